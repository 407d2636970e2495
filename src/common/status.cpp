#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::QUEUED, "In Queue")
    (status::PROCESSING, "Processing")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::RUNTIME_ERROR_SIGSEGV, "Runtime Error (SIGSEGV)")
    (status::RUNTIME_ERROR_SIGXFSZ, "Runtime Error (SIGXFSZ)")
    (status::RUNTIME_ERROR_SIGFPE, "Runtime Error (SIGFPE)")
    (status::RUNTIME_ERROR_SIGABRT, "Runtime Error (SIGABRT)")
    (status::RUNTIME_ERROR_NZEC, "Runtime Error (NZEC)")
    (status::RUNTIME_ERROR_OTHER, "Runtime Error (Other)")
    (status::INTERNAL_ERROR, "Internal Error")
    (status::EXEC_FORMAT_ERROR, "Exec Format Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

bool is_terminal(status stat) {
    return stat != status::QUEUED && stat != status::PROCESSING;
}

optional<status> status_from_id(int id) {
    if (id < status_id(status::QUEUED) || id > status_id(status::EXEC_FORMAT_ERROR))
        return nullopt;
    return static_cast<status>(id);
}

optional<status> status_from_display_message(const string &message) {
    for (auto &[stat, name] : status_string)
        if (message == name) return stat;
    return nullopt;
}

}  // namespace codejudge
