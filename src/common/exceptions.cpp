#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codejudge {
using namespace std;

codejudge_exception::codejudge_exception()
    : codejudge_exception("") {}

codejudge_exception::codejudge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *codejudge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const codejudge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : codejudge_exception() {}

internal_error::internal_error(const string &message)
    : codejudge_exception(message) {}

broker_error::broker_error()
    : codejudge_exception() {}

broker_error::broker_error(const string &message)
    : codejudge_exception(message) {}

database_error::database_error()
    : codejudge_exception() {}

database_error::database_error(const string &message)
    : codejudge_exception(message) {}

validation_error::validation_error()
    : codejudge_exception() {}

validation_error::validation_error(const string &message)
    : codejudge_exception(message) {}

unsupported_language::unsupported_language(int language_id)
    : validation_error("Unsupported language ID: " + to_string(language_id)), language_id(language_id) {}

submission_not_found::submission_not_found(long long submission_id)
    : codejudge_exception("Submission " + to_string(submission_id) + " not found"), submission_id(submission_id) {}

}  // namespace codejudge
