#include "judge/lifecycle.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;

bool can_transition(status from, status to) {
    switch (from) {
        case status::QUEUED:
            return to == status::PROCESSING || to == status::INTERNAL_ERROR;
        case status::PROCESSING:
            return is_terminal(to);
        default:
            return false;  // 终止状态
    }
}

submission_lifecycle::submission_lifecycle(store::submission_store &store) : store(store) {}

bool submission_lifecycle::claim(long long submission_id) {
    if (store.try_claim(submission_id)) {
        DLOG(INFO) << "Submission " << submission_id << " claimed";
        return true;
    }
    LOG(WARNING) << "Submission " << submission_id << " is missing or already claimed";
    return false;
}

bool submission_lifecycle::finish(long long submission_id, const submission_outcome &outcome) {
    if (!can_transition(status::PROCESSING, outcome.status))
        BOOST_THROW_EXCEPTION(internal_error(string("Cannot finish submission with non-terminal status ") +
                                             get_display_message(outcome.status)));
    if (store.complete(submission_id, outcome)) {
        LOG(INFO) << "Submission " << submission_id << " executed with status: " << get_display_message(outcome.status);
        return true;
    }
    LOG(WARNING) << "Submission " << submission_id << " is no longer processing, result discarded";
    return false;
}

bool submission_lifecycle::fail(long long submission_id, const string &error_message) {
    string message = error_message.empty() ? "Unknown internal error" : error_message;
    if (store.force_internal_error(submission_id, message)) {
        LOG(ERROR) << "Submission " << submission_id << " marked as internal error: " << message;
        return true;
    }
    LOG(WARNING) << "Submission " << submission_id << " is missing or already finished, not marked as internal error";
    return false;
}

bool submission_lifecycle::edit(long long submission_id, const submission_edit &edit) {
    if (store.update_if_queued(submission_id, edit)) return true;
    LOG(INFO) << "Refused to edit submission " << submission_id << " which is missing or no longer queued";
    return false;
}

}  // namespace codejudge
