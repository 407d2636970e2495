#include "sandbox/process_runner.hpp"

namespace codejudge::sandbox {
using namespace std;

process_runner::~process_runner() = default;

process_output posix_process_runner::run(const vector<string> &argv, chrono::milliseconds timeout) {
    return exec_program(argv, timeout);
}

}  // namespace codejudge::sandbox
