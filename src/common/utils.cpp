#include "common/utils.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <ctime>
#include <system_error>
#include <thread>

namespace codejudge {
using namespace std;

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

static system_error make_system_error(const char *what) {
    return system_error(errno, generic_category(), what);
}

process_output exec_program(const vector<string> &argv, chrono::milliseconds timeout) {
    if (argv.empty()) throw invalid_argument("exec_program: empty argument list");

    // 在 fork 之前准备好 argv，子进程中只调用 async-signal-safe 的函数
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    int out_pipe[2], err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) throw make_system_error("pipe");
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto ex = make_system_error("pipe");
        close_fd(out_pipe[0]), close_fd(out_pipe[1]);
        throw ex;
    }

    pid_t pid;
    switch (pid = fork()) {
        case -1: {  // fork 失败
            auto ex = make_system_error("fork");
            close_fd(out_pipe[0]), close_fd(out_pipe[1]);
            close_fd(err_pipe[0]), close_fd(err_pipe[1]);
            throw ex;
        }
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            execvp(args[0], args.data());
            static const char message[] = "exec_program: unable to execute program\n";
            ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
            (void)ignored;
            _exit(127);
        }
        default:
            break;
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    process_output result;
    auto deadline = chrono::steady_clock::now() + timeout;
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    string *sinks[2] = {&result.stdout_text, &result.stderr_text};
    int open_fds = 2;
    char buffer[4096];

    while (open_fds > 0) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            kill(pid, SIGKILL);
            break;
        }
        int ret = poll(fds, 2, (int)min<long long>(remaining, INT_MAX));
        if (ret < 0) {
            if (errno == EINTR) continue;
            auto ex = make_system_error("poll");
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_fd(fds[0].fd), close_fd(fds[1].fd);
            throw ex;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof buffer);
            if (n > 0) {
                sinks[i]->append(buffer, (size_t)n);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[i].fd);  // poll 会忽略负数的 fd
                --open_fds;
            }
        }
    }
    close_fd(fds[0].fd);
    close_fd(fds[1].fd);

    // 子进程可能关闭了标准输出但仍在运行，因此等待时也需要检查时限
    int status = 0;
    while (true) {
        pid_t w = waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
        if (w == pid) break;
        if (w < 0) {
            if (errno == EINTR) continue;
            throw make_system_error("waitpid");
        }
        if (chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            kill(pid, SIGKILL);
            continue;
        }
        this_thread::sleep_for(chrono::milliseconds(10));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.signal = WTERMSIG(status);
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_uuid() {
    // random_generator 不是线程安全的，每个线程各持有一个
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

string format_iso8601(chrono::system_clock::time_point tp) {
    auto micros = chrono::duration_cast<chrono::microseconds>(tp.time_since_epoch()).count();
    time_t seconds = (time_t)(micros / 1000000);
    long long fraction = micros % 1000000;
    if (fraction < 0) fraction += 1000000, --seconds;
    tm utc;
    gmtime_r(&seconds, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, fraction);
}

optional<chrono::system_clock::time_point> parse_iso8601(const string &text) {
    tm utc{};
    int consumed = 0;
    // 日期和时间之间允许使用 'T' 或者空格分隔，后者是 MySQL DATETIME 的文本格式
    if (sscanf(text.c_str(), "%4d-%2d-%2d%*1[T ]%2d:%2d:%2d%n",
               &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
               &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed) != 6)
        return nullopt;
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;

    long long micros = 0;
    if ((size_t)consumed < text.size() && text[consumed] == '.') {
        int digits = 0;
        for (size_t i = consumed + 1; i < text.size() && isdigit((unsigned char)text[i]); ++i) {
            if (digits < 6) micros = micros * 10 + (text[i] - '0'), ++digits;
        }
        for (; digits < 6; ++digits) micros *= 10;
    }

    time_t seconds = timegm(&utc);
    return chrono::system_clock::time_point(chrono::seconds(seconds)) +
           chrono::duration_cast<chrono::system_clock::duration>(chrono::microseconds(micros));
}

}  // namespace codejudge
