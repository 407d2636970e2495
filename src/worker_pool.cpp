#include "worker_pool.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;

worker_pool::worker_pool(size_t concurrency) : capacity(concurrency), tasks(concurrency) {
    if (concurrency == 0) BOOST_THROW_EXCEPTION(validation_error("worker pool concurrency must be positive"));
    for (size_t i = 0; i < concurrency; ++i)
        threads.emplace_back([this] { run(); });
}

worker_pool::~worker_pool() {
    shutdown();
}

bool worker_pool::submit(function<void()> task) {
    {
        unique_lock<mutex> lock(mut);
        slot_freed.wait(lock, [this] { return active < capacity || stopped; });
        if (stopped) return false;
        ++active;
    }
    // active 不超过 capacity，因此交接队列不会满，这里不会阻塞
    if (!tasks.push(move(task))) {
        scoped_lock lock(mut);
        --active;
        return false;
    }
    return true;
}

void worker_pool::run() {
    function<void()> task;
    while (tasks.pop(task)) {
        try {
            task();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Task crashed in worker pool: " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
        task = nullptr;
        {
            scoped_lock lock(mut);
            --active;
        }
        slot_freed.notify_all();
    }
}

void worker_pool::wait_idle() {
    unique_lock<mutex> lock(mut);
    slot_freed.wait(lock, [this] { return active == 0; });
}

void worker_pool::shutdown() {
    {
        scoped_lock lock(mut);
        if (stopped) return;
        stopped = true;
    }
    slot_freed.notify_all();
    tasks.close();
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
}

size_t worker_pool::in_flight() const {
    scoped_lock lock(mut);
    return active;
}

size_t worker_pool::concurrency() const {
    return capacity;
}

}  // namespace codejudge
