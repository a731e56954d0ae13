#include "threading.hpp"

namespace threading {

ThreadPool::ThreadPool(size_t threads) : num_threads(threads) {
    workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock,
                                   [this]() { return stop || !tasks.empty(); });

                    if (stop && tasks.empty()) {
                        return;
                    }

                    task = std::move(tasks.back());
                    tasks.pop_back();
                    // Counted under the lock so wait() never sees an empty
                    // queue while a task is in flight
                    ++active_tasks;
                }

                task();

                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    --active_tasks;
                    if (active_tasks == 0 && tasks.empty()) {
                        idle.notify_all();
                    }
                }
            }
        });
    }
}

void ThreadPool::wait() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle.wait(lock, [this]() { return active_tasks == 0 && tasks.empty(); });
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop = true;
    }
    condition.notify_all();
    for (std::thread &worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace threading
