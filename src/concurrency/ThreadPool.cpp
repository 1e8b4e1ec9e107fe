#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace ms::concurrency;
using namespace ms::logging;

ThreadPool::ThreadPool(unsigned int nThreads) : stopFlag(false) {
    if (nThreads == 0) nThreads = std::max(1u, std::thread::hardware_concurrency());
    for (unsigned int i = 0; i < nThreads; ++i) {
        spawnWorker();
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() { {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task> > empty;
        std::swap(queue, empty);
    }

    stopFlag.store(true);
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) { {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

unsigned int ThreadPool::workerCount() const {
    return threads_.size();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;

            try {
                (*task)();
            } catch (const std::exception& e) {
                LogRegistry::sync()->error("[ThreadPool] Task threw: {}", e.what());
            }
        }
    });
}
