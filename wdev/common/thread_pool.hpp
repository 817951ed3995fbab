/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file thread_pool.hpp
 * @brief Implementation of thread pool that uses async threads
 **/

#ifndef _WDEV_THREAD_POOL_HPP_
#define _WDEV_THREAD_POOL_HPP_

#include "common/async_thread.hpp"
#include "common/logger_macros.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>

namespace wdev {

/**
 * Fixed size pool of worker threads consuming a FIFO of jobs.
 * Destroying the pool runs every queued job to completion and joins all workers.
 */
class WdevThreadPool {
public:
    WdevThreadPool(size_t num_worker_threads, const std::string &name = "") :
        m_num_threads(num_worker_threads), m_kill_threads(false)
    {
        for (size_t i = 0; i < num_worker_threads; i++) {
            m_threads.emplace_back(std::make_unique<AsyncThread<wdev_status>>(name,
            [this]() -> wdev_status {
                while(true) {
                    std::function<wdev_status()> func;
                    {
                        std::unique_lock<std::mutex> lock(m_mutex);
                        m_cv.wait(lock, [this](){ return (m_kill_threads || !m_queue.empty()); });
                        if (m_kill_threads && m_queue.empty()) {
                            return WDEV_SUCCESS;
                        }
                        func = std::move(m_queue.front());
                        m_queue.pop();
                    }

                    wdev_status status = func();
                    if (WDEV_SUCCESS != status) {
                        LOGGER__DEBUG("Thread pool job failed with status {}", status);
                    }
               }
            }
        ));
        }
    }

    WdevThreadPool(const WdevThreadPool &) = delete;
    WdevThreadPool(WdevThreadPool &&other) = delete;
    WdevThreadPool& operator=(const WdevThreadPool&) = delete;
    WdevThreadPool& operator=(WdevThreadPool &&) = delete;

    template<class F, class... Args>
    void add_job(F&& func, Args&&... args) {
        auto job = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_kill_threads) {
                LOGGER__ERROR("Cannot add jobs after threadpool has been terminated");
                return;
            }
            m_queue.emplace(job);
        }
        m_cv.notify_one();
    }

    ~WdevThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_kill_threads = true;
        }
        m_cv.notify_all();
        for (size_t i = 0; i < m_num_threads; i++) {
            AsyncThreadPtr<wdev_status> thread = std::move(m_threads[i]);
            thread->get();
        }
    }

private:
    size_t m_num_threads;
    std::vector<AsyncThreadPtr<wdev_status>> m_threads;
    std::queue<std::function<wdev_status()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_kill_threads;
};

} /* namespace wdev */

#endif /* _WDEV_THREAD_POOL_HPP_ */
