//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkerPool.h
// Purpose: Bounded pool of threads on which the HTTP surface runs synchronous tool calls
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <mutex>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace toolwire {

class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads)
        : pool(threads == 0 ? 1 : threads) {}

    ~WorkerPool() { Stop(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue work. Returns false once the pool has been stopped; accepted work always runs.
    bool Post(std::function<void()> work) {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopped) {
            return false;
        }
        boost::asio::post(pool, std::move(work));
        return true;
    }

    // Lets queued work finish, then joins the threads. Idempotent.
    void Stop() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopped) {
                return;
            }
            stopped = true;
        }
        pool.join();
    }

private:
    boost::asio::thread_pool pool;
    std::mutex mutex;
    bool stopped{false};
};

} // namespace toolwire
