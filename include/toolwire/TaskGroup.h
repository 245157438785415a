//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TaskGroup.h
// Purpose: Runs each session handler invocation on its own thread and lets the owner wait for all of them
//==========================================================================================================

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include "logging/Logger.h"

namespace toolwire {

//==========================================================================================================
// TaskGroup
// Purpose: One detached thread per task, counted so Stop() can wait for every task to finish.
//          Concurrency is bounded by the callers (each Session admits at most maxInFlight tasks), so a
//          slow handler in one session never holds a thread another session needs.
//==========================================================================================================
class TaskGroup {
public:
    TaskGroup() : state(std::make_shared<State>()) {}

    ~TaskGroup() { Stop(); }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Starts work on a new thread. Returns false once stopped or when no thread could be created.
    bool Spawn(std::function<void()> work) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->stopped) {
                return false;
            }
            ++state->active;
        }
        try {
            std::thread([st = state, work = std::move(work)]() mutable {
                try {
                    work();
                } catch (const std::exception& e) {
                    LOG_ERROR("TaskGroup: task failed: {}", e.what());
                }
                // Captures are released before the task counts as finished
                work = nullptr;
                {
                    std::lock_guard<std::mutex> lock(st->mutex);
                    --st->active;
                }
                st->idle.notify_all();
            }).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("TaskGroup: failed to start a thread: {}", e.what());
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                --state->active;
            }
            state->idle.notify_all();
            return false;
        }
        return true;
    }

    // Refuses new tasks, then waits for running ones. Idempotent; must not be called from a task.
    void Stop() {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->stopped = true;
        state->idle.wait(lock, [this]() { return state->active == 0; });
    }

    std::size_t Active() const {
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->active;
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable idle;
        std::size_t active{0};
        bool stopped{false};
    };

    // Shared with running threads so it outlives the group object
    std::shared_ptr<State> state;
};

} // namespace toolwire
