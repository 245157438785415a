//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryChannel.cpp
// Purpose: In-memory channel implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "toolwire/InMemoryChannel.hpp"

namespace toolwire {

class InMemoryChannel::Impl {
public:
    enum class State { Idle, Open, Closed };

    std::string channelId;
    std::atomic<State> state{State::Idle};
    std::atomic<bool> localClosed{false};
    std::atomic<bool> remoteClosed{false};
    std::atomic<bool> closeNotified{false};
    IChannel::FrameHandler frameHandler;
    IChannel::CloseHandler closeHandler;
    std::weak_ptr<Impl> peer;
    std::deque<std::string> messageQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        channelId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        localClosed = true;
        queueCondition.notify_all();
        if (processingThread.joinable()) {
            processingThread.request_stop();
            if (processingThread.get_id() == std::this_thread::get_id()) {
                // Destroyed from our own close handler; the loop touches nothing after it returns
                processingThread.detach();
            } else {
                processingThread.join();
            }
        }
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            std::string reason = "Connection closed";
            for (;;) {
                std::unique_lock<std::mutex> lock(queueMutex);
                queueCondition.wait(lock, [this, &st]() {
                    return !messageQueue.empty() || localClosed.load() || remoteClosed.load() || st.stop_requested();
                });
                if (st.stop_requested() || localClosed.load()) {
                    messageQueue.clear();
                    break;
                }
                if (messageQueue.empty() && remoteClosed.load()) {
                    reason = "Connection closed by peer";
                    break;
                }
                std::string frame = std::move(messageQueue.front());
                messageQueue.pop_front();
                lock.unlock();
                if (frameHandler) {
                    try {
                        frameHandler(frame);
                    } catch (const std::exception& e) {
                        LOG_ERROR("InMemoryChannel {}: frame handler exception: {}", channelId, e.what());
                    }
                }
            }
            finish(reason);
        });
    }

    // Marks the channel closed and fires the close handler once. Must be the last use of 'this'.
    void finish(const std::string& reason) {
        state = State::Closed;
        if (closeNotified.exchange(true)) {
            return;
        }
        IChannel::CloseHandler handler = closeHandler;
        LOG_DEBUG("InMemoryChannel {} closed: {}", channelId, reason);
        if (handler) {
            handler(reason);
        }
    }

    void enqueueMessage(const std::string& message) {
        std::lock_guard<std::mutex> lock(queueMutex);
        messageQueue.push_back(message);
        queueCondition.notify_one();
    }

    void markRemoteClosed() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            remoteClosed = true;
        }
        queueCondition.notify_all();
    }

    bool acceptsFrames() const {
        return state.load() != State::Closed && !localClosed.load();
    }

    bool sendToPeer(const std::string& message) {
        if (!acceptsFrames() || remoteClosed.load()) {
            return false;
        }
        auto p = peer.lock();
        if (!p || !p->acceptsFrames()) {
            LOG_WARN("InMemoryChannel {}: peer not connected; dropping frame", channelId);
            return false;
        }
        p->enqueueMessage(message);
        return true;
    }
};

InMemoryChannel::InMemoryChannel() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryChannel::~InMemoryChannel() {
    FUNC_SCOPE();
    // Let the peer drain and observe the close
    if (auto p = pImpl->peer.lock()) {
        p->markRemoteClosed();
    }
}

std::pair<std::unique_ptr<InMemoryChannel>, std::unique_ptr<InMemoryChannel>> InMemoryChannel::CreatePair() {
    FUNC_SCOPE();
    auto channel1 = std::make_unique<InMemoryChannel>();
    auto channel2 = std::make_unique<InMemoryChannel>();
    channel1->pImpl->peer = channel2->pImpl;
    channel2->pImpl->peer = channel1->pImpl;
    return std::make_pair(std::move(channel1), std::move(channel2));
}

std::future<void> InMemoryChannel::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    Impl::State expected = Impl::State::Idle;
    if (pImpl->state.compare_exchange_strong(expected, Impl::State::Open)) {
        LOG_DEBUG("Starting InMemoryChannel {}", pImpl->channelId);
        pImpl->startProcessing();
    }
    promise.set_value();
    return promise.get_future();
}

std::future<void> InMemoryChannel::Close() {
    FUNC_SCOPE();
    std::promise<void> promise;
    bool wasClosed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        wasClosed = pImpl->localClosed.exchange(true);
    }
    if (!wasClosed) {
        LOG_DEBUG("Closing InMemoryChannel {}", pImpl->channelId);
        pImpl->queueCondition.notify_all();
        if (auto p = pImpl->peer.lock()) {
            p->markRemoteClosed();
        }
        // Never started: no receive loop will fire the close handler
        if (!pImpl->processingThread.joinable()) {
            promise.set_value();
            pImpl->finish("Connection closed");
            return promise.get_future();
        }
    }
    promise.set_value();
    return promise.get_future();
}

bool InMemoryChannel::IsOpen() const {
    return pImpl->state.load() == Impl::State::Open && !pImpl->localClosed.load() && !pImpl->remoteClosed.load();
}

std::string InMemoryChannel::GetChannelId() const { return pImpl->channelId; }

bool InMemoryChannel::Send(const std::string& frame) {
    LOG_DEBUG("InMemoryChannel {} send: {}", pImpl->channelId, frame);
    return pImpl->sendToPeer(frame);
}

void InMemoryChannel::SetFrameHandler(FrameHandler handler) {
    FUNC_SCOPE();
    pImpl->frameHandler = std::move(handler);
}

void InMemoryChannel::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    pImpl->closeHandler = std::move(handler);
}

} // namespace toolwire
