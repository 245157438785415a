//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Channel.h
// Purpose: Duplex text-frame channel interface used by sessions
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <string>

namespace toolwire {

//==========================================================================================================
// IChannel
// Purpose: One persistent, bidirectional connection carrying discrete text frames.
// Notes:
//   - Exactly one receive loop per channel; frames reach the frame handler in arrival order, one at a time.
//   - Send() may be called from any thread; writes are serialized by the channel.
//   - The close handler runs exactly once, after the last delivered frame, whatever closed the channel.
//==========================================================================================================
class IChannel {
public:
    using FrameHandler = std::function<void(const std::string& frame)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~IChannel() = default;

    //==========================================================================================================
    // Starts the receive loop. Handlers must be set before calling.
    // Returns:
    //   Future that completes when the channel is ready to deliver frames.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the channel. Safe to call more than once and from within handlers.
    // Returns:
    //   Future that completes when the close has been initiated.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsOpen() const = 0;

    // Diagnostic identifier.
    virtual std::string GetChannelId() const = 0;

    // Queues one frame. Returns false when the channel (or its peer) is closed.
    virtual bool Send(const std::string& frame) = 0;

    virtual void SetFrameHandler(FrameHandler handler) = 0;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
};

} // namespace toolwire
