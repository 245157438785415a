//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryChannel.hpp
// Purpose: In-memory channel pair for tests and embedding
//==========================================================================================================
#pragma once

#include <memory>
#include <utility>

#include "toolwire/Channel.h"

namespace toolwire {

//==========================================================================================================
// InMemoryChannel
// Purpose: In-process channel delivering frames to a paired instance without networking or I/O.
//          Frames sent before the peer starts are queued and delivered once it does. Closing one side
//          closes the other after it has drained the frames already delivered to it.
//==========================================================================================================
class InMemoryChannel : public IChannel {
public:
    InMemoryChannel();
    virtual ~InMemoryChannel();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two channels wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryChannel>, std::unique_ptr<InMemoryChannel>> CreatePair();

    ////////////////////////////////////////// IChannel //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsOpen() const override;
    std::string GetChannelId() const override;
    bool Send(const std::string& frame) override;
    void SetFrameHandler(FrameHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolwire
