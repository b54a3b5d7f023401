//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.h
// Purpose: Interface for newline-delimited message framing on tool-server stdio pipes
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace toolhost {

//========================================================================================================
// IMessageFramer
// Purpose: Splits an inbound byte stream into complete messages and frames outbound ones.
// Methods:
//   encode(payload): Returns payload followed by the frame terminator.
//   tryDecodeEx(buffer): Inspects buffer; bytesConsumed tells the caller how much to erase, for
//                        every status (an oversized line is consumed while being discarded).
//   tryDecode(buffer): Convenience; erases consumed bytes and returns the next message if any.
// Notes:
//   Implementations may keep resynchronisation state between calls, so one framer serves one stream.
//========================================================================================================
class IMessageFramer {
public:
    virtual ~IMessageFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        LineTooLong
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes the caller must drop from the front of the buffer
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// Newline framing: '\n' terminates a line, a trailing '\r' is stripped and blank lines are skipped.
std::unique_ptr<IMessageFramer> MakeNewlineFramer(std::size_t maxLineLength = 4 * 1024 * 1024);

} // namespace toolhost
