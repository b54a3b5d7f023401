//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited framer used for tool-server stdout
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolhost/LineFramer.h"

namespace toolhost {

namespace {
class NewlineFramer : public IMessageFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t pos = 0;
        while (pos < buffer.size()) {
            std::size_t eol = buffer.find('\n', pos);
            if (discarding) {
                if (eol == std::string::npos) {
                    return { DecodeStatus::Incomplete, std::nullopt, buffer.size() };
                }
                discarding = false;
                pos = eol + 1;
                continue;
            }
            if (eol == std::string::npos) {
                if (buffer.size() - pos > maxLineLength) {
                    LOG_WARN("Discarding line longer than {} bytes", maxLineLength);
                    discarding = true;
                    return { DecodeStatus::LineTooLong, std::nullopt, buffer.size() };
                }
                return { DecodeStatus::Incomplete, std::nullopt, pos };
            }
            std::size_t end = eol;
            if (end > pos && buffer[end - 1] == '\r') {
                --end;
            }
            if (end - pos > maxLineLength) {
                LOG_WARN("Discarding line of {} bytes (max={})", end - pos, maxLineLength);
                return { DecodeStatus::LineTooLong, std::nullopt, eol + 1 };
            }
            if (isBlank(buffer, pos, end)) {
                pos = eol + 1;
                continue;
            }
            return { DecodeStatus::Ok, buffer.substr(pos, end - pos), eol + 1 };
        }
        return { DecodeStatus::Incomplete, std::nullopt, pos };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        while (true) {
            DecodeResult r = tryDecodeEx(buffer);
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            if (r.status == DecodeStatus::Ok) {
                return r.payload;
            }
            if (r.status == DecodeStatus::Incomplete) {
                return std::nullopt;
            }
            // LineTooLong: keep scanning what is left
        }
    }

private:
    static bool isBlank(const std::string& s, std::size_t from, std::size_t to) {
        for (std::size_t k = from; k < to; ++k) {
            char c = s[k];
            if (c != ' ' && c != '\t' && c != '\r') return false;
        }
        return true;
    }

    std::size_t maxLineLength;
    bool discarding{false};
};
} // namespace

std::unique_ptr<IMessageFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

} // namespace toolhost
