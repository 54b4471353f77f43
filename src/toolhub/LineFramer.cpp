//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Default newline framer used by the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "toolhub/LineFramer.h"

namespace toolhub {

namespace {
bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c){ return std::isspace(c) != 0; });
}

class LineFramer : public ILineFramer {
public:
    explicit LineFramer(std::size_t maxLen) : maxLen(maxLen) {}

    std::string encode(const std::string& payload) override {
        if (payload.find('\n') != std::string::npos) {
            throw std::invalid_argument("frame payload contains a raw newline");
        }
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult next(std::string& buffer) override {
        for (;;) {
            const std::size_t eol = buffer.find('\n');
            if (discarding) {
                if (eol == std::string::npos) {
                    std::size_t dropped = buffer.size();
                    buffer.clear();
                    droppedSoFar += dropped;
                    return { DecodeStatus::Incomplete, std::nullopt, 0 };
                }
                buffer.erase(0, eol + 1);
                discarding = false;
                LOG_WARN("LineFramer: discarded oversize line ({} bytes, max={})", droppedSoFar + eol, maxLen);
                droppedSoFar = 0;
                continue;
            }
            if (eol == std::string::npos) {
                if (buffer.size() > maxLen) {
                    // No terminator yet and already past the cap: drop and skip to the next newline
                    std::size_t dropped = buffer.size();
                    buffer.clear();
                    discarding = true;
                    droppedSoFar = dropped;
                    return { DecodeStatus::LineTooLarge, std::nullopt, dropped };
                }
                return { DecodeStatus::Incomplete, std::nullopt, 0 };
            }

            std::string line = buffer.substr(0, eol);
            buffer.erase(0, eol + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.size() > maxLen) {
                LOG_WARN("LineFramer: line of {} bytes exceeds max {}", line.size(), maxLen);
                return { DecodeStatus::LineTooLarge, std::nullopt, line.size() };
            }
            if (isBlank(line)) {
                continue;
            }
            return { DecodeStatus::Ok, std::make_optional(std::move(line)), 0 };
        }
    }

    std::size_t maxLineBytes() const override { return maxLen; }

private:
    std::size_t maxLen;
    bool discarding{false};
    std::size_t droppedSoFar{0};
};
} // namespace

std::unique_ptr<ILineFramer> MakeLineFramer(std::size_t maxLineBytes) {
    return std::make_unique<LineFramer>(maxLineBytes);
}

} // namespace toolhub
