//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.h
// Purpose: Interface for newline-delimited message framing (one JSON-RPC message per line)
//========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace toolhub {

constexpr std::size_t DefaultMaxLineBytes = 4u * 1024u * 1024u;

//========================================================================================================
// ILineFramer
// Purpose: Splits an inbound byte stream into frames and encodes outbound frames.
// Notes:
//   - '\n' terminates a frame; one trailing '\r' is stripped; blank lines are skipped.
//   - A line longer than the cap is discarded up to and including its terminating '\n'; the framer
//     remembers a partially discarded line across calls.
//   - Not thread-safe; owned by a single reader loop.
//========================================================================================================
class ILineFramer {
public:
    virtual ~ILineFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        LineTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesDropped{0};        // oversize bytes thrown away when status==LineTooLarge
    };

    // Appends the delimiter. Throws std::invalid_argument when payload contains a raw newline.
    virtual std::string encode(const std::string& payload) = 0;

    // Extracts the next frame from the front of buffer, erasing everything it consumed.
    virtual DecodeResult next(std::string& buffer) = 0;

    virtual std::size_t maxLineBytes() const = 0;
};

std::unique_ptr<ILineFramer> MakeLineFramer(std::size_t maxLineBytes = DefaultMaxLineBytes);

} // namespace toolhub
