#pragma once

#include "service/request.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mediaprep::service {

inline constexpr std::size_t kFrameHeaderBytes = 4;

// Parses one request body: `{"op": str, "input": object, "context": {str: str}}`.
// `input` and `context` may be omitted or null. On failure `error` is a
// ValidationError whose details name the offending field.
bool ParseRequest(std::string_view body, Request& request, OperationError& error);

// `{"ok", "output", "latency_ms", "cost"}`. latency_ms is rounded up so a
// measured duration never serializes as 0.
core::json::Value OutcomeToJson(const Outcome& outcome);

std::string SerializeOutcome(const Outcome& outcome);

std::int64_t LatencyMillisRoundedUp(std::chrono::nanoseconds latency);

// 4-byte big-endian body length.
std::array<unsigned char, kFrameHeaderBytes> EncodeFrameHeader(std::uint32_t body_length);

std::uint32_t DecodeFrameHeader(const std::array<unsigned char, kFrameHeaderBytes>& header);

} // namespace mediaprep::service
