#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

constexpr auto default_log_file = "./logs/pancake_client.log";

using Byte = uint8_t;

// column page framing
constexpr uint8_t PAGE_FORMAT_VERSION = 1;
constexpr size_t PAGE_HEADER_SIZE = 3;
constexpr uint8_t NULL_MARKER = 0x00;
constexpr uint8_t PRESENT_MARKER = 0x01;
constexpr uint32_t MAX_NESTED_LIST_DEPTH = 3;

constexpr uint32_t DEFAULT_MAX_RETRIES = 3;
constexpr double DEFAULT_BACKOFF_MULTIPLIER = 2.0;
#ifdef TESTS
constexpr std::chrono::milliseconds DEFAULT_INITIAL_BACKOFF{1};
constexpr std::chrono::milliseconds DEFAULT_MAX_BACKOFF{4};
#else
constexpr std::chrono::milliseconds DEFAULT_INITIAL_BACKOFF{50};
constexpr std::chrono::milliseconds DEFAULT_MAX_BACKOFF{2000};
#endif
