// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>

namespace overlay {
namespace util {

// Current Unix time in seconds, or the mock time if one is set.
int64_t GetTime();

// Set mock time for tests (0 disables mock time).
void SetMockTime(int64_t time);

}  // namespace util
}  // namespace overlay
