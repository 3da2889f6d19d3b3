#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace termdeck
{

// Process-wide identifier source. Every id is "<prefix>-<n>" with n drawn from
// a single monotonic counter, so ids stay unique across prefixes too.
namespace ids
{

inline constexpr std::string_view SESSION_PREFIX   = "session";
inline constexpr std::string_view WORKSPACE_PREFIX = "ws";
inline constexpr std::string_view SPLIT_PREFIX     = "split";

std::string next(std::string_view prefix);

// Advance the counter past the numeric suffix of `id` (if it has one), so ids
// restored from a snapshot never collide with freshly generated ones.
void reserve(std::string_view id);

uint64_t peek_counter();

}   // namespace ids

}   // namespace termdeck
