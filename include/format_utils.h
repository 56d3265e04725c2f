// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace magpie::format {

/// UTC instant with nanosecond resolution (years 1678-2261)
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

// =============================================================================
// Timestamps
// =============================================================================

/**
 * @brief Parse an ISO-8601 / RFC 3339 timestamp
 *
 * Accepts `YYYY-MM-DDTHH:MM:SS`, optional fractional seconds (up to nine
 * digits), and a `Z` or `+HH:MM` / `-HH:MM` offset. A missing offset is
 * read as UTC.
 *
 * Leap seconds (`:60`) and fractions finer than a nanosecond are rejected
 * rather than rounded, so distinct instants never parse to the same value.
 *
 * @return nullopt if the string is not a valid timestamp
 */
std::optional<Timestamp> parse_iso8601(const std::string& text);

/**
 * @brief Format as `YYYY-MM-DDTHH:MM:SS.fffZ`
 *
 * The fraction has 3, 6 or 9 digits: the shortest group that holds the
 * instant exactly. Millisecond instants (the provider's precision) are fixed
 * width, so their lexical order matches chronological order. Distinct
 * instants always format differently.
 */
std::string iso8601(Timestamp ts);

// =============================================================================
// Duration / Size Formatting
// =============================================================================

/**
 * @brief Format duration in seconds to human-readable string
 *
 * Produces output like:
 * - "30s" for durations under 1 minute
 * - "4m 05s" for durations under 1 hour
 * - "2h 15m" for longer runs
 *
 * @param total_seconds Duration in seconds (negative values treated as 0)
 */
std::string duration(int total_seconds);

/**
 * @brief Format a byte count ("512 B", "12.5 KiB", "3.20 MiB")
 */
std::string byte_size(uint64_t bytes);

} // namespace magpie::format
