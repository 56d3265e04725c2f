// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "feed_types.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace magpie {

/**
 * @brief AuthorId -> username map shared by one feed walk
 *
 * Thread-safe. No lock is held across network calls: callers look up, fetch
 * on a miss, then insert. The first inserted value wins, so every reader
 * sees one stable value per author even if two threads raced on the miss.
 */
class UsernameCache {
  public:
    /// Cached username, counting a hit or a miss
    std::optional<std::string> get(const UserId& id);

    /// Cached username without touching the counters
    std::optional<std::string> peek(const UserId& id) const;

    /**
     * @brief Insert unless already present
     * @return The value now stored for id (the earlier one if it existed)
     */
    std::string insert(const UserId& id, const std::string& username);

    size_t size() const;
    size_t hits() const;
    size_t misses() const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<UserId, std::string> names_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace magpie
