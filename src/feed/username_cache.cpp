// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "username_cache.h"

namespace magpie {

std::optional<std::string> UsernameCache::get(const UserId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(id);
    if (it == names_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second;
}

std::optional<std::string> UsernameCache::peek(const UserId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(id);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string UsernameCache::insert(const UserId& id, const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.emplace(id, username).first->second;
}

size_t UsernameCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.size();
}

size_t UsernameCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t UsernameCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace magpie
