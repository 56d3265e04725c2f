// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <memory>

namespace magpie {

/**
 * @brief Cooperative cancellation flag shared between the run and its workers
 *
 * Copies share one flag. request() is async-signal-safe (a lock-free atomic
 * store), so the SIGINT handler may call it directly.
 */
class CancellationToken {
  public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void request() const noexcept {
        flag_->store(true, std::memory_order_relaxed);
    }

    bool requested() const noexcept {
        return flag_->load(std::memory_order_relaxed);
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace magpie
