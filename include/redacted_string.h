// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <utility>

namespace magpie {

/**
 * @brief String holder for secrets that must not reach the logs in full
 *
 * redacted() shows only the first four characters.
 * Use secret() where the real value is needed (request headers, form bodies).
 */
class RedactedString {
  public:
    RedactedString() = default;
    explicit RedactedString(std::string value) : value_(std::move(value)) {}

    const std::string& secret() const {
        return value_;
    }

    bool empty() const {
        return value_.empty();
    }

    std::string redacted() const {
        return value_.substr(0, 4) + "***";
    }

    bool operator==(const RedactedString& other) const {
        return value_ == other.value_;
    }
    bool operator!=(const RedactedString& other) const {
        return !(*this == other);
    }

  private:
    std::string value_;
};

} // namespace magpie
