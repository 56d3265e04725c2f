// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "format_utils.h"

#include <string>

namespace magpie {

/**
 * @brief One downloadable image found on a liked item
 *
 * Immutable once built by the enricher. filename() is the on-disk identity.
 */
struct ImageReference {
    std::string author;            ///< Author username
    std::string item_id;           ///< Liked item id
    format::Timestamp created_at;  ///< Item creation time
    std::string internal_filename; ///< Last URL path segment, or url-link.<fmt>
    std::string url;

    /**
     * @brief "<created_at> <author> <item_id> <internal_filename>"
     *
     * created_at is rendered as fixed-width ISO-8601 UTC. Each component has
     * '%', ' ', '/' and NUL percent-escaped before joining, so the result is a
     * single valid path component and distinct references never share one.
     */
    std::string filename() const;
};

/// Percent-escape the characters filename() treats as structural
std::string escape_filename_component(const std::string& component);

} // namespace magpie
