// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "image_reference.h"

namespace magpie {

std::string escape_filename_component(const std::string& component) {
    std::string out;
    out.reserve(component.size());
    for (char c : component) {
        switch (c) {
        case '%':
            out += "%25";
            break;
        case ' ':
            out += "%20";
            break;
        case '/':
            out += "%2F";
            break;
        case '\0':
            out += "%00";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string ImageReference::filename() const {
    return format::iso8601(created_at) + ' ' + escape_filename_component(author) + ' ' +
           escape_filename_component(item_id) + ' ' + escape_filename_component(internal_filename);
}

} // namespace magpie
