// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace magpie {

/**
 * @brief Start `program arg` detached from this process
 *
 * The program is looked up on PATH and reparented to init, so it is never
 * left as a zombie. Does not wait for it to finish.
 *
 * @return false if the program could not be executed
 */
bool spawn_detached(const std::string& program, const std::string& arg);

/**
 * @brief Open a URL with the desktop's default handler
 *
 * Runs `xdg-open` (Linux) or `open` (macOS) via spawn_detached().
 * Does not wait for the browser.
 *
 * @return false if the opener could not be started
 */
bool open_in_browser(const std::string& url);

} // namespace magpie
