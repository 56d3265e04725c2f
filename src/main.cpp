// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char** argv) {
    // Minimal logging first so early log calls don't crash
    magpie::logging::init_early();

    try {
        magpie::Application app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("Runtime error: {}", e.what());
        spdlog::shutdown();
        return 1;
    }
}
