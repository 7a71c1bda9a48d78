// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <cstdio>
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    beacon::util::LogManager::Initialize(level, false, "");

    // "trace" also lowers every component logger, so LOG_NET_TRACE,
    // LOG_DISC_TRACE, etc. all print
    if (level == "trace") {
        for (const auto& component : beacon::util::LogManager::Components()) {
            beacon::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    beacon::util::LogManager::Shutdown();
}
