// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    liveprobe::util::LogManager::Initialize(level, false, "");

    // "trace" should reach LOG_PROBE_TRACE as well as the default logger
    if (level == "trace") {
        liveprobe::util::LogManager::SetLogLevel("trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    liveprobe::util::LogManager::Shutdown();
}
