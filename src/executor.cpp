/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/executor.hpp"

namespace dagpool {

const char* toString(ExecutorPhase phase) noexcept {
    switch (phase) {
        case ExecutorPhase::Initializing: return "INITIALIZING";
        case ExecutorPhase::Ready:        return "READY";
        case ExecutorPhase::Running:      return "RUNNING";
        case ExecutorPhase::Exited:       return "EXITED";
        default: return "UNKNOWN";
    }
}

}
