/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dagpool {

enum class ExitAction : std::uint8_t { Complete, Fail, Reschedule };

[[nodiscard]] const char* toString(ExitAction action) noexcept;
[[nodiscard]] std::optional<ExitAction> parseExitAction(const std::string& text);

// Maps exit codes to actions, e.g. COMPLETE: "0", RESCHEDULE: "137-140,255".
class ExitActions {
public:
    struct Range {
        int first;
        int last;
        ExitAction action;
    };

    // Throws ValidationError on a malformed range list.
    void add(ExitAction action, const std::string& ranges);

    // First matching range wins, in insertion order.
    [[nodiscard]] std::optional<ExitAction> lookup(int exitCode) const noexcept;

    [[nodiscard]] bool empty() const noexcept { return ranges_.empty(); }
    [[nodiscard]] const std::vector<Range>& ranges() const noexcept { return ranges_; }

private:
    std::vector<Range> ranges_;
};

}
