/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/exit_actions.hpp"
#include "dagpool/errors.hpp"
#include <cctype>
#include <sstream>

namespace dagpool {

namespace {

std::string trimmed(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) return {};
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

int parseCode(const std::string& text, const std::string& context) {
    std::size_t consumed = 0;
    int code = 0;
    try {
        code = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ValidationError("Invalid exit code '" + text + "' in '" + context + "'");
    }
    if (consumed != text.size() || code < 0 || code > 255) {
        throw ValidationError("Invalid exit code '" + text + "' in '" + context + "'");
    }
    return code;
}

}

const char* toString(ExitAction action) noexcept {
    switch (action) {
        case ExitAction::Complete:   return "COMPLETE";
        case ExitAction::Fail:       return "FAIL";
        case ExitAction::Reschedule: return "RESCHEDULE";
        default: return "UNKNOWN";
    }
}

std::optional<ExitAction> parseExitAction(const std::string& text) {
    std::string value(text);
    for (char& c : value) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (value == "COMPLETE") return ExitAction::Complete;
    if (value == "FAIL") return ExitAction::Fail;
    if (value == "RESCHEDULE") return ExitAction::Reschedule;
    return std::nullopt;
}

void ExitActions::add(ExitAction action, const std::string& ranges) {
    std::istringstream input(ranges);
    std::string item;
    while (std::getline(input, item, ',')) {
        item = trimmed(item);
        if (item.empty()) continue;

        const auto dash = item.find('-');
        Range range{0, 0, action};
        if (dash == std::string::npos) {
            range.first = range.last = parseCode(item, ranges);
        } else {
            range.first = parseCode(trimmed(item.substr(0, dash)), ranges);
            range.last = parseCode(trimmed(item.substr(dash + 1)), ranges);
            if (range.first > range.last) {
                throw ValidationError("Empty exit code range '" + item + "'");
            }
        }
        ranges_.push_back(range);
    }
}

std::optional<ExitAction> ExitActions::lookup(int exitCode) const noexcept {
    for (const auto& range : ranges_) {
        if (exitCode >= range.first && exitCode <= range.last) {
            return range.action;
        }
    }
    return std::nullopt;
}

}
