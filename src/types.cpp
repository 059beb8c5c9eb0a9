/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/types.hpp"
#include "dagpool/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace dagpool {

namespace {

constexpr double kEpsilon = 1e-9;

std::string lowered(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

void appendComponent(std::ostringstream& out, const char* name, double value, bool& first) {
    if (value == 0) return;
    if (!first) out << ", ";
    first = false;
    out << name << "=";
    if (std::isinf(value)) {
        out << "unlimited";
    } else {
        out << value;
    }
}

}

const char* toString(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low:    return "LOW";
        case Priority::Normal: return "NORMAL";
        case Priority::High:   return "HIGH";
        default: return "UNKNOWN";
    }
}

std::optional<Priority> parsePriority(const std::string& text) {
    const auto value = lowered(text);
    if (value == "low") return Priority::Low;
    if (value == "normal") return Priority::Normal;
    if (value == "high") return Priority::High;
    return std::nullopt;
}

std::string TaskRef::str() const {
    return workflow + "/" + task + "#" + std::to_string(retryId);
}

std::string makeGroupKey(const WorkflowId& workflow, const std::string& group) {
    return workflow + "/" + group;
}

std::pair<WorkflowId, std::string> splitGroupKey(const std::string& key) {
    const auto slash = key.rfind('/');
    if (slash == std::string::npos) {
        return {key, std::string{}};
    }
    return {key.substr(0, slash), key.substr(slash + 1)};
}

Resources& Resources::operator+=(const Resources& other) noexcept {
    cpu += other.cpu;
    gpu += other.gpu;
    memory += other.memory;
    storage += other.storage;
    return *this;
}

Resources& Resources::operator-=(const Resources& other) noexcept {
    cpu -= other.cpu;
    gpu -= other.gpu;
    memory -= other.memory;
    storage -= other.storage;
    return *this;
}

bool Resources::fitsWithin(const Resources& limit) const noexcept {
    return cpu <= limit.cpu + kEpsilon &&
           gpu <= limit.gpu + kEpsilon &&
           memory <= limit.memory + kEpsilon &&
           storage <= limit.storage + kEpsilon;
}

bool Resources::isZero() const noexcept {
    return std::abs(cpu) <= kEpsilon && std::abs(gpu) <= kEpsilon &&
           std::abs(memory) <= kEpsilon && std::abs(storage) <= kEpsilon;
}

bool Resources::anyPositive() const noexcept {
    return cpu > kEpsilon || gpu > kEpsilon || memory > kEpsilon || storage > kEpsilon;
}

Resources Resources::clampedAtZero() const noexcept {
    return {std::max(cpu, 0.0), std::max(gpu, 0.0), std::max(memory, 0.0), std::max(storage, 0.0)};
}

Resources Resources::min(const Resources& other) const noexcept {
    return {std::min(cpu, other.cpu), std::min(gpu, other.gpu),
            std::min(memory, other.memory), std::min(storage, other.storage)};
}

std::string Resources::toString() const {
    std::ostringstream out;
    bool first = true;
    appendComponent(out, "cpu", cpu, first);
    appendComponent(out, "gpu", gpu, first);
    appendComponent(out, "memory", memory, first);
    appendComponent(out, "storage", storage, first);
    if (first) return "none";
    return out.str();
}

double parseQuantityGi(const std::string& text) {
    std::size_t consumed = 0;
    double number = 0;
    try {
        number = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ValidationError("Invalid quantity: '" + text + "'");
    }
    if (number < 0) {
        throw ValidationError("Negative quantity: '" + text + "'");
    }

    std::string suffix = text.substr(consumed);
    suffix.erase(std::remove_if(suffix.begin(), suffix.end(),
                                [](unsigned char c) { return std::isspace(c); }),
                 suffix.end());

    if (suffix.empty() || suffix == "Gi") return number;
    if (suffix == "Ki") return number / (1024.0 * 1024.0);
    if (suffix == "Mi") return number / 1024.0;
    if (suffix == "Ti") return number * 1024.0;
    throw ValidationError("Unknown quantity suffix in '" + text + "'");
}

Seconds parseDuration(const std::string& text) {
    std::size_t consumed = 0;
    long long number = 0;
    try {
        number = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw ValidationError("Invalid duration: '" + text + "'");
    }
    if (number < 0) {
        throw ValidationError("Negative duration: '" + text + "'");
    }

    const std::string suffix = text.substr(consumed);
    if (suffix.empty() || suffix == "s") return Seconds(number);
    if (suffix == "m") return Seconds(number * 60);
    if (suffix == "h") return Seconds(number * 3600);
    if (suffix == "d") return Seconds(number * 86400);
    throw ValidationError("Unknown duration suffix in '" + text + "'");
}

} // namespace dagpool
