#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace dagpool {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::seconds;

// Workflow priority class. Immutable after submission.
enum class Priority : std::uint8_t { Low = 0, Normal = 1, High = 2 };

inline constexpr std::size_t kPriorityClasses = 3;

using WorkflowId = std::string;

[[nodiscard]] const char* toString(Priority priority) noexcept;
[[nodiscard]] std::optional<Priority> parsePriority(const std::string& text);

// One concrete instance of a task. A reschedule creates a new instance with retryId + 1.
struct TaskRef {
    WorkflowId workflow;
    std::string task;
    int retryId = 0;

    [[nodiscard]] std::string str() const;
    bool operator==(const TaskRef& other) const noexcept {
        return retryId == other.retryId && task == other.task && workflow == other.workflow;
    }
    bool operator!=(const TaskRef& other) const noexcept { return !(*this == other); }
};

// Groups are addressed as "<workflow>/<group>" wherever they leave their workflow.
[[nodiscard]] std::string makeGroupKey(const WorkflowId& workflow, const std::string& group);
[[nodiscard]] std::pair<WorkflowId, std::string> splitGroupKey(const std::string& key);

// Resource vector. Memory and storage are in GiB. An infinite component means unlimited.
struct Resources {
    double cpu = 0;
    double gpu = 0;
    double memory = 0;
    double storage = 0;

    [[nodiscard]] static Resources unlimited() noexcept {
        constexpr double inf = std::numeric_limits<double>::infinity();
        return {inf, inf, inf, inf};
    }

    Resources& operator+=(const Resources& other) noexcept;
    Resources& operator-=(const Resources& other) noexcept;
    friend Resources operator+(Resources lhs, const Resources& rhs) noexcept { return lhs += rhs; }
    friend Resources operator-(Resources lhs, const Resources& rhs) noexcept { return lhs -= rhs; }

    // Component-wise <= with a small tolerance for accumulated floating point error.
    [[nodiscard]] bool fitsWithin(const Resources& limit) const noexcept;
    [[nodiscard]] bool isZero() const noexcept;
    [[nodiscard]] bool anyPositive() const noexcept;

    [[nodiscard]] Resources clampedAtZero() const noexcept;
    [[nodiscard]] Resources min(const Resources& other) const noexcept;

    [[nodiscard]] std::string toString() const;
};

// Parses "512Mi", "32Gi", "2Ti", "1024Ki" or a bare number (GiB) into GiB.
// Throws ValidationError on malformed input.
[[nodiscard]] double parseQuantityGi(const std::string& text);

// Parses "90", "90s", "15m", "2h" or "1d". Throws ValidationError on malformed input.
[[nodiscard]] Seconds parseDuration(const std::string& text);

} // namespace dagpool
