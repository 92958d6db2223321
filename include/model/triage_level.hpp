#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace triage::model {

// Five-level ordinal triage outcome; 1 is most urgent.
enum class triage_level : std::uint8_t {
    RESUSCITATION = 1,
    EMERGENT = 2,
    URGENT = 3,
    LESS_URGENT = 4,
    NON_URGENT = 5,
};

inline constexpr std::array<triage_level, 5> kAllLevels = {
    triage_level::RESUSCITATION, triage_level::EMERGENT, triage_level::URGENT,
    triage_level::LESS_URGENT,   triage_level::NON_URGENT,
};

// Counts and proportions are indexed by level number; slot 0 is unused.
using level_counts_t = std::array<std::size_t, 6>;
using level_proportions_t = std::array<double, 6>;

inline constexpr int level_number(const triage_level level) noexcept {
    return static_cast<int>(level);
}

const char* label(triage_level level) noexcept;
const char* short_code(triage_level level) noexcept;
const char* description(triage_level level) noexcept;
int wait_time_minutes(triage_level level) noexcept;
std::vector<std::string> recommended_actions(triage_level level);

inline constexpr bool is_high_acuity(const triage_level level) noexcept {
    return level == triage_level::RESUSCITATION || level == triage_level::EMERGENT;
}

inline constexpr bool is_low_acuity(const triage_level level) noexcept {
    return level == triage_level::LESS_URGENT || level == triage_level::NON_URGENT;
}

std::optional<triage_level> level_from_int(int value) noexcept;

// Accepts the level number, its label (any case) or its short code.
std::optional<triage_level> parse_level(std::string_view text);

inline constexpr int distance(const triage_level a, const triage_level b) noexcept {
    const int d = level_number(a) - level_number(b);
    return d < 0 ? -d : d;
}

// -1 when a is more acute than b, 1 when less acute, 0 when equal.
inline constexpr int compare(const triage_level a, const triage_level b) noexcept {
    if (level_number(a) < level_number(b)) {
        return -1;
    }
    if (level_number(a) > level_number(b)) {
        return 1;
    }
    return 0;
}

level_counts_t level_counts(const std::vector<triage_level>& levels) noexcept;
level_proportions_t level_proportions(const std::vector<triage_level>& levels) noexcept;

}  // namespace triage::model
