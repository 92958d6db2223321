#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

namespace triage::model {

// Fixed index order shared by weights, reference ranges and bounds tables.
inline constexpr std::size_t kVitalHr = 0;
inline constexpr std::size_t kVitalRr = 1;
inline constexpr std::size_t kVitalSbp = 2;
inline constexpr std::size_t kVitalDbp = 3;
inline constexpr std::size_t kVitalTemp = 4;
inline constexpr std::size_t kVitalSpo2 = 5;
inline constexpr std::size_t kVitalGcs = 6;
inline constexpr std::size_t kNumVitals = 7;

// One observation. Zero in any field means "not measured".
struct vitals {
    int hr;       // beats/min
    int rr;       // breaths/min
    int sbp;      // mmHg
    int dbp;      // mmHg
    double temp;  // Celsius
    int spo2;     // percent
    int gcs;      // 3..15
};

static_assert(std::is_standard_layout_v<vitals>, "vitals must be standard layout");
static_assert(std::is_trivial_v<vitals>, "vitals must be trivial");

using vital_values = std::array<double, kNumVitals>;

inline constexpr const char* vital_name(const std::size_t index) noexcept {
    constexpr const char* kNames[kNumVitals] = {"hr", "rr", "sbp", "dbp", "temp", "spo2", "gcs"};
    return index < kNumVitals ? kNames[index] : "unknown";
}

inline constexpr vital_values values(const vitals& v) noexcept {
    return {static_cast<double>(v.hr),  static_cast<double>(v.rr),   static_cast<double>(v.sbp),
            static_cast<double>(v.dbp), v.temp,                      static_cast<double>(v.spo2),
            static_cast<double>(v.gcs)};
}

// Integer vitals count as measured only when strictly positive; temperature
// only needs to differ from 0.0, so a negative reading is still present.
inline constexpr bool present(const double value, const std::size_t index) noexcept {
    if (index == kVitalTemp) {
        return value != 0.0;
    }
    return value > 0.0;
}

inline constexpr bool present(const vitals& v, const std::size_t index) noexcept {
    return index < kNumVitals && present(values(v)[index], index);
}

inline constexpr std::size_t present_count(const vitals& v) noexcept {
    std::size_t count = 0;
    for (std::size_t i = 0; i < kNumVitals; ++i) {
        if (present(v, i)) {
            ++count;
        }
    }
    return count;
}

}  // namespace triage::model
