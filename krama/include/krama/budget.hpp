#pragma once
// Comparison budget: how many questions is a ranking worth?
//
// Three modes trade accuracy for patience. Quick touches every item about
// one and a half times; balanced and thorough add an n log n sorting term.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace krama {

enum class BudgetMode : uint8_t {
    Quick = 0,
    Balanced = 1,
    Thorough = 2,
};

inline const char* budget_mode_name(BudgetMode m) {
    switch (m) {
        case BudgetMode::Quick:    return "quick";
        case BudgetMode::Balanced: return "balanced";
        case BudgetMode::Thorough: return "thorough";
    }
    return "unknown";
}

inline std::optional<BudgetMode> parse_budget_mode(const std::string& name) {
    if (name == "quick") return BudgetMode::Quick;
    if (name == "balanced") return BudgetMode::Balanced;
    if (name == "thorough") return BudgetMode::Thorough;
    return std::nullopt;
}

struct BudgetConfig {
    double quick_multiplier = 1.5;
    double balanced_multiplier = 3.0;
    double thorough_multiplier = 5.0;
    uint64_t min_quick = 20;
    uint64_t min_balanced = 30;
    uint64_t min_thorough = 40;
    uint64_t max_balanced = 1500;
    uint64_t max_thorough = 2000;
    double minutes_per_comparison = 0.1;
};

// Comparison budget for a dataset of item_count items
inline uint64_t comparison_budget(BudgetMode mode, size_t item_count, const BudgetConfig& config = {}) {
    const double n = static_cast<double>(item_count);
    const auto sorting = item_count > 1
        ? static_cast<uint64_t>(std::ceil(n * std::log2(n))) : 0;

    switch (mode) {
        case BudgetMode::Quick:
            return std::max(static_cast<uint64_t>(std::ceil(n * config.quick_multiplier)), config.min_quick);
        case BudgetMode::Balanced: {
            auto base = static_cast<uint64_t>(n * config.balanced_multiplier);
            return std::clamp(base + sorting, config.min_balanced, config.max_balanced);
        }
        case BudgetMode::Thorough: {
            auto base = static_cast<uint64_t>(n * config.thorough_multiplier);
            return std::clamp(base + sorting, config.min_thorough, config.max_thorough);
        }
    }
    return config.min_quick;
}

// Rough minutes a budget takes a person
inline uint64_t estimated_minutes(uint64_t comparisons, const BudgetConfig& config = {}) {
    return static_cast<uint64_t>(std::ceil(static_cast<double>(comparisons) * config.minutes_per_comparison));
}

// Minutes left, assuming answers speed up as the session goes on
inline uint64_t estimated_minutes_left(uint64_t comparisons, uint64_t max_comparisons) {
    if (comparisons >= max_comparisons) return 0;
    double remaining = static_cast<double>(max_comparisons - comparisons);
    double minutes = remaining * 0.08 * (1.0 - std::log10(remaining) / 20.0);
    return static_cast<uint64_t>(std::ceil(std::max(minutes, 0.0)));
}

} // namespace krama
