#pragma once
// Configuration: every tunable of the engine, with defaults
//
// Defaults reproduce the reference behaviour. Overrides come from a JSON
// object (see json.hpp); any key left out keeps its default.

#include <cstddef>
#include <cstdint>

namespace krama {

struct SelectorConfig {
    float broad_phase_end = 0.35f;      // progress < this: groups of 5
    float narrow_phase_end = 0.75f;     // progress < this: groups of 3
    size_t broad_group_size = 5;
    size_t narrow_group_size = 3;

    float reuse_penalty = 0.7f;         // Item was in the previous selection
    uint32_t recent_pair_window = 50;   // Resolutions a pair stays "recent"
    float recent_pair_floor = 0.1f;     // Penalty right after a pair was resolved
    float recent_pair_ceiling = 0.2f;   // Penalty at the end of the window
    uint32_t very_recent_pairs = 10;    // Try an alternate anchor inside this
    size_t alternate_anchor_min_pool = 10;

    float bucket_low = -0.5f;           // Rating buckets for diversity
    float bucket_high = 0.5f;
    float initial_shuffle_uncertain = 0.2f;  // Top share shuffled at comparison 0
    float initial_shuffle_fewest = 0.3f;
    float pair_closeness_epsilon = 0.1f;     // 1 / (|dr| + eps)
};

struct LearningConfig {
    float base_rate = 0.1f;
    float min_rate = 0.01f;
    float max_rate = 0.2f;
    float progress_decay = 0.5f;
    float early_phase_boost = 1.2f;     // progress < early_phase_end
    float late_phase_damping = 0.8f;    // progress > late_phase_start
    float early_phase_end = 0.3f;
    float late_phase_start = 0.7f;
    float surprise_steepness = 5.0f;
    float violation_boost = 1.5f;

    float momentum_factor = 0.9f;

    uint32_t adaptation_window = 15;    // Changes needed for a volatility factor
    float typical_change = 0.1f;
    float consistency_threshold = 0.7f;
    float consistency_scaling = 1.5f;
    float inconsistency_scaling = 0.6f;
    float surprise_boost = 1.5f;
    float expected_result_damping = 0.7f;

    float uncertainty_reduction = 0.1f;
    float early_uncertainty_scale = 0.8f;
    float late_uncertainty_scale = 1.2f;
    float uncertainty_floor = 0.1f;
    float group_observation_strength = 0.8f;
    float contradiction_certainty = 0.5f;  // Uncertainty rate for outcomes against the ratings
};

struct BatchConfig {
    size_t early_min = 2, early_max = 8;
    size_t mid_min = 3, mid_max = 12;
    size_t late_min = 4, late_max = 20;
    float early_fraction = 0.03f;
    float mid_fraction = 0.06f;
    float late_fraction = 0.1f;

    uint32_t volatility_window = 20;
    float volatility_high = 0.05f;
    float volatility_low = 0.01f;
};

struct ConfidenceConfig {
    uint32_t min_comparisons = 3;
    uint32_t optimal_comparisons = 5;
    size_t local_range = 5;             // +/- ranking positions
    size_t recent_split = 5;            // Last N results count as "recent"
    float recent_weight = 0.6f;
    float historical_weight = 0.4f;
    float floor = 0.2f;

    float w_comparisons = 0.15f;
    float w_bayesian = 0.20f;
    float w_position = 0.15f;
    float w_local = 0.15f;
    float w_group = 0.10f;
    float w_temporal = 0.15f;
    float w_transitivity = 0.10f;
};

struct AuditConfig {
    uint32_t interval = 10;             // Comparisons between runs
    uint32_t min_comparisons = 5;
    float direct_strength = 0.8f;
    float direct_margin = 0.1f;
    float winner_share = 0.6f;
    float incremental = 0.6f;
    float max_correction = 0.5f;
    float cycle_margin = 0.05f;
    float triad_margin = 0.1f;
    size_t max_cycle_length = 5;
    size_t max_cycles = 300;
    size_t max_scc_search = 8;          // Larger SCCs are reduced first
    size_t triad_samples = 300;
    float renormalize_nudge = 0.05f;
};

struct ConvergenceConfig {
    float min_progress = 0.4f;
    uint32_t min_comparisons_per_item = 5;
    float min_confidence = 0.7f;
    uint32_t stability_window = 15;
    float stability_threshold = 0.03f;
    float min_transitivity = 0.85f;
    float min_rank_stability = 0.9f;

    float base_threshold = 0.7f;
    size_t min_dataset = 10;
    size_t max_dataset = 500;
    float early_multiplier = 0.8f;
    float late_multiplier = 1.2f;
    float min_threshold = 0.5f;
    float max_threshold = 0.9f;
    size_t transitivity_triads = 1000;
};

struct EngineConfig {
    uint64_t seed = 0x6b72616d61ULL;
    SelectorConfig selector;
    LearningConfig learning;
    BatchConfig batch;
    ConfidenceConfig confidence;
    AuditConfig audit;
    ConvergenceConfig convergence;
};

} // namespace krama
