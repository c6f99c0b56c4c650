#pragma once
// JSON: items in, configuration in, rankings out
//
// nlohmann/json bindings for the public types. Readers are forgiving:
// every configuration key is optional, ids may be numbers, years may be
// strings. Writers are plain and stable.

#include "auditor.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace krama {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════
// Items
// ═══════════════════════════════════════════════════════════════════════

inline void to_json(json& j, const Item& item) {
    j = json{{"id", item.id}, {"title", item.title}, {"year", item.year}};
    if (!item.image.empty()) j["image"] = item.image;
}

inline void from_json(const json& j, Item& item) {
    const json& id = j.at("id");
    item.id = id.is_string() ? id.get<std::string>() : id.dump();
    item.title = j.value("title", item.id);

    item.year = 0;
    if (auto it = j.find("year"); it != j.end()) {
        if (it->is_number_integer()) {
            item.year = it->get<int>();
        } else if (it->is_string()) {
            const std::string s = it->get<std::string>();
            item.year = s.empty() ? 0 : std::atoi(s.c_str());
        }
    }

    item.image = j.value("image", std::string{});
    if (item.image.empty()) item.image = j.value("poster", std::string{});
}

// ═══════════════════════════════════════════════════════════════════════
// Records
// ═══════════════════════════════════════════════════════════════════════

inline void to_json(json& j, const RecentResult& r) {
    j = json{
        {"opponent", r.opponent},
        {"outcome", r.outcome},
        {"rating_diff", r.rating_diff},
        {"learning_rate", r.learning_rate}
    };
}

inline void from_json(const json& j, RecentResult& r) {
    r.opponent = j.at("opponent").get<std::string>();
    r.outcome = j.value("outcome", 0) != 0 ? 1 : 0;
    r.rating_diff = j.value("rating_diff", 0.0f);
    r.learning_rate = j.value("learning_rate", 0.0f);
}

inline void to_json(json& j, const GroupSelections& g) {
    j = json{{"chosen", g.chosen}, {"appearances", g.appearances}};
}

inline void from_json(const json& j, GroupSelections& g) {
    g.chosen = j.value("chosen", 0u);
    g.appearances = j.value("appearances", 0u);
}

inline void to_json(json& j, const RatingRecord& rec) {
    j = json{
        {"rating", rec.rating},
        {"rating_mean", rec.rating_mean},
        {"rating_uncertainty", rec.rating_uncertainty},
        {"wins", rec.wins},
        {"losses", rec.losses},
        {"comparisons", rec.comparisons},
        {"recent_results", rec.recent_results.to_vector()},
        {"group_selections", rec.group_selections},
        {"momentum", rec.momentum}
    };
}

inline void from_json(const json& j, RatingRecord& rec) {
    rec.rating = j.value("rating", 0.0f);
    rec.rating_mean = j.value("rating_mean", 0.0f);
    rec.rating_uncertainty = j.value("rating_uncertainty", 1.0f);
    rec.wins = j.value("wins", 0u);
    rec.losses = j.value("losses", 0u);
    rec.comparisons = rec.wins + rec.losses;
    rec.recent_results = RecentResults{};
    if (auto it = j.find("recent_results"); it != j.end()) {
        for (const auto& r : *it) rec.recent_results.push(r.get<RecentResult>());
    }
    rec.group_selections = j.value("group_selections", GroupSelections{});
    rec.momentum = j.value("momentum", 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════
// Results and progress
// ═══════════════════════════════════════════════════════════════════════

inline void to_json(json& j, const RankedResult& r) {
    j = json{
        {"rank", r.rank},
        {"item", r.item},
        {"rating", r.rating},
        {"wins", r.wins},
        {"losses", r.losses},
        {"comparisons", r.comparisons},
        {"recent_results", r.recent_results},
        {"confidence", r.confidence},
        {"rating_uncertainty", r.rating_uncertainty},
        {"group_selections", r.group_selections}
    };
}

inline void to_json(json& j, const OptimizationStats& s) {
    j = json{
        {"runs", s.runs},
        {"last_run_comparison", s.last_run_comparison},
        {"total_corrections", s.total_corrections},
        {"direct_fixed", s.direct_fixed},
        {"transitivity_fixed", s.transitivity_fixed},
        {"cycles_found", s.cycles_found},
        {"normalization_fixes", s.normalization_fixes}
    };
}

inline void to_json(json& j, const ProgressStats& s) {
    j = json{
        {"comparisons", s.comparisons},
        {"max_comparisons", s.max_comparisons},
        {"avg_confidence", s.avg_confidence},
        {"stability_score", s.stability_score},
        {"optimization", s.optimization},
        {"learning_rate", s.learning_rate},
        {"estimated_minutes_left", s.estimated_minutes_left},
        {"phase", phase_name(s.phase)},
        {"state", state_name(s.state)},
        {"pending_updates", s.pending_updates}
    };
}

// ═══════════════════════════════════════════════════════════════════════
// Configuration (every key optional)
// ═══════════════════════════════════════════════════════════════════════

namespace detail {
// Reads a key into a field when present, leaving the default otherwise
struct FieldReader {
    const json& j;
    template<typename T>
    void operator()(const char* key, T& field) const {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) field = it->get<T>();
    }
};

struct FieldWriter {
    json& j;
    template<typename T>
    void operator()(const char* key, const T& field) const { j[key] = field; }
};

template<typename Config, typename F>
void selector_fields(Config& c, F&& f) {
    f("broad_phase_end", c.broad_phase_end);
    f("narrow_phase_end", c.narrow_phase_end);
    f("broad_group_size", c.broad_group_size);
    f("narrow_group_size", c.narrow_group_size);
    f("reuse_penalty", c.reuse_penalty);
    f("recent_pair_window", c.recent_pair_window);
    f("recent_pair_floor", c.recent_pair_floor);
    f("recent_pair_ceiling", c.recent_pair_ceiling);
    f("very_recent_pairs", c.very_recent_pairs);
    f("alternate_anchor_min_pool", c.alternate_anchor_min_pool);
    f("bucket_low", c.bucket_low);
    f("bucket_high", c.bucket_high);
    f("initial_shuffle_uncertain", c.initial_shuffle_uncertain);
    f("initial_shuffle_fewest", c.initial_shuffle_fewest);
    f("pair_closeness_epsilon", c.pair_closeness_epsilon);
}

template<typename Config, typename F>
void learning_fields(Config& c, F&& f) {
    f("base_rate", c.base_rate);
    f("min_rate", c.min_rate);
    f("max_rate", c.max_rate);
    f("progress_decay", c.progress_decay);
    f("early_phase_boost", c.early_phase_boost);
    f("late_phase_damping", c.late_phase_damping);
    f("early_phase_end", c.early_phase_end);
    f("late_phase_start", c.late_phase_start);
    f("surprise_steepness", c.surprise_steepness);
    f("violation_boost", c.violation_boost);
    f("momentum_factor", c.momentum_factor);
    f("adaptation_window", c.adaptation_window);
    f("typical_change", c.typical_change);
    f("consistency_threshold", c.consistency_threshold);
    f("consistency_scaling", c.consistency_scaling);
    f("inconsistency_scaling", c.inconsistency_scaling);
    f("surprise_boost", c.surprise_boost);
    f("expected_result_damping", c.expected_result_damping);
    f("uncertainty_reduction", c.uncertainty_reduction);
    f("early_uncertainty_scale", c.early_uncertainty_scale);
    f("late_uncertainty_scale", c.late_uncertainty_scale);
    f("uncertainty_floor", c.uncertainty_floor);
    f("group_observation_strength", c.group_observation_strength);
    f("contradiction_certainty", c.contradiction_certainty);
}

template<typename Config, typename F>
void batch_fields(Config& c, F&& f) {
    f("early_min", c.early_min);
    f("early_max", c.early_max);
    f("mid_min", c.mid_min);
    f("mid_max", c.mid_max);
    f("late_min", c.late_min);
    f("late_max", c.late_max);
    f("early_fraction", c.early_fraction);
    f("mid_fraction", c.mid_fraction);
    f("late_fraction", c.late_fraction);
    f("volatility_window", c.volatility_window);
    f("volatility_high", c.volatility_high);
    f("volatility_low", c.volatility_low);
}

template<typename Config, typename F>
void confidence_fields(Config& c, F&& f) {
    f("min_comparisons", c.min_comparisons);
    f("optimal_comparisons", c.optimal_comparisons);
    f("local_range", c.local_range);
    f("recent_split", c.recent_split);
    f("recent_weight", c.recent_weight);
    f("historical_weight", c.historical_weight);
    f("floor", c.floor);
    f("w_comparisons", c.w_comparisons);
    f("w_bayesian", c.w_bayesian);
    f("w_position", c.w_position);
    f("w_local", c.w_local);
    f("w_group", c.w_group);
    f("w_temporal", c.w_temporal);
    f("w_transitivity", c.w_transitivity);
}

template<typename Config, typename F>
void audit_fields(Config& c, F&& f) {
    f("interval", c.interval);
    f("min_comparisons", c.min_comparisons);
    f("direct_strength", c.direct_strength);
    f("direct_margin", c.direct_margin);
    f("winner_share", c.winner_share);
    f("incremental", c.incremental);
    f("max_correction", c.max_correction);
    f("cycle_margin", c.cycle_margin);
    f("triad_margin", c.triad_margin);
    f("max_cycle_length", c.max_cycle_length);
    f("max_cycles", c.max_cycles);
    f("max_scc_search", c.max_scc_search);
    f("triad_samples", c.triad_samples);
    f("renormalize_nudge", c.renormalize_nudge);
}

template<typename Config, typename F>
void convergence_fields(Config& c, F&& f) {
    f("min_progress", c.min_progress);
    f("min_comparisons_per_item", c.min_comparisons_per_item);
    f("min_confidence", c.min_confidence);
    f("stability_window", c.stability_window);
    f("stability_threshold", c.stability_threshold);
    f("min_transitivity", c.min_transitivity);
    f("min_rank_stability", c.min_rank_stability);
    f("base_threshold", c.base_threshold);
    f("min_dataset", c.min_dataset);
    f("max_dataset", c.max_dataset);
    f("early_multiplier", c.early_multiplier);
    f("late_multiplier", c.late_multiplier);
    f("min_threshold", c.min_threshold);
    f("max_threshold", c.max_threshold);
    f("transitivity_triads", c.transitivity_triads);
}

template<typename Config, typename F>
void engine_fields(Config& c, F&& f) {
    f("seed", c.seed);
    f("selector", c.selector);
    f("learning", c.learning);
    f("batch", c.batch);
    f("confidence", c.confidence);
    f("audit", c.audit);
    f("convergence", c.convergence);
}
} // namespace detail

inline void from_json(const json& j, SelectorConfig& c) {
    detail::selector_fields(c, detail::FieldReader{j});
}

inline void to_json(json& j, const SelectorConfig& c) {
    j = json::object();
    detail::selector_fields(c, detail::FieldWriter{j});
}

inline void from_json(const json& j, LearningConfig& c) {
    detail::learning_fields(c, detail::FieldReader{j});
}

inline void to_json(json& j, const LearningConfig& c) {
    j = json::object();
    detail::learning_fields(c, detail::FieldWriter{j});
}

inline void from_json(const json& j, BatchConfig& c) {
    detail::batch_fields(c, detail::FieldReader{j});
}

inline void to_json(json& j, const BatchConfig& c) {
    j = json::object();
    detail::batch_fields(c, detail::FieldWriter{j});
}

inline void from_json(const json& j, ConfidenceConfig& c) {
    detail::confidence_fields(c, detail::FieldReader{j});
}

inline void to_json(json& j, const ConfidenceConfig& c) {
    j = json::object();
    detail::confidence_fields(c, detail::FieldWriter{j});
}

inline void from_json(const json& j, AuditConfig& c) {
    detail::audit_fields(c, detail::FieldReader{j});
}

inline void to_json(json& j, const AuditConfig& c) {
    j = json::object();
    detail::audit_fields(c, detail::FieldWriter{j});
}

inline void from_json(const json& j, ConvergenceConfig& c) {
    detail::convergence_fields(c, detail::FieldReader{j});
}

inline void to_json(json& j, const ConvergenceConfig& c) {
    j = json::object();
    detail::convergence_fields(c, detail::FieldWriter{j});
}

inline void from_json(const json& j, EngineConfig& c) {
    detail::engine_fields(c, detail::FieldReader{j});
}

inline void to_json(json& j, const EngineConfig& c) {
    j = json::object();
    detail::engine_fields(c, detail::FieldWriter{j});
}

// ═══════════════════════════════════════════════════════════════════════
// Files
// ═══════════════════════════════════════════════════════════════════════

inline json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open " + path);
    return json::parse(in);
}

// Items from a JSON array, or an object holding one under "items"
inline std::vector<Item> parse_items(const json& j) {
    const json& list = j.is_object() ? j.at("items") : j;
    if (!list.is_array()) throw std::runtime_error("item list must be a JSON array");
    std::vector<Item> items;
    items.reserve(list.size());
    for (const auto& entry : list) items.push_back(entry.get<Item>());
    return items;
}

inline std::vector<Item> load_items(const std::string& path) {
    return parse_items(read_json_file(path));
}

inline EngineConfig load_config(const std::string& path) {
    return read_json_file(path).get<EngineConfig>();
}

} // namespace krama
