#pragma once
// Convergence Monitor: is it safe to stop asking?
//
// Four signals must agree at once: items are trusted, ratings have stopped
// moving, the ratings honour the recorded outcomes, and the order has held
// still for a while. Small datasets must earn more trust before stopping.

#include "config.hpp"
#include "history.hpp"
#include "preference_graph.hpp"
#include "rating_store.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <random>

namespace krama {

struct AdaptiveThresholds {
    float confidence = 0.7f;
    float stability = 0.56f;
    float transitivity = 0.63f;
    float rank_change = 0.05f;
};

// Snapshot of every signal the monitor looked at
struct ConvergenceReport {
    bool converged = false;
    float progress = 0.0f;
    float avg_confidence = 0.0f;
    float transitivity = 0.0f;
    float rank_stability = 0.0f;
    AdaptiveThresholds thresholds;
    const char* blocked_by = "";
};

class ConvergenceMonitor {
public:
    explicit ConvergenceMonitor(ConvergenceConfig config = {}) : config_(config) {}

    const ConvergenceConfig& config() const { return config_; }

    AdaptiveThresholds thresholds(size_t item_count, float progress) const {
        float span = static_cast<float>(config_.max_dataset - config_.min_dataset);
        float size = std::clamp((static_cast<float>(item_count) - static_cast<float>(config_.min_dataset)) / span,
                                0.0f, 1.0f);
        float base = config_.base_threshold * (1.0f - 0.3f * size);

        float multiplier = 1.0f;
        if (progress < 0.3f) multiplier = config_.early_multiplier;
        else if (progress > 0.7f) multiplier = config_.late_multiplier;

        float t = std::clamp(base * multiplier, config_.min_threshold, config_.max_threshold);

        AdaptiveThresholds out;
        out.confidence = t;
        out.stability = 0.8f * t;
        out.transitivity = 0.9f * t;
        out.rank_change = std::max(0.02f, 0.05f * (1.0f - size));
        return out;
    }

    // Share of evidenced triads whose recorded outcomes agree with the
    // ratings. All triads are checked when few enough, else a fixed sample.
    float transitivity_score(const RatingStore& store, const ComparisonHistory& history) const {
        PreferenceGraph graph = PreferenceGraph::build(store.ids(), history);
        const size_t n = graph.node_count();
        if (n < 3) return 1.0f;

        size_t evidenced = 0, transitive = 0;
        auto check = [&](size_t i, size_t j, size_t k) {
            const size_t nodes[3] = {i, j, k};
            bool any = false, agree = true;
            for (size_t x = 0; x < 3; ++x) {
                for (size_t y = 0; y < 3; ++y) {
                    if (x == y || !graph.has_edge(nodes[x], nodes[y])) continue;
                    any = true;
                    if (store.rating(graph.id(nodes[x])) <= store.rating(graph.id(nodes[y]))) agree = false;
                }
            }
            if (!any) return;
            evidenced++;
            if (agree) transitive++;
        };

        const uint64_t total = static_cast<uint64_t>(n) * (n - 1) * (n - 2) / 6;
        if (total <= config_.transitivity_triads) {
            for (size_t i = 0; i < n; ++i)
                for (size_t j = i + 1; j < n; ++j)
                    for (size_t k = j + 1; k < n; ++k) check(i, j, k);
        } else {
            // Fixed seed: reading the score must not disturb the session
            Rng rng(n * 2654435761ULL + history.size());
            std::uniform_int_distribution<size_t> pick(0, n - 1);
            for (size_t s = 0; s < config_.transitivity_triads; ++s) {
                size_t i = pick(rng), j = pick(rng), k = pick(rng);
                if (i == j || j == k || i == k) continue;
                check(i, j, k);
            }
        }
        return evidenced > 0 ? static_cast<float>(transitive) / static_cast<float>(evidenced) : 0.0f;
    }

    // Position agreement with the ranking stability_window entries ago,
    // top positions weighted more. 0 without enough history.
    float rank_stability(const RatingStore& store, const ComparisonHistory& history) const {
        const HistoryEntry* then = history.from_back(config_.stability_window - 1);
        if (!then || store.size() < 2) return 0.0f;

        RankingView now = RankingView::of(store);
        RankingView before = RankingView::of(then->before.store);
        const float n = static_cast<float>(now.size());

        float score = 0.0f, weights = 0.0f;
        for (size_t i = 0; i < now.size(); ++i) {
            size_t prev = before.position_of(now.ranked[i]);
            float diff = std::fabs(static_cast<float>(i) - static_cast<float>(prev));
            float weight = 1.0f - static_cast<float>(i) / n;
            score += (1.0f - diff / (n - 1.0f)) * weight;
            weights += weight;
        }
        return weights > 0.0f ? score / weights : 0.0f;
    }

    ConvergenceReport evaluate(const RatingStore& store, const ComparisonHistory& history,
                               const std::deque<float>& recent_changes,
                               uint64_t comparisons, uint64_t max_comparisons,
                               float avg_confidence) const {
        ConvergenceReport r;
        r.progress = max_comparisons > 0
            ? static_cast<float>(comparisons) / static_cast<float>(max_comparisons) : 0.0f;
        r.avg_confidence = avg_confidence;
        r.thresholds = thresholds(store.size(), r.progress);

        if (r.progress < config_.min_progress) {
            r.blocked_by = "progress";
            return r;
        }
        if (store.min_comparisons() < config_.min_comparisons_per_item) {
            r.blocked_by = "coverage";
            return r;
        }
        if (avg_confidence < std::max(r.thresholds.confidence, config_.min_confidence)) {
            r.blocked_by = "confidence";
            return r;
        }
        if (recent_changes.size() < config_.stability_window) {
            r.blocked_by = "stability";
            return r;
        }
        float limit = std::min(r.thresholds.rank_change, config_.stability_threshold);
        for (auto it = recent_changes.end() - config_.stability_window; it != recent_changes.end(); ++it) {
            if (std::fabs(*it) > limit) {
                r.blocked_by = "stability";
                return r;
            }
        }
        r.transitivity = transitivity_score(store, history);
        if (r.transitivity < std::max(r.thresholds.transitivity, config_.min_transitivity)) {
            r.blocked_by = "transitivity";
            return r;
        }
        r.rank_stability = rank_stability(store, history);
        if (r.rank_stability < std::max(r.thresholds.stability, config_.min_rank_stability)) {
            r.blocked_by = "rank_stability";
            return r;
        }
        r.converged = true;
        return r;
    }

private:
    ConvergenceConfig config_;
};

} // namespace krama
