#pragma once
// Confidence Estimator: how much do we trust an item's position?
//
// Seven signals blended into [0.2, 1]: comparison count, Bayesian
// uncertainty, position-aware win rate, local consistency, group choice
// ratio, temporal stability, local transitivity.
//
// Results are memoised per item. Each cached value remembers which items
// it read, so a mutation only evicts the values that actually depended on
// the items it touched.

#include "config.hpp"
#include "rating_store.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace krama {

// Individual factors, exposed for diagnostics and tests
struct ConfidenceFactors {
    float comparisons = 0.0f;
    float bayesian = 0.0f;
    float position = 0.0f;
    float local = 0.5f;
    float group = 0.5f;
    float temporal = 0.5f;
    float transitivity = 0.5f;
};

class ConfidenceEstimator {
public:
    explicit ConfidenceEstimator(ConfidenceConfig config = {}) : config_(config) {}

    const ConfidenceConfig& config() const { return config_; }

    // Blended confidence. `deps` receives every item the value read.
    float compute(const ItemId& id, const RatingStore& store, const RankingView& view,
                  std::vector<ItemId>* deps = nullptr) const {
        if (deps) deps->push_back(id);
        const RatingRecord* rec = store.find(id);
        if (!rec || rec->comparisons < config_.min_comparisons) {
            return config_.floor;
        }

        ConfidenceFactors f = factors(id, *rec, store, view, deps);
        float blended =
            f.comparisons * config_.w_comparisons +
            f.bayesian * config_.w_bayesian +
            f.position * config_.w_position +
            f.local * config_.w_local +
            f.group * config_.w_group +
            f.temporal * config_.w_temporal +
            f.transitivity * config_.w_transitivity;

        return std::clamp(blended, config_.floor, 1.0f);
    }

    ConfidenceFactors factors(const ItemId& id, const RatingRecord& rec,
                              const RatingStore& store, const RankingView& view,
                              std::vector<ItemId>* deps = nullptr) const {
        ConfidenceFactors f;

        // 1. Comparison sufficiency
        float sufficiency = static_cast<float>(rec.comparisons) /
                            static_cast<float>(config_.optimal_comparisons);
        f.comparisons = std::min(sufficiency, 1.0f) * 0.8f + 0.2f;

        // 2. Bayesian confidence
        f.bayesian = 1.0f - std::min(rec.rating_uncertainty, 1.0f);

        // 3. Position-aware win rate: top quarter should win, bottom should lose
        size_t pos = view.position_of(id);
        float relative = static_cast<float>(pos) / static_cast<float>(std::max<size_t>(view.size(), 1));
        float expected, weight;
        if (relative <= 0.25f) {
            expected = 0.75f;
            weight = 0.8f;
        } else if (relative >= 0.75f) {
            expected = 0.25f;
            weight = 0.8f;
        } else {
            expected = 0.5f;
            weight = 0.5f;
        }
        f.position = (1.0f - std::fabs(rec.win_rate() - expected)) * weight;

        // Neighbourhood in the current ranking
        size_t lo = pos > config_.local_range ? pos - config_.local_range : 0;
        size_t hi = std::min(view.size(), pos + config_.local_range + 1);
        if (deps) {
            for (size_t i = lo; i < hi; ++i) {
                if (view.ranked[i] != id) deps->push_back(view.ranked[i]);
            }
        }

        // 4. Local consistency: outcomes against neighbours agree with ratings
        size_t local_total = 0, local_agree = 0;
        for (size_t i = 0; i < rec.recent_results.size(); ++i) {
            const RecentResult& r = rec.recent_results[i];
            size_t opp_pos = view.position_of(r.opponent);
            if (opp_pos < lo || opp_pos >= hi || r.opponent == id) continue;
            local_total++;
            uint8_t expected_outcome = store.rating(r.opponent) < rec.rating ? 1 : 0;
            if (r.outcome == expected_outcome) local_agree++;
        }
        if (local_total > 0) {
            f.local = static_cast<float>(local_agree) / static_cast<float>(local_total);
        }

        // 5. Group choice ratio
        if (rec.group_selections.appearances > 0) {
            f.group = static_cast<float>(rec.group_selections.chosen) /
                      static_cast<float>(rec.group_selections.appearances);
        }

        // 6. Temporal consistency
        size_t n = rec.recent_results.size();
        size_t split = n > config_.recent_split ? n - config_.recent_split : 0;
        float recent = rec.recent_results.flip_consistency(split, n);
        float historical = rec.recent_results.flip_consistency(0, split);
        f.temporal = recent * config_.recent_weight + historical * config_.historical_weight;

        // 7. Local transitivity
        f.transitivity = local_transitivity(pos, lo, hi, store, view);

        return f;
    }

private:
    // Every recorded outcome between upper and lower favours upper
    static bool agrees(const RatingRecord& upper, const ItemId& upper_id,
                       const RatingRecord& lower, const ItemId& lower_id) {
        for (size_t i = 0; i < upper.recent_results.size(); ++i) {
            const auto& r = upper.recent_results[i];
            if (r.opponent == lower_id && r.outcome != 1) return false;
        }
        for (size_t i = 0; i < lower.recent_results.size(); ++i) {
            const auto& r = lower.recent_results[i];
            if (r.opponent == upper_id && r.outcome != 0) return false;
        }
        return true;
    }

    float local_transitivity(size_t pos, size_t lo, size_t hi,
                             const RatingStore& store, const RankingView& view) const {
        float weighted = 0.0f;
        float total = 0.0f;

        for (size_t i = lo; i + 2 < hi; ++i) {
            const ItemId& a = view.ranked[i];
            const RatingRecord* ra = store.find(a);
            for (size_t j = i + 1; j + 1 < hi; ++j) {
                const ItemId& b = view.ranked[j];
                const RatingRecord* rb = store.find(b);
                for (size_t k = j + 1; k < hi; ++k) {
                    const ItemId& c = view.ranked[k];
                    const RatingRecord* rc = store.find(c);
                    if (!ra || !rb || !rc) continue;

                    bool evidence =
                        (ra->recent_results.has_opponent(b) || ra->recent_results.has_opponent(c)) &&
                        rb->recent_results.has_opponent(c);
                    if (!evidence) continue;

                    float distance = static_cast<float>(i > pos ? i - pos : pos - i);
                    float pos_weight = 1.0f / (distance + 1.0f);
                    float spread = std::fabs(ra->rating - rb->rating) +
                                   std::fabs(rb->rating - rc->rating) +
                                   std::fabs(ra->rating - rc->rating);
                    float weight = pos_weight / (1.0f + spread);

                    total += weight;
                    if (agrees(*ra, a, *rb, b) && agrees(*rb, b, *rc, c) && agrees(*ra, a, *rc, c)) {
                        weighted += weight;
                    }
                }
            }
        }
        return total > 0.0f ? weighted / total : 0.5f;
    }

    ConfidenceConfig config_;
};

// Memoised confidence with dependency-driven invalidation
class ConfidenceCache {
public:
    ConfidenceCache() = default;

    // Cached value, computing it on a miss
    float get(const ItemId& id, const ConfidenceEstimator& estimator,
              const RatingStore& store, const RankingView& view) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(id);
        if (it != values_.end()) {
            hits_++;
            return it->second;
        }

        misses_++;
        std::vector<ItemId> deps;
        float value = estimator.compute(id, store, view, &deps);
        values_.emplace(id, value);
        for (const auto& dep : deps) {
            dependents_[dep].insert(id);
        }
        return value;
    }

    // Evict every value that read any of `changed`
    template<typename Ids>
    size_t invalidate(const Ids& changed) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t evicted = 0;
        for (const auto& dep : changed) {
            auto it = dependents_.find(dep);
            if (it == dependents_.end()) continue;
            for (const auto& key : it->second) {
                evicted += values_.erase(key);
            }
            dependents_.erase(it);
        }
        return evicted;
    }

    // Only for a change of the item set itself
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
        dependents_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

    bool contains(const ItemId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(id) > 0;
    }

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

private:
    mutable std::mutex mutex_;
    mutable std::unordered_map<ItemId, float> values_;
    mutable std::unordered_map<ItemId, std::unordered_set<ItemId>> dependents_;
    mutable uint64_t hits_ = 0;
    mutable uint64_t misses_ = 0;
};

} // namespace krama
