#pragma once
// Comparison Selector: what should the user look at next?
//
// Early on, groups of five sweep the field; then groups of three; at the
// end, single pairs settle the close calls. Every candidate is valued by
// how much we still don't know about it. Items rotate through a "used"
// pool so everyone gets seen before anyone is shown twice.

#include "config.hpp"
#include "log.hpp"
#include "rating_store.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace krama {

// Rotation and recency bookkeeping, kept with each history entry
struct SelectorState {
    std::unordered_set<ItemId> used;
    std::vector<ItemId> last_selection;
    std::unordered_map<std::string, uint64_t> pair_last;
    uint64_t resolutions = 0;
};

class ComparisonSelector {
public:
    explicit ComparisonSelector(SelectorConfig config = {}) : config_(config) {}

    const SelectorConfig& config() const { return config_; }

    // New session: forget everything
    void reset() {
        used_.clear();
        last_selection_.clear();
        pair_last_.clear();
        resolutions_ = 0;
    }

    SelectorState state() const {
        return {used_, last_selection_, pair_last_, resolutions_};
    }

    void restore(SelectorState s) {
        used_ = std::move(s.used);
        last_selection_ = std::move(s.last_selection);
        pair_last_ = std::move(s.pair_last);
        resolutions_ = s.resolutions;
    }

    Phase phase(float progress) const {
        if (progress < config_.broad_phase_end) return Phase::Broad;
        if (progress < config_.narrow_phase_end) return Phase::Narrow;
        return Phase::Pairs;
    }

    // Group size for a phase, degraded to the item count
    size_t group_size(Phase p, size_t item_count) const {
        size_t size = 2;
        if (p == Phase::Broad) size = config_.broad_group_size;
        else if (p == Phase::Narrow) size = config_.narrow_group_size;
        return std::min(size, item_count);
    }

    // A pair was resolved (feeds the recency penalty)
    void note_resolved(const ItemId& a, const ItemId& b) {
        pair_last_[pair_key(a, b)] = ++resolutions_;
    }

    uint64_t resolutions() const { return resolutions_; }
    size_t used_count() const { return used_.size(); }
    const std::vector<ItemId>& last_selection() const { return last_selection_; }

    // Resolutions since the pair was last resolved, or nothing
    std::optional<uint64_t> pair_age(const ItemId& a, const ItemId& b) const {
        auto it = pair_last_.find(pair_key(a, b));
        if (it == pair_last_.end()) return std::nullopt;
        return resolutions_ - it->second;
    }

    // Multiplier for a candidate pair: 1 when fresh, at most 0.2 when recent
    float recency_factor(const RatingStore& store, const ItemId& a, const ItemId& b) const {
        float factor = 1.0f;
        auto age = pair_age(a, b);
        if (age && *age < config_.recent_pair_window) {
            float t = static_cast<float>(*age) / static_cast<float>(config_.recent_pair_window);
            factor = std::min(config_.recent_pair_ceiling,
                              config_.recent_pair_floor +
                              (config_.recent_pair_ceiling - config_.recent_pair_floor) * t);
        }
        const RatingRecord* ra = store.find(a);
        const RatingRecord* rb = store.find(b);
        if ((ra && ra->recent_results.has_opponent(b)) || (rb && rb->recent_results.has_opponent(a))) {
            factor = std::min(factor, config_.recent_pair_ceiling);
        }
        return factor;
    }

    // Information value of showing an item
    template<typename ConfidenceFn>
    float value(const ItemId& id, const RatingStore& store, ConfidenceFn& confidence) const {
        const RatingRecord* rec = store.find(id);
        if (!rec) return 0.0f;
        float v = (1.0f - confidence(id)) * (1.0f + rec->outcome_uncertainty()) /
                  static_cast<float>(rec->comparisons + 1);
        if (std::find(last_selection_.begin(), last_selection_.end(), id) != last_selection_.end()) {
            v *= config_.reuse_penalty;
        }
        return v;
    }

    template<typename ConfidenceFn>
    float group_value(const std::vector<ItemId>& group, const RatingStore& store,
                      ConfidenceFn& confidence) const {
        float total = 0.0f;
        for (const auto& id : group) total += value(id, store, confidence);
        for (size_t i = 0; i + 1 < group.size(); ++i) {
            for (size_t j = i + 1; j < group.size(); ++j) {
                float diff = std::fabs(store.rating(group[i]) - store.rating(group[j]));
                total += 1.0f / (diff + config_.pair_closeness_epsilon);
            }
        }
        return total;
    }

    // Next comparison. Empty only when fewer than two items exist.
    template<typename ConfidenceFn>
    std::vector<ItemId> select(const RatingStore& store, ConfidenceFn&& confidence,
                               float progress, uint64_t comparisons, Rng& rng) {
        const size_t size = group_size(phase(progress), store.size());
        if (size < 2) return {};

        std::vector<ItemId> available;
        for (const auto& id : store.ids()) {
            if (!used_.count(id)) available.push_back(id);
        }
        if (available.size() < size) {
            log_debug("Selector", "used pool exhausted (%zu left, need %zu), resetting",
                      available.size(), size);
            used_.clear();
            available = store.ids();
        }

        if (comparisons == 0) std::shuffle(available.begin(), available.end(), rng);

        std::vector<ItemId> selected = size == 2
            ? select_pair(store, confidence, available)
            : select_group(store, confidence, available, size, comparisons, rng);

        for (const auto& id : selected) used_.insert(id);
        last_selection_ = selected;
        return selected;
    }

private:
    template<typename ConfidenceFn>
    std::vector<ItemId> select_pair(const RatingStore& store, ConfidenceFn& confidence,
                                    const std::vector<ItemId>& available) const {
        std::vector<ItemId> sorted = by_fewest_comparisons(store, available);
        const ItemId& anchor = sorted[0];

        size_t best = 0;
        float best_score = -1.0f;
        for (size_t i = 1; i < sorted.size(); ++i) {
            float score = value(sorted[i], store, confidence) * recency_factor(store, anchor, sorted[i]);
            if (score > best_score) {
                best_score = score;
                best = i;
            }
        }
        if (best == 0) best = 1;

        auto age = pair_age(anchor, sorted[best]);
        bool very_recent = age && *age < config_.very_recent_pairs;
        if (very_recent && available.size() > config_.alternate_anchor_min_pool && sorted.size() > 2) {
            const ItemId& alternate = sorted[1];
            size_t alt_best = 0;
            float alt_score = -1.0f;
            for (size_t i = 0; i < sorted.size(); ++i) {
                if (i == 1) continue;
                auto alt_age = pair_age(alternate, sorted[i]);
                if (alt_age && *alt_age < config_.very_recent_pairs) continue;
                float score = value(sorted[i], store, confidence);
                if (score > alt_score) {
                    alt_score = score;
                    alt_best = i;
                }
            }
            if (alt_score >= 0.0f) {
                log_debug("Selector", "pair %s/%s is very recent, using alternate anchor %s",
                          anchor.c_str(), sorted[best].c_str(), alternate.c_str());
                return {alternate, sorted[alt_best]};
            }
        }
        return {anchor, sorted[best]};
    }

    template<typename ConfidenceFn>
    std::vector<ItemId> select_group(const RatingStore& store, ConfidenceFn& confidence,
                                     const std::vector<ItemId>& available, size_t size,
                                     uint64_t comparisons, Rng& rng) const {
        std::vector<std::vector<ItemId>> candidates;
        candidates.push_back(diverse_uncertain(store, available, size, comparisons, rng));
        candidates.push_back(fewest_compared(store, available, size, comparisons, rng));
        candidates.push_back(similar_rating(store, available, size, rng));

        size_t best = 0;
        float best_value = -1.0f;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (candidates[i].empty()) continue;
            float v = group_value(candidates[i], store, confidence);
            if (v > best_value) {
                best_value = v;
                best = i;
            }
        }
        std::vector<ItemId> group = std::move(candidates[best]);

        // Pad short groups with unused items
        for (const auto& id : available) {
            if (group.size() >= size) break;
            if (std::find(group.begin(), group.end(), id) == group.end()) group.push_back(id);
        }
        return group;
    }

    // Highest uncertainty anchor, then one item per rating bucket
    std::vector<ItemId> diverse_uncertain(const RatingStore& store, const std::vector<ItemId>& available,
                                          size_t size, uint64_t comparisons, Rng& rng) const {
        std::vector<ItemId> sorted = by_uncertainty(store, available);
        if (comparisons == 0) shuffle_top(sorted, config_.initial_shuffle_uncertain, rng);
        if (sorted.empty()) return {};

        const ItemId anchor = sorted[0];
        const RatingRecord* anchor_rec = store.find(anchor);

        std::vector<ItemId> rest;
        for (const auto& id : available) {
            if (id == anchor) continue;
            if (anchor_rec && anchor_rec->recent_results.has_opponent(id)) continue;
            rest.push_back(id);
        }
        rest = by_uncertainty(store, rest);

        std::vector<ItemId> ordered;
        ordered.push_back(anchor);
        ordered.insert(ordered.end(), rest.begin(), rest.end());

        std::vector<ItemId> low, mid, high;
        for (size_t i = 1; i < ordered.size(); ++i) {
            float r = store.rating(ordered[i]);
            if (r < config_.bucket_low) low.push_back(ordered[i]);
            else if (r > config_.bucket_high) high.push_back(ordered[i]);
            else mid.push_back(ordered[i]);
        }

        std::vector<ItemId> group{anchor};
        for (const auto* bucket : {&low, &mid, &high}) {
            if (!bucket->empty() && group.size() < size) group.push_back(bucket->front());
        }
        for (size_t i = 1; i < ordered.size() && group.size() < size; ++i) {
            if (std::find(group.begin(), group.end(), ordered[i]) == group.end()) {
                group.push_back(ordered[i]);
            }
        }
        return group;
    }

    // Fewest comparisons first, skipping the anchor's recent opponents
    std::vector<ItemId> fewest_compared(const RatingStore& store, const std::vector<ItemId>& available,
                                        size_t size, uint64_t comparisons, Rng& rng) const {
        std::vector<ItemId> sorted = by_fewest_comparisons(store, available);
        if (comparisons == 0) shuffle_top(sorted, config_.initial_shuffle_fewest, rng);
        if (sorted.empty()) return {};

        const RatingRecord* anchor_rec = store.find(sorted[0]);
        std::vector<ItemId> fresh;
        for (size_t i = 1; i < sorted.size(); ++i) {
            if (anchor_rec && anchor_rec->recent_results.has_opponent(sorted[i])) continue;
            fresh.push_back(sorted[i]);
        }
        if (fresh.empty()) fresh.assign(sorted.begin() + 1, sorted.end());

        std::vector<ItemId> group{sorted[0]};
        for (size_t i = 0; i < fresh.size() && group.size() < size; ++i) group.push_back(fresh[i]);
        return group;
    }

    // Random anchor plus its nearest-rated neighbours, recent opponents last
    std::vector<ItemId> similar_rating(const RatingStore& store, const std::vector<ItemId>& available,
                                       size_t size, Rng& rng) const {
        if (available.empty()) return {};
        std::uniform_int_distribution<size_t> pick(0, available.size() - 1);
        const ItemId anchor = available[pick(rng)];
        const RatingRecord* anchor_rec = store.find(anchor);
        float anchor_rating = store.rating(anchor);

        std::vector<ItemId> others;
        for (const auto& id : available) {
            if (id != anchor) others.push_back(id);
        }
        std::stable_sort(others.begin(), others.end(), [&](const ItemId& a, const ItemId& b) {
            bool ra = anchor_rec && anchor_rec->recent_results.has_opponent(a);
            bool rb = anchor_rec && anchor_rec->recent_results.has_opponent(b);
            if (ra != rb) return !ra;
            return std::fabs(store.rating(a) - anchor_rating) < std::fabs(store.rating(b) - anchor_rating);
        });

        std::vector<ItemId> group{anchor};
        for (size_t i = 0; i < others.size() && group.size() < size; ++i) group.push_back(others[i]);
        return group;
    }

    static std::vector<ItemId> by_fewest_comparisons(const RatingStore& store, std::vector<ItemId> ids) {
        std::stable_sort(ids.begin(), ids.end(), [&](const ItemId& a, const ItemId& b) {
            return store.find(a)->comparisons < store.find(b)->comparisons;
        });
        return ids;
    }

    static std::vector<ItemId> by_uncertainty(const RatingStore& store, std::vector<ItemId> ids) {
        std::stable_sort(ids.begin(), ids.end(), [&](const ItemId& a, const ItemId& b) {
            return store.find(a)->outcome_uncertainty() > store.find(b)->outcome_uncertainty();
        });
        return ids;
    }

    static void shuffle_top(std::vector<ItemId>& ids, float share, Rng& rng) {
        if (ids.empty()) return;
        auto top = static_cast<size_t>(std::ceil(static_cast<float>(ids.size()) * share));
        top = std::clamp<size_t>(top, 1, ids.size());
        std::shuffle(ids.begin(), ids.begin() + static_cast<std::ptrdiff_t>(top), rng);
    }

    SelectorConfig config_;
    std::unordered_set<ItemId> used_;
    std::vector<ItemId> last_selection_;
    std::unordered_map<std::string, uint64_t> pair_last_;
    uint64_t resolutions_ = 0;
};

} // namespace krama
