#pragma once
// Rating Store: the authoritative standings
//
// One record per item, fixed for the session. A plain value type:
// copying it is how history takes snapshots.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace krama {

class RatingStore {
public:
    RatingStore() = default;

    // Reset to one fresh record per item. Duplicate ids keep the first.
    size_t init(const std::vector<Item>& items) {
        records_.clear();
        order_.clear();
        size_t skipped = 0;
        for (const auto& item : items) {
            if (records_.count(item.id)) {
                skipped++;
                continue;
            }
            records_.emplace(item.id, RatingRecord{});
            order_.push_back(item.id);
        }
        return skipped;
    }

    bool contains(const ItemId& id) const {
        return records_.find(id) != records_.end();
    }

    const RatingRecord* find(const ItemId& id) const {
        auto it = records_.find(id);
        return it != records_.end() ? &it->second : nullptr;
    }

    RatingRecord* find(const ItemId& id) {
        auto it = records_.find(id);
        return it != records_.end() ? &it->second : nullptr;
    }

    // Mutate a record in place; false if the id is unknown
    template<typename F>
    bool with_record(const ItemId& id, F&& func) {
        auto it = records_.find(id);
        if (it == records_.end()) return false;
        func(it->second);
        return true;
    }

    float rating(const ItemId& id) const {
        auto it = records_.find(id);
        return it != records_.end() ? it->second.rating : 0.0f;
    }

    // Ids in insertion order
    const std::vector<ItemId>& ids() const { return order_; }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    // Ids by rating, highest first. Ties keep insertion order.
    std::vector<ItemId> ranked_ids() const {
        std::vector<ItemId> ranked = order_;
        std::stable_sort(ranked.begin(), ranked.end(),
            [this](const ItemId& a, const ItemId& b) {
                return records_.at(a).rating > records_.at(b).rating;
            });
        return ranked;
    }

    uint64_t total_comparisons() const {
        uint64_t total = 0;
        for (const auto& [_, rec] : records_) total += rec.comparisons;
        return total;
    }

    uint32_t min_comparisons() const {
        if (records_.empty()) return 0;
        uint32_t lo = UINT32_MAX;
        for (const auto& [_, rec] : records_) lo = std::min(lo, rec.comparisons);
        return lo;
    }

    // Zero mean, unit standard deviation. No-op when all ratings are equal.
    bool normalize() {
        if (records_.empty()) return false;
        float n = static_cast<float>(records_.size());
        float mean = 0.0f;
        for (const auto& [_, rec] : records_) mean += rec.rating;
        mean /= n;

        float var = 0.0f;
        for (const auto& [_, rec] : records_) {
            float d = rec.rating - mean;
            var += d * d;
        }
        float stddev = std::sqrt(var / n);
        if (stddev <= 1e-6f) return false;

        for (auto& [_, rec] : records_) {
            rec.rating = (rec.rating - mean) / stddev;
        }
        return true;
    }

    // Ids whose record differs between two stores over the same item set
    std::unordered_set<ItemId> diff(const RatingStore& other) const {
        std::unordered_set<ItemId> changed;
        for (const auto& id : order_) {
            const RatingRecord* theirs = other.find(id);
            if (!theirs || !records_.at(id).same_state(*theirs)) {
                changed.insert(id);
            }
        }
        return changed;
    }

private:
    std::unordered_map<ItemId, RatingRecord> records_;
    std::vector<ItemId> order_;
};

// Current ranking order with position lookup
struct RankingView {
    std::vector<ItemId> ranked;
    std::unordered_map<ItemId, size_t> position;

    static RankingView of(const RatingStore& store) {
        RankingView view;
        view.ranked = store.ranked_ids();
        view.position.reserve(view.ranked.size());
        for (size_t i = 0; i < view.ranked.size(); ++i) {
            view.position.emplace(view.ranked[i], i);
        }
        return view;
    }

    size_t size() const { return ranked.size(); }

    size_t position_of(const ItemId& id) const {
        auto it = position.find(id);
        return it != position.end() ? it->second : ranked.size();
    }

    // Ids whose position differs from another view
    std::vector<ItemId> moved(const RankingView& other) const {
        std::vector<ItemId> out;
        for (size_t i = 0; i < ranked.size(); ++i) {
            if (other.position_of(ranked[i]) != i) out.push_back(ranked[i]);
        }
        return out;
    }
};

} // namespace krama
