#pragma once
// Update Batcher: buffer outcomes, flush them together
//
// Outcomes wait in a priority queue until the dynamic batch size is
// reached. Early and late the batches stay small (responsive), mid-session
// they grow (efficient); volatile ratings shrink them again.

#include "config.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <queue>
#include <unordered_set>
#include <vector>

namespace krama {

// A queued outcome, with the factors captured when it was resolved
struct PendingUpdate {
    ItemId winner;
    ItemId loser;
    bool high_impact = false;
    float uncertainty = 0.0f;     // Larger rating uncertainty of the pair
    uint64_t order = 0;           // Insertion order
    bool group = false;           // Came from a group choice
    bool contradicted = false;    // Winner was rated below the loser
    float learning_rate = 0.0f;
    float volatility = 1.0f;
    float consistency = 1.0f;
};

// High impact first, then more uncertain, then older
struct PendingPriority {
    bool operator()(const PendingUpdate& a, const PendingUpdate& b) const {
        if (a.high_impact != b.high_impact) return !a.high_impact;
        if (a.uncertainty != b.uncertainty) return a.uncertainty < b.uncertainty;
        return a.order > b.order;
    }
};

using PendingQueue = std::priority_queue<PendingUpdate, std::vector<PendingUpdate>, PendingPriority>;

// Stage sizes for the current dataset and volatility
struct BatchParameters {
    size_t early_size = 2;
    size_t mid_size = 3;
    size_t late_size = 4;
    float early_threshold = 0.15f;
    float late_threshold = 0.75f;
    float min_confidence = 0.35f;
};

class UpdateBatcher {
public:
    explicit UpdateBatcher(BatchConfig config = {}) : config_(config) {}

    void push(PendingUpdate update) {
        update.order = next_order_++;
        queue_.push(std::move(update));
    }

    size_t pending() const { return queue_.size(); }
    bool empty() const { return queue_.empty(); }

    void clear() {
        queue_ = PendingQueue();
        next_order_ = 0;
    }

    // Value copy of the queue for history snapshots
    const PendingQueue& queue() const { return queue_; }

    void restore(PendingQueue queue) {
        queue_ = std::move(queue);
    }

    // Scale factor from the last volatility_window rating changes
    float volatility_factor(const std::deque<float>& recent_changes) const {
        if (recent_changes.size() < config_.volatility_window) return 1.0f;
        float sum = 0.0f;
        auto start = recent_changes.end() - config_.volatility_window;
        for (auto it = start; it != recent_changes.end(); ++it) sum += std::fabs(*it);
        float v = sum / static_cast<float>(config_.volatility_window);

        if (v > config_.volatility_high) return 0.5f;
        if (v < config_.volatility_low) return 1.5f;
        return 0.5f + (config_.volatility_high - v) /
                      (config_.volatility_high - config_.volatility_low);
    }

    BatchParameters parameters(size_t item_count, const std::deque<float>& recent_changes) const {
        float n = static_cast<float>(std::max<size_t>(item_count, 2));
        float scaling = std::log2(n) / std::log2(100.0f);

        auto stage = [&](float fraction, size_t lo, size_t hi) {
            auto raw = static_cast<size_t>(std::floor(n * fraction * scaling));
            return std::min(hi, std::max(lo, raw));
        };

        BatchParameters p;
        p.early_size = stage(config_.early_fraction, config_.early_min, config_.early_max);
        p.mid_size = stage(config_.mid_fraction, config_.mid_min, config_.mid_max);
        p.late_size = stage(config_.late_fraction, config_.late_min, config_.late_max);
        p.early_threshold = 0.15f + 0.05f * (1.0f - scaling);
        p.late_threshold = 0.65f + 0.1f * scaling;
        p.min_confidence = 0.35f + 0.1f * scaling;

        float vf = volatility_factor(recent_changes);
        auto scaled = [vf](size_t size, size_t floor_size) {
            auto s = static_cast<size_t>(std::lround(static_cast<float>(size) * vf));
            return std::max(floor_size, s);
        };
        p.early_size = scaled(p.early_size, config_.early_min);
        p.mid_size = scaled(p.mid_size, config_.mid_min);
        p.late_size = scaled(p.late_size, config_.late_min);
        return p;
    }

    size_t batch_size(size_t item_count, float progress, float avg_confidence,
                      const std::deque<float>& recent_changes) const {
        BatchParameters p = parameters(item_count, recent_changes);
        if (progress < p.early_threshold) return p.early_size;
        if (progress > p.late_threshold) return p.late_size;
        return avg_confidence < p.min_confidence ? p.early_size : p.mid_size;
    }

    // Pop everything in priority order; repeated pairs keep their first entry
    std::vector<PendingUpdate> drain() {
        std::vector<PendingUpdate> batch;
        batch.reserve(queue_.size());
        std::unordered_set<std::string> seen;
        while (!queue_.empty()) {
            PendingUpdate top = queue_.top();
            queue_.pop();
            std::string key = top.winner + '\x1f' + top.loser;
            if (!seen.insert(key).second) continue;
            batch.push_back(std::move(top));
        }
        return batch;
    }

private:
    BatchConfig config_;
    PendingQueue queue_;
    uint64_t next_order_ = 0;
};

} // namespace krama
