#pragma once
// Core types: the atoms of a ranking
//
// Items are opaque. Ratings are log-strengths.
// Every outcome leaves a trace; nothing is certain until it is repeated.

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace krama {

// Item identifier (as supplied by the importer)
using ItemId = std::string;

// Engine-owned pseudo random generator (seeded, reproducible)
using Rng = std::mt19937_64;

// An item to be ranked. Immutable once ranking starts.
struct Item {
    ItemId id;
    std::string title;
    int year = 0;
    std::string image;  // Poster reference, may be empty

    bool operator==(const Item& other) const { return id == other.id; }
};

// One entry of an item's recent result window
struct RecentResult {
    ItemId opponent;
    uint8_t outcome = 0;        // 1 = won, 0 = lost
    float rating_diff = 0.0f;   // |r_self - r_opponent| when resolved
    float learning_rate = 0.0f; // Rate the update was queued with
};

// Fixed capacity ring of recent results, oldest first
class RecentResults {
public:
    static constexpr size_t CAPACITY = 10;

    void push(RecentResult r) {
        if (count_ < CAPACITY) {
            slots_[(head_ + count_) % CAPACITY] = std::move(r);
            ++count_;
        } else {
            slots_[head_] = std::move(r);
            head_ = (head_ + 1) % CAPACITY;
        }
    }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    // i = 0 is the oldest entry
    const RecentResult& operator[](size_t i) const {
        return slots_[(head_ + i) % CAPACITY];
    }

    const RecentResult& back() const { return (*this)[count_ - 1]; }

    bool has_opponent(const ItemId& id) const {
        for (size_t i = 0; i < count_; ++i) {
            if ((*this)[i].opponent == id) return true;
        }
        return false;
    }

    // Copy out in chronological order
    std::vector<RecentResult> to_vector() const {
        std::vector<RecentResult> out;
        out.reserve(count_);
        for (size_t i = 0; i < count_; ++i) out.push_back((*this)[i]);
        return out;
    }

    // Consistency of consecutive outcomes in [begin, end):
    // 1 = never flipped, 0 = alternating, 0.5 with fewer than two results
    float flip_consistency(size_t begin, size_t end) const {
        end = std::min(end, count_);
        if (end <= begin || end - begin < 2) return 0.5f;
        size_t flips = 0;
        for (size_t i = begin + 1; i < end; ++i) {
            if ((*this)[i].outcome != (*this)[i - 1].outcome) flips++;
        }
        return 1.0f - static_cast<float>(flips) / static_cast<float>(end - begin - 1);
    }

    float flip_consistency() const { return flip_consistency(0, count_); }

private:
    std::array<RecentResult, CAPACITY> slots_{};
    size_t head_ = 0;
    size_t count_ = 0;
};

// How often an item was offered in a group, and chosen from it
struct GroupSelections {
    uint32_t chosen = 0;
    uint32_t appearances = 0;
};

// Per-item rating state. One per item for the whole session.
struct RatingRecord {
    float rating = 0.0f;              // Log-strength
    float rating_mean = 0.0f;         // Bayesian shadow of rating
    float rating_uncertainty = 1.0f;  // Decays only, floored at 0.1
    uint32_t wins = 0;
    uint32_t losses = 0;
    uint32_t comparisons = 0;         // Always wins + losses
    RecentResults recent_results;
    GroupSelections group_selections;
    float momentum = 0.0f;            // Decayed running rating delta

    float win_rate() const {
        if (comparisons == 0) return 0.0f;
        return static_cast<float>(wins) / static_cast<float>(comparisons);
    }

    // Outcome flip rate of recent results (1 = fully uncertain)
    float outcome_uncertainty() const {
        if (recent_results.size() < 2) return 1.0f;
        return 1.0f - recent_results.flip_consistency();
    }

    // True when nothing that feeds confidence differs
    bool same_state(const RatingRecord& other) const {
        return rating == other.rating &&
               rating_uncertainty == other.rating_uncertainty &&
               comparisons == other.comparisons &&
               wins == other.wins &&
               recent_results.size() == other.recent_results.size() &&
               group_selections.chosen == other.group_selections.chosen &&
               group_selections.appearances == other.group_selections.appearances;
    }
};

// A resolved pairwise outcome
struct ComparisonEvent {
    ItemId winner;
    ItemId loser;
    std::vector<ItemId> group_members;  // > 2 members marks a group choice
    uint64_t sequence = 0;
    bool high_impact = false;

    bool is_group() const { return group_members.size() > 2; }
};

// Running totals across all audit passes
struct OptimizationStats {
    uint64_t runs = 0;
    uint64_t last_run_comparison = 0;
    uint64_t total_corrections = 0;
    uint64_t direct_fixed = 0;
    uint64_t transitivity_fixed = 0;
    uint64_t cycles_found = 0;
    uint64_t normalization_fixes = 0;
};

// Selection phase, driven by progress through the budget
enum class Phase : uint8_t {
    Broad = 0,   // Groups of 5
    Narrow = 1,  // Groups of 3
    Pairs = 2,   // Pairwise refinement
};

inline const char* phase_name(Phase p) {
    switch (p) {
        case Phase::Broad:  return "broad";
        case Phase::Narrow: return "narrow";
        case Phase::Pairs:  return "pairs";
    }
    return "unknown";
}

// Engine lifecycle
enum class EngineState : uint8_t {
    Idle = 0,
    Selecting = 1,
    AwaitingOutcome = 2,
    Batching = 3,
    Auditing = 4,
    Converged = 5,  // Early termination
    Finished = 6,   // Budget exhausted or finished by caller
};

inline const char* state_name(EngineState s) {
    switch (s) {
        case EngineState::Idle:            return "idle";
        case EngineState::Selecting:       return "selecting";
        case EngineState::AwaitingOutcome: return "awaiting_outcome";
        case EngineState::Batching:        return "batching";
        case EngineState::Auditing:        return "auditing";
        case EngineState::Converged:       return "converged";
        case EngineState::Finished:        return "finished";
    }
    return "unknown";
}

// Raised when no valid comparison can be formed at all.
// Callers should treat the session as over ("unable to continue ranking").
class SelectionFailure : public std::runtime_error {
public:
    explicit SelectionFailure(const std::string& what)
        : std::runtime_error(what) {}
};

// Order-independent key for an unordered pair
inline std::string pair_key(const ItemId& a, const ItemId& b) {
    return a < b ? a + '\x1f' + b : b + '\x1f' + a;
}

// Logistic expected score of a over b, stable for large gaps
inline float expected_score(float rating_a, float rating_b) {
    return 1.0f / (1.0f + std::exp(rating_b - rating_a));
}

} // namespace krama
