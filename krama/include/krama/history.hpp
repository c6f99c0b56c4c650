#pragma once
// Comparison History: append-only log with undo
//
// Each entry holds the event and a value copy of everything the event
// is about to change. Undo pops the newest entry and hands the copy back.

#include "batcher.hpp"
#include "rating_store.hpp"
#include "selector.hpp"
#include "types.hpp"
#include <deque>
#include <optional>
#include <vector>

namespace krama {

// State captured before an event is applied
struct SessionSnapshot {
    RatingStore store;
    PendingQueue pending;
    std::deque<float> recent_changes;
    SelectorState selector;
    OptimizationStats audit;
};

struct HistoryEntry {
    ComparisonEvent event;
    SessionSnapshot before;
};

class ComparisonHistory {
public:
    ComparisonHistory() = default;

    void push(ComparisonEvent event, SessionSnapshot before) {
        entries_.push_back({std::move(event), std::move(before)});
    }

    // Remove and return the newest entry
    std::optional<HistoryEntry> pop() {
        if (entries_.empty()) return std::nullopt;
        HistoryEntry last = std::move(entries_.back());
        entries_.pop_back();
        return last;
    }

    // k = 0 is the newest entry
    const HistoryEntry* from_back(size_t k) const {
        if (k >= entries_.size()) return nullptr;
        return &entries_[entries_.size() - 1 - k];
    }

    const std::vector<HistoryEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    // Did `winner` ever beat `loser`?
    bool has_outcome(const ItemId& winner, const ItemId& loser) const {
        for (const auto& e : entries_) {
            if (e.event.winner == winner && e.event.loser == loser) return true;
        }
        return false;
    }

private:
    std::vector<HistoryEntry> entries_;
};

} // namespace krama
