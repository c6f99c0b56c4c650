#pragma once
// Ranking Engine: the session, end to end
//
// Owns every piece of a ranking session: the standings, the history, the
// pending queue, the caches and the random generator. Callers ask what to
// show, report what was preferred, and read back the ranking.
//
//   Idle -> Selecting -> AwaitingOutcome -> Batching -> {Selecting | Auditing}
//        -> {Selecting | Converged}, and Finished once the budget is spent.
//   Undo returns to AwaitingOutcome with the undone items on display.

#include "auditor.hpp"
#include "batcher.hpp"
#include "budget.hpp"
#include "confidence.hpp"
#include "config.hpp"
#include "convergence.hpp"
#include "history.hpp"
#include "log.hpp"
#include "rating_store.hpp"
#include "selector.hpp"
#include "types.hpp"
#include "updater.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace krama {

// One row of the final ranking
struct RankedResult {
    Item item;
    size_t rank = 0;  // 1-based
    float rating = 0.0f;
    uint32_t wins = 0;
    uint32_t losses = 0;
    uint32_t comparisons = 0;
    std::vector<RecentResult> recent_results;
    float confidence = 0.0f;
    float rating_uncertainty = 1.0f;
    GroupSelections group_selections;
};

struct ProgressStats {
    uint64_t comparisons = 0;
    uint64_t max_comparisons = 0;
    float avg_confidence = 0.0f;
    float stability_score = 0.0f;
    OptimizationStats optimization;
    float learning_rate = 0.0f;
    uint64_t estimated_minutes_left = 0;
    Phase phase = Phase::Broad;
    EngineState state = EngineState::Idle;
    size_t pending_updates = 0;
};

class RankingEngine {
public:
    explicit RankingEngine(EngineConfig config = {})
        : config_(config)
        , rng_(config.seed)
        , selector_(config.selector)
        , updater_(config.learning)
        , batcher_(config.batch)
        , estimator_(config.confidence)
        , auditor_(config.audit)
        , monitor_(config.convergence)
        , last_learning_rate_(config.learning.base_rate)
    {}

    RankingEngine(const RankingEngine&) = delete;
    RankingEngine& operator=(const RankingEngine&) = delete;

    // Begin a fresh session. Throws SelectionFailure with fewer than two
    // distinct items, leaving the engine idle and empty. A budget of 0 picks
    // the balanced budget.
    void start(const std::vector<Item>& items, uint64_t max_comparisons) {
        std::unordered_map<ItemId, Item> unique;
        std::vector<ItemId> order;
        for (const auto& item : items) {
            if (unique.emplace(item.id, item).second) order.push_back(item.id);
        }

        clear_session();
        if (order.size() < 2) {
            throw SelectionFailure("unable to continue ranking: need at least two distinct items, got " +
                                   std::to_string(order.size()));
        }

        items_ = std::move(unique);
        order_ = std::move(order);
        size_t duplicates = store_.init(items);
        if (duplicates > 0) {
            log_warn("Engine", "ignored %zu duplicate item id(s)", duplicates);
        }

        if (max_comparisons == 0) {
            max_comparisons = comparison_budget(BudgetMode::Balanced, order_.size());
        }
        max_comparisons_ = max_comparisons;

        rng_.seed(config_.seed);
        view_ = RankingView::of(store_);
        state_ = EngineState::Selecting;

        log_info("Engine", "ranking %zu items with a budget of %llu comparisons",
                 order_.size(), static_cast<unsigned long long>(max_comparisons_));
    }

    // Items to present next; empty once the session is over
    std::vector<Item> current_selection() {
        if (state_ == EngineState::Idle || is_finished()) return {};
        if (state_ == EngineState::AwaitingOutcome && !current_.empty()) return items_of(current_);

        if (comparisons_ >= max_comparisons_) {
            finish();
            return {};
        }

        state_ = EngineState::Selecting;
        auto confidence_of = [this](const ItemId& id) { return confidence(id); };
        current_ = selector_.select(store_, confidence_of, progress(), comparisons_, rng_);
        if (current_.size() < 2) {
            // Unreachable once start() has validated the item set
            log_warn("Selector", "unable to form a comparison from %zu items", store_.size());
            current_.clear();
            return {};
        }
        state_ = EngineState::AwaitingOutcome;
        log_debug("Selector", "presenting %zu items (%s phase)", current_.size(),
                  phase_name(selector_.phase(progress())));
        return items_of(current_);
    }

    // Record that `winner` was preferred over `loser`. group_members lists the
    // whole group for group choices (more than two members). False when the
    // outcome was rejected; state is untouched in that case.
    bool resolve(const ItemId& winner, const ItemId& loser,
                 const std::vector<ItemId>& group_members = {}) {
        if (state_ == EngineState::Idle || is_finished()) {
            log_warn("Engine", "outcome %s > %s ignored: no session in progress",
                     winner.c_str(), loser.c_str());
            return false;
        }
        const RatingRecord* w = store_.find(winner);
        const RatingRecord* l = store_.find(loser);
        if (!w || !l || winner == loser) {
            log_warn("Engine", "outcome %s > %s ignored: unknown or identical items",
                     winner.c_str(), loser.c_str());
            return false;
        }
        for (const auto& id : group_members) {
            if (!store_.contains(id)) {
                log_warn("Engine", "outcome %s > %s ignored: unknown group member %s",
                         winner.c_str(), loser.c_str(), id.c_str());
                return false;
            }
        }

        SessionSnapshot before{store_, batcher_.queue(), recent_changes_, selector_.state(), auditor_.stats()};
        const float p = progress();

        PendingUpdate update;
        update.winner = winner;
        update.loser = loser;
        update.high_impact = is_high_impact(*w, *l, p);
        update.uncertainty = std::max(w->rating_uncertainty, l->rating_uncertainty);
        update.group = group_members.size() > 2;
        update.contradicted = w->rating < l->rating;

        LearningFactors f = updater_.factors(store_, winner, loser, recent_changes_);
        update.learning_rate = updater_.learning_rate(store_, winner, loser, p,
                                                      confidence(winner), confidence(loser), f);
        update.volatility = f.volatility;
        update.consistency = f.consistency;

        // Outcome counters land now; ratings wait for the batch
        const float diff = std::fabs(w->rating - l->rating);
        store_.with_record(winner, [&](RatingRecord& r) {
            r.wins++;
            r.comparisons++;
            r.recent_results.push({loser, 1, diff, update.learning_rate});
        });
        store_.with_record(loser, [&](RatingRecord& r) {
            r.losses++;
            r.comparisons++;
            r.recent_results.push({winner, 0, diff, update.learning_rate});
        });
        if (update.group) {
            for (const auto& id : group_members) {
                store_.with_record(id, [](RatingRecord& r) { r.group_selections.appearances++; });
            }
            store_.with_record(winner, [](RatingRecord& r) { r.group_selections.chosen++; });
        }

        ComparisonEvent event{winner, loser, group_members, comparisons_, update.high_impact};
        refresh(before.store);
        history_.push(std::move(event), std::move(before));
        selector_.note_resolved(winner, loser);
        comparisons_++;
        current_.clear();

        state_ = EngineState::Batching;
        batcher_.push(std::move(update));

        size_t target = batcher_.batch_size(store_.size(), progress(), avg_confidence(), recent_changes_);
        bool applied = false;
        if (batcher_.pending() >= target) {
            apply_pending();
            applied = true;
        }

        if (comparisons_ >= max_comparisons_) {
            finish();
            return true;
        }

        if (auditor_.due(comparisons_)) {
            run_audit();
            applied = true;
        }

        if (applied && check_convergence()) return true;

        state_ = EngineState::Selecting;
        return true;
    }

    // The user picked `winner` out of the current selection
    bool choose(const ItemId& winner) {
        std::vector<ItemId> group = current_;
        if (group.empty() || std::find(group.begin(), group.end(), winner) == group.end()) {
            log_warn("Engine", "choice %s is not part of the current selection", winner.c_str());
            return false;
        }
        const std::vector<ItemId> members = group.size() > 2 ? group : std::vector<ItemId>{};

        bool any = false;
        for (const auto& loser : group) {
            if (loser == winner) continue;
            if (!resolve(winner, loser, members)) break;
            any = true;
            if (is_finished()) break;
        }
        return any;
    }

    // Roll back the newest outcome and present its items again, so the
    // caller can answer differently. Nothing when there is no history.
    std::optional<std::vector<Item>> undo() {
        if (state_ == EngineState::Idle) return std::nullopt;
        auto entry = history_.pop();
        if (!entry) return std::nullopt;

        RatingStore previous = std::move(store_);
        store_ = std::move(entry->before.store);
        batcher_.restore(std::move(entry->before.pending));
        recent_changes_ = std::move(entry->before.recent_changes);
        selector_.restore(std::move(entry->before.selector));
        auditor_.restore(entry->before.audit);
        comparisons_ = comparisons_ > 0 ? comparisons_ - 1 : 0;
        refresh(previous);

        const ComparisonEvent& e = entry->event;
        current_ = e.group_members.empty() ? std::vector<ItemId>{e.winner, e.loser} : e.group_members;
        state_ = EngineState::AwaitingOutcome;
        log_debug("Engine", "undid %s > %s", e.winner.c_str(), e.loser.c_str());
        return items_of(current_);
    }

    // Confidence in [0.2, 1] for an item's current position
    float confidence(const ItemId& id) const {
        return cache_.get(id, estimator_, store_, view_);
    }

    std::vector<RankedResult> ranked_results() const {
        std::vector<RankedResult> out;
        out.reserve(view_.size());
        for (size_t i = 0; i < view_.size(); ++i) {
            const ItemId& id = view_.ranked[i];
            const RatingRecord* rec = store_.find(id);
            auto item = items_.find(id);
            if (!rec || item == items_.end()) continue;
            RankedResult r;
            r.item = item->second;
            r.rank = i + 1;
            r.rating = rec->rating;
            r.wins = rec->wins;
            r.losses = rec->losses;
            r.comparisons = rec->comparisons;
            r.recent_results = rec->recent_results.to_vector();
            r.confidence = confidence(id);
            r.rating_uncertainty = rec->rating_uncertainty;
            r.group_selections = rec->group_selections;
            out.push_back(std::move(r));
        }
        return out;
    }

    ProgressStats progress_stats() const {
        ProgressStats s;
        s.comparisons = comparisons_;
        s.max_comparisons = max_comparisons_;
        s.avg_confidence = avg_confidence();
        s.stability_score = monitor_.rank_stability(store_, history_);
        s.optimization = auditor_.stats();
        s.learning_rate = last_learning_rate_;
        s.estimated_minutes_left = estimated_minutes_left(comparisons_, max_comparisons_);
        s.phase = selector_.phase(progress());
        s.state = state_;
        s.pending_updates = batcher_.pending();
        return s;
    }

    bool is_finished() const {
        return state_ == EngineState::Finished || state_ == EngineState::Converged;
    }

    EngineState state() const { return state_; }

    // Apply every pending update now. Returns how many were applied.
    size_t flush() {
        if (batcher_.empty()) return 0;
        return apply_pending();
    }

    // End the session, applying whatever is still pending
    void finish() {
        if (state_ == EngineState::Idle) return;
        flush();
        current_.clear();
        if (state_ != EngineState::Converged) state_ = EngineState::Finished;
        log_info("Engine", "finished after %llu comparisons", static_cast<unsigned long long>(comparisons_));
    }

    // Run a consistency pass now, regardless of schedule
    std::optional<AuditReport> audit() {
        if (state_ == EngineState::Idle) return std::nullopt;
        EngineState resume = state_;
        auto report = run_audit();
        state_ = resume;
        return report;
    }

    ConvergenceReport convergence() const {
        return monitor_.evaluate(store_, history_, recent_changes_, comparisons_, max_comparisons_,
                                 avg_confidence());
    }

    float progress() const {
        if (max_comparisons_ == 0) return 0.0f;
        return static_cast<float>(comparisons_) / static_cast<float>(max_comparisons_);
    }

    float avg_confidence() const {
        if (store_.empty()) return 0.0f;
        float sum = 0.0f;
        for (const auto& id : store_.ids()) sum += confidence(id);
        return sum / static_cast<float>(store_.size());
    }

    const EngineConfig& config() const { return config_; }
    const RatingStore& store() const { return store_; }
    const ComparisonHistory& history() const { return history_; }
    const ConfidenceCache& cache() const { return cache_; }
    const ComparisonSelector& selector() const { return selector_; }
    const ConsistencyAuditor& auditor() const { return auditor_; }
    const std::deque<float>& recent_changes() const { return recent_changes_; }
    const std::vector<ItemId>& selection_ids() const { return current_; }
    uint64_t comparisons() const { return comparisons_; }
    uint64_t max_comparisons() const { return max_comparisons_; }
    size_t pending_updates() const { return batcher_.pending(); }

    const Item* item(const ItemId& id) const {
        auto it = items_.find(id);
        return it != items_.end() ? &it->second : nullptr;
    }

private:
    // Drop every trace of the previous session
    void clear_session() {
        items_.clear();
        order_.clear();
        store_ = RatingStore{};
        view_ = RankingView{};
        history_.clear();
        batcher_.clear();
        selector_.reset();
        auditor_.reset();
        cache_.clear();
        recent_changes_.clear();
        current_.clear();
        comparisons_ = 0;
        max_comparisons_ = 0;
        last_learning_rate_ = config_.learning.base_rate;
        state_ = EngineState::Idle;
    }

    std::vector<Item> items_of(const std::vector<ItemId>& ids) const {
        std::vector<Item> out;
        out.reserve(ids.size());
        for (const auto& id : ids) {
            auto it = items_.find(id);
            if (it != items_.end()) out.push_back(it->second);
        }
        return out;
    }

    // Rebuild the ranking view and evict confidence values touched by a change
    void refresh(const RatingStore& previous) {
        RankingView next = RankingView::of(store_);
        std::unordered_set<ItemId> stale = store_.diff(previous);
        for (auto& id : next.moved(view_)) stale.insert(std::move(id));
        view_ = std::move(next);
        if (!stale.empty()) {
            size_t evicted = cache_.invalidate(stale);
            log_debug("Engine", "%zu item(s) changed, %zu cached confidence value(s) evicted",
                      stale.size(), evicted);
        }
    }

    size_t apply_pending() {
        state_ = EngineState::Batching;
        std::vector<PendingUpdate> batch = batcher_.drain();
        RatingStore previous = store_;
        BatchOutcome outcome = updater_.apply_batch(store_, batch, progress(), recent_changes_);
        if (outcome.applied > 0) last_learning_rate_ = outcome.last_learning_rate;
        refresh(previous);
        log_debug("Batcher", "applied %zu update(s), mean |change| %.4f",
                  outcome.applied, static_cast<double>(outcome.mean_abs_change));
        return outcome.applied;
    }

    std::optional<AuditReport> run_audit() {
        state_ = EngineState::Auditing;
        flush();
        state_ = EngineState::Auditing;
        RatingStore previous = store_;
        auto report = auditor_.run(store_, history_, comparisons_, rng_);
        refresh(previous);
        return report;
    }

    bool check_convergence() {
        ConvergenceReport r = convergence();
        if (!r.converged) {
            log_debug("Engine", "not converged (%s)", r.blocked_by);
            return false;
        }
        flush();
        state_ = EngineState::Converged;
        current_.clear();
        log_info("Engine", "converged after %llu of %llu comparisons (confidence %.2f, transitivity %.2f, stability %.2f)",
                 static_cast<unsigned long long>(comparisons_),
                 static_cast<unsigned long long>(max_comparisons_),
                 static_cast<double>(r.avg_confidence), static_cast<double>(r.transitivity),
                 static_cast<double>(r.rank_stability));
        return true;
    }

    EngineConfig config_;
    Rng rng_;

    std::unordered_map<ItemId, Item> items_;
    std::vector<ItemId> order_;

    RatingStore store_;
    RankingView view_;
    ComparisonHistory history_;
    std::deque<float> recent_changes_;

    ComparisonSelector selector_;
    RatingUpdater updater_;
    UpdateBatcher batcher_;
    ConfidenceEstimator estimator_;
    ConfidenceCache cache_;
    ConsistencyAuditor auditor_;
    ConvergenceMonitor monitor_;

    std::vector<ItemId> current_;
    uint64_t comparisons_ = 0;
    uint64_t max_comparisons_ = 0;
    float last_learning_rate_ = 0.1f;
    EngineState state_ = EngineState::Idle;
};

} // namespace krama
