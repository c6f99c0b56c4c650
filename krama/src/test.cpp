#undef NDEBUG
#include <krama/krama.hpp>
#include <krama/json.hpp>
#include <iostream>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstring>
#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace krama;

static bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) < eps;
}

std::vector<Item> make_items(size_t n) {
    std::vector<Item> items;
    for (size_t i = 0; i < n; ++i) {
        items.push_back({"i" + std::to_string(i), "Item " + std::to_string(i), 1990 + static_cast<int>(i), ""});
    }
    return items;
}

// Index in `items` is the hidden rank: lower is better
std::unordered_map<ItemId, size_t> truth_of(const std::vector<Item>& items) {
    std::unordered_map<ItemId, size_t> truth;
    for (size_t i = 0; i < items.size(); ++i) truth.emplace(items[i].id, i);
    return truth;
}

ItemId best_of(const std::vector<Item>& selection, const std::unordered_map<ItemId, size_t>& truth) {
    size_t best = 0;
    for (size_t i = 1; i < selection.size(); ++i) {
        if (truth.at(selection[i].id) < truth.at(selection[best].id)) best = i;
    }
    return selection[best].id;
}

void push_outcome(ComparisonHistory& history, const ItemId& winner, const ItemId& loser) {
    history.push(ComparisonEvent{winner, loser, {}, history.size(), false}, SessionSnapshot{});
}

void check_counts(const RankingEngine& engine) {
    uint64_t total = 0;
    for (const auto& id : engine.store().ids()) {
        const RatingRecord* rec = engine.store().find(id);
        assert(rec->wins + rec->losses == rec->comparisons);
        assert(rec->recent_results.size() <= RecentResults::CAPACITY);
        total += rec->comparisons;
    }
    assert(total % 2 == 0);
    assert(total == 2 * engine.history().size());
    assert(engine.comparisons() == engine.history().size());
}

void test_recent_results() {
    std::cout << "Testing RecentResults..." << std::endl;

    RecentResults r;
    assert(r.empty());
    assert(r.flip_consistency() == 0.5f);

    for (int i = 0; i < 12; ++i) {
        r.push({"x" + std::to_string(i), static_cast<uint8_t>(i % 2), 0.0f, 0.1f});
    }
    assert(r.size() == RecentResults::CAPACITY);
    assert(r[0].opponent == "x2");
    assert(r.back().opponent == "x11");
    assert(r.has_opponent("x5"));
    assert(!r.has_opponent("x1"));
    assert(r.flip_consistency() == 0.0f);

    RatingRecord rec;
    assert(rec.win_rate() == 0.0f);
    assert(rec.outcome_uncertainty() == 1.0f);
    rec.wins = 3;
    rec.losses = 1;
    rec.comparisons = 4;
    assert(near(rec.win_rate(), 0.75f));

    std::cout << "  PASS" << std::endl;
}

void test_rating_store() {
    std::cout << "Testing RatingStore..." << std::endl;

    RatingStore store;
    size_t duplicates = store.init({{"a", "A", 0, ""}, {"b", "B", 0, ""}, {"a", "A again", 0, ""}});
    assert(duplicates == 1);
    assert(store.size() == 2);

    // Ties keep insertion order
    auto ranked = store.ranked_ids();
    assert(ranked[0] == "a" && ranked[1] == "b");

    store.with_record("b", [](RatingRecord& r) { r.rating = 1.0f; });
    ranked = store.ranked_ids();
    assert(ranked[0] == "b");

    assert(store.normalize());
    assert(near(store.rating("a"), -1.0f));
    assert(near(store.rating("b"), 1.0f));

    RatingStore copy = store;
    store.with_record("a", [](RatingRecord& r) { r.comparisons++; r.wins++; });
    auto changed = store.diff(copy);
    assert(changed.size() == 1);
    assert(changed.count("a") == 1);

    assert(!store.with_record("missing", [](RatingRecord&) {}));
    assert(store.rating("missing") == 0.0f);

    RankingView before = RankingView::of(copy);
    store.with_record("a", [](RatingRecord& r) { r.rating = 5.0f; });
    RankingView after = RankingView::of(store);
    assert(after.position_of("a") == 0);
    assert(after.moved(before).size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_budget() {
    std::cout << "Testing comparison budget..." << std::endl;

    assert(comparison_budget(BudgetMode::Quick, 10) == 20);
    assert(comparison_budget(BudgetMode::Quick, 100) == 150);
    assert(comparison_budget(BudgetMode::Balanced, 4) == 30);
    assert(comparison_budget(BudgetMode::Balanced, 10) == 64);
    assert(comparison_budget(BudgetMode::Balanced, 100) == 965);
    assert(comparison_budget(BudgetMode::Thorough, 100) == 1165);
    assert(comparison_budget(BudgetMode::Thorough, 1000) == 2000);

    assert(estimated_minutes(965) == 97);
    assert(estimated_minutes_left(100, 100) == 0);
    assert(estimated_minutes_left(0, 100) == 8);

    assert(parse_budget_mode("thorough") == BudgetMode::Thorough);
    assert(!parse_budget_mode("forever"));
    assert(std::strcmp(budget_mode_name(BudgetMode::Quick), "quick") == 0);

    std::cout << "  PASS" << std::endl;
}

void test_batcher() {
    std::cout << "Testing UpdateBatcher..." << std::endl;

    UpdateBatcher batcher;
    std::deque<float> changes;

    BatchParameters p = batcher.parameters(4, changes);
    assert(p.early_size == 2);
    assert(p.mid_size == 3);
    assert(p.late_size == 4);

    assert(batcher.batch_size(4, 0.1f, 0.5f, changes) == 2);
    assert(batcher.batch_size(4, 0.5f, 0.9f, changes) == 3);
    assert(batcher.batch_size(4, 0.5f, 0.1f, changes) == 2);  // Low confidence stays small
    assert(batcher.batch_size(4, 0.9f, 0.5f, changes) == 4);

    assert(batcher.volatility_factor(changes) == 1.0f);
    changes.assign(20, 0.2f);
    assert(batcher.volatility_factor(changes) == 0.5f);
    changes.assign(20, 0.001f);
    assert(batcher.volatility_factor(changes) == 1.5f);
    changes.assign(20, 0.03f);
    assert(near(batcher.volatility_factor(changes), 1.0f));

    PendingUpdate ab;
    ab.winner = "a";
    ab.loser = "b";
    ab.uncertainty = 0.9f;
    PendingUpdate cd;
    cd.winner = "c";
    cd.loser = "d";
    cd.uncertainty = 0.1f;
    cd.high_impact = true;

    batcher.push(ab);
    batcher.push(ab);
    PendingQueue saved = batcher.queue();
    batcher.push(cd);
    assert(batcher.pending() == 3);

    auto batch = batcher.drain();
    assert(batch.size() == 2);  // Repeated pair applied once
    assert(batch[0].winner == "c");  // High impact first
    assert(batcher.empty());

    batcher.restore(saved);
    assert(batcher.pending() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_preference_graph() {
    std::cout << "Testing PreferenceGraph..." << std::endl;

    ComparisonHistory history;
    push_outcome(history, "a", "b");
    push_outcome(history, "b", "c");
    push_outcome(history, "c", "a");
    push_outcome(history, "c", "d");
    push_outcome(history, "a", "b");

    PreferenceGraph graph = PreferenceGraph::build({"a", "b", "c", "d"}, history);
    assert(graph.node_count() == 4);
    assert(graph.edge_count() == 4);
    assert(graph.weight(0, 1) == 2);
    assert(graph.has_edge("c", "a"));
    assert(!graph.has_edge("a", "c"));
    assert(history.has_outcome("c", "d"));

    auto components = graph.strongly_connected_components();
    assert(components.size() == 2);
    const std::vector<size_t>* cyclic = nullptr;
    for (const auto& c : components) {
        if (c.size() == 3) cyclic = &c;
    }
    assert(cyclic != nullptr);

    auto cycles = graph.elementary_cycles(*cyclic, 5, 300);
    assert(cycles.size() == 1);
    assert(cycles[0].size() == 3);
    assert(cycles[0][0] == 0);

    std::cout << "  PASS" << std::endl;
}

void test_updater() {
    std::cout << "Testing RatingUpdater..." << std::endl;

    RatingUpdater updater;
    RatingStore store;
    store.init(make_items(2));
    std::deque<float> changes;

    PendingUpdate u;
    u.winner = "i0";
    u.loser = "i1";
    u.learning_rate = 0.1f;

    BatchOutcome out = updater.apply_batch(store, {u}, 0.5f, changes);
    assert(out.applied == 1);
    assert(changes.size() == 1);
    assert(near(store.rating("i0"), 0.1f));   // delta 0.05 plus momentum 0.05
    assert(near(store.rating("i1"), -0.1f));
    assert(near(store.find("i0")->rating_uncertainty, 0.9f));
    assert(store.find("i0")->rating_mean > 0.0f);

    // Outcomes against the ratings tighten uncertainty less
    RatingStore upset;
    upset.init(make_items(2));
    upset.with_record("i1", [](RatingRecord& r) { r.rating = 1.0f; });
    u.contradicted = true;
    updater.apply_batch(upset, {u}, 0.5f, changes);
    assert(upset.find("i0")->rating_uncertainty > store.find("i0")->rating_uncertainty);
    assert(upset.rating("i0") > 0.0f);

    // Learning rate stays within bounds
    RatingStore fresh;
    fresh.init(make_items(2));
    LearningFactors f = updater.factors(fresh, "i0", "i1", changes);
    float rate = updater.learning_rate(fresh, "i0", "i1", 0.0f, 0.2f, 0.2f, f);
    assert(rate >= updater.config().min_rate && rate <= updater.config().max_rate);

    RatingRecord a, b;
    assert(!is_high_impact(a, b, 0.1f));
    assert(is_high_impact(a, b, 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_selector() {
    std::cout << "Testing ComparisonSelector..." << std::endl;

    ComparisonSelector selector;
    assert(selector.phase(0.2f) == Phase::Broad);
    assert(selector.phase(0.5f) == Phase::Narrow);
    assert(selector.phase(0.8f) == Phase::Pairs);
    assert(selector.group_size(Phase::Broad, 3) == 3);
    assert(selector.group_size(Phase::Narrow, 10) == 3);

    RatingStore store;
    store.init(make_items(4));
    Rng rng(7);
    auto confidence = [](const ItemId&) { return 0.2f; };

    auto first = selector.select(store, confidence, 0.9f, 1, rng);
    assert(first.size() == 2);
    assert(selector.used_count() == 2);

    auto second = selector.select(store, confidence, 0.9f, 2, rng);
    assert(second.size() == 2);
    for (const auto& id : second) {
        assert(std::find(first.begin(), first.end(), id) == first.end());
    }
    assert(selector.used_count() == 4);

    // Pool exhausted: it resets instead of failing
    auto third = selector.select(store, confidence, 0.9f, 3, rng);
    assert(third.size() == 2);
    assert(third[0] != third[1]);
    assert(selector.used_count() == 2);

    auto group = selector.select(store, confidence, 0.0f, 0, rng);
    assert(group.size() == 4);
    std::unordered_set<ItemId> distinct(group.begin(), group.end());
    assert(distinct.size() == 4);

    selector.note_resolved("i0", "i1");
    assert(selector.pair_age("i0", "i1") == 0u);
    assert(!selector.pair_age("i2", "i3"));
    assert(selector.recency_factor(store, "i1", "i0") == 0.1f);
    assert(selector.recency_factor(store, "i2", "i3") == 1.0f);

    std::cout << "  PASS" << std::endl;
}

void test_start_failure() {
    std::cout << "Testing start with too few items..." << std::endl;

    RankingEngine engine;
    bool threw = false;
    try {
        engine.start({{"solo", "Solo", 0, ""}}, 10);
    } catch (const SelectionFailure&) {
        threw = true;
    }
    assert(threw);
    assert(engine.state() == EngineState::Idle);
    assert(engine.current_selection().empty());

    threw = false;
    try {
        engine.start({{"a", "A", 0, ""}, {"a", "A again", 0, ""}}, 10);
    } catch (const SelectionFailure& e) {
        threw = std::string(e.what()).find("two distinct") != std::string::npos;
    }
    assert(threw);

    // A failed restart leaves nothing of the previous session behind
    engine.start(make_items(3), 10);
    assert(engine.resolve("i0", "i1"));
    threw = false;
    try {
        engine.start({{"solo", "Solo", 0, ""}}, 10);
    } catch (const SelectionFailure&) {
        threw = true;
    }
    assert(threw);
    assert(engine.state() == EngineState::Idle);
    assert(engine.ranked_results().empty());
    assert(engine.store().empty());
    assert(engine.history().empty());
    assert(engine.comparisons() == 0);
    assert(engine.pending_updates() == 0);
    assert(!engine.undo());
    assert(engine.state() == EngineState::Idle);
    assert(!engine.resolve("i0", "i1"));
    assert(engine.current_selection().empty());

    std::cout << "  PASS" << std::endl;
}

void test_resolve_rejects_unknown() {
    std::cout << "Testing resolve with unknown ids..." << std::endl;

    RankingEngine engine;
    assert(!engine.resolve("i0", "i1"));  // No session yet

    engine.start(make_items(4), 50);
    assert(!engine.resolve("i0", "nope"));
    assert(!engine.resolve("i0", "i0"));
    assert(!engine.resolve("i0", "i1", {"i0", "i1", "ghost"}));
    assert(engine.comparisons() == 0);
    assert(engine.history().empty());
    assert(engine.store().find("i0")->comparisons == 0);
    assert(!engine.choose("i0"));  // Nothing presented yet

    std::cout << "  PASS" << std::endl;
}

void test_budget_fallback() {
    std::cout << "Testing default budget..." << std::endl;

    RankingEngine engine;
    engine.start(make_items(10), 0);
    assert(engine.max_comparisons() == comparison_budget(BudgetMode::Balanced, 10));
    assert(engine.state() == EngineState::Selecting);

    std::cout << "  PASS" << std::endl;
}

void test_same_pair_twice() {
    std::cout << "Testing same pair resolved twice..." << std::endl;

    RankingEngine engine;
    engine.start(make_items(4), 100);
    assert(engine.resolve("i0", "i1"));
    assert(engine.pending_updates() == 1);
    assert(engine.resolve("i0", "i1"));

    const RatingRecord* w = engine.store().find("i0");
    const RatingRecord* l = engine.store().find("i1");
    assert(w->comparisons == 2 && w->wins == 2);
    assert(l->comparisons == 2 && l->losses == 2);

    // The batch held both; the repeat was applied once
    assert(engine.pending_updates() == 0);
    assert(engine.recent_changes().size() == 1);
    assert(engine.store().rating("i0") > engine.store().rating("i1"));

    std::cout << "  PASS" << std::endl;
}

void test_choose_group() {
    std::cout << "Testing group choice..." << std::endl;

    RankingEngine engine;
    engine.start(make_items(8), 100);

    auto selection = engine.current_selection();
    assert(selection.size() == 5);
    assert(engine.state() == EngineState::AwaitingOutcome);
    assert(engine.current_selection().size() == 5);  // Same selection until answered

    const ItemId winner = selection[2].id;
    assert(engine.choose(winner));
    assert(engine.comparisons() == 4);
    assert(engine.history().size() == 4);

    const RatingRecord* w = engine.store().find(winner);
    assert(w->wins == 4);
    assert(w->group_selections.chosen == 4);
    for (const auto& item : selection) {
        const RatingRecord* rec = engine.store().find(item.id);
        assert(rec->group_selections.appearances == 4);
        if (item.id != winner) {
            assert(rec->losses == 1);
            assert(rec->group_selections.chosen == 0);
        }
    }
    assert(engine.history().entries().back().event.is_group());
    check_counts(engine);

    auto undone = engine.undo();
    assert(undone && undone->size() == 5);
    assert(engine.comparisons() == 3);
    check_counts(engine);

    std::cout << "  PASS" << std::endl;
}

void test_confidence_cache() {
    std::cout << "Testing confidence cache..." << std::endl;

    auto items = make_items(10);
    auto truth = truth_of(items);
    RankingEngine engine;
    engine.start(items, 60);

    assert(engine.confidence("i0") == 0.2f);  // No comparisons yet

    for (int step = 0; step < 8 && !engine.is_finished(); ++step) {
        auto selection = engine.current_selection();
        if (selection.empty()) break;
        engine.choose(best_of(selection, truth));
    }

    ConfidenceEstimator estimator(engine.config().confidence);
    RankingView view = RankingView::of(engine.store());
    for (const auto& id : engine.store().ids()) {
        float cached = engine.confidence(id);
        uint64_t hits = engine.cache().hits();
        float again = engine.confidence(id);
        assert(cached == again);
        assert(engine.cache().hits() == hits + 1);
        assert(near(cached, estimator.compute(id, engine.store(), view), 1e-6f));
        assert(cached >= 0.2f && cached <= 1.0f);
    }

    std::cout << "  PASS" << std::endl;
}

void test_undo_round_trip() {
    std::cout << "Testing resolve/undo round trip..." << std::endl;

    auto items = make_items(12);
    auto truth = truth_of(items);
    RankingEngine engine;
    engine.start(items, 80);

    for (int step = 0; step < 7 && !engine.is_finished(); ++step) {
        engine.choose(best_of(engine.current_selection(), truth));
    }

    RatingStore before = engine.store();
    uint64_t comparisons = engine.comparisons();
    size_t pending = engine.pending_updates();
    std::deque<float> changes = engine.recent_changes();

    assert(engine.resolve("i9", "i3"));
    assert(engine.comparisons() == comparisons + 1);

    auto undone = engine.undo();
    assert(undone && undone->size() == 2);
    assert((*undone)[0].id == "i9" && (*undone)[1].id == "i3");

    assert(engine.comparisons() == comparisons);
    assert(engine.pending_updates() == pending);
    assert(engine.recent_changes() == changes);
    for (const auto& id : before.ids()) {
        const RatingRecord* now = engine.store().find(id);
        const RatingRecord* then = before.find(id);
        assert(now->same_state(*then));
        assert(now->momentum == then->momentum);
        assert(now->rating_mean == then->rating_mean);
    }

    // Cached confidence follows the restored state
    ConfidenceEstimator estimator(engine.config().confidence);
    RankingView view = RankingView::of(engine.store());
    for (const auto& id : engine.store().ids()) {
        assert(near(engine.confidence(id), estimator.compute(id, engine.store(), view), 1e-6f));
    }

    std::cout << "  PASS" << std::endl;
}

std::vector<ItemId> ids_of(const std::vector<Item>& items) {
    std::vector<ItemId> ids;
    for (const auto& item : items) ids.push_back(item.id);
    return ids;
}

void test_undo_presents_again() {
    std::cout << "Testing undo presents the choice again..." << std::endl;

    RankingEngine engine;
    engine.start(make_items(8), 100);

    auto selection = engine.current_selection();
    assert(selection.size() == 5);
    const ItemId first = selection[0].id;
    assert(engine.choose(first));
    assert(engine.selector().resolutions() == 4);
    assert(engine.selector().pair_age(first, selection[4].id).has_value());

    auto undone = engine.undo();
    assert(undone && ids_of(*undone) == ids_of(selection));
    assert(engine.state() == EngineState::AwaitingOutcome);
    assert(engine.selection_ids() == ids_of(selection));
    assert(ids_of(engine.current_selection()) == ids_of(selection));

    // The undone pair no longer counts as recently compared
    assert(engine.selector().resolutions() == 3);
    assert(!engine.selector().pair_age(first, selection[4].id).has_value());
    assert(engine.selector().pair_age(first, selection[3].id).has_value());

    // A different answer is accepted for the same group
    assert(engine.choose((*undone)[1].id));
    assert(engine.comparisons() == 7);
    check_counts(engine);

    // Undo reopens a session that ran out of budget
    RankingEngine small;
    small.start(make_items(4), 3);
    auto group = small.current_selection();
    assert(group.size() == 4);
    assert(small.choose(group[0].id));
    assert(small.state() == EngineState::Finished);

    auto reopened = small.undo();
    assert(reopened && reopened->size() == 4);
    assert(small.state() == EngineState::AwaitingOutcome);
    assert(!small.is_finished());
    assert(small.comparisons() == 2);
    assert(small.current_selection().size() == 4);

    assert(small.choose(reopened->back().id));
    assert(small.state() == EngineState::Finished);
    assert(small.comparisons() == 3);
    check_counts(small);

    std::cout << "  PASS" << std::endl;
}

void test_undo_restores_audit() {
    std::cout << "Testing undo rolls back an audit pass..." << std::endl;

    RankingEngine engine;
    engine.start(make_items(8), 100);

    const std::vector<std::pair<ItemId, ItemId>> outcomes = {
        {"i0", "i1"}, {"i2", "i3"}, {"i4", "i5"}, {"i6", "i7"}, {"i1", "i2"},
        {"i3", "i4"}, {"i5", "i6"}, {"i0", "i2"}, {"i4", "i6"}, {"i7", "i0"},
    };
    for (size_t i = 0; i + 1 < outcomes.size(); ++i) {
        assert(engine.resolve(outcomes[i].first, outcomes[i].second));
    }
    assert(engine.progress_stats().optimization.runs == 0);
    RatingStore before = engine.store();

    assert(engine.resolve(outcomes.back().first, outcomes.back().second));
    OptimizationStats after = engine.progress_stats().optimization;
    assert(after.runs == 1);
    assert(after.last_run_comparison == 10);

    assert(engine.undo());
    OptimizationStats rolled = engine.progress_stats().optimization;
    assert(rolled.runs == 0);
    assert(rolled.last_run_comparison == 0);
    assert(rolled.total_corrections == 0);
    assert(engine.comparisons() == 9);
    for (const auto& id : before.ids()) {
        assert(engine.store().find(id)->same_state(*before.find(id)));
    }

    // The pass is due again once the outcome is replayed
    assert(engine.auditor().due(10));
    assert(engine.resolve(outcomes.back().first, outcomes.back().second));
    assert(engine.progress_stats().optimization.runs == 1);
    check_counts(engine);

    std::cout << "  PASS" << std::endl;
}

void test_session_invariants() {
    std::cout << "Testing session invariants..." << std::endl;

    auto items = make_items(12);
    auto truth = truth_of(items);
    RankingEngine engine;
    engine.start(items, 80);

    auto first = engine.current_selection();
    assert(first.size() == 5);

    std::unordered_map<ItemId, float> uncertainty;
    for (const auto& id : engine.store().ids()) uncertainty[id] = 1.0f;

    engine.choose(best_of(first, truth));
    size_t steps = 1;
    while (!engine.is_finished()) {
        check_counts(engine);
        for (const auto& id : engine.store().ids()) {
            float u = engine.store().find(id)->rating_uncertainty;
            assert(u <= uncertainty[id]);
            assert(u >= 0.1f);
            uncertainty[id] = u;
        }

        auto selection = engine.current_selection();
        if (selection.empty()) break;
        assert(selection.size() >= 2);
        assert(engine.choose(best_of(selection, truth)));
        steps++;
    }
    check_counts(engine);
    assert(engine.is_finished());
    assert(engine.pending_updates() == 0);
    assert(engine.comparisons() <= engine.max_comparisons());
    assert(engine.current_selection().empty());
    assert(!engine.resolve("i0", "i1"));

    ProgressStats stats = engine.progress_stats();
    assert(stats.comparisons == engine.comparisons());
    assert(stats.stability_score >= 0.0f && stats.stability_score <= 1.0f);
    assert(stats.optimization.runs >= 1);  // 80 comparisons include scheduled audits

    auto results = engine.ranked_results();
    assert(results.size() == 12);
    for (size_t i = 0; i < results.size(); ++i) {
        assert(results[i].rank == i + 1);
        if (i > 0) assert(results[i - 1].rating >= results[i].rating);
    }

    std::cout << "  PASS (" << steps << " choices)" << std::endl;
}

void test_simulated_ranking() {
    std::cout << "Testing simulated ranking quality..." << std::endl;

    auto items = make_items(8);
    auto truth = truth_of(items);
    RankingEngine engine;
    engine.start(items, comparison_budget(BudgetMode::Thorough, items.size()));

    while (!engine.is_finished()) {
        auto selection = engine.current_selection();
        if (selection.empty()) break;
        engine.choose(best_of(selection, truth));
    }

    auto results = engine.ranked_results();
    assert(results.size() == 8);
    std::unordered_map<ItemId, size_t> rank;
    for (const auto& r : results) rank[r.item.id] = r.rank;

    // Never beaten / never chosen: both ends land where they belong
    assert(rank.at("i0") <= 2);
    assert(rank.at("i7") >= 7);

    std::cout << "  PASS" << std::endl;
}

void test_seeded_reproducibility() {
    std::cout << "Testing seeded reproducibility..." << std::endl;

    auto items = make_items(9);
    auto truth = truth_of(items);
    EngineConfig config;
    config.seed = 1234;

    RankingEngine a(config), b(config);
    a.start(items, 40);
    b.start(items, 40);
    while (!a.is_finished()) {
        auto sa = a.current_selection();
        auto sb = b.current_selection();
        assert(sa.size() == sb.size());
        for (size_t i = 0; i < sa.size(); ++i) assert(sa[i].id == sb[i].id);
        if (sa.empty()) break;
        a.choose(best_of(sa, truth));
        b.choose(best_of(sb, truth));
    }
    auto ra = a.ranked_results();
    auto rb = b.ranked_results();
    for (size_t i = 0; i < ra.size(); ++i) {
        assert(ra[i].item.id == rb[i].item.id);
        assert(ra[i].rating == rb[i].rating);
    }

    std::cout << "  PASS" << std::endl;
}

void test_four_item_scenario() {
    std::cout << "Testing four item scenario..." << std::endl;

    RankingEngine engine;
    engine.start({{"A", "A", 0, ""}, {"B", "B", 0, ""}, {"C", "C", 0, ""}, {"D", "D", 0, ""}}, 6);

    const std::pair<const char*, const char*> outcomes[] = {
        {"A", "B"}, {"C", "D"}, {"A", "C"}, {"B", "D"}, {"A", "D"}, {"B", "C"}
    };
    for (const auto& [w, l] : outcomes) {
        assert(!engine.is_finished());
        assert(engine.resolve(w, l));
    }

    assert(engine.is_finished());
    assert(engine.state() == EngineState::Finished);
    assert(engine.pending_updates() == 0);

    auto results = engine.ranked_results();
    assert(results[0].item.id == "A");
    assert(results[1].item.id == "B");
    assert(results[2].item.id == "C");
    assert(results[3].item.id == "D");
    assert(results[0].wins == 3 && results[3].losses == 3);
    assert(engine.confidence("A") > engine.confidence("D"));

    std::cout << "  PASS" << std::endl;
}

void test_three_cycle_repair() {
    std::cout << "Testing 3-cycle repair..." << std::endl;

    RatingStore store;
    store.init({{"A", "A", 0, ""}, {"B", "B", 0, ""}, {"C", "C", 0, ""}});
    store.with_record("A", [](RatingRecord& r) { r.rating = 1.0f; });
    store.with_record("C", [](RatingRecord& r) { r.rating = -1.0f; });

    ComparisonHistory history;
    push_outcome(history, "A", "B");
    push_outcome(history, "B", "C");
    push_outcome(history, "C", "A");

    ConsistencyAuditor auditor;
    assert(!auditor.due(3));

    float before = ConsistencyAuditor::violation(store, "C", "A");
    assert(near(before, 2.0f));

    Rng rng(1);
    auto report = auditor.run(store, history, 3, rng);
    assert(report.has_value());
    assert(report->direct == 1);
    assert(report->cycles == 1);
    assert(report->corrections >= 2);
    assert(ConsistencyAuditor::violation(store, "C", "A") < before);

    assert(!auditor.running());
    assert(auditor.stats().runs == 1);
    assert(auditor.stats().cycles_found == 1);
    assert(!auditor.due(12));
    assert(auditor.due(13));

    std::cout << "  PASS" << std::endl;
}

void test_convergence() {
    std::cout << "Testing ConvergenceMonitor..." << std::endl;

    ConvergenceMonitor monitor;
    AdaptiveThresholds small = monitor.thresholds(10, 0.5f);
    assert(near(small.confidence, 0.7f));
    assert(near(small.stability, 0.56f));
    assert(near(small.transitivity, 0.63f));
    assert(near(small.rank_change, 0.05f));

    AdaptiveThresholds large = monitor.thresholds(500, 0.9f);
    assert(near(large.confidence, 0.588f));
    assert(near(large.rank_change, 0.02f));

    RatingStore store;
    store.init({{"A", "A", 0, ""}, {"B", "B", 0, ""}, {"C", "C", 0, ""}});
    ComparisonHistory history;
    assert(monitor.transitivity_score(store, history) == 0.0f);
    assert(monitor.rank_stability(store, history) == 0.0f);

    store.with_record("A", [](RatingRecord& r) { r.rating = 1.0f; });
    store.with_record("C", [](RatingRecord& r) { r.rating = -1.0f; });
    push_outcome(history, "A", "B");
    push_outcome(history, "B", "C");
    assert(monitor.transitivity_score(store, history) == 1.0f);
    push_outcome(history, "C", "A");
    assert(monitor.transitivity_score(store, history) == 0.0f);

    RankingEngine engine;
    engine.start(make_items(6), 30);
    ConvergenceReport r = engine.convergence();
    assert(!r.converged);
    assert(std::strcmp(r.blocked_by, "progress") == 0);

    std::cout << "  PASS" << std::endl;
}

void test_early_convergence() {
    std::cout << "Testing early convergence..." << std::endl;

    // Small steps keep every recent change under the stability limit, and
    // the remaining gates are opened so progress and coverage decide
    EngineConfig config;
    config.learning.min_rate = 0.01f;
    config.learning.max_rate = 0.02f;
    config.convergence.min_progress = 0.1f;
    config.convergence.min_comparisons_per_item = 2;
    config.convergence.min_confidence = 0.0f;
    config.convergence.min_threshold = 0.0f;
    config.convergence.max_threshold = 0.0f;
    config.convergence.min_transitivity = 0.0f;
    config.convergence.min_rank_stability = 0.0f;

    auto items = make_items(6);
    auto truth = truth_of(items);
    RankingEngine engine(config);
    engine.start(items, 200);

    for (int step = 0; step < 200 && !engine.is_finished(); ++step) {
        auto selection = engine.current_selection();
        if (selection.empty()) break;
        engine.choose(best_of(selection, truth));
    }

    assert(engine.state() == EngineState::Converged);
    assert(engine.is_finished());
    assert(engine.pending_updates() == 0);
    assert(engine.comparisons() >= 20);
    assert(engine.comparisons() < engine.max_comparisons());
    assert(engine.store().min_comparisons() >= 2);
    assert(engine.progress_stats().state == EngineState::Converged);
    check_counts(engine);

    const uint64_t done = engine.comparisons();
    assert(engine.current_selection().empty());
    assert(!engine.resolve("i0", "i5"));
    assert(engine.comparisons() == done);

    engine.finish();
    assert(engine.state() == EngineState::Converged);

    std::cout << "  PASS" << std::endl;
}

void test_audit_guard() {
    std::cout << "Testing auditor re-entrancy guard..." << std::endl;

    RatingStore store;
    store.init({{"A", "A", 0, ""}, {"B", "B", 0, ""}, {"C", "C", 0, ""}});
    ComparisonHistory history;
    push_outcome(history, "A", "B");
    push_outcome(history, "B", "C");
    push_outcome(history, "C", "A");

    ConsistencyAuditor auditor;
    Rng rng(3);

    assert(auditor.try_begin());
    assert(auditor.running());
    assert(!auditor.try_begin());
    assert(!auditor.run(store, history, 12, rng).has_value());
    assert(auditor.stats().runs == 0);
    assert(auditor.running());

    auditor.end();
    assert(auditor.run(store, history, 12, rng).has_value());
    assert(auditor.stats().runs == 1);
    assert(!auditor.running());

    std::cout << "  PASS" << std::endl;
}

void test_json() {
    std::cout << "Testing JSON..." << std::endl;

    json list = json::parse(R"([
        {"id": 42, "title": "Heat", "year": "1995", "poster": "heat.jpg"},
        {"id": "ran", "title": "Ran", "year": 1985}
    ])");
    auto items = parse_items(list);
    assert(items.size() == 2);
    assert(items[0].id == "42");
    assert(items[0].year == 1995);
    assert(items[0].image == "heat.jpg");
    assert(items[1].year == 1985);
    assert(parse_items(json{{"items", list}}).size() == 2);

    bool threw = false;
    try {
        parse_items(json::parse(R"({"movies": []})"));
    } catch (const json::exception&) {
        threw = true;
    }
    assert(threw);

    EngineConfig config = json::parse(R"({
        "seed": 7,
        "learning": {"base_rate": 0.2},
        "audit": {"interval": 20}
    })").get<EngineConfig>();
    assert(config.seed == 7);
    assert(config.learning.base_rate == 0.2f);
    assert(config.learning.min_rate == 0.01f);
    assert(config.audit.interval == 20);
    assert(config.audit.min_comparisons == 5);

    json dumped = config;
    assert(dumped["audit"]["interval"].get<uint32_t>() == 20);
    assert(dumped["convergence"].contains("min_rank_stability"));

    RankingEngine engine(config);
    engine.start(items, 10);
    assert(engine.resolve("ran", "42"));
    engine.finish();
    json ranking = engine.ranked_results();
    assert(ranking.size() == 2);
    assert(ranking[0]["item"]["id"] == "ran");
    assert(ranking[0]["rank"] == 1);
    json stats = engine.progress_stats();
    assert(stats["state"] == "finished");
    assert(stats["comparisons"] == 1);

    RatingRecord rec = json(*engine.store().find("ran")).get<RatingRecord>();
    assert(rec.same_state(*engine.store().find("ran")));

    std::cout << "  PASS" << std::endl;
}

int main() {
    set_quiet(true);

    std::cout << "=== Krama C++ Tests ===" << std::endl;
    std::cout << std::endl;

    test_recent_results();
    test_rating_store();
    test_budget();
    test_batcher();
    test_preference_graph();
    test_updater();
    test_selector();

    std::cout << std::endl;
    std::cout << "=== Engine Tests ===" << std::endl;
    test_start_failure();
    test_resolve_rejects_unknown();
    test_budget_fallback();
    test_same_pair_twice();
    test_choose_group();
    test_confidence_cache();
    test_undo_round_trip();
    test_undo_presents_again();
    test_undo_restores_audit();
    test_session_invariants();
    test_simulated_ranking();
    test_seeded_reproducibility();
    test_four_item_scenario();
    test_three_cycle_repair();
    test_audit_guard();
    test_convergence();
    test_early_convergence();
    test_json();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
