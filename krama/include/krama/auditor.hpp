#pragma once
// Consistency Auditor: when the ratings contradict the evidence
//
// Recorded outcomes are facts; ratings are opinions. Every so often the
// auditor walks the preference graph and pulls the opinions back toward
// the facts: direct contradictions first, then inconsistent triads, then
// cycles. Corrections are partial and capped so the ratings settle
// instead of swinging. Afterwards the scale is renormalised.

#include "config.hpp"
#include "history.hpp"
#include "log.hpp"
#include "preference_graph.hpp"
#include "rating_store.hpp"
#include "types.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <optional>
#include <random>
#include <vector>

namespace krama {

// What a single pass did
struct AuditReport {
    size_t direct = 0;
    size_t triads = 0;
    size_t cycles = 0;
    size_t normalization_fixes = 0;
    size_t corrections = 0;
};

class ConsistencyAuditor {
public:
    explicit ConsistencyAuditor(AuditConfig config = {}) : config_(config) {}

    const AuditConfig& config() const { return config_; }
    const OptimizationStats& stats() const { return stats_; }
    bool running() const { return running_.load(); }

    void reset() {
        stats_ = {};
    }

    // Undo hands back the totals as they were before the undone outcome
    void restore(const OptimizationStats& stats) {
        stats_ = stats;
    }

    // Claim the auditor for one pass. False when a pass already holds it.
    bool try_begin() {
        bool expected = false;
        return running_.compare_exchange_strong(expected, true);
    }

    void end() {
        running_ = false;
    }

    bool due(uint64_t comparisons) const {
        return comparisons >= config_.min_comparisons &&
               comparisons >= stats_.last_run_comparison + config_.interval;
    }

    // One audit pass. Skipped (nullopt) when another pass is in progress.
    std::optional<AuditReport> run(RatingStore& store, const ComparisonHistory& history,
                                   uint64_t comparisons, Rng& rng) {
        if (!try_begin()) {
            log_debug("Auditor", "pass already running, skipping");
            return std::nullopt;
        }
        struct Release {
            ConsistencyAuditor& auditor;
            ~Release() { auditor.end(); }
        } release{*this};

        PreferenceGraph graph = PreferenceGraph::build(store.ids(), history);
        AuditReport report;

        report.direct = fix_direct(store, graph);
        report.triads = fix_triads(store, graph, rng);
        report.cycles = fix_cycles(store, graph);

        // Edges that hold now must still hold after rescaling
        std::vector<bool> held(graph.edges().size());
        for (size_t i = 0; i < graph.edges().size(); ++i) {
            held[i] = satisfied(store, graph, graph.edges()[i]);
        }
        if (store.normalize()) {
            for (size_t i = 0; i < graph.edges().size(); ++i) {
                const auto& e = graph.edges()[i];
                if (!held[i] || satisfied(store, graph, e)) continue;
                store.with_record(graph.id(e.from), [&](RatingRecord& r) { r.rating += config_.renormalize_nudge; });
                store.with_record(graph.id(e.to), [&](RatingRecord& r) { r.rating -= config_.renormalize_nudge; });
                report.normalization_fixes++;
            }
        }

        report.corrections = report.direct + report.triads + report.cycles + report.normalization_fixes;

        stats_.runs++;
        stats_.last_run_comparison = comparisons;
        stats_.total_corrections += report.corrections;
        stats_.direct_fixed += report.direct;
        stats_.transitivity_fixed += report.triads + report.cycles;
        stats_.normalization_fixes += report.normalization_fixes;

        if (report.corrections > 0) {
            log_info("Auditor", "pass at #%llu: %zu direct, %zu triad, %zu cycle, %zu renormalisation fixes",
                     static_cast<unsigned long long>(comparisons), report.direct, report.triads,
                     report.cycles, report.normalization_fixes);
        } else {
            log_debug("Auditor", "pass at #%llu: consistent", static_cast<unsigned long long>(comparisons));
        }
        return report;
    }

    // Rating gap by which an edge is violated (0 when it holds)
    static float violation(const RatingStore& store, const ItemId& winner, const ItemId& loser) {
        return std::max(0.0f, store.rating(loser) - store.rating(winner));
    }

private:
    static bool satisfied(const RatingStore& store, const PreferenceGraph& graph,
                          const PreferenceGraph::Edge& e) {
        return store.rating(graph.id(e.from)) > store.rating(graph.id(e.to));
    }

    void adjust(RatingStore& store, const ItemId& id, float delta) {
        store.with_record(id, [delta](RatingRecord& r) { r.rating += delta; });
    }

    // Recorded winner rated at or below its loser
    size_t fix_direct(RatingStore& store, const PreferenceGraph& graph) {
        // Detect against the pre-pass ratings, like one consistent scan
        std::vector<std::pair<size_t, float>> found;
        for (size_t i = 0; i < graph.edges().size(); ++i) {
            const auto& e = graph.edges()[i];
            float w = store.rating(graph.id(e.from));
            float l = store.rating(graph.id(e.to));
            if (w <= l) found.emplace_back(i, l - w);
        }
        for (const auto& [i, gap] : found) {
            const auto& e = graph.edges()[i];
            float amount = (gap + config_.direct_margin) * config_.direct_strength;
            adjust(store, graph.id(e.from), amount * config_.winner_share);
            adjust(store, graph.id(e.to), -amount * (1.0f - config_.winner_share));
        }
        return found.size();
    }

    // Triads a > b > c by rating that history contradicts
    size_t fix_triads(RatingStore& store, const PreferenceGraph& graph, Rng& rng) {
        const size_t n = graph.node_count();
        if (n < 3) return 0;

        struct Triad { size_t a, b, c; };
        std::vector<Triad> triads;

        const uint64_t total = static_cast<uint64_t>(n) * (n - 1) * (n - 2) / 6;
        if (total <= config_.triad_samples) {
            for (size_t i = 0; i < n; ++i)
                for (size_t j = i + 1; j < n; ++j)
                    for (size_t k = j + 1; k < n; ++k) triads.push_back({i, j, k});
        } else {
            std::uniform_int_distribution<size_t> pick(0, n - 1);
            for (size_t s = 0; s < config_.triad_samples; ++s) {
                size_t i = pick(rng), j = pick(rng), k = pick(rng);
                if (i == j || j == k || i == k) continue;
                triads.push_back({i, j, k});
            }
        }

        size_t fixed = 0;
        for (auto t : triads) {
            size_t m[3] = {t.a, t.b, t.c};
            std::sort(std::begin(m), std::end(m), [&](size_t x, size_t y) {
                return store.rating(graph.id(x)) > store.rating(graph.id(y));
            });
            const ItemId& a = graph.id(m[0]);
            const ItemId& b = graph.id(m[1]);
            const ItemId& c = graph.id(m[2]);
            float ra = store.rating(a), rb = store.rating(b), rc = store.rating(c);
            if (!(ra > rb && rb > rc)) continue;

            bool contradicted = graph.has_edge(m[2], m[0]) ||
                                (graph.has_edge(m[1], m[0]) && graph.has_edge(m[2], m[1]));
            if (!contradicted) continue;

            // Move the least certain member toward a consistent position
            float ua = store.find(a)->rating_uncertainty;
            float ub = store.find(b)->rating_uncertainty;
            float uc = store.find(c)->rating_uncertainty;
            size_t pick = 0;
            if (ub > ua) pick = 1;
            if (uc > std::max(ua, ub)) pick = 2;

            float target;
            const ItemId* id;
            if (pick == 0) {
                target = rb + config_.triad_margin;
                id = &a;
            } else if (pick == 1) {
                target = (ra + rc) / 2.0f;
                id = &b;
            } else {
                target = rb - config_.triad_margin;
                id = &c;
            }
            float step = (target - store.rating(*id)) * config_.incremental;
            step = std::copysign(std::min(std::fabs(step), config_.max_correction), step);
            adjust(store, *id, step);
            fixed++;
        }
        return fixed;
    }

    // Elementary cycles inside strongly connected components
    size_t fix_cycles(RatingStore& store, const PreferenceGraph& graph) {
        size_t fixed = 0;
        for (auto& component : graph.strongly_connected_components()) {
            if (component.size() < 3) continue;
            if (component.size() > config_.max_scc_search) {
                component = most_conflicted(store, graph, component);
            }
            auto cycles = graph.elementary_cycles(component, config_.max_cycle_length, config_.max_cycles);
            stats_.cycles_found += cycles.size();

            for (const auto& cycle : cycles) {
                bool touched = false;
                for (size_t i = 0; i < cycle.size(); ++i) {
                    const ItemId& winner = graph.id(cycle[i]);
                    const ItemId& loser = graph.id(cycle[(i + 1) % cycle.size()]);
                    float rw = store.rating(winner);
                    float rl = store.rating(loser);
                    if (rw > rl) continue;
                    float step = std::min((rl - rw + config_.cycle_margin) * config_.incremental,
                                          config_.max_correction);
                    adjust(store, winner, step);
                    adjust(store, loser, -step);
                    touched = true;
                }
                if (touched) fixed++;
            }
        }
        return fixed;
    }

    // Members with the most violated in-component edges
    std::vector<size_t> most_conflicted(const RatingStore& store, const PreferenceGraph& graph,
                                        const std::vector<size_t>& component) const {
        std::vector<bool> inside(graph.node_count(), false);
        for (size_t v : component) inside[v] = true;

        std::vector<size_t> conflicts(graph.node_count(), 0);
        for (const auto& e : graph.edges()) {
            if (!inside[e.from] || !inside[e.to]) continue;
            if (!satisfied(store, graph, e)) {
                conflicts[e.from] += e.weight;
                conflicts[e.to] += e.weight;
            }
        }

        std::vector<size_t> ranked = component;
        std::stable_sort(ranked.begin(), ranked.end(), [&](size_t x, size_t y) {
            return conflicts[x] > conflicts[y];
        });
        ranked.resize(config_.max_scc_search);
        std::sort(ranked.begin(), ranked.end());
        return ranked;
    }

    AuditConfig config_;
    OptimizationStats stats_;
    std::atomic<bool> running_{false};
};

} // namespace krama
