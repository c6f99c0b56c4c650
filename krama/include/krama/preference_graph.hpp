#pragma once
// Preference Graph: who beat whom
//
// Derived from history, never stored. Edge winner -> loser for every
// distinct ordered pair ever resolved, weighted by how often it happened.
// Cycles live inside strongly connected components, so SCCs are found
// first (Tarjan) and elementary cycles are only searched inside them.

#include "history.hpp"
#include "types.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace krama {

class PreferenceGraph {
public:
    struct Edge {
        size_t from;
        size_t to;
        uint32_t weight;
    };

    PreferenceGraph() = default;

    static PreferenceGraph build(const std::vector<ItemId>& ids,
                                 const ComparisonHistory& history) {
        PreferenceGraph g;
        g.ids_ = ids;
        g.adjacency_.resize(ids.size());
        for (size_t i = 0; i < ids.size(); ++i) g.index_.emplace(ids[i], i);

        for (const auto& entry : history.entries()) {
            auto w = g.index(entry.event.winner);
            auto l = g.index(entry.event.loser);
            if (!w || !l || *w == *l) continue;
            g.add_edge(*w, *l);
        }
        return g;
    }

    size_t node_count() const { return ids_.size(); }
    size_t edge_count() const { return edges_.size(); }

    const ItemId& id(size_t node) const { return ids_[node]; }

    std::optional<size_t> index(const ItemId& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    // Edges in order of first observation
    const std::vector<Edge>& edges() const { return edges_; }

    const std::vector<size_t>& successors(size_t node) const { return adjacency_[node]; }

    bool has_edge(size_t from, size_t to) const {
        return edge_slot_.count(slot_key(from, to)) > 0;
    }

    bool has_edge(const ItemId& winner, const ItemId& loser) const {
        auto w = index(winner);
        auto l = index(loser);
        return w && l && has_edge(*w, *l);
    }

    uint32_t weight(size_t from, size_t to) const {
        auto it = edge_slot_.find(slot_key(from, to));
        return it != edge_slot_.end() ? edges_[it->second].weight : 0;
    }

    // Tarjan's algorithm. Components come out in reverse topological order.
    std::vector<std::vector<size_t>> strongly_connected_components() const {
        const size_t n = ids_.size();
        const size_t UNSEEN = static_cast<size_t>(-1);
        std::vector<size_t> index(n, UNSEEN), low(n, 0);
        std::vector<bool> on_stack(n, false);
        std::vector<size_t> stack;
        std::vector<std::vector<size_t>> components;
        size_t counter = 0;

        std::function<void(size_t)> connect = [&](size_t v) {
            index[v] = low[v] = counter++;
            stack.push_back(v);
            on_stack[v] = true;

            for (size_t w : adjacency_[v]) {
                if (index[w] == UNSEEN) {
                    connect(w);
                    low[v] = std::min(low[v], low[w]);
                } else if (on_stack[w]) {
                    low[v] = std::min(low[v], index[w]);
                }
            }

            if (low[v] == index[v]) {
                std::vector<size_t> component;
                size_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != v);
                std::sort(component.begin(), component.end());
                components.push_back(std::move(component));
            }
        };

        for (size_t v = 0; v < n; ++v) {
            if (index[v] == UNSEEN) connect(v);
        }
        return components;
    }

    // Elementary cycles of length 3..max_length using only `nodes`.
    // Each cycle is reported once, starting from its smallest node.
    std::vector<std::vector<size_t>> elementary_cycles(const std::vector<size_t>& nodes,
                                                       size_t max_length,
                                                       size_t max_cycles) const {
        std::vector<std::vector<size_t>> cycles;
        if (nodes.size() < 3 || max_length < 3) return cycles;

        std::vector<bool> allowed(ids_.size(), false);
        for (size_t v : nodes) allowed[v] = true;

        std::vector<size_t> sorted = nodes;
        std::sort(sorted.begin(), sorted.end());

        std::vector<size_t> path;
        std::vector<bool> on_path(ids_.size(), false);

        std::function<void(size_t, size_t)> extend = [&](size_t start, size_t v) {
            if (cycles.size() >= max_cycles) return;
            for (size_t w : adjacency_[v]) {
                if (!allowed[w] || w < start) continue;
                if (w == start) {
                    if (path.size() >= 3) cycles.push_back(path);
                    if (cycles.size() >= max_cycles) return;
                } else if (!on_path[w] && path.size() < max_length) {
                    path.push_back(w);
                    on_path[w] = true;
                    extend(start, w);
                    on_path[w] = false;
                    path.pop_back();
                }
            }
        };

        for (size_t start : sorted) {
            if (cycles.size() >= max_cycles) break;
            path.assign(1, start);
            on_path[start] = true;
            extend(start, start);
            on_path[start] = false;
        }
        return cycles;
    }

private:
    void add_edge(size_t from, size_t to) {
        uint64_t key = slot_key(from, to);
        auto it = edge_slot_.find(key);
        if (it != edge_slot_.end()) {
            edges_[it->second].weight++;
            return;
        }
        edge_slot_.emplace(key, edges_.size());
        edges_.push_back({from, to, 1});
        adjacency_[from].push_back(to);
    }

    static uint64_t slot_key(size_t from, size_t to) {
        return (static_cast<uint64_t>(from) << 32) | static_cast<uint64_t>(to & 0xFFFFFFFFu);
    }

    std::vector<ItemId> ids_;
    std::unordered_map<ItemId, size_t> index_;
    std::vector<std::vector<size_t>> adjacency_;
    std::vector<Edge> edges_;
    std::unordered_map<uint64_t, size_t> edge_slot_;
};

} // namespace krama
