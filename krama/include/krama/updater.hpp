#pragma once
// Rating Updater: outcomes become ratings
//
// Softmax expectation, ELO-style delta, momentum that both drives and is
// driven by the update. The learning rate breathes with the session:
// generous early and on surprises, cautious once items are trusted.
// A Bayesian shadow tracks how sure we are; it only ever tightens.

#include "batcher.hpp"
#include "config.hpp"
#include "rating_store.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_map>
#include <vector>

namespace krama {

// Recent-change window shared by the batcher, updater and convergence
inline constexpr size_t RECENT_CHANGE_WINDOW = 20;

// Adaptive multipliers derived from recent behaviour
struct LearningFactors {
    float volatility = 1.0f;
    float consistency = 1.0f;
    float surprise = 1.0f;
};

// Outcome of one batch application
struct BatchOutcome {
    size_t applied = 0;
    float last_learning_rate = 0.0f;
    float mean_abs_change = 0.0f;
};

// High-impact comparison: close ratings, few comparisons, mid-session
inline bool is_high_impact(const RatingRecord& a, const RatingRecord& b, float progress) {
    if (progress < 0.2f) return false;
    float diff = std::fabs(a.rating - b.rating);
    float avg_comparisons = static_cast<float>(a.comparisons + b.comparisons) / 2.0f;
    float proximity = 1.0f / (1.0f + std::exp(5.0f * (diff - 0.5f)));
    float scarcity = 1.0f / (avg_comparisons + 1.0f);
    float phase = 1.0f - std::fabs(progress - 0.5f) * 2.0f;
    return proximity * 0.5f + scarcity * 0.3f + phase * 0.2f > 0.7f;
}

class RatingUpdater {
public:
    explicit RatingUpdater(LearningConfig config = {}) : config_(config) {}

    const LearningConfig& config() const { return config_; }

    LearningFactors factors(const RatingStore& store,
                            const ItemId& winner, const ItemId& loser,
                            const std::deque<float>& recent_changes) const {
        LearningFactors f;
        const RatingRecord* w = store.find(winner);
        const RatingRecord* l = store.find(loser);
        if (!w || !l) return f;

        float avg_consistency = (w->recent_results.flip_consistency() +
                                 l->recent_results.flip_consistency()) / 2.0f;
        f.consistency = avg_consistency > config_.consistency_threshold
            ? config_.consistency_scaling
            : config_.inconsistency_scaling;

        bool expected = latest_agrees(store, *w) && latest_agrees(store, *l);
        f.surprise = expected ? config_.expected_result_damping : config_.surprise_boost;

        if (recent_changes.size() >= config_.adaptation_window) {
            float sum = 0.0f;
            auto start = recent_changes.end() - config_.adaptation_window;
            for (auto it = start; it != recent_changes.end(); ++it) sum += std::fabs(*it);
            float avg = sum / static_cast<float>(config_.adaptation_window);
            f.volatility = std::clamp(std::log(avg / config_.typical_change + 1.0f), 0.5f, 1.5f);
        }
        return f;
    }

    float learning_rate(const RatingStore& store, const ItemId& winner, const ItemId& loser,
                        float progress, float winner_confidence, float loser_confidence,
                        const LearningFactors& f) const {
        const RatingRecord* w = store.find(winner);
        const RatingRecord* l = store.find(loser);
        if (!w || !l) return config_.min_rate;

        float phase = 1.0f;
        if (progress < config_.early_phase_end) phase = config_.early_phase_boost;
        else if (progress > config_.late_phase_start) phase = config_.late_phase_damping;

        float rate = config_.base_rate * (1.0f - progress * config_.progress_decay) * phase;

        float diff = std::fabs(w->rating - l->rating);
        rate *= 1.0f + 1.0f / (1.0f + std::exp(-config_.surprise_steepness * (1.0f - diff)));

        rate *= 1.0f - (winner_confidence + loser_confidence) / 4.0f;

        if (w->rating < l->rating) rate *= config_.violation_boost;

        float avg_momentum = (std::fabs(w->momentum) + std::fabs(l->momentum)) / 2.0f;
        rate *= 1.0f + avg_momentum * config_.momentum_factor;

        rate *= f.volatility * f.consistency * f.surprise;
        return std::clamp(rate, config_.min_rate, config_.max_rate);
    }

    // Apply a drained batch atomically. Every delta is computed against the
    // pre-batch store; per-item changes accumulate and momentum lands once.
    BatchOutcome apply_batch(RatingStore& store, const std::vector<PendingUpdate>& batch,
                             float progress, std::deque<float>& recent_changes) const {
        BatchOutcome out;
        if (batch.empty()) return out;

        struct Accum {
            float delta = 0.0f;
            float momentum = 0.0f;
            float mean_delta = 0.0f;
            float uncertainty = 1.0f;
        };
        std::unordered_map<ItemId, Accum> acc;
        std::vector<ItemId> touched;

        auto slot = [&](const ItemId& id, const RatingRecord& rec) -> Accum& {
            auto [it, inserted] = acc.try_emplace(id);
            if (inserted) {
                it->second.momentum = rec.momentum;
                it->second.uncertainty = rec.rating_uncertainty;
                touched.push_back(id);
            }
            return it->second;
        };

        float phase = 1.0f;
        if (progress < config_.early_phase_end) phase = config_.early_uncertainty_scale;
        else if (progress > config_.late_phase_start) phase = config_.late_uncertainty_scale;

        float abs_sum = 0.0f;
        for (const auto& u : batch) {
            const RatingRecord* w = store.find(u.winner);
            const RatingRecord* l = store.find(u.loser);
            if (!w || !l || u.winner == u.loser) continue;

            float p = expected_score(w->rating, l->rating);
            float delta = u.learning_rate * (1.0f - p);
            float scaling = u.volatility * u.consistency;

            Accum& aw = slot(u.winner, *w);
            Accum& al = slot(u.loser, *l);

            aw.momentum = aw.momentum * config_.momentum_factor + delta * scaling;
            al.momentum = al.momentum * config_.momentum_factor - delta * scaling;
            aw.delta += delta;
            al.delta -= delta;

            float strength = (u.group ? config_.group_observation_strength : 1.0f) * u.volatility;
            float rate = config_.uncertainty_reduction * phase * u.consistency;
            if (u.contradicted) rate *= config_.contradiction_certainty;
            aw.mean_delta += delta * (1.0f + aw.uncertainty) * strength;
            al.mean_delta -= delta * (1.0f + al.uncertainty) * strength;
            aw.uncertainty = std::max(config_.uncertainty_floor, aw.uncertainty * (1.0f - rate * strength));
            al.uncertainty = std::max(config_.uncertainty_floor, al.uncertainty * (1.0f - rate * strength));

            recent_changes.push_back(delta);
            while (recent_changes.size() > RECENT_CHANGE_WINDOW) recent_changes.pop_front();

            abs_sum += std::fabs(delta);
            out.applied++;
            out.last_learning_rate = u.learning_rate;
        }

        for (const auto& id : touched) {
            const Accum& a = acc.at(id);
            store.with_record(id, [&](RatingRecord& rec) {
                rec.rating += a.delta + a.momentum;
                rec.momentum = a.momentum;
                rec.rating_mean += a.mean_delta;
                rec.rating_uncertainty = std::min(rec.rating_uncertainty, a.uncertainty);
            });
        }

        if (out.applied > 0) out.mean_abs_change = abs_sum / static_cast<float>(out.applied);
        return out;
    }

private:
    // Latest recorded result matches the current rating order
    static bool latest_agrees(const RatingStore& store, const RatingRecord& rec) {
        if (rec.recent_results.empty()) return true;
        const RecentResult& last = rec.recent_results.back();
        uint8_t expected = rec.rating > store.rating(last.opponent) ? 1 : 0;
        return last.outcome == expected;
    }

    LearningConfig config_;
};

} // namespace krama
