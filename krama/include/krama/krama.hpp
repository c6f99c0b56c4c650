#pragma once
// Krama: adaptive pairwise ranking
//
// Order a list by asking a person which of a few items they prefer:
// - Types: Items, rating records, events, lifecycle states
// - Store: Standings, ranking views, snapshots
// - Selector: Which items to show next (groups, then pairs)
// - Updater + Batcher: Outcomes into ratings, in batches
// - Confidence: How settled each position is
// - Auditor: Pulling ratings back toward recorded outcomes
// - Convergence: When to stop asking
// - Engine: Unified API for a ranking session

#include "types.hpp"
#include "config.hpp"
#include "log.hpp"
#include "rating_store.hpp"
#include "batcher.hpp"
#include "history.hpp"
#include "preference_graph.hpp"
#include "confidence.hpp"
#include "selector.hpp"
#include "updater.hpp"
#include "auditor.hpp"
#include "convergence.hpp"
#include "budget.hpp"
#include "engine.hpp"
#include "version.hpp"
