// krama: Command-line interface for ranking sessions
//
// Usage: krama <command> ITEMS.json [options]
//
// Commands:
//   rank       Interactive ranking session on stdin
//   simulate   Rank against the file order as hidden ground truth
//   budget     Show the comparison budget of each mode
//   help       Show this help

#include <krama/engine.hpp>
#include <krama/json.hpp>
#include <krama/log.hpp>
#include <krama/version.hpp>
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>
#include <cstdlib>
#include <random>
#include <unordered_map>
#include <vector>

using namespace krama;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "krama " << KRAMA_VERSION << " - Adaptive pairwise ranking\n\n"
              << "Usage: " << name << " <command> ITEMS.json [options]\n\n"
              << "Commands:\n"
              << "  rank               Rank interactively (1..k pick, u undo, s stats, q quit)\n"
              << "  simulate           Rank against the file order as ground truth\n"
              << "  budget             Show the comparison budget of each mode\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --mode MODE        quick | balanced | thorough (default: balanced)\n"
              << "  --max N            Comparison budget (overrides --mode)\n"
              << "  --noise P          Simulated answer error rate (simulate only)\n"
              << "  --seed N           Random seed\n"
              << "  --config PATH      Engine configuration (JSON)\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  --quiet            Only print warnings\n"
              << "  -v, --version      Show version\n";
}

static void print_ranking(const std::vector<RankedResult>& results) {
    std::cout << "Ranking\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";
    for (const auto& r : results) {
        std::cout << std::setw(4) << r.rank << ". " << r.item.title;
        if (r.item.year > 0) std::cout << " (" << r.item.year << ")";
        std::cout << "\n      rating " << std::fixed << std::setprecision(3) << r.rating
                  << "  W/L " << r.wins << "/" << r.losses
                  << "  confidence " << std::setprecision(0) << r.confidence * 100.0f << "%\n";
        std::cout.unsetf(std::ios::floatfield);
        std::cout << std::setprecision(6);
    }
}

static void print_stats(const ProgressStats& s) {
    std::cout << "  " << s.comparisons << "/" << s.max_comparisons << " comparisons"
              << ", phase " << phase_name(s.phase)
              << ", confidence " << std::fixed << std::setprecision(2) << s.avg_confidence
              << ", stability " << s.stability_score
              << ", ~" << s.estimated_minutes_left << " min left"
              << ", " << s.optimization.total_corrections << " corrections\n";
    std::cout.unsetf(std::ios::floatfield);
    std::cout << std::setprecision(6);
}

static json session_json(const RankingEngine& engine) {
    return {
        {"version", KRAMA_VERSION},
        {"state", state_name(engine.state())},
        {"progress", engine.progress_stats()},
        {"ranking", engine.ranked_results()}
    };
}

uint64_t resolve_budget(BudgetMode mode, uint64_t max_comparisons, size_t item_count) {
    if (max_comparisons > 0) return max_comparisons;
    return comparison_budget(mode, item_count);
}

int cmd_rank(RankingEngine& engine, const std::vector<Item>& items, uint64_t budget, bool json_output) {
    engine.start(items, budget);

    std::string line;
    while (!engine.is_finished()) {
        std::vector<Item> selection = engine.current_selection();
        if (selection.empty()) break;

        std::cout << "\nWhich do you prefer? (" << engine.comparisons() + 1 << "/"
                  << engine.max_comparisons() << ")\n";
        for (size_t i = 0; i < selection.size(); ++i) {
            std::cout << "  " << (i + 1) << ") " << selection[i].title;
            if (selection[i].year > 0) std::cout << " (" << selection[i].year << ")";
            std::cout << "\n";
        }
        std::cout << "> " << std::flush;

        if (!std::getline(std::cin, line)) {
            engine.finish();
            break;
        }
        if (line == "q") {
            engine.finish();
            break;
        }
        if (line == "u") {
            // The undone choice comes back as the next selection
            if (engine.undo()) std::cout << "Undid the last answer, choose again\n";
            else std::cout << "Nothing to undo\n";
            continue;
        }
        if (line == "s") {
            print_stats(engine.progress_stats());
            continue;
        }

        char* end = nullptr;
        long pick = std::strtol(line.c_str(), &end, 10);
        if (end == line.c_str() || *end != '\0' || pick < 1 || pick > static_cast<long>(selection.size())) {
            std::cout << "Enter 1-" << selection.size() << ", u, s or q\n";
            continue;
        }
        engine.choose(selection[static_cast<size_t>(pick - 1)].id);
    }

    if (json_output) {
        std::cout << session_json(engine).dump(2) << "\n";
    } else {
        std::cout << "\n";
        print_ranking(engine.ranked_results());
        print_stats(engine.progress_stats());
    }
    return 0;
}

// Share of item pairs the ranking orders the same way as the truth
static double pairwise_agreement(const std::vector<RankedResult>& results,
                                 const std::unordered_map<ItemId, size_t>& truth) {
    size_t agree = 0, total = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        for (size_t j = i + 1; j < results.size(); ++j) {
            total++;
            if (truth.at(results[i].item.id) < truth.at(results[j].item.id)) agree++;
        }
    }
    return total > 0 ? static_cast<double>(agree) / static_cast<double>(total) : 1.0;
}

int cmd_simulate(RankingEngine& engine, const std::vector<Item>& items, uint64_t budget,
                 double noise, uint64_t seed, bool json_output) {
    std::unordered_map<ItemId, size_t> truth;
    for (size_t i = 0; i < items.size(); ++i) truth.emplace(items[i].id, i);

    Rng answers(seed ^ 0x9e3779b97f4a7c15ULL);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    engine.start(items, budget);
    while (!engine.is_finished()) {
        std::vector<Item> selection = engine.current_selection();
        if (selection.empty()) break;

        size_t best = 0;
        for (size_t i = 1; i < selection.size(); ++i) {
            if (truth.at(selection[i].id) < truth.at(selection[best].id)) best = i;
        }
        if (noise > 0.0 && coin(answers) < noise) {
            std::uniform_int_distribution<size_t> any(0, selection.size() - 1);
            best = any(answers);
        }
        if (!engine.choose(selection[best].id)) {
            log_warn("Simulate", "choice of %s was rejected", selection[best].id.c_str());
            break;
        }
    }

    auto results = engine.ranked_results();
    double agreement = pairwise_agreement(results, truth);
    size_t exact = 0;
    for (const auto& r : results) {
        if (truth.at(r.item.id) + 1 == r.rank) exact++;
    }

    if (json_output) {
        json out = session_json(engine);
        out["simulation"] = {
            {"noise", noise},
            {"pairwise_agreement", agreement},
            {"exact_positions", exact}
        };
        std::cout << out.dump(2) << "\n";
    } else {
        print_ranking(results);
        std::cout << "\nSimulation (" << state_name(engine.state()) << ")\n";
        std::cout << "  Comparisons used:    " << engine.comparisons() << "/" << engine.max_comparisons() << "\n";
        std::cout << "  Pairwise agreement:  " << std::fixed << std::setprecision(3) << agreement << "\n";
        std::cout << "  Exact positions:     " << exact << "/" << results.size() << "\n";
    }
    return 0;
}

int cmd_budget(size_t item_count, bool json_output) {
    const BudgetMode modes[] = {BudgetMode::Quick, BudgetMode::Balanced, BudgetMode::Thorough};
    if (json_output) {
        json out = json::object();
        out["items"] = item_count;
        for (BudgetMode m : modes) {
            uint64_t c = comparison_budget(m, item_count);
            out[budget_mode_name(m)] = {{"comparisons", c}, {"minutes", estimated_minutes(c)}};
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    std::cout << "Budget for " << item_count << " items\n";
    for (BudgetMode m : modes) {
        uint64_t c = comparison_budget(m, item_count);
        std::cout << "  " << std::left << std::setw(10) << budget_mode_name(m) << std::right
                  << std::setw(6) << c << " comparisons  ~" << estimated_minutes(c) << " min\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string items_path;
    std::string config_path;
    std::string mode_name = "balanced";
    uint64_t max_comparisons = 0;
    double noise = 0.0;
    bool seed_set = false;
    uint64_t seed = 0;
    bool json_output = false;

    try {
        // Parse arguments
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
                mode_name = argv[++i];
            } else if (strcmp(argv[i], "--max") == 0 && i + 1 < argc) {
                max_comparisons = std::stoull(argv[++i]);
            } else if (strcmp(argv[i], "--noise") == 0 && i + 1 < argc) {
                noise = std::stod(argv[++i]);
            } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
                seed_set = true;
            } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (strcmp(argv[i], "--json") == 0) {
                json_output = true;
            } else if (strcmp(argv[i], "--verbose") == 0) {
                set_verbose(true);
            } else if (strcmp(argv[i], "--quiet") == 0) {
                set_quiet(true);
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "krama " << KRAMA_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-') {
                if (command.empty()) {
                    command = argv[i];
                } else if (items_path.empty()) {
                    items_path = argv[i];
                }
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (command.empty() || command == "help") {
            print_usage(argv[0]);
            return 0;
        }
        if (command != "rank" && command != "simulate" && command != "budget") {
            std::cerr << "Unknown command: " << command << "\n";
            print_usage(argv[0]);
            return 1;
        }
        if (items_path.empty()) {
            std::cerr << "Usage: krama " << command << " ITEMS.json [options]\n";
            return 1;
        }

        auto mode = parse_budget_mode(mode_name);
        if (!mode) {
            std::cerr << "Error: unknown mode '" << mode_name << "' (quick, balanced, thorough)\n";
            return 1;
        }
        if (noise < 0.0 || noise > 1.0) {
            std::cerr << "Error: --noise must be between 0 and 1\n";
            return 1;
        }

        std::vector<Item> items = load_items(items_path);
        log_debug("CLI", "loaded %zu items from %s", items.size(), items_path.c_str());

        if (command == "budget") {
            return cmd_budget(items.size(), json_output);
        }

        EngineConfig config;
        if (!config_path.empty()) {
            config = load_config(config_path);
            log_debug("CLI", "configuration from %s: %s", config_path.c_str(), json(config).dump().c_str());
        }
        if (seed_set) config.seed = seed;

        RankingEngine engine(config);
        uint64_t budget = resolve_budget(*mode, max_comparisons, items.size());

        if (command == "rank") {
            return cmd_rank(engine, items, budget, json_output);
        }
        return cmd_simulate(engine, items, budget, noise, config.seed, json_output);
    } catch (const SelectionFailure& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const json::exception& e) {
        std::cerr << "Error: invalid JSON: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
