// template_rank.cpp: score strategy templates from backtest snapshots.
//
// Pairs training and validation snapshots per period, scores each strategy,
// keeps the best strategy per template and optionally scales the result by a
// verification multiplier. Verification metrics come from a CSV, or from
// the best parameter set of each template in a backtest cache.
//
// Usage: ./template_rank --snapshots <snapshots.csv> [--verification <csv>]
//                        [--cache <records.csv>] [--settings <file>]
//                        [--now-ms T] [--output <scores.json>]

#include "scoring/param_scorer.hpp"
#include "scoring/score_csv.hpp"
#include "scoring/score_io.hpp"
#include "scoring/settings_lookup.hpp"
#include "scoring/template_scorer.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --snapshots <path> [options]\n"
              << "\n"
              << "  --snapshots     Training/validation snapshots (.csv)\n"
              << "  --verification  Per-template verify metrics (.csv)\n"
              << "  --cache         Backtest-cache rows; verify metrics of each\n"
              << "                  template's best parameter set are used\n"
              << "  --settings      KEY=VALUE settings file (TEMPLATE_SCORE_* and\n"
              << "                  PARAM_SCORE_* keys)\n"
              << "  --now-ms        Reference time for recency weighting (epoch ms)\n"
              << "  --output        Write score breakdowns as JSON\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string snapshots_path;
    std::string verification_path;
    std::string cache_path;
    std::string settings_path;
    std::string now_str;
    std::string output_path;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--snapshots" && i + 1 < argc) {
                snapshots_path = argv[++i];
            } else if (arg == "--verification" && i + 1 < argc) {
                verification_path = argv[++i];
            } else if (arg == "--cache" && i + 1 < argc) {
                cache_path = argv[++i];
            } else if (arg == "--settings" && i + 1 < argc) {
                settings_path = argv[++i];
            } else if (arg == "--now-ms" && i + 1 < argc) {
                now_str = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (snapshots_path.empty()) {
            std::cerr << "Missing required argument: --snapshots\n";
            print_usage(argv[0]);
            return 1;
        }

        std::ifstream snapshots_in(snapshots_path);
        if (!snapshots_in.is_open()) {
            std::cerr << "Cannot open snapshots file: " << snapshots_path << "\n";
            return 1;
        }
        auto snapshots = score_csv::read_snapshots(snapshots_in);

        std::unique_ptr<KeyValueFileSettingsLookup> lookup;
        if (!settings_path.empty()) {
            lookup = std::make_unique<KeyValueFileSettingsLookup>(settings_path);
        }

        TemplateScoreOptions options;
        options.settings_lookup = lookup.get();
        if (!now_str.empty()) {
            auto now = score_csv::parse_number(now_str);
            if (!now) throw std::invalid_argument("Invalid value for --now-ms: '" + now_str + "'");
            options.now_ms = score_csv::to_integer<int64_t>(*now, "--now-ms", now_str);
        }

        if (!cache_path.empty()) {
            auto records = score_csv::read_backtest_cache_file(cache_path);
            ParamScoreOptions param_options;
            param_options.settings_lookup = lookup.get();
            auto best = best_params_by_template(records, param_options);
            for (const auto& [template_id, result] : best) {
                options.verification_by_template[template_id] =
                    verification_from_record(records.at(result.record_index));
            }
            std::cout << "Cache: " << records.size() << " records, best parameter sets for "
                      << best.size() << " templates\n";
        }
        // Explicit verification rows take precedence over cache-derived ones.
        if (!verification_path.empty()) {
            std::ifstream verification_in(verification_path);
            if (!verification_in.is_open()) {
                std::cerr << "Cannot open verification file: " << verification_path << "\n";
                return 1;
            }
            for (auto& [template_id, metrics] : score_csv::read_verification(verification_in)) {
                options.verification_by_template[template_id] = metrics;
            }
        }

        auto results = compute_template_score_results(snapshots, options);

        std::cout << "Snapshots: " << snapshots.size()
                  << "  scored templates: " << results.scores.size() << "\n";
        for (const auto& [template_id, score] : results.scores) {
            const auto& b = results.breakdowns.at(template_id);
            std::cout << "  " << std::left << std::setw(24) << template_id
                      << " " << std::setw(4) << b.final_score100
                      << " strategy=" << b.strategy_id
                      << " periods=" << b.weights.period_count;
            if (b.verification_multiplier) {
                std::cout << " verify=" << std::fixed << std::setprecision(3)
                          << *b.verification_multiplier << std::defaultfloat;
            }
            std::cout << "\n";
        }

        if (!output_path.empty()) {
            std::ofstream out(output_path);
            if (!out.is_open()) {
                std::cerr << "Cannot open output file: " << output_path << "\n";
                return 1;
            }
            out << score_io::to_json(results) << "\n";
            std::cout << "Wrote " << output_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
