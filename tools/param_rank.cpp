// param_rank.cpp: rank the parameter sets of one template's backtest cache.
//
// Reads exported backtest-cache rows (CSV or Parquet), scores every eligible
// parameter set by core quality, drawdown penalty and neighborhood stability,
// and writes the ranking in descending final score.
//
// Usage: ./param_rank --input <records.csv|.parquet> --output <ranked.csv|.parquet>
//                     [--report <availability.json>] [--settings <file>]
//                     [--min-trades N] [--neighbor-threshold X]
//                     [--stability-gamma X] [--top N]

#include "scoring/param_scorer.hpp"
#include "scoring/score_csv.hpp"
#include "scoring/score_io.hpp"
#include "scoring/settings_lookup.hpp"

// Arrow/Parquet for Parquet input and output
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

enum class FileFormat { CSV, PARQUET };

FileFormat format_of(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext == ".parquet") return FileFormat::PARQUET;
    if (ext == ".csv") return FileFormat::CSV;
    throw std::invalid_argument("Unsupported file format '" + path +
                                "'. Use .csv or .parquet extension.");
}

std::string format_double(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

// ===========================================================================
// Parquet Reader: flattens every column into text cells so the CSV record
// mapping applies unchanged.
// ===========================================================================
std::string cell_text(const arrow::Array& array, int64_t row) {
    if (array.IsNull(row)) return "";
    switch (array.type_id()) {
        case arrow::Type::DOUBLE:
            return format_double(static_cast<const arrow::DoubleArray&>(array).Value(row));
        case arrow::Type::FLOAT:
            return format_double(static_cast<const arrow::FloatArray&>(array).Value(row));
        case arrow::Type::INT64:
            return std::to_string(static_cast<const arrow::Int64Array&>(array).Value(row));
        case arrow::Type::INT32:
            return std::to_string(static_cast<const arrow::Int32Array&>(array).Value(row));
        case arrow::Type::BOOL:
            return static_cast<const arrow::BooleanArray&>(array).Value(row) ? "true" : "false";
        case arrow::Type::STRING:
            return static_cast<const arrow::StringArray&>(array).GetString(row);
        default:
            throw std::runtime_error("Unsupported Parquet column type: " +
                                     array.type()->ToString());
    }
}

arrow::Status read_parquet_table(const std::string& path, score_csv::Table& out) {
    ARROW_ASSIGN_OR_RAISE(auto infile, arrow::io::ReadableFile::Open(path));

    parquet::arrow::FileReaderBuilder builder;
    ARROW_RETURN_NOT_OK(builder.Open(infile));
    std::unique_ptr<parquet::arrow::FileReader> reader;
    ARROW_RETURN_NOT_OK(builder.Build(&reader));

    std::shared_ptr<arrow::Table> table;
    ARROW_RETURN_NOT_OK(reader->ReadTable(&table));
    ARROW_ASSIGN_OR_RAISE(table, table->CombineChunks(arrow::default_memory_pool()));

    const auto& schema = *table->schema();
    out.header.clear();
    out.index.clear();
    for (int c = 0; c < schema.num_fields(); ++c) {
        out.header.push_back(schema.field(c)->name());
        out.index[schema.field(c)->name()] = static_cast<size_t>(c);
    }

    out.rows.assign(static_cast<size_t>(table->num_rows()),
                    std::vector<std::string>(out.header.size()));
    for (int c = 0; c < table->num_columns(); ++c) {
        const auto& column = table->column(c);
        if (column->num_chunks() == 0) continue;
        const auto& array = *column->chunk(0);
        for (int64_t r = 0; r < array.length(); ++r) {
            out.rows[static_cast<size_t>(r)][static_cast<size_t>(c)] = cell_text(array, r);
        }
    }
    return arrow::Status::OK();
}

// ===========================================================================
// Parquet Writer
// ===========================================================================
arrow::Status write_parquet_file(const std::string& path,
                                 const std::vector<ParamScoreResult>& ranked,
                                 const std::vector<BacktestCacheRecord>& records) {
    std::set<std::string> param_keys;
    for (const auto& r : ranked) {
        for (const auto& kv : r.parameters) param_keys.insert(kv.first);
    }

    arrow::FieldVector fields;
    fields.push_back(arrow::field("rank", arrow::int64()));
    fields.push_back(arrow::field("id", arrow::utf8()));
    fields.push_back(arrow::field("template_id", arrow::utf8()));

    const std::vector<std::pair<std::string, double ParamScoreResult::*>> double_cols = {
        {"final_score", &ParamScoreResult::final_score},
        {"core_score", &ParamScoreResult::core_score},
        {"dd_penalty", &ParamScoreResult::dd_penalty},
        {"stability_score", &ParamScoreResult::stability_score},
        {"sharpe_ratio", &ParamScoreResult::sharpe_ratio},
        {"calmar_ratio", &ParamScoreResult::calmar_ratio},
        {"total_return", &ParamScoreResult::total_return},
        {"cagr", &ParamScoreResult::cagr},
        {"max_drawdown", &ParamScoreResult::max_drawdown},
        {"max_drawdown_ratio", &ParamScoreResult::max_drawdown_ratio},
    };
    for (const auto& col : double_cols) {
        fields.push_back(arrow::field(col.first, arrow::float64()));
    }
    fields.push_back(arrow::field("win_rate", arrow::float64()));
    fields.push_back(arrow::field("total_trades", arrow::int64()));
    // Parameter values of mixed type are stored as their text form.
    for (const auto& key : param_keys) {
        fields.push_back(arrow::field(score_csv::PARAM_PREFIX + key, arrow::utf8()));
    }

    auto schema = arrow::schema(fields);
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;

    // rank (INT64)
    {
        arrow::Int64Builder b;
        for (size_t i = 0; i < ranked.size(); ++i) {
            ARROW_RETURN_NOT_OK(b.Append(static_cast<int64_t>(i + 1)));
        }
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }
    // id (STRING, nullable)
    {
        arrow::StringBuilder b;
        for (const auto& r : ranked) {
            const auto& id = records.at(r.record_index).id;
            if (id) ARROW_RETURN_NOT_OK(b.Append(*id));
            else ARROW_RETURN_NOT_OK(b.AppendNull());
        }
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }
    // template_id (STRING)
    {
        arrow::StringBuilder b;
        for (const auto& r : ranked) {
            ARROW_RETURN_NOT_OK(b.Append(records.at(r.record_index).template_id));
        }
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }
    for (const auto& col : double_cols) {
        arrow::DoubleBuilder b;
        for (const auto& r : ranked) ARROW_RETURN_NOT_OK(b.Append(r.*(col.second)));
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }
    // win_rate (DOUBLE, nullable)
    {
        arrow::DoubleBuilder b;
        for (const auto& r : ranked) {
            if (r.win_rate) ARROW_RETURN_NOT_OK(b.Append(*r.win_rate));
            else ARROW_RETURN_NOT_OK(b.AppendNull());
        }
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }
    // total_trades (INT64)
    {
        arrow::Int64Builder b;
        for (const auto& r : ranked) ARROW_RETURN_NOT_OK(b.Append(r.total_trades));
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }
    for (const auto& key : param_keys) {
        arrow::StringBuilder b;
        for (const auto& r : ranked) {
            auto it = r.parameters.find(key);
            if (it == r.parameters.end()) {
                ARROW_RETURN_NOT_OK(b.AppendNull());
                continue;
            }
            const ParamValue& v = it->second;
            if (const double* d = std::get_if<double>(&v)) {
                ARROW_RETURN_NOT_OK(b.Append(format_double(*d)));
            } else if (const bool* flag = std::get_if<bool>(&v)) {
                ARROW_RETURN_NOT_OK(b.Append(*flag ? "true" : "false"));
            } else {
                ARROW_RETURN_NOT_OK(b.Append(std::get<std::string>(v)));
            }
        }
        ARROW_RETURN_NOT_OK(b.Finish(&arr));
        arrays.push_back(arr);
    }

    auto table = arrow::Table::Make(schema, arrays);

    // Write to Parquet with ZSTD compression
    ARROW_ASSIGN_OR_RAISE(auto outfile, arrow::io::FileOutputStream::Open(path));
    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();
    int64_t chunk_size = std::max<int64_t>(1, static_cast<int64_t>(ranked.size()));
    ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile, chunk_size, props));
    return outfile->Close();
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <path> --output <path> [options]\n"
              << "\n"
              << "  --input               Backtest-cache rows (.csv or .parquet)\n"
              << "  --output              Ranked parameter sets (.csv or .parquet)\n"
              << "  --report              Write rankings and per-record availability as JSON\n"
              << "  --settings            KEY=VALUE settings file (PARAM_SCORE_* keys)\n"
              << "  --min-trades          Minimum trade count for eligibility\n"
              << "  --neighbor-threshold  Parameter-space neighbor radius\n"
              << "  --stability-gamma     Stability exponent\n"
              << "  --top                 Keep only the N best rows in --output\n";
}

double parse_flag_number(const std::string& flag, const std::string& value) {
    auto v = score_csv::parse_number(value);
    if (!v) throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "'");
    return *v;
}

}  // namespace

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_path;
    std::string output_path;
    std::string report_path;
    std::string settings_path;
    std::string top_str;
    ParamScoreOverrides overrides;

    try {
        // Parse CLI args
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--report" && i + 1 < argc) {
                report_path = argv[++i];
            } else if (arg == "--settings" && i + 1 < argc) {
                settings_path = argv[++i];
            } else if (arg == "--min-trades" && i + 1 < argc) {
                overrides.min_trades = parse_flag_number(arg, argv[++i]);
            } else if (arg == "--neighbor-threshold" && i + 1 < argc) {
                overrides.neighbor_threshold = parse_flag_number(arg, argv[++i]);
            } else if (arg == "--stability-gamma" && i + 1 < argc) {
                overrides.stability_gamma = parse_flag_number(arg, argv[++i]);
            } else if (arg == "--top" && i + 1 < argc) {
                top_str = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        // Validate required args
        if (input_path.empty()) {
            std::cerr << "Missing required argument: --input\n";
            print_usage(argv[0]);
            return 1;
        }
        if (output_path.empty()) {
            std::cerr << "Missing required argument: --output\n";
            print_usage(argv[0]);
            return 1;
        }

        size_t top = 0;
        if (!top_str.empty()) {
            double n = parse_flag_number("--top", top_str);
            if (n < 1.0) throw std::invalid_argument("--top must be at least 1");
            top = score_csv::to_integer<size_t>(n, "--top", top_str);
        }

        FileFormat in_format = format_of(input_path);
        FileFormat out_format = format_of(output_path);

        std::vector<BacktestCacheRecord> records;
        if (in_format == FileFormat::PARQUET) {
            score_csv::Table table;
            auto status = read_parquet_table(input_path, table);
            if (!status.ok()) {
                std::cerr << "Failed to read Parquet: " << status.ToString() << "\n";
                return 1;
            }
            records = score_csv::records_from_table(std::move(table));
        } else {
            records = score_csv::read_backtest_cache_file(input_path);
        }

        std::unique_ptr<KeyValueFileSettingsLookup> lookup;
        if (!settings_path.empty()) {
            lookup = std::make_unique<KeyValueFileSettingsLookup>(settings_path);
        }

        ParamScoreOptions options;
        options.settings_lookup = lookup.get();
        options.overrides = overrides;
        auto summary = score_backtest_parameters(records, options);

        std::cout << "Records: " << records.size()
                  << "  eligible: " << summary.scored.size() << "\n";

        if (!report_path.empty()) {
            std::ofstream report(report_path);
            if (!report.is_open()) {
                std::cerr << "Cannot open report file: " << report_path << "\n";
                return 1;
            }
            report << score_io::to_json(summary, records) << "\n";
        }

        ParamScoreSummary output = summary;
        if (top > 0 && output.scored.size() > top) output.scored.resize(top);

        if (out_format == FileFormat::PARQUET) {
            auto status = write_parquet_file(output_path, output.scored, records);
            if (!status.ok()) {
                std::cerr << "Failed to write Parquet: " << status.ToString() << "\n";
                return 1;
            }
        } else {
            std::ofstream csv(output_path);
            if (!csv.is_open()) {
                std::cerr << "Cannot open output file: " << output_path << "\n";
                return 1;
            }
            score_csv::write_ranked(csv, output, records);
        }

        std::cout << "Wrote " << output.scored.size() << " rows to " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
