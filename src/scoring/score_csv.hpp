#pragma once

#include "scoring/backtest_cache_record.hpp"
#include "scoring/param_scorer.hpp"
#include "scoring/template_scorer.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// CSV exchange format for exported backtest-cache rows, template snapshots
// and verification metrics. Blank cells are absent values. Backtest-cache
// columns named "param_<name>" form the parameter set.
// ---------------------------------------------------------------------------
namespace score_csv {

const std::string PARAM_PREFIX = "param_";

// Split one line; double quotes protect commas, "" is a literal quote.
inline std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> cols;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cur += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cur += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cols.push_back(cur);
            cur.clear();
        } else if (c != '\r' && c != '\n') {
            cur += c;
        }
    }
    cols.push_back(cur);
    return cols;
}

inline std::string quote(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    return out + "\"";
}

inline std::optional<double> parse_number(const std::string& cell) {
    if (cell.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(cell.c_str(), &end);
    if (end != cell.c_str() + cell.size()) return std::nullopt;
    return v;
}

// Numbers first, then true/false, otherwise the raw text.
inline std::optional<ParamValue> parse_param_value(const std::string& cell) {
    if (cell.empty()) return std::nullopt;
    if (auto v = parse_number(cell)) return ParamValue{*v};
    if (cell == "true") return ParamValue{true};
    if (cell == "false") return ParamValue{false};
    return ParamValue{cell};
}

inline std::string format_param_value(const ParamValue& value) {
    if (const double* d = std::get_if<double>(&value)) {
        std::ostringstream ss;
        ss << std::setprecision(17) << *d;
        return ss.str();
    }
    if (const bool* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    return quote(std::get<std::string>(value));
}

// Truncate toward zero. Throws if the value is not finite or the result does
// not fit in Int; `text` is the original input for the message.
template <typename Int>
Int to_integer(double value, const std::string& what, const std::string& text) {
    // 2^digits, the first value past the top of Int's range.
    constexpr double upper = 2.0 * static_cast<double>(std::numeric_limits<Int>::max() / 2 + 1);
    constexpr double lower = static_cast<double>(std::numeric_limits<Int>::min());
    double t = std::trunc(value);
    if (!std::isfinite(t) || t < lower || t >= upper) {
        throw std::invalid_argument(what + " is out of range: '" + text + "'");
    }
    return static_cast<Int>(t);
}

// Header-indexed view of one data row.
class Row {
public:
    Row(const std::map<std::string, size_t>& index, std::vector<std::string> cells)
        : index_(index), cells_(std::move(cells)) {}

    std::string text(const std::string& col) const {
        auto it = index_.find(col);
        if (it == index_.end() || it->second >= cells_.size()) return "";
        return cells_[it->second];
    }

    std::optional<std::string> optional_text(const std::string& col) const {
        auto t = text(col);
        if (t.empty()) return std::nullopt;
        return t;
    }

    // Throws if a non-blank cell is not a number.
    std::optional<double> number(const std::string& col) const {
        auto t = text(col);
        if (t.empty()) return std::nullopt;
        auto v = parse_number(t);
        if (!v) {
            throw std::invalid_argument("Column '" + col + "' is not numeric: '" + t + "'");
        }
        return v;
    }

    template <typename Int>
    std::optional<Int> integer(const std::string& col) const {
        auto v = number(col);
        if (!v) return std::nullopt;
        return to_integer<Int>(*v, "Column '" + col + "'", text(col));
    }

private:
    const std::map<std::string, size_t>& index_;
    std::vector<std::string> cells_;
};

struct Table {
    std::vector<std::string> header;
    std::map<std::string, size_t> index;
    std::vector<std::vector<std::string>> rows;

    void require(const std::vector<std::string>& columns, const std::string& what) const {
        for (const auto& c : columns) {
            if (!index.count(c)) {
                throw std::runtime_error(what + ": missing required column '" + c + "'");
            }
        }
    }
};

inline Table read_table(std::istream& in) {
    Table t;
    std::string line;
    if (!std::getline(in, line)) return t;
    t.header = split_line(line);
    for (size_t i = 0; i < t.header.size(); ++i) t.index[t.header[i]] = i;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        t.rows.push_back(split_line(line));
    }
    return t;
}

inline Table read_table_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return read_table(in);
}

// ---------------------------------------------------------------------------
// Backtest-cache rows
// ---------------------------------------------------------------------------
// Map a header-indexed table onto cache records. Shared with columnar
// readers that first flatten their input into text cells.
inline std::vector<BacktestCacheRecord> records_from_table(Table table) {
    table.require({"template_id"}, "backtest cache");

    std::vector<BacktestCacheRecord> records;
    records.reserve(table.rows.size());
    for (auto& cells : table.rows) {
        Row row(table.index, std::move(cells));
        BacktestCacheRecord r;
        r.id = row.optional_text("id");
        r.template_id = row.text("template_id");
        r.sharpe_ratio = row.number("sharpe_ratio");
        r.calmar_ratio = row.number("calmar_ratio");
        r.total_return = row.number("total_return");
        r.cagr = row.number("cagr");
        r.max_drawdown = row.number("max_drawdown");
        r.max_drawdown_ratio = row.number("max_drawdown_ratio");
        r.win_rate = row.number("win_rate");
        r.total_trades = row.number("total_trades");
        r.verify_sharpe_ratio = row.number("verify_sharpe_ratio");
        r.verify_calmar_ratio = row.number("verify_calmar_ratio");
        r.verify_total_return = row.number("verify_total_return");
        r.verify_cagr = row.number("verify_cagr");
        r.verify_max_drawdown_ratio = row.number("verify_max_drawdown_ratio");
        r.top_abs_gain_ticker = row.optional_text("top_abs_gain_ticker");
        r.top_rel_gain_ticker = row.optional_text("top_rel_gain_ticker");

        for (const auto& col : table.header) {
            if (col.rfind(PARAM_PREFIX, 0) != 0 || col.size() == PARAM_PREFIX.size()) continue;
            if (auto v = parse_param_value(row.text(col))) {
                r.parameters.emplace(col.substr(PARAM_PREFIX.size()), *v);
            }
        }
        records.push_back(std::move(r));
    }
    return records;
}

inline std::vector<BacktestCacheRecord> read_backtest_cache(std::istream& in) {
    return records_from_table(read_table(in));
}

inline std::vector<BacktestCacheRecord> read_backtest_cache_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return read_backtest_cache(in);
}

// Ranked output: one row per scored parameter set, parameters spread over
// param_<name> columns (union of all keys, name order).
inline void write_ranked(std::ostream& out, const ParamScoreSummary& summary,
                         const std::vector<BacktestCacheRecord>& records) {
    std::set<std::string> keys;
    for (const auto& r : summary.scored) {
        for (const auto& kv : r.parameters) keys.insert(kv.first);
    }

    out << "rank,id,template_id,final_score,core_score,dd_penalty,stability_score,"
           "sharpe_ratio,calmar_ratio,total_return,cagr,max_drawdown,max_drawdown_ratio,"
           "win_rate,total_trades";
    for (const auto& k : keys) out << "," << quote(PARAM_PREFIX + k);
    out << "\n";

    out << std::setprecision(17);
    for (size_t i = 0; i < summary.scored.size(); ++i) {
        const auto& r = summary.scored[i];
        const auto& src = records.at(r.record_index);
        out << (i + 1) << "," << quote(src.id.value_or("")) << "," << quote(src.template_id);
        out << "," << r.final_score << "," << r.core_score << "," << r.dd_penalty
            << "," << r.stability_score;
        out << "," << r.sharpe_ratio << "," << r.calmar_ratio << "," << r.total_return
            << "," << r.cagr << "," << r.max_drawdown << "," << r.max_drawdown_ratio;
        out << ",";
        if (r.win_rate) out << *r.win_rate;
        out << "," << r.total_trades;
        for (const auto& k : keys) {
            out << ",";
            auto it = r.parameters.find(k);
            if (it != r.parameters.end()) out << format_param_value(it->second);
        }
        out << "\n";
    }
}

// ---------------------------------------------------------------------------
// Template snapshots and verification metrics
// ---------------------------------------------------------------------------
inline std::vector<TemplateScoreSnapshot> read_snapshots(std::istream& in) {
    auto table = read_table(in);
    table.require({"template_id", "strategy_id", "period_months", "scope"}, "snapshots");

    std::vector<TemplateScoreSnapshot> snapshots;
    snapshots.reserve(table.rows.size());
    for (auto& cells : table.rows) {
        Row row(table.index, std::move(cells));
        TemplateScoreSnapshot s;
        s.template_id = row.text("template_id");
        s.strategy_id = row.text("strategy_id");
        s.period_months = row.integer<int>("period_months").value_or(0);
        s.period_days = row.integer<int>("period_days");
        s.scope = parse_backtest_scope(row.text("scope"));
        s.created_at_ms = row.integer<int64_t>("created_at_ms");

        StrategyPerformance perf;
        perf.cagr = row.number("cagr");
        perf.max_drawdown_percent = row.number("max_drawdown_percent");
        perf.total_trades = row.number("total_trades");
        perf.sharpe_ratio = row.number("sharpe_ratio");
        perf.calmar_ratio = row.number("calmar_ratio");
        // A row with no performance cells is a snapshot whose backtest has
        // not produced results.
        if (perf.cagr || perf.max_drawdown_percent || perf.total_trades ||
            perf.sharpe_ratio || perf.calmar_ratio) {
            s.performance = perf;
        }
        snapshots.push_back(std::move(s));
    }
    return snapshots;
}

inline std::map<std::string, TemplateVerificationMetrics> read_verification(std::istream& in) {
    auto table = read_table(in);
    table.require({"template_id"}, "verification");

    std::map<std::string, TemplateVerificationMetrics> out;
    for (auto& cells : table.rows) {
        Row row(table.index, std::move(cells));
        TemplateVerificationMetrics m;
        m.verify_sharpe_ratio = row.number("verify_sharpe_ratio");
        m.verify_calmar_ratio = row.number("verify_calmar_ratio");
        m.verify_cagr = row.number("verify_cagr");
        m.verify_max_drawdown_ratio = row.number("verify_max_drawdown_ratio");
        out[row.text("template_id")] = m;
    }
    return out;
}

}  // namespace score_csv
