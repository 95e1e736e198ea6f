#include "json_writer.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace plancalc {
namespace io {

namespace {

struct Layout {
    std::string indent;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty)
        : indent(pretty ? "  " : ""),
          newline(pretty ? "\n" : ""),
          space(pretty ? " " : "") {}

    std::string pad(int depth) const {
        std::string out;
        for (int i = 0; i < depth; ++i) {
            out += indent;
        }
        return out;
    }
};

std::string quote(const std::string& s) {
    std::ostringstream oss;
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c;
        }
    }
    oss << '"';
    return oss.str();
}

void write_breakdown(std::ostream& os, const ResultBreakdown& b, const Layout& l, int depth) {
    std::string p = l.pad(depth);
    os << "{" << l.newline;
    os << p << "\"terminal_value\":" << l.space << b.terminal_value << "," << l.newline;
    os << p << "\"total_contributions\":" << l.space << b.total_contributions << "," << l.newline;
    os << p << "\"total_fees\":" << l.space << b.total_fees << "," << l.newline;
    os << p << "\"total_withdrawal_fees\":" << l.space << b.total_withdrawal_fees << "," << l.newline;
    os << p << "\"surrender_charges\":" << l.space << b.surrender_charges << "," << l.newline;
    os << p << "\"transfer_fees\":" << l.space << b.transfer_fees << "," << l.newline;
    os << p << "\"total_tax_savings\":" << l.space << b.total_tax_savings << "," << l.newline;
    os << p << "\"total_one_time_tax\":" << l.space << b.total_one_time_tax << "," << l.newline;
    os << p << "\"capital_gains_tax\":" << l.space << b.capital_gains_tax << "," << l.newline;
    os << p << "\"total_withdrawn\":" << l.space << b.total_withdrawn << "," << l.newline;
    os << p << "\"withdrawal_events\":" << l.space << b.withdrawal_events << "," << l.newline;
    os << p << "\"months_in_plan\":" << l.space << b.months_in_plan << "," << l.newline;
    os << p << "\"horizon_months\":" << l.space << b.horizon_months << "," << l.newline;
    os << p << "\"return_on_contributions\":" << l.space << b.return_on_contributions << "," << l.newline;
    os << p << "\"irr\":" << l.space;
    if (b.irr) {
        os << *b.irr;
    } else {
        os << "null";
    }
    os << l.newline << l.pad(depth - 1) << "}";
}

void write_snapshots(std::ostream& os, const std::vector<YearlySnapshot>& snapshots,
                     const Layout& l, int depth) {
    os << "[";
    for (size_t i = 0; i < snapshots.size(); ++i) {
        const YearlySnapshot& s = snapshots[i];
        os << (i > 0 ? "," : "") << l.newline << l.pad(depth)
           << "{\"year\":" << l.space << s.year
           << "," << l.space << "\"balance\":" << l.space << s.balance
           << "," << l.space << "\"contributions\":" << l.space << s.contributions
           << "," << l.space << "\"fees\":" << l.space << s.fees
           << "," << l.space << "\"tax_savings\":" << l.space << s.tax_savings
           << "," << l.space << "\"reinvestment_balance\":" << l.space << s.reinvestment_balance
           << "}";
    }
    if (!snapshots.empty()) {
        os << l.newline << l.pad(depth - 1);
    }
    os << "]";
}

void write_entry(std::ostream& os, const RankedStrategy& entry, const Layout& l, int depth) {
    const StrategyResult& r = entry.result;
    std::string p = l.pad(depth);

    os << l.pad(depth - 1) << "{" << l.newline;
    os << p << "\"rank\":" << l.space << entry.rank << "," << l.newline;
    os << p << "\"strategy_type\":" << l.space << quote(type_to_string(r.type())) << "," << l.newline;
    os << p << "\"strategy_label\":" << l.space << quote(r.label) << "," << l.newline;
    os << p << "\"net_benefit\":" << l.space << r.net_benefit << "," << l.newline;

    os << p << "\"parameters\":" << l.space << "{";
    auto params = strategy_parameters(r.descriptor);
    for (size_t i = 0; i < params.size(); ++i) {
        os << (i > 0 ? "," + l.space : "") << quote(params[i].first) << ":" << l.space << params[i].second;
    }
    os << "}," << l.newline;

    os << p << "\"breakdown\":" << l.space;
    write_breakdown(os, r.breakdown, l, depth + 1);

    if (!r.snapshots.empty()) {
        os << "," << l.newline << p << "\"yearly\":" << l.space;
        write_snapshots(os, r.snapshots, l, depth + 1);
    }

    os << l.newline << l.pad(depth - 1) << "}";
}

void write_entries(std::ostream& os, const RankingTable& table, size_t top,
                   const Layout& l, int depth) {
    size_t count = (top == 0) ? table.size() : std::min(top, table.size());

    os << "[";
    for (size_t i = 0; i < count; ++i) {
        os << (i > 0 ? "," : "") << l.newline;
        write_entry(os, table.entries()[i], l, depth + 1);
    }
    if (count > 0) {
        os << l.newline << l.pad(depth - 1);
    }
    os << "]";
}

} // anonymous namespace

void write_ranking_json(std::ostream& os, const RankingTable& table,
                        size_t top, bool pretty_print) {
    Layout l(pretty_print);
    os << std::fixed << std::setprecision(6);
    write_entries(os, table, top, l, 1);
    os << l.newline;
}

void write_comparison_result_json(std::ostream& os, const ComparisonResult& result,
                                  size_t top, bool pretty_print) {
    Layout l(pretty_print);

    os << std::fixed << std::setprecision(6);
    os << "{" << l.newline;

    // Run metrics
    os << l.indent << "\"strategies_evaluated\":" << l.space << result.strategies_evaluated << "," << l.newline;
    os << l.indent << "\"strategies_skipped\":" << l.space << result.strategies_skipped << "," << l.newline;
    os << l.indent << "\"strategies_failed\":" << l.space << result.strategies_failed << "," << l.newline;
    os << l.indent << "\"cancelled\":" << l.space << (result.cancelled ? "true" : "false") << "," << l.newline;
    os << l.indent << "\"execution_time_ms\":" << l.space << std::setprecision(2)
       << result.execution_time_ms << "," << l.newline;
    os << std::setprecision(6);

    // Ranking
    os << l.indent << "\"ranking\":" << l.space;
    write_entries(os, result.table, top, l, 2);
    os << l.newline;

    os << "}" << l.newline;
}

void write_comparison_result_json(const std::string& filepath, const ComparisonResult& result,
                                  size_t top, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_comparison_result_json(file, result, top, pretty_print);
}

} // namespace io
} // namespace plancalc
