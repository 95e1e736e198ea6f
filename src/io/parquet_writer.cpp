#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace plancalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_ranking(const RankingTable& table, const std::string& filepath) {
    if (table.empty()) {
        throw std::runtime_error("Ranking table has no entries to write");
    }

    auto schema = arrow::schema({
        arrow::field("rank", arrow::uint32()),
        arrow::field("strategy_type", arrow::utf8()),
        arrow::field("strategy_label", arrow::utf8()),
        arrow::field("net_benefit", arrow::float64()),
        arrow::field("year", arrow::int32()),
        arrow::field("interval_years", arrow::int32()),
        arrow::field("ratio", arrow::float64()),
        arrow::field("fee_rate", arrow::float64()),
        arrow::field("terminal_value", arrow::float64()),
        arrow::field("total_contributions", arrow::float64()),
        arrow::field("total_tax_savings", arrow::float64()),
        arrow::field("total_one_time_tax", arrow::float64()),
        arrow::field("irr", arrow::float64(), /*nullable=*/true)
    });

    arrow::UInt32Builder rank_builder;
    arrow::StringBuilder type_builder;
    arrow::StringBuilder label_builder;
    arrow::DoubleBuilder net_builder;
    arrow::Int32Builder year_builder;
    arrow::Int32Builder interval_builder;
    arrow::DoubleBuilder ratio_builder;
    arrow::DoubleBuilder fee_builder;
    arrow::DoubleBuilder terminal_builder;
    arrow::DoubleBuilder contributions_builder;
    arrow::DoubleBuilder tax_savings_builder;
    arrow::DoubleBuilder one_time_tax_builder;
    arrow::DoubleBuilder irr_builder;

    for (const RankedStrategy& entry : table) {
        const StrategyResult& r = entry.result;

        int year = 0;
        int interval = 0;
        double ratio = 0.0;
        double fee = 0.0;
        if (const auto* full = std::get_if<FullWithdrawal>(&r.descriptor)) {
            year = full->year;
        } else if (const auto* partial = std::get_if<PartialWithdrawal>(&r.descriptor)) {
            interval = partial->interval_years;
            ratio = partial->ratio;
        } else if (const auto* sw = std::get_if<Switch>(&r.descriptor)) {
            year = sw->year;
            fee = sw->fee_rate;
        }

        check(rank_builder.Append(static_cast<uint32_t>(entry.rank)), "append rank");
        check(type_builder.Append(type_to_string(r.type())), "append strategy_type");
        check(label_builder.Append(r.label), "append strategy_label");
        check(net_builder.Append(r.net_benefit), "append net_benefit");
        check(year_builder.Append(year), "append year");
        check(interval_builder.Append(interval), "append interval_years");
        check(ratio_builder.Append(ratio), "append ratio");
        check(fee_builder.Append(fee), "append fee_rate");
        check(terminal_builder.Append(r.breakdown.terminal_value), "append terminal_value");
        check(contributions_builder.Append(r.breakdown.total_contributions), "append total_contributions");
        check(tax_savings_builder.Append(r.breakdown.total_tax_savings), "append total_tax_savings");
        check(one_time_tax_builder.Append(r.breakdown.total_one_time_tax), "append total_one_time_tax");
        if (r.breakdown.irr) {
            check(irr_builder.Append(*r.breakdown.irr), "append irr");
        } else {
            check(irr_builder.AppendNull(), "append irr");
        }
    }

    auto arrow_table = arrow::Table::Make(schema, {
        finish(rank_builder, "rank"),
        finish(type_builder, "strategy_type"),
        finish(label_builder, "strategy_label"),
        finish(net_builder, "net_benefit"),
        finish(year_builder, "year"),
        finish(interval_builder, "interval_years"),
        finish(ratio_builder, "ratio"),
        finish(fee_builder, "fee_rate"),
        finish(terminal_builder, "terminal_value"),
        finish(contributions_builder, "total_contributions"),
        finish(tax_savings_builder, "total_tax_savings"),
        finish(one_time_tax_builder, "total_one_time_tax"),
        finish(irr_builder, "irr")
    });

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_ranking(const RankingTable& /* table */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace plancalc
