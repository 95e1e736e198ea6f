#ifndef PLANCALC_PARQUET_WRITER_HPP
#define PLANCALC_PARQUET_WRITER_HPP

#include "../ranker.hpp"
#include <string>

namespace plancalc {

class ParquetWriter {
public:
    /**
     * Write a ranking table to a Parquet file.
     *
     * Output schema:
     *   - rank: uint32
     *   - strategy_type: utf8
     *   - strategy_label: utf8
     *   - net_benefit: float64
     *   - year: int32 (full withdrawal / switch year, 0 otherwise)
     *   - interval_years: int32 (partial withdrawal, 0 otherwise)
     *   - ratio: float64 (partial withdrawal, 0 otherwise)
     *   - fee_rate: float64 (switch, 0 otherwise)
     *   - terminal_value, total_contributions, total_tax_savings,
     *     total_one_time_tax: float64
     *   - irr: float64, null when Newton does not converge
     *
     * @param table Ranked results
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the table is empty, the file cannot be
     *         written, or Arrow support is not compiled in
     */
    static void write_ranking(const RankingTable& table, const std::string& filepath);
};

} // namespace plancalc

#endif // PLANCALC_PARQUET_WRITER_HPP
