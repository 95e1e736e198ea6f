#ifndef PLANCALC_IO_JSON_WRITER_HPP
#define PLANCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../comparison.hpp"
#include "../ranker.hpp"

namespace plancalc {
namespace io {

// Write a RankingTable as a JSON array of
//   {rank, strategy_type, strategy_label, net_benefit, parameters, breakdown}
// `top` limits the number of entries (0 = all)
void write_ranking_json(std::ostream& os, const RankingTable& table,
                        size_t top = 0, bool pretty_print = true);

// Write ComparisonResult to JSON format
// The output includes run metrics and the (optionally truncated) ranking
void write_comparison_result_json(std::ostream& os, const ComparisonResult& result,
                                  size_t top = 0, bool pretty_print = true);

// Write ComparisonResult to JSON file
void write_comparison_result_json(const std::string& filepath, const ComparisonResult& result,
                                  size_t top = 0, bool pretty_print = true);

} // namespace io
} // namespace plancalc

#endif // PLANCALC_IO_JSON_WRITER_HPP
