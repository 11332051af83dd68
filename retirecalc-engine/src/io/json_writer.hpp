#ifndef RETIRECALC_IO_JSON_WRITER_HPP
#define RETIRECALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../simulation.hpp"

namespace retirecalc {
namespace io {

// Write SimulationResult to JSON format.
// Includes statistics, counts, guardrail and LTC sections, balance bands
// and the representative scenario's yearly cash flows.
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print = true);

// Write SimulationResult to JSON file
void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  bool pretty_print = true);

} // namespace io
} // namespace retirecalc

#endif // RETIRECALC_IO_JSON_WRITER_HPP
