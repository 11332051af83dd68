#ifndef RETIRECALC_IO_PARAMS_READER_HPP
#define RETIRECALC_IO_PARAMS_READER_HPP

#include <istream>
#include <string>
#include <nlohmann/json.hpp>
#include "../params.hpp"

namespace retirecalc {
namespace io {

// Build SimulationParameters from a JSON household profile.
// Missing fields keep their defaults; unknown enum names throw
// InvalidParameterError, wrong JSON types throw ConfigParseError.
// The result is not validated; run_simulation validates it.
SimulationParameters parameters_from_json(const nlohmann::json& j);

SimulationParameters parse_parameters_json(std::istream& is);

// Throws std::runtime_error if the file cannot be opened
SimulationParameters load_parameters_json(const std::string& filepath);

} // namespace io
} // namespace retirecalc

#endif // RETIRECALC_IO_PARAMS_READER_HPP
