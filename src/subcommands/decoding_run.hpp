#pragma once

#include <filesystem>

#include <cmd_launcher/subcommand.hpp>

#include "graph/decoding.hpp"
#include "io/params_io.hpp"

namespace run
{
/**
 * @brief Parameters json (if given) merged with the command line values, command line wins.
 */
io::DecodingParamsFile load_params(const utils::DecodingOptions& options);

/**
 * @throws std::invalid_argument if no search radius is given or the values are out of range
 */
graph::DecodingParameters decoding_parameters(const utils::DecodingOptions& options,
                                              const io::DecodingParamsFile& params);

void set_threads(const int threads);

/**
 * @brief Write decoded.json to `output_dir` and the enabled debug outputs.
 */
void save_result(const graph::DecodingResult& result, const int round_count, const int channel_count,
                 const std::filesystem::path& output_dir);
}  // namespace run
