#include "decoding_run.hpp"

#include <format>
#include <stdexcept>

#include <omp.h>
#include <spdlog/spdlog.h>

#include "graph/debug.hpp"
#include "graph/debugging.hpp"
#include "io/spots_io.hpp"

namespace run
{
io::DecodingParamsFile load_params(const utils::DecodingOptions& options)
{
    io::DecodingParamsFile params;
    if (!options.params_path_.empty())
    {
        params = io::read_params(options.params_path_);
    }

    const auto override_with = [](std::optional<float>& value, const std::optional<float>& cli_value)
    {
        if (cli_value.has_value())
        {
            value = cli_value;
        }
    };
    override_with(params.search_radius_, options.search_radius_);
    override_with(params.search_radius_max_, options.search_radius_max_);
    override_with(params.quality_weight_, options.quality_weight_);
    override_with(params.merge_radius_, options.merge_radius_);
    return params;
}

graph::DecodingParameters decoding_parameters(const utils::DecodingOptions& options,
                                              const io::DecodingParamsFile& params)
{
    if (!params.search_radius_.has_value())
    {
        throw std::invalid_argument(std::format(
            "Search radius is not set. Use --search-radius or add \"search_radius\" to {}.",
            options.params_path_.empty() ? std::string("a --params-path json") : options.params_path_.string()));
    }

    const graph::DecodingParameters parameters(*params.search_radius_, params.search_radius_max_,
                                               params.quality_weight_.value_or(graph::kDefaultQualityWeight),
                                               params.merge_radius_.value_or(graph::kDefaultMergeRadius));
    spdlog::info("search_radius={}, search_radius_max={}, quality_weight={}, merge_radius={}",
                 parameters.search_radius_, parameters.search_radius_max_, parameters.quality_weight_,
                 parameters.merge_radius_);
    return parameters;
}

void set_threads(const int threads)
{
    if (threads > 0)
    {
        omp_set_num_threads(threads);
    }
    spdlog::debug("Running with {} OpenMP threads", omp_get_max_threads());
}

void save_result(const graph::DecodingResult& result, const int round_count, const int channel_count,
                 const std::filesystem::path& output_dir)
{
    io::save_targets(io::targets_to_json(result.targets_, round_count, channel_count), output_dir);

    if constexpr (kSaveGraphJson)
    {
        graph::debug::save_graph_json(result.graph_, result.sequences_);
    }
    if constexpr (kSaveGraphPly)
    {
        graph::debug::save_graph_ply(result.graph_, result.sequences_);
    }
}
}  // namespace run
