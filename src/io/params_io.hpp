#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "spots/detector_parameters.hpp"

namespace io
{
/**
 * @brief Content of a parameters json. Decoding values are optional so that command line flags can fill or override
 * them, the detector defaults to local maxima.
 */
struct DecodingParamsFile
{
    std::optional<float> search_radius_;
    std::optional<float> search_radius_max_;
    std::optional<float> quality_weight_;
    std::optional<float> merge_radius_;

    spots::DetectorParameters detector_ = spots::LocalMaxParameters{};
};

DecodingParamsFile parse_params(const nlohmann::json& json);

/**
 * @throws std::invalid_argument if the file does not exist or is not a valid parameters json
 */
DecodingParamsFile read_params(const std::filesystem::path& filepath);

/**
 * @brief Parse `{"method": "local_max" | "h_maxima" | "blob_log" | "blob_dog", ...}`, missing fields keep their
 * defaults.
 * @throws std::invalid_argument on unknown method or out of range values
 */
spots::DetectorParameters parse_detector(const nlohmann::json& json);
}  // namespace io
