#include "params_io.hpp"

#include <format>
#include <fstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace decoding
{
constexpr std::string_view kSearchRadius = "search_radius";
constexpr std::string_view kSearchRadiusMax = "search_radius_max";
constexpr std::string_view kQualityWeight = "quality_weight";
constexpr std::string_view kMergeRadius = "merge_radius";
constexpr std::string_view kDetector = "detector";
}  // namespace decoding

namespace detector
{
constexpr std::string_view kMethod = "method";
constexpr std::string_view kThresholdAbs = "threshold_abs";
constexpr std::string_view kMinDistance = "min_distance";
constexpr std::string_view kH = "h";
constexpr std::string_view kConnectivity = "connectivity";
constexpr std::string_view kMinSigma = "min_sigma";
constexpr std::string_view kMaxSigma = "max_sigma";
constexpr std::string_view kNumSigma = "num_sigma";
constexpr std::string_view kSigmaRatio = "sigma_ratio";
constexpr std::string_view kThreshold = "threshold";
constexpr std::string_view kOverlap = "overlap";
}  // namespace detector

namespace
{
template <typename T>
void read_if_present(const nlohmann::json& json, const std::string_view key, T& value)
{
    if (json.contains(key.data()))
    {
        value = json.at(std::string(key)).get<T>();
    }
}

std::optional<float> read_optional(const nlohmann::json& json, const std::string_view key)
{
    if (!json.contains(key.data()) || json.at(std::string(key)).is_null())
    {
        return std::nullopt;
    }
    return json.at(std::string(key)).get<float>();
}

spots::LocalMaxParameters read_local_max(const nlohmann::json& json)
{
    spots::LocalMaxParameters params;
    read_if_present(json, detector::kThresholdAbs, params.threshold_abs_);
    read_if_present(json, detector::kMinDistance, params.min_distance_);
    return params;
}

spots::HMaximaParameters read_h_maxima(const nlohmann::json& json)
{
    spots::HMaximaParameters params;
    read_if_present(json, detector::kH, params.h_);
    read_if_present(json, detector::kConnectivity, params.connectivity_);
    return params;
}

spots::BlobLogParameters read_blob_log(const nlohmann::json& json)
{
    spots::BlobLogParameters params;
    read_if_present(json, detector::kMinSigma, params.min_sigma_);
    read_if_present(json, detector::kMaxSigma, params.max_sigma_);
    read_if_present(json, detector::kNumSigma, params.num_sigma_);
    read_if_present(json, detector::kThreshold, params.threshold_);
    read_if_present(json, detector::kOverlap, params.overlap_);
    return params;
}

spots::BlobDogParameters read_blob_dog(const nlohmann::json& json)
{
    spots::BlobDogParameters params;
    read_if_present(json, detector::kMinSigma, params.min_sigma_);
    read_if_present(json, detector::kMaxSigma, params.max_sigma_);
    read_if_present(json, detector::kSigmaRatio, params.sigma_ratio_);
    read_if_present(json, detector::kThreshold, params.threshold_);
    read_if_present(json, detector::kOverlap, params.overlap_);
    return params;
}
}  // namespace

namespace io
{
spots::DetectorParameters parse_detector(const nlohmann::json& json)
{
    const std::string method = json.at(std::string(detector::kMethod)).get<std::string>();

    spots::DetectorParameters params;
    if (method == spots::kLocalMax)
    {
        params = read_local_max(json);
    }
    else if (method == spots::kHMaxima)
    {
        params = read_h_maxima(json);
    }
    else if (method == spots::kBlobLog)
    {
        params = read_blob_log(json);
    }
    else if (method == spots::kBlobDog)
    {
        params = read_blob_dog(json);
    }
    else
    {
        throw std::invalid_argument(std::format("Unknown detector method: {}.", method));
    }

    spots::validate(params);
    return params;
}

DecodingParamsFile parse_params(const nlohmann::json& json)
{
    DecodingParamsFile params;
    params.search_radius_ = read_optional(json, decoding::kSearchRadius);
    params.search_radius_max_ = read_optional(json, decoding::kSearchRadiusMax);
    params.quality_weight_ = read_optional(json, decoding::kQualityWeight);
    params.merge_radius_ = read_optional(json, decoding::kMergeRadius);
    if (json.contains(decoding::kDetector.data()))
    {
        params.detector_ = parse_detector(json.at(std::string(decoding::kDetector)));
    }
    return params;
}

DecodingParamsFile read_params(const std::filesystem::path& filepath)
{
    if (!std::filesystem::exists(filepath))
    {
        throw std::invalid_argument(std::format("Error loading '{}'. File does not exist.", filepath.string()));
    }

    std::ifstream file(filepath);
    nlohmann::json json;
    try
    {
        file >> json;
        auto params = parse_params(json);
        spdlog::info("Loaded parameters from {}, detector: {}", filepath.string(), spots::method_name(params.detector_));
        return params;
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::invalid_argument(std::format("Error loading '{}'. {}", filepath.string(), e.what()));
    }
}
}  // namespace io
