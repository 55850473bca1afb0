#pragma once

#include <string_view>
#include <variant>

namespace spots
{
/**
 * @brief Local maxima of the image (peak_local_max).
 */
struct LocalMaxParameters
{
    // maxima must be strictly brighter than this
    float threshold_abs_ = 0.0f;

    // half size of the maximum filter window [pixel]
    int min_distance_ = 1;
};

/**
 * @brief Regional maxima rising at least h_ above their surroundings (h_maxima).
 */
struct HMaximaParameters
{
    float h_ = 0.5f;

    // pixel connectivity in the plane, 4 or 8
    int connectivity_ = 8;
};

/**
 * @brief Laplacian of Gaussian blob detection.
 */
struct BlobLogParameters
{
    float min_sigma_ = 1.0f;
    float max_sigma_ = 2.0f;
    int num_sigma_ = 5;

    // minimal scale normalized response
    float threshold_ = 0.1f;

    // blobs overlapping by more than this fraction of the smaller one are pruned
    float overlap_ = 0.5f;
};

/**
 * @brief Difference of Gaussian blob detection, sigma grows geometrically by sigma_ratio_.
 */
struct BlobDogParameters
{
    float min_sigma_ = 1.0f;
    float max_sigma_ = 2.0f;
    float sigma_ratio_ = 1.6f;
    float threshold_ = 0.1f;
    float overlap_ = 0.5f;
};

using DetectorParameters =
    std::variant<LocalMaxParameters, HMaximaParameters, BlobLogParameters, BlobDogParameters>;

static constexpr std::string_view kLocalMax = "local_max";
static constexpr std::string_view kHMaxima = "h_maxima";
static constexpr std::string_view kBlobLog = "blob_log";
static constexpr std::string_view kBlobDog = "blob_dog";

std::string_view method_name(const DetectorParameters &parameters);

/**
 * @throws std::invalid_argument if parameters of the selected method are out of range
 */
void validate(const DetectorParameters &parameters);
}  // namespace spots
