#include "detector_parameters.hpp"

#include <cmath>
#include <format>
#include <stdexcept>
#include <type_traits>

namespace spots
{
std::string_view method_name(const DetectorParameters &parameters)
{
    return std::visit(
        [](const auto &method) -> std::string_view
        {
            using Method = std::decay_t<decltype(method)>;
            if constexpr (std::is_same_v<Method, LocalMaxParameters>)
            {
                return kLocalMax;
            }
            else if constexpr (std::is_same_v<Method, HMaximaParameters>)
            {
                return kHMaxima;
            }
            else if constexpr (std::is_same_v<Method, BlobLogParameters>)
            {
                return kBlobLog;
            }
            else
            {
                return kBlobDog;
            }
        },
        parameters);
}

void validate(const DetectorParameters &parameters)
{
    if (const auto *local_max = std::get_if<LocalMaxParameters>(&parameters))
    {
        if (local_max->min_distance_ < 1)
        {
            throw std::invalid_argument(
                std::format("{}: min_distance must be at least 1, got {}.", kLocalMax, local_max->min_distance_));
        }
        return;
    }

    if (const auto *h_maxima = std::get_if<HMaximaParameters>(&parameters))
    {
        if (!(h_maxima->h_ > 0.0f) || !std::isfinite(h_maxima->h_))
        {
            throw std::invalid_argument(std::format("{}: h must be positive, got {}.", kHMaxima, h_maxima->h_));
        }
        if (h_maxima->connectivity_ != 4 && h_maxima->connectivity_ != 8)
        {
            throw std::invalid_argument(
                std::format("{}: connectivity must be 4 or 8, got {}.", kHMaxima, h_maxima->connectivity_));
        }
        return;
    }

    const auto check_sigmas = [](const std::string_view name, const float min_sigma, const float max_sigma,
                                 const float overlap)
    {
        if (!(min_sigma > 0.0f) || max_sigma < min_sigma)
        {
            throw std::invalid_argument(
                std::format("{}: need 0 < min_sigma <= max_sigma, got {} and {}.", name, min_sigma, max_sigma));
        }
        if (overlap < 0.0f || overlap > 1.0f)
        {
            throw std::invalid_argument(std::format("{}: overlap must be in [0, 1], got {}.", name, overlap));
        }
    };

    if (const auto *blob_log = std::get_if<BlobLogParameters>(&parameters))
    {
        check_sigmas(kBlobLog, blob_log->min_sigma_, blob_log->max_sigma_, blob_log->overlap_);
        if (blob_log->num_sigma_ < 1)
        {
            throw std::invalid_argument(
                std::format("{}: num_sigma must be at least 1, got {}.", kBlobLog, blob_log->num_sigma_));
        }
        return;
    }

    const auto &blob_dog = std::get<BlobDogParameters>(parameters);
    check_sigmas(kBlobDog, blob_dog.min_sigma_, blob_dog.max_sigma_, blob_dog.overlap_);
    if (!(blob_dog.sigma_ratio_ > 1.0f))
    {
        throw std::invalid_argument(
            std::format("{}: sigma_ratio must be larger than 1, got {}.", kBlobDog, blob_dog.sigma_ratio_));
    }
}
}  // namespace spots
