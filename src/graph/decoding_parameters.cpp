#include "decoding_parameters.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace graph
{
DecodingParameters::DecodingParameters(const float search_radius, const std::optional<float> search_radius_max,
                                       const float quality_weight, const float merge_radius)
    : search_radius_(search_radius),
      search_radius_max_(search_radius_max.value_or(search_radius)),
      quality_weight_(quality_weight),
      merge_radius_(merge_radius)
{
    if (!std::isfinite(search_radius_) || search_radius_ <= 0.0f)
    {
        throw std::invalid_argument(std::format("search_radius must be positive, got {}.", search_radius_));
    }
    if (!std::isfinite(search_radius_max_) || search_radius_max_ < search_radius_)
    {
        throw std::invalid_argument(std::format("search_radius_max ({}) must not be smaller than search_radius ({}).",
                                                search_radius_max_, search_radius_));
    }
    if (!std::isfinite(quality_weight_) || quality_weight_ < 0.0f)
    {
        throw std::invalid_argument(std::format("quality_weight must be non-negative, got {}.", quality_weight_));
    }
    if (!std::isfinite(merge_radius_) || merge_radius_ < 0.0f)
    {
        throw std::invalid_argument(std::format("merge_radius must be non-negative, got {}.", merge_radius_));
    }
}
}  // namespace graph
