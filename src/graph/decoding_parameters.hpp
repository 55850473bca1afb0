#pragma once

#include <optional>

namespace graph
{
static constexpr float kDefaultQualityWeight = 1.0f;
static constexpr float kDefaultMergeRadius = 1.0f;

struct DecodingParameters
{
    // maximal distance between spots of different rounds for an initial graph edge [pixel]
    float search_radius_;

    // maximal distance of consecutive-round edges added inside a connected component, and maximal distance between
    // any two spots of a decoded sequence [pixel]
    float search_radius_max_;

    // lambda in cost = distance - lambda * (quality_a + quality_b)
    float quality_weight_ = kDefaultQualityWeight;

    // bleed-through tolerance between channels of the same round [pixel]
    float merge_radius_ = kDefaultMergeRadius;

    /**
     * @throws std::invalid_argument on non-positive search radius, search_radius_max smaller than search_radius or
     * negative weights. Nothing is clamped.
     */
    DecodingParameters(const float search_radius, const std::optional<float> search_radius_max = std::nullopt,
                       const float quality_weight = kDefaultQualityWeight,
                       const float merge_radius = kDefaultMergeRadius);
};
}  // namespace graph
