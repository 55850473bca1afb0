#pragma once

#include <vector>

#include "spots.hpp"

namespace spots
{
/**
 * @brief Quality of channel assignment: max channel intensity over L2 norm of the intensity vector, in (0, 1].
 * Negative intensities count as 0. Vectors without a positive entry (or empty ones) get the fallback score
 * kFallbackQuality.
 */
float quality(const Eigen::VectorXf &channel_intensities);

static constexpr float kFallbackQuality = 0.0f;

/**
 * @brief Consolidate candidates of a single round. Candidates from different channels closer than `merge_radius` are
 * bleed-through of one emitter and become one spot placed at the brightest member.
 *
 * @param candidates detections of one round, all channels
 * @param channel_count number of channels of the round, length of the resulting intensity vectors
 * @param merge_radius bleed-through tolerance [pixel]
 *
 * @return spots sorted by (z, y, x, channel)
 */
std::vector<base::Spot> merge_round(const std::vector<base::SpotCandidate> &candidates, const int channel_count,
                                    const float merge_radius);

/**
 * @brief Split candidates by round and merge every round. Result is ordered by round, then as in merge_round, so it
 * does not depend on the order of `candidates`.
 */
std::vector<base::Spot> merge_rounds(const std::vector<base::SpotCandidate> &candidates, const int round_count,
                                     const int channel_count, const float merge_radius);
}  // namespace spots
