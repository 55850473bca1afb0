#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "detector_parameters.hpp"
#include "spots.hpp"

namespace spots::detection
{
struct Peak
{
    Eigen::Vector3f position_;  // x, y, z
    float response_;
    float radius_;  // sigma * sqrt(2) for blobs, 1 for local maxima
};

/**
 * @brief Find spots in a single (round, channel) volume with the detector selected by `parameters`.
 *
 * @param volume z planes of one (round, channel), all of the same size
 */
std::vector<Peak> find_peaks(const std::vector<cv::Mat1f> &volume, const DetectorParameters &parameters);

/**
 * @brief Run the detector on every (round, channel) of the stack. Every candidate samples the intensity of all channels
 * of its round at its position.
 */
std::vector<base::SpotCandidate> detect_spots(const base::ImageStack &stack, const DetectorParameters &parameters);

/**
 * @brief Overlap of two disks as a fraction of the smaller one, in [0, 1].
 */
float disk_overlap(const float distance, const float radius_a, const float radius_b);
}  // namespace spots::detection
