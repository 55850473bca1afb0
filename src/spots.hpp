#pragma once

#include <vector>

#include <Eigen/Core>
#include <opencv2/core.hpp>

namespace base
{
/**
 * @brief Raw detection in a single (round, channel) volume, as produced by a spot detector.
 */
struct SpotCandidate
{
    int round_;
    int channel_;

    Eigen::Vector3f position_;  // x, y, z [pixel], z is 0 for planar data

    float intensity_;
    float radius_;

    // intensities of all channels of the round sampled at position_, empty when the detector did not sample them
    Eigen::VectorXf channel_intensities_;

    SpotCandidate(const int round, const int channel, const Eigen::Vector3f &position, const float intensity,
                  const float radius = 1.0f);
    SpotCandidate(const int round, const int channel, const Eigen::Vector3f &position, const float intensity,
                  const float radius, const Eigen::VectorXf &channel_intensities);
};

/**
 * @brief Consolidated detection: one physical emitter in one round. Node of the candidate graph.
 */
struct Spot
{
    int round_;
    int channel_;

    Eigen::Vector3f position_;

    float intensity_;
    float radius_;

    Eigen::VectorXf channel_intensities_;

    // max(channel_intensities_) / |channel_intensities_|_2
    float quality_;

    Spot(const int round, const int channel, const Eigen::Vector3f &position, const float intensity,
         const float radius, const Eigen::VectorXf &channel_intensities, const float quality);
};

/**
 * @brief Vertex-disjoint path selected by the flow solver inside one connected component.
 */
struct DecodedSequence
{
    int component_;

    // spot indices, one per round, ordered by round
    std::vector<int> spots_;

    // sum of (distance - quality_weight * (quality_a + quality_b)) over the path edges
    float cost_;

    DecodedSequence(const int component, const std::vector<int> &spots, const float cost);
};

struct DecodedRound
{
    int round_;
    int channel_;
    Eigen::Vector3f position_;
    float quality_;
    Eigen::VectorXf intensities_;
};

/**
 * @brief Output record handed to codebook lookup: per round intensities of the selected spot.
 */
class DecodedTarget
{
   public:
    int component_;
    float cost_;

    // centroid of the selected spots
    Eigen::Vector3f position_;

    std::vector<DecodedRound> rounds_;

    DecodedTarget(const int component, const float cost, const std::vector<DecodedRound> &rounds);

    /**
     * @brief Index of the max-intensity channel in every round, the key a codebook lookup matches against.
     */
    std::vector<int> per_round_max_code() const;
};

/**
 * @brief Image planes of one field of view indexed by [round][channel][z].
 */
class ImageStack
{
   public:
    ImageStack(const int rounds, const int channels, const int planes);

    cv::Mat1f &plane(const int round, const int channel, const int z);
    const cv::Mat1f &plane(const int round, const int channel, const int z) const;

    // all z planes of one (round, channel) volume
    std::vector<cv::Mat1f> volume(const int round, const int channel) const;

    int rounds() const { return rounds_; }
    int channels() const { return channels_; }
    int planes() const { return planes_; }

    cv::Size plane_size() const;

    /**
     * @brief Maximum projection over rounds, channels and planes. Used as background for debug drawings.
     */
    cv::Mat1f max_projection() const;

   private:
    int rounds_;
    int channels_;
    int planes_;

    std::vector<cv::Mat1f> planes_data_;

    size_t flat_index(const int round, const int channel, const int z) const;
};

}  // namespace base
