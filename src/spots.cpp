#include "spots.hpp"

#include <format>
#include <stdexcept>

base::SpotCandidate::SpotCandidate(const int round, const int channel, const Eigen::Vector3f &position,
                                   const float intensity, const float radius)
    : round_(round), channel_(channel), position_(position), intensity_(intensity), radius_(radius)
{
}

base::SpotCandidate::SpotCandidate(const int round, const int channel, const Eigen::Vector3f &position,
                                   const float intensity, const float radius,
                                   const Eigen::VectorXf &channel_intensities)
    : round_(round),
      channel_(channel),
      position_(position),
      intensity_(intensity),
      radius_(radius),
      channel_intensities_(channel_intensities)
{
}

base::Spot::Spot(const int round, const int channel, const Eigen::Vector3f &position, const float intensity,
                 const float radius, const Eigen::VectorXf &channel_intensities, const float quality)
    : round_(round),
      channel_(channel),
      position_(position),
      intensity_(intensity),
      radius_(radius),
      channel_intensities_(channel_intensities),
      quality_(quality)
{
}

base::DecodedSequence::DecodedSequence(const int component, const std::vector<int> &spots, const float cost)
    : component_(component), spots_(spots), cost_(cost)
{
}

base::DecodedTarget::DecodedTarget(const int component, const float cost, const std::vector<DecodedRound> &rounds)
    : component_(component), cost_(cost), position_(Eigen::Vector3f::Zero()), rounds_(rounds)
{
    for (const auto &round : rounds_)
    {
        position_ += round.position_;
    }
    if (!rounds_.empty())
    {
        position_ /= float(rounds_.size());
    }
}

std::vector<int> base::DecodedTarget::per_round_max_code() const
{
    std::vector<int> code;
    code.reserve(rounds_.size());
    for (const auto &round : rounds_)
    {
        if (round.intensities_.size() == 0)
        {
            code.emplace_back(round.channel_);
            continue;
        }
        Eigen::Index max_channel = 0;
        round.intensities_.maxCoeff(&max_channel);
        code.emplace_back(int(max_channel));
    }
    return code;
}

base::ImageStack::ImageStack(const int rounds, const int channels, const int planes)
    : rounds_(rounds), channels_(channels), planes_(planes)
{
    if (rounds <= 0 || channels <= 0 || planes <= 0)
    {
        throw std::invalid_argument(
            std::format("Image stack needs positive dimensions, got rounds={} channels={} planes={}.", rounds,
                        channels, planes));
    }
    planes_data_.resize(size_t(rounds) * channels * planes);
}

size_t base::ImageStack::flat_index(const int round, const int channel, const int z) const
{
    if (round < 0 || round >= rounds_ || channel < 0 || channel >= channels_ || z < 0 || z >= planes_)
    {
        throw std::out_of_range(std::format("Plane (r={}, c={}, z={}) outside of image stack.", round, channel, z));
    }
    return (size_t(round) * channels_ + channel) * planes_ + z;
}

cv::Mat1f &base::ImageStack::plane(const int round, const int channel, const int z)
{
    return planes_data_[flat_index(round, channel, z)];
}

const cv::Mat1f &base::ImageStack::plane(const int round, const int channel, const int z) const
{
    return planes_data_[flat_index(round, channel, z)];
}

std::vector<cv::Mat1f> base::ImageStack::volume(const int round, const int channel) const
{
    std::vector<cv::Mat1f> planes;
    planes.reserve(planes_);
    for (int z = 0; z < planes_; ++z)
    {
        planes.emplace_back(plane(round, channel, z));
    }
    return planes;
}

cv::Size base::ImageStack::plane_size() const
{
    return planes_data_.front().size();
}

cv::Mat1f base::ImageStack::max_projection() const
{
    cv::Mat1f projection = planes_data_.front().clone();
    for (const auto &plane : planes_data_)
    {
        if (plane.size() != projection.size())
        {
            throw std::invalid_argument("Image stack planes differ in size.");
        }
        cv::max(projection, plane, projection);
    }
    return projection;
}
