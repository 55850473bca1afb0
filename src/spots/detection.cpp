#include "detection.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include "constants.hpp"
#include "spot_search.hpp"

namespace
{
cv::Mat1f max_filter(const cv::Mat1f &layer, const int half_size)
{
    cv::Mat1f filtered;
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(2 * half_size + 1, 2 * half_size + 1));
    cv::dilate(layer, filtered, kernel, cv::Point(-1, -1), 1, cv::BORDER_REPLICATE);
    return filtered;
}

/**
 * @brief Maximum over the in-plane window and the neighbouring layers (z planes or scales).
 */
std::vector<cv::Mat1f> neighbourhood_max(const std::vector<cv::Mat1f> &layers, const int half_size)
{
    std::vector<cv::Mat1f> filtered(layers.size());
    for (size_t i = 0; i < layers.size(); ++i)
    {
        filtered[i] = max_filter(layers[i], half_size);
    }

    std::vector<cv::Mat1f> maxima(layers.size());
    for (size_t i = 0; i < layers.size(); ++i)
    {
        maxima[i] = filtered[i].clone();
        if (i > 0)
        {
            cv::max(maxima[i], filtered[i - 1], maxima[i]);
        }
        if (i + 1 < layers.size())
        {
            cv::max(maxima[i], filtered[i + 1], maxima[i]);
        }
    }
    return maxima;
}

/**
 * @brief One peak per connected plateau of `mask`, placed at the plateau centroid.
 */
void collect_plateaus(const cv::Mat1b &mask, const cv::Mat1f &response, const float z, const float radius,
                      std::vector<spots::detection::Peak> &peaks, const int connectivity = 8)
{
    cv::Mat1i labels;
    cv::Mat1i stats;
    cv::Mat1d centroids;
    const int count = cv::connectedComponentsWithStats(mask, labels, stats, centroids, connectivity, CV_32S);

    // label 0 is the background
    for (int label = 1; label < count; ++label)
    {
        const double x = centroids(label, 0);
        const double y = centroids(label, 1);
        const int col = std::clamp(int(std::lround(x)), 0, response.cols - 1);
        const int row = std::clamp(int(std::lround(y)), 0, response.rows - 1);
        peaks.push_back(spots::detection::Peak{Eigen::Vector3f(float(x), float(y), z), response(row, col), radius});
    }
}

cv::Mat1b maxima_mask(const cv::Mat1f &layer, const cv::Mat1f &maxima, const float threshold)
{
    const cv::Mat1b is_max = layer >= maxima;
    const cv::Mat1b above = layer > threshold;
    return is_max & above;
}

std::vector<spots::detection::Peak> find_local_max(const std::vector<cv::Mat1f> &volume,
                                                   const spots::LocalMaxParameters &parameters)
{
    std::vector<spots::detection::Peak> peaks;
    const auto maxima = neighbourhood_max(volume, parameters.min_distance_);
    for (size_t z = 0; z < volume.size(); ++z)
    {
        collect_plateaus(maxima_mask(volume[z], maxima[z], parameters.threshold_abs_), volume[z], float(z), 1.0f,
                         peaks);
    }
    return peaks;
}

/**
 * @brief Grayscale reconstruction by dilation of `marker` under `mask`, iterated until stable. Neighbouring planes
 * are part of the neighbourhood, fully for connectivity 8 and only straight above and below for 4.
 */
std::vector<cv::Mat1f> reconstruct_by_dilation(std::vector<cv::Mat1f> marker, const std::vector<cv::Mat1f> &mask,
                                               const int connectivity)
{
    const cv::Mat kernel =
        cv::getStructuringElement(connectivity == 4 ? cv::MORPH_CROSS : cv::MORPH_RECT, cv::Size(3, 3));

    bool changed = true;
    while (changed)
    {
        changed = false;

        std::vector<cv::Mat1f> dilated(marker.size());
        for (size_t i = 0; i < marker.size(); ++i)
        {
            cv::dilate(marker[i], dilated[i], kernel, cv::Point(-1, -1), 1, cv::BORDER_REPLICATE);
        }

        const auto &across_planes = connectivity == 4 ? marker : dilated;
        std::vector<cv::Mat1f> updated(marker.size());
        for (size_t i = 0; i < marker.size(); ++i)
        {
            cv::Mat1f next = dilated[i].clone();
            if (i > 0)
            {
                cv::max(next, across_planes[i - 1], next);
            }
            if (i + 1 < marker.size())
            {
                cv::max(next, across_planes[i + 1], next);
            }
            cv::min(next, mask[i], next);

            const cv::Mat1b differs = next != marker[i];
            changed |= cv::countNonZero(differs) > 0;
            updated[i] = next;
        }
        marker = std::move(updated);
    }
    return marker;
}

std::vector<spots::detection::Peak> find_h_maxima(const std::vector<cv::Mat1f> &volume,
                                                  const spots::HMaximaParameters &parameters)
{
    double lowest = std::numeric_limits<double>::max();
    double highest = std::numeric_limits<double>::lowest();
    for (const auto &plane : volume)
    {
        double plane_min = 0.0;
        double plane_max = 0.0;
        cv::minMaxLoc(plane, &plane_min, &plane_max);
        lowest = std::min(lowest, plane_min);
        highest = std::max(highest, plane_max);
    }
    // otherwise the global maximum would always qualify, even on a flat image
    if (double(parameters.h_) > highest - lowest)
    {
        return {};
    }

    std::vector<cv::Mat1f> lowered(volume.size());
    for (size_t z = 0; z < volume.size(); ++z)
    {
        lowered[z] = volume[z] - parameters.h_;
    }
    const auto reconstructed = reconstruct_by_dilation(std::move(lowered), volume, parameters.connectivity_);

    // absorbs the rounding of (value - h) + h
    const float tolerance = 1e-6f * std::max(1.0f, parameters.h_);

    std::vector<spots::detection::Peak> peaks;
    for (size_t z = 0; z < volume.size(); ++z)
    {
        const cv::Mat1f residue = volume[z] - reconstructed[z];
        const cv::Mat1b mask = residue >= parameters.h_ - tolerance;
        collect_plateaus(mask, volume[z], float(z), 1.0f, peaks, parameters.connectivity_);
    }
    return peaks;
}

std::vector<float> linear_sigmas(const spots::BlobLogParameters &parameters)
{
    std::vector<float> sigmas(parameters.num_sigma_);
    if (parameters.num_sigma_ == 1)
    {
        sigmas.front() = parameters.min_sigma_;
        return sigmas;
    }
    const float step = (parameters.max_sigma_ - parameters.min_sigma_) / float(parameters.num_sigma_ - 1);
    for (int i = 0; i < parameters.num_sigma_; ++i)
    {
        sigmas[i] = parameters.min_sigma_ + float(i) * step;
    }
    return sigmas;
}

cv::Mat1f gaussian(const cv::Mat1f &plane, const float sigma)
{
    cv::Mat1f blurred;
    cv::GaussianBlur(plane, blurred, cv::Size(0, 0), sigma, sigma, cv::BORDER_REPLICATE);
    return blurred;
}

/**
 * @brief Scale normalized peaks of a stack of responses, one layer per sigma.
 */
void collect_scale_space_peaks(const std::vector<cv::Mat1f> &responses, const std::vector<float> &sigmas,
                               const float threshold, const float z, std::vector<spots::detection::Peak> &peaks)
{
    const auto maxima = neighbourhood_max(responses, 1);
    for (size_t s = 0; s < responses.size(); ++s)
    {
        collect_plateaus(maxima_mask(responses[s], maxima[s], threshold), responses[s], z, sigmas[s] * sqrt2, peaks);
    }
}

std::vector<spots::detection::Peak> find_blob_log(const std::vector<cv::Mat1f> &volume,
                                                  const spots::BlobLogParameters &parameters)
{
    const auto sigmas = linear_sigmas(parameters);

    std::vector<spots::detection::Peak> peaks;
    for (size_t z = 0; z < volume.size(); ++z)
    {
        std::vector<cv::Mat1f> responses(sigmas.size());
        for (size_t s = 0; s < sigmas.size(); ++s)
        {
            cv::Mat1f laplacian;
            cv::Laplacian(gaussian(volume[z], sigmas[s]), laplacian, CV_32F, 1, 1.0, 0.0, cv::BORDER_REPLICATE);
            responses[s] = laplacian * -(sigmas[s] * sigmas[s]);
        }
        collect_scale_space_peaks(responses, sigmas, parameters.threshold_, float(z), peaks);
    }
    return peaks;
}

std::vector<spots::detection::Peak> find_blob_dog(const std::vector<cv::Mat1f> &volume,
                                                  const spots::BlobDogParameters &parameters)
{
    // k + 1 blurred images give k differences
    const int k = int(std::log(parameters.max_sigma_ / parameters.min_sigma_) / std::log(parameters.sigma_ratio_)) + 1;
    std::vector<float> sigmas(k + 1);
    for (int i = 0; i <= k; ++i)
    {
        sigmas[i] = parameters.min_sigma_ * std::pow(parameters.sigma_ratio_, float(i));
    }
    const std::vector<float> layer_sigmas(sigmas.begin(), sigmas.end() - 1);

    std::vector<spots::detection::Peak> peaks;
    for (size_t z = 0; z < volume.size(); ++z)
    {
        std::vector<cv::Mat1f> blurred(sigmas.size());
        for (size_t s = 0; s < sigmas.size(); ++s)
        {
            blurred[s] = gaussian(volume[z], sigmas[s]);
        }

        std::vector<cv::Mat1f> responses(k);
        for (int s = 0; s < k; ++s)
        {
            responses[s] = (blurred[s] - blurred[s + 1]) * sigmas[s];
        }
        collect_scale_space_peaks(responses, layer_sigmas, parameters.threshold_, float(z), peaks);
    }
    return peaks;
}

/**
 * @brief Drop the smaller of two blobs in the same plane overlapping by more than `overlap`.
 */
std::vector<spots::detection::Peak> prune_blobs(std::vector<spots::detection::Peak> peaks, const float overlap)
{
    if (peaks.size() < 2)
    {
        return peaks;
    }

    std::sort(peaks.begin(), peaks.end(),
              [](const auto &a, const auto &b)
              {
                  if (a.radius_ != b.radius_)
                  {
                      return a.radius_ > b.radius_;
                  }
                  if (a.response_ != b.response_)
                  {
                      return a.response_ > b.response_;
                  }
                  return std::lexicographical_compare(a.position_.data(), a.position_.data() + 3, b.position_.data(),
                                                      b.position_.data() + 3);
              });

    std::vector<Eigen::Vector3f> positions;
    positions.reserve(peaks.size());
    for (const auto &peak : peaks)
    {
        positions.push_back(peak.position_);
    }
    const float max_radius = peaks.front().radius_;
    const spots::SpotSearch search(positions, 2.0f * max_radius);

    std::vector<bool> kept(peaks.size(), true);
    for (int i = 0; i < int(peaks.size()); ++i)
    {
        if (!kept[i])
        {
            continue;
        }
        for (const int j : search.within_radius(peaks[i].position_, peaks[i].radius_ + max_radius))
        {
            if (j <= i || !kept[j] || peaks[j].position_.z() != peaks[i].position_.z())
            {
                continue;
            }
            const float distance = (peaks[i].position_ - peaks[j].position_).norm();
            if (spots::detection::disk_overlap(distance, peaks[i].radius_, peaks[j].radius_) > overlap)
            {
                kept[j] = false;
            }
        }
    }

    std::vector<spots::detection::Peak> pruned;
    for (size_t i = 0; i < peaks.size(); ++i)
    {
        if (kept[i])
        {
            pruned.push_back(peaks[i]);
        }
    }
    return pruned;
}

float sample(const cv::Mat1f &plane, const Eigen::Vector3f &position)
{
    const int col = std::clamp(int(std::lround(position.x())), 0, plane.cols - 1);
    const int row = std::clamp(int(std::lround(position.y())), 0, plane.rows - 1);
    return plane(row, col);
}
}  // namespace

namespace spots::detection
{
float disk_overlap(const float distance, const float radius_a, const float radius_b)
{
    const float r1 = std::max(radius_a, radius_b);
    const float r2 = std::min(radius_a, radius_b);
    if (distance >= r1 + r2)
    {
        return 0.0f;
    }
    if (distance <= r1 - r2)
    {
        return 1.0f;
    }

    const float ratio1 = std::clamp((distance * distance + r1 * r1 - r2 * r2) / (2.0f * distance * r1), -1.0f, 1.0f);
    const float ratio2 = std::clamp((distance * distance + r2 * r2 - r1 * r1) / (2.0f * distance * r2), -1.0f, 1.0f);
    const float a = -distance + r2 + r1;
    const float b = distance - r2 + r1;
    const float c = distance + r2 - r1;
    const float d = distance + r2 + r1;
    const float area = r1 * r1 * std::acos(ratio1) + r2 * r2 * std::acos(ratio2) -
                       0.5f * std::sqrt(std::max(0.0f, a * b * c * d));
    return std::clamp(area / (pi * r2 * r2), 0.0f, 1.0f);
}

std::vector<Peak> find_peaks(const std::vector<cv::Mat1f> &volume, const DetectorParameters &parameters)
{
    if (volume.empty())
    {
        return {};
    }

    if (const auto *local_max = std::get_if<LocalMaxParameters>(&parameters))
    {
        return find_local_max(volume, *local_max);
    }
    if (const auto *h_maxima = std::get_if<HMaximaParameters>(&parameters))
    {
        return find_h_maxima(volume, *h_maxima);
    }
    if (const auto *blob_log = std::get_if<BlobLogParameters>(&parameters))
    {
        return prune_blobs(find_blob_log(volume, *blob_log), blob_log->overlap_);
    }
    const auto &blob_dog = std::get<BlobDogParameters>(parameters);
    return prune_blobs(find_blob_dog(volume, blob_dog), blob_dog.overlap_);
}

std::vector<base::SpotCandidate> detect_spots(const base::ImageStack &stack, const DetectorParameters &parameters)
{
    validate(parameters);

    const int volume_count = stack.rounds() * stack.channels();
    std::vector<std::vector<base::SpotCandidate>> per_volume(volume_count);

#pragma omp parallel for schedule(dynamic)
    for (int idx = 0; idx < volume_count; ++idx)
    {
        const int round = idx / stack.channels();
        const int channel = idx % stack.channels();

        for (const auto &peak : find_peaks(stack.volume(round, channel), parameters))
        {
            const int z = int(peak.position_.z());
            Eigen::VectorXf intensities(stack.channels());
            for (int c = 0; c < stack.channels(); ++c)
            {
                intensities(c) = sample(stack.plane(round, c, z), peak.position_);
            }
            per_volume[idx].emplace_back(round, channel, peak.position_, intensities(channel), peak.radius_,
                                         intensities);
        }
    }

    std::vector<base::SpotCandidate> candidates;
    for (int idx = 0; idx < volume_count; ++idx)
    {
        spdlog::debug("round {} channel {}: {} {} peaks", idx / stack.channels(), idx % stack.channels(),
                      per_volume[idx].size(), method_name(parameters));
        candidates.insert(candidates.end(), per_volume[idx].begin(), per_volume[idx].end());
    }
    spdlog::info("{} detected {} candidates in {} rounds x {} channels", method_name(parameters), candidates.size(),
                 stack.rounds(), stack.channels());
    return candidates;
}
}  // namespace spots::detection
