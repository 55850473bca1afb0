#include "intra_round_merge.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <functional>
#include <numeric>
#include <stdexcept>

#include <boost/pending/disjoint_sets.hpp>
#include <spdlog/spdlog.h>

#include "spot_search.hpp"

namespace
{
// a second channel this bright at the same location breaks the one-signal-per-round assumption
constexpr float kMultiSignalRatio = 0.8f;

// cell size used when only coincident candidates merge
constexpr float kMinimalCellSize = 1.0f;

bool canonical_less(const Eigen::Vector3f &lhs_position, const int lhs_channel, const Eigen::Vector3f &rhs_position,
                    const int rhs_channel)
{
    for (const int axis : {2, 1, 0})
    {
        if (lhs_position(axis) != rhs_position(axis))
        {
            return lhs_position(axis) < rhs_position(axis);
        }
    }
    return lhs_channel < rhs_channel;
}

void validate_candidate(const base::SpotCandidate &candidate, const int round, const int channel_count)
{
    if (candidate.round_ != round)
    {
        throw std::invalid_argument(
            std::format("Candidate of round {} passed to merge of round {}.", candidate.round_, round));
    }
    if (candidate.channel_ < 0 || candidate.channel_ >= channel_count)
    {
        throw std::invalid_argument(
            std::format("Candidate channel {} outside of [0, {}).", candidate.channel_, channel_count));
    }
    if (candidate.channel_intensities_.size() != 0 && candidate.channel_intensities_.size() != channel_count)
    {
        throw std::invalid_argument(std::format("Candidate carries {} channel intensities, expected {}.",
                                                candidate.channel_intensities_.size(), channel_count));
    }
    if (!candidate.position_.allFinite())
    {
        throw std::invalid_argument(std::format("Candidate of round {} has non-finite position.", round));
    }
}

Eigen::VectorXf member_intensities(const base::SpotCandidate &candidate, const int channel_count)
{
    if (candidate.channel_intensities_.size() == channel_count)
    {
        return candidate.channel_intensities_;
    }
    Eigen::VectorXf intensities = Eigen::VectorXf::Zero(channel_count);
    intensities(candidate.channel_) = candidate.intensity_;
    return intensities;
}

bool has_competing_channel(const Eigen::VectorXf &intensities)
{
    if (intensities.size() < 2)
    {
        return false;
    }
    std::vector<float> sorted(intensities.data(), intensities.data() + intensities.size());
    std::partial_sort(sorted.begin(), sorted.begin() + 2, sorted.end(), std::greater<float>());
    return sorted[0] > 0.0f && sorted[1] >= kMultiSignalRatio * sorted[0];
}
}  // namespace

namespace spots
{
float quality(const Eigen::VectorXf &channel_intensities)
{
    if (channel_intensities.size() == 0)
    {
        return kFallbackQuality;
    }
    // negative samples (background subtracted images) carry no signal
    const Eigen::VectorXf signal = channel_intensities.cwiseMax(0.0f);
    const float norm = signal.norm();
    if (!(norm > 0.0f) || !std::isfinite(norm))
    {
        return kFallbackQuality;
    }
    return signal.maxCoeff() / norm;
}

std::vector<base::Spot> merge_round(const std::vector<base::SpotCandidate> &candidates, const int channel_count,
                                    const float merge_radius)
{
    std::vector<base::Spot> merged;
    if (candidates.empty())
    {
        return merged;
    }

    const int round = candidates.front().round_;
    for (const auto &candidate : candidates)
    {
        validate_candidate(candidate, round, channel_count);
    }

    std::vector<int> order(candidates.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&candidates](const int lhs, const int rhs)
              {
                  const auto &a = candidates[lhs];
                  const auto &b = candidates[rhs];
                  if (canonical_less(a.position_, a.channel_, b.position_, b.channel_))
                  {
                      return true;
                  }
                  if (canonical_less(b.position_, b.channel_, a.position_, a.channel_))
                  {
                      return false;
                  }
                  return a.intensity_ > b.intensity_;
              });

    std::vector<Eigen::Vector3f> positions;
    positions.reserve(order.size());
    for (const int idx : order)
    {
        positions.emplace_back(candidates[idx].position_);
    }

    const SpotSearch search(positions, std::max(merge_radius, kMinimalCellSize));

    std::vector<int> rank(order.size());
    std::vector<int> parent(order.size());
    boost::disjoint_sets<int *, int *> clusters(rank.data(), parent.data());
    for (int idx = 0; idx < int(order.size()); ++idx)
    {
        clusters.make_set(idx);
    }

    for (int idx = 0; idx < int(order.size()); ++idx)
    {
        for (const int other : search.pairs_from(idx, merge_radius))
        {
            // bleed-through only happens across channels
            if (candidates[order[idx]].channel_ != candidates[order[other]].channel_)
            {
                clusters.union_set(idx, other);
            }
        }
    }

    // cluster members in canonical order, clusters numbered by their first member
    std::vector<int> cluster_of_root(order.size(), -1);
    std::vector<std::vector<int>> members;
    for (int idx = 0; idx < int(order.size()); ++idx)
    {
        const int root = clusters.find_set(idx);
        if (cluster_of_root[root] < 0)
        {
            cluster_of_root[root] = int(members.size());
            members.emplace_back();
        }
        members[cluster_of_root[root]].emplace_back(order[idx]);
    }

    int competing_channels = 0;
    merged.reserve(members.size());
    for (const auto &cluster : members)
    {
        int brightest = cluster.front();
        Eigen::VectorXf intensities = member_intensities(candidates[brightest], channel_count);
        for (size_t member_idx = 1; member_idx < cluster.size(); ++member_idx)
        {
            const int member = cluster[member_idx];
            if (candidates[member].intensity_ > candidates[brightest].intensity_)
            {
                brightest = member;
            }
            intensities = intensities.cwiseMax(member_intensities(candidates[member], channel_count));
        }

        if (has_competing_channel(intensities))
        {
            ++competing_channels;
        }

        const auto &representative = candidates[brightest];
        merged.emplace_back(round, representative.channel_, representative.position_, representative.intensity_,
                            representative.radius_, intensities, quality(intensities));
    }

    std::sort(merged.begin(), merged.end(), [](const base::Spot &lhs, const base::Spot &rhs)
              { return canonical_less(lhs.position_, lhs.channel_, rhs.position_, rhs.channel_); });

    if (competing_channels > 0)
    {
        spdlog::warn("round {}: {} of {} spots have more than one active channel", round, competing_channels,
                     merged.size());
    }
    spdlog::debug("round {}: merged {} candidates into {} spots", round, candidates.size(), merged.size());

    return merged;
}

std::vector<base::Spot> merge_rounds(const std::vector<base::SpotCandidate> &candidates, const int round_count,
                                     const int channel_count, const float merge_radius)
{
    if (round_count < 0 || channel_count <= 0)
    {
        throw std::invalid_argument(
            std::format("Invalid dimensions: {} rounds, {} channels.", round_count, channel_count));
    }

    std::vector<std::vector<base::SpotCandidate>> per_round(round_count);
    for (const auto &candidate : candidates)
    {
        if (candidate.round_ < 0 || candidate.round_ >= round_count)
        {
            throw std::invalid_argument(
                std::format("Candidate round {} outside of [0, {}).", candidate.round_, round_count));
        }
        per_round[candidate.round_].emplace_back(candidate);
    }

    std::vector<base::Spot> spots;
    for (int round = 0; round < round_count; ++round)
    {
        auto merged = merge_round(per_round[round], channel_count, merge_radius);
        if (merged.empty())
        {
            spdlog::info("round {}: no spots", round);
        }
        spots.insert(spots.end(), merged.begin(), merged.end());
    }

    spdlog::info("merged {} candidates into {} spots over {} rounds", candidates.size(), spots.size(), round_count);
    return spots;
}
}  // namespace spots
