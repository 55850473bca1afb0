#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <vector>

#include <omp.h>

#include "graph/decoding.hpp"
#include "graph/sequence_selector.hpp"

namespace
{
base::SpotCandidate candidate(const int round, const int channel, const float x, const float y,
                              const float intensity = 1.0f)
{
    return base::SpotCandidate(round, channel, Eigen::Vector3f(x, y, 0.0f), intensity);
}

base::SpotCandidate sampled(const int round, const int channel, const float x, const float y,
                            const Eigen::Vector2f &intensities)
{
    return base::SpotCandidate(round, channel, Eigen::Vector3f(x, y, 0.0f), intensities(channel), 1.0f, intensities);
}

std::vector<base::SpotCandidate> triplet(const float x_offset)
{
    return {candidate(0, 0, x_offset, 0.0f), candidate(1, 1, x_offset + 1.0f, 0.0f),
            candidate(2, 0, x_offset + 2.0f, 0.0f)};
}

void expect_same_sequences(const graph::DecodingResult &lhs, const graph::DecodingResult &rhs)
{
    ASSERT_EQ(lhs.sequences_.size(), rhs.sequences_.size());
    for (size_t idx = 0; idx < lhs.sequences_.size(); ++idx)
    {
        EXPECT_EQ(lhs.sequences_[idx].component_, rhs.sequences_[idx].component_);
        EXPECT_EQ(lhs.sequences_[idx].spots_, rhs.sequences_[idx].spots_);
        EXPECT_FLOAT_EQ(lhs.sequences_[idx].cost_, rhs.sequences_[idx].cost_);
    }
}

std::vector<base::SpotCandidate> crowded_field()
{
    std::vector<base::SpotCandidate> candidates;
    std::mt19937 generator(7);
    std::uniform_real_distribution<float> jitter(-0.4f, 0.4f);
    for (int target = 0; target < 40; ++target)
    {
        const float x = float(target % 8) * 3.0f;
        const float y = float(target / 8) * 3.0f;
        for (int round = 0; round < 4; ++round)
        {
            candidates.push_back(candidate(round, (target + round) % 3, x + jitter(generator), y + jitter(generator),
                                           1.0f + jitter(generator)));
        }
    }
    return candidates;
}
}  // namespace

TEST(Decoding, ChainWithinSearchRadius)
{
    const auto result = graph::decode(triplet(0.0f), 3, 2, graph::DecodingParameters(1.5f, 2.5f));

    ASSERT_EQ(result.sequences_.size(), 1);
    EXPECT_EQ(result.sequences_[0].spots_.size(), 3);
    ASSERT_EQ(result.targets_.size(), 1);

    const auto &target = result.targets_[0];
    ASSERT_EQ(target.rounds_.size(), 3);
    for (int round = 0; round < 3; ++round)
    {
        EXPECT_EQ(target.rounds_[round].round_, round);
    }
    EXPECT_FLOAT_EQ(target.position_.x(), 1.0f);
    EXPECT_EQ(target.per_round_max_code(), (std::vector<int>{0, 1, 0}));
}

TEST(Decoding, RadiiBelowSpotDistance)
{
    const auto result = graph::decode(triplet(0.0f), 3, 2, graph::DecodingParameters(0.5f, 0.9f));

    EXPECT_TRUE(result.graph_.edges().empty());
    EXPECT_TRUE(result.sequences_.empty());
    EXPECT_TRUE(result.targets_.empty());
}

TEST(Decoding, SpreadBeyondSearchRadiusMax)
{
    // every round shifts the spot 3 px along the diagonal, so consecutive rounds are 4.24 px apart and the
    // sequence spreads over 8.49 px
    const std::vector<base::SpotCandidate> candidates{candidate(0, 0, 35.0f, 35.0f), candidate(1, 1, 32.0f, 32.0f),
                                                      candidate(2, 0, 29.0f, 29.0f)};

    const auto wide = graph::decode(candidates, 3, 2, graph::DecodingParameters(5.0f, 10.0f));
    ASSERT_EQ(wide.sequences_.size(), 1);
    EXPECT_EQ(wide.sequences_[0].spots_.size(), 3);
    EXPECT_NEAR(graph::sequence_spread(wide.graph_, wide.sequences_[0]), 6.0f * std::sqrt(2.0f), 1e-4f);

    const auto narrow = graph::decode(candidates, 3, 2, graph::DecodingParameters(5.0f, 5.0f));
    EXPECT_EQ(narrow.graph_.edges().size(), 2);
    EXPECT_TRUE(narrow.sequences_.empty());
    EXPECT_TRUE(narrow.targets_.empty());
}

TEST(Decoding, HigherQualityCandidateWins)
{
    const std::vector<base::SpotCandidate> candidates{
        sampled(0, 0, 0.0f, 0.0f, Eigen::Vector2f(1.0f, 0.0f)), sampled(1, 1, 0.0f, 1.0f, Eigen::Vector2f(0.0f, 1.0f)),
        sampled(2, 0, -1.0f, 2.0f, Eigen::Vector2f(1.0f, 0.9f)), sampled(2, 0, 1.0f, 2.0f, Eigen::Vector2f(1.0f, 0.0f))};

    const auto result = graph::decode(candidates, 3, 2, graph::DecodingParameters(1.5f, 2.5f));

    ASSERT_EQ(result.targets_.size(), 1);
    EXPECT_FLOAT_EQ(result.targets_[0].rounds_[2].position_.x(), 1.0f);
    EXPECT_FLOAT_EQ(result.targets_[0].rounds_[2].quality_, 1.0f);
}

TEST(Decoding, HigherQualityMiddleRoundCandidateWins)
{
    // both round 1 candidates are sqrt(2) away from the round 0 and the round 2 spot
    const std::vector<base::SpotCandidate> candidates{
        sampled(0, 0, 0.0f, 0.0f, Eigen::Vector2f(1.0f, 0.0f)), sampled(1, 1, -1.0f, 1.0f, Eigen::Vector2f(0.9f, 1.0f)),
        sampled(1, 1, 1.0f, 1.0f, Eigen::Vector2f(0.0f, 1.0f)), sampled(2, 0, 0.0f, 2.0f, Eigen::Vector2f(1.0f, 0.0f))};

    const auto result = graph::decode(candidates, 3, 2, graph::DecodingParameters(1.5f, 2.5f));

    ASSERT_EQ(result.graph_.spots().size(), 4);
    ASSERT_EQ(result.targets_.size(), 1);
    const auto &middle = result.targets_[0].rounds_[1];
    EXPECT_FLOAT_EQ(middle.position_.x(), 1.0f);
    EXPECT_FLOAT_EQ(middle.quality_, 1.0f);
    EXPECT_FLOAT_EQ(result.targets_[0].rounds_[0].position_.y(), 0.0f);
    EXPECT_FLOAT_EQ(result.targets_[0].rounds_[2].position_.y(), 2.0f);
}

TEST(Decoding, SeparatedTripletsDecodeIndependently)
{
    auto candidates = triplet(0.0f);
    const auto second = triplet(100.0f);
    candidates.insert(candidates.end(), second.begin(), second.end());

    const auto result = graph::decode(candidates, 3, 2, graph::DecodingParameters(1.5f, 2.5f));

    ASSERT_EQ(result.graph_.components().size(), 2);
    ASSERT_EQ(result.sequences_.size(), 2);
    for (int idx = 0; idx < 2; ++idx)
    {
        const auto &sequence = result.sequences_[idx];
        EXPECT_EQ(sequence.component_, idx);
        for (const int spot : sequence.spots_)
        {
            EXPECT_EQ(result.graph_.component_of(spot), idx);
        }
    }
    EXPECT_LT(result.targets_[0].position_.x(), 50.0f);
    EXPECT_GT(result.targets_[1].position_.x(), 50.0f);
}

TEST(Decoding, RepairRecoversSkippedRound)
{
    // round 0 and round 2 are close, round 1 is only reachable with the larger radius
    const std::vector<base::SpotCandidate> candidates{candidate(0, 0, 0.0f, 0.0f), candidate(1, 0, 2.2f, 0.0f),
                                                      candidate(2, 0, 1.0f, 0.0f)};

    EXPECT_TRUE(graph::decode(candidates, 3, 1, graph::DecodingParameters(1.5f)).sequences_.empty());

    const auto repaired = graph::decode(candidates, 3, 1, graph::DecodingParameters(1.5f, 2.5f));
    ASSERT_EQ(repaired.sequences_.size(), 1);
    EXPECT_EQ(repaired.sequences_[0].spots_, (std::vector<int>{0, 1, 2}));
}

TEST(Decoding, EmptyInput)
{
    const auto result = graph::decode({}, 4, 3, graph::DecodingParameters(2.0f));

    EXPECT_TRUE(result.sequences_.empty());
    EXPECT_TRUE(result.targets_.empty());
}

TEST(Decoding, SequencesAreDisjointAndConsecutive)
{
    const auto result = graph::decode(crowded_field(), 4, 3, graph::DecodingParameters(1.5f, 2.0f, 0.5f, 0.5f));

    ASSERT_FALSE(result.sequences_.empty());
    std::set<int> used;
    for (const auto &sequence : result.sequences_)
    {
        ASSERT_EQ(sequence.spots_.size(), 4);
        for (size_t idx = 0; idx < sequence.spots_.size(); ++idx)
        {
            EXPECT_TRUE(used.insert(sequence.spots_[idx]).second);
            EXPECT_EQ(result.graph_.spots()[sequence.spots_[idx]].round_, int(idx));
            EXPECT_EQ(result.graph_.component_of(sequence.spots_[idx]), sequence.component_);
            if (idx > 0)
            {
                EXPECT_TRUE(result.graph_.connected(sequence.spots_[idx - 1], sequence.spots_[idx]));
            }
        }
    }
}

TEST(Decoding, IndependentOfInputOrder)
{
    auto candidates = crowded_field();
    const graph::DecodingParameters parameters(1.5f, 2.0f);

    const auto reference = graph::decode(candidates, 4, 3, parameters);
    std::shuffle(candidates.begin(), candidates.end(), std::mt19937(11));
    const auto shuffled = graph::decode(candidates, 4, 3, parameters);

    expect_same_sequences(reference, shuffled);
}

TEST(Decoding, IndependentOfThreadCount)
{
    const auto candidates = crowded_field();
    const graph::DecodingParameters parameters(1.5f, 2.0f);
    const int threads = omp_get_max_threads();

    omp_set_num_threads(1);
    const auto single = graph::decode(candidates, 4, 3, parameters);
    omp_set_num_threads(4);
    const auto parallel = graph::decode(candidates, 4, 3, parameters);
    omp_set_num_threads(threads);

    expect_same_sequences(single, parallel);
}

TEST(DecodingParameters, RejectsInvalidValues)
{
    EXPECT_THROW(graph::DecodingParameters(0.0f), std::invalid_argument);
    EXPECT_THROW(graph::DecodingParameters(-1.0f), std::invalid_argument);
    EXPECT_THROW(graph::DecodingParameters(std::numeric_limits<float>::infinity()), std::invalid_argument);
    EXPECT_THROW(graph::DecodingParameters(2.0f, 1.0f), std::invalid_argument);
    EXPECT_THROW(graph::DecodingParameters(2.0f, std::nullopt, -0.1f), std::invalid_argument);
    EXPECT_THROW(graph::DecodingParameters(2.0f, std::nullopt, 1.0f, -1.0f), std::invalid_argument);
}

TEST(DecodingParameters, Defaults)
{
    const graph::DecodingParameters parameters(2.0f);

    EXPECT_FLOAT_EQ(parameters.search_radius_max_, 2.0f);
    EXPECT_FLOAT_EQ(parameters.quality_weight_, graph::kDefaultQualityWeight);
    EXPECT_FLOAT_EQ(parameters.merge_radius_, graph::kDefaultMergeRadius);
}
