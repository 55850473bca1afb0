#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "spots/intra_round_merge.hpp"

namespace
{
base::SpotCandidate candidate(const int round, const int channel, const float x, const float y, const float intensity)
{
    return base::SpotCandidate(round, channel, Eigen::Vector3f(x, y, 0.0f), intensity);
}
}  // namespace

TEST(Quality, MaxOverNorm)
{
    EXPECT_FLOAT_EQ(spots::quality(Eigen::Vector2f(3.0f, 4.0f)), 0.8f);
    EXPECT_FLOAT_EQ(spots::quality(Eigen::Vector3f(0.0f, 2.0f, 0.0f)), 1.0f);
}

TEST(Quality, FallbackForZeroAndEmptyVectors)
{
    EXPECT_EQ(spots::quality(Eigen::VectorXf::Zero(4)), spots::kFallbackQuality);
    EXPECT_EQ(spots::quality(Eigen::VectorXf()), spots::kFallbackQuality);
}

TEST(Quality, NegativeIntensitiesCountAsZero)
{
    EXPECT_FLOAT_EQ(spots::quality(Eigen::Vector3f(3.0f, -4.0f, 0.0f)), 1.0f);
    EXPECT_FLOAT_EQ(spots::quality(Eigen::Vector3f(3.0f, 4.0f, -12.0f)), 0.8f);
    EXPECT_EQ(spots::quality(Eigen::Vector2f(-1.0f, -2.0f)), spots::kFallbackQuality);
}

TEST(MergeRound, BleedThroughBecomesOneSpotAtBrightestMember)
{
    const std::vector<base::SpotCandidate> candidates{candidate(0, 0, 10.0f, 10.0f, 3.0f),
                                                      candidate(0, 1, 10.5f, 10.0f, 4.0f)};

    const auto spots = spots::merge_round(candidates, 2, 1.0f);

    ASSERT_EQ(spots.size(), 1);
    EXPECT_EQ(spots[0].channel_, 1);
    EXPECT_FLOAT_EQ(spots[0].position_.x(), 10.5f);
    EXPECT_FLOAT_EQ(spots[0].intensity_, 4.0f);
    ASSERT_EQ(spots[0].channel_intensities_.size(), 2);
    EXPECT_FLOAT_EQ(spots[0].channel_intensities_(0), 3.0f);
    EXPECT_FLOAT_EQ(spots[0].channel_intensities_(1), 4.0f);
    EXPECT_FLOAT_EQ(spots[0].quality_, 0.8f);
}

TEST(MergeRound, SameChannelIsNeverMerged)
{
    const std::vector<base::SpotCandidate> candidates{candidate(0, 0, 0.0f, 0.0f, 1.0f),
                                                      candidate(0, 0, 0.5f, 0.0f, 2.0f)};

    EXPECT_EQ(spots::merge_round(candidates, 1, 1.0f).size(), 2);
}

TEST(MergeRound, DistantChannelsStaySeparate)
{
    const std::vector<base::SpotCandidate> candidates{candidate(0, 0, 0.0f, 0.0f, 1.0f),
                                                      candidate(0, 1, 3.0f, 0.0f, 1.0f)};

    const auto spots = spots::merge_round(candidates, 2, 1.0f);

    ASSERT_EQ(spots.size(), 2);
    EXPECT_FLOAT_EQ(spots[0].quality_, 1.0f);
    EXPECT_FLOAT_EQ(spots[1].quality_, 1.0f);
}

TEST(MergeRound, ChainedChannelsFormOneCluster)
{
    const std::vector<base::SpotCandidate> candidates{candidate(0, 0, 0.0f, 0.0f, 1.0f),
                                                      candidate(0, 1, 0.8f, 0.0f, 5.0f),
                                                      candidate(0, 2, 1.6f, 0.0f, 2.0f)};

    const auto spots = spots::merge_round(candidates, 3, 1.0f);

    ASSERT_EQ(spots.size(), 1);
    EXPECT_EQ(spots[0].channel_, 1);
    EXPECT_FLOAT_EQ(spots[0].channel_intensities_.sum(), 8.0f);
}

TEST(MergeRound, SampledIntensitiesAreKept)
{
    Eigen::VectorXf sampled(3);
    sampled << 0.2f, 0.9f, 0.1f;
    const std::vector<base::SpotCandidate> candidates{
        base::SpotCandidate(0, 1, Eigen::Vector3f(1.0f, 1.0f, 0.0f), 0.9f, 1.5f, sampled)};

    const auto spots = spots::merge_round(candidates, 3, 1.0f);

    ASSERT_EQ(spots.size(), 1);
    EXPECT_TRUE(spots[0].channel_intensities_.isApprox(sampled));
    EXPECT_FLOAT_EQ(spots[0].radius_, 1.5f);
    EXPECT_NEAR(spots[0].quality_, 0.9f / std::sqrt(0.86f), 1e-6);
}

TEST(MergeRound, OutputIsOrderedAndIndependentOfInputOrder)
{
    const std::vector<base::SpotCandidate> candidates{candidate(0, 0, 5.0f, 1.0f, 1.0f),
                                                      candidate(0, 0, 2.0f, 3.0f, 1.0f),
                                                      candidate(0, 1, 1.0f, 1.0f, 1.0f)};
    const std::vector<base::SpotCandidate> reversed(candidates.rbegin(), candidates.rend());

    const auto spots = spots::merge_round(candidates, 2, 0.5f);
    const auto spots_reversed = spots::merge_round(reversed, 2, 0.5f);

    ASSERT_EQ(spots.size(), 3);
    EXPECT_FLOAT_EQ(spots[0].position_.x(), 1.0f);
    EXPECT_FLOAT_EQ(spots[1].position_.x(), 5.0f);
    EXPECT_FLOAT_EQ(spots[2].position_.y(), 3.0f);
    for (size_t idx = 0; idx < spots.size(); ++idx)
    {
        EXPECT_EQ(spots[idx].position_, spots_reversed[idx].position_);
        EXPECT_EQ(spots[idx].channel_, spots_reversed[idx].channel_);
    }
}

TEST(MergeRound, RejectsInvalidCandidates)
{
    EXPECT_THROW(spots::merge_round({candidate(0, 2, 0.0f, 0.0f, 1.0f)}, 2, 1.0f), std::invalid_argument);
    EXPECT_THROW(spots::merge_round({candidate(0, 0, 0.0f, 0.0f, 1.0f), candidate(1, 0, 5.0f, 0.0f, 1.0f)}, 2, 1.0f),
                 std::invalid_argument);
    EXPECT_THROW(spots::merge_round({candidate(0, 0, std::nanf(""), 0.0f, 1.0f)}, 2, 1.0f), std::invalid_argument);
}

TEST(MergeRounds, OrdersByRound)
{
    const std::vector<base::SpotCandidate> candidates{candidate(2, 0, 0.0f, 0.0f, 1.0f),
                                                      candidate(0, 0, 1.0f, 0.0f, 1.0f),
                                                      candidate(1, 0, 2.0f, 0.0f, 1.0f)};

    const auto spots = spots::merge_rounds(candidates, 3, 1, 1.0f);

    ASSERT_EQ(spots.size(), 3);
    EXPECT_EQ(spots[0].round_, 0);
    EXPECT_EQ(spots[1].round_, 1);
    EXPECT_EQ(spots[2].round_, 2);
}

TEST(MergeRounds, RejectsRoundOutOfRange)
{
    EXPECT_THROW(spots::merge_rounds({candidate(3, 0, 0.0f, 0.0f, 1.0f)}, 3, 1, 1.0f), std::invalid_argument);
    EXPECT_THROW(spots::merge_rounds({}, 3, 0, 1.0f), std::invalid_argument);
}
