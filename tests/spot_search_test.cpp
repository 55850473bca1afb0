#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <vector>

#include "spots/spot_search.hpp"

namespace
{
std::vector<Eigen::Vector3f> line_of_points()
{
    return {Eigen::Vector3f(0, 0, 0), Eigen::Vector3f(1, 0, 0), Eigen::Vector3f(2, 0, 0), Eigen::Vector3f(5, 0, 0),
            Eigen::Vector3f(-3, 0, 0)};
}
}  // namespace

TEST(SpotSearch, WithinRadiusIsInclusiveAndSorted)
{
    const spots::SpotSearch search(line_of_points(), 1.0f);

    EXPECT_EQ(search.within_radius(Eigen::Vector3f(1, 0, 0), 1.0f), (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(search.within_radius(Eigen::Vector3f(1, 0, 0), 0.5f), (std::vector<int>{1}));
    EXPECT_EQ(search.within_radius(Eigen::Vector3f(-2.5f, 0, 0), 1.0f), (std::vector<int>{4}));
}

TEST(SpotSearch, RadiusLargerThanCell)
{
    const spots::SpotSearch search(line_of_points(), 0.5f);

    EXPECT_EQ(search.within_radius(Eigen::Vector3f(0, 0, 0), 3.0f), (std::vector<int>{0, 1, 2, 4}));
}

TEST(SpotSearch, QueryOutsideOfIndexedExtent)
{
    const spots::SpotSearch search(line_of_points(), 1.0f);

    EXPECT_TRUE(search.within_radius(Eigen::Vector3f(-10, -10, 0), 1.0f).empty());
    EXPECT_EQ(search.within_radius(Eigen::Vector3f(6, 0, 0), 1.0f), (std::vector<int>{3}));
}

TEST(SpotSearch, FarAwayQueryIsEmpty)
{
    const spots::SpotSearch search(line_of_points(), 1.0f);

    EXPECT_TRUE(search.within_radius(Eigen::Vector3f(1e12f, 0, 0), 1.0f).empty());
    EXPECT_TRUE(search.within_radius(Eigen::Vector3f(0, -1e12f, 0), 1.0f).empty());
    EXPECT_TRUE(search.within_radius(Eigen::Vector3f(0, 0, std::numeric_limits<float>::infinity()), 1.0f).empty());
}

TEST(SpotSearch, RejectsExtentBeyondCellRange)
{
    const std::vector<Eigen::Vector3f> points{Eigen::Vector3f(0, 0, 0), Eigen::Vector3f(1e12f, 0, 0)};

    EXPECT_THROW(spots::SpotSearch(points, 1.0f), std::invalid_argument);
}

TEST(SpotSearch, PairsFromReportsEveryPairOnce)
{
    const spots::SpotSearch search(line_of_points(), 1.0f);

    EXPECT_EQ(search.pairs_from(0, 2.0f), (std::vector<int>{1, 2}));
    EXPECT_EQ(search.pairs_from(1, 2.0f), (std::vector<int>{2}));
    EXPECT_TRUE(search.pairs_from(2, 2.0f).empty());
}

TEST(SpotSearch, ThirdAxisCounts)
{
    const std::vector<Eigen::Vector3f> points{Eigen::Vector3f(0, 0, 0), Eigen::Vector3f(0, 0, 3)};
    const spots::SpotSearch search(points, 1.0f);

    EXPECT_TRUE(search.pairs_from(0, 2.0f).empty());
    EXPECT_EQ(search.pairs_from(0, 3.0f), (std::vector<int>{1}));
}

TEST(SpotSearch, EmptySet)
{
    const spots::SpotSearch search({}, 1.0f);

    EXPECT_EQ(search.size(), 0);
    EXPECT_TRUE(search.within_radius(Eigen::Vector3f::Zero(), 10.0f).empty());
}

TEST(SpotSearch, RejectsNonPositiveCellSize)
{
    EXPECT_THROW(spots::SpotSearch(line_of_points(), 0.0f), std::invalid_argument);
    EXPECT_THROW(spots::SpotSearch(line_of_points(), -1.0f), std::invalid_argument);
}
