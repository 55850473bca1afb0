#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "io/params_io.hpp"
#include "io/spots_io.hpp"

namespace
{
std::filesystem::path temporary_dir(const std::string &name)
{
    const auto dir = std::filesystem::temp_directory_path() / "spotdecode_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}
}  // namespace

TEST(SpotsIo, ParseCandidatesWithDefaults)
{
    const auto json = nlohmann::json::parse(R"({
        "spots": [
            {"round": 0, "channel": 1, "x": 1.5, "y": 2.5, "intensity": 10.0},
            {"round": 2, "channel": 0, "x": 3.0, "y": 4.0, "z": 2.0, "intensity": 5.0, "radius": 2.0,
             "intensities": [5.0, 1.0]}
        ]
    })");

    const auto candidates = io::parse_candidates(json);

    EXPECT_EQ(candidates.round_count_, 3);
    EXPECT_EQ(candidates.channel_count_, 2);
    ASSERT_EQ(candidates.spots_.size(), 2);

    const auto &first = candidates.spots_[0];
    EXPECT_EQ(first.channel_, 1);
    EXPECT_FLOAT_EQ(first.position_.z(), 0.0f);
    EXPECT_FLOAT_EQ(first.radius_, 1.0f);
    EXPECT_EQ(first.channel_intensities_.size(), 0);

    const auto &second = candidates.spots_[1];
    EXPECT_FLOAT_EQ(second.position_.z(), 2.0f);
    EXPECT_FLOAT_EQ(second.radius_, 2.0f);
    ASSERT_EQ(second.channel_intensities_.size(), 2);
    EXPECT_FLOAT_EQ(second.channel_intensities_(1), 1.0f);
}

TEST(SpotsIo, ExplicitCountsWin)
{
    const auto json = nlohmann::json::parse(R"({"round_count": 5, "channel_count": 4, "spots": []})");

    const auto candidates = io::parse_candidates(json);

    EXPECT_EQ(candidates.round_count_, 5);
    EXPECT_EQ(candidates.channel_count_, 4);
    EXPECT_TRUE(candidates.spots_.empty());
}

TEST(SpotsIo, RejectsMalformedSpots)
{
    EXPECT_THROW(io::parse_candidates(nlohmann::json::parse(R"({"spots": [{"round": 0, "x": 1, "y": 1}]})")),
                 nlohmann::json::exception);
    EXPECT_THROW(io::parse_candidates(nlohmann::json::parse(
                     R"({"spots": [{"round": -1, "channel": 0, "x": 1, "y": 1, "intensity": 1}]})")),
                 std::invalid_argument);
    EXPECT_THROW(io::read_candidates("/nonexistent/spots.json"), std::invalid_argument);
}

TEST(SpotsIo, ReadWrapsJsonErrors)
{
    const auto dir = temporary_dir("read_wraps");
    const auto path = dir / "broken.json";
    std::ofstream(path) << "{\"spots\": [";

    EXPECT_THROW(io::read_candidates(path), std::invalid_argument);
}

TEST(SpotsIo, TargetsToJson)
{
    const std::vector<base::DecodedRound> rounds{
        base::DecodedRound{0, 1, Eigen::Vector3f(1.0f, 2.0f, 0.0f), 0.9f, Eigen::Vector2f(0.1f, 0.9f)},
        base::DecodedRound{1, 0, Eigen::Vector3f(3.0f, 2.0f, 0.0f), 1.0f, Eigen::Vector2f(1.0f, 0.0f)}};
    const std::vector<base::DecodedTarget> targets{base::DecodedTarget(4, -1.5f, rounds)};

    const auto json = io::targets_to_json(targets, 2, 2);

    EXPECT_EQ(json["round_count"].get<int>(), 2);
    EXPECT_EQ(json["channel_count"].get<int>(), 2);
    ASSERT_EQ(json["targets"].size(), 1);
    const auto &target = json["targets"][0];
    EXPECT_EQ(target["component"].get<int>(), 4);
    EXPECT_FLOAT_EQ(target["cost"].get<float>(), -1.5f);
    EXPECT_FLOAT_EQ(target["x"].get<float>(), 2.0f);
    EXPECT_EQ(target["code"].get<std::vector<int>>(), (std::vector<int>{1, 0}));
    ASSERT_EQ(target["rounds"].size(), 2);
    EXPECT_EQ(target["rounds"][0]["channel"].get<int>(), 1);
    EXPECT_EQ(target["rounds"][1]["intensities"].get<std::vector<float>>(), (std::vector<float>{1.0f, 0.0f}));
}

TEST(SpotsIo, SaveTargetsWritesDecodedJson)
{
    const auto dir = temporary_dir("save_targets") / "nested";
    const auto json = io::targets_to_json({}, 3, 2);

    const auto path = io::save_targets(json, dir);

    EXPECT_EQ(path.filename().string(), std::string(io::kDecodedFileName));
    std::ifstream file(path);
    nlohmann::json loaded;
    file >> loaded;
    EXPECT_EQ(loaded, json);
}

TEST(ParamsIo, OptionalDecodingValues)
{
    const auto params = io::parse_params(nlohmann::json::parse(R"({"search_radius": 2.5, "merge_radius": 0.5})"));

    ASSERT_TRUE(params.search_radius_.has_value());
    EXPECT_FLOAT_EQ(*params.search_radius_, 2.5f);
    EXPECT_FALSE(params.search_radius_max_.has_value());
    EXPECT_FALSE(params.quality_weight_.has_value());
    EXPECT_FLOAT_EQ(params.merge_radius_.value(), 0.5f);
    EXPECT_TRUE(std::holds_alternative<spots::LocalMaxParameters>(params.detector_));
}

TEST(ParamsIo, DetectorMethods)
{
    const auto log = io::parse_detector(nlohmann::json::parse(R"({"method": "blob_log", "num_sigma": 3})"));
    ASSERT_TRUE(std::holds_alternative<spots::BlobLogParameters>(log));
    EXPECT_EQ(std::get<spots::BlobLogParameters>(log).num_sigma_, 3);
    EXPECT_EQ(spots::method_name(log), spots::kBlobLog);

    const auto dog = io::parse_detector(nlohmann::json::parse(R"({"method": "blob_dog", "sigma_ratio": 2.0})"));
    ASSERT_TRUE(std::holds_alternative<spots::BlobDogParameters>(dog));
    EXPECT_FLOAT_EQ(std::get<spots::BlobDogParameters>(dog).sigma_ratio_, 2.0f);

    const auto local_max =
        io::parse_detector(nlohmann::json::parse(R"({"method": "local_max", "threshold_abs": 0.2, "min_distance": 3})"));
    ASSERT_TRUE(std::holds_alternative<spots::LocalMaxParameters>(local_max));
    EXPECT_EQ(std::get<spots::LocalMaxParameters>(local_max).min_distance_, 3);

    const auto h_maxima =
        io::parse_detector(nlohmann::json::parse(R"({"method": "h_maxima", "h": 0.25, "connectivity": 4})"));
    ASSERT_TRUE(std::holds_alternative<spots::HMaximaParameters>(h_maxima));
    EXPECT_FLOAT_EQ(std::get<spots::HMaximaParameters>(h_maxima).h_, 0.25f);
    EXPECT_EQ(std::get<spots::HMaximaParameters>(h_maxima).connectivity_, 4);
    EXPECT_EQ(spots::method_name(h_maxima), spots::kHMaxima);
}

TEST(ParamsIo, RejectsInvalidDetector)
{
    EXPECT_THROW(io::parse_detector(nlohmann::json::parse(R"({"method": "watershed"})")), std::invalid_argument);
    EXPECT_THROW(io::parse_detector(nlohmann::json::parse(R"({"method": "blob_log", "min_sigma": 0})")),
                 std::invalid_argument);
    EXPECT_THROW(io::parse_detector(nlohmann::json::parse(R"({"method": "blob_dog", "sigma_ratio": 1.0})")),
                 std::invalid_argument);
    EXPECT_THROW(io::parse_detector(nlohmann::json::parse(R"({"method": "h_maxima", "connectivity": 6})")),
                 std::invalid_argument);
    EXPECT_THROW(io::read_params("/nonexistent/params.json"), std::invalid_argument);
}
