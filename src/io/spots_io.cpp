#include "spots_io.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace keys
{
constexpr std::string_view kRoundCount = "round_count";
constexpr std::string_view kChannelCount = "channel_count";
constexpr std::string_view kSpots = "spots";
constexpr std::string_view kTargets = "targets";
constexpr std::string_view kRounds = "rounds";
constexpr std::string_view kRound = "round";
constexpr std::string_view kChannel = "channel";
constexpr std::string_view kX = "x";
constexpr std::string_view kY = "y";
constexpr std::string_view kZ = "z";
constexpr std::string_view kIntensity = "intensity";
constexpr std::string_view kIntensities = "intensities";
constexpr std::string_view kRadius = "radius";
constexpr std::string_view kQuality = "quality";
constexpr std::string_view kComponent = "component";
constexpr std::string_view kCost = "cost";
constexpr std::string_view kCode = "code";
}  // namespace keys

namespace
{
constexpr int kOutputJsonIndent = 2;

base::SpotCandidate parse_candidate(const nlohmann::json& json)
{
    const int round = json.at(keys::kRound.data()).get<int>();
    const int channel = json.at(keys::kChannel.data()).get<int>();
    if (round < 0 || channel < 0)
    {
        throw std::invalid_argument(std::format("Spot with negative index: round {} channel {}.", round, channel));
    }

    const Eigen::Vector3f position(json.at(keys::kX.data()).get<float>(), json.at(keys::kY.data()).get<float>(),
                                   json.value(keys::kZ.data(), 0.0f));
    const float intensity = json.at(keys::kIntensity.data()).get<float>();
    const float radius = json.value(keys::kRadius.data(), 1.0f);

    if (!json.contains(keys::kIntensities.data()))
    {
        return base::SpotCandidate(round, channel, position, intensity, radius);
    }
    const auto values = json.at(keys::kIntensities.data()).get<std::vector<float>>();
    return base::SpotCandidate(round, channel, position, intensity, radius,
                               Eigen::Map<const Eigen::VectorXf>(values.data(), Eigen::Index(values.size())));
}

nlohmann::json position_to_json(const Eigen::Vector3f& position, nlohmann::json json)
{
    json[keys::kX.data()] = position.x();
    json[keys::kY.data()] = position.y();
    json[keys::kZ.data()] = position.z();
    return json;
}
}  // namespace

namespace io
{
CandidateSpots parse_candidates(const nlohmann::json& json)
{
    CandidateSpots result{0, 0, {}};
    for (const auto& spot : json.at(keys::kSpots.data()))
    {
        result.spots_.push_back(parse_candidate(spot));
        result.round_count_ = std::max(result.round_count_, result.spots_.back().round_ + 1);
        result.channel_count_ = std::max(result.channel_count_, result.spots_.back().channel_ + 1);
    }

    if (json.contains(keys::kRoundCount.data()))
    {
        result.round_count_ = json.at(keys::kRoundCount.data()).get<int>();
    }
    if (json.contains(keys::kChannelCount.data()))
    {
        result.channel_count_ = json.at(keys::kChannelCount.data()).get<int>();
    }
    return result;
}

CandidateSpots read_candidates(const std::filesystem::path& filepath)
{
    if (!std::filesystem::exists(filepath))
    {
        throw std::invalid_argument(std::format("Error loading '{}'. File does not exist.", filepath.string()));
    }

    std::ifstream file(filepath);
    try
    {
        nlohmann::json json;
        file >> json;
        auto candidates = parse_candidates(json);
        spdlog::info("Loaded {} candidate spots ({} rounds, {} channels) from {}", candidates.spots_.size(),
                     candidates.round_count_, candidates.channel_count_, filepath.string());
        return candidates;
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::invalid_argument(std::format("Error loading '{}'. {}", filepath.string(), e.what()));
    }
}

nlohmann::json targets_to_json(const std::vector<base::DecodedTarget>& targets, const int round_count,
                               const int channel_count)
{
    nlohmann::json targets_json = nlohmann::json::array();
    for (const auto& target : targets)
    {
        nlohmann::json rounds_json = nlohmann::json::array();
        for (const auto& round : target.rounds_)
        {
            nlohmann::json round_json;
            round_json[keys::kRound.data()] = round.round_;
            round_json[keys::kChannel.data()] = round.channel_;
            round_json = position_to_json(round.position_, std::move(round_json));
            round_json[keys::kQuality.data()] = round.quality_;
            round_json[keys::kIntensities.data()] =
                std::vector<float>(round.intensities_.data(), round.intensities_.data() + round.intensities_.size());
            rounds_json.push_back(std::move(round_json));
        }

        nlohmann::json target_json;
        target_json[keys::kComponent.data()] = target.component_;
        target_json[keys::kCost.data()] = target.cost_;
        target_json = position_to_json(target.position_, std::move(target_json));
        target_json[keys::kRounds.data()] = std::move(rounds_json);
        target_json[keys::kCode.data()] = target.per_round_max_code();
        targets_json.push_back(std::move(target_json));
    }

    nlohmann::json json;
    json[keys::kRoundCount.data()] = round_count;
    json[keys::kChannelCount.data()] = channel_count;
    json[keys::kTargets.data()] = std::move(targets_json);
    return json;
}

std::filesystem::path save_targets(const nlohmann::json& json, const std::filesystem::path& output_dir)
{
    std::filesystem::create_directories(output_dir);
    const std::filesystem::path filepath = output_dir / kDecodedFileName;

    std::ofstream file(filepath);
    if (!file)
    {
        throw std::runtime_error(std::format("Could not open '{}' for writing.", filepath.string()));
    }
    file << json.dump(kOutputJsonIndent);
    spdlog::info("Saved {} targets to {}", json.at(keys::kTargets.data()).size(), filepath.string());
    return filepath;
}
}  // namespace io
