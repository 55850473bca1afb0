#pragma once

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include "spots.hpp"

namespace io
{
static constexpr std::string_view kDecodedFileName = "decoded.json";

struct CandidateSpots
{
    int round_count_;
    int channel_count_;
    std::vector<base::SpotCandidate> spots_;
};

/**
 * @brief Parse `{"round_count", "channel_count", "spots": [...]}`. Counts default to the largest index + 1.
 * @throws nlohmann::json::exception on missing fields, std::invalid_argument on negative indices
 */
CandidateSpots parse_candidates(const nlohmann::json& json);

CandidateSpots read_candidates(const std::filesystem::path& filepath);

nlohmann::json targets_to_json(const std::vector<base::DecodedTarget>& targets, const int round_count,
                               const int channel_count);

/**
 * @brief Write `json` as `decoded.json` into `output_dir`, creating the directory.
 * @returns path of the written file
 */
std::filesystem::path save_targets(const nlohmann::json& json, const std::filesystem::path& output_dir);
}  // namespace io
