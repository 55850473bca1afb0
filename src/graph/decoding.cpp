#include "decoding.hpp"

#include <spdlog/spdlog.h>

#include "sequence_selector.hpp"
#include "spots/intra_round_merge.hpp"

namespace graph
{
DecodingResult decode(const std::vector<base::SpotCandidate> &candidates, const int round_count,
                      const int channel_count, const DecodingParameters &parameters)
{
    auto merged = spots::merge_rounds(candidates, round_count, channel_count, parameters.merge_radius_);
    return decode_spots(std::move(merged), round_count, parameters);
}

DecodingResult decode_spots(std::vector<base::Spot> spots, const int round_count,
                            const DecodingParameters &parameters)
{
    CandidateGraph graph = build_candidate_graph(std::move(spots), round_count, parameters.search_radius_);
    repair_connectivity(graph, parameters.search_radius_max_);

    if (round_count < 2)
    {
        spdlog::warn("{} round(s): at least two rounds are needed to decode sequences", round_count);
    }

    const int component_count = int(graph.components().size());
    std::vector<std::vector<base::DecodedSequence>> per_component(component_count);
    std::vector<int> dropped(component_count, 0);

#pragma omp parallel for schedule(dynamic)
    for (int component = 0; component < component_count; ++component)
    {
        per_component[component] = select_sequences(graph, component, parameters.quality_weight_);
        dropped[component] = drop_spread_sequences(graph, per_component[component], parameters.search_radius_max_);
    }

    std::vector<base::DecodedSequence> sequences;
    int dropped_count = 0;
    for (int component = 0; component < component_count; ++component)
    {
        const auto &component_sequences = per_component[component];
        sequences.insert(sequences.end(), component_sequences.begin(), component_sequences.end());
        dropped_count += dropped[component];
    }

    if (dropped_count > 0)
    {
        spdlog::info("dropped {} sequences spreading over more than search_radius_max {}", dropped_count,
                     parameters.search_radius_max_);
    }
    if (sequences.empty())
    {
        spdlog::warn("zero sequences decoded");
    }
    spdlog::info("decoded {} sequences from {} components", sequences.size(), component_count);

    auto targets = assemble_targets(graph, sequences);
    return DecodingResult{std::move(graph), std::move(sequences), std::move(targets)};
}

std::vector<base::DecodedTarget> assemble_targets(const CandidateGraph &graph,
                                                  const std::vector<base::DecodedSequence> &sequences)
{
    std::vector<base::DecodedTarget> targets;
    targets.reserve(sequences.size());
    for (const auto &sequence : sequences)
    {
        std::vector<base::DecodedRound> rounds;
        rounds.reserve(sequence.spots_.size());
        for (const int spot_idx : sequence.spots_)
        {
            const auto &spot = graph.spots().at(spot_idx);
            rounds.push_back(
                base::DecodedRound{spot.round_, spot.channel_, spot.position_, spot.quality_, spot.channel_intensities_});
        }
        targets.emplace_back(sequence.component_, sequence.cost_, rounds);
    }
    return targets;
}
}  // namespace graph
