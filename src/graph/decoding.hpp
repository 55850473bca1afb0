#pragma once

#include <vector>

#include "candidate_graph.hpp"
#include "decoding_parameters.hpp"

namespace graph
{
struct DecodingResult
{
    CandidateGraph graph_;
    std::vector<base::DecodedSequence> sequences_;
    std::vector<base::DecodedTarget> targets_;
};

/**
 * @brief Full graph decoding of one field of view: merge candidates within rounds, build the candidate graph, repair
 * connectivity and select sequences per component.
 *
 * Graph construction runs once on all spots, sequence selection runs over components in parallel. Sequences are
 * concatenated in component order, so the result does not depend on the number of threads.
 *
 * @param candidates raw detections of all rounds and channels
 * @param round_count number of imaging rounds, sequences span rounds 0 .. round_count - 1
 * @param channel_count number of channels per round
 * @param parameters validated decoding configuration
 */
DecodingResult decode(const std::vector<base::SpotCandidate> &candidates, const int round_count,
                      const int channel_count, const DecodingParameters &parameters);

/**
 * @brief Same as above for spots that were already merged within rounds.
 */
DecodingResult decode_spots(std::vector<base::Spot> spots, const int round_count,
                            const DecodingParameters &parameters);

/**
 * @brief Convert decoded paths into per round records of the selected spots.
 */
std::vector<base::DecodedTarget> assemble_targets(const CandidateGraph &graph,
                                                  const std::vector<base::DecodedSequence> &sequences);
}  // namespace graph
