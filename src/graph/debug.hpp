#pragma once

#include <opencv2/core/mat.hpp>

#include "candidate_graph.hpp"

namespace graph::debug
{
static constexpr std::string_view kGraphSubdir = "graph";

/**
 * @brief Max projection with spots colored by round, graph edges in gray and decoded sequences as labeled polylines.
 */
void save_decoding_overlay(const cv::Mat1f &max_projection, const CandidateGraph &graph,
                           const std::vector<base::DecodedSequence> &sequences);

/**
 * @brief Spots and edges as PLY, z is scaled so that rounds are stacked on top of each other. Sequences are saved
 * to a second file.
 */
void save_graph_ply(const CandidateGraph &graph, const std::vector<base::DecodedSequence> &sequences);

void save_graph_json(const CandidateGraph &graph, const std::vector<base::DecodedSequence> &sequences);
}  // namespace graph::debug
