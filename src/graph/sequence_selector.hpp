#pragma once

#include <vector>

#include "candidate_graph.hpp"

namespace graph
{
/**
 * @brief Cost of choosing an edge between consecutive rounds, distance - quality_weight * (quality_a + quality_b).
 * Lower is better.
 */
float transition_cost(const float distance, const float quality_a, const float quality_b, const float quality_weight);

/**
 * @brief Indices of the component edges whose spots lie in consecutive rounds. All other edges are pruned before the
 * flow network is built.
 */
std::vector<int> consecutive_round_edges(const CandidateGraph &graph, const int component);

/**
 * @brief Select vertex-disjoint round-ordered paths in a connected component with a minimum cost maximum flow.
 *
 * Every spot is split into an in and out vertex joined by a unit capacity arc, the source feeds all spots of the
 * first round and all spots of the last round drain into the sink. Arcs between consecutive rounds carry
 * transition_cost shifted by 2 * quality_weight, which makes them non-negative and adds the same amount to every
 * complete path.
 *
 * @param graph graph after connectivity repair
 * @param component index into graph.components()
 * @param quality_weight lambda of transition_cost
 *
 * @return one sequence per unit of flow, empty if no source-sink path exists
 */
std::vector<base::DecodedSequence> select_sequences(const CandidateGraph &graph, const int component,
                                                    const float quality_weight);

/**
 * @brief Largest distance between any two spots of a sequence, 0 for fewer than two spots.
 */
float sequence_spread(const CandidateGraph &graph, const base::DecodedSequence &sequence);

/**
 * @brief Removes the sequences whose spread is larger than `search_radius_max`.
 *
 * @return number of removed sequences
 */
int drop_spread_sequences(const CandidateGraph &graph, std::vector<base::DecodedSequence> &sequences,
                          const float search_radius_max);
}  // namespace graph
