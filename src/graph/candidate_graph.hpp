#pragma once

#include <cstdint>
#include <unordered_set>
#include <vector>

#include "spots.hpp"

namespace graph
{
struct Edge
{
    // spot indices, from_ < to_
    int from_;
    int to_;

    float distance_;

    Edge(const int from, const int to, const float distance);
};

/**
 * @brief Undirected graph over the spots of all rounds. Spots are nodes addressed by their index in spots(), edges
 * are records in edges() addressed by index. Spots of the same round are never connected.
 */
class CandidateGraph
{
   private:
    std::vector<base::Spot> spots_;
    int round_count_;

    std::vector<Edge> edges_;

    // node -> incident edge indices
    std::vector<std::vector<int>> incident_;

    std::unordered_set<std::uint64_t> edge_keys_;

    std::vector<int> component_of_;
    std::vector<std::vector<int>> components_;

    static std::uint64_t edge_key(const int from, const int to);

   public:
    CandidateGraph(std::vector<base::Spot> spots, const int round_count);

    const std::vector<base::Spot> &spots() const { return spots_; }
    const std::vector<Edge> &edges() const { return edges_; }
    const std::vector<int> &incident(const int node) const { return incident_.at(node); }
    int round_count() const { return round_count_; }

    bool connected(const int node_a, const int node_b) const;

    /**
     * @brief Adds an undirected edge between two spots of different rounds.
     *
     * @return false if the edge exists already or both spots belong to the same round
     */
    bool add_edge(const int node_a, const int node_b);

    /**
     * @brief Recomputes connected components with union-find. Component ids are ordered by their smallest spot index.
     */
    void compute_components();

    const std::vector<std::vector<int>> &components() const { return components_; }
    int component_of(const int node) const { return component_of_.at(node); }
};

/**
 * @brief Connect every pair of spots from different rounds not farther than `search_radius`, then compute connected
 * components.
 */
CandidateGraph build_candidate_graph(std::vector<base::Spot> spots, const int round_count, const float search_radius);

/**
 * @brief Inside every connected component, connect spots of consecutive rounds (r, r + 1) that are not farther than
 * `search_radius_max`. Spots of different components are never examined, so components stay as they are.
 *
 * @return number of added edges
 */
int repair_connectivity(CandidateGraph &graph, const float search_radius_max);
}  // namespace graph
