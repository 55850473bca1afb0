#include "candidate_graph.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

#include <boost/pending/disjoint_sets.hpp>
#include <spdlog/spdlog.h>

#include "spots/spot_search.hpp"

namespace
{
std::vector<Eigen::Vector3f> positions_of(const std::vector<base::Spot> &spots)
{
    std::vector<Eigen::Vector3f> positions;
    positions.reserve(spots.size());
    for (const auto &spot : spots)
    {
        positions.emplace_back(spot.position_);
    }
    return positions;
}
}  // namespace

namespace graph
{
Edge::Edge(const int from, const int to, const float distance) : from_(from), to_(to), distance_(distance) {}

CandidateGraph::CandidateGraph(std::vector<base::Spot> spots, const int round_count)
    : spots_(std::move(spots)), round_count_(round_count), incident_(spots_.size())
{
    for (const auto &spot : spots_)
    {
        if (spot.round_ < 0 || spot.round_ >= round_count_)
        {
            throw std::invalid_argument(std::format("Spot round {} outside of [0, {}).", spot.round_, round_count_));
        }
    }
    compute_components();
}

std::uint64_t CandidateGraph::edge_key(const int from, const int to)
{
    return (std::uint64_t(std::uint32_t(from)) << 32) | std::uint64_t(std::uint32_t(to));
}

bool CandidateGraph::connected(const int node_a, const int node_b) const
{
    return edge_keys_.contains(edge_key(std::min(node_a, node_b), std::max(node_a, node_b)));
}

bool CandidateGraph::add_edge(const int node_a, const int node_b)
{
    const int from = std::min(node_a, node_b);
    const int to = std::max(node_a, node_b);
    if (spots_.at(from).round_ == spots_.at(to).round_)
    {
        return false;
    }
    if (!edge_keys_.insert(edge_key(from, to)).second)
    {
        return false;
    }

    const float distance = (spots_[from].position_ - spots_[to].position_).norm();
    incident_[from].emplace_back(int(edges_.size()));
    incident_[to].emplace_back(int(edges_.size()));
    edges_.emplace_back(from, to, distance);
    return true;
}

void CandidateGraph::compute_components()
{
    component_of_.assign(spots_.size(), -1);
    components_.clear();
    if (spots_.empty())
    {
        return;
    }

    std::vector<int> rank(spots_.size());
    std::vector<int> parent(spots_.size());
    boost::disjoint_sets<int *, int *> disjoint_sets(rank.data(), parent.data());
    for (int node = 0; node < int(spots_.size()); ++node)
    {
        disjoint_sets.make_set(node);
    }
    for (const auto &edge : edges_)
    {
        disjoint_sets.union_set(edge.from_, edge.to_);
    }

    std::vector<int> component_of_root(spots_.size(), -1);
    for (int node = 0; node < int(spots_.size()); ++node)
    {
        const int root = disjoint_sets.find_set(node);
        if (component_of_root[root] < 0)
        {
            component_of_root[root] = int(components_.size());
            components_.emplace_back();
        }
        component_of_[node] = component_of_root[root];
        components_[component_of_root[root]].emplace_back(node);
    }
}

CandidateGraph build_candidate_graph(std::vector<base::Spot> spots, const int round_count, const float search_radius)
{
    if (!std::isfinite(search_radius) || search_radius <= 0.0f)
    {
        throw std::invalid_argument(std::format("search_radius must be positive, got {}.", search_radius));
    }

    CandidateGraph graph(std::move(spots), round_count);
    if (graph.spots().empty())
    {
        spdlog::info("no spots, empty candidate graph");
        return graph;
    }

    const spots::SpotSearch search(positions_of(graph.spots()), search_radius);
    for (int node = 0; node < int(graph.spots().size()); ++node)
    {
        for (const int other : search.pairs_from(node, search_radius))
        {
            graph.add_edge(node, other);
        }
    }
    graph.compute_components();

    spdlog::info("candidate graph: {} spots, {} edges, {} components", graph.spots().size(), graph.edges().size(),
                 graph.components().size());
    return graph;
}

int repair_connectivity(CandidateGraph &graph, const float search_radius_max)
{
    if (graph.spots().empty())
    {
        return 0;
    }

    const spots::SpotSearch search(positions_of(graph.spots()), search_radius_max);

    int added = 0;
    for (int node = 0; node < int(graph.spots().size()); ++node)
    {
        const int round = graph.spots()[node].round_;
        const int component = graph.component_of(node);
        for (const int other : search.pairs_from(node, search_radius_max))
        {
            if (graph.component_of(other) != component)
            {
                continue;
            }
            if (std::abs(graph.spots()[other].round_ - round) != 1)
            {
                continue;
            }
            if (graph.add_edge(node, other))
            {
                ++added;
            }
        }
    }

    spdlog::info("connectivity repair: added {} edges within {} components (search_radius_max {})", added,
                 graph.components().size(), search_radius_max);
    return added;
}
}  // namespace graph
