#include "sequence_selector.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include <boost/graph/adjacency_list.hpp>
// find_flow_cost.hpp relies on declarations from the solver header
#include <boost/graph/successive_shortest_path_nonnegative_weights.hpp>
#include <boost/graph/find_flow_cost.hpp>
#include <spdlog/spdlog.h>

namespace
{
// arc costs are whole multiples of 1/kCostScale distance units, so reduced costs in the solver stay exact
constexpr double kCostScale = 1000.0;

using Traits = boost::adjacency_list_traits<boost::vecS, boost::vecS, boost::directedS>;
using FlowGraph = boost::adjacency_list<
    boost::vecS, boost::vecS, boost::directedS, boost::no_property,
    boost::property<boost::edge_capacity_t, long,
                    boost::property<boost::edge_residual_capacity_t, long,
                                    boost::property<boost::edge_reverse_t, Traits::edge_descriptor,
                                                    boost::property<boost::edge_weight_t, double>>>>>;
using Arc = boost::graph_traits<FlowGraph>::edge_descriptor;

/**
 * @brief Unit capacity network: vertex 0 is the source, 1 the sink, then an (in, out) vertex pair per spot.
 */
class FlowNetwork
{
   private:
    FlowGraph graph_;

   public:
    static constexpr int kSource = 0;
    static constexpr int kSink = 1;

    explicit FlowNetwork(const size_t spot_count) : graph_(2 + 2 * spot_count) {}

    static int in_vertex(const int local_spot) { return 2 + 2 * local_spot; }
    static int out_vertex(const int local_spot) { return 3 + 2 * local_spot; }

    Arc add_arc(const int from, const int to, const double cost)
    {
        auto capacity = boost::get(boost::edge_capacity, graph_);
        auto reverse = boost::get(boost::edge_reverse, graph_);
        auto weight = boost::get(boost::edge_weight, graph_);

        const Arc arc = boost::add_edge(from, to, graph_).first;
        const Arc reverse_arc = boost::add_edge(to, from, graph_).first;

        capacity[arc] = 1;
        capacity[reverse_arc] = 0;
        reverse[arc] = reverse_arc;
        reverse[reverse_arc] = arc;
        weight[arc] = cost;
        weight[reverse_arc] = -cost;
        return arc;
    }

    void solve() { boost::successive_shortest_path_nonnegative_weights(graph_, kSource, kSink); }

    bool has_flow(const Arc &arc) const
    {
        return boost::get(boost::edge_capacity, graph_, arc) - boost::get(boost::edge_residual_capacity, graph_, arc) >
               0;
    }

    double total_cost() const { return boost::find_flow_cost(graph_); }
};

struct Transition
{
    Arc arc_;
    int next_;
    float cost_;
};
}  // namespace

namespace graph
{
float transition_cost(const float distance, const float quality_a, const float quality_b, const float quality_weight)
{
    return distance - quality_weight * (quality_a + quality_b);
}

std::vector<int> consecutive_round_edges(const CandidateGraph &graph, const int component)
{
    std::vector<int> kept;
    for (const int node : graph.components().at(component))
    {
        for (const int edge_idx : graph.incident(node))
        {
            const auto &edge = graph.edges()[edge_idx];
            // every edge is listed by both of its spots
            if (edge.from_ != node)
            {
                continue;
            }
            if (std::abs(graph.spots()[edge.from_].round_ - graph.spots()[edge.to_].round_) == 1)
            {
                kept.emplace_back(edge_idx);
            }
        }
    }
    std::sort(kept.begin(), kept.end());
    return kept;
}

std::vector<base::DecodedSequence> select_sequences(const CandidateGraph &graph, const int component,
                                                    const float quality_weight)
{
    std::vector<base::DecodedSequence> sequences;

    const auto &members = graph.components().at(component);
    const auto &spots = graph.spots();
    const int last_round = graph.round_count() - 1;
    if (last_round < 1)
    {
        return sequences;
    }

    std::unordered_map<int, int> local_of;
    bool has_first_round = false;
    bool has_last_round = false;
    for (int local = 0; local < int(members.size()); ++local)
    {
        local_of.emplace(members[local], local);
        has_first_round |= spots[members[local]].round_ == 0;
        has_last_round |= spots[members[local]].round_ == last_round;
    }
    if (!has_first_round || !has_last_round)
    {
        spdlog::debug("component {}: {} spots do not span rounds 0 to {}", component, members.size(), last_round);
        return sequences;
    }

    FlowNetwork network(members.size());

    std::vector<std::optional<Arc>> source_arcs(members.size());
    std::vector<std::optional<Arc>> sink_arcs(members.size());
    for (int local = 0; local < int(members.size()); ++local)
    {
        const int round = spots[members[local]].round_;
        network.add_arc(FlowNetwork::in_vertex(local), FlowNetwork::out_vertex(local), 0.0);
        if (round == 0)
        {
            source_arcs[local] = network.add_arc(FlowNetwork::kSource, FlowNetwork::in_vertex(local), 0.0);
        }
        if (round == last_round)
        {
            sink_arcs[local] = network.add_arc(FlowNetwork::out_vertex(local), FlowNetwork::kSink, 0.0);
        }
    }

    const float shift = 2.0f * quality_weight;
    std::vector<std::vector<Transition>> transitions(members.size());
    for (const int edge_idx : consecutive_round_edges(graph, component))
    {
        const auto &edge = graph.edges()[edge_idx];
        int lower = local_of.at(edge.from_);
        int upper = local_of.at(edge.to_);
        if (spots[edge.from_].round_ > spots[edge.to_].round_)
        {
            std::swap(lower, upper);
        }

        const float cost = transition_cost(edge.distance_, spots[edge.from_].quality_, spots[edge.to_].quality_,
                                           quality_weight);
        const double scaled_cost = std::max(0.0, std::round(double(cost + shift) * kCostScale));

        const Arc arc = network.add_arc(FlowNetwork::out_vertex(lower), FlowNetwork::in_vertex(upper), scaled_cost);
        transitions[lower].push_back(Transition{arc, upper, cost});
    }

    network.solve();

    for (int first = 0; first < int(members.size()); ++first)
    {
        if (!source_arcs[first].has_value() || !network.has_flow(*source_arcs[first]))
        {
            continue;
        }

        std::vector<int> path{members[first]};
        float path_cost = 0.0f;
        int current = first;
        while (spots[members[current]].round_ != last_round)
        {
            const auto next = std::find_if(transitions[current].begin(), transitions[current].end(),
                                           [&network](const Transition &transition)
                                           { return network.has_flow(transition.arc_); });
            if (next == transitions[current].end())
            {
                throw std::logic_error(
                    std::format("component {}: flow enters spot {} but does not leave it", component, members[current]));
            }
            path_cost += next->cost_;
            current = next->next_;
            path.emplace_back(members[current]);
        }

        if (!sink_arcs[current].has_value() || !network.has_flow(*sink_arcs[current]))
        {
            throw std::logic_error(
                std::format("component {}: path ending at spot {} does not reach the sink", component,
                            members[current]));
        }
        sequences.emplace_back(component, path, path_cost);
    }

    spdlog::debug("component {}: {} spots, {} sequences, flow cost {}", component, members.size(), sequences.size(),
                  network.total_cost() / kCostScale);
    return sequences;
}

float sequence_spread(const CandidateGraph &graph, const base::DecodedSequence &sequence)
{
    float spread = 0.0f;
    for (size_t a = 0; a < sequence.spots_.size(); ++a)
    {
        for (size_t b = a + 1; b < sequence.spots_.size(); ++b)
        {
            const auto &position_a = graph.spots().at(sequence.spots_[a]).position_;
            const auto &position_b = graph.spots().at(sequence.spots_[b]).position_;
            spread = std::max(spread, (position_a - position_b).norm());
        }
    }
    return spread;
}

int drop_spread_sequences(const CandidateGraph &graph, std::vector<base::DecodedSequence> &sequences,
                          const float search_radius_max)
{
    const auto first_dropped =
        std::remove_if(sequences.begin(), sequences.end(),
                       [&graph, search_radius_max](const base::DecodedSequence &sequence)
                       { return sequence_spread(graph, sequence) > search_radius_max; });
    const int dropped = int(std::distance(first_dropped, sequences.end()));
    sequences.erase(first_dropped, sequences.end());
    return dropped;
}
}  // namespace graph
