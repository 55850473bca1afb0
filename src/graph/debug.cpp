#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include <opencv2/imgproc.hpp>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "io/debug.hpp"

namespace
{
// rounds are drawn this far apart in the PLY export [pixel]
constexpr double kRoundSpacing = 10.0;

cv::Scalar round_color(const int round, const int round_count)
{
    // hue in OpenCV is [0, 180)
    const int hue = round_count > 0 ? 150 * round / std::max(1, round_count - 1) : 0;
    cv::Mat3b hsv(1, 1, cv::Vec3b(uchar(hue), 255, 255));
    cv::Mat3b bgr;
    cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
    return cv::Scalar(bgr(0, 0)[0], bgr(0, 0)[1], bgr(0, 0)[2]);
}

cv::Point to_point(const Eigen::Vector3f &position)
{
    return cv::Point(int(std::lround(position.x())), int(std::lround(position.y())));
}

Eigen::Vector3d stacked_position(const base::Spot &spot)
{
    return Eigen::Vector3d(spot.position_.x(), spot.position_.y(), spot.position_.z() + kRoundSpacing * spot.round_);
}
}  // namespace

namespace graph::debug
{
void save_decoding_overlay(const cv::Mat1f &max_projection, const CandidateGraph &graph,
                           const std::vector<base::DecodedSequence> &sequences)
{
    cv::Mat1b gray;
    cv::normalize(max_projection, gray, 0, 255, cv::NORM_MINMAX, CV_8U);
    cv::Mat3b painted;
    cv::cvtColor(gray, painted, cv::COLOR_GRAY2BGR);

    const auto &spots = graph.spots();
    for (const auto &edge : graph.edges())
    {
        cv::line(painted, to_point(spots[edge.from_].position_), to_point(spots[edge.to_].position_),
                 cv::Scalar(90, 90, 90));
    }

    for (const auto &sequence : sequences)
    {
        for (size_t idx = 1; idx < sequence.spots_.size(); ++idx)
        {
            cv::line(painted, to_point(spots[sequence.spots_[idx - 1]].position_),
                     to_point(spots[sequence.spots_[idx]].position_), cv::Scalar(255, 255, 255));
        }
        const auto &first = spots[sequence.spots_.front()];
        cv::putText(painted, std::to_string(sequence.component_), to_point(first.position_) + cv::Point(3, -3),
                    cv::FONT_HERSHEY_PLAIN, 1.0, cv::Scalar(255, 0, 255));
    }

    for (const auto &spot : spots)
    {
        cv::circle(painted, to_point(spot.position_), std::max(1, int(std::lround(spot.radius_))),
                   round_color(spot.round_, graph.round_count()));
    }

    io::debug::save_image(painted, "decoding", kGraphSubdir);
}

void save_graph_ply(const CandidateGraph &graph, const std::vector<base::DecodedSequence> &sequences)
{
    io::debug::HapplyWrapper graph_ply;
    for (const auto &spot : graph.spots())
    {
        const cv::Scalar color = round_color(spot.round_, graph.round_count());
        // BGR -> RGB
        graph_ply.add_point(stacked_position(spot), io::debug::Color(uchar(color[2]), uchar(color[1]), uchar(color[0])));
    }
    for (const auto &edge : graph.edges())
    {
        graph_ply.add_edge(edge.from_, edge.to_);
    }
    graph_ply.save("candidate_graph", kGraphSubdir);

    io::debug::HapplyWrapper sequences_ply;
    for (const auto &sequence : sequences)
    {
        int previous = -1;
        for (const int spot_idx : sequence.spots_)
        {
            const int current = sequences_ply.add_point(stacked_position(graph.spots()[spot_idx]));
            if (previous >= 0)
            {
                sequences_ply.add_edge(previous, current);
            }
            previous = current;
        }
    }
    sequences_ply.save("sequences", kGraphSubdir);
}

void save_graph_json(const CandidateGraph &graph, const std::vector<base::DecodedSequence> &sequences)
{
    nlohmann::json json;

    nlohmann::json spots_json = nlohmann::json::array();
    for (int node = 0; node < int(graph.spots().size()); ++node)
    {
        const auto &spot = graph.spots()[node];
        spots_json.push_back({{"round", spot.round_},
                              {"channel", spot.channel_},
                              {"x", spot.position_.x()},
                              {"y", spot.position_.y()},
                              {"z", spot.position_.z()},
                              {"quality", spot.quality_},
                              {"component", graph.component_of(node)}});
    }

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto &edge : graph.edges())
    {
        edges_json.push_back({{"from", edge.from_}, {"to", edge.to_}, {"distance", edge.distance_}});
    }

    nlohmann::json sequences_json = nlohmann::json::array();
    for (const auto &sequence : sequences)
    {
        sequences_json.push_back(
            {{"component", sequence.component_}, {"spots", sequence.spots_}, {"cost", sequence.cost_}});
    }

    json["spots"] = std::move(spots_json);
    json["edges"] = std::move(edges_json);
    json["sequences"] = std::move(sequences_json);
    io::debug::save_json(json, "candidate_graph", kGraphSubdir);
}
}  // namespace graph::debug
