#include "debug.hpp"

#include <format>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

#include <happly.h>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

namespace
{
constexpr int kDebugJsonIndent = 4;

static constexpr std::string_view kRed("red");
static constexpr std::string_view kGreen("green");
static constexpr std::string_view kBlue("blue");

const std::unordered_map<int, std::string_view> kMatTypeToExtension{
    {CV_8UC1, ".png"},   {CV_8UC3, ".png"},   {CV_8UC4, ".png"},   {CV_16UC1, ".tiff"},
    {CV_16UC3, ".tiff"}, {CV_16SC1, ".tiff"}, {CV_32SC1, ".tiff"}, {CV_32SC3, ".tiff"},
    {CV_32FC1, ".tiff"}, {CV_32FC3, ".tiff"}, {CV_64FC1, ".tiff"}, {CV_64FC3, ".tiff"},
};
}  // namespace

namespace io
{
void debug::save_image(const cv::Mat& image, const std::filesystem::path& name, const std::filesystem::path& subdir)
{
    const std::filesystem::path dir_path = debug_save_path() / subdir;
    std::filesystem::create_directories(dir_path);

    std::filesystem::path full_filepath = (dir_path / name);
    full_filepath.replace_extension(kMatTypeToExtension.at(image.type()));
    spdlog::info("Saving image to {}", full_filepath.string());

    if (!cv::imwrite(full_filepath.string(), image))
    {
        spdlog::error("Could not write image {}", full_filepath.string());
    }
}

void debug::save_json(const nlohmann::json& json, std::filesystem::path name, const std::filesystem::path& subdir)
{
    const std::filesystem::path dir_path = debug_save_path() / subdir;
    std::filesystem::create_directories(dir_path);
    name.replace_extension(".json");
    spdlog::info("Saving json to '{}'", (dir_path / name).string());
    std::ofstream file(dir_path / name);
    file << json.dump(kDebugJsonIndent);
}

namespace debug
{
int HapplyWrapper::add_point(const Eigen::Vector3d& point, const Color& color)
{
    x_.emplace_back(point(0));
    y_.emplace_back(point(1));
    z_.emplace_back(point(2));

    red_.emplace_back(color(0));
    green_.emplace_back(color(1));
    blue_.emplace_back(color(2));
    return int(x_.size()) - 1;
}

void HapplyWrapper::add_edge(const int vertex1, const int vertex2)
{
    const int count = int(x_.size());
    if (vertex1 < 0 || vertex1 >= count || vertex2 < 0 || vertex2 >= count)
    {
        throw std::out_of_range(
            std::format("Edge ({}, {}) references a point outside of the {} added ones.", vertex1, vertex2, count));
    }
    edges_.push_back({vertex1, vertex2});
}

void HapplyWrapper::add_vertices(happly::PLYData& ply_out) const
{
    ply_out.addElement(std::string(kVertexName), x_.size());

    auto& vertices = ply_out.getElement(std::string(kVertexName));
    vertices.addProperty<double>(std::string(kVertexX), x_);
    vertices.addProperty<double>(std::string(kVertexY), y_);
    vertices.addProperty<double>(std::string(kVertexZ), z_);
    vertices.addProperty<unsigned char>(std::string(kRed), red_);
    vertices.addProperty<unsigned char>(std::string(kGreen), green_);
    vertices.addProperty<unsigned char>(std::string(kBlue), blue_);
}

void HapplyWrapper::add_edges(happly::PLYData& ply_out) const
{
    std::vector<int> vertices_1(edges_.size());
    std::vector<int> vertices_2(edges_.size());
    for (size_t idx = 0; idx < edges_.size(); ++idx)
    {
        vertices_1[idx] = edges_[idx][0];
        vertices_2[idx] = edges_[idx][1];
    }
    ply_out.addElement(std::string(kEdgeName), edges_.size());
    ply_out.getElement(std::string(kEdgeName)).addProperty<int>(std::string(kEdgeVertexIdx1), vertices_1);
    ply_out.getElement(std::string(kEdgeName)).addProperty<int>(std::string(kEdgeVertexIdx2), vertices_2);
}

void HapplyWrapper::save(std::filesystem::path name, const std::filesystem::path& subdir,
                         const std::filesystem::path& root_dir) const
{
    happly::PLYData ply_out;

    add_vertices(ply_out);
    add_edges(ply_out);

    const std::filesystem::path dir_path = root_dir / subdir;
    std::filesystem::create_directories(dir_path);
    name.replace_extension(".ply");

    spdlog::debug("Saving graph: {}", (dir_path / name).string());
    ply_out.write((dir_path / name).string(), happly::DataFormat::ASCII);
}
}  // namespace debug
}  // namespace io
