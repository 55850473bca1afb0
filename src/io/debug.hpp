#pragma once

/* @brief This file provides functions meant for debugging only. All files are saved in `save_path()/debug` unless
 * another root directory is given.
 */

#include <array>
#include <filesystem>
#include <string_view>
#include <vector>

#include <Eigen/Core>
#include <nlohmann/json.hpp>
#include <opencv2/core/mat.hpp>

#include "save_path.hpp"

namespace happly
{
class PLYData;
}

namespace io
{
static constexpr std::string_view kVertexName("vertex");
static constexpr std::string_view kVertexX("x");
static constexpr std::string_view kVertexY("y");
static constexpr std::string_view kVertexZ("z");
static constexpr std::string_view kEdgeName("edge");
static constexpr std::string_view kEdgeVertexIdx1("vertex1");
static constexpr std::string_view kEdgeVertexIdx2("vertex2");
}  // namespace io

namespace io::debug
{
using Color = Eigen::Matrix<unsigned char, 3, 1>;

/* @brief Saves an image, the extension is chosen from the matrix type.
 * @param name Name of the file, without extension.
 * @param subdir Optional subdirectory for the created file.
 */
void save_image(const cv::Mat& image, const std::filesystem::path& name,
                const std::filesystem::path& subdir = std::filesystem::path());

/* @brief Saves a json to a file.
 * @param name Name of the file, without extension.
 * @param subdir Optional subdirectory for the created file.
 */
void save_json(const nlohmann::json& json, std::filesystem::path name,
               const std::filesystem::path& subdir = std::filesystem::path());

/**
 * @brief Collects colored points and edges and writes them as a PLY file, e.g. to inspect a candidate graph in
 * MeshLab or CloudCompare.
 */
class HapplyWrapper
{
   private:
    std::vector<double> x_, y_, z_;
    std::vector<unsigned char> red_, green_, blue_;

    // edges reference already added points
    std::vector<std::array<int, 2>> edges_;

   public:
    /**
     * @brief Add a point, returns its index to be used by `add_edge`.
     */
    int add_point(const Eigen::Vector3d& point, const Color& color = Color::Constant(255));

    /**
     * @brief Connect two points returned by `add_point`.
     * @throws std::out_of_range if an index does not name an added point
     */
    void add_edge(const int vertex1, const int vertex2);

    size_t point_count() const { return x_.size(); }
    size_t edge_count() const { return edges_.size(); }

    /**
     * @param name Name of the file, without extension (.ply is added by our code).
     * @param subdir Optional subdirectory for the created file.
     * @param root_dir Optional directory for the created subdirectory.
     */
    void save(std::filesystem::path name, const std::filesystem::path& subdir = "",
              const std::filesystem::path& root_dir = debug_save_path()) const;

   private:
    void add_vertices(happly::PLYData& ply_out) const;
    void add_edges(happly::PLYData& ply_out) const;
};
}  // namespace io::debug
