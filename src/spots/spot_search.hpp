#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include <Eigen/Core>

namespace spots
{
/**
 * @brief Uniform grid over a point set. Every point is scattered into the cell containing it, so a radius query only
 * visits the cells overlapping the query ball.
 */
class SpotSearch
{
   private:
    float cell_size_;

    Eigen::Vector3f min_corner_;

    const std::vector<Eigen::Vector3f> positions_;

    std::unordered_map<std::int64_t, std::vector<int>> tiled_spots_;

    // floored cell coordinates, still in float so that far away points can be range checked before the int cast
    Eigen::Vector3f cell_of(const Eigen::Vector3f &point) const;

   public:
    SpotSearch(const std::vector<Eigen::Vector3f> &positions, const float cell_size);

    /**
     * @brief Indices of all points with distance to `point` not larger than `radius`, in increasing index order.
     */
    std::vector<int> within_radius(const Eigen::Vector3f &point, const float radius) const;

    /**
     * @brief Same as within_radius, but only returns indices larger than `idx` so that every unordered pair of the
     * indexed set is reported once.
     */
    std::vector<int> pairs_from(const int idx, const float radius) const;

    size_t size() const { return positions_.size(); }
};
}  // namespace spots
