#include "spot_search.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace
{
// 21 bits per axis, cells are counted from the minimal corner so they are never negative
constexpr std::int64_t kAxisBits = 21;
constexpr std::int64_t kAxisMask = (std::int64_t(1) << kAxisBits) - 1;

std::int64_t pack_cell(const Eigen::Vector3i &cell)
{
    return (std::int64_t(cell(2)) << (2 * kAxisBits)) | (std::int64_t(cell(1)) << kAxisBits) | std::int64_t(cell(0));
}

Eigen::Vector3f find_min_coordinates(const std::vector<Eigen::Vector3f> &positions)
{
    Eigen::Vector3f min_corner = Eigen::Vector3f::Constant(std::numeric_limits<float>::max());
    for (const auto &position : positions)
    {
        min_corner = min_corner.cwiseMin(position);
    }
    if (positions.empty())
    {
        min_corner.setZero();
    }
    return min_corner;
}

std::unordered_map<std::int64_t, std::vector<int>> scatter_to_tiles(const std::vector<Eigen::Vector3f> &positions,
                                                                    const Eigen::Vector3f &min_corner,
                                                                    const float cell_size)
{
    std::unordered_map<std::int64_t, std::vector<int>> tiled_spots;

    for (int idx = 0; idx < int(positions.size()); ++idx)
    {
        const Eigen::Vector3f cell = ((positions[idx] - min_corner) / cell_size).array().floor();
        if (!cell.allFinite() || (cell.array() > float(kAxisMask)).any())
        {
            throw std::invalid_argument(
                std::format("Spot extent too large for search cell size {}. Use a larger radius.", cell_size));
        }
        tiled_spots[pack_cell(cell.cast<int>())].emplace_back(idx);
    }

    return tiled_spots;
}
}  // namespace

namespace spots
{
SpotSearch::SpotSearch(const std::vector<Eigen::Vector3f> &positions, const float cell_size)
    : cell_size_(cell_size), positions_(positions)
{
    if (!(cell_size_ > 0.0f) || !std::isfinite(cell_size_))
    {
        throw std::invalid_argument(std::format("Search cell size must be positive, got {}.", cell_size_));
    }

    min_corner_ = find_min_coordinates(positions_);
    tiled_spots_ = scatter_to_tiles(positions_, min_corner_, cell_size_);
}

Eigen::Vector3f SpotSearch::cell_of(const Eigen::Vector3f &point) const
{
    return ((point - min_corner_) / cell_size_).array().floor();
}

std::vector<int> SpotSearch::within_radius(const Eigen::Vector3f &point, const float radius) const
{
    std::vector<int> found;
    if (positions_.empty() || radius < 0.0f)
    {
        return found;
    }

    // no indexed cell lies outside [0, kAxisMask] on any axis
    const float reach_cells = std::min(std::ceil(radius / cell_size_), float(kAxisMask));
    const Eigen::Vector3f center_cell = cell_of(point);
    if (!center_cell.allFinite() || (center_cell.array() + reach_cells < 0.0f).any() ||
        (center_cell.array() - reach_cells > float(kAxisMask)).any())
    {
        return found;
    }

    const int reach = int(reach_cells);
    const Eigen::Vector3i center = center_cell.cast<int>();
    const float radius_squared = radius * radius;

    for (int z = center(2) - reach; z <= center(2) + reach; ++z)
    {
        for (int y = center(1) - reach; y <= center(1) + reach; ++y)
        {
            for (int x = center(0) - reach; x <= center(0) + reach; ++x)
            {
                if (x < 0 || y < 0 || z < 0 || x > kAxisMask || y > kAxisMask || z > kAxisMask)
                {
                    continue;
                }
                const auto tile = tiled_spots_.find(pack_cell(Eigen::Vector3i(x, y, z)));
                if (tile == tiled_spots_.end())
                {
                    continue;
                }
                for (const int spot_id : tile->second)
                {
                    if ((positions_[spot_id] - point).squaredNorm() <= radius_squared)
                    {
                        found.emplace_back(spot_id);
                    }
                }
            }
        }
    }

    std::sort(found.begin(), found.end());
    return found;
}

std::vector<int> SpotSearch::pairs_from(const int idx, const float radius) const
{
    std::vector<int> found = within_radius(positions_.at(idx), radius);
    found.erase(std::remove_if(found.begin(), found.end(), [idx](const int other) { return other <= idx; }),
                found.end());
    return found;
}
}  // namespace spots
