#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "parkgen/geometry.hpp"

namespace parkgen {

// Uniform hash grid over axis-aligned boxes; used to find candidate polygon pairs
// (overlap and clearance checks) without an all-pairs sweep.
class SpatialHashGrid {
public:
    struct CellKey {
        std::int64_t ix = 0;
        std::int64_t iy = 0;

        bool operator==(const CellKey& other) const { return ix == other.ix && iy == other.iy; }
    };

    struct CellKeyHash {
        std::size_t operator()(const CellKey& k) const noexcept {
            const std::uint64_t x = static_cast<std::uint64_t>(k.ix);
            const std::uint64_t y = static_cast<std::uint64_t>(k.iy);
            std::uint64_t h = x * 0x9E3779B97F4A7C15ULL;
            h ^= y + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
            return static_cast<std::size_t>(h);
        }
    };

    explicit SpatialHashGrid(double cell_size);

    void insert(int id, const BoundingBox& box);

    // Candidate IDs whose cells touch the query box grown by `margin`. Deduplicated.
    void query_into(std::vector<int>& out, const BoundingBox& box, double margin = 0.0) const;

    double cell_size() const { return cell_size_; }

private:
    double cell_size_ = 1.0;

    std::unordered_map<CellKey, std::vector<int>, CellKeyHash> cells_;
    std::vector<bool> id_present_;

    mutable std::vector<std::uint32_t> seen_;
    mutable std::uint32_t stamp_ = 1;

    void reserve_ids(std::size_t n);
    std::vector<CellKey> cells_for_box(const BoundingBox& box, double margin) const;
    static std::int64_t coord_to_cell(double v, double cell_size);
};

// Sensible cell size for a set of polygons: mean bbox extent, at least 1.
double suggested_cell_size(const std::vector<Polygon>& polys);

}  // namespace parkgen
