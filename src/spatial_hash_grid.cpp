#include "parkgen/spatial_hash_grid.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace parkgen {

SpatialHashGrid::SpatialHashGrid(double cell_size) : cell_size_(cell_size) {
    if (!(cell_size_ > 0.0)) {
        throw std::invalid_argument("SpatialHashGrid: cell_size must be > 0");
    }
}

void SpatialHashGrid::reserve_ids(std::size_t n) {
    id_present_.resize(n, false);
    seen_.resize(n, 0);
}

std::int64_t SpatialHashGrid::coord_to_cell(double v, double cell_size) {
    return static_cast<std::int64_t>(std::floor(v / cell_size));
}

std::vector<SpatialHashGrid::CellKey> SpatialHashGrid::cells_for_box(const BoundingBox& box, double margin) const {
    const double m = (margin >= 0.0) ? margin : 0.0;
    const std::int64_t ix0 = coord_to_cell(box.min_x - m, cell_size_);
    const std::int64_t ix1 = coord_to_cell(box.max_x + m, cell_size_);
    const std::int64_t iy0 = coord_to_cell(box.min_y - m, cell_size_);
    const std::int64_t iy1 = coord_to_cell(box.max_y + m, cell_size_);

    std::vector<CellKey> keys;
    keys.reserve(static_cast<size_t>((ix1 - ix0 + 1) * (iy1 - iy0 + 1)));
    for (std::int64_t ix = ix0; ix <= ix1; ++ix) {
        for (std::int64_t iy = iy0; iy <= iy1; ++iy) {
            keys.push_back(CellKey{ix, iy});
        }
    }
    return keys;
}

void SpatialHashGrid::insert(int id, const BoundingBox& box) {
    if (id < 0) {
        throw std::invalid_argument("SpatialHashGrid::insert: id must be >= 0");
    }
    const size_t uid = static_cast<size_t>(id);
    if (uid >= id_present_.size()) {
        reserve_ids(uid + 1);
    }
    if (id_present_[uid]) {
        throw std::runtime_error("SpatialHashGrid::insert: id already present");
    }

    for (const auto& k : cells_for_box(box, 0.0)) {
        cells_[k].push_back(id);
    }
    id_present_[uid] = true;
}

void SpatialHashGrid::query_into(std::vector<int>& out, const BoundingBox& box, double margin) const {
    out.clear();

    // Prevent stamp overflow from breaking dedupe.
    if (++stamp_ == 0) {
        std::fill(seen_.begin(), seen_.end(), 0);
        stamp_ = 1;
    }

    for (const auto& k : cells_for_box(box, margin)) {
        auto it = cells_.find(k);
        if (it == cells_.end()) {
            continue;
        }
        for (const int id : it->second) {
            const size_t uid = static_cast<size_t>(id);
            if (seen_[uid] == stamp_) {
                continue;
            }
            seen_[uid] = stamp_;
            out.push_back(id);
        }
    }
    std::sort(out.begin(), out.end());
}

double suggested_cell_size(const std::vector<Polygon>& polys) {
    double acc = 0.0;
    size_t n = 0;
    for (const auto& p : polys) {
        if (p.empty()) {
            continue;
        }
        const BoundingBox bb = polygon_bbox(p);
        acc += std::max(bb.width(), bb.height());
        ++n;
    }
    if (n == 0) {
        return 1.0;
    }
    return std::max(1.0, acc / static_cast<double>(n));
}

}  // namespace parkgen
