#pragma once

#include "parkgen/geometry.hpp"
#include "parkgen/layout.hpp"
#include "parkgen/layout_decoder.hpp"
#include "parkgen/params.hpp"

namespace parkgen_test {

inline parkgen::Polygon rect(double x0, double y0, double x1, double y1) {
    return parkgen::Polygon{{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

// 20 ha rectangular site with a highway 30 m south of it.
struct Scenario {
    parkgen::Polygon boundary = rect(0.0, 0.0, 500.0, 400.0);
    parkgen::Polyline highway{{-100.0, -30.0}, {600.0, -30.0}};
    parkgen::ParameterSet params;

    Scenario() {
        params.lot_area_target = 1200.0;
        params.min_lot_count = 50;
    }

    parkgen::DecodeContext context() const { return parkgen::prepare_decode(boundary, &highway, params); }

    parkgen::CandidateLayout decode(const parkgen::Genome& g = parkgen::Genome{}) const {
        return parkgen::decode_layout(context(), g, params);
    }
};

inline bool same_polygon(const parkgen::Polygon& a, const parkgen::Polygon& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].x != b[i].x || a[i].y != b[i].y) {
            return false;
        }
    }
    return true;
}

}  // namespace parkgen_test
