#include "geometry.hpp"
#include <range/v3/all.hpp>
#include <cmath>
#include <limits>
#include <algorithm>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;
namespace bg = boost::geometry;

namespace {

    double angle_between(const pbn::point& u, const pbn::point& v) {
        auto cross = u.x * v.y - u.y * v.x;
        auto dot = u.x * v.x + u.y * v.y;
        return std::abs(std::atan2(cross, dot));
    }

    bool is_zero_length(const pbn::point& v) {
        return v.x == 0.0 && v.y == 0.0;
    }
}

pbn::bounding_box::bounding_box() :
    min_x(std::numeric_limits<int>::max()),
    min_y(std::numeric_limits<int>::max()),
    max_x(std::numeric_limits<int>::min()),
    max_y(std::numeric_limits<int>::min())
{}

pbn::bounding_box::bounding_box(int x1, int y1, int x2, int y2) :
    min_x(x1), min_y(y1), max_x(x2), max_y(y2)
{}

bool pbn::bounding_box::empty() const {
    return max_x < min_x || max_y < min_y;
}

int pbn::bounding_box::width() const {
    return empty() ? 0 : max_x - min_x + 1;
}

int pbn::bounding_box::height() const {
    return empty() ? 0 : max_y - min_y + 1;
}

void pbn::bounding_box::extend(const int_point& pt) {
    min_x = std::min(min_x, pt.x);
    min_y = std::min(min_y, pt.y);
    max_x = std::max(max_x, pt.x);
    max_y = std::max(max_y, pt.y);
}

bool pbn::bounding_box::contains(const int_point& pt) const {
    return pt.x >= min_x && pt.x <= max_x && pt.y >= min_y && pt.y <= max_y;
}

cv::Rect pbn::bounding_box::to_rect() const {
    return { min_x, min_y, width(), height() };
}

pbn::polygon pbn::make_polygon(const ring& outer, const std::vector<ring>& inners) {
    polygon poly;
    poly.outer() = outer;
    for (const auto& hole : inners) {
        poly.inners().push_back(hole);
    }
    bg::correct(poly);
    return poly;
}

pbn::ring pbn::make_ring(std::span<const point> verts) {
    ring r;
    r.resize(verts.size());
    std::copy(verts.begin(), verts.end(), r.begin());
    return r;
}

pbn::polyline pbn::closed_polyline(const ring& r) {
    polyline poly;
    poly.resize(r.size() + 1);
    std::copy(r.begin(), r.end(), poly.begin());
    poly.back() = r.front();
    return poly;
}

pbn::rectangle pbn::bounding_rectangle(const ring& r) {
    bg::model::box<point> box;
    bg::envelope(r, box);
    return {
        box.min_corner().x,
        box.min_corner().y,
        box.max_corner().x,
        box.max_corner().y
    };
}

bool pbn::is_degenerate_ring(const ring& r) {
    return r.size() <= 2;
}

pbn::point pbn::centroid(const polygon& poly) {
    point pt;
    bg::centroid(poly, pt);
    return pt;
}

double pbn::total_turning_angle(std::span<const point> pts) {
    auto directions = pts |
        rv::sliding(2) |
        rv::transform(
            [](auto pair)->point {
                return pair[1] - pair[0];
            }
        ) |
        rv::remove_if(is_zero_length) |
        r::to_vector;

    return r::accumulate(
        directions |
            rv::sliding(2) |
            rv::transform(
                [](auto pair)->double {
                    return angle_between(pair[0], pair[1]);
                }
            ),
        0.0
    );
}
