#include "label_placer.hpp"
#include "border_segmenter.hpp"
#include <queue>
#include <cmath>
#include <limits>

/*------------------------------------------------------------------------------------------------*/

namespace bg = boost::geometry;

namespace {

    struct cell {
        pbn::point center;
        double half_size;
        double distance;
        double max_distance;

        cell(const pbn::point& c, double h, const pbn::polygon& poly) :
            center(c),
            half_size(h),
            distance(pbn::signed_distance_to_outline(c, poly)),
            max_distance(distance + h * std::sqrt(2.0))
        {}
    };

    struct cell_less {
        bool operator()(const cell& a, const cell& b) const {
            return a.max_distance < b.max_distance;
        }
    };

    double distance_to_ring(const pbn::point& pt, const pbn::ring& r) {
        return bg::distance(pt, pbn::closed_polyline(r));
    }

    bool is_degenerate(const pbn::polygon& poly) {
        return pbn::is_degenerate_ring(poly.outer()) || bg::area(poly) == 0.0;
    }

    pbn::point box_center(const pbn::bounding_box& box) {
        return {
            (box.min_x + box.max_x + 1) / 2.0,
            (box.min_y + box.max_y + 1) / 2.0
        };
    }
}

double pbn::signed_distance_to_outline(const point& pt, const polygon& poly) {
    double dist = distance_to_ring(pt, poly.outer());
    for (const auto& hole : poly.inners()) {
        dist = std::min(dist, distance_to_ring(pt, hole));
    }
    return bg::within(pt, poly) ? dist : -dist;
}

pbn::label_anchor pbn::pole_of_inaccessibility(const polygon& poly, double precision) {
    if (poly.outer().empty()) {
        return { {0.0, 0.0}, 0.0 };
    }
    auto [x1, y1, x2, y2] = bounding_rectangle(poly.outer());
    point bbox_center = { (x1 + x2) / 2.0, (y1 + y2) / 2.0 };
    double wd = x2 - x1;
    double hgt = y2 - y1;
    double cell_size = std::min(wd, hgt);
    if (cell_size <= 0.0 || is_degenerate(poly)) {
        return { bbox_center, 0.0 };
    }

    std::priority_queue<cell, std::vector<cell>, cell_less> queue;
    double h = cell_size / 2.0;
    for (double x = x1; x < x2; x += cell_size) {
        for (double y = y1; y < y2; y += cell_size) {
            queue.push(cell({ x + h, y + h }, h, poly));
        }
    }

    cell best(pbn::centroid(poly), 0.0, poly);
    cell bbox_cell(bbox_center, 0.0, poly);
    if (bbox_cell.distance > best.distance) {
        best = bbox_cell;
    }

    while (!queue.empty()) {
        auto c = queue.top();
        queue.pop();

        if (c.distance > best.distance) {
            best = c;
        }
        if (c.max_distance - best.distance <= precision) {
            continue;
        }

        h = c.half_size / 2.0;
        queue.push(cell({ c.center.x - h, c.center.y - h }, h, poly));
        queue.push(cell({ c.center.x + h, c.center.y - h }, h, poly));
        queue.push(cell({ c.center.x - h, c.center.y + h }, h, poly));
        queue.push(cell({ c.center.x + h, c.center.y + h }, h, poly));
    }

    return { best.center, std::max(best.distance, 0.0) };
}

void pbn::place_labels(facet_result& facets, double precision, const progress* prog) {
    auto n = facets.size();
    for (auto& f : facets.facets()) {
        if (prog) {
            prog->check_cancellation();
        }
        if (f.is_deleted()) {
            f.label.reset();
            continue;
        }
        auto poly = facet_outline(facets, f.id);
        f.label = (poly.outer().empty() || is_degenerate(poly)) ?
            label_anchor{ box_center(f.bbox), 0.0 } :
            pole_of_inaccessibility(poly, precision);
        if (prog) {
            prog->update(static_cast<double>(f.id + 1) / n);
        }
    }
}
