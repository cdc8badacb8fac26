#include "border_segmenter.hpp"
#include "border_tracer.hpp"
#include "point_set.hpp"
#include <range/v3/all.hpp>
#include <set>
#include <optional>
#include <algorithm>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    bool is_image_corner(const pbn::facet_result& facets, const cv::Point& v) {
        return (v.x == 0 || v.x == facets.width()) && (v.y == 0 || v.y == facets.height());
    }

    bool raster_less(const cv::Point& a, const cv::Point& b) {
        return (a.y == b.y) ? a.x < b.x : a.y < b.y;
    }

    std::vector<int> junction_indices(const pbn::facet_result& facets, 
            const std::vector<cv::Point>& vertices) {
        auto junctions = rv::iota(0, static_cast<int>(vertices.size())) |
            rv::filter(
                [&](int i) {
                    return pbn::is_junction_vertex(facets, vertices[i]);
                }
            ) | r::to_vector;

        if (!junctions.empty()) {
            return junctions;
        }

        // a loop shared in its entirety with one neighbor is cut at its
        // topmost-leftmost and bottommost-rightmost vertices.
        auto first = r::min_element(vertices, raster_less) - vertices.begin();
        auto last = r::max_element(vertices, raster_less) - vertices.begin();
        junctions = { static_cast<int>(first), static_cast<int>(last) };
        r::sort(junctions);
        return junctions;
    }

    std::vector<pbn::point> to_points(const std::vector<cv::Point>& vertices) {
        return vertices |
            rv::transform(
                [](const cv::Point& v)->pbn::point {
                    return { static_cast<double>(v.x), static_cast<double>(v.y) };
                }
            ) | r::to_vector;
    }

    bool is_reverse_of(const std::vector<cv::Point>& a, const std::vector<cv::Point>& b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.rbegin());
    }
}

bool pbn::is_junction_vertex(const facet_result& facets, const int_point& v) {
    if (is_image_corner(facets, v)) {
        return true;
    }
    std::set<int> regions = {
        facets.facet_id_at(v.x - 1, v.y - 1),
        facets.facet_id_at(v.x, v.y - 1),
        facets.facet_id_at(v.x - 1, v.y),
        facets.facet_id_at(v.x, v.y)
    };
    return regions.size() >= 3;
}

std::vector<pbn::lattice_path> pbn::split_loop(const facet_result& facets, int facet_id, 
        const border_loop& loop) {
    auto vertices = loop_vertices(loop);
    auto step_neighbors = loop_step_neighbors(loop);
    auto junctions = junction_indices(facets, vertices);
    int n = static_cast<int>(vertices.size());
    int m = static_cast<int>(junctions.size());

    std::vector<lattice_path> paths;
    for (int k = 0; k < m; ++k) {
        int from = junctions[k];
        int to = junctions[(k + 1) % m];
        int len = (to - from + n) % n;
        if (len == 0) {
            len = n;
        }

        lattice_path path;
        path.neighbor = step_neighbors[from];
        for (int j = 0; j <= len; ++j) {
            int i = (from + j) % n;
            path.vertices.push_back(vertices[i]);
            if (j < len && step_neighbors[i] != path.neighbor) {
                throw consistency_error("border segment crosses a junction", 
                    facet_id, vertices[i].x, vertices[i].y);
            }
        }
        paths.push_back(std::move(path));
    }
    return paths;
}

std::vector<pbn::point> pbn::smooth_segment(std::span<const point> pts, int iterations) {
    std::vector<point> current(pts.begin(), pts.end());
    if (current.size() < 3) {
        return current;
    }
    std::vector<point> next(current.size());
    for (int iter = 0; iter < iterations; ++iter) {
        next.front() = current.front();
        next.back() = current.back();
        for (size_t i = 1; i < current.size() - 1; ++i) {
            next[i] = (current[i - 1] + 2.0 * current[i] + current[i + 1]) * 0.25;
        }
        std::swap(current, next);
    }
    return current;
}

void pbn::segment_borders(facet_result& facets, int smoothing_iterations, const progress* prog) {
    auto& shared = facets.segments();
    shared.clear();

    std::vector<std::vector<int_point>> lattice_paths;
    std::vector<bool> claimed;
    path_table table;

    auto n = facets.size();
    for (auto& f : facets.facets()) {
        if (prog) {
            prog->check_cancellation();
        }
        f.segments.clear();
        for (auto [loop_index, loop] : rv::enumerate(f.loops)) {
            for (auto& path : split_loop(facets, f.id, loop)) {
                auto entry = (path.neighbor != image_edge) ?
                    table.find(path.vertices) : std::optional<path_table::entry>{};

                if (entry) {
                    if (!entry->reversed || claimed[entry->index] ||
                            !is_reverse_of(lattice_paths[entry->index], path.vertices)) {
                        throw consistency_error("shared border segment mismatch", 
                            f.id, path.vertices.front().x, path.vertices.front().y);
                    }
                    claimed[entry->index] = true;
                    f.segments.push_back({ entry->index, true, path.neighbor, static_cast<int>(loop_index) });
                    continue;
                }

                int index = static_cast<int>(shared.size());
                if (path.neighbor != image_edge) {
                    table.insert(path.vertices, index);
                }
                shared.push_back({ {}, f.id, path.neighbor });
                claimed.push_back(path.neighbor == image_edge);
                f.segments.push_back({ index, false, path.neighbor, static_cast<int>(loop_index) });
                lattice_paths.push_back(std::move(path.vertices));
            }
        }
        if (prog) {
            prog->update(0.5 * (f.id + 1) / n);
        }
    }

    for (auto [index, seg] : rv::enumerate(shared)) {
        if (!claimed[index]) {
            throw consistency_error("border segment has no counterpart in facet " + 
                std::to_string(seg.neighbor), seg.owner);
        }
        seg.points = smooth_segment(to_points(lattice_paths[index]), smoothing_iterations);
        if (prog) {
            prog->update(0.5 + 0.5 * (index + 1) / shared.size());
        }
    }
}

std::vector<pbn::point> pbn::segment_points(const facet_result& facets, const facet_segment& seg) {
    const auto& pts = facets.segments().at(seg.index).points;
    if (seg.reversed) {
        return { pts.rbegin(), pts.rend() };
    }
    return pts;
}

std::vector<pbn::ring> pbn::facet_rings(const facet_result& facets, int facet_id) {
    const auto& f = facets[facet_id];
    std::vector<ring> rings(f.loops.size());
    for (const auto& seg : f.segments) {
        auto pts = segment_points(facets, seg);
        auto& loop_ring = rings[seg.loop];
        loop_ring.insert(loop_ring.end(), pts.begin(), pts.end() - 1);
    }
    return rings;
}

pbn::polygon pbn::facet_outline(const facet_result& facets, int facet_id) {
    auto rings = facet_rings(facets, facet_id);
    if (rings.empty()) {
        return {};
    }
    std::vector<ring> holes(rings.begin() + 1, rings.end());
    return make_polygon(rings.front(), holes);
}
