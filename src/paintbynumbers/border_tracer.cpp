#include "border_tracer.hpp"
#include <range/v3/all.hpp>
#include <array>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    constexpr int k_num_orientations = 4;

    const std::array<cv::Point, k_num_orientations> k_normal = {{
        {-1, 0},    // left
        { 0,-1},    // top
        { 1, 0},    // right
        { 0, 1}     // bottom
    }};

    const std::array<cv::Point, k_num_orientations> k_corner = {{
        {0, 1},     // left wall is walked from the bottom-left corner, north
        {0, 0},     // top, from the top-left, east
        {1, 0},     // right, from the top-right, south
        {1, 1}      // bottom, from the bottom-right, west
    }};

    int index(pbn::orientation o) {
        return static_cast<int>(o);
    }

    uchar wall_bit(pbn::orientation o) {
        return static_cast<uchar>(1 << index(o));
    }

    bool in_facet(const pbn::facet_result& facets, int facet_id, const cv::Point& pt) {
        return facets.facet_id_at(pt) == facet_id;
    }

    int across_wall(const pbn::facet_result& facets, const pbn::wall& w) {
        return facets.facet_id_at(w.pixel + pbn::wall_normal(w.side));
    }

    bool is_exterior_wall(const pbn::facet_result& facets, int facet_id, const pbn::wall& w) {
        return !in_facet(facets, facet_id, w.pixel + pbn::wall_normal(w.side));
    }

    class wall_mask {
    private:
        cv::Mat mask_;
        pbn::bounding_box bbox_;

    public:
        wall_mask(const pbn::bounding_box& bbox) :
            mask_(cv::Mat::zeros(bbox.height(), bbox.width(), CV_8UC1)),
            bbox_(bbox)
        {}

        void consume(const pbn::wall& w) {
            mask_.at<uchar>(w.pixel.y - bbox_.min_y, w.pixel.x - bbox_.min_x) |= wall_bit(w.side);
        }

        bool is_consumed(const pbn::wall& w) const {
            return mask_.at<uchar>(w.pixel.y - bbox_.min_y, w.pixel.x - bbox_.min_x) & wall_bit(w.side);
        }
    };

    std::vector<pbn::path_point> to_runs(const pbn::facet_result& facets, 
            const std::vector<pbn::wall>& walls) {
        auto path_points = walls |
            rv::transform(
                [&](const pbn::wall& w)->pbn::path_point {
                    return { w.pixel, w.side, across_wall(facets, w) };
                }
            ) | r::to_vector;

        auto starts_run = [&](size_t i)->bool {
            const auto& prev = path_points[(i + path_points.size() - 1) % path_points.size()];
            const auto& cur = path_points[i];
            return prev.side != cur.side || prev.across != cur.across;
        };

        size_t first = 0;
        while (first < path_points.size() && !starts_run(first)) {
            ++first;
        }

        std::vector<pbn::path_point> runs;
        for (size_t j = 0; j < path_points.size(); ++j) {
            auto i = (first + j) % path_points.size();
            if (starts_run(i)) {
                runs.push_back(path_points[i]);
            }
        }
        return runs;
    }

    pbn::border_loop trace_loop(const pbn::facet_result& facets, int facet_id, 
            const pbn::wall& start, int max_steps, bool is_hole, wall_mask& consumed) {
        std::vector<pbn::wall> walls;
        auto w = start;
        do {
            if (static_cast<int>(walls.size()) >= max_steps) {
                throw pbn::consistency_error("border trace did not close", 
                    facet_id, start.pixel.x, start.pixel.y);
            }
            walls.push_back(w);
            consumed.consume(w);
            w = pbn::next_wall(facets, facet_id, w);
        } while (w != start);

        return { to_runs(facets, walls), is_hole };
    }

    // visits the lattice vertex at the start of every unit step of the loop
    // along with the run the step belongs to.
    template<typename F>
    void for_each_step(const pbn::border_loop& loop, F visit) {
        const auto& runs = loop.points;
        for (size_t i = 0; i < runs.size(); ++i) {
            const auto& run = runs[i];
            const auto& next_run = runs[(i + 1) % runs.size()];
            auto start = pbn::wall_start(run.pixel, run.side);
            auto end = pbn::wall_start(next_run.pixel, next_run.side);
            auto step = pbn::travel_direction(run.side);
            for (auto pt = start; pt != end; pt += step) {
                visit(pt, run);
            }
        }
    }
}

pbn::orientation pbn::rotate_cw(orientation o) {
    return static_cast<orientation>((index(o) + 1) % k_num_orientations);
}

pbn::orientation pbn::rotate_ccw(orientation o) {
    return static_cast<orientation>((index(o) + k_num_orientations - 1) % k_num_orientations);
}

pbn::int_point pbn::wall_normal(orientation o) {
    return k_normal[index(o)];
}

pbn::int_point pbn::travel_direction(orientation o) {
    return wall_normal(rotate_cw(o));
}

pbn::int_point pbn::wall_start(const int_point& pixel, orientation o) {
    return pixel + k_corner[index(o)];
}

pbn::wall pbn::next_wall(const facet_result& facets, int facet_id, const wall& w) {
    auto ahead = w.pixel + travel_direction(w.side);
    if (!in_facet(facets, facet_id, ahead)) {
        return { w.pixel, rotate_cw(w.side) };
    }
    auto diagonal = ahead + wall_normal(w.side);
    if (in_facet(facets, facet_id, diagonal)) {
        return { diagonal, rotate_ccw(w.side) };
    }
    return { ahead, w.side };
}

std::vector<pbn::border_loop> pbn::trace_facet(const facet_result& facets, int facet_id) {
    const auto& f = facets[facet_id];
    if (f.is_deleted()) {
        return {};
    }

    int max_steps = 4 * static_cast<int>(f.border_points.size());
    wall_mask consumed(f.bbox);
    std::vector<border_loop> loops;
    loops.push_back(
        trace_loop(facets, facet_id, { f.border_points.front(), orientation::top }, max_steps,
            false, consumed)
    );

    for (const auto& pixel : f.border_points) {
        for (int i = 0; i < k_num_orientations; ++i) {
            wall w = { pixel, static_cast<orientation>(i) };
            if (is_exterior_wall(facets, facet_id, w) && !consumed.is_consumed(w)) {
                loops.push_back(
                    trace_loop(facets, facet_id, w, max_steps, true, consumed)
                );
            }
        }
    }

    return loops;
}

void pbn::trace_borders(facet_result& facets, const progress* prog) {
    auto n = facets.size();
    for (auto& f : facets.facets()) {
        if (prog) {
            prog->check_cancellation();
        }
        f.loops = trace_facet(facets, f.id);
        if (prog) {
            prog->update(static_cast<double>(f.id + 1) / n);
        }
    }
}

std::vector<pbn::int_point> pbn::loop_vertices(const border_loop& loop) {
    std::vector<int_point> vertices;
    for_each_step(loop,
        [&](const int_point& pt, const path_point&) {
            vertices.push_back(pt);
        }
    );
    return vertices;
}

std::vector<int> pbn::loop_step_neighbors(const border_loop& loop) {
    std::vector<int> neighbors;
    for_each_step(loop,
        [&](const int_point&, const path_point& run) {
            neighbors.push_back(run.across);
        }
    );
    return neighbors;
}
