#pragma once

#include "facets.hpp"
#include "geometry.hpp"
#include <vector>
#include <span>

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    // a lattice vertex touched by three or more regions, counting the outside
    // of the image as one, or a corner of the image.
    bool is_junction_vertex(const facet_result& facets, const int_point& vertex);

    struct lattice_path {
        std::vector<int_point> vertices;
        int neighbor;
    };

    // cuts a traced loop at its junction vertices.
    std::vector<lattice_path> split_loop(const facet_result& facets, int facet_id, 
        const border_loop& loop);

    // each round moves every interior point to the mean of the midpoints of
    // its two edges. Endpoints never move.
    std::vector<point> smooth_segment(std::span<const point> pts, int iterations);

    void segment_borders(facet_result& facets, int smoothing_iterations, 
        const progress* prog = nullptr);

    // the points of a segment in the order the facet walks it.
    std::vector<point> segment_points(const facet_result& facets, const facet_segment& seg);

    std::vector<ring> facet_rings(const facet_result& facets, int facet_id);
    polygon facet_outline(const facet_result& facets, int facet_id);
}
