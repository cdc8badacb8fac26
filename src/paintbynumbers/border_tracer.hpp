#pragma once

#include "facets.hpp"
#include <vector>

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    orientation rotate_cw(orientation o);
    orientation rotate_ccw(orientation o);

    // offset to the pixel across the wall.
    int_point wall_normal(orientation o);

    // unit step along the wall, keeping the facet on the right.
    int_point travel_direction(orientation o);

    // the lattice vertex at which walking the wall begins.
    int_point wall_start(const int_point& pixel, orientation o);

    struct wall {
        int_point pixel;
        orientation side;

        bool operator==(const wall& w) const = default;
    };

    wall next_wall(const facet_result& facets, int facet_id, const wall& w);

    std::vector<border_loop> trace_facet(const facet_result& facets, int facet_id);
    void trace_borders(facet_result& facets, const progress* prog = nullptr);

    // lattice vertices of a loop at unit spacing; the first vertex is not repeated.
    std::vector<int_point> loop_vertices(const border_loop& loop);

    // the facet across each unit step of loop_vertices().
    std::vector<int> loop_step_neighbors(const border_loop& loop);
}
