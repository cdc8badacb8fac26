#pragma once

#include "facets.hpp"
#include "geometry.hpp"

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    // positive inside the polygon, negative outside or inside a hole.
    double signed_distance_to_outline(const point& pt, const polygon& poly);

    label_anchor pole_of_inaccessibility(const polygon& poly, double precision = 1.0);

    void place_labels(facet_result& facets, double precision = 1.0, const progress* prog = nullptr);
}
