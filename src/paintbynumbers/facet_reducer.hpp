#pragma once

#include "facets.hpp"
#include "color.hpp"
#include "settings.hpp"
#include <span>
#include <vector>

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    // the order in which facets are considered for removal.
    std::vector<int> removal_sequence(const facet_result& facets, removal_order order);

    // reassigns the pixels of the given facet to its neighbors and rebuilds the
    // neighbors. Returns false, changing nothing, if the facet has no live neighbor.
    bool delete_facet(facet_result& facets, cv::Mat& color_indices, int id,
        const distance_matrix& color_distances);

    void reduce_facets(facet_result& facets, cv::Mat& color_indices,
        std::span<const rgb_color> palette, const settings& params,
        const progress* prog = nullptr);
}
