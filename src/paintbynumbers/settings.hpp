#pragma once

#include "util.hpp"
#include "color.hpp"
#include <optional>
#include <vector>
#include <string>

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    enum class removal_order {
        large_to_small,
        small_to_large
    };

    std::string to_string(removal_order order);
    removal_order removal_order_from_string(const std::string& str);

    struct settings {
        int cluster_count = 16;
        color_space space = color_space::rgb;
        double convergence_threshold = 1.0;
        int random_seed = 0;
        std::optional<std::vector<rgb_color>> fixed_palette;

        int min_facet_size = 20;
        removal_order order = removal_order::large_to_small;
        std::optional<int> max_facet_count;

        int border_smoothing_iterations = 2;
        int max_iterations = 100;
        int narrow_pixel_strip_cleanup_runs = 3;
        double label_precision = 1.0;

        // throws input_error describing the first bad field.
        void validate() const;
    };

    json settings_to_json(const settings& s);
    settings json_to_settings(const json& js);
    settings settings_from_file(const std::string& filename);
}
