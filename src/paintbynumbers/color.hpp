#pragma once

#include "util.hpp"
#include <string>
#include <vector>
#include <span>
#include <opencv2/core.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    enum class color_space {
        rgb,
        hsl,
        lab
    };

    std::string to_string(color_space cs);
    color_space color_space_from_string(const std::string& str);

    // RGB coordinates are 0..255 per channel, HSL is (h,s,l) each in [0,1], and
    // LAB is (L,a,b) with L in [0,100].
    cv::Vec3d to_color_space(const rgb_color& c, color_space cs);
    std::vector<cv::Vec3d> to_color_space(std::span<const rgb_color> colors, color_space cs);
    rgb_color from_color_space(const cv::Vec3d& v, color_space cs);

    double color_distance(const rgb_color& a, const rgb_color& b, color_space cs = color_space::rgb);
    double color_distance(const cv::Vec3d& a, const cv::Vec3d& b);

    using distance_matrix = std::vector<std::vector<double>>;
    distance_matrix color_distance_matrix(std::span<const rgb_color> palette);
}
