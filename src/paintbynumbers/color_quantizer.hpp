#pragma once

#include "util.hpp"
#include "color.hpp"
#include "settings.hpp"
#include <vector>
#include <span>
#include <cstdint>
#include <opencv2/core.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    struct weighted_point {
        cv::Vec3d position;
        double weight;
        rgb_color source;
    };

    struct distinct_colors {
        std::vector<rgb_color> colors;
        std::vector<int> counts;
        cv::Mat indices;    // CV_32SC1, index into colors per pixel
    };

    struct clustering {
        std::vector<cv::Vec3d> centroids;
        std::vector<int> assignment;    // cluster per weighted point
        int iterations;
    };

    struct color_quantization {
        std::vector<rgb_color> palette;
        cv::Mat color_indices;          // CV_32SC1, index into palette per pixel
    };

    // collects the distinct colors of an RGB image in the order they first
    // appear in a raster scan.
    distinct_colors find_distinct_colors(const cv::Mat& img_rgb);

    std::vector<weighted_point> to_weighted_points(const distinct_colors& dc, color_space cs);

    clustering kmeans(std::span<const weighted_point> points, int k, double convergence_threshold,
        int max_iterations, uint32_t seed, const progress* prog = nullptr);

    std::vector<int> assign_to_nearest(std::span<const weighted_point> points,
        std::span<const cv::Vec3d> centroids);

    int remove_narrow_pixel_strips(cv::Mat& color_indices, std::span<const rgb_color> palette);

    color_quantization quantize_colors(const cv::Mat& img_rgb, const settings& params,
        const progress* prog = nullptr);
}
