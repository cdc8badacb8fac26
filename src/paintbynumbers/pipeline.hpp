#pragma once

#include "util.hpp"
#include "settings.hpp"
#include "facets.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <vector>
#include <string>
#include <functional>

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    struct paint_by_numbers {
        std::vector<rgb_color> palette;
        facet_result facets;
    };

    enum class run_status {
        completed,
        cancelled
    };

    struct run_result {
        run_status status;
        std::optional<paint_by_numbers> output;
    };

    struct svg_options {
        bool fill_facets = true;
        bool show_borders = true;
        bool show_labels = true;
        double scale = 1.0;
        double font_size = 10.0;
        double border_width = 0.5;
    };

    // converts a decoded OpenCV image, BGR, BGRA, or grayscale, to 8-bit RGB.
    cv::Mat from_bgr(const cv::Mat& img);

    paint_by_numbers process_image(const cv::Mat& img_rgb, const settings& params, 
        progress& prog);

    // input errors and internal consistency errors propagate as exceptions; 
    // cancellation is reported in the result.
    run_result generate_paint_by_numbers(const cv::Mat& bgr_image, const settings& params,
        const callbacks& cbs = {});

    // the requested font size, shrunk so the label fits its pole of
    // inaccessibility circle but never below one output pixel.
    double label_font_size(const label_anchor& label, const svg_options& options);

    void write_to_svg(const std::string& filename, const paint_by_numbers& pbn_data,
        const svg_options& options = {}, std::function<void(double)> update_progress_cb = {});
    cv::Mat paint_facets(const paint_by_numbers& pbn_data);
}
