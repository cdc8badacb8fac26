#pragma once

#include <string>
#include <functional>
#include <stdexcept>
#include <chrono>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include "geometry.hpp"

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    using json = nlohmann::json;

    // canonical 8-bit RGB triple, stored in R,G,B order regardless of the
    // color space it was produced in.
    using rgb_color = cv::Vec3b;

    rgb_color rgb(uchar r, uchar g, uchar b);

    // errors

    class input_error : public std::invalid_argument {
    public:
        explicit input_error(const std::string& msg);
    };

    class consistency_error : public std::logic_error {
    public:
        explicit consistency_error(const std::string& msg);
        consistency_error(const std::string& msg, int facet_id);
        consistency_error(const std::string& msg, int facet_id, int x, int y);
    };

    class cancelled : public std::runtime_error {
    public:
        cancelled();
    };

    // progress, logging, and cancellation

    struct callbacks {
        std::function<void(double)> update_progress_cb;
        std::function<void(const std::string&)> update_status_cb;
        std::function<void(const std::string&)> log_message_cb;
        std::function<bool()> is_cancelled;
    };

    class progress {
    private:
        const callbacks* cbs_;
        double stage_start_;
        double stage_extent_;
        std::chrono::high_resolution_clock::time_point start_time_;

    public:
        progress(const callbacks& cbs);

        // subsequent update() calls map [0,1] onto [start, start + extent]
        // of the whole run.
        void start_stage(const std::string& name, double start, double extent);
        void update(double stage_fraction) const;
        void log(const std::string& msg) const;
        void status(const std::string& msg) const;
        void check_cancellation() const;
        double elapsed_seconds() const;
    };

    // SVG
    std::string svg_header(int wd, int hgt);
    std::string to_svg_color(const rgb_color& c);
    std::string polygon_to_svg(const polygon& poly, const std::string& fill, 
        const std::string& stroke, double stroke_width, double scale);
    std::string text_to_svg(const point& pt, const std::string& text, double font_size, 
        double scale);

    // etc.
    std::string to_string(double val, int precision);
    std::string to_string(const cv::Point& pt);
}
