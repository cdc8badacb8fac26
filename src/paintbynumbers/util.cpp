#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <range/v3/all.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    std::string uchar_to_hex(unsigned char uc) {
        std::stringstream ss;
        ss << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(uc);
        return ss.str();
    }

    std::string loop_to_path_commands(const pbn::ring& loop, double scale) {
        std::stringstream ss;
        ss << "M " << scale * loop[0].x << "," << scale * loop[0].y << " L";
        for (const auto& pt : rv::tail(loop)) {
            ss << " " << scale * pt.x << "," << scale * pt.y;
        }
        ss << " Z";
        return ss.str();
    }

    std::string svg_path_commands(const pbn::polygon& poly, double scale) {
        std::stringstream ss;
        ss << loop_to_path_commands(poly.outer(), scale);
        for (const auto& hole : poly.inners()) {
            ss << " " << loop_to_path_commands(hole, scale);
        }
        return ss.str();
    }

    std::string facet_context(int facet_id) {
        return " (facet " + std::to_string(facet_id) + ")";
    }

    std::string pixel_context(int facet_id, int x, int y) {
        return " (facet " + std::to_string(facet_id) + " at pixel " +
            pbn::to_string(cv::Point(x, y)) + ")";
    }
}

pbn::rgb_color pbn::rgb(uchar r, uchar g, uchar b) {
    return { r,g,b };
}

pbn::input_error::input_error(const std::string& msg) :
    std::invalid_argument(msg)
{}

pbn::consistency_error::consistency_error(const std::string& msg) :
    std::logic_error(msg)
{}

pbn::consistency_error::consistency_error(const std::string& msg, int facet_id) :
    std::logic_error(msg + facet_context(facet_id))
{}

pbn::consistency_error::consistency_error(const std::string& msg, int facet_id, int x, int y) :
    std::logic_error(msg + pixel_context(facet_id, x, y))
{}

pbn::cancelled::cancelled() :
    std::runtime_error("cancelled")
{}

/*------------------------------------------------------------------------------------------------*/

pbn::progress::progress(const callbacks& cbs) :
    cbs_(&cbs),
    stage_start_(0.0),
    stage_extent_(1.0),
    start_time_(std::chrono::high_resolution_clock::now())
{}

void pbn::progress::start_stage(const std::string& name, double start, double extent) {
    stage_start_ = start;
    stage_extent_ = extent;
    status(name);
    update(0.0);
}

void pbn::progress::update(double stage_fraction) const {
    if (cbs_->update_progress_cb) {
        stage_fraction = std::clamp(stage_fraction, 0.0, 1.0);
        cbs_->update_progress_cb(stage_start_ + stage_extent_ * stage_fraction);
    }
}

void pbn::progress::log(const std::string& msg) const {
    if (cbs_->log_message_cb) {
        cbs_->log_message_cb(msg);
    }
}

void pbn::progress::status(const std::string& msg) const {
    if (cbs_->update_status_cb) {
        cbs_->update_status_cb(msg);
    }
    log(std::string("----") + msg + std::string("----"));
}

void pbn::progress::check_cancellation() const {
    if (cbs_->is_cancelled && cbs_->is_cancelled()) {
        throw cancelled();
    }
}

double pbn::progress::elapsed_seconds() const {
    std::chrono::duration<double> elapsed = std::chrono::high_resolution_clock::now() - start_time_;
    return elapsed.count();
}

/*------------------------------------------------------------------------------------------------*/

std::string pbn::svg_header(int wd, int hgt)
{
    std::stringstream ss;

    ss << "<?xml version=\"1.0\" standalone=\"no\"?>\n";
    ss << "<svg width=\"" + std::to_string(wd) + "px\" height=\"" +
        std::to_string(hgt) + "px\"  xmlns = \"http://www.w3.org/2000/svg\" version = \"1.1\">\n";
    return ss.str();
}

std::string pbn::to_svg_color(const rgb_color& c) {
    std::stringstream ss;
    ss << "#" << uchar_to_hex(c[0]) << uchar_to_hex(c[1]) << uchar_to_hex(c[2]);
    return ss.str();
}

std::string pbn::polygon_to_svg(const polygon& poly, const std::string& fill,
        const std::string& stroke, double stroke_width, double scale) {
    if (poly.outer().empty()) {
        return {};
    }
    std::stringstream ss;
    ss << "<path fill-rule=\"evenodd\" stroke=\"";
    ss << stroke << "\" stroke-width=\"" << stroke_width << "\" fill=\"";
    ss << fill << "\" d=\"";
    ss << svg_path_commands(poly, scale);
    ss << "\" />";
    return ss.str();
}

std::string pbn::text_to_svg(const point& pt, const std::string& text, double font_size,
        double scale) {
    std::stringstream ss;
    ss << "<text x=\"" << scale * pt.x << "\" y=\"" << scale * pt.y << "\" ";
    ss << "font-family=\"Tahoma\" font-size=\"" << font_size << "\" ";
    ss << "text-anchor=\"middle\" dominant-baseline=\"middle\">";
    ss << text << "</text>";
    return ss.str();
}

std::string pbn::to_string(double val, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << val;
    return ss.str();
}

std::string pbn::to_string(const cv::Point& pt) {
    std::stringstream ss;
    ss << "( " << pt.x << " , " << pt.y << " )";
    return ss.str();
}
