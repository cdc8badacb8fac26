#include "pipeline.hpp"
#include "color_quantizer.hpp"
#include "facet_reducer.hpp"
#include "border_tracer.hpp"
#include "border_segmenter.hpp"
#include "label_placer.hpp"
#include <opencv2/imgproc.hpp>
#include <range/v3/all.hpp>
#include <fstream>
#include <algorithm>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    std::string label_text(const pbn::facet& f) {
        return std::to_string(f.color);
    }

    cv::Vec3b to_bgr(const pbn::rgb_color& c) {
        return { c[2], c[1], c[0] };
    }
}

cv::Mat pbn::from_bgr(const cv::Mat& img) {
    if (img.empty()) {
        throw input_error("empty image");
    }
    if (img.depth() != CV_8U) {
        throw input_error("expected an 8-bit image");
    }

    cv::Mat rgb_img;
    switch (img.channels()) {
        case 1:
            cv::cvtColor(img, rgb_img, cv::COLOR_GRAY2RGB);
            break;
        case 3:
            cv::cvtColor(img, rgb_img, cv::COLOR_BGR2RGB);
            break;
        case 4:
            cv::cvtColor(img, rgb_img, cv::COLOR_BGRA2RGB);
            break;
        default:
            throw input_error("unsupported number of channels: " + std::to_string(img.channels()));
    }
    return rgb_img;
}

pbn::paint_by_numbers pbn::process_image(const cv::Mat& img_rgb, const settings& params,
        progress& prog) {
    params.validate();

    prog.start_stage("quantizing colors", 0.0, 0.3);
    auto quantization = quantize_colors(img_rgb, params, &prog);
    prog.log(std::to_string(quantization.palette.size()) + " colors in palette");

    prog.start_stage("building facets", 0.3, 0.1);
    auto facets = build_facets(quantization.color_indices, &prog);
    prog.log(std::to_string(facets.live_facet_count()) + " facets");

    prog.start_stage("reducing facets", 0.4, 0.2);
    reduce_facets(facets, quantization.color_indices, quantization.palette, params, &prog);
    prog.log(std::to_string(facets.live_facet_count()) + " facets after reduction");

    prog.start_stage("tracing borders", 0.6, 0.15);
    trace_borders(facets, &prog);

    prog.start_stage("segmenting borders", 0.75, 0.15);
    segment_borders(facets, params.border_smoothing_iterations, &prog);
    prog.log(std::to_string(facets.segments().size()) + " border segments");

    prog.start_stage("placing labels", 0.9, 0.1);
    place_labels(facets, params.label_precision, &prog);
    prog.update(1.0);

    return { std::move(quantization.palette), std::move(facets) };
}

pbn::run_result pbn::generate_paint_by_numbers(const cv::Mat& bgr_image, const settings& params,
        const callbacks& cbs) {
    progress prog(cbs);
    params.validate();
    auto img_rgb = from_bgr(bgr_image);

    try {
        auto output = process_image(img_rgb, params, prog);
        prog.status("complete.");
        prog.log("(" + to_string(prog.elapsed_seconds(), 2) + " seconds)");
        return { run_status::completed, std::move(output) };
    } catch (const cancelled&) {
        prog.status("cancelled.");
        return { run_status::cancelled, {} };
    }
}

double pbn::label_font_size(const label_anchor& label, const svg_options& options) {
    constexpr double min_font_size = 1.0;
    auto fitted = std::max(2.0 * label.radius * options.scale, min_font_size);
    return std::min(options.font_size, fitted);
}

void pbn::write_to_svg(const std::string& filename, const paint_by_numbers& pbn_data,
        const svg_options& options, std::function<void(double)> update_progress_cb) {
    std::ofstream outfile(filename);
    if (!outfile) {
        throw std::runtime_error("unable to open " + filename);
    }
    const auto& facets = pbn_data.facets;
    outfile << svg_header(
        static_cast<int>(options.scale * facets.width()), 
        static_cast<int>(options.scale * facets.height())
    );

    auto n = static_cast<double>(facets.size());
    for (const auto& f : facets.facets()) {
        if (!f.is_deleted()) {
            auto poly = facet_outline(facets, f.id);
            auto fill = options.fill_facets ? to_svg_color(pbn_data.palette.at(f.color)) : "none";
            auto stroke = options.show_borders ? "black" : "none";
            outfile << polygon_to_svg(poly, fill, stroke, options.border_width, options.scale) << std::endl;
            if (options.show_labels && f.label) {
                outfile << text_to_svg(f.label->position, label_text(f), 
                    label_font_size(*f.label, options), options.scale) << std::endl;
            }
        }
        if (update_progress_cb) {
            update_progress_cb((f.id + 1) / n);
        }
    }
    outfile << "</svg>" << std::endl;
    outfile.close();
}

cv::Mat pbn::paint_facets(const paint_by_numbers& pbn_data) {
    const auto& facets = pbn_data.facets;
    auto colors = facets.facets() |
        rv::transform(
            [&](const facet& f)->cv::Vec3b {
                return f.is_deleted() ? cv::Vec3b(0, 0, 0) : to_bgr(pbn_data.palette.at(f.color));
            }
        ) | r::to_vector;

    cv::Mat mat(facets.height(), facets.width(), CV_8UC3);
    for (int y = 0; y < mat.rows; ++y) {
        for (int x = 0; x < mat.cols; ++x) {
            mat.at<cv::Vec3b>(y, x) = colors[facets.facet_id_at(x, y)];
        }
    }
    return mat;
}
