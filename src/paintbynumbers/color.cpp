#include "color.hpp"
#include <opencv2/imgproc.hpp>
#include <range/v3/all.hpp>
#include <cmath>
#include <array>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    constexpr double k_hue_range = 360.0;

    cv::Mat colors_to_float_mat(std::span<const pbn::rgb_color> colors) {
        cv::Mat mat(static_cast<int>(colors.size()), 1, CV_32FC3);
        for (auto [i, c] : rv::enumerate(colors)) {
            mat.at<cv::Vec3f>(static_cast<int>(i), 0) = cv::Vec3f(
                c[0] / 255.0f, c[1] / 255.0f, c[2] / 255.0f
            );
        }
        return mat;
    }

    cv::Vec3d from_hls(const cv::Vec3f& hls) {
        return {
            std::fmod(hls[0] / k_hue_range, 1.0),
            hls[2],
            hls[1]
        };
    }

    cv::Vec3f to_hls(const cv::Vec3d& hsl) {
        return {
            static_cast<float>(hsl[0] * k_hue_range),
            static_cast<float>(hsl[2]),
            static_cast<float>(hsl[1])
        };
    }

    uchar unit_to_uchar(float v) {
        return cv::saturate_cast<uchar>(std::round(v * 255.0f));
    }
}

std::string pbn::to_string(color_space cs) {
    switch (cs) {
        case color_space::rgb: return "RGB";
        case color_space::hsl: return "HSL";
        case color_space::lab: return "LAB";
    }
    throw std::runtime_error("unknown color space");
}

pbn::color_space pbn::color_space_from_string(const std::string& str) {
    if (str == "RGB") {
        return color_space::rgb;
    } else if (str == "HSL") {
        return color_space::hsl;
    } else if (str == "LAB") {
        return color_space::lab;
    }
    throw input_error("unknown color space: " + str);
}

std::vector<cv::Vec3d> pbn::to_color_space(std::span<const rgb_color> colors, color_space cs) {
    if (cs == color_space::rgb) {
        return colors |
            rv::transform(
                [](const rgb_color& c)->cv::Vec3d {
                    return { static_cast<double>(c[0]), static_cast<double>(c[1]), static_cast<double>(c[2]) };
                }
            ) | r::to_vector;
    }
    if (colors.empty()) {
        return {};
    }

    cv::Mat converted;
    cv::cvtColor(
        colors_to_float_mat(colors), 
        converted, 
        (cs == color_space::hsl) ? cv::COLOR_RGB2HLS : cv::COLOR_RGB2Lab
    );

    std::vector<cv::Vec3d> output(colors.size());
    for (int i = 0; i < converted.rows; ++i) {
        auto v = converted.at<cv::Vec3f>(i, 0);
        output[i] = (cs == color_space::hsl) ? from_hls(v) : cv::Vec3d(v[0], v[1], v[2]);
    }
    return output;
}

cv::Vec3d pbn::to_color_space(const rgb_color& c, color_space cs) {
    std::array<rgb_color, 1> colors = { c };
    return to_color_space(colors, cs).front();
}

pbn::rgb_color pbn::from_color_space(const cv::Vec3d& v, color_space cs) {
    if (cs == color_space::rgb) {
        return rgb(
            cv::saturate_cast<uchar>(std::round(v[0])),
            cv::saturate_cast<uchar>(std::round(v[1])),
            cv::saturate_cast<uchar>(std::round(v[2]))
        );
    }

    cv::Mat input(1, 1, CV_32FC3);
    input.at<cv::Vec3f>(0, 0) = (cs == color_space::hsl) ?
        to_hls(v) :
        cv::Vec3f(static_cast<float>(v[0]), static_cast<float>(v[1]), static_cast<float>(v[2]));

    cv::Mat converted;
    cv::cvtColor(
        input,
        converted,
        (cs == color_space::hsl) ? cv::COLOR_HLS2RGB : cv::COLOR_Lab2RGB
    );
    auto c = converted.at<cv::Vec3f>(0, 0);
    return rgb(unit_to_uchar(c[0]), unit_to_uchar(c[1]), unit_to_uchar(c[2]));
}

double pbn::color_distance(const cv::Vec3d& a, const cv::Vec3d& b) {
    return cv::norm(a - b);
}

double pbn::color_distance(const rgb_color& a, const rgb_color& b, color_space cs) {
    return color_distance(to_color_space(a, cs), to_color_space(b, cs));
}

pbn::distance_matrix pbn::color_distance_matrix(std::span<const rgb_color> palette) {
    auto n = palette.size();
    distance_matrix distances(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            auto d = color_distance(palette[i], palette[j]);
            distances[i][j] = d;
            distances[j][i] = d;
        }
    }
    return distances;
}
