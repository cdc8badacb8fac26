#include "color_quantizer.hpp"
#include <range/v3/all.hpp>
#include <unordered_map>
#include <random>
#include <numeric>
#include <limits>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    struct rgb_color_hasher {
        size_t operator()(const pbn::rgb_color& c) const {
            return (static_cast<size_t>(c[0]) << 16) | (static_cast<size_t>(c[1]) << 8) | c[2];
        }
    };

    std::vector<cv::Vec3d> initial_centroids(std::span<const pbn::weighted_point> points,
            int k, uint32_t seed) {
        std::vector<int> indices(points.size());
        std::iota(indices.begin(), indices.end(), 0);

        std::mt19937 rng(seed);
        int n = static_cast<int>(points.size());
        std::vector<cv::Vec3d> centroids(k);
        for (int i = 0; i < k; ++i) {
            std::uniform_int_distribution<int> dist(i, n - 1);
            std::swap(indices[i], indices[dist(rng)]);
            centroids[i] = points[indices[i]].position;
        }
        return centroids;
    }

    std::vector<cv::Vec3d> update_centroids(std::span<const pbn::weighted_point> points,
            std::span<const int> assignment, std::span<const cv::Vec3d> old_centroids) {
        std::vector<cv::Vec3d> sums(old_centroids.size(), cv::Vec3d(0, 0, 0));
        std::vector<double> weights(old_centroids.size(), 0.0);
        for (auto [pt, cluster] : rv::zip(points, assignment)) {
            sums[cluster] += pt.weight * pt.position;
            weights[cluster] += pt.weight;
        }
        std::vector<cv::Vec3d> centroids(old_centroids.size());
        for (size_t i = 0; i < centroids.size(); ++i) {
            centroids[i] = (weights[i] > 0.0) ? sums[i] / weights[i] : old_centroids[i];
        }
        return centroids;
    }

    pbn::color_quantization to_quantization(const pbn::distinct_colors& dc,
            std::span<const int> color_to_palette, std::vector<pbn::rgb_color> palette) {
        pbn::color_quantization output;
        output.palette = std::move(palette);
        output.color_indices = cv::Mat(dc.indices.size(), CV_32SC1);
        for (int y = 0; y < dc.indices.rows; ++y) {
            for (int x = 0; x < dc.indices.cols; ++x) {
                output.color_indices.at<int>(y, x) = color_to_palette[dc.indices.at<int>(y, x)];
            }
        }
        return output;
    }

    // renumbers palette entries by first use in raster order, dropping unused
    // entries and merging entries that are the same color.
    void compact_palette(pbn::color_quantization& q) {
        std::unordered_map<pbn::rgb_color, int, rgb_color_hasher> color_to_index;
        std::vector<int> remap(q.palette.size(), -1);
        std::vector<pbn::rgb_color> palette;

        for (int y = 0; y < q.color_indices.rows; ++y) {
            for (int x = 0; x < q.color_indices.cols; ++x) {
                auto& index = q.color_indices.at<int>(y, x);
                if (remap[index] < 0) {
                    const auto& c = q.palette[index];
                    auto iter = color_to_index.find(c);
                    if (iter == color_to_index.end()) {
                        iter = color_to_index.insert({ c, static_cast<int>(palette.size()) }).first;
                        palette.push_back(c);
                    }
                    remap[index] = iter->second;
                }
                index = remap[index];
            }
        }
        q.palette = std::move(palette);
    }

    pbn::color_quantization quantize_to_fixed_palette(const pbn::distinct_colors& dc,
            const std::vector<pbn::rgb_color>& fixed, pbn::color_space cs) {
        auto fixed_positions = pbn::to_color_space(fixed, cs);
        auto points = pbn::to_weighted_points(dc, cs);
        auto assignment = pbn::assign_to_nearest(points, fixed_positions);
        return to_quantization(dc, assignment, fixed);
    }

    pbn::color_quantization quantize_by_kmeans(const pbn::distinct_colors& dc,
            const pbn::settings& params, const pbn::progress* prog) {
        auto points = pbn::to_weighted_points(dc, params.space);
        auto clusters = pbn::kmeans(
            points,
            params.cluster_count,
            params.convergence_threshold,
            params.max_iterations,
            static_cast<uint32_t>(params.random_seed),
            prog
        );
        if (prog) {
            prog->log("k-means finished after " + std::to_string(clusters.iterations) + " iterations");
        }

        // every distinct color is its own cluster; skip the round trip
        // through the color space.
        if (params.cluster_count >= static_cast<int>(dc.colors.size())) {
            return to_quantization(dc, clusters.assignment, dc.colors);
        }

        auto palette = clusters.centroids |
            rv::transform(
                [&](const auto& centroid) {
                    return pbn::from_color_space(centroid, params.space);
                }
            ) | r::to_vector;

        return to_quantization(dc, clusters.assignment, std::move(palette));
    }
}

pbn::distinct_colors pbn::find_distinct_colors(const cv::Mat& img_rgb) {
    if (img_rgb.empty()) {
        throw input_error("empty image");
    }
    if (img_rgb.type() != CV_8UC3) {
        throw input_error("expected an 8-bit 3-channel image");
    }

    distinct_colors dc;
    dc.indices = cv::Mat(img_rgb.size(), CV_32SC1);
    std::unordered_map<rgb_color, int, rgb_color_hasher> color_to_index;
    for (int y = 0; y < img_rgb.rows; ++y) {
        for (int x = 0; x < img_rgb.cols; ++x) {
            auto c = img_rgb.at<rgb_color>(y, x);
            auto iter = color_to_index.find(c);
            if (iter == color_to_index.end()) {
                iter = color_to_index.insert({ c, static_cast<int>(dc.colors.size()) }).first;
                dc.colors.push_back(c);
                dc.counts.push_back(0);
            }
            dc.counts[iter->second]++;
            dc.indices.at<int>(y, x) = iter->second;
        }
    }
    return dc;
}

std::vector<pbn::weighted_point> pbn::to_weighted_points(const distinct_colors& dc, color_space cs) {
    double total = static_cast<double>(dc.indices.total());
    auto positions = to_color_space(dc.colors, cs);
    std::vector<weighted_point> points(dc.colors.size());
    for (size_t i = 0; i < points.size(); ++i) {
        points[i] = { positions[i], dc.counts[i] / total, dc.colors[i] };
    }
    return points;
}

std::vector<int> pbn::assign_to_nearest(std::span<const weighted_point> points,
        std::span<const cv::Vec3d> centroids) {
    std::vector<int> assignment(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        double best_dist = std::numeric_limits<double>::max();
        int best = 0;
        for (size_t j = 0; j < centroids.size(); ++j) {
            auto dist = color_distance(points[i].position, centroids[j]);
            if (dist < best_dist) {
                best_dist = dist;
                best = static_cast<int>(j);
            }
        }
        assignment[i] = best;
    }
    return assignment;
}

pbn::clustering pbn::kmeans(std::span<const weighted_point> points, int k, 
        double convergence_threshold, int max_iterations, uint32_t seed, const progress* prog) {
    if (k <= 0) {
        throw input_error("cluster count must be positive");
    }

    clustering output;
    output.iterations = 0;
    if (k >= static_cast<int>(points.size())) {
        output.centroids = points | rv::transform([](const auto& pt) {return pt.position; }) | r::to_vector;
        output.assignment = rv::iota(0, static_cast<int>(points.size())) | r::to_vector;
        return output;
    }

    output.centroids = initial_centroids(points, k, seed);
    double delta = std::numeric_limits<double>::max();
    while (delta > convergence_threshold && output.iterations < max_iterations) {
        if (prog) {
            prog->check_cancellation();
        }
        output.assignment = assign_to_nearest(points, output.centroids);
        auto centroids = update_centroids(points, output.assignment, output.centroids);

        delta = 0.0;
        for (auto [old_centroid, new_centroid] : rv::zip(output.centroids, centroids)) {
            delta += color_distance(old_centroid, new_centroid);
        }
        output.centroids = std::move(centroids);
        ++output.iterations;

        if (prog) {
            prog->update(static_cast<double>(output.iterations) / max_iterations);
        }
    }
    output.assignment = assign_to_nearest(points, output.centroids);

    return output;
}

int pbn::remove_narrow_pixel_strips(cv::Mat& color_indices, std::span<const rgb_color> palette) {
    auto distances = color_distance_matrix(palette);
    int count = 0;
    for (int y = 1; y < color_indices.rows - 1; ++y) {
        for (int x = 1; x < color_indices.cols - 1; ++x) {
            int top = color_indices.at<int>(y - 1, x);
            int bottom = color_indices.at<int>(y + 1, x);
            int left = color_indices.at<int>(y, x - 1);
            int right = color_indices.at<int>(y, x + 1);
            int& cur = color_indices.at<int>(y, x);

            bool vertical_strip = cur != top && cur != bottom;
            bool horizontal_strip = cur != left && cur != right;
            if (vertical_strip && horizontal_strip) {
                continue;
            }
            if (vertical_strip) {
                cur = (distances[cur][top] < distances[cur][bottom]) ? top : bottom;
                ++count;
            } else if (horizontal_strip) {
                cur = (distances[cur][left] < distances[cur][right]) ? left : right;
                ++count;
            }
        }
    }
    return count;
}

pbn::color_quantization pbn::quantize_colors(const cv::Mat& img_rgb, const settings& params,
        const progress* prog) {
    params.validate();

    auto dc = find_distinct_colors(img_rgb);
    if (prog) {
        prog->log(std::to_string(dc.colors.size()) + " distinct colors");
    }

    color_quantization output = (params.fixed_palette) ?
        quantize_to_fixed_palette(dc, *params.fixed_palette, params.space) :
        quantize_by_kmeans(dc, params, prog);

    for (int run = 0; run < params.narrow_pixel_strip_cleanup_runs; ++run) {
        int count = remove_narrow_pixel_strips(output.color_indices, output.palette);
        if (prog) {
            prog->log(std::to_string(count) + " pixels replaced to remove narrow pixel strips");
        }
    }
    if (!params.fixed_palette) {
        compact_palette(output);
    }
    if (prog) {
        prog->update(1.0);
    }

    return output;
}
