#include <gtest/gtest.h>
#include "paintbynumbers/color_quantizer.hpp"
#include "test_helpers.hpp"
#include <random>

namespace {

    cv::Mat noisy_image(int wd, int hgt, uint32_t seed) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        cv::Mat img(hgt, wd, CV_8UC3);
        for (int y = 0; y < hgt; ++y) {
            for (int x = 0; x < wd; ++x) {
                img.at<cv::Vec3b>(y, x) = cv::Vec3b(
                    static_cast<uchar>(dist(rng)), static_cast<uchar>(dist(rng)), static_cast<uchar>(dist(rng))
                );
            }
        }
        return img;
    }

    int count_differences(const cv::Mat& a, const cv::Mat& b) {
        return cv::countNonZero(a != b);
    }

    pbn::settings no_cleanup() {
        pbn::settings s;
        s.narrow_pixel_strip_cleanup_runs = 0;
        return s;
    }
}

// =============================================================================
// distinct colors
// =============================================================================

TEST(ColorQuantizerTest, DistinctColorsInFirstAppearanceOrder) {
    auto palette = std::vector<pbn::rgb_color>{
        pbn::rgb(10, 20, 30), pbn::rgb(200, 0, 0), pbn::rgb(0, 0, 99)
    };
    auto img = pbn_test::rgb_image(pbn_test::index_grid({ {1, 1, 0}, {2, 0, 0} }), palette);
    auto dc = pbn::find_distinct_colors(img);

    ASSERT_EQ(dc.colors.size(), 3u);
    EXPECT_EQ(dc.colors[0], palette[1]);
    EXPECT_EQ(dc.colors[1], palette[0]);
    EXPECT_EQ(dc.colors[2], palette[2]);
    EXPECT_EQ(dc.counts, (std::vector<int>{ 2, 3, 1 }));
    EXPECT_EQ(dc.indices.at<int>(1, 0), 2);

    auto points = pbn::to_weighted_points(dc, pbn::color_space::rgb);
    EXPECT_DOUBLE_EQ(points[1].weight, 0.5);
}

TEST(ColorQuantizerTest, RejectsEmptyImage) {
    EXPECT_THROW(pbn::find_distinct_colors(cv::Mat()), pbn::input_error);
    EXPECT_THROW(pbn::quantize_colors(cv::Mat(), pbn::settings{}), pbn::input_error);
}

TEST(ColorQuantizerTest, RejectsNonPositiveClusterCount) {
    auto s = no_cleanup();
    s.cluster_count = 0;
    EXPECT_THROW(pbn::quantize_colors(noisy_image(4, 4, 1), s), pbn::input_error);
}

// =============================================================================
// k-means
// =============================================================================

TEST(ColorQuantizerTest, ClusterCountAboveDistinctColorsIsIdentity) {
    auto palette = std::vector<pbn::rgb_color>{
        pbn::rgb(10, 20, 30), pbn::rgb(200, 0, 0), pbn::rgb(0, 0, 99)
    };
    auto grid = pbn_test::index_grid({ {0, 1, 2}, {2, 1, 0} });
    auto q = pbn::quantize_colors(pbn_test::rgb_image(grid, palette), no_cleanup());

    EXPECT_EQ(q.palette, palette);
    EXPECT_EQ(count_differences(q.color_indices, grid), 0);

    auto s = no_cleanup();
    s.space = pbn::color_space::lab;
    EXPECT_EQ(pbn::quantize_colors(pbn_test::rgb_image(grid, palette), s).palette, palette);
}

TEST(ColorQuantizerTest, DeterministicForFixedSeed) {
    auto img = noisy_image(24, 16, 5);
    auto s = no_cleanup();
    s.cluster_count = 4;
    s.random_seed = 7;

    auto first = pbn::quantize_colors(img, s);
    auto second = pbn::quantize_colors(img, s);

    EXPECT_EQ(first.palette, second.palette);
    EXPECT_EQ(count_differences(first.color_indices, second.color_indices), 0);
}

TEST(ColorQuantizerTest, PaletteIndicesAreDenseAndBounded) {
    auto img = noisy_image(20, 20, 11);
    for (auto cs : { pbn::color_space::rgb, pbn::color_space::hsl, pbn::color_space::lab }) {
        auto s = no_cleanup();
        s.cluster_count = 5;
        s.space = cs;
        auto q = pbn::quantize_colors(img, s);

        ASSERT_LE(q.palette.size(), 5u);
        std::vector<bool> used(q.palette.size(), false);
        int last_new = -1;
        for (int y = 0; y < q.color_indices.rows; ++y) {
            for (int x = 0; x < q.color_indices.cols; ++x) {
                int index = q.color_indices.at<int>(y, x);
                ASSERT_GE(index, 0);
                ASSERT_LT(index, static_cast<int>(q.palette.size()));
                if (!used[index]) {
                    EXPECT_EQ(index, last_new + 1);
                    last_new = index;
                    used[index] = true;
                }
            }
        }
    }
}

TEST(ColorQuantizerTest, PointsAreAssignedToNearestCentroid) {
    auto dc = pbn::find_distinct_colors(noisy_image(16, 16, 3));
    auto points = pbn::to_weighted_points(dc, pbn::color_space::rgb);
    auto clusters = pbn::kmeans(points, 6, 1.0, 100, 99);

    ASSERT_EQ(clusters.centroids.size(), 6u);
    ASSERT_EQ(clusters.assignment.size(), points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        auto assigned = pbn::color_distance(points[i].position, clusters.centroids[clusters.assignment[i]]);
        for (const auto& centroid : clusters.centroids) {
            EXPECT_LE(assigned, pbn::color_distance(points[i].position, centroid));
        }
    }
}

TEST(ColorQuantizerTest, IterationCap) {
    auto dc = pbn::find_distinct_colors(noisy_image(16, 16, 3));
    auto points = pbn::to_weighted_points(dc, pbn::color_space::rgb);
    auto clusters = pbn::kmeans(points, 6, 1e-9, 1, 99);
    EXPECT_EQ(clusters.iterations, 1);
}

TEST(ColorQuantizerTest, KMeansIsCancellable) {
    auto dc = pbn::find_distinct_colors(noisy_image(16, 16, 3));
    auto points = pbn::to_weighted_points(dc, pbn::color_space::rgb);
    pbn::callbacks cbs;
    cbs.is_cancelled = []() { return true; };
    pbn::progress prog(cbs);
    EXPECT_THROW(pbn::kmeans(points, 6, 1.0, 100, 99, &prog), pbn::cancelled);
}

// =============================================================================
// fixed palette
// =============================================================================

TEST(ColorQuantizerTest, FixedPaletteKeepsAllColors) {
    auto input_palette = std::vector<pbn::rgb_color>{ pbn::rgb(250, 10, 10), pbn::rgb(5, 5, 240) };
    auto img = pbn_test::rgb_image(pbn_test::index_grid({ {0, 1}, {1, 1} }), input_palette);
    auto s = no_cleanup();
    s.fixed_palette = std::vector<pbn::rgb_color>{
        pbn::rgb(0, 0, 0), pbn::rgb(255, 0, 0), pbn::rgb(0, 0, 255)
    };
    auto q = pbn::quantize_colors(img, s);

    EXPECT_EQ(q.palette, *s.fixed_palette);
    EXPECT_EQ(q.color_indices.at<int>(0, 0), 1);
    EXPECT_EQ(q.color_indices.at<int>(0, 1), 2);
    EXPECT_EQ(q.color_indices.at<int>(1, 1), 2);
}

// =============================================================================
// narrow strips
// =============================================================================

TEST(ColorQuantizerTest, NarrowStripsAreReplacedByCloserColor) {
    auto grid = pbn_test::index_grid({
        {0, 0, 0, 0, 0},
        {1, 1, 1, 1, 1},
        {2, 2, 2, 2, 2}
    });
    auto palette = std::vector<pbn::rgb_color>{
        pbn::rgb(0, 0, 0), pbn::rgb(10, 10, 10), pbn::rgb(255, 255, 255)
    };
    int count = pbn::remove_narrow_pixel_strips(grid, palette);

    EXPECT_EQ(count, 3);
    auto expected = pbn_test::index_grid({
        {0, 0, 0, 0, 0},
        {1, 0, 0, 0, 1},
        {2, 2, 2, 2, 2}
    });
    EXPECT_EQ(count_differences(grid, expected), 0);
}

TEST(ColorQuantizerTest, IsolatedPixelsAreLeftAlone) {
    auto grid = pbn_test::index_grid({
        {0, 0, 0},
        {0, 1, 0},
        {0, 0, 0}
    });
    EXPECT_EQ(pbn::remove_narrow_pixel_strips(grid, pbn_test::gray_palette(2)), 0);
    EXPECT_EQ(grid.at<int>(1, 1), 1);
}

TEST(ColorQuantizerTest, LaterCleanupRunsReachStripsExposedByEarlierOnes) {
    auto grid = pbn_test::index_grid({
        {0, 1, 0, 0, 1},
        {0, 1, 1, 0, 1},
        {0, 0, 0, 0, 1},
        {1, 0, 0, 0, 1}
    });
    auto palette = pbn_test::gray_palette(2);

    auto once = grid.clone();
    EXPECT_EQ(pbn::remove_narrow_pixel_strips(once, palette), 1);
    EXPECT_EQ(once.at<int>(1, 2), 0);
    EXPECT_EQ(once.at<int>(1, 1), 1);

    auto twice = once.clone();
    EXPECT_EQ(pbn::remove_narrow_pixel_strips(twice, palette), 1);
    EXPECT_EQ(twice.at<int>(1, 1), 0);
    EXPECT_EQ(pbn::remove_narrow_pixel_strips(twice, palette), 0);

    auto s = no_cleanup();
    s.narrow_pixel_strip_cleanup_runs = 1;
    auto q1 = pbn::quantize_colors(pbn_test::rgb_image(grid, palette), s);
    EXPECT_EQ(count_differences(q1.color_indices, once), 0);

    s.narrow_pixel_strip_cleanup_runs = 3;
    auto q3 = pbn::quantize_colors(pbn_test::rgb_image(grid, palette), s);
    EXPECT_EQ(count_differences(q3.color_indices, twice), 0);
}
