#include <gtest/gtest.h>
#include "paintbynumbers/label_placer.hpp"
#include "paintbynumbers/border_segmenter.hpp"
#include "paintbynumbers/border_tracer.hpp"
#include "test_helpers.hpp"
#include <cmath>

namespace {

    pbn::ring rect_ring(double x1, double y1, double x2, double y2) {
        std::vector<pbn::point> pts = { {x1, y1}, {x2, y1}, {x2, y2}, {x1, y2} };
        return pbn::make_ring(pts);
    }

    pbn::polygon square_with_hole() {
        return pbn::make_polygon(rect_ring(0, 0, 10, 10), { rect_ring(4, 4, 6, 6) });
    }

    pbn::facet_result labeled(const cv::Mat& grid, int smoothing = 2, double precision = 1.0) {
        auto facets = pbn::build_facets(grid);
        pbn::trace_borders(facets);
        pbn::segment_borders(facets, smoothing);
        pbn::place_labels(facets, precision);
        return facets;
    }
}

TEST(LabelPlacerTest, SignedDistance) {
    auto square = pbn::make_polygon(rect_ring(0, 0, 10, 10), {});
    EXPECT_NEAR(pbn::signed_distance_to_outline({ 5, 5 }, square), 5.0, 1e-9);
    EXPECT_NEAR(pbn::signed_distance_to_outline({ 1, 5 }, square), 1.0, 1e-9);
    EXPECT_NEAR(pbn::signed_distance_to_outline({ 15, 5 }, square), -5.0, 1e-9);

    auto holed = square_with_hole();
    EXPECT_NEAR(pbn::signed_distance_to_outline({ 5, 5 }, holed), -1.0, 1e-9);
    EXPECT_NEAR(pbn::signed_distance_to_outline({ 2, 5 }, holed), 2.0, 1e-9);
}

TEST(LabelPlacerTest, RectangleLabelIsOnItsMidline) {
    auto poly = pbn::make_polygon(rect_ring(0, 0, 10, 2), {});
    auto anchor = pbn::pole_of_inaccessibility(poly, 0.1);
    EXPECT_NEAR(anchor.position.y, 1.0, 1e-9);
    EXPECT_NEAR(anchor.radius, 1.0, 1e-9);
}

TEST(LabelPlacerTest, LabelAvoidsHole) {
    auto poly = square_with_hole();
    auto anchor = pbn::pole_of_inaccessibility(poly, 0.1);
    EXPECT_GT(pbn::signed_distance_to_outline(anchor.position, poly), 0.0);
    EXPECT_NEAR(pbn::signed_distance_to_outline(anchor.position, poly), anchor.radius, 1e-9);
    EXPECT_GT(anchor.radius, 2.0);
    EXPECT_LT(anchor.radius, 2.4);
}

TEST(LabelPlacerTest, DegeneratePolygonsGetZeroRadius) {
    std::vector<pbn::point> flat = { {0, 0}, {5, 0}, {10, 0} };
    auto anchor = pbn::pole_of_inaccessibility(pbn::make_polygon(pbn::make_ring(flat), {}));
    EXPECT_EQ(anchor.radius, 0.0);
    EXPECT_NEAR(anchor.position.x, 5.0, 1e-9);
    EXPECT_NEAR(anchor.position.y, 0.0, 1e-9);

    EXPECT_EQ(pbn::pole_of_inaccessibility(pbn::polygon{}).radius, 0.0);
}

TEST(LabelPlacerTest, SolidImageLabelIsCentered) {
    auto facets = labeled(pbn_test::solid(3, 3));
    ASSERT_TRUE(facets[0].label);
    EXPECT_NEAR(facets[0].label->position.x, 1.5, 1e-9);
    EXPECT_NEAR(facets[0].label->position.y, 1.5, 1e-9);
    EXPECT_NEAR(facets[0].label->radius, 1.5, 1e-9);
}

TEST(LabelPlacerTest, SinglePixelFacets) {
    auto facets = labeled(pbn_test::index_grid({ {0, 1}, {2, 3} }), 0);
    for (const auto& f : facets.facets()) {
        ASSERT_TRUE(f.label);
        EXPECT_NEAR(f.label->position.x, f.bbox.min_x + 0.5, 1e-9);
        EXPECT_NEAR(f.label->position.y, f.bbox.min_y + 0.5, 1e-9);
        EXPECT_NEAR(f.label->radius, 0.5, 1e-9);
    }
}

TEST(LabelPlacerTest, LabelsLandInsideTheirFacets) {
    auto grid = pbn_test::solid(9, 9);
    for (int y = 3; y < 6; ++y) {
        for (int x = 3; x < 6; ++x) {
            grid.at<int>(y, x) = 1;
        }
    }
    auto facets = labeled(grid, 0, 0.25);

    // the surrounding facet is a square ring; its label must miss the middle.
    ASSERT_TRUE(facets[0].label);
    auto pos = facets[0].label->position;
    EXPECT_EQ(facets.facet_id_at(static_cast<int>(pos.x), static_cast<int>(pos.y)), 0);
    EXPECT_GT(facets[0].label->radius, 0.5);

    ASSERT_TRUE(facets[1].label);
    EXPECT_NEAR(facets[1].label->position.x, 4.5, 1e-9);
    EXPECT_NEAR(facets[1].label->position.y, 4.5, 1e-9);
}

TEST(LabelPlacerTest, DeletedFacetsHaveNoLabel) {
    auto facets = pbn::build_facets(pbn_test::index_grid({ {0, 0, 0}, {0, 0, 0} }));
    facets[0].point_count = 0;
    pbn::place_labels(facets);
    EXPECT_FALSE(facets[0].label);
}
