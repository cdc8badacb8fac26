#include <gtest/gtest.h>
#include "paintbynumbers/facets.hpp"
#include "test_helpers.hpp"

TEST(FacetBuilderTest, SolidImageIsOneFacet) {
    auto facets = pbn::build_facets(pbn_test::solid(3, 3));

    ASSERT_EQ(facets.size(), 1u);
    const auto& f = facets[0];
    EXPECT_EQ(f.point_count, 9);
    EXPECT_EQ(f.border_points.size(), 8u);
    EXPECT_TRUE(f.neighbors.empty());
    EXPECT_EQ(f.bbox.width(), 3);
    EXPECT_EQ(f.bbox.height(), 3);
    EXPECT_EQ(f.border_points.front(), cv::Point(0, 0));
    EXPECT_NO_THROW(facets.validate());
}

TEST(FacetBuilderTest, CheckerboardHasNoDiagonalNeighbors) {
    auto facets = pbn::build_facets(pbn_test::index_grid({ {0, 1}, {2, 3} }));

    ASSERT_EQ(facets.size(), 4u);
    for (const auto& f : facets.facets()) {
        EXPECT_EQ(f.point_count, 1);
        EXPECT_EQ(f.neighbors.size(), 2u);
    }
    EXPECT_EQ(facets[0].neighbors, (std::vector<int>{ 1, 2 }));
    EXPECT_EQ(facets[3].neighbors, (std::vector<int>{ 1, 2 }));
    EXPECT_EQ(facets[1].neighbors, (std::vector<int>{ 0, 3 }));
}

TEST(FacetBuilderTest, SameColorDiagonalCellsAreSeparateFacets) {
    auto facets = pbn::build_facets(pbn_test::checkerboard(2, 2));

    ASSERT_EQ(facets.size(), 4u);
    EXPECT_EQ(facets[0].color, facets[3].color);
    EXPECT_EQ(facets.facet_id_at(1, 1), 3);
}

TEST(FacetBuilderTest, IslandNeighborsAndBorders) {
    auto grid = pbn_test::solid(5, 5);
    grid.at<int>(2, 2) = 1;
    auto facets = pbn::build_facets(grid);

    ASSERT_EQ(facets.size(), 2u);
    EXPECT_EQ(facets[0].point_count, 24);
    EXPECT_EQ(facets[1].point_count, 1);
    EXPECT_EQ(facets[0].neighbors, std::vector<int>{ 1 });
    EXPECT_EQ(facets[1].neighbors, std::vector<int>{ 0 });
    // the outer ring of the image plus the four pixels around the island.
    EXPECT_EQ(facets[0].border_points.size(), 20u);
}

TEST(FacetBuilderTest, PointCountsCoverImage) {
    auto grid = pbn_test::random_indices(31, 17, 3, 21);
    auto facets = pbn::build_facets(grid);

    EXPECT_EQ(pbn_test::total_point_count(facets), 31 * 17);
    EXPECT_NO_THROW(facets.validate());
    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            EXPECT_EQ(facets[facets.facet_id_at(x, y)].color, grid.at<int>(y, x));
        }
    }
}

TEST(FacetBuilderTest, OffGridIsImageEdge) {
    auto facets = pbn::build_facets(pbn_test::solid(2, 2));
    EXPECT_EQ(facets.facet_id_at(-1, 0), pbn::image_edge);
    EXPECT_EQ(facets.facet_id_at(0, 2), pbn::image_edge);
}

TEST(FacetBuilderTest, RejectsEmptyGrid) {
    EXPECT_THROW(pbn::build_facets(cv::Mat()), pbn::input_error);
}

TEST(FacetResultTest, DirtyNeighborsAreRebuiltOnDemand) {
    auto grid = pbn_test::solid(5, 5);
    grid.at<int>(2, 2) = 1;
    auto facets = pbn::build_facets(grid);

    facets[0].neighbors.clear();
    facets.mark_dirty(0);
    EXPECT_TRUE(facets.is_dirty(0));
    EXPECT_EQ(facets.neighbors(0), std::vector<int>{ 1 });
    EXPECT_FALSE(facets.is_dirty(0));
}

TEST(FacetResultTest, RefreshNeighborsRebuildsEveryDirtyFacet) {
    auto grid = pbn_test::solid(5, 5);
    grid.at<int>(2, 2) = 1;
    auto facets = pbn::build_facets(grid);

    facets[0].neighbors.clear();
    facets[1].neighbors = { 7 };
    facets.mark_dirty(0);
    facets.mark_dirty(1);
    facets.refresh_neighbors();

    EXPECT_FALSE(facets.is_dirty(0));
    EXPECT_FALSE(facets.is_dirty(1));
    EXPECT_EQ(facets[0].neighbors, std::vector<int>{ 1 });
    EXPECT_EQ(facets[1].neighbors, std::vector<int>{ 0 });
}

TEST(FacetBuilderTest, FourNeighborhoodIsUpRightDownLeft) {
    const auto& offsets = pbn::four_neighborhood();
    EXPECT_EQ(offsets[0], cv::Point(0, -1));
    EXPECT_EQ(offsets[1], cv::Point(1, 0));
    EXPECT_EQ(offsets[2], cv::Point(0, 1));
    EXPECT_EQ(offsets[3], cv::Point(-1, 0));
}

TEST(FacetResultTest, ValidateDetectsCountMismatch) {
    auto facets = pbn::build_facets(pbn_test::index_grid({ {0, 1}, {1, 1} }));
    facets[1].point_count = 2;
    EXPECT_THROW(facets.validate(), pbn::consistency_error);
}

TEST(FacetResultTest, ValidateDetectsDeletedReference) {
    auto facets = pbn::build_facets(pbn_test::index_grid({ {0, 1}, {1, 1} }));
    facets[0].point_count = 0;
    EXPECT_THROW(facets.validate(), pbn::consistency_error);
}

TEST(FacetResultTest, LiveFacets) {
    auto facets = pbn::build_facets(pbn_test::index_grid({ {0, 1, 2} }));
    facets[1].point_count = 0;
    EXPECT_EQ(facets.live_facet_count(), 2);
    EXPECT_EQ(facets.live_facet_ids(), (std::vector<int>{ 0, 2 }));
}
