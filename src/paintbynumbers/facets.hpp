#pragma once

#include "util.hpp"
#include "geometry.hpp"
#include <vector>
#include <set>
#include <optional>
#include <array>
#include <opencv2/core.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace pbn {

    // facet id used for anything across the image boundary.
    constexpr int image_edge = -1;

    enum class orientation {
        left = 0,
        top,
        right,
        bottom
    };

    // a run of pixel walls with the same orientation and the same facet on the
    // far side, starting at the given wall of the given pixel.
    struct path_point {
        int_point pixel;
        orientation side;
        int across;

        bool operator==(const path_point& pp) const = default;
    };

    struct border_loop {
        std::vector<path_point> points;
        bool is_hole;
    };

    struct shared_segment {
        std::vector<point> points;
        int owner;
        int neighbor;
    };

    // a facet's view of a shared_segment; reversed when the facet walks the
    // segment in the opposite direction from its owner.
    struct facet_segment {
        int index;
        bool reversed;
        int neighbor;
        int loop;
    };

    struct label_anchor {
        point position;
        double radius;
    };

    struct facet {
        int id;
        int color;
        int point_count;
        std::vector<int_point> border_points;
        std::vector<int> neighbors;
        bounding_box bbox;

        std::vector<border_loop> loops;
        std::vector<facet_segment> segments;
        std::optional<label_anchor> label;

        bool is_deleted() const;
    };

    class facet_result {
    private:
        cv::Mat facet_map_;
        std::vector<facet> facets_;
        std::set<int> dirty_;
        std::vector<shared_segment> segments_;

    public:
        facet_result();
        facet_result(cv::Mat facet_map, std::vector<facet> facets);

        int width() const;
        int height() const;
        bool in_bounds(int x, int y) const;

        const cv::Mat& facet_map() const;
        cv::Mat& facet_map();
        int facet_id_at(int x, int y) const;
        int facet_id_at(const int_point& pt) const;

        size_t size() const;
        const facet& operator[](int id) const;
        facet& operator[](int id);
        const std::vector<facet>& facets() const;
        std::vector<facet>& facets();
        int live_facet_count() const;
        std::vector<int> live_facet_ids() const;

        // neighbor lists are rebuilt on demand when marked dirty.
        const std::vector<int>& neighbors(int id);
        void mark_dirty(int id);
        bool is_dirty(int id) const;
        void refresh_neighbors();

        const std::vector<shared_segment>& segments() const;
        std::vector<shared_segment>& segments();

        // throws consistency_error unless every pixel belongs to a live facet
        // whose point count matches its pixels.
        void validate() const;
    };

    // offsets to the 4-connected neighbors: up, right, down, left.
    const std::array<cv::Point, 4>& four_neighborhood();

    bool is_border_pixel(const cv::Mat& color_indices, int x, int y);

    facet fill_facet(const cv::Mat& color_indices, cv::Mat& facet_map, cv::Mat& visited,
        const int_point& seed, int id);

    std::vector<int> find_neighbors(const facet& f, const cv::Mat& facet_map);

    facet_result build_facets(const cv::Mat& color_indices, const progress* prog = nullptr);
}
