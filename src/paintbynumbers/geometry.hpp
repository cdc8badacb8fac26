#pragma once

#include <vector>
#include <span>
#include <tuple>
#include <opencv2/core.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/register/point.hpp>

/*------------------------------------------------------------------------------------------------------*/

namespace pbn { using point = cv::Point2d; }
BOOST_GEOMETRY_REGISTER_POINT_2D(pbn::point, double, boost::geometry::cs::cartesian, x, y);

namespace pbn {

    using polygon = boost::geometry::model::polygon<point, true, false>;
    using ring = boost::geometry::model::ring<point, true, false>;
    using polyline = boost::geometry::model::linestring<point>;
    using rectangle = std::tuple<double, double, double, double>;
    using int_point = cv::Point;

    // inclusive integer bounds of a set of pixels.
    struct bounding_box {
        int min_x;
        int min_y;
        int max_x;
        int max_y;

        bounding_box();
        bounding_box(int x1, int y1, int x2, int y2);

        bool empty() const;
        int width() const;
        int height() const;
        void extend(const int_point& pt);
        bool contains(const int_point& pt) const;
        cv::Rect to_rect() const;
    };

    polygon make_polygon(const ring& outer, const std::vector<ring>& inners);
    ring make_ring(std::span<const point> verts);
    polyline closed_polyline(const ring& r);
    rectangle bounding_rectangle(const ring& r);
    bool is_degenerate_ring(const ring& r);
    point centroid(const polygon& poly);

    // sum of the absolute turning angles, in radians, at the interior
    // vertices of an open polyline.
    double total_turning_angle(std::span<const point> pts);
}
