#include "facets.hpp"
#include <range/v3/all.hpp>
#include <array>
#include <stack>
#include <algorithm>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    bool in_mat(const cv::Mat& mat, const cv::Point& pt) {
        return pt.x >= 0 && pt.y >= 0 && pt.x < mat.cols && pt.y < mat.rows;
    }

    bool raster_order(const cv::Point& a, const cv::Point& b) {
        return (a.y == b.y) ? a.x < b.x : a.y < b.y;
    }
}

bool pbn::facet::is_deleted() const {
    return point_count == 0;
}

pbn::facet_result::facet_result() 
{}

pbn::facet_result::facet_result(cv::Mat facet_map, std::vector<facet> facets) :
    facet_map_(facet_map),
    facets_(std::move(facets))
{}

int pbn::facet_result::width() const {
    return facet_map_.cols;
}

int pbn::facet_result::height() const {
    return facet_map_.rows;
}

bool pbn::facet_result::in_bounds(int x, int y) const {
    return in_mat(facet_map_, { x,y });
}

const cv::Mat& pbn::facet_result::facet_map() const {
    return facet_map_;
}

cv::Mat& pbn::facet_result::facet_map() {
    return facet_map_;
}

int pbn::facet_result::facet_id_at(int x, int y) const {
    return in_bounds(x, y) ? facet_map_.at<int>(y, x) : image_edge;
}

int pbn::facet_result::facet_id_at(const int_point& pt) const {
    return facet_id_at(pt.x, pt.y);
}

size_t pbn::facet_result::size() const {
    return facets_.size();
}

const pbn::facet& pbn::facet_result::operator[](int id) const {
    return facets_.at(id);
}

pbn::facet& pbn::facet_result::operator[](int id) {
    return facets_.at(id);
}

const std::vector<pbn::facet>& pbn::facet_result::facets() const {
    return facets_;
}

std::vector<pbn::facet>& pbn::facet_result::facets() {
    return facets_;
}

int pbn::facet_result::live_facet_count() const {
    return static_cast<int>(r::count_if(facets_, [](const facet& f) {return !f.is_deleted(); }));
}

std::vector<int> pbn::facet_result::live_facet_ids() const {
    return facets_ |
        rv::filter([](const facet& f) {return !f.is_deleted(); }) |
        rv::transform([](const facet& f) {return f.id; }) |
        r::to_vector;
}

const std::vector<int>& pbn::facet_result::neighbors(int id) {
    auto& f = facets_.at(id);
    if (dirty_.contains(id)) {
        f.neighbors = find_neighbors(f, facet_map_);
        dirty_.erase(id);
    }
    return f.neighbors;
}

void pbn::facet_result::mark_dirty(int id) {
    dirty_.insert(id);
}

bool pbn::facet_result::is_dirty(int id) const {
    return dirty_.contains(id);
}

void pbn::facet_result::refresh_neighbors() {
    for (int id : dirty_) {
        auto& f = facets_.at(id);
        f.neighbors = find_neighbors(f, facet_map_);
    }
    dirty_.clear();
}

const std::vector<pbn::shared_segment>& pbn::facet_result::segments() const {
    return segments_;
}

std::vector<pbn::shared_segment>& pbn::facet_result::segments() {
    return segments_;
}

void pbn::facet_result::validate() const {
    std::vector<int> counts(facets_.size(), 0);
    for (int y = 0; y < height(); ++y) {
        for (int x = 0; x < width(); ++x) {
            int id = facet_map_.at<int>(y, x);
            if (id < 0 || id >= static_cast<int>(facets_.size())) {
                throw consistency_error("pixel references a nonexistent facet", id, x, y);
            }
            if (facets_[id].is_deleted()) {
                throw consistency_error("pixel references a deleted facet", id, x, y);
            }
            counts[id]++;
        }
    }
    long long total = 0;
    for (const auto& f : facets_) {
        if (counts[f.id] != f.point_count) {
            throw consistency_error(
                "facet point count " + std::to_string(f.point_count) +
                " does not match its " + std::to_string(counts[f.id]) + " pixels",
                f.id
            );
        }
        total += f.point_count;
    }
    if (total != static_cast<long long>(width()) * height()) {
        throw consistency_error("facet point counts do not sum to the image area");
    }
}

/*------------------------------------------------------------------------------------------------*/

const std::array<cv::Point, 4>& pbn::four_neighborhood() {
    static const std::array<cv::Point, 4> offsets = {{
        {0, -1}, {1, 0}, {0, 1}, {-1, 0}
    }};
    return offsets;
}

bool pbn::is_border_pixel(const cv::Mat& color_indices, int x, int y) {
    int color = color_indices.at<int>(y, x);
    for (const auto& offset : four_neighborhood()) {
        cv::Point neighbor(x + offset.x, y + offset.y);
        if (!in_mat(color_indices, neighbor) || color_indices.at<int>(neighbor) != color) {
            return true;
        }
    }
    return false;
}

pbn::facet pbn::fill_facet(const cv::Mat& color_indices, cv::Mat& facet_map, cv::Mat& visited,
        const int_point& seed, int id) {
    facet f;
    f.id = id;
    f.color = color_indices.at<int>(seed);
    f.point_count = 0;

    std::stack<cv::Point> stack;
    stack.push(seed);
    visited.at<uchar>(seed) = 1;
    while (!stack.empty()) {
        auto pt = stack.top();
        stack.pop();

        facet_map.at<int>(pt) = id;
        f.point_count++;
        f.bbox.extend(pt);
        if (is_border_pixel(color_indices, pt.x, pt.y)) {
            f.border_points.push_back(pt);
        }

        for (const auto& offset : four_neighborhood()) {
            cv::Point neighbor = pt + offset;
            if (in_mat(color_indices, neighbor) && !visited.at<uchar>(neighbor) &&
                    color_indices.at<int>(neighbor) == f.color) {
                visited.at<uchar>(neighbor) = 1;
                stack.push(neighbor);
            }
        }
    }
    std::sort(f.border_points.begin(), f.border_points.end(), raster_order);

    return f;
}

std::vector<int> pbn::find_neighbors(const facet& f, const cv::Mat& facet_map) {
    std::set<int> neighbors;
    for (const auto& pt : f.border_points) {
        for (const auto& offset : four_neighborhood()) {
            cv::Point neighbor = pt + offset;
            if (in_mat(facet_map, neighbor)) {
                int id = facet_map.at<int>(neighbor);
                if (id != f.id) {
                    neighbors.insert(id);
                }
            }
        }
    }
    return { neighbors.begin(), neighbors.end() };
}

pbn::facet_result pbn::build_facets(const cv::Mat& color_indices, const progress* prog) {
    if (color_indices.empty()) {
        throw input_error("empty color index grid");
    }

    cv::Mat facet_map(color_indices.size(), CV_32SC1, cv::Scalar(image_edge));
    cv::Mat visited = cv::Mat::zeros(color_indices.size(), CV_8UC1);
    std::vector<facet> facets;

    for (int y = 0; y < color_indices.rows; ++y) {
        for (int x = 0; x < color_indices.cols; ++x) {
            if (!visited.at<uchar>(y, x)) {
                facets.push_back(
                    fill_facet(color_indices, facet_map, visited, { x,y }, static_cast<int>(facets.size()))
                );
            }
        }
        if (prog) {
            prog->update(0.5 * (y + 1) / color_indices.rows);
        }
    }

    for (auto& f : facets) {
        f.neighbors = find_neighbors(f, facet_map);
    }
    if (prog) {
        prog->update(1.0);
    }

    return { facet_map, std::move(facets) };
}
