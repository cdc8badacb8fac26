#include "facet_reducer.hpp"
#include <range/v3/all.hpp>
#include <limits>
#include <set>
#include <QDebug>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    int squared_distance(const cv::Point& a, const cv::Point& b) {
        auto diff = a - b;
        return diff.x * diff.x + diff.y * diff.y;
    }

    int min_squared_distance(const cv::Point& pt, const std::vector<cv::Point>& border) {
        int min_dist = std::numeric_limits<int>::max();
        for (const auto& border_pt : border) {
            min_dist = std::min(min_dist, squared_distance(pt, border_pt));
        }
        return min_dist;
    }

    // the neighbor closest to the pixel by border distance, then by color
    // distance to the facet being removed, then by lowest id.
    int closest_neighbor(const pbn::facet_result& facets, const cv::Point& pt, int color,
            const std::vector<int>& neighbors, const pbn::distance_matrix& color_distances) {
        int best = pbn::image_edge;
        int best_dist = std::numeric_limits<int>::max();
        double best_color_dist = std::numeric_limits<double>::max();
        for (int id : neighbors) {
            const auto& neighbor = facets[id];
            auto dist = min_squared_distance(pt, neighbor.border_points);
            auto color_dist = color_distances[color][neighbor.color];
            if (dist < best_dist || (dist == best_dist && color_dist < best_color_dist)) {
                best = id;
                best_dist = dist;
                best_color_dist = color_dist;
            }
        }
        return best;
    }

    pbn::bounding_box union_of_boxes(const pbn::facet_result& facets, int id,
            const std::vector<int>& neighbors) {
        auto box = facets[id].bbox;
        for (int neighbor : neighbors) {
            const auto& nb = facets[neighbor].bbox;
            if (!nb.empty()) {
                box.extend({ nb.min_x, nb.min_y });
                box.extend({ nb.max_x, nb.max_y });
            }
        }
        return box;
    }

    void tombstone(pbn::facet& f) {
        f.point_count = 0;
        f.border_points.clear();
        f.neighbors.clear();
        f.bbox = {};
    }

    // refills every live neighbor from one of its own pixels so that pixels
    // given its color join it. A neighbor whose seed is taken by an earlier
    // fill has merged into that fill.
    void rebuild_neighbors(pbn::facet_result& facets, const cv::Mat& color_indices,
            const std::vector<int>& neighbors, const pbn::bounding_box& area, cv::Mat& visited) {
        visited(area.to_rect()).setTo(0);
        auto& facet_map = facets.facet_map();
        for (int id : neighbors) {
            auto& f = facets[id];
            if (f.is_deleted()) {
                continue;
            }
            auto seed = f.border_points.front();
            if (visited.at<uchar>(seed)) {
                tombstone(f);
                continue;
            }
            f = pbn::fill_facet(color_indices, facet_map, visited, seed, id);
        }
    }

    std::vector<cv::Point> orphaned_pixels(const pbn::facet_result& facets, int id) {
        const auto& box = facets[id].bbox;
        std::vector<cv::Point> orphans;
        for (int y = box.min_y; y <= box.max_y; ++y) {
            for (int x = box.min_x; x <= box.max_x; ++x) {
                if (facets.facet_id_at(x, y) == id) {
                    orphans.emplace_back(x, y);
                }
            }
        }
        return orphans;
    }

    // direct reassignment of pixels the refill did not reach to the lowest id
    // live facet beside them.
    int reassign_orphans(pbn::facet_result& facets, cv::Mat& color_indices, int id,
            const std::vector<cv::Point>& orphans) {
        int reassigned = 0;
        for (const auto& pt : orphans) {
            int best = std::numeric_limits<int>::max();
            for (const auto& offset : pbn::four_neighborhood()) {
                int neighbor = facets.facet_id_at(pt + offset);
                if (neighbor != pbn::image_edge && neighbor != id && !facets[neighbor].is_deleted()) {
                    best = std::min(best, neighbor);
                }
            }
            if (best != std::numeric_limits<int>::max()) {
                facets.facet_map().at<int>(pt) = best;
                color_indices.at<int>(pt) = facets[best].color;
                ++reassigned;
            }
        }
        return reassigned;
    }

    int smallest_live_facet(const pbn::facet_result& facets) {
        int smallest = pbn::image_edge;
        for (const auto& f : facets.facets()) {
            if (!f.is_deleted() && 
                    (smallest == pbn::image_edge || f.point_count < facets[smallest].point_count)) {
                smallest = f.id;
            }
        }
        return smallest;
    }

    bool delete_facet_aux(pbn::facet_result& facets, cv::Mat& color_indices, int id,
            const pbn::distance_matrix& color_distances, cv::Mat& visited) {
        if (facets[id].is_deleted()) {
            return false;
        }
        auto neighbors = facets.neighbors(id) |
            rv::filter([&](int n) {return !facets[n].is_deleted(); }) |
            r::to_vector;
        if (neighbors.empty()) {
            return false;
        }

        std::set<int> changed(neighbors.begin(), neighbors.end());
        for (int neighbor : neighbors) {
            for (int n : facets.neighbors(neighbor)) {
                changed.insert(n);
            }
        }

        const auto& f = facets[id];
        for (int y = f.bbox.min_y; y <= f.bbox.max_y; ++y) {
            for (int x = f.bbox.min_x; x <= f.bbox.max_x; ++x) {
                if (facets.facet_id_at(x, y) != id) {
                    continue;
                }
                int replacement = closest_neighbor(facets, { x,y }, f.color, neighbors, color_distances);
                color_indices.at<int>(y, x) = facets[replacement].color;
            }
        }

        auto area = union_of_boxes(facets, id, neighbors);
        rebuild_neighbors(facets, color_indices, neighbors, area, visited);
        auto orphans = orphaned_pixels(facets, id);
        while (!orphans.empty()) {
            qDebug() << "facet" << id << ":" << static_cast<int>(orphans.size()) 
                << "pixels not reached by neighbor rebuild, reassigning directly";
            if (reassign_orphans(facets, color_indices, id, orphans) == 0) {
                throw pbn::consistency_error("unable to reassign pixels of removed facet", 
                    id, orphans.front().x, orphans.front().y);
            }
            rebuild_neighbors(facets, color_indices, neighbors, area, visited);
            orphans = orphaned_pixels(facets, id);
        }

        tombstone(facets[id]);
        for (int n : changed) {
            facets.mark_dirty(n);
        }
        return true;
    }
}

std::vector<int> pbn::removal_sequence(const facet_result& facets, removal_order order) {
    auto ids = facets.live_facet_ids();
    if (order == removal_order::large_to_small) {
        r::stable_sort(ids, 
            [&](int a, int b) {
                return facets[a].point_count > facets[b].point_count;
            }
        );
    } else {
        r::stable_sort(ids,
            [&](int a, int b) {
                return facets[a].point_count < facets[b].point_count;
            }
        );
    }
    return ids;
}

bool pbn::delete_facet(facet_result& facets, cv::Mat& color_indices, int id,
        const distance_matrix& color_distances) {
    cv::Mat visited = cv::Mat::zeros(color_indices.size(), CV_8UC1);
    return delete_facet_aux(facets, color_indices, id, color_distances, visited);
}

void pbn::reduce_facets(facet_result& facets, cv::Mat& color_indices,
        std::span<const rgb_color> palette, const settings& params, const progress* prog) {
    auto color_distances = color_distance_matrix(palette);
    cv::Mat visited = cv::Mat::zeros(color_indices.size(), CV_8UC1);

    auto sequence = removal_sequence(facets, params.order);
    int removed = 0;
    for (auto [i, id] : rv::enumerate(sequence)) {
        if (prog) {
            prog->check_cancellation();
        }
        const auto& f = facets[id];
        if (!f.is_deleted() && f.point_count < params.min_facet_size) {
            if (delete_facet_aux(facets, color_indices, id, color_distances, visited)) {
                ++removed;
            }
        }
        if (prog) {
            prog->update(0.5 * (i + 1) / sequence.size());
        }
    }
    if (prog) {
        prog->log(std::to_string(removed) + " facets smaller than " + 
            std::to_string(params.min_facet_size) + " pixels removed");
    }

    if (params.max_facet_count) {
        int max_count = *params.max_facet_count;
        int excess = facets.live_facet_count() - max_count;
        int capped = 0;
        while (facets.live_facet_count() > max_count) {
            if (prog) {
                prog->check_cancellation();
            }
            int smallest = smallest_live_facet(facets);
            if (!delete_facet_aux(facets, color_indices, smallest, color_distances, visited)) {
                break;
            }
            ++capped;
            if (prog) {
                prog->update(0.5 + 0.5 * capped / excess);
            }
        }
        if (prog) {
            prog->log(std::to_string(capped) + " facets removed to reach " + 
                std::to_string(max_count) + " facets");
        }
    }
    facets.refresh_neighbors();
    if (prog) {
        prog->update(1.0);
    }

    facets.validate();
}
