#include "settings.hpp"
#include <array>
#include <fstream>
#include <sstream>

/*------------------------------------------------------------------------------------------------*/

namespace {

    pbn::json palette_to_json(const std::vector<pbn::rgb_color>& palette) {
        pbn::json js = pbn::json::array();
        for (const auto& c : palette) {
            js.push_back(pbn::json::array({ c[0], c[1], c[2] }));
        }
        return js;
    }

    std::vector<pbn::rgb_color> json_to_palette(const pbn::json& js) {
        if (!js.is_array()) {
            throw pbn::input_error("fixedPalette must be a list of [r,g,b] triples");
        }
        std::vector<pbn::rgb_color> palette;
        for (const auto& entry : js) {
            if (!entry.is_array() || entry.size() != 3) {
                throw pbn::input_error("fixedPalette entry must have exactly 3 channels: " + entry.dump());
            }
            std::array<uchar, 3> channels;
            for (int i = 0; i < 3; ++i) {
                if (!entry[i].is_number_integer()) {
                    throw pbn::input_error("fixedPalette channel must be an integer: " + entry.dump());
                }
                auto val = entry[i].get<int>();
                if (val < 0 || val > 255) {
                    throw pbn::input_error("fixedPalette channel out of range 0-255: " + entry.dump());
                }
                channels[i] = static_cast<uchar>(val);
            }
            palette.push_back(pbn::rgb(channels[0], channels[1], channels[2]));
        }
        return palette;
    }

    template<typename T>
    void read_field(const pbn::json& js, const char* key, T& field) {
        if (js.contains(key)) {
            field = js[key].get<T>();
        }
    }
}

std::string pbn::to_string(removal_order order) {
    return (order == removal_order::large_to_small) ? "largeToSmall" : "smallToLarge";
}

pbn::removal_order pbn::removal_order_from_string(const std::string& str) {
    if (str == "largeToSmall") {
        return removal_order::large_to_small;
    } else if (str == "smallToLarge") {
        return removal_order::small_to_large;
    }
    throw input_error("unknown removal order: " + str);
}

void pbn::settings::validate() const {
    if (cluster_count <= 0) {
        throw input_error("clusterCount must be positive");
    }
    if (convergence_threshold <= 0.0) {
        throw input_error("convergenceThreshold must be positive");
    }
    if (fixed_palette && fixed_palette->empty()) {
        throw input_error("fixedPalette must not be empty");
    }
    if (min_facet_size < 0) {
        throw input_error("minFacetSize must be non-negative");
    }
    if (max_facet_count && *max_facet_count <= 0) {
        throw input_error("maxFacetCount must be positive");
    }
    if (border_smoothing_iterations < 0) {
        throw input_error("borderSmoothingIterations must be non-negative");
    }
    if (max_iterations <= 0) {
        throw input_error("maxIterations must be positive");
    }
    if (narrow_pixel_strip_cleanup_runs < 0) {
        throw input_error("narrowPixelStripCleanupRuns must be non-negative");
    }
    if (label_precision <= 0.0) {
        throw input_error("labelPrecision must be positive");
    }
}

pbn::json pbn::settings_to_json(const settings& s) {
    json js = {
        {"clusterCount", s.cluster_count},
        {"colorSpace", to_string(s.space)},
        {"convergenceThreshold", s.convergence_threshold},
        {"randomSeed", s.random_seed},
        {"minFacetSize", s.min_facet_size},
        {"removalOrder", to_string(s.order)},
        {"borderSmoothingIterations", s.border_smoothing_iterations},
        {"maxIterations", s.max_iterations},
        {"narrowPixelStripCleanupRuns", s.narrow_pixel_strip_cleanup_runs},
        {"labelPrecision", s.label_precision}
    };
    if (s.fixed_palette) {
        js["fixedPalette"] = palette_to_json(*s.fixed_palette);
    }
    if (s.max_facet_count) {
        js["maxFacetCount"] = *s.max_facet_count;
    }
    return js;
}

pbn::settings pbn::json_to_settings(const json& js) {
    if (!js.is_object()) {
        throw input_error("settings must be a JSON object");
    }
    settings s;
    try {
        read_field(js, "clusterCount", s.cluster_count);
        read_field(js, "convergenceThreshold", s.convergence_threshold);
        read_field(js, "randomSeed", s.random_seed);
        read_field(js, "minFacetSize", s.min_facet_size);
        read_field(js, "borderSmoothingIterations", s.border_smoothing_iterations);
        read_field(js, "maxIterations", s.max_iterations);
        read_field(js, "narrowPixelStripCleanupRuns", s.narrow_pixel_strip_cleanup_runs);
        read_field(js, "labelPrecision", s.label_precision);
        if (js.contains("colorSpace")) {
            s.space = color_space_from_string(js["colorSpace"].get<std::string>());
        }
        if (js.contains("removalOrder")) {
            s.order = removal_order_from_string(js["removalOrder"].get<std::string>());
        }
        if (js.contains("maxFacetCount") && !js["maxFacetCount"].is_null()) {
            s.max_facet_count = js["maxFacetCount"].get<int>();
        }
        if (js.contains("fixedPalette") && !js["fixedPalette"].is_null()) {
            s.fixed_palette = json_to_palette(js["fixedPalette"]);
        }
    } catch (const json::exception& e) {
        throw input_error(std::string("malformed settings: ") + e.what());
    }
    return s;
}

pbn::settings pbn::settings_from_file(const std::string& filename) {
    std::ifstream ifs(filename);
    if (!ifs) {
        throw input_error("unable to open settings file " + filename);
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    json js;
    try {
        js = json::parse(ss.str());
    } catch (const json::exception& e) {
        throw input_error("unable to parse settings file " + filename + ": " + e.what());
    }
    return json_to_settings(js);
}
