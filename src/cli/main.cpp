#include "../paintbynumbers/pipeline.hpp"
#include "../paintbynumbers/settings.hpp"
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <string>

namespace {

    void print_usage() {
        std::cerr << "usage: pbn <input image> <output.svg|output.png> [settings.json]" << std::endl;
    }

    bool ends_with(const std::string& str, const std::string& suffix) {
        return str.size() >= suffix.size() &&
            str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    pbn::callbacks console_callbacks() {
        return {
            {},
            [](const std::string& status) { std::cout << status << std::endl; },
            [](const std::string& msg) { std::cout << "  " << msg << std::endl; },
            {}
        };
    }
}

int main(int argc, char* argv[])
{
    if (argc < 3 || argc > 4) {
        print_usage();
        return 1;
    }
    std::string input_file = argv[1];
    std::string output_file = argv[2];

    try {
        auto params = (argc == 4) ? pbn::settings_from_file(argv[3]) : pbn::settings{};
        auto img = cv::imread(input_file, cv::IMREAD_COLOR);
        if (img.empty()) {
            std::cerr << "unable to read " << input_file << std::endl;
            return 1;
        }

        auto cbs = console_callbacks();
        auto result = pbn::generate_paint_by_numbers(img, params, cbs);
        if (result.status != pbn::run_status::completed || !result.output) {
            std::cerr << "cancelled" << std::endl;
            return 1;
        }

        if (ends_with(output_file, ".png")) {
            if (!cv::imwrite(output_file, pbn::paint_facets(*result.output))) {
                std::cerr << "unable to write " << output_file << std::endl;
                return 1;
            }
        } else {
            pbn::write_to_svg(output_file, *result.output);
        }
    } catch (const pbn::input_error& e) {
        std::cerr << "invalid input: " << e.what() << std::endl;
        return 1;
    } catch (const pbn::consistency_error& e) {
        std::cerr << "internal error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
