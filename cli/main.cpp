#include "pixedit/errors.hpp"
#include "pixedit/filters.hpp"
#include "pixedit/histogram.hpp"
#include "pixedit/image_io.hpp"
#include "pixedit/log.hpp"
#include "pixedit/session.hpp"

#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/cfg/env.h>
#include <spdlog/fmt/fmt.h>

struct CliOptions {
    std::string input;
    std::string output;
    std::vector<std::string> steps;   // 濾鏡名稱或 undo / redo / reset
    pe::FilterParameters params;
    int  quality = 95;
    bool print_histogram = false;
    std::string log_level;            // 空字串 = 沿用 SPDLOG_LEVEL / 預設
};

static void print_usage(const char* argv0) {
    fmt::print(stderr,
        "usage: {} <input> <output> [steps...] [options]\n"
        "\n"
        "steps:\n"
        "  none grayscale brightness contrast brightness_contrast\n"
        "  gaussian_blur edge_detection sepia undo redo reset\n"
        "\n"
        "options:\n"
        "  --brightness N   [-100, 100]  (default 0)\n"
        "  --contrast N     [-100, 100]  (default 0)\n"
        "  --radius N       blur radius  (default 3)\n"
        "  --quality N      JPEG quality (default 95)\n"
        "  --histogram      print RGB histogram summary of the result\n"
        "  --log-level L    trace|debug|info|warn|error|critical|off\n",
        argv0);
}

static double parse_double(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
}

static int parse_int(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

static CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
            return argv[++i];
        };

        if (arg == "--brightness")      opts.params.brightness  = parse_double(arg, next());
        else if (arg == "--contrast")   opts.params.contrast    = parse_double(arg, next());
        else if (arg == "--radius")     opts.params.blur_radius = parse_int(arg, next());
        else if (arg == "--quality")    opts.quality            = parse_int(arg, next());
        else if (arg == "--histogram")  opts.print_histogram    = true;
        else if (arg == "--log-level")  opts.log_level          = next();
        else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        throw std::invalid_argument("input and output paths are required");
    }
    opts.input  = positional[0];
    opts.output = positional[1];
    opts.steps.assign(positional.begin() + 2, positional.end());

    // 先把步驟名稱都檢查過，避免處理到一半才發現打錯字
    for (const auto& step : opts.steps) {
        if (step != "undo" && step != "redo" && step != "reset") {
            pe::parse_filter_kind(step);
        }
    }
    return opts;
}

static void print_histogram(const pe::ImageHistogram& hist) {
    auto mean = [](const pe::ImageHistogram::Bins& bins) {
        const auto total = pe::ImageHistogram::total(bins);
        if (total == 0) return 0.0;
        double acc = 0.0;
        for (std::size_t v = 0; v < bins.size(); ++v) {
            acc += static_cast<double>(v) * static_cast<double>(bins[v]);
        }
        return acc / static_cast<double>(total);
    };

    fmt::print("pixels: {}\n", pe::ImageHistogram::total(hist.red));
    fmt::print("mean   R {:.2f}  G {:.2f}  B {:.2f}\n",
               mean(hist.red), mean(hist.green), mean(hist.blue));
    fmt::print("peak bin count: {}\n", hist.max_value);
}

static void run(const CliOptions& opts) {
    pe::EditSession session;
    session.load(pe::load_image(opts.input));

    for (const auto& step : opts.steps) {
        if (step == "undo") {
            session.undo();
        } else if (step == "redo") {
            session.redo();
        } else if (step == "reset") {
            session.reset();
        } else {
            const pe::FilterKind kind = pe::parse_filter_kind(step);
            session.apply(kind, opts.params);
            pe::logger()->info("applied {} filter", pe::filter_name(kind));
        }
    }

    const pe::RasterSnapshot snap = session.snapshot();
    pe::save_image(opts.output, *snap.buffer, opts.quality);
    session.mark_saved();

    if (opts.print_histogram) {
        if (snap.histogram) {
            print_histogram(*snap.histogram);
        } else {
            pe::logger()->warn("no histogram available");
        }
    }
}

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
        if (!opts.log_level.empty()) {
            pe::set_log_level(pe::parse_log_level(opts.log_level));
        }
    } catch (const std::invalid_argument& e) {
        pe::logger()->error("{}", e.what());
        print_usage(argv[0]);
        return 1;
    }

    try {
        run(opts);
    } catch (const pe::Error& e) {
        pe::logger()->error("{}: {}", pe::to_string(e.code()), e.what());
        return 2;
    } catch (const std::exception& e) {
        pe::logger()->error("{}", e.what());
        return 2;
    }
    return EXIT_SUCCESS;
}
