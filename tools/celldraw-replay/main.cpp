//=============================================================================
// celldraw-replay - apply recorded draw batches and save the frame
//
// Stands in for the host process: every file on the command line is one
// batch, applied in order to a single text view. The composited view frame
// is written as a binary PPM.
//=============================================================================

#include <celldraw/config.h>
#include <celldraw/font/freetype-rasterizer.h>
#include <celldraw/text-view.h>
#include <ytrace/ytrace.hpp>

#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace celldraw;

namespace {

constexpr const char* DEFAULT_FONT = "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf";

Result<std::vector<uint8_t>> readBatch(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::vector<uint8_t>>("Cannot open batch file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Err<std::vector<uint8_t>>("Read error on batch file: " + path);
    }
    return Ok(std::move(bytes));
}

struct Options {
    std::string configPath;
    YAML::Node cmdOverrides;
    std::string outputPath;
    std::vector<std::string> batches;
};

Result<Options> parseArgs(int argc, char* argv[]) {
    args::ArgumentParser parser("celldraw-replay - replay draw batches into an image");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path",
                                            {'c', "config"});
    args::ValueFlag<std::string> fontArg(parser, "font", "Path to TTF/OTF font",
                                         {'f', "font"});
    args::ValueFlag<float> sizeArg(parser, "points", "Font size in points",
                                   {'s', "size"});
    args::ValueFlag<int> rowsArg(parser, "rows", "Grid rows", {'r', "rows"});
    args::ValueFlag<int> colsArg(parser, "cols", "Grid columns", {'C', "columns"});
    args::ValueFlag<std::string> outputArg(parser, "file", "Output PPM image",
                                           {'o', "output"});
    args::Flag verboseFlag(parser, "verbose", "Log every draw record", {'v', "verbose"});
    args::PositionalList<std::string> batchFiles(parser, "batch",
                                                 "Recorded draw batch files, applied in order");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return Err<Options>("Help requested");
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return Err<Options>(std::string("Parse error: ") + e.what());
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return Err<Options>(std::string("Invalid arguments: ") + e.what());
    }

    if (verboseFlag) {
        spdlog::set_level(spdlog::level::trace);
    }

    Options options;
    if (fontArg) {
        options.cmdOverrides["font"]["path"] = args::get(fontArg);
    }
    if (sizeArg) {
        options.cmdOverrides["font"]["size"] = args::get(sizeArg);
    }
    if (rowsArg) {
        options.cmdOverrides["grid"]["rows"] = args::get(rowsArg);
    }
    if (colsArg) {
        options.cmdOverrides["grid"]["columns"] = args::get(colsArg);
    }

    options.configPath = configFile ? args::get(configFile) : "";
    options.outputPath = outputArg ? args::get(outputArg) : "celldraw.ppm";
    options.batches = args::get(batchFiles);
    if (options.batches.empty()) {
        std::cerr << parser;
        return Err<Options>("No batch files given");
    }
    return Ok(std::move(options));
}

Result<void> run(const Options& options) {
    auto configResult = Config::create(options.configPath, options.cmdOverrides);
    if (!configResult) {
        return Err<void>("Failed to create config", configResult);
    }
    ViewStyle style = ViewStyle::fromConfig(**configResult);
    if (style.fontPath.empty()) {
        style.fontPath = DEFAULT_FONT;
    }

    auto fontResult = font::FreeTypeRasterizer::create(style.fontPath, style.pointSize);
    if (!fontResult) {
        return Err<void>("Failed to load font", fontResult);
    }

    TextView view(style);
    view.setFont(*fontResult);

    size_t repaints = 0;
    view.setDisplayCallback([&repaints](const TextView&) { ++repaints; });
    view.setCursorPosListener([](int row, int col) {
        ydebug("cursor at ({},{})", row, col);
    });

    for (const auto& path : options.batches) {
        auto bytes = readBatch(path);
        if (!bytes) {
            return Err<void>("Failed to read batch", bytes);
        }
        auto stats = view.performBatchDraw(*bytes);
        if (!stats) {
            return Err<void>("Failed to draw " + path, stats);
        }
        yinfo("{}: {} records, {}/{} bytes{}", path, stats->recordsApplied,
              stats->bytesConsumed, bytes->size(),
              stats->stoppedEarly ? " (stopped early)" : "");
    }

    GridSurface frame(view.desiredSize());
    view.display(frame);
    if (auto res = frame.writePpm(options.outputPath); !res) {
        return Err<void>("Failed to write frame", res);
    }
    yinfo("Wrote {}x{} frame to {} after {} repaints", frame.width(), frame.height(),
          options.outputPath, repaints);
    return Ok();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    auto options = parseArgs(argc, argv);
    if (!options) {
        if (options.error().message() == "Help requested") {
            return 0;
        }
        yerror("{}", error_msg(options));
        return 1;
    }

    if (auto res = run(*options); !res) {
        yerror("celldraw-replay failed: {}", error_msg(res));
        return 1;
    }
    return 0;
}
