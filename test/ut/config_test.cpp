//=============================================================================
// Config Tests
//=============================================================================

#include <boost/ut.hpp>
#include <celldraw/config.h>
#include <celldraw/text-view.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace boost::ut;
using namespace celldraw;

namespace {

std::filesystem::path writeTempConfig(const std::string& name, const std::string& yaml) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << yaml;
    return path;
}

} // anonymous namespace

suite config_tests = [] {
    "defaults are present without a file"_test = [] {
        auto config = Config::create(std::string("/nonexistent/celldraw.yaml"));
        expect(!config.has_value()) << "explicit path must exist";

        // Point XDG somewhere empty so the user's own config is not picked up
        ::setenv("XDG_CONFIG_HOME", "/nonexistent-celldraw-xdg", 1);
        auto defaults = Config::create();
        expect(defaults.has_value());
        expect((*defaults)->get<int>(Config::KEY_GRID_ROWS, 0) == 24_i);
        expect((*defaults)->get<int>(Config::KEY_GRID_COLUMNS, 0) == 80_i);
        expect((*defaults)->get<int>(Config::KEY_VIEW_MIN_ROWS, 0) == 4_i);
        expect((*defaults)->get<int>(Config::KEY_VIEW_MIN_COLUMNS, 0) == 30_i);
        expect((*defaults)->get<bool>(Config::KEY_FONT_ANTIALIAS, false));
        ::unsetenv("XDG_CONFIG_HOME");
    };

    "file values override defaults"_test = [] {
        auto path = writeTempConfig("celldraw_config_test.yaml",
            "font:\n"
            "  size: 15.5\n"
            "  linespace: 2\n"
            "grid:\n"
            "  rows: 40\n"
            "colors:\n"
            "  background: \"#102030\"\n");

        auto config = Config::create(path.string());
        expect(config.has_value());
        auto& c = **config;
        expect(c.get<float>(Config::KEY_FONT_SIZE, 0.0f) == 15.5_f);
        expect(c.get<int>(Config::KEY_GRID_ROWS, 0) == 40_i);
        expect(c.get<int>(Config::KEY_GRID_COLUMNS, 0) == 80_i) << "sibling default kept";
        expect(c.getColor(Config::KEY_COLORS_BACKGROUND) == Color(0xFF102030));
        expect(c.has("font.size"));
        expect(!c.has("font.nothing"));
        expect(!c.has("font.size.deeper"));
        std::filesystem::remove(path);
    };

    "malformed yaml is an error"_test = [] {
        auto path = writeTempConfig("celldraw_config_bad.yaml", "font: [unclosed\n");
        auto config = Config::create(path.string());
        expect(!config.has_value());
        std::filesystem::remove(path);
    };

    "environment overrides the file"_test = [] {
        ::setenv("CELLDRAW_FONT_SIZE", "18", 1);
        ::setenv("CELLDRAW_FONT_CELL_WIDTH_MULTIPLIER", "1.25", 1);
        auto config = Config::create(std::string(), YAML::Node());
        ::unsetenv("CELLDRAW_FONT_SIZE");
        ::unsetenv("CELLDRAW_FONT_CELL_WIDTH_MULTIPLIER");

        expect(config.has_value());
        expect((*config)->get<float>(Config::KEY_FONT_SIZE, 0.0f) == 18.0_f);
        expect((*config)->get<float>(Config::KEY_FONT_CELL_WIDTH_MULTIPLIER, 0.0f) == 1.25_f);
    };

    "command line overrides win"_test = [] {
        ::setenv("CELLDRAW_GRID_ROWS", "30", 1);
        YAML::Node overrides;
        overrides["grid"]["rows"] = 50;
        overrides["font"]["path"] = "/tmp/font.ttf";
        auto config = Config::create(std::string(), overrides);
        ::unsetenv("CELLDRAW_GRID_ROWS");

        expect(config.has_value());
        expect((*config)->get<int>(Config::KEY_GRID_ROWS, 0) == 50_i);
        expect((*config)->get<std::string>(Config::KEY_FONT_PATH, "") == "/tmp/font.ttf");
    };

    "wrong value types fall back to the default"_test = [] {
        YAML::Node overrides;
        overrides["grid"]["rows"] = "many";
        auto config = Config::create(std::string(), overrides);
        expect(config.has_value());
        expect(!(*config)->get<int>(Config::KEY_GRID_ROWS).has_value());
        expect((*config)->get<int>(Config::KEY_GRID_ROWS, 7) == 7_i);
    };

    "color parsing"_test = [] {
        expect(Config::parseColor("#FF8000").value() == Color(0xFFFF8000));
        expect(Config::parseColor("0x80FF8000").value() == Color(0x80FF8000));
        expect(Config::parseColor("#80ff8000").value() == Color(0x80FF8000));
        expect(!Config::parseColor("FF8000").has_value());
        expect(!Config::parseColor("#FF80").has_value());
        expect(!Config::parseColor("#GG8000").has_value());
    };

    "view style from config"_test = [] {
        YAML::Node overrides;
        overrides["view"]["inset-width"] = 5;
        overrides["view"]["min-rows"] = 8;
        overrides["colors"]["foreground"] = "#00FF00";
        overrides["grid"]["columns"] = 132;
        auto config = Config::create(std::string(), overrides);
        expect(config.has_value());

        auto style = ViewStyle::fromConfig(**config);
        expect(style.inset.width == 5_i);
        expect(style.inset.height == 1_i);
        expect(style.minGrid.rows == 8_i);
        expect(style.grid.columns == 132_i);
        expect(style.foreground == Color(0xFF00FF00));
        expect(style.background == colors::White);
        expect(style.pointSize == 12.0_f);
    };

    "env var names follow the dotted path"_test = [] {
        ::setenv("CELLDRAW_VIEW_INSET_HEIGHT", "6", 1);
        auto config = Config::create(std::string(), YAML::Node());
        ::unsetenv("CELLDRAW_VIEW_INSET_HEIGHT");
        expect(config.has_value());
        expect((*config)->get<int>(Config::KEY_VIEW_INSET_HEIGHT, 0) == 6_i);
    };
};
