#pragma once

#include <celldraw/base/factory.h>
#include <celldraw/color.h>
#include <celldraw/result.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace celldraw {

//-----------------------------------------------------------------------------
// Config - yaml-cpp backed settings tree
//
// Precedence, lowest first: built-in defaults, config file (explicit path or
// the XDG location), CELLDRAW_* environment variables, command line
// overrides. Keys are dotted paths ("font.size").
//-----------------------------------------------------------------------------
class Config : public base::ObjectFactory<Config> {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> createImpl(ContextType& ctx, const std::string& configPath,
                                  const YAML::Node& cmdOverrides);
    static Result<Ptr> createImpl(ContextType& ctx, const std::string& configPath);
    static Result<Ptr> createImpl(ContextType& ctx);

    virtual ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Value at a dotted path; nullopt if missing or not convertible
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // Color at a dotted path: "0xAARRGGBB", "#RRGGBB" or "#AARRGGBB"
    std::optional<Color> getColor(const std::string& path) const;

    // Merge `overrides` on top of the current tree
    void applyOverrides(const YAML::Node& overrides);

    const YAML::Node& root() const { return _config; }

    // $XDG_CONFIG_HOME/celldraw/config.yaml (falls back to ~/.config)
    static std::filesystem::path getXDGConfigPath();

    static Result<Color> parseColor(const std::string& text);

    static constexpr const char* ENV_PREFIX = "CELLDRAW_";

    static constexpr const char* KEY_FONT_PATH = "font.path";
    static constexpr const char* KEY_FONT_SIZE = "font.size";
    static constexpr const char* KEY_FONT_CELL_WIDTH_MULTIPLIER = "font.cell-width-multiplier";
    static constexpr const char* KEY_FONT_LINESPACE = "font.linespace";
    static constexpr const char* KEY_FONT_ANTIALIAS = "font.antialias";
    static constexpr const char* KEY_VIEW_INSET_WIDTH = "view.inset-width";
    static constexpr const char* KEY_VIEW_INSET_HEIGHT = "view.inset-height";
    static constexpr const char* KEY_VIEW_MIN_ROWS = "view.min-rows";
    static constexpr const char* KEY_VIEW_MIN_COLUMNS = "view.min-columns";
    static constexpr const char* KEY_COLORS_BACKGROUND = "colors.background";
    static constexpr const char* KEY_COLORS_FOREGROUND = "colors.foreground";
    static constexpr const char* KEY_GRID_ROWS = "grid.rows";
    static constexpr const char* KEY_GRID_COLUMNS = "grid.columns";

protected:
    Config() = default;

    YAML::Node getNode(const std::string& path) const;

    // Convert dotted path to env var name ("font.cell-width-multiplier" ->
    // "CELLDRAW_FONT_CELL_WIDTH_MULTIPLIER")
    static std::string pathToEnvVar(const std::string& path);

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace celldraw
