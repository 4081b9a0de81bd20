#include <celldraw/config.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace celldraw {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Every leaf key with a default is also looked up in the environment
const char* const ENV_KEYS[] = {
    Config::KEY_FONT_PATH,
    Config::KEY_FONT_SIZE,
    Config::KEY_FONT_CELL_WIDTH_MULTIPLIER,
    Config::KEY_FONT_LINESPACE,
    Config::KEY_FONT_ANTIALIAS,
    Config::KEY_VIEW_INSET_WIDTH,
    Config::KEY_VIEW_INSET_HEIGHT,
    Config::KEY_VIEW_MIN_ROWS,
    Config::KEY_VIEW_MIN_COLUMNS,
    Config::KEY_COLORS_BACKGROUND,
    Config::KEY_COLORS_FOREGROUND,
    Config::KEY_GRID_ROWS,
    Config::KEY_GRID_COLUMNS,
};

} // anonymous namespace

//=============================================================================
// ConfigImpl
//=============================================================================

class ConfigImpl : public Config {
public:
    ConfigImpl(std::string configPath, YAML::Node cmdOverrides)
        : _configPath(std::move(configPath)), _cmdOverrides(std::move(cmdOverrides)) {}

    Result<void> init() {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicit path must load; the XDG file is best effort
                if (!_configPath.empty()) {
                    return Err<void>("Failed to load config " + effectivePath, res);
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides();

        if (_cmdOverrides && !_cmdOverrides.IsNull()) {
            applyOverrides(_cmdOverrides);
        }
        return Ok();
    }

private:
    void loadDefaults() {
        _config = YAML::Node(YAML::NodeType::Map);
        _config["font"]["path"] = "";
        _config["font"]["size"] = 12.0;
        _config["font"]["cell-width-multiplier"] = 1.0;
        _config["font"]["linespace"] = 0.0;
        _config["font"]["antialias"] = true;
        _config["view"]["inset-width"] = 2;
        _config["view"]["inset-height"] = 1;
        _config["view"]["min-rows"] = 4;
        _config["view"]["min-columns"] = 30;
        _config["colors"]["background"] = "0xFFFFFFFF";
        _config["colors"]["foreground"] = "0xFF000000";
        _config["grid"]["rows"] = 24;
        _config["grid"]["columns"] = 80;
    }

    Result<void> loadFile(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                return Err<void>("Cannot open config file: " + path);
            }
            YAML::Node fileConfig = YAML::Load(file);
            if (fileConfig && !fileConfig.IsNull()) {
                if (!fileConfig.IsMap()) {
                    return Err<void>("Config root is not a map: " + path);
                }
                mergeNodes(_config, fileConfig);
            }
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err<void>("YAML parse error: " + std::string(e.what()));
        }
    }

    void applyEnvOverrides() {
        for (const char* key : ENV_KEYS) {
            std::string envVar = pathToEnvVar(key);
            const char* val = std::getenv(envVar.c_str());
            if (!val) continue;

            YAML::Node target = _config;
            auto parts = splitPath(key);
            for (size_t i = 0; i + 1 < parts.size(); ++i) {
                target.reset(target[parts[i]]);
            }
            target[parts.back()] = std::string(val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }

    std::string _configPath;
    YAML::Node _cmdOverrides;
};

//=============================================================================
// Config
//=============================================================================

Result<Config::Ptr> Config::createImpl(ContextType&, const std::string& configPath,
                                       const YAML::Node& cmdOverrides) {
    auto impl = std::make_shared<ConfigImpl>(configPath, cmdOverrides);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(Ptr(std::move(impl)));
}

Result<Config::Ptr> Config::createImpl(ContextType& ctx, const std::string& configPath) {
    return createImpl(ctx, configPath, YAML::Node());
}

Result<Config::Ptr> Config::createImpl(ContextType& ctx) {
    return createImpl(ctx, std::string(), YAML::Node());
}

YAML::Node Config::getNode(const std::string& path) const {
    // Walk through const nodes: non-const operator[] inserts missing keys
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        const YAML::Node& node = current;
        if (!node.IsMap()) {
            return YAML::Node();
        }
        YAML::Node child = node[part];
        if (!child) {
            return YAML::Node();
        }
        current.reset(child);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::optional<Color> Config::getColor(const std::string& path) const {
    auto text = get<std::string>(path);
    if (!text) {
        return std::nullopt;
    }
    auto color = parseColor(*text);
    if (!color) {
        ywarn("Config: {}: {}", path, error_msg(color));
        return std::nullopt;
    }
    return *color;
}

void Config::applyOverrides(const YAML::Node& overrides) {
    if (!overrides || !overrides.IsMap()) return;
    mergeNodes(_config, overrides);
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') {
            envVar += '_';
        } else {
            envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return envVar;
}

Result<Color> Config::parseColor(const std::string& text) {
    std::string digits;
    if (text.starts_with("#")) {
        digits = text.substr(1);
    } else if (text.starts_with("0x") || text.starts_with("0X")) {
        digits = text.substr(2);
    } else {
        return Err<Color>("color must start with '#' or '0x': " + text);
    }

    if (digits.size() != 6 && digits.size() != 8) {
        return Err<Color>("color needs 6 or 8 hex digits: " + text);
    }
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Err<Color>("invalid hex digit in color: " + text);
        }
    }

    auto packed = static_cast<uint32_t>(std::stoul(digits, nullptr, 16));
    if (digits.size() == 6) {
        return Ok(Color::fromRgb(packed));
    }
    return Ok(Color::fromArgb(packed));
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "celldraw" / "config.yaml";
}

} // namespace celldraw
