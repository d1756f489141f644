#include <isobox/config.h>
#include <isobox/color.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace isobox {

// ─── Defaults ────────────────────────────────────────────────────────────────

static const char* DEFAULT_CONFIG = R"(
box:
  x: 0
  y: 0
  z: 0
  width: 3
  depth: 3
  height: 2
  angle: 30
  scale: 40
  top-corner-radius: 6
  top-color: gray
  side-color: black
  outline-color: black
  outline-width: 0
surface:
  width: 200
  height: 200
  background: transparent
output:
  path: isobox.svg
)";

// ─── Helpers ─────────────────────────────────────────────────────────────────

// Split a slash-separated path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Recursive so no Node handle is ever reassigned (yaml-cpp assignment
// writes through to the referenced node)
static YAML::Node lookup(const YAML::Node& node, const std::vector<std::string>& parts,
                         size_t i) {
    if (i == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node();
    const YAML::Node child = node[parts[i]];
    if (!child) return YAML::Node();
    return lookup(child, parts, i + 1);
}

// "box/top-corner-radius" -> "ISOBOX_BOX_TOP_CORNER_RADIUS"
static std::string pathToEnvVar(const std::string& path) {
    std::string envVar = Config::ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

// Merge YAML nodes (source into target)
static void mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& val = it->second;
        if (val.IsMap()) {
            if (!target[key].IsMap()) {
                target[key] = YAML::Node(YAML::NodeType::Map);
            }
            YAML::Node child = target[key];
            mergeNodes(child, val);
        } else {
            target[key] = YAML::Clone(val);
        }
    }
}

// ─── ConfigImpl ──────────────────────────────────────────────────────────────

class ConfigImpl : public Config {
public:
    ConfigImpl(const std::string& configPath, const YAML::Node& cmdOverrides)
        : _configPath(configPath), _cmdOverrides(cmdOverrides) {}

    ~ConfigImpl() override = default;

    Result<void> init() {
        try {
            _config = YAML::Load(DEFAULT_CONFIG);
        } catch (const YAML::Exception& e) {
            return Err("Config: broken built-in defaults: " + std::string(e.what()));
        }

        std::string effectivePath = _configPath;
        bool explicitPath = !effectivePath.empty();
        if (!explicitPath) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (!xdgPath.empty() && std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                if (explicitPath) {
                    return Err("Failed to load config file " + effectivePath, res);
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                _loadedPath = effectivePath;
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides(_config, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
        return Ok();
    }

    bool has(const std::string& path) const override {
        YAML::Node node = getNode(path);
        return node && !node.IsNull();
    }

    const YAML::Node& root() const override { return _config; }

    const std::string& loadedPath() const override { return _loadedPath; }

    Result<BoxSpec> boxSpec() const override {
        BoxSpec spec;
        struct FloatField { const char* key; float* target; };
        const FloatField floats[] = {
            {KEY_BOX_X, &spec.x},
            {KEY_BOX_Y, &spec.y},
            {KEY_BOX_Z, &spec.z},
            {KEY_BOX_WIDTH, &spec.width},
            {KEY_BOX_DEPTH, &spec.depth},
            {KEY_BOX_HEIGHT, &spec.height},
            {KEY_BOX_ANGLE, &spec.angleDegrees},
            {KEY_BOX_SCALE, &spec.scale},
            {KEY_BOX_TOP_CORNER_RADIUS, &spec.topCornerRadiusPx},
            {KEY_BOX_OUTLINE_WIDTH, &spec.outlineWidthPx},
        };
        for (const auto& f : floats) {
            auto res = readFloat(f.key, *f.target);
            if (!res) return Err<BoxSpec>("Config: bad box settings", res);
            *f.target = *res;
        }

        struct ColorField { const char* key; uint32_t* target; };
        const ColorField colors[] = {
            {KEY_BOX_TOP_COLOR, &spec.topColor},
            {KEY_BOX_SIDE_COLOR, &spec.sideColor},
            {KEY_BOX_OUTLINE_COLOR, &spec.outlineColor},
        };
        for (const auto& c : colors) {
            auto res = readColor(c.key, *c.target);
            if (!res) return Err<BoxSpec>("Config: bad box settings", res);
            *c.target = *res;
        }
        return Ok(spec);
    }

    Result<float> surfaceWidth() const override { return readFloat(KEY_SURFACE_WIDTH, 200.0f); }
    Result<float> surfaceHeight() const override { return readFloat(KEY_SURFACE_HEIGHT, 200.0f); }

    Result<uint32_t> backgroundColor() const override {
        return readColor(KEY_SURFACE_BACKGROUND, color::TRANSPARENT);
    }

    std::string outputPath() const override {
        return Config::get<std::string>(KEY_OUTPUT_PATH, "isobox.svg");
    }

protected:
    YAML::Node getNode(const std::string& path) const override {
        return lookup(_config, splitPath(path), 0);
    }

private:
    Result<float> readFloat(const char* key, float fallback) const {
        YAML::Node node = getNode(key);
        if (!node || node.IsNull()) return Ok(fallback);
        try {
            return Ok(node.as<float>());
        } catch (const YAML::Exception&) {
            return Err<float>(std::string(key) + " is not a number: " + YAML::Dump(node));
        }
    }

    Result<uint32_t> readColor(const char* key, uint32_t fallback) const {
        YAML::Node node = getNode(key);
        if (!node || node.IsNull()) return Ok(fallback);
        if (!node.IsScalar()) {
            return Err<uint32_t>(std::string(key) + " must be a color string");
        }
        auto res = color::parse(node.Scalar());
        if (!res) return Err<uint32_t>(std::string(key) + " is not a color", res);
        return res;
    }

    Result<void> loadFile(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                return Err("Cannot open config file: " + path);
            }
            YAML::Node fileConfig = YAML::Load(file);
            if (!fileConfig || fileConfig.IsNull()) {
                return Ok();
            }
            if (!fileConfig.IsMap()) {
                return Err("Config file root must be a map: " + path);
            }
            mergeNodes(_config, fileConfig);
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err("YAML parse error: " + std::string(e.what()));
        }
    }

    // Apply environment variable overrides to every existing leaf
    void applyEnvOverrides(YAML::Node node, const std::string& prefix) {
        std::vector<std::string> keys;
        for (auto it = node.begin(); it != node.end(); ++it) {
            keys.push_back(it->first.as<std::string>());
        }

        for (const auto& key : keys) {
            std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
            YAML::Node child = node[key];
            if (child.IsMap()) {
                applyEnvOverrides(child, fullPath);
                continue;
            }

            std::string envVar = pathToEnvVar(fullPath);
            if (const char* val = std::getenv(envVar.c_str())) {
                node[key] = std::string(val);
                ydebug("Config override from env: {}={}", envVar, val);
            }
        }
    }

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

// ─── Static helpers ──────────────────────────────────────────────────────────

std::filesystem::path Config::getXDGConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "isobox" / "config.yaml";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "isobox" / "config.yaml";
    }
    return {};
}

// Factory
Result<Config::Ptr> Config::createImpl(const std::string& configPath,
                                       const YAML::Node& cmdOverrides) {
    auto impl = std::make_shared<ConfigImpl>(configPath, cmdOverrides);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok<Ptr>(std::move(impl));
}

} // namespace isobox
