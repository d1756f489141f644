#pragma once

#include <isobox/base/object.h>
#include <isobox/base/factory.h>
#include <isobox/box-renderer.h>
#include <isobox/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace isobox {

//=============================================================================
// Config - layered settings for box rendering
//
// Layers, lowest priority first:
//   1. built-in defaults
//   2. config file (explicit path, else $XDG_CONFIG_HOME/isobox/config.yaml)
//   3. environment: box/top-corner-radius -> ISOBOX_BOX_TOP_CORNER_RADIUS
//   4. command line overrides (a YAML map shaped like the file)
//
// Keys are slash-separated paths, e.g. "box/width".
//=============================================================================
class Config : public base::Object,
               public base::ObjectFactory<Config> {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> createImpl(const std::string& configPath = "",
                                  const YAML::Node& cmdOverrides = YAML::Node());

    ~Config() override = default;
    const char* typeName() const override { return "Config"; }

    // nullopt when the key is missing or does not convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    virtual bool has(const std::string& path) const = 0;

    // Merged tree of all layers
    virtual const YAML::Node& root() const = 0;

    // Config file actually loaded, empty when running on defaults
    virtual const std::string& loadedPath() const = 0;

    // box/* section as a BoxSpec; fails on malformed numbers or colors
    virtual Result<BoxSpec> boxSpec() const = 0;

    virtual Result<float> surfaceWidth() const = 0;
    virtual Result<float> surfaceHeight() const = 0;
    virtual Result<uint32_t> backgroundColor() const = 0;
    virtual std::string outputPath() const = 0;

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "ISOBOX_";

    static constexpr const char* KEY_BOX_X = "box/x";
    static constexpr const char* KEY_BOX_Y = "box/y";
    static constexpr const char* KEY_BOX_Z = "box/z";
    static constexpr const char* KEY_BOX_WIDTH = "box/width";
    static constexpr const char* KEY_BOX_DEPTH = "box/depth";
    static constexpr const char* KEY_BOX_HEIGHT = "box/height";
    static constexpr const char* KEY_BOX_ANGLE = "box/angle";
    static constexpr const char* KEY_BOX_SCALE = "box/scale";
    static constexpr const char* KEY_BOX_TOP_CORNER_RADIUS = "box/top-corner-radius";
    static constexpr const char* KEY_BOX_TOP_COLOR = "box/top-color";
    static constexpr const char* KEY_BOX_SIDE_COLOR = "box/side-color";
    static constexpr const char* KEY_BOX_OUTLINE_COLOR = "box/outline-color";
    static constexpr const char* KEY_BOX_OUTLINE_WIDTH = "box/outline-width";
    static constexpr const char* KEY_SURFACE_WIDTH = "surface/width";
    static constexpr const char* KEY_SURFACE_HEIGHT = "surface/height";
    static constexpr const char* KEY_SURFACE_BACKGROUND = "surface/background";
    static constexpr const char* KEY_OUTPUT_PATH = "output/path";

protected:
    Config() = default;

    // Null node when the path does not exist
    virtual YAML::Node getNode(const std::string& path) const = 0;
};

// Template implementations
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

} // namespace isobox
