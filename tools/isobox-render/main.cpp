// isobox-render: Render one rounded-top isometric box to SVG
//
// Settings come from Config (defaults, config file, ISOBOX_* environment),
// and any flag given on the command line overrides them.

#include <isobox/box-renderer.h>
#include <isobox/canvas.h>
#include <isobox/color.h>
#include <isobox/config.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <yaml-cpp/yaml.h>

#include <args.hxx>
#include <iostream>
#include <string>

using namespace isobox;

//=============================================================================
// Helpers
//=============================================================================

template<typename T>
static void overrideIf(YAML::Node& overrides, const char* section, const char* key,
                       args::ValueFlag<T>& flag) {
    if (flag) overrides[section][key] = args::get(flag);
}

static void dumpCalls(const BoxSpec& spec, float width, float height) {
    auto canvasRes = RecordingCanvas::create(width, height);
    if (!canvasRes) {
        yerror("dump: {}", error_msg(canvasRes));
        return;
    }
    auto canvas = *canvasRes;
    composeBox(spec, *canvas);

    size_t i = 0;
    for (const auto& call : canvas->calls()) {
        auto b = call.path.bounds();
        yinfo("#{} {} color={} width={} cmds={} bounds=({}, {})-({}, {})",
              i++, call.kind == DrawCall::Kind::Fill ? "fill" : "stroke",
              color::toHex(call.color), call.strokeWidth, call.path.commands().size(),
              b.minX, b.minY, b.maxX, b.maxY);
    }
}

//=============================================================================
// Main
//=============================================================================

int main(int argc, char** argv) {
    args::ArgumentParser parser("isobox-render - Render a rounded-top isometric box to SVG");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "Config file (YAML)", {'c', "config"});
    args::ValueFlag<std::string> outputFlag(parser, "FILE", "Output SVG file", {'o', "output"});
    args::ValueFlag<float> xFlag(parser, "X", "Box origin x", {'x'});
    args::ValueFlag<float> yFlag(parser, "Y", "Box origin y", {'y'});
    args::ValueFlag<float> zFlag(parser, "Z", "Box origin z", {'z'});
    args::ValueFlag<float> widthFlag(parser, "W", "Box width", {"width"});
    args::ValueFlag<float> depthFlag(parser, "D", "Box depth", {"depth"});
    args::ValueFlag<float> heightFlag(parser, "H", "Box height", {"height"});
    args::ValueFlag<float> angleFlag(parser, "DEG", "Projection angle in degrees", {"angle"});
    args::ValueFlag<float> scaleFlag(parser, "S", "Pixels per scene unit", {"scale"});
    args::ValueFlag<float> radiusFlag(parser, "PX", "Top face corner radius", {'r', "radius"});
    args::ValueFlag<std::string> topColorFlag(parser, "COLOR", "Top face color", {"top-color"});
    args::ValueFlag<std::string> sideColorFlag(parser, "COLOR", "Side face color", {"side-color"});
    args::ValueFlag<std::string> outlineColorFlag(parser, "COLOR", "Outline color", {"outline-color"});
    args::ValueFlag<float> outlineWidthFlag(parser, "PX", "Outline width (0 = none)", {"outline-width"});
    args::ValueFlag<float> surfaceWidthFlag(parser, "PX", "Surface width", {"surface-width"});
    args::ValueFlag<float> surfaceHeightFlag(parser, "PX", "Surface height", {"surface-height"});
    args::ValueFlag<std::string> backgroundFlag(parser, "COLOR", "Background color", {"background"});
    args::ValueFlag<std::string> logFileFlag(parser, "FILE", "Write log to file", {"log-file"});
    args::Flag dumpFlag(parser, "dump", "Log every draw call", {"dump"});
    args::Flag verboseFlag(parser, "verbose", "Verbose output", {'v', "verbose"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (logFileFlag) {
        auto fileLogger = spdlog::basic_logger_mt("isobox-render", args::get(logFileFlag), true);
        spdlog::set_default_logger(fileLogger);
    }
    spdlog::set_level(verboseFlag ? spdlog::level::debug : spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);

    YAML::Node overrides(YAML::NodeType::Map);
    overrideIf(overrides, "box", "x", xFlag);
    overrideIf(overrides, "box", "y", yFlag);
    overrideIf(overrides, "box", "z", zFlag);
    overrideIf(overrides, "box", "width", widthFlag);
    overrideIf(overrides, "box", "depth", depthFlag);
    overrideIf(overrides, "box", "height", heightFlag);
    overrideIf(overrides, "box", "angle", angleFlag);
    overrideIf(overrides, "box", "scale", scaleFlag);
    overrideIf(overrides, "box", "top-corner-radius", radiusFlag);
    overrideIf(overrides, "box", "top-color", topColorFlag);
    overrideIf(overrides, "box", "side-color", sideColorFlag);
    overrideIf(overrides, "box", "outline-color", outlineColorFlag);
    overrideIf(overrides, "box", "outline-width", outlineWidthFlag);
    overrideIf(overrides, "surface", "width", surfaceWidthFlag);
    overrideIf(overrides, "surface", "height", surfaceHeightFlag);
    overrideIf(overrides, "surface", "background", backgroundFlag);
    overrideIf(overrides, "output", "path", outputFlag);

    std::string configPath = configFlag ? args::get(configFlag) : "";
    auto configRes = Config::create(configPath, overrides);
    if (!configRes) {
        std::cerr << "Error: " << error_msg(configRes) << "\n";
        return 1;
    }
    auto config = *configRes;

    auto specRes = config->boxSpec();
    auto widthRes = config->surfaceWidth();
    auto heightRes = config->surfaceHeight();
    auto bgRes = config->backgroundColor();
    if (!specRes || !widthRes || !heightRes || !bgRes) {
        std::cerr << "Error: " << error_msg(specRes) << error_msg(widthRes)
                  << error_msg(heightRes) << error_msg(bgRes) << "\n";
        return 1;
    }

    auto canvasRes = SvgCanvas::create(*widthRes, *heightRes);
    if (!canvasRes) {
        std::cerr << "Error: " << error_msg(canvasRes) << "\n";
        return 1;
    }
    auto canvas = *canvasRes;
    canvas->setBgColor(*bgRes);

    if (auto res = renderBox(*specRes, *canvas); !res) {
        std::cerr << "Error: " << error_msg(res) << "\n";
        return 1;
    }

    if (dumpFlag) {
        auto validated = validateBoxSpec(*specRes, *widthRes, *heightRes);
        if (validated) dumpCalls(*validated, *widthRes, *heightRes);
    }

    std::string outPath = config->outputPath();
    if (auto res = canvas->writeFile(outPath); !res) {
        std::cerr << "Error: " << error_msg(res) << "\n";
        return 1;
    }
    yinfo("isobox-render: {}x{}x{} box -> {}", specRes->width, specRes->depth,
          specRes->height, outPath);
    return 0;
}
