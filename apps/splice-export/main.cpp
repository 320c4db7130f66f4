/**
 * @file main.cpp
 * @brief Command line exporter: renders a saved timeline to a video file
 */

#include <splice/core/config.hpp>
#include <splice/core/logger.hpp>
#include <splice/engine/compositing_backend.hpp>
#include <splice/engine/export_pipeline.hpp>
#include <splice/media/asset_layer_source.hpp>
#include <splice/media/ffmpeg_frame_encoder.hpp>
#include <splice/media/ffmpeg_media_decoder.hpp>
#include <splice/model/io/timeline_io.hpp>
#include <splice/model/media_asset_registry.hpp>
#include <splice/model/timeline.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace spl;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted = true;
}

struct Options {
    std::string timelinePath;
    std::string outputPath;
    std::string configPath;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> fps;
    std::optional<std::string> quality;
    std::optional<double> fromSeconds;
    std::optional<double> toSeconds;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <timeline.json> <output> [options]\n"
              << "\nOptions:\n"
              << "  --config <file>     JSON configuration (merged over defaults)\n"
              << "  --width <px>        Output width\n"
              << "  --height <px>       Output height\n"
              << "  --fps <n>           Output frame rate\n"
              << "  --quality <q>       low | medium | high\n"
              << "  --from <seconds>    Range start\n"
              << "  --to <seconds>      Range end\n"
              << "\nExample: " << program << " project.json out.mp4 --quality medium" << std::endl;
}

std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        try {
            if (arg == "--help" || arg == "-h") {
                return std::nullopt;
            } else if (arg == "--config") {
                auto v = next(); if (!v) return std::nullopt;
                options.configPath = *v;
            } else if (arg == "--width") {
                auto v = next(); if (!v) return std::nullopt;
                options.width = std::stoi(*v);
            } else if (arg == "--height") {
                auto v = next(); if (!v) return std::nullopt;
                options.height = std::stoi(*v);
            } else if (arg == "--fps") {
                auto v = next(); if (!v) return std::nullopt;
                options.fps = std::stoi(*v);
            } else if (arg == "--quality") {
                auto v = next(); if (!v) return std::nullopt;
                options.quality = *v;
            } else if (arg == "--from") {
                auto v = next(); if (!v) return std::nullopt;
                options.fromSeconds = std::stod(*v);
            } else if (arg == "--to") {
                auto v = next(); if (!v) return std::nullopt;
                options.toSeconds = std::stod(*v);
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                return std::nullopt;
            } else {
                positional.push_back(arg);
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (positional.size() != 2) {
        return std::nullopt;
    }
    options.timelinePath = positional[0];
    options.outputPath = positional[1];
    return options;
}

Result<std::string> readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::FileOpenFailed, "Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string formatEta(Microseconds eta) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(eta).count();
    std::ostringstream out;
    out << seconds / 60 << ":" << std::setw(2) << std::setfill('0') << seconds % 60;
    return out.str();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto options = parseArgs(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 2;
    }

    // 1. Configuration and logging
    Config& config = Config::getInstance();
    config.loadDefaults();
    if (!options->configPath.empty()) {
        auto loaded = config.loadFromFile(options->configPath);
        if (!loaded) {
            std::cerr << "Config error: " << loaded.error().what() << std::endl;
            return 1;
        }
    }
    EditorSettings editor = EditorSettings::fromConfig(config);

    LogOptions logOptions;
    logOptions.level = parseLogLevel(editor.logLevel).value_or(spdlog::level::info);
    logOptions.filePath = editor.logFile;
    initLogging("splice-export", logOptions);

    // 2. Timeline document
    auto text = readFile(options->timelinePath);
    if (!text) {
        LOG_ERROR("{}", text.error().what());
        return 1;
    }
    auto document = model::TimelineIO::fromString(text.value());
    if (!document) {
        LOG_ERROR("Cannot load {}: {}", options->timelinePath, document.error().what());
        return 1;
    }

    // 3. Assets (fresh ids, remapped into the document)
    model::MediaAssetRegistry registry(std::make_shared<media::FfmpegMediaDecoder>());
    std::map<UUID, UUID> idMap;
    for (const auto& ref : document.value().assets) {
        auto id = registry.registerAsset(ref.descriptor);
        if (!id) {
            LOG_ERROR("Asset {}: {}", ref.descriptor, id.error().what());
            return 1;
        }
        auto asset = registry.waitFor(id.value(), std::chrono::seconds(30));
        if (!asset) {
            LOG_ERROR("Asset {}: {}", ref.descriptor, asset.error().what());
            return 1;
        }
        idMap[ref.id] = id.value();
    }
    model::TimelineIO::remapAssets(document.value(), idMap);

    model::Timeline timeline;
    timeline.attachRegistry(&registry);
    auto applied = document.value().applyTo(timeline);
    if (!applied) {
        LOG_ERROR("Invalid timeline: {}", applied.error().what());
        return 1;
    }

    // 4. Export settings
    engine::ExportSettings settings = engine::ExportSettings::fromEditorSettings(editor);
    settings.outputPath = options->outputPath;
    if (options->width) settings.width = *options->width;
    if (options->height) settings.height = *options->height;
    if (options->fps) settings.frameRate = {*options->fps, 1};
    if (options->quality) {
        auto quality = engine::parseExportQuality(*options->quality);
        if (!quality) {
            LOG_ERROR("Unknown quality '{}'", *options->quality);
            return 2;
        }
        settings.quality = *quality;
    }
    if (options->fromSeconds || options->toSeconds) {
        engine::ExportRange range;
        range.start = options->fromSeconds ? secondsToTicks(*options->fromSeconds) : 0;
        range.end = options->toSeconds ? secondsToTicks(*options->toSeconds) : timeline.endTick();
        settings.range = range;
    }

    // 5. Render
    auto source = std::make_shared<media::AssetLayerSource>(registry);
    auto encoder = std::make_shared<media::FfmpegFrameEncoder>();
    auto backend = std::make_shared<engine::CompositingBackend>(
        media::AssetLayerSource::bind(source), encoder);

    engine::ExportPipeline pipeline;
    auto job = pipeline.submit(timeline.snapshot(), settings, backend);

    auto progressConn = pipeline.progress.connectScoped([](const engine::ExportProgress& p) {
        if (p.currentFrame % 30 == 0 || p.currentFrame == p.totalFrames) {
            std::cout << "\rFrame " << p.currentFrame << "/" << p.totalFrames
                      << "  ETA " << formatEta(p.estimatedTimeRemaining) << std::flush;
        }
    });

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    auto started = pipeline.start(job->id());
    if (!started) {
        LOG_ERROR("Cannot start export: {}", started.error().what());
        return 1;
    }

    while (!engine::isTerminal(job->state())) {
        if (g_interrupted.exchange(false)) {
            std::cout << "\nCancelling..." << std::endl;
            auto cancelled = pipeline.cancel(job->id());
            if (!cancelled) {
                LOG_WARN("Cancel failed: {}", cancelled.error().what());
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    auto finalState = pipeline.wait(job->id());
    std::cout << std::endl;

    if (!finalState || finalState.value() != engine::ExportState::Completed) {
        auto error = job->lastError();
        LOG_ERROR("Export {} {}: {}", job->id().shortString(),
                  finalState ? engine::exportStateToString(finalState.value()) : "lost",
                  error ? error->what() : "no error recorded");
        return finalState && finalState.value() == engine::ExportState::Cancelled ? 130 : 1;
    }

    if (job->recoveredFrameErrors() > 0) {
        LOG_WARN("{} frame(s) were replaced by blank frames", job->recoveredFrameErrors());
    }
    std::cout << "Exported " << job->totalFrames() << " frames to " << settings.outputPath
              << " (" << encoder->codecName() << ")" << std::endl;
    return 0;
}
