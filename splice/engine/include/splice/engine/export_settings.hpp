/**
 * @file export_settings.hpp
 * @brief Output parameters for an export job
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/core/types.hpp>

#include <optional>
#include <string>

namespace spl {
struct EditorSettings;
}

namespace spl::engine {

enum class ExportQuality : uint8_t {
    Low,
    Medium,
    High,
};

const char* exportQualityToString(ExportQuality quality);
std::optional<ExportQuality> parseExportQuality(const std::string& name);

/// Timeline span to export, [start, end)
struct ExportRange {
    Tick start = 0;
    Tick end = 0;
};

struct ExportSettings {
    int width = 1920;
    int height = 1080;
    Rational frameRate{30, 1};
    ExportQuality quality = ExportQuality::High;
    std::string outputPath;
    std::string videoCodec = "libx264";     ///< Preferred encoder, falls back when missing
    std::optional<ExportRange> range;       ///< nullopt = whole timeline

    size_t etaWindow = 30;                  ///< Frames in the ETA moving average
    int maxConsecutiveFrameFailures = 3;

    int sampleRate = 48000;
    int channels = 2;

    /// Target video bitrate in bits per second for the quality level
    [[nodiscard]] int64_t videoBitrate() const;

    /// InvalidArgument for non-positive sizes, rates or thresholds, InvalidRange for an empty range
    [[nodiscard]] Result<void> validate() const;

    static ExportSettings fromEditorSettings(const EditorSettings& editor);
};

} // namespace spl::engine
