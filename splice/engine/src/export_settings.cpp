/**
 * @file export_settings.cpp
 * @brief Export settings helpers
 */

#include <splice/engine/export_settings.hpp>

#include <splice/core/config.hpp>
#include <splice/core/logger.hpp>

namespace spl::engine {

const char* exportQualityToString(ExportQuality quality) {
    switch (quality) {
        case ExportQuality::Low: return "low";
        case ExportQuality::Medium: return "medium";
        case ExportQuality::High: return "high";
        default: return "unknown";
    }
}

std::optional<ExportQuality> parseExportQuality(const std::string& name) {
    if (name == "low") return ExportQuality::Low;
    if (name == "medium") return ExportQuality::Medium;
    if (name == "high") return ExportQuality::High;
    return std::nullopt;
}

int64_t ExportSettings::videoBitrate() const {
    switch (quality) {
        case ExportQuality::Low: return 2'500'000;
        case ExportQuality::Medium: return 5'000'000;
        case ExportQuality::High: return 8'000'000;
    }
    return 8'000'000;
}

Result<void> ExportSettings::validate() const {
    if (width <= 0 || height <= 0) {
        return Err(ErrorCode::InvalidArgument, "Export size must be positive");
    }
    if (!frameRate.valid()) {
        return Err(ErrorCode::InvalidArgument, "Export frame rate must be positive");
    }
    if (etaWindow == 0) {
        return Err(ErrorCode::InvalidArgument, "ETA window must hold at least one frame");
    }
    if (maxConsecutiveFrameFailures < 1) {
        return Err(ErrorCode::InvalidArgument, "Frame failure threshold must be at least 1");
    }
    if (range && (range->start < 0 || range->end <= range->start)) {
        return Err(ErrorCode::InvalidRange, "Export range is empty");
    }
    return Ok();
}

ExportSettings ExportSettings::fromEditorSettings(const EditorSettings& editor) {
    ExportSettings settings;
    settings.width = editor.exportWidth;
    settings.height = editor.exportHeight;
    settings.frameRate = {editor.exportFpsNum, editor.exportFpsDen};
    settings.videoCodec = editor.exportVideoCodec;
    settings.etaWindow = editor.etaWindow;
    settings.maxConsecutiveFrameFailures = editor.maxConsecutiveFrameFailures;

    if (auto quality = parseExportQuality(editor.exportQuality)) {
        settings.quality = *quality;
    } else {
        LOG_WARN("Unknown export quality '{}', using high", editor.exportQuality);
    }
    return settings;
}

} // namespace spl::engine
