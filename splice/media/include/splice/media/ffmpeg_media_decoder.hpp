/**
 * @file ffmpeg_media_decoder.hpp
 * @brief Media probing through libavformat
 */

#pragma once

#include <splice/model/media_asset.hpp>

#include <string>

namespace spl::media {

/**
 * @brief MediaDecoder that inspects files with FFmpeg
 *
 * Each decode() inspects on its own thread (std::async), so registering
 * many assets does not block the editing thread.
 */
class FfmpegMediaDecoder : public model::MediaDecoder {
public:
    std::future<Result<model::MediaAssetInfo>> decode(const std::string& descriptor) override;

    /// Synchronous inspection (container, streams, duration)
    static Result<model::MediaAssetInfo> inspect(const std::string& path);

    /// Known file extension for video, audio or still images
    static bool isSupported(const std::string& path);
};

} // namespace spl::media
