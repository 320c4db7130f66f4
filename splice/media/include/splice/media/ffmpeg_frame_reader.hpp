/**
 * @file ffmpeg_frame_reader.hpp
 * @brief Random-access RGBA frame reader for a media file
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/core/types.hpp>
#include <splice/engine/frame_buffer.hpp>

#include <memory>
#include <string>

namespace spl::media {

/**
 * @brief Decodes the picture shown at a source position
 *
 * Sequential requests decode forward. A request behind the current
 * position, or more than ten frames ahead of it, seeks to the previous
 * keyframe first. Past the end of the stream the last frame is held.
 * Still images are decoded once.
 *
 * Not thread-safe; an export job uses one reader per asset.
 */
class FfmpegFrameReader {
public:
    FfmpegFrameReader();
    ~FfmpegFrameReader();

    FfmpegFrameReader(const FfmpegFrameReader&) = delete;
    FfmpegFrameReader& operator=(const FfmpegFrameReader&) = delete;

    Result<void> open(const std::string& path);
    void close();
    [[nodiscard]] bool isOpen() const;

    /**
     * @brief Picture at the given source tick, scaled to width x height
     */
    Result<engine::FrameBuffer> frameAt(Tick sourceTick, int width, int height);

    [[nodiscard]] Size sourceSize() const;
    [[nodiscard]] int64_t seekCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace spl::media
