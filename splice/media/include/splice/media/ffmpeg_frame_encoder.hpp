/**
 * @file ffmpeg_frame_encoder.hpp
 * @brief Video file writer using libavcodec/libavformat
 */

#pragma once

#include <splice/engine/compositing_backend.hpp>

#include <memory>

namespace spl::media {

/**
 * @brief Encodes RGBA frames into a video file
 *
 * The container follows the output path's extension. The encoder named
 * in the settings is tried first, then H.264, then MPEG-4 Part 2.
 * Frames are converted to YUV 4:2:0, so the output size must be even.
 */
class FfmpegFrameEncoder : public engine::FrameEncoder {
public:
    FfmpegFrameEncoder();
    ~FfmpegFrameEncoder() override;

    FfmpegFrameEncoder(const FfmpegFrameEncoder&) = delete;
    FfmpegFrameEncoder& operator=(const FfmpegFrameEncoder&) = delete;

    Result<void> open(const engine::ExportSettings& settings) override;
    Result<void> writeFrame(const engine::FrameBuffer& frame) override;
    Result<void> finish() override;

    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] int64_t framesWritten() const;

    /// Name of the encoder actually in use (empty before open)
    [[nodiscard]] std::string codecName() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace spl::media
