/**
 * @file frame_buffer.hpp
 * @brief Rendered output frame (RGBA video plus the frame's audio)
 */

#pragma once

#include <splice/core/types.hpp>

#include <cstdint>
#include <vector>

namespace spl::engine {

/**
 * @brief One output frame
 *
 * Pixels are tightly packed RGBA (stride = width * 4). Audio is
 * interleaved float samples covering the frame's duration.
 */
struct FrameBuffer {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    int sampleRate = 0;
    int channels = 0;
    std::vector<float> audio;

    Tick timestamp = 0;
    int64_t frameIndex = 0;
    bool substituted = false;   ///< Blank stand-in for a frame that failed to render

    [[nodiscard]] size_t stride() const { return static_cast<size_t>(width) * 4; }
    [[nodiscard]] bool empty() const { return pixels.empty(); }

    [[nodiscard]] uint8_t* pixel(int x, int y) {
        return pixels.data() + static_cast<size_t>(y) * stride() + static_cast<size_t>(x) * 4;
    }
    [[nodiscard]] const uint8_t* pixel(int x, int y) const {
        return pixels.data() + static_cast<size_t>(y) * stride() + static_cast<size_t>(x) * 4;
    }

    /// Opaque black video and silent audio
    static FrameBuffer blank(int width, int height, Tick timestamp, int64_t frameIndex,
                             int sampleRate = 0, int channels = 0, size_t samplesPerChannel = 0) {
        FrameBuffer frame;
        frame.width = width;
        frame.height = height;
        frame.pixels.assign(static_cast<size_t>(width) * height * 4, 0);
        for (size_t i = 3; i < frame.pixels.size(); i += 4) {
            frame.pixels[i] = 255;
        }
        frame.sampleRate = sampleRate;
        frame.channels = channels;
        frame.audio.assign(samplesPerChannel * static_cast<size_t>(channels), 0.0f);
        frame.timestamp = timestamp;
        frame.frameIndex = frameIndex;
        return frame;
    }
};

} // namespace spl::engine
