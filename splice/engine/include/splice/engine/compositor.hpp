/**
 * @file compositor.hpp
 * @brief Software compositor for multi-track video
 *
 * Blends RGBA layers bottom to top onto a background-coloured canvas.
 * Layers of a different size are scaled to the canvas (nearest
 * neighbour).
 */

#pragma once

#include <splice/engine/frame_buffer.hpp>

#include <array>
#include <vector>

namespace spl::engine {

/**
 * @brief Blend mode for compositing
 */
enum class BlendMode {
    Normal,      ///< Normal alpha compositing
    Add,         ///< Additive blending
    Multiply,    ///< Multiply blending
    Screen,      ///< Screen blending
    Overlay,     ///< Overlay blending
    Difference,  ///< Difference blending
};

/**
 * @brief Layer for compositing
 */
struct CompositeLayer {
    const FrameBuffer* frame = nullptr;
    BlendMode blendMode = BlendMode::Normal;
    float opacity = 1.0f;
};

/// Normalized RGBA pixel
struct Pixel {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 0.0f;
};

class Compositor {
public:
    Compositor(int width, int height)
        : m_outputWidth(width)
        , m_outputHeight(height) {}

    void setOutputSize(int width, int height) {
        m_outputWidth = width;
        m_outputHeight = height;
    }

    /**
     * @brief Set background color (RGBA)
     */
    void setBackgroundColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
        m_bgColor = {r, g, b, a};
    }

    /**
     * @brief Blend layers (first = bottom) into a new frame
     *
     * Null layers are skipped. No layers yields the background.
     */
    FrameBuffer compose(const std::vector<CompositeLayer>& layers, Tick timestamp, int64_t frameIndex) const;

    /// Canvas filled with the background colour
    FrameBuffer createBlankFrame(Tick timestamp = 0, int64_t frameIndex = 0) const;

    /// Blend src onto dst in place, scaling src to dst's size
    static void blendLayer(FrameBuffer& dst, const FrameBuffer& src, BlendMode mode, float opacity);

    static Pixel blendPixel(BlendMode mode, const Pixel& src, const Pixel& dst);

    [[nodiscard]] int outputWidth() const { return m_outputWidth; }
    [[nodiscard]] int outputHeight() const { return m_outputHeight; }

private:
    int m_outputWidth;
    int m_outputHeight;

    std::array<uint8_t, 4> m_bgColor = {0, 0, 0, 255};  // Black
};

} // namespace spl::engine
