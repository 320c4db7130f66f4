/**
 * @file compositor.cpp
 * @brief Software compositing implementation
 */

#include <splice/engine/compositor.hpp>

#include <algorithm>
#include <cmath>

namespace spl::engine {

namespace {

uint8_t toByte(float v) {
    return static_cast<uint8_t>(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
}

} // anonymous namespace

FrameBuffer Compositor::createBlankFrame(Tick timestamp, int64_t frameIndex) const {
    FrameBuffer frame;
    frame.width = m_outputWidth;
    frame.height = m_outputHeight;
    frame.timestamp = timestamp;
    frame.frameIndex = frameIndex;
    frame.pixels.resize(static_cast<size_t>(m_outputWidth) * m_outputHeight * 4);

    for (size_t i = 0; i < frame.pixels.size(); i += 4) {
        frame.pixels[i + 0] = m_bgColor[0];
        frame.pixels[i + 1] = m_bgColor[1];
        frame.pixels[i + 2] = m_bgColor[2];
        frame.pixels[i + 3] = m_bgColor[3];
    }
    return frame;
}

FrameBuffer Compositor::compose(const std::vector<CompositeLayer>& layers,
                                Tick timestamp, int64_t frameIndex) const {
    FrameBuffer result = createBlankFrame(timestamp, frameIndex);

    for (const auto& layer : layers) {
        if (!layer.frame || layer.frame->empty()) continue;
        blendLayer(result, *layer.frame, layer.blendMode, layer.opacity);
    }
    return result;
}

void Compositor::blendLayer(FrameBuffer& dst, const FrameBuffer& src, BlendMode mode, float opacity) {
    if (dst.empty() || src.empty() || opacity <= 0.0f) return;

    const bool sameSize = src.width == dst.width && src.height == dst.height;

    for (int y = 0; y < dst.height; ++y) {
        const int sy = sameSize ? y : static_cast<int>(static_cast<int64_t>(y) * src.height / dst.height);
        for (int x = 0; x < dst.width; ++x) {
            const int sx = sameSize ? x : static_cast<int>(static_cast<int64_t>(x) * src.width / dst.width);

            const uint8_t* s = src.pixel(sx, sy);
            uint8_t* d = dst.pixel(x, y);

            Pixel sp{s[0] / 255.0f, s[1] / 255.0f, s[2] / 255.0f, (s[3] / 255.0f) * opacity};
            Pixel dp{d[0] / 255.0f, d[1] / 255.0f, d[2] / 255.0f, d[3] / 255.0f};

            Pixel out = blendPixel(mode, sp, dp);
            d[0] = toByte(out.r);
            d[1] = toByte(out.g);
            d[2] = toByte(out.b);
            d[3] = toByte(out.a);
        }
    }
}

Pixel Compositor::blendPixel(BlendMode mode, const Pixel& src, const Pixel& dst) {
    // Separable modes mix the blended colour with dst by source alpha
    auto mix = [&](float br, float bg, float bb) {
        return Pixel{
            br * src.a + dst.r * (1.0f - src.a),
            bg * src.a + dst.g * (1.0f - src.a),
            bb * src.a + dst.b * (1.0f - src.a),
            src.a + dst.a * (1.0f - src.a)
        };
    };

    switch (mode) {
        case BlendMode::Normal: {
            // Porter-Duff over
            Pixel out;
            out.a = src.a + dst.a * (1.0f - src.a);
            if (out.a > 0.0f) {
                out.r = (src.r * src.a + dst.r * dst.a * (1.0f - src.a)) / out.a;
                out.g = (src.g * src.a + dst.g * dst.a * (1.0f - src.a)) / out.a;
                out.b = (src.b * src.a + dst.b * dst.a * (1.0f - src.a)) / out.a;
            }
            return out;
        }

        case BlendMode::Add:
            return Pixel{
                std::min(1.0f, src.r * src.a + dst.r),
                std::min(1.0f, src.g * src.a + dst.g),
                std::min(1.0f, src.b * src.a + dst.b),
                std::min(1.0f, src.a + dst.a)
            };

        case BlendMode::Multiply:
            return mix(src.r * dst.r, src.g * dst.g, src.b * dst.b);

        case BlendMode::Screen:
            return mix(1.0f - (1.0f - src.r) * (1.0f - dst.r),
                       1.0f - (1.0f - src.g) * (1.0f - dst.g),
                       1.0f - (1.0f - src.b) * (1.0f - dst.b));

        case BlendMode::Overlay: {
            auto overlay = [](float a, float b) {
                return a < 0.5f
                    ? 2.0f * a * b
                    : 1.0f - 2.0f * (1.0f - a) * (1.0f - b);
            };
            return mix(overlay(dst.r, src.r), overlay(dst.g, src.g), overlay(dst.b, src.b));
        }

        case BlendMode::Difference:
            return mix(std::abs(src.r - dst.r), std::abs(src.g - dst.g), std::abs(src.b - dst.b));
    }
    return dst;
}

} // namespace spl::engine
