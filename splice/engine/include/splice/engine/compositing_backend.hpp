/**
 * @file compositing_backend.hpp
 * @brief Render backend built on the software compositor
 */

#pragma once

#include <splice/engine/compositor.hpp>
#include <splice/engine/render_backend.hpp>

#include <functional>
#include <memory>

namespace spl::engine {

/**
 * @brief Picture of one active element at the request's frame
 *
 * Returns an empty FrameBuffer when the element contributes nothing
 * (audio, a gap in the source). An error fails the whole frame.
 */
using LayerSource = std::function<Result<FrameBuffer>(const model::ActiveElement&, const FrameRequest&)>;

/**
 * @brief Sink for finished frames (file encoder, test recorder, ...)
 */
class FrameEncoder {
public:
    virtual ~FrameEncoder() = default;

    virtual Result<void> open(const ExportSettings& settings) = 0;
    virtual Result<void> writeFrame(const FrameBuffer& frame) = 0;

    /// Flush and close; a no-op when never opened
    virtual Result<void> finish() = 0;
};

/**
 * @brief Composites video layers in track order and feeds an encoder
 *
 * Audio tracks are skipped: frames carry silence of the right length.
 * Caption layers go to the LayerSource like video layers. Drawing their
 * cue text is up to a text-capable source; AssetLayerSource leaves them out.
 */
class CompositingBackend : public RenderBackend {
public:
    CompositingBackend(LayerSource source, std::shared_ptr<FrameEncoder> encoder);

    void setBackgroundColor(uint8_t r, uint8_t g, uint8_t b) {
        m_compositor.setBackgroundColor(r, g, b);
    }

    Result<void> prepare(const ExportSettings& settings, int64_t totalFrames) override;
    std::future<Result<FrameBuffer>> renderFrame(const FrameRequest& request) override;
    std::future<Result<void>> encode(const FrameBuffer& frame) override;
    std::future<Result<void>> finalize() override;

private:
    Result<FrameBuffer> render(const FrameRequest& request);

    LayerSource m_source;
    std::shared_ptr<FrameEncoder> m_encoder;
    Compositor m_compositor{0, 0};
    int m_sampleRate = 0;
    int m_channels = 0;
};

} // namespace spl::engine
