/**
 * @file render_backend.hpp
 * @brief Renderer/encoder collaborator driven by export jobs
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/engine/export_settings.hpp>
#include <splice/engine/frame_buffer.hpp>
#include <splice/model/timeline.hpp>

#include <future>
#include <vector>

namespace spl::engine {

/**
 * @brief Everything needed to render one output frame
 *
 * Layers are in track order (first = bottom of the video stack).
 */
struct FrameRequest {
    int64_t frameIndex = 0;
    Tick timestamp = 0;
    TickDuration frameDuration = 0;
    std::vector<model::ActiveElement> layers;
    const model::TimelineSnapshot* snapshot = nullptr;   ///< Valid during the call only
    int width = 0;
    int height = 0;
};

/**
 * @brief Renders and encodes frames for an export job
 *
 * A job calls prepare() once, then renderFrame()/encode() per frame on
 * its own thread, and finalize() exactly once at the end (also after a
 * failure or cancellation) to flush and close the output.
 */
class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    /// Open outputs; a failure fails the job before the first frame
    virtual Result<void> prepare(const ExportSettings& /*settings*/, int64_t /*totalFrames*/) {
        return Ok();
    }

    virtual std::future<Result<FrameBuffer>> renderFrame(const FrameRequest& request) = 0;
    virtual std::future<Result<void>> encode(const FrameBuffer& frame) = 0;
    virtual std::future<Result<void>> finalize() = 0;
};

} // namespace spl::engine
