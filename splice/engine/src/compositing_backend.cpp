/**
 * @file compositing_backend.cpp
 * @brief Compositing render backend
 */

#include <splice/engine/compositing_backend.hpp>

#include <splice/core/logger.hpp>

namespace spl::engine {

namespace {

template<typename T>
std::future<T> ready(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

} // anonymous namespace

CompositingBackend::CompositingBackend(LayerSource source, std::shared_ptr<FrameEncoder> encoder)
    : m_source(std::move(source))
    , m_encoder(std::move(encoder)) {
}

Result<void> CompositingBackend::prepare(const ExportSettings& settings, int64_t totalFrames) {
    if (!m_encoder) {
        return Err(ErrorCode::InvalidArgument, "Compositing backend has no encoder");
    }

    m_compositor.setOutputSize(settings.width, settings.height);
    m_sampleRate = settings.sampleRate;
    m_channels = settings.channels;

    LOG_DEBUG("Compositing {} frames at {}x{}", totalFrames, settings.width, settings.height);
    return m_encoder->open(settings);
}

std::future<Result<FrameBuffer>> CompositingBackend::renderFrame(const FrameRequest& request) {
    return ready(render(request));
}

Result<FrameBuffer> CompositingBackend::render(const FrameRequest& request) {
    std::vector<FrameBuffer> pictures;
    pictures.reserve(request.layers.size());

    // Caption layers pass through; a source that renders text draws them
    for (const auto& layer : request.layers) {
        if (layer.trackKind == model::TrackKind::Audio || !m_source) continue;

        auto picture = m_source(layer, request);
        if (!picture) {
            return Err<FrameBuffer>(picture.error().withContext("Layer '" + layer.element.name + "'"));
        }
        if (!picture.value().empty()) {
            pictures.push_back(std::move(picture).value());
        }
    }

    std::vector<CompositeLayer> layers;
    layers.reserve(pictures.size());
    for (const auto& picture : pictures) {
        layers.push_back(CompositeLayer{&picture, BlendMode::Normal, 1.0f});
    }

    FrameBuffer frame = m_compositor.compose(layers, request.timestamp, request.frameIndex);
    frame.sampleRate = m_sampleRate;
    frame.channels = m_channels;
    const auto samples = static_cast<size_t>(
        static_cast<int64_t>(m_sampleRate) * request.frameDuration / kTicksPerSecond);
    frame.audio.assign(samples * static_cast<size_t>(m_channels), 0.0f);
    return frame;
}

std::future<Result<void>> CompositingBackend::encode(const FrameBuffer& frame) {
    if (!m_encoder) {
        return ready(Err(ErrorCode::InvalidState, "Compositing backend has no encoder"));
    }
    return ready(m_encoder->writeFrame(frame));
}

std::future<Result<void>> CompositingBackend::finalize() {
    if (!m_encoder) {
        return ready(Ok());
    }
    return ready(m_encoder->finish());
}

} // namespace spl::engine
