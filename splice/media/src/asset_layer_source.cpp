/**
 * @file asset_layer_source.cpp
 * @brief Asset layer source implementation
 */

#include <splice/media/asset_layer_source.hpp>

#include <splice/core/logger.hpp>

namespace spl::media {

AssetLayerSource::AssetLayerSource(const model::MediaAssetRegistry& registry)
    : m_registry(registry) {
}

Result<engine::FrameBuffer> AssetLayerSource::picture(const model::ActiveElement& layer,
                                                      const engine::FrameRequest& request) {
    const auto& source = layer.element.source;
    // Caption cues and generated content have no decodable picture
    if (source.kind != model::SourceKind::Asset) {
        return engine::FrameBuffer{};
    }

    auto asset = m_registry.get(source.id);
    if (!asset) {
        return Error(ErrorCode::AssetNotReady,
                     "Asset " + source.id.shortString() + " is not ready");
    }
    if (asset.value().kind() == model::MediaAssetKind::Audio) {
        return engine::FrameBuffer{};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto reader = readerFor(asset.value());
    if (!reader) {
        return reader.error();
    }

    auto frame = reader.value()->frameAt(layer.sourceTick, request.width, request.height);
    if (!frame) {
        return Error(ErrorCode::RenderError, frame.error().what());
    }
    frame.value().frameIndex = request.frameIndex;
    frame.value().timestamp = request.timestamp;
    return frame;
}

Result<FfmpegFrameReader*> AssetLayerSource::readerFor(const model::MediaAsset& asset) {
    auto it = m_readers.find(asset.id);
    if (it != m_readers.end()) {
        return it->second.get();
    }

    auto reader = std::make_unique<FfmpegFrameReader>();
    auto opened = reader->open(asset.descriptor);
    if (!opened) {
        LOG_ERROR("Cannot read frames from asset {} ({}): {}",
                  asset.id.shortString(), asset.descriptor, opened.error().what());
        return Error(ErrorCode::RenderError, opened.error().what());
    }

    FfmpegFrameReader* raw = reader.get();
    m_readers.emplace(asset.id, std::move(reader));
    return raw;
}

engine::LayerSource AssetLayerSource::bind(std::shared_ptr<AssetLayerSource> source) {
    return [source = std::move(source)](const model::ActiveElement& layer,
                                        const engine::FrameRequest& request) {
        return source->picture(layer, request);
    };
}

size_t AssetLayerSource::openReaders() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_readers.size();
}

} // namespace spl::media
