/**
 * @file asset_layer_source.hpp
 * @brief Layer pictures for export, read from registered media assets
 */

#pragma once

#include <splice/engine/compositing_backend.hpp>
#include <splice/media/ffmpeg_frame_reader.hpp>
#include <splice/model/media_asset_registry.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace spl::media {

/**
 * @brief Resolves asset elements to decoded pictures
 *
 * One FfmpegFrameReader is opened lazily per asset. Caption cues,
 * generated elements and audio-only assets contribute no picture.
 *
 * Usage:
 * @code
 *   auto source = std::make_shared<AssetLayerSource>(registry);
 *   engine::CompositingBackend backend(AssetLayerSource::bind(source), encoder);
 * @endcode
 */
class AssetLayerSource {
public:
    explicit AssetLayerSource(const model::MediaAssetRegistry& registry);

    Result<engine::FrameBuffer> picture(const model::ActiveElement& layer,
                                        const engine::FrameRequest& request);

    /// Adapter for CompositingBackend; the source stays alive while bound
    static engine::LayerSource bind(std::shared_ptr<AssetLayerSource> source);

    [[nodiscard]] size_t openReaders() const;

private:
    Result<FfmpegFrameReader*> readerFor(const model::MediaAsset& asset);

    const model::MediaAssetRegistry& m_registry;

    mutable std::mutex m_mutex;
    std::map<UUID, std::unique_ptr<FfmpegFrameReader>> m_readers;
};

} // namespace spl::media
