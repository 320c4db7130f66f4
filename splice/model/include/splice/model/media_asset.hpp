/**
 * @file media_asset.hpp
 * @brief Opaque handle to decoded media
 *
 * A MediaAsset describes a source file the timeline can reference.
 * Elements never hold asset data, only the asset id.
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/core/types.hpp>
#include <splice/core/uuid.hpp>

#include <future>
#include <string>

namespace spl::model {

enum class MediaAssetKind : uint8_t {
    Video,
    Audio,
    Image,
};

enum class AssetLoadState : uint8_t {
    Loading,
    Ready,
    Failed,
};

inline const char* mediaAssetKindToString(MediaAssetKind kind) {
    switch (kind) {
        case MediaAssetKind::Video: return "video";
        case MediaAssetKind::Audio: return "audio";
        case MediaAssetKind::Image: return "image";
        default: return "unknown";
    }
}

inline const char* assetLoadStateToString(AssetLoadState state) {
    switch (state) {
        case AssetLoadState::Loading: return "Loading";
        case AssetLoadState::Ready: return "Ready";
        case AssetLoadState::Failed: return "Failed";
        default: return "Unknown";
    }
}

/**
 * @brief What the decode collaborator learned about a source
 */
struct MediaAssetInfo {
    MediaAssetKind kind = MediaAssetKind::Video;
    TickDuration durationTicks = 0;     ///< 0 for still images (unbounded)

    // Video
    Size resolution;
    Rational frameRate;
    std::string videoCodec;

    // Audio
    int sampleRate = 0;
    int channels = 0;
    std::string audioCodec;
};

/**
 * @brief Registered media asset
 */
struct MediaAsset {
    UUID id;
    std::string descriptor;             ///< Source path or URI
    AssetLoadState loadState = AssetLoadState::Loading;
    MediaAssetInfo info;
    std::string errorMessage;           ///< Set when Failed

    [[nodiscard]] MediaAssetKind kind() const { return info.kind; }
    [[nodiscard]] TickDuration durationTicks() const { return info.durationTicks; }
    [[nodiscard]] bool isReady() const { return loadState == AssetLoadState::Ready; }

    /// Still images can be held on the timeline for any duration
    [[nodiscard]] bool hasBoundedDuration() const {
        return info.kind != MediaAssetKind::Image;
    }
};

/**
 * @brief Decode collaborator
 *
 * Implementations inspect the source asynchronously. A future that is
 * already ready with an error when decode() returns is treated as a
 * synchronous load failure.
 */
class MediaDecoder {
public:
    virtual ~MediaDecoder() = default;

    virtual std::future<Result<MediaAssetInfo>> decode(const std::string& descriptor) = 0;
};

} // namespace spl::model
