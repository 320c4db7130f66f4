/**
 * @file media_asset_registry.hpp
 * @brief Owner of all media assets known to the session
 */

#pragma once

#include <splice/core/signals.hpp>
#include <splice/model/media_asset.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace spl::model {

/**
 * @brief Thread-safe registry of media assets
 *
 * Loading is asynchronous: registerAsset() returns as soon as the
 * decoder has been asked for the asset. Callers either call poll() from
 * their event loop (which fires assetReady / assetFailed) or block in
 * waitFor().
 *
 * Removed assets are tombstoned rather than erased. They drop out of
 * assets() and count(), but find(), get() and isReady() still resolve
 * them so that elements already on the timeline, undo/redo of those
 * elements, and exports keep working.
 *
 * Usage:
 * @code
 *   MediaAssetRegistry registry(std::make_shared<media::FfmpegMediaDecoder>());
 *   auto id = registry.registerAsset("/footage/a.mp4");
 *   auto conn = registry.assetReady.connectScoped([](const MediaAsset& a) { ... });
 *   registry.poll();
 * @endcode
 */
class MediaAssetRegistry {
public:
    explicit MediaAssetRegistry(std::shared_ptr<MediaDecoder> decoder);

    MediaAssetRegistry(const MediaAssetRegistry&) = delete;
    MediaAssetRegistry& operator=(const MediaAssetRegistry&) = delete;

    /**
     * @brief Start loading a source
     *
     * @return new asset id, or AssetLoadError when the descriptor is empty
     *         or the decoder fails synchronously (the asset is kept in the
     *         Failed state for inspection)
     */
    Result<UUID> registerAsset(const std::string& descriptor);

    /// NotFound if the asset is absent or not Ready
    Result<MediaAsset> get(const UUID& id) const;

    /// Asset regardless of load state, removed ones included
    std::optional<MediaAsset> find(const UUID& id) const;

    bool isReady(const UUID& id) const;
    std::optional<AssetLoadState> state(const UUID& id) const;

    /// Assets that have not been removed
    std::vector<MediaAsset> assets() const;
    size_t count() const;

    /**
     * @brief Take an asset out of the listing
     *
     * The entry stays resolvable by id.
     * @return false if the id is unknown or already removed
     */
    bool remove(const UUID& id);
    bool isRemoved(const UUID& id) const;

    /**
     * @brief Resolve finished decodes without blocking
     * @return number of assets that left the Loading state
     */
    size_t poll();

    /**
     * @brief Block until the asset leaves the Loading state
     * @return the Ready asset, AssetLoadError if it failed, NotFound if
     *         unknown, Timeout if still loading after timeout
     */
    Result<MediaAsset> waitFor(const UUID& id, std::chrono::milliseconds timeout);

    Signal<const MediaAsset&> assetReady;
    Signal<const MediaAsset&> assetFailed;

private:
    struct Entry {
        MediaAsset asset;
        std::shared_future<Result<MediaAssetInfo>> pending;
        bool removed = false;
    };

    /// Applies a decode result; returns the asset to announce
    MediaAsset resolveLocked(Entry& entry, Result<MediaAssetInfo> result);
    void announce(const MediaAsset& asset);

    std::shared_ptr<MediaDecoder> m_decoder;

    mutable std::mutex m_mutex;
    std::map<UUID, Entry> m_entries;
};

} // namespace spl::model
