/**
 * @file media_asset_registry.cpp
 * @brief Media asset registry implementation
 */

#include <splice/model/media_asset_registry.hpp>
#include <splice/core/logger.hpp>

namespace spl::model {

namespace {

bool isResolvable(const std::shared_future<Result<MediaAssetInfo>>& future) {
    if (!future.valid()) {
        return false;
    }
    auto status = future.wait_for(std::chrono::seconds(0));
    return status == std::future_status::ready || status == std::future_status::deferred;
}

Result<MediaAssetInfo> takeResult(const std::shared_future<Result<MediaAssetInfo>>& future) {
    try {
        return future.get();
    } catch (const std::exception& e) {
        return Err<MediaAssetInfo>(ErrorCode::AssetLoadError,
                                   std::string("Decoder threw: ") + e.what());
    }
}

} // anonymous namespace

MediaAssetRegistry::MediaAssetRegistry(std::shared_ptr<MediaDecoder> decoder)
    : m_decoder(std::move(decoder)) {}

Result<UUID> MediaAssetRegistry::registerAsset(const std::string& descriptor) {
    if (descriptor.empty()) {
        return Err<UUID>(ErrorCode::AssetLoadError, "Empty source descriptor");
    }
    if (!m_decoder) {
        return Err<UUID>(ErrorCode::AssetLoadError, "No media decoder configured");
    }

    Entry entry;
    entry.asset.id = UUID::generate();
    entry.asset.descriptor = descriptor;
    entry.asset.loadState = AssetLoadState::Loading;

    try {
        entry.pending = m_decoder->decode(descriptor).share();
    } catch (const std::exception& e) {
        return Err<UUID>(ErrorCode::AssetLoadError,
                         "Decoder rejected " + descriptor + ": " + e.what());
    }

    const UUID id = entry.asset.id;
    std::optional<MediaAsset> resolved;
    Error syncError;
    bool failedSynchronously = false;

    {
        std::lock_guard lock(m_mutex);
        auto [it, inserted] = m_entries.emplace(id, std::move(entry));

        // Only an already-ready future counts as synchronous; a deferred one
        // is left for poll() so decode work never runs on the caller here.
        if (it->second.pending.valid() &&
            it->second.pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            resolved = resolveLocked(it->second, takeResult(it->second.pending));
            if (resolved->loadState == AssetLoadState::Failed) {
                failedSynchronously = true;
                syncError = Error(ErrorCode::AssetLoadError, resolved->errorMessage);
            }
        }
    }

    if (resolved) {
        announce(*resolved);
    }
    if (failedSynchronously) {
        return Err<UUID>(syncError);
    }

    LOG_DEBUG("Asset {} registered: {}", id.shortString(), descriptor);
    return id;
}

Result<MediaAsset> MediaAssetRegistry::get(const UUID& id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return Err<MediaAsset>(ErrorCode::NotFound, "Unknown asset " + id.toString());
    }
    if (it->second.asset.loadState != AssetLoadState::Ready) {
        return Err<MediaAsset>(ErrorCode::NotFound,
            std::string("Asset ") + id.toString() + " is " +
            assetLoadStateToString(it->second.asset.loadState));
    }
    return it->second.asset;
}

std::optional<MediaAsset> MediaAssetRegistry::find(const UUID& id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.asset;
}

bool MediaAssetRegistry::isReady(const UUID& id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(id);
    return it != m_entries.end() && it->second.asset.loadState == AssetLoadState::Ready;
}

std::optional<AssetLoadState> MediaAssetRegistry::state(const UUID& id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.asset.loadState;
}

std::vector<MediaAsset> MediaAssetRegistry::assets() const {
    std::lock_guard lock(m_mutex);
    std::vector<MediaAsset> result;
    result.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        if (entry.removed) continue;
        result.push_back(entry.asset);
    }
    return result;
}

size_t MediaAssetRegistry::count() const {
    std::lock_guard lock(m_mutex);
    size_t live = 0;
    for (const auto& [id, entry] : m_entries) {
        if (!entry.removed) ++live;
    }
    return live;
}

bool MediaAssetRegistry::remove(const UUID& id) {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.removed) {
        return false;
    }
    // Timeline elements and history entries may still point at it
    it->second.removed = true;
    LOG_DEBUG("Asset {} removed: {}", id.shortString(), it->second.asset.descriptor);
    return true;
}

bool MediaAssetRegistry::isRemoved(const UUID& id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(id);
    return it != m_entries.end() && it->second.removed;
}

size_t MediaAssetRegistry::poll() {
    std::vector<MediaAsset> finished;
    {
        std::lock_guard lock(m_mutex);
        for (auto& [id, entry] : m_entries) {
            if (entry.asset.loadState != AssetLoadState::Loading) continue;
            if (!isResolvable(entry.pending)) continue;
            finished.push_back(resolveLocked(entry, takeResult(entry.pending)));
        }
    }

    for (const auto& asset : finished) {
        announce(asset);
    }
    return finished.size();
}

Result<MediaAsset> MediaAssetRegistry::waitFor(const UUID& id, std::chrono::milliseconds timeout) {
    std::shared_future<Result<MediaAssetInfo>> pending;
    {
        std::lock_guard lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return Err<MediaAsset>(ErrorCode::NotFound, "Unknown asset " + id.toString());
        }
        pending = it->second.pending;
    }

    if (pending.valid() &&
        pending.wait_for(timeout) == std::future_status::timeout) {
        return Err<MediaAsset>(ErrorCode::Timeout, "Asset " + id.toString() + " still loading");
    }

    poll();

    auto asset = find(id);
    if (!asset || isRemoved(id)) {
        return Err<MediaAsset>(ErrorCode::NotFound, "Asset removed while loading");
    }
    if (asset->loadState == AssetLoadState::Failed) {
        return Err<MediaAsset>(ErrorCode::AssetLoadError, asset->errorMessage);
    }
    return *asset;
}

MediaAsset MediaAssetRegistry::resolveLocked(Entry& entry, Result<MediaAssetInfo> result) {
    if (result.ok()) {
        entry.asset.info = result.value();
        entry.asset.loadState = AssetLoadState::Ready;
        entry.asset.errorMessage.clear();
    } else {
        entry.asset.loadState = AssetLoadState::Failed;
        entry.asset.errorMessage = result.error().what();
    }
    entry.pending = {};
    return entry.asset;
}

void MediaAssetRegistry::announce(const MediaAsset& asset) {
    if (asset.loadState == AssetLoadState::Ready) {
        LOG_INFO("Asset ready: {} ({}, {:.2f}s)", asset.descriptor,
                 mediaAssetKindToString(asset.kind()), ticksToSeconds(asset.durationTicks()));
        assetReady.fire(asset);
    } else if (asset.loadState == AssetLoadState::Failed) {
        LOG_WARN("Asset failed to load: {} - {}", asset.descriptor, asset.errorMessage);
        assetFailed.fire(asset);
    }
}

} // namespace spl::model
