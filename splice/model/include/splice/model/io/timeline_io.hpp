/**
 * @file timeline_io.hpp
 * @brief Timeline serialization to/from JSON
 *
 * Converts timeline contents (tracks, elements, caption tracks, playhead)
 * and the asset references they need to a JSON document. Writing the
 * document to disk is up to the caller.
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/model/timeline.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace spl::model {

/// Asset a document refers to (id as saved, descriptor to load it again)
struct AssetReference {
    UUID id;
    std::string descriptor;
};

/**
 * @brief Serializable timeline contents
 */
struct TimelineDocument {
    std::vector<AssetReference> assets;
    std::vector<Track> tracks;
    std::vector<CaptionTrack> captionTracks;
    Tick playheadTick = 0;

    /// Capture a timeline, with asset descriptors looked up in the registry
    static TimelineDocument capture(const Timeline& timeline, const MediaAssetRegistry* registry);

    /// Load into a timeline (replaces its contents)
    Result<void> applyTo(Timeline& timeline) const;
};

/**
 * @brief Timeline document I/O operations
 */
class TimelineIO {
public:
    /// Current document format version
    static constexpr int kFormatVersion = 1;

    static nlohmann::json toJson(const TimelineDocument& document);

    /// InvalidData on malformed documents, NotSupported on newer versions
    static Result<TimelineDocument> fromJson(const nlohmann::json& root);

    /// Pretty printed with a 2-space indent
    static std::string toString(const TimelineDocument& document);
    static Result<TimelineDocument> fromString(const std::string& text);

    /**
     * @brief Rewrite asset ids after re-registering the assets
     *
     * Registries assign fresh ids, so a loaded document maps each saved
     * asset id to the id its descriptor received. Unmapped ids are kept.
     */
    static void remapAssets(TimelineDocument& document, const std::map<UUID, UUID>& idMap);
};

} // namespace spl::model
