/**
 * @file timeline.hpp
 * @brief Timeline composition model
 *
 * The timeline owns ordered tracks of elements plus the caption tracks
 * they reference. Every mutation is validated and applied atomically
 * (fully or not at all) and returns a change record describing the old
 * and new state, which the history manager turns into an inverse
 * command.
 *
 * Single writer, many readers: the editing thread mutates, any thread
 * may query or take a snapshot. A shared mutex makes readers observe
 * only fully applied mutations.
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/core/signals.hpp>
#include <splice/model/caption_track.hpp>
#include <splice/model/track.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <vector>

namespace spl::model {

class MediaAssetRegistry;

// ============================================================================
// Snapshot
// ============================================================================

/// Element active at a given tick, with the source position to render
struct ActiveElement {
    size_t trackIndex = 0;
    UUID trackId;
    TrackKind trackKind = TrackKind::Video;
    Element element;
    Tick sourceTick = 0;
};

/**
 * @brief Immutable copy of the timeline contents
 *
 * Shared by export jobs; later edits never reach an existing snapshot.
 */
struct TimelineSnapshot {
    std::vector<Track> tracks;
    std::map<UUID, CaptionTrack> captionTracks;
    Tick playheadTick = 0;
    uint64_t version = 0;

    /// Maximum end tick over all tracks
    [[nodiscard]] Tick endTick() const;

    /// Active elements on enabled tracks at the given tick, in track order
    [[nodiscard]] std::vector<ActiveElement> activeElementsAt(Tick tick) const;

    [[nodiscard]] const Track* findTrack(const UUID& trackId) const;
    [[nodiscard]] const CaptionTrack* findCaptionTrack(const UUID& captionTrackId) const;

    /// Same tracks, elements and caption tracks (playhead/version ignored)
    [[nodiscard]] bool sameContent(const TimelineSnapshot& other) const {
        return tracks == other.tracks && captionTracks == other.captionTracks;
    }
};

// ============================================================================
// Change Records
// ============================================================================

struct ElementAdded {
    Element element;
};

struct ElementRemoved {
    Element element;
};

struct ElementMoved {
    UUID elementId;
    UUID oldTrackId;
    Tick oldStartTick = 0;
    UUID newTrackId;
    Tick newStartTick = 0;
};

struct ElementTrimmed {
    UUID elementId;
    Tick oldTrimIn = 0;
    Tick oldTrimOut = 0;
    TickDuration oldDuration = 0;
    Tick newTrimIn = 0;
    Tick newTrimOut = 0;
    TickDuration newDuration = 0;
};

struct ElementSplit {
    Element original;
    Element left;     ///< Keeps the original id
    Element right;
};

struct ElementsMerged {
    Element left;
    Element right;
    Element merged;   ///< Keeps the left id
};

struct TrackAdded {
    Track track;
    size_t index = 0;
    std::optional<CaptionTrack> captionTrack;
};

struct TrackRemoved {
    Track track;
    size_t index = 0;
    std::optional<CaptionTrack> captionTrack;
};

struct TracksReordered {
    std::vector<UUID> oldOrder;
    std::vector<UUID> newOrder;
};

struct TrackEnabledChanged {
    UUID trackId;
    bool oldEnabled = true;
    bool newEnabled = true;
};

enum class ChangeKind : uint8_t {
    ElementAdded,
    ElementRemoved,
    ElementMoved,
    ElementTrimmed,
    ElementSplit,
    ElementsMerged,
    TrackAdded,
    TrackRemoved,
    TracksReordered,
    TrackEnabled,
    Restored,
};

/// Fired after every successful mutation
struct TimelineChange {
    uint64_t version = 0;
    ChangeKind kind = ChangeKind::Restored;
};

// ============================================================================
// Timeline
// ============================================================================

class Timeline {
public:
    Timeline() = default;

    Timeline(const Timeline&) = delete;
    Timeline& operator=(const Timeline&) = delete;

    /**
     * @brief Validate asset references against a registry
     *
     * With a registry attached, asset-backed elements must reference a
     * Ready asset of a kind matching the track, and stay within the
     * asset's duration. The registry must outlive the timeline.
     */
    void attachRegistry(const MediaAssetRegistry* registry);

    // ========== Tracks ==========

    /**
     * @brief Insert a track (with its elements)
     *
     * @param index position in the track order; nullopt appends
     * @param captionTrack required for Caption tracks, installed with it
     */
    Result<TrackAdded> addTrack(Track track, std::optional<size_t> index = std::nullopt,
                                std::optional<CaptionTrack> captionTrack = std::nullopt);

    /// Remove a track, its elements and its caption track
    Result<TrackRemoved> removeTrack(const UUID& trackId);

    /// InvalidOrder unless newOrder is a permutation of the current track ids
    Result<TracksReordered> reorderTracks(const std::vector<UUID>& newOrder);

    Result<TrackEnabledChanged> setTrackEnabled(const UUID& trackId, bool enabled);

    // ========== Elements ==========

    /**
     * @brief Place an element on a track
     *
     * Fails with OverlapError, InvalidRange, NotFound (track),
     * IncompatibleTrack, AssetNotReady or DuplicateId. A null element id
     * is replaced with a generated one.
     */
    Result<ElementAdded> addElement(const UUID& trackId, Element element);

    Result<ElementRemoved> removeElement(const UUID& elementId);

    /// Move in time, optionally onto another track of a compatible kind
    Result<ElementMoved> moveElement(const UUID& elementId, Tick newStartTick,
                                     std::optional<UUID> targetTrackId = std::nullopt);

    /// Change trims keeping the start anchored and the source extent fixed
    Result<ElementTrimmed> trimElement(const UUID& elementId, Tick newTrimIn, Tick newTrimOut);

    /**
     * @brief Split an element in two at a tick strictly inside it
     *
     * The left part keeps the element id; the right part gets rightId (or
     * a generated id) and rightName (or the original name). Covered time
     * is preserved exactly.
     */
    Result<ElementSplit> splitElement(const UUID& elementId, Tick atTick,
                                      std::optional<UUID> rightId = std::nullopt,
                                      std::optional<std::string> rightName = std::nullopt);

    /// Inverse of split: adjacent elements with a contiguous source
    Result<ElementsMerged> mergeElements(const UUID& leftId, const UUID& rightId);

    /// Replace the whole contents (project load); validated like addTrack
    Result<void> restore(std::vector<Track> tracks, std::vector<CaptionTrack> captionTracks,
                         Tick playheadTick = 0);

    // ========== UI State (not part of history) ==========

    /// NotFound if any id does not name an element
    Result<void> setSelection(const std::set<UUID>& elementIds);
    void clearSelection();
    void setPlayhead(Tick tick);

    // ========== Queries ==========

    [[nodiscard]] std::vector<Track> tracks() const;
    [[nodiscard]] std::vector<UUID> trackOrder() const;
    [[nodiscard]] size_t trackCount() const;
    [[nodiscard]] std::optional<Track> track(const UUID& trackId) const;
    [[nodiscard]] std::optional<Element> element(const UUID& elementId) const;
    [[nodiscard]] std::optional<CaptionTrack> captionTrack(const UUID& captionTrackId) const;
    [[nodiscard]] std::set<UUID> selection() const;
    [[nodiscard]] Tick playhead() const;
    [[nodiscard]] Tick endTick() const;
    [[nodiscard]] uint64_t version() const;
    [[nodiscard]] std::vector<ActiveElement> activeElementsAt(Tick tick) const;

    /// Immutable copy for export and other readers
    [[nodiscard]] std::shared_ptr<const TimelineSnapshot> snapshot() const;

    // ========== Signals ==========

    Signal<const TimelineChange&> changed;
    Signal<const std::set<UUID>&> selectionChanged;
    Signal<Tick> playheadChanged;

private:
    struct State {
        std::vector<Track> tracks;
        std::map<UUID, CaptionTrack> captionTracks;
    };

    struct Location {
        size_t trackIndex;
        size_t elementIndex;
    };

    std::optional<Location> locate(const State& state, const UUID& elementId) const;
    std::optional<size_t> trackIndex(const State& state, const UUID& trackId) const;
    bool idInUse(const State& state, const UUID& id) const;

    /// Range, source compatibility and overlap checks for one element
    Result<void> validatePlacement(const Track& track, const Element& element,
                                   const CaptionTrack* captions) const;
    Result<void> validateTrackInsert(const State& state, Track& track,
                                     const std::optional<CaptionTrack>& captionTrack) const;

    TimelineChange commitLocked(ChangeKind kind);

    mutable std::shared_mutex m_mutex;
    State m_state;
    std::set<UUID> m_selection;
    Tick m_playhead = 0;
    uint64_t m_version = 0;
    const MediaAssetRegistry* m_registry = nullptr;
};

} // namespace spl::model
