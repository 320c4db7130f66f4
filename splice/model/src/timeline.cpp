/**
 * @file timeline.cpp
 * @brief Timeline model implementation
 */

#include <splice/model/timeline.hpp>
#include <splice/model/media_asset_registry.hpp>
#include <splice/core/logger.hpp>

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace spl::model {

namespace {

std::vector<ActiveElement> collectActive(const std::vector<Track>& tracks, Tick tick) {
    std::vector<ActiveElement> active;
    for (size_t i = 0; i < tracks.size(); ++i) {
        const Track& track = tracks[i];
        if (!track.enabled) continue;

        const Element* element = track.elementAt(tick);
        if (!element) continue;

        active.push_back({i, track.id, track.kind, *element, element->sourceTickAt(tick)});
    }
    return active;
}

Tick maxEndTick(const std::vector<Track>& tracks) {
    Tick end = 0;
    for (const auto& track : tracks) {
        end = std::max(end, track.endTick());
    }
    return end;
}

std::string describeRange(const Element& e) {
    return "[" + std::to_string(e.startTick) + ", " + std::to_string(e.endTick()) + ")";
}

} // anonymous namespace

// ============================================================================
// TimelineSnapshot
// ============================================================================

Tick TimelineSnapshot::endTick() const {
    return maxEndTick(tracks);
}

std::vector<ActiveElement> TimelineSnapshot::activeElementsAt(Tick tick) const {
    return collectActive(tracks, tick);
}

const Track* TimelineSnapshot::findTrack(const UUID& trackId) const {
    for (const auto& track : tracks) {
        if (track.id == trackId) return &track;
    }
    return nullptr;
}

const CaptionTrack* TimelineSnapshot::findCaptionTrack(const UUID& captionTrackId) const {
    auto it = captionTracks.find(captionTrackId);
    return it != captionTracks.end() ? &it->second : nullptr;
}

// ============================================================================
// Timeline - helpers
// ============================================================================

void Timeline::attachRegistry(const MediaAssetRegistry* registry) {
    std::unique_lock lock(m_mutex);
    m_registry = registry;
}

std::optional<Timeline::Location> Timeline::locate(const State& state, const UUID& elementId) const {
    for (size_t t = 0; t < state.tracks.size(); ++t) {
        const auto& elements = state.tracks[t].elements;
        for (size_t e = 0; e < elements.size(); ++e) {
            if (elements[e].id == elementId) {
                return Location{t, e};
            }
        }
    }
    return std::nullopt;
}

std::optional<size_t> Timeline::trackIndex(const State& state, const UUID& trackId) const {
    for (size_t i = 0; i < state.tracks.size(); ++i) {
        if (state.tracks[i].id == trackId) return i;
    }
    return std::nullopt;
}

bool Timeline::idInUse(const State& state, const UUID& id) const {
    for (const auto& track : state.tracks) {
        if (track.id == id) return true;
        if (track.findElement(id)) return true;
    }
    return false;
}

Result<void> Timeline::validatePlacement(const Track& track, const Element& element,
                                         const CaptionTrack* captions) const {
    if (element.startTick < 0) {
        return Err(ErrorCode::InvalidRange, "Element starts before 0");
    }
    if (element.durationTicks <= 0) {
        return Err(ErrorCode::InvalidRange, "Element duration must be positive");
    }
    if (element.trimInTicks < 0 || element.trimOutTicks < 0) {
        return Err(ErrorCode::InvalidRange, "Trim values must not be negative");
    }

    switch (element.source.kind) {
        case SourceKind::CaptionCue:
            if (track.kind != TrackKind::Caption) {
                return Err(ErrorCode::IncompatibleTrack,
                    std::string("Caption cue cannot be placed on a ") +
                    trackKindToString(track.kind) + " track");
            }
            if (captions && !captions->findCue(element.source.id)) {
                return Err(ErrorCode::NotFound, "Unknown caption cue " + element.source.id.toString());
            }
            break;

        case SourceKind::None:
            if (track.kind != TrackKind::Video) {
                return Err(ErrorCode::IncompatibleTrack,
                    "Generated elements belong on video tracks");
            }
            break;

        case SourceKind::Asset: {
            if (track.kind == TrackKind::Caption) {
                return Err(ErrorCode::IncompatibleTrack, "Media cannot be placed on a caption track");
            }
            if (!m_registry) break;

            auto asset = m_registry->find(element.source.id);
            if (!asset) {
                return Err(ErrorCode::NotFound, "Unknown asset " + element.source.id.toString());
            }
            if (!asset->isReady()) {
                return Err(ErrorCode::AssetNotReady,
                    "Asset " + asset->descriptor + " is " + assetLoadStateToString(asset->loadState));
            }

            const bool audioAsset = asset->kind() == MediaAssetKind::Audio;
            if (audioAsset != (track.kind == TrackKind::Audio)) {
                return Err(ErrorCode::IncompatibleTrack,
                    std::string(mediaAssetKindToString(asset->kind())) + " asset cannot go on a " +
                    trackKindToString(track.kind) + " track");
            }
            if (asset->hasBoundedDuration() &&
                element.trimInTicks + element.durationTicks > asset->durationTicks()) {
                return Err(ErrorCode::InvalidRange,
                    "Element exceeds source duration of " + asset->descriptor);
            }
            break;
        }
    }

    if (track.hasOverlap(element.startTick, element.endTick(), element.id)) {
        return Err(ErrorCode::OverlapError,
            "Element " + describeRange(element) + " overlaps on track '" + track.name + "'");
    }

    return Ok();
}

Result<void> Timeline::validateTrackInsert(const State& state, Track& track,
                                           const std::optional<CaptionTrack>& captionTrack) const {
    if (track.id.isNull()) {
        track.id = UUID::generate();
    }
    if (idInUse(state, track.id)) {
        return Err(ErrorCode::DuplicateId, "Track id already in use: " + track.id.toString());
    }

    if (track.kind == TrackKind::Caption) {
        if (!captionTrack) {
            return Err(ErrorCode::InvalidArgument, "Caption track requires its cue list");
        }
        if (captionTrack->id.isNull()) {
            return Err(ErrorCode::InvalidArgument, "Caption track id must be set");
        }
        if (!track.captionTrackId) {
            track.captionTrackId = captionTrack->id;
        }
        if (*track.captionTrackId != captionTrack->id) {
            return Err(ErrorCode::InvalidArgument, "Track references a different caption track");
        }
        if (state.captionTracks.count(captionTrack->id)) {
            return Err(ErrorCode::DuplicateId,
                "Caption track already installed: " + captionTrack->id.toString());
        }
        if (!captionTrack->isWellFormed()) {
            return Err(ErrorCode::InvalidRange, "Caption cues overlap or are empty");
        }
    } else if (captionTrack || track.captionTrackId) {
        return Err(ErrorCode::InvalidArgument, "Only caption tracks reference caption cues");
    }

    // Validate elements one by one against the partially built track
    std::vector<Element> incoming = std::move(track.elements);
    std::stable_sort(incoming.begin(), incoming.end(),
        [](const Element& a, const Element& b) { return a.startTick < b.startTick; });

    track.elements.clear();
    std::unordered_set<UUID> seen;
    const CaptionTrack* captions = captionTrack ? &*captionTrack : nullptr;

    for (auto& element : incoming) {
        if (element.id.isNull()) {
            element.id = UUID::generate();
        }
        if (element.id == track.id || !seen.insert(element.id).second || idInUse(state, element.id)) {
            return Err(ErrorCode::DuplicateId, "Element id already in use: " + element.id.toString());
        }
        element.trackId = track.id;

        auto valid = validatePlacement(track, element, captions);
        if (!valid) {
            return valid;
        }
        track.elements.push_back(std::move(element));
    }

    return Ok();
}

TimelineChange Timeline::commitLocked(ChangeKind kind) {
    ++m_version;
    return TimelineChange{m_version, kind};
}

// ============================================================================
// Tracks
// ============================================================================

Result<TrackAdded> Timeline::addTrack(Track track, std::optional<size_t> index,
                                      std::optional<CaptionTrack> captionTrack) {
    TimelineChange change;
    TrackAdded record;
    {
        std::unique_lock lock(m_mutex);

        const size_t position = index.value_or(m_state.tracks.size());
        if (position > m_state.tracks.size()) {
            return Err<TrackAdded>(ErrorCode::InvalidRange, "Track index out of range");
        }

        auto valid = validateTrackInsert(m_state, track, captionTrack);
        if (!valid) {
            return Err<TrackAdded>(valid.error());
        }

        if (captionTrack) {
            m_state.captionTracks.emplace(captionTrack->id, *captionTrack);
        }
        m_state.tracks.insert(m_state.tracks.begin() + static_cast<std::ptrdiff_t>(position), track);

        record = TrackAdded{std::move(track), position, std::move(captionTrack)};
        change = commitLocked(ChangeKind::TrackAdded);
    }

    LOG_DEBUG("Track added: {} '{}' at {}", trackKindToString(record.track.kind),
              record.track.name, record.index);
    changed.fire(change);
    return record;
}

Result<TrackRemoved> Timeline::removeTrack(const UUID& trackId) {
    TimelineChange change;
    TrackRemoved record;
    bool selectionTouched = false;
    std::set<UUID> selection;
    {
        std::unique_lock lock(m_mutex);

        auto index = trackIndex(m_state, trackId);
        if (!index) {
            return Err<TrackRemoved>(ErrorCode::NotFound, "Unknown track " + trackId.toString());
        }

        record.track = m_state.tracks[*index];
        record.index = *index;
        if (record.track.captionTrackId) {
            auto it = m_state.captionTracks.find(*record.track.captionTrackId);
            if (it != m_state.captionTracks.end()) {
                record.captionTrack = it->second;
                m_state.captionTracks.erase(it);
            }
        }
        m_state.tracks.erase(m_state.tracks.begin() + static_cast<std::ptrdiff_t>(*index));

        for (const auto& element : record.track.elements) {
            selectionTouched |= m_selection.erase(element.id) > 0;
        }
        selection = m_selection;
        change = commitLocked(ChangeKind::TrackRemoved);
    }

    LOG_DEBUG("Track removed: '{}' ({} elements)", record.track.name, record.track.elements.size());
    changed.fire(change);
    if (selectionTouched) {
        selectionChanged.fire(selection);
    }
    return record;
}

Result<TracksReordered> Timeline::reorderTracks(const std::vector<UUID>& newOrder) {
    TimelineChange change;
    TracksReordered record;
    {
        std::unique_lock lock(m_mutex);

        if (newOrder.size() != m_state.tracks.size()) {
            return Err<TracksReordered>(ErrorCode::InvalidOrder,
                "Expected " + std::to_string(m_state.tracks.size()) + " track ids, got " +
                std::to_string(newOrder.size()));
        }

        std::vector<Track> reordered;
        reordered.reserve(newOrder.size());
        std::unordered_set<UUID> used;
        for (const auto& id : newOrder) {
            auto index = trackIndex(m_state, id);
            if (!index || !used.insert(id).second) {
                return Err<TracksReordered>(ErrorCode::InvalidOrder,
                    "Track order does not match the timeline's tracks");
            }
            reordered.push_back(m_state.tracks[*index]);
        }

        for (const auto& track : m_state.tracks) {
            record.oldOrder.push_back(track.id);
        }
        record.newOrder = newOrder;
        m_state.tracks = std::move(reordered);
        change = commitLocked(ChangeKind::TracksReordered);
    }

    changed.fire(change);
    return record;
}

Result<TrackEnabledChanged> Timeline::setTrackEnabled(const UUID& trackId, bool enabled) {
    TimelineChange change;
    TrackEnabledChanged record;
    {
        std::unique_lock lock(m_mutex);

        auto index = trackIndex(m_state, trackId);
        if (!index) {
            return Err<TrackEnabledChanged>(ErrorCode::NotFound, "Unknown track " + trackId.toString());
        }

        Track& track = m_state.tracks[*index];
        record = TrackEnabledChanged{trackId, track.enabled, enabled};
        track.enabled = enabled;
        change = commitLocked(ChangeKind::TrackEnabled);
    }

    changed.fire(change);
    return record;
}

// ============================================================================
// Elements
// ============================================================================

Result<ElementAdded> Timeline::addElement(const UUID& trackId, Element element) {
    TimelineChange change;
    {
        std::unique_lock lock(m_mutex);

        auto index = trackIndex(m_state, trackId);
        if (!index) {
            return Err<ElementAdded>(ErrorCode::NotFound, "Unknown track " + trackId.toString());
        }

        if (element.id.isNull()) {
            element.id = UUID::generate();
        }
        if (idInUse(m_state, element.id)) {
            return Err<ElementAdded>(ErrorCode::DuplicateId,
                "Element id already in use: " + element.id.toString());
        }
        element.trackId = trackId;

        Track& track = m_state.tracks[*index];
        const CaptionTrack* captions = nullptr;
        if (track.captionTrackId) {
            auto it = m_state.captionTracks.find(*track.captionTrackId);
            if (it != m_state.captionTracks.end()) captions = &it->second;
        }

        auto valid = validatePlacement(track, element, captions);
        if (!valid) {
            return Err<ElementAdded>(valid.error());
        }

        track.insertSorted(element);
        change = commitLocked(ChangeKind::ElementAdded);
    }

    LOG_TRACE("Element {} added {}", element.id.shortString(), describeRange(element));
    changed.fire(change);
    return ElementAdded{std::move(element)};
}

Result<ElementRemoved> Timeline::removeElement(const UUID& elementId) {
    TimelineChange change;
    ElementRemoved record;
    bool selectionTouched = false;
    std::set<UUID> selection;
    {
        std::unique_lock lock(m_mutex);

        auto loc = locate(m_state, elementId);
        if (!loc) {
            return Err<ElementRemoved>(ErrorCode::NotFound, "Unknown element " + elementId.toString());
        }

        auto& elements = m_state.tracks[loc->trackIndex].elements;
        record.element = elements[loc->elementIndex];
        elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(loc->elementIndex));

        selectionTouched = m_selection.erase(elementId) > 0;
        selection = m_selection;
        change = commitLocked(ChangeKind::ElementRemoved);
    }

    changed.fire(change);
    if (selectionTouched) {
        selectionChanged.fire(selection);
    }
    return record;
}

Result<ElementMoved> Timeline::moveElement(const UUID& elementId, Tick newStartTick,
                                           std::optional<UUID> targetTrackId) {
    TimelineChange change;
    ElementMoved record;
    {
        std::unique_lock lock(m_mutex);

        auto loc = locate(m_state, elementId);
        if (!loc) {
            return Err<ElementMoved>(ErrorCode::NotFound, "Unknown element " + elementId.toString());
        }

        size_t targetIndex = loc->trackIndex;
        if (targetTrackId) {
            auto index = trackIndex(m_state, *targetTrackId);
            if (!index) {
                return Err<ElementMoved>(ErrorCode::NotFound,
                    "Unknown target track " + targetTrackId->toString());
            }
            targetIndex = *index;
        }

        Track& source = m_state.tracks[loc->trackIndex];
        Track& target = m_state.tracks[targetIndex];

        Element moved = source.elements[loc->elementIndex];
        record.elementId = elementId;
        record.oldTrackId = moved.trackId;
        record.oldStartTick = moved.startTick;

        moved.startTick = newStartTick;
        moved.trackId = target.id;

        const CaptionTrack* captions = nullptr;
        if (target.captionTrackId) {
            auto it = m_state.captionTracks.find(*target.captionTrackId);
            if (it != m_state.captionTracks.end()) captions = &it->second;
        }

        auto valid = validatePlacement(target, moved, captions);
        if (!valid) {
            return Err<ElementMoved>(valid.error());
        }

        source.erase(elementId);
        target.insertSorted(moved);

        record.newTrackId = target.id;
        record.newStartTick = newStartTick;
        change = commitLocked(ChangeKind::ElementMoved);
    }

    changed.fire(change);
    return record;
}

Result<ElementTrimmed> Timeline::trimElement(const UUID& elementId, Tick newTrimIn, Tick newTrimOut) {
    TimelineChange change;
    ElementTrimmed record;
    {
        std::unique_lock lock(m_mutex);

        auto loc = locate(m_state, elementId);
        if (!loc) {
            return Err<ElementTrimmed>(ErrorCode::NotFound, "Unknown element " + elementId.toString());
        }

        Track& track = m_state.tracks[loc->trackIndex];
        Element& current = track.elements[loc->elementIndex];

        const TickDuration newDuration = current.sourceExtent() - newTrimIn - newTrimOut;
        if (newTrimIn < 0 || newTrimOut < 0 || newDuration <= 0) {
            return Err<ElementTrimmed>(ErrorCode::InvalidRange,
                "Trim leaves no visible duration (extent " +
                std::to_string(current.sourceExtent()) + ")");
        }

        Element trimmed = current;
        trimmed.trimInTicks = newTrimIn;
        trimmed.trimOutTicks = newTrimOut;
        trimmed.durationTicks = newDuration;

        const CaptionTrack* captions = nullptr;
        if (track.captionTrackId) {
            auto it = m_state.captionTracks.find(*track.captionTrackId);
            if (it != m_state.captionTracks.end()) captions = &it->second;
        }

        auto valid = validatePlacement(track, trimmed, captions);
        if (!valid) {
            return Err<ElementTrimmed>(valid.error());
        }

        record = ElementTrimmed{elementId,
                                current.trimInTicks, current.trimOutTicks, current.durationTicks,
                                newTrimIn, newTrimOut, newDuration};
        current = trimmed;
        change = commitLocked(ChangeKind::ElementTrimmed);
    }

    changed.fire(change);
    return record;
}

Result<ElementSplit> Timeline::splitElement(const UUID& elementId, Tick atTick,
                                            std::optional<UUID> rightId,
                                            std::optional<std::string> rightName) {
    TimelineChange change;
    ElementSplit record;
    {
        std::unique_lock lock(m_mutex);

        auto loc = locate(m_state, elementId);
        if (!loc) {
            return Err<ElementSplit>(ErrorCode::NotFound, "Unknown element " + elementId.toString());
        }

        Track& track = m_state.tracks[loc->trackIndex];
        const Element original = track.elements[loc->elementIndex];

        if (atTick <= original.startTick || atTick >= original.endTick()) {
            return Err<ElementSplit>(ErrorCode::InvalidRange,
                "Split point " + std::to_string(atTick) + " is not inside " + describeRange(original));
        }

        const UUID newId = rightId.value_or(UUID::generate());
        if (newId.isNull() || idInUse(m_state, newId)) {
            return Err<ElementSplit>(ErrorCode::DuplicateId, "Split id already in use: " + newId.toString());
        }

        const TickDuration leftDuration = atTick - original.startTick;
        const TickDuration rightDuration = original.endTick() - atTick;

        Element left = original;
        left.durationTicks = leftDuration;
        left.trimOutTicks = original.trimOutTicks + rightDuration;

        Element right = original;
        right.id = newId;
        right.startTick = atTick;
        right.durationTicks = rightDuration;
        right.trimInTicks = original.trimInTicks + leftDuration;
        right.trimOutTicks = original.trimOutTicks;
        if (rightName) {
            right.name = *rightName;
        }

        track.elements[loc->elementIndex] = left;
        track.insertSorted(right);

        record = ElementSplit{original, left, right};
        change = commitLocked(ChangeKind::ElementSplit);
    }

    changed.fire(change);
    return record;
}

Result<ElementsMerged> Timeline::mergeElements(const UUID& leftId, const UUID& rightId) {
    TimelineChange change;
    ElementsMerged record;
    bool selectionTouched = false;
    std::set<UUID> selection;
    {
        std::unique_lock lock(m_mutex);

        auto leftLoc = locate(m_state, leftId);
        auto rightLoc = locate(m_state, rightId);
        if (!leftLoc || !rightLoc) {
            return Err<ElementsMerged>(ErrorCode::NotFound, "Unknown element to merge");
        }
        if (leftLoc->trackIndex != rightLoc->trackIndex) {
            return Err<ElementsMerged>(ErrorCode::InvalidArgument, "Elements are on different tracks");
        }

        Track& track = m_state.tracks[leftLoc->trackIndex];
        const Element left = track.elements[leftLoc->elementIndex];
        const Element right = track.elements[rightLoc->elementIndex];

        if (!(left.source == right.source)) {
            return Err<ElementsMerged>(ErrorCode::InvalidArgument, "Elements reference different sources");
        }
        if (left.endTick() != right.startTick) {
            return Err<ElementsMerged>(ErrorCode::InvalidRange, "Elements are not adjacent");
        }
        if (right.trimInTicks != left.trimInTicks + left.durationTicks ||
            left.trimOutTicks != right.durationTicks + right.trimOutTicks) {
            return Err<ElementsMerged>(ErrorCode::InvalidRange, "Source ranges are not contiguous");
        }

        Element merged = left;
        merged.durationTicks = left.durationTicks + right.durationTicks;
        merged.trimOutTicks = right.trimOutTicks;

        track.elements[leftLoc->elementIndex] = merged;
        track.erase(rightId);

        selectionTouched = m_selection.erase(rightId) > 0;
        selection = m_selection;

        record = ElementsMerged{left, right, merged};
        change = commitLocked(ChangeKind::ElementsMerged);
    }

    changed.fire(change);
    if (selectionTouched) {
        selectionChanged.fire(selection);
    }
    return record;
}

Result<void> Timeline::restore(std::vector<Track> tracks, std::vector<CaptionTrack> captionTracks,
                               Tick playheadTick) {
    std::map<UUID, CaptionTrack> pendingCaptions;
    for (auto& captionTrack : captionTracks) {
        UUID id = captionTrack.id;
        if (!pendingCaptions.emplace(id, std::move(captionTrack)).second) {
            return Err(ErrorCode::DuplicateId, "Duplicate caption track " + id.toString());
        }
    }

    TimelineChange change;
    {
        std::unique_lock lock(m_mutex);

        State fresh;
        for (auto& track : tracks) {
            std::optional<CaptionTrack> captions;
            if (track.captionTrackId) {
                auto it = pendingCaptions.find(*track.captionTrackId);
                if (it == pendingCaptions.end()) {
                    return Err(ErrorCode::NotFound,
                        "Track '" + track.name + "' references a missing caption track");
                }
                captions = std::move(it->second);
                pendingCaptions.erase(it);
            }

            auto valid = validateTrackInsert(fresh, track, captions);
            if (!valid) {
                return Err(valid.error().withContext("Track '" + track.name + "'"));
            }
            if (captions) {
                fresh.captionTracks.emplace(captions->id, std::move(*captions));
            }
            fresh.tracks.push_back(std::move(track));
        }

        if (!pendingCaptions.empty()) {
            return Err(ErrorCode::InvalidArgument, "Caption track not referenced by any track");
        }

        m_state = std::move(fresh);
        m_selection.clear();
        m_playhead = std::max<Tick>(0, playheadTick);
        change = commitLocked(ChangeKind::Restored);
    }

    LOG_INFO("Timeline restored: {} tracks", trackCount());
    changed.fire(change);
    return Ok();
}

// ============================================================================
// UI State
// ============================================================================

Result<void> Timeline::setSelection(const std::set<UUID>& elementIds) {
    {
        std::unique_lock lock(m_mutex);
        for (const auto& id : elementIds) {
            if (!locate(m_state, id)) {
                return Err(ErrorCode::NotFound, "Cannot select unknown element " + id.toString());
            }
        }
        m_selection = elementIds;
    }
    selectionChanged.fire(elementIds);
    return Ok();
}

void Timeline::clearSelection() {
    {
        std::unique_lock lock(m_mutex);
        if (m_selection.empty()) return;
        m_selection.clear();
    }
    selectionChanged.fire({});
}

void Timeline::setPlayhead(Tick tick) {
    const Tick clamped = std::max<Tick>(0, tick);
    {
        std::unique_lock lock(m_mutex);
        m_playhead = clamped;
    }
    playheadChanged.fire(clamped);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Track> Timeline::tracks() const {
    std::shared_lock lock(m_mutex);
    return m_state.tracks;
}

std::vector<UUID> Timeline::trackOrder() const {
    std::shared_lock lock(m_mutex);
    std::vector<UUID> order;
    order.reserve(m_state.tracks.size());
    for (const auto& track : m_state.tracks) {
        order.push_back(track.id);
    }
    return order;
}

size_t Timeline::trackCount() const {
    std::shared_lock lock(m_mutex);
    return m_state.tracks.size();
}

std::optional<Track> Timeline::track(const UUID& trackId) const {
    std::shared_lock lock(m_mutex);
    auto index = trackIndex(m_state, trackId);
    if (!index) return std::nullopt;
    return m_state.tracks[*index];
}

std::optional<Element> Timeline::element(const UUID& elementId) const {
    std::shared_lock lock(m_mutex);
    auto loc = locate(m_state, elementId);
    if (!loc) return std::nullopt;
    return m_state.tracks[loc->trackIndex].elements[loc->elementIndex];
}

std::optional<CaptionTrack> Timeline::captionTrack(const UUID& captionTrackId) const {
    std::shared_lock lock(m_mutex);
    auto it = m_state.captionTracks.find(captionTrackId);
    if (it == m_state.captionTracks.end()) return std::nullopt;
    return it->second;
}

std::set<UUID> Timeline::selection() const {
    std::shared_lock lock(m_mutex);
    return m_selection;
}

Tick Timeline::playhead() const {
    std::shared_lock lock(m_mutex);
    return m_playhead;
}

Tick Timeline::endTick() const {
    std::shared_lock lock(m_mutex);
    return maxEndTick(m_state.tracks);
}

uint64_t Timeline::version() const {
    std::shared_lock lock(m_mutex);
    return m_version;
}

std::vector<ActiveElement> Timeline::activeElementsAt(Tick tick) const {
    std::shared_lock lock(m_mutex);
    return collectActive(m_state.tracks, tick);
}

std::shared_ptr<const TimelineSnapshot> Timeline::snapshot() const {
    std::shared_lock lock(m_mutex);
    auto snap = std::make_shared<TimelineSnapshot>();
    snap->tracks = m_state.tracks;
    snap->captionTracks = m_state.captionTracks;
    snap->playheadTick = m_playhead;
    snap->version = m_version;
    return snap;
}

} // namespace spl::model
