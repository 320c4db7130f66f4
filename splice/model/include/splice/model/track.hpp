/**
 * @file track.hpp
 * @brief Track containing a sequence of elements
 *
 * Tracks are horizontal lanes in the timeline. Video tracks stack from
 * bottom to top, audio tracks are mixed, caption tracks overlay text.
 */

#pragma once

#include <splice/model/element.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace spl::model {

enum class TrackKind : uint8_t {
    Video,
    Audio,
    Caption,
};

inline const char* trackKindToString(TrackKind kind) {
    switch (kind) {
        case TrackKind::Video: return "video";
        case TrackKind::Audio: return "audio";
        case TrackKind::Caption: return "caption";
        default: return "unknown";
    }
}

/**
 * @brief A track containing elements
 *
 * Elements on a track cannot overlap. The track keeps its elements
 * sorted by startTick.
 */
struct Track {
    UUID id;
    std::string name;
    TrackKind kind = TrackKind::Video;
    bool enabled = true;
    std::optional<UUID> captionTrackId;   ///< Set for TrackKind::Caption
    std::vector<Element> elements;

    static Track make(TrackKind kind, std::string name = {}) {
        Track track;
        track.id = UUID::generate();
        track.kind = kind;
        track.name = std::move(name);
        return track;
    }

    [[nodiscard]] const Element* findElement(const UUID& elementId) const {
        auto it = std::find_if(elements.begin(), elements.end(),
            [&](const Element& e) { return e.id == elementId; });
        return it != elements.end() ? &*it : nullptr;
    }

    [[nodiscard]] Element* findElement(const UUID& elementId) {
        auto it = std::find_if(elements.begin(), elements.end(),
            [&](const Element& e) { return e.id == elementId; });
        return it != elements.end() ? &*it : nullptr;
    }

    /**
     * @brief Check whether [start, end) would overlap an element
     * @param ignoreA, ignoreB elements excluded from the check (the ones being edited)
     */
    [[nodiscard]] bool hasOverlap(Tick start, Tick end,
                                  const UUID& ignoreA = UUID(),
                                  const UUID& ignoreB = UUID()) const {
        for (const auto& e : elements) {
            if (e.id == ignoreA || e.id == ignoreB) continue;
            if (e.overlaps(start, end)) return true;
        }
        return false;
    }

    /// Element covering the given tick, if any
    [[nodiscard]] const Element* elementAt(Tick tick) const {
        auto it = std::upper_bound(elements.begin(), elements.end(), tick,
            [](Tick t, const Element& e) { return t < e.startTick; });
        if (it == elements.begin()) return nullptr;
        --it;
        return it->covers(tick) ? &*it : nullptr;
    }

    void insertSorted(Element element) {
        auto it = std::upper_bound(elements.begin(), elements.end(), element.startTick,
            [](Tick t, const Element& e) { return t < e.startTick; });
        elements.insert(it, std::move(element));
    }

    bool erase(const UUID& elementId) {
        auto it = std::find_if(elements.begin(), elements.end(),
            [&](const Element& e) { return e.id == elementId; });
        if (it == elements.end()) return false;
        elements.erase(it);
        return true;
    }

    [[nodiscard]] Tick endTick() const {
        return elements.empty() ? 0 : elements.back().endTick();
    }

    bool operator==(const Track&) const = default;
};

} // namespace spl::model
