/**
 * @file element.hpp
 * @brief A placed, trimmed reference to a media asset or caption cue
 */

#pragma once

#include <splice/core/types.hpp>
#include <splice/core/uuid.hpp>

#include <string>

namespace spl::model {

enum class SourceKind : uint8_t {
    None,         ///< Generated content (text, colour)
    Asset,        ///< MediaAsset id
    CaptionCue,   ///< Caption id inside the track's CaptionTrack
};

inline const char* sourceKindToString(SourceKind kind) {
    switch (kind) {
        case SourceKind::None: return "none";
        case SourceKind::Asset: return "asset";
        case SourceKind::CaptionCue: return "caption";
        default: return "unknown";
    }
}

/**
 * @brief Non-owning reference to what an element shows
 */
struct SourceRef {
    SourceKind kind = SourceKind::None;
    UUID id;

    static SourceRef asset(const UUID& assetId) { return {SourceKind::Asset, assetId}; }
    static SourceRef cue(const UUID& cueId) { return {SourceKind::CaptionCue, cueId}; }

    bool operator==(const SourceRef&) const = default;
};

/**
 * @brief Element on a track
 *
 * Covers [startTick, startTick + durationTicks) on the timeline and
 * [trimInTicks, trimInTicks + durationTicks) of its source. trimOutTicks
 * is what was cut from the tail, so the original source extent is
 * trimIn + duration + trimOut; trimming and splitting preserve it.
 */
struct Element {
    UUID id;
    UUID trackId;
    std::string name;
    Tick startTick = 0;
    TickDuration durationTicks = 0;
    SourceRef source;
    Tick trimInTicks = 0;
    Tick trimOutTicks = 0;

    [[nodiscard]] Tick endTick() const { return startTick + durationTicks; }

    [[nodiscard]] TickDuration sourceExtent() const {
        return trimInTicks + durationTicks + trimOutTicks;
    }

    /// True if the element is visible at the given timeline tick
    [[nodiscard]] bool covers(Tick tick) const {
        return tick >= startTick && tick < endTick();
    }

    /// True if [start, end) intersects the element
    [[nodiscard]] bool overlaps(Tick start, Tick end) const {
        return start < endTick() && startTick < end;
    }

    /// Timeline tick -> source tick
    [[nodiscard]] Tick sourceTickAt(Tick tick) const {
        return trimInTicks + (tick - startTick);
    }

    bool operator==(const Element&) const = default;
};

} // namespace spl::model
