/**
 * @file caption_track.hpp
 * @brief Timed caption cues
 */

#pragma once

#include <splice/core/types.hpp>
#include <splice/core/uuid.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace spl::model {

/// A single timed caption line
struct Caption {
    UUID id;
    Tick startTick = 0;
    Tick endTick = 0;
    std::string text;

    [[nodiscard]] TickDuration duration() const { return endTick - startTick; }

    bool operator==(const Caption&) const = default;
};

/**
 * @brief Ordered, non-overlapping caption cues
 *
 * Referenced by exactly one Timeline track of kind Caption.
 */
struct CaptionTrack {
    UUID id;
    std::string language;
    std::vector<Caption> cues;

    [[nodiscard]] const Caption* findCue(const UUID& cueId) const {
        auto it = std::find_if(cues.begin(), cues.end(),
            [&](const Caption& c) { return c.id == cueId; });
        return it != cues.end() ? &*it : nullptr;
    }

    /// True if cues are sorted, non-empty in time and do not overlap
    [[nodiscard]] bool isWellFormed() const {
        for (size_t i = 0; i < cues.size(); ++i) {
            if (cues[i].endTick <= cues[i].startTick) return false;
            if (i > 0 && cues[i].startTick < cues[i - 1].endTick) return false;
        }
        return true;
    }

    bool operator==(const CaptionTrack&) const = default;
};

} // namespace spl::model
