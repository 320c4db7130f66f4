/**
 * @file edit_command.hpp
 * @brief Reversible timeline edits as a tagged variant
 *
 * Each command is plain data. applyCommand() runs it against a Timeline
 * and returns the command that undoes it, built from the change record
 * the timeline reports.
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/model/timeline.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace spl::model {

namespace cmd {

struct AddElement {
    UUID trackId;
    Element element;
};

struct RemoveElement {
    UUID elementId;
};

struct MoveElement {
    UUID elementId;
    Tick newStartTick = 0;
    std::optional<UUID> targetTrackId;
};

struct TrimElement {
    UUID elementId;
    Tick trimInTicks = 0;
    Tick trimOutTicks = 0;
};

struct SplitElement {
    UUID elementId;
    Tick atTick = 0;
    UUID rightId;                           ///< Null = generate on first apply
    std::optional<std::string> rightName;   ///< Defaults to the original name
};

struct MergeElements {
    UUID leftId;
    UUID rightId;
};

struct AddTrack {
    Track track;
    std::optional<size_t> index;            ///< nullopt appends
    std::optional<CaptionTrack> captionTrack;
};

struct RemoveTrack {
    UUID trackId;
};

struct ReorderTracks {
    std::vector<UUID> order;
};

struct SetTrackEnabled {
    UUID trackId;
    bool enabled = true;
};

} // namespace cmd

using EditCommand = std::variant<
    cmd::AddElement,
    cmd::RemoveElement,
    cmd::MoveElement,
    cmd::TrimElement,
    cmd::SplitElement,
    cmd::MergeElements,
    cmd::AddTrack,
    cmd::RemoveTrack,
    cmd::ReorderTracks,
    cmd::SetTrackEnabled>;

/**
 * @brief Outcome of applying a command
 *
 * forward is the command with every generated id filled in, so
 * re-applying it (redo) reproduces the exact same state.
 */
struct AppliedCommand {
    EditCommand forward;
    EditCommand inverse;
};

/// Apply a command; on failure the timeline is unchanged
Result<AppliedCommand> applyCommand(Timeline& timeline, const EditCommand& command);

/// Human readable label ("Move Element", "Add Track", ...)
std::string describeCommand(const EditCommand& command);

/**
 * @brief Commands for a ripple delete
 *
 * Removes the element and shifts every later element on the same track
 * left by the removed duration. Run the result as one history batch.
 */
Result<std::vector<EditCommand>> buildRippleDelete(const Timeline& timeline, const UUID& elementId);

} // namespace spl::model
