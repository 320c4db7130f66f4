/**
 * @file edit_command.cpp
 * @brief Command application and inverse construction
 */

#include <splice/model/commands/edit_command.hpp>

namespace spl::model {

namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

template<typename Record, typename Build>
Result<AppliedCommand> finish(Result<Record> record, Build&& build) {
    if (!record) {
        return Err<AppliedCommand>(record.error());
    }
    return build(record.value());
}

} // anonymous namespace

Result<AppliedCommand> applyCommand(Timeline& timeline, const EditCommand& command) {
    return std::visit(Overloaded{
        [&](const cmd::AddElement& c) {
            return finish(timeline.addElement(c.trackId, c.element),
                [&](const ElementAdded& r) -> Result<AppliedCommand> {
                    return AppliedCommand{cmd::AddElement{c.trackId, r.element},
                                          cmd::RemoveElement{r.element.id}};
                });
        },
        [&](const cmd::RemoveElement& c) {
            return finish(timeline.removeElement(c.elementId),
                [&](const ElementRemoved& r) -> Result<AppliedCommand> {
                    return AppliedCommand{c, cmd::AddElement{r.element.trackId, r.element}};
                });
        },
        [&](const cmd::MoveElement& c) {
            return finish(timeline.moveElement(c.elementId, c.newStartTick, c.targetTrackId),
                [&](const ElementMoved& r) -> Result<AppliedCommand> {
                    cmd::MoveElement inverse{r.elementId, r.oldStartTick, std::nullopt};
                    if (r.oldTrackId != r.newTrackId) {
                        inverse.targetTrackId = r.oldTrackId;
                    }
                    return AppliedCommand{c, inverse};
                });
        },
        [&](const cmd::TrimElement& c) {
            return finish(timeline.trimElement(c.elementId, c.trimInTicks, c.trimOutTicks),
                [&](const ElementTrimmed& r) -> Result<AppliedCommand> {
                    return AppliedCommand{c, cmd::TrimElement{r.elementId, r.oldTrimIn, r.oldTrimOut}};
                });
        },
        [&](const cmd::SplitElement& c) {
            std::optional<UUID> rightId;
            if (!c.rightId.isNull()) rightId = c.rightId;

            auto split = timeline.splitElement(c.elementId, c.atTick, rightId, c.rightName);
            if (!split) {
                return Err<AppliedCommand>(split.error());
            }
            const ElementSplit& r = split.value();
            cmd::SplitElement forward = c;
            forward.rightId = r.right.id;
            return Result<AppliedCommand>(AppliedCommand{forward,
                cmd::MergeElements{r.left.id, r.right.id}});
        },
        [&](const cmd::MergeElements& c) {
            return finish(timeline.mergeElements(c.leftId, c.rightId),
                [&](const ElementsMerged& r) -> Result<AppliedCommand> {
                    cmd::SplitElement inverse{r.merged.id, r.right.startTick, r.right.id, r.right.name};
                    return AppliedCommand{c, inverse};
                });
        },
        [&](const cmd::AddTrack& c) {
            return finish(timeline.addTrack(c.track, c.index, c.captionTrack),
                [&](const TrackAdded& r) -> Result<AppliedCommand> {
                    return AppliedCommand{cmd::AddTrack{r.track, r.index, r.captionTrack},
                                          cmd::RemoveTrack{r.track.id}};
                });
        },
        [&](const cmd::RemoveTrack& c) {
            return finish(timeline.removeTrack(c.trackId),
                [&](const TrackRemoved& r) -> Result<AppliedCommand> {
                    return AppliedCommand{c, cmd::AddTrack{r.track, r.index, r.captionTrack}};
                });
        },
        [&](const cmd::ReorderTracks& c) {
            return finish(timeline.reorderTracks(c.order),
                [&](const TracksReordered& r) -> Result<AppliedCommand> {
                    return AppliedCommand{c, cmd::ReorderTracks{r.oldOrder}};
                });
        },
        [&](const cmd::SetTrackEnabled& c) {
            return finish(timeline.setTrackEnabled(c.trackId, c.enabled),
                [&](const TrackEnabledChanged& r) -> Result<AppliedCommand> {
                    return AppliedCommand{c, cmd::SetTrackEnabled{r.trackId, r.oldEnabled}};
                });
        },
    }, command);
}

std::string describeCommand(const EditCommand& command) {
    return std::visit(Overloaded{
        [](const cmd::AddElement&) { return std::string("Add Element"); },
        [](const cmd::RemoveElement&) { return std::string("Remove Element"); },
        [](const cmd::MoveElement&) { return std::string("Move Element"); },
        [](const cmd::TrimElement&) { return std::string("Trim Element"); },
        [](const cmd::SplitElement&) { return std::string("Split Element"); },
        [](const cmd::MergeElements&) { return std::string("Merge Elements"); },
        [](const cmd::AddTrack& c) {
            return c.track.kind == TrackKind::Caption ? std::string("Add Captions")
                                                      : std::string("Add Track");
        },
        [](const cmd::RemoveTrack&) { return std::string("Remove Track"); },
        [](const cmd::ReorderTracks&) { return std::string("Reorder Tracks"); },
        [](const cmd::SetTrackEnabled& c) {
            return c.enabled ? std::string("Enable Track") : std::string("Disable Track");
        },
    }, command);
}

Result<std::vector<EditCommand>> buildRippleDelete(const Timeline& timeline, const UUID& elementId) {
    auto element = timeline.element(elementId);
    if (!element) {
        return Err<std::vector<EditCommand>>(ErrorCode::NotFound, "Unknown element " + elementId.toString());
    }
    auto track = timeline.track(element->trackId);
    if (!track) {
        return Err<std::vector<EditCommand>>(ErrorCode::NotFound, "Element has no track");
    }

    std::vector<EditCommand> commands;
    commands.push_back(cmd::RemoveElement{elementId});

    // Elements are sorted, so shifting in ascending order never collides
    const TickDuration shift = element->durationTicks;
    for (const auto& later : track->elements) {
        if (later.startTick < element->endTick()) continue;
        commands.push_back(cmd::MoveElement{later.id, later.startTick - shift, std::nullopt});
    }
    return commands;
}

} // namespace spl::model
