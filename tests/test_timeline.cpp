/**
 * @file test_timeline.cpp
 * @brief Timeline placement rules, edits and snapshots
 */

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <splice/model/media_asset_registry.hpp>
#include <splice/model/timeline.hpp>

using namespace spl;
using namespace spl::model;
using spl::test::makeElement;

namespace {

constexpr Tick kSec = kTicksPerSecond;

} // anonymous namespace

TEST_CASE("Overlapping elements are rejected", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);

    REQUIRE(timeline.addElement(track, makeElement(0, 100, "A")));
    const auto version = timeline.version();

    auto overlapping = timeline.addElement(track, makeElement(50, 100, "B"));
    REQUIRE_FALSE(overlapping);
    REQUIRE(overlapping.error().code() == ErrorCode::OverlapError);
    REQUIRE(timeline.version() == version);
    REQUIRE(timeline.track(track)->elements.size() == 1);

    // Touching end to start is not an overlap
    REQUIRE(timeline.addElement(track, makeElement(100, 50, "B")));
    REQUIRE(timeline.track(track)->elements.size() == 2);
}

TEST_CASE("Element placement is validated", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);

    SECTION("unknown track") {
        auto result = timeline.addElement(UUID::generate(), makeElement(0, 10));
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("non-positive duration") {
        REQUIRE(timeline.addElement(track, makeElement(0, 0)).error().code() == ErrorCode::InvalidRange);
    }

    SECTION("negative start") {
        REQUIRE(timeline.addElement(track, makeElement(-5, 10)).error().code() == ErrorCode::InvalidRange);
    }

    SECTION("duplicate id") {
        auto element = makeElement(0, 10);
        REQUIRE(timeline.addElement(track, element));
        element.startTick = 20;
        REQUIRE(timeline.addElement(track, element).error().code() == ErrorCode::DuplicateId);
    }

    SECTION("generated element on an audio track") {
        auto audio = timeline.addTrack(Track::make(TrackKind::Audio, "A1")).value().track.id;
        auto result = timeline.addElement(audio, makeElement(0, 10));
        REQUIRE(result.error().code() == ErrorCode::IncompatibleTrack);
    }
}

TEST_CASE("Elements are kept sorted by start", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);

    REQUIRE(timeline.addElement(track, makeElement(200, 50, "C")));
    REQUIRE(timeline.addElement(track, makeElement(0, 50, "A")));
    REQUIRE(timeline.addElement(track, makeElement(100, 50, "B")));

    auto elements = timeline.track(track)->elements;
    REQUIRE(elements.size() == 3);
    REQUIRE(elements[0].name == "A");
    REQUIRE(elements[1].name == "B");
    REQUIRE(elements[2].name == "C");
    REQUIRE(timeline.endTick() == 250);
}

TEST_CASE("Split and merge preserve the source extent", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);

    auto element = makeElement(1000, 100, "clip");
    element.trimInTicks = 10;
    element.trimOutTicks = 5;
    REQUIRE(timeline.addElement(track, element));

    SECTION("split point must be strictly inside") {
        REQUIRE(timeline.splitElement(element.id, 1000).error().code() == ErrorCode::InvalidRange);
        REQUIRE(timeline.splitElement(element.id, 1100).error().code() == ErrorCode::InvalidRange);
    }

    SECTION("split then merge") {
        auto split = timeline.splitElement(element.id, 1040);
        REQUIRE(split);

        const Element& left = split.value().left;
        const Element& right = split.value().right;
        REQUIRE(left.id == element.id);
        REQUIRE(left.startTick == 1000);
        REQUIRE(left.durationTicks == 40);
        REQUIRE(left.trimInTicks == 10);
        REQUIRE(left.trimOutTicks == 65);
        REQUIRE(right.startTick == 1040);
        REQUIRE(right.durationTicks == 60);
        REQUIRE(right.trimInTicks == 50);
        REQUIRE(right.trimOutTicks == 5);
        REQUIRE(left.sourceExtent() == element.sourceExtent());
        REQUIRE(right.sourceExtent() == element.sourceExtent());
        REQUIRE(timeline.track(track)->elements.size() == 2);

        auto merged = timeline.mergeElements(left.id, right.id);
        REQUIRE(merged);
        REQUIRE(merged.value().merged == *timeline.element(element.id));
        REQUIRE(*timeline.element(element.id) == element);
        REQUIRE_FALSE(timeline.element(right.id));
    }

    SECTION("split keeps a requested right id") {
        UUID rightId = UUID::generate();
        auto split = timeline.splitElement(element.id, 1050, rightId, std::string("tail"));
        REQUIRE(split);
        REQUIRE(timeline.element(rightId)->name == "tail");
    }
}

TEST_CASE("Merging needs adjacent, contiguous halves", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);

    auto a = makeElement(0, 50);
    auto b = makeElement(60, 50);
    REQUIRE(timeline.addElement(track, a));
    REQUIRE(timeline.addElement(track, b));

    REQUIRE(timeline.mergeElements(a.id, b.id).error().code() == ErrorCode::InvalidRange);
    REQUIRE(timeline.mergeElements(a.id, UUID::generate()).error().code() == ErrorCode::NotFound);
}

TEST_CASE("Trim keeps the start and the source extent", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);

    auto element = makeElement(0, 100);
    auto neighbour = makeElement(100, 50);
    REQUIRE(timeline.addElement(track, element));
    REQUIRE(timeline.addElement(track, neighbour));

    auto trimmed = timeline.trimElement(element.id, 20, 30);
    REQUIRE(trimmed);
    auto current = *timeline.element(element.id);
    REQUIRE(current.startTick == 0);
    REQUIRE(current.durationTicks == 50);
    REQUIRE(current.sourceExtent() == 100);
    REQUIRE(trimmed.value().oldDuration == 100);

    SECTION("trimming away everything fails") {
        REQUIRE(timeline.trimElement(element.id, 60, 40).error().code() == ErrorCode::InvalidRange);
        REQUIRE(timeline.trimElement(element.id, -1, 0).error().code() == ErrorCode::InvalidRange);
    }

    SECTION("growing into the neighbour fails") {
        REQUIRE(timeline.moveElement(neighbour.id, 60));
        auto result = timeline.trimElement(element.id, 20, 0);
        REQUIRE(result.error().code() == ErrorCode::OverlapError);
        REQUIRE(timeline.element(element.id)->durationTicks == 50);
    }

    SECTION("untrimming back to the full extent") {
        REQUIRE(timeline.trimElement(element.id, 0, 0));
        REQUIRE(timeline.element(element.id)->endTick() == 100);
    }
}

TEST_CASE("Moving elements between tracks", "[timeline]") {
    Timeline timeline;
    UUID v1 = test::addVideoTrack(timeline, "V1");
    UUID v2 = test::addVideoTrack(timeline, "V2");

    auto element = makeElement(0, 100);
    auto blocker = makeElement(500, 100);
    REQUIRE(timeline.addElement(v1, element));
    REQUIRE(timeline.addElement(v2, blocker));

    auto moved = timeline.moveElement(element.id, 200, v2);
    REQUIRE(moved);
    REQUIRE(moved.value().oldTrackId == v1);
    REQUIRE(moved.value().newTrackId == v2);
    REQUIRE(timeline.track(v1)->elements.empty());
    REQUIRE(timeline.element(element.id)->trackId == v2);
    REQUIRE(timeline.element(element.id)->startTick == 200);

    SECTION("a rejected move leaves the element in place") {
        auto result = timeline.moveElement(element.id, 450);
        REQUIRE(result.error().code() == ErrorCode::OverlapError);
        REQUIRE(timeline.element(element.id)->startTick == 200);
    }

    SECTION("unknown target track") {
        REQUIRE(timeline.moveElement(element.id, 0, UUID::generate()).error().code() == ErrorCode::NotFound);
    }

    SECTION("incompatible target track") {
        auto audio = timeline.addTrack(Track::make(TrackKind::Audio)).value().track.id;
        auto result = timeline.moveElement(element.id, 0, audio);
        REQUIRE(result.error().code() == ErrorCode::IncompatibleTrack);
        REQUIRE(timeline.element(element.id)->trackId == v2);
    }
}

TEST_CASE("Track reordering must be a permutation", "[timeline]") {
    Timeline timeline;
    UUID a = test::addVideoTrack(timeline, "A");
    UUID b = test::addVideoTrack(timeline, "B");
    UUID c = test::addVideoTrack(timeline, "C");

    REQUIRE(timeline.reorderTracks({a, b}).error().code() == ErrorCode::InvalidOrder);
    REQUIRE(timeline.reorderTracks({a, a, b}).error().code() == ErrorCode::InvalidOrder);
    REQUIRE(timeline.reorderTracks({a, b, UUID::generate()}).error().code() == ErrorCode::InvalidOrder);

    auto reordered = timeline.reorderTracks({c, a, b});
    REQUIRE(reordered);
    REQUIRE(reordered.value().oldOrder == std::vector<UUID>{a, b, c});
    REQUIRE(timeline.trackOrder() == std::vector<UUID>{c, a, b});
}

TEST_CASE("Tracks insert at an index and remove with their captions", "[timeline]") {
    Timeline timeline;
    UUID a = test::addVideoTrack(timeline, "A");
    UUID b = test::addVideoTrack(timeline, "B");

    auto inserted = timeline.addTrack(Track::make(TrackKind::Video, "Middle"), size_t{1});
    REQUIRE(inserted);
    REQUIRE(timeline.trackOrder() == std::vector<UUID>{a, inserted.value().track.id, b});
    REQUIRE(timeline.addTrack(Track::make(TrackKind::Video), size_t{9}).error().code() == ErrorCode::InvalidRange);

    CaptionTrack captions;
    captions.id = UUID::generate();
    captions.language = "en";
    captions.cues.push_back({UUID::generate(), 0, kSec, "Hello"});

    REQUIRE(timeline.addTrack(Track::make(TrackKind::Caption)).error().code() == ErrorCode::InvalidArgument);

    auto captionTrack = timeline.addTrack(Track::make(TrackKind::Caption, "Captions"), std::nullopt, captions);
    REQUIRE(captionTrack);
    REQUIRE(captionTrack.value().track.captionTrackId == captions.id);
    REQUIRE(timeline.captionTrack(captions.id));

    auto removed = timeline.removeTrack(captionTrack.value().track.id);
    REQUIRE(removed);
    REQUIRE(removed.value().captionTrack == captions);
    REQUIRE_FALSE(timeline.captionTrack(captions.id));
    REQUIRE(timeline.removeTrack(captionTrack.value().track.id).error().code() == ErrorCode::NotFound);
}

TEST_CASE("Caption cues only go on caption tracks", "[timeline][captions]") {
    Timeline timeline;
    UUID video = test::addVideoTrack(timeline);

    CaptionTrack captions;
    captions.id = UUID::generate();
    Caption cue{UUID::generate(), 0, kSec, "Hi"};
    captions.cues.push_back(cue);
    UUID captionTrack = timeline.addTrack(Track::make(TrackKind::Caption), std::nullopt, captions)
                            .value().track.id;

    auto element = makeElement(0, kSec);
    element.source = SourceRef::cue(cue.id);

    REQUIRE(timeline.addElement(video, element).error().code() == ErrorCode::IncompatibleTrack);
    REQUIRE(timeline.addElement(captionTrack, element));

    auto unknownCue = makeElement(2 * kSec, kSec);
    unknownCue.source = SourceRef::cue(UUID::generate());
    REQUIRE(timeline.addElement(captionTrack, unknownCue).error().code() == ErrorCode::NotFound);
}

TEST_CASE("Selection tracks existing elements", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);
    auto element = makeElement(0, 10);
    REQUIRE(timeline.addElement(track, element));

    std::vector<std::set<UUID>> notifications;
    auto conn = timeline.selectionChanged.connectScoped([&](const std::set<UUID>& selection) {
        notifications.push_back(selection);
    });

    REQUIRE(timeline.setSelection({UUID::generate()}).error().code() == ErrorCode::NotFound);
    REQUIRE(notifications.empty());

    REQUIRE(timeline.setSelection({element.id}));
    REQUIRE(timeline.selection() == std::set<UUID>{element.id});

    REQUIRE(timeline.removeElement(element.id));
    REQUIRE(timeline.selection().empty());
    REQUIRE(notifications.size() == 2);
    REQUIRE(notifications.back().empty());
}

TEST_CASE("Playhead is clamped at zero", "[timeline]") {
    Timeline timeline;
    std::vector<Tick> seen;
    auto conn = timeline.playheadChanged.connectScoped([&](Tick t) { seen.push_back(t); });

    timeline.setPlayhead(5 * kSec);
    timeline.setPlayhead(-10);
    REQUIRE(timeline.playhead() == 0);
    REQUIRE(seen == std::vector<Tick>{5 * kSec, 0});
}

TEST_CASE("Active elements at a tick", "[timeline]") {
    Timeline timeline;
    UUID bottom = test::addVideoTrack(timeline, "bottom");
    UUID top = test::addVideoTrack(timeline, "top");

    auto a = makeElement(0, 100, "a");
    a.trimInTicks = 30;
    auto b = makeElement(50, 100, "b");
    REQUIRE(timeline.addElement(bottom, a));
    REQUIRE(timeline.addElement(top, b));

    auto active = timeline.activeElementsAt(60);
    REQUIRE(active.size() == 2);
    REQUIRE(active[0].trackId == bottom);
    REQUIRE(active[0].trackIndex == 0);
    REQUIRE(active[0].sourceTick == 90);
    REQUIRE(active[1].trackId == top);
    REQUIRE(active[1].sourceTick == 10);

    REQUIRE(timeline.activeElementsAt(100).size() == 1);
    REQUIRE(timeline.activeElementsAt(150).empty());

    REQUIRE(timeline.setTrackEnabled(top, false));
    REQUIRE(timeline.activeElementsAt(60).size() == 1);
}

TEST_CASE("Snapshots do not see later edits", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);
    auto element = makeElement(0, 100);
    REQUIRE(timeline.addElement(track, element));

    auto before = timeline.snapshot();
    REQUIRE(timeline.moveElement(element.id, 400));
    REQUIRE(timeline.addElement(track, makeElement(0, 10)));
    auto after = timeline.snapshot();

    REQUIRE(before->findTrack(track)->elements.size() == 1);
    REQUIRE(before->findTrack(track)->elements[0].startTick == 0);
    REQUIRE(before->endTick() == 100);
    REQUIRE(after->endTick() == 500);
    REQUIRE(after->version > before->version);
    REQUIRE_FALSE(after->sameContent(*before));
}

TEST_CASE("Change notifications follow successful edits only", "[timeline]") {
    Timeline timeline;
    std::vector<TimelineChange> changes;
    auto conn = timeline.changed.connectScoped([&](const TimelineChange& c) { changes.push_back(c); });

    UUID track = test::addVideoTrack(timeline);
    auto element = makeElement(0, 100);
    REQUIRE(timeline.addElement(track, element));
    REQUIRE_FALSE(timeline.addElement(track, makeElement(10, 10)));

    REQUIRE(changes.size() == 2);
    REQUIRE(changes[0].kind == ChangeKind::TrackAdded);
    REQUIRE(changes[1].kind == ChangeKind::ElementAdded);
    REQUIRE(changes[1].version == timeline.version());
}

TEST_CASE("Restore validates the whole document", "[timeline]") {
    Timeline timeline;
    UUID track = test::addVideoTrack(timeline);
    REQUIRE(timeline.addElement(track, makeElement(0, 100)));

    auto bad = Track::make(TrackKind::Video, "bad");
    bad.elements.push_back(makeElement(0, 100));
    bad.elements.push_back(makeElement(50, 100));

    auto result = timeline.restore({bad}, {});
    REQUIRE(result.error().code() == ErrorCode::OverlapError);
    REQUIRE(timeline.trackCount() == 1);
    REQUIRE(timeline.track(track));

    auto good = Track::make(TrackKind::Video, "good");
    good.elements.push_back(makeElement(200, 100));
    good.elements.push_back(makeElement(0, 100));
    REQUIRE(timeline.restore({good}, {}, 42));
    REQUIRE(timeline.trackCount() == 1);
    REQUIRE(timeline.playhead() == 42);
    REQUIRE(timeline.tracks()[0].elements[0].startTick == 0);
}

TEST_CASE("Asset elements are checked against the registry", "[timeline][assets]") {
    auto decoder = std::make_shared<test::FakeDecoder>();
    decoder->setInfo("clip.mp4", test::videoInfo(5 * kSec));
    decoder->setInfo("music.wav", test::audioInfo(60 * kSec));
    model::MediaAssetInfo still;
    still.kind = MediaAssetKind::Image;
    decoder->setInfo("logo.png", still);

    MediaAssetRegistry registry(decoder);
    UUID clip = registry.registerAsset("clip.mp4").value();
    UUID music = registry.registerAsset("music.wav").value();
    UUID logo = registry.registerAsset("logo.png").value();
    UUID loading = registry.registerAsset("slow.mov").value();

    Timeline timeline;
    timeline.attachRegistry(&registry);
    UUID video = test::addVideoTrack(timeline);
    UUID audio = timeline.addTrack(Track::make(TrackKind::Audio)).value().track.id;

    auto place = [&](const UUID& track, const UUID& asset, Tick start, TickDuration duration, Tick trimIn = 0) {
        auto element = makeElement(start, duration);
        element.source = SourceRef::asset(asset);
        element.trimInTicks = trimIn;
        return timeline.addElement(track, element);
    };

    REQUIRE(place(video, clip, 0, 5 * kSec));
    REQUIRE(place(video, clip, 10 * kSec, 4 * kSec, 2 * kSec).error().code() == ErrorCode::InvalidRange);
    REQUIRE(place(video, music, 20 * kSec, kSec).error().code() == ErrorCode::IncompatibleTrack);
    REQUIRE(place(audio, clip, 0, kSec).error().code() == ErrorCode::IncompatibleTrack);
    REQUIRE(place(audio, music, 0, 60 * kSec));
    REQUIRE(place(video, loading, 30 * kSec, kSec).error().code() == ErrorCode::AssetNotReady);
    REQUIRE(place(video, UUID::generate(), 30 * kSec, kSec).error().code() == ErrorCode::NotFound);

    // Still images have no source length
    REQUIRE(place(video, logo, 100 * kSec, 600 * kSec));
}
