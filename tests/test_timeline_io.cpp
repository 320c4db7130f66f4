/**
 * @file test_timeline_io.cpp
 * @brief Timeline document JSON format
 */

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <splice/model/io/timeline_io.hpp>
#include <splice/model/media_asset_registry.hpp>

using namespace spl;
using namespace spl::model;
using json = nlohmann::json;

namespace {

constexpr Tick kSec = kTicksPerSecond;

} // anonymous namespace

TEST_CASE("A saved timeline loads back unchanged", "[io]") {
    auto decoder = std::make_shared<test::FakeDecoder>();
    decoder->setInfo("/media/interview.mp4", test::videoInfo(60 * kSec));
    MediaAssetRegistry registry(decoder);
    UUID asset = registry.registerAsset("/media/interview.mp4").value();

    Timeline timeline;
    timeline.attachRegistry(&registry);
    UUID video = test::addVideoTrack(timeline, "Main");

    auto clip = test::makeElement(kSec, 10 * kSec, "interview");
    clip.source = SourceRef::asset(asset);
    clip.trimInTicks = 5 * kSec;
    clip.trimOutTicks = 45 * kSec;
    REQUIRE(timeline.addElement(video, clip));
    REQUIRE(timeline.addElement(video, test::makeElement(20 * kSec, 2 * kSec, "title")));

    CaptionTrack captions;
    captions.id = UUID::generate();
    captions.language = "en";
    captions.cues.push_back({UUID::generate(), kSec, 2 * kSec, "Hello"});
    captions.cues.push_back({UUID::generate(), 2 * kSec, 3 * kSec, "World\nagain"});
    REQUIRE(timeline.addTrack(Track::make(TrackKind::Caption, "Captions"), std::nullopt, captions));
    REQUIRE(timeline.setTrackEnabled(video, false));
    timeline.setPlayhead(7 * kSec);

    auto document = TimelineDocument::capture(timeline, &registry);
    REQUIRE(document.assets.size() == 1);
    REQUIRE(document.assets[0].id == asset);
    REQUIRE(document.assets[0].descriptor == "/media/interview.mp4");

    auto text = TimelineIO::toString(document);
    auto loaded = TimelineIO::fromString(text);
    REQUIRE(loaded);

    Timeline restored;
    restored.attachRegistry(&registry);
    REQUIRE(loaded.value().applyTo(restored));
    REQUIRE(restored.snapshot()->sameContent(*timeline.snapshot()));
    REQUIRE(restored.playhead() == 7 * kSec);
}

TEST_CASE("Documents from a newer format are refused", "[io]") {
    json root = {{"formatVersion", TimelineIO::kFormatVersion + 1}, {"tracks", json::array()}};
    auto result = TimelineIO::fromJson(root);
    REQUIRE(result.error().code() == ErrorCode::NotSupported);
}

TEST_CASE("Malformed documents", "[io]") {
    SECTION("not JSON") {
        REQUIRE(TimelineIO::fromString("{ tracks: ").error().code() == ErrorCode::ParseError);
    }

    SECTION("not an object") {
        REQUIRE(TimelineIO::fromString("[1, 2]").error().code() == ErrorCode::InvalidData);
    }

    SECTION("missing element fields") {
        json root = {
            {"formatVersion", 1},
            {"tracks", {{
                {"id", UUID::generate().toString()},
                {"kind", "video"},
                {"elements", {{{"id", UUID::generate().toString()}}}}
            }}}
        };
        REQUIRE(TimelineIO::fromJson(root).error().code() == ErrorCode::InvalidData);
    }

    SECTION("bad ids and kinds") {
        json badId = {{"tracks", {{{"id", "not-a-uuid"}, {"kind", "video"}}}}};
        REQUIRE(TimelineIO::fromJson(badId).error().code() == ErrorCode::InvalidData);

        json badKind = {{"tracks", {{{"id", UUID::generate().toString()}, {"kind", "hologram"}}}}};
        REQUIRE(TimelineIO::fromJson(badKind).error().code() == ErrorCode::InvalidData);
    }
}

TEST_CASE("Loading validates placement", "[io]") {
    auto track = Track::make(TrackKind::Video, "V");
    track.elements.push_back(test::makeElement(0, 100));
    track.elements.push_back(test::makeElement(50, 100));

    TimelineDocument document;
    document.tracks.push_back(track);

    auto loaded = TimelineIO::fromString(TimelineIO::toString(document));
    REQUIRE(loaded);

    Timeline timeline;
    REQUIRE(loaded.value().applyTo(timeline).error().code() == ErrorCode::OverlapError);
    REQUIRE(timeline.trackCount() == 0);
}

TEST_CASE("Asset ids are remapped after reloading media", "[io]") {
    UUID savedId = UUID::generate();
    UUID freshId = UUID::generate();

    auto track = Track::make(TrackKind::Video, "V");
    auto element = test::makeElement(0, kSec);
    element.source = SourceRef::asset(savedId);
    track.elements.push_back(element);

    TimelineDocument document;
    document.assets.push_back({savedId, "clip.mp4"});
    document.tracks.push_back(track);

    TimelineIO::remapAssets(document, {{savedId, freshId}});
    REQUIRE(document.assets[0].id == freshId);
    REQUIRE(document.tracks[0].elements[0].source.id == freshId);
}
