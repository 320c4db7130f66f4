/**
 * @file test_media_asset_registry.cpp
 * @brief Asset registration and asynchronous load completion
 */

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <splice/model/commands/history_manager.hpp>
#include <splice/model/media_asset_registry.hpp>

#include <thread>

using namespace spl;
using namespace spl::model;

namespace {

struct Events {
    std::vector<std::string> ready;
    std::vector<std::string> failed;
    ScopedConnection readyConn;
    ScopedConnection failedConn;

    explicit Events(MediaAssetRegistry& registry) {
        readyConn = registry.assetReady.connectScoped([this](const MediaAsset& a) {
            ready.push_back(a.descriptor);
        });
        failedConn = registry.assetFailed.connectScoped([this](const MediaAsset& a) {
            failed.push_back(a.descriptor);
        });
    }
};

} // anonymous namespace

TEST_CASE("A decoder that answers immediately makes the asset ready", "[assets]") {
    auto decoder = std::make_shared<test::FakeDecoder>();
    decoder->setInfo("clip.mp4", test::videoInfo(10 * kTicksPerSecond));
    MediaAssetRegistry registry(decoder);
    Events events(registry);

    auto id = registry.registerAsset("clip.mp4");
    REQUIRE(id);
    REQUIRE(registry.isReady(id.value()));
    REQUIRE(events.ready == std::vector<std::string>{"clip.mp4"});

    auto asset = registry.get(id.value());
    REQUIRE(asset);
    REQUIRE(asset.value().descriptor == "clip.mp4");
    REQUIRE(asset.value().kind() == MediaAssetKind::Video);
    REQUIRE(asset.value().durationTicks() == 10 * kTicksPerSecond);
    REQUIRE(asset.value().info.resolution == Size{1920, 1080});
}

TEST_CASE("Synchronous decode failures are reported at registration", "[assets]") {
    auto decoder = std::make_shared<test::FakeDecoder>();
    decoder->setFailure("broken.mp4", "moov atom not found");
    MediaAssetRegistry registry(decoder);
    Events events(registry);

    auto id = registry.registerAsset("broken.mp4");
    REQUIRE_FALSE(id);
    REQUIRE(id.error().code() == ErrorCode::AssetLoadError);
    REQUIRE(events.failed == std::vector<std::string>{"broken.mp4"});

    // The failed asset stays listed
    REQUIRE(registry.count() == 1);
    REQUIRE(registry.assets()[0].loadState == AssetLoadState::Failed);
    REQUIRE_FALSE(registry.assets()[0].errorMessage.empty());
}

TEST_CASE("Empty descriptors are rejected", "[assets]") {
    MediaAssetRegistry registry(std::make_shared<test::FakeDecoder>());
    REQUIRE(registry.registerAsset("").error().code() == ErrorCode::AssetLoadError);
    REQUIRE(registry.count() == 0);
}

TEST_CASE("Pending loads resolve through poll", "[assets]") {
    auto decoder = std::make_shared<test::FakeDecoder>();
    MediaAssetRegistry registry(decoder);
    Events events(registry);

    UUID good = registry.registerAsset("good.mov").value();
    UUID bad = registry.registerAsset("bad.mov").value();

    REQUIRE(registry.state(good) == AssetLoadState::Loading);
    REQUIRE(registry.get(good).error().code() == ErrorCode::NotFound);
    REQUIRE(registry.poll() == 0);

    decoder->complete("good.mov", test::videoInfo(kTicksPerSecond));
    REQUIRE(registry.poll() == 1);
    REQUIRE(registry.isReady(good));
    REQUIRE(events.ready == std::vector<std::string>{"good.mov"});

    decoder->complete("bad.mov", Error(ErrorCode::DecoderError, "unsupported codec"));
    REQUIRE(registry.poll() == 1);
    REQUIRE(registry.state(bad) == AssetLoadState::Failed);
    REQUIRE(events.failed == std::vector<std::string>{"bad.mov"});

    // Resolved assets are not announced twice
    REQUIRE(registry.poll() == 0);
    REQUIRE(events.ready.size() == 1);
}

TEST_CASE("Waiting for an asset", "[assets]") {
    auto decoder = std::make_shared<test::FakeDecoder>();
    MediaAssetRegistry registry(decoder);

    UUID id = registry.registerAsset("remote.mp4").value();

    SECTION("times out while loading") {
        auto result = registry.waitFor(id, std::chrono::milliseconds(10));
        REQUIRE(result.error().code() == ErrorCode::Timeout);
        REQUIRE(registry.state(id) == AssetLoadState::Loading);
    }

    SECTION("returns once the decoder finishes on another thread") {
        std::thread worker([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            decoder->complete("remote.mp4", test::audioInfo(3 * kTicksPerSecond));
        });
        auto result = registry.waitFor(id, std::chrono::seconds(5));
        worker.join();
        REQUIRE(result);
        REQUIRE(result.value().kind() == MediaAssetKind::Audio);
    }

    SECTION("reports a failed load") {
        decoder->complete("remote.mp4", Error(ErrorCode::DecoderError, "truncated"));
        auto result = registry.waitFor(id, std::chrono::seconds(1));
        REQUIRE(result.error().code() == ErrorCode::AssetLoadError);
    }

    SECTION("unknown ids") {
        REQUIRE(registry.waitFor(UUID::generate(), std::chrono::milliseconds(1)).error().code()
                == ErrorCode::NotFound);
    }
}

TEST_CASE("Removing an asset", "[assets]") {
    auto decoder = std::make_shared<test::FakeDecoder>();
    decoder->setInfo("a.png", test::videoInfo(0));
    MediaAssetRegistry registry(decoder);

    UUID id = registry.registerAsset("a.png").value();
    REQUIRE(registry.count() == 1);
    REQUIRE(registry.remove(id));
    REQUIRE_FALSE(registry.remove(id));
    REQUIRE_FALSE(registry.remove(UUID::generate()));

    REQUIRE(registry.isRemoved(id));
    REQUIRE(registry.count() == 0);
    REQUIRE(registry.assets().empty());

    // Still resolvable for anything that references it
    REQUIRE(registry.find(id));
    REQUIRE(registry.isReady(id));
    REQUIRE(registry.get(id).value().descriptor == "a.png");
}

TEST_CASE("Removing an asset keeps its elements undoable", "[assets][history]") {
    auto decoder = std::make_shared<test::FakeDecoder>();
    decoder->setInfo("clip.mp4", test::videoInfo(10 * kTicksPerSecond));
    MediaAssetRegistry registry(decoder);
    UUID asset = registry.registerAsset("clip.mp4").value();

    Timeline timeline;
    timeline.attachRegistry(&registry);
    HistoryManager history(timeline);

    auto track = Track::make(TrackKind::Video, "V1");
    REQUIRE(history.execute(cmd::AddTrack{track, std::nullopt, std::nullopt}));

    auto element = test::makeElement(0, 4 * kTicksPerSecond, "clip");
    element.source = SourceRef::asset(asset);
    REQUIRE(history.execute(cmd::AddElement{track.id, element}));
    REQUIRE(history.execute(cmd::RemoveElement{element.id}));

    REQUIRE(registry.remove(asset));
    REQUIRE(registry.assets().empty());

    // Bringing the element back revalidates it against the registry
    REQUIRE(history.undo());
    REQUIRE(timeline.element(element.id));
    REQUIRE(timeline.element(element.id)->source == SourceRef::asset(asset));

    REQUIRE(history.execute(cmd::MoveElement{element.id, kTicksPerSecond, std::nullopt}));
    REQUIRE(history.execute(cmd::TrimElement{element.id, kTicksPerSecond, 0}));
    REQUIRE(timeline.element(element.id)->durationTicks == 3 * kTicksPerSecond);

    while (history.undo()) {}
    REQUIRE(timeline.trackCount() == 0);
    while (history.redo()) {}
    REQUIRE(timeline.element(element.id)->startTick == kTicksPerSecond);

    // Placing it afresh is still validated against the source duration
    auto copy = test::makeElement(8 * kTicksPerSecond, 4 * kTicksPerSecond);
    copy.source = SourceRef::asset(asset);
    copy.trimInTicks = 8 * kTicksPerSecond;
    REQUIRE(history.execute(cmd::AddElement{track.id, copy}).error().code() == ErrorCode::InvalidRange);
}
