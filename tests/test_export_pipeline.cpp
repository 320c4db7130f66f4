/**
 * @file test_export_pipeline.cpp
 * @brief Export job ownership and the compositing backend
 */

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <splice/engine/compositing_backend.hpp>
#include <splice/engine/export_pipeline.hpp>

#include <algorithm>
#include <atomic>

using namespace spl;
using namespace spl::engine;

namespace {

constexpr Tick kSec = kTicksPerSecond;

ExportSettings smallSettings() {
    ExportSettings settings;
    settings.width = 4;
    settings.height = 4;
    settings.frameRate = {30, 1};
    return settings;
}

} // anonymous namespace

TEST_CASE("Pipeline runs submitted jobs on worker threads", "[pipeline]") {
    ExportPipeline pipeline;
    std::atomic<int> progressEvents{0};
    std::atomic<int> terminalEvents{0};
    auto progressConn = pipeline.progress.connectScoped([&](const ExportProgress&) {
        ++progressEvents;
    });
    auto stateConn = pipeline.stateChanged.connectScoped([&](const ExportProgress& p) {
        if (isTerminal(p.state)) ++terminalEvents;
    });

    auto backend = std::make_shared<test::FakeRenderBackend>();
    auto job = pipeline.submit(test::makeSnapshot(2 * kSec), smallSettings(), backend);
    REQUIRE(job->state() == ExportState::Pending);
    REQUIRE(pipeline.job(job->id()) == job);

    REQUIRE(pipeline.start(job->id()));
    auto state = pipeline.wait(job->id());
    REQUIRE(state);
    REQUIRE(state.value() == ExportState::Completed);
    REQUIRE(progressEvents.load() == 60);
    REQUIRE(terminalEvents.load() == 1);
    REQUIRE(backend->encoded().size() == 60);
}

TEST_CASE("Pipeline reports unknown jobs", "[pipeline]") {
    ExportPipeline pipeline;
    UUID unknown = UUID::generate();

    REQUIRE(pipeline.start(unknown).error().code() == ErrorCode::NotFound);
    REQUIRE(pipeline.run(unknown).error().code() == ErrorCode::NotFound);
    REQUIRE(pipeline.cancel(unknown).error().code() == ErrorCode::NotFound);
    REQUIRE(pipeline.wait(unknown).error().code() == ErrorCode::NotFound);
    REQUIRE_FALSE(pipeline.job(unknown));
}

TEST_CASE("Pipeline cancellation", "[pipeline][cancel]") {
    ExportPipeline pipeline;
    auto backend = std::make_shared<test::FakeRenderBackend>();

    SECTION("while rendering") {
        auto job = pipeline.submit(test::makeSnapshot(10 * kSec), smallSettings(), backend);
        UUID id = job->id();
        auto conn = pipeline.progress.connectScoped([&](const ExportProgress& p) {
            if (p.currentFrame == 50) {
                REQUIRE(pipeline.cancel(id));
            }
        });

        REQUIRE(pipeline.run(id).error().code() == ErrorCode::Cancelled);
        REQUIRE(job->state() == ExportState::Cancelled);
        REQUIRE(job->currentFrame() == 50);
        REQUIRE(backend->finalizeCalls() == 1);
    }

    SECTION("every pending job") {
        auto first = pipeline.submit(test::makeSnapshot(kSec), smallSettings(), backend);
        auto second = pipeline.submit(test::makeSnapshot(kSec), smallSettings(), backend);
        REQUIRE(pipeline.jobs().size() == 2);

        pipeline.cancelAll();
        REQUIRE(first->state() == ExportState::Cancelled);
        REQUIRE(second->state() == ExportState::Cancelled);
        REQUIRE(backend->prepareCalls() == 0);

        REQUIRE(pipeline.removeFinished() == 2);
        REQUIRE(pipeline.jobs().empty());
    }
}

TEST_CASE("Finished jobs are removed, pending ones kept", "[pipeline]") {
    ExportPipeline pipeline;
    auto backend = std::make_shared<test::FakeRenderBackend>();

    auto done = pipeline.submit(test::makeSnapshot(kSec), smallSettings(), backend);
    auto waiting = pipeline.submit(test::makeSnapshot(kSec), smallSettings(), backend);
    REQUIRE(pipeline.run(done->id()));

    REQUIRE(pipeline.removeFinished() == 1);
    REQUIRE_FALSE(pipeline.job(done->id()));
    REQUIRE(pipeline.job(waiting->id()) == waiting);
}

TEST_CASE("Removing finished jobs from a terminal state slot", "[pipeline]") {
    ExportPipeline pipeline;
    auto backend = std::make_shared<test::FakeRenderBackend>();

    auto earlier = pipeline.submit(test::makeSnapshot(kSec), smallSettings(), backend);
    REQUIRE(pipeline.run(earlier->id()));
    UUID earlierId = earlier->id();
    earlier.reset();

    std::atomic<int> removedInSlot{-1};
    std::atomic<bool> slotOnWorker{false};
    auto conn = pipeline.stateChanged.connectScoped([&](const ExportProgress& p) {
        if (!isTerminal(p.state) || p.exportId == earlierId) return;
        auto self = pipeline.job(p.exportId);
        slotOnWorker = self && self->onWorkerThread();
        self.reset();
        removedInSlot = static_cast<int>(pipeline.removeFinished());
    });

    // Only the pipeline holds the job
    UUID id = pipeline.submit(test::makeSnapshot(kSec), smallSettings(), backend)->id();
    REQUIRE(pipeline.start(id));
    REQUIRE(pipeline.wait(id).value() == ExportState::Completed);

    REQUIRE(slotOnWorker.load());
    REQUIRE(removedInSlot.load() == 1);
    REQUIRE_FALSE(pipeline.job(earlierId));
    REQUIRE(pipeline.job(id));

    REQUIRE(pipeline.removeFinished() == 1);
    REQUIRE(pipeline.jobs().empty());
}

TEST_CASE("Compositing backend stacks video tracks and carries silence", "[pipeline][compositor]") {
    auto snapshot = std::make_shared<model::TimelineSnapshot>();

    auto bottom = model::Track::make(model::TrackKind::Video, "Bottom");
    bottom.elements.push_back(test::makeElement(0, kSec, "red"));
    auto top = model::Track::make(model::TrackKind::Video, "Top");
    top.elements.push_back(test::makeElement(kSec / 2, kSec / 2, "blue"));
    auto music = model::Track::make(model::TrackKind::Audio, "Music");
    music.elements.push_back(test::makeElement(0, kSec, "music"));

    snapshot->tracks = {bottom, top, music};

    int audioLayersSeen = 0;
    LayerSource source = [&](const model::ActiveElement& layer, const FrameRequest&) -> Result<FrameBuffer> {
        if (layer.trackKind == model::TrackKind::Audio) {
            ++audioLayersSeen;
            return FrameBuffer{};
        }
        if (layer.element.name == "red") {
            return test::solidFrame(2, 2, 255, 0, 0);
        }
        return test::solidFrame(2, 2, 0, 0, 255);
    };

    auto encoder = std::make_shared<test::RecordingEncoder>();
    auto backend = std::make_shared<CompositingBackend>(source, encoder);

    auto settings = smallSettings();
    settings.frameRate = {25, 1};
    settings.sampleRate = 48000;
    settings.channels = 2;

    ExportJob job(snapshot, settings, backend);
    REQUIRE(job.run());

    REQUIRE(encoder->opened);
    REQUIRE(encoder->finished);
    REQUIRE(encoder->openedWidth == 4);
    REQUIRE(encoder->openedHeight == 4);
    REQUIRE(encoder->frames.size() == 25);
    REQUIRE(audioLayersSeen == 0);

    const auto& early = encoder->frames[0];
    REQUIRE(early.width == 4);
    REQUIRE(early.height == 4);
    REQUIRE(early.pixel(3, 3)[0] == 255);
    REQUIRE(early.pixel(3, 3)[2] == 0);

    // The later track sits on top once it starts
    const auto& late = encoder->frames[20];
    REQUIRE(late.pixel(0, 0)[0] == 0);
    REQUIRE(late.pixel(0, 0)[2] == 255);

    for (const auto& frame : encoder->frames) {
        REQUIRE(frame.sampleRate == 48000);
        REQUIRE(frame.channels == 2);
        REQUIRE(frame.audio.size() == 1920 * 2);
        REQUIRE(std::all_of(frame.audio.begin(), frame.audio.end(), [](float s) { return s == 0.0f; }));
    }
}

TEST_CASE("Caption layers reach the layer source", "[pipeline][compositor][captions]") {
    auto snapshot = std::make_shared<model::TimelineSnapshot>();

    auto video = model::Track::make(model::TrackKind::Video, "V1");
    video.elements.push_back(test::makeElement(0, kSec, "red"));
    auto captions = model::Track::make(model::TrackKind::Caption, "Captions (en)");
    auto cue = test::makeElement(0, kSec / 2, "Hello");
    cue.source = model::SourceRef::cue(UUID::generate());
    captions.elements.push_back(cue);
    snapshot->tracks = {video, captions};

    int captionLayersSeen = 0;
    auto encoder = std::make_shared<test::RecordingEncoder>();

    SECTION("a text-capable source draws them on top") {
        LayerSource source = [&](const model::ActiveElement& layer, const FrameRequest&) -> Result<FrameBuffer> {
            if (layer.trackKind == model::TrackKind::Caption) {
                ++captionLayersSeen;
                REQUIRE(layer.element.source.kind == model::SourceKind::CaptionCue);
                return test::solidFrame(4, 4, 255, 255, 255);
            }
            return test::solidFrame(4, 4, 255, 0, 0);
        };
        ExportJob job(snapshot, smallSettings(), std::make_shared<CompositingBackend>(source, encoder));
        REQUIRE(job.run());

        REQUIRE(captionLayersSeen == 15);
        REQUIRE(encoder->frames[0].pixel(0, 0)[1] == 255);
        REQUIRE(encoder->frames[20].pixel(0, 0)[1] == 0);
    }

    SECTION("an empty picture leaves the frame to the video below") {
        LayerSource source = [&](const model::ActiveElement& layer, const FrameRequest&) -> Result<FrameBuffer> {
            if (layer.trackKind == model::TrackKind::Caption) {
                ++captionLayersSeen;
                return FrameBuffer{};
            }
            return test::solidFrame(4, 4, 255, 0, 0);
        };
        ExportJob job(snapshot, smallSettings(), std::make_shared<CompositingBackend>(source, encoder));
        REQUIRE(job.run());

        REQUIRE(captionLayersSeen == 15);
        REQUIRE(encoder->frames[0].pixel(0, 0)[0] == 255);
        REQUIRE(encoder->frames[0].pixel(0, 0)[1] == 0);
    }
}

TEST_CASE("A failing layer fails only its frame", "[pipeline][compositor]") {
    auto snapshot = test::makeSnapshot(kSec);

    LayerSource source = [](const model::ActiveElement&, const FrameRequest& request) -> Result<FrameBuffer> {
        if (request.frameIndex == 4) {
            return Err<FrameBuffer>(ErrorCode::DecoderError, "corrupt packet");
        }
        return test::solidFrame(4, 4, 10, 20, 30);
    };

    auto encoder = std::make_shared<test::RecordingEncoder>();
    ExportJob job(snapshot, smallSettings(), std::make_shared<CompositingBackend>(source, encoder));

    REQUIRE(job.run());
    REQUIRE(job.recoveredFrameErrors() == 1);
    REQUIRE(encoder->frames.size() == 30);
    REQUIRE(encoder->frames[4].substituted);
    REQUIRE(encoder->frames[4].pixel(0, 0)[0] == 0);
    REQUIRE(encoder->frames[5].pixel(0, 0)[0] == 10);
    REQUIRE(job.lastError()->message().find("corrupt packet") != std::string::npos);
}
