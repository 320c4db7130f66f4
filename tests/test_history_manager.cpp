/**
 * @file test_history_manager.cpp
 * @brief Undo/redo, transactions and the clean state
 */

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <splice/model/commands/history_manager.hpp>

#include <algorithm>
#include <random>

using namespace spl;
using namespace spl::model;
using spl::test::makeElement;

namespace {

struct Fixture {
    Timeline timeline;
    HistoryManager history{timeline};
    UUID track;

    Fixture() {
        track = test::addVideoTrack(timeline);
    }

    UUID add(Tick start, TickDuration duration, const std::string& name = {}) {
        auto element = makeElement(start, duration, name);
        REQUIRE(history.execute(cmd::AddElement{track, element}));
        return element.id;
    }
};

} // anonymous namespace

TEST_CASE("Undo and redo restore identical timelines", "[history]") {
    Fixture f;
    auto empty = f.timeline.snapshot();

    UUID id = f.add(0, 100, "clip");
    auto added = f.timeline.snapshot();

    REQUIRE(f.history.execute(cmd::MoveElement{id, 300, std::nullopt}));
    REQUIRE(f.history.execute(cmd::TrimElement{id, 10, 20}));
    REQUIRE(f.history.execute(cmd::SplitElement{id, 330, UUID(), std::nullopt}));
    auto edited = f.timeline.snapshot();

    REQUIRE(f.history.index() == 4);
    REQUIRE(f.history.undoText() == "Split Element");

    REQUIRE(f.history.undo());
    REQUIRE(f.history.undo());
    REQUIRE(f.history.undo());
    REQUIRE(f.timeline.snapshot()->sameContent(*added));
    REQUIRE(f.history.undo());
    REQUIRE(f.timeline.snapshot()->sameContent(*empty));
    REQUIRE_FALSE(f.history.undo());
    REQUIRE_FALSE(f.history.canUndo());

    while (f.history.redo()) {}
    REQUIRE(f.history.index() == 4);
    REQUIRE(f.timeline.snapshot()->sameContent(*edited));
}

TEST_CASE("Split keeps the same right id across redo", "[history]") {
    Fixture f;
    UUID id = f.add(0, 100);
    REQUIRE(f.history.execute(cmd::SplitElement{id, 40, UUID(), std::nullopt}));

    auto right = f.timeline.track(f.track)->elements[1].id;
    REQUIRE(f.history.undo());
    REQUIRE_FALSE(f.timeline.element(right));
    REQUIRE(f.history.redo());
    REQUIRE(f.timeline.element(right));
}

TEST_CASE("Rejected commands leave no history", "[history]") {
    Fixture f;
    f.add(0, 100);

    auto result = f.history.execute(cmd::AddElement{f.track, makeElement(50, 10)});
    REQUIRE(result.error().code() == ErrorCode::OverlapError);
    REQUIRE(f.history.count() == 1);
}

TEST_CASE("A new edit discards the redo tail", "[history]") {
    Fixture f;
    f.add(0, 10);
    f.add(20, 10);
    REQUIRE(f.history.undo());
    REQUIRE(f.history.canRedo());

    f.add(50, 10);
    REQUIRE_FALSE(f.history.canRedo());
    REQUIRE(f.history.count() == 2);
}

TEST_CASE("A transaction undoes as one step", "[history][transaction]") {
    Fixture f;
    UUID id = f.add(0, 100);
    auto before = f.timeline.snapshot();

    f.history.beginTransaction("Drag");
    REQUIRE(f.history.inTransaction());
    REQUIRE(f.history.execute(cmd::MoveElement{id, 50, std::nullopt}));
    REQUIRE(f.history.execute(cmd::TrimElement{id, 10, 0}));
    REQUIRE(f.history.execute(cmd::MoveElement{id, 120, std::nullopt}));

    // Undo is blocked while the transaction is open
    REQUIRE_FALSE(f.history.undo());
    REQUIRE(f.history.commitTransaction());

    REQUIRE(f.history.count() == 2);
    REQUIRE(f.history.undoText() == "Drag");
    REQUIRE(f.history.entry(1)->commands.size() == 3);

    REQUIRE(f.history.undo());
    REQUIRE(f.timeline.snapshot()->sameContent(*before));

    REQUIRE(f.history.redo());
    auto element = *f.timeline.element(id);
    REQUIRE(element.startTick == 120);
    REQUIRE(element.trimInTicks == 10);
    REQUIRE(element.durationTicks == 90);
}

TEST_CASE("Aborting a transaction reverts its edits", "[history][transaction]") {
    Fixture f;
    UUID id = f.add(0, 100);
    auto before = f.timeline.snapshot();

    f.history.beginTransaction("Scratch");
    REQUIRE(f.history.execute(cmd::MoveElement{id, 500, std::nullopt}));
    REQUIRE(f.history.execute(cmd::AddElement{f.track, makeElement(0, 50)}));
    REQUIRE(f.history.abortTransaction());

    REQUIRE_FALSE(f.history.inTransaction());
    REQUIRE(f.timeline.snapshot()->sameContent(*before));
    REQUIRE(f.history.count() == 1);

    REQUIRE(f.history.abortTransaction().error().code() == ErrorCode::InvalidState);
    REQUIRE(f.history.commitTransaction().error().code() == ErrorCode::InvalidState);
}

TEST_CASE("Nested transactions fold into the outermost", "[history][transaction]") {
    Fixture f;
    UUID id = f.add(0, 100);

    f.history.beginTransaction("Outer");
    REQUIRE(f.history.execute(cmd::MoveElement{id, 10, std::nullopt}));
    f.history.beginTransaction("Inner");
    REQUIRE(f.history.execute(cmd::MoveElement{id, 20, std::nullopt}));
    REQUIRE(f.history.commitTransaction());
    REQUIRE(f.history.inTransaction());
    REQUIRE(f.history.count() == 1);
    REQUIRE(f.history.commitTransaction());

    REQUIRE(f.history.count() == 2);
    REQUIRE(f.history.undoText() == "Outer");

    SECTION("abort inside a nested transaction unwinds everything") {
        f.history.beginTransaction("Outer");
        REQUIRE(f.history.execute(cmd::MoveElement{id, 30, std::nullopt}));
        f.history.beginTransaction("Inner");
        REQUIRE(f.history.execute(cmd::MoveElement{id, 40, std::nullopt}));
        REQUIRE(f.history.abortTransaction());

        REQUIRE_FALSE(f.history.inTransaction());
        REQUIRE(f.timeline.element(id)->startTick == 20);
        REQUIRE(f.history.count() == 2);
    }
}

TEST_CASE("A rejected sub-edit keeps the transaction open", "[history][transaction]") {
    Fixture f;
    UUID id = f.add(0, 100);
    f.add(200, 100);

    f.history.beginTransaction("Drag");
    REQUIRE(f.history.execute(cmd::MoveElement{id, 50, std::nullopt}));
    REQUIRE(f.history.execute(cmd::MoveElement{id, 150, std::nullopt}).error().code()
            == ErrorCode::OverlapError);

    REQUIRE(f.history.inTransaction());
    REQUIRE(f.timeline.element(id)->startTick == 50);

    REQUIRE(f.history.commitTransaction());
    REQUIRE(f.history.count() == 3);
    REQUIRE(f.history.entry(2)->commands.size() == 1);
}

TEST_CASE("An empty transaction records nothing", "[history][transaction]") {
    Fixture f;
    int notifications = 0;
    auto conn = f.history.indexChanged.connectScoped([&] { ++notifications; });

    f.history.beginTransaction("Nothing");
    REQUIRE(f.history.commitTransaction());
    REQUIRE(f.history.count() == 0);
    REQUIRE(notifications == 0);
}

TEST_CASE("Batches are all or nothing", "[history]") {
    Fixture f;
    UUID id = f.add(0, 100);
    auto before = f.timeline.snapshot();

    std::vector<EditCommand> batch{
        cmd::MoveElement{id, 200, std::nullopt},
        cmd::AddElement{f.track, makeElement(0, 50)},
        cmd::AddElement{f.track, makeElement(250, 10)},   // overlaps the moved element
    };
    auto result = f.history.executeBatch("Paste", batch);
    REQUIRE(result.error().code() == ErrorCode::OverlapError);
    REQUIRE(f.timeline.snapshot()->sameContent(*before));
    REQUIRE(f.history.count() == 1);

    batch.pop_back();
    REQUIRE(f.history.executeBatch("Paste", batch));
    REQUIRE(f.history.count() == 2);
    REQUIRE(f.history.undo());
    REQUIRE(f.timeline.snapshot()->sameContent(*before));
}

TEST_CASE("Ripple delete closes the gap", "[history]") {
    Fixture f;
    UUID a = f.add(0, 100);
    UUID b = f.add(100, 50);
    UUID c = f.add(200, 50);
    auto before = f.timeline.snapshot();

    auto commands = buildRippleDelete(f.timeline, a);
    REQUIRE(commands);
    REQUIRE(commands.value().size() == 3);
    REQUIRE(f.history.executeBatch("Ripple Delete", commands.value()));

    REQUIRE_FALSE(f.timeline.element(a));
    REQUIRE(f.timeline.element(b)->startTick == 0);
    REQUIRE(f.timeline.element(c)->startTick == 100);

    REQUIRE(f.history.undo());
    REQUIRE(f.timeline.snapshot()->sameContent(*before));

    REQUIRE(buildRippleDelete(f.timeline, UUID::generate()).error().code() == ErrorCode::NotFound);
}

TEST_CASE("The undo limit drops the oldest entries", "[history]") {
    Timeline timeline;
    HistoryManager history(timeline, 3);
    UUID track = test::addVideoTrack(timeline);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(history.execute(cmd::AddElement{track, makeElement(i * 100, 10)}));
    }
    REQUIRE(history.count() == 3);
    REQUIRE(history.index() == 3);

    int undone = 0;
    while (history.undo()) ++undone;
    REQUIRE(undone == 3);
    REQUIRE(timeline.track(track)->elements.size() == 2);

    history.setUndoLimit(0);
    REQUIRE(history.undoLimit() == 0);
}

TEST_CASE("Clean state follows the saved position", "[history]") {
    Fixture f;
    std::vector<bool> changes;
    auto conn = f.history.cleanChanged.connectScoped([&](bool clean) { changes.push_back(clean); });

    REQUIRE(f.history.isClean());
    f.add(0, 10);
    REQUIRE_FALSE(f.history.isClean());

    f.history.setClean();
    REQUIRE(f.history.isClean());

    f.add(20, 10);
    REQUIRE(f.history.undo());
    REQUIRE(f.history.isClean());

    REQUIRE(f.history.undo());
    f.add(40, 10);
    // The saved state sits on a discarded branch now
    while (f.history.undo()) {}
    REQUIRE_FALSE(f.history.isClean());

    REQUIRE(changes == std::vector<bool>{false, true, false, true, false});
}

TEST_CASE("Random edit sequences undo and redo exactly", "[history][random]") {
    Timeline timeline;
    HistoryManager history(timeline, 0);
    auto empty = timeline.snapshot();

    for (int i = 1; i <= 3; ++i) {
        auto track = Track::make(TrackKind::Video, "V" + std::to_string(i));
        REQUIRE(history.execute(cmd::AddTrack{track, std::nullopt, std::nullopt}));
    }

    std::mt19937_64 rng(12345);
    std::uniform_int_distribution<int> actionDist(0, 7);
    std::uniform_int_distribution<int> stepDist(0, 80);
    std::uniform_int_distribution<int> lenDist(1, 12);
    std::uniform_int_distribution<int> coin(0, 1);
    constexpr Tick kStep = 10;

    auto pick = [&](size_t size) {
        return std::uniform_int_distribution<size_t>(0, size - 1)(rng);
    };

    auto pickTrack = [&]() {
        auto tracks = timeline.tracks();
        return tracks[pick(tracks.size())];
    };

    auto pickElement = [&]() -> std::optional<Element> {
        std::vector<Element> all;
        for (const auto& track : timeline.tracks()) {
            all.insert(all.end(), track.elements.begin(), track.elements.end());
        }
        if (all.empty()) return std::nullopt;
        return all[pick(all.size())];
    };

    auto requireSortedAndDisjoint = [&]() {
        for (const auto& track : timeline.tracks()) {
            for (size_t i = 1; i < track.elements.size(); ++i) {
                REQUIRE(track.elements[i - 1].startTick <= track.elements[i].startTick);
                REQUIRE(track.elements[i - 1].endTick() <= track.elements[i].startTick);
            }
        }
    };

    struct Stats {
        int attempted = 0;
        int accepted = 0;
        int rejected = 0;
    } stats;

    for (int op = 0; op < 400; ++op) {
        std::optional<EditCommand> command;

        switch (actionDist(rng)) {
            case 0:
            case 1: {
                auto element = makeElement(stepDist(rng) * kStep, lenDist(rng) * kStep);
                command = cmd::AddElement{pickTrack().id, element};
                break;
            }
            case 2: {
                auto element = pickElement();
                if (!element) break;
                std::optional<UUID> target;
                if (coin(rng)) target = pickTrack().id;
                command = cmd::MoveElement{element->id, stepDist(rng) * kStep, target};
                break;
            }
            case 3: {
                auto element = pickElement();
                if (!element) break;
                std::uniform_int_distribution<Tick> trimDist(0, element->sourceExtent());
                command = cmd::TrimElement{element->id, trimDist(rng), trimDist(rng)};
                break;
            }
            case 4: {
                auto element = pickElement();
                if (!element) break;
                std::uniform_int_distribution<Tick> atDist(element->startTick, element->endTick());
                command = cmd::SplitElement{element->id, atDist(rng), UUID(), std::nullopt};
                break;
            }
            case 5: {
                auto track = pickTrack();
                if (track.elements.size() < 2) break;
                size_t i = pick(track.elements.size() - 1);
                command = cmd::MergeElements{track.elements[i].id, track.elements[i + 1].id};
                break;
            }
            case 6: {
                auto element = pickElement();
                if (!element) break;
                command = cmd::RemoveElement{element->id};
                break;
            }
            case 7: {
                std::vector<UUID> order;
                for (const auto& track : timeline.tracks()) order.push_back(track.id);
                std::shuffle(order.begin(), order.end(), rng);
                command = cmd::ReorderTracks{order};
                break;
            }
        }

        if (!command) continue;
        ++stats.attempted;
        if (history.execute(*command)) {
            ++stats.accepted;
            requireSortedAndDisjoint();
        } else {
            ++stats.rejected;
        }
    }

    INFO("attempted " << stats.attempted << ", accepted " << stats.accepted
         << ", rejected " << stats.rejected);
    REQUIRE(stats.accepted > 100);
    REQUIRE(stats.rejected > 0);
    REQUIRE(history.count() == static_cast<size_t>(stats.accepted) + 3);

    auto edited = timeline.snapshot();
    const size_t steps = history.index();

    while (history.undo()) {
        requireSortedAndDisjoint();
    }
    REQUIRE(history.index() == 0);
    REQUIRE(timeline.snapshot()->sameContent(*empty));

    while (history.redo()) {}
    REQUIRE(history.index() == steps);
    REQUIRE(timeline.snapshot()->sameContent(*edited));
}

TEST_CASE("Command labels", "[history]") {
    REQUIRE(describeCommand(cmd::RemoveElement{UUID::generate()}) == "Remove Element");
    REQUIRE(describeCommand(cmd::AddTrack{Track::make(TrackKind::Caption), std::nullopt, std::nullopt})
            == "Add Captions");
    REQUIRE(describeCommand(cmd::SetTrackEnabled{UUID::generate(), false}) == "Disable Track");
}
