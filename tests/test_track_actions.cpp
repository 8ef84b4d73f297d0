#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <variant>

#include "ActionTestFixture.hpp"
#include "beatline/studio/state/TrackActions.hpp"

/**
 * Tests for track actions: every undo restores the exact prior state
 */

using namespace beatline;
using namespace beatline::test;

TEST_CASE("AddTrackAction - undo/redo", "[track][action][undo]") {
    ActionTestFixture f;
    auto file = f.backend.addFile("vocals.wav", 6.0);

    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(1, TrackType::Audio, file)));
    REQUIRE(f.track(1) != nullptr);
    REQUIRE(f.engine.getTrack(1)->unit != nullptr);
    REQUIRE(f.history.getUndoDescription() == "Add Audio Track");

    f.history.undo();
    REQUIRE(f.track(1) == nullptr);
    REQUIRE(f.engine.getTrack(1) == nullptr);

    // Redo recreates the same id with fresh nodes
    f.history.redo();
    REQUIRE(f.track(1) != nullptr);
    REQUIRE(f.engine.getTrack(1)->unit != nullptr);
}

TEST_CASE("DeleteTrackAction - undo restores the whole track", "[track][action][undo]") {
    ActionTestFixture f;
    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(1, TrackType::MIDI)));
    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(2, TrackType::Audio)));
    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(3, TrackType::Drum)));

    f.controller.dispatch(SetTrackVolumeEvent{2, 55.0});
    f.controller.dispatch(SetTrackPanEvent{2, -30.0});
    f.controller.dispatch(SetTrackMuteEvent{2, true});
    f.controller.dispatch(SetTrackPositionEvent{2, {600.0, 90.0}});
    TrackInfo before = *f.track(2);

    f.history.executeAction(std::make_unique<DeleteTrackAction>(f.controller, 2));
    REQUIRE(f.track(2) == nullptr);
    REQUIRE(f.history.getUndoDescription() == "Delete Audio 2");

    f.history.undo();
    const auto* restored = f.track(2);
    REQUIRE(restored != nullptr);
    REQUIRE(f.state().indexOf(2) == 1);
    REQUIRE(restored->name == before.name);
    REQUIRE(restored->volume == Catch::Approx(55.0));
    REQUIRE(restored->pan == Catch::Approx(-30.0));
    REQUIRE(restored->muted);
    REQUIRE((restored->position == before.position));

    // Engine side comes back with the same mix
    REQUIRE(f.engine.getTrack(2)->muted);
    REQUIRE(f.engine.getTrack(2)->positionX == Catch::Approx(600.0));

    SECTION("Redo deletes again") {
        f.history.redo();
        REQUIRE(f.track(2) == nullptr);
    }
}

TEST_CASE("DeleteTrackAction - missing track fails", "[track][action][error]") {
    ActionTestFixture f;

    REQUIRE_THROWS_AS(
        f.history.executeAction(std::make_unique<DeleteTrackAction>(f.controller, 42)),
        ActionExecutionError);
    REQUIRE_FALSE(f.history.canUndo());
}

TEST_CASE("MoveTrackAction - undo/redo", "[track][action][undo]") {
    ActionTestFixture f;
    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(1, TrackType::MIDI)));
    f.controller.dispatch(SetTrackPositionEvent{1, {100.0, 20.0}});

    f.history.executeAction(
        std::make_unique<MoveTrackAction>(f.controller, 1, TrackPosition{500.0, 40.0}));
    REQUIRE(f.track(1)->position.x == Catch::Approx(500.0));
    REQUIRE(f.engine.getTrack(1)->positionX == Catch::Approx(500.0));

    f.history.undo();
    REQUIRE(f.track(1)->position.x == Catch::Approx(100.0));
    REQUIRE(f.track(1)->position.y == Catch::Approx(20.0));
    REQUIRE(f.engine.getTrack(1)->positionX == Catch::Approx(100.0));

    f.history.redo();
    REQUIRE(f.track(1)->position.x == Catch::Approx(500.0));
}

TEST_CASE("TrimTrackAction - undo/redo", "[track][action][trim][undo]") {
    ActionTestFixture f;
    auto file = f.backend.addFile("drums.wav", 8.0);
    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(1, TrackType::Audio, file)));
    f.controller.dispatch(SetTrackTrimEvent{1, 1.0, std::nullopt});

    f.history.executeAction(std::make_unique<TrimTrackAction>(f.controller, 1, 2.0, 6.0));
    REQUIRE(f.history.getUndoDescription() == "Trim Track");
    REQUIRE(f.track(1)->calculatedWidth == Catch::Approx(400.0));
    REQUIRE(*f.engine.getTrack(1)->trimEnd == Catch::Approx(6.0));

    f.history.undo();
    const auto& audio = std::get<AudioContent>(f.track(1)->content);
    REQUIRE(audio.trimStart == Catch::Approx(1.0));
    REQUIRE_FALSE(audio.trimEnd.has_value());
    REQUIRE(f.track(1)->calculatedWidth == Catch::Approx(700.0));
    REQUIRE(f.engine.getTrack(1)->trimStart == Catch::Approx(1.0));
    REQUIRE_FALSE(f.engine.getTrack(1)->trimEnd.has_value());

    f.history.redo();
    REQUIRE(std::get<AudioContent>(f.track(1)->content).trimStart == Catch::Approx(2.0));
    REQUIRE(*f.track(1)->duration == Catch::Approx(4.0));
}

TEST_CASE("TrimTrackAction - only audio tracks trim", "[track][action][trim][error]") {
    ActionTestFixture f;
    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(1, TrackType::Drum)));

    REQUIRE_THROWS_AS(f.history.executeAction(
                          std::make_unique<TrimTrackAction>(f.controller, 1, 0.5, std::nullopt)),
                      ActionExecutionError);
    REQUIRE(f.history.getUndoDescription() == "Add Drum Track");
}

TEST_CASE("Mixer actions - undo restores exact values", "[track][action][mixer][undo]") {
    ActionTestFixture f;
    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(1, TrackType::Audio)));
    f.history.executeAction(
        std::make_unique<AddTrackAction>(f.controller, f.makeTrack(2, TrackType::Audio)));
    f.controller.dispatch(SetTrackVolumeEvent{1, 63.5});

    SECTION("Volume") {
        f.history.executeAction(std::make_unique<ChangeVolumeAction>(f.controller, 1, 20.0));
        REQUIRE(f.track(1)->volume == Catch::Approx(20.0));

        f.history.undo();
        REQUIRE(f.track(1)->volume == 63.5);
        REQUIRE(f.engine.getTrack(1)->volume == 63.5);
    }

    SECTION("Pan") {
        f.history.executeAction(std::make_unique<ChangePanAction>(f.controller, 1, 75.0));
        REQUIRE(f.engine.getTrack(1)->channel->getPan() == Catch::Approx(0.75));

        f.history.undo();
        REQUIRE(f.track(1)->pan == 0.0);
        REQUIRE(f.engine.getTrack(1)->channel->getPan() == Catch::Approx(0.0));
    }

    SECTION("Mute") {
        f.history.executeAction(std::make_unique<ChangeMuteAction>(f.controller, 1, true));
        REQUIRE(f.engine.getTrack(1)->channel->isMuted());

        f.history.undo();
        REQUIRE_FALSE(f.track(1)->muted);
        REQUIRE_FALSE(f.engine.getTrack(1)->channel->isMuted());
    }

    SECTION("Solo") {
        f.history.executeAction(std::make_unique<ChangeSoloAction>(f.controller, 1, true));
        REQUIRE(f.engine.getTrack(2)->channel->isMuted());

        f.history.undo();
        REQUIRE_FALSE(f.track(1)->soloed);
        REQUIRE_FALSE(f.engine.getTrack(2)->channel->isMuted());

        f.history.redo();
        REQUIRE(f.engine.getTrack(2)->channel->isMuted());
    }
}
