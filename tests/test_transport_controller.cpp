#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <optional>

#include "FakeAudioBackend.hpp"
#include "beatline/studio/core/Config.hpp"
#include "beatline/studio/engine/AudioEngine.hpp"
#include "beatline/studio/engine/TransportController.hpp"

/**
 * Tests for TransportController scheduling and state transitions
 *
 * At 120 BPM in 4/4 with 200px measures: 1 measure = 2 seconds,
 * so a track at x = 1500 starts at 15 seconds.
 */

using namespace beatline;
using namespace beatline::test;

namespace {

constexpr double FADE_WAIT = 0.05;

struct TransportFixture {
    TransportFixture() {
        Config::getInstance().resetToDefaults();
    }

    FakeAudioBackend backend;
    AudioEngine engine{backend};
    TransportController transport{engine};

    /** Audio track with a decodable file placed at `x` pixels. */
    void addAudio(TrackId id, double x, double duration) {
        auto file = backend.addFile("track" + std::to_string(id) + ".wav", duration);
        engine.createTrack(id, "Track " + juce::String(id), TrackType::Audio, file);
        engine.setTrackPosition(id, x);
    }

    FakePlaybackUnit& unit(TrackId id) {
        return dynamic_cast<FakePlaybackUnit&>(*engine.getTrack(id)->unit);
    }
};

}  // namespace

// ============================================================================
// Tempo
// ============================================================================

TEST_CASE("TransportController - tempo is clamped", "[transport][tempo]") {
    TransportFixture f;

    REQUIRE(f.transport.getTempo() == Catch::Approx(120.0));

    f.transport.setTempo(500.0);
    REQUIRE(f.transport.getTempo() == Catch::Approx(300.0));
    REQUIRE(f.backend.clock.getBpm() == Catch::Approx(300.0));

    f.transport.setTempo(5.0);
    REQUIRE(f.transport.getTempo() == Catch::Approx(20.0));
}

TEST_CASE("TransportController - time signature", "[transport][tempo]") {
    TransportFixture f;

    f.transport.setTimeSignature(3, 8);
    REQUIRE(f.transport.getBeatsPerMeasure() == 3);
    REQUIRE(f.transport.getBeatUnit() == 8);

    SECTION("Invalid denominator keeps the previous one") {
        f.transport.setTimeSignature(5, 6);
        REQUIRE(f.transport.getBeatsPerMeasure() == 5);
        REQUIRE(f.transport.getBeatUnit() == 8);
    }

    SECTION("Numerator is clamped") {
        f.transport.setTimeSignature(0, 4);
        REQUIRE(f.transport.getBeatsPerMeasure() == 1);
    }
}

// ============================================================================
// Play
// ============================================================================

TEST_CASE("TransportController - play from zero", "[transport][play]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.addAudio(2, 1500.0, 10.0);

    REQUIRE(f.transport.play());
    REQUIRE(f.transport.isPlaying());
    REQUIRE(f.backend.clock.isRunning());

    SECTION("Track at the playhead starts immediately, synced") {
        REQUIRE(f.unit(1).getState() == UnitState::Started);
        REQUIRE(f.unit(1).lastOffset == Catch::Approx(0.0));
        REQUIRE(f.unit(1).isSynced());
    }

    SECTION("Later track waits for its offset") {
        REQUIRE(f.unit(2).getState() == UnitState::Stopped);
        REQUIRE(f.transport.getPendingScheduleCount() == 1);

        f.backend.clock.advance(14.9);
        REQUIRE(f.unit(2).getState() == UnitState::Stopped);

        f.backend.clock.advance(0.2);
        REQUIRE(f.unit(2).getState() == UnitState::Started);
        REQUIRE(f.unit(2).lastOffset == Catch::Approx(0.0));
        REQUIRE(f.unit(2).isSynced());

        // Deferred starts fade in from silence
        REQUIRE(f.unit(2).rampCount == 1);
        REQUIRE(f.unit(2).lastRampTarget == Catch::Approx(0.0));
        REQUIRE(f.unit(2).lastRampSeconds == Catch::Approx(0.01));
    }

    SECTION("Max position is the latest track end") {
        // A ends at 30, B at 15 + 10
        REQUIRE(f.transport.getMaxPosition() == Catch::Approx(30.0));
    }
}

TEST_CASE("TransportController - play skips finished tracks", "[transport][play]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 5.0);
    f.addAudio(2, 0.0, 20.0);

    f.backend.clock.setPosition(7.0);
    f.transport.play();

    REQUIRE(f.unit(1).getState() == UnitState::Stopped);
    REQUIRE(f.unit(2).getState() == UnitState::Started);
    REQUIRE(f.unit(2).lastOffset == Catch::Approx(7.0));
}

TEST_CASE("TransportController - one failing track does not stop the others",
          "[transport][play][error]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 10.0);
    f.addAudio(2, 0.0, 10.0);
    f.unit(1).failStart = true;

    REQUIRE(f.transport.play());
    REQUIRE(f.transport.isPlaying());
    REQUIRE(f.unit(1).getState() == UnitState::Stopped);
    REQUIRE(f.unit(2).getState() == UnitState::Started);
}

TEST_CASE("TransportController - initialization failure propagates", "[transport][error]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 10.0);
    f.backend.failInitialize = true;

    REQUIRE_THROWS_AS(f.transport.play(), InitializationError);
    REQUIRE_FALSE(f.transport.isPlaying());
    REQUIRE(f.unit(1).getState() == UnitState::Stopped);
}

TEST_CASE("TransportController - no tracks", "[transport][play]") {
    TransportFixture f;

    REQUIRE(f.transport.play());
    REQUIRE(f.transport.getMaxPosition() ==
            Catch::Approx(Config::getInstance().getDefaultMaxPosition()));
}

// ============================================================================
// Seek
// ============================================================================

TEST_CASE("TransportController - seek while playing", "[transport][seek]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.addAudio(2, 1500.0, 10.0);

    f.transport.play();
    f.transport.seek(10.0);

    REQUIRE(f.transport.isPlaying());
    REQUIRE(f.transport.getPosition() == Catch::Approx(10.0));

    // A restarts inside its audio
    REQUIRE(f.unit(1).getState() == UnitState::Started);
    REQUIRE(f.unit(1).lastOffset == Catch::Approx(10.0));
    REQUIRE(f.unit(1).startOffsets.size() == 2);

    // B is still 5 seconds away
    REQUIRE(f.unit(2).getState() == UnitState::Stopped);
    REQUIRE(f.transport.getPendingScheduleCount() == 1);

    f.backend.clock.advance(5.1);
    REQUIRE(f.unit(2).getState() == UnitState::Started);
    REQUIRE(f.unit(2).lastOffset == Catch::Approx(0.0));
}

TEST_CASE("TransportController - seek backwards cancels a started deferred track",
          "[transport][seek]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.addAudio(2, 1500.0, 10.0);

    f.transport.play();
    f.backend.clock.advance(16.0);
    REQUIRE(f.unit(2).getState() == UnitState::Started);

    f.transport.seek(2.0);

    REQUIRE(f.unit(2).getState() == UnitState::Stopped);
    REQUIRE(f.unit(1).lastOffset == Catch::Approx(2.0));
    REQUIRE(f.transport.getPendingScheduleCount() == 1);
}

TEST_CASE("TransportController - seek while stopped", "[transport][seek]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);

    f.transport.seek(12.0);

    REQUIRE_FALSE(f.transport.isPlaying());
    REQUIRE(f.transport.getPosition() == Catch::Approx(12.0));
    REQUIRE(f.unit(1).getState() == UnitState::Stopped);

    SECTION("Play resumes from the seek point") {
        f.transport.play();
        REQUIRE(f.unit(1).lastOffset == Catch::Approx(12.0));
    }

    SECTION("Seek is clamped to the project length") {
        f.transport.seek(100.0);
        REQUIRE(f.transport.getPosition() == Catch::Approx(30.0));

        f.transport.seek(-5.0);
        REQUIRE(f.transport.getPosition() == Catch::Approx(0.0));
    }
}

// ============================================================================
// Pause and stop
// ============================================================================

TEST_CASE("TransportController - pause keeps the position", "[transport][pause]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);

    f.transport.play();
    f.backend.clock.advance(3.0);

    bool completed = false;
    f.transport.pause([&completed] { completed = true; });

    REQUIRE_FALSE(f.transport.isPlaying());
    REQUIRE_FALSE(f.backend.clock.isRunning());
    REQUIRE(f.transport.getPosition() == Catch::Approx(3.0));

    // Fading out, free of the clock
    REQUIRE(f.unit(1).getState() == UnitState::Started);
    REQUIRE_FALSE(f.unit(1).isSynced());
    REQUIRE(std::isinf(f.unit(1).lastRampTarget));
    REQUIRE_FALSE(completed);

    f.backend.clock.advance(FADE_WAIT);
    REQUIRE(completed);
    REQUIRE(f.unit(1).getState() == UnitState::Stopped);
    REQUIRE(f.transport.getPosition() == Catch::Approx(3.0));

    SECTION("Play resumes where it paused") {
        f.transport.play();
        REQUIRE(f.unit(1).lastOffset == Catch::Approx(3.0));
        REQUIRE(f.unit(1).getVolumeDb() == Catch::Approx(0.0));
    }
}

TEST_CASE("TransportController - stop returns to zero", "[transport][stop]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.addAudio(2, 1500.0, 10.0);

    f.transport.play();
    f.backend.clock.advance(4.0);

    bool completed = false;
    f.transport.stop([&completed] { completed = true; });

    REQUIRE_FALSE(f.transport.isPlaying());
    REQUIRE(f.transport.getPosition() == Catch::Approx(0.0));
    REQUIRE(f.transport.getPendingScheduleCount() == 0);

    f.backend.clock.advance(FADE_WAIT);
    REQUIRE(completed);
    REQUIRE(f.unit(1).getState() == UnitState::Stopped);
    REQUIRE(f.unit(1).getVolumeDb() == Catch::Approx(0.0));

    SECTION("Cancelled deferred start never fires") {
        f.backend.clock.start();
        f.backend.clock.advance(20.0);
        REQUIRE(f.unit(2).getState() == UnitState::Stopped);
    }
}

TEST_CASE("TransportController - stop when nothing plays completes at once",
          "[transport][stop]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);

    bool completed = false;
    f.transport.stop([&completed] { completed = true; });
    REQUIRE(completed);
}

TEST_CASE("TransportController - play during a fade wins", "[transport][stop]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);

    f.transport.play();
    f.backend.clock.advance(2.0);
    f.transport.pause();
    f.transport.play();

    // The pending fade completion must not stop the restarted unit
    f.backend.clock.advance(FADE_WAIT);
    REQUIRE(f.transport.isPlaying());
    REQUIRE(f.unit(1).getState() == UnitState::Started);
    REQUIRE(f.unit(1).lastOffset == Catch::Approx(2.0));
}

// ============================================================================
// Layout changes while playing
// ============================================================================

TEST_CASE("TransportController - moving a track while playing", "[transport][reschedule]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.addAudio(2, 1500.0, 10.0);

    f.transport.play();
    f.backend.clock.advance(5.0);

    // Move B to 2 seconds; it should already be 3 seconds in
    f.transport.handleTrackPositionChange(2, 200.0);

    REQUIRE(f.transport.isPlaying());
    REQUIRE(f.unit(2).getState() == UnitState::Started);
    REQUIRE(f.unit(2).lastOffset == Catch::Approx(3.0));
    REQUIRE(f.unit(1).lastOffset == Catch::Approx(5.0));
    REQUIRE(f.transport.getPosition() == Catch::Approx(5.0));
    REQUIRE(f.transport.getPendingScheduleCount() == 0);
}

TEST_CASE("TransportController - moving a track while stopped", "[transport][reschedule]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);

    f.transport.handleTrackPositionChange(1, 400.0);

    REQUIRE_FALSE(f.transport.isPlaying());
    REQUIRE(f.unit(1).startOffsets.empty());
    REQUIRE(f.transport.getTrackOffset(*f.engine.getTrack(1)) == Catch::Approx(4.0));
}

TEST_CASE("TransportController - tempo change while playing", "[transport][reschedule]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.addAudio(2, 1500.0, 10.0);

    f.transport.play();
    f.backend.clock.advance(5.0);

    f.transport.setTempo(60.0);
    f.transport.handleTempoChange();

    // B now starts at 30 seconds
    REQUIRE(f.transport.getTrackOffset(*f.engine.getTrack(2)) == Catch::Approx(30.0));
    REQUIRE(f.unit(1).lastOffset == Catch::Approx(5.0));
    REQUIRE(f.transport.getPendingScheduleCount() == 1);

    f.backend.clock.advance(20.0);
    REQUIRE(f.unit(2).getState() == UnitState::Stopped);
}

// ============================================================================
// Trim
// ============================================================================

TEST_CASE("TransportController - trimmed track starts inside its region", "[transport][trim]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.addAudio(2, 1500.0, 10.0);
    f.transport.handleTrackTrimChange(1, 4.0, 20.0);
    f.transport.handleTrackTrimChange(2, 2.0, std::nullopt);

    SECTION("Playhead inside the region adds the trim start") {
        f.backend.clock.setPosition(3.0);
        f.transport.play();
        REQUIRE(f.unit(1).getState() == UnitState::Started);
        REQUIRE(f.unit(1).lastOffset == Catch::Approx(7.0));
    }

    SECTION("Deferred start begins at the trim start") {
        f.transport.play();
        f.backend.clock.advance(15.1);
        REQUIRE(f.unit(2).getState() == UnitState::Started);
        REQUIRE(f.unit(2).lastOffset == Catch::Approx(2.0));
    }

    SECTION("Playhead past the trimmed length skips the track") {
        // 16 seconds of region, the file itself runs to 30
        f.backend.clock.setPosition(17.0);
        f.transport.play();
        REQUIRE(f.unit(1).getState() == UnitState::Stopped);
        REQUIRE(f.unit(1).startOffsets.empty());
    }
}

TEST_CASE("TransportController - trim end fades the track out", "[transport][trim]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.transport.handleTrackTrimChange(1, 0.0, 5.0);

    f.transport.play();
    REQUIRE(f.transport.getPendingScheduleCount() == 1);

    f.backend.clock.advance(4.9);
    REQUIRE(f.unit(1).rampCount == 0);

    // Ramp starts at the trim end, the unit stops once the fade is over
    f.backend.clock.advance(0.105);
    REQUIRE(f.unit(1).rampCount == 1);
    REQUIRE(std::isinf(f.unit(1).lastRampTarget));
    REQUIRE(f.unit(1).lastRampTarget < 0.0);
    REQUIRE(f.unit(1).getState() == UnitState::Started);

    f.backend.clock.advance(0.02);
    REQUIRE(f.unit(1).getState() == UnitState::Stopped);
    REQUIRE(f.unit(1).stopCount == 1);
    REQUIRE(f.transport.isPlaying());
}

TEST_CASE("TransportController - trim end at the file end schedules nothing",
          "[transport][trim]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);
    f.transport.handleTrackTrimChange(1, 1.0, 30.0);

    f.transport.play();
    REQUIRE(f.unit(1).lastOffset == Catch::Approx(1.0));
    REQUIRE(f.transport.getPendingScheduleCount() == 0);
}

TEST_CASE("TransportController - trimming while playing", "[transport][trim][reschedule]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);

    f.transport.play();
    f.backend.clock.advance(5.0);

    SECTION("New trim start moves the read position") {
        f.transport.handleTrackTrimChange(1, 2.0, std::nullopt);
        REQUIRE(f.unit(1).getState() == UnitState::Started);
        REQUIRE(f.unit(1).lastOffset == Catch::Approx(7.0));
        REQUIRE(f.transport.getPosition() == Catch::Approx(5.0));
    }

    SECTION("Trim end behind the playhead silences the track") {
        f.transport.handleTrackTrimChange(1, 0.0, 3.0);
        REQUIRE(f.unit(1).getState() == UnitState::Stopped);
        REQUIRE(f.transport.isPlaying());
    }
}

TEST_CASE("TransportController - trim while stopped only updates the engine",
          "[transport][trim]") {
    TransportFixture f;
    f.addAudio(1, 0.0, 30.0);

    f.transport.handleTrackTrimChange(1, 2.5, 8.0);

    REQUIRE(f.unit(1).startOffsets.empty());
    REQUIRE(f.engine.getTrack(1)->trimStart == Catch::Approx(2.5));
    REQUIRE(f.engine.getTrack(1)->trimEnd == 8.0);
}

// ============================================================================
// Note sequences
// ============================================================================

TEST_CASE("TransportController - sequence tracks send notes", "[transport][midi]") {
    TransportFixture f;
    f.engine.createTrack(5, "Keys", TrackType::MIDI);

    // Steps are sixteenths: 0.125s at 120 BPM
    f.engine.setTrackSequence(5, {{0, 2, 1, 60, 100}, {4, 1, 1, 64, 90}});

    f.transport.play();
    f.backend.clock.advance(0.01);

    auto ons = f.backend.notes.noteOns();
    REQUIRE(ons.size() == 1);
    REQUIRE(ons[0].noteNumber == 60);
    REQUIRE(ons[0].velocity == 100);

    f.backend.clock.advance(0.6);
    ons = f.backend.notes.noteOns();
    REQUIRE(ons.size() == 2);
    REQUIRE(ons[1].noteNumber == 64);

    SECTION("Muted tracks stay silent") {
        f.transport.seek(0.0);
        f.backend.notes.events.clear();
        f.engine.setTrackMute(5, true);

        f.backend.clock.advance(1.0);
        REQUIRE(f.backend.notes.noteOns().empty());
    }

    SECTION("Stop releases sounding notes") {
        f.transport.stop();
        REQUIRE(f.backend.notes.events.back().kind == FakeNoteOutput::Kind::AllOff);
    }
}

TEST_CASE("TransportController - sequence notes before the playhead are skipped",
          "[transport][midi]") {
    TransportFixture f;
    f.engine.createTrack(5, "Drums", TrackType::Drum);
    f.engine.setTrackSequence(5, {{0, 1, 10, 36, 100}, {8, 1, 10, 38, 100}});

    // Step 8 is at 1 second
    f.backend.clock.setPosition(0.5);
    f.transport.play();
    f.backend.clock.advance(1.0);

    auto ons = f.backend.notes.noteOns();
    REQUIRE(ons.size() == 1);
    REQUIRE(ons[0].noteNumber == 38);
    REQUIRE(ons[0].channel == 10);
}
