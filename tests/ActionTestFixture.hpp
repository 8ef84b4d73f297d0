#pragma once

#include "FakeAudioBackend.hpp"
#include "beatline/studio/core/Config.hpp"
#include "beatline/studio/core/HistoryManager.hpp"
#include "beatline/studio/state/ProjectController.hpp"

namespace beatline::test {

/**
 * Engine, transport, reducer and history wired over the fake backend
 */
struct ActionTestFixture {
    ActionTestFixture() {
        Config::getInstance().resetToDefaults();
    }

    FakeAudioBackend backend;
    AudioEngine engine{backend};
    TransportController transport{engine};
    ProjectController controller{engine, transport};
    HistoryManager history;

    const ProjectState& state() const {
        return controller.getState();
    }

    const TrackInfo* track(TrackId id) const {
        return controller.getState().findTrack(id);
    }

    TrackInfo makeTrack(TrackId id, TrackType type, const juce::File& file = {}) {
        TrackInfo info;
        info.id = id;
        info.name = juce::String(getTrackTypeName(type)) + " " + juce::String(id);
        info.content = makeTrackContent(type, file);
        return info;
    }
};

}  // namespace beatline::test
