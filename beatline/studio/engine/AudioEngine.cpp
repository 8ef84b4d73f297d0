#include "AudioEngine.hpp"

#include <algorithm>
#include <iostream>

#include "../core/MixUtils.hpp"

namespace beatline {

AudioEngine::AudioEngine(AudioBackend& backend) : backend_(backend) {}

AudioEngine::~AudioEngine() {
    // Dispose units before the backend goes away
    tracks_.clear();
}

void AudioEngine::initialize() {
    if (backend_.isInitialized()) {
        return;
    }
    backend_.initialize();
    std::cout << "ENGINE: Audio backend initialized" << std::endl;
}

void AudioEngine::shutdown() {
    stopAllPlayback();
    tracks_.clear();
    if (backend_.isInitialized()) {
        backend_.shutdown();
    }
}

bool AudioEngine::isInitialized() const {
    return backend_.isInitialized();
}

// ===== Tracks =====

EngineTrack& AudioEngine::createTrack(TrackId id, const juce::String& name, TrackType type,
                                      const juce::File& file) {
    // Idempotent cleanup of a stale track with the same id
    removeTrack(id);

    auto track = std::make_unique<EngineTrack>();
    track->id = id;
    track->name = name;
    track->type = type;
    track->channel = backend_.createChannel();

    if (type == TrackType::Audio && file != juce::File()) {
        try {
            track->unit = backend_.createUnit(file, *track->channel);
            track->duration = track->unit->getDuration();
            DBG("ENGINE: Decoded " << file.getFileName() << " (" << *track->duration << "s)");
        } catch (const std::exception& e) {
            std::cerr << "ENGINE: Failed to load audio for track " << id << ": " << e.what()
                      << std::endl;
        }
    }

    auto& ref = *track;
    tracks_.push_back(std::move(track));
    applyMix(ref);
    return ref;
}

void AudioEngine::removeTrack(TrackId id) {
    auto it = std::find_if(tracks_.begin(), tracks_.end(),
                           [id](const auto& t) { return t->id == id; });
    if (it == tracks_.end()) {
        return;
    }

    auto& track = **it;
    if (track.unit) {
        if (track.unit->getState() == UnitState::Started) {
            track.unit->stop();
        }
        track.unit->unsync();
    }

    bool wasSoloed = track.soloed;
    tracks_.erase(it);

    if (wasSoloed) {
        applyMixToAll();
    }
}

EngineTrack* AudioEngine::getTrack(TrackId id) {
    for (auto& track : tracks_) {
        if (track->id == id) {
            return track.get();
        }
    }
    return nullptr;
}

const EngineTrack* AudioEngine::getTrack(TrackId id) const {
    for (const auto& track : tracks_) {
        if (track->id == id) {
            return track.get();
        }
    }
    return nullptr;
}

std::vector<EngineTrack*> AudioEngine::getAllTracks() const {
    std::vector<EngineTrack*> result;
    result.reserve(tracks_.size());
    for (const auto& track : tracks_) {
        result.push_back(track.get());
    }
    return result;
}

// ===== Mixer =====

void AudioEngine::setTrackVolume(TrackId id, double volume) {
    if (auto* track = getTrack(id)) {
        track->volume = MixUtils::clampVolume(volume);
        applyMix(*track);
    }
}

void AudioEngine::setTrackPan(TrackId id, double pan) {
    if (auto* track = getTrack(id)) {
        track->pan = MixUtils::clampPan(pan);
        applyMix(*track);
    }
}

void AudioEngine::setTrackMute(TrackId id, bool muted) {
    if (auto* track = getTrack(id)) {
        track->muted = muted;
        applyMix(*track);
    }
}

void AudioEngine::setTrackSolo(TrackId id, bool soloed) {
    if (auto* track = getTrack(id)) {
        if (track->soloed == soloed) {
            return;
        }
        track->soloed = soloed;
        // Solo changes what every other track hears
        applyMixToAll();
    }
}

double AudioEngine::getEffectiveVolumeDb(TrackId id) const {
    const auto* track = getTrack(id);
    if (!track) {
        return MixUtils::silenceDb();
    }
    return MixUtils::volumeToDecibels(track->volume, track->muted || isSilencedBySolo(*track));
}

// ===== Timeline data =====

void AudioEngine::setTrackPosition(TrackId id, double x) {
    if (auto* track = getTrack(id)) {
        track->positionX = x;
    }
}

void AudioEngine::setTrackDuration(TrackId id, std::optional<double> duration) {
    if (auto* track = getTrack(id)) {
        track->duration = duration;
    }
}

void AudioEngine::setTrackTrim(TrackId id, double trimStart, std::optional<double> trimEnd) {
    if (auto* track = getTrack(id)) {
        track->trimStart = trimStart;
        track->trimEnd = trimEnd;
    }
}

std::optional<double> AudioEngine::getSourceDuration(TrackId id) const {
    const auto* track = getTrack(id);
    if (track == nullptr || !track->unit) {
        return std::nullopt;
    }
    return track->unit->getDuration();
}

void AudioEngine::setTrackSequence(TrackId id, std::vector<SequenceNote> sequence) {
    if (auto* track = getTrack(id)) {
        track->sequence = std::move(sequence);
    }
}

// ===== Playback =====

void AudioEngine::stopAllPlayback() {
    for (auto& track : tracks_) {
        // Stopping a unit that is not started is an invalid state for some backends
        if (track->unit && track->unit->getState() == UnitState::Started) {
            track->unit->stop();
        }
    }
}

void AudioEngine::pauseAllPlayback() {
    DBG("ENGINE: Pausing " << (int)tracks_.size() << " tracks via the clock");
}

TransportClock& AudioEngine::getClock() {
    return backend_.getClock();
}

NoteOutput& AudioEngine::getNoteOutput() {
    return backend_.getNoteOutput();
}

// ===== Helpers =====

bool AudioEngine::isSilencedBySolo(const EngineTrack& track) const {
    if (track.soloed) {
        return false;
    }
    return std::any_of(tracks_.begin(), tracks_.end(),
                       [](const auto& t) { return t->soloed; });
}

void AudioEngine::applyMix(EngineTrack& track) {
    if (!track.channel) {
        return;
    }
    track.channel->setVolumeDb(MixUtils::volumeToDecibels(track.volume));
    track.channel->setPan(MixUtils::panToChannel(track.pan));
    track.channel->setMute(track.muted || isSilencedBySolo(track));
}

void AudioEngine::applyMixToAll() {
    for (auto& track : tracks_) {
        applyMix(*track);
    }
}

}  // namespace beatline
