#pragma once

/**
 * @file speech.h
 * @brief Speech input and speech output collaborator interfaces
 *
 * Recognition and synthesis live behind these interfaces; the orchestrator
 * only decides when to listen and when to speak.
 */

#include "providers/component.h"
#include "core/types.h"
#include <string>

namespace cabin_voice {

/**
 * @brief Speech capture: wake-word polling and transcription delivery
 */
class ISpeechInput : public Component {
public:
    /**
     * @brief Poll the wake-word detector (called once per loop tick while Idle)
     */
    virtual bool is_wake_word_detected() = 0;

    /**
     * @brief Register the receiver for finished utterances
     *
     * The callback may be invoked from any thread; it must only hand the
     * transcription off, never block.
     */
    virtual void set_transcription_callback(TranscriptionCallback callback) = 0;
};

/**
 * @brief Speech synthesis and playback
 */
class ISpeechOutput : public Component {
public:
    /**
     * @brief Speak text; returns once the utterance has been delivered
     * @param interrupt Cut off anything currently playing
     */
    virtual VoidResult speak(const std::string& text, bool interrupt) = 0;
};

} // namespace cabin_voice
