#pragma once

#include "common.h"
#include <memory>

namespace cabin_voice {

/**
 * @brief Conversation state enumeration
 */
enum class ConversationState {
    Idle,        ///< Resting; only a wake word (or a proactive event) leaves it
    Listening,   ///< Waiting for the next utterance
    Processing,  ///< Understanding + dialogue in progress
    Speaking     ///< Response or proactive notification being delivered
};

const char* state_name(ConversationState state);

/**
 * @brief Side effect the transition handler must perform for a transition
 */
enum class SideEffect {
    None,
    Acknowledge,               ///< Wake word: audio/UI acknowledgement
    ForwardText,               ///< Confident transcription: run understanding + dialogue
    PromptRepeat,              ///< Low-confidence transcription: "didn't catch that"
    ExecuteCommandsThenSpeak,  ///< Response ready: run attached commands, then speak
    Apologize,                 ///< Turn failed: spoken apology, keep listening
    AwaitUtterance,            ///< Response delivered, conversation continues
    EndSession,                ///< Response delivered, conversation over: reset UI, log duration
    SpeakProactive             ///< Vehicle-triggered notification
};

const char* side_effect_name(SideEffect effect);

/**
 * @brief Result of feeding one trigger to the state machine
 */
struct Transition {
    ConversationState from = ConversationState::Idle;
    ConversationState to = ConversationState::Idle;
    SideEffect effect = SideEffect::None;
    bool accepted = false;      ///< False = trigger is a no-op in the current state
};

/**
 * @brief Conversation state machine
 *
 * - Idle -> Listening (wake word)
 * - Listening -> Processing (transcription, confidence >= threshold)
 * - Listening -> Listening (transcription, confidence < threshold; prompt to repeat)
 * - Processing -> Speaking (response generated)
 * - Processing -> Listening (turn failed; apology)
 * - Speaking -> Idle (response delivered, end_conversation) / Listening (otherwise)
 * - Idle | Listening -> Speaking (proactive notification); delivered -> Idle
 *
 * A wake word outside Idle is ignored. A proactive trigger while Processing or
 * Speaking is rejected so the caller can defer it until the turn completes.
 *
 * Not internally synchronized for mutation: all on_* calls must come from the
 * single transition handler. get_state() may be read from any thread.
 */
class ConversationStateMachine {
public:
    /**
     * @param min_confidence Transcriptions below this stay in Listening
     */
    explicit ConversationStateMachine(float min_confidence = 0.7f);
    ~ConversationStateMachine();

    ConversationState get_state() const;

    /// True while a conversation (or proactive notification) is in progress
    bool is_conversation_active() const;

    /// True while Speaking a proactive notification
    bool is_proactive() const;

    Transition on_wake_word();
    Transition on_transcription(float confidence);
    Transition on_response_generated();
    Transition on_turn_failed();
    Transition on_response_delivered(bool end_conversation);
    Transition on_proactive_trigger();

    /**
     * @brief Reset state machine to Idle
     */
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace cabin_voice
