#include "state_machine.h"
#include "logger.h"
#include <atomic>

namespace cabin_voice {

const char* state_name(ConversationState state) {
    switch (state) {
        case ConversationState::Idle:       return "Idle";
        case ConversationState::Listening:  return "Listening";
        case ConversationState::Processing: return "Processing";
        case ConversationState::Speaking:   return "Speaking";
    }
    return "Unknown";
}

const char* side_effect_name(SideEffect effect) {
    switch (effect) {
        case SideEffect::None:                     return "none";
        case SideEffect::Acknowledge:              return "acknowledge";
        case SideEffect::ForwardText:              return "forward_text";
        case SideEffect::PromptRepeat:             return "prompt_repeat";
        case SideEffect::ExecuteCommandsThenSpeak: return "execute_commands_then_speak";
        case SideEffect::Apologize:                return "apologize";
        case SideEffect::AwaitUtterance:           return "await_utterance";
        case SideEffect::EndSession:               return "end_session";
        case SideEffect::SpeakProactive:           return "speak_proactive";
    }
    return "unknown";
}

class ConversationStateMachine::Impl {
public:
    explicit Impl(float min_confidence)
        : state_(ConversationState::Idle), min_confidence_(min_confidence), proactive_(false) {}

    ConversationState get_state() const {
        return state_.load();
    }

    bool is_proactive() const {
        return proactive_.load();
    }

    Transition on_wake_word() {
        if (state_ == ConversationState::Idle) {
            return go(ConversationState::Listening, SideEffect::Acknowledge);
        }
        // Wake word while a conversation is in progress is ignored
        return reject();
    }

    Transition on_transcription(float confidence) {
        if (state_ != ConversationState::Listening) {
            return reject();
        }
        if (confidence >= min_confidence_) {
            return go(ConversationState::Processing, SideEffect::ForwardText);
        }
        return go(ConversationState::Listening, SideEffect::PromptRepeat);
    }

    Transition on_response_generated() {
        if (state_ == ConversationState::Processing) {
            return go(ConversationState::Speaking, SideEffect::ExecuteCommandsThenSpeak);
        }
        return reject();
    }

    Transition on_turn_failed() {
        if (state_ == ConversationState::Processing) {
            return go(ConversationState::Listening, SideEffect::Apologize);
        }
        return reject();
    }

    Transition on_response_delivered(bool end_conversation) {
        if (state_ != ConversationState::Speaking) {
            return reject();
        }
        if (proactive_ || end_conversation) {
            proactive_ = false;
            return go(ConversationState::Idle, SideEffect::EndSession);
        }
        return go(ConversationState::Listening, SideEffect::AwaitUtterance);
    }

    Transition on_proactive_trigger() {
        ConversationState current = state_;
        if (current == ConversationState::Idle || current == ConversationState::Listening) {
            proactive_ = true;
            return go(ConversationState::Speaking, SideEffect::SpeakProactive);
        }
        return reject();
    }

    void reset() {
        state_ = ConversationState::Idle;
        proactive_ = false;
    }

private:
    Transition go(ConversationState next, SideEffect effect) {
        Transition t;
        t.from = state_;
        t.to = next;
        t.effect = effect;
        t.accepted = true;
        state_ = next;
        if (t.from != t.to) {
            LOG_FSM(std::string(state_name(t.from)) + " -> " + state_name(t.to) + " (" + side_effect_name(effect) + ")");
        }
        return t;
    }

    Transition reject() const {
        Transition t;
        t.from = state_;
        t.to = t.from;
        return t;
    }

    std::atomic<ConversationState> state_;
    float min_confidence_;
    std::atomic<bool> proactive_;
};

ConversationStateMachine::ConversationStateMachine(float min_confidence)
    : pimpl_(std::make_unique<Impl>(min_confidence)) {}
ConversationStateMachine::~ConversationStateMachine() = default;

ConversationState ConversationStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool ConversationStateMachine::is_conversation_active() const {
    return pimpl_->get_state() != ConversationState::Idle;
}

bool ConversationStateMachine::is_proactive() const {
    return pimpl_->is_proactive();
}

Transition ConversationStateMachine::on_wake_word() {
    return pimpl_->on_wake_word();
}

Transition ConversationStateMachine::on_transcription(float confidence) {
    return pimpl_->on_transcription(confidence);
}

Transition ConversationStateMachine::on_response_generated() {
    return pimpl_->on_response_generated();
}

Transition ConversationStateMachine::on_turn_failed() {
    return pimpl_->on_turn_failed();
}

Transition ConversationStateMachine::on_response_delivered(bool end_conversation) {
    return pimpl_->on_response_delivered(end_conversation);
}

Transition ConversationStateMachine::on_proactive_trigger() {
    return pimpl_->on_proactive_trigger();
}

void ConversationStateMachine::reset() {
    pimpl_->reset();
}

} // namespace cabin_voice
