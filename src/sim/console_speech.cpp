#include "sim/console_speech.h"
#include "logger.h"
#include "utils.h"
#include <cerrno>
#include <cstring>
#include <poll.h>

namespace cabin_voice {
namespace sim {

// =============================================================================
// ConsoleSpeechInput
// =============================================================================

ConsoleSpeechInput::ConsoleSpeechInput(const SimulationConfig& config, int fd)
    : wake_phrase_(utils::normalize_copy(utils::trim_copy(config.wake_phrase))), fd_(fd),
      running_(false), wake_pending_(false) {}

ConsoleSpeechInput::~ConsoleSpeechInput() {
    VoidResult stopped = stop();
    (void)stopped;
}

std::string ConsoleSpeechInput::name() const {
    return component::SPEECH_INPUT;
}

VoidResult ConsoleSpeechInput::start() {
    if (running_) {
        return VoidResult();
    }
    running_ = true;
    wake_pending_ = false;
    if (fd_ >= 0) {
        reader_ = std::thread(&ConsoleSpeechInput::reader_loop, this);
    }
    Logger::info("[Speech] Console input ready (say \"" + wake_phrase_ + "\" to start)");
    return VoidResult();
}

VoidResult ConsoleSpeechInput::stop() {
    running_ = false;
    if (reader_.joinable()) {
        reader_.join();
    }
    return VoidResult();
}

VoidResult ConsoleSpeechInput::restart() {
    VoidResult stopped = stop();
    if (!stopped) {
        return stopped;
    }
    return start();
}

bool ConsoleSpeechInput::health_check() {
    return running_;
}

bool ConsoleSpeechInput::is_wake_word_detected() {
    return wake_pending_.exchange(false);
}

void ConsoleSpeechInput::set_transcription_callback(TranscriptionCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void ConsoleSpeechInput::set_end_of_input_handler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    end_of_input_ = std::move(handler);
}

void ConsoleSpeechInput::submit_line(const std::string& line) {
    std::string text = utils::trim_copy(line);
    if (text.empty()) {
        return;
    }

    if (utils::normalize_copy(text) == wake_phrase_) {
        wake_pending_ = true;
        return;
    }

    Transcription transcription;
    if (text[0] == '?') {
        transcription.text = utils::trim_copy(text.substr(1));
        transcription.confidence = LOW_CONFIDENCE;
    } else {
        transcription.text = text;
        transcription.confidence = HIGH_CONFIDENCE;
    }

    TranscriptionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = callback_;
    }
    if (callback) {
        callback(transcription);
    }
}

void ConsoleSpeechInput::reader_loop() {
    Logger::set_thread_name("console");
    std::string pending;
    char buf[256];

    while (running_) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::error(std::string("[Speech] poll failed: ") + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            // End of input
            if (!pending.empty()) submit_line(pending);
            break;
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t newline;
        bool quit = false;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (utils::normalize_copy(utils::trim_copy(line)) == "quit") {
                quit = true;
                break;
            }
            submit_line(line);
        }
        if (quit) break;
    }

    if (running_) {
        std::function<void()> handler;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            handler = end_of_input_;
        }
        Logger::info("[Speech] Console input closed");
        if (handler) handler();
    }
}

// =============================================================================
// ConsoleSpeechOutput
// =============================================================================

ConsoleSpeechOutput::ConsoleSpeechOutput() : running_(false) {}

std::string ConsoleSpeechOutput::name() const {
    return component::SPEECH_OUTPUT;
}

VoidResult ConsoleSpeechOutput::start() {
    running_ = true;
    return VoidResult();
}

VoidResult ConsoleSpeechOutput::stop() {
    running_ = false;
    return VoidResult();
}

VoidResult ConsoleSpeechOutput::restart() {
    running_ = true;
    return VoidResult();
}

bool ConsoleSpeechOutput::health_check() {
    return running_;
}

VoidResult ConsoleSpeechOutput::speak(const std::string& text, bool interrupt) {
    if (!running_) {
        return make_provider_error("speech output is not running");
    }
    Logger::info(std::string("[TTS] ") + (interrupt ? "(interrupt) " : "") + text);
    std::lock_guard<std::mutex> lock(mutex_);
    spoken_.push_back(text);
    return VoidResult();
}

std::vector<std::string> ConsoleSpeechOutput::spoken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spoken_;
}

} // namespace sim
} // namespace cabin_voice
