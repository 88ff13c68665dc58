#pragma once

/**
 * @file console_speech.h
 * @brief Console stand-ins for microphone and speaker
 *
 * Input lines:
 * - the wake phrase (default "hey cabin") raises the wake word
 * - "?text" is delivered with low confidence (0.3)
 * - any other line is delivered with confidence 0.95
 */

#include "config.h"
#include "providers/speech.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

namespace cabin_voice {
namespace sim {

constexpr float HIGH_CONFIDENCE = 0.95f;
constexpr float LOW_CONFIDENCE = 0.3f;

class ConsoleSpeechInput : public ISpeechInput {
public:
    /**
     * @param fd File descriptor to read lines from (stdin by default)
     */
    explicit ConsoleSpeechInput(const SimulationConfig& config, int fd = STDIN_FILENO);
    ~ConsoleSpeechInput() override;

    std::string name() const override;
    VoidResult start() override;
    VoidResult stop() override;
    VoidResult restart() override;
    bool health_check() override;

    bool is_wake_word_detected() override;
    void set_transcription_callback(TranscriptionCallback callback) override;

    /**
     * @brief Handle one input line as if it had been spoken
     */
    void submit_line(const std::string& line);

    /// Called once when the input reaches end of file or "quit"
    void set_end_of_input_handler(std::function<void()> handler);

private:
    void reader_loop();

    std::string wake_phrase_;
    int fd_;
    std::atomic<bool> running_;
    std::atomic<bool> wake_pending_;
    std::thread reader_;

    std::mutex callback_mutex_;
    TranscriptionCallback callback_;
    std::function<void()> end_of_input_;
};

class ConsoleSpeechOutput : public ISpeechOutput {
public:
    ConsoleSpeechOutput();

    std::string name() const override;
    VoidResult start() override;
    VoidResult stop() override;
    VoidResult restart() override;
    bool health_check() override;

    VoidResult speak(const std::string& text, bool interrupt) override;

    /// Everything spoken so far
    std::vector<std::string> spoken() const;

private:
    std::atomic<bool> running_;
    mutable std::mutex mutex_;
    std::vector<std::string> spoken_;
};

} // namespace sim
} // namespace cabin_voice
