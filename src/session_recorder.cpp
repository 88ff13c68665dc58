#include "session_recorder.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <deque>
#include <filesystem>
#include <mutex>
#include <curl/curl.h>
#include <thread>

namespace cabin_voice {

class SessionRecorder::Impl {
public:
    explicit Impl(const TelemetryConfig& config)
        : session_dir_(config.session_log_dir), feed_server_url_(config.feed_server_url),
          max_events_(config.max_events == 0 ? 1 : config.max_events),
          session_started_(false), total_events_(0), session_start_time_(Clock::now()) {
        if (!feed_server_url_.empty()) {
            // Never cleaned up: feed posts may still be running on detached threads
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }
    }

    VoidResult start_session() {
        std::lock_guard<std::mutex> lock(mutex_);

        // Generate session ID from timestamp
        auto now = std::time(nullptr);
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << "_" << std::setw(3) << std::setfill('0')
           << (wall_ms() % 1000);
        session_id_ = ss.str();
        events_.clear();
        total_events_ = 0;
        session_start_time_ = Clock::now();

        std::error_code ec;
        std::filesystem::create_directories(get_session_path(), ec);
        if (ec) {
            session_started_ = false;
            return make_io_error("Cannot create session directory " + get_session_path() + ": " + ec.message());
        }
        const std::string stream_path = get_session_path() + "/events.jsonl";
        if (event_stream_.is_open()) {
            event_stream_.close();
        }
        event_stream_.open(stream_path, std::ios::app);
        if (!event_stream_.is_open()) {
            session_started_ = false;
            return make_io_error("Cannot open " + stream_path);
        }
        session_started_ = true;
        write_session_log();
        Logger::info("[Telemetry] Session " + session_id_ + " recording to " + get_session_path());
        return VoidResult();
    }

    void finalize_session() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return;
        write_session_log();
        event_stream_.close();
        session_started_ = false;
    }

    void record_event(const std::string& event_type, const Json& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return;

        SessionEvent event;
        event.timestamp_ms = ms_since(session_start_time_);
        event.event_type = event_type;
        event.data = data;
        append_to_stream(event);
        events_.push_back(event);
        ++total_events_;
        if (events_.size() > max_events_) {
            events_.pop_front();
        }

        // Notify feed server (non-blocking)
        notify_feed_server(event);
    }

    bool is_healthy() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_started_ && std::filesystem::is_directory(get_session_path());
    }

    std::string get_session_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_id_;
    }

    std::string session_path() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_session_path();
    }

    std::vector<SessionEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<SessionEvent>(events_.begin(), events_.end());
    }

private:
    std::string get_session_path() const {
        return session_dir_ + "/" + session_id_;
    }

    // Notify feed server of new event (fire-and-forget, non-blocking)
    void notify_feed_server(const SessionEvent& event) {
        if (feed_server_url_.empty()) return;  // Not configured

        Json body = {
            {"session_id", session_id_},
            {"timestamp_ms", event.timestamp_ms},
            {"event_type", event.event_type},
            {"data", event.data}
        };

        // Launch in detached thread to avoid blocking
        std::thread([url = feed_server_url_, payload = body.dump()]() {
            CURL* curl = curl_easy_init();
            if (!curl) return;

            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 500L);  // 500ms timeout
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

            CURLcode res = curl_easy_perform(curl);
            if (res != CURLE_OK) {
                Logger::debug(std::string("[Telemetry] Feed POST failed: ") + curl_easy_strerror(res));
            }

            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);
        }).detach();
    }

    static Json event_json(const SessionEvent& e) {
        return Json{
            {"timestamp_ms", e.timestamp_ms},
            {"event_type", e.event_type},
            {"data", e.data}
        };
    }

    // One line per event, so recording stays constant work for long sessions
    void append_to_stream(const SessionEvent& event) {
        event_stream_ << event_json(event).dump() << '\n';
        event_stream_.flush();
        if (!event_stream_.good()) {
            Logger::warn("[Telemetry] Cannot append to " + get_session_path() + "/events.jsonl");
            event_stream_.clear();
        }
    }

    // Written at session start and finalize only
    void write_session_log() {
        Json events = Json::array();
        for (const auto& e : events_) {
            events.push_back(event_json(e));
        }
        Json log = {
            {"session_id", session_id_},
            {"event_count", total_events_},
            {"dropped_events", total_events_ - events_.size()},
            {"events", events}
        };

        std::string path = get_session_path() + "/session.json";
        std::ofstream file(path);
        if (!file.is_open()) {
            Logger::warn("[Telemetry] Cannot write " + path);
            return;
        }
        file << log.dump(2) << "\n";
    }

    std::string session_dir_;
    std::string session_id_;
    std::string feed_server_url_;
    size_t max_events_;
    bool session_started_;
    std::deque<SessionEvent> events_;     // Most recent max_events_
    size_t total_events_;
    std::ofstream event_stream_;
    TimePoint session_start_time_;
    mutable std::mutex mutex_;
};

SessionRecorder::SessionRecorder(const TelemetryConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

SessionRecorder::~SessionRecorder() = default;

void SessionRecorder::log_event(const std::string& name, const Json& payload) {
    pimpl_->record_event(name, payload);
}

void SessionRecorder::log_interaction(const std::string& input, const NluResult& nlu,
                                      const DialogueResponse& response) {
    pimpl_->record_event("interaction", Json{
        {"input", input},
        {"nlu", nlu},
        {"response", response}
    });
}

std::string SessionRecorder::name() const {
    return component::TELEMETRY;
}

VoidResult SessionRecorder::start() {
    return pimpl_->start_session();
}

VoidResult SessionRecorder::stop() {
    pimpl_->finalize_session();
    return VoidResult();
}

VoidResult SessionRecorder::restart() {
    pimpl_->finalize_session();
    return pimpl_->start_session();
}

bool SessionRecorder::health_check() {
    return pimpl_->is_healthy();
}

std::string SessionRecorder::get_session_id() const {
    return pimpl_->get_session_id();
}

std::string SessionRecorder::get_session_path() const {
    return pimpl_->session_path();
}

std::vector<SessionEvent> SessionRecorder::events() const {
    return pimpl_->events();
}

} // namespace cabin_voice
