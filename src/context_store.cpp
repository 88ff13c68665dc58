/**
 * @file context_store.cpp
 * @brief Context store implementation
 */

#include "context_store.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <atomic>

namespace cabin_voice {

namespace {

// Top-level fields accepted by update()
const char* const MAPPING_FIELDS[] = {"entities", "vehicle_state", "user_preferences", "system_status"};

bool is_mapping_field(const std::string& key) {
    for (const char* f : MAPPING_FIELDS) {
        if (key == f) return true;
    }
    return false;
}

// Fields the vehicle side writes; changing only these does not keep a conversation alive
bool is_vehicle_field(const std::string& key) {
    return key == "vehicle_state" || key == "system_status";
}

const char* type_label(const Json& v) {
    return v.type_name();
}

/// Recursive merge of patch into target; fails without partial writes only because
/// the caller merges into a copy.
VoidResult deep_merge(Json& target, const Json& patch, const std::string& path) {
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        const std::string key_path = path + "." + it.key();
        const Json& value = it.value();

        if (!target.contains(it.key())) {
            if (!value.is_null()) {
                target[it.key()] = value;
            }
            continue;
        }

        Json& existing = target[it.key()];
        if (value.is_null()) {
            target.erase(it.key());
        } else if (existing.is_object()) {
            if (!value.is_object()) {
                return make_schema_error(key_path + " expects a mapping, got " + type_label(value));
            }
            VoidResult nested = deep_merge(existing, value, key_path);
            if (!nested) {
                return nested;
            }
        } else if (value.is_object() && !existing.is_null()) {
            return make_schema_error(key_path + " expects " + std::string(type_label(existing)) +
                                     ", got a mapping");
        } else {
            existing = value;
        }
    }
    return VoidResult();
}

Json& mapping_field(ConversationContext& ctx, const std::string& key) {
    if (key == "entities") return ctx.entities;
    if (key == "vehicle_state") return ctx.vehicle_state;
    if (key == "user_preferences") return ctx.user_preferences;
    return ctx.system_status;
}

} // anonymous namespace

// =============================================================================
// ConversationContext
// =============================================================================

ConversationContext ConversationContext::defaults() {
    ConversationContext ctx;
    ctx.system_status = Json{
        {"status", "ready"},
        {"active_features", Json::array()},
        {"errors", Json::array()}
    };
    ctx.last_update_ms = wall_ms();
    return ctx;
}

Json ConversationContext::to_json() const {
    Json j;
    j["conversation_history"] = history;
    j["current_intent"] = current_intent.empty() ? Json() : Json(current_intent);
    j["entities"] = entities;
    j["vehicle_state"] = vehicle_state;
    j["user_preferences"] = user_preferences;
    j["system_status"] = system_status;
    j["last_update"] = last_update_ms;
    return j;
}

ConversationContext ConversationContext::from_json(const Json& j) {
    ConversationContext ctx = defaults();
    if (j.contains("conversation_history") && j["conversation_history"].is_array()) {
        ctx.history = j["conversation_history"].get<std::vector<ConversationTurn>>();
    }
    if (j.contains("current_intent") && j["current_intent"].is_string()) {
        ctx.current_intent = j["current_intent"].get<std::string>();
    }
    for (const char* f : MAPPING_FIELDS) {
        if (j.contains(f) && j[f].is_object()) {
            mapping_field(ctx, f) = j[f];
        }
    }
    if (j.contains("last_update") && j["last_update"].is_number_integer()) {
        ctx.last_update_ms = j["last_update"].get<int64_t>();
    }
    return ctx;
}

// =============================================================================
// ContextStore Implementation
// =============================================================================

class ContextStore::Impl {
public:
    Impl(const ContextConfig& config, ClockFn clock)
        : config_(config), clock_(std::move(clock)),
          context_(ConversationContext::defaults()), last_touch_(clock_()), running_(false) {
        if (config_.history_window == 0) {
            config_.history_window = 1;
        }
    }

    ConversationContext read() {
        std::lock_guard<std::mutex> lock(mutex_);
        expire_if_stale_locked();
        return context_;
    }

    VoidResult apply(const Json& partial, bool merge) {
        if (!partial.is_object()) {
            return make_schema_error(std::string("context update must be a mapping, got ") + type_label(partial));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        expire_if_stale_locked();

        ConversationContext next = context_;
        bool conversational = false;
        for (auto it = partial.begin(); it != partial.end(); ++it) {
            const std::string& key = it.key();
            const Json& value = it.value();
            if (!is_vehicle_field(key)) {
                conversational = true;
            }

            if (is_mapping_field(key)) {
                if (!value.is_object()) {
                    return make_schema_error(key + " expects a mapping, got " + type_label(value));
                }
                if (!merge) {
                    mapping_field(next, key) = value;
                    continue;
                }
                VoidResult merged = deep_merge(mapping_field(next, key), value, key);
                if (!merged) {
                    return merged;
                }
            } else if (key == "current_intent") {
                if (value.is_null()) {
                    next.current_intent.clear();
                } else if (value.is_string()) {
                    next.current_intent = value.get<std::string>();
                } else {
                    return make_schema_error(std::string("current_intent expects a string, got ") + type_label(value));
                }
            } else if (key == "conversation_history" || key == "history") {
                return make_schema_error("conversation history is append-only; use append_turn");
            } else if (key == "last_update") {
                return make_schema_error("last_update is maintained by the context store");
            } else {
                LOG_CONTEXT("Ignoring unknown context field: " + key);
            }
        }

        commit_locked(std::move(next), conversational);
        return VoidResult();
    }

    void append_turn(const ConversationTurn& turn) {
        std::lock_guard<std::mutex> lock(mutex_);
        expire_if_stale_locked();

        ConversationContext next = context_;
        next.history.push_back(turn);
        if (next.history.size() > config_.history_window) {
            next.history.erase(next.history.begin(),
                               next.history.end() - static_cast<std::ptrdiff_t>(config_.history_window));
        }
        commit_locked(std::move(next), true);
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_locked();
        LOG_CONTEXT("Context cleared");
    }

    void record_vehicle_event(const std::string& event_type, const Json& payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        expire_if_stale_locked();

        Json event = {
            {"type", event_type},
            {"data", payload},
            {"timestamp", wall_ms()}
        };

        ConversationContext next = context_;
        Json& vehicle = next.vehicle_state;
        vehicle["last_event"] = event;
        if (!vehicle.contains("recent_events") || !vehicle["recent_events"].is_array()) {
            vehicle["recent_events"] = Json::array();
        }
        Json& recent = vehicle["recent_events"];
        recent.push_back(event);
        while (recent.size() > config_.history_window) {
            recent.erase(recent.begin());
        }
        commit_locked(std::move(next), false);
    }

    std::vector<ConversationTurn> recent_history(size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        expire_if_stale_locked();
        const auto& h = context_.history;
        size_t count = std::min(n, h.size());
        return std::vector<ConversationTurn>(h.end() - static_cast<std::ptrdiff_t>(count), h.end());
    }

    Json summary() {
        ConversationContext ctx = read();
        auto sub = [](const Json& j, const char* key) {
            return j.contains(key) ? j[key] : Json::object();
        };
        auto count = [](const Json& j, const char* key) -> size_t {
            return (j.contains(key) && j[key].is_array()) ? j[key].size() : 0;
        };
        return Json{
            {"conversation", {
                {"turn_count", ctx.history.size()},
                {"user_intent", ctx.current_intent.empty() ? Json() : Json(ctx.current_intent)},
                {"entity_count", ctx.entities.size()}
            }},
            {"vehicle", {
                {"climate", sub(ctx.vehicle_state, "climate_control")},
                {"media", sub(ctx.vehicle_state, "media")},
                {"navigation", sub(ctx.vehicle_state, "navigation")},
                {"event_count", count(ctx.vehicle_state, "recent_events")}
            }},
            {"user", {
                {"preference_count", ctx.user_preferences.size()}
            }},
            {"system", {
                {"status", ctx.system_status.value("status", Json("unknown"))},
                {"active_feature_count", count(ctx.system_status, "active_features")},
                {"error_count", count(ctx.system_status, "errors")}
            }}
        };
    }

    VoidResult save(const std::string& path) {
        Json snapshot = read().to_json();

        std::ofstream file(path);
        if (!file.is_open()) {
            return make_io_error("Failed to open context snapshot for writing: " + path);
        }
        file << snapshot.dump(2);
        if (!file.good()) {
            return make_io_error("Failed to write context snapshot: " + path);
        }
        LOG_CONTEXT("Context saved to " + path);
        return VoidResult();
    }

    VoidResult load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return make_io_error("Failed to open context snapshot: " + path);
        }

        Json j;
        try {
            file >> j;
        } catch (const Json::exception& e) {
            return make_parse_error("Failed to parse context snapshot " + path + ": " + e.what());
        }
        if (!j.is_object()) {
            return make_schema_error("Context snapshot is not a mapping: " + path);
        }

        ConversationContext loaded;
        try {
            loaded = ConversationContext::from_json(j);
        } catch (const Json::exception& e) {
            return make_schema_error("Context snapshot has unexpected field types: " + std::string(e.what()));
        }
        if (loaded.history.size() > config_.history_window) {
            loaded.history.erase(loaded.history.begin(),
                                 loaded.history.end() - static_cast<std::ptrdiff_t>(config_.history_window));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.ttl_ms > 0 && wall_ms() - loaded.last_update_ms > config_.ttl_ms) {
            LOG_CONTEXT("Context snapshot expired, starting from defaults");
            reset_locked();
            return VoidResult();
        }
        context_ = std::move(loaded);
        last_touch_ = clock_();
        LOG_CONTEXT("Context loaded from " + path);
        return VoidResult();
    }

    VoidResult start() {
        if (!config_.snapshot_path.empty()) {
            std::ifstream probe(config_.snapshot_path);
            if (probe.good()) {
                VoidResult loaded = load(config_.snapshot_path);
                if (!loaded) {
                    Logger::warn("[Context] " + loaded.error().message + "; starting from defaults");
                }
            }
        }
        running_ = true;
        return VoidResult();
    }

    VoidResult stop() {
        if (!running_.exchange(false)) {
            return VoidResult();
        }
        if (!config_.snapshot_path.empty()) {
            return save(config_.snapshot_path);
        }
        return VoidResult();
    }

    bool health_check() const {
        return running_;
    }

private:
    void expire_if_stale_locked() {
        if (config_.ttl_ms <= 0) {
            return;
        }
        auto idle_ms = std::chrono::duration_cast<Duration>(clock_() - last_touch_).count();
        if (idle_ms > config_.ttl_ms) {
            LOG_CONTEXT("Context expired after " + std::to_string(idle_ms) + " ms idle, resetting");
            reset_locked();
        }
    }

    void reset_locked() {
        context_ = ConversationContext::defaults();
        last_touch_ = clock_();
    }

    /// touch: the change belongs to the conversation and restarts the TTL
    void commit_locked(ConversationContext next, bool touch) {
        next.last_update_ms = wall_ms();
        context_ = std::move(next);
        if (touch) {
            last_touch_ = clock_();
        }
    }

    ContextConfig config_;
    ClockFn clock_;
    std::mutex mutex_;
    ConversationContext context_;
    TimePoint last_touch_;
    std::atomic<bool> running_;
};

ContextStore::ContextStore(const ContextConfig& config, ClockFn clock)
    : impl_(std::make_unique<Impl>(config, std::move(clock))) {}

ContextStore::~ContextStore() = default;

ConversationContext ContextStore::read() {
    return impl_->read();
}

VoidResult ContextStore::update(const Json& partial) {
    return impl_->apply(partial, true);
}

VoidResult ContextStore::replace(const Json& partial) {
    return impl_->apply(partial, false);
}

void ContextStore::append_turn(const ConversationTurn& turn) {
    impl_->append_turn(turn);
}

void ContextStore::reset() {
    impl_->reset();
}

void ContextStore::record_vehicle_event(const std::string& event_type, const Json& payload) {
    impl_->record_vehicle_event(event_type, payload);
}

std::vector<ConversationTurn> ContextStore::recent_history(size_t n) {
    return impl_->recent_history(n);
}

Json ContextStore::summary() {
    return impl_->summary();
}

VoidResult ContextStore::save(const std::string& path) {
    return impl_->save(path);
}

VoidResult ContextStore::load(const std::string& path) {
    return impl_->load(path);
}

std::string ContextStore::name() const {
    return component::CONTEXT;
}

VoidResult ContextStore::start() {
    return impl_->start();
}

VoidResult ContextStore::stop() {
    return impl_->stop();
}

VoidResult ContextStore::restart() {
    VoidResult stopped = impl_->stop();
    if (!stopped) {
        Logger::warn("[Context] " + stopped.error().message);
    }
    return impl_->start();
}

bool ContextStore::health_check() {
    return impl_->health_check();
}

} // namespace cabin_voice
