/**
 * Context store behaviour.
 * Asserts:
 * - Concurrent updates are all applied (deep merge, none lost).
 * - History never exceeds the window and keeps the most recent turns.
 * - TTL expiry resets the context lazily on read; vehicle refreshes do not postpone it.
 * - replace() swaps mapping fields whole.
 * - Schema mismatches are rejected and leave the prior state untouched.
 */

#include "context_store.h"
#include "logger.h"
#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace cabin_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static ConversationTurn make_turn(const std::string& text) {
    ConversationTurn turn;
    turn.timestamp_ms = wall_ms();
    turn.speaker = speaker::USER;
    turn.text = text;
    turn.intent = "unknown";
    return turn;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    ContextConfig config;
    config.history_window = 5;

    // --- Defaults ---
    {
        ContextStore store(config);
        ConversationContext ctx = store.read();
        ASSERT(ctx.history.empty());
        ASSERT(ctx.current_intent.empty());
        ASSERT(ctx.entities.empty());
        ASSERT(ctx.system_status["status"] == "ready");
        ASSERT(store.name() == component::CONTEXT);
    }

    // --- Deep merge in submission order ---
    {
        ContextStore store(config);
        ASSERT(store.update(Json{{"entities", {{"temperature", 21}, {"zone", {{"driver", true}}}}}}).is_ok());
        ASSERT(store.update(Json{{"entities", {{"zone", {{"passenger", false}}}}}}).is_ok());
        ASSERT(store.update(Json{{"entities", {{"temperature", 23}}}, {"current_intent", "climate_control"}}).is_ok());

        ConversationContext ctx = store.read();
        ASSERT(ctx.entities["temperature"] == 23);
        ASSERT(ctx.entities["zone"]["driver"] == true);
        ASSERT(ctx.entities["zone"]["passenger"] == false);
        ASSERT(ctx.current_intent == "climate_control");

        // Null removes a key
        ASSERT(store.update(Json{{"entities", {{"zone", nullptr}}}}).is_ok());
        ASSERT(!store.read().entities.contains("zone"));

        // Unknown top-level keys are ignored
        ASSERT(store.update(Json{{"mood", "cheerful"}}).is_ok());
    }

    // --- Concurrent updates: none lost ---
    {
        ContextStore store(config);
        const int threads = 8;
        const int per_thread = 100;
        std::vector<std::thread> workers;
        for (int t = 0; t < threads; ++t) {
            workers.emplace_back([&store, t]() {
                for (int i = 0; i < per_thread; ++i) {
                    std::string key = "t" + std::to_string(t) + "_" + std::to_string(i);
                    VoidResult r = store.update(Json{{"user_preferences", {{key, i}}},
                                                     {"vehicle_state", {{"last_writer", t}}}});
                    (void)r;
                }
            });
        }
        for (auto& w : workers) w.join();

        ConversationContext ctx = store.read();
        ASSERT(ctx.user_preferences.size() == static_cast<size_t>(threads * per_thread));
        ASSERT(ctx.user_preferences["t3_42"] == 42);
        ASSERT(ctx.vehicle_state["last_writer"].is_number());
    }

    // --- History window ---
    {
        ContextStore store(config);
        for (int i = 0; i < 8; ++i) {
            store.append_turn(make_turn("turn " + std::to_string(i)));
            ASSERT(store.read().history.size() <= config.history_window);
        }
        ConversationContext ctx = store.read();
        ASSERT(ctx.history.size() == 5);
        ASSERT(ctx.history.front().text == "turn 3");
        ASSERT(ctx.history.back().text == "turn 7");

        std::vector<ConversationTurn> recent = store.recent_history(2);
        ASSERT(recent.size() == 2);
        ASSERT(recent[0].text == "turn 6");
        ASSERT(recent[1].text == "turn 7");
        ASSERT(store.recent_history(50).size() == 5);
    }

    // --- Concurrent appends keep the window ---
    {
        ContextStore store(config);
        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([&store]() {
                for (int i = 0; i < 50; ++i) store.append_turn(make_turn("x"));
            });
        }
        for (auto& w : workers) w.join();
        ASSERT(store.read().history.size() == 5);
    }

    // --- Schema mismatch keeps prior state ---
    {
        ContextStore store(config);
        ASSERT(store.update(Json{{"vehicle_state", {{"climate_control", {{"temperature", 21}}}}},
                                 {"current_intent", "navigation"}}).is_ok());
        ConversationContext before = store.read();

        VoidResult r = store.update(Json{{"entities", "not a mapping"}});
        ASSERT(r.is_error());
        ASSERT(r.error().type == ErrorType::SchemaMismatch);

        // Nested mapping replaced by a scalar, with a valid field in the same update
        r = store.update(Json{{"current_intent", "media_control"},
                              {"vehicle_state", {{"climate_control", 5}}}});
        ASSERT(r.is_error());
        ASSERT(r.error().type == ErrorType::SchemaMismatch);

        // Scalar replaced by a mapping
        r = store.update(Json{{"vehicle_state", {{"climate_control", {{"temperature", {{"c", 20}}}}}}}});
        ASSERT(r.is_error());

        r = store.update(Json{{"current_intent", 42}});
        ASSERT(r.is_error());

        r = store.update(Json::array({1, 2}));
        ASSERT(r.is_error());

        ConversationContext after = store.read();
        ASSERT(after.current_intent == "navigation");
        ASSERT(after.vehicle_state == before.vehicle_state);
        ASSERT(after.last_update_ms == before.last_update_ms);
    }

    // --- History and timestamp are not writable through update ---
    {
        ContextStore store(config);
        ASSERT(store.update(Json{{"history", Json::array()}}).error().type == ErrorType::SchemaMismatch);
        ASSERT(store.update(Json{{"conversation_history", Json::array()}}).is_error());
        ASSERT(store.update(Json{{"last_update", 0}}).is_error());
    }

    // --- TTL expiry with an injected clock ---
    {
        TimePoint now = Clock::now();
        ContextConfig ttl_config = config;
        ttl_config.ttl_ms = 30 * 60 * 1000;
        ContextStore store(ttl_config, [&now]() { return now; });

        ASSERT(store.update(Json{{"current_intent", "navigation"},
                                 {"entities", {{"destination", "airport"}}}}).is_ok());
        store.append_turn(make_turn("navigate to the airport"));

        now += std::chrono::minutes(29);
        ASSERT(store.read().current_intent == "navigation");

        // Reading does not refresh the TTL; only mutations do
        now += std::chrono::minutes(2);
        ConversationContext ctx = store.read();
        ASSERT(ctx.current_intent.empty());
        ASSERT(ctx.history.empty());
        ASSERT(ctx.entities.empty());
        ASSERT(ctx.system_status["status"] == "ready");
    }

    // --- Vehicle refreshes and events do not keep a conversation alive ---
    {
        TimePoint now = Clock::now();
        ContextConfig ttl_config = config;
        ttl_config.ttl_ms = 30 * 60 * 1000;
        ContextStore store(ttl_config, [&now]() { return now; });

        ASSERT(store.update(Json{{"current_intent", "farewell"}}).is_ok());
        store.append_turn(make_turn("goodbye"));

        for (int minute = 1; minute <= 31; ++minute) {
            now += std::chrono::minutes(1);
            ASSERT(store.update(Json{{"vehicle_state", {{"vehicle", {{"speed", minute}}}}}}).is_ok());
            store.record_vehicle_event("speed_changed", Json{{"speed", minute}});
        }
        ConversationContext ctx = store.read();
        ASSERT(ctx.history.empty());
        ASSERT(ctx.current_intent.empty());

        // A conversation update does refresh it
        ASSERT(store.update(Json{{"user_preferences", {{"units", "metric"}}}}).is_ok());
        now += std::chrono::minutes(29);
        ASSERT(store.read().user_preferences["units"] == "metric");
    }

    // --- Replace swaps mapping fields whole ---
    {
        ContextStore store(config);
        ASSERT(store.update(Json{{"entities", {{"destination", "home"}, {"avoid", "tolls"}}}}).is_ok());

        // A merge cannot turn a scalar into a mapping
        ASSERT(store.update(Json{{"entities", {{"destination", {{"name", "work"}}}}}}).is_error());

        ASSERT(store.replace(Json{{"current_intent", "navigation"},
                                  {"entities", {{"destination", {{"name", "work"}}}}}}).is_ok());
        ConversationContext ctx = store.read();
        ASSERT(ctx.current_intent == "navigation");
        ASSERT(ctx.entities["destination"]["name"] == "work");
        ASSERT(!ctx.entities.contains("avoid"));

        ASSERT(store.replace(Json{{"entities", Json::object()}}).is_ok());
        ASSERT(store.read().entities.empty());

        ASSERT(store.replace(Json{{"entities", "home"}}).error().type == ErrorType::SchemaMismatch);
        ASSERT(store.replace(Json{{"history", Json::array()}}).is_error());
    }

    // --- Vehicle events are recorded and bounded ---
    {
        ContextStore store(config);
        for (int i = 0; i < 7; ++i) {
            store.record_vehicle_event("door_open", Json{{"door", i}});
        }
        ConversationContext ctx = store.read();
        ASSERT(ctx.vehicle_state["last_event"]["type"] == "door_open");
        ASSERT(ctx.vehicle_state["last_event"]["data"]["door"] == 6);
        ASSERT(ctx.vehicle_state["recent_events"].size() == 5);

        Json summary = store.summary();
        ASSERT(summary["vehicle"]["event_count"] == 5);
        ASSERT(summary["system"]["status"] == "ready");
    }

    // --- reset ---
    {
        ContextStore store(config);
        store.append_turn(make_turn("hello"));
        store.reset();
        ASSERT(store.read().history.empty());
    }

    // --- Snapshot persistence across start/stop ---
    {
        char dir_template[] = "/tmp/cabin_voice_ctx_XXXXXX";
        char* dir = mkdtemp(dir_template);
        ASSERT(dir != nullptr);
        if (dir) {
            ContextConfig persist = config;
            persist.snapshot_path = std::string(dir) + "/context.json";
            {
                ContextStore store(persist);
                ASSERT(store.start().is_ok());
                ASSERT(store.health_check());
                ASSERT(store.update(Json{{"user_preferences", {{"temperature", 20}}}}).is_ok());
                store.append_turn(make_turn("make it cooler"));
                ASSERT(store.stop().is_ok());
                ASSERT(!store.health_check());
            }
            {
                ContextStore store(persist);
                ASSERT(store.start().is_ok());
                ConversationContext ctx = store.read();
                ASSERT(ctx.user_preferences["temperature"] == 20);
                ASSERT(ctx.history.size() == 1);
                ASSERT(ctx.history[0].text == "make it cooler");
            }

            ContextStore store(persist);
            ASSERT(store.load(std::string(dir) + "/missing.json").error().type == ErrorType::IOError);

            std::remove(persist.snapshot_path.c_str());
            rmdir(dir);
        }
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All context store tests passed.\n";
    return 0;
}
