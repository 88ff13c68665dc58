#pragma once

/**
 * @file context_store.h
 * @brief Concurrency-safe conversation context
 *
 * Features:
 * - Bounded conversation history (last N turns)
 * - Deep-merge updates with schema checks (prior state kept on mismatch)
 * - Lazy TTL expiry: a conversation idle longer than the TTL resets to defaults;
 *   vehicle_state/system_status refreshes and recorded vehicle events do not count as activity
 * - Optional JSON snapshot persistence
 */

#include "config.h"
#include "core/types.h"
#include "providers/component.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>

namespace cabin_voice {

/**
 * @brief Snapshot of the shared conversation context
 */
struct ConversationContext {
    std::vector<ConversationTurn> history;   ///< Oldest first, at most history_window entries
    std::string current_intent;              ///< Empty = none
    Json entities = Json::object();
    Json vehicle_state = Json::object();
    Json user_preferences = Json::object();
    Json system_status = Json::object();
    int64_t last_update_ms = 0;              ///< Wall-clock ms of the last mutation

    /// Default context (system_status.status = "ready")
    static ConversationContext defaults();

    Json to_json() const;
    static ConversationContext from_json(const Json& j);
};

/**
 * @brief Exclusive owner of the ConversationContext
 *
 * Every operation runs under one mutex; read() returns a copy, so callers
 * never observe a partially-applied update. Also registered as the
 * "context_fusion" component for health checks and recovery.
 */
class ContextStore : public Component {
public:
    explicit ContextStore(const ContextConfig& config, ClockFn clock = Clock::now);
    ~ContextStore() override;

    // Non-copyable
    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    // =========================================================================
    // Context operations
    // =========================================================================

    /**
     * @brief Consistent snapshot; resets to defaults first if the TTL has expired
     */
    ConversationContext read();

    /**
     * @brief Deep-merge a partial update
     *
     * Mapping fields (entities, vehicle_state, user_preferences, system_status)
     * are merged recursively; current_intent is replaced. A null value inside a
     * mapping removes that key.
     * @return SchemaMismatch if any field type is incompatible; nothing is applied then
     */
    VoidResult update(const Json& partial);

    /**
     * @brief Like update(), but each mapping field present is replaced whole
     *
     * Used for per-turn entities, whose shape is owned by the understanding
     * provider and may change between turns.
     * @return SchemaMismatch if a field has the wrong top-level type
     */
    VoidResult replace(const Json& partial);

    /**
     * @brief Append a turn and truncate history to the window
     */
    void append_turn(const ConversationTurn& turn);

    /**
     * @brief Reset to defaults
     */
    void reset();

    /**
     * @brief Record a vehicle event as vehicle_state.last_event / recent_events
     */
    void record_vehicle_event(const std::string& event_type, const Json& payload);

    /// Last n turns (oldest first)
    std::vector<ConversationTurn> recent_history(size_t n);

    /// Compact summary of the context (counts and key fields)
    Json summary();

    // =========================================================================
    // Persistence
    // =========================================================================

    VoidResult save(const std::string& path);
    VoidResult load(const std::string& path);

    // =========================================================================
    // Component
    // =========================================================================

    std::string name() const override;
    VoidResult start() override;
    VoidResult stop() override;
    VoidResult restart() override;
    bool health_check() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cabin_voice
