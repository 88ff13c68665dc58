#pragma once

/**
 * @file component.h
 * @brief Lifecycle contract shared by every collaborator
 *
 * The orchestrator, health monitor and recovery manager drive all
 * collaborators through this interface only.
 */

#include "errors.h"
#include <string>
#include <memory>

namespace cabin_voice {

/**
 * @brief Abstract lifecycle-managed component
 */
class Component {
public:
    virtual ~Component() = default;

    /**
     * @brief Stable component name (see cabin_voice::component)
     */
    virtual std::string name() const = 0;

    virtual VoidResult start() = 0;
    virtual VoidResult stop() = 0;

    /**
     * @brief Stop and start again; used by recovery
     */
    virtual VoidResult restart() = 0;

    /**
     * @brief Liveness probe
     * @return True if the component can serve calls
     */
    virtual bool health_check() = 0;
};

using ComponentPtr = std::shared_ptr<Component>;

} // namespace cabin_voice
