/**
 * @file service.h
 * @brief Base interface for daemon services
 */

#pragma once

namespace dailyd {

/**
 * @brief A long-running component started and stopped by the daemon
 *
 * Services start in descending priority order and stop in reverse.
 */
class Service {
public:
    virtual ~Service() = default;

    /**
     * @return true if the service is running afterwards
     */
    virtual bool start() = 0;
    virtual void stop() = 0;

    virtual const char* name() const = 0;
    virtual int priority() const { return 0; }
    virtual bool is_running() const = 0;
    virtual bool is_healthy() const { return is_running(); }
};

} // namespace dailyd
