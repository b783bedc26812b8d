/*
 * Connection Manager - Session lifecycle and operation gate
 *
 * State machine:
 *   Disconnected/Error --connect--> Connecting --banner or status--> Connected
 *                                       |                              |
 *                                       +--timeout/open failure--> Error
 *   Connected --transport failure--> Error
 *   any --disconnect--> Disconnected
 *
 * Gate:
 *   withWorker() runs its function under the gate lock only when the
 *   session is Connected, so "check connected" and "enqueue" are atomic
 *   with respect to a concurrent disconnect. The gate is never held while
 *   waiting for I/O or while joining the worker thread.
 */

#ifndef CONNECTION_MANAGER_H
#define CONNECTION_MANAGER_H

#include <stdint.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <serial_port.h>

#include "controller_types.h"
#include "serial_worker.h"

// Extra time granted on top of a request's own timeout before a caller gives up
constexpr uint32_t CONTROLLER_WAIT_MARGIN_MS = 1000;

using SessionUnsolicitedCallback =
    std::function<void(const GrblResponse& response, std::optional<uint32_t> alarmCode)>;

class ConnectionManager {
public:
    ConnectionManager(SessionState& session, SerialChannelFactory factory,
                      const ControllerSettings& settings);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open the port and confirm a GRBL device is listening
     *
     * Rejected with INVALID_STATE while Connecting or Connected. Waits for
     * the welcome banner up to the startup timeout, then sends one status
     * query. Neither answering fails with TIMEOUT.
     */
    CommandResult connect(const std::string& port, uint32_t baudRate);

    /**
     * @brief Stop the worker and return to Disconnected (idempotent)
     *
     * Every pending request resolves with NOT_CONNECTED.
     */
    void disconnect();

    /**
     * @brief Run fn against the live worker under the gate
     * @return false (fn not called) unless Connected
     */
    bool withWorker(const std::function<void(SerialWorker&)>& fn);

    bool isConnected() const;

    /**
     * @brief Handler for lines not claimed by a pending request (set before connect)
     */
    void onUnsolicited(SessionUnsolicitedCallback callback) { _unsolicitedCallback = callback; }

    std::optional<SerialWorkerStats> workerStats() const;

private:
    CommandResult failConnect(uint64_t sessionId, ErrorCode code, const std::string& message,
                              std::optional<std::string> details = std::nullopt);
    void handleFatal(const SerialWorker* worker, const std::string& message);

    SessionState& _session;
    SerialChannelFactory _factory;
    ControllerSettings _settings;

    mutable std::mutex _gate;
    std::shared_ptr<SerialWorker> _worker;

    SessionUnsolicitedCallback _unsolicitedCallback;
};

#endif // CONNECTION_MANAGER_H
