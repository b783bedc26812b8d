/*
 * Status Sync - Keeps the cached machine status in step with the device
 *
 * Each poll issues one status query. A report replaces the cached status
 * and marks it fresh; a missed poll keeps the cached status and marks it
 * stale. Alarms are deduplicated: a PendingAlarm id is assigned only for
 * an alarm instance the caller has not been shown yet.
 */

#ifndef STATUS_SYNC_H
#define STATUS_SYNC_H

#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

#include <grbl_protocol.h>

#include "connection_manager.h"
#include "controller_types.h"

// Extra wait on top of the status timeout before a poll is declared missed
constexpr uint32_t STATUS_SYNC_WAIT_MARGIN_MS = 200;

enum class PollResult : uint8_t {
    NotConnected = 0,
    Fresh,          // report applied
    Missed          // no report in time, status marked stale
};

class StatusSync {
public:
    StatusSync(SessionState& session, ConnectionManager& connection, uint32_t statusTimeoutMs);
    ~StatusSync();

    StatusSync(const StatusSync&) = delete;
    StatusSync& operator=(const StatusSync&) = delete;

    /**
     * @brief Issue one status query and apply the outcome
     */
    PollResult pollOnce();

    /**
     * @brief Apply a report for a session (ignored if that session is gone)
     * @param alarmCode Most recent ALARM:N code, if any
     */
    void applyReport(uint64_t sessionId, const MachineStatus& status, std::optional<uint32_t> alarmCode);

    /**
     * @brief Lines no request claimed (auto-reports, banner after reset, messages)
     */
    void handleUnsolicited(const GrblResponse& response, std::optional<uint32_t> alarmCode);

    // ---- Internal poller ----

    /**
     * @brief Start (or restart) polling every intervalMs
     * @return false if intervalMs is 0
     */
    bool startPoller(uint32_t intervalMs);
    void stopPoller();
    bool isPolling() const { return _polling.load(); }

    uint32_t missedPolls() const { return _missedPolls.load(); }

private:
    void markStale(uint64_t sessionId);
    void pollLoop(uint32_t intervalMs);

    SessionState& _session;
    ConnectionManager& _connection;
    uint32_t _statusTimeoutMs;

    std::atomic<uint32_t> _missedPolls{0};

    std::thread _poller;
    std::mutex _pollerMutex;
    std::condition_variable _pollerCv;
    bool _pollerStop = false;
    std::atomic<bool> _polling{false};
};

#endif // STATUS_SYNC_H
