/*
 * Status Sync - Implementation
 */

#include "status_sync.h"
#include "../debug_config.h"

#include <stdio.h>
#include <chrono>
#include <future>

StatusSync::StatusSync(SessionState& session, ConnectionManager& connection, uint32_t statusTimeoutMs)
    : _session(session), _connection(connection), _statusTimeoutMs(statusTimeoutMs) {
}

StatusSync::~StatusSync() {
    stopPoller();
}

// ============================================================================
// Polling
// ============================================================================

PollResult StatusSync::pollOnce() {
    std::future<StatusQueryResult> query;
    uint64_t sessionId = 0;

    bool submitted = _connection.withWorker([&](SerialWorker& worker) {
        sessionId = _session.read([](const SessionData& data) { return data.sessionId; });
        query = worker.submitStatusQuery(_statusTimeoutMs);
    });
    if (!submitted) {
        return PollResult::NotConnected;
    }

    StatusQueryResult result;
    if (query.wait_for(std::chrono::milliseconds(_statusTimeoutMs + STATUS_SYNC_WAIT_MARGIN_MS)) ==
        std::future_status::ready) {
        result = query.get();
    }

    if (!result.status) {
        _missedPolls++;
        markStale(sessionId);
        SYNC_LOG("Missed poll (%u total)", (unsigned)_missedPolls.load());
        return PollResult::Missed;
    }

    applyReport(sessionId, *result.status, result.alarmCode);
    return PollResult::Fresh;
}

void StatusSync::applyReport(uint64_t sessionId, const MachineStatus& status, std::optional<uint32_t> alarmCode) {
    _session.update([&](SessionData& data) {
        if (data.sessionId != sessionId || !isConnected(data.connection)) {
            return;
        }

        data.status = status;
        data.statusFresh = true;

        if (status.state != MachineState::Alarm) {
            if (data.pendingAlarm) {
                SYNC_LOG("Alarm #%llu cleared", (unsigned long long)data.pendingAlarm->id);
            }
            data.pendingAlarm.reset();
            return;
        }

        uint32_t code = 0;
        if (alarmCode) {
            code = *alarmCode;
        } else if (data.pendingAlarm) {
            code = data.pendingAlarm->code;
        }

        if (data.pendingAlarm && data.pendingAlarm->code == code) {
            return;
        }

        PendingAlarm alarm;
        alarm.code = code;
        alarm.id = ++data.lastAlarmId;
        data.pendingAlarm = alarm;

        char msg[64];
        snprintf(msg, sizeof(msg), "ALARM:%u %s", (unsigned)code, GrblProtocol::alarmDescription(code));
        data.lastError = CommandError{msg, ErrorCode::Alarm, std::nullopt};
        SYNC_LOG("New alarm #%llu: %s", (unsigned long long)alarm.id, msg);
    });
}

void StatusSync::handleUnsolicited(const GrblResponse& response, std::optional<uint32_t> alarmCode) {
    switch (response.type) {
        case GrblResponse::Type::Status: {
            uint64_t sessionId = _session.read([](const SessionData& data) { return data.sessionId; });
            applyReport(sessionId, response.status, alarmCode);
            break;
        }

        case GrblResponse::Type::Welcome:
            // Device restarted under us (reset button, DTR, ...)
            _session.update([&](SessionData& data) {
                if (isConnected(data.connection)) {
                    data.welcome = response.text;
                    data.statusFresh = false;
                }
            });
            SYNC_LOG("Device restarted: %s", response.text.c_str());
            break;

        case GrblResponse::Type::Alarm:
            SYNC_LOG("ALARM:%u announced", (unsigned)response.code);
            break;

        case GrblResponse::Type::Message:
            SYNC_LOG("Message: %s", response.text.c_str());
            break;

        default:
            break;
    }
}

void StatusSync::markStale(uint64_t sessionId) {
    _session.update([&](SessionData& data) {
        if (data.sessionId == sessionId) {
            data.statusFresh = false;
        }
    });
}

// ============================================================================
// Poller
// ============================================================================

bool StatusSync::startPoller(uint32_t intervalMs) {
    if (intervalMs == 0) {
        return false;
    }

    stopPoller();

    {
        std::lock_guard<std::mutex> lock(_pollerMutex);
        _pollerStop = false;
    }
    _polling = true;
    _poller = std::thread(&StatusSync::pollLoop, this, intervalMs);
    SYNC_LOG("Poller started (%u ms)", (unsigned)intervalMs);
    return true;
}

void StatusSync::stopPoller() {
    {
        std::lock_guard<std::mutex> lock(_pollerMutex);
        _pollerStop = true;
    }
    _pollerCv.notify_all();

    if (_poller.joinable()) {
        _poller.join();
        SYNC_LOG("Poller stopped");
    }
    _polling = false;
}

void StatusSync::pollLoop(uint32_t intervalMs) {
    std::unique_lock<std::mutex> lock(_pollerMutex);
    while (!_pollerStop) {
        if (_pollerCv.wait_for(lock, std::chrono::milliseconds(intervalMs), [this] { return _pollerStop; })) {
            break;
        }
        lock.unlock();
        pollOnce();
        lock.lock();
    }
}
