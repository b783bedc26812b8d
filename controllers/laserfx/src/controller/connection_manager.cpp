/*
 * Connection Manager - Implementation
 */

#include "connection_manager.h"
#include "../debug_config.h"

#include <stdio.h>
#include <chrono>
#include <future>
#include <utility>

#define LOG(fmt, ...) CONTROLLER_LOG("Connection", fmt, ##__VA_ARGS__)

// ============================================================================
// Lifecycle
// ============================================================================

ConnectionManager::ConnectionManager(SessionState& session, SerialChannelFactory factory,
                                     const ControllerSettings& settings)
    : _session(session), _factory(std::move(factory)), _settings(settings) {
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

// ============================================================================
// Connect
// ============================================================================

CommandResult ConnectionManager::connect(const std::string& port, uint32_t baudRate) {
    std::shared_ptr<SerialWorker> stale;
    uint64_t sessionId = 0;

    {
        std::lock_guard<std::mutex> lock(_gate);
        ConnectionState current = _session.connection();
        if (std::holds_alternative<Connection::Connected>(current)) {
            return CommandResult::failure(ErrorCode::InvalidState, "already connected");
        }
        if (std::holds_alternative<Connection::Connecting>(current)) {
            return CommandResult::failure(ErrorCode::InvalidState, "connection already in progress");
        }

        // Worker left over from a transport failure
        stale = std::move(_worker);

        sessionId = _session.update([](SessionData& data) {
            data.connection = Connection::Connecting{};
            data.status = MachineStatus();
            data.statusFresh = false;
            data.welcome.reset();
            data.lastError.reset();
            data.pendingAlarm.reset();
            return ++data.sessionId;
        });
    }

    if (stale) {
        stale->end();
    }

    LOG("Connecting to %s @ %u", port.c_str(), (unsigned)baudRate);

    std::unique_ptr<SerialChannel> channel = _factory ? _factory() : nullptr;
    if (!channel || !channel->open(port, baudRate)) {
        return failConnect(sessionId, ErrorCode::SerialError, "failed to open " + port);
    }
    // Drop whatever the device printed before we were listening
    channel->flushInput();

    std::shared_ptr<SerialWorker> worker = std::make_shared<SerialWorker>();
    const SerialWorker* raw = worker.get();

    worker->onUnsolicited([this, raw](const GrblResponse& response) {
        if (_unsolicitedCallback) {
            _unsolicitedCallback(response, raw->lastAlarmCode());
        }
    });
    worker->onFatal([this, raw](const std::string& message) {
        handleFatal(raw, message);
    });

    if (!worker->begin(std::move(channel))) {
        return failConnect(sessionId, ErrorCode::SerialError, "failed to start serial worker");
    }

    if (_settings.resetOnConnect) {
        worker->sendRealtime(GrblProtocol::RT_SOFT_RESET);
    }

    // Banner first; firmware that stays quiet gets one status query
    std::optional<std::string> banner;
    std::future<std::optional<std::string>> bannerWait = worker->submitBannerWait(_settings.startupTimeoutMs);
    if (bannerWait.wait_for(std::chrono::milliseconds(_settings.startupTimeoutMs + CONTROLLER_WAIT_MARGIN_MS)) ==
        std::future_status::ready) {
        banner = bannerWait.get();
    }

    bool linked = banner.has_value();
    if (!linked && worker->isRunning()) {
        LOG("No banner within %u ms, trying a status query", (unsigned)_settings.startupTimeoutMs);
        std::future<StatusQueryResult> check = worker->submitStatusQuery(_settings.statusTimeoutMs);
        if (check.wait_for(std::chrono::milliseconds(_settings.statusTimeoutMs + CONTROLLER_WAIT_MARGIN_MS)) ==
            std::future_status::ready) {
            linked = check.get().status.has_value();
        }
    }

    if (!worker->isRunning()) {
        worker->end();
        return failConnect(sessionId, ErrorCode::SerialError, "serial link lost while connecting");
    }

    if (!linked) {
        worker->end();
        char details[80];
        snprintf(details, sizeof(details), "no banner within %u ms and no reply to status query",
                 (unsigned)_settings.startupTimeoutMs);
        return failConnect(sessionId, ErrorCode::Timeout, "no response from controller", std::string(details));
    }

    bool installed = false;
    {
        std::lock_guard<std::mutex> lock(_gate);
        installed = _session.update([&](SessionData& data) {
            if (data.sessionId != sessionId ||
                !std::holds_alternative<Connection::Connecting>(data.connection)) {
                return false;
            }
            data.connection = Connection::Connected{port, baudRate};
            data.welcome = banner;
            return true;
        });
        if (installed) {
            _worker = worker;
        }
    }

    if (!installed) {
        // disconnect() ran while we were waiting for the device
        worker->end();
        return CommandResult::failure(ErrorCode::NotConnected, "connect cancelled");
    }

    LOG("Connected to %s @ %u%s%s", port.c_str(), (unsigned)baudRate,
        banner ? ": " : " (no banner)", banner ? banner->c_str() : "");
    return CommandResult::success();
}

CommandResult ConnectionManager::failConnect(uint64_t sessionId, ErrorCode code, const std::string& message,
                                             std::optional<std::string> details) {
    fprintf(stderr, "[Connection] Connect failed: %s\n", message.c_str());
    _session.update([&](SessionData& data) {
        if (data.sessionId == sessionId && std::holds_alternative<Connection::Connecting>(data.connection)) {
            data.connection = Connection::Error{message};
        }
    });
    return CommandResult::failure(code, message, std::move(details));
}

// ============================================================================
// Disconnect
// ============================================================================

void ConnectionManager::disconnect() {
    std::shared_ptr<SerialWorker> worker;
    {
        std::lock_guard<std::mutex> lock(_gate);
        worker = std::move(_worker);
        _session.update([](SessionData& data) {
            data.connection = Connection::Disconnected{};
            data.status = MachineStatus();
            data.statusFresh = false;
            data.welcome.reset();
            data.pendingAlarm.reset();
        });
    }

    // Outside the gate: end() joins the worker thread
    if (worker) {
        worker->end();
        LOG("Disconnected");
    }
}

// ============================================================================
// Gate
// ============================================================================

bool ConnectionManager::withWorker(const std::function<void(SerialWorker&)>& fn) {
    std::lock_guard<std::mutex> lock(_gate);
    if (!_worker || !::isConnected(_session.connection())) {
        return false;
    }
    fn(*_worker);
    return true;
}

bool ConnectionManager::isConnected() const {
    std::lock_guard<std::mutex> lock(_gate);
    return _worker && ::isConnected(_session.connection());
}

std::optional<SerialWorkerStats> ConnectionManager::workerStats() const {
    std::lock_guard<std::mutex> lock(_gate);
    if (!_worker) return std::nullopt;
    return _worker->stats();
}

// ============================================================================
// Transport Failure
// ============================================================================

// Runs on the failing worker's thread
void ConnectionManager::handleFatal(const SerialWorker* worker, const std::string& message) {
    std::lock_guard<std::mutex> lock(_gate);
    if (_worker.get() != worker) {
        // Still connecting; connect() sees the dead worker and reports it
        return;
    }

    _session.update([&](SessionData& data) {
        data.connection = Connection::Error{message};
        data.statusFresh = false;
        data.lastError = CommandError{message, ErrorCode::SerialError, std::nullopt};
    });
    LOG("Connection lost: %s", message.c_str());
}
