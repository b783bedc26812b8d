/*
 * GRBL Controller - Implementation
 */

#include "grbl_controller.h"
#include "../debug_config.h"

#include <math.h>
#include <stdio.h>
#include <algorithm>
#include <chrono>

#define LOG(fmt, ...) CONTROLLER_LOG("Controller", fmt, ##__VA_ARGS__)

// ============================================================================
// Lifecycle
// ============================================================================

GrblController::GrblController(const ControllerSettings& settings, SerialChannelFactory factory)
    : _settings(settings),
      _connection(_session, std::move(factory), settings),
      _sync(_session, _connection, settings.statusTimeoutMs) {
    _connection.onUnsolicited([this](const GrblResponse& response, std::optional<uint32_t> alarmCode) {
        captureLine(response);
        _sync.handleUnsolicited(response, alarmCode);
    });
}

GrblController::~GrblController() {
    _sync.stopPoller();
    _connection.disconnect();
}

// ============================================================================
// Connection
// ============================================================================

CommandResult GrblController::connect(const std::string& port, uint32_t baudRate) {
    std::vector<uint32_t> rates = supportedBaudRates();
    if (std::find(rates.begin(), rates.end(), baudRate) == rates.end()) {
        char msg[48];
        snprintf(msg, sizeof(msg), "unsupported baud rate %u", (unsigned)baudRate);
        return record(CommandResult::failure(ErrorCode::InvalidState, msg));
    }

    CommandResult result = _connection.connect(port, baudRate);
    if (!result.ok()) {
        return record(result);
    }

    // Populate the snapshot straight away; a miss only leaves it stale
    _sync.pollOnce();
    return result;
}

CommandResult GrblController::disconnect() {
    _connection.disconnect();
    return CommandResult::success();
}

std::vector<PortInfo> GrblController::listPorts() const {
    PortEnumerator enumerator;
    return enumerator.listPorts();
}

std::vector<uint32_t> GrblController::supportedBaudRates() {
    return PortEnumerator::supportedBaudRates();
}

// ============================================================================
// Status
// ============================================================================

ControllerSnapshot GrblController::snapshot() const {
    return _session.snapshot();
}

CommandResult GrblController::pollOnce() {
    if (_sync.pollOnce() == PollResult::NotConnected) {
        return CommandResult::failure(ErrorCode::NotConnected, "not connected");
    }
    return CommandResult::success();
}

bool GrblController::startPolling(uint32_t intervalMs) {
    return _sync.startPoller(intervalMs != 0 ? intervalMs : _settings.pollIntervalMs);
}

void GrblController::stopPolling() {
    _sync.stopPoller();
}

// ============================================================================
// Motion
// ============================================================================

CommandResult GrblController::jog(std::optional<double> x, std::optional<double> y, std::optional<double> z,
                                  double feed, bool incremental) {
    if (!x && !y && !z) {
        return record(CommandResult::failure(ErrorCode::InvalidState, "jog needs at least one axis"));
    }
    if (!(feed > 0.0)) {
        return record(CommandResult::failure(ErrorCode::InvalidState, "jog feed rate must be positive"));
    }

    std::string line = GrblProtocol::buildJogCommand(x, y, z, feed, incremental);

    std::future<CommandResult> future;
    uint64_t commandId = 0;
    std::optional<CommandResult> rejected;
    bool connected = _connection.withWorker([&](SerialWorker& worker) {
        MachineState state = _session.status().state;
        if (state != MachineState::Idle && state != MachineState::Jog) {
            rejected = CommandResult::failure(ErrorCode::InvalidState,
                                              std::string("cannot jog in ") + GrblStatus::machineStateName(state) + " state");
            return;
        }
        future = worker.submitCommand(line, _settings.command, &commandId);
    });

    if (!connected) {
        return record(CommandResult::failure(ErrorCode::NotConnected, "not connected"));
    }
    if (rejected) {
        LOG("Jog rejected: %s", rejected->error->message.c_str());
        return record(*rejected);
    }
    return record(awaitCommand(future, _settings.command, commandId));
}

CommandResult GrblController::jogCancel() {
    bool sent = false;
    _connection.withWorker([&](SerialWorker& worker) {
        sent = worker.sendRealtime(GrblProtocol::RT_JOG_CANCEL);
    });
    if (!sent) {
        LOG("Jog cancel not sent (ignored)");
    }
    return CommandResult::success();
}

CommandResult GrblController::home() {
    return record(sendCommand(GrblProtocol::CMD_HOME, _settings.homing));
}

CommandResult GrblController::unlock() {
    return record(sendCommand(GrblProtocol::CMD_UNLOCK, _settings.command));
}

// ============================================================================
// Real-time control
// ============================================================================

CommandResult GrblController::softReset() {
    CommandResult result = sendRealtime(GrblProtocol::RT_SOFT_RESET);
    if (!result.ok()) {
        return record(result);
    }

    _session.update([](SessionData& data) {
        data.status = MachineStatus();
        data.statusFresh = false;
    });
    return result;
}

CommandResult GrblController::feedHold() {
    return record(sendRealtime(GrblProtocol::RT_FEED_HOLD));
}

CommandResult GrblController::cycleStart() {
    return record(sendRealtime(GrblProtocol::RT_CYCLE_START));
}

CommandResult GrblController::feedOverride(OverrideAdjust adjust) {
    return record(sendRealtime(GrblProtocol::feedOverrideByte(adjust)));
}

CommandResult GrblController::spindleOverride(OverrideAdjust adjust) {
    return record(sendRealtime(GrblProtocol::spindleOverrideByte(adjust)));
}

CommandResult GrblController::rapidOverride(RapidPreset preset) {
    return record(sendRealtime(GrblProtocol::rapidOverrideByte(preset)));
}

CommandResult GrblController::safetyDoor() {
    return record(sendRealtime(GrblProtocol::RT_SAFETY_DOOR));
}

CommandResult GrblController::toggleSpindleStop() {
    return record(sendRealtime(GrblProtocol::RT_SPINDLE_STOP_TOGGLE));
}

CommandResult GrblController::toggleFlood() {
    return record(sendRealtime(GrblProtocol::RT_COOLANT_FLOOD_TOGGLE));
}

CommandResult GrblController::toggleMist() {
    return record(sendRealtime(GrblProtocol::RT_COOLANT_MIST_TOGGLE));
}

// ============================================================================
// Device queries
// ============================================================================

CommandResult GrblController::queryDevice(DeviceQuery query, std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> queryLock(_queryMutex);
    {
        std::lock_guard<std::mutex> lock(_captureMutex);
        _captured.clear();
        _capturing = true;
    }

    CommandResult result = sendCommand(GrblProtocol::deviceQueryCommand(query), _settings.command);

    {
        std::lock_guard<std::mutex> lock(_captureMutex);
        _capturing = false;
        lines.swap(_captured);
        _captured.clear();
    }
    return record(result);
}

CommandResult GrblController::toggleCheckMode() {
    return record(sendCommand(GrblProtocol::CMD_CHECK_MODE, _settings.command));
}

void GrblController::captureLine(const GrblResponse& response) {
    std::lock_guard<std::mutex> lock(_captureMutex);
    if (!_capturing) return;

    if (response.type == GrblResponse::Type::Setting) {
        _captured.push_back("$" + std::to_string(response.code) + "=" + response.text);
    } else if (response.type == GrblResponse::Type::Message) {
        _captured.push_back(response.text);
    }
}

// ============================================================================
// Framing
// ============================================================================

CommandResult GrblController::runFrame(const FrameBounds& bounds, double feed, uint32_t power,
                                       Units units, LaserMode mode) {
    if (!_connection.isConnected()) {
        return record(CommandResult::failure(ErrorCode::NotConnected, "not connected"));
    }

    double width = fabs(bounds.xMax - bounds.xMin);
    double height = fabs(bounds.yMax - bounds.yMin);
    if (width == 0.0 || height == 0.0) {
        return record(CommandResult::failure(ErrorCode::InvalidState, "frame must have non-zero width and height"));
    }
    if (!(feed > 0.0)) {
        return record(CommandResult::failure(ErrorCode::InvalidState, "frame feed rate must be positive"));
    }
    if (power > _settings.maxLaserPower) {
        char msg[64];
        snprintf(msg, sizeof(msg), "laser power %u exceeds maximum %u",
                 (unsigned)power, (unsigned)_settings.maxLaserPower);
        return record(CommandResult::failure(ErrorCode::InvalidState, msg));
    }

    std::vector<std::string> program = GrblProtocol::buildFrameProgram(bounds, feed, power, units, mode);

    for (size_t i = 0; i < program.size(); i++) {
        std::future<CommandResult> future;
        uint64_t commandId = 0;
        std::optional<CommandResult> rejected;

        bool connected = _connection.withWorker([&](SerialWorker& worker) {
            if (i == 0) {
                MachineState state = _session.status().state;
                if (state != MachineState::Idle) {
                    rejected = CommandResult::failure(ErrorCode::InvalidState,
                                                      std::string("cannot frame in ") + GrblStatus::machineStateName(state) + " state");
                    return;
                }
            }
            future = worker.submitCommand(program[i], _settings.command, &commandId);
        });

        if (!connected) {
            return record(CommandResult::failure(ErrorCode::NotConnected, "not connected"));
        }
        if (rejected) {
            return record(*rejected);
        }

        CommandResult result = awaitCommand(future, _settings.command, commandId);
        if (!result.ok()) {
            LOG("Frame stopped at line %u '%s'", (unsigned)(i + 1), program[i].c_str());
            return record(result);
        }
    }

    return CommandResult::success();
}

// ============================================================================
// Helpers
// ============================================================================

CommandResult GrblController::sendCommand(const std::string& line, const RequestPolicy& policy) {
    std::future<CommandResult> future;
    uint64_t commandId = 0;
    bool connected = _connection.withWorker([&](SerialWorker& worker) {
        future = worker.submitCommand(line, policy, &commandId);
    });
    if (!connected) {
        return CommandResult::failure(ErrorCode::NotConnected, "not connected");
    }
    return awaitCommand(future, policy, commandId);
}

CommandResult GrblController::sendRealtime(uint8_t byte) {
    bool sent = false;
    bool connected = _connection.withWorker([&](SerialWorker& worker) {
        sent = worker.sendRealtime(byte);
    });
    if (!connected || !sent) {
        return CommandResult::failure(ErrorCode::NotConnected, "not connected");
    }
    return CommandResult::success();
}

CommandResult GrblController::awaitCommand(std::future<CommandResult>& future, const RequestPolicy& policy,
                                           uint64_t commandId) {
    std::chrono::milliseconds budget((uint64_t)policy.timeoutMs * (policy.retries + 1u) + CONTROLLER_WAIT_MARGIN_MS);
    if (future.wait_for(budget) == std::future_status::ready) {
        return future.get();
    }

    // Still queued behind a slow command: withdraw it so it never runs late
    bool withdrawn = false;
    _connection.withWorker([&](SerialWorker& worker) {
        withdrawn = worker.withdrawCommand(commandId);
    });
    if (withdrawn) {
        LOG("Command %llu withdrawn before it was sent", (unsigned long long)commandId);
        return future.get();
    }

    // Already written: the worker's retry policy resolves it
    if (future.wait_for(budget) != std::future_status::ready) {
        return CommandResult::failure(ErrorCode::Timeout, "controller did not answer in time");
    }
    return future.get();
}

CommandResult GrblController::record(const CommandResult& result) {
    if (!result.ok()) {
        _session.recordError(*result.error);
    }
    return result;
}
