/*
 * Serial Worker - Implementation
 */

#include "serial_worker.h"
#include "../debug_config.h"

#include <stdio.h>
#include <utility>

// Unique across workers, so an id never matches a later session's command
static std::atomic<uint64_t> g_nextCommandId{1};

// ============================================================================
// Helpers
// ============================================================================

static std::string stripTerminator(const std::string& payload) {
    if (!payload.empty() && payload.back() == GrblProtocol::LINE_TERMINATOR) {
        return payload.substr(0, payload.size() - 1);
    }
    return payload;
}

// ============================================================================
// Lifecycle
// ============================================================================

SerialWorker::~SerialWorker() {
    end();
}

bool SerialWorker::begin(std::unique_ptr<SerialChannel> channel) {
    if (_running.load() || _thread.joinable()) {
        WORKER_LOG("begin() while running");
        return false;
    }
    if (!channel || !channel->isOpen()) {
        WORKER_LOG("begin() with closed channel");
        return false;
    }

    _channel = std::move(channel);
    _channelClosed = false;
    _rxLine.clear();
    _rxOverflow = false;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _lastBanner.reset();
        _lastAlarmCode.reset();
        _stats = SerialWorkerStats();
    }

    _stopRequested = false;
    _running = true;
    _thread = std::thread(&SerialWorker::run, this);

    WORKER_LOG("Started on %s", _channel->getName());
    return true;
}

void SerialWorker::end() {
    _stopRequested = true;
    if (_thread.joinable()) {
        _thread.join();
    }

    std::lock_guard<std::mutex> lock(_mutex);
    size_t pending = _commands.size() + _statusQueries.size() + _bannerWaits.size();
    resolveAll(ErrorCode::NotConnected, "disconnected");
    _realtime.clear();
    closeChannel();
    if (_running.exchange(false) && pending > 0) {
        WORKER_LOG("Stopped, %u pending request(s) resolved", (unsigned)pending);
    }
}

// ============================================================================
// Submission
// ============================================================================

std::future<CommandResult> SerialWorker::submitCommand(const std::string& line, const RequestPolicy& policy,
                                                      uint64_t* id) {
    PendingCommand cmd;
    cmd.id = g_nextCommandId.fetch_add(1);
    if (id) *id = cmd.id;
    cmd.payload = line;
    if (cmd.payload.empty() || cmd.payload.back() != GrblProtocol::LINE_TERMINATOR) {
        cmd.payload += GrblProtocol::LINE_TERMINATOR;
    }
    cmd.policy = policy;
    cmd.retriesLeft = policy.retries;
    std::future<CommandResult> future = cmd.promise.get_future();

    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running.load()) {
        cmd.promise.set_value(CommandResult::failure(ErrorCode::NotConnected, "not connected"));
        return future;
    }
    _commands.push_back(std::move(cmd));
    return future;
}

bool SerialWorker::withdrawCommand(uint64_t id) {
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto it = _commands.begin(); it != _commands.end(); ++it) {
        if (it->id != id) continue;
        if (it->attempts > 0) {
            return false;
        }
        WORKER_LOG("Withdrew unsent '%s'", stripTerminator(it->payload).c_str());
        it->promise.set_value(CommandResult::failure(
            ErrorCode::Timeout, "'" + stripTerminator(it->payload) + "' not sent",
            std::string("device still busy with an earlier command")));
        _commands.erase(it);
        return true;
    }
    return false;
}

std::future<StatusQueryResult> SerialWorker::submitStatusQuery(uint32_t timeoutMs) {
    PendingStatus query;
    query.deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
    std::future<StatusQueryResult> future = query.promise.get_future();

    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running.load()) {
        query.promise.set_value(StatusQueryResult());
        return future;
    }
    _statusQueries.push_back(std::move(query));
    return future;
}

std::future<std::optional<std::string>> SerialWorker::submitBannerWait(uint32_t timeoutMs) {
    PendingBanner wait;
    wait.deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
    std::future<std::optional<std::string>> future = wait.promise.get_future();

    std::lock_guard<std::mutex> lock(_mutex);
    if (_lastBanner) {
        // Banner already arrived before anyone asked
        wait.promise.set_value(_lastBanner);
        return future;
    }
    if (!_running.load()) {
        wait.promise.set_value(std::nullopt);
        return future;
    }
    _bannerWaits.push_back(std::move(wait));
    return future;
}

bool SerialWorker::sendRealtime(uint8_t byte) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running.load()) {
        return false;
    }
    _realtime.push_back(byte);
    return true;
}

// ============================================================================
// Status
// ============================================================================

std::optional<uint32_t> SerialWorker::lastAlarmCode() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastAlarmCode;
}

size_t SerialWorker::pendingCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _commands.size() + _statusQueries.size() + _bannerWaits.size();
}

SerialWorkerStats SerialWorker::stats() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stats;
}

// ============================================================================
// Worker Thread
// ============================================================================

void SerialWorker::run() {
    uint8_t buffer[SERIAL_WORKER_RX_CHUNK];

    while (!_stopRequested.load()) {
        if (!writeRealtime() || !writeStatusQueries() || !writeNextCommand()) {
            fail("serial write failed");
            return;
        }

        int n = _channel->read(buffer, sizeof(buffer), SERIAL_WORKER_READ_TIMEOUT_MS);
        if (n < 0) {
            fail("serial read failed (device disconnected?)");
            return;
        }
        if (n > 0) {
            receive(buffer, (size_t)n);
        }

        checkTimeouts();
    }
}

bool SerialWorker::writeRealtime() {
    std::vector<uint8_t> bytes;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        bytes.assign(_realtime.begin(), _realtime.end());
        _realtime.clear();
    }

    for (uint8_t byte : bytes) {
        if (!writeBytes(&byte, 1)) {
            return false;
        }

        if (byte == GrblProtocol::RT_SOFT_RESET) {
            // Firmware discards the line it was executing
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_commands.empty() && _commands.front().sent) {
                WORKER_LOG("Soft reset aborted '%s'", stripTerminator(_commands.front().payload).c_str());
                _commands.front().promise.set_value(
                    CommandResult::failure(ErrorCode::Unknown, "aborted by soft reset"));
                _commands.pop_front();
            }
            _rxLine.clear();
            _rxOverflow = false;
        }
    }
    return true;
}

bool SerialWorker::writeStatusQueries() {
    bool needQuery = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (PendingStatus& query : _statusQueries) {
            if (!query.sent) {
                query.sent = true;
                needQuery = true;
            }
        }
    }

    if (!needQuery) return true;

    // One '?' answers every query waiting for it
    uint8_t byte = GrblProtocol::RT_STATUS_QUERY;
    return writeBytes(&byte, 1);
}

bool SerialWorker::writeNextCommand() {
    std::string payload;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_commands.empty() || _commands.front().sent) {
            return true;
        }
        PendingCommand& cmd = _commands.front();
        cmd.sent = true;
        cmd.attempts++;
        cmd.deadline = Clock::now() + std::chrono::milliseconds(cmd.policy.timeoutMs);
        _stats.commands_sent++;
        payload = cmd.payload;
    }

    WORKER_LOG("> %s", stripTerminator(payload).c_str());
    return writeBytes(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

void SerialWorker::receive(const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; i++) {
        char c = (char)data[i];

        if (c == GrblProtocol::LINE_TERMINATOR) {
            if (_rxOverflow) {
                _rxOverflow = false;
                std::lock_guard<std::mutex> lock(_mutex);
                _stats.lines_dropped++;
                WORKER_LOG("Dropped overlong line");
            } else {
                if (!_rxLine.empty() && _rxLine.back() == '\r') {
                    _rxLine.pop_back();
                }
                if (!_rxLine.empty()) {
                    handleLine(_rxLine);
                }
            }
            _rxLine.clear();
            continue;
        }

        if (_rxOverflow) continue;

        if (_rxLine.size() >= GrblProtocol::MAX_LINE_LENGTH) {
            _rxOverflow = true;
            _rxLine.clear();
            continue;
        }
        _rxLine += c;
    }
}

void SerialWorker::handleLine(const std::string& line) {
    GrblResponse resp = GrblProtocol::parseResponse(line);
    bool forward = false;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stats.lines_received++;

        bool inFlight = !_commands.empty() && _commands.front().sent;

        switch (resp.type) {
            case GrblResponse::Type::Ok:
                if (inFlight) {
                    _commands.front().promise.set_value(CommandResult::success());
                    _commands.pop_front();
                } else {
                    _stats.lines_dropped++;
                    WORKER_LOG("Dropped 'ok' with nothing in flight");
                }
                break;

            case GrblResponse::Type::Error:
                if (inFlight) {
                    PendingCommand& cmd = _commands.front();
                    char msg[96];
                    snprintf(msg, sizeof(msg), "error:%u %s", (unsigned)resp.code,
                             GrblProtocol::errorDescription(resp.code));
                    WORKER_LOG("< %s", msg);
                    cmd.promise.set_value(CommandResult::failure(ErrorCode::GrblError, msg,
                                                                 stripTerminator(cmd.payload)));
                    _commands.pop_front();
                } else {
                    _stats.lines_dropped++;
                    WORKER_LOG("Dropped 'error:%u' with nothing in flight", (unsigned)resp.code);
                }
                break;

            case GrblResponse::Type::Alarm:
                _lastAlarmCode = resp.code;
                WORKER_LOG("< ALARM:%u (%s)", (unsigned)resp.code, GrblProtocol::alarmDescription(resp.code));
                if (inFlight) {
                    PendingCommand& cmd = _commands.front();
                    char msg[96];
                    snprintf(msg, sizeof(msg), "ALARM:%u %s", (unsigned)resp.code,
                             GrblProtocol::alarmDescription(resp.code));
                    cmd.promise.set_value(CommandResult::failure(ErrorCode::Alarm, msg,
                                                                 stripTerminator(cmd.payload)));
                    _commands.pop_front();
                }
                forward = true;
                break;

            case GrblResponse::Type::Status: {
                _stats.status_reports++;
                if (resp.status.state != MachineState::Alarm) {
                    _lastAlarmCode.reset();
                }

                bool answered = false;
                for (auto it = _statusQueries.begin(); it != _statusQueries.end();) {
                    if (it->sent) {
                        StatusQueryResult result;
                        result.status = resp.status;
                        result.alarmCode = _lastAlarmCode;
                        it->promise.set_value(result);
                        it = _statusQueries.erase(it);
                        answered = true;
                    } else {
                        ++it;
                    }
                }
                forward = !answered;
                break;
            }

            case GrblResponse::Type::Welcome:
                WORKER_LOG("Banner: %s", resp.text.c_str());
                _lastBanner = resp.text;
                for (PendingBanner& wait : _bannerWaits) {
                    wait.promise.set_value(resp.text);
                }
                _bannerWaits.clear();
                forward = true;
                break;

            case GrblResponse::Type::Message:
            case GrblResponse::Type::Setting:
                forward = true;
                break;

            case GrblResponse::Type::Unknown:
                _stats.lines_dropped++;
                WORKER_LOG("Dropped unrecognised line '%s'", line.c_str());
                break;
        }
    }

    if (forward && _unsolicitedCallback) {
        _unsolicitedCallback(resp);
    }
}

void SerialWorker::checkTimeouts() {
    Clock::time_point now = Clock::now();
    std::lock_guard<std::mutex> lock(_mutex);

    if (!_commands.empty() && _commands.front().sent && now >= _commands.front().deadline) {
        PendingCommand& cmd = _commands.front();
        if (cmd.retriesLeft > 0) {
            cmd.retriesLeft--;
            cmd.sent = false;
            _stats.retries++;
            WORKER_LOG("Timeout on '%s', retrying (%u left)",
                       stripTerminator(cmd.payload).c_str(), (unsigned)cmd.retriesLeft);
        } else {
            _stats.timeouts++;
            char details[48];
            snprintf(details, sizeof(details), "%u attempt(s), %u ms each",
                     (unsigned)cmd.attempts, (unsigned)cmd.policy.timeoutMs);
            WORKER_LOG("Timeout on '%s' after %s", stripTerminator(cmd.payload).c_str(), details);
            cmd.promise.set_value(CommandResult::failure(
                ErrorCode::Timeout, "no response to '" + stripTerminator(cmd.payload) + "'", std::string(details)));
            _commands.pop_front();
        }
    }

    for (auto it = _statusQueries.begin(); it != _statusQueries.end();) {
        if (now >= it->deadline) {
            StatusQueryResult result;
            result.alarmCode = _lastAlarmCode;
            it->promise.set_value(result);
            it = _statusQueries.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = _bannerWaits.begin(); it != _bannerWaits.end();) {
        if (now >= it->deadline) {
            it->promise.set_value(std::nullopt);
            it = _bannerWaits.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================================
// Failure Handling
// ============================================================================

void SerialWorker::fail(const std::string& message) {
    fprintf(stderr, "[Worker] Transport error: %s\n", message.c_str());
    {
        std::lock_guard<std::mutex> lock(_mutex);
        resolveAll(ErrorCode::SerialError, message);
        _realtime.clear();
        closeChannel();
        _running = false;
    }

    if (_fatalCallback) {
        _fatalCallback(message);
    }
}

// Caller holds _mutex
void SerialWorker::resolveAll(ErrorCode code, const std::string& message) {
    for (PendingCommand& cmd : _commands) {
        cmd.promise.set_value(CommandResult::failure(code, message));
    }
    _commands.clear();

    for (PendingStatus& query : _statusQueries) {
        query.promise.set_value(StatusQueryResult());
    }
    _statusQueries.clear();

    for (PendingBanner& wait : _bannerWaits) {
        wait.promise.set_value(std::nullopt);
    }
    _bannerWaits.clear();
}

bool SerialWorker::writeBytes(const uint8_t* data, size_t len) {
    int written = _channel->write(data, len);
    if (written < 0 || (size_t)written != len) {
        return false;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _stats.bytes_written += (uint32_t)len;
    return true;
}

// Caller holds _mutex (or the thread is joined)
void SerialWorker::closeChannel() {
    if (_channelClosed || !_channel) return;
    _channel->close();
    _channelClosed = true;
}
