/*
 * Serial Worker - Owns the serial channel and correlates responses
 *
 * One dedicated thread owns the only handle to the channel. Callers talk to
 * it by message passing:
 *   - send-and-await: line commands, status queries, banner waits
 *     (each returns a std::future resolved by the worker)
 *   - fire-and-forget: real-time bytes (hold, resume, reset, overrides)
 *
 * Correlation:
 *   GRBL acknowledges every line with exactly one "ok" / "error:N" and has
 *   no request ids, so at most one line command is in flight and the rest
 *   wait in a strict FIFO. Real-time bytes bypass the FIFO and are written
 *   ahead of queued lines.
 *
 * Threading:
 *   Callbacks run on the worker thread and must be set before begin().
 *   They must not call end() on the same worker.
 */

#ifndef SERIAL_WORKER_H
#define SERIAL_WORKER_H

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <grbl_protocol.h>
#include <serial_port.h>

#include "controller_types.h"

// ============================================================================
// Worker Types
// ============================================================================

constexpr int SERIAL_WORKER_READ_TIMEOUT_MS = 5;
constexpr size_t SERIAL_WORKER_RX_CHUNK = 256;

/**
 * @brief Result of one status query
 */
struct StatusQueryResult {
    std::optional<MachineStatus> status;    // empty: no report within the timeout
    std::optional<uint32_t> alarmCode;      // most recent ALARM:N still relevant
};

struct SerialWorkerStats {
    uint32_t lines_received = 0;
    uint32_t lines_dropped = 0;
    uint32_t bytes_written = 0;
    uint32_t commands_sent = 0;
    uint32_t retries = 0;
    uint32_t timeouts = 0;
    uint32_t status_reports = 0;
};

using UnsolicitedCallback = std::function<void(const GrblResponse& response)>;
using FatalCallback = std::function<void(const std::string& message)>;

// ============================================================================
// SerialWorker Class
// ============================================================================

class SerialWorker {
public:
    SerialWorker() = default;
    ~SerialWorker();

    SerialWorker(const SerialWorker&) = delete;
    SerialWorker& operator=(const SerialWorker&) = delete;

    /**
     * @brief Take ownership of an open channel and start the worker thread
     * @return false if already running or the channel is not open
     */
    bool begin(std::unique_ptr<SerialChannel> channel);

    /**
     * @brief Stop the thread, resolve every pending request with
     *        NOT_CONNECTED and close the channel (idempotent)
     */
    void end();

    bool isRunning() const { return _running.load(); }

    // ---- Send-and-await ----

    /**
     * @brief Queue one line command
     * @param line Command (terminator added when missing)
     * @param policy Timeout and retry budget for this request class
     * @param id Receives the command id for withdrawCommand() (optional)
     */
    std::future<CommandResult> submitCommand(const std::string& line, const RequestPolicy& policy,
                                             uint64_t* id = nullptr);

    /**
     * @brief Remove a queued command that has never been written
     *
     * The command resolves with TIMEOUT. A command already written stays
     * under its retry policy.
     * @return true if the command was withdrawn
     */
    bool withdrawCommand(uint64_t id);

    /**
     * @brief Request one status report ('?'); never retried
     */
    std::future<StatusQueryResult> submitStatusQuery(uint32_t timeoutMs);

    /**
     * @brief Wait for the firmware welcome banner
     * @return Future resolving to the banner line, or empty on timeout
     */
    std::future<std::optional<std::string>> submitBannerWait(uint32_t timeoutMs);

    // ---- Fire-and-forget ----

    /**
     * @brief Queue a real-time byte ahead of any line command
     * @return false if the worker is not running
     */
    bool sendRealtime(uint8_t byte);

    // ---- Callbacks (set before begin) ----

    void onUnsolicited(UnsolicitedCallback callback) { _unsolicitedCallback = callback; }
    void onFatal(FatalCallback callback) { _fatalCallback = callback; }

    // ---- Status ----

    std::optional<uint32_t> lastAlarmCode() const;
    size_t pendingCount() const;
    SerialWorkerStats stats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct PendingCommand {
        uint64_t id = 0;
        std::string payload;                // terminated line
        RequestPolicy policy;
        uint8_t retriesLeft = 0;
        uint32_t attempts = 0;
        bool sent = false;
        Clock::time_point deadline;
        std::promise<CommandResult> promise;
    };

    struct PendingStatus {
        bool sent = false;
        Clock::time_point deadline;
        std::promise<StatusQueryResult> promise;
    };

    struct PendingBanner {
        Clock::time_point deadline;
        std::promise<std::optional<std::string>> promise;
    };

    void run();
    bool writeRealtime();
    bool writeNextCommand();
    bool writeStatusQueries();
    void receive(const uint8_t* data, size_t len);
    void handleLine(const std::string& line);
    void checkTimeouts();
    void fail(const std::string& message);
    void resolveAll(ErrorCode code, const std::string& message);
    bool writeBytes(const uint8_t* data, size_t len);
    void closeChannel();

    std::unique_ptr<SerialChannel> _channel;
    bool _channelClosed = true;

    std::thread _thread;
    std::atomic<bool> _running{false};
    std::atomic<bool> _stopRequested{false};

    mutable std::mutex _mutex;
    std::deque<PendingCommand> _commands;   // front is in flight once sent
    std::vector<PendingStatus> _statusQueries;
    std::vector<PendingBanner> _bannerWaits;
    std::deque<uint8_t> _realtime;
    std::optional<std::string> _lastBanner;
    std::optional<uint32_t> _lastAlarmCode;
    SerialWorkerStats _stats;

    std::string _rxLine;
    bool _rxOverflow = false;

    UnsolicitedCallback _unsolicitedCallback;
    FatalCallback _fatalCallback;
};

#endif // SERIAL_WORKER_H
