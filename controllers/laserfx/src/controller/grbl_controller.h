/*
 * GRBL Controller - Facade over one GRBL laser/motion controller session
 *
 * Owns the session state, the connection manager and the status
 * synchronizer. Every operation returns a CommandResult; expected device
 * conditions (not connected, alarm, timeouts) never throw. Failures other
 * than jog cancel and poll staleness are recorded as the snapshot's last
 * error.
 *
 * Usage:
 *   GrblController controller(settings);
 *   controller.connect("/dev/ttyUSB0", 115200);
 *   controller.startPolling();
 *   controller.jog(10.0, std::nullopt, std::nullopt, 1000.0, true);
 *   ControllerSnapshot snap = controller.snapshot();
 */

#ifndef GRBL_CONTROLLER_H
#define GRBL_CONTROLLER_H

#include <stdint.h>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <grbl_protocol.h>
#include <port_enumerator.h>
#include <serial_port.h>

#include "connection_manager.h"
#include "controller_types.h"
#include "status_sync.h"

class GrblController {
public:
    explicit GrblController(const ControllerSettings& settings = ControllerSettings(),
                            SerialChannelFactory factory = PosixSerialPort::factory());
    ~GrblController();

    GrblController(const GrblController&) = delete;
    GrblController& operator=(const GrblController&) = delete;

    // ---- Connection ----

    CommandResult connect(const std::string& port, uint32_t baudRate = GrblProtocol::DEFAULT_BAUD_RATE);
    CommandResult disconnect();

    std::vector<PortInfo> listPorts() const;
    static std::vector<uint32_t> supportedBaudRates();

    // ---- Status ----

    /**
     * @brief Consistent copy of connection, status, banner, last error, alarm
     */
    ControllerSnapshot snapshot() const;

    /**
     * @brief Query status once; a missed reply only marks the status stale
     * @return NOT_CONNECTED when there is no session, success otherwise
     */
    CommandResult pollOnce();

    bool startPolling(uint32_t intervalMs = 0);     // 0 = configured interval
    void stopPolling();
    bool isPolling() const { return _sync.isPolling(); }

    // ---- Motion ----

    /**
     * @brief Jog the given axes (only in idle or jog state)
     * @param incremental true: distances (G91), false: absolute targets (G90)
     */
    CommandResult jog(std::optional<double> x, std::optional<double> y, std::optional<double> z,
                      double feed, bool incremental = true);

    /**
     * @brief Cancel any jog in progress; always succeeds
     */
    CommandResult jogCancel();

    CommandResult home();
    CommandResult unlock();

    // ---- Real-time control ----

    CommandResult softReset();
    CommandResult feedHold();
    CommandResult cycleStart();

    CommandResult feedOverride(OverrideAdjust adjust);
    CommandResult spindleOverride(OverrideAdjust adjust);
    CommandResult rapidOverride(RapidPreset preset);

    CommandResult safetyDoor();
    CommandResult toggleSpindleStop();
    CommandResult toggleFlood();
    CommandResult toggleMist();

    // ---- Device queries ----

    /**
     * @brief Run $$, $G or $I and collect the report lines printed before "ok"
     * @param lines Receives "$N=value" settings or bracket payloads ("GC:G0 G54 ...")
     */
    CommandResult queryDevice(DeviceQuery query, std::vector<std::string>& lines);

    /**
     * @brief Toggle g-code check mode ($C); the device answers with a message
     */
    CommandResult toggleCheckMode();

    // ---- Framing ----

    /**
     * @brief Trace the bounding rectangle of a job
     *
     * Machine must be idle; the rectangle needs non-zero width and height,
     * a positive feed and power within 0..max laser power. Lines are sent
     * in order and the first failure stops the sequence.
     */
    CommandResult runFrame(const FrameBounds& bounds, double feed, uint32_t power,
                           Units units = Units::Millimeters, LaserMode mode = LaserMode::Dynamic);

    // ---- Info ----

    const ControllerSettings& settings() const { return _settings; }
    std::optional<SerialWorkerStats> workerStats() const { return _connection.workerStats(); }

private:
    CommandResult sendCommand(const std::string& line, const RequestPolicy& policy);
    CommandResult sendRealtime(uint8_t byte);
    CommandResult awaitCommand(std::future<CommandResult>& future, const RequestPolicy& policy,
                               uint64_t commandId);
    CommandResult record(const CommandResult& result);
    void captureLine(const GrblResponse& response);

    ControllerSettings _settings;
    SessionState _session;
    ConnectionManager _connection;
    StatusSync _sync;

    std::mutex _queryMutex;             // one device query at a time
    std::mutex _captureMutex;
    bool _capturing = false;
    std::vector<std::string> _captured;
};

#endif // GRBL_CONTROLLER_H
