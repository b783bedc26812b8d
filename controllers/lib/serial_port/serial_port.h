/*
 * Serial Port - Byte channel to a GRBL controller
 *
 * Provides:
 *   - SerialChannel abstract interface (open/read/write/close)
 *   - PosixSerialPort termios implementation (raw 8N1, no flow control)
 *   - SerialChannelFactory used by the connection manager to open ports
 *
 * Reads are poll() driven: VMIN/VTIME are zero and every read takes an
 * explicit timeout, so the owning thread never blocks indefinitely.
 */

#ifndef SERIAL_PORT_H
#define SERIAL_PORT_H

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <memory>
#include <string>

// ============================================================================
// SerialChannel Interface
// ============================================================================

/**
 * @brief Abstract byte channel
 *
 * Implementations are used from a single thread (the serial worker).
 */
class SerialChannel {
public:
    virtual ~SerialChannel() = default;

    /**
     * @brief Open the channel
     * @param port Device path (e.g. /dev/ttyUSB0)
     * @param baudRate Line speed in bits per second
     * @return true on success
     */
    virtual bool open(const std::string& port, uint32_t baudRate) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * @brief Read available bytes, waiting at most timeoutMs
     * @return Bytes read (>0), 0 on timeout, -1 on error or hang-up
     */
    virtual int read(uint8_t* buffer, size_t maxLen, int timeoutMs) = 0;

    /**
     * @brief Write all bytes
     * @return Bytes written, -1 on error
     */
    virtual int write(const uint8_t* data, size_t len) = 0;

    /**
     * @brief Discard unread input (stale boot chatter)
     */
    virtual void flushInput() = 0;

    virtual const char* getName() const = 0;
};

using SerialChannelFactory = std::function<std::unique_ptr<SerialChannel>()>;

// ============================================================================
// PosixSerialPort Class
// ============================================================================

class PosixSerialPort : public SerialChannel {
public:
    PosixSerialPort() = default;
    ~PosixSerialPort() override;

    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    bool open(const std::string& port, uint32_t baudRate) override;
    void close() override;
    bool isOpen() const override { return _fd >= 0; }

    int read(uint8_t* buffer, size_t maxLen, int timeoutMs) override;
    int write(const uint8_t* data, size_t len) override;
    void flushInput() override;

    const char* getName() const override { return "PosixSerialPort"; }

    const std::string& port() const { return _port; }
    uint32_t baudRate() const { return _baudRate; }

    /**
     * @brief Factory producing PosixSerialPort instances
     */
    static SerialChannelFactory factory();

private:
    bool configure(uint32_t baudRate);

    int _fd = -1;
    std::string _port;
    uint32_t _baudRate = 0;
};

#endif // SERIAL_PORT_H
