/*
 * Serial Port - Implementation
 */

#include "serial_port.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <stdio.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

// Debug logging
#ifndef SERIAL_PORT_DEBUG
#define SERIAL_PORT_DEBUG 0
#endif

#if SERIAL_PORT_DEBUG
#define LOG(fmt, ...) fprintf(stderr, "[SerialPort] " fmt "\n", ##__VA_ARGS__)
#else
#define LOG(fmt, ...) ((void)0)
#endif

// ============================================================================
// Helpers
// ============================================================================

static bool baudToSpeed(uint32_t baudRate, speed_t& speed) {
    switch (baudRate) {
        case 9600:   speed = B9600;   return true;
        case 19200:  speed = B19200;  return true;
        case 38400:  speed = B38400;  return true;
        case 57600:  speed = B57600;  return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        default: return false;
    }
}

// ============================================================================
// PosixSerialPort
// ============================================================================

PosixSerialPort::~PosixSerialPort() {
    close();
}

bool PosixSerialPort::open(const std::string& port, uint32_t baudRate) {
    if (_fd >= 0) {
        close();
    }

    _fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (_fd < 0) {
        fprintf(stderr, "[SerialPort] Failed to open %s: %s\n", port.c_str(), strerror(errno));
        return false;
    }

    if (!configure(baudRate)) {
        ::close(_fd);
        _fd = -1;
        return false;
    }

    _port = port;
    _baudRate = baudRate;
    LOG("Opened %s @ %u", port.c_str(), (unsigned)baudRate);
    return true;
}

bool PosixSerialPort::configure(uint32_t baudRate) {
    speed_t speed;
    if (!baudToSpeed(baudRate, speed)) {
        fprintf(stderr, "[SerialPort] Unsupported baud rate %u\n", (unsigned)baudRate);
        return false;
    }

    termios tio{};
    if (tcgetattr(_fd, &tio) != 0) {
        fprintf(stderr, "[SerialPort] tcgetattr failed: %s\n", strerror(errno));
        return false;
    }

    cfmakeraw(&tio);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(_fd, TCSANOW, &tio) != 0) {
        fprintf(stderr, "[SerialPort] tcsetattr failed: %s\n", strerror(errno));
        return false;
    }

    tcflush(_fd, TCIOFLUSH);
    return true;
}

void PosixSerialPort::close() {
    if (_fd < 0) return;
    ::close(_fd);
    _fd = -1;
    LOG("Closed %s", _port.c_str());
}

int PosixSerialPort::read(uint8_t* buffer, size_t maxLen, int timeoutMs) {
    if (_fd < 0) return -1;

    pollfd pfd{_fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeoutMs);
    if (pr == 0) return 0;
    if (pr < 0) {
        if (errno == EINTR) return 0;
        LOG("poll failed: %s", strerror(errno));
        return -1;
    }

    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        LOG("Port hang-up (revents=0x%x)", pfd.revents);
        return -1;
    }

    ssize_t n = ::read(_fd, buffer, maxLen);
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) return 0;
        LOG("read failed: %s", strerror(errno));
        return -1;
    }
    if (n == 0) {
        // readable with no data: device went away
        return -1;
    }
    return (int)n;
}

int PosixSerialPort::write(const uint8_t* data, size_t len) {
    if (_fd < 0) return -1;

    size_t written = 0;
    int stalls = 0;
    while (written < len) {
        ssize_t n = ::write(_fd, data + written, len - written);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                // Output buffer full; give up after ~1 s without progress
                if (++stalls > 10) return -1;
                pollfd pfd{_fd, POLLOUT, 0};
                if (::poll(&pfd, 1, 100) < 0 && errno != EINTR) return -1;
                continue;
            }
            LOG("write failed: %s", strerror(errno));
            return -1;
        }
        written += (size_t)n;
        stalls = 0;
    }
    return (int)written;
}

void PosixSerialPort::flushInput() {
    if (_fd >= 0) {
        tcflush(_fd, TCIFLUSH);
    }
}

SerialChannelFactory PosixSerialPort::factory() {
    return []() -> std::unique_ptr<SerialChannel> {
        return std::make_unique<PosixSerialPort>();
    };
}
