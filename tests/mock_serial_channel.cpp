/*
 * Mock Serial Channel - Implementation
 */

#include "mock_serial_channel.h"

#include <string.h>
#include <algorithm>
#include <chrono>

#include <grbl_protocol.h>

// ============================================================================
// Scripting
// ============================================================================

void MockGrblDevice::setBanner(const std::string& banner) {
    std::lock_guard<std::mutex> lock(_mutex);
    _banner = banner;
    _hasBanner = true;
}

void MockGrblDevice::clearBanner() {
    std::lock_guard<std::mutex> lock(_mutex);
    _hasBanner = false;
}

void MockGrblDevice::setStatusReply(const std::string& report) {
    std::lock_guard<std::mutex> lock(_mutex);
    _statusReply = report;
}

void MockGrblDevice::setDefaultReply(const std::string& reply) {
    std::lock_guard<std::mutex> lock(_mutex);
    _defaultReply = reply;
}

void MockGrblDevice::setReply(const std::string& prefix, const std::string& reply) {
    std::lock_guard<std::mutex> lock(_mutex);
    _rules.emplace_back(prefix, reply);
}

void MockGrblDevice::setFailOpen(bool fail) {
    std::lock_guard<std::mutex> lock(_mutex);
    _failOpen = fail;
}

void MockGrblDevice::inject(const std::string& line) {
    std::lock_guard<std::mutex> lock(_mutex);
    queueLine(line);
}

void MockGrblDevice::hangUp() {
    std::lock_guard<std::mutex> lock(_mutex);
    _hungUp = true;
    _cv.notify_all();
}

// ============================================================================
// Inspection
// ============================================================================

std::vector<std::string> MockGrblDevice::lines() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lines;
}

std::string MockGrblDevice::realtime() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _realtime;
}

size_t MockGrblDevice::countRealtime(uint8_t byte) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return (size_t)std::count(_realtime.begin(), _realtime.end(), (char)byte);
}

size_t MockGrblDevice::bytesWritten() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _bytesWritten;
}

int MockGrblDevice::openCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _opens;
}

int MockGrblDevice::closeCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closes;
}

int MockGrblDevice::flushCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _flushes;
}

bool MockGrblDevice::waitForLines(size_t count, int timeoutMs) const {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                        [&] { return _lines.size() >= count; });
}

bool MockGrblDevice::waitForRealtime(uint8_t byte, size_t count, int timeoutMs) const {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [&] {
        return (size_t)std::count(_realtime.begin(), _realtime.end(), (char)byte) >= count;
    });
}

SerialChannelFactory MockGrblDevice::factory() {
    std::shared_ptr<MockGrblDevice> self = shared_from_this();
    return [self]() -> std::unique_ptr<SerialChannel> {
        return std::unique_ptr<SerialChannel>(new MockSerialChannel(self));
    };
}

// ============================================================================
// Device Side
// ============================================================================

bool MockGrblDevice::deviceOpen() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_failOpen) return false;
    _opens++;
    _hungUp = false;
    _rx.clear();
    _lineBuffer.clear();
    if (_hasBanner) {
        queueLine("");
        queueLine(_banner);
    }
    return true;
}

void MockGrblDevice::deviceClose() {
    std::lock_guard<std::mutex> lock(_mutex);
    _closes++;
    _cv.notify_all();
}

// The banner is queued at open, so a flush only counts
void MockGrblDevice::deviceFlush() {
    std::lock_guard<std::mutex> lock(_mutex);
    _flushes++;
}

int MockGrblDevice::deviceRead(uint8_t* buffer, size_t maxLen, int timeoutMs) {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [&] { return _hungUp || !_rx.empty(); });
    if (_hungUp) return -1;
    if (_rx.empty()) return 0;

    size_t n = std::min(maxLen, _rx.size());
    memcpy(buffer, _rx.data(), n);
    _rx.erase(0, n);
    return (int)n;
}

int MockGrblDevice::deviceWrite(const uint8_t* data, size_t len) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_hungUp) return -1;

    for (size_t i = 0; i < len; i++) {
        uint8_t byte = data[i];
        _bytesWritten++;

        if (GrblProtocol::isRealtimeByte(byte)) {
            _realtime += (char)byte;
            if (byte == GrblProtocol::RT_STATUS_QUERY && !_statusReply.empty()) {
                queueLine(_statusReply);
            } else if (byte == GrblProtocol::RT_SOFT_RESET) {
                _lineBuffer.clear();
                if (_hasBanner) {
                    queueLine("");
                    queueLine(_banner);
                }
            }
            continue;
        }

        if (byte == '\n') {
            std::string line = _lineBuffer;
            _lineBuffer.clear();
            _lines.push_back(line);
            handleLine(line);
        } else if (byte != '\r') {
            _lineBuffer += (char)byte;
        }
    }

    _cv.notify_all();
    return (int)len;
}

void MockGrblDevice::queueLine(const std::string& line) {
    _rx += line;
    _rx += "\r\n";
    _cv.notify_all();
}

void MockGrblDevice::handleLine(const std::string& line) {
    for (const auto& rule : _rules) {
        if (line.compare(0, rule.first.size(), rule.first) == 0) {
            if (!rule.second.empty()) queueLine(rule.second);
            return;
        }
    }
    if (!_defaultReply.empty()) {
        queueLine(_defaultReply);
    }
}

// ============================================================================
// MockSerialChannel
// ============================================================================

bool MockSerialChannel::open(const std::string& port, uint32_t baudRate) {
    (void)port;
    (void)baudRate;
    _open = _device->deviceOpen();
    return _open;
}

void MockSerialChannel::close() {
    if (!_open) return;
    _open = false;
    _device->deviceClose();
}

int MockSerialChannel::read(uint8_t* buffer, size_t maxLen, int timeoutMs) {
    if (!_open) return -1;
    return _device->deviceRead(buffer, maxLen, timeoutMs);
}

void MockSerialChannel::flushInput() {
    if (_open) _device->deviceFlush();
}

int MockSerialChannel::write(const uint8_t* data, size_t len) {
    if (!_open) return -1;
    return _device->deviceWrite(data, len);
}
