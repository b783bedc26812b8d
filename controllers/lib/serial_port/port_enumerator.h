/*
 * Port Enumerator - Lists candidate serial ports
 *
 * Scans the Linux sysfs tty class. Virtual terminals (no backing device)
 * and unpopulated legacy platform UARTs are skipped. USB ports report the
 * manufacturer, product and serial number strings of the USB device.
 */

#ifndef PORT_ENUMERATOR_H
#define PORT_ENUMERATOR_H

#include <stdint.h>
#include <optional>
#include <string>
#include <vector>

constexpr const char* PORT_ENUMERATOR_SYSFS_ROOT = "/sys/class/tty";

/**
 * @brief One enumerated serial port
 */
struct PortInfo {
    std::string path;                   // /dev/ttyUSB0
    std::string portType;               // "USB", "PCI", "Bluetooth", "Unknown"
    std::optional<std::string> manufacturer;
    std::optional<std::string> product;
    std::optional<std::string> serialNumber;
};

class PortEnumerator {
public:
    /**
     * @param sysfsRoot tty class directory to scan
     * @param devRoot Directory device nodes live in
     */
    explicit PortEnumerator(const std::string& sysfsRoot = PORT_ENUMERATOR_SYSFS_ROOT,
                            const std::string& devRoot = "/dev");

    /**
     * @brief Enumerate ports, sorted by path
     * @return Port list (empty if the sysfs root is unreadable)
     */
    std::vector<PortInfo> listPorts() const;

    /**
     * @brief Baud rates offered to callers (9600 ... 230400)
     */
    static std::vector<uint32_t> supportedBaudRates();

private:
    bool describePort(const std::string& name, PortInfo& out) const;

    std::string _sysfsRoot;
    std::string _devRoot;
};

#endif // PORT_ENUMERATOR_H
