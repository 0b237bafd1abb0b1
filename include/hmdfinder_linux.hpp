#pragma once
#ifdef __linux__

    #include <hmdfinder.hpp>

    #include <cstdint>
    #include <expected>
    #include <string>
    #include <vector>

struct udev;

namespace Hmd {

/**
 * @brief Owns the udev handle used to enumerate USB devices.
 *
 * Nothing is initialised at load time, the enumerator creates a context for
 * each scan and the handle is released when the context goes out of scope.
 */
class UsbContext {
public:
    /// @brief Initialise udev.
    /// @return UsbContext on success, std::string on failure.
    static auto create() noexcept -> std::expected<UsbContext, std::string>;

    UsbContext(UsbContext&& other) noexcept;
    UsbContext& operator=(UsbContext&& other) noexcept;
    UsbContext(const UsbContext&) = delete;
    UsbContext& operator=(const UsbContext&) = delete;
    ~UsbContext();

    auto get() const noexcept -> struct udev*;

private:
    explicit UsbContext(struct udev* udev) noexcept;

    struct udev* udev_;
};

/// @brief Parse the port chain out of a kernel USB device name.
/// @param sysname Kernel name (ie. "1-2.3" for bus 1, port 2, port 3 or "usb1" for a root hub)
/// @return Ports from the root hub down, empty for a root hub. std::string on error.
auto portChainFromSysname(const std::string& sysname)
    -> std::expected<std::vector<uint32_t>, std::string>;

/// @brief List the numbers of all USB busses on the host.
/// @param context udev context to enumerate with
/// @return Bus numbers in ascending order, std::string on failure.
auto list_busses(const UsbContext& context) noexcept
    -> std::expected<std::vector<uint32_t>, std::string>;

/// @brief Read a DeviceRecord for every USB device on one bus, root hub included.
/// @param context udev context to enumerate with
/// @param bus Bus number
/// @return DeviceRecords on success, std::string on failure.
auto list_bus_devices(const UsbContext& context, uint32_t bus) noexcept
    -> std::expected<DeviceRecords, std::string>;

// Enumerate every bus. A bus that fails to enumerate is reported on stderr and left out.
auto enumerate_busses() noexcept -> std::expected<UsbBusses, std::string>;

} // namespace Hmd

#endif // __linux__
