#ifdef __linux__

    #include <hmdfinder_linux.hpp>
    #include <hmdbuilder.hpp>
    #include <usbdef.hpp>

    #include <libudev.h>

    #include <expected>
    #include <optional>
    #include <string>
    #include <string_view>
    #include <iostream>
    #include <algorithm>
    #include <charconv>

// Helper function to get udev device attribute, std::nullopt if the device doesn't provide it
auto get_device_property(struct udev_device* dev, const char* property)
    -> std::optional<std::string> {
    const char* value = udev_device_get_sysattr_value(dev, property);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

// Template function to convert string to integer types
template<typename T>
auto string_to_int(std::string_view str, int base = 10) -> std::optional<T>
    requires std::is_integral_v<T>
{
    T value = 0;
    if (str.empty()) {
        return std::nullopt;
    }
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value, base);
    if (ec == std::errc {} && ptr == str.data() + str.size()) {
        return value;
    }
    return std::nullopt;
}

// Read a numeric sysfs attribute
template<typename T>
auto get_device_int_property(struct udev_device* dev, const char* property, int base = 10)
    -> std::expected<T, std::string> {
    auto value = get_device_property(dev, property);
    if (!value.has_value()) {
        return std::unexpected(std::string("Missing attribute ") + property);
    }
    if (auto number = string_to_int<T>(value.value(), base); number.has_value()) {
        return number.value();
    }
    return std::unexpected(
        std::string("Invalid attribute ") + property + ": \"" + value.value() + "\""
    );
}

Hmd::UsbContext::UsbContext(struct udev* udev) noexcept: udev_(udev) {}

Hmd::UsbContext::UsbContext(UsbContext&& other) noexcept: udev_(other.udev_) {
    other.udev_ = nullptr;
}

Hmd::UsbContext& Hmd::UsbContext::operator=(UsbContext&& other) noexcept {
    if (this != &other) {
        if (udev_) {
            udev_unref(udev_);
        }
        udev_ = other.udev_;
        other.udev_ = nullptr;
    }
    return *this;
}

Hmd::UsbContext::~UsbContext() {
    if (udev_) {
        udev_unref(udev_);
    }
}

auto Hmd::UsbContext::create() noexcept -> std::expected<Hmd::UsbContext, std::string> {
    struct udev* udev = udev_new();
    if (!udev) {
        return std::unexpected("Failed to initialize udev");
    }
    return Hmd::UsbContext(udev);
}

auto Hmd::UsbContext::get() const noexcept -> struct udev* {
    return udev_;
}

auto Hmd::portChainFromSysname(const std::string& sysname)
    -> std::expected<std::vector<uint32_t>, std::string> {
    // Root hubs are named after their bus: usb1, usb2, ...
    if (sysname.starts_with("usb")) {
        return std::vector<uint32_t> {};
    }

    auto dash = sysname.find('-');
    if (dash == std::string::npos) {
        return std::unexpected("Not a USB device name: \"" + sysname + "\"");
    }

    // 1-2.3.4 -> bus 1, ports 2, 3, 4
    std::vector<uint32_t> portChain;
    std::string_view ports(sysname);
    ports.remove_prefix(dash + 1);
    while (true) {
        auto dot = ports.find('.');
        auto port = string_to_int<uint32_t>(ports.substr(0, dot), 10);
        if (!port.has_value()) {
            return std::unexpected("Invalid port in USB device name: \"" + sysname + "\"");
        }
        portChain.push_back(port.value());
        if (dot == std::string_view::npos) {
            break;
        }
        ports.remove_prefix(dot + 1);
    }
    return portChain;
}

auto _createDeviceRecordFromUDevDevice(udev_device* dev)
    -> std::expected<Hmd::DeviceRecord, std::string> {
    if (!dev) {
        return std::unexpected("Invalid udev device");
    }

    const char* _sysname = udev_device_get_sysname(dev);
    std::string sysname = _sysname ? _sysname : "";
    const char* _devPath = udev_device_get_syspath(dev);
    std::string devPath = _devPath ? _devPath : "";

    auto portChain = Hmd::portChainFromSysname(sysname);
    if (!portChain.has_value()) {
        return std::unexpected(portChain.error());
    }

    auto busnum = get_device_int_property<uint32_t>(dev, "busnum");
    auto devnum = get_device_int_property<uint32_t>(dev, "devnum");
    auto vid = get_device_int_property<uint16_t>(dev, "idVendor", 16);
    auto pid = get_device_int_property<uint16_t>(dev, "idProduct", 16);
    auto deviceClass = get_device_int_property<uint8_t>(dev, "bDeviceClass", 16);
    if (!busnum.has_value()) {
        return std::unexpected(devPath + ": " + busnum.error());
    }
    if (!devnum.has_value()) {
        return std::unexpected(devPath + ": " + devnum.error());
    }
    if (!vid.has_value() || !pid.has_value()) {
        return std::unexpected(devPath + ": " + (vid.has_value() ? pid.error() : vid.error()));
    }
    if (!deviceClass.has_value()) {
        return std::unexpected(devPath + ": " + deviceClass.error());
    }

    auto builder = Hmd::DeviceRecord::builder();
    builder.setBus(busnum.value())
        .setAddress(devnum.value())
        .setVID(vid.value())
        .setPID(pid.value())
        .setDeviceClass(deviceClass.value())
        .setManufacturer(get_device_property(dev, "manufacturer"))
        .setProduct(get_device_property(dev, "product"))
        .setSerial(get_device_property(dev, "serial"))
        .setRaw(devPath);
    if (portChain.value().empty()) {
        // Root hub, sits on port 0 of its own bus
        builder.setPortNumber(0);
    } else {
        builder.setPortNumber(portChain.value().back()).setPortChain(portChain.value());
    }
    return builder.build();
}

auto Hmd::list_busses(const Hmd::UsbContext& context) noexcept
    -> std::expected<std::vector<uint32_t>, std::string> {
    if (!context.get()) {
        return std::unexpected("udev context is not initialized");
    }

    struct udev_enumerate* enumerate = udev_enumerate_new(context.get());
    if (!enumerate) {
        return std::unexpected("Failed to create udev enumerator");
    }
    udev_enumerate_add_match_subsystem(enumerate, "usb");
    udev_enumerate_add_match_property(enumerate, "DEVTYPE", "usb_device");
    udev_enumerate_add_match_sysname(enumerate, "usb*");
    if (udev_enumerate_scan_devices(enumerate) < 0) {
        udev_enumerate_unref(enumerate);
        return std::unexpected("Failed to scan USB root hubs");
    }

    std::vector<uint32_t> busses;
    struct udev_list_entry* devices = udev_enumerate_get_list_entry(enumerate);
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, devices) {
        const char* path = udev_list_entry_get_name(entry);
        struct udev_device* dev = udev_device_new_from_syspath(context.get(), path);
        if (!dev) {
            continue;
        }
        if (auto busnum = get_device_int_property<uint32_t>(dev, "busnum"); busnum.has_value()) {
            busses.push_back(busnum.value());
        } else {
            std::cerr << path << ": " << busnum.error() << std::endl;
        }
        udev_device_unref(dev);
    }
    udev_enumerate_unref(enumerate);

    std::sort(busses.begin(), busses.end());
    busses.erase(std::unique(busses.begin(), busses.end()), busses.end());
    return busses;
}

auto Hmd::list_bus_devices(const Hmd::UsbContext& context, uint32_t bus) noexcept
    -> std::expected<Hmd::DeviceRecords, std::string> {
    if (!context.get()) {
        return std::unexpected("udev context is not initialized");
    }

    struct udev_enumerate* enumerate = udev_enumerate_new(context.get());
    if (!enumerate) {
        return std::unexpected("Failed to create udev enumerator");
    }
    const std::string busnum = std::to_string(bus);
    udev_enumerate_add_match_subsystem(enumerate, "usb");
    udev_enumerate_add_match_property(enumerate, "DEVTYPE", "usb_device");
    udev_enumerate_add_match_sysattr(enumerate, "busnum", busnum.c_str());
    if (udev_enumerate_scan_devices(enumerate) < 0) {
        udev_enumerate_unref(enumerate);
        return std::unexpected("Failed to scan USB devices on bus " + busnum);
    }

    Hmd::DeviceRecords records;
    struct udev_list_entry* devices = udev_enumerate_get_list_entry(enumerate);
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, devices) {
        const char* path = udev_list_entry_get_name(entry);
        struct udev_device* dev = udev_device_new_from_syspath(context.get(), path);
        if (!dev) {
            continue;
        }
        // A device we can't identify only loses its own record, not the whole bus
        if (auto record = _createDeviceRecordFromUDevDevice(dev); record.has_value()) {
            records.push_back(std::move(record.value()));
        } else {
            std::cerr << "Skipping USB device: " << record.error() << std::endl;
        }
        udev_device_unref(dev);
    }
    udev_enumerate_unref(enumerate);

    return records;
}

auto Hmd::enumerate_busses() noexcept -> std::expected<Hmd::UsbBusses, std::string> {
    auto context = Hmd::UsbContext::create();
    if (!context.has_value()) {
        return std::unexpected(context.error());
    }

    auto busNumbers = Hmd::list_busses(context.value());
    if (!busNumbers.has_value()) {
        return std::unexpected(busNumbers.error());
    }

    Hmd::UsbBusses busses;
    for (const auto& number: busNumbers.value()) {
        if (auto records = Hmd::list_bus_devices(context.value(), number); records.has_value()) {
            busses.push_back(Hmd::UsbBus { .number = number, .devices = std::move(records.value()) });
        } else {
            std::cerr << "Failed to enumerate USB bus " << number << ": " << records.error()
                      << std::endl;
        }
    }
    return busses;
}

auto Hmd::find_all() noexcept -> std::expected<Hmd::HmdDevices, std::string> {
    auto busses = Hmd::enumerate_busses();
    if (!busses.has_value()) {
        return std::unexpected(busses.error());
    }
    return Hmd::find_all(busses.value());
}

#endif // __linux__
