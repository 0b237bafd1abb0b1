#include <hmdbuilder.hpp>
#include <sstream>

namespace Hmd {

DeviceRecordBuilder& DeviceRecordBuilder::setAddress(uint32_t address) {
    address_ = address;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setBus(uint32_t bus) {
    bus_ = bus;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setPortNumber(uint32_t port) {
    portNumber_ = port;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setPortChain(const std::vector<uint32_t>& portChain) {
    portChain_ = portChain;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setVID(uint16_t vid) {
    vid_ = vid;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setPID(uint16_t pid) {
    pid_ = pid;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setDeviceClass(uint8_t deviceClass) {
    deviceClass_ = deviceClass;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setProduct(const std::optional<std::string>& product) {
    product_ = product;
    return *this;
}

DeviceRecordBuilder&
DeviceRecordBuilder::setManufacturer(const std::optional<std::string>& manufacturer) {
    manufacturer_ = manufacturer;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setSerial(const std::optional<std::string>& serial) {
    serial_ = serial;
    return *this;
}

DeviceRecordBuilder& DeviceRecordBuilder::setRaw(const std::string& raw) {
    raw_ = raw;
    return *this;
}

std::expected<DeviceRecord, std::string> DeviceRecordBuilder::build() const {
    if (auto error = validate(); error.has_value()) {
        return std::unexpected(error.value());
    }

    return DeviceRecord {
        .address = address_.value(),
        .bus = bus_.value(),
        .portNumber = portNumber_.value(),
        .portChain = portChain_,
        .vid = vid_.value(),
        .pid = pid_.value(),
        .deviceClass = deviceClass_.value(),
        .product = product_,
        .manufacturer = manufacturer_,
        .serial = serial_,
        ._raw = raw_,
    };
}

std::optional<std::string> DeviceRecordBuilder::validate() const {
    if (!bus_.has_value()) {
        return "Device bus is required but not set";
    }

    if (!address_.has_value()) {
        return "Device address is required but not set";
    }

    if (!portNumber_.has_value()) {
        return "Device port number is required but not set";
    }

    if (!vid_.has_value()) {
        return "Device vendor ID is required but not set";
    }

    if (!pid_.has_value()) {
        return "Device product ID is required but not set";
    }

    if (!deviceClass_.has_value()) {
        return "Device class is required but not set";
    }

    // The port chain has to end where the device actually sits
    if (portChain_.has_value()) {
        if (portChain_.value().empty()) {
            return "Device port chain cannot be empty";
        }
        if (portChain_.value().back() != portNumber_.value()) {
            std::stringstream ss;
            ss << "Device port chain ends in port " << portChain_.value().back()
               << " but the device is on port " << portNumber_.value();
            return ss.str();
        }
    }

    return std::nullopt; // No validation errors
}

} // namespace Hmd
