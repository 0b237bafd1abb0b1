#pragma once

#include <usbtree.hpp>
#include <optional>
#include <expected>
#include <string>
#include <vector>

namespace Hmd {

/**
 * @brief Builder class for constructing DeviceRecord objects with validation.
 *
 * The DeviceRecordBuilder provides a fluent interface for creating DeviceRecord
 * objects. Identity and position fields are required, the descriptor strings
 * and the port chain are optional. Validation happens in build().
 *
 * @code{.cpp}
 * auto record = Hmd::DeviceRecord::builder()
 *     .setBus(1)
 *     .setAddress(7)
 *     .setPortNumber(3)
 *     .setPortChain({ 2, 3 })
 *     .setVID(Hmd::USB_VID_VALVE)
 *     .setPID(Hmd::USB_PID_VALVE_WATCHMAN_DONGLE)
 *     .setDeviceClass(0)
 *     .setSerial("ABC123")
 *     .build();
 *
 * if (record.has_value()) {
 *     // Use record.value()
 * } else {
 *     // Handle error: record.error()
 * }
 * @endcode
 */
class DeviceRecordBuilder {
private:
    std::optional<uint32_t> address_;
    std::optional<uint32_t> bus_;
    std::optional<uint32_t> portNumber_;
    std::optional<std::vector<uint32_t>> portChain_;
    std::optional<uint16_t> vid_;
    std::optional<uint16_t> pid_;
    std::optional<uint8_t> deviceClass_;
    std::optional<std::string> product_;
    std::optional<std::string> manufacturer_;
    std::optional<std::string> serial_;
    std::string raw_;

public:
    DeviceRecordBuilder() = default;

    /**
     * @brief Sets the bus-local device address.
     *
     * @param address Address assigned by the host controller
     * @return Reference to this builder for method chaining
     */
    DeviceRecordBuilder& setAddress(uint32_t address);

    /**
     * @brief Sets the bus number the device is attached to.
     *
     * @param bus Bus number
     * @return Reference to this builder for method chaining
     */
    DeviceRecordBuilder& setBus(uint32_t bus);

    /**
     * @brief Sets the port the device occupies on its parent.
     *
     * @param port Port number, 1 = first port
     * @return Reference to this builder for method chaining
     */
    DeviceRecordBuilder& setPortNumber(uint32_t port);

    /**
     * @brief Sets the full port chain from the bus root to the device.
     *
     * Leave unset for root level devices.
     *
     * @param portChain Ports from root to leaf, the last one equal to the port number
     * @return Reference to this builder for method chaining
     */
    DeviceRecordBuilder& setPortChain(const std::vector<uint32_t>& portChain);

    DeviceRecordBuilder& setVID(uint16_t vid);
    DeviceRecordBuilder& setPID(uint16_t pid);
    DeviceRecordBuilder& setDeviceClass(uint8_t deviceClass);

    /**
     * @brief Sets the product descriptor string.
     *
     * @param product Product string, std::nullopt if the device did not report one
     * @return Reference to this builder for method chaining
     */
    DeviceRecordBuilder& setProduct(const std::optional<std::string>& product);
    DeviceRecordBuilder& setManufacturer(const std::optional<std::string>& manufacturer);
    DeviceRecordBuilder& setSerial(const std::optional<std::string>& serial);

    /**
     * @brief Sets the internal system path the record was read from.
     *
     * @param raw sysfs path of the device
     * @return Reference to this builder for method chaining
     */
    DeviceRecordBuilder& setRaw(const std::string& raw);

    /**
     * @brief Builds and validates the DeviceRecord.
     *
     * @return std::expected containing either a valid DeviceRecord or an error message
     */
    std::expected<DeviceRecord, std::string> build() const;

private:
    /**
     * @brief Validates that all required fields have been set and agree with each other.
     *
     * @return std::optional containing an error message if validation fails,
     *         or std::nullopt if all fields are valid
     */
    std::optional<std::string> validate() const;
};

} // namespace Hmd
