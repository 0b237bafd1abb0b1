#pragma once

#include <usbtree.hpp>

#include <string>
#include <expected>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace Hmd {

enum class HmdType : uint32_t {
    Unknown = 0,
    Vive = 1,
    ValveIndex = 2,
    BigscreenBeyond = 3,
};

auto getHmdTypeFrom(uint16_t vid, uint16_t pid, const std::string& product) -> HmdType;
auto getHmdTypeName(HmdType type) -> std::string;

/**
 * @brief A headset found on the bus together with the hub it hangs off.
 *
 * The HmdDevice shares ownership of the tree it was found in, so it stays
 * valid after the scan that produced it returns.
 */
class HmdDevice {
public:
    HmdDevice(std::shared_ptr<const UsbTree> tree, const HmdMatch& match);

    /// Root hub of the headset assembly.
    auto getDevice() const noexcept -> const UsbTreeItem&;
    /// Node whose signature identified the headset.
    auto getIdDevice() const noexcept -> const UsbTreeItem&;

    /// Wireless receivers below the headset root, in port order.
    auto getAttachedDongles() const -> std::vector<const UsbTreeItem*>;
    /// Serial numbers of getAttachedDongles(), same order.
    auto getDongleSerials() const -> std::vector<std::string>;

    /// "<manufacturer> <product>" of the identifying node
    auto getDisplayName() const -> std::string;
    auto getType() const noexcept -> HmdType;
    auto getBus() const noexcept -> uint32_t;
    /// Port chain of the headset root, taken from its position in the tree.
    auto getPortChain() const -> std::vector<uint32_t>;

    // This is a unique ID based on bus and location so we
    // can identify headsets when the configuration changes.
    auto getUniqueID() const noexcept -> uint64_t;

    bool operator==(const HmdDevice& other) const noexcept {
        return getUniqueID() == other.getUniqueID();
    }

private:
    std::shared_ptr<const UsbTree> tree_;
    const UsbTreeItem* device_;
    const UsbTreeItem* idDevice_;
    uint64_t uniqueID_;
};

/// Headsets found during a scan
typedef std::vector<HmdDevice> HmdDevices;

/// Device records of a single USB bus.
struct UsbBus {
    uint32_t number;
    DeviceRecords devices;
};

/// Container of all USB busses, ascending by bus number.
typedef std::vector<UsbBus> UsbBusses;

/**
 * @brief Reconstructs the tree of one bus and finds every headset in it.
 *
 * @param records Device records of the bus, in any order
 * @return One HmdDevice per root subtree holding a headset, in port order.
 */
auto scan_bus(const DeviceRecords& records) -> HmdDevices;

/**
 * @brief Visits every headset on the given busses, bus by bus.
 *
 * Each bus is only reconstructed when the previous one has been visited.
 *
 * @param busses Busses in the order they should be scanned
 * @param callback Receives each HmdDevice; return false to stop the scan
 */
void for_each_hmd(
    const UsbBusses& busses,
    const std::function<bool(const HmdDevice&)>& callback
);

/// Collects every headset on the given busses.
auto find_all(const UsbBusses& busses) -> HmdDevices;

/**
   * @brief Finds all supported headsets attached to a host.
   *
   * @return HmdDevices on success, std::string on failure.
   *
   * @code{.cpp}
   *
   * #include <hmdfinder.hpp>
   *
   * // Find and display all headsets connected
   * if (auto hmds = Hmd::find_all(); hmds.has_value()) {
   *    for (auto& hmd : hmds.value()) {
   *      std::println("{} on bus {}", hmd.getDisplayName(), hmd.getBus());
   *      for (auto& serial : hmd.getDongleSerials()) {
   *        std::println("  dongle {}", serial);
   *      }
   *    }
   * } else {
   *    // We ran into problems, lets display the error.
   *    std::println("Failed to find headsets: {}", hmds.error());
   * }
   */
auto find_all() noexcept -> std::expected<HmdDevices, std::string>;

/**
 * @brief Generates a unique 64-bit ID from a bus number and a port chain.
 *
 * The bus number occupies the upper 16 bits. Each port of the chain takes 6
 * bits of the lower 48, the first port in the lowest bits, which covers the
 * 7 tiers USB allows.
 *
 * @param bus Bus the device is attached to
 * @param portChain Ports from the bus root to the device
 * @return A 64-bit unique identifier
 *
 * @code{.cpp}
 * // Example: bus 1, port chain 2 -> 3
 * uint64_t uniqueId = Hmd::generateUniqueID(1, { 2, 3 });
 * // Result: 0x00010000000000C2
 * @endcode
 */
auto generateUniqueID(uint32_t bus, const std::vector<uint32_t>& portChain) -> uint64_t;

}; // namespace Hmd
