#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Hmd {
/// USB device class code of a hub (USB-IF device class registry).
const uint8_t USB_CLASS_HUB = 0x09;

/// HTC Vendor ID.
const uint16_t USB_VID_HTC = 0x0BB4;
/// HTC Vive HMD Product ID, the Lighthouse FPGA behind the headset hub.
const uint16_t USB_PID_HTC_VIVE = 0x0309;

/// Valve Vendor ID.
const uint16_t USB_VID_VALVE = 0x28DE;
/// Valve Watchman wireless receiver.
const uint16_t USB_PID_VALVE_WATCHMAN_DONGLE = 0x2101;
/// Valve Watchman wireless receiver, combined HMD variant.
const uint16_t USB_PID_VALVE_WATCHMAN_DONGLE_COMBO = 0x2102;

/// Product string reported by the Valve Index headset.
const std::string USB_PRODUCT_VALVE_INDEX = "Index HMD";
/// Product string reported by the Bigscreen Beyond headset.
const std::string USB_PRODUCT_BIGSCREEN_BEYOND = "Beyond";

/// Number of parent hops from the Vive FPGA to the headset's root hub.
const uint32_t HMD_ROOT_DEPTH_VIVE = 3;
/// Number of parent hops from an Index/Beyond product node to the headset's root hub.
const uint32_t HMD_ROOT_DEPTH_BY_PRODUCT = 2;

/// Normalized serial of a device that did not report one.
const std::string USB_NO_SERIAL_NUMBER = "No Serial Number";

static std::map<uint16_t, std::vector<uint16_t>> DongleVIDPID = {
    { USB_VID_VALVE,
      {
          USB_PID_VALVE_WATCHMAN_DONGLE,
          USB_PID_VALVE_WATCHMAN_DONGLE_COMBO,
      } },
};

static std::vector<std::string> HmdProductNames = {
    USB_PRODUCT_BIGSCREEN_BEYOND,
    USB_PRODUCT_VALVE_INDEX,
};

auto is_vid_pid_dongle(uint16_t vid, uint16_t pid) -> bool;

/**
 * @brief Looks up how far above a matching node the headset's root hub sits.
 *
 * @param vid Vendor ID of the candidate node
 * @param pid Product ID of the candidate node
 * @param product Normalized product string of the candidate node
 * @return The number of parent hops, or std::nullopt if the node is not an HMD.
 */
auto get_hmd_root_depth(uint16_t vid, uint16_t pid, const std::string& product)
    -> std::optional<uint32_t>;

}; // namespace Hmd
