#include <hmdfinder.hpp>
#include <usbdef.hpp>

#include <expected>
#include <string>
#include <algorithm>
#include <iterator>

namespace {

// Limitation: 6 bits per port and 8 ports deep leaves the upper 16 bits for the bus.
// USB allows at most 7 tiers below the root hub so deeper chains do not occur.
const auto bitsPerPort = 6; // Make sure the mask below matches this
const auto maxPortsInID = 8;

} // namespace

auto Hmd::generateUniqueID(uint32_t bus, const std::vector<uint32_t>& portChain) -> uint64_t {
    uint64_t uniqueID = static_cast<uint64_t>(bus & 0xFFFF) << (bitsPerPort * maxPortsInID);
    auto i = 0;
    for (const uint32_t& port: portChain) {
        if (i == maxPortsInID) {
            break;
        }
        uniqueID |= static_cast<uint64_t>(port & 0x3F) << (bitsPerPort * i++);
    }
    return uniqueID;
}

auto Hmd::getHmdTypeFrom(uint16_t vid, uint16_t pid, const std::string& product) -> Hmd::HmdType {
    if (vid == Hmd::USB_VID_HTC && pid == Hmd::USB_PID_HTC_VIVE) {
        return Hmd::HmdType::Vive;
    }
    if (product == Hmd::USB_PRODUCT_VALVE_INDEX) {
        return Hmd::HmdType::ValveIndex;
    }
    if (product == Hmd::USB_PRODUCT_BIGSCREEN_BEYOND) {
        return Hmd::HmdType::BigscreenBeyond;
    }
    return Hmd::HmdType::Unknown;
}

auto Hmd::getHmdTypeName(Hmd::HmdType type) -> std::string {
    switch (type) {
        case Hmd::HmdType::Vive:
            return "HTC Vive";
        case Hmd::HmdType::ValveIndex:
            return "Valve Index";
        case Hmd::HmdType::BigscreenBeyond:
            return "Bigscreen Beyond";
        default:
            return "Unknown";
    }
}

Hmd::HmdDevice::HmdDevice(std::shared_ptr<const Hmd::UsbTree> tree, const Hmd::HmdMatch& match):
    tree_(std::move(tree)),
    device_(match.device),
    idDevice_(match.idDevice),
    uniqueID_(Hmd::generateUniqueID(getBus(), getPortChain())) {}

auto Hmd::HmdDevice::getDevice() const noexcept -> const Hmd::UsbTreeItem& {
    return *device_;
}

auto Hmd::HmdDevice::getIdDevice() const noexcept -> const Hmd::UsbTreeItem& {
    return *idDevice_;
}

auto Hmd::HmdDevice::getAttachedDongles() const -> std::vector<const Hmd::UsbTreeItem*> {
    std::vector<const Hmd::UsbTreeItem*> dongles;
    const auto flatList = device_->childrenFlatList();
    std::copy_if(
        flatList.begin(),
        flatList.end(),
        std::back_inserter(dongles),
        [](const Hmd::UsbTreeItem* item) { return item->isDongle(); }
    );
    return dongles;
}

auto Hmd::HmdDevice::getDongleSerials() const -> std::vector<std::string> {
    std::vector<std::string> serials;
    for (const auto* dongle: getAttachedDongles()) {
        serials.push_back(dongle->getSerial());
    }
    return serials;
}

auto Hmd::HmdDevice::getDisplayName() const -> std::string {
    return idDevice_->getVendor() + " " + idDevice_->getProduct();
}

auto Hmd::HmdDevice::getType() const noexcept -> Hmd::HmdType {
    return Hmd::getHmdTypeFrom(idDevice_->getVID(), idDevice_->getPID(), idDevice_->getProduct());
}

auto Hmd::HmdDevice::getBus() const noexcept -> uint32_t {
    // The identifying node always carries a record, the headset root may not
    if (const auto& record = idDevice_->getDevice(); record.has_value()) {
        return record->bus;
    }
    return 0;
}

auto Hmd::HmdDevice::getPortChain() const -> std::vector<uint32_t> {
    std::vector<uint32_t> portChain;
    for (const Hmd::UsbTreeItem* item = device_; item != nullptr; item = item->getParent()) {
        portChain.push_back(item->getPort());
    }
    std::reverse(portChain.begin(), portChain.end());
    return portChain;
}

auto Hmd::HmdDevice::getUniqueID() const noexcept -> uint64_t {
    return uniqueID_;
}

auto Hmd::scan_bus(const Hmd::DeviceRecords& records) -> Hmd::HmdDevices {
    Hmd::HmdDevices hmds;
    auto tree = Hmd::UsbTree::fromDeviceRecords(records);
    for (const auto& match: tree->findHMDs()) {
        hmds.emplace_back(tree, match);
    }
    return hmds;
}

void Hmd::for_each_hmd(
    const Hmd::UsbBusses& busses,
    const std::function<bool(const Hmd::HmdDevice&)>& callback
) {
    for (const auto& bus: busses) {
        for (const auto& hmd: Hmd::scan_bus(bus.devices)) {
            if (!callback(hmd)) {
                return;
            }
        }
    }
}

auto Hmd::find_all(const Hmd::UsbBusses& busses) -> Hmd::HmdDevices {
    Hmd::HmdDevices hmds;
    Hmd::for_each_hmd(busses, [&hmds](const Hmd::HmdDevice& hmd) {
        hmds.push_back(hmd);
        return true;
    });
    return hmds;
}
