#include <usbtree.hpp>
#include <hmdbuilder.hpp>
#include <usbdef.hpp>

#include <iomanip>
#include <sstream>
#include <iterator>

namespace {

auto _classPrettyFrom(const std::optional<Hmd::DeviceRecord>& device) -> std::string {
    if (!device.has_value()) {
        return "Unknown";
    }
    if (device->deviceClass == Hmd::USB_CLASS_HUB) {
        return "USB-Hub";
    }
    return "Device";
}

} // namespace

auto Hmd::DeviceRecord::getEffectivePortChain() const -> std::vector<uint32_t> {
    if (portChain.has_value() && !portChain.value().empty()) {
        return portChain.value();
    }
    return { portNumber };
}

Hmd::DeviceRecordBuilder Hmd::DeviceRecord::builder() {
    return Hmd::DeviceRecordBuilder();
}

auto Hmd::createDeviceTree(const Hmd::DeviceRecords& records) -> Hmd::DeviceTreeEntries {
    Hmd::DeviceTreeEntries root;
    for (const auto& record: records) {
        Hmd::DeviceTreeEntries* currentLevel = &root;
        const auto portChain = record.getEffectivePortChain();
        // Every port but the last belongs to a hub above the device
        for (auto it = portChain.begin(); it != std::prev(portChain.end()); ++it) {
            auto& slot = (*currentLevel)[*it];
            if (!slot) {
                slot = std::make_unique<Hmd::DeviceTreeEntry>();
            }
            currentLevel = &slot->children;
        }
        auto& slot = (*currentLevel)[portChain.back()];
        if (!slot) {
            slot = std::make_unique<Hmd::DeviceTreeEntry>();
        }
        slot->device = record;
    }
    return root;
}

Hmd::UsbTreeItem::UsbTreeItem(
    const Hmd::DeviceTreeEntry& entry,
    uint32_t port,
    const Hmd::UsbTreeItem* parent,
    uint32_t level
):
    device_(entry.device),
    parent_(parent),
    level_(level),
    port_(port),
    product_(device_.has_value() ? device_->product.value_or("") : ""),
    vendor_(device_.has_value() ? device_->manufacturer.value_or("") : ""),
    serial_(
        device_.has_value() ? device_->serial.value_or(Hmd::USB_NO_SERIAL_NUMBER)
                            : Hmd::USB_NO_SERIAL_NUMBER
    ),
    hub_(device_.has_value() && device_->deviceClass == Hmd::USB_CLASS_HUB),
    dongle_(device_.has_value() && Hmd::is_vid_pid_dongle(device_->vid, device_->pid)),
    classPretty_(_classPrettyFrom(device_)) {
    for (const auto& [childPort, child]: entry.children) {
        children_.emplace(
            childPort,
            std::make_unique<Hmd::UsbTreeItem>(*child, childPort, this, level + 1)
        );
    }
}

auto Hmd::UsbTreeItem::getDevice() const noexcept -> const std::optional<Hmd::DeviceRecord>& {
    return device_;
}

auto Hmd::UsbTreeItem::getChildren() const noexcept -> const Hmd::UsbTreeItems& {
    return children_;
}

auto Hmd::UsbTreeItem::getChild(uint32_t port) const noexcept -> const Hmd::UsbTreeItem* {
    if (auto it = children_.find(port); it != children_.end()) {
        return it->second.get();
    }
    return nullptr;
}

auto Hmd::UsbTreeItem::getParent() const noexcept -> const Hmd::UsbTreeItem* {
    return parent_;
}

auto Hmd::UsbTreeItem::getLevel() const noexcept -> uint32_t {
    return level_;
}

auto Hmd::UsbTreeItem::getPort() const noexcept -> uint32_t {
    return port_;
}

auto Hmd::UsbTreeItem::getVID() const noexcept -> uint16_t {
    return device_.has_value() ? device_->vid : 0;
}

auto Hmd::UsbTreeItem::getPID() const noexcept -> uint16_t {
    return device_.has_value() ? device_->pid : 0;
}

auto Hmd::UsbTreeItem::getProduct() const noexcept -> const std::string& {
    return product_;
}

auto Hmd::UsbTreeItem::getVendor() const noexcept -> const std::string& {
    return vendor_;
}

auto Hmd::UsbTreeItem::getSerial() const noexcept -> const std::string& {
    return serial_;
}

auto Hmd::UsbTreeItem::getClassPretty() const noexcept -> const std::string& {
    return classPretty_;
}

bool Hmd::UsbTreeItem::isPlaceholder() const noexcept {
    return !device_.has_value();
}

bool Hmd::UsbTreeItem::isHub() const noexcept {
    return hub_;
}

bool Hmd::UsbTreeItem::isDongle() const noexcept {
    return dongle_;
}

auto Hmd::UsbTreeItem::getHMDRootDepth() const noexcept -> std::optional<uint32_t> {
    if (!device_.has_value()) {
        return std::nullopt;
    }
    return Hmd::get_hmd_root_depth(device_->vid, device_->pid, product_);
}

auto Hmd::UsbTreeItem::childrenFlatList() const -> std::vector<const Hmd::UsbTreeItem*> {
    std::vector<const Hmd::UsbTreeItem*> flatList;
    std::vector<const Hmd::UsbTreeItem*> pending;

    // Pushed in reverse so the lowest port is popped first
    auto pushChildren = [&pending](const Hmd::UsbTreeItem& item) {
        for (auto it = item.children_.rbegin(); it != item.children_.rend(); ++it) {
            pending.push_back(it->second.get());
        }
    };

    pushChildren(*this);
    while (!pending.empty()) {
        const Hmd::UsbTreeItem* item = pending.back();
        pending.pop_back();
        flatList.push_back(item);
        if (item->isHub()) {
            pushChildren(*item);
        }
    }
    return flatList;
}

auto Hmd::UsbTreeItem::findHMD() const noexcept -> std::optional<Hmd::HmdMatch> {
    for (const auto& [port, child]: children_) {
        if (auto match = child->findHMD(); match.has_value()) {
            return match;
        }
    }

    auto requiredDepth = getHMDRootDepth();
    if (!requiredDepth.has_value()) {
        return std::nullopt;
    }

    const Hmd::UsbTreeItem* device = this;
    for (uint32_t i = 0; i < requiredDepth.value(); ++i) {
        device = device->getParent();
        if (device == nullptr) {
            // The headset root would be above the bus root
            return std::nullopt;
        }
    }
    return Hmd::HmdMatch { .device = device, .idDevice = this };
}

auto Hmd::UsbTreeItem::render(uint32_t indent) const -> std::string {
    std::stringstream ss;
    ss << std::string(indent, ' ') << "[Port" << port_ << "]: " << classPretty_ << " (VID:"
       << std::uppercase << std::hex << getVID() << " PID:" << getPID() << std::dec
       << std::nouppercase << "), " << vendor_ << ", " << product_;
    for (const auto& [port, child]: children_) {
        ss << "\n" << child->render(indent + 2);
    }
    return ss.str();
}

Hmd::UsbTree::UsbTree(const Hmd::DeviceRecords& records) {
    const auto entries = Hmd::createDeviceTree(records);
    for (const auto& [port, entry]: entries) {
        roots_.emplace(port, std::make_unique<Hmd::UsbTreeItem>(*entry, port));
    }
}

auto Hmd::UsbTree::fromDeviceRecords(const Hmd::DeviceRecords& records)
    -> std::shared_ptr<const Hmd::UsbTree> {
    return std::make_shared<const Hmd::UsbTree>(records);
}

auto Hmd::UsbTree::getRoots() const noexcept -> const Hmd::UsbTreeItems& {
    return roots_;
}

auto Hmd::UsbTree::find(const std::vector<uint32_t>& portChain) const noexcept
    -> const Hmd::UsbTreeItem* {
    if (portChain.empty()) {
        return nullptr;
    }
    auto rootIter = roots_.find(portChain.front());
    if (rootIter == roots_.end()) {
        return nullptr;
    }
    const Hmd::UsbTreeItem* item = rootIter->second.get();
    for (auto it = std::next(portChain.begin()); it != portChain.end() && item != nullptr; ++it) {
        item = item->getChild(*it);
    }
    return item;
}

auto Hmd::UsbTree::findHMDs() const -> std::vector<Hmd::HmdMatch> {
    std::vector<Hmd::HmdMatch> matches;
    for (const auto& [port, root]: roots_) {
        if (auto match = root->findHMD(); match.has_value()) {
            matches.push_back(match.value());
        }
    }
    return matches;
}

auto Hmd::UsbTree::render() const -> std::string {
    std::stringstream ss;
    for (auto it = roots_.begin(); it != roots_.end(); ++it) {
        if (it != roots_.begin()) {
            ss << "\n";
        }
        ss << it->second->render();
    }
    return ss.str();
}
