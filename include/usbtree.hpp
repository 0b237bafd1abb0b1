#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Hmd {

// Forward declaration
class DeviceRecordBuilder;

/// Snapshot of one enumerated USB device and its position on the bus.
struct DeviceRecord {
    /// Bus-local device address
    uint32_t address;
    /// Bus number
    uint32_t bus;
    /// Port on the immediate parent, or on the bus root if topmost
    uint32_t portNumber;
    /// Ports from the bus root down to this device. Absent for root-level devices.
    std::optional<std::vector<uint32_t>> portChain;

    /// Vendor ID
    uint16_t vid;
    /// Product ID
    uint16_t pid;
    /// USB device class code (bDeviceClass)
    uint8_t deviceClass;

    /// Descriptor strings, absent when the device declined to report them
    std::optional<std::string> product;
    std::optional<std::string> manufacturer;
    std::optional<std::string> serial;

    /// Internal system path of the device, empty for synthetic records
    std::string _raw;

    /// Port chain used to place the record in the tree, portNumber alone when portChain is absent.
    auto getEffectivePortChain() const -> std::vector<uint32_t>;

    /**
     * @brief Creates a new DeviceRecordBuilder for constructing validated DeviceRecord objects.
     */
    static DeviceRecordBuilder builder();

    bool operator==(const DeviceRecord& other) const = default;
};

/// Flat list of device records, usually everything on one bus.
typedef std::vector<DeviceRecord> DeviceRecords;

struct DeviceTreeEntry;
/// Port keyed level of the intermediate tree. std::map keeps ports in ascending numeric order.
typedef std::map<uint32_t, std::unique_ptr<DeviceTreeEntry>> DeviceTreeEntries;

/// Intermediate tree slot. device stays empty when only a descendant was recorded here.
struct DeviceTreeEntry {
    std::optional<DeviceRecord> device;
    DeviceTreeEntries children;
};

/**
 * @brief Places every record at the slot named by its port chain.
 *
 * Slots for intermediate hubs are created on demand and filled in if the hub's
 * own record shows up later in the same pass.
 *
 * @param records Device records of a single bus, in any order
 * @return Root level of the port keyed tree
 */
auto createDeviceTree(const DeviceRecords& records) -> DeviceTreeEntries;

class UsbTreeItem;
/// Children of a tree node keyed by port number, ascending.
typedef std::map<uint32_t, std::unique_ptr<UsbTreeItem>> UsbTreeItems;

/// Result of an HMD search inside a tree: the headset root and the node that matched.
struct HmdMatch {
    const UsbTreeItem* device;
    const UsbTreeItem* idDevice;
};

/**
 * @brief Node of the reconstructed hub tree.
 *
 * Owns its children, refers to its parent without owning it and caches the
 * normalized descriptor strings and the classification of its device.
 * Nodes are immutable once constructed.
 */
class UsbTreeItem {
public:
    UsbTreeItem(
        const DeviceTreeEntry& entry,
        uint32_t port,
        const UsbTreeItem* parent = nullptr,
        uint32_t level = 0
    );

    UsbTreeItem(const UsbTreeItem&) = delete;
    UsbTreeItem& operator=(const UsbTreeItem&) = delete;

    auto getDevice() const noexcept -> const std::optional<DeviceRecord>&;
    auto getChildren() const noexcept -> const UsbTreeItems&;
    auto getChild(uint32_t port) const noexcept -> const UsbTreeItem*;
    auto getParent() const noexcept -> const UsbTreeItem*;
    /// Depth below the bus root, 0 for root level nodes. Diagnostic only.
    auto getLevel() const noexcept -> uint32_t;
    /// Port this node occupies on its parent.
    auto getPort() const noexcept -> uint32_t;

    auto getVID() const noexcept -> uint16_t;
    auto getPID() const noexcept -> uint16_t;
    auto getProduct() const noexcept -> const std::string&;
    auto getVendor() const noexcept -> const std::string&;
    auto getSerial() const noexcept -> const std::string&;
    auto getClassPretty() const noexcept -> const std::string&;

    /// True when no record was enumerated at this position.
    bool isPlaceholder() const noexcept;
    bool isHub() const noexcept;
    /// True for a known wireless receiver (Valve Watchman).
    bool isDongle() const noexcept;

    /// Parent hops from this node to the headset root, std::nullopt if this is not an HMD.
    auto getHMDRootDepth() const noexcept -> std::optional<uint32_t>;

    /**
     * @brief Lists descendants in pre-order, expanding only through hubs.
     *
     * The node itself is always expanded. Children that are not hubs are
     * listed but their own children are not.
     */
    auto childrenFlatList() const -> std::vector<const UsbTreeItem*>;

    /**
     * @brief Searches this subtree for a supported HMD.
     *
     * Children are searched before the node itself so a match deeper in the
     * tree wins. A candidate whose root would lie above the bus root is
     * skipped and the search continues.
     */
    auto findHMD() const noexcept -> std::optional<HmdMatch>;

    auto render(uint32_t indent = 0) const -> std::string;

private:
    std::optional<DeviceRecord> device_;
    UsbTreeItems children_;
    const UsbTreeItem* parent_;
    uint32_t level_;
    uint32_t port_;

    std::string product_;
    std::string vendor_;
    std::string serial_;
    bool hub_;
    bool dongle_;
    std::string classPretty_;
};

/**
 * @brief Forest of hub trees reconstructed from one bus snapshot.
 *
 * @code{.cpp}
 * auto tree = Hmd::UsbTree::fromDeviceRecords(records);
 * std::cout << tree->render() << std::endl;
 * for (const auto& match: tree->findHMDs()) {
 *     std::cout << match.idDevice->getProduct() << std::endl;
 * }
 * @endcode
 */
class UsbTree {
public:
    explicit UsbTree(const DeviceRecords& records);

    UsbTree(const UsbTree&) = delete;
    UsbTree& operator=(const UsbTree&) = delete;
    UsbTree(UsbTree&&) noexcept = default;
    UsbTree& operator=(UsbTree&&) noexcept = default;

    static auto fromDeviceRecords(const DeviceRecords& records) -> std::shared_ptr<const UsbTree>;

    auto getRoots() const noexcept -> const UsbTreeItems&;

    /// Follows portChain from the roots, nullptr if any port along the way is missing.
    auto find(const std::vector<uint32_t>& portChain) const noexcept -> const UsbTreeItem*;

    /// Searches every root subtree independently, at most one match per root.
    auto findHMDs() const -> std::vector<HmdMatch>;

    auto render() const -> std::string;

private:
    UsbTreeItems roots_;
};

}; // namespace Hmd
