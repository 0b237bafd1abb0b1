#include <chmdfinder.h>
#include <chmdfinder_internal.hpp>
#include <hmdfinder.hpp>
#include <algorithm>
#include <memory>
#include <vector>

using namespace Hmd;

typedef struct hmd_device_t {
    HmdDevice device;

    // Receivers below the headset root and the iterator over them.
    std::vector<const UsbTreeItem*> dongles = device.getAttachedDongles();
    std::vector<const UsbTreeItem*>::const_iterator donglesIter = dongles.cbegin();

    bool operator==(const HmdDevice& other) const noexcept {
        return device == other;
    }
} hmd_device_t;

static std::vector<std::shared_ptr<hmd_device_t>> hmd_devices;

// Resolve the node a query refers to, nullptr for an unknown selector.
static const UsbTreeItem* _select_node(const hmd_device_t* device, hmd_node_t node) {
    switch (node) {
        case hmd_node_id:
            return &device->device.getIdDevice();
        case hmd_node_root:
            return &device->device.getDevice();
    }
    return nullptr;
}

static hmd_error_t _copy_str(char* const value, uint32_t* value_size, const std::string& str) {
    if (fixedStringCopy(value, value_size, str).has_value()) {
        return hmd_error_success;
    }
    return hmd_error_memory;
}

static hmd_error_t _get_item_str(
    const UsbTreeItem& item,
    hmd_stringtype_t str_type,
    char* const value,
    uint32_t* value_size
) {
    switch (str_type) {
        case hmd_stringtype_name:
            return _copy_str(value, value_size, item.getVendor() + " " + item.getProduct());
        case hmd_stringtype_serial:
            return _copy_str(value, value_size, item.getSerial());
        case hmd_stringtype_manufacturer:
            return _copy_str(value, value_size, item.getVendor());
        case hmd_stringtype_product:
            return _copy_str(value, value_size, item.getProduct());
        case hmd_stringtype_class:
            return _copy_str(value, value_size, item.getClassPretty());
        case hmd_stringtype_raw:
            if (item.isPlaceholder()) {
                return hmd_error_none; // Nothing was enumerated at this position
            }
            return _copy_str(value, value_size, item.getDevice()->_raw);
        case hmd_stringtype_type:
            return hmd_error_invalid_parameter;
    }
    return hmd_error_invalid_parameter;
}

static hmd_error_t
_get_item_int(const UsbTreeItem& item, hmd_inttype_t int_type, uint32_t* value) {
    if (int_type == hmd_inttype_port) {
        *value = item.getPort();
        return hmd_error_success;
    }

    const auto& record = item.getDevice();
    if (!record.has_value()) {
        return hmd_error_none;
    }

    switch (int_type) {
        case hmd_inttype_vid:
            *value = record->vid;
            return hmd_error_success;
        case hmd_inttype_pid:
            *value = record->pid;
            return hmd_error_success;
        case hmd_inttype_bus:
            *value = record->bus;
            return hmd_error_success;
        case hmd_inttype_address:
            *value = record->address;
            return hmd_error_success;
    }
    return hmd_error_invalid_parameter;
}

CHMD_FINDER_API hmd_error_t hmd_device_find_all(
    hmd_device_t** devices,
    uint32_t* count,
    char* const error_message,
    uint32_t* error_message_size
) {
    if (devices == nullptr || count == nullptr) {
        return hmd_error_invalid_parameter;
    }

    auto found_hmds = find_all();
    if (!found_hmds.has_value()) {
        if (error_message == nullptr || error_message_size == nullptr) {
            return hmd_error_invalid_parameter;
        }
        if (fixedStringCopy(error_message, error_message_size, found_hmds.error()).has_value()) {
            return hmd_error_internal_error;
        } else {
            return hmd_error_memory;
        }
    }

    auto min_size = std::min(*count, static_cast<uint32_t>(found_hmds.value().size()));
    *count = min_size;

    for (uint32_t i = 0; i < min_size; ++i) {
        auto hmd_device = std::make_shared<hmd_device_t>(found_hmds.value()[i]);
        hmd_devices.push_back(hmd_device);
        devices[i] = hmd_device.get();
    }
    return hmd_error_success;
}

CHMD_FINDER_API bool hmd_device_is_valid(hmd_device_t* device) {
    if (device == nullptr) {
        return false;
    }
    // Check if the handle is in the list of handed out devices
    return std::any_of(
        hmd_devices.begin(),
        hmd_devices.end(),
        [&](const std::shared_ptr<hmd_device_t>& hmd_device) { return hmd_device.get() == device; }
    );
}

CHMD_FINDER_API hmd_error_t hmd_device_free(hmd_device_t** devices, uint32_t count) {
    if (devices == nullptr || count == 0) {
        return hmd_error_invalid_parameter;
    }
    for (uint32_t i = 0; i < count; ++i) {
        if (devices[i] == nullptr) {
            continue;
        }
        hmd_devices.erase(
            std::remove_if(
                hmd_devices.begin(),
                hmd_devices.end(),
                [&](const std::shared_ptr<hmd_device_t>& hmd_device) {
                    return hmd_device.get() == devices[i];
                }
            ),
            hmd_devices.end()
        );
        devices[i] = nullptr; // Clear the pointer
    }
    return hmd_error_success;
}

CHMD_FINDER_API hmd_error_t hmd_device_get_str(
    hmd_device_t* device,
    hmd_node_t node,
    hmd_stringtype_t str_type,
    char* const value,
    uint32_t* value_size
) {
    if (device == nullptr || value == nullptr || value_size == nullptr || *value_size == 0) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    if (str_type == hmd_stringtype_type) {
        return _copy_str(value, value_size, getHmdTypeName(device->device.getType()));
    }
    if (node == hmd_node_id && str_type == hmd_stringtype_name) {
        return _copy_str(value, value_size, device->device.getDisplayName());
    }

    const UsbTreeItem* item = _select_node(device, node);
    if (item == nullptr) {
        return hmd_error_invalid_parameter;
    }
    return _get_item_str(*item, str_type, value, value_size);
}

CHMD_FINDER_API hmd_error_t hmd_device_get_int(
    hmd_device_t* device,
    hmd_node_t node,
    hmd_inttype_t int_type,
    uint32_t* value
) {
    if (device == nullptr || value == nullptr) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    const UsbTreeItem* item = _select_node(device, node);
    if (item == nullptr) {
        return hmd_error_invalid_parameter;
    }
    return _get_item_int(*item, int_type, value);
}

CHMD_FINDER_API hmd_error_t hmd_device_get_type(hmd_device_t* device, hmd_type_t* hmd_type) {
    if (device == nullptr || hmd_type == nullptr) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }
    *hmd_type = static_cast<hmd_type_t>(device->device.getType());
    return hmd_error_success;
}

CHMD_FINDER_API hmd_error_t
hmd_device_get_type_name(hmd_type_t hmd_type, char* const name, uint32_t* name_size) {
    if (name == nullptr || name_size == nullptr) {
        return hmd_error_invalid_parameter;
    }

    std::string type_name;
    switch (hmd_type) {
        case hmd_type_unknown:
            type_name = getHmdTypeName(HmdType::Unknown);
            break;
        case hmd_type_vive:
            type_name = getHmdTypeName(HmdType::Vive);
            break;
        case hmd_type_valve_index:
            type_name = getHmdTypeName(HmdType::ValveIndex);
            break;
        case hmd_type_bigscreen_beyond:
            type_name = getHmdTypeName(HmdType::BigscreenBeyond);
            break;
        default:
            type_name = std::string("Unknown HMD Type");
    }

    if (!fixedStringCopy(name, name_size, type_name).has_value()) {
        return hmd_error_memory;
    }
    return hmd_error_success;
}

CHMD_FINDER_API hmd_error_t hmd_device_unique_id(hmd_device_t* device, uint64_t* unique_id) {
    if (device == nullptr || unique_id == nullptr) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    *unique_id = device->device.getUniqueID();
    return hmd_error_success;
}

CHMD_FINDER_API hmd_error_t hmd_device_get_port_chain(
    hmd_device_t* device,
    uint32_t* port_chain,
    uint32_t* port_chain_size
) {
    if (device == nullptr || port_chain == nullptr || port_chain_size == nullptr) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    const auto chain = device->device.getPortChain();
    if (chain.size() > *port_chain_size) {
        *port_chain_size = static_cast<uint32_t>(chain.size());
        return hmd_error_memory;
    }
    std::copy(chain.begin(), chain.end(), port_chain);
    *port_chain_size = static_cast<uint32_t>(chain.size());
    return hmd_error_success;
}

CHMD_FINDER_API hmd_error_t hmd_dongle_begin(hmd_device_t* device) {
    if (device == nullptr) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    device->donglesIter = device->dongles.cbegin();
    if (device->donglesIter == device->dongles.cend()) {
        return hmd_error_no_more_devices;
    }
    return hmd_error_success;
}

CHMD_FINDER_API hmd_error_t hmd_dongle_next(hmd_device_t* device) {
    if (device == nullptr) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    if (device->donglesIter == device->dongles.cend()) {
        return hmd_error_no_more_devices;
    }

    ++device->donglesIter;
    if (device->donglesIter == device->dongles.cend()) {
        return hmd_error_no_more_devices;
    } else {
        return hmd_error_success;
    }
}

CHMD_FINDER_API hmd_error_t hmd_dongle_count(hmd_device_t* device, uint32_t* count) {
    if (device == nullptr || count == nullptr) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    *count = static_cast<uint32_t>(device->dongles.size());
    return hmd_error_success;
}

CHMD_FINDER_API hmd_error_t hmd_dongle_get_str(
    hmd_device_t* device,
    hmd_stringtype_t str_type,
    char* const value,
    uint32_t* value_size
) {
    if (device == nullptr || value == nullptr || value_size == nullptr || *value_size == 0) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    if (device->donglesIter == device->dongles.cend()) {
        return hmd_error_no_more_devices;
    }
    return _get_item_str(**device->donglesIter, str_type, value, value_size);
}

CHMD_FINDER_API hmd_error_t
hmd_dongle_get_int(hmd_device_t* device, hmd_inttype_t int_type, uint32_t* value) {
    if (device == nullptr || value == nullptr) {
        return hmd_error_invalid_parameter;
    }

    if (!hmd_device_is_valid(device)) {
        return hmd_error_invalid_device;
    }

    if (device->donglesIter == device->dongles.cend()) {
        return hmd_error_no_more_devices;
    }
    return _get_item_int(**device->donglesIter, int_type, value);
}
