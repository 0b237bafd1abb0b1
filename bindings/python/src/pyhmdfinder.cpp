#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/vector.h>

#include <hmdfinder.hpp>

#include <string>
#include <optional>
#include <cstdint>

namespace nb = nanobind;

auto find_all() -> Hmd::HmdDevices {
    if (auto hmdsResult = Hmd::find_all(); !hmdsResult.has_value()) {
        PyErr_SetString(PyExc_RuntimeError, hmdsResult.error().c_str());
        throw nb::python_error();
    } else {
        return hmdsResult.value();
    }
}

NB_MODULE(pyhmdfinder, m) {
    nb::enum_<Hmd::HmdType>(m, "HmdType")
        .value("Unknown", Hmd::HmdType::Unknown)
        .value("Vive", Hmd::HmdType::Vive)
        .value("ValveIndex", Hmd::HmdType::ValveIndex)
        .value("BigscreenBeyond", Hmd::HmdType::BigscreenBeyond)
        .export_values();

    nb::class_<Hmd::DeviceRecord>(m, "DeviceRecord")
        .def_ro("address", &Hmd::DeviceRecord::address)
        .def_ro("bus", &Hmd::DeviceRecord::bus)
        .def_ro("port_number", &Hmd::DeviceRecord::portNumber)
        .def_ro("port_chain", &Hmd::DeviceRecord::portChain)
        .def_ro("vid", &Hmd::DeviceRecord::vid)
        .def_ro("pid", &Hmd::DeviceRecord::pid)
        .def_ro("device_class", &Hmd::DeviceRecord::deviceClass)
        .def_ro("product", &Hmd::DeviceRecord::product)
        .def_ro("manufacturer", &Hmd::DeviceRecord::manufacturer)
        .def_ro("serial", &Hmd::DeviceRecord::serial)
        .def_ro("_raw", &Hmd::DeviceRecord::_raw);

    nb::class_<Hmd::UsbTreeItem>(m, "UsbTreeItem")
        .def("__str__", [](const Hmd::UsbTreeItem& self) { return self.render(); })
        .def_prop_ro("device", &Hmd::UsbTreeItem::getDevice)
        .def_prop_ro("port", &Hmd::UsbTreeItem::getPort)
        .def_prop_ro("level", &Hmd::UsbTreeItem::getLevel)
        .def_prop_ro("vid", &Hmd::UsbTreeItem::getVID)
        .def_prop_ro("pid", &Hmd::UsbTreeItem::getPID)
        .def_prop_ro("product", &Hmd::UsbTreeItem::getProduct)
        .def_prop_ro("vendor", &Hmd::UsbTreeItem::getVendor)
        .def_prop_ro("serial", &Hmd::UsbTreeItem::getSerial)
        .def_prop_ro("class_pretty", &Hmd::UsbTreeItem::getClassPretty)
        .def("is_placeholder", &Hmd::UsbTreeItem::isPlaceholder)
        .def("is_hub", &Hmd::UsbTreeItem::isHub)
        .def("is_dongle", &Hmd::UsbTreeItem::isDongle)
        .def("render", &Hmd::UsbTreeItem::render, nb::arg("indent") = 0);

    nb::class_<Hmd::HmdDevice>(m, "HmdDevice")
        .def("__str__", [](const Hmd::HmdDevice& self) { return self.getDisplayName(); })
        .def(
            "__eq__",
            [](const Hmd::HmdDevice& self, const Hmd::HmdDevice& other) { return self == other; }
        )
        // Tree nodes live as long as the HmdDevice that returned them
        .def_prop_ro("device", &Hmd::HmdDevice::getDevice, nb::rv_policy::reference_internal)
        .def_prop_ro("id_device", &Hmd::HmdDevice::getIdDevice, nb::rv_policy::reference_internal)
        .def_prop_ro("hmd_type", &Hmd::HmdDevice::getType)
        .def_prop_ro("bus", &Hmd::HmdDevice::getBus)
        .def_prop_ro("port_chain", &Hmd::HmdDevice::getPortChain)
        .def_prop_ro("unique_id", &Hmd::HmdDevice::getUniqueID)
        .def(
            "get_attached_dongles",
            &Hmd::HmdDevice::getAttachedDongles,
            nb::rv_policy::reference_internal
        )
        .def("get_dongle_serials", &Hmd::HmdDevice::getDongleSerials)
        .def("get_display_name", &Hmd::HmdDevice::getDisplayName);

    m.def("find_all", &find_all);
    m.def("get_hmd_type_name", &Hmd::getHmdTypeName);
}
