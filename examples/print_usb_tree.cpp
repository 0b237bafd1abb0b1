/**
 * @file print_usb_tree.cpp
 * @brief Example printing the hub/port tree reconstructed for every USB bus
 *
 * Each line shows the port a device occupies on its parent, whether it is a
 * hub, its VID/PID and its manufacturer and product strings. Positions that
 * only show up as part of a child's port chain are printed as "Unknown".
 */

#include <hmdfinder_linux.hpp>
#include <iostream>

int main() {
    std::cout << "USB Port Tree" << std::endl;
    std::cout << "=============" << std::endl << std::endl;

    auto busses = Hmd::enumerate_busses();
    if (!busses.has_value()) {
        std::cerr << "Failed to enumerate USB busses: " << busses.error() << std::endl;
        return 1;
    }

    for (const auto& bus: busses.value()) {
        std::cout << "Bus " << bus.number << " (" << bus.devices.size() << " devices)"
                  << std::endl;
        auto tree = Hmd::UsbTree::fromDeviceRecords(bus.devices);
        std::cout << tree->render() << std::endl;

        for (const auto& hmd: Hmd::scan_bus(bus.devices)) {
            std::cout << "  -> " << hmd.getDisplayName() << " rooted at port chain [";
            const auto portChain = hmd.getPortChain();
            for (size_t i = 0; i < portChain.size(); ++i) {
                std::cout << portChain[i];
                if (i < portChain.size() - 1) std::cout << ", ";
            }
            std::cout << "]" << std::endl;
        }
        std::cout << std::endl;
    }

    return 0;
}
