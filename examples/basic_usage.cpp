/**
 * @file basic_usage.cpp
 * @brief Basic example demonstrating how to use the hmdfinder library
 *
 * This example shows how to:
 * - Find all connected headsets
 * - Display headset information
 * - List the wireless receivers attached next to each headset
 * - Handle errors properly
 */

#include <hmdfinder.hpp>
#include <iostream>
#include <iomanip>

int main() {
    std::cout << "HMD Finder Example" << std::endl;
    std::cout << "==================" << std::endl << std::endl;

    // Find all headsets
    if (auto hmds = Hmd::find_all(); hmds.has_value()) {
        const auto& devices = hmds.value();

        std::cout << "Found " << devices.size() << " headset(s):" << std::endl << std::endl;

        for (size_t i = 0; i < devices.size(); ++i) {
            const auto& hmd = devices[i];
            const auto& root = hmd.getDevice();
            const auto& id = hmd.getIdDevice();

            std::cout << "Headset " << (i + 1) << ": " << hmd.getDisplayName() << std::endl;
            std::cout << "  Type: " << Hmd::getHmdTypeName(hmd.getType()) << std::endl;
            std::cout << "  Bus: " << hmd.getBus() << std::endl;
            std::cout << "  Unique ID: 0x" << std::hex << hmd.getUniqueID() << std::dec
                      << std::endl;
            std::cout << "  Root: " << root.getClassPretty() << " on port " << root.getPort()
                      << " (VID: 0x" << std::hex << std::setw(4) << std::setfill('0')
                      << root.getVID() << ", PID: 0x" << std::setw(4) << root.getPID() << std::dec
                      << ")" << std::endl;
            std::cout << "  Identified by: " << id.getProduct() << " (Serial: " << id.getSerial()
                      << ")" << std::endl;

            auto dongles = hmd.getAttachedDongles();
            std::cout << "  Dongles: " << dongles.size() << std::endl;
            for (const auto* dongle: dongles) {
                std::cout << "    - " << dongle->getVendor() << " " << dongle->getProduct()
                          << " (Serial: " << dongle->getSerial() << ", Port: " << dongle->getPort()
                          << ")" << std::endl;
            }
            std::cout << std::endl;
        }
    } else {
        // Handle errors
        std::cerr << "Failed to find headsets: " << hmds.error() << std::endl;
        return 1;
    }

    return 0;
}
