#include <gtest/gtest.h>

#include <hmdfinder.hpp>
#include <usbdef.hpp>

#include "usbtree_test_setup.hpp"

#include <algorithm>
#include <string>
#include <vector>

TEST(HmdFinder, getHmdTypeName) {
    ASSERT_STREQ(Hmd::getHmdTypeName(Hmd::HmdType::Unknown).c_str(), "Unknown");
    ASSERT_STREQ(Hmd::getHmdTypeName(Hmd::HmdType::Vive).c_str(), "HTC Vive");
    ASSERT_STREQ(Hmd::getHmdTypeName(Hmd::HmdType::ValveIndex).c_str(), "Valve Index");
    ASSERT_STREQ(Hmd::getHmdTypeName(Hmd::HmdType::BigscreenBeyond).c_str(), "Bigscreen Beyond");
}

TEST(HmdFinder, getHmdTypeFrom) {
    ASSERT_EQ(Hmd::getHmdTypeFrom(Hmd::USB_VID_HTC, Hmd::USB_PID_HTC_VIVE, ""), Hmd::HmdType::Vive);
    ASSERT_EQ(Hmd::getHmdTypeFrom(Hmd::USB_VID_VALVE, 0x2613, "Index HMD"), Hmd::HmdType::ValveIndex);
    ASSERT_EQ(Hmd::getHmdTypeFrom(0x35BD, 0x0101, "Beyond"), Hmd::HmdType::BigscreenBeyond);
    ASSERT_EQ(Hmd::getHmdTypeFrom(0, 0, ""), Hmd::HmdType::Unknown);
    ASSERT_EQ(Hmd::getHmdTypeFrom(Hmd::USB_VID_VALVE, 0x2101, "Watchman Dongle"), Hmd::HmdType::Unknown);
}

TEST(HmdFinder, generateUniqueID) {
    ASSERT_EQ(Hmd::generateUniqueID(1, { 2, 3 }), 0x00010000000000C2ULL);
    ASSERT_EQ(Hmd::generateUniqueID(1, { 1 }), 0x0001000000000001ULL);
    ASSERT_EQ(Hmd::generateUniqueID(0, {}), 0ULL);
    ASSERT_EQ(Hmd::generateUniqueID(3, {}), 0x0003000000000000ULL);

    // Ports are masked to 6 bits, the bus to 16
    ASSERT_EQ(Hmd::generateUniqueID(0x10001, { 0x41 }), 0x0001000000000001ULL);

    // Only the first eight ports take part
    ASSERT_EQ(
        Hmd::generateUniqueID(1, { 1, 1, 1, 1, 1, 1, 1, 1 }),
        Hmd::generateUniqueID(1, { 1, 1, 1, 1, 1, 1, 1, 1, 5 })
    );

    ASSERT_NE(Hmd::generateUniqueID(1, { 1 }), Hmd::generateUniqueID(2, { 1 }));
    ASSERT_NE(Hmd::generateUniqueID(1, { 1, 2 }), Hmd::generateUniqueID(1, { 2, 1 }));
}

TEST(HmdFinder, ViveRootThreeHubsUp) {
    const auto records = UsbTreeTestSetup::createViveSetup();
    auto tree = Hmd::UsbTree::fromDeviceRecords(records);

    const auto matches = tree->findHMDs();
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].device, tree->find({ 1 }));
    EXPECT_EQ(matches[0].idDevice, tree->find({ 1, 1, 1, 1 }));

    Hmd::HmdDevice hmd(tree, matches[0]);
    EXPECT_EQ(hmd.getType(), Hmd::HmdType::Vive);
    EXPECT_EQ(hmd.getDisplayName(), "HTC Vive");
    EXPECT_EQ(hmd.getBus(), 1);
    EXPECT_EQ(hmd.getPortChain(), (std::vector<uint32_t> { 1 }));
    EXPECT_EQ(hmd.getUniqueID(), Hmd::generateUniqueID(1, { 1 }));
}

TEST(HmdFinder, IndexRootTwoHubsUp) {
    const auto hmds = Hmd::scan_bus(UsbTreeTestSetup::createIndexSetup());
    ASSERT_EQ(hmds.size(), 1);

    const auto& hmd = hmds[0];
    EXPECT_EQ(hmd.getType(), Hmd::HmdType::ValveIndex);
    EXPECT_EQ(hmd.getDisplayName(), "Valve Index HMD");
    EXPECT_EQ(hmd.getPortChain(), (std::vector<uint32_t> { 4 }));
    EXPECT_EQ(hmd.getDevice().getPort(), 4);
    EXPECT_EQ(hmd.getIdDevice().getProduct(), "Index HMD");
    EXPECT_EQ(hmd.getIdDevice().getSerial(), "LHR-INDEX001");
}

TEST(HmdFinder, BigscreenBeyond) {
    const Hmd::DeviceRecords records = {
        UsbTreeTestSetup::createHub({ 2 }),
        UsbTreeTestSetup::createHub({ 2, 4 }),
        UsbTreeTestSetup::createBeyond({ 2, 4, 1 }),
        UsbTreeTestSetup::createDongle({ 2, 4, 2 }, "BEYOND-D1"),
    };
    const auto hmds = Hmd::scan_bus(records);
    ASSERT_EQ(hmds.size(), 1);
    EXPECT_EQ(hmds[0].getType(), Hmd::HmdType::BigscreenBeyond);
    EXPECT_EQ(hmds[0].getDisplayName(), "Bigscreen Beyond");
    EXPECT_EQ(hmds[0].getPortChain(), (std::vector<uint32_t> { 2 }));
    EXPECT_EQ(hmds[0].getDongleSerials(), (std::vector<std::string> { "BEYOND-D1" }));
}

TEST(HmdFinder, DonglesBelowHeadsetRootOnly) {
    const auto hmds = Hmd::scan_bus(UsbTreeTestSetup::createViveSetup());
    ASSERT_EQ(hmds.size(), 1);

    const auto dongles = hmds[0].getAttachedDongles();
    ASSERT_EQ(dongles.size(), 2);
    EXPECT_EQ(dongles[0]->getPort(), 2);
    EXPECT_EQ(dongles[0]->getParent()->getPort(), 1);
    EXPECT_EQ(dongles[1]->getPort(), 3);
    EXPECT_EQ(dongles[1]->getPID(), Hmd::USB_PID_VALVE_WATCHMAN_DONGLE_COMBO);

    // DONGLE-OUTSIDE sits on another root port and is not part of the headset
    EXPECT_EQ(hmds[0].getDongleSerials(), (std::vector<std::string> { "DONGLE-A", "DONGLE-B" }));
}

TEST(HmdFinder, DonglesBehindNonHubAreIgnored) {
    const auto hmds = Hmd::scan_bus(UsbTreeTestSetup::createIndexSetup());
    ASSERT_EQ(hmds.size(), 1);
    EXPECT_EQ(hmds[0].getDongleSerials(), (std::vector<std::string> { "INDEX-D1" }));
}

TEST(HmdFinder, DongleWithoutSerial) {
    auto records = UsbTreeTestSetup::createIndexSetup();
    records.push_back(UsbTreeTestSetup::createDongle({ 4, 1, 3 }, std::nullopt));
    records.push_back(UsbTreeTestSetup::createDongle({ 4, 3 }, "INDEX-D3"));

    const auto hmds = Hmd::scan_bus(records);
    ASSERT_EQ(hmds.size(), 1);
    EXPECT_EQ(
        hmds[0].getDongleSerials(),
        (std::vector<std::string> { "INDEX-D1", "No Serial Number", "INDEX-D3" })
    );
}

TEST(HmdFinder, NoDongles) {
    const Hmd::DeviceRecords records = {
        UsbTreeTestSetup::createHub({ 1 }),
        UsbTreeTestSetup::createHub({ 1, 1 }),
        UsbTreeTestSetup::createIndex({ 1, 1, 1 }),
        UsbTreeTestSetup::createDongle({ 2 }, "ELSEWHERE"),
    };
    const auto hmds = Hmd::scan_bus(records);
    ASSERT_EQ(hmds.size(), 1);
    EXPECT_TRUE(hmds[0].getAttachedDongles().empty());
    EXPECT_TRUE(hmds[0].getDongleSerials().empty());
}

TEST(HmdFinder, RootAboveBusIsSkipped) {
    const Hmd::DeviceRecords records = {
        // A Vive plugged straight into the host, three hubs up is past the bus root
        UsbTreeTestSetup::createVive({ 1 }),
        UsbTreeTestSetup::createHub({ 2 }),
        UsbTreeTestSetup::createHub({ 2, 1 }),
        UsbTreeTestSetup::createIndex({ 2, 1, 1 }),
    };
    auto tree = Hmd::UsbTree::fromDeviceRecords(records);
    EXPECT_FALSE(tree->find({ 1 })->findHMD().has_value());

    const auto matches = tree->findHMDs();
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].device, tree->find({ 2 }));
    EXPECT_EQ(matches[0].idDevice, tree->find({ 2, 1, 1 }));
}

TEST(HmdFinder, SearchContinuesAfterSkippedCandidate) {
    const Hmd::DeviceRecords records = {
        UsbTreeTestSetup::createHub({ 1 }),
        // Only two levels deep, the Vive root would be above the bus root
        UsbTreeTestSetup::createVive({ 1, 1 }),
        UsbTreeTestSetup::createHub({ 1, 2 }),
        UsbTreeTestSetup::createIndex({ 1, 2, 1 }),
    };
    auto tree = Hmd::UsbTree::fromDeviceRecords(records);

    const auto matches = tree->findHMDs();
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].device, tree->find({ 1 }));
    EXPECT_EQ(matches[0].idDevice, tree->find({ 1, 2, 1 }));
}

TEST(HmdFinder, DeepestMatchWins) {
    auto outer = UsbTreeTestSetup::createHub({ 1, 1, 1 });
    outer.product = Hmd::USB_PRODUCT_BIGSCREEN_BEYOND;
    const Hmd::DeviceRecords records = {
        UsbTreeTestSetup::createHub({ 1 }),
        UsbTreeTestSetup::createHub({ 1, 1 }),
        outer,
        UsbTreeTestSetup::createIndex({ 1, 1, 1, 1 }),
    };
    auto tree = Hmd::UsbTree::fromDeviceRecords(records);

    const auto matches = tree->findHMDs();
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].idDevice, tree->find({ 1, 1, 1, 1 }));
    EXPECT_EQ(matches[0].device, tree->find({ 1, 1 }));
}

TEST(HmdFinder, FirstChildInPortOrderWins) {
    const Hmd::DeviceRecords records = {
        UsbTreeTestSetup::createHub({ 1 }),
        UsbTreeTestSetup::createHub({ 1, 2 }),
        UsbTreeTestSetup::createBeyond({ 1, 2, 1 }),
        UsbTreeTestSetup::createHub({ 1, 1 }),
        UsbTreeTestSetup::createIndex({ 1, 1, 1 }),
    };
    auto tree = Hmd::UsbTree::fromDeviceRecords(records);

    // One finding per root subtree
    const auto matches = tree->findHMDs();
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].idDevice, tree->find({ 1, 1, 1 }));
}

TEST(HmdFinder, OneFindingPerRoot) {
    auto records = UsbTreeTestSetup::createViveSetup();
    const auto index = UsbTreeTestSetup::createIndexSetup();
    records.insert(records.end(), index.begin(), index.end());

    const auto hmds = Hmd::scan_bus(records);
    ASSERT_EQ(hmds.size(), 2);
    EXPECT_EQ(hmds[0].getType(), Hmd::HmdType::Vive);
    EXPECT_EQ(hmds[0].getPortChain(), (std::vector<uint32_t> { 1 }));
    EXPECT_EQ(hmds[1].getType(), Hmd::HmdType::ValveIndex);
    EXPECT_EQ(hmds[1].getPortChain(), (std::vector<uint32_t> { 4 }));
    EXPECT_NE(hmds[0].getUniqueID(), hmds[1].getUniqueID());
    EXPECT_FALSE(hmds[0] == hmds[1]);
}

TEST(HmdFinder, PlaceholderHeadsetRoot) {
    // The hub above the Index was not enumerated
    const Hmd::DeviceRecords records = {
        UsbTreeTestSetup::createHub({ 3, 1 }),
        UsbTreeTestSetup::createIndex({ 3, 1, 1 }),
        UsbTreeTestSetup::createDongle({ 3, 1, 2 }, "D-1"),
    };
    const auto hmds = Hmd::scan_bus(records);
    ASSERT_EQ(hmds.size(), 1);
    EXPECT_TRUE(hmds[0].getDevice().isPlaceholder());
    EXPECT_EQ(hmds[0].getBus(), 1);
    EXPECT_EQ(hmds[0].getPortChain(), (std::vector<uint32_t> { 3 }));
    EXPECT_EQ(hmds[0].getDongleSerials(), (std::vector<std::string> { "D-1" }));
}

TEST(HmdFinder, NoHeadsets) {
    const Hmd::DeviceRecords records = {
        UsbTreeTestSetup::createRootHub(),
        UsbTreeTestSetup::createHub({ 1 }),
        UsbTreeTestSetup::createDevice({ 1, 1 }),
        UsbTreeTestSetup::createDongle({ 2 }, "LONELY"),
    };
    EXPECT_TRUE(Hmd::scan_bus(records).empty());
    EXPECT_TRUE(Hmd::scan_bus({}).empty());
}

TEST(HmdFinder, ScanIsDeterministic) {
    const auto records = UsbTreeTestSetup::createViveSetup();
    auto reversed = records;
    std::reverse(reversed.begin(), reversed.end());

    const auto first = Hmd::scan_bus(records);
    const auto second = Hmd::scan_bus(reversed);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].getUniqueID(), second[i].getUniqueID());
        EXPECT_EQ(first[i].getDisplayName(), second[i].getDisplayName());
        EXPECT_EQ(first[i].getDongleSerials(), second[i].getDongleSerials());
        EXPECT_TRUE(first[i] == second[i]);
    }
}

TEST(HmdFinder, FindingOutlivesRecords) {
    Hmd::HmdDevices hmds;
    {
        const auto records = UsbTreeTestSetup::createViveSetup();
        hmds = Hmd::scan_bus(records);
    }
    ASSERT_EQ(hmds.size(), 1);

    // A copy keeps the tree alive on its own
    const Hmd::HmdDevice copy = hmds[0];
    hmds.clear();
    EXPECT_EQ(copy.getDisplayName(), "HTC Vive");
    EXPECT_EQ(copy.getDongleSerials().size(), 2);
    EXPECT_EQ(copy.getIdDevice().getParent()->getParent()->getParent(), &copy.getDevice());
}

TEST(HmdFinder, FindAllAcrossBusses) {
    const Hmd::UsbBusses busses = {
        Hmd::UsbBus { .number = 1, .devices = UsbTreeTestSetup::createViveSetup(1) },
        Hmd::UsbBus { .number = 2, .devices = {} },
        Hmd::UsbBus { .number = 3, .devices = UsbTreeTestSetup::createViveSetup(3) },
    };

    const auto hmds = Hmd::find_all(busses);
    ASSERT_EQ(hmds.size(), 2);
    EXPECT_EQ(hmds[0].getBus(), 1);
    EXPECT_EQ(hmds[1].getBus(), 3);
    // Same layout on another bus is a different headset
    EXPECT_EQ(hmds[0].getPortChain(), hmds[1].getPortChain());
    EXPECT_NE(hmds[0].getUniqueID(), hmds[1].getUniqueID());
    EXPECT_EQ(hmds[1].getUniqueID(), Hmd::generateUniqueID(3, { 1 }));
}

TEST(HmdFinder, ForEachStopsEarly) {
    const Hmd::UsbBusses busses = {
        Hmd::UsbBus { .number = 1, .devices = UsbTreeTestSetup::createViveSetup(1) },
        Hmd::UsbBus { .number = 2, .devices = UsbTreeTestSetup::createIndexSetup(2) },
    };

    std::vector<uint32_t> visited;
    Hmd::for_each_hmd(busses, [&visited](const Hmd::HmdDevice& hmd) {
        visited.push_back(hmd.getBus());
        return false;
    });
    EXPECT_EQ(visited, (std::vector<uint32_t> { 1 }));

    visited.clear();
    Hmd::for_each_hmd(busses, [&visited](const Hmd::HmdDevice& hmd) {
        visited.push_back(hmd.getBus());
        return true;
    });
    EXPECT_EQ(visited, (std::vector<uint32_t> { 1, 2 }));
}
