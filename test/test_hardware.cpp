#include <gtest/gtest.h>

#include <hmdfinder.hpp>
#include <usbdef.hpp>

#include <cstdio>

TEST(HmdFinder, ExpectedHardware) {
    auto results = Hmd::find_all();
    if (!results.has_value()) {
        FAIL() << "Failed to find hardware: " << results.error();
        return;
    }

    if (results.value().empty()) {
        GTEST_SKIP() << "No headset connected - skipping hardware test";
        return;
    }

    for (const auto& hmd: results.value()) {
        printf(
            "%s (%s) on bus %u\n",
            hmd.getDisplayName().c_str(),
            Hmd::getHmdTypeName(hmd.getType()).c_str(),
            hmd.getBus()
        );

        ASSERT_NE(hmd.getType(), Hmd::HmdType::Unknown) << "Every finding has a known type";
        ASSERT_FALSE(hmd.getPortChain().empty());
        ASSERT_EQ(hmd.getUniqueID(), Hmd::generateUniqueID(hmd.getBus(), hmd.getPortChain()));

        // The identifying node sits below the headset root
        const Hmd::UsbTreeItem* item = &hmd.getIdDevice();
        while (item != nullptr && item != &hmd.getDevice()) {
            item = item->getParent();
        }
        ASSERT_EQ(item, &hmd.getDevice()) << "Headset root is not an ancestor of the id device";

        const auto dongles = hmd.getAttachedDongles();
        const auto serials = hmd.getDongleSerials();
        ASSERT_EQ(dongles.size(), serials.size());
        for (size_t i = 0; i < dongles.size(); ++i) {
            ASSERT_TRUE(dongles[i]->isDongle());
            ASSERT_EQ(dongles[i]->getVID(), Hmd::USB_VID_VALVE);
            printf("\tdongle %s\n", serials[i].c_str());
        }
    }
}
