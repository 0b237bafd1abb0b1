#include "usbdef.hpp"

#include <cstdint>
#include <algorithm>

auto Hmd::is_vid_pid_dongle(uint16_t vid, uint16_t pid) -> bool {
    if (auto vidIter = Hmd::DongleVIDPID.find(vid); vidIter != Hmd::DongleVIDPID.end()) {
        const auto& pids = vidIter->second;
        return std::find(pids.begin(), pids.end(), pid) != pids.end();
    }
    return false;
}

auto Hmd::get_hmd_root_depth(uint16_t vid, uint16_t pid, const std::string& product)
    -> std::optional<uint32_t> {
    if (vid == Hmd::USB_VID_HTC && pid == Hmd::USB_PID_HTC_VIVE) {
        return Hmd::HMD_ROOT_DEPTH_VIVE;
    }
    if (std::find(Hmd::HmdProductNames.begin(), Hmd::HmdProductNames.end(), product)
        != Hmd::HmdProductNames.end())
    {
        return Hmd::HMD_ROOT_DEPTH_BY_PRODUCT;
    }
    return std::nullopt;
}
