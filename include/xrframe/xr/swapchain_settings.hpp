// XRFrame Swapchain Layer
// swapchain_settings.hpp - Tunables read from the configuration file

#pragma once

#include "types.hpp"

#include <chrono>

namespace xrframe::core {
class Config;
}

namespace xrframe::xr {

struct SwapchainSettings {
    // Timeout used by ImageRing::wait when none is given
    Duration wait_timeout = std::chrono::milliseconds(100);

    // Apply SwapchainDesc::debug_name after creation
    bool apply_debug_names = true;

    // Reads the "swapchain" section; missing keys keep the defaults above.
    // A negative wait_timeout_ms means wait indefinitely.
    [[nodiscard]] static SwapchainSettings from_config(const core::Config& config);
};

}  // namespace xrframe::xr
