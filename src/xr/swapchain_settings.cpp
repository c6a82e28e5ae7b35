// XRFrame Swapchain Layer
// swapchain_settings.cpp - Configuration mapping

#include <xrframe/core/config.hpp>
#include <xrframe/xr/swapchain_settings.hpp>

namespace xrframe::xr {

SwapchainSettings SwapchainSettings::from_config(const core::Config& config) {
    SwapchainSettings settings;

    int timeout_ms = config.get_int(core::config_section::SWAPCHAIN, core::config_key::WAIT_TIMEOUT_MS,
                                    static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                         settings.wait_timeout)
                                                         .count()));
    if (timeout_ms < 0) {
        settings.wait_timeout = INFINITE_TIMEOUT;
    } else {
        settings.wait_timeout = std::chrono::milliseconds(timeout_ms);
    }

    settings.apply_debug_names =
        config.get_bool(core::config_section::SWAPCHAIN, core::config_key::DEBUG_NAMES, settings.apply_debug_names);

    return settings;
}

}  // namespace xrframe::xr
