// XRFrame Swapchain Layer
// driver_interface.cpp - Entry point resolution

#include <xrframe/core/logger.hpp>
#include <xrframe/xr/driver_interface.hpp>
#include <xrframe/xr/error.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace xrframe::xr {

namespace {

constexpr const char* DEBUG_UTILS_EXTENSION = XR_EXT_DEBUG_UTILS_EXTENSION_NAME;

// Resolves name into out. Required entry points throw on failure, optional
// ones are left null.
template<typename Pfn>
void resolve(XrInstance instance, PFN_xrGetInstanceProcAddr get_instance_proc_addr, const char* name,
             Pfn& out, bool required) {
    PFN_xrVoidFunction function = nullptr;
    XrResult result = get_instance_proc_addr(instance, name, &function);

    if (XR_SUCCEEDED(result) && function != nullptr) {
        out = reinterpret_cast<Pfn>(function);
        return;
    }

    out = nullptr;
    if (!required) {
        XRFRAME_LOG_DEBUG(core::log_category::XR, "Optional entry point {} unavailable ({})", name,
                          static_cast<int>(result));
        return;
    }

    if (XR_SUCCEEDED(result)) {
        result = XR_ERROR_FUNCTION_UNSUPPORTED;
    }
    XRFRAME_LOG_ERROR(core::log_category::XR, "Failed to resolve {} ({})", name, static_cast<int>(result));
    throw DriverError(result, "xrGetInstanceProcAddr",
                      fmt::format("xrGetInstanceProcAddr failed for {}: XrResult({})", name, static_cast<int>(result)));
}

void require(bool present, const char* name) {
    if (!present) {
        XRFRAME_LOG_ERROR(core::log_category::XR, "Missing required entry point {}", name);
        throw DriverError(XR_ERROR_FUNCTION_UNSUPPORTED, name, fmt::format("Missing required entry point {}", name));
    }
}

}  // namespace

DriverInterface::DriverInterface(XrInstance instance, const EntryPoints& entry_points)
    : instance_(instance), fp_(entry_points) {}

std::shared_ptr<const DriverInterface> DriverInterface::load(XrInstance instance,
                                                             PFN_xrGetInstanceProcAddr get_instance_proc_addr,
                                                             std::span<const std::string> enabled_extensions) {
    if (get_instance_proc_addr == nullptr) {
        throw DriverError(XR_ERROR_FUNCTION_UNSUPPORTED, "xrGetInstanceProcAddr", "xrGetInstanceProcAddr is null");
    }

    EntryPoints fp;
    resolve(instance, get_instance_proc_addr, "xrCreateSwapchain", fp.create_swapchain, true);
    resolve(instance, get_instance_proc_addr, "xrDestroySwapchain", fp.destroy_swapchain, true);
    resolve(instance, get_instance_proc_addr, "xrEnumerateSwapchainImages", fp.enumerate_swapchain_images, true);
    resolve(instance, get_instance_proc_addr, "xrAcquireSwapchainImage", fp.acquire_swapchain_image, true);
    resolve(instance, get_instance_proc_addr, "xrWaitSwapchainImage", fp.wait_swapchain_image, true);
    resolve(instance, get_instance_proc_addr, "xrReleaseSwapchainImage", fp.release_swapchain_image, true);
    resolve(instance, get_instance_proc_addr, "xrEnumerateSwapchainFormats", fp.enumerate_swapchain_formats, true);
    resolve(instance, get_instance_proc_addr, "xrDestroySession", fp.destroy_session, true);
    resolve(instance, get_instance_proc_addr, "xrResultToString", fp.result_to_string, false);

    bool debug_utils = std::find(enabled_extensions.begin(), enabled_extensions.end(), DEBUG_UTILS_EXTENSION) !=
                       enabled_extensions.end();
    if (debug_utils) {
        resolve(instance, get_instance_proc_addr, "xrSetDebugUtilsObjectNameEXT", fp.set_debug_utils_object_name,
                true);
    }

    XRFRAME_LOG_DEBUG(core::log_category::XR, "Resolved runtime entry points (debug utils: {})",
                      debug_utils ? "yes" : "no");
    return std::shared_ptr<const DriverInterface>(new DriverInterface(instance, fp));
}

std::shared_ptr<const DriverInterface> DriverInterface::load(XrInstance instance,
                                                             std::span<const std::string> enabled_extensions) {
    return load(instance, &xrGetInstanceProcAddr, enabled_extensions);
}

std::shared_ptr<const DriverInterface> DriverInterface::from_entry_points(XrInstance instance,
                                                                          const EntryPoints& entry_points) {
    const std::array<std::pair<bool, const char*>, 8> required = {{
        {entry_points.create_swapchain != nullptr, "xrCreateSwapchain"},
        {entry_points.destroy_swapchain != nullptr, "xrDestroySwapchain"},
        {entry_points.enumerate_swapchain_images != nullptr, "xrEnumerateSwapchainImages"},
        {entry_points.acquire_swapchain_image != nullptr, "xrAcquireSwapchainImage"},
        {entry_points.wait_swapchain_image != nullptr, "xrWaitSwapchainImage"},
        {entry_points.release_swapchain_image != nullptr, "xrReleaseSwapchainImage"},
        {entry_points.enumerate_swapchain_formats != nullptr, "xrEnumerateSwapchainFormats"},
        {entry_points.destroy_session != nullptr, "xrDestroySession"},
    }};
    for (const auto& [present, name] : required) {
        require(present, name);
    }

    return std::shared_ptr<const DriverInterface>(new DriverInterface(instance, entry_points));
}

std::string DriverInterface::result_name(XrResult result) const {
    if (fp_.result_to_string != nullptr) {
        char buffer[XR_MAX_RESULT_STRING_SIZE] = {};
        if (XR_SUCCEEDED(fp_.result_to_string(instance_, result, buffer)) && buffer[0] != '\0') {
            return buffer;
        }
    }
    return fmt::format("XrResult({})", static_cast<int>(result));
}

XrResult DriverInterface::check(XrResult result, const char* operation) const {
    if (XR_SUCCEEDED(result)) {
        return result;
    }

    auto name = result_name(result);
    XRFRAME_LOG_ERROR(core::log_category::XR, "{} failed: {} ({})", operation, name, static_cast<int>(result));
    throw DriverError(result, operation, fmt::format("{} failed: {} ({})", operation, name, static_cast<int>(result)));
}

}  // namespace xrframe::xr
