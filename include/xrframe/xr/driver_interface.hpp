// XRFrame Swapchain Layer
// driver_interface.hpp - OpenXR entry points resolved once per instance

#pragma once

#include <openxr/openxr.h>

#include <memory>
#include <span>
#include <string>

namespace xrframe::xr {

// Immutable table of runtime entry points.
// Resolved once through xrGetInstanceProcAddr and shared read-only by every
// session and swapchain derived from the instance.
class DriverInterface {
public:
    struct EntryPoints {
        // Required
        PFN_xrCreateSwapchain create_swapchain = nullptr;
        PFN_xrDestroySwapchain destroy_swapchain = nullptr;
        PFN_xrEnumerateSwapchainImages enumerate_swapchain_images = nullptr;
        PFN_xrAcquireSwapchainImage acquire_swapchain_image = nullptr;
        PFN_xrWaitSwapchainImage wait_swapchain_image = nullptr;
        PFN_xrReleaseSwapchainImage release_swapchain_image = nullptr;
        PFN_xrEnumerateSwapchainFormats enumerate_swapchain_formats = nullptr;
        PFN_xrDestroySession destroy_session = nullptr;

        // Optional
        PFN_xrResultToString result_to_string = nullptr;
        PFN_xrSetDebugUtilsObjectNameEXT set_debug_utils_object_name = nullptr;  // XR_EXT_debug_utils
    };

    // Resolve all entry points for instance. The debug-naming entry point is
    // only resolved when XR_EXT_debug_utils is among enabled_extensions.
    // Throws DriverError if a required entry point is unavailable.
    [[nodiscard]] static std::shared_ptr<const DriverInterface> load(
        XrInstance instance, PFN_xrGetInstanceProcAddr get_instance_proc_addr,
        std::span<const std::string> enabled_extensions = {});

    // Same as above, using the loader's exported xrGetInstanceProcAddr
    [[nodiscard]] static std::shared_ptr<const DriverInterface> load(
        XrInstance instance, std::span<const std::string> enabled_extensions = {});

    // Wrap an already-resolved table (API layers, tests).
    // Throws DriverError if a required entry point is null.
    [[nodiscard]] static std::shared_ptr<const DriverInterface> from_entry_points(
        XrInstance instance, const EntryPoints& entry_points);

    [[nodiscard]] XrInstance instance() const { return instance_; }
    [[nodiscard]] const EntryPoints& fp() const { return fp_; }

    [[nodiscard]] bool has_debug_utils() const { return fp_.set_debug_utils_object_name != nullptr; }

    // "XR_ERROR_HANDLE_INVALID" style name, or "XrResult(<code>)" if unknown
    [[nodiscard]] std::string result_name(XrResult result) const;

    // Returns result unchanged if it is a success code (XR_TIMEOUT_EXPIRED
    // included). Otherwise logs and throws DriverError naming operation.
    XrResult check(XrResult result, const char* operation) const;

    DriverInterface(const DriverInterface&) = delete;
    DriverInterface& operator=(const DriverInterface&) = delete;

private:
    DriverInterface(XrInstance instance, const EntryPoints& entry_points);

    XrInstance instance_;
    EntryPoints fp_;
};

}  // namespace xrframe::xr
