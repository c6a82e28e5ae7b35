// XRFrame Test Support
// fake_runtime.hpp - In-process OpenXR runtime with a fixed-size image ring

#pragma once

#include <openxr/openxr.h>

#include <xrframe/xr/driver_interface.hpp>
#include <xrframe/xr/graphics_binding.hpp>
#include <xrframe/xr/session.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace xrframe::test {

// Same layout as XrSwapchainImageOpenGLKHR
struct FakeImage {
    XrStructureType type;
    void* next;
    uint32_t texture;
};

struct FakeSwapchainState {
    XrSwapchainCreateInfo create_info{};
    std::deque<uint32_t> acquired;   // Acquired, not yet waited (FIFO)
    std::optional<uint32_t> waited;  // Waited, not yet released
    std::vector<uint32_t> acquire_order;
    std::vector<uint32_t> release_order;
    uint32_t next_index = 0;
    uint32_t destroy_calls = 0;
    bool destroyed = false;
    std::string debug_name;
    uint32_t name_calls = 0;
};

// Entry points behave like a conformant runtime for the acquire/wait/release
// handshake: ordering violations return XR_ERROR_CALL_ORDER_INVALID and calls
// on destroyed handles return XR_ERROR_HANDLE_INVALID.
// Only one FakeRuntime may be alive at a time.
class FakeRuntime {
public:
    struct CallCounts {
        uint32_t create = 0;
        uint32_t destroy = 0;
        uint32_t enumerate_images = 0;
        uint32_t acquire = 0;
        uint32_t wait = 0;
        uint32_t release = 0;
        uint32_t set_name = 0;
        uint32_t destroy_session = 0;
    };

    FakeRuntime();
    ~FakeRuntime();

    FakeRuntime(const FakeRuntime&) = delete;
    FakeRuntime& operator=(const FakeRuntime&) = delete;

    // Behaviour knobs (set before the calls they affect)
    uint32_t image_count = 3;
    uint32_t timeouts_before_ready = 0;  // Number of waits answered with XR_TIMEOUT_EXPIRED
    int32_t image_count_drift = 0;       // Added to the count returned by the capacity query
    XrResult create_result = XR_SUCCESS;
    XrResult destroy_result = XR_SUCCESS;
    std::vector<int64_t> formats = {0x8C43 /* GL_SRGB8_ALPHA8 */, 0x8058 /* GL_RGBA8 */};
    std::set<std::string> missing_entry_points;

    [[nodiscard]] XrInstance instance() const;
    [[nodiscard]] XrSession session() const;

    [[nodiscard]] CallCounts calls() const;
    [[nodiscard]] std::vector<XrDuration> wait_timeouts() const;

    // Copy of the bookkeeping for handle; nullopt if it was never created
    [[nodiscard]] std::optional<FakeSwapchainState> state(XrSwapchain handle) const;

    // Register a swapchain without going through xrCreateSwapchain
    [[nodiscard]] XrSwapchain inject_swapchain();

    [[nodiscard]] static uint32_t texture_for(uint32_t index) { return 0x1000 + index; }

    [[nodiscard]] static PFN_xrGetInstanceProcAddr get_instance_proc_addr();

    [[nodiscard]] std::shared_ptr<const xr::DriverInterface> make_driver(bool debug_utils = false) const;
    [[nodiscard]] std::shared_ptr<xr::Session> make_session(
        bool debug_utils = false, xr::SessionOwnership ownership = xr::SessionOwnership::Owned) const;

    // Entry point implementations, called through the function table
    XrResult create_swapchain(XrSession session, const XrSwapchainCreateInfo* info, XrSwapchain* out);
    XrResult destroy_swapchain(XrSwapchain handle);
    XrResult enumerate_swapchain_images(XrSwapchain handle, uint32_t capacity, uint32_t* count,
                                        XrSwapchainImageBaseHeader* images);
    XrResult acquire_swapchain_image(XrSwapchain handle, const XrSwapchainImageAcquireInfo* info, uint32_t* index);
    XrResult wait_swapchain_image(XrSwapchain handle, const XrSwapchainImageWaitInfo* info);
    XrResult release_swapchain_image(XrSwapchain handle, const XrSwapchainImageReleaseInfo* info);
    XrResult enumerate_swapchain_formats(XrSession session, uint32_t capacity, uint32_t* count, int64_t* out);
    XrResult destroy_session(XrSession session);
    XrResult set_debug_name(XrInstance instance, const XrDebugUtilsObjectNameInfoEXT* info);

    static FakeRuntime& active();

private:
    FakeSwapchainState* live_state(XrSwapchain handle);

    mutable std::mutex mutex_;
    std::map<uint64_t, FakeSwapchainState> swapchains_;
    uint64_t next_handle_ = 0x100;
    CallCounts calls_;
    std::vector<XrDuration> wait_timeouts_;
};

class FakeGraphicsBinding : public xr::GraphicsBinding {
public:
    FakeGraphicsBinding() = default;

    XrStructureType image_structure_type() const override { return XR_TYPE_SWAPCHAIN_IMAGE_OPENGL_KHR; }
    size_t image_structure_size() const override { return sizeof(FakeImage); }
    uint64_t native_image(const XrSwapchainImageBaseHeader& image) const override {
        return reinterpret_cast<const FakeImage&>(image).texture;
    }
    const char* name() const override { return "fake-gl"; }
};

}  // namespace xrframe::test
