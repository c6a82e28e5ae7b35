// XRFrame Swapchain Layer
// swapchain.hpp - Single-owner swapchain handle and image ring protocol

#pragma once

#include "session.hpp"
#include "swapchain_settings.hpp"
#include "types.hpp"

#include <openxr/openxr.h>

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace xrframe::xr {

// Uniquely owns one XrSwapchain. The handle is destroyed exactly once, when
// the owning object goes away, whether or not images are still acquired.
//
// Image ring protocol, per swapchain and strictly FIFO:
//   acquire_image()  -> index of the next slot (not yet safe to write)
//   wait_image()     -> oldest acquired image becomes Ready
//   release_image()  -> oldest Ready image goes back to the compositor
// Ordering is the caller's responsibility and is not tracked here; misuse is
// reported by the runtime and surfaces as DriverError. See ImageRing for a
// token-checked wrapper.
//
// Not thread-safe for a single instance. Distinct swapchains may be driven
// from different threads.
class Swapchain {
public:
    // Create a swapchain on session. Throws DriverError with the runtime's code.
    [[nodiscard]] static Swapchain create(std::shared_ptr<Session> session, const SwapchainDesc& desc,
                                          const SwapchainSettings& settings = {});

    // Take ownership of an existing handle without issuing a create call.
    // handle must be a valid swapchain created from session; anything else is
    // undefined behavior at the runtime boundary.
    [[nodiscard]] static Swapchain from_raw(std::shared_ptr<Session> session, XrSwapchain handle);

    ~Swapchain();

    // Non-copyable, movable (the moved-from object owns nothing)
    Swapchain(const Swapchain&) = delete;
    Swapchain& operator=(const Swapchain&) = delete;
    Swapchain(Swapchain&& other) noexcept;
    Swapchain& operator=(Swapchain&& other) noexcept;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] XrSwapchain raw_handle() const { return handle_; }
    [[nodiscard]] Session& session() const { return *session_; }
    [[nodiscard]] XrInstance instance() const { return session_->instance(); }

    // ========================================================================
    // Image Ring
    // ========================================================================

    // Index of the next image to render to. May be called while an earlier
    // image is still Ready; the runtime bounds outstanding acquisitions.
    [[nodiscard]] uint32_t acquire_image() const;

    // Wait for the compositor to finish reading the oldest unwaited acquired
    // image. Returns WaitResult::Timeout if it is not ready within timeout
    // (NO_TIMEOUT polls, INFINITE_TIMEOUT blocks).
    //
    // Precondition: exactly one acquired image is outstanding and the result
    // of the previous successful wait has been released.
    [[nodiscard]] WaitResult wait_image(Duration timeout) const;

    // Release the oldest Ready image back to the compositor.
    //
    // Precondition: the most recent wait_image() returned Ready.
    void release_image() const;

    // All images the ring cycles through, in slot order. Throws DriverError if
    // the runtime reports a different count on the second call.
    [[nodiscard]] std::vector<SwapchainImage> enumerate_images() const;

    // ========================================================================
    // Debug naming
    // ========================================================================

    // Label the swapchain for debugging tools when XR_EXT_debug_utils is
    // enabled. Without the extension this is a no-op. Throws
    // std::invalid_argument if name contains an embedded NUL.
    void set_name(std::string_view name) const;

private:
    Swapchain(std::shared_ptr<Session> session, XrSwapchain handle);

    void destroy() noexcept;
    [[nodiscard]] const DriverInterface& driver() const { return session_->driver(); }

    std::shared_ptr<Session> session_;
    XrSwapchain handle_ = XR_NULL_HANDLE;
};

}  // namespace xrframe::xr
