// XRFrame Swapchain Layer
// session.hpp - Session owning the runtime session handle

#pragma once

#include "driver_interface.hpp"
#include "graphics_binding.hpp"

#include <openxr/openxr.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace xrframe::xr {

enum class SessionOwnership : uint8_t {
    Owned,     // xrDestroySession is called when the last reference is released
    Borrowed,  // The handle is destroyed by someone else
};

// Always held through std::shared_ptr. Every Swapchain keeps a reference, so
// a Session outlives all swapchains created from it.
class Session {
public:
    // Take (or borrow) an existing session handle.
    // driver and graphics must be non-null; throws std::invalid_argument otherwise.
    [[nodiscard]] static std::shared_ptr<Session> adopt(std::shared_ptr<const DriverInterface> driver,
                                                        XrSession handle,
                                                        std::shared_ptr<const GraphicsBinding> graphics,
                                                        SessionOwnership ownership = SessionOwnership::Owned);

    ~Session();

    // Non-copyable, non-movable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    [[nodiscard]] XrSession raw_handle() const { return handle_; }
    [[nodiscard]] XrInstance instance() const { return driver_->instance(); }
    [[nodiscard]] const DriverInterface& driver() const { return *driver_; }
    [[nodiscard]] const GraphicsBinding& graphics() const { return *graphics_; }
    [[nodiscard]] SessionOwnership ownership() const { return ownership_; }

    // Formats the runtime supports for swapchain creation, in its order of preference
    [[nodiscard]] std::vector<int64_t> enumerate_swapchain_formats() const;

private:
    Session(std::shared_ptr<const DriverInterface> driver, XrSession handle,
            std::shared_ptr<const GraphicsBinding> graphics, SessionOwnership ownership);

    std::shared_ptr<const DriverInterface> driver_;
    std::shared_ptr<const GraphicsBinding> graphics_;
    XrSession handle_;
    SessionOwnership ownership_;
};

}  // namespace xrframe::xr
