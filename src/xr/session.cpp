// XRFrame Swapchain Layer
// session.cpp - Session implementation

#include <xrframe/core/logger.hpp>
#include <xrframe/xr/error.hpp>
#include <xrframe/xr/session.hpp>
#include <xrframe/xr/types.hpp>

#include <stdexcept>
#include <utility>

namespace xrframe::xr {

std::shared_ptr<Session> Session::adopt(std::shared_ptr<const DriverInterface> driver, XrSession handle,
                                        std::shared_ptr<const GraphicsBinding> graphics,
                                        SessionOwnership ownership) {
    if (!driver) {
        throw std::invalid_argument("Session::adopt: driver interface is null");
    }
    if (!graphics) {
        throw std::invalid_argument("Session::adopt: graphics binding is null");
    }

    XRFRAME_LOG_DEBUG(core::log_category::XR, "Adopted session {:#x} ({} binding, {})", handle_to_u64(handle),
                      graphics->name(), ownership == SessionOwnership::Owned ? "owned" : "borrowed");
    return std::shared_ptr<Session>(new Session(std::move(driver), handle, std::move(graphics), ownership));
}

Session::Session(std::shared_ptr<const DriverInterface> driver, XrSession handle,
                 std::shared_ptr<const GraphicsBinding> graphics, SessionOwnership ownership)
    : driver_(std::move(driver)), graphics_(std::move(graphics)), handle_(handle), ownership_(ownership) {}

Session::~Session() {
    if (ownership_ != SessionOwnership::Owned || handle_ == XR_NULL_HANDLE) {
        return;
    }

    XrResult result = driver_->fp().destroy_session(handle_);
    if (XR_FAILED(result)) {
        // Nothing left to recover during teardown
        XRFRAME_LOG_WARN(core::log_category::XR, "xrDestroySession failed for {:#x}: {}", handle_to_u64(handle_),
                         driver_->result_name(result));
    } else {
        XRFRAME_LOG_DEBUG(core::log_category::XR, "Destroyed session {:#x}", handle_to_u64(handle_));
    }
}

std::vector<int64_t> Session::enumerate_swapchain_formats() const {
    const auto& fp = driver_->fp();

    uint32_t count = 0;
    driver_->check(fp.enumerate_swapchain_formats(handle_, 0, &count, nullptr), "xrEnumerateSwapchainFormats");

    std::vector<int64_t> formats(count);
    uint32_t written = 0;
    driver_->check(fp.enumerate_swapchain_formats(handle_, count, &written, formats.data()),
                   "xrEnumerateSwapchainFormats");

    if (written != count) {
        XRFRAME_LOG_ERROR(core::log_category::XR, "Swapchain format count changed between calls ({} -> {})", count,
                          written);
        throw DriverError(XR_ERROR_RUNTIME_FAILURE, "xrEnumerateSwapchainFormats",
                          fmt::format("swapchain format count changed between calls ({} -> {})", count, written));
    }

    return formats;
}

}  // namespace xrframe::xr
