// XRFrame Swapchain Layer
// error.hpp - Errors reported by the OpenXR runtime

#pragma once

#include <openxr/openxr.h>

#include <stdexcept>
#include <string>

namespace xrframe::xr {

// A runtime entry point returned a failure code.
// Never retried internally; the caller decides how to recover.
class DriverError : public std::runtime_error {
public:
    DriverError(XrResult result, const char* operation, const std::string& message);

    [[nodiscard]] XrResult result() const noexcept { return result_; }

    // Name of the entry point that failed, e.g. "xrAcquireSwapchainImage"
    [[nodiscard]] const char* operation() const noexcept { return operation_; }

private:
    XrResult result_;
    const char* operation_;
};

}  // namespace xrframe::xr
