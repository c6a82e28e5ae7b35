// XRFrame Swapchain Layer
// error.cpp - DriverError implementation

#include <xrframe/xr/error.hpp>

namespace xrframe::xr {

DriverError::DriverError(XrResult result, const char* operation, const std::string& message)
    : std::runtime_error(message), result_(result), operation_(operation) {}

}  // namespace xrframe::xr
