// XRFrame Swapchain Layer
// types.hpp - Common types, flags and descriptors

#pragma once

#include <openxr/openxr.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>

namespace xrframe::xr {

// ============================================================================
// Timeouts
// ============================================================================

using Duration = std::chrono::nanoseconds;

// Poll: return immediately if the image is not ready yet
inline constexpr Duration NO_TIMEOUT{0};
// Block until the image is ready
inline constexpr Duration INFINITE_TIMEOUT = Duration::max();

[[nodiscard]] constexpr XrDuration to_xr_duration(Duration timeout) {
    if (timeout == INFINITE_TIMEOUT) {
        return XR_INFINITE_DURATION;
    }
    if (timeout.count() < 0) {
        return XR_NO_DURATION;
    }
    return static_cast<XrDuration>(timeout.count());
}

// ============================================================================
// Handle conversion
// ============================================================================

// OpenXR handles are pointers on 64-bit targets and uint64_t elsewhere
template<typename Handle>
[[nodiscard]] inline uint64_t handle_to_u64(Handle handle) {
    if constexpr (std::is_pointer_v<Handle>) {
        return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(handle));
    } else {
        return static_cast<uint64_t>(handle);
    }
}

template<typename Handle>
[[nodiscard]] inline Handle handle_from_u64(uint64_t value) {
    if constexpr (std::is_pointer_v<Handle>) {
        return reinterpret_cast<Handle>(static_cast<uintptr_t>(value));
    } else {
        return static_cast<Handle>(value);
    }
}

// ============================================================================
// Swapchain Usage Flags
// ============================================================================

enum class SwapchainUsage : uint32_t {
    None = 0,
    ColorAttachment = XR_SWAPCHAIN_USAGE_COLOR_ATTACHMENT_BIT,
    DepthStencilAttachment = XR_SWAPCHAIN_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
    UnorderedAccess = XR_SWAPCHAIN_USAGE_UNORDERED_ACCESS_BIT,
    TransferSrc = XR_SWAPCHAIN_USAGE_TRANSFER_SRC_BIT,
    TransferDst = XR_SWAPCHAIN_USAGE_TRANSFER_DST_BIT,
    Sampled = XR_SWAPCHAIN_USAGE_SAMPLED_BIT,
    MutableFormat = XR_SWAPCHAIN_USAGE_MUTABLE_FORMAT_BIT,
};

inline SwapchainUsage operator|(SwapchainUsage a, SwapchainUsage b) {
    return static_cast<SwapchainUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline SwapchainUsage operator&(SwapchainUsage a, SwapchainUsage b) {
    return static_cast<SwapchainUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline bool has_flag(SwapchainUsage flags, SwapchainUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

// ============================================================================
// Descriptors
// ============================================================================

struct SwapchainDesc {
    int64_t format = 0;  // Backend format value (VkFormat, GLenum, DXGI_FORMAT)
    SwapchainUsage usage = SwapchainUsage::ColorAttachment | SwapchainUsage::Sampled;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t sample_count = 1;
    uint32_t face_count = 1;
    uint32_t array_size = 1;
    uint32_t mip_count = 1;
    bool static_image = false;
    bool protected_content = false;
    std::string debug_name;
};

// One slot of the image ring as reported by the runtime
struct SwapchainImage {
    uint32_t index = 0;
    uint64_t native_image = 0;  // VkImage, GL texture name, ID3D11Texture2D*, ...

    bool operator==(const SwapchainImage&) const = default;
};

// Outcome of waiting on the oldest acquired image
enum class WaitResult : uint8_t {
    Ready,
    Timeout,
};

[[nodiscard]] constexpr const char* to_string(WaitResult result) {
    switch (result) {
        case WaitResult::Ready:
            return "ready";
        case WaitResult::Timeout:
            return "timeout";
    }
    return "unknown";
}

}  // namespace xrframe::xr
