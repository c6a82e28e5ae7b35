// XRFrame Swapchain Layer
// swapchain.cpp - Swapchain lifecycle and image ring protocol

#include <xrframe/core/logger.hpp>
#include <xrframe/platform/timer.hpp>
#include <xrframe/xr/error.hpp>
#include <xrframe/xr/swapchain.hpp>

#include <cstddef>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace xrframe::xr {

using core::log_category::SWAPCHAIN;

// ============================================================================
// Lifecycle
// ============================================================================

Swapchain Swapchain::create(std::shared_ptr<Session> session, const SwapchainDesc& desc,
                            const SwapchainSettings& settings) {
    if (!session) {
        throw std::invalid_argument("Swapchain::create: session is null");
    }

    XrSwapchainCreateInfo info{XR_TYPE_SWAPCHAIN_CREATE_INFO};
    info.next = nullptr;
    info.createFlags = 0;
    if (desc.static_image) {
        info.createFlags |= XR_SWAPCHAIN_CREATE_STATIC_IMAGE_BIT;
    }
    if (desc.protected_content) {
        info.createFlags |= XR_SWAPCHAIN_CREATE_PROTECTED_CONTENT_BIT;
    }
    info.usageFlags = static_cast<XrSwapchainUsageFlags>(desc.usage);
    info.format = desc.format;
    info.sampleCount = desc.sample_count;
    info.width = desc.width;
    info.height = desc.height;
    info.faceCount = desc.face_count;
    info.arraySize = desc.array_size;
    info.mipCount = desc.mip_count;

    const DriverInterface& driver = session->driver();
    XrSwapchain handle = XR_NULL_HANDLE;
    driver.check(driver.fp().create_swapchain(session->raw_handle(), &info, &handle), "xrCreateSwapchain");

    XRFRAME_LOG_DEBUG(SWAPCHAIN, "Created swapchain {:#x} ({}x{}, format {}, {} samples)", handle_to_u64(handle),
                      desc.width, desc.height, desc.format, desc.sample_count);

    // Owned from here on; a failing set_name below still destroys the handle
    Swapchain swapchain(std::move(session), handle);
    if (settings.apply_debug_names && !desc.debug_name.empty()) {
        swapchain.set_name(desc.debug_name);
    }
    return swapchain;
}

Swapchain Swapchain::from_raw(std::shared_ptr<Session> session, XrSwapchain handle) {
    if (!session) {
        throw std::invalid_argument("Swapchain::from_raw: session is null");
    }
    XRFRAME_LOG_DEBUG(SWAPCHAIN, "Adopted swapchain {:#x}", handle_to_u64(handle));
    return Swapchain(std::move(session), handle);
}

Swapchain::Swapchain(std::shared_ptr<Session> session, XrSwapchain handle)
    : session_(std::move(session)), handle_(handle) {}

Swapchain::~Swapchain() {
    destroy();
}

Swapchain::Swapchain(Swapchain&& other) noexcept
    : session_(std::move(other.session_)), handle_(std::exchange(other.handle_, XR_NULL_HANDLE)) {}

Swapchain& Swapchain::operator=(Swapchain&& other) noexcept {
    if (this != &other) {
        destroy();
        session_ = std::move(other.session_);
        handle_ = std::exchange(other.handle_, XR_NULL_HANDLE);
    }
    return *this;
}

void Swapchain::destroy() noexcept {
    if (handle_ == XR_NULL_HANDLE) {
        return;
    }

    // Outstanding acquired images are not waited for or reclaimed
    XrResult result = driver().fp().destroy_swapchain(handle_);
    if (XR_FAILED(result)) {
        XRFRAME_LOG_WARN(SWAPCHAIN, "xrDestroySwapchain failed for {:#x}: {}", handle_to_u64(handle_),
                         driver().result_name(result));
    } else {
        XRFRAME_LOG_DEBUG(SWAPCHAIN, "Destroyed swapchain {:#x}", handle_to_u64(handle_));
    }
    handle_ = XR_NULL_HANDLE;
}

// ============================================================================
// Image Ring
// ============================================================================

uint32_t Swapchain::acquire_image() const {
    XrSwapchainImageAcquireInfo info{XR_TYPE_SWAPCHAIN_IMAGE_ACQUIRE_INFO};
    info.next = nullptr;

    uint32_t index = 0;
    driver().check(driver().fp().acquire_swapchain_image(handle_, &info, &index), "xrAcquireSwapchainImage");

    XRFRAME_LOG_TRACE(SWAPCHAIN, "Acquired image {} on {:#x}", index, handle_to_u64(handle_));
    return index;
}

WaitResult Swapchain::wait_image(Duration timeout) const {
    XrSwapchainImageWaitInfo info{XR_TYPE_SWAPCHAIN_IMAGE_WAIT_INFO};
    info.next = nullptr;
    info.timeout = to_xr_duration(timeout);

    platform::Timer timer;
    XrResult result = driver().check(driver().fp().wait_swapchain_image(handle_, &info), "xrWaitSwapchainImage");

    if (result == XR_TIMEOUT_EXPIRED) {
        XRFRAME_LOG_TRACE(SWAPCHAIN, "Wait on {:#x} timed out after {:.3f} ms", handle_to_u64(handle_),
                          timer.elapsed_milliseconds());
        return WaitResult::Timeout;
    }

    XRFRAME_LOG_TRACE(SWAPCHAIN, "Waited {:.3f} ms on {:#x}", timer.elapsed_milliseconds(), handle_to_u64(handle_));
    return WaitResult::Ready;
}

void Swapchain::release_image() const {
    XrSwapchainImageReleaseInfo info{XR_TYPE_SWAPCHAIN_IMAGE_RELEASE_INFO};
    info.next = nullptr;

    driver().check(driver().fp().release_swapchain_image(handle_, &info), "xrReleaseSwapchainImage");
    XRFRAME_LOG_TRACE(SWAPCHAIN, "Released image on {:#x}", handle_to_u64(handle_));
}

std::vector<SwapchainImage> Swapchain::enumerate_images() const {
    const auto& fp = driver().fp();
    const GraphicsBinding& graphics = session_->graphics();

    const size_t stride = graphics.image_structure_size();
    if (stride < sizeof(XrSwapchainImageBaseHeader)) {
        throw std::logic_error(fmt::format("{} binding reports an image struct of {} bytes", graphics.name(), stride));
    }

    uint32_t count = 0;
    driver().check(fp.enumerate_swapchain_images(handle_, 0, &count, nullptr), "xrEnumerateSwapchainImages");

    // Backend structs are laid out back to back; only the common header is
    // initialized here, the runtime fills the rest
    std::vector<std::byte> storage(static_cast<size_t>(count) * stride);
    auto header_at = [&](uint32_t i) {
        return reinterpret_cast<XrSwapchainImageBaseHeader*>(storage.data() + static_cast<size_t>(i) * stride);
    };
    for (uint32_t i = 0; i < count; ++i) {
        new (storage.data() + static_cast<size_t>(i) * stride)
            XrSwapchainImageBaseHeader{graphics.image_structure_type(), nullptr};
    }

    uint32_t written = 0;
    driver().check(fp.enumerate_swapchain_images(handle_, count, &written, count > 0 ? header_at(0) : nullptr),
                   "xrEnumerateSwapchainImages");

    if (written != count) {
        XRFRAME_LOG_ERROR(SWAPCHAIN, "Image count of {:#x} changed between calls ({} -> {})", handle_to_u64(handle_),
                          count, written);
        throw DriverError(XR_ERROR_RUNTIME_FAILURE, "xrEnumerateSwapchainImages",
                          fmt::format("swapchain image count changed between calls ({} -> {})", count, written));
    }

    std::vector<SwapchainImage> images;
    images.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        images.push_back(SwapchainImage{i, graphics.native_image(*header_at(i))});
    }

    XRFRAME_LOG_DEBUG(SWAPCHAIN, "Swapchain {:#x} has {} images", handle_to_u64(handle_), count);
    return images;
}

// ============================================================================
// Debug naming
// ============================================================================

void Swapchain::set_name(std::string_view name) const {
    if (name.find('\0') != std::string_view::npos) {
        throw std::invalid_argument("Swapchain::set_name: name contains an embedded NUL");
    }

    const auto& fp = driver().fp();
    if (fp.set_debug_utils_object_name == nullptr) {
        return;
    }

    std::string object_name(name);
    XrDebugUtilsObjectNameInfoEXT info{XR_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT};
    info.next = nullptr;
    info.objectType = XR_OBJECT_TYPE_SWAPCHAIN;
    info.objectHandle = handle_to_u64(handle_);
    info.objectName = object_name.c_str();

    driver().check(fp.set_debug_utils_object_name(instance(), &info), "xrSetDebugUtilsObjectNameEXT");
    XRFRAME_LOG_TRACE(SWAPCHAIN, "Named swapchain {:#x} \"{}\"", handle_to_u64(handle_), object_name);
}

}  // namespace xrframe::xr
