// XRFrame Swapchain Layer
// image_ring.cpp - Token-checked image ring

#include <xrframe/core/logger.hpp>
#include <xrframe/xr/error.hpp>
#include <xrframe/xr/image_ring.hpp>

#include <stdexcept>
#include <utility>

namespace xrframe::xr {

AcquiredImage::AcquiredImage(AcquiredImage&& other) noexcept
    : index_(std::exchange(other.index_, std::nullopt)) {}

AcquiredImage& AcquiredImage::operator=(AcquiredImage&& other) noexcept {
    index_ = std::exchange(other.index_, std::nullopt);
    return *this;
}

ReadyImage::ReadyImage(ReadyImage&& other) noexcept
    : image_(std::exchange(other.image_, std::nullopt)) {}

ReadyImage& ReadyImage::operator=(ReadyImage&& other) noexcept {
    image_ = std::exchange(other.image_, std::nullopt);
    return *this;
}

namespace {

Swapchain& require_live(Swapchain& swapchain) {
    if (swapchain.raw_handle() == XR_NULL_HANDLE) {
        throw std::invalid_argument("ImageRing: swapchain owns no handle");
    }
    return swapchain;
}

}  // namespace

ImageRing::ImageRing(Swapchain swapchain, const SwapchainSettings& settings)
    : swapchain_(std::move(swapchain)),
      settings_(settings),
      images_(require_live(swapchain_).enumerate_images()) {}

AcquiredImage ImageRing::acquire() {
    uint32_t index = swapchain_.acquire_image();
    if (index >= images_.size()) {
        XRFRAME_LOG_ERROR(core::log_category::SWAPCHAIN, "Runtime returned image {} for a ring of {}", index,
                          images_.size());
        throw DriverError(XR_ERROR_RUNTIME_FAILURE, "xrAcquireSwapchainImage",
                          fmt::format("image index {} out of range for a ring of {}", index, images_.size()));
    }
    pending_.push_back(index);
    return AcquiredImage(index);
}

std::optional<ReadyImage> ImageRing::wait(AcquiredImage& image) {
    return wait(image, settings_.wait_timeout);
}

std::optional<ReadyImage> ImageRing::wait(AcquiredImage& image, Duration timeout) {
    if (!image) {
        throw std::logic_error("ImageRing::wait called without an acquired image");
    }
    // The runtime always readies the oldest acquisition
    if (pending_.empty() || pending_.front() != image.index()) {
        throw std::logic_error(
            fmt::format("ImageRing::wait called with image {} out of acquisition order", image.index()));
    }
    if (ready_) {
        throw std::logic_error(fmt::format("ImageRing::wait called while image {} is still ready", *ready_));
    }

    if (swapchain_.wait_image(timeout) == WaitResult::Timeout) {
        return std::nullopt;
    }

    pending_.pop_front();
    ready_ = *std::exchange(image.index_, std::nullopt);
    return ReadyImage(images_[*ready_]);
}

void ImageRing::release(ReadyImage&& image) {
    if (!image) {
        throw std::logic_error("ImageRing::release called without a ready image");
    }
    if (!ready_ || *ready_ != image.index()) {
        throw std::logic_error(fmt::format("ImageRing::release called with image {} which is not the ready image",
                                           image.index()));
    }

    swapchain_.release_image();
    ready_.reset();
    image.image_.reset();
}

}  // namespace xrframe::xr
