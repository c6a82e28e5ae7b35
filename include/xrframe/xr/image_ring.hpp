// XRFrame Swapchain Layer
// image_ring.hpp - Token-checked acquire/wait/release on top of Swapchain

#pragma once

#include "swapchain.hpp"
#include "swapchain_settings.hpp"
#include "types.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace xrframe::xr {

class ImageRing;

// An image that has been acquired but not yet waited on.
// Move-only; emptied once a wait succeeds.
class AcquiredImage {
public:
    AcquiredImage() = default;
    AcquiredImage(AcquiredImage&& other) noexcept;
    AcquiredImage& operator=(AcquiredImage&& other) noexcept;
    AcquiredImage(const AcquiredImage&) = delete;
    AcquiredImage& operator=(const AcquiredImage&) = delete;

    [[nodiscard]] bool valid() const { return index_.has_value(); }
    explicit operator bool() const { return valid(); }

    // Precondition: valid()
    [[nodiscard]] uint32_t index() const { return *index_; }

private:
    friend class ImageRing;
    explicit AcquiredImage(uint32_t index) : index_(index) {}

    std::optional<uint32_t> index_;
};

// An image the compositor has finished with; safe to render into until it is
// handed back with ImageRing::release().
class ReadyImage {
public:
    ReadyImage() = default;
    ReadyImage(ReadyImage&& other) noexcept;
    ReadyImage& operator=(ReadyImage&& other) noexcept;
    ReadyImage(const ReadyImage&) = delete;
    ReadyImage& operator=(const ReadyImage&) = delete;

    [[nodiscard]] bool valid() const { return image_.has_value(); }
    explicit operator bool() const { return valid(); }

    // Precondition: valid()
    [[nodiscard]] uint32_t index() const { return image_->index; }
    [[nodiscard]] const SwapchainImage& image() const { return *image_; }

private:
    friend class ImageRing;
    explicit ReadyImage(const SwapchainImage& image) : image_(image) {}

    std::optional<SwapchainImage> image_;
};

// Owns a swapchain and hands out tokens so that waits and releases require
// the token produced by the previous step. Tokens must be waited on in the
// order they were acquired and released in the order they became ready,
// matching the runtime's FIFO handshake. Violations throw std::logic_error
// before the runtime is called. Tokens from different rings are not told apart.
class ImageRing {
public:
    // Takes ownership of swapchain and enumerates its images once.
    // Throws std::invalid_argument for an empty swapchain, DriverError on failure.
    explicit ImageRing(Swapchain swapchain, const SwapchainSettings& settings = {});

    [[nodiscard]] AcquiredImage acquire();

    // image must be the oldest token not yet waited on. On success image is
    // emptied and the Ready token returned. On timeout returns std::nullopt
    // and image stays valid so the wait can be retried.
    [[nodiscard]] std::optional<ReadyImage> wait(AcquiredImage& image);
    [[nodiscard]] std::optional<ReadyImage> wait(AcquiredImage& image, Duration timeout);

    void release(ReadyImage&& image);

    [[nodiscard]] Swapchain& swapchain() { return swapchain_; }
    [[nodiscard]] const Swapchain& swapchain() const { return swapchain_; }
    [[nodiscard]] const std::vector<SwapchainImage>& images() const { return images_; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(images_.size()); }

    // Acquired and not yet waited on, oldest first
    [[nodiscard]] const std::deque<uint32_t>& pending() const { return pending_; }

private:
    Swapchain swapchain_;
    SwapchainSettings settings_;
    std::vector<SwapchainImage> images_;
    std::deque<uint32_t> pending_;
    std::optional<uint32_t> ready_;
};

}  // namespace xrframe::xr
