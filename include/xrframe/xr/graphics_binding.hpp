// XRFrame Swapchain Layer
// graphics_binding.hpp - Graphics backend capability interface

#pragma once

#include <openxr/openxr.h>

#include <cstddef>
#include <cstdint>

namespace xrframe::xr {

// Abstract graphics binding
// Describes the backend-specific swapchain image struct the runtime fills in
// (XrSwapchainImageVulkanKHR, XrSwapchainImageOpenGLKHR, ...).
// Implementations live with the renderer; this layer only needs the layout.
class GraphicsBinding {
public:
    virtual ~GraphicsBinding() = default;

    // Non-copyable
    GraphicsBinding(const GraphicsBinding&) = delete;
    GraphicsBinding& operator=(const GraphicsBinding&) = delete;

    // Structure type tag written into every image struct before enumeration
    [[nodiscard]] virtual XrStructureType image_structure_type() const = 0;

    // Size in bytes of one image struct (array stride)
    [[nodiscard]] virtual size_t image_structure_size() const = 0;

    // Backend image handle stored in one filled image struct
    [[nodiscard]] virtual uint64_t native_image(const XrSwapchainImageBaseHeader& image) const = 0;

    [[nodiscard]] virtual const char* name() const = 0;

protected:
    GraphicsBinding() = default;
};

}  // namespace xrframe::xr
