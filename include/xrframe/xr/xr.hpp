// XRFrame Swapchain Layer
// xr.hpp - Main include

#pragma once

#include "driver_interface.hpp"
#include "error.hpp"
#include "graphics_binding.hpp"
#include "image_ring.hpp"
#include "session.hpp"
#include "swapchain.hpp"
#include "swapchain_settings.hpp"
#include "types.hpp"
