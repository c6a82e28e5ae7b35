// XRFrame Swapchain Tests
// driver_interface_test.cpp - Entry point resolution and result checking

#include <gtest/gtest.h>
#include <xrframe/xr/driver_interface.hpp>
#include <xrframe/xr/error.hpp>

#include "support/fake_runtime.hpp"

#include <string>
#include <vector>

using namespace xrframe::xr;
using xrframe::test::FakeRuntime;

class DriverInterfaceTest : public ::testing::Test {
protected:
    FakeRuntime runtime_;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(DriverInterfaceTest, LoadResolvesRequiredEntryPoints) {
    auto driver = runtime_.make_driver();
    const auto& fp = driver->fp();

    EXPECT_EQ(driver->instance(), runtime_.instance());
    EXPECT_NE(fp.create_swapchain, nullptr);
    EXPECT_NE(fp.destroy_swapchain, nullptr);
    EXPECT_NE(fp.enumerate_swapchain_images, nullptr);
    EXPECT_NE(fp.acquire_swapchain_image, nullptr);
    EXPECT_NE(fp.wait_swapchain_image, nullptr);
    EXPECT_NE(fp.release_swapchain_image, nullptr);
    EXPECT_NE(fp.enumerate_swapchain_formats, nullptr);
    EXPECT_NE(fp.destroy_session, nullptr);
    EXPECT_NE(fp.result_to_string, nullptr);
    EXPECT_FALSE(driver->has_debug_utils());
}

TEST_F(DriverInterfaceTest, DebugUtilsOnlyWhenExtensionEnabled) {
    std::vector<std::string> extensions = {"XR_KHR_opengl_enable"};
    auto without = DriverInterface::load(runtime_.instance(), FakeRuntime::get_instance_proc_addr(), extensions);
    EXPECT_FALSE(without->has_debug_utils());

    extensions.emplace_back(XR_EXT_DEBUG_UTILS_EXTENSION_NAME);
    auto with = DriverInterface::load(runtime_.instance(), FakeRuntime::get_instance_proc_addr(), extensions);
    EXPECT_TRUE(with->has_debug_utils());
}

TEST_F(DriverInterfaceTest, MissingRequiredEntryPointThrows) {
    runtime_.missing_entry_points.insert("xrWaitSwapchainImage");

    try {
        (void)runtime_.make_driver();
        FAIL() << "Expected DriverError";
    } catch (const DriverError& e) {
        EXPECT_EQ(e.result(), XR_ERROR_FUNCTION_UNSUPPORTED);
        EXPECT_NE(std::string(e.what()).find("xrWaitSwapchainImage"), std::string::npos);
    }
}

TEST_F(DriverInterfaceTest, MissingOptionalEntryPointIsTolerated) {
    runtime_.missing_entry_points.insert("xrResultToString");

    auto driver = runtime_.make_driver();
    EXPECT_EQ(driver->fp().result_to_string, nullptr);
    EXPECT_EQ(driver->result_name(XR_ERROR_HANDLE_INVALID), "XrResult(-12)");
}

TEST_F(DriverInterfaceTest, NullProcAddrThrows) {
    EXPECT_THROW((void)DriverInterface::load(runtime_.instance(), nullptr), DriverError);
}

TEST_F(DriverInterfaceTest, FromEntryPointsValidatesTable) {
    auto loaded = runtime_.make_driver();

    DriverInterface::EntryPoints table = loaded->fp();
    auto copy = DriverInterface::from_entry_points(runtime_.instance(), table);
    EXPECT_EQ(copy->fp().acquire_swapchain_image, table.acquire_swapchain_image);

    table.destroy_session = nullptr;
    try {
        (void)DriverInterface::from_entry_points(runtime_.instance(), table);
        FAIL() << "Expected DriverError";
    } catch (const DriverError& e) {
        EXPECT_STREQ(e.operation(), "xrDestroySession");
    }
}

// ============================================================================
// Result checking
// ============================================================================

TEST_F(DriverInterfaceTest, CheckPassesSuccessCodes) {
    auto driver = runtime_.make_driver();
    EXPECT_EQ(driver->check(XR_SUCCESS, "xrTest"), XR_SUCCESS);
    EXPECT_EQ(driver->check(XR_TIMEOUT_EXPIRED, "xrTest"), XR_TIMEOUT_EXPIRED);
}

TEST_F(DriverInterfaceTest, CheckThrowsWithRuntimeName) {
    auto driver = runtime_.make_driver();

    try {
        driver->check(XR_ERROR_HANDLE_INVALID, "xrAcquireSwapchainImage");
        FAIL() << "Expected DriverError";
    } catch (const DriverError& e) {
        EXPECT_EQ(e.result(), XR_ERROR_HANDLE_INVALID);
        EXPECT_STREQ(e.operation(), "xrAcquireSwapchainImage");
        EXPECT_EQ(std::string(e.what()), "xrAcquireSwapchainImage failed: XR_ERROR_HANDLE_INVALID (-12)");
    }
}

TEST_F(DriverInterfaceTest, UnknownResultFallsBackToCode) {
    auto driver = runtime_.make_driver();
    EXPECT_EQ(driver->result_name(static_cast<XrResult>(-999)), "XrResult(-999)");
}
