// XRFrame Swapchain Tests
// image_ring_test.cpp - Token-checked acquire/wait/release

#include <gtest/gtest.h>
#include <xrframe/xr/error.hpp>
#include <xrframe/xr/image_ring.hpp>

#include "support/fake_runtime.hpp"

#include <stdexcept>
#include <utility>

using namespace xrframe::xr;
using xrframe::test::FakeRuntime;

class ImageRingTest : public ::testing::Test {
protected:
    FakeRuntime runtime_;

    Swapchain make_swapchain() {
        SwapchainDesc desc;
        desc.format = 0x8058;
        desc.width = 640;
        desc.height = 480;
        return Swapchain::create(runtime_.make_session(), desc);
    }
};

TEST_F(ImageRingTest, EnumeratesOnConstruction) {
    Swapchain swapchain = make_swapchain();
    XrSwapchain handle = swapchain.raw_handle();

    ImageRing ring(std::move(swapchain));
    EXPECT_EQ(ring.image_count(), runtime_.image_count);
    EXPECT_EQ(ring.swapchain().raw_handle(), handle);
    EXPECT_EQ(runtime_.calls().enumerate_images, 2u);
}

TEST_F(ImageRingTest, FullCycleMovesTokens) {
    ImageRing ring(make_swapchain());

    for (int frame = 0; frame < 6; ++frame) {
        AcquiredImage acquired = ring.acquire();
        ASSERT_TRUE(acquired);
        uint32_t index = acquired.index();

        std::optional<ReadyImage> ready = ring.wait(acquired);
        ASSERT_TRUE(ready.has_value());
        EXPECT_FALSE(acquired);
        EXPECT_EQ(ready->index(), index);
        EXPECT_EQ(ready->image().native_image, FakeRuntime::texture_for(index));

        ring.release(std::move(*ready));
        EXPECT_FALSE(*ready);  // NOLINT(bugprone-use-after-move)
    }

    EXPECT_EQ(runtime_.calls().release, 6u);
}

TEST_F(ImageRingTest, TimeoutKeepsAcquiredToken) {
    runtime_.timeouts_before_ready = 1;
    ImageRing ring(make_swapchain());

    AcquiredImage acquired = ring.acquire();
    EXPECT_FALSE(ring.wait(acquired, NO_TIMEOUT).has_value());
    EXPECT_TRUE(acquired);
    EXPECT_EQ(ring.pending().size(), 1u);

    auto ready = ring.wait(acquired, NO_TIMEOUT);
    ASSERT_TRUE(ready.has_value());
    EXPECT_TRUE(ring.pending().empty());
    ring.release(std::move(*ready));
}

TEST_F(ImageRingTest, WaitUsesConfiguredTimeout) {
    SwapchainSettings settings;
    settings.wait_timeout = std::chrono::milliseconds(3);
    ImageRing ring(make_swapchain(), settings);

    AcquiredImage acquired = ring.acquire();
    auto ready = ring.wait(acquired);
    ASSERT_TRUE(ready.has_value());

    ASSERT_EQ(runtime_.wait_timeouts().size(), 1u);
    EXPECT_EQ(runtime_.wait_timeouts().front(), 3'000'000);
    ring.release(std::move(*ready));
}

TEST_F(ImageRingTest, EmptyTokensRejectedBeforeRuntime) {
    ImageRing ring(make_swapchain());

    AcquiredImage empty_acquired;
    EXPECT_THROW((void)ring.wait(empty_acquired, NO_TIMEOUT), std::logic_error);

    ReadyImage empty_ready;
    EXPECT_THROW(ring.release(std::move(empty_ready)), std::logic_error);

    EXPECT_EQ(runtime_.calls().wait, 0u);
    EXPECT_EQ(runtime_.calls().release, 0u);
}

TEST_F(ImageRingTest, MovedFromTokenIsEmpty) {
    ImageRing ring(make_swapchain());

    AcquiredImage first = ring.acquire();
    AcquiredImage second = std::move(first);
    EXPECT_FALSE(first);  // NOLINT(bugprone-use-after-move)
    EXPECT_TRUE(second);

    EXPECT_THROW((void)ring.wait(first, NO_TIMEOUT), std::logic_error);  // NOLINT(bugprone-use-after-move)
    auto ready = ring.wait(second, NO_TIMEOUT);
    ASSERT_TRUE(ready.has_value());
    ring.release(std::move(*ready));
}

TEST_F(ImageRingTest, RuntimeBoundStillApplies) {
    runtime_.image_count = 2;
    ImageRing ring(make_swapchain());

    AcquiredImage a = ring.acquire();
    AcquiredImage b = ring.acquire();
    EXPECT_THROW((void)ring.acquire(), DriverError);
}

// ============================================================================
// Acquisition order
// ============================================================================

TEST_F(ImageRingTest, WaitOnNewerTokenRejected) {
    ImageRing ring(make_swapchain());

    AcquiredImage older = ring.acquire();
    AcquiredImage newer = ring.acquire();
    ASSERT_NE(older.index(), newer.index());

    EXPECT_THROW((void)ring.wait(newer, NO_TIMEOUT), std::logic_error);
    EXPECT_TRUE(newer);
    EXPECT_EQ(runtime_.calls().wait, 0u);

    // In order, each Ready token names the image the runtime readied
    auto ready = ring.wait(older, NO_TIMEOUT);
    ASSERT_TRUE(ready.has_value());
    auto state = runtime_.state(ring.swapchain().raw_handle());
    ASSERT_TRUE(state->waited.has_value());
    EXPECT_EQ(ready->index(), *state->waited);
    ring.release(std::move(*ready));

    ready = ring.wait(newer, NO_TIMEOUT);
    ASSERT_TRUE(ready.has_value());
    state = runtime_.state(ring.swapchain().raw_handle());
    EXPECT_EQ(ready->index(), *state->waited);
    ring.release(std::move(*ready));

    EXPECT_EQ(state->release_order, state->acquire_order);
}

TEST_F(ImageRingTest, SecondWaitBeforeReleaseRejected) {
    ImageRing ring(make_swapchain());

    AcquiredImage first = ring.acquire();
    AcquiredImage second = ring.acquire();
    auto ready = ring.wait(first, NO_TIMEOUT);
    ASSERT_TRUE(ready.has_value());

    EXPECT_THROW((void)ring.wait(second, NO_TIMEOUT), std::logic_error);
    EXPECT_EQ(runtime_.calls().wait, 1u);
    ring.release(std::move(*ready));
}

// ============================================================================
// Ownership
// ============================================================================

TEST_F(ImageRingTest, SourceSwapchainMovedAwayAtConstruction) {
    Swapchain swapchain = make_swapchain();
    ImageRing ring(std::move(swapchain));

    // Moving the source again cannot affect the ring
    Swapchain moved = std::move(swapchain);  // NOLINT(bugprone-use-after-move)
    EXPECT_EQ(moved.raw_handle(), XR_NULL_HANDLE);

    AcquiredImage acquired = ring.acquire();
    auto ready = ring.wait(acquired, NO_TIMEOUT);
    ASSERT_TRUE(ready.has_value());
    ring.release(std::move(*ready));
}

TEST_F(ImageRingTest, MovedRingKeepsWorking) {
    ImageRing ring(make_swapchain());
    XrSwapchain handle = ring.swapchain().raw_handle();

    AcquiredImage acquired = ring.acquire();
    ImageRing moved = std::move(ring);
    EXPECT_EQ(moved.swapchain().raw_handle(), handle);

    auto ready = moved.wait(acquired, NO_TIMEOUT);
    ASSERT_TRUE(ready.has_value());
    moved.release(std::move(*ready));
    EXPECT_EQ(runtime_.calls().destroy, 0u);
}

TEST_F(ImageRingTest, RingDestroysSwapchainOnce) {
    XrSwapchain handle = XR_NULL_HANDLE;
    {
        ImageRing ring(make_swapchain());
        handle = ring.swapchain().raw_handle();
    }
    EXPECT_EQ(runtime_.state(handle)->destroy_calls, 1u);
}

TEST_F(ImageRingTest, EmptySwapchainRejected) {
    Swapchain swapchain = make_swapchain();
    Swapchain owner = std::move(swapchain);

    EXPECT_THROW(ImageRing ring(std::move(swapchain)), std::invalid_argument);  // NOLINT(bugprone-use-after-move)
}
