#include <gtest/gtest.h>

#include "pixedit/effects.hpp"
#include "pixedit/errors.hpp"
#include "raster_helpers.hpp"

using pe::RasterBuffer;
using pe_test::make_solid;
using pe_test::pixel_at;
using pe_test::set_pixel;
using pe_test::Pixel;

static void expect_transparent_border(const RasterBuffer& out) {
    const std::uint32_t W = out.width();
    const std::uint32_t H = out.height();
    for (std::uint32_t y = 0; y < H; ++y) {
        for (std::uint32_t x = 0; x < W; ++x) {
            const bool border = x == 0 || y == 0 || x == W - 1 || y == H - 1;
            if (border) {
                EXPECT_EQ(pixel_at(out, x, y), (Pixel{0, 0, 0, 0})) << "(" << x << "," << y << ")";
            }
        }
    }
}

TEST(EdgeDetection, BorderRingIsTransparentBlack) {
    RasterBuffer src = make_solid(3, 3, Pixel{0, 0, 0, 255});
    set_pixel(src, 1, 1, Pixel{255, 255, 255, 255});

    RasterBuffer out = pe::edge_detection(src);
    expect_transparent_border(out);

    // Sobel 兩個 kernel 的中心權重都是 0，只有中心亮時梯度為 0，但 alpha 仍寫成 255
    EXPECT_EQ(pixel_at(out, 1, 1), (Pixel{0, 0, 0, 255}));
}

TEST(EdgeDetection, VerticalEdgeGivesHorizontalGradient) {
    // 右欄灰階 50：gx = 50 * (1 + 2 + 1) = 200，gy = 0
    RasterBuffer src = make_solid(3, 3, Pixel{0, 0, 0, 255});
    for (std::uint32_t y = 0; y < 3; ++y) {
        set_pixel(src, 2, y, Pixel{50, 50, 50, 255});
    }

    RasterBuffer out = pe::edge_detection(src);
    EXPECT_EQ(pixel_at(out, 1, 1), (Pixel{200, 200, 200, 255}));
    expect_transparent_border(out);
}

TEST(EdgeDetection, MagnitudeIsClamped) {
    RasterBuffer src = make_solid(3, 3, Pixel{0, 0, 0, 255});
    for (std::uint32_t y = 0; y < 3; ++y) {
        set_pixel(src, 2, y, Pixel{255, 255, 255, 255});
    }
    EXPECT_EQ(pixel_at(pe::edge_detection(src), 1, 1), (Pixel{255, 255, 255, 255}));
}

TEST(EdgeDetection, DiagonalCornerCombinesBothGradients) {
    // 只有右下角 100：gx = gy = 100，sqrt(20000) = 141.42
    RasterBuffer src = make_solid(3, 3, Pixel{0, 0, 0, 255});
    set_pixel(src, 2, 2, Pixel{100, 100, 100, 255});
    EXPECT_EQ(pixel_at(pe::edge_detection(src), 1, 1), (Pixel{141, 141, 141, 255}));
}

TEST(EdgeDetection, FlatImageHasNoEdgesButOpaqueInterior) {
    RasterBuffer out = pe::edge_detection(make_solid(5, 4, Pixel{90, 90, 90, 0}));
    for (std::uint32_t y = 1; y < 3; ++y) {
        for (std::uint32_t x = 1; x < 4; ++x) {
            EXPECT_EQ(pixel_at(out, x, y), (Pixel{0, 0, 0, 255}));
        }
    }
    expect_transparent_border(out);
}

TEST(EdgeDetection, TooSmallForInteriorIsAllZero) {
    RasterBuffer out = pe::edge_detection(make_solid(2, 5, Pixel{10, 200, 30, 255}));
    ASSERT_EQ(out.width(), 2u);
    ASSERT_EQ(out.height(), 5u);
    for (std::size_t i = 0; i < out.size(); ++i) {
        EXPECT_EQ(out.data()[i], 0);
    }
}

TEST(EdgeDetection, RejectsEmptyInput) {
    EXPECT_THROW(pe::edge_detection(RasterBuffer()), pe::InvalidDimensions);
}
