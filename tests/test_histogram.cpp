#include <gtest/gtest.h>

#include "pixedit/errors.hpp"
#include "pixedit/histogram.hpp"
#include "raster_helpers.hpp"

using pe::ImageHistogram;
using pe::RasterBuffer;
using pe_test::make_noise;
using pe_test::make_solid;
using pe_test::set_pixel;
using pe_test::Pixel;

TEST(Histogram, CountsEachChannelIndependently) {
    ImageHistogram h = pe::compute_histogram(make_solid(1, 1, Pixel{100, 150, 200, 255}));

    EXPECT_EQ(h.blue[100], 1u);
    EXPECT_EQ(h.green[150], 1u);
    EXPECT_EQ(h.red[200], 1u);
    EXPECT_EQ(h.red[100], 0u);
    EXPECT_EQ(h.max_value, 1u);
}

TEST(Histogram, ConservesMass) {
    for (std::uint32_t seed : {1u, 7u, 2024u}) {
        RasterBuffer buf = make_noise(37, 19, seed);
        ImageHistogram h = pe::compute_histogram(buf);
        const std::uint64_t n = 37u * 19u;
        EXPECT_EQ(ImageHistogram::total(h.red), n);
        EXPECT_EQ(ImageHistogram::total(h.green), n);
        EXPECT_EQ(ImageHistogram::total(h.blue), n);
    }
}

TEST(Histogram, MaxValueSpansAllChannels) {
    // 6 個像素：red 全是 10，green / blue 分散
    RasterBuffer buf(3, 2);
    for (std::uint32_t i = 0; i < 6; ++i) {
        const auto v = static_cast<std::uint8_t>(i * 20);
        set_pixel(buf, i % 3, i / 3, Pixel{v, static_cast<std::uint8_t>(v + 1), 10, 0});
    }
    ImageHistogram h = pe::compute_histogram(buf);
    EXPECT_EQ(h.red[10], 6u);
    EXPECT_EQ(h.max_value, 6u);
}

TEST(Histogram, IgnoresAlpha) {
    RasterBuffer a = make_solid(4, 4, Pixel{1, 2, 3, 0});
    RasterBuffer b = make_solid(4, 4, Pixel{1, 2, 3, 255});
    ImageHistogram ha = pe::compute_histogram(a);
    ImageHistogram hb = pe::compute_histogram(b);
    EXPECT_EQ(ha.red, hb.red);
    EXPECT_EQ(ha.green, hb.green);
    EXPECT_EQ(ha.blue, hb.blue);
}

TEST(Histogram, EmptyBufferIsAnError) {
    EXPECT_THROW(pe::compute_histogram(RasterBuffer()), pe::InvalidDimensions);
}
