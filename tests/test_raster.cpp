#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

#include "pixedit/errors.hpp"
#include "pixedit/raster.hpp"
#include "pixedit/session.hpp"
#include "raster_helpers.hpp"

using pe::RasterBuffer;
using pe_test::make_noise;
using pe_test::pixel_at;
using pe_test::Pixel;

TEST(RasterBuffer, ConstructsFromMatchingBytes) {
    std::vector<std::uint8_t> bytes = {
        1, 2, 3, 4,    5, 6, 7, 8,
        9, 10, 11, 12, 13, 14, 15, 16,
    };
    RasterBuffer buf(2, 2, bytes);

    EXPECT_EQ(buf.width(), 2u);
    EXPECT_EQ(buf.height(), 2u);
    EXPECT_EQ(buf.stride(), 8u);
    EXPECT_EQ(buf.size(), 16u);
    EXPECT_EQ(buf.bytes(), bytes);
    EXPECT_EQ(pixel_at(buf, 1, 1), (Pixel{13, 14, 15, 16}));
}

TEST(RasterBuffer, RejectsLengthMismatch) {
    std::vector<std::uint8_t> short_bytes(2 * 2 * 4 - 1, 0);
    EXPECT_THROW(RasterBuffer(2, 2, short_bytes), pe::InvalidDimensions);

    std::vector<std::uint8_t> long_bytes(2 * 2 * 4 + 4, 0);
    EXPECT_THROW(RasterBuffer(2, 2, long_bytes), pe::InvalidDimensions);
}

TEST(RasterBuffer, RejectsZeroSize) {
    EXPECT_THROW(RasterBuffer(0, 4), pe::InvalidDimensions);
    EXPECT_THROW(RasterBuffer(4, 0, std::vector<std::uint8_t>{}), pe::InvalidDimensions);
}

TEST(RasterBuffer, RejectsDimensionsThatOverflowByteCount) {
    const std::uint32_t past_int = static_cast<std::uint32_t>(std::numeric_limits<int>::max()) + 1u;
    const std::uint32_t max_int  = static_cast<std::uint32_t>(std::numeric_limits<int>::max());

    EXPECT_THROW(RasterBuffer(past_int, 1), pe::InvalidDimensions);
    EXPECT_THROW(RasterBuffer(1, past_int), pe::InvalidDimensions);
    EXPECT_THROW(RasterBuffer(max_int, max_int), pe::InvalidDimensions);

    // 長度檢查之前就先擋下，不會因為乘法繞回而剛好「相等」
    EXPECT_THROW(RasterBuffer(0xFFFFFFFFu, 0xFFFFFFFFu, std::vector<std::uint8_t>{}),
                 pe::InvalidDimensions);
    EXPECT_THROW(pe::load_raster(std::vector<std::uint8_t>(16), 0x80000000u, 0x80000000u),
                 pe::InvalidDimensions);
}

TEST(RasterBuffer, InvalidDimensionsCarriesCode) {
    try {
        RasterBuffer(3, 3, std::vector<std::uint8_t>(5));
        FAIL() << "expected InvalidDimensions";
    } catch (const pe::Error& e) {
        EXPECT_EQ(e.code(), pe::ErrorCode::InvalidDimensions);
        EXPECT_STREQ(pe::to_string(e.code()), "InvalidDimensions");
    }
}

TEST(RasterBuffer, CloneIsByteEqualAndDoesNotAlias) {
    RasterBuffer src = make_noise(7, 5);
    RasterBuffer copy = src.clone();

    EXPECT_EQ(copy, src);
    EXPECT_NE(copy.data(), src.data());

    copy.data()[0] = static_cast<std::uint8_t>(src.data()[0] + 1);
    EXPECT_NE(copy, src);
    EXPECT_EQ(src, make_noise(7, 5));
}

TEST(RasterBuffer, MoveLeavesSourceEmpty) {
    RasterBuffer src = make_noise(4, 4);
    const std::uint8_t* storage = src.data();

    RasterBuffer dst = std::move(src);
    EXPECT_EQ(dst.data(), storage);
    EXPECT_TRUE(src.empty());  // NOLINT(bugprone-use-after-move)
    EXPECT_EQ(src.size(), 0u);
}

TEST(RasterBuffer, RequireValidRejectsEmpty) {
    RasterBuffer empty;
    EXPECT_THROW(pe::require_valid(empty, "test"), pe::InvalidDimensions);
    EXPECT_NO_THROW(pe::require_valid(make_noise(1, 1), "test"));
}
