#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "pixedit/color.hpp"
#include "pixedit/effects.hpp"
#include "pixedit/errors.hpp"
#include "pixedit/filters.hpp"
#include "raster_helpers.hpp"

using pe::FilterKind;
using pe::FilterParameters;
using pe::RasterBuffer;
using pe_test::make_noise;

static FilterParameters params(double b, double c, int r) {
    FilterParameters p;
    p.brightness  = b;
    p.contrast    = c;
    p.blur_radius = r;
    return p;
}

TEST(FilterParameters, DefaultsMatchEditorSliders) {
    FilterParameters p;
    EXPECT_EQ(p.brightness, 0.0);
    EXPECT_EQ(p.contrast, 0.0);
    EXPECT_EQ(p.blur_radius, 3);
}

TEST(Transform, DispatchesToEachFilter) {
    const RasterBuffer src = make_noise(11, 7);
    const FilterParameters p = params(25.0, -40.0, 2);

    EXPECT_EQ(pe::transform(src, FilterKind::Grayscale, p), pe::grayscale(src));
    EXPECT_EQ(pe::transform(src, FilterKind::Brightness, p), pe::adjust_brightness(src, 25.0));
    EXPECT_EQ(pe::transform(src, FilterKind::Contrast, p), pe::adjust_contrast(src, -40.0));
    EXPECT_EQ(pe::transform(src, FilterKind::BrightnessContrast, p),
              pe::adjust_brightness_contrast(src, 25.0, -40.0));
    EXPECT_EQ(pe::transform(src, FilterKind::GaussianBlur, p), pe::gaussian_blur(src, 2));
    EXPECT_EQ(pe::transform(src, FilterKind::EdgeDetection, p), pe::edge_detection(src));
    EXPECT_EQ(pe::transform(src, FilterKind::Sepia, p), pe::sepia(src));
}

TEST(Transform, NoneAndUnknownKindsAreIdentityClones) {
    const RasterBuffer src = make_noise(4, 4);

    RasterBuffer none = pe::transform(src, FilterKind::None, FilterParameters{});
    EXPECT_EQ(none, src);
    EXPECT_NE(none.data(), src.data());

    RasterBuffer unknown = pe::transform(src, static_cast<FilterKind>(99), FilterParameters{});
    EXPECT_EQ(unknown, src);
}

TEST(Transform, AlwaysReturnsNewStorage) {
    const RasterBuffer src = make_noise(6, 6);
    const FilterKind kinds[] = {
        FilterKind::None, FilterKind::Grayscale, FilterKind::Brightness,
        FilterKind::Contrast, FilterKind::BrightnessContrast,
        FilterKind::GaussianBlur, FilterKind::EdgeDetection, FilterKind::Sepia,
    };
    for (FilterKind k : kinds) {
        RasterBuffer out = pe::transform(src, k, params(0.0, 0.0, 0));
        EXPECT_NE(out.data(), src.data()) << pe::filter_name(k);
        EXPECT_EQ(out.width(), src.width());
        EXPECT_EQ(out.height(), src.height());
    }
    EXPECT_EQ(src, make_noise(6, 6));
}

TEST(Transform, ZeroRadiusBlurIsIdentity) {
    const RasterBuffer src = make_noise(5, 3);
    EXPECT_EQ(pe::transform(src, FilterKind::GaussianBlur, params(0.0, 0.0, 0)), src);
}

TEST(Transform, RejectsEmptyBuffer) {
    EXPECT_THROW(pe::transform(RasterBuffer(), FilterKind::None, FilterParameters{}),
                 pe::InvalidDimensions);
}

TEST(FilterNames, RoundTripThroughParser) {
    const FilterKind kinds[] = {
        FilterKind::None, FilterKind::Grayscale, FilterKind::Brightness,
        FilterKind::Contrast, FilterKind::BrightnessContrast,
        FilterKind::GaussianBlur, FilterKind::EdgeDetection, FilterKind::Sepia,
    };
    for (FilterKind k : kinds) {
        EXPECT_EQ(pe::parse_filter_kind(pe::filter_name(k)), k);
    }
    EXPECT_STREQ(pe::filter_name(FilterKind::BrightnessContrast), "brightness_contrast");
}

TEST(FilterNames, UnknownNameThrows) {
    EXPECT_THROW(pe::parse_filter_kind("emboss"), std::invalid_argument);
    EXPECT_THROW(pe::parse_filter_kind("Grayscale"), std::invalid_argument);
}

TEST(FilterNames, AvailableFiltersMatchEditorPicker) {
    const auto& filters = pe::available_filters();
    ASSERT_EQ(filters.size(), 6u);
    EXPECT_EQ(filters.front(), FilterKind::None);
    EXPECT_EQ(filters[2], FilterKind::Sepia);
    EXPECT_EQ(filters.back(), FilterKind::EdgeDetection);
}
