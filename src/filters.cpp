#include "pixedit/filters.hpp"
#include "pixedit/color.hpp"
#include "pixedit/effects.hpp"
#include "pixedit/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace pe {

// ============================================================
// Box blur（可分離：水平 → 垂直）
// ============================================================

static constexpr int C = RasterBuffer::kChannels;

// 沿著一個方向做平均。step 是相鄰樣本在 byte 上的距離，
// 水平 pass 為 4，垂直 pass 為 stride
static void blur_pass(const uint8_t* in, uint8_t* out,
                      int W, int H, int radius, bool horizontal) {
    const std::size_t stride = static_cast<std::size_t>(W) * C;

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            int sum_b = 0, sum_g = 0, sum_r = 0, count = 0;

            for (int t = -radius; t <= radius; ++t) {
                const int sx = horizontal ? x + t : x;
                const int sy = horizontal ? y : y + t;
                if (sx < 0 || sx >= W || sy < 0 || sy >= H) {
                    continue;  // 邊界外的樣本不算，除數也跟著少
                }
                const std::size_t s = static_cast<std::size_t>(sy) * stride
                                    + static_cast<std::size_t>(sx) * C;
                sum_b += in[s + RasterBuffer::Blue];
                sum_g += in[s + RasterBuffer::Green];
                sum_r += in[s + RasterBuffer::Red];
                ++count;
            }

            const std::size_t d = static_cast<std::size_t>(y) * stride
                                + static_cast<std::size_t>(x) * C;
            out[d + RasterBuffer::Blue]  = static_cast<uint8_t>(sum_b / count);
            out[d + RasterBuffer::Green] = static_cast<uint8_t>(sum_g / count);
            out[d + RasterBuffer::Red]   = static_cast<uint8_t>(sum_r / count);
            out[d + RasterBuffer::Alpha] = in[d + RasterBuffer::Alpha];
        }
    }
}

RasterBuffer box_blur(const RasterBuffer& src, int radius) {
    require_valid(src, "box_blur");
    if (radius <= 0) {
        return src.clone();
    }

    const int W = static_cast<int>(src.width());
    const int H = static_cast<int>(src.height());

    RasterBuffer tmp(src.width(), src.height());
    RasterBuffer dst(src.width(), src.height());

    // ---- 水平 pass: src → tmp ----
    blur_pass(src.data(), tmp.data(), W, H, radius, true);
    // ---- 垂直 pass: tmp → dst ----
    blur_pass(tmp.data(), dst.data(), W, H, radius, false);

    return dst;
}

RasterBuffer gaussian_blur(const RasterBuffer& src, int radius) {
    require_valid(src, "gaussian_blur");
    if (radius <= 0) {
        return src.clone();
    }

    // 三次 box blur 已經很接近 Gaussian 的形狀
    constexpr int kPasses = 3;

    RasterBuffer out = box_blur(src, radius);
    for (int pass = 1; pass < kPasses; ++pass) {
        out = box_blur(out, radius);
    }
    return out;
}

// ============================================================
// 分派表
// ============================================================

using TransformFn = RasterBuffer (*)(const RasterBuffer&, const FilterParameters&);

struct FilterEntry {
    FilterKind  kind;
    const char* name;
    TransformFn fn;
};

static RasterBuffer run_identity(const RasterBuffer& s, const FilterParameters&) {
    return s.clone();
}
static RasterBuffer run_grayscale(const RasterBuffer& s, const FilterParameters&) {
    return grayscale(s);
}
static RasterBuffer run_brightness(const RasterBuffer& s, const FilterParameters& p) {
    return adjust_brightness(s, p.brightness);
}
static RasterBuffer run_contrast(const RasterBuffer& s, const FilterParameters& p) {
    return adjust_contrast(s, p.contrast);
}
static RasterBuffer run_brightness_contrast(const RasterBuffer& s, const FilterParameters& p) {
    return adjust_brightness_contrast(s, p.brightness, p.contrast);
}
static RasterBuffer run_gaussian_blur(const RasterBuffer& s, const FilterParameters& p) {
    return gaussian_blur(s, p.blur_radius);
}
static RasterBuffer run_edge_detection(const RasterBuffer& s, const FilterParameters&) {
    return edge_detection(s);
}
static RasterBuffer run_sepia(const RasterBuffer& s, const FilterParameters&) {
    return sepia(s);
}

static const FilterEntry kFilterTable[] = {
    {FilterKind::None,               "none",                run_identity},
    {FilterKind::Grayscale,          "grayscale",           run_grayscale},
    {FilterKind::Brightness,         "brightness",          run_brightness},
    {FilterKind::Contrast,           "contrast",            run_contrast},
    {FilterKind::BrightnessContrast, "brightness_contrast", run_brightness_contrast},
    {FilterKind::GaussianBlur,       "gaussian_blur",       run_gaussian_blur},
    {FilterKind::EdgeDetection,      "edge_detection",      run_edge_detection},
    {FilterKind::Sepia,              "sepia",               run_sepia},
};

static const FilterEntry* find_entry(FilterKind kind) {
    for (const FilterEntry& e : kFilterTable) {
        if (e.kind == kind) return &e;
    }
    return nullptr;
}

RasterBuffer transform(const RasterBuffer& source,
                       FilterKind kind,
                       const FilterParameters& params) {
    require_valid(source, "transform");

    const FilterEntry* entry = find_entry(kind);
    if (!entry) {
        // 不認得的 kind 當成 None
        return source.clone();
    }
    return entry->fn(source, params);
}

const char* filter_name(FilterKind kind) {
    const FilterEntry* entry = find_entry(kind);
    return entry ? entry->name : "unknown";
}

FilterKind parse_filter_kind(const std::string& name) {
    for (const FilterEntry& e : kFilterTable) {
        if (name == e.name) return e.kind;
    }
    throw std::invalid_argument("unknown filter: " + name);
}

const std::vector<FilterKind>& available_filters() {
    static const std::vector<FilterKind> filters = {
        FilterKind::None,
        FilterKind::Grayscale,
        FilterKind::Sepia,
        FilterKind::BrightnessContrast,
        FilterKind::GaussianBlur,
        FilterKind::EdgeDetection,
    };
    return filters;
}

} // namespace pe
