#include "pixedit/color.hpp"
#include "pixedit/errors.hpp"

#include <algorithm>
#include <cmath>

namespace pe {

static constexpr int B = RasterBuffer::Blue;
static constexpr int G = RasterBuffer::Green;
static constexpr int R = RasterBuffer::Red;

static inline uint8_t clamp_byte(int v) {
    if (v < 0)   return 0;
    if (v > 255) return 255;
    return static_cast<uint8_t>(v);
}

// 截斷（往 0）再夾到 [0, 255]；NaN 當 0
static inline uint8_t trunc_clamp(double v) {
    if (!(v >= 0.0)) return 0;
    if (v >= 255.0)  return 255;
    return static_cast<uint8_t>(v);
}

// [-100, 100] -> 約 [-255, 255]。超過 ±512 的結果都一樣會被夾住，
// 先限制住避免轉 int 溢位
static inline int brightness_adjustment(double brightness) {
    double v = brightness * 2.55;
    if (std::isnan(v)) return 0;
    v = std::clamp(v, -512.0, 512.0);
    return static_cast<int>(v);
}

static inline double contrast_factor(double contrast) {
    double f = (100.0 + contrast) / 100.0;
    if (std::isnan(f)) return 1.0;
    return std::max(0.0, f);
}

// 權重 0.299 / 0.587 / 0.114 用千分位整數算，結果就是實數值的精確截斷，
// 灰階再轉一次也不會因浮點誤差掉 1
static inline uint8_t luminance(uint8_t r, uint8_t g, uint8_t b) {
    const int sum = 299 * r + 587 * g + 114 * b;
    return static_cast<uint8_t>(sum / 1000);
}

RasterBuffer grayscale(const RasterBuffer& src) {
    require_valid(src, "grayscale");

    RasterBuffer dst = src.clone();
    uint8_t* px = dst.data();
    const std::size_t total = dst.size();

    for (std::size_t i = 0; i < total; i += RasterBuffer::kChannels) {
        const uint8_t gray = luminance(px[i + R], px[i + G], px[i + B]);
        px[i + B] = gray;
        px[i + G] = gray;
        px[i + R] = gray;
    }

    return dst;
}

RasterBuffer adjust_brightness(const RasterBuffer& src, double brightness) {
    require_valid(src, "adjust_brightness");

    const int adj = brightness_adjustment(brightness);

    RasterBuffer dst = src.clone();
    uint8_t* px = dst.data();
    const std::size_t total = dst.size();

    for (std::size_t i = 0; i < total; i += RasterBuffer::kChannels) {
        px[i + B] = clamp_byte(px[i + B] + adj);
        px[i + G] = clamp_byte(px[i + G] + adj);
        px[i + R] = clamp_byte(px[i + R] + adj);
    }

    return dst;
}

RasterBuffer adjust_contrast(const RasterBuffer& src, double contrast) {
    require_valid(src, "adjust_contrast");

    const double factor = contrast_factor(contrast);

    // 每個值的結果只跟輸入 byte 有關，先建表
    uint8_t lut[256];
    for (int v = 0; v < 256; ++v) {
        lut[v] = trunc_clamp(factor * (v - 128) + 128.0);
    }

    RasterBuffer dst = src.clone();
    uint8_t* px = dst.data();
    const std::size_t total = dst.size();

    for (std::size_t i = 0; i < total; i += RasterBuffer::kChannels) {
        px[i + B] = lut[px[i + B]];
        px[i + G] = lut[px[i + G]];
        px[i + R] = lut[px[i + R]];
    }

    return dst;
}

RasterBuffer adjust_brightness_contrast(const RasterBuffer& src,
                                        double brightness,
                                        double contrast) {
    require_valid(src, "adjust_brightness_contrast");

    const int    adj    = brightness_adjustment(brightness);
    const double factor = contrast_factor(contrast);

    // 亮度在截斷之前就加進去，和「先 contrast 再 brightness」兩次 pass 的結果不同
    uint8_t lut[256];
    for (int v = 0; v < 256; ++v) {
        lut[v] = trunc_clamp(factor * (v - 128) + 128.0 + adj);
    }

    RasterBuffer dst = src.clone();
    uint8_t* px = dst.data();
    const std::size_t total = dst.size();

    for (std::size_t i = 0; i < total; i += RasterBuffer::kChannels) {
        px[i + B] = lut[px[i + B]];
        px[i + G] = lut[px[i + G]];
        px[i + R] = lut[px[i + R]];
    }

    return dst;
}

RasterBuffer sepia(const RasterBuffer& src) {
    require_valid(src, "sepia");

    RasterBuffer dst = src.clone();
    uint8_t* px = dst.data();
    const std::size_t total = dst.size();

    for (std::size_t i = 0; i < total; i += RasterBuffer::kChannels) {
        const int r = px[i + R];
        const int g = px[i + G];
        const int b = px[i + B];

        // 0.393 0.769 0.189
        // 0.349 0.686 0.168
        // 0.272 0.534 0.131
        const int tr = (393 * r + 769 * g + 189 * b) / 1000;
        const int tg = (349 * r + 686 * g + 168 * b) / 1000;
        const int tb = (272 * r + 534 * g + 131 * b) / 1000;

        px[i + R] = clamp_byte(tr);
        px[i + G] = clamp_byte(tg);
        px[i + B] = clamp_byte(tb);
    }

    return dst;
}

} // namespace pe
