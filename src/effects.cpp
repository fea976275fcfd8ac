#include "pixedit/effects.hpp"
#include "pixedit/color.hpp"

#include <cmath>

namespace pe {

static constexpr int kSobelX[3][3] = {
    {-1, 0, 1},
    {-2, 0, 2},
    {-1, 0, 1},
};

static constexpr int kSobelY[3][3] = {
    {-1, -2, -1},
    { 0,  0,  0},
    { 1,  2,  1},
};

RasterBuffer edge_detection(const RasterBuffer& src) {
    // 灰階後三個色版一樣，下面只讀 blue
    RasterBuffer gray = grayscale(src);

    const uint32_t W = gray.width();
    const uint32_t H = gray.height();

    // 全 0 起跳；外圈不寫
    RasterBuffer dst(W, H);
    if (W < 3 || H < 3) {
        return dst;
    }

    const uint8_t* in = gray.data();
    uint8_t* out = dst.data();

    for (uint32_t y = 1; y + 1 < H; ++y) {
        for (uint32_t x = 1; x + 1 < W; ++x) {
            int gx = 0;
            int gy = 0;

            for (int ky = -1; ky <= 1; ++ky) {
                for (int kx = -1; kx <= 1; ++kx) {
                    const int v = in[gray.offset(x + kx, y + ky) + RasterBuffer::Blue];
                    gx += v * kSobelX[ky + 1][kx + 1];
                    gy += v * kSobelY[ky + 1][kx + 1];
                }
            }

            int mag = static_cast<int>(std::sqrt(static_cast<double>(gx * gx + gy * gy)));
            if (mag > 255) mag = 255;
            const uint8_t edge = static_cast<uint8_t>(mag);

            const std::size_t d = dst.offset(x, y);
            out[d + RasterBuffer::Blue]  = edge;
            out[d + RasterBuffer::Green] = edge;
            out[d + RasterBuffer::Red]   = edge;
            out[d + RasterBuffer::Alpha] = 255;
        }
    }

    return dst;
}

} // namespace pe
