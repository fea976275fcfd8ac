#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "pixedit/raster.hpp"

namespace pe_test {

using Pixel = std::array<std::uint8_t, 4>;  // B, G, R, A

inline pe::RasterBuffer make_solid(std::uint32_t w, std::uint32_t h, Pixel px) {
    pe::RasterBuffer buf(w, h);
    std::uint8_t* d = buf.data();
    for (std::size_t i = 0; i < buf.size(); i += 4) {
        d[i + 0] = px[0];
        d[i + 1] = px[1];
        d[i + 2] = px[2];
        d[i + 3] = px[3];
    }
    return buf;
}

// 固定種子的 LCG，每次產生一樣的「雜訊」影像
inline pe::RasterBuffer make_noise(std::uint32_t w, std::uint32_t h, std::uint32_t seed = 12345u) {
    pe::RasterBuffer buf(w, h);
    std::uint32_t state = seed;
    std::uint8_t* d = buf.data();
    for (std::size_t i = 0; i < buf.size(); ++i) {
        state = state * 1664525u + 1013904223u;
        d[i] = static_cast<std::uint8_t>(state >> 24);
    }
    return buf;
}

inline Pixel pixel_at(const pe::RasterBuffer& buf, std::uint32_t x, std::uint32_t y) {
    const std::size_t o = buf.offset(x, y);
    const std::uint8_t* d = buf.data();
    return {d[o + 0], d[o + 1], d[o + 2], d[o + 3]};
}

inline void set_pixel(pe::RasterBuffer& buf, std::uint32_t x, std::uint32_t y, Pixel px) {
    const std::size_t o = buf.offset(x, y);
    std::uint8_t* d = buf.data();
    d[o + 0] = px[0];
    d[o + 1] = px[1];
    d[o + 2] = px[2];
    d[o + 3] = px[3];
}

} // namespace pe_test
