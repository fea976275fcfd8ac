#pragma once

#include "raster.hpp"

namespace pe {

// 灰階：gray = trunc(0.299 R + 0.587 G + 0.114 B)，alpha 不動
RasterBuffer grayscale(const RasterBuffer& src);

// 亮度：每個 RGB 加上 trunc(brightness * 2.55)
RasterBuffer adjust_brightness(const RasterBuffer& src, double brightness);

// 對比：以 128 為支點，factor = max(0, (100 + contrast) / 100)
RasterBuffer adjust_contrast(const RasterBuffer& src, double contrast);

// 亮度 + 對比一次算完（先對比再加亮度，同一個算式裡）
RasterBuffer adjust_brightness_contrast(const RasterBuffer& src,
                                        double brightness,
                                        double contrast);

// 懷舊色調
RasterBuffer sepia(const RasterBuffer& src);

} // namespace pe
