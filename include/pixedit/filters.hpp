#pragma once

#include <string>
#include <vector>
#include "pixedit/raster.hpp"

namespace pe {

// ------------------------------------------------------------
// 濾鏡種類（封閉集合）
// ------------------------------------------------------------
enum class FilterKind {
    None = 0,
    Grayscale,
    Brightness,
    Contrast,
    BrightnessContrast,
    GaussianBlur,
    EdgeDetection,
    Sepia,
};

// ------------------------------------------------------------
// 濾鏡參數：超出範圍不算錯誤，由各公式自行夾住
// ------------------------------------------------------------
struct FilterParameters {
    double brightness = 0.0;   // [-100, 100]
    double contrast   = 0.0;   // [-100, 100]
    int    blur_radius = 3;    // [1, 10]
};

// 依 kind 分派到對應的轉換；永遠回傳新的緩衝區，不修改 source
RasterBuffer transform(const RasterBuffer& source,
                       FilterKind kind,
                       const FilterParameters& params);

// ------------------------------------------------------------
// 模糊
// ------------------------------------------------------------

// 一次 box blur：水平 pass 後接垂直 pass，窗口 2*radius+1，
// 只計入界內樣本，alpha 直接沿用
RasterBuffer box_blur(const RasterBuffer& src, int radius);

// 以三次 box blur 近似 Gaussian；radius <= 0 時回傳 clone
RasterBuffer gaussian_blur(const RasterBuffer& src, int radius);

// ------------------------------------------------------------
// 名稱 <-> enum
// ------------------------------------------------------------
const char* filter_name(FilterKind kind);

// 不認得的名稱丟 std::invalid_argument
FilterKind parse_filter_kind(const std::string& name);

// 介面上可選的濾鏡清單
const std::vector<FilterKind>& available_filters();

} // namespace pe
