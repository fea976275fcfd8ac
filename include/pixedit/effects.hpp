#pragma once

#include "raster.hpp"

namespace pe {

// Sobel 邊緣偵測：先轉灰階，只寫入內部像素 (1..W-2, 1..H-2)。
// 輸出從全 0 開始，所以最外圈一格會是透明黑 (0,0,0,0)。
RasterBuffer edge_detection(const RasterBuffer& src);

} // namespace pe
