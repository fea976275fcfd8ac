#pragma once
#include <string>
#include "pixedit/raster.hpp"

namespace pe {

// 讀入任何 stb_image 支援的格式，一律展開成 BGRA8。失敗丟 ImageIOError
RasterBuffer load_image(const std::string& path);

// 依副檔名選編碼器：.jpg/.jpeg → JPEG（alpha 捨棄），.bmp → BMP，其他 → PNG。
// quality 只對 JPEG 有意義（1-100）。失敗丟 ImageIOError
void save_image(const std::string& path, const RasterBuffer& buffer, int quality = 95);

} // namespace pe
