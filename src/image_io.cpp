#include "pixedit/image_io.hpp"
#include "pixedit/errors.hpp"
#include "pixedit/log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// stb
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image.h>
#include <stb_image_write.h>

namespace pe {

static std::string lower_extension(const std::string& path) {
    const auto dot = path.find_last_of('.');
    if (dot == std::string::npos) return {};
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

// BGRA <-> RGBA：只是交換 0 和 2
static void swap_red_blue(uint8_t* px, std::size_t total) {
    for (std::size_t i = 0; i < total; i += 4) {
        std::swap(px[i + 0], px[i + 2]);
    }
}

RasterBuffer load_image(const std::string& path)
{
    int w = 0, h = 0, comp_in = 0;

    // 不管原圖幾個通道，都要求 stb 給 4 通道 RGBA
    stbi_uc* raw = stbi_load(path.c_str(), &w, &h, &comp_in, 4);
    if (!raw) {
        const char* reason = stbi_failure_reason();
        logger()->error("load_image {}: {}", path, reason ? reason : "unknown error");
        throw ImageIOError("stb_image: failed to load " + path +
                           (reason ? std::string(" (") + reason + ")" : std::string()));
    }

    std::unique_ptr<stbi_uc, void (*)(void*)> owner(raw, stbi_image_free);

    const std::size_t n = static_cast<std::size_t>(w) * h * 4;
    RasterBuffer buffer(static_cast<uint32_t>(w), static_cast<uint32_t>(h), raw, n);
    swap_red_blue(buffer.data(), buffer.size());

    logger()->info("loaded {} ({}x{}, {} channel(s) in file)", path, w, h, comp_in);
    return buffer;
}

void save_image(const std::string& path, const RasterBuffer& buffer, int quality)
{
    require_valid(buffer, "save_image");

    const int w = static_cast<int>(buffer.width());
    const int h = static_cast<int>(buffer.height());
    const std::string ext = lower_extension(path);

    int ok = 0;
    if (ext == ".jpg" || ext == ".jpeg") {
        // JPEG 沒有 alpha，轉成 RGB 3 通道
        std::vector<uint8_t> rgb(static_cast<std::size_t>(w) * h * 3);
        const uint8_t* in = buffer.data();
        for (std::size_t p = 0, n = buffer.pixel_count(); p < n; ++p) {
            rgb[p * 3 + 0] = in[p * 4 + RasterBuffer::Red];
            rgb[p * 3 + 1] = in[p * 4 + RasterBuffer::Green];
            rgb[p * 3 + 2] = in[p * 4 + RasterBuffer::Blue];
        }
        ok = stbi_write_jpg(path.c_str(), w, h, 3, rgb.data(), std::clamp(quality, 1, 100));
    } else {
        std::vector<uint8_t> rgba = buffer.bytes();
        swap_red_blue(rgba.data(), rgba.size());

        if (ext == ".bmp") {
            ok = stbi_write_bmp(path.c_str(), w, h, 4, rgba.data());
        } else {
            // 預設 PNG
            ok = stbi_write_png(path.c_str(), w, h, 4, rgba.data(), w * 4);
        }
    }

    if (!ok) {
        logger()->error("save_image {}: encoder failed", path);
        throw ImageIOError("stb_image_write: failed to write " + path);
    }
    logger()->info("saved {} ({}x{})", path, w, h);
}

} // namespace pe
