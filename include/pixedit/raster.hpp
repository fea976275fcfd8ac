#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace pe {

using std::uint8_t;
using std::uint32_t;

// BGRA8 影像：每個像素 4 bytes，順序固定為 (B, G, R, A)
class RasterBuffer {
public:
    static constexpr int kChannels = 4;

    enum Channel : int {
        Blue  = 0,
        Green = 1,
        Red   = 2,
        Alpha = 3,
    };

    RasterBuffer() = default;

    // 配置新的緩衝區，內容全為 0
    RasterBuffer(uint32_t width, uint32_t height);

    // 從位元組序列建立（深拷貝），長度必須是 width * height * 4
    RasterBuffer(uint32_t width, uint32_t height,
                 const std::vector<uint8_t>& bytes);
    RasterBuffer(uint32_t width, uint32_t height,
                 const uint8_t* bytes, std::size_t length);

    // 不允許隱式複製，要複製請用 clone()
    RasterBuffer(const RasterBuffer&)            = delete;
    RasterBuffer& operator=(const RasterBuffer&) = delete;

    RasterBuffer(RasterBuffer&& other) noexcept;
    RasterBuffer& operator=(RasterBuffer&& other) noexcept;

    // 完整複製一份新的記憶體，絕不共用
    RasterBuffer clone() const;

    uint32_t    width()  const { return width_; }
    uint32_t    height() const { return height_; }
    std::size_t stride() const { return static_cast<std::size_t>(width_) * kChannels; }
    std::size_t size()   const { return stride() * height_; }
    std::size_t pixel_count() const { return static_cast<std::size_t>(width_) * height_; }
    bool        empty()  const { return !data_; }

    uint8_t*       data()       { return data_.get(); }
    const uint8_t* data() const { return data_.get(); }

    // (x, y) 像素第一個 byte (blue) 的位置
    std::size_t offset(uint32_t x, uint32_t y) const {
        return static_cast<std::size_t>(y) * stride() + static_cast<std::size_t>(x) * kChannels;
    }

    std::vector<uint8_t> bytes() const;

    // 給 bindings 延長生命週期用
    const std::shared_ptr<uint8_t[]>& shared() const { return data_; }

    bool operator==(const RasterBuffer& other) const;
    bool operator!=(const RasterBuffer& other) const { return !(*this == other); }

private:
    uint32_t width_  = 0;
    uint32_t height_ = 0;
    std::shared_ptr<uint8_t[]> data_;
};

// empty / 尺寸為 0 時丟出 InvalidDimensions，what 前綴為 op
void require_valid(const RasterBuffer& buffer, const char* op);

} // namespace pe
