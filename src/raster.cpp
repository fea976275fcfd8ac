#include "pixedit/raster.hpp"
#include "pixedit/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>

namespace pe {

static std::shared_ptr<uint8_t[]> allocate_bytes(std::size_t n) {
    return std::shared_ptr<uint8_t[]>(new uint8_t[n](), std::default_delete<uint8_t[]>());
}

// 單邊不超過 int（濾鏡內部用 int 索引），總 byte 數不超過 ptrdiff_t
static std::size_t checked_length(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        throw InvalidDimensions("RasterBuffer: width and height must be > 0");
    }
    constexpr uint32_t kMaxSide =
        static_cast<uint32_t>(std::numeric_limits<int>::max());
    constexpr std::size_t kMaxPixels =
        static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max()) /
        RasterBuffer::kChannels;

    if (width > kMaxSide || height > kMaxSide ||
        static_cast<std::size_t>(width) > kMaxPixels / height) {
        throw InvalidDimensions("RasterBuffer: " + std::to_string(width) + "x" +
                                std::to_string(height) + " is too large");
    }
    return static_cast<std::size_t>(width) * height * RasterBuffer::kChannels;
}

RasterBuffer::RasterBuffer(uint32_t width, uint32_t height)
    : width_(width), height_(height)
{
    data_ = allocate_bytes(checked_length(width, height));
}

RasterBuffer::RasterBuffer(uint32_t width, uint32_t height,
                           const std::vector<uint8_t>& bytes)
    : RasterBuffer(width, height, bytes.data(), bytes.size())
{
}

RasterBuffer::RasterBuffer(uint32_t width, uint32_t height,
                           const uint8_t* bytes, std::size_t length)
{
    const std::size_t n = checked_length(width, height);
    if (length != n || bytes == nullptr) {
        throw InvalidDimensions("RasterBuffer: expected " + std::to_string(n) +
                                " bytes for " + std::to_string(width) + "x" +
                                std::to_string(height) + " BGRA, got " +
                                std::to_string(length));
    }
    width_  = width;
    height_ = height;
    data_   = allocate_bytes(n);
    std::copy(bytes, bytes + n, data_.get());
}

RasterBuffer::RasterBuffer(RasterBuffer&& other) noexcept
    : width_(std::exchange(other.width_, 0u)),
      height_(std::exchange(other.height_, 0u)),
      data_(std::move(other.data_))
{
}

RasterBuffer& RasterBuffer::operator=(RasterBuffer&& other) noexcept {
    if (this != &other) {
        width_  = std::exchange(other.width_, 0u);
        height_ = std::exchange(other.height_, 0u);
        data_   = std::move(other.data_);
    }
    return *this;
}

RasterBuffer RasterBuffer::clone() const {
    if (empty()) {
        return RasterBuffer();
    }
    RasterBuffer dst(width_, height_);
    std::copy(data(), data() + size(), dst.data());
    return dst;
}

std::vector<uint8_t> RasterBuffer::bytes() const {
    if (empty()) return {};
    return std::vector<uint8_t>(data(), data() + size());
}

bool RasterBuffer::operator==(const RasterBuffer& other) const {
    if (width_ != other.width_ || height_ != other.height_) return false;
    if (empty() || other.empty()) return empty() == other.empty();
    return std::equal(data(), data() + size(), other.data());
}

void require_valid(const RasterBuffer& buffer, const char* op) {
    if (buffer.empty() || buffer.width() == 0 || buffer.height() == 0) {
        throw InvalidDimensions(std::string(op) + ": empty raster");
    }
}

} // namespace pe
