#pragma once

#include <array>
#include <cstdint>
#include "pixedit/raster.hpp"

namespace pe {

// RGB 三個色版的強度分佈（alpha 不算）
struct ImageHistogram {
    using Bins = std::array<std::uint64_t, 256>;

    Bins red{};
    Bins green{};
    Bins blue{};

    // 768 個 bin 的最大值，給 UI 正規化用
    std::uint64_t max_value = 0;

    static std::uint64_t total(const Bins& bins);
};

// 空的緩衝區丟 InvalidDimensions
ImageHistogram compute_histogram(const RasterBuffer& buffer);

} // namespace pe
