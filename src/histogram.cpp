#include "pixedit/histogram.hpp"

#include <algorithm>
#include <numeric>

namespace pe {

std::uint64_t ImageHistogram::total(const Bins& bins) {
    return std::accumulate(bins.begin(), bins.end(), std::uint64_t{0});
}

ImageHistogram compute_histogram(const RasterBuffer& buffer) {
    require_valid(buffer, "compute_histogram");

    ImageHistogram hist;
    const uint8_t* px = buffer.data();
    const std::size_t total = buffer.size();

    for (std::size_t i = 0; i < total; i += RasterBuffer::kChannels) {
        ++hist.blue[px[i + RasterBuffer::Blue]];
        ++hist.green[px[i + RasterBuffer::Green]];
        ++hist.red[px[i + RasterBuffer::Red]];
    }

    hist.max_value = std::max({
        *std::max_element(hist.red.begin(), hist.red.end()),
        *std::max_element(hist.green.begin(), hist.green.end()),
        *std::max_element(hist.blue.begin(), hist.blue.end()),
    });

    return hist;
}

} // namespace pe
