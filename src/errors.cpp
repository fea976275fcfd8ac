#include "pixedit/errors.hpp"

namespace pe {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidDimensions: return "InvalidDimensions";
        case ErrorCode::HistoryEmpty:      return "HistoryEmpty";
        case ErrorCode::NoCurrentImage:    return "NoCurrentImage";
        case ErrorCode::NoOriginalImage:   return "NoOriginalImage";
        case ErrorCode::SessionBusy:       return "SessionBusy";
        case ErrorCode::ImageIO:           return "ImageIO";
    }
    return "Unknown";
}

} // namespace pe
