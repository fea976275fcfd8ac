#pragma once

#include <stdexcept>
#include <string>

namespace pe {

// ------------------------------------------------------------
// 錯誤分類
// ------------------------------------------------------------
enum class ErrorCode {
    InvalidDimensions,   // 位元組長度 != width * height * 4
    HistoryEmpty,        // undo / redo 堆疊是空的
    NoCurrentImage,      // 尚未 load 就 apply
    NoOriginalImage,     // 尚未 load 就 reset
    SessionBusy,         // 已有一個變更操作在執行中
    ImageIO,             // 檔案解碼 / 編碼失敗
};

const char* to_string(ErrorCode code) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InvalidDimensions : public Error {
public:
    explicit InvalidDimensions(const std::string& what)
        : Error(ErrorCode::InvalidDimensions, what) {}
};

class HistoryEmpty : public Error {
public:
    explicit HistoryEmpty(const std::string& what)
        : Error(ErrorCode::HistoryEmpty, what) {}
};

class NoCurrentImage : public Error {
public:
    explicit NoCurrentImage(const std::string& what)
        : Error(ErrorCode::NoCurrentImage, what) {}
};

class NoOriginalImage : public Error {
public:
    explicit NoOriginalImage(const std::string& what)
        : Error(ErrorCode::NoOriginalImage, what) {}
};

class SessionBusy : public Error {
public:
    explicit SessionBusy(const std::string& what)
        : Error(ErrorCode::SessionBusy, what) {}
};

class ImageIOError : public Error {
public:
    explicit ImageIOError(const std::string& what)
        : Error(ErrorCode::ImageIO, what) {}
};

} // namespace pe
