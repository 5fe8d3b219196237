#pragma once

#include <stdexcept>
#include <string>

namespace imgmgr {

enum class ErrorKind {
    InvalidInput,            // 來源不存在、不是檔案
    UnsupportedFormat,       // MIME 或要求的輸出格式不支援
    DecodeFailure,
    DirectoryCreateFailure,  // 致命：直接往外丟，不走 fallback
    EncodeFailure,
};

const char* to_string(ErrorKind kind);

// 轉換流程中的錯誤；除了 DirectoryCreateFailure 以外都可以由 fallback 圖片接手
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    bool recoverable() const { return kind_ != ErrorKind::DirectoryCreateFailure; }

private:
    ErrorKind kind_;
};

} // namespace imgmgr
