#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "imgmgr/transform_context.hpp"

namespace imgmgr {

class CacheStore;

// 來源路徑拆解結果
struct SourceParts {
    std::filesystem::path dir;   // 來源所在目錄
    std::string url_base;        // dir 去掉 public_root 前綴（不在 root 底下就是 dir 本身）
    std::string filename;        // "photo.jpg"
    std::string extension;       // "jpg"（小寫）
};

// '\' 一律當成 '/'
SourceParts parse_source(const std::string& source, const std::string& public_root);

// 衍生圖位置：<dir>/<w>-<h>/<mode>/<filename>[換副檔名]
struct CachePath {
    std::filesystem::path absolute;
    std::string public_path;

    bool operator==(const CachePath& other) const {
        return absolute == other.absolute && public_path == other.public_path;
    }
    bool operator!=(const CachePath& other) const { return !(*this == other); }
};

class CachePathResolver {
public:
    CachePathResolver(std::shared_ptr<CacheStore> store,
                      std::string public_root,
                      std::filesystem::perms directory_perms);

    // 建好 <w>-<h> 與 <mode> 兩層目錄後回傳路徑；已存在的目錄不會重建
    // 目錄建不起來 → Error(DirectoryCreateFailure)
    CachePath resolve(const TransformContext& ctx) const;

    // 來源本身的公開路徑（SVG 直接回傳這個）
    std::string public_source_path(const std::string& source) const;

    const std::string& public_root() const { return public_root_; }

private:
    std::shared_ptr<CacheStore> store_;
    std::string public_root_;
    std::filesystem::perms directory_perms_;
};

} // namespace imgmgr
