#pragma once

#include <filesystem>
#include <system_error>
#include <vector>

#include "imgmgr/image.hpp"

namespace imgmgr {

// 衍生圖的儲存後端；檔案是否存在本身就是快取索引
// 換成物件儲存時只需實作這個介面
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual bool is_file(const std::filesystem::path& path) const = 0;

    // 讀不到 → Error(InvalidInput)
    virtual Bytes read(const std::filesystem::path& path) const = 0;

    // 原子寫入（暫存檔 + rename），寫完套用 perms
    // 失敗 → Error(EncodeFailure)
    virtual void write(const std::filesystem::path& path,
                       const Bytes& bytes,
                       std::filesystem::perms perms) = 0;

    // 已存在（包含別人剛好同時建立）不算錯；建不起來 → Error(DirectoryCreateFailure)
    virtual void ensure_directory(const std::filesystem::path& dir,
                                  std::filesystem::perms perms) = 0;

    // dir 底下所有一般檔案（遞迴）
    virtual std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir) const = 0;

    virtual bool remove(const std::filesystem::path& path) = 0;
};

class FileSystemStore : public CacheStore {
public:
    bool exists(const std::filesystem::path& path) const override;
    bool is_file(const std::filesystem::path& path) const override;
    Bytes read(const std::filesystem::path& path) const override;
    void write(const std::filesystem::path& path,
               const Bytes& bytes,
               std::filesystem::perms perms) override;
    void ensure_directory(const std::filesystem::path& dir,
                          std::filesystem::perms perms) override;
    std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir) const override;
    bool remove(const std::filesystem::path& path) override;

protected:
    // 只建一層；回傳 false 並設定 ec 表示沒建成（可能別人先建好了）
    virtual bool make_directory(const std::filesystem::path& dir, std::error_code& ec);
};

} // namespace imgmgr
