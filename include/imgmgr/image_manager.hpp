#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "imgmgr/cache_path.hpp"
#include "imgmgr/cache_store.hpp"
#include "imgmgr/codec.hpp"
#include "imgmgr/config.hpp"
#include "imgmgr/transform_context.hpp"

namespace imgmgr {

// resolve 的狀態機：原圖 → 錯誤圖（只重試一次）→ 失敗
enum class Attempt {
    Original,
    Fallback,
    Failed,
};

const char* to_string(Attempt attempt);

/**
 * 產生並快取縮圖 / 裁切圖。
 *
 * 衍生圖存在 <來源目錄>/<w>-<h>/<mode>/<檔名>，檔案存在與否就是快取索引，
 * 第二次呼叫直接回傳路徑、不再解碼。
 *
 * 可恢復的錯誤（來源不存在、格式不支援、編解碼失敗）不會丟出，
 * 而是記到 errors() 並改用設定的錯誤圖重跑一次；
 * 目錄建不起來（DirectoryCreateFailure）則直接丟出 imgmgr::Error。
 *
 * 不是 thread-safe：同一個實例請勿同時呼叫。多個實例 / process 同時寫
 * 同一個衍生圖時，後寫的覆蓋先寫的，讀取端不會看到寫到一半的檔案。
 */
class ImageManager {
public:
    explicit ImageManager(Config config,
                          std::shared_ptr<Codec> codec = make_default_codec(),
                          std::shared_ptr<CacheStore> store = std::make_shared<FileSystemStore>());

    // 回傳公開路徑；std::nullopt 表示連錯誤圖也失敗（請看 errors()）
    // 寬高 <= 0、quality 不在 0..100 → std::invalid_argument
    std::optional<std::string> resolve(const TransformRequest& request);

    // 字串模式版本；quality 未指定時用 config 的 default_quality
    std::optional<std::string> resolve(const std::string& source,
                                       int width,
                                       int height,
                                       const std::string& mode,
                                       std::optional<int> quality = std::nullopt,
                                       std::optional<std::string> output_format = std::nullopt);

    // 只算路徑不轉檔（會建立目錄）；from_root = true → 檔案系統絕對路徑
    std::string get_path(const TransformRequest& request, bool from_root) const;

    // 刪除來源與其所有衍生圖，回傳刪除的檔案數
    std::size_t delete_image(const std::string& source);

    // 取出並清空上一次 resolve 累積的錯誤訊息
    std::vector<std::string> errors();

    // 上一次 resolve 停在哪個狀態（Original / Fallback = 成功，Failed = 沒有路徑）
    Attempt last_attempt() const { return last_attempt_; }

    const Config& config() const { return config_; }

private:
    void validate(const TransformRequest& request) const;

    // 單次嘗試；可恢復的錯誤以 imgmgr::Error 丟出
    std::string attempt(const TransformContext& ctx);

    ImageU8 apply_orientation(const TransformContext& ctx, const Bytes& bytes, ImageU8 image);

    Config                      config_;
    std::shared_ptr<Codec>      codec_;
    std::shared_ptr<CacheStore> store_;
    CachePathResolver           resolver_;

    std::vector<std::string> errors_;
    Attempt last_attempt_ = Attempt::Original;
};

} // namespace imgmgr
