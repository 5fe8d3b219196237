#pragma once

#include <optional>
#include <string>

#include "imgmgr/geometry.hpp"

namespace imgmgr {

// 一次 resolve 呼叫的參數，不會被保存
struct TransformRequest {
    std::string   source_path;
    int           width   = 0;
    int           height  = 0;
    TransformMode mode    = TransformMode::Crop;
    int           quality = 90;                   // 0..100
    std::optional<std::string> output_format;     // 例如 "webp"；空 → 沿用來源格式
};

// 在 resolve → 路徑計算 → fallback 之間傳遞的狀態
// fallback 時換掉 source_path、丟掉 output_format，其餘沿用
struct TransformContext {
    std::string   source_path;
    int           width   = 0;
    int           height  = 0;
    TransformMode mode    = TransformMode::Crop;
    int           quality = 90;
    std::optional<std::string> output_format;

    static TransformContext from_request(const TransformRequest& request) {
        TransformContext ctx;
        ctx.source_path   = request.source_path;
        ctx.width         = request.width;
        ctx.height        = request.height;
        ctx.mode          = request.mode;
        ctx.quality       = request.quality;
        ctx.output_format = request.output_format;
        return ctx;
    }

    TransformContext with_source(const std::string& path) const {
        TransformContext ctx = *this;
        ctx.source_path = path;
        ctx.output_format.reset();
        return ctx;
    }
};

} // namespace imgmgr
