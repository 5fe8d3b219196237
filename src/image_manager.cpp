#include "imgmgr/image_manager.hpp"
#include "imgmgr/cascade_delete.hpp"
#include "imgmgr/errors.hpp"
#include "imgmgr/format.hpp"
#include "imgmgr/geometry.hpp"
#include "imgmgr/logging.hpp"
#include "imgmgr/orientation.hpp"
#include "imgmgr/pixel_ops.hpp"

#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace imgmgr {

const char* to_string(Attempt attempt)
{
    switch (attempt) {
    case Attempt::Original: return "original";
    case Attempt::Fallback: return "fallback";
    case Attempt::Failed:   return "failed";
    }
    return "unknown";
}

ImageManager::ImageManager(Config config,
                           std::shared_ptr<Codec> codec,
                           std::shared_ptr<CacheStore> store)
    : config_(std::move(config)),
      codec_(std::move(codec)),
      store_(std::move(store)),
      resolver_(store_, config_.public_root, config_.directory_permissions)
{
    if (!codec_) throw std::invalid_argument("ImageManager: codec is null");
    if (!store_) throw std::invalid_argument("ImageManager: store is null");
}

void ImageManager::validate(const TransformRequest& request) const
{
    if (request.width <= 0 || request.height <= 0) {
        throw std::invalid_argument("ImageManager: width and height must be > 0");
    }
    if (request.quality < 0 || request.quality > 100) {
        throw std::invalid_argument("ImageManager: quality must be within 0..100");
    }
}

std::optional<std::string> ImageManager::resolve(const TransformRequest& request)
{
    errors_.clear();
    validate(request);

    TransformContext ctx = TransformContext::from_request(request);
    Attempt state = Attempt::Original;

    while (state != Attempt::Failed) {
        try {
            std::string path = attempt(ctx);
            last_attempt_ = state;
            return path;
        } catch (const Error& e) {
            if (!e.recoverable()) {
                last_attempt_ = Attempt::Failed;
                IMGMGR_LOG_ERROR("{}: {}", ctx.source_path, e.what());
                throw;
            }
            errors_.emplace_back(e.what());

            if (state == Attempt::Fallback) {
                IMGMGR_LOG_ERROR("error image {} failed: {}", ctx.source_path, e.what());
                state = Attempt::Failed;
                break;
            }

            const fs::path fallback = config_.error_image_path();
            if (!store_->is_file(fallback)) {
                errors_.emplace_back("Error image not found.");
                IMGMGR_LOG_ERROR("{}: {}; error image {} not found",
                                 ctx.source_path, e.what(), fallback.string());
                state = Attempt::Failed;
                break;
            }

            IMGMGR_LOG_WARN("{}: {}; using {}", ctx.source_path, e.what(), fallback.string());
            ctx   = ctx.with_source(fallback.string());
            state = Attempt::Fallback;
        }
    }

    last_attempt_ = Attempt::Failed;
    return std::nullopt;
}

std::optional<std::string> ImageManager::resolve(const std::string& source,
                                                 int width,
                                                 int height,
                                                 const std::string& mode,
                                                 std::optional<int> quality,
                                                 std::optional<std::string> output_format)
{
    TransformRequest request;
    request.source_path   = source;
    request.width         = width;
    request.height        = height;
    request.mode          = parse_mode(mode);
    request.quality       = quality.value_or(config_.default_quality);
    request.output_format = std::move(output_format);
    return resolve(request);
}

std::string ImageManager::attempt(const TransformContext& ctx)
{
    if (ctx.source_path.empty() || !store_->is_file(ctx.source_path)) {
        throw Error(ErrorKind::InvalidInput, "Image file not found: " + ctx.source_path);
    }

    const CachePath cache = resolver_.resolve(ctx);
    if (store_->exists(cache.absolute)) {
        IMGMGR_LOG_DEBUG("cache hit {}", cache.absolute.string());
        return cache.public_path;
    }

    // 向量圖不轉換
    const SourceParts src = parse_source(ctx.source_path, resolver_.public_root());
    if (src.extension == "svg") {
        return resolver_.public_source_path(ctx.source_path);
    }

    const Bytes bytes = store_->read(ctx.source_path);

    const std::optional<ImageInfo> info = codec_->probe(bytes);
    if (!info) {
        throw Error(ErrorKind::UnsupportedFormat, "Invalid file type");
    }
    const std::optional<ImageFormat> in_format = format_from_mime(info->mime);
    if (!in_format) {
        throw Error(ErrorKind::UnsupportedFormat, info->mime + " images are not supported");
    }

    ImageFormat out_format = *in_format;
    if (ctx.output_format) {
        const std::optional<ImageFormat> f = format_from_extension(*ctx.output_format);
        if (!f) {
            throw Error(ErrorKind::UnsupportedFormat, *ctx.output_format + " images are not supported");
        }
        out_format = *f;
    }

    ImageU8 image = codec_->decode(bytes, *in_format);
    if (*in_format == ImageFormat::Jpeg) {
        image = apply_orientation(ctx, bytes, std::move(image));
    }

    const TransformSpec spec = compute_transform_spec(
        image.w(), image.h(), ctx.width, ctx.height, ctx.mode);

    // 輸出格式不支援透明 → 疊黑底
    const bool preserve_alpha = supports_alpha(out_format);
    ImageU8 out = resize(image, spec.render_width, spec.render_height, preserve_alpha);
    if (spec.crop) {
        out = crop(out, *spec.crop);
    }

    const Bytes encoded = codec_->encode(out, out_format, ctx.quality);
    store_->write(cache.absolute, encoded, config_.file_permissions);

    IMGMGR_LOG_INFO("wrote {} ({}x{} {}, {} bytes)",
                    cache.absolute.string(), out.w(), out.h(), extension(out_format), encoded.size());
    return cache.public_path;
}

ImageU8 ImageManager::apply_orientation(const TransformContext& ctx, const Bytes& bytes, ImageU8 image)
{
    const int tag = read_jpeg_orientation(bytes);
    if (tag == 1) return image;

    ImageU8 fixed = correct_orientation(image, tag);
    IMGMGR_LOG_INFO("{}: EXIF orientation {} corrected ({}x{} -> {}x{})",
                    ctx.source_path, tag, image.w(), image.h(), fixed.w(), fixed.h());

    // 寫回的檔案不帶 EXIF，之後讀到的 orientation 都是 1
    if (config_.persist_orientation) {
        const Bytes jpeg = codec_->encode(fixed, ImageFormat::Jpeg, ctx.quality);
        store_->write(ctx.source_path, jpeg, config_.file_permissions);
    }
    return fixed;
}

std::string ImageManager::get_path(const TransformRequest& request, bool from_root) const
{
    validate(request);
    const CachePath cache = resolver_.resolve(TransformContext::from_request(request));
    return from_root ? cache.absolute.string() : cache.public_path;
}

std::size_t ImageManager::delete_image(const std::string& source)
{
    return delete_derivatives(*store_, source);
}

std::vector<std::string> ImageManager::errors()
{
    std::vector<std::string> out;
    out.swap(errors_);
    return out;
}

} // namespace imgmgr
