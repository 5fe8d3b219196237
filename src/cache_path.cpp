#include "imgmgr/cache_path.hpp"
#include "imgmgr/cache_store.hpp"
#include "imgmgr/filename.hpp"
#include "imgmgr/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace imgmgr {

static std::string normalize_slashes(std::string s)
{
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

static std::string strip_trailing_slashes(std::string s)
{
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

// a + "/" + b，避免出現 "//"
static std::string url_join(const std::string& a, const std::string& b)
{
    if (!a.empty() && a.back() == '/') return a + b;
    return a + "/" + b;
}

SourceParts parse_source(const std::string& source, const std::string& public_root)
{
    const std::string file = normalize_slashes(source);
    const std::string root = strip_trailing_slashes(normalize_slashes(public_root));

    SourceParts parts;

    std::string dir;
    const std::size_t slash = file.find_last_of('/');
    if (slash == std::string::npos) {
        dir = ".";
        parts.filename = file;
    } else {
        dir = (slash == 0) ? "/" : file.substr(0, slash);
        parts.filename = file.substr(slash + 1);
    }

    parts.dir = fs::path(dir);
    parts.extension = file_extension(parts.filename);

    if (!root.empty() && root != "/" && dir.compare(0, root.size(), root) == 0
        && (dir.size() == root.size() || dir[root.size()] == '/')) {
        parts.url_base = dir.substr(root.size());
    } else {
        parts.url_base = dir;
    }
    return parts;
}

CachePathResolver::CachePathResolver(std::shared_ptr<CacheStore> store,
                                     std::string public_root,
                                     fs::perms directory_perms)
    : store_(std::move(store)),
      public_root_(strip_trailing_slashes(normalize_slashes(std::move(public_root)))),
      directory_perms_(directory_perms)
{
    if (!store_) throw std::invalid_argument("CachePathResolver: null store");
}

CachePath CachePathResolver::resolve(const TransformContext& ctx) const
{
    const SourceParts parts = parse_source(ctx.source_path, public_root_);

    const std::string size_dir = std::to_string(ctx.width) + "-" + std::to_string(ctx.height);
    const std::string mode_dir = mode_name(ctx.mode);

    // 先建尺寸目錄，再建模式目錄
    const fs::path size_path = parts.dir / size_dir;
    store_->ensure_directory(size_path, directory_perms_);
    const fs::path mode_path = size_path / mode_dir;
    store_->ensure_directory(mode_path, directory_perms_);

    const std::string filename = ctx.output_format
        ? substitute_extension(parts.filename, *ctx.output_format)
        : parts.filename;

    CachePath path;
    path.absolute    = mode_path / filename;
    path.public_path = url_join(url_join(url_join(parts.url_base, size_dir), mode_dir), filename);

    IMGMGR_LOG_TRACE("cache path for {}: {}", ctx.source_path, path.absolute.string());
    return path;
}

std::string CachePathResolver::public_source_path(const std::string& source) const
{
    const SourceParts parts = parse_source(source, public_root_);
    return url_join(parts.url_base, parts.filename);
}

} // namespace imgmgr
