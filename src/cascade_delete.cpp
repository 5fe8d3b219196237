#include "imgmgr/cascade_delete.hpp"
#include "imgmgr/cache_path.hpp"
#include "imgmgr/cache_store.hpp"
#include "imgmgr/filename.hpp"
#include "imgmgr/format.hpp"
#include "imgmgr/geometry.hpp"
#include "imgmgr/logging.hpp"

#include <cctype>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace imgmgr {

// "<digits>-<digits>"
static bool is_size_dir(const std::string& name)
{
    const std::size_t dash = name.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 >= name.size()) return false;
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (i == dash) continue;
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
    }
    return true;
}

static bool is_mode_dir(const std::string& name)
{
    try {
        parse_mode(name);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

// file 是不是直接放在 <root>/<w>-<h>/<mode>/ 底下
static bool in_derivative_dir(const fs::path& root, const fs::path& file)
{
    const fs::path rel = file.parent_path().lexically_relative(root);

    std::vector<std::string> parts;
    for (const auto& p : rel) parts.push_back(p.string());

    return parts.size() == 2 && is_size_dir(parts[0]) && is_mode_dir(parts[1]);
}

std::size_t delete_derivatives(CacheStore& store, const std::string& source)
{
    const SourceParts src = parse_source(source, std::string());
    const std::string stem = file_stem(src.filename);

    std::size_t removed = 0;
    for (const fs::path& file : store.list_files(src.dir)) {
        const std::string name = file.filename().string();

        bool match = (name == src.filename);
        // 同主檔名的另一張來源還在 → 這個快取檔也是它的，留著
        if (!match && file_stem(name) == stem
            && format_from_extension(file_extension(name))
            && in_derivative_dir(src.dir, file)
            && !store.is_file(src.dir / name)) {
            match = true;
        }

        if (match && store.remove(file)) {
            ++removed;
            IMGMGR_LOG_DEBUG("removed {}", file.string());
        }
    }

    IMGMGR_LOG_INFO("deleted {} ({} file(s))", source, removed);
    return removed;
}

} // namespace imgmgr
