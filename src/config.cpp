#include "imgmgr/config.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace imgmgr {

namespace {

template <typename T>
T get_or(const toml::table& tbl, std::string_view section, std::string_view key, T fallback)
{
    if (auto v = tbl[section][key].value<T>()) {
        return *v;
    }
    return fallback;
}

fs::perms get_perms(const toml::table& tbl, std::string_view key, fs::perms fallback)
{
    const int64_t v = get_or<int64_t>(tbl, "output", key, static_cast<int64_t>(fallback));
    if (v < 0 || v > 07777) {
        throw std::runtime_error("config: output." + std::string(key) + " must be within 0o0..0o7777");
    }
    return static_cast<fs::perms>(v);
}

bool valid_level(const std::string& level)
{
    return level == "trace" || level == "debug" || level == "info" || level == "warn"
        || level == "warning" || level == "error" || level == "critical" || level == "off";
}

} // namespace

fs::path Config::error_image_path() const
{
    if (error_image.is_absolute() || public_root.empty()) return error_image;
    return fs::path(public_root) / error_image;
}

Config config_from_toml(const toml::table& tbl)
{
    Config cfg;

    cfg.public_root = get_or<std::string>(tbl, "paths", "public_root", cfg.public_root);
    cfg.error_image = get_or<std::string>(tbl, "paths", "error_image", cfg.error_image.string());

    const int64_t quality = get_or<int64_t>(tbl, "output", "default_quality", cfg.default_quality);
    if (quality < 0 || quality > 100) {
        throw std::runtime_error("config: output.default_quality must be within 0..100");
    }
    cfg.default_quality = static_cast<int>(quality);

    cfg.file_permissions      = get_perms(tbl, "file_permissions", cfg.file_permissions);
    cfg.directory_permissions = get_perms(tbl, "directory_permissions", cfg.directory_permissions);
    cfg.persist_orientation   = get_or<bool>(tbl, "output", "persist_orientation", cfg.persist_orientation);

    cfg.logging.level = get_or<std::string>(tbl, "logging", "level", cfg.logging.level);
    cfg.logging.file  = get_or<std::string>(tbl, "logging", "file", cfg.logging.file);
    if (!valid_level(cfg.logging.level)) {
        throw std::runtime_error("config: unknown logging.level '" + cfg.logging.level + "'");
    }

    return cfg;
}

Config load_config(const fs::path& path)
{
    try {
        const toml::table tbl = toml::parse_file(path.string());
        return config_from_toml(tbl);
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << "config: " << path.string() << ": " << e.description()
           << " (line " << e.source().begin.line << ")";
        throw std::runtime_error(ss.str());
    }
}

Config load_config_and_logging(const fs::path& path)
{
    Config cfg = load_config(path);
    if (!init_logging(cfg.logging)) {
        throw std::runtime_error("config: " + path.string() + ": cannot set up logging (file '"
                                 + cfg.logging.file + "')");
    }
    return cfg;
}

} // namespace imgmgr
