#include "imgmgr/cache_store.hpp"
#include "imgmgr/errors.hpp"
#include "imgmgr/logging.hpp"

#include <atomic>
#include <fstream>
#include <functional>
#include <random>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace imgmgr {

// 同一目錄下不會撞名的暫存檔
static fs::path temp_sibling(const fs::path& path)
{
    static std::atomic<unsigned> counter{0};
    static const unsigned salt = std::random_device{}();

    std::ostringstream ss;
    ss << path.filename().string() << ".tmp."
       << std::hex << salt << '.'
       << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '.'
       << counter.fetch_add(1);
    return path.parent_path() / ss.str();
}

bool FileSystemStore::exists(const fs::path& path) const
{
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileSystemStore::is_file(const fs::path& path) const
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

Bytes FileSystemStore::read(const fs::path& path) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error(ErrorKind::InvalidInput, "Unable to read file: " + path.string());
    }

    Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw Error(ErrorKind::InvalidInput, "Unable to read file: " + path.string());
    }
    return bytes;
}

void FileSystemStore::write(const fs::path& path, const Bytes& bytes, fs::perms perms)
{
    const fs::path tmp = temp_sibling(path);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw Error(ErrorKind::EncodeFailure, "Unable to write file: " + path.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code ignore;
            fs::remove(tmp, ignore);
            throw Error(ErrorKind::EncodeFailure, "Unable to write file: " + path.string());
        }
    }

    std::error_code ec;
    fs::permissions(tmp, perms, fs::perm_options::replace, ec);
    if (ec) {
        IMGMGR_LOG_WARN("chmod failed for {}: {}", tmp.string(), ec.message());
    }

    // 讀的人只會看到舊檔或完整的新檔
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        throw Error(ErrorKind::EncodeFailure,
                    "Unable to move file into place: " + path.string() + " (" + ec.message() + ")");
    }
}

bool FileSystemStore::make_directory(const fs::path& dir, std::error_code& ec)
{
    return fs::create_directory(dir, ec);
}

void FileSystemStore::ensure_directory(const fs::path& dir, fs::perms perms)
{
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return;

    if (make_directory(dir, ec)) {
        std::error_code perm_ec;
        fs::permissions(dir, perms, fs::perm_options::replace, perm_ec);
        if (perm_ec) {
            IMGMGR_LOG_WARN("chmod failed for {}: {}", dir.string(), perm_ec.message());
        }
        IMGMGR_LOG_DEBUG("created directory {}", dir.string());
        return;
    }

    // 別的 process 剛好搶先建好
    std::error_code again;
    if (fs::is_directory(dir, again)) return;

    throw Error(ErrorKind::DirectoryCreateFailure,
                "Error creating directory: " + dir.string()
                + (ec ? " (" + ec.message() + ")" : std::string()));
}

std::vector<fs::path> FileSystemStore::list_files(const fs::path& dir) const
{
    std::vector<fs::path> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return files;

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    return files;
}

bool FileSystemStore::remove(const fs::path& path)
{
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        IMGMGR_LOG_WARN("failed to remove {}: {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

} // namespace imgmgr
