#include "file_io.hpp"
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#  include <io.h>
#  include <fcntl.h>
#else
#  include <unistd.h>
#  include <fcntl.h>
#endif

// Flush a written file to the storage device, so a rename over the old file
// never exposes unwritten data after a power loss.
static bool sync_file(const fs::path& path) {
#ifdef _WIN32
    int fd = _open(path.string().c_str(), _O_RDWR | _O_BINARY);
    if (fd < 0) return false;
    bool ok = _commit(fd) == 0;
    _close(fd);
#else
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
#endif
    return ok;
}

Result<void> write_file_atomic(const fs::path& path, const std::string& content) {
    fs::path tmp = path;
    tmp += ".tmp";

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("failed to create directory {}: {}",
                                             path.parent_path().string(), ec.message()),
                                 ErrorCode::Io);
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err("failed to open " + tmp.string() + " for writing",
                                     ErrorCode::Io);
        }
        out << content;
        out.flush();
        if (!out) {
            return Result<void>::Err("failed to write " + tmp.string(), ErrorCode::Io);
        }
    }

    if (!sync_file(tmp)) {
        fs::remove(tmp, ec);
        return Result<void>::Err("failed to sync " + tmp.string(), ErrorCode::Io);
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(fmt::format("failed to replace {}", path.string()),
                                 ErrorCode::Io);
    }
    return Result<void>::Ok();
}

Result<std::optional<std::string>> read_file_if_exists(const fs::path& path) {
    using R = Result<std::optional<std::string>>;

    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        return R::Err(fmt::format("failed to stat {}: {}", path.string(), ec.message()),
                      ErrorCode::Io);
    }
    if (!exists) {
        return R::Ok(std::nullopt);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::Err("failed to open " + path.string() + " for reading", ErrorCode::Io);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return R::Err("failed to read " + path.string(), ErrorCode::Io);
    }
    return R::Ok(ss.str());
}
