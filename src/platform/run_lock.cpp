#include "run_lock.hpp"
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <sys/file.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

#ifdef _WIN32
static bool try_lock_fd(int fd, bool exclusive) {
    HANDLE h = (HANDLE)_get_osfhandle(fd);
    OVERLAPPED ov = {};
    DWORD flags = LOCKFILE_FAIL_IMMEDIATELY | (exclusive ? LOCKFILE_EXCLUSIVE_LOCK : 0);
    return LockFileEx(h, flags, 0, 1, 0, &ov) != 0;
}
#else
static bool try_lock_fd(int fd, bool exclusive) {
    return flock(fd, (exclusive ? LOCK_EX : LOCK_SH) | LOCK_NB) == 0;
}
#endif

static void close_fd(int fd) {
#ifdef _WIN32
    _close(fd);
#else
    close(fd);
#endif
}

RunLock::RunLock(const std::string& lock_path, const std::string& start_time) {
    // Ensure parent directory exists
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path());

#ifdef _WIN32
    fd_ = _open(lock_path.c_str(), _O_CREAT | _O_RDWR, 0644);
#else
    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR, 0644);
#endif
    if (fd_ < 0) return;
    if (!try_lock_fd(fd_, true)) {
        close_fd(fd_);
        fd_ = -1;
        return;
    }

    // Only the holder rewrites the marker content.
#ifdef _WIN32
    _chsize(fd_, 0);
    _lseek(fd_, 0, SEEK_SET);
    int written = _write(fd_, start_time.data(), static_cast<unsigned>(start_time.size()));
#else
    int written = -1;
    if (ftruncate(fd_, 0) == 0 && lseek(fd_, 0, SEEK_SET) == 0) {
        written = static_cast<int>(write(fd_, start_time.data(), start_time.size()));
    }
#endif
    if (written != static_cast<int>(start_time.size())) {
        close_fd(fd_);
        fd_ = -1;
    }
}

RunLock::~RunLock() {
    if (fd_ < 0) return;
    close_fd(fd_);
    // flock is released automatically when fd is closed
}

RunLock::Probe RunLock::probe(const std::string& lock_path) {
    Probe result;

#ifdef _WIN32
    int fd = _open(lock_path.c_str(), _O_RDONLY);
#else
    int fd = open(lock_path.c_str(), O_RDONLY);
#endif
    if (fd < 0) return result;

    if (try_lock_fd(fd, false)) {
        // Nobody holds it; our shared lock goes away with the fd.
        close_fd(fd);
        return result;
    }
    close_fd(fd);

    result.running = true;
    std::ifstream in(lock_path);
    std::stringstream ss;
    ss << in.rdbuf();
    result.start_time = ss.str();
    trim(result.start_time);
    return result;
}
