#include <ledgerstream/core/utils/file_sync.hpp>
#include <ledgerstream/core/ledger/errors.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace LedgerStream {
namespace FileSync {

namespace fs = std::filesystem;

namespace {

std::string errnoMessage(const std::string& what, const fs::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

void syncFd(int fd, const fs::path& path) {
    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        errno = saved;
        throw LedgerIoError(errnoMessage("fsync failed for", path));
    }
}

} // namespace

void syncDirectory(const fs::path& dir) {
    fs::path target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        throw LedgerIoError(errnoMessage("open directory failed for", target));
    }
    syncFd(fd, target);
    ::close(fd);
}

void atomicWrite(const fs::path& path, const std::string& contents) {
    fs::path tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        throw LedgerIoError(errnoMessage("create failed for", tmp));
    }
    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            errno = saved;
            throw LedgerIoError(errnoMessage("write failed for", tmp));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    syncFd(fd, tmp);
    ::close(fd);

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw LedgerIoError("rename " + tmp.string() + " -> " + path.string() + " failed: " + ec.message());
    }
    syncDirectory(path.parent_path());
}

} // namespace FileSync
} // namespace LedgerStream
