#include <ledgerstream/core/utils/append_file.hpp>
#include <ledgerstream/core/ledger/errors.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace LedgerStream {

namespace fs = std::filesystem;

namespace {

std::string errnoMessage(const std::string& what, const fs::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

} // namespace

AppendFile::AppendFile(fs::path path) : path_(std::move(path)) {
    if (path_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw LedgerIoError("Cannot create directory " + path_.parent_path().string() + ": " + ec.message());
        }
    }
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw LedgerIoError(errnoMessage("Failed to open ledger log", path_));
    }
}

AppendFile::~AppendFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void AppendFile::append(const std::string& data) {
    const char* cursor = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, cursor, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw LedgerIoError(errnoMessage("Failed to append to", path_));
        }
        cursor += n;
        remaining -= static_cast<size_t>(n);
    }
}

void AppendFile::sync() {
    if (::fsync(fd_) != 0) {
        throw LedgerIoError(errnoMessage("fsync failed for", path_));
    }
}

void AppendFile::truncate(uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        throw LedgerIoError(errnoMessage("Failed to truncate", path_));
    }
    sync();
}

uint64_t AppendFile::size() const {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        throw LedgerIoError(errnoMessage("fstat failed for", path_));
    }
    return static_cast<uint64_t>(st.st_size);
}

} // namespace LedgerStream
