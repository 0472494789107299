#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace LedgerStream {

/**
 * @class AppendFile
 * @brief Owns an O_APPEND file descriptor for a line-oriented log.
 *
 * append() writes the whole buffer (retrying short writes) and sync() forces it
 * to stable storage. Errors throw LedgerIoError. Not thread-safe; callers hold
 * their own lock.
 */
class AppendFile {
public:
    explicit AppendFile(std::filesystem::path path);
    ~AppendFile();

    AppendFile(const AppendFile&) = delete;
    AppendFile& operator=(const AppendFile&) = delete;

    void append(const std::string& data);
    void sync();

    /// Cut the file to @p size bytes and fsync
    void truncate(uint64_t size = 0);

    uint64_t size() const;
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

} // namespace LedgerStream
