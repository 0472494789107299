#pragma once

#include <filesystem>
#include <string>

namespace LedgerStream {

/**
 * @brief Small POSIX durability helpers shared by the ledger log and snapshots.
 *
 * All functions throw LedgerIoError on failure.
 */
namespace FileSync {

/// fsync a directory so that creates/renames inside it survive a crash
void syncDirectory(const std::filesystem::path& dir);

/**
 * @brief Replace @p path with @p contents atomically.
 *
 * Writes <path>.tmp, fsyncs it, renames it over @p path and fsyncs the parent
 * directory. A reader sees either the old file or the new one, never a torn mix.
 */
void atomicWrite(const std::filesystem::path& path, const std::string& contents);

} // namespace FileSync

} // namespace LedgerStream
