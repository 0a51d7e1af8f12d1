#ifndef _POLLWATCH_FILE_INFO_HPP_
#define _POLLWATCH_FILE_INFO_HPP_

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>

// Metadata of a single path, captured once and never updated.
struct FileInfo {
    std::string name;
    int64_t size = 0;
    // permission bits only (st_mode & 07777)
    mode_t mode = 0;
    std::chrono::system_clock::time_point mod_time;
    bool is_dir = false;
    // raw stat result, opaque to the watcher
    struct stat sys{};
};

// Absolute path -> metadata
using Snapshot = std::map<std::string, FileInfo>;

// stat a path, following symlinks
FileInfo stat_path( const std::string& path );

// stat a path without following symlinks
FileInfo lstat_path( const std::string& path );

// Immediate children of a directory, sorted by name.
// Entries removed while the directory is being read are skipped.
std::vector<FileInfo> read_dir( const std::string& path );

#endif // _POLLWATCH_FILE_INFO_HPP_
