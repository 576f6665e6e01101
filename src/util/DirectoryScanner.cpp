#include "util/DirectoryScanner.hpp"
#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cstdint>
#include <cstring>
#include <memory>

namespace turntable::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;
    int64_t  d_off;
    uint16_t d_reclen;
    uint8_t  d_type;
    char     d_name[];
};

constexpr uint8_t TYPE_UNKNOWN = 0;
constexpr uint8_t TYPE_REG = 8;
constexpr uint8_t TYPE_DIR = 4;

bool DirectoryScanner::is_audio_extension(const char* filename) {
    if (!filename || !std::strrchr(filename, '.')) return false;
    return Platform::is_audio_file(std::filesystem::path(filename));
}

std::vector<std::string> DirectoryScanner::scan_directory(const std::filesystem::path& root_dir) {
    std::vector<std::string> result;

    // Normalize: strip trailing slashes to prevent // in paths
    std::string root_str = root_dir.string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    Logger::info("DirectoryScanner: Scanning " + root_str);

    scan_directory_recursive(root_str, result);

    Logger::info("DirectoryScanner: Found " + std::to_string(result.size()) + " audio files");
    return result;
}

void DirectoryScanner::scan_directory_recursive(const std::string& dir_path, std::vector<std::string>& result) {
    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        Logger::debug("DirectoryScanner: Failed to open directory: " + dir_path);
        return;
    }

    // Heap buffer: this function recurses once per directory level
    auto buffer = std::make_unique<char[]>(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.get(), BUFFER_SIZE);

        if (nread == -1) {
            Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            break;
        }
        if (nread == 0) break;

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.get() + pos);
            pos += d->d_reclen;

            if (std::strcmp(d->d_name, ".") == 0 || std::strcmp(d->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = dir_path + "/" + d->d_name;
            uint8_t type = d->d_type;

            if (type == TYPE_UNKNOWN) {
                // Filesystem doesn't report d_type, fall back to stat
                struct stat entry_stat;
                if (fstatat(fd, d->d_name, &entry_stat, 0) != 0) continue;
                if (S_ISREG(entry_stat.st_mode)) type = TYPE_REG;
                else if (S_ISDIR(entry_stat.st_mode)) type = TYPE_DIR;
            }

            if (type == TYPE_REG) {
                if (is_audio_extension(d->d_name)) {
                    result.push_back(full_path);
                }
            } else if (type == TYPE_DIR) {
                scan_directory_recursive(full_path, result);
            }
        }
    }

    close(fd);
}

}  // namespace turntable::util
