#pragma once

#include <filesystem>
#include <vector>
#include <string>
#include <cstddef>

namespace turntable::util {

/**
 * DirectoryScanner: recursive enumeration of playable files using the
 * getdents64 syscall.
 *
 * Entries are visited in the order the kernel returns them, depth first, so
 * the result is stable for an unchanged directory on a given filesystem but
 * is not sorted.
 */
class DirectoryScanner {
public:
    /**
     * Recursively collects every file under root_dir whose extension is a
     * supported audio extension (see Platform::AUDIO_EXTENSIONS).
     *
     * @param root_dir Directory to scan. A missing or unreadable directory
     *                 yields an empty result.
     * @return Absolute-or-as-given paths, in traversal order
     */
    [[nodiscard]] static std::vector<std::string> scan_directory(const std::filesystem::path& root_dir);

    /**
     * Checks if a filename has a supported audio extension (case-insensitive).
     */
    [[nodiscard]] static bool is_audio_extension(const char* filename);

private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;  // getdents64 batch buffer

    static void scan_directory_recursive(const std::string& dir_path, std::vector<std::string>& result);
};

}  // namespace turntable::util
