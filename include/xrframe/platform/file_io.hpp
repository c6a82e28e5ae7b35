// XRFrame Platform
// file_io.hpp - File system helpers used by configuration and logging

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace xrframe::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations
class FileSystem {
public:
    static fs::path get_temp_directory();

    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool remove_all(const fs::path& path);

private:
    FileSystem() = delete;  // Static class, no instances
};

}  // namespace xrframe::platform
