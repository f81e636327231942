#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tempo::host {

enum class EntryType {
    REGULAR_FILE,
    DIRECTORY,
    SYMLINK,
    OTHER
};

const char* to_string(EntryType type);

struct DirEntry {
    std::string name;
    std::string path;
    EntryType type;
};

bool file_exists(const std::string& path);

// Entries of a directory in iteration order, empty when it cannot be opened
std::vector<DirEntry> scandir(const std::string& path);

// First line of a file without the line terminator
std::optional<std::string> head(const std::string& file);

} // namespace tempo::host
