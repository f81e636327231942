#include <tempo/host/filesystem.hpp>
#include <tempo/utils/logger.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tempo::host {

const char* to_string(EntryType type) {
    switch (type) {
        case EntryType::REGULAR_FILE:
            return "file";
        case EntryType::DIRECTORY:
            return "directory";
        case EntryType::SYMLINK:
            return "link";
        case EntryType::OTHER:
            break;
    }
    return "other";
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    // symlink_status so a dangling link still counts, like a plain stat of the name
    return fs::exists(fs::symlink_status(path, ec));
}

std::vector<DirEntry> scandir(const std::string& path) {
    std::vector<DirEntry> entries;

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        utils::Logger::debug() << "Cannot scan " << path << ": " << ec.message() << utils::Logger::endl;
        return entries;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            utils::Logger::warn() << "Stopped scanning " << path << ": " << ec.message() << utils::Logger::endl;
            break;
        }

        DirEntry entry;
        entry.name = it->path().filename().string();
        entry.path = path + "/" + entry.name;

        std::error_code type_ec;
        if (it->is_symlink(type_ec)) {
            entry.type = EntryType::SYMLINK;
        } else if (it->is_directory(type_ec)) {
            entry.type = EntryType::DIRECTORY;
        } else if (it->is_regular_file(type_ec)) {
            entry.type = EntryType::REGULAR_FILE;
        } else {
            entry.type = EntryType::OTHER;
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

std::optional<std::string> head(const std::string& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return std::nullopt;
    }

    std::string line;
    std::getline(in, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // namespace tempo::host
