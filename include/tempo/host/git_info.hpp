#pragma once
#include <optional>
#include <string>

namespace tempo::host {

struct GitInfo {
    std::string branch;
    // Empty when the branch ref has no loose file (e.g. only in packed-refs)
    std::string hash;
};

// Branch and commit of a checkout from its .git/HEAD; nullopt when there is
// no repository or HEAD is detached
std::optional<GitInfo> git_info(const std::string& dir);

} // namespace tempo::host
