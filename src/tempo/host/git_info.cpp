#include <tempo/host/git_info.hpp>
#include <tempo/host/filesystem.hpp>

namespace tempo::host {

namespace {
constexpr const char* REF_PREFIX = "ref: ";
constexpr const char* HEADS_PREFIX = "refs/heads/";
}

std::optional<GitInfo> git_info(const std::string& dir) {
    auto line = head(dir + "/.git/HEAD");
    if (!line) {
        return std::nullopt;
    }

    // "ref: refs/heads/<branch>", anything else is a detached HEAD
    std::string::size_type ref_pos = line->find(REF_PREFIX);
    if (ref_pos == std::string::npos) {
        return std::nullopt;
    }
    std::string ref = line->substr(ref_pos + std::char_traits<char>::length(REF_PREFIX));
    if (ref.rfind(HEADS_PREFIX, 0) != 0) {
        return std::nullopt;
    }

    GitInfo info;
    info.branch = ref.substr(std::char_traits<char>::length(HEADS_PREFIX));
    info.hash = head(dir + "/.git/" + ref).value_or("");
    return info;
}

} // namespace tempo::host
