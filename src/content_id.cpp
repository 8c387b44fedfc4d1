#include "content_id.hpp"

namespace koboshelf {
namespace content_id {

static std::string strip_trailing_slashes(const std::string& path) {
    std::string result = path;
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::optional<std::string> resolve_library_root(const std::vector<std::string>& library_roots,
                                                 const std::string& directory) {
    const std::string dir = strip_trailing_slashes(directory);
    for (const auto& configured : library_roots) {
        if (configured.empty()) continue;
        std::string root = strip_trailing_slashes(configured);
        if (dir == root) {
            return root;
        }
        // "/" is the only root that already ends in a separator
        std::string prefix = root == "/" ? root : root + "/";
        if (dir.compare(0, prefix.size(), prefix) == 0) {
            return root;
        }
    }
    return std::nullopt;
}

std::string relative_directory(const std::string& root, const std::string& directory) {
    const std::string base = strip_trailing_slashes(root);
    const std::string dir = strip_trailing_slashes(directory);
    if (dir.size() <= base.size()) {
        return "";
    }
    size_t start = base.size();
    if (dir[start] == '/') {
        start++;
    }
    return dir.substr(start);
}

std::optional<std::string> make(const std::vector<std::string>& library_roots,
                                const std::string& directory,
                                const std::string& name,
                                const std::string& extension) {
    auto root = resolve_library_root(library_roots, directory);
    if (!root) {
        return std::nullopt;
    }

    std::string relative = relative_directory(*root, directory);
    std::string id = DEVICE_PREFIX;
    if (!relative.empty()) {
        id += relative + "/";
    }
    id += name + "." + extension;
    return id;
}

std::optional<std::string> destination_directory(const std::vector<std::string>& library_roots,
                                                 const std::string& directory,
                                                 const std::string& working_root) {
    auto root = resolve_library_root(library_roots, directory);
    if (!root) {
        return std::nullopt;
    }

    std::string relative = relative_directory(*root, directory);
    std::string destination = strip_trailing_slashes(working_root);
    if (!relative.empty()) {
        destination += "/" + relative;
    }
    return destination;
}

} // namespace content_id
} // namespace koboshelf
