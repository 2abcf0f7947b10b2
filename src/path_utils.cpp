#include "path_utils.h"
#include <cstdlib>
#include <string>

namespace luna_voice {

std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;

    const char* home = std::getenv("HOME");
    if (!home) return path;

    if (path.size() == 1) {
        return std::string(home);
    }
    if (path[1] == '/' || path[1] == '\\') {
        return std::string(home) + path.substr(1);
    }
    return path;
}

} // namespace luna_voice
