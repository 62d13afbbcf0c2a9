#include "file_walker.hpp"
#include <system_error>

void walkProjectFiles(const fs::path& root,
                      const PatternMatcher& matcher,
                      const std::function<bool(const fs::path&)>& visitor) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    if (ec) {
        return;
    }

    while (it != end) {
        const fs::path relativePath = it->path().lexically_relative(root);
        std::error_code typeEc;

        if (it->is_directory(typeEc)) {
            if (matcher.isIgnoredDirectory(relativePath)) {
                it.disable_recursion_pending();
            }
        } else if (it->is_regular_file(typeEc)) {
            if (!matcher.isIgnored(relativePath) && !visitor(relativePath)) {
                return;
            }
        }

        it.increment(ec);
        if (ec) {
            return;
        }
    }
}
