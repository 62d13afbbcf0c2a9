#pragma once

#include <filesystem>
#include <functional>
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

// Visit every regular file below `root` that the matcher does not ignore, pruning
// ignored directories. The visitor receives the path relative to `root` and returns
// false to stop the walk early. Unreadable entries are skipped; this never throws.
void walkProjectFiles(const fs::path& root,
                      const PatternMatcher& matcher,
                      const std::function<bool(const fs::path&)>& visitor);
