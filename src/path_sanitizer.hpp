#pragma once

#include <string>

// Trims whitespace, roots the path at "/" and collapses ".", ".." and repeated separators.
// Throws ResolveError (EmptyPath, PathResolvesToRoot).
std::string sanitize_file_path(const std::string& file);
