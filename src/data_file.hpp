#pragma once

#include "package.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Reads a JSON array of {"name", "file"?, "pkg"?} objects.
// Throws CdnsnipException on a missing file, invalid JSON or an entry without a name.
std::vector<PackageSpec> read_data_file(const std::filesystem::path& path);
std::vector<PackageSpec> parse_package_specs(const std::string& contents, const std::string& source);
