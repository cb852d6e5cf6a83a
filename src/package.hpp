#pragma once

#include <map>
#include <optional>
#include <string>

struct PackageSpec {
    std::string name;         // snippet / template identity
    std::string file;         // optional, empty means "pick the default file"
    std::string package_name; // optional registry identity, defaults to name

    bool operator==(const PackageSpec&) const = default;
};

// Candidate entry points of one published version.
struct VersionAssets {
    std::optional<std::string> jsdelivr;
    std::optional<std::string> unpkg;
    std::optional<std::string> module;
    std::optional<std::string> main;
};

struct PackageMetadata {
    bool has_dist_tags = false;
    std::map<std::string, std::string> dist_tags;
    std::map<std::string, VersionAssets> versions;
};

// Normalized file path -> content hash, for one package@version.
using CdnFileListing = std::map<std::string, std::string>;

struct ResolvedPackage {
    PackageSpec spec;
    std::string version;
    std::string file;      // "/"-rooted
    std::string integrity; // "sha256-..."
    std::string src;       // absolute URL
};
