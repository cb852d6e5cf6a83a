#include "resolver.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "path_sanitizer.hpp"
#include "utils.hpp"

#include <array>
#include <utility>

namespace {
    using AssetField = std::optional<std::string> VersionAssets::*;

    // Fallback priority for the default file of a version
    constexpr std::array<AssetField, 4> default_file_chain = {
        &VersionAssets::jsdelivr,
        &VersionAssets::unpkg,
        &VersionAssets::module,
        &VersionAssets::main,
    };

    std::string latest_version(const PackageMetadata& meta, const std::string& package_name) {
        if (!meta.has_dist_tags) {
            throw ResolveError(ResolveErrorKind::NoLatestVersion, string_format("error.no_dist_tags", package_name),
                               package_name);
        }
        auto it = meta.dist_tags.find("latest");
        if (it == meta.dist_tags.end() || it->second.empty()) {
            throw ResolveError(ResolveErrorKind::NoLatestVersion,
                               string_format("error.no_latest_version", package_name), package_name);
        }
        return it->second;
    }
}

std::string integrity_from_hash(const std::string& hash) {
    return "sha256-" + hash;
}

Resolver::Resolver(RegistryClient client) : client_(std::move(client)) {}

std::optional<std::string> Resolver::default_file(const VersionAssets& assets) {
    for (AssetField field : default_file_chain) {
        const auto& value = assets.*field;
        if (value && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::string Resolver::cdn_src(const std::string& package_name, const std::string& version,
                              const std::string& file) const {
    return client_.endpoints().cdn_url + "/" + package_name + "@" + version + file;
}

ResolverCache::MetadataPtr Resolver::metadata(const std::string& package_name, const CancellationToken& token) const {
    if (auto cached = cache_.get_metadata(package_name)) {
        log_debug(string_format("debug.cache_hit_metadata", package_name));
        return cached;
    }

    // Not locked across the request: concurrent first lookups of one package may both fetch.
    auto fetched = std::make_shared<PackageMetadata>(client_.fetch_metadata(package_name, token));
    cache_.store_metadata(package_name, fetched);
    return fetched;
}

ResolverCache::ListingPtr Resolver::file_listing(const std::string& package_name, const std::string& version,
                                                 const CancellationToken& token) const {
    if (auto cached = cache_.get_listing(package_name, version)) {
        log_debug(string_format("debug.cache_hit_listing", package_name, version));
        return cached;
    }

    auto fetched = std::make_shared<CdnFileListing>(client_.fetch_file_listing(package_name, version, token));
    cache_.store_listing(package_name, version, fetched);
    return fetched;
}

ResolvedPackage Resolver::resolve(const PackageSpec& spec) const {
    return resolve(spec, CancellationToken());
}

ResolvedPackage Resolver::resolve(const PackageSpec& spec, const CancellationToken& token) const {
    ResolvedPackage resolved;
    resolved.spec = spec;
    if (resolved.spec.package_name.empty()) {
        resolved.spec.package_name = resolved.spec.name;
    }
    const std::string& package_name = resolved.spec.package_name;

    auto meta = metadata(package_name, token);
    resolved.version = latest_version(*meta, package_name);

    std::string file = spec.file;
    if (file.empty()) {
        auto assets = meta->versions.find(resolved.version);
        if (assets == meta->versions.end()) {
            throw ResolveError(ResolveErrorKind::VersionAssetsMissing,
                               string_format("error.version_assets_missing", spec.name, resolved.version),
                               package_name, resolved.version);
        }
        auto chosen = default_file(assets->second);
        if (!chosen) {
            throw ResolveError(ResolveErrorKind::NoDefaultFile,
                               string_format("error.no_default_file", package_name, resolved.version),
                               package_name, resolved.version);
        }
        file = *chosen;
    }

    try {
        resolved.file = sanitize_file_path(file);
    } catch (const ResolveError& e) {
        throw ResolveError(e.kind(), string_format("error.invalid_file_path", spec.name, e.what()), package_name,
                           resolved.version, file);
    }

    auto listing = file_listing(package_name, resolved.version, token);
    auto hash = listing->find(resolved.file);
    if (hash == listing->end()) {
        throw ResolveError(ResolveErrorKind::FileNotOnCDN,
                           string_format("error.file_not_on_cdn", resolved.file, spec.name), package_name,
                           resolved.version, resolved.file);
    }

    resolved.integrity = integrity_from_hash(hash->second);
    resolved.src = cdn_src(package_name, resolved.version, resolved.file);
    return resolved;
}
