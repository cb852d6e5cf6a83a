#pragma once

#include "cache.hpp"
#include "cancellation.hpp"
#include "package.hpp"
#include "registry_client.hpp"

#include <optional>
#include <string>

// Resolves package specs into version-pinned, integrity-tagged CDN asset references.
// Safe to call from several threads at once; failures are reported as ResolveError.
class Resolver {
public:
    explicit Resolver(RegistryClient client);

    ResolvedPackage resolve(const PackageSpec& spec, const CancellationToken& token) const;
    ResolvedPackage resolve(const PackageSpec& spec) const;

    const ResolverCache& cache() const { return cache_; }
    const RegistryClient& client() const { return client_; }

    std::string cdn_src(const std::string& package_name, const std::string& version, const std::string& file) const;

    // First non-empty field of the fallback chain: jsdelivr, unpkg, module, main.
    static std::optional<std::string> default_file(const VersionAssets& assets);

private:
    ResolverCache::MetadataPtr metadata(const std::string& package_name, const CancellationToken& token) const;
    ResolverCache::ListingPtr file_listing(const std::string& package_name, const std::string& version,
                                           const CancellationToken& token) const;

    RegistryClient client_;
    mutable ResolverCache cache_;
};

std::string integrity_from_hash(const std::string& hash);
