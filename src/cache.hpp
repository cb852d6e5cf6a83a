#pragma once

#include "package.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// In-memory, process-lifetime store of registry responses owned by one Resolver.
// Both maps share one mutex, held only for the duration of a map access.
class ResolverCache {
public:
    using MetadataPtr = std::shared_ptr<const PackageMetadata>;
    using ListingPtr = std::shared_ptr<const CdnFileListing>;

    ResolverCache() = default;
    ResolverCache(const ResolverCache&) = delete;
    ResolverCache& operator=(const ResolverCache&) = delete;

    // Thread-safe accessors and modifiers; lookups return nullptr on a miss
    MetadataPtr get_metadata(const std::string& package_name) const;
    void store_metadata(const std::string& package_name, MetadataPtr metadata);

    ListingPtr get_listing(const std::string& package_name, const std::string& version) const;
    void store_listing(const std::string& package_name, const std::string& version, ListingPtr listing);

    size_t metadata_size() const;
    size_t listing_size() const;
    void clear();

    static std::string listing_key(const std::string& package_name, const std::string& version);

private:
    std::unordered_map<std::string, MetadataPtr> metadata_;
    std::unordered_map<std::string, ListingPtr> listings_;

    mutable std::mutex mtx;
};
