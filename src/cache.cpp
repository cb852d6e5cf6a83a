#include "cache.hpp"
#include <utility>

std::string ResolverCache::listing_key(const std::string& package_name, const std::string& version) {
    return package_name + "@" + version;
}

ResolverCache::MetadataPtr ResolverCache::get_metadata(const std::string& package_name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = metadata_.find(package_name);
    return (it != metadata_.end()) ? it->second : nullptr;
}

void ResolverCache::store_metadata(const std::string& package_name, MetadataPtr metadata) {
    std::lock_guard<std::mutex> lock(mtx);
    metadata_[package_name] = std::move(metadata);
}

ResolverCache::ListingPtr ResolverCache::get_listing(const std::string& package_name, const std::string& version) const {
    const std::string key = listing_key(package_name, version);
    std::lock_guard<std::mutex> lock(mtx);
    auto it = listings_.find(key);
    return (it != listings_.end()) ? it->second : nullptr;
}

void ResolverCache::store_listing(const std::string& package_name, const std::string& version, ListingPtr listing) {
    std::string key = listing_key(package_name, version);
    std::lock_guard<std::mutex> lock(mtx);
    listings_[std::move(key)] = std::move(listing);
}

size_t ResolverCache::metadata_size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return metadata_.size();
}

size_t ResolverCache::listing_size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return listings_.size();
}

void ResolverCache::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    metadata_.clear();
    listings_.clear();
}
