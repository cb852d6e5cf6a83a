#include "registry_client.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

namespace {
    // Helper to safely get a non-empty string from JSON
    std::optional<std::string> get_string_field(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            std::string value = it->get<std::string>();
            if (!value.empty()) return value;
        }
        return std::nullopt;
    }

    VersionAssets decode_version_assets(const nlohmann::json& j) {
        VersionAssets assets;
        assets.jsdelivr = get_string_field(j, "jsdelivr");
        assets.unpkg = get_string_field(j, "unpkg");
        assets.module = get_string_field(j, "module");
        assets.main = get_string_field(j, "main");
        return assets;
    }

    ResolveError malformed(const std::string& source, const std::string& reason, const std::string& package_name,
                           const std::string& version = "") {
        return ResolveError(ResolveErrorKind::MalformedResponse,
                            string_format("error.malformed_response", source, reason), package_name, version);
    }
}

PackageMetadata decode_package_metadata(const std::string& body, const std::string& source,
                                        const std::string& package_name) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw malformed(source, e.what(), package_name);
    }
    if (!j.is_object()) {
        throw malformed(source, "expected a JSON object", package_name);
    }

    PackageMetadata meta;
    if (auto tags = j.find("dist-tags"); tags != j.end() && !tags->is_null()) {
        if (!tags->is_object()) {
            throw malformed(source, "\"dist-tags\" is not an object", package_name);
        }
        meta.has_dist_tags = true;
        for (auto& [tag, version] : tags->items()) {
            if (version.is_string()) {
                meta.dist_tags[tag] = version.get<std::string>();
            }
        }
    }

    if (auto versions = j.find("versions"); versions != j.end() && !versions->is_null()) {
        if (!versions->is_object()) {
            throw malformed(source, "\"versions\" is not an object", package_name);
        }
        for (auto& [version, info] : versions->items()) {
            if (info.is_object()) {
                meta.versions.emplace(version, decode_version_assets(info));
            }
        }
    }
    return meta;
}

CdnFileListing decode_file_listing(const std::string& body, const std::string& source,
                                   const std::string& package_name, const std::string& version) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw malformed(source, e.what(), package_name, version);
    }
    if (!j.is_object()) {
        throw malformed(source, "expected a JSON object", package_name, version);
    }

    CdnFileListing listing;
    auto files = j.find("files");
    if (files == j.end() || files->is_null()) {
        return listing;
    }
    if (!files->is_array()) {
        throw malformed(source, "\"files\" is not an array", package_name, version);
    }
    for (const auto& entry : *files) {
        if (!entry.is_object()) continue;
        auto name = get_string_field(entry, "name");
        auto hash = get_string_field(entry, "hash");
        if (name && hash) {
            listing[*name] = *hash;
        }
    }
    return listing;
}

RegistryClient::RegistryClient(std::shared_ptr<HttpTransport> transport, Endpoints endpoints)
    : transport_(std::move(transport)), endpoints_(std::move(endpoints)) {
    endpoints_.registry_url = trim_trailing_slashes(endpoints_.registry_url);
    endpoints_.data_url = trim_trailing_slashes(endpoints_.data_url);
    endpoints_.cdn_url = trim_trailing_slashes(endpoints_.cdn_url);
}

std::string RegistryClient::metadata_url(const std::string& package_name) const {
    return endpoints_.registry_url + "/" + package_name;
}

std::string RegistryClient::listing_url(const std::string& package_name, const std::string& version) const {
    return endpoints_.data_url + "/" + package_name + "@" + version + "/flat";
}

HttpResponse RegistryClient::get(const std::string& url, const std::string& package_name, const std::string& version,
                                 const CancellationToken& token) const {
    if (token.is_cancelled()) {
        throw ResolveError(ResolveErrorKind::TransportError, string_format("error.resolve_cancelled", package_name),
                           package_name, version)
            .with_cancelled(true);
    }
    try {
        return transport_->get(url, token);
    } catch (const TransportException& e) {
        throw ResolveError(ResolveErrorKind::TransportError, e.what(), package_name, version)
            .with_cancelled(e.cancelled());
    }
}

PackageMetadata RegistryClient::fetch_metadata(const std::string& package_name, const CancellationToken& token) const {
    const std::string url = metadata_url(package_name);
    HttpResponse res = get(url, package_name, "", token);
    if (!res.ok()) {
        throw ResolveError(ResolveErrorKind::MetadataUnavailable,
                           string_format("error.metadata_unavailable", package_name, res.status()), package_name)
            .with_http_status(res.status_code);
    }
    return decode_package_metadata(res.body, url, package_name);
}

CdnFileListing RegistryClient::fetch_file_listing(const std::string& package_name, const std::string& version,
                                                  const CancellationToken& token) const {
    const std::string url = listing_url(package_name, version);
    HttpResponse res = get(url, package_name, version, token);
    if (!res.ok()) {
        throw ResolveError(ResolveErrorKind::ListingUnavailable,
                           string_format("error.listing_unavailable", url, res.status()), package_name, version)
            .with_http_status(res.status_code);
    }
    return decode_file_listing(res.body, url, package_name, version);
}
