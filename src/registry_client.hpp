#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "package.hpp"

#include <memory>
#include <string>

// Response decoding. Throw ResolveError(MalformedResponse) naming `source` on invalid input.
PackageMetadata decode_package_metadata(const std::string& body, const std::string& source,
                                        const std::string& package_name = "");
CdnFileListing decode_file_listing(const std::string& body, const std::string& source,
                                   const std::string& package_name = "", const std::string& version = "");

class RegistryClient {
public:
    RegistryClient(std::shared_ptr<HttpTransport> transport, Endpoints endpoints);

    // GET {registry_url}/{package_name}
    PackageMetadata fetch_metadata(const std::string& package_name, const CancellationToken& token) const;
    // GET {data_url}/{package_name}@{version}/flat
    CdnFileListing fetch_file_listing(const std::string& package_name, const std::string& version,
                                      const CancellationToken& token) const;

    std::string metadata_url(const std::string& package_name) const;
    std::string listing_url(const std::string& package_name, const std::string& version) const;

    const Endpoints& endpoints() const { return endpoints_; }
    HttpTransport& transport() const { return *transport_; }

private:
    HttpResponse get(const std::string& url, const std::string& package_name, const std::string& version,
                     const CancellationToken& token) const;

    std::shared_ptr<HttpTransport> transport_;
    Endpoints endpoints_;
};
