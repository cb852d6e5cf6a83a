#include "exception.hpp"

const char* to_string(ResolveErrorKind kind) {
    switch (kind) {
        case ResolveErrorKind::TransportError:
            return "transport_error";
        case ResolveErrorKind::MetadataUnavailable:
            return "metadata_unavailable";
        case ResolveErrorKind::ListingUnavailable:
            return "listing_unavailable";
        case ResolveErrorKind::MalformedResponse:
            return "malformed_response";
        case ResolveErrorKind::NoLatestVersion:
            return "no_latest_version";
        case ResolveErrorKind::VersionAssetsMissing:
            return "version_assets_missing";
        case ResolveErrorKind::NoDefaultFile:
            return "no_default_file";
        case ResolveErrorKind::EmptyPath:
            return "empty_path";
        case ResolveErrorKind::PathResolvesToRoot:
            return "path_resolves_to_root";
        case ResolveErrorKind::FileNotOnCDN:
            return "file_not_on_cdn";
    }
    return "unknown";
}
