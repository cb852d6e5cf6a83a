#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class CdnsnipException : public std::runtime_error {
public:
    explicit CdnsnipException(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised by HttpTransport implementations when a request could not be completed.
class TransportException : public CdnsnipException {
public:
    TransportException(const std::string& message, bool cancelled = false)
        : CdnsnipException(message), cancelled_(cancelled) {}

    bool cancelled() const { return cancelled_; }

private:
    bool cancelled_;
};

enum class ResolveErrorKind {
    TransportError,
    MetadataUnavailable,
    ListingUnavailable,
    MalformedResponse,
    NoLatestVersion,
    VersionAssetsMissing,
    NoDefaultFile,
    EmptyPath,
    PathResolvesToRoot,
    FileNotOnCDN
};

const char* to_string(ResolveErrorKind kind);

class ResolveError : public CdnsnipException {
public:
    ResolveError(ResolveErrorKind kind, const std::string& message, std::string package_name = "",
                 std::string version = "", std::string file = "")
        : CdnsnipException(message), kind_(kind), package_name_(std::move(package_name)),
          version_(std::move(version)), file_(std::move(file)) {}

    ResolveErrorKind kind() const { return kind_; }
    const std::string& package_name() const { return package_name_; }
    const std::string& version() const { return version_; }
    const std::string& file() const { return file_; }

    // HTTP status of the failed request, 0 when no response was received.
    long http_status() const { return http_status_; }
    bool cancelled() const { return cancelled_; }

    ResolveError& with_http_status(long status) {
        http_status_ = status;
        return *this;
    }
    ResolveError& with_cancelled(bool cancelled) {
        cancelled_ = cancelled;
        return *this;
    }

private:
    ResolveErrorKind kind_;
    std::string package_name_;
    std::string version_;
    std::string file_;
    long http_status_ = 0;
    bool cancelled_ = false;
};
