#pragma once

#include <filesystem>
#include <string>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;

// Derived paths
extern std::filesystem::path ENDPOINTS_CONF;

inline constexpr const char* DEFAULT_REGISTRY_URL = "https://registry.npmjs.org";
inline constexpr const char* DEFAULT_DATA_URL = "https://data.jsdelivr.com/v1/package/npm";
inline constexpr const char* DEFAULT_CDN_URL = "https://cdn.jsdelivr.net/npm";
inline constexpr long DEFAULT_TIMEOUT_MS = 10000;

struct Endpoints {
    std::string registry_url = DEFAULT_REGISTRY_URL; // package metadata
    std::string data_url = DEFAULT_DATA_URL;         // flattened file listings
    std::string cdn_url = DEFAULT_CDN_URL;           // asset links
    long timeout_ms = DEFAULT_TIMEOUT_MS;
};

// Functions
void set_config_dir(const std::string& config_dir);

// Defaults, then ENDPOINTS_CONF if it exists, then CDNSNIP_*_URL environment variables.
Endpoints load_endpoints();
Endpoints parse_endpoints(const std::string& contents, const std::string& source, Endpoints base = {});
void apply_endpoint_env_overrides(Endpoints& endpoints);

// Strips trailing separators and rejects empty URLs or non-positive timeouts.
void validate_endpoints(Endpoints& endpoints);
long parse_timeout_ms(const std::string& value);
