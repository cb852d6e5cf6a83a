#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <sstream>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = CDNSNIP_CONF_DIR;
fs::path L10N_DIR = CDNSNIP_L10N_DIR;

fs::path ENDPOINTS_CONF = fs::path(CDNSNIP_CONF_DIR) / "endpoints.conf";

void set_config_dir(const std::string& config_dir) {
    CONFIG_DIR = fs::path(config_dir).lexically_normal();
    if (CONFIG_DIR.empty()) CONFIG_DIR = CDNSNIP_CONF_DIR;

    ENDPOINTS_CONF = CONFIG_DIR / "endpoints.conf";
}

long parse_timeout_ms(const std::string& value) {
    std::string trimmed = trim(value);
    size_t consumed = 0;
    long result = 0;
    try {
        result = std::stol(trimmed, &consumed);
    } catch (const std::exception&) {
        throw CdnsnipException(string_format("error.invalid_timeout", value));
    }
    if (consumed != trimmed.size() || result <= 0) {
        throw CdnsnipException(string_format("error.invalid_timeout", value));
    }
    return result;
}

Endpoints parse_endpoints(const std::string& contents, const std::string& source, Endpoints base) {
    std::istringstream in(contents);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        size_t pos = stripped.find('=');
        if (pos == std::string::npos) {
            throw CdnsnipException(string_format("error.invalid_config_line", line_no, source));
        }
        std::string key = trim(std::string_view(stripped).substr(0, pos));
        std::string value = trim(std::string_view(stripped).substr(pos + 1));

        if (key == "registry_url") {
            base.registry_url = value;
        } else if (key == "data_url") {
            base.data_url = value;
        } else if (key == "cdn_url") {
            base.cdn_url = value;
        } else if (key == "timeout_ms") {
            base.timeout_ms = parse_timeout_ms(value);
        } else {
            log_warning(string_format("warning.unknown_config_key", key, source));
        }
    }
    return base;
}

void apply_endpoint_env_overrides(Endpoints& endpoints) {
    if (const char* v = getenv("CDNSNIP_REGISTRY_URL"); v && *v) endpoints.registry_url = v;
    if (const char* v = getenv("CDNSNIP_DATA_URL"); v && *v) endpoints.data_url = v;
    if (const char* v = getenv("CDNSNIP_CDN_URL"); v && *v) endpoints.cdn_url = v;
}

void validate_endpoints(Endpoints& endpoints) {
    auto check = [](std::string& url, const char* name) {
        url = trim_trailing_slashes(trim(url));
        if (url.empty()) {
            throw CdnsnipException(string_format("error.empty_endpoint", name));
        }
    };
    check(endpoints.registry_url, "registry_url");
    check(endpoints.data_url, "data_url");
    check(endpoints.cdn_url, "cdn_url");
    if (endpoints.timeout_ms <= 0) {
        throw CdnsnipException(string_format("error.invalid_timeout", std::to_string(endpoints.timeout_ms)));
    }
}

Endpoints load_endpoints() {
    Endpoints endpoints;
    std::error_code ec;
    if (fs::is_regular_file(ENDPOINTS_CONF, ec)) {
        endpoints = parse_endpoints(read_file(ENDPOINTS_CONF), ENDPOINTS_CONF.string(), endpoints);
    }
    apply_endpoint_env_overrides(endpoints);
    validate_endpoints(endpoints);
    return endpoints;
}
