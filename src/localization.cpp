#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace {
    // Built-in English catalog. Files in L10N_DIR override individual keys.
    const std::unordered_map<std::string, std::string> default_strings = {
        {"info.log_prefix", "==> "},
        {"debug.prefix", "--> "},
        {"warning.prefix", "Warning:"},
        {"error.prefix", "Error:"},

        {"info.usage", "Usage: cdnsnip [options] [names...]"},
        {"info.resolved", "Resolved `%s` (%s) version %s"},
        {"info.verified", "Verified integrity of %s"},
        {"info.dry_run_request", "Would request %s"},
        {"info.resolve_summary", "Resolved %d of %d packages"},

        {"label.data_file", "data file"},

        {"help.data", "JSON data file with package specs"},
        {"help.file", "File to include for the single package given on the command line"},
        {"help.pkg", "Registry package name for the single package given on the command line"},
        {"help.registry_url", "Base URL of the package metadata registry"},
        {"help.data_url", "Base URL of the CDN file listing API"},
        {"help.cdn_url", "Base URL used to build asset links"},
        {"help.timeout_ms", "Per-request timeout in milliseconds"},
        {"help.config_dir", "Directory containing endpoints.conf"},
        {"help.jobs", "Number of packages resolved in parallel"},
        {"help.json", "Print resolved packages as JSON"},
        {"help.verify", "Download each asset and check it against its integrity hash"},
        {"help.fail_fast", "Stop at the first package that fails to resolve"},
        {"help.dry_run", "Print the requests that would be made without sending them"},
        {"help.verbose", "Print debug output"},
        {"help.quiet", "Only print errors and results"},
        {"help.help", "Show this help"},

        {"debug.cache_hit_metadata", "Metadata cache hit for %s"},
        {"debug.cache_hit_listing", "File listing cache hit for %s@%s"},
        {"debug.http_get", "GET %s"},
        {"debug.endpoints", "Endpoints: registry=%s data=%s cdn=%s timeout=%ldms"},

        {"warning.unknown_config_key", "Ignoring unknown key '%s' in %s"},

        {"error.transport_failed", "request to %s failed: %s"},
        {"error.request_cancelled", "request to %s was cancelled"},
        {"error.resolve_cancelled", "resolution of package %s was cancelled"},
        {"error.metadata_unavailable", "can't get latest version of package %s from npm: HTTP %s"},
        {"error.listing_unavailable", "request to %s failed with status HTTP %s"},
        {"error.malformed_response", "invalid response from %s: %s"},
        {"error.no_dist_tags", "no dist-tags found for package %s"},
        {"error.no_latest_version", "no latest dist-tag found for package %s"},
        {"error.version_assets_missing", "no pkg information found for %s version %s"},
        {"error.no_default_file", "no default file import found for %s version %s. Add it explicitly to the CDN data file"},
        {"error.empty_path", "file path is empty"},
        {"error.path_resolves_to_root", "file path \"%s\" resolves to root"},
        {"error.invalid_file_path", "invalid file for package %s: %s"},
        {"error.file_not_on_cdn", "file %s for snippet %s not found on CDN"},
        {"error.curl_init_failed", "failed to initialize curl for %s"},
        {"error.integrity_mismatch", "integrity mismatch for %s: expected %s, got %s"},
        {"error.asset_download_failed", "download of %s failed: HTTP %s"},
        {"error.openssl_ctx_failed", "failed to create OpenSSL digest context"},
        {"error.openssl_init_failed", "failed to initialize SHA-256 digest"},
        {"error.openssl_update_failed", "failed to update SHA-256 digest"},
        {"error.openssl_final_failed", "failed to finalize SHA-256 digest"},
        {"error.open_file_failed", "failed to open file %s"},
        {"error.required", "%s is required"},
        {"error.not_found", "%s \"%s\" not found"},
        {"error.is_directory", "%s \"%s\" is a directory"},
        {"error.invalid_config_line", "invalid line %d in %s"},
        {"error.empty_endpoint", "endpoint %s must not be empty"},
        {"error.invalid_timeout", "invalid timeout '%s'"},
        {"error.data_file_parse", "failed to parse data file %s: %s"},
        {"error.data_file_not_array", "data file %s must contain a JSON array"},
        {"error.data_entry_invalid", "entry %d in data file %s has no name"},
        {"error.verbose_quiet_conflict", "cannot use --verbose and --quiet together"},
        {"error.no_packages", "no packages given, pass names or --data"},
        {"error.single_package_options", "--file and --pkg require exactly one package name"},
        {"error.invalid_jobs", "--jobs must be at least 1"},
        {"error.resolve_package_failed", "resolve package %s: %s"},
        {"error.resolve_failed_count", "%d of %d packages failed to resolve"},
        {"error.cmd_parse_error", "failed to parse command line: %s"},
        {"error.unexpected_error", "unexpected error: %s"},
    };

    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;
}

void load_strings(const std::string& lang) {
    std::filesystem::path file_path = L10N_DIR / (lang + ".txt");
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            translations[key] = value;
        }
    }
}

void init_localization() {
    translations = default_strings;

    const char* lang_env = getenv("LANG");
    if (lang_env && *lang_env) {
        std::string lang(lang_env);
        lang = lang.substr(0, lang.find_first_of("_.@"));
        if (!lang.empty() && lang != "C" && lang != "POSIX") {
            load_strings(lang);
        }
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto def = default_strings.find(key);
    if (def != default_strings.end()) {
        return def->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
