#include "data_file.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

namespace {
    std::string optional_string(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
        return "";
    }
}

std::vector<PackageSpec> parse_package_specs(const std::string& contents, const std::string& source) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(contents);
    } catch (const nlohmann::json::parse_error& e) {
        throw CdnsnipException(string_format("error.data_file_parse", source, e.what()));
    }
    if (!j.is_array()) {
        throw CdnsnipException(string_format("error.data_file_not_array", source));
    }

    std::vector<PackageSpec> specs;
    specs.reserve(j.size());
    int index = 0;
    for (const auto& entry : j) {
        PackageSpec spec;
        if (entry.is_object()) {
            spec.name = trim(optional_string(entry, "name"));
            spec.file = optional_string(entry, "file");
            spec.package_name = trim(optional_string(entry, "pkg"));
        }
        if (spec.name.empty()) {
            throw CdnsnipException(string_format("error.data_entry_invalid", index, source));
        }
        specs.push_back(std::move(spec));
        ++index;
    }
    return specs;
}

std::vector<PackageSpec> read_data_file(const std::filesystem::path& path) {
    ensure_existing_file(path, get_string("label.data_file"));
    return parse_package_specs(read_file(path), path.string());
}
