#include "path_sanitizer.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <filesystem>

std::string sanitize_file_path(const std::string& file) {
    std::string trimmed = trim(file);
    if (trimmed.empty()) {
        throw ResolveError(ResolveErrorKind::EmptyPath, get_string("error.empty_path"), "", "", file);
    }

    std::string cleaned = std::filesystem::path("/" + trimmed).lexically_normal().generic_string();
    while (cleaned.size() > 1 && cleaned.back() == '/') {
        cleaned.pop_back();
    }

    if (cleaned == "/") {
        throw ResolveError(ResolveErrorKind::PathResolvesToRoot,
                           string_format("error.path_resolves_to_root", file), "", "", file);
    }
    return cleaned;
}
