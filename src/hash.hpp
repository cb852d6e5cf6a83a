#pragma once

#include <string>
#include <string_view>

// Raw SHA-256 digest (32 bytes) of data.
// Throws CdnsnipException if the OpenSSL digest cannot be computed.
std::string calculate_sha256(std::string_view data);

std::string base64_encode(std::string_view data);

// Subresource-integrity string: "sha256-" followed by the base64 digest.
std::string sha256_integrity(std::string_view data);

bool verify_integrity(std::string_view data, const std::string& integrity);
