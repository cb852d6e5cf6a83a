#pragma once

#include "cancellation.hpp"
#include "exception.hpp"
#include "package.hpp"
#include "resolver.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct BatchOptions {
    size_t jobs = 4;
    bool fail_fast = false; // cancel outstanding work after the first failure
    bool verify = false;    // download each asset and check its integrity
};

struct ResolveOutcome {
    PackageSpec spec;
    std::optional<ResolvedPackage> resolved;
    std::optional<ResolveErrorKind> error_kind; // unset for verification failures
    std::string error;

    bool ok() const { return resolved.has_value(); }
};

// Resolves every package spec on a pool of `jobs` workers. Outcomes keep the input order;
// with fail_fast, specs never started are left out of the result.
std::vector<ResolveOutcome> resolve_all(const Resolver& resolver, const std::vector<PackageSpec>& specs,
                                        const BatchOptions& options, CancellationSource& cancellation);

// Downloads resolved.src and compares its SHA-256 digest with resolved.integrity.
// Throws CdnsnipException on a download failure or a mismatch.
void verify_resolved_package(const Resolver& resolver, const ResolvedPackage& resolved,
                             const CancellationToken& token);
