#pragma once

#include "batch.hpp"
#include "cancellation.hpp"
#include "package.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Package selection given on the command line
struct CliPackageArgs {
    std::vector<std::string> names;
    std::optional<std::string> file; // --file, single name only
    std::optional<std::string> pkg;  // --pkg, single name only
};

// Data file specs first, then one spec per positional name.
// Throws CdnsnipException when --file/--pkg are used without exactly one name, or when nothing is left to resolve.
std::vector<PackageSpec> collect_specs(std::vector<PackageSpec> data_specs, const CliPackageArgs& args);

nlohmann::json outcome_to_json(const ResolveOutcome& outcome);

// name <TAB> pkg@version <TAB> src <TAB> integrity
std::string format_resolved_line(const ResolvedPackage& resolved);

// Failed outcomes plus specs that never ran because fail-fast stopped the batch.
int count_unresolved(const std::vector<ResolveOutcome>& outcomes, size_t total);

// SIGINT cancels `source` from now on; nullptr restores the default disposition.
void set_interrupt_target(CancellationSource* source);
