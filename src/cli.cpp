#include "cli.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <atomic>
#include <csignal>

namespace {
    std::atomic<CancellationSource*> interrupt_target{nullptr};
    static_assert(std::atomic<CancellationSource*>::is_always_lock_free);

    void handle_interrupt(int) {
        if (CancellationSource* source = interrupt_target.load()) source->cancel();
    }
}

std::vector<PackageSpec> collect_specs(std::vector<PackageSpec> data_specs, const CliPackageArgs& args) {
    bool single_options = args.file.has_value() || args.pkg.has_value();
    if (single_options && args.names.size() != 1) {
        throw CdnsnipException(get_string("error.single_package_options"));
    }

    std::vector<PackageSpec> specs = std::move(data_specs);
    for (const auto& name : args.names) {
        PackageSpec spec;
        spec.name = name;
        if (args.file) spec.file = *args.file;
        if (args.pkg) spec.package_name = *args.pkg;
        specs.push_back(std::move(spec));
    }

    if (specs.empty()) {
        throw CdnsnipException(get_string("error.no_packages"));
    }
    return specs;
}

nlohmann::json outcome_to_json(const ResolveOutcome& outcome) {
    nlohmann::json j;
    j["name"] = outcome.spec.name;
    if (outcome.ok()) {
        const auto& r = *outcome.resolved;
        j["pkg"] = r.spec.package_name;
        j["version"] = r.version;
        j["file"] = r.file;
        j["integrity"] = r.integrity;
        j["src"] = r.src;
    } else {
        j["error"] = outcome.error;
        j["kind"] = outcome.error_kind ? to_string(*outcome.error_kind) : "verification_failed";
    }
    return j;
}

std::string format_resolved_line(const ResolvedPackage& resolved) {
    return resolved.spec.name + '\t' + resolved.spec.package_name + '@' + resolved.version + '\t' + resolved.src +
           '\t' + resolved.integrity;
}

int count_unresolved(const std::vector<ResolveOutcome>& outcomes, size_t total) {
    int failed = 0;
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) ++failed;
    }
    size_t skipped = total > outcomes.size() ? total - outcomes.size() : 0;
    return failed + static_cast<int>(skipped);
}

void set_interrupt_target(CancellationSource* source) {
    interrupt_target.store(source);
    std::signal(SIGINT, source ? handle_interrupt : SIG_DFL);
}
