#include "batch.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <future>

void verify_resolved_package(const Resolver& resolver, const ResolvedPackage& resolved,
                             const CancellationToken& token) {
    HttpResponse res;
    try {
        res = resolver.client().transport().get(resolved.src, token);
    } catch (const TransportException& e) {
        throw CdnsnipException(e.what());
    }
    if (!res.ok()) {
        throw CdnsnipException(string_format("error.asset_download_failed", resolved.src, res.status()));
    }
    if (!verify_integrity(res.body, resolved.integrity)) {
        throw CdnsnipException(string_format("error.integrity_mismatch", resolved.src, resolved.integrity,
                                             sha256_integrity(res.body)));
    }
    log_debug(string_format("info.verified", resolved.src));
}

std::vector<ResolveOutcome> resolve_all(const Resolver& resolver, const std::vector<PackageSpec>& specs,
                                        const BatchOptions& options, CancellationSource& cancellation) {
    std::vector<std::optional<ResolveOutcome>> slots(specs.size());
    std::atomic<size_t> next{0};
    const CancellationToken token = cancellation.token();

    auto worker = [&]() {
        while (true) {
            if (options.fail_fast && cancellation.is_cancelled()) return;
            size_t i = next.fetch_add(1);
            if (i >= specs.size()) return;

            ResolveOutcome outcome;
            outcome.spec = specs[i];
            try {
                ResolvedPackage resolved = resolver.resolve(specs[i], token);
                if (options.verify) {
                    verify_resolved_package(resolver, resolved, token);
                }
                log_info(string_format("info.resolved", resolved.spec.name, resolved.spec.package_name,
                                       resolved.version));
                outcome.resolved = std::move(resolved);
            } catch (const ResolveError& e) {
                outcome.error_kind = e.kind();
                outcome.error = string_format("error.resolve_package_failed", specs[i].name, e.what());
            } catch (const CdnsnipException& e) {
                outcome.error = string_format("error.resolve_package_failed", specs[i].name, e.what());
            }

            if (!outcome.ok() && options.fail_fast) {
                cancellation.cancel();
            }
            slots[i] = std::move(outcome);
        }
    };

    size_t workers = std::clamp<size_t>(options.jobs, 1, std::max<size_t>(specs.size(), 1));
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    for (auto& fut : futures) {
        fut.get();
    }

    std::vector<ResolveOutcome> outcomes;
    for (auto& slot : slots) {
        if (slot) outcomes.push_back(std::move(*slot));
    }
    return outcomes;
}
