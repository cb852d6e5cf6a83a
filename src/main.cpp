#include "batch.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "data_file.hpp"
#include "exception.hpp"
#include "http_client.hpp"
#include "localization.hpp"
#include "resolver.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
    void print_usage(const cxxopts::Options& options) {
        std::cerr << options.help() << std::endl;
    }

    std::vector<PackageSpec> specs_from_args(const cxxopts::ParseResult& result) {
        std::vector<PackageSpec> data_specs;
        if (result.count("data")) {
            data_specs = read_data_file(result["data"].as<std::string>());
        }

        CliPackageArgs args;
        if (result.count("names")) args.names = result["names"].as<std::vector<std::string>>();
        if (result.count("file")) args.file = result["file"].as<std::string>();
        if (result.count("pkg")) args.pkg = result["pkg"].as<std::string>();
        return collect_specs(std::move(data_specs), args);
    }
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("d,data", get_string("help.data"), cxxopts::value<std::string>())
            ("f,file", get_string("help.file"), cxxopts::value<std::string>())
            ("p,pkg", get_string("help.pkg"), cxxopts::value<std::string>())
            ("registry-url", get_string("help.registry_url"), cxxopts::value<std::string>())
            ("data-url", get_string("help.data_url"), cxxopts::value<std::string>())
            ("cdn-url", get_string("help.cdn_url"), cxxopts::value<std::string>())
            ("timeout-ms", get_string("help.timeout_ms"), cxxopts::value<std::string>())
            ("config-dir", get_string("help.config_dir"), cxxopts::value<std::string>())
            ("j,jobs", get_string("help.jobs"), cxxopts::value<int>()->default_value("4"))
            ("json", get_string("help.json"), cxxopts::value<bool>()->default_value("false"))
            ("verify", get_string("help.verify"), cxxopts::value<bool>()->default_value("false"))
            ("fail-fast", get_string("help.fail_fast"), cxxopts::value<bool>()->default_value("false"))
            ("dry-run", get_string("help.dry_run"), cxxopts::value<bool>()->default_value("false"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("names", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"names"});
        options.positional_help("[names...]");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        bool verbose = result["verbose"].as<bool>();
        bool quiet = result["quiet"].as<bool>();
        if (verbose && quiet) {
            throw CdnsnipException(get_string("error.verbose_quiet_conflict"));
        }
        bool json_output = result["json"].as<bool>();
        set_verbose_mode(verbose);
        set_quiet_mode(quiet || json_output);
        set_dry_run_mode(result["dry-run"].as<bool>());

        int jobs = result["jobs"].as<int>();
        if (jobs < 1) {
            throw CdnsnipException(get_string("error.invalid_jobs"));
        }

        if (result.count("config-dir")) {
            set_config_dir(result["config-dir"].as<std::string>());
        }

        Endpoints endpoints = load_endpoints();
        if (result.count("registry-url")) endpoints.registry_url = result["registry-url"].as<std::string>();
        if (result.count("data-url")) endpoints.data_url = result["data-url"].as<std::string>();
        if (result.count("cdn-url")) endpoints.cdn_url = result["cdn-url"].as<std::string>();
        if (result.count("timeout-ms")) endpoints.timeout_ms = parse_timeout_ms(result["timeout-ms"].as<std::string>());
        validate_endpoints(endpoints);
        log_debug(string_format("debug.endpoints", endpoints.registry_url, endpoints.data_url, endpoints.cdn_url,
                                endpoints.timeout_ms));

        std::vector<PackageSpec> specs = specs_from_args(result);

        auto transport = std::make_shared<CurlTransport>(endpoints.timeout_ms);
        Resolver resolver(RegistryClient(transport, endpoints));

        if (get_dry_run_mode()) {
            for (const auto& spec : specs) {
                const std::string& pkg = spec.package_name.empty() ? spec.name : spec.package_name;
                std::cout << string_format("info.dry_run_request", resolver.client().metadata_url(pkg)) << std::endl;
            }
            return 0;
        }

        CancellationSource cancellation;
        set_interrupt_target(&cancellation);

        BatchOptions batch;
        batch.jobs = static_cast<size_t>(jobs);
        batch.fail_fast = result["fail-fast"].as<bool>();
        batch.verify = result["verify"].as<bool>();

        std::vector<ResolveOutcome> outcomes = resolve_all(resolver, specs, batch, cancellation);
        set_interrupt_target(nullptr);

        nlohmann::json out = nlohmann::json::array();
        for (const auto& outcome : outcomes) {
            if (!outcome.ok()) {
                log_error(outcome.error);
            }
            if (json_output) {
                out.push_back(outcome_to_json(outcome));
            } else if (outcome.ok()) {
                std::cout << format_resolved_line(*outcome.resolved) << std::endl;
            }
        }
        if (json_output) {
            std::cout << out.dump(2) << std::endl;
        }

        int total = static_cast<int>(specs.size());
        int unresolved = count_unresolved(outcomes, specs.size());
        if (unresolved > 0) {
            log_error(string_format("error.resolve_failed_count", unresolved, total));
            return 1;
        }
        log_info(string_format("info.resolve_summary", total, total));
        return 0;

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const CdnsnipException& e) {
        log_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }
}
