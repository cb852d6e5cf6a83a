#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include "../src/cancellation.hpp"
#include "../src/exception.hpp"
#include "../src/resolver.hpp"

#include <future>
#include <thread>
#include <vector>

class ResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport;
    std::unique_ptr<Resolver> resolver;

    void SetUp() override {
        transport = std::make_shared<FakeTransport>();
        resolver = std::make_unique<Resolver>(RegistryClient(transport, test_endpoints()));
    }

    void serve_package(const std::string& pkg, const std::string& version, const nlohmann::json& assets,
                       const std::vector<std::pair<std::string, std::string>>& files) {
        transport->route(TEST_REGISTRY_URL + "/" + pkg, 200, metadata_body(version, assets));
        transport->route(TEST_DATA_URL + "/" + pkg + "@" + version + "/flat", 200, listing_body(files));
    }

    ResolveErrorKind resolve_error_kind(const PackageSpec& spec) {
        try {
            resolver->resolve(spec);
        } catch (const ResolveError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected ResolveError for " << spec.name;
        return ResolveErrorKind::TransportError;
    }
};

TEST_F(ResolverTest, ResolvesDefaultFile) {
    serve_package("foo", "1.2.3", {{"jsdelivr", "index.js"}}, {{"/index.js", "HASH_INDEX"}});

    ResolvedPackage resolved = resolver->resolve({"snippet1", "", "foo"});

    EXPECT_EQ(resolved.spec.name, "snippet1");
    EXPECT_EQ(resolved.spec.package_name, "foo");
    EXPECT_EQ(resolved.version, "1.2.3");
    EXPECT_EQ(resolved.file, "/index.js");
    EXPECT_EQ(resolved.integrity, "sha256-HASH_INDEX");
    EXPECT_EQ(resolved.src, TEST_CDN_URL + "/foo@1.2.3/index.js");
}

TEST_F(ResolverTest, PackageNameDefaultsToName) {
    serve_package("bar", "2.0.0", {{"main", "lib/bar.js"}}, {{"/lib/bar.js", "H"}});

    ResolvedPackage resolved = resolver->resolve({"bar", "", ""});

    EXPECT_EQ(resolved.spec.package_name, "bar");
    EXPECT_EQ(resolved.src, TEST_CDN_URL + "/bar@2.0.0/lib/bar.js");
    EXPECT_EQ(transport->count(TEST_REGISTRY_URL + "/bar"), 1);
}

TEST_F(ResolverTest, ExplicitFileOverridesDefault) {
    serve_package("bar", "1.2.3", {{"jsdelivr", "index.js"}}, {{"/other.js", "HASH_OTHER"}});

    ResolvedPackage resolved = resolver->resolve({"snippet2", "/other.js", "bar"});

    EXPECT_EQ(resolved.file, "/other.js");
    EXPECT_EQ(resolved.integrity, "sha256-HASH_OTHER");
}

TEST_F(ResolverTest, ExplicitFileIsSanitized) {
    serve_package("bar", "1.0.0", {{"main", "index.js"}}, {{"/dist/bar.min.js", "H"}});

    ResolvedPackage resolved = resolver->resolve({"bar", "  dist/./extra/../bar.min.js ", ""});

    EXPECT_EQ(resolved.file, "/dist/bar.min.js");
    EXPECT_EQ(resolved.src, TEST_CDN_URL + "/bar@1.0.0/dist/bar.min.js");
}

TEST_F(ResolverTest, JsDelivrFieldWinsOverOthers) {
    serve_package("foo", "1.0.0",
                  {{"jsdelivr", "dist/cdn.js"}, {"unpkg", "dist/umd.js"}, {"module", "esm/index.js"}, {"main", "cjs/index.js"}},
                  {{"/dist/cdn.js", "A"}, {"/dist/umd.js", "B"}, {"/esm/index.js", "C"}, {"/cjs/index.js", "D"}});

    EXPECT_EQ(resolver->resolve({"foo", "", ""}).file, "/dist/cdn.js");
}

TEST_F(ResolverTest, FallsBackToUnpkgField) {
    serve_package("foo", "1.0.0", {{"unpkg", "dist/umd.js"}, {"module", "esm/index.js"}, {"main", "cjs/index.js"}},
                  {{"/dist/umd.js", "B"}, {"/esm/index.js", "C"}, {"/cjs/index.js", "D"}});

    EXPECT_EQ(resolver->resolve({"foo", "", ""}).file, "/dist/umd.js");
}

TEST_F(ResolverTest, FallsBackToModuleBeforeMain) {
    serve_package("foo", "1.0.0", {{"module", "esm/index.js"}, {"main", "cjs/index.js"}},
                  {{"/esm/index.js", "C"}, {"/cjs/index.js", "D"}});

    ResolvedPackage resolved = resolver->resolve({"foo", "", ""});
    EXPECT_EQ(resolved.file, "/esm/index.js");
    EXPECT_EQ(resolved.integrity, "sha256-C");
}

TEST_F(ResolverTest, FallsBackToMainField) {
    serve_package("foo", "1.0.0", {{"main", "cjs/index.js"}}, {{"/cjs/index.js", "D"}});

    EXPECT_EQ(resolver->resolve({"foo", "", ""}).file, "/cjs/index.js");
}

TEST_F(ResolverTest, EmptyFieldsAreSkipped) {
    serve_package("foo", "1.0.0", {{"jsdelivr", ""}, {"unpkg", nullptr}, {"main", "index.js"}},
                  {{"/index.js", "D"}});

    EXPECT_EQ(resolver->resolve({"foo", "", ""}).file, "/index.js");
}

TEST_F(ResolverTest, DefaultFileChainOrder) {
    VersionAssets assets;
    EXPECT_FALSE(Resolver::default_file(assets).has_value());

    assets.main = "main.js";
    EXPECT_EQ(Resolver::default_file(assets), "main.js");
    assets.module = "module.js";
    EXPECT_EQ(Resolver::default_file(assets), "module.js");
    assets.unpkg = "unpkg.js";
    EXPECT_EQ(Resolver::default_file(assets), "unpkg.js");
    assets.jsdelivr = "jsdelivr.js";
    EXPECT_EQ(Resolver::default_file(assets), "jsdelivr.js");
}

TEST_F(ResolverTest, NoDefaultFileNamesPackageAndVersion) {
    serve_package("foo", "3.1.4", nlohmann::json::object(), {{"/index.js", "H"}});

    try {
        resolver->resolve({"snippet", "", "foo"});
        FAIL() << "expected NoDefaultFile";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::NoDefaultFile);
        std::string msg = e.what();
        EXPECT_NE(msg.find("foo"), std::string::npos);
        EXPECT_NE(msg.find("3.1.4"), std::string::npos);
        EXPECT_EQ(e.package_name(), "foo");
        EXPECT_EQ(e.version(), "3.1.4");
    }
    EXPECT_EQ(transport->count(TEST_DATA_URL), 0);
}

TEST_F(ResolverTest, VersionAssetsMissing) {
    nlohmann::json meta;
    meta["dist-tags"] = {{"latest", "2.0.0"}};
    meta["versions"] = {{"1.0.0", {{"main", "index.js"}}}};
    transport->route(TEST_REGISTRY_URL + "/foo", 200, meta.dump());

    EXPECT_EQ(resolve_error_kind({"foo", "", ""}), ResolveErrorKind::VersionAssetsMissing);
}

TEST_F(ResolverTest, ExplicitFileDoesNotNeedVersionAssets) {
    nlohmann::json meta;
    meta["dist-tags"] = {{"latest", "2.0.0"}};
    transport->route(TEST_REGISTRY_URL + "/foo", 200, meta.dump());
    transport->route(TEST_DATA_URL + "/foo@2.0.0/flat", 200, listing_body({{"/a.js", "H"}}));

    EXPECT_EQ(resolver->resolve({"foo", "a.js", ""}).file, "/a.js");
}

TEST_F(ResolverTest, MissingDistTagsFailsWithoutListingRequest) {
    transport->route(TEST_REGISTRY_URL + "/foo", 200, R"({"versions": {}})");

    EXPECT_EQ(resolve_error_kind({"foo", "", ""}), ResolveErrorKind::NoLatestVersion);
    EXPECT_EQ(transport->count(TEST_DATA_URL), 0);
}

TEST_F(ResolverTest, MissingLatestTagFailsWithoutListingRequest) {
    transport->route(TEST_REGISTRY_URL + "/foo", 200, R"({"dist-tags": {"next": "2.0.0-beta.1"}})");

    EXPECT_EQ(resolve_error_kind({"foo", "", ""}), ResolveErrorKind::NoLatestVersion);
    EXPECT_EQ(transport->count(TEST_DATA_URL), 0);
}

TEST_F(ResolverTest, FileNotOnCdnNamesFileAndSnippet) {
    serve_package("bar", "1.0.0", {{"main", "index.js"}}, {{"/index.js", "H"}});

    try {
        resolver->resolve({"snippet-name", "/missing.js", "bar"});
        FAIL() << "expected FileNotOnCDN";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::FileNotOnCDN);
        std::string msg = e.what();
        EXPECT_NE(msg.find("/missing.js"), std::string::npos);
        EXPECT_NE(msg.find("snippet-name"), std::string::npos);
        EXPECT_EQ(e.file(), "/missing.js");
    }
}

TEST_F(ResolverTest, InvalidFilePathKeepsSanitizerKind) {
    serve_package("bar", "1.0.0", {{"main", "index.js"}}, {{"/index.js", "H"}});

    EXPECT_EQ(resolve_error_kind({"bar", "   ", ""}), ResolveErrorKind::EmptyPath);
    EXPECT_EQ(resolve_error_kind({"bar", "a/..", ""}), ResolveErrorKind::PathResolvesToRoot);
    EXPECT_EQ(transport->count(TEST_DATA_URL), 0);
}

TEST_F(ResolverTest, DefaultFieldResolvingToRootFails) {
    serve_package("bar", "1.0.0", {{"main", "./"}}, {{"/index.js", "H"}});

    EXPECT_EQ(resolve_error_kind({"bar", "", ""}), ResolveErrorKind::PathResolvesToRoot);
}

TEST_F(ResolverTest, MetadataNotFoundReportsStatus) {
    transport->route(TEST_REGISTRY_URL, 404, "");

    try {
        resolver->resolve({"snippet404", "", "typo"});
        FAIL() << "expected MetadataUnavailable";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::MetadataUnavailable);
        EXPECT_EQ(e.http_status(), 404);
        EXPECT_NE(std::string(e.what()).find("404"), std::string::npos);
        EXPECT_EQ(e.package_name(), "typo");
    }
    EXPECT_EQ(transport->count(TEST_DATA_URL), 0);
}

TEST_F(ResolverTest, MetadataErrorIncludesReasonPhrase) {
    transport->route(TEST_REGISTRY_URL, 404, "", "Not Found");

    try {
        resolver->resolve({"typo", "", ""});
        FAIL() << "expected MetadataUnavailable";
    } catch (const ResolveError& e) {
        EXPECT_EQ(std::string(e.what()), "can't get latest version of package typo from npm: HTTP 404 Not Found");
        EXPECT_EQ(e.http_status(), 404);
    }
}

TEST_F(ResolverTest, ListingErrorStatus) {
    transport->route(TEST_REGISTRY_URL + "/foo", 200, metadata_body("1.0.0", {{"main", "index.js"}}));
    transport->route(TEST_DATA_URL, 503, "");

    try {
        resolver->resolve({"foo", "", ""});
        FAIL() << "expected ListingUnavailable";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::ListingUnavailable);
        EXPECT_EQ(e.http_status(), 503);
        EXPECT_EQ(e.version(), "1.0.0");
        EXPECT_NE(std::string(e.what()).find("503"), std::string::npos);
    }
}

TEST_F(ResolverTest, TransportFailureIsTransportError) {
    // No routes: the fake transport fails every request like an unreachable host.
    try {
        resolver->resolve({"foo", "", ""});
        FAIL() << "expected TransportError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::TransportError);
        EXPECT_FALSE(e.cancelled());
    }
}

TEST_F(ResolverTest, MalformedMetadata) {
    transport->route(TEST_REGISTRY_URL + "/foo", 200, "<html>not json</html>");

    EXPECT_EQ(resolve_error_kind({"foo", "", ""}), ResolveErrorKind::MalformedResponse);
}

TEST_F(ResolverTest, CachesMetadataAndListing) {
    serve_package("foo", "1.0.0", {{"jsdelivr", "index.js"}}, {{"/index.js", "HASH_INDEX"}});

    PackageSpec spec{"snippet", "", "foo"};
    ResolvedPackage first = resolver->resolve(spec);
    ResolvedPackage second = resolver->resolve(spec);

    EXPECT_EQ(transport->count(TEST_REGISTRY_URL), 1);
    EXPECT_EQ(transport->count(TEST_DATA_URL), 1);
    EXPECT_EQ(first.src, second.src);
    EXPECT_EQ(first.integrity, second.integrity);
    EXPECT_EQ(resolver->cache().metadata_size(), 1u);
    EXPECT_EQ(resolver->cache().listing_size(), 1u);
}

TEST_F(ResolverTest, SpecsSharingPackageShareCacheEntries) {
    serve_package("foo", "1.0.0", {{"jsdelivr", "index.js"}}, {{"/index.js", "A"}, {"/extra.js", "B"}});

    resolver->resolve({"first", "", "foo"});
    ResolvedPackage extra = resolver->resolve({"second", "extra.js", "foo"});

    EXPECT_EQ(extra.integrity, "sha256-B");
    EXPECT_EQ(transport->count(TEST_REGISTRY_URL), 1);
    EXPECT_EQ(transport->count(TEST_DATA_URL), 1);
}

TEST_F(ResolverTest, FailedFetchIsNotCached) {
    transport->route(TEST_REGISTRY_URL + "/foo", 500, "");
    EXPECT_EQ(resolve_error_kind({"foo", "", ""}), ResolveErrorKind::MetadataUnavailable);

    serve_package("foo", "1.0.0", {{"main", "index.js"}}, {{"/index.js", "H"}});
    EXPECT_NO_THROW(resolver->resolve({"foo", "", ""}));

    EXPECT_EQ(transport->count(TEST_REGISTRY_URL), 2);
    EXPECT_EQ(resolver->cache().metadata_size(), 1u);
}

TEST_F(ResolverTest, CancelledTokenIssuesNoRequest) {
    serve_package("foo", "1.0.0", {{"main", "index.js"}}, {{"/index.js", "H"}});
    CancellationSource source;
    source.cancel();

    try {
        resolver->resolve({"snippet", "", "foo"}, source.token());
        FAIL() << "expected cancellation";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::TransportError);
        EXPECT_TRUE(e.cancelled());
    }
    EXPECT_EQ(transport->total(), 0);
}

TEST_F(ResolverTest, CancellationBeforeListingRequest) {
    serve_package("foo", "1.0.0", {{"main", "index.js"}}, {{"/index.js", "H"}});
    CancellationSource source;
    transport->on_request([&](const std::string& url) {
        if (url.rfind(TEST_REGISTRY_URL, 0) == 0) source.cancel();
    });

    try {
        resolver->resolve({"foo", "", ""}, source.token());
        FAIL() << "expected cancellation";
    } catch (const ResolveError& e) {
        EXPECT_TRUE(e.cancelled());
    }
    EXPECT_EQ(transport->count(TEST_DATA_URL), 0);
}

TEST_F(ResolverTest, CachedPackageResolvesWithCancelledToken) {
    serve_package("foo", "1.0.0", {{"main", "index.js"}}, {{"/index.js", "H"}});
    resolver->resolve({"foo", "", ""});

    CancellationSource source;
    source.cancel();
    EXPECT_NO_THROW(resolver->resolve({"foo", "", ""}, source.token()));
    EXPECT_EQ(transport->total(), 2);
}

TEST_F(ResolverTest, ConcurrentResolutionsOfDifferentPackages) {
    const int num_packages = 8;
    for (int i = 0; i < num_packages; ++i) {
        std::string pkg = "pkg" + std::to_string(i);
        serve_package(pkg, "1.0." + std::to_string(i), {{"main", "index.js"}}, {{"/index.js", "H" + std::to_string(i)}});
    }
    transport->set_delay(std::chrono::milliseconds(5));

    std::vector<std::future<ResolvedPackage>> futures;
    for (int i = 0; i < num_packages; ++i) {
        futures.push_back(std::async(std::launch::async, [this, i] {
            return resolver->resolve({"pkg" + std::to_string(i), "", ""});
        }));
    }

    for (int i = 0; i < num_packages; ++i) {
        ResolvedPackage resolved = futures[i].get();
        EXPECT_EQ(resolved.version, "1.0." + std::to_string(i));
        EXPECT_EQ(resolved.integrity, "sha256-H" + std::to_string(i));
    }
    EXPECT_EQ(resolver->cache().metadata_size(), static_cast<size_t>(num_packages));
    EXPECT_EQ(resolver->cache().listing_size(), static_cast<size_t>(num_packages));
}

TEST_F(ResolverTest, ConcurrentResolutionsOfSamePackageAgree) {
    serve_package("foo", "1.0.0", {{"main", "index.js"}}, {{"/index.js", "H"}});
    transport->set_delay(std::chrono::milliseconds(5));

    std::vector<std::future<ResolvedPackage>> futures;
    for (int i = 0; i < 6; ++i) {
        futures.push_back(std::async(std::launch::async, [this] { return resolver->resolve({"foo", "", ""}); }));
    }
    for (auto& fut : futures) {
        EXPECT_EQ(fut.get().src, TEST_CDN_URL + "/foo@1.0.0/index.js");
    }

    // Duplicate first fetches are tolerated, but never more than one per caller.
    EXPECT_GE(transport->count(TEST_REGISTRY_URL), 1);
    EXPECT_LE(transport->count(TEST_REGISTRY_URL), 6);
    EXPECT_EQ(resolver->cache().metadata_size(), 1u);
}

TEST_F(ResolverTest, CdnUrlTrailingSlashIsTrimmed) {
    Endpoints endpoints = test_endpoints();
    endpoints.cdn_url = TEST_CDN_URL + "/";
    endpoints.registry_url = TEST_REGISTRY_URL + "//";
    Resolver trimmed(RegistryClient(transport, endpoints));
    serve_package("foo", "1.0.0", {{"main", "index.js"}}, {{"/index.js", "H"}});

    EXPECT_EQ(trimmed.resolve({"foo", "", ""}).src, TEST_CDN_URL + "/foo@1.0.0/index.js");
    EXPECT_EQ(transport->requests().front(), TEST_REGISTRY_URL + "/foo");
}

TEST_F(ResolverTest, ScopedPackageName) {
    serve_package("@scope/widget", "0.9.0", {{"jsdelivr", "dist/widget.umd.js"}}, {{"/dist/widget.umd.js", "W"}});

    ResolvedPackage resolved = resolver->resolve({"widget", "", "@scope/widget"});

    EXPECT_EQ(resolved.src, TEST_CDN_URL + "/@scope/widget@0.9.0/dist/widget.umd.js");
}
