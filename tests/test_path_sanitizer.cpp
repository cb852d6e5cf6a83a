#include <gtest/gtest.h>
#include "../src/exception.hpp"
#include "../src/path_sanitizer.hpp"

namespace {
    ResolveErrorKind sanitize_error(const std::string& input) {
        try {
            sanitize_file_path(input);
        } catch (const ResolveError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected ResolveError for \"" << input << "\"";
        return ResolveErrorKind::TransportError;
    }
}

TEST(PathSanitizerTest, AddsLeadingSeparator) {
    EXPECT_EQ(sanitize_file_path("foo.js"), "/foo.js");
    EXPECT_EQ(sanitize_file_path("/foo.js"), "/foo.js");
    EXPECT_EQ(sanitize_file_path("dist/foo.min.js"), "/dist/foo.min.js");
}

TEST(PathSanitizerTest, TrimsWhitespace) {
    EXPECT_EQ(sanitize_file_path("  foo.js\t"), "/foo.js");
    EXPECT_EQ(sanitize_file_path("\n/dist/a.css "), "/dist/a.css");
}

TEST(PathSanitizerTest, CollapsesDotSegmentsAndSeparators) {
    EXPECT_EQ(sanitize_file_path("./dist/./foo.js"), "/dist/foo.js");
    EXPECT_EQ(sanitize_file_path("/dist//a/./b/../c.js"), "/dist/a/c.js");
    EXPECT_EQ(sanitize_file_path("dist///foo.js"), "/dist/foo.js");
    EXPECT_EQ(sanitize_file_path("dist/"), "/dist");
}

TEST(PathSanitizerTest, ParentSegmentsCannotEscapeRoot) {
    EXPECT_EQ(sanitize_file_path("../../etc/passwd"), "/etc/passwd");
    EXPECT_EQ(sanitize_file_path("/a/../../b.js"), "/b.js");
}

TEST(PathSanitizerTest, EmptyPath) {
    EXPECT_EQ(sanitize_error(""), ResolveErrorKind::EmptyPath);
    EXPECT_EQ(sanitize_error("   "), ResolveErrorKind::EmptyPath);
    EXPECT_EQ(sanitize_error("\t\n"), ResolveErrorKind::EmptyPath);
}

TEST(PathSanitizerTest, ResolvesToRoot) {
    EXPECT_EQ(sanitize_error("/"), ResolveErrorKind::PathResolvesToRoot);
    EXPECT_EQ(sanitize_error(".."), ResolveErrorKind::PathResolvesToRoot);
    EXPECT_EQ(sanitize_error("."), ResolveErrorKind::PathResolvesToRoot);
    EXPECT_EQ(sanitize_error("a/.."), ResolveErrorKind::PathResolvesToRoot);
    EXPECT_EQ(sanitize_error("./"), ResolveErrorKind::PathResolvesToRoot);
}

TEST(PathSanitizerTest, RootErrorQuotesInput) {
    try {
        sanitize_file_path("dist/..");
        FAIL() << "expected PathResolvesToRoot";
    } catch (const ResolveError& e) {
        EXPECT_NE(std::string(e.what()).find("dist/.."), std::string::npos);
        EXPECT_EQ(e.file(), "dist/..");
    }
}
