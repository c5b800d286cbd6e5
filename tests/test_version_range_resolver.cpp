#include "esa/version_range_resolver.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace esa {
namespace {

RawRequirement Source(const std::string& id, const std::string& filter) {
    return RawRequirement{id, testutil::EeRequirement(filter)};
}

std::vector<std::string> Labels(const std::vector<CandidateEnvironment>& envs) {
    std::vector<std::string> out;
    for (const auto& e : envs)
        out.push_back(e.label);
    return out;
}

ResolutionResult ResolveOk(const std::vector<RawRequirement>& reqs) {
    auto r = VersionRangeResolver().Resolve(reqs);
    EXPECT_TRUE(r.has_value()) << (r ? "" : r.error());
    return r.value_or(ResolutionResult{});
}

const std::string kFilter17To111 = "(&(osgi.ee=JavaSE)(version>=1.7)(version<=1.11))";
const std::string kFilter19To111 = "(&(osgi.ee=JavaSE)(version>=1.9)(version<=1.11))";

TEST(JavaExecutionEnvironmentsTest, FixedTableInAscendingOrder) {
    const auto& envs = JavaExecutionEnvironments();
    ASSERT_EQ(envs.size(), 6u);
    EXPECT_EQ(Labels(envs),
              (std::vector<std::string>{"Java 6", "Java 7", "Java 8", "Java 9", "Java 10", "Java 11"}));
    EXPECT_EQ(envs.front().range.ToString(), "[1.2,1.6]");
    EXPECT_EQ(envs.back().range.ToString(), "[1.2,1.11]");
    EXPECT_EQ(&envs, &JavaExecutionEnvironments());
}

TEST(VersionRangeResolverTest, NoRequirementsKeepsEveryCandidate) {
    const auto r = ResolveOk({});
    EXPECT_FALSE(r.IsConflict());
    EXPECT_EQ(r.surviving.size(), 6u);
    EXPECT_EQ(r.MinimumVersion(), "1.6");
    EXPECT_TRUE(r.diagnostics.empty());
    EXPECT_TRUE(r.raw_directives.empty());
}

TEST(VersionRangeResolverTest, SingleSourceEliminatesDisjointCandidates) {
    const auto r = ResolveOk({Source("a.jar", kFilter17To111)});
    EXPECT_EQ(Labels(r.surviving),
              (std::vector<std::string>{"Java 7", "Java 8", "Java 9", "Java 10", "Java 11"}));
    EXPECT_EQ(r.MinimumVersion(), "1.7");

    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].Describe(),
              "Manifest from a.jar with range [1.7,1.11] caused env for Java 6 to be removed.");
    ASSERT_EQ(r.raw_directives.size(), 1u);
    EXPECT_EQ(r.raw_directives.at("a.jar"), kFilter17To111);
}

TEST(VersionRangeResolverTest, SecondSourceNarrowsFurther) {
    const auto r = ResolveOk({Source("a.jar", kFilter17To111), Source("b.jar", kFilter19To111)});
    EXPECT_EQ(Labels(r.surviving), (std::vector<std::string>{"Java 9", "Java 10", "Java 11"}));
    EXPECT_EQ(r.MinimumVersion(), "1.9");

    ASSERT_EQ(r.diagnostics.size(), 3u);
    EXPECT_EQ(r.diagnostics[1].source_id, "b.jar");
    EXPECT_EQ(r.diagnostics[1].eliminated_label, "Java 7");
    EXPECT_EQ(r.diagnostics[2].eliminated_label, "Java 8");
    EXPECT_EQ(r.raw_directives.size(), 2u);
}

TEST(VersionRangeResolverTest, RangeBelowEveryCandidateIsConflict) {
    const auto r = ResolveOk({Source("old.jar", "(&(osgi.ee=JavaSE)(version>=1.0)(version<=1.1))")});
    EXPECT_TRUE(r.IsConflict());
    EXPECT_EQ(r.MinimumVersion(), "");
    ASSERT_EQ(r.diagnostics.size(), 6u);
    for (const auto& d : r.diagnostics) {
        EXPECT_EQ(d.source_id, "old.jar");
        EXPECT_EQ(d.attempted.ToString(), "[1.0,1.1]");
    }
    const auto trail = r.DescribeDiagnostics();
    EXPECT_NE(trail.find("caused env for Java 6 to be removed."), std::string::npos);
    EXPECT_NE(trail.find("caused env for Java 11 to be removed."), std::string::npos);
    EXPECT_LT(trail.find("Java 6"), trail.find("Java 11"));
}

TEST(VersionRangeResolverTest, SurvivorsDoNotDependOnOrder) {
    const std::vector<RawRequirement> sources = {
        Source("a.jar", kFilter17To111),
        Source("b.jar", "(&(osgi.ee=JavaSE)(version=1.8))"),
        Source("c.jar", "(&(osgi.ee=JavaSE)(version>=1.6)(!(version>=1.10)))"),
    };
    const auto forward = ResolveOk(sources);
    const auto backward = ResolveOk({sources[2], sources[1], sources[0]});
    EXPECT_EQ(Labels(forward.surviving), Labels(backward.surviving));
    EXPECT_EQ(Labels(forward.surviving), (std::vector<std::string>{"Java 8", "Java 9", "Java 10", "Java 11"}));
    EXPECT_EQ(forward.MinimumVersion(), backward.MinimumVersion());
}

TEST(VersionRangeResolverTest, SourcesWithoutJavaSeConstraintNeverNarrow) {
    const auto baseline = ResolveOk({Source("a.jar", kFilter17To111)});
    const auto r = ResolveOk({
        Source("a.jar", kFilter17To111),
        RawRequirement{"svc.jar", "osgi.service;filter:=\"(objectClass=com.example.Svc)\""},
        RawRequirement{"nofilter.jar", "osgi.ee"},
        Source("cdc.jar", "(&(osgi.ee=CDC/Foundation)(version=1.1))"),
        Source("any.jar", "(osgi.ee=JavaSE)"),
    });
    EXPECT_EQ(Labels(r.surviving), Labels(baseline.surviving));
    EXPECT_EQ(r.MinimumVersion(), baseline.MinimumVersion());
    EXPECT_EQ(r.raw_directives.size(), 1u);
}

TEST(VersionRangeResolverTest, OnlyFirstExecutionEnvironmentClauseCounts) {
    const auto r = ResolveOk({RawRequirement{
        "a.jar",
        "osgi.ee;filter:=\"(&(osgi.ee=JavaSE)(version=1.7))\","
        "osgi.ee;filter:=\"(&(osgi.ee=JavaSE)(version=1.9))\""}});
    EXPECT_EQ(r.MinimumVersion(), "1.7");
}

TEST(VersionRangeResolverTest, LooserRepeatedFloorDoesNotWeakenStricterOne) {
    const auto r = ResolveOk({Source("a.jar", "(&(osgi.ee=JavaSE)(version>=1.9)(version>=1.7))")});
    EXPECT_EQ(Labels(r.surviving), (std::vector<std::string>{"Java 9", "Java 10", "Java 11"}));
    EXPECT_EQ(r.MinimumVersion(), "1.9");
}

TEST(VersionRangeResolverTest, NonConstrainingSourceIsLeftOutOfRawDirectives) {
    // Every candidate starts at 1.2, so a ceiling alone removes nothing.
    const auto r = ResolveOk({Source("a.jar", "(&(osgi.ee=JavaSE)(version>=1.6)(!(version>=1.10)))")});
    EXPECT_EQ(r.surviving.size(), 6u);
    EXPECT_TRUE(r.raw_directives.empty());
}

TEST(VersionRangeResolverTest, MalformedInputFails) {
    const VersionRangeResolver resolver;
    const auto bad_header = resolver.Resolve({RawRequirement{"a.jar", "osgi.ee;filter:=\"(unterminated"}});
    ASSERT_FALSE(bad_header.has_value());
    EXPECT_NE(bad_header.error().find("a.jar"), std::string::npos);

    EXPECT_FALSE(resolver.Resolve({Source("b.jar", "(&(osgi.ee=JavaSE)(version=1.8)")}).has_value());
    EXPECT_FALSE(resolver.Resolve({Source("c.jar", "(&(osgi.ee=JavaSE)(version=x.y))")}).has_value());
}

TEST(VersionRangeResolverTest, CustomCandidateTable) {
    std::vector<CandidateEnvironment> envs = {
        {"Old", VersionRange::Parse("[1.0,1.4]").value()},
        {"New", VersionRange::Parse("[1.0,2.0]").value()},
    };
    auto r = VersionRangeResolver(envs).Resolve({Source("a.jar", "(&(osgi.ee=JavaSE)(version=1.5))")});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(Labels(r->surviving), (std::vector<std::string>{"New"}));
    EXPECT_EQ(r->MinimumVersion(), "2.0");
}

} // namespace
} // namespace esa
