#include "esa/jar_manifest.hpp"

#include <gtest/gtest.h>

namespace esa {
namespace {

TEST(JarManifestTest, ReadsMainSectionHeaders) {
    auto m = JarManifest::Parse(
        "Manifest-Version: 1.0\r\n"
        "Bundle-SymbolicName: com.example.bundle\r\n"
        "Require-Capability: osgi.ee;filter:=\"(&(osgi.ee=JavaSE)(version=1.8))\"\r\n"
        "\r\n");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->MainAttributes().size(), 3u);
    EXPECT_EQ(m->MainAttribute("Bundle-SymbolicName"), "com.example.bundle");
    EXPECT_EQ(m->MainAttribute(kRequireCapabilityHeader),
              "osgi.ee;filter:=\"(&(osgi.ee=JavaSE)(version=1.8))\"");
}

TEST(JarManifestTest, HeaderLookupIgnoresCase) {
    auto m = JarManifest::Parse("require-capability: osgi.ee\n");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->MainAttribute("Require-Capability"), "osgi.ee");
    EXPECT_FALSE(m->MainAttribute("Bundle-Version").has_value());
}

TEST(JarManifestTest, JoinsContinuationLines) {
    // The jar tool wraps lines at 72 bytes.
    auto m = JarManifest::Parse(
        "Manifest-Version: 1.0\n"
        "Require-Capability: osgi.ee;filter:=\"(&(osgi.ee=JavaSE)(vers\n"
        " ion=1.7))\"\n");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->MainAttribute("Require-Capability"),
              "osgi.ee;filter:=\"(&(osgi.ee=JavaSE)(version=1.7))\"");
}

TEST(JarManifestTest, StopsAtFirstBlankLine) {
    auto m = JarManifest::Parse(
        "Manifest-Version: 1.0\r\n"
        "\r\n"
        "Name: com/example/Foo.class\r\n"
        "Require-Capability: osgi.ee\r\n");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_FALSE(m->MainAttribute("Require-Capability").has_value());
    EXPECT_FALSE(m->MainAttribute("Name").has_value());
}

TEST(JarManifestTest, AcceptsBomAndBareCarriageReturns) {
    auto m = JarManifest::Parse("\xEF\xBB\xBFManifest-Version: 1.0\rIBM-ShortName: webProfile-8.0\r");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->MainAttribute("Manifest-Version"), "1.0");
    EXPECT_EQ(m->MainAttribute("IBM-ShortName"), "webProfile-8.0");
}

TEST(JarManifestTest, LastDuplicateWins) {
    auto m = JarManifest::Parse("Subsystem-Name: first\nsubsystem-name: second\n");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->MainAttributes().size(), 1u);
    EXPECT_EQ(m->MainAttribute("Subsystem-Name"), "second");
}

TEST(JarManifestTest, EmptyTextHasNoHeaders) {
    auto m = JarManifest::Parse("");
    ASSERT_TRUE(m.has_value());
    EXPECT_TRUE(m->MainAttributes().empty());
}

TEST(JarManifestTest, RejectsMalformedLines) {
    EXPECT_FALSE(JarManifest::Parse(" leading continuation\n").has_value());
    EXPECT_FALSE(JarManifest::Parse("NoColonHere\n").has_value());
    EXPECT_FALSE(JarManifest::Parse("Missing-Space:value\n").has_value());
    EXPECT_FALSE(JarManifest::Parse("Bad Name: value\n").has_value());
    EXPECT_FALSE(JarManifest::Parse(std::string(71, 'A') + ": value\n").has_value());
}

} // namespace
} // namespace esa
