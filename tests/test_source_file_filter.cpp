#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/config.hpp"
#include "verify/source_file_filter.hpp"

namespace corpus {

TEST(SourceFileFilterTest, DefaultGlobsDropKnownBadFixtures) {
    SourceFileFilter filter(config::DefaultExcludedGlobs());

    EXPECT_TRUE(filter.Excluded("/ws/pkg-1.0/tests/failset/case.py"));
    EXPECT_TRUE(filter.Excluded("/ws/pkg-1.0/failset/deep/nested/case.py"));
    EXPECT_TRUE(filter.Excluded("/ws/pkg-1.0/test2to3/x/y.py"));
    EXPECT_TRUE(filter.Excluded("/ws/pkg-1.0/tests/bad_coding.py"));
    EXPECT_TRUE(filter.Excluded("/ws/pkg-1.0/lib2to3/tests/data/py2_test_grammar.py"));

    EXPECT_FALSE(filter.Excluded("/ws/pkg-1.0/pkg/module.py"));
    EXPECT_FALSE(filter.Excluded("/ws/pkg-1.0/pkg/notbad.py"));
}

TEST(SourceFileFilterTest, NoGlobsExcludesNothing) {
    SourceFileFilter filter({});
    EXPECT_FALSE(filter.Excluded("/ws/pkg/failset/case.py"));
}

TEST(SourceFileFilterTest, ScanCountsCandidatesAndExclusions) {
    testutil::TemporaryDirectory tmp;
    const std::string root = tmp.Path() + "/pkg-1.0";
    testutil::WriteFile(root + "/pkg/__init__.py", "");
    testutil::WriteFile(root + "/pkg/core.py", "x = 1\n");
    testutil::WriteFile(root + "/tests/failset/broken.py", "def (\n");
    testutil::WriteFile(root + "/tests/bad_syntax.py", "print 'x'\n");
    testutil::WriteFile(root + "/README.rst", "docs\n");

    SourceFileFilter filter(config::DefaultExcludedGlobs());
    const auto census = filter.Scan(root);
    EXPECT_EQ(census.candidates, 2U);
    EXPECT_EQ(census.excluded, 2U);

    const auto rst = filter.Scan(root, ".rst");
    EXPECT_EQ(rst.candidates, 1U);
}

TEST(SourceFileFilterTest, ScanOfMissingRootIsEmpty) {
    SourceFileFilter filter({});
    const auto census = filter.Scan("/nonexistent/corpus/root");
    EXPECT_EQ(census.candidates, 0U);
    EXPECT_EQ(census.excluded, 0U);
}

} // namespace corpus
