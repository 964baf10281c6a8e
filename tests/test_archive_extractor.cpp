#include <gtest/gtest.h>

#include "archive/archive_extractor.hpp"
#include "testing.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace corpus {

class ArchiveExtractorTest : public ::testing::Test {
  protected:
    void SetUp() override { fs::create_directories(dest); }

    std::string Fixture(const std::string& filename,
                        const std::vector<testutil::ArchiveEntry>& entries,
                        testutil::FixtureFormat format) {
        const std::string path = temp_dir.Path() + "/" + filename;
        testutil::WriteArchive(path, entries, format);
        return path;
    }

    static std::vector<testutil::ArchiveEntry> PackageTree() {
        return {
            {"pkg-1.0/", "", AE_IFDIR},
            {"pkg-1.0/setup.py", "from setuptools import setup\n"},
            {"pkg-1.0/pkg/__init__.py", "VERSION = '1.0'\n"},
        };
    }

    testutil::TemporaryDirectory temp_dir;
    std::string dest = temp_dir.Path() + "/out";
};

TEST_F(ArchiveExtractorTest, DetectsFormatFromContent) {
    EXPECT_EQ(ArchiveExtractor::DetectFormat(Fixture("a.tar", PackageTree(), testutil::FixtureFormat::Tar)),
              ArchiveFormat::Tar);
    EXPECT_EQ(ArchiveExtractor::DetectFormat(Fixture("b.tar.gz", PackageTree(), testutil::FixtureFormat::TarGz)),
              ArchiveFormat::Tar);
    EXPECT_EQ(ArchiveExtractor::DetectFormat(Fixture("c.zip", PackageTree(), testutil::FixtureFormat::Zip)),
              ArchiveFormat::Zip);

    // The extension does not matter: a gzipped tar named .zip is still tar.
    EXPECT_EQ(ArchiveExtractor::DetectFormat(Fixture("d.zip", PackageTree(), testutil::FixtureFormat::TarGz)),
              ArchiveFormat::Tar);
}

TEST_F(ArchiveExtractorTest, TextFileIsUnknown) {
    const std::string path = temp_dir.Path() + "/notes.zip";
    testutil::WriteFile(path, "this is not an archive\n");
    EXPECT_EQ(ArchiveExtractor::DetectFormat(path), ArchiveFormat::Unknown);
    EXPECT_EQ(ArchiveExtractor::DetectFormat(temp_dir.Path() + "/absent.tar.gz"), ArchiveFormat::Unknown);
}

TEST_F(ArchiveExtractorTest, ExtractsGzippedTar) {
    const auto path = Fixture("pkg-1.0.tar.gz", PackageTree(), testutil::FixtureFormat::TarGz);

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, dest);
    ASSERT_TRUE(res.has_value()) << res.error().msg;

    EXPECT_EQ(res->format, ArchiveFormat::Tar);
    EXPECT_EQ(res->entries, 3U);
    EXPECT_EQ(res->top_level, std::set<std::string>{"pkg-1.0"});
    EXPECT_EQ(testutil::ReadFile(dest + "/pkg-1.0/setup.py"), "from setuptools import setup\n");
    EXPECT_EQ(testutil::ReadFile(dest + "/pkg-1.0/pkg/__init__.py"), "VERSION = '1.0'\n");
}

TEST_F(ArchiveExtractorTest, ExtractsZip) {
    const auto path = Fixture("pkg-1.0.zip", PackageTree(), testutil::FixtureFormat::Zip);

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, dest);
    ASSERT_TRUE(res.has_value()) << res.error().msg;

    EXPECT_EQ(res->format, ArchiveFormat::Zip);
    EXPECT_TRUE(fs::is_directory(dest + "/pkg-1.0"));
    EXPECT_EQ(testutil::ReadFile(dest + "/pkg-1.0/pkg/__init__.py"), "VERSION = '1.0'\n");
}

TEST_F(ArchiveExtractorTest, CountsBytesAndTopLevelEntries) {
    const auto path = Fixture("flat.tar",
                              {{"module.py", "x = 1\n"}, {"other/data.txt", "abc"}},
                              testutil::FixtureFormat::Tar);

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, dest);
    ASSERT_TRUE(res.has_value()) << res.error().msg;

    EXPECT_EQ(res->bytes, 9U);
    EXPECT_EQ(res->top_level, (std::set<std::string>{"module.py", "other"}));
    EXPECT_TRUE(fs::is_regular_file(dest + "/module.py"));
}

TEST_F(ArchiveExtractorTest, UnrecognizedFormatIsReported) {
    const std::string path = temp_dir.Path() + "/bogus-1.0.zip";
    testutil::WriteFile(path, "plain text pretending to be a zip\n");

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, dest);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ExtractError::UnrecognizedFormat);
    EXPECT_NE(res.error().msg.find("Could not identify type of compressed file"), std::string::npos);
    EXPECT_TRUE(fs::is_empty(dest));
}

TEST_F(ArchiveExtractorTest, RejectsEntryEscapingDestination) {
    const auto path = Fixture("evil.tar",
                              {{"../escape.py", "import os\n"}},
                              testutil::FixtureFormat::Tar);

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, dest);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ExtractError::UnsafePath);
    EXPECT_FALSE(fs::exists(temp_dir.Path() + "/escape.py"));
}

TEST_F(ArchiveExtractorTest, RejectsHardlinkEscapingDestination) {
    const auto path = Fixture("link.tar",
                              {{"pkg-1.0/", "", AE_IFDIR},
                               {"pkg-1.0/passwd", "", AE_IFREG, "pkg-1.0/../../etc/passwd"}},
                              testutil::FixtureFormat::Tar);

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, dest);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ExtractError::UnsafePath);
    EXPECT_NE(res.error().msg.find("Unsafe hardlink target in archive"), std::string::npos);
    EXPECT_FALSE(fs::exists(dest + "/pkg-1.0/passwd"));
}

TEST_F(ArchiveExtractorTest, DotDotThatStaysInsideIsResolved) {
    const auto path = Fixture("pkg-1.0.tar",
                              {{"./pkg-1.0/docs/../setup.py", "setup()\n"},
                               {"pkg-1.0/setup_link.py", "", AE_IFREG, "pkg-1.0/setup.py"}},
                              testutil::FixtureFormat::Tar);

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, dest);
    ASSERT_TRUE(res.has_value()) << res.error().msg;

    EXPECT_EQ(testutil::ReadFile(dest + "/pkg-1.0/setup.py"), "setup()\n");
    EXPECT_EQ(testutil::ReadFile(dest + "/pkg-1.0/setup_link.py"), "setup()\n");
    EXPECT_EQ(res->top_level, std::set<std::string>{"pkg-1.0"});
}

TEST_F(ArchiveExtractorTest, RejectsBackslashInEntryName) {
    const auto path = Fixture("win.tar", {{"pkg-1.0\\..\\evil.py", "x\n"}}, testutil::FixtureFormat::Tar);

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, dest);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ExtractError::UnsafePath);
}

TEST_F(ArchiveExtractorTest, MissingDestinationIsIoError) {
    const auto path = Fixture("pkg-1.0.tar", PackageTree(), testutil::FixtureFormat::Tar);

    ArchiveExtractor extractor;
    auto res = extractor.ExtractAll(path, temp_dir.Path() + "/missing");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ExtractError::Io);
}

} // namespace corpus
