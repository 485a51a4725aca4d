#include "archive/container_kind.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace reposync {

class FormatDetectorTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FormatDetectorTests, DetectsBySignatureNotName) {
    const auto tgz = testutil::WriteArchive(MakePath("repo.zip"),
                                            {{"A-1.0.ckan", testutil::Ckan("ModA", "1.0")}},
                                            testutil::Container::TarGz);
    const auto zip = testutil::WriteArchive(MakePath("repo.tar.gz"),
                                            {{"A-1.0.ckan", testutil::Ckan("ModA", "1.0")}},
                                            testutil::Container::Zip);

    ContainerKind kind = ContainerKind::Unsupported;
    ASSERT_TRUE(FormatDetector::Detect(tgz, kind).ok);
    EXPECT_EQ(kind, ContainerKind::TarGz);
    ASSERT_TRUE(FormatDetector::Detect(zip, kind).ok);
    EXPECT_EQ(kind, ContainerKind::Zip);
}

TEST_F(FormatDetectorTests, PlainTarIsUnsupported) {
    const auto tar = testutil::WriteArchive(MakePath("repo.tar"),
                                            {{"A-1.0.ckan", testutil::Ckan("ModA", "1.0")}},
                                            testutil::Container::Tar);

    ContainerKind kind = ContainerKind::TarGz;
    auto r = FormatDetector::Detect(tar, kind);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.err, kErrUnsupportedContainer);
    EXPECT_EQ(kind, ContainerKind::Unsupported);
    EXPECT_NE(r.msg.find("Not a .tar.gz or .zip"), std::string::npos);
}

TEST_F(FormatDetectorTests, MissingFileIsNotFound) {
    ContainerKind kind = ContainerKind::Zip;
    auto r = FormatDetector::Detect(MakePath("gone"), kind);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.err, kErrNotFound);
}

TEST(FormatDetectorBytesTests, MagicNumbers) {
    const std::vector<std::uint8_t> gz = {0x1f, 0x8b, 0x08, 0x00};
    const std::vector<std::uint8_t> zip = {0x50, 0x4b, 0x03, 0x04};
    const std::vector<std::uint8_t> empty_zip = {0x50, 0x4b, 0x05, 0x06};
    const std::vector<std::uint8_t> text = {'{', '"', 'a', '"'};
    const std::vector<std::uint8_t> shorty = {0x1f};

    EXPECT_EQ(FormatDetector::DetectBytes(gz), ContainerKind::TarGz);
    EXPECT_EQ(FormatDetector::DetectBytes(zip), ContainerKind::Zip);
    EXPECT_EQ(FormatDetector::DetectBytes(empty_zip), ContainerKind::Zip);
    EXPECT_EQ(FormatDetector::DetectBytes(text), ContainerKind::Unsupported);
    EXPECT_EQ(FormatDetector::DetectBytes(shorty), ContainerKind::Unsupported);
    EXPECT_STREQ(ToString(ContainerKind::TarGz), "tar.gz");
}

} // namespace reposync
