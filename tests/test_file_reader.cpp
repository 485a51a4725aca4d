#include "io/file_reader.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class FileReaderTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FileReaderTests, OpenOK_AndTotalSizeMatches) {
    const std::string p = MakePath("in.bin");
    std::vector<std::uint8_t> data(12345);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>(i & 0xFF);
    ASSERT_TRUE(testutil::WriteBytesFile(p, data));

    reposync::FileReader r;
    auto res = reposync::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(r.Path(), p);

    auto sz = r.TotalSize();
    ASSERT_TRUE(sz.has_value());
    EXPECT_EQ(*sz, data.size());
}

TEST_F(FileReaderTests, OpenNonexistent_ReportsNotFound) {
    reposync::FileReader r;
    const std::string p = MakePath("nope.bin");
    auto res = reposync::FileReader::Open(p, r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, reposync::kErrNotFound);
    EXPECT_NE(res.msg.find(p), std::string::npos);
}

TEST_F(FileReaderTests, ReadAllBytes_EqualsInput) {
    const std::string p = MakePath("in2.bin");
    std::vector<std::uint8_t> data(2 * 1024 * 1024 + 7);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>((i * 13) & 0xFF);
    ASSERT_TRUE(testutil::WriteBytesFile(p, data));

    reposync::FileReader r;
    auto res = reposync::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    std::vector<std::uint8_t> out(data.size());
    size_t pos = 0;
    while (pos < out.size()) {
        std::span<std::uint8_t> buf(out.data() + pos, out.size() - pos);
        ssize_t n = r.Read(buf);
        ASSERT_GE(n, 0);
        if (n == 0)
            break;
        pos += static_cast<size_t>(n);
    }

    ASSERT_EQ(pos, data.size());
    EXPECT_EQ(out, data);
}

TEST_F(FileReaderTests, MoveTransfersDescriptor) {
    const std::string p = MakePath("moved.txt");
    ASSERT_TRUE(testutil::WriteTextFile(p, "abcdef"));

    reposync::FileReader a;
    ASSERT_TRUE(reposync::FileReader::Open(p, a).ok);

    std::uint8_t head[3]{};
    ASSERT_EQ(a.Read(std::span<std::uint8_t>(head, 3)), 3);

    reposync::FileReader b(std::move(a));
    EXPECT_FALSE(a.IsOpen());
    EXPECT_LT(a.Read(std::span<std::uint8_t>(head, 3)), 0);
    ASSERT_TRUE(b.IsOpen());
    EXPECT_EQ(b.Path(), p);
    EXPECT_EQ(testutil::ReadAll(b), "def");
}

TEST_F(FileReaderTests, DescriptorsAreReleased) {
    const std::string p = MakePath("reused.txt");
    ASSERT_TRUE(testutil::WriteTextFile(p, "x"));

    // The next descriptor the process gets is the lowest free one, so a leak
    // shows up as an ever-increasing number.
    const int before = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(before, 0);
    ::close(before);

    {
        reposync::FileReader r;
        for (int i = 0; i < 4; ++i)
            ASSERT_TRUE(reposync::FileReader::Open(p, r).ok);
    }

    const int after = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(after, 0);
    ::close(after);
    EXPECT_EQ(after, before);
}

} // namespace
