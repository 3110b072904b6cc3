#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "errors.hpp"
#include "io/cloudreader.hpp"

using namespace cloud2bim;
namespace fs = std::filesystem;

namespace {

std::string writeTemp(const std::string& name, const std::string& text)
{
    const fs::path p = fs::temp_directory_path() / ("cloud2bim_reader_" + name);
    std::ofstream out(p);
    out << text;
    return p.string();
}

} // namespace

TEST(CloudReader, XyzWithColours)
{
    const auto path = writeTemp("colours.xyz",
                                "# header\n"
                                "0 0 0 255 0 0\n"
                                "\n"
                                "1 2 3 0 255 51\n");
    const PointCloud c = CloudReader::read(path);
    ASSERT_EQ(c.size(), 2u);
    ASSERT_TRUE(c.hasColours());
    EXPECT_FLOAT_EQ(c.points[1].y, 2.f);
    EXPECT_FLOAT_EQ(c.colours[0][0], 1.f);
    EXPECT_FLOAT_EQ(c.colours[1][2], 0.2f);
}

TEST(CloudReader, XyzDropsColoursWhenSomeLinesLackThem)
{
    const auto path = writeTemp("mixed.xyz", "0 0 0 255 0 0\n1 1 1\n");
    const PointCloud c = CloudReader::read(path);
    EXPECT_EQ(c.size(), 2u);
    EXPECT_FALSE(c.hasColours());
}

TEST(CloudReader, XyzSkipsMalformedLines)
{
    const auto path = writeTemp("malformed.txt", "0 0 0\nfoo bar\n1 1\n2 2 2\n");
    EXPECT_EQ(CloudReader::read(path).size(), 2u);
}

TEST(CloudReader, SubsampleKeepsEveryNthLine)
{
    std::string text;
    for (int i = 0; i < 10; ++i)
        text += std::to_string(i) + " 0 0\n";
    const PointCloud c = CloudReader::read(writeTemp("sub.xyz", text), 3);
    ASSERT_EQ(c.size(), 4u);
    EXPECT_FLOAT_EQ(c.points[3].x, 9.f);
}

TEST(CloudReader, PtxSkipsHeaderAndMissingReturns)
{
    const auto path = writeTemp("scan.ptx",
                                "2\n"
                                "2\n"
                                "0 0 0\n"
                                "1 0 0\n0 1 0\n0 0 1\n"
                                "1 0 0 0\n0 1 0 0\n0 0 1 0\n0 0 0 1\n"
                                "1 2 3 0.5 255 255 255\n"
                                "0 0 0 0 0 0 0\n"
                                "4 5 6 0.5 0 0 0\n"
                                "7 8 9 0.5 255 0 0\n");
    const PointCloud c = CloudReader::read(path);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_FLOAT_EQ(c.points[2].z, 9.f);
    ASSERT_TRUE(c.hasColours());
    EXPECT_FLOAT_EQ(c.colours[0][1], 1.f);
}

TEST(CloudReader, PtxMalformedHeaderIsInputError)
{
    const auto path = writeTemp("bad.ptx", "two\n2\n");
    EXPECT_THROW(CloudReader::read(path), InputError);
}

TEST(CloudReader, UnknownExtensionIsInputError)
{
    EXPECT_THROW(CloudReader::read(writeTemp("cloud.las", "")), InputError);
}

TEST(CloudReader, MissingFileIsIoError)
{
    EXPECT_THROW(CloudReader::read("/nonexistent/cloud.xyz"), IoError);
}
