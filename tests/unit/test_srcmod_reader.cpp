/**
 * @file test_srcmod_reader.cpp
 * @brief Unit tests for the SRCMOD .fsp reader
 */

#include <gtest/gtest.h>
#include "SrcmodReader.hpp"
#include "TestFixtures.hpp"
#include <cstdio>
#include <fstream>

using namespace CFSM;

class SrcmodReaderTest : public ::testing::Test {
protected:
    SrcmodReader reader;
};

TEST_F(SrcmodReaderTest, FindFieldsParsesNumbers) {
    auto f = SrcmodReader::findFields("FOO = 4");
    ASSERT_EQ(f.count("FOO"), 1u);
    EXPECT_DOUBLE_EQ(f["FOO"], 4.0);

    f = SrcmodReader::findFields("FOO = -4.5e-6");
    EXPECT_DOUBLE_EQ(f["FOO"], -4.5e-6);

    f = SrcmodReader::findFields("% Invs : Dx = 5.00 km  Dz = 2.5 km");
    EXPECT_DOUBLE_EQ(f["DX"], 5.0);
    EXPECT_DOUBLE_EQ(f["DZ"], 2.5);
}

TEST_F(SrcmodReaderTest, FindFieldsFirstOccurrenceWins) {
    EXPECT_DOUBLE_EQ(SrcmodReader::findFields("FOO = 1 FOO = 2")["FOO"], 1.0);
    EXPECT_DOUBLE_EQ(SrcmodReader::findFields("FOO = 1\nFOO = 2")["FOO"], 1.0);
    EXPECT_DOUBLE_EQ(SrcmodReader::findFields("foo = 3\nFOO = 2")["FOO"], 3.0);
}

TEST_F(SrcmodReaderTest, FindFieldsIgnoresColumnAliasesAndText) {
    auto f = SrcmodReader::findFields("% LAT LON X==EW Y==NS Z\nNAME = abc\nA=1");
    EXPECT_EQ(f.count("X"), 0u);
    EXPECT_EQ(f.count("NAME"), 0u);
    EXPECT_EQ(f.count("A"), 0u);
}

TEST_F(SrcmodReaderTest, FindTagsStopsAtDoubleSpace) {
    auto tags = SrcmodReader::findTags(
        "% Event : 1999 Hector Mine  [Salichon et al.]\n"
        "% EventTAG: s1999HECTOR01SALI\n"
        "% Loc  : LAT = 34.59\n");
    EXPECT_EQ(tags["EVENT"], "1999 Hector Mine");
    EXPECT_EQ(tags["EVENTTAG"], "s1999HECTOR01SALI");
    EXPECT_EQ(tags["LOC"], "LAT = 34.59");
}

TEST_F(SrcmodReaderTest, SegmentDataGroupsRowsByDepth) {
    auto grid = SrcmodReader::parseSegmentData("% LAT LON C==X Z\n 1 2 3 4 \n 5 6 7 4");
    ASSERT_EQ(grid.size(), 1u);
    ASSERT_EQ(grid[0].size(), 2u);
    EXPECT_DOUBLE_EQ(grid[0][0].at("LAT"), 1.0);
    EXPECT_DOUBLE_EQ(grid[0][0].at("LON"), 2.0);
    EXPECT_DOUBLE_EQ(grid[0][0].at("C"), 3.0);
    EXPECT_DOUBLE_EQ(grid[0][0].at("Z"), 4.0);
    EXPECT_DOUBLE_EQ(grid[0][1].at("LAT"), 5.0);
    EXPECT_DOUBLE_EQ(grid[0][1].at("C"), 7.0);

    grid = SrcmodReader::parseSegmentData("% lat lon z slip\n 1 2 0 1\n 1 3 0 2\n 1 2 5 3\n 1 3 5 4\n");
    ASSERT_EQ(grid.size(), 2u);
    EXPECT_DOUBLE_EQ(grid[1][0].at("SLIP"), 3.0);
    EXPECT_DOUBLE_EQ(grid[1][1].at("Z"), 5.0);
}

TEST_F(SrcmodReaderTest, UnevenRowsAreFatal) {
    EXPECT_THROW(SrcmodReader::parseSegmentData("% LAT LON Z\n 1 2 0\n 1 3 0\n 1 2 5\n"),
                 RuptureParseError);
}

TEST_F(SrcmodReaderTest, MalformedDataLinesAreFatal) {
    // Data before the column header
    EXPECT_THROW(SrcmodReader::parseSegmentData(" 1 2 3\n% LAT LON Z\n"), RuptureParseError);
    // Fewer values than columns
    EXPECT_THROW(SrcmodReader::parseSegmentData("% LAT LON Z SLIP\n 1 2 3\n"), RuptureParseError);
    // Coordinates out of range
    EXPECT_THROW(SrcmodReader::parseSegmentData("% LAT LON Z\n 95 2 0\n"), RuptureParseError);
    EXPECT_THROW(SrcmodReader::parseSegmentData("% LAT LON Z\n 5 200 0\n"), RuptureParseError);
    // No depth column
    EXPECT_THROW(SrcmodReader::parseSegmentData("% LAT LON SLIP\n 5 20 1\n"), RuptureParseError);
    // No data at all
    EXPECT_THROW(SrcmodReader::parseSegmentData("% LAT LON Z\n"), RuptureParseError);
}

TEST_F(SrcmodReaderTest, ParseSingleSegmentFile) {
    RuptureDescription d = reader.parse(TestFixtures::strikeSlipFsp());

    EXPECT_EQ(d.dateText, "7/4/2001");
    EXPECT_EQ(d.date, TimeUtils::makeUtc(2001, 7, 4));

    ASSERT_TRUE(d.tag.has_value());
    EXPECT_EQ(*d.tag, "s2001SYNTH01TEST");
    ASSERT_TRUE(d.description.has_value());
    EXPECT_EQ(*d.description, "Synthetic strike-slip event 7/4/2001");

    ASSERT_TRUE(d.epicenterLatitude && d.epicenterLongitude);
    EXPECT_DOUBLE_EQ(*d.epicenterLatitude, 34.5);
    EXPECT_DOUBLE_EQ(*d.epicenterLongitude, -116.3);
    EXPECT_DOUBLE_EQ(*d.depth, 5.0);
    EXPECT_DOUBLE_EQ(*d.magnitude, 6.1);
    EXPECT_DOUBLE_EQ(*d.moment, 1.8e18);

    ASSERT_EQ(d.segments.size(), 1u);
    const auto& seg = d.segments[0];
    // Single-segment files use the header fields
    EXPECT_DOUBLE_EQ(seg.fields.at("STRK"), 0.0);
    EXPECT_DOUBLE_EQ(seg.fields.at("DX"), 5.0);
    ASSERT_EQ(seg.rows.size(), 2u);
    ASSERT_EQ(seg.rows[0].size(), 2u);
    EXPECT_DOUBLE_EQ(seg.rows[0][1].at("Y"), 2.5);
    EXPECT_DOUBLE_EQ(seg.rows[1][0].at("SLIP"), 0.8);
    EXPECT_DOUBLE_EQ(seg.rows[1][1].at("Z"), 5.0);
}

TEST_F(SrcmodReaderTest, ParseMultiSegmentFile) {
    RuptureDescription d = reader.parse(TestFixtures::twoSegmentFsp());

    EXPECT_EQ(d.date, TimeUtils::makeUtc(2005, 3, 15));
    EXPECT_DOUBLE_EQ(d.fields.at("NSG"), 2.0);
    ASSERT_EQ(d.segments.size(), 2u);

    // Each segment carries its own fields
    EXPECT_DOUBLE_EQ(d.segments[0].fields.at("STRIKE"), 45.0);
    EXPECT_DOUBLE_EQ(d.segments[0].fields.at("DIP"), 60.0);
    EXPECT_DOUBLE_EQ(d.segments[0].fields.at("LEN"), 10.0);
    EXPECT_DOUBLE_EQ(d.segments[1].fields.at("STRIKE"), 90.0);
    EXPECT_DOUBLE_EQ(d.segments[1].fields.at("DIP"), 80.0);

    EXPECT_EQ(d.segments[0].rows.size(), 2u);
    EXPECT_EQ(d.segments[1].rows.size(), 1u);
    EXPECT_EQ(d.segments[1].rows[0].size(), 2u);
}

TEST_F(SrcmodReaderTest, MissingOptionalEntriesAreLeftUnset) {
    std::string text = TestFixtures::strikeSlipFsp();
    text.replace(text.find("EventTAG"), 8, "EventREF");
    text.replace(text.find("Mw = 6.10"), 9, "Mx = 6.10");

    RuptureDescription d = reader.parse(text);
    EXPECT_FALSE(d.tag.has_value());
    EXPECT_FALSE(d.magnitude.has_value());
    EXPECT_TRUE(d.epicenterLatitude.has_value());
}

TEST_F(SrcmodReaderTest, MissingNsgIsFatal) {
    std::string text = TestFixtures::strikeSlipFsp();
    text.replace(text.find("Nsg = 1"), 7, "Nsq = 1");
    EXPECT_THROW(reader.parse(text), RuptureParseError);
}

TEST_F(SrcmodReaderTest, SegmentCountMismatchIsFatal) {
    std::string text = TestFixtures::twoSegmentFsp();
    text.replace(text.find("NSG = 2"), 7, "NSG = 3");
    EXPECT_THROW(reader.parse(text), RuptureParseError);
}

TEST_F(SrcmodReaderTest, MissingDateIsFatal) {
    std::string text = TestFixtures::strikeSlipFsp();
    text.replace(text.find("7/4/2001"), 8, "July 4th");
    EXPECT_THROW(reader.parse(text), RuptureParseError);
}

TEST_F(SrcmodReaderTest, ReadFile) {
    const std::string path = "test_srcmod_reader.fsp";
    {
        std::ofstream out(path);
        out << TestFixtures::strikeSlipFsp();
    }
    RuptureDescription d = reader.readFile(path);
    EXPECT_EQ(d.segments.size(), 1u);
    std::remove(path.c_str());

    EXPECT_THROW(reader.readFile("does_not_exist.fsp"), RuptureParseError);
}
