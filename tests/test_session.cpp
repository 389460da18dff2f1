#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "oralsense_session.h"

using namespace oralsense;

TEST(SessionCsv, ParsesNamedColumnsInAnyOrder) {
    std::istringstream in(
        "Timestamp,Accel_Z,PPG_IR,PPG_Red,PPG_Green,Accel_X,Accel_Y\n"
        "0.00,16384,50000,40000,30000,1,-2\n"
        "\n"
        "0.02,16380,50010,40005,30002,3,-4\n");
    std::string err;
    auto rec = parseSessionCsv(in, &err);
    ASSERT_TRUE(rec.has_value()) << err;
    ASSERT_EQ(rec->size(), 2u);
    EXPECT_TRUE(rec->hasTimestamps());
    EXPECT_DOUBLE_EQ(rec->ir[1], 50010.0);
    EXPECT_DOUBLE_EQ(rec->red[0], 40000.0);
    EXPECT_DOUBLE_EQ(rec->green[1], 30002.0);
    EXPECT_DOUBLE_EQ(rec->accelX[1], 3.0);
    EXPECT_DOUBLE_EQ(rec->accelY[0], -2.0);
    EXPECT_DOUBLE_EQ(rec->accelZ[0], 16384.0);
    EXPECT_DOUBLE_EQ(rec->timestamp[1], 0.02);
    EXPECT_EQ(rec->skippedRows, 0u);
}

TEST(SessionCsv, ShortAliasesAndQuotedFields) {
    std::istringstream in(
        "red,ir,green,ax,ay,az\r\n"
        "\"1\",2,3,4,5,6\r\n");
    std::string err;
    auto rec = parseSessionCsv(in, &err);
    ASSERT_TRUE(rec.has_value()) << err;
    ASSERT_EQ(rec->size(), 1u);
    EXPECT_FALSE(rec->hasTimestamps());
    EXPECT_DOUBLE_EQ(rec->red[0], 1.0);
    EXPECT_DOUBLE_EQ(rec->accelZ[0], 6.0);
}

TEST(SessionCsv, SkipsMalformedRows) {
    std::istringstream in(
        "red,ir,green,accel_x,accel_y,accel_z\n"
        "1,2,3,4,5,6\n"
        "1,2,oops,4,5,6\n"
        "1,2,3\n"
        "7,8,9,10,11,12\n");
    std::string err;
    auto rec = parseSessionCsv(in, &err);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->size(), 2u);
    EXPECT_EQ(rec->skippedRows, 2u);
    EXPECT_DOUBLE_EQ(rec->ir[1], 8.0);
}

TEST(SessionCsv, MissingColumnOrNoRowsIsAnError) {
    std::string err;
    std::istringstream noZ("red,ir,green,accel_x,accel_y\n1,2,3,4,5\n");
    EXPECT_FALSE(parseSessionCsv(noZ, &err).has_value());
    EXPECT_NE(err.find("accel_z"), std::string::npos);

    std::istringstream headerOnly("red,ir,green,ax,ay,az\n");
    EXPECT_FALSE(parseSessionCsv(headerOnly, &err).has_value());

    std::istringstream empty("");
    EXPECT_FALSE(parseSessionCsv(empty, &err).has_value());

    EXPECT_FALSE(loadSessionCsv("/nonexistent/session.csv", &err).has_value());
    EXPECT_NE(err.find("cannot open"), std::string::npos);
}

TEST(SessionCsv, ConvertsToRawSamples) {
    std::istringstream in("t,red,ir,green,ax,ay,az\n1.5,10,20,30,-1,-2,16384\n");
    std::string err;
    auto rec = parseSessionCsv(in, &err);
    ASSERT_TRUE(rec.has_value()) << err;
    auto raw = rec->toRawSamples();
    ASSERT_EQ(raw.size(), 1u);
    EXPECT_EQ(raw[0].red, 10);
    EXPECT_EQ(raw[0].ir, 20);
    EXPECT_EQ(raw[0].green, 30);
    EXPECT_EQ(raw[0].accelX, -1);
    EXPECT_EQ(raw[0].accelZ, 16384);
    EXPECT_DOUBLE_EQ(raw[0].timestamp, 1.5);
}
