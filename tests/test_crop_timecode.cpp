#include <gtest/gtest.h>
#include "cropregion.h"
#include "timecode.h"
#include "keyframeerrors.h"

TEST(CropRegionTest, DefaultIsFullFrame) {
    CropRegion region;
    EXPECT_TRUE(region.isFullFrame());

    cv::Mat frame(10, 10, CV_8UC1, cv::Scalar(1));
    EXPECT_EQ(region.apply(frame).data, frame.data);
}

TEST(CropRegionTest, Parse) {
    CropRegion region = CropRegion::parse("0.35,0,0.65,1");
    EXPECT_DOUBLE_EQ(region.left, 0.35);
    EXPECT_DOUBLE_EQ(region.top, 0.0);
    EXPECT_DOUBLE_EQ(region.width, 0.65);
    EXPECT_DOUBLE_EQ(region.height, 1.0);
    EXPECT_FALSE(region.isFullFrame());

    EXPECT_NO_THROW(CropRegion::parse(" 0.25, 0.25 ,0.5,0.5"));
}

TEST(CropRegionTest, ParseRejectsMalformedInput) {
    EXPECT_THROW(CropRegion::parse(""), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("0,0,1"), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("0,0,1,1,1"), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("a,0,1,1"), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("0.5x,0,0.5,1"), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("0,0,1.5,1"), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("-0.1,0,0.5,1"), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("0,0,0,1"), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("0.5,0,0.75,1"), InvalidParameters);
    EXPECT_THROW(CropRegion::parse("0,0.5,1,0.75"), InvalidParameters);
}

TEST(CropRegionTest, ToRectAndApply) {
    CropRegion region = CropRegion::parse("0.25,0,0.5,0.5");

    cv::Rect rect = region.toRect(cv::Size(200, 100));
    EXPECT_EQ(rect, cv::Rect(50, 0, 100, 50));

    cv::Mat frame(100, 200, CV_8UC3, cv::Scalar(1, 2, 3));
    cv::Mat cropped = region.apply(frame);
    EXPECT_EQ(cropped.cols, 100);
    EXPECT_EQ(cropped.rows, 50);
    EXPECT_TRUE(cropped.isContinuous());
    EXPECT_TRUE(region.apply(cv::Mat()).empty());
}

TEST(CropRegionTest, ToStringRoundTrip) {
    CropRegion region = CropRegion::parse("0.25,0,0.5,1");
    CropRegion again = CropRegion::parse(region.toString());
    EXPECT_DOUBLE_EQ(again.left, 0.25);
    EXPECT_DOUBLE_EQ(again.width, 0.5);
}

TEST(TimecodeTest, Parse) {
    EXPECT_DOUBLE_EQ(Timecode::parse("01:02:03"), 3723.0);
    EXPECT_DOUBLE_EQ(Timecode::parse("00:00:00"), 0.0);
    EXPECT_DOUBLE_EQ(Timecode::parse(" 00:10:00 "), 600.0);
    EXPECT_DOUBLE_EQ(Timecode::parse("100:00:00"), 360000.0);
}

TEST(TimecodeTest, EmptyMeansOpen) {
    EXPECT_LT(Timecode::parse(""), 0.0);
    EXPECT_LT(Timecode::parse("   "), 0.0);
}

TEST(TimecodeTest, ParseRejectsMalformedInput) {
    EXPECT_THROW(Timecode::parse("1:2"), InvalidParameters);
    EXPECT_THROW(Timecode::parse("aa:00:00"), InvalidParameters);
    EXPECT_THROW(Timecode::parse("00:60:00"), InvalidParameters);
    EXPECT_THROW(Timecode::parse("00:00:60"), InvalidParameters);
    EXPECT_THROW(Timecode::parse("00:-1:00"), InvalidParameters);
    EXPECT_THROW(Timecode::parse("00:00:01.5"), InvalidParameters);
}

TEST(TimecodeTest, Format) {
    EXPECT_EQ(Timecode::format(3723.5), "01:02:03.500");
    EXPECT_EQ(Timecode::format(0.0), "00:00:00.000");
    EXPECT_EQ(Timecode::format(-3.0), "00:00:00.000");
}
