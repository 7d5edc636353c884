#include <gtest/gtest.h>
#include "omr/Errors.hpp"
#include "omr/SheetSource.hpp"
#include "SheetFixtures.hpp"

#include <climits>
#include <fstream>

using namespace omr;

TEST(SheetSourceTest, KindFollowsExtension) {
    EXPECT_EQ(SheetSource::fromPath("sheets/key.pdf").kind(), SheetSource::Kind::Pdf);
    EXPECT_EQ(SheetSource::fromPath("sheets/KEY.PDF").kind(), SheetSource::Kind::Pdf);
    EXPECT_EQ(SheetSource::fromPath("sheets/student.jpg").kind(), SheetSource::Kind::Raster);
    EXPECT_EQ(SheetSource::fromPath("sheets/student").kind(), SheetSource::Kind::Raster);
    EXPECT_EQ(SheetSource::fromPath("scan.pdf").describe(), "scan.pdf");
}

TEST(SheetSourceTest, BufferSourcesKeepRequestedKind) {
    auto pdf = SheetSource::fromBuffer({'%', 'P', 'D', 'F'}, SheetSource::Kind::Pdf);
    EXPECT_EQ(pdf.kind(), SheetSource::Kind::Pdf);
    EXPECT_EQ(pdf.describe(), "<4 byte buffer>");
}

TEST(SheetSourceTest, SupportedUploadExtensions) {
    EXPECT_TRUE(isSupportedSheetFile("a.png"));
    EXPECT_TRUE(isSupportedSheetFile("a.JPG"));
    EXPECT_TRUE(isSupportedSheetFile("dir.v2/a.jpeg"));
    EXPECT_TRUE(isSupportedSheetFile("a.pdf"));
    EXPECT_FALSE(isSupportedSheetFile("a.gif"));
    EXPECT_FALSE(isSupportedSheetFile("png"));
    EXPECT_FALSE(isSupportedSheetFile(""));
}

TEST(SheetSourceTest, DecodesEncodedRasterBuffer) {
    cv::Mat img = omr::test::makeSheetImage({{40, 3, 1}});
    std::vector<unsigned char> bytes;
    ASSERT_TRUE(cv::imencode(".png", img, bytes));

    cv::Mat decoded = SheetSource::fromBuffer(bytes, SheetSource::Kind::Raster).decode();
    ASSERT_EQ(decoded.size(), img.size());
    EXPECT_EQ(decoded.type(), CV_8UC3);
    EXPECT_EQ(cv::norm(decoded, img, cv::NORM_INF), 0.0);
}

TEST(SheetSourceTest, UndecodableInputsRaiseLoadError) {
    auto dir = omr::test::tempDir("sheet_source");
    const std::string fakePng = (dir / "broken.png").string();
    const std::string fakePdf = (dir / "broken.pdf").string();
    {
        std::ofstream(fakePng, std::ios::binary) << "not an image";
        std::ofstream(fakePdf, std::ios::binary) << "not a pdf";
    }

    EXPECT_THROW(SheetSource::fromPath(fakePng).decode(), LoadError);
    EXPECT_THROW(SheetSource::fromPath(fakePdf).decode(), LoadError);
    EXPECT_THROW(SheetSource::fromPath((dir / "missing.jpg").string()).decode(), LoadError);
    EXPECT_THROW(SheetSource::fromPath((dir / "missing.pdf").string()).decode(), LoadError);
    EXPECT_THROW(SheetSource::fromBuffer({1, 2, 3}, SheetSource::Kind::Raster).decode(), LoadError);
    EXPECT_THROW(SheetSource::fromBuffer({'x', 'y'}, SheetSource::Kind::Pdf).decode(), LoadError);
}

TEST(SheetSourceTest, RendersFirstPdfPageAtRequestedDpi) {
    auto src = SheetSource::fromBuffer(omr::test::makePdf(), SheetSource::Kind::Pdf);

    cv::Mat page = src.decode();
    ASSERT_EQ(page.type(), CV_8UC3);
    ASSERT_EQ(page.size(), cv::Size(200, 200));   // 72 pt at 200 dpi
    EXPECT_EQ(page.at<cv::Vec3b>(100, 100), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(page.at<cv::Vec3b>(10, 10), cv::Vec3b(255, 255, 255));

    cv::Mat small = src.decode(100);
    EXPECT_EQ(small.type(), CV_8UC3);
    EXPECT_EQ(small.size(), cv::Size(100, 100));
}

TEST(SheetSourceTest, PdfWithoutPagesRaisesLoadError) {
    auto src = SheetSource::fromBuffer(omr::test::makePdf(false), SheetSource::Kind::Pdf);
    EXPECT_THROW(src.decode(), LoadError);
}

TEST(SheetSourceTest, BufferLengthMustFitAnInt) {
    EXPECT_EQ(checkedBufferLength(4, "x"), 4);
    EXPECT_EQ(checkedBufferLength(static_cast<std::size_t>(INT_MAX), "x"), INT_MAX);
    EXPECT_THROW(checkedBufferLength(static_cast<std::size_t>(INT_MAX) + 1, "x"), LoadError);
}
