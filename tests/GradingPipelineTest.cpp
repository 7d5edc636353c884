#include <gtest/gtest.h>
#include "omr/Errors.hpp"
#include "omr/GradingPipeline.hpp"
#include "SheetFixtures.hpp"

using namespace omr;
using omr::test::RowSpec;

namespace {

const std::vector<RowSpec> kKeyRows{{40, 4, 0}, {120, 4, 1}, {200, 4, 2}, {280, 4, 3}};

}

TEST(GradingPipelineTest, GradesStudentAgainstKey) {
    std::vector<RowSpec> studentRows{{40, 4, 0}, {120, 4, 2}, {200, 4, 2}, {280, 4, 0}};
    auto studentPath = omr::test::writeSheet(omr::test::makeSheetImage(studentRows), "pipeline", "student.png");
    auto keyPath = omr::test::writeSheet(omr::test::makeSheetImage(kKeyRows), "pipeline", "key.png");

    GradingPipeline pipeline;
    PipelineResult result = pipeline.process(SheetSource::fromPath(studentPath), SheetSource::fromPath(keyPath));

    ASSERT_TRUE(result.grading.has_value());
    const GradingResult& g = *result.grading;
    EXPECT_EQ(g.totalQuestions(), 4);
    EXPECT_EQ(g.score(), 2);
    EXPECT_EQ(g.incorrectCount(), 2);
    EXPECT_EQ(g.unansweredCount(), 0);
    EXPECT_DOUBLE_EQ(g.percentage(), 50.0);

    EXPECT_EQ(g.correctAnswers().toList(4), (std::vector<std::string>{"A", "B", "C", "D"}));
    EXPECT_EQ(g.studentAnswers().toList(4), (std::vector<std::string>{"A", "C", "C", "A"}));
    EXPECT_EQ(g.studentCoordinates().size(), 4u);
    EXPECT_EQ(g.studentCoordinates().at(1).size(), 4u);
    EXPECT_FALSE(result.student.image.empty());
}

TEST(GradingPipelineTest, StudentOnlyReading) {
    auto path = omr::test::writeSheet(omr::test::makeSheetImage(kKeyRows), "pipeline", "alone.png");

    PipelineResult result = GradingPipeline().process(SheetSource::fromPath(path));
    EXPECT_FALSE(result.grading.has_value());
    EXPECT_EQ(result.student.reading.questionCount, 4);
    EXPECT_EQ(result.student.reading.answers.answerFor(4), "D");
}

TEST(GradingPipelineTest, BlankKeySheetCannotBeGraded) {
    cv::Mat blank(360, 420, CV_8UC3, cv::Scalar(255, 255, 255));
    auto keyPath = omr::test::writeSheet(blank, "pipeline", "blank_key.png");
    auto studentPath = omr::test::writeSheet(omr::test::makeSheetImage(kKeyRows), "pipeline", "student2.png");

    GradingPipeline pipeline;
    EXPECT_THROW(pipeline.process(SheetSource::fromPath(studentPath), SheetSource::fromPath(keyPath)),
                 ConfigError);
}

TEST(GradingPipelineTest, BlankStudentSheetScoresZero) {
    cv::Mat blank(360, 420, CV_8UC3, cv::Scalar(255, 255, 255));
    auto studentPath = omr::test::writeSheet(blank, "pipeline", "blank_student.png");
    auto keyPath = omr::test::writeSheet(omr::test::makeSheetImage(kKeyRows), "pipeline", "key2.png");

    PipelineResult result = GradingPipeline().process(SheetSource::fromPath(studentPath),
                                                      SheetSource::fromPath(keyPath));
    EXPECT_FALSE(result.student.reading.found());
    EXPECT_EQ(result.grading->incorrectCount(), 4);
    EXPECT_EQ(result.grading->score(), 0);

    GradingPolicy strict;
    strict.emptyStudentSheet = GradingPolicy::EmptyStudentSheet::Reject;
    EXPECT_THROW(GradingPipeline(LoaderConfig(), DetectorConfig(), strict)
                     .process(SheetSource::fromPath(studentPath), SheetSource::fromPath(keyPath)),
                 ConfigError);
}

TEST(GradingPipelineTest, UnreadableStudentSheetIsALoadError) {
    auto keyPath = omr::test::writeSheet(omr::test::makeSheetImage(kKeyRows), "pipeline", "key3.png");
    auto missing = (omr::test::tempDir("pipeline") / "missing.png").string();

    EXPECT_THROW(GradingPipeline().process(SheetSource::fromPath(missing), SheetSource::fromPath(keyPath)),
                 LoadError);
}
