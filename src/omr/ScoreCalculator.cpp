#include "omr/ScoreCalculator.hpp"
#include "omr/Errors.hpp"
#include "omr/Log.hpp"

#include <utility>

namespace omr {

GradingResult::GradingResult(AnswerKey studentAnswers,
                             AnswerKey correctAnswers,
                             CoordinateMap studentCoordinates,
                             std::vector<QuestionOutcome> outcomes)
    : studentAnswers_(std::move(studentAnswers)),
      correctAnswers_(std::move(correctAnswers)),
      studentCoordinates_(std::move(studentCoordinates)),
      outcomes_(std::move(outcomes))
{
    for (const auto& o : outcomes_) {
        switch (o.verdict) {
        case Verdict::Correct:    correctCount_++; break;
        case Verdict::Unanswered: unansweredCount_++; break;
        case Verdict::Incorrect:  incorrectCount_++; break;
        }
    }
    if (!outcomes_.empty()) {
        percentage_ = static_cast<double>(correctCount_) / outcomes_.size() * 100.0;
    }
}

ScoreCalculator::ScoreCalculator(const GradingPolicy& policy)
    : policy_(policy) {}

GradingResult ScoreCalculator::grade(const AnswerKey& studentAnswers,
                                     const CoordinateMap& studentCoordinates,
                                     const AnswerKey& keyAnswers,
                                     int keyQuestionCount) const
{
    if (keyQuestionCount <= 0) {
        throw ConfigError("No questions detected on the correct answer sheet.");
    }

    std::vector<QuestionOutcome> outcomes;
    outcomes.reserve(keyQuestionCount);

    for (int q = 1; q <= keyQuestionCount; ++q) {
        QuestionOutcome o;
        o.questionNumber = q;
        o.studentAnswer = studentAnswers.answerFor(q);
        o.correctAnswer = keyAnswers.answerFor(q);

        // A missing student row is a wrong pick, not an unanswered one
        if (studentAnswers.contains(q) == keyAnswers.contains(q) &&
            o.studentAnswer == o.correctAnswer) {
            o.verdict = Verdict::Correct;
        } else if (studentAnswers.isUnanswered(q)) {
            o.verdict = Verdict::Unanswered;
        } else {
            o.verdict = Verdict::Incorrect;
        }
        outcomes.push_back(o);
    }

    return GradingResult(studentAnswers, keyAnswers, studentCoordinates, std::move(outcomes));
}

GradingResult ScoreCalculator::grade(const SheetReading& student, const SheetReading& key) const {
    if (!student.found()) {
        if (policy_.emptyStudentSheet == GradingPolicy::EmptyStudentSheet::Reject) {
            throw ConfigError("No bubbles detected on the student sheet.");
        }
        log::warn("no bubbles detected on the student sheet, every question is scored as incorrect");
    }
    return grade(student.answers, student.coordinates, key.answers, key.questionCount);
}

}
