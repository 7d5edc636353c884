#ifndef OMR_SCORE_CALCULATOR_HPP
#define OMR_SCORE_CALCULATOR_HPP

#include <string>
#include <vector>
#include "omr/AnswerKey.hpp"
#include "omr/BubbleDetector.hpp"

namespace omr {

enum class Verdict {
    Correct,
    Incorrect,
    Unanswered
};

struct QuestionOutcome {
    int questionNumber;
    std::string studentAnswer;   // "" when the student sheet has no such row
    std::string correctAnswer;
    Verdict verdict;
};

// What to do with a student sheet on which no bubble was found.
struct GradingPolicy {
    enum class EmptyStudentSheet {
        ScoreAsIncorrect,   // every question counts as a wrong pick
        Reject              // ConfigError
    };

    EmptyStudentSheet emptyStudentSheet = EmptyStudentSheet::ScoreAsIncorrect;
};

class GradingResult {
public:
    GradingResult(AnswerKey studentAnswers,
                  AnswerKey correctAnswers,
                  CoordinateMap studentCoordinates,
                  std::vector<QuestionOutcome> outcomes);

    const AnswerKey& studentAnswers() const { return studentAnswers_; }
    const AnswerKey& correctAnswers() const { return correctAnswers_; }
    const CoordinateMap& studentCoordinates() const { return studentCoordinates_; }
    const std::vector<QuestionOutcome>& outcomes() const { return outcomes_; }

    int totalQuestions() const { return static_cast<int>(outcomes_.size()); }
    int score() const { return correctCount_; }
    int correctCount() const { return correctCount_; }
    int incorrectCount() const { return incorrectCount_; }
    int unansweredCount() const { return unansweredCount_; }
    double percentage() const { return percentage_; }

private:
    AnswerKey studentAnswers_;
    AnswerKey correctAnswers_;
    CoordinateMap studentCoordinates_;
    std::vector<QuestionOutcome> outcomes_;
    int correctCount_ = 0;
    int incorrectCount_ = 0;
    int unansweredCount_ = 0;
    double percentage_ = 0.0;
};

class ScoreCalculator {
public:
    explicit ScoreCalculator(const GradingPolicy& policy = GradingPolicy());

    // Compares questions 1..keyQuestionCount. Throws ConfigError when the key
    // has no questions.
    GradingResult grade(const AnswerKey& studentAnswers,
                        const CoordinateMap& studentCoordinates,
                        const AnswerKey& keyAnswers,
                        int keyQuestionCount) const;

    // Same, applying the empty-student-sheet policy first
    GradingResult grade(const SheetReading& student, const SheetReading& key) const;

    const GradingPolicy& policy() const { return policy_; }

private:
    GradingPolicy policy_;
};

}

#endif // OMR_SCORE_CALCULATOR_HPP
