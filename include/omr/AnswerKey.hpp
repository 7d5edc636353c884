#ifndef OMR_ANSWER_KEY_HPP
#define OMR_ANSWER_KEY_HPP

#include <opencv2/core.hpp>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace omr {

// Answers read from one sheet: question number (1-based) -> option letter
// ("A", "B", ...) or kUnanswered.
class AnswerKey {
public:
    static const std::string kUnanswered;

    AnswerKey() = default;
    AnswerKey(std::initializer_list<std::pair<const int, std::string>> answers);

    void setAnswer(int questionNumber, const std::string& answer);

    // Empty string when the question was never recorded.
    std::string answerFor(int questionNumber) const;

    bool contains(int questionNumber) const;
    bool isUnanswered(int questionNumber) const;

    std::size_t size() const { return answers_.size(); }
    bool empty() const { return answers_.empty(); }
    void clear() { answers_.clear(); }

    // Answers for questions 1..count, "" for the missing ones
    std::vector<std::string> toList(int count) const;

    std::map<int, std::string>::const_iterator begin() const { return answers_.begin(); }
    std::map<int, std::string>::const_iterator end() const { return answers_.end(); }

    bool operator==(const AnswerKey& other) const { return answers_ == other.answers_; }
    bool operator!=(const AnswerKey& other) const { return !(*this == other); }

private:
    std::map<int, std::string> answers_;
};

// question number -> option letter -> bubble bounding box
using CoordinateMap = std::map<int, std::map<char, cv::Rect>>;

}

#endif // OMR_ANSWER_KEY_HPP
