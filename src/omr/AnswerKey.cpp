#include "omr/AnswerKey.hpp"

namespace omr {

const std::string AnswerKey::kUnanswered = "Unanswered";

AnswerKey::AnswerKey(std::initializer_list<std::pair<const int, std::string>> answers)
    : answers_(answers) {}

void AnswerKey::setAnswer(int questionNumber, const std::string& answer) {
    answers_[questionNumber] = answer;
}

std::string AnswerKey::answerFor(int questionNumber) const {
    auto it = answers_.find(questionNumber);
    if (it == answers_.end()) return "";
    return it->second;
}

bool AnswerKey::contains(int questionNumber) const {
    return answers_.find(questionNumber) != answers_.end();
}

bool AnswerKey::isUnanswered(int questionNumber) const {
    auto it = answers_.find(questionNumber);
    return it != answers_.end() && it->second == kUnanswered;
}

std::vector<std::string> AnswerKey::toList(int count) const {
    std::vector<std::string> out;
    out.reserve(count > 0 ? count : 0);
    for (int q = 1; q <= count; ++q) {
        out.push_back(answerFor(q));
    }
    return out;
}

}
