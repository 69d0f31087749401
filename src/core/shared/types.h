#pragma once

#include <QString>
#include <cstdint>

namespace rb {

constexpr int kDefaultPriority = 1;

// A chatbot as seen by the matcher. Owned by the store; read-only here.
struct Bot {
    int64_t id = 0;
    QString slug;
    QString name;
    QString fallbackMessage;
};

// One stored question/answer record scoped to a bot.
struct Candidate {
    int64_t id = 0;
    QString question;
    QString answer;
    QString keywordSpec;   // raw, comma separated; may be empty
    int priority = kDefaultPriority;
};

} // namespace rb
