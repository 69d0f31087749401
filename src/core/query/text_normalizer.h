#pragma once

#include <QString>

namespace rb {

class TextNormalizer {
public:
    // Lowercase, turn every character outside [a-z0-9] into a space,
    // collapse whitespace runs and trim. Total and idempotent.
    static QString normalize(const QString& raw);
};

} // namespace rb
