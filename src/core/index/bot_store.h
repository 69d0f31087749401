#pragma once

#include "core/shared/types.h"

#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace rb {

// BotStore -- read interface the matcher needs from persistence.
class BotStore {
public:
    virtual ~BotStore() = default;

    virtual std::optional<Bot> fetchBotBySlug(const QString& slug) = 0;

    // All Q&A records of a bot, ordered by priority DESC, id ASC.
    // The order decides tie-breaks during matching.
    virtual std::vector<Candidate> fetchCandidates(int64_t botId) = 0;
};

} // namespace rb
