#include "cce/combat/combat_log.hpp"

namespace cce::combat {

void CombatLog::append(foundation::LogCategory source, std::string message) {
    CCE_LOG_DEBUG(source, message);
    entries_.push_back(CombatLogEntry{entries_.size() + 1, source, std::move(message)});
}

std::vector<std::string> CombatLog::tail(std::size_t count) const {
    auto first = entries_.size() > count ? entries_.size() - count : 0;
    std::vector<std::string> out;
    out.reserve(entries_.size() - first);
    for (auto i = first; i < entries_.size(); ++i) {
        out.push_back(entries_[i].message);
    }
    return out;
}

}  // namespace cce::combat
