#include "response/PhraseSelector.hpp"
#include "core/Logger.hpp"
#include <stdexcept>

namespace crisisguard {

size_t RotatingPhraseSelector::Select(const std::string& key, size_t count) {
    if (count == 0) {
        throw std::invalid_argument("PhraseSelector: no variants for key " + key);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    size_t& next = next_[key];
    size_t index = next % count;
    next = index + 1;
    return index;
}

SeededPhraseSelector::SeededPhraseSelector(uint32_t seed)
    : rng_(seed) {
}

size_t SeededPhraseSelector::Select(const std::string& key, size_t count) {
    if (count == 0) {
        throw std::invalid_argument("PhraseSelector: no variants for key " + key);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<size_t> dist(0, count - 1);
    return dist(rng_);
}

std::unique_ptr<PhraseSelector> MakePhraseSelector(const std::string& mode, uint32_t seed) {
    if (mode == "seeded") {
        return std::make_unique<SeededPhraseSelector>(seed);
    }
    if (mode != "rotate") {
        LOG_WARN("Unknown phrase selection mode '{}', using rotation", mode);
    }
    return std::make_unique<RotatingPhraseSelector>();
}

} // namespace crisisguard
