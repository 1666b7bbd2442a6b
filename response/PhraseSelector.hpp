#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace crisisguard {

// Chooses among interchangeable template variants. Implementations are
// deterministic so composed responses can be asserted exactly.
class PhraseSelector {
public:
    virtual ~PhraseSelector() = default;

    // Index in [0, count). Throws std::invalid_argument when count is 0.
    virtual size_t Select(const std::string& key, size_t count) = 0;
};

// Cycles 0, 1, 2, ... independently per key.
class RotatingPhraseSelector : public PhraseSelector {
public:
    size_t Select(const std::string& key, size_t count) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, size_t> next_;
};

class SeededPhraseSelector : public PhraseSelector {
public:
    explicit SeededPhraseSelector(uint32_t seed);

    size_t Select(const std::string& key, size_t count) override;

private:
    std::mutex mutex_;
    std::mt19937 rng_;
};

// mode is "rotate" or "seeded"; anything else falls back to rotation.
std::unique_ptr<PhraseSelector> MakePhraseSelector(const std::string& mode, uint32_t seed);

} // namespace crisisguard
