#pragma once

#include "engine/CrisisTypes.hpp"
#include <string>
#include <vector>

namespace crisisguard {

struct CategoryRule {
    RiskCategory category;
    double weight;
    std::vector<std::string> terms;   // normalized, duplicates removed

    explicit CategoryRule(RiskCategory c = RiskCategory::SUICIDE) : category(c), weight(1.0) {}
};

struct PatternRule {
    RiskPattern pattern;
    double weight;
    std::vector<std::string> phrases; // normalized, duplicates removed

    explicit PatternRule(RiskPattern p = RiskPattern::FINALITY_STATEMENT) : pattern(p), weight(1.0) {}
};

// Trigger tables for the category matcher and the pattern detector. Built once
// (defaults or YAML) and then shared read-only between sessions.
class RiskLexicon {
public:
    RiskLexicon();

    // English and Arabic tables with the stock weights.
    static RiskLexicon Defaults();

    // Overlays config/crisis_rules.yaml on the current tables. Entries not named in
    // the file keep their current terms and weight. Returns false and leaves the
    // lexicon unchanged when the file cannot be parsed.
    bool LoadFromYaml(const std::string& path);

    void SetCategory(RiskCategory category, double weight, const std::vector<std::string>& terms);
    void SetPattern(RiskPattern pattern, double weight, const std::vector<std::string>& phrases);

    const CategoryRule& GetCategory(RiskCategory category) const;
    const PatternRule& GetPattern(RiskPattern pattern) const;

    const std::vector<CategoryRule>& Categories() const { return categories_; }
    const std::vector<PatternRule>& Patterns() const { return patterns_; }

    // Entries with at least one trigger
    size_t GetLoadedCategoryCount() const;
    size_t GetLoadedPatternCount() const;
    size_t GetTermCount() const;

private:
    std::vector<CategoryRule> categories_;   // indexed by RiskCategory
    std::vector<PatternRule> patterns_;      // indexed by RiskPattern
};

} // namespace crisisguard
