#include "engine/RiskLexicon.hpp"
#include "engine/TextNormalizer.hpp"
#include "core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace crisisguard {

namespace {

std::vector<std::string> NormalizeTerms(const std::vector<std::string>& terms) {
    std::vector<std::string> out;
    out.reserve(terms.size());
    for (const auto& term : terms) {
        std::string normalized = NormalizeText(term);
        if (normalized.empty()) {
            continue;
        }
        if (std::find(out.begin(), out.end(), normalized) == out.end()) {
            out.push_back(std::move(normalized));
        }
    }
    return out;
}

template<typename A, typename B>
std::vector<std::string> Concat(const A& first, const B& second) {
    std::vector<std::string> out(first.begin(), first.end());
    out.insert(out.end(), second.begin(), second.end());
    return out;
}

// Accepts either a flat list or a map of language code -> list.
bool ReadTermList(const YAML::Node& node, std::vector<std::string>& out) {
    out.clear();
    if (node.IsSequence()) {
        for (const auto& term : node) {
            out.push_back(term.as<std::string>());
        }
        return true;
    }
    if (node.IsMap()) {
        for (const auto& language : node) {
            const std::string code = language.first.as<std::string>();
            if (!LanguageFromString(code)) {
                LOG_WARN("Ignoring terms for unknown language '{}'", code);
                continue;
            }
            for (const auto& term : language.second) {
                out.push_back(term.as<std::string>());
            }
        }
        return true;
    }
    return false;
}

bool IsValidWeight(double weight) {
    return std::isfinite(weight) && weight >= 0.0;
}

} // namespace

RiskLexicon::RiskLexicon() {
    for (RiskCategory category : kAllRiskCategories) {
        categories_.emplace_back(category);
    }
    for (RiskPattern pattern : kAllRiskPatterns) {
        patterns_.emplace_back(pattern);
    }
}

RiskLexicon RiskLexicon::Defaults() {
    RiskLexicon lexicon;

    lexicon.SetCategory(RiskCategory::SUICIDE, 8.0, Concat(
        std::initializer_list<const char*>{
            "suicide", "suicidal", "kill myself", "end my life", "want to die",
            "no reason to live", "better off dead", "take my own life",
            "don't want to live", "end it all"},
        std::initializer_list<const char*>{
            "انتحار", "أقتل نفسي", "أنهي حياتي", "لا أريد العيش", "أموت",
            "أريد أن أموت", "ما عدت أريد العيش", "انتهيت", "سأنهي هذا",
            "أفضل أن أموت", "الموت أفضل"}));

    lexicon.SetCategory(RiskCategory::SELF_HARM, 6.0, Concat(
        std::initializer_list<const char*>{
            "hurt myself", "harm myself", "cut myself", "cutting myself", "burn myself",
            "self harm", "self-harm", "punish myself", "deserve the pain"},
        std::initializer_list<const char*>{
            "أؤذي نفسي", "أجرح نفسي", "أضرب نفسي", "أحرق نفسي", "أقطع نفسي",
            "أعذب نفسي", "أذية النفس", "جروح", "أستحق الألم", "أعاقب نفسي"}));

    lexicon.SetCategory(RiskCategory::HOPELESSNESS, 2.0, Concat(
        std::initializer_list<const char*>{
            "hopeless", "no hope", "lost hope", "never get better", "pointless",
            "no point", "helpless", "empty inside", "can't go on"},
        std::initializer_list<const char*>{
            "لا أمل", "ميؤوس", "فقدت الأمل", "لا فائدة", "لن يتحسن", "انتهى الأمر",
            "لا معنى", "فارغ", "ضائع", "لا أستطيع", "عاجز"}));

    lexicon.SetCategory(RiskCategory::ISOLATION, 1.5, Concat(
        std::initializer_list<const char*>{
            "alone", "lonely", "nobody cares", "no one cares", "no one understands",
            "abandoned", "isolated", "by myself", "forgotten"},
        std::initializer_list<const char*>{
            "وحيد", "لا أحد", "منعزل", "مهجور", "منسي", "لا أحد يهتم",
            "لا أحد يفهم", "بمفردي", "معزول"}));

    lexicon.SetCategory(RiskCategory::SUBSTANCE_ABUSE, 2.0, Concat(
        std::initializer_list<const char*>{
            "drugs", "alcohol", "drunk", "overdose", "addicted", "addiction",
            "pills", "wasted"},
        std::initializer_list<const char*>{
            "مخدرات", "كحول", "إدمان", "مدمن", "حبوب", "تعاطي", "سكران", "مخمور"}));

    lexicon.SetCategory(RiskCategory::VIOLENCE, 6.0, Concat(
        std::initializer_list<const char*>{
            "kill them", "kill him", "kill her", "kill someone", "hurt someone",
            "hurt other people", "get revenge", "make them pay", "smash everything"},
        std::initializer_list<const char*>{
            "أعتدي", "أؤذي الآخرين", "عنف", "أقتلهم", "أهدد", "انتقام", "أدمر",
            "أحطم", "أضربهم"}));

    lexicon.SetCategory(RiskCategory::PSYCHOSIS, 4.0, Concat(
        std::initializer_list<const char*>{
            "hearing voices", "hear voices", "seeing things", "watching me",
            "following me", "conspiracy", "they're after me", "not real", "not myself"},
        std::initializer_list<const char*>{
            "أسمع أصوات", "أرى أشياء", "يتحدثون عني", "يراقبونني", "مؤامرة",
            "يتبعونني", "أفكار غريبة", "لست أنا"}));

    lexicon.SetPattern(RiskPattern::FINALITY_STATEMENT, 3.0, Concat(
        std::initializer_list<const char*>{
            "last time", "won't be around", "it's over", "no turning back",
            "this is the end"},
        std::initializer_list<const char*>{
            "آخر مرة", "لن أعود", "لا رجعة", "نهاية"}));

    lexicon.SetPattern(RiskPattern::GOODBYE_MESSAGE, 3.0, Concat(
        std::initializer_list<const char*>{
            "goodbye forever", "farewell", "take care of yourselves",
            "we won't meet again", "final goodbye"},
        std::initializer_list<const char*>{
            "وداع", "مع السلامة إلى الأبد", "لن نلتقي", "اعتنوا بأنفسكم"}));

    lexicon.SetPattern(RiskPattern::EXTREME_LANGUAGE, 1.0, Concat(
        std::initializer_list<const char*>{
            "always", "never", "everything", "nothing", "worst", "impossible"},
        std::initializer_list<const char*>{
            "دائماً", "أبداً", "كل شيء", "لا شيء", "الأسوأ", "مستحيل"}));

    lexicon.SetPattern(RiskPattern::WORTHLESSNESS, 2.0, Concat(
        std::initializer_list<const char*>{
            "worthless", "useless", "failure", "don't deserve", "waste of space"},
        std::initializer_list<const char*>{
            "لا قيمة لي", "عديم الفائدة", "فاشل", "لا أستحق"}));

    lexicon.SetPattern(RiskPattern::BURDEN_STATEMENT, 2.0, Concat(
        std::initializer_list<const char*>{
            "burden", "better off without me", "holding everyone back",
            "everyone would be happier"},
        std::initializer_list<const char*>{
            "عبء", "أفضل بدوني", "سيرتاحون مني"}));

    lexicon.SetPattern(RiskPattern::ISOLATION_EXPRESSION, 2.0, Concat(
        std::initializer_list<const char*>{
            "no one to talk to", "completely alone", "cut off from everyone",
            "nobody left"},
        std::initializer_list<const char*>{
            "لا أحد أتحدث معه", "وحيد تماماً", "انقطعت عن الجميع"}));

    return lexicon;
}

bool RiskLexicon::LoadFromYaml(const std::string& path) {
    RiskLexicon loaded = *this;

    try {
        const YAML::Node root = YAML::LoadFile(path);

        if (!root["categories"] && !root["patterns"]) {
            LOG_ERROR("Invalid rules file {}: missing 'categories' and 'patterns' sections", path);
            return false;
        }

        const YAML::Node categories = root["categories"];
        const YAML::Node patterns = root["patterns"];

        for (const auto& node : categories) {
            if (!node["name"]) {
                LOG_WARN("Skipping category without name");
                continue;
            }
            const std::string name = node["name"].as<std::string>();
            auto category = RiskCategoryFromString(name);
            if (!category) {
                LOG_WARN("Skipping unknown risk category '{}'", name);
                continue;
            }

            const CategoryRule& current = loaded.GetCategory(*category);
            double weight = node["weight"] ? node["weight"].as<double>() : current.weight;
            if (!IsValidWeight(weight)) {
                LOG_WARN("Skipping category '{}' with invalid weight {}", name, weight);
                continue;
            }

            std::vector<std::string> terms = current.terms;
            if (node["terms"] && !ReadTermList(node["terms"], terms)) {
                LOG_WARN("Skipping category '{}': 'terms' must be a list or a language map", name);
                continue;
            }

            loaded.SetCategory(*category, weight, terms);
            LOG_DEBUG("Loaded category: {} (weight={}, terms={})",
                     name, weight, loaded.GetCategory(*category).terms.size());
        }

        for (const auto& node : patterns) {
            if (!node["name"]) {
                LOG_WARN("Skipping pattern without name");
                continue;
            }
            const std::string name = node["name"].as<std::string>();
            auto pattern = RiskPatternFromString(name);
            if (!pattern) {
                LOG_WARN("Skipping unknown risk pattern '{}'", name);
                continue;
            }

            const PatternRule& current = loaded.GetPattern(*pattern);
            double weight = node["weight"] ? node["weight"].as<double>() : current.weight;
            if (!IsValidWeight(weight)) {
                LOG_WARN("Skipping pattern '{}' with invalid weight {}", name, weight);
                continue;
            }

            std::vector<std::string> phrases = current.phrases;
            if (node["phrases"] && !ReadTermList(node["phrases"], phrases)) {
                LOG_WARN("Skipping pattern '{}': 'phrases' must be a list or a language map", name);
                continue;
            }

            loaded.SetPattern(*pattern, weight, phrases);
        }
    } catch (const YAML::Exception& ex) {
        LOG_ERROR("Failed to parse YAML rules file {}: {}", path, ex.what());
        return false;
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to load rules from {}: {}", path, ex.what());
        return false;
    }

    *this = std::move(loaded);
    LOG_INFO("Loaded risk lexicon from {} ({} categories, {} patterns, {} triggers)",
            path, GetLoadedCategoryCount(), GetLoadedPatternCount(), GetTermCount());
    return true;
}

void RiskLexicon::SetCategory(RiskCategory category, double weight,
                              const std::vector<std::string>& terms) {
    CategoryRule& rule = categories_[static_cast<size_t>(category)];
    rule.weight = weight;
    rule.terms = NormalizeTerms(terms);
}

void RiskLexicon::SetPattern(RiskPattern pattern, double weight,
                             const std::vector<std::string>& phrases) {
    PatternRule& rule = patterns_[static_cast<size_t>(pattern)];
    rule.weight = weight;
    rule.phrases = NormalizeTerms(phrases);
}

const CategoryRule& RiskLexicon::GetCategory(RiskCategory category) const {
    return categories_.at(static_cast<size_t>(category));
}

const PatternRule& RiskLexicon::GetPattern(RiskPattern pattern) const {
    return patterns_.at(static_cast<size_t>(pattern));
}

size_t RiskLexicon::GetLoadedCategoryCount() const {
    return static_cast<size_t>(std::count_if(categories_.begin(), categories_.end(),
        [](const CategoryRule& rule) { return !rule.terms.empty(); }));
}

size_t RiskLexicon::GetLoadedPatternCount() const {
    return static_cast<size_t>(std::count_if(patterns_.begin(), patterns_.end(),
        [](const PatternRule& rule) { return !rule.phrases.empty(); }));
}

size_t RiskLexicon::GetTermCount() const {
    size_t count = 0;
    for (const auto& rule : categories_) count += rule.terms.size();
    for (const auto& rule : patterns_) count += rule.phrases.size();
    return count;
}

} // namespace crisisguard
