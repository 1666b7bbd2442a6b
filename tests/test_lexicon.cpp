#include <gtest/gtest.h>
#include "engine/RiskLexicon.hpp"
#include "engine/TextNormalizer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace crisisguard;

class LexiconTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "crisisguard_lexicon_test";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string WriteRules(const std::string& content) {
        auto path = dir_ / "rules.yaml";
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    static bool HasTerm(const std::vector<std::string>& terms, const std::string& term) {
        return std::find(terms.begin(), terms.end(), term) != terms.end();
    }

    std::filesystem::path dir_;
};

TEST_F(LexiconTest, NormalizeLowercasesAndCollapsesWhitespace) {
    EXPECT_EQ(NormalizeText("  I   Want\tTO\n\nDie  "), "i want to die");
    EXPECT_EQ(NormalizeText(""), "");
    EXPECT_EQ(NormalizeText("   "), "");
}

TEST_F(LexiconTest, NormalizeFoldsCurlyApostrophe) {
    EXPECT_EQ(NormalizeText("I don\xE2\x80\x99t want to live"), "i don't want to live");
}

TEST_F(LexiconTest, NormalizeDropsTatweel) {
    // "انتحـــار" with tatweel stretching
    EXPECT_EQ(NormalizeText("انتحـــار"), "انتحار");
}

TEST_F(LexiconTest, NormalizeLeavesArabicLettersUntouched) {
    EXPECT_EQ(NormalizeText("أريد أن أنهي حياتي"), "أريد أن أنهي حياتي");
}

TEST_F(LexiconTest, DefaultsCoverEveryCategoryAndPattern) {
    RiskLexicon lexicon = RiskLexicon::Defaults();
    EXPECT_EQ(lexicon.GetLoadedCategoryCount(), kAllRiskCategories.size());
    EXPECT_EQ(lexicon.GetLoadedPatternCount(), kAllRiskPatterns.size());
    EXPECT_GT(lexicon.GetTermCount(), 100u);

    EXPECT_DOUBLE_EQ(lexicon.GetCategory(RiskCategory::SUICIDE).weight, 8.0);
    EXPECT_TRUE(HasTerm(lexicon.GetCategory(RiskCategory::SUICIDE).terms, "kill myself"));
    EXPECT_TRUE(HasTerm(lexicon.GetCategory(RiskCategory::SUICIDE).terms, "انتحار"));
}

TEST_F(LexiconTest, EmptyLexiconHasNoTriggers) {
    RiskLexicon lexicon;
    EXPECT_EQ(lexicon.GetLoadedCategoryCount(), 0u);
    EXPECT_EQ(lexicon.GetTermCount(), 0u);
}

TEST_F(LexiconTest, SetCategoryNormalizesAndDeduplicates) {
    RiskLexicon lexicon;
    lexicon.SetCategory(RiskCategory::ISOLATION, 1.0, {"Alone", "alone", "  ALONE ", "", "lonely"});

    const auto& rule = lexicon.GetCategory(RiskCategory::ISOLATION);
    ASSERT_EQ(rule.terms.size(), 2u);
    EXPECT_EQ(rule.terms[0], "alone");
    EXPECT_EQ(rule.terms[1], "lonely");
}

TEST_F(LexiconTest, YamlOverlaysNamedEntries) {
    auto path = WriteRules(
        "categories:\n"
        "  - name: isolation\n"
        "    weight: 3.0\n"
        "    terms: [stranded]\n"
        "  - name: substance_abuse\n"
        "    terms:\n"
        "      en: [bender]\n"
        "      ar: [\"مخدرات\"]\n"
        "patterns:\n"
        "  - name: burden_statement\n"
        "    weight: 4\n");

    RiskLexicon lexicon = RiskLexicon::Defaults();
    ASSERT_TRUE(lexicon.LoadFromYaml(path));

    const auto& isolation = lexicon.GetCategory(RiskCategory::ISOLATION);
    EXPECT_DOUBLE_EQ(isolation.weight, 3.0);
    ASSERT_EQ(isolation.terms.size(), 1u);
    EXPECT_EQ(isolation.terms[0], "stranded");

    const auto& substance = lexicon.GetCategory(RiskCategory::SUBSTANCE_ABUSE);
    EXPECT_DOUBLE_EQ(substance.weight, 2.0);
    EXPECT_EQ(substance.terms.size(), 2u);

    EXPECT_DOUBLE_EQ(lexicon.GetPattern(RiskPattern::BURDEN_STATEMENT).weight, 4.0);
    EXPECT_FALSE(lexicon.GetPattern(RiskPattern::BURDEN_STATEMENT).phrases.empty());

    // Untouched entries keep their defaults
    EXPECT_DOUBLE_EQ(lexicon.GetCategory(RiskCategory::SUICIDE).weight, 8.0);
}

TEST_F(LexiconTest, YamlSkipsUnknownNamesAndBadWeights) {
    auto path = WriteRules(
        "categories:\n"
        "  - name: gambling\n"
        "    terms: [casino]\n"
        "  - name: violence\n"
        "    weight: -1\n"
        "    terms: [fight]\n");

    RiskLexicon lexicon = RiskLexicon::Defaults();
    ASSERT_TRUE(lexicon.LoadFromYaml(path));
    EXPECT_DOUBLE_EQ(lexicon.GetCategory(RiskCategory::VIOLENCE).weight, 6.0);
    EXPECT_FALSE(HasTerm(lexicon.GetCategory(RiskCategory::VIOLENCE).terms, "fight"));
}

TEST_F(LexiconTest, YamlWithoutSectionsIsRejected) {
    auto path = WriteRules("thresholds:\n  low: 3\n");
    RiskLexicon lexicon = RiskLexicon::Defaults();
    size_t before = lexicon.GetTermCount();
    EXPECT_FALSE(lexicon.LoadFromYaml(path));
    EXPECT_EQ(lexicon.GetTermCount(), before);
}

TEST_F(LexiconTest, MissingFileLeavesLexiconUnchanged) {
    RiskLexicon lexicon = RiskLexicon::Defaults();
    size_t before = lexicon.GetTermCount();
    EXPECT_FALSE(lexicon.LoadFromYaml((dir_ / "nope.yaml").string()));
    EXPECT_EQ(lexicon.GetTermCount(), before);
}

TEST_F(LexiconTest, ShippedRulesMatchBuiltInTables) {
    RiskLexicon loaded;
    ASSERT_TRUE(loaded.LoadFromYaml("config/crisis_rules.yaml"));
    RiskLexicon defaults = RiskLexicon::Defaults();

    for (RiskCategory category : kAllRiskCategories) {
        EXPECT_EQ(loaded.GetCategory(category).terms, defaults.GetCategory(category).terms)
            << RiskCategoryToString(category);
        EXPECT_DOUBLE_EQ(loaded.GetCategory(category).weight, defaults.GetCategory(category).weight);
    }
    for (RiskPattern pattern : kAllRiskPatterns) {
        EXPECT_EQ(loaded.GetPattern(pattern).phrases, defaults.GetPattern(pattern).phrases)
            << RiskPatternToString(pattern);
    }
}
