#include <gtest/gtest.h>
#include "response/ResponseComposer.hpp"
#include <stdexcept>

using namespace crisisguard;

class ComposerTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = std::make_shared<const ResourceDirectory>(ResourceDirectory::Defaults());
    }

    ResponseComposer MakeComposer(Language language,
                                  std::unique_ptr<PhraseSelector> selector = nullptr) {
        if (!selector) {
            selector = std::make_unique<RotatingPhraseSelector>();
        }
        return ResponseComposer(directory_, std::move(selector), language);
    }

    static SafetyVerdict Verdict(int level, CrisisType type) {
        SafetyVerdict verdict;
        verdict.session_id = "s";
        verdict.crisis_level = level;
        verdict.crisis_type = type;
        verdict.urgency = level >= 9 ? Urgency::IMMEDIATE : Urgency::MODERATE;
        return verdict;
    }

    std::shared_ptr<const ResourceDirectory> directory_;
};

TEST_F(ComposerTest, RequiresCollaborators) {
    EXPECT_THROW(ResponseComposer(nullptr, std::make_unique<RotatingPhraseSelector>()),
                 std::invalid_argument);
    EXPECT_THROW(ResponseComposer(directory_, nullptr), std::invalid_argument);
}

TEST_F(ComposerTest, TemplateKeys) {
    EXPECT_EQ(ResponseComposer::TemplateKey(CrisisType::SUICIDE_RISK), "suicide_risk");
    EXPECT_EQ(ResponseComposer::TemplateKey(CrisisType::SELF_HARM_RISK), "self_harm_risk");
    EXPECT_EQ(ResponseComposer::TemplateKey(CrisisType::SUBSTANCE_ABUSE), "substance_abuse");
    EXPECT_EQ(ResponseComposer::TemplateKey(CrisisType::VIOLENCE_RISK), "generic");
    EXPECT_EQ(ResponseComposer::TemplateKey(CrisisType::UNKNOWN), "generic");
}

TEST_F(ComposerTest, RotationCyclesVariants) {
    auto composer = MakeComposer(Language::ENGLISH);
    ASSERT_EQ(composer.GetVariantCount("suicide_risk"), 2u);

    auto first = composer.Compose(Verdict(6, CrisisType::SUICIDE_RISK));
    auto second = composer.Compose(Verdict(6, CrisisType::SUICIDE_RISK));
    auto third = composer.Compose(Verdict(6, CrisisType::SUICIDE_RISK));

    EXPECT_NE(first.message, second.message);
    EXPECT_EQ(first.message, third.message);
}

TEST_F(ComposerTest, RotationIsPerTemplate) {
    auto composer = MakeComposer(Language::ENGLISH);
    auto suicide = composer.Compose(Verdict(6, CrisisType::SUICIDE_RISK));
    auto generic = composer.Compose(Verdict(4, CrisisType::SOCIAL_CRISIS));
    auto generic_again = composer.Compose(Verdict(4, CrisisType::SOCIAL_CRISIS));
    EXPECT_NE(generic.message, generic_again.message);
    EXPECT_NE(suicide.message, generic.message);
}

TEST_F(ComposerTest, SeededSelectionIsReproducible) {
    auto a = MakeComposer(Language::ARABIC, std::make_unique<SeededPhraseSelector>(42));
    auto b = MakeComposer(Language::ARABIC, std::make_unique<SeededPhraseSelector>(42));

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(a.Compose(Verdict(7, CrisisType::SELF_HARM_RISK)).message,
                  b.Compose(Verdict(7, CrisisType::SELF_HARM_RISK)).message);
    }
}

TEST_F(ComposerTest, SuicideMessageCarriesCulturalSupport) {
    auto composer = MakeComposer(Language::ENGLISH);
    auto response = composer.Compose(Verdict(6, CrisisType::SUICIDE_RISK));
    EXPECT_NE(response.message.find("80077"), std::string::npos);
    EXPECT_NE(response.message.find("\n\n"), std::string::npos);
}

TEST_F(ComposerTest, ResourcesOnlyAtHighLevel) {
    auto composer = MakeComposer(Language::ARABIC);

    auto medium = composer.Compose(Verdict(6, CrisisType::SUICIDE_RISK));
    EXPECT_TRUE(medium.resources.empty());
    EXPECT_TRUE(medium.emergency_contacts.empty());

    auto high = composer.Compose(Verdict(7, CrisisType::SUICIDE_RISK));
    EXPECT_EQ(high.resources.size(), directory_->GetHotlines().size());
    ASSERT_EQ(high.emergency_contacts.size(), 2u);
    EXPECT_EQ(high.emergency_contacts[0].number, "80077");
}

TEST_F(ComposerTest, ImmediateActionsByTier) {
    auto composer = MakeComposer(Language::ENGLISH);

    auto critical = composer.ImmediateActions(9);
    ASSERT_EQ(critical.size(), 4u);
    EXPECT_NE(critical[0].find("999"), std::string::npos);

    auto high = composer.ImmediateActions(7);
    ASSERT_EQ(high.size(), 4u);
    EXPECT_NE(high[0].find("80077"), std::string::npos);

    EXPECT_EQ(composer.ImmediateActions(5).size(), 4u);
    EXPECT_EQ(composer.ImmediateActions(0).size(), 3u);
}

TEST_F(ComposerTest, FollowUpFromMediumThreshold) {
    auto composer = MakeComposer(Language::ARABIC);
    EXPECT_TRUE(composer.Compose(Verdict(5, CrisisType::SEVERE_DEPRESSION)).follow_up_required);
    EXPECT_FALSE(composer.Compose(Verdict(4, CrisisType::SEVERE_DEPRESSION)).follow_up_required);
}

TEST_F(ComposerTest, JsonShape) {
    auto composer = MakeComposer(Language::ENGLISH);
    auto json = CrisisResponseToJson(composer.Compose(Verdict(9, CrisisType::SUICIDE_RISK)));

    EXPECT_EQ(json["crisis_level"], 9);
    EXPECT_EQ(json["urgency"], "immediate");
    EXPECT_TRUE(json["resources"].is_array());
    EXPECT_EQ(json["emergency_contacts"].size(), 2u);
    EXPECT_EQ(json["immediate_actions"].size(), 4u);
    EXPECT_TRUE(json["follow_up_required"].get<bool>());
}

TEST_F(ComposerTest, SelectorRejectsEmptyVariantList) {
    RotatingPhraseSelector rotating;
    SeededPhraseSelector seeded(1);
    EXPECT_THROW(rotating.Select("k", 0), std::invalid_argument);
    EXPECT_THROW(seeded.Select("k", 0), std::invalid_argument);
}

TEST_F(ComposerTest, DefaultDirectoryContents) {
    auto directory = ResourceDirectory::Defaults();
    EXPECT_EQ(directory.GetHotlines().size(), 3u);
    EXPECT_EQ(directory.GetHospitals().size(), 3u);
    EXPECT_EQ(directory.GetCounselingCenters().size(), 2u);
    EXPECT_EQ(directory.GetOnlineResources().size(), 2u);
    EXPECT_EQ(directory.GetEmergencyContacts().size(), 2u);
    EXPECT_EQ(directory.GetEntryCount(), 12u);
}

TEST_F(ComposerTest, ShippedResourceFileLoads) {
    ResourceDirectory directory;
    ASSERT_TRUE(directory.LoadFromYaml("config/resources.yaml"));
    EXPECT_EQ(directory.GetEntryCount(), 12u);
    EXPECT_EQ(directory.GetHospitals()[0].services.size(), 2u);
}

TEST_F(ComposerTest, MissingResourceFileKeepsDirectory) {
    auto directory = ResourceDirectory::Defaults();
    EXPECT_FALSE(directory.LoadFromYaml("config/does_not_exist.yaml"));
    EXPECT_EQ(directory.GetEntryCount(), 12u);
}
