#pragma once

#include "core/Config.hpp"
#include "engine/CrisisTypes.hpp"
#include "response/PhraseSelector.hpp"
#include "response/ResourceDirectory.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace crisisguard {

struct CrisisResponse {
    std::string message;
    int crisis_level{0};
    Urgency urgency{Urgency::NONE};
    std::vector<Hotline> resources;                  // only at the "high" threshold and above
    std::vector<EmergencyContact> emergency_contacts;
    std::vector<std::string> immediate_actions;
    bool follow_up_required{false};
};

class ResponseComposer {
public:
    ResponseComposer(std::shared_ptr<const ResourceDirectory> directory,
                     std::unique_ptr<PhraseSelector> selector,
                     Language language = Language::ARABIC,
                     const CrisisThresholds& thresholds = CrisisThresholds{});

    CrisisResponse Compose(const SafetyVerdict& verdict);

    std::string CulturalSupport(CrisisType crisis_type) const;
    std::vector<std::string> ImmediateActions(int crisis_level) const;

    // "suicide_risk", "self_harm_risk", "substance_abuse" or "generic"
    static std::string TemplateKey(CrisisType crisis_type);
    size_t GetVariantCount(const std::string& key) const;

private:
    const std::vector<std::string>& Variants(const std::string& key) const;

    std::shared_ptr<const ResourceDirectory> directory_;
    std::unique_ptr<PhraseSelector> selector_;
    Language language_;
    CrisisThresholds thresholds_;
};

nlohmann::json CrisisResponseToJson(const CrisisResponse& response);

} // namespace crisisguard
