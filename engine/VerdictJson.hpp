#pragma once

#include "engine/CrisisEngine.hpp"
#include "engine/CrisisTypes.hpp"
#include <nlohmann/json.hpp>

namespace crisisguard {

nlohmann::json VerdictToJson(const SafetyVerdict& verdict);
nlohmann::json AssessmentToJson(const EscalationAssessment& assessment);
nlohmann::json HealthToJson(const EngineHealth& health);

nlohmann::json CrisisEventToJson(const CrisisEvent& event);

nlohmann::json CategoriesToJson(const std::vector<RiskCategory>& categories);
// Unknown category names are dropped.
std::vector<RiskCategory> CategoriesFromJson(const nlohmann::json& j);

} // namespace crisisguard
