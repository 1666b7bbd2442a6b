#include "response/ResponseComposer.hpp"
#include <map>
#include <stdexcept>

namespace crisisguard {

namespace {

using TemplateTable = std::map<std::string, std::vector<std::string>>;

const TemplateTable& ArabicTemplates() {
    static const TemplateTable table = {
        {"suicide_risk", {
            "أشكرك على ثقتك ومشاركتي ما تشعر به. ما تمر به الآن مؤلم جداً، وسلامتك هي أهم شيء في هذه اللحظة.\n"
            "أنت لست وحيداً، وهناك من يريد مساعدتك الآن. هل أنت في أمان في هذه اللحظة؟",
            "أسمعك، وأقدر صعوبة ما تشعر به. التفكير في إنهاء الحياة يعني أن ألمك كبير، لكنه لا يعني أنه لا يوجد مخرج.\n"
            "دعنا نتأكد من سلامتك أولاً، ثم نبحث معاً عن المساعدة المناسبة.",
        }},
        {"self_harm_risk", {
            "أقدر صراحتك معي. الرغبة في إيذاء نفسك علامة على ألم كبير تحمله، وأنت تستحق الرعاية لا الألم.\n"
            "هل يمكنك أن تبتعد الآن عن أي شيء قد تؤذي به نفسك؟",
            "شكراً لأنك أخبرتني. أنت تستحق أن تُعامل بلطف، حتى من نفسك.\n"
            "لنجد معاً طريقة أخرى للتعامل مع هذا الألم، ويمكن لمختص أن يساعدك في ذلك.",
        }},
        {"substance_abuse", {
            "أقدر شجاعتك في الحديث عن هذا الموضوع. التعامل مع المخدرات أو الكحول صعب، لكن التعافي ممكن.\n"
            "هناك مختصون يمكنهم مساعدتك دون أحكام، وأول خطوة هي طلب المساعدة.",
            "شكراً لمشاركتك. الاعتماد على المواد ليس ضعفاً في شخصيتك، بل حالة يمكن علاجها.\n"
            "هل تود أن نتحدث عن مصادر الدعم المتاحة لك؟",
        }},
        {"generic", {
            "أقدر شجاعتك في مشاركة هذه المشاعر الصعبة معي.\n"
            "أريدك أن تعلم أنك لست وحيداً، وأن هناك أشخاصاً يهتمون بك ويريدون مساعدتك.\n"
            "هذه المشاعر التي تمر بها الآن قاسية، لكنها مؤقتة ويمكن التعامل معها.",
            "شكراً لأنك شاركتني ما تمر به. مشاعرك مهمة، ومن حقك أن تحصل على الدعم.\n"
            "لنأخذ الأمور خطوة بخطوة، وأنا هنا معك.",
        }},
    };
    return table;
}

const TemplateTable& EnglishTemplates() {
    static const TemplateTable table = {
        {"suicide_risk", {
            "Thank you for trusting me with what you are feeling. What you are going through is very painful, "
            "and your safety matters most right now.\n"
            "You are not alone, and there are people who want to help you now. Are you safe at this moment?",
            "I hear you, and I know how hard this is. Thinking about ending your life means your pain is "
            "enormous, not that there is no way through.\n"
            "Let's make sure you are safe first, then find the right help together.",
        }},
        {"self_harm_risk", {
            "I appreciate you being honest with me. Wanting to hurt yourself is a sign of how much pain you "
            "are carrying, and you deserve care, not pain.\n"
            "Can you move away from anything you might use to hurt yourself right now?",
            "Thank you for telling me. You deserve kindness, including from yourself.\n"
            "Let's find another way to cope with this pain together; a specialist can help with that.",
        }},
        {"substance_abuse", {
            "It takes courage to talk about this. Struggling with drugs or alcohol is hard, but recovery "
            "is possible.\n"
            "There are specialists who can help without judgement, and asking for help is the first step.",
            "Thank you for sharing this. Depending on a substance is not a flaw in your character; it is a "
            "condition that can be treated.\n"
            "Would you like to talk about the support available to you?",
        }},
        {"generic", {
            "I appreciate your courage in sharing these difficult feelings with me.\n"
            "I want you to know that you are not alone, and that there are people who care about you and "
            "want to help.\n"
            "What you are feeling right now is harsh, but it is temporary and it can be dealt with.",
            "Thank you for sharing what you are going through. Your feelings matter, and you deserve "
            "support.\n"
            "Let's take things one step at a time. I am here with you.",
        }},
    };
    return table;
}

} // namespace

ResponseComposer::ResponseComposer(std::shared_ptr<const ResourceDirectory> directory,
                                   std::unique_ptr<PhraseSelector> selector,
                                   Language language,
                                   const CrisisThresholds& thresholds)
    : directory_(std::move(directory)),
      selector_(std::move(selector)),
      language_(language),
      thresholds_(thresholds) {
    if (!directory_ || !selector_) {
        throw std::invalid_argument("ResponseComposer requires a resource directory and a phrase selector");
    }
}

std::string ResponseComposer::TemplateKey(CrisisType crisis_type) {
    switch (crisis_type) {
        case CrisisType::SUICIDE_RISK:    return "suicide_risk";
        case CrisisType::SELF_HARM_RISK:  return "self_harm_risk";
        case CrisisType::SUBSTANCE_ABUSE: return "substance_abuse";
        default:                          return "generic";
    }
}

const std::vector<std::string>& ResponseComposer::Variants(const std::string& key) const {
    const TemplateTable& table = language_ == Language::ENGLISH ? EnglishTemplates() : ArabicTemplates();
    auto it = table.find(key);
    return it != table.end() ? it->second : table.at("generic");
}

size_t ResponseComposer::GetVariantCount(const std::string& key) const {
    return Variants(key).size();
}

CrisisResponse ResponseComposer::Compose(const SafetyVerdict& verdict) {
    CrisisResponse response;
    response.crisis_level = verdict.crisis_level;
    response.urgency = verdict.urgency;

    const std::string key = TemplateKey(verdict.crisis_type);
    const auto& variants = Variants(key);
    const std::string& base = variants[selector_->Select(key, variants.size())];
    response.message = base + "\n\n" + CulturalSupport(verdict.crisis_type);

    if (verdict.crisis_level >= thresholds_.high) {
        response.resources = directory_->GetHotlines();
        response.emergency_contacts = directory_->GetEmergencyContacts();
    }

    response.immediate_actions = ImmediateActions(verdict.crisis_level);
    response.follow_up_required = verdict.crisis_level >= thresholds_.medium;
    return response;
}

std::string ResponseComposer::CulturalSupport(CrisisType crisis_type) const {
    if (language_ == Language::ENGLISH) {
        const std::string base =
            "In our faith and culture, life is a sacred trust, and reaching out for help is a "
            "strength, not a weakness.";
        if (crisis_type == CrisisType::SUICIDE_RISK) {
            return base + "\n\n"
                "Remember that:\n"
                "• God says: \"Do not kill yourselves; indeed God is ever merciful to you\"\n"
                "• Your life is a trust from God, and you are responsible for protecting it\n"
                "• With hardship comes ease; this is God's promise\n"
                "• Your family and friends love you and need you\n\n"
                "Please reach out to:\n"
                "• A mosque imam or a sheikh you trust\n"
                "• Your family members or close friends\n"
                "• The mental health helpline: 80077";
        }
        return base + "\n\n"
            "God says: \"Whoever saves one life, it is as if he had saved all of mankind\"\n"
            "You deserve life and happiness, and there is always hope.\n\n"
            "Do not hesitate to ask for help from:\n"
            "• Family and friends\n"
            "• Mental health professionals\n"
            "• Your religious community";
    }

    const std::string base =
        "في ديننا وثقافتنا، حياة الإنسان أمانة عظيمة، وطلب المساعدة قوة وليس ضعفاً.";
    if (crisis_type == CrisisType::SUICIDE_RISK) {
        return base + "\n\n"
            "تذكر أن:\n"
            "• الله سبحانه وتعالى قال: \"ولا تقتلوا أنفسكم إن الله كان بكم رحيماً\"\n"
            "• حياتك أمانة من الله، وأنت مسؤول عن المحافظة عليها\n"
            "• مع العسر يسراً، وهذا وعد من الله\n"
            "• أهلك وأصدقاؤك يحبونك ويحتاجونك\n\n"
            "أرجوك تواصل مع:\n"
            "• إمام المسجد أو شيخ تثق به\n"
            "• أفراد أسرتك أو أصدقائك المقربين\n"
            "• خط المساعدة النفسية: 80077";
    }
    return base + "\n\n"
        "الله سبحانه وتعالى يقول: \"ومن أحياها فكأنما أحيا الناس جميعاً\"\n"
        "أنت تستحق الحياة والسعادة، وهناك أمل دائماً.\n\n"
        "لا تتردد في طلب المساعدة من:\n"
        "• الأسرة والأصدقاء\n"
        "• المختصين في الصحة النفسية\n"
        "• المجتمع الديني";
}

std::vector<std::string> ResponseComposer::ImmediateActions(int crisis_level) const {
    const bool english = language_ == Language::ENGLISH;

    if (crisis_level >= thresholds_.critical) {
        if (english) {
            return {"Call emergency services (999) immediately",
                    "Do not leave the person alone",
                    "Remove anything that could be used for self-harm",
                    "Transfer to hospital if needed"};
        }
        return {"الاتصال بالطوارئ (999) فوراً",
                "عدم ترك الشخص وحيداً",
                "إزالة أي وسائل يمكن استخدامها للإيذاء",
                "النقل للمستشفى إذا لزم الأمر"};
    }

    if (crisis_level >= thresholds_.high) {
        if (english) {
            return {"Call the mental health helpline (80077)",
                    "Involve a trusted person (family or friend)",
                    "Arrange an urgent visit to a specialist",
                    "Keep following up for the next 24-48 hours"};
        }
        return {"الاتصال بخط المساعدة النفسية (80077)",
                "إشراك شخص موثوق (أسرة/صديق)",
                "ترتيب زيارة عاجلة لمختص",
                "المتابعة المستمرة لمدة 24-48 ساعة"};
    }

    if (crisis_level >= thresholds_.medium) {
        if (english) {
            return {"Book an appointment with a mental health professional",
                    "Let a trusted person know what is happening",
                    "Remove immediate sources of stress",
                    "Practise self-soothing techniques"};
        }
        return {"جدولة موعد مع مختص نفسي",
                "إعلام شخص موثوق بالوضع",
                "إزالة مسببات الضغط الفورية",
                "تطبيق تقنيات التهدئة الذاتية"};
    }

    if (english) {
        return {"Strengthen your social support network",
                "Do calming activities",
                "Keep regular check-ins on your wellbeing"};
    }
    return {"تعزيز شبكة الدعم الاجتماعي",
            "ممارسة أنشطة مهدئة",
            "المتابعة الدورية للحالة النفسية"};
}

nlohmann::json CrisisResponseToJson(const CrisisResponse& response) {
    nlohmann::json j;
    j["message"] = response.message;
    j["crisis_level"] = response.crisis_level;
    j["urgency"] = UrgencyToString(response.urgency);

    nlohmann::json resources = nlohmann::json::array();
    for (const auto& hotline : response.resources) {
        resources.push_back({
            {"name", hotline.name},
            {"number", hotline.number},
            {"description", hotline.description},
            {"language", hotline.language}
        });
    }
    j["resources"] = resources;

    nlohmann::json contacts = nlohmann::json::array();
    for (const auto& contact : response.emergency_contacts) {
        contacts.push_back({
            {"name", contact.name},
            {"number", contact.number},
            {"available", contact.available}
        });
    }
    j["emergency_contacts"] = contacts;

    j["immediate_actions"] = response.immediate_actions;
    j["follow_up_required"] = response.follow_up_required;
    return j;
}

} // namespace crisisguard
