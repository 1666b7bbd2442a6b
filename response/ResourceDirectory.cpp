#include "response/ResourceDirectory.hpp"
#include "core/Logger.hpp"
#include <yaml-cpp/yaml.h>

namespace crisisguard {

namespace {

std::string ReadString(const YAML::Node& node, const char* key) {
    return node[key] ? node[key].as<std::string>() : std::string();
}

std::vector<std::string> ReadStringList(const YAML::Node& node, const char* key) {
    std::vector<std::string> out;
    if (node[key]) {
        for (const auto& item : node[key]) {
            out.push_back(item.as<std::string>());
        }
    }
    return out;
}

} // namespace

ResourceDirectory ResourceDirectory::Defaults() {
    ResourceDirectory directory;

    directory.hotlines_ = {
        {"خط المساعدة النفسية - وزارة الصحة", "80077", "خدمة مجانية متاحة 24/7", "العربية"},
        {"الطوارئ العامة", "999", "للحالات الطارئة التي تهدد الحياة", "العربية والإنجليزية"},
        {"الهلال الأحمر العماني", "999", "خدمات الإسعاف والطوارئ الطبية", "العربية"},
    };

    directory.hospitals_ = {
        {"مستشفى الجامعة", "مسقط", "+968-24141414", {"طب نفسي", "طوارئ نفسية"}, "24/7"},
        {"مستشفى خولة", "مسقط", "+968-24560300", {"طوارئ عامة", "طب نفسي"}, "24/7"},
        {"المستشفى الوطني", "مسقط", "+968-24583600", {"طب نفسي", "علاج الإدمان"}, "متاح بالمواعيد"},
    };

    directory.counseling_centers_ = {
        {"مركز الإرشاد النفسي - جامعة السلطان قابوس", "+968-24141111", "",
         {"إرشاد نفسي", "استشارات أسرية"}, "طلاب وأفراد المجتمع"},
        {"مراكز الرعاية الصحية الأولية", "", "متوفرة في جميع المحافظات",
         {"استشارات نفسية أولية", "تحويل للمتخصصين"}, ""},
    };

    directory.online_resources_ = {
        {"موقع وزارة الصحة العمانية", "https://www.moh.gov.om", "معلومات عن الخدمات النفسية"},
        {"تطبيق صحتك", "", "تطبيق وزارة الصحة للاستشارات الطبية"},
    };

    directory.emergency_contacts_ = {
        {"خط المساعدة النفسية", "80077", "24/7"},
        {"الطوارئ", "999", "24/7"},
    };

    return directory;
}

bool ResourceDirectory::LoadFromYaml(const std::string& path) {
    ResourceDirectory loaded = *this;

    try {
        const YAML::Node root = YAML::LoadFile(path);

        if (const YAML::Node node = root["hotlines"]) {
            loaded.hotlines_.clear();
            for (const auto& item : node) {
                Hotline hotline;
                hotline.name = ReadString(item, "name");
                hotline.number = ReadString(item, "number");
                hotline.description = ReadString(item, "description");
                hotline.language = ReadString(item, "language");
                if (hotline.name.empty() || hotline.number.empty()) {
                    LOG_WARN("Skipping hotline without name or number in {}", path);
                    continue;
                }
                loaded.hotlines_.push_back(std::move(hotline));
            }
        }

        if (const YAML::Node node = root["hospitals"]) {
            loaded.hospitals_.clear();
            for (const auto& item : node) {
                Hospital hospital;
                hospital.name = ReadString(item, "name");
                hospital.location = ReadString(item, "location");
                hospital.phone = ReadString(item, "phone");
                hospital.services = ReadStringList(item, "services");
                hospital.hours = ReadString(item, "hours");
                if (hospital.name.empty()) {
                    LOG_WARN("Skipping hospital without name in {}", path);
                    continue;
                }
                loaded.hospitals_.push_back(std::move(hospital));
            }
        }

        if (const YAML::Node node = root["counseling_centers"]) {
            loaded.counseling_centers_.clear();
            for (const auto& item : node) {
                CounselingCenter center;
                center.name = ReadString(item, "name");
                center.phone = ReadString(item, "phone");
                center.description = ReadString(item, "description");
                center.services = ReadStringList(item, "services");
                center.target = ReadString(item, "target");
                if (center.name.empty()) {
                    LOG_WARN("Skipping counseling center without name in {}", path);
                    continue;
                }
                loaded.counseling_centers_.push_back(std::move(center));
            }
        }

        if (const YAML::Node node = root["online_resources"]) {
            loaded.online_resources_.clear();
            for (const auto& item : node) {
                OnlineResource resource;
                resource.name = ReadString(item, "name");
                resource.url = ReadString(item, "url");
                resource.description = ReadString(item, "description");
                if (resource.name.empty()) {
                    continue;
                }
                loaded.online_resources_.push_back(std::move(resource));
            }
        }

        if (const YAML::Node node = root["emergency_contacts"]) {
            loaded.emergency_contacts_.clear();
            for (const auto& item : node) {
                EmergencyContact contact;
                contact.name = ReadString(item, "name");
                contact.number = ReadString(item, "number");
                contact.available = ReadString(item, "available");
                if (contact.name.empty() || contact.number.empty()) {
                    LOG_WARN("Skipping emergency contact without name or number in {}", path);
                    continue;
                }
                loaded.emergency_contacts_.push_back(std::move(contact));
            }
        }
    } catch (const YAML::Exception& ex) {
        LOG_ERROR("Failed to parse resource directory {}: {}", path, ex.what());
        return false;
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to load resource directory {}: {}", path, ex.what());
        return false;
    }

    *this = std::move(loaded);
    LOG_INFO("Loaded resource directory from {} ({} entries)", path, GetEntryCount());
    return true;
}

size_t ResourceDirectory::GetEntryCount() const {
    return hotlines_.size() + hospitals_.size() + counseling_centers_.size() +
           online_resources_.size() + emergency_contacts_.size();
}

} // namespace crisisguard
