#pragma once

#include <string>
#include <vector>

namespace crisisguard {

struct Hotline {
    std::string name;
    std::string number;
    std::string description;
    std::string language;
};

struct Hospital {
    std::string name;
    std::string location;
    std::string phone;
    std::vector<std::string> services;
    std::string hours;
};

struct CounselingCenter {
    std::string name;
    std::string phone;
    std::string description;
    std::vector<std::string> services;
    std::string target;
};

struct OnlineResource {
    std::string name;
    std::string url;
    std::string description;
};

struct EmergencyContact {
    std::string name;
    std::string number;
    std::string available;
};

// Static help directory handed out with high-risk responses. Read-only once loaded.
class ResourceDirectory {
public:
    // Sultanate of Oman directory.
    static ResourceDirectory Defaults();

    // Replaces every section present in config/resources.yaml; absent sections
    // keep their current entries. Returns false and changes nothing on error.
    bool LoadFromYaml(const std::string& path);

    const std::vector<Hotline>& GetHotlines() const { return hotlines_; }
    const std::vector<Hospital>& GetHospitals() const { return hospitals_; }
    const std::vector<CounselingCenter>& GetCounselingCenters() const { return counseling_centers_; }
    const std::vector<OnlineResource>& GetOnlineResources() const { return online_resources_; }
    const std::vector<EmergencyContact>& GetEmergencyContacts() const { return emergency_contacts_; }

    size_t GetEntryCount() const;

private:
    std::vector<Hotline> hotlines_;
    std::vector<Hospital> hospitals_;
    std::vector<CounselingCenter> counseling_centers_;
    std::vector<OnlineResource> online_resources_;
    std::vector<EmergencyContact> emergency_contacts_;
};

} // namespace crisisguard
