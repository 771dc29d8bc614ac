#ifndef USERRECORD_HPP
#define USERRECORD_HPP

#include <cstdint>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

// --- Record owned by the backing store and cached by id ---
class UserRecord {
public:
    std::string id;
    std::string name;
    std::string email;
    std::string role = "member";
    bool active = true;
    // Bumped by the store on every persist.
    int64_t version = 0;

    bool operator==(const UserRecord& other) const {
        return id == other.id && name == other.name && email == other.email
            && role == other.role && active == other.active && version == other.version;
    }
    bool operator!=(const UserRecord& other) const { return !(*this == other); }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "UserRecord { Id: " << id
            << ", Name: " << name
            << ", Email: " << email
            << ", Role: " << role
            << ", Active: " << std::boolalpha << active
            << ", Version: " << version << " }";
        return oss.str();
    }
};

inline void to_json(nlohmann::json& j, const UserRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"name", record.name},
        {"email", record.email},
        {"role", record.role},
        {"active", record.active},
        {"version", record.version}
    };
}

// id and name are required; the rest fall back to defaults.
inline void from_json(const nlohmann::json& j, UserRecord& record) {
    j.at("id").get_to(record.id);
    j.at("name").get_to(record.name);
    record.email = j.value("email", std::string());
    record.role = j.value("role", std::string("member"));
    record.active = j.value("active", true);
    record.version = j.value("version", static_cast<int64_t>(0));
}

// Cache key of a record.
inline std::string userKey(const UserRecord& record) {
    return record.id;
}

#endif // USERRECORD_HPP
