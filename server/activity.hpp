// activity.hpp
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Activity {
    std::string name;
    std::string description;
    std::string schedule;
    int max_participants = 0;
    std::vector<std::string> participants; // unique, in signup order

    bool has_participant(const std::string& email) const;
    bool is_full() const { return static_cast<int>(participants.size()) >= max_participants; }
};

// The listing form omits the name; it is the key of the enclosing object.
void to_json(nlohmann::json& j, const Activity& activity);
