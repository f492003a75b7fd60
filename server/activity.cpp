// activity.cpp
#include "activity.hpp"
#include <algorithm>

bool Activity::has_participant(const std::string& email) const {
    return std::find(participants.begin(), participants.end(), email) != participants.end();
}

void to_json(nlohmann::json& j, const Activity& activity) {
    j = nlohmann::json{
        {"description", activity.description},
        {"schedule", activity.schedule},
        {"max_participants", activity.max_participants},
        {"participants", activity.participants}
    };
}
