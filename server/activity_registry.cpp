// activity_registry.cpp
#include "activity_registry.hpp"
#include "logger.hpp"
#include <algorithm>

const char* to_string(RegistryStatus status) {
    switch (status) {
        case RegistryStatus::Ok: return "ok";
        case RegistryStatus::ActivityNotFound: return "activity_not_found";
        case RegistryStatus::AlreadySignedUp: return "already_signed_up";
        case RegistryStatus::NotSignedUp: return "not_signed_up";
        case RegistryStatus::ActivityFull: return "activity_full";
    }
    return "unknown";
}

ActivityRegistry::ActivityRegistry(bool enforce_capacity)
    : enforce_capacity_(enforce_capacity) {}

ActivityRegistry::ActivityRegistry(std::vector<Activity> activities, bool enforce_capacity)
    : enforce_capacity_(enforce_capacity) {
    reset(std::move(activities));
}

void ActivityRegistry::reset(std::vector<Activity> activities) {
    std::lock_guard<std::mutex> lk(activities_mutex_);
    activities_.clear();
    for (auto& activity : activities) {
        std::string name = activity.name;
        if (!activities_.emplace(name, std::move(activity)).second) {
            Logger::instance().warn("Duplicate activity dropped", { {"activity", name} });
        }
    }
    Logger::instance().info("Activity registry loaded", { {"activities", static_cast<uint64_t>(activities_.size())}, {"enforce_capacity", enforce_capacity_} });
}

std::map<std::string, Activity> ActivityRegistry::list() const {
    std::lock_guard<std::mutex> lk(activities_mutex_);
    return activities_;
}

std::optional<Activity> ActivityRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lk(activities_mutex_);
    auto it = activities_.find(name);
    if (it == activities_.end()) return std::nullopt;
    return it->second;
}

std::size_t ActivityRegistry::size() const {
    std::lock_guard<std::mutex> lk(activities_mutex_);
    return activities_.size();
}

RegistryStatus ActivityRegistry::signup(const std::string& activity_name, const std::string& email) {
    std::lock_guard<std::mutex> lk(activities_mutex_);
    auto it = activities_.find(activity_name);
    if (it == activities_.end()) {
        Logger::instance().warn("Signup failed - no such activity", { {"activity", activity_name} });
        return RegistryStatus::ActivityNotFound;
    }
    Activity& activity = it->second;
    if (activity.has_participant(email)) {
        Logger::instance().warn("Signup failed - already signed up", { {"activity", activity_name}, {"email", email} });
        return RegistryStatus::AlreadySignedUp;
    }
    if (enforce_capacity_ && activity.is_full()) {
        Logger::instance().warn("Signup failed - activity full", { {"activity", activity_name}, {"max_participants", activity.max_participants} });
        return RegistryStatus::ActivityFull;
    }
    activity.participants.push_back(email);
    Logger::instance().info("Participant signed up", { {"activity", activity_name}, {"email", email}, {"participants", static_cast<uint64_t>(activity.participants.size())} });
    return RegistryStatus::Ok;
}

RegistryStatus ActivityRegistry::unregister(const std::string& activity_name, const std::string& email) {
    std::lock_guard<std::mutex> lk(activities_mutex_);
    auto it = activities_.find(activity_name);
    if (it == activities_.end()) {
        Logger::instance().warn("Unregister failed - no such activity", { {"activity", activity_name} });
        return RegistryStatus::ActivityNotFound;
    }
    auto& roster = it->second.participants;
    auto pos = std::find(roster.begin(), roster.end(), email);
    if (pos == roster.end()) {
        Logger::instance().warn("Unregister failed - not signed up", { {"activity", activity_name}, {"email", email} });
        return RegistryStatus::NotSignedUp;
    }
    roster.erase(pos);
    Logger::instance().info("Participant unregistered", { {"activity", activity_name}, {"email", email}, {"participants", static_cast<uint64_t>(roster.size())} });
    return RegistryStatus::Ok;
}
