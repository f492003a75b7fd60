// activity_registry.hpp
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "activity.hpp"

enum class RegistryStatus {
    Ok,
    ActivityNotFound,
    AlreadySignedUp,
    NotSignedUp,
    ActivityFull
};

const char* to_string(RegistryStatus status);

// In-memory activity registry shared by all sessions. A single mutex guards
// every roster, so each signup/unregister is an atomic check-and-mutate.
class ActivityRegistry {
public:
    explicit ActivityRegistry(bool enforce_capacity = false);
    ActivityRegistry(std::vector<Activity> activities, bool enforce_capacity = false);

    // Replaces the whole activity set. Later duplicates of a name are dropped.
    void reset(std::vector<Activity> activities);

    std::map<std::string, Activity> list() const;
    std::optional<Activity> find(const std::string& name) const;
    std::size_t size() const;

    RegistryStatus signup(const std::string& activity_name, const std::string& email);
    RegistryStatus unregister(const std::string& activity_name, const std::string& email);

    bool enforces_capacity() const { return enforce_capacity_; }

private:
    mutable std::mutex activities_mutex_;
    std::map<std::string, Activity> activities_;
    const bool enforce_capacity_;
};
