// seed_activities.hpp
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "activity.hpp"

// The activities offered when no seed file is configured.
std::vector<Activity> default_activities();

// Builds activities from the same object shape GET /activities returns.
// Throws std::invalid_argument on a bad record and nlohmann::json::type_error
// on a field of the wrong type.
std::vector<Activity> activities_from_json(const nlohmann::json& doc);

// Reads and parses a seed file. Throws std::runtime_error if it cannot be read.
std::vector<Activity> load_activities_file(const std::string& path);
