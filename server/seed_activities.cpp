// seed_activities.cpp
#include "seed_activities.hpp"
#include "logger.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

std::vector<Activity> default_activities() {
    return {
        { "Chess Club",
          "Learn strategies and compete in chess tournaments",
          "Fridays, 3:30 PM - 5:00 PM", 12,
          { "michael@mergington.edu", "daniel@mergington.edu" } },
        { "Programming Class",
          "Learn programming fundamentals and build software projects",
          "Tuesdays and Thursdays, 3:30 PM - 4:30 PM", 20,
          { "emma@mergington.edu", "sophia@mergington.edu" } },
        { "Gym Class",
          "Physical education and sports activities",
          "Mondays, Wednesdays, Fridays, 2:00 PM - 3:00 PM", 30,
          { "john@mergington.edu", "olivia@mergington.edu" } },
        { "Soccer Team",
          "Join the school soccer team and compete in matches",
          "Tuesdays and Thursdays, 4:00 PM - 5:30 PM", 22,
          { "liam@mergington.edu", "noah@mergington.edu" } },
        { "Basketball Team",
          "Practice and play basketball with the school team",
          "Wednesdays and Fridays, 3:30 PM - 5:00 PM", 15,
          { "ava@mergington.edu", "mia@mergington.edu" } },
        { "Art Club",
          "Explore your creativity through painting and drawing",
          "Thursdays, 3:30 PM - 5:00 PM", 15,
          { "amelia@mergington.edu", "harper@mergington.edu" } },
        { "Drama Club",
          "Act, direct, and produce plays and performances",
          "Mondays and Wednesdays, 4:00 PM - 5:30 PM", 20,
          { "ella@mergington.edu", "scarlett@mergington.edu" } },
        { "Math Club",
          "Solve challenging problems and participate in math competitions",
          "Tuesdays, 3:30 PM - 4:30 PM", 10,
          { "james@mergington.edu", "benjamin@mergington.edu" } },
        { "Debate Team",
          "Develop public speaking and argumentation skills",
          "Fridays, 4:00 PM - 5:30 PM", 12,
          { "charlotte@mergington.edu", "henry@mergington.edu" } },
    };
}

std::vector<Activity> activities_from_json(const json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("activities document must be a JSON object keyed by activity name");
    }
    std::vector<Activity> out;
    out.reserve(doc.size());
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const json& record = it.value();
        Activity activity;
        activity.name = it.key();
        activity.description = record.value("description", "");
        activity.schedule = record.value("schedule", "");
        activity.max_participants = record.at("max_participants").get<int>();
        if (activity.max_participants <= 0) {
            throw std::invalid_argument("activity '" + activity.name + "': max_participants must be positive");
        }
        if (record.contains("participants")) {
            for (const auto& email : record.at("participants")) {
                std::string e = email.get<std::string>();
                if (activity.has_participant(e)) {
                    throw std::invalid_argument("activity '" + activity.name + "': duplicate participant " + e);
                }
                activity.participants.push_back(std::move(e));
            }
        }
        if (static_cast<int>(activity.participants.size()) > activity.max_participants) {
            Logger::instance().warn("Seeded roster exceeds capacity", { {"activity", activity.name}, {"participants", static_cast<uint64_t>(activity.participants.size())}, {"max_participants", activity.max_participants} });
        }
        out.push_back(std::move(activity));
    }
    return out;
}

std::vector<Activity> load_activities_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open activities file: " + path);
    }
    json doc = json::parse(in);
    auto activities = activities_from_json(doc);
    Logger::instance().info("Activities file loaded", { {"path", path}, {"activities", static_cast<uint64_t>(activities.size())} });
    return activities;
}
