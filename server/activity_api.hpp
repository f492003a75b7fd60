// activity_api.hpp
#pragma once
#include <map>
#include <memory>
#include <string>
#include "protocol.hpp"
#include "activity_registry.hpp"
#include "static_files.hpp"

// Maps HTTP requests onto registry operations:
//   GET    /                              -> 307 /static/index.html
//   GET    /activities                    -> full listing
//   POST   /activities/{name}/signup      -> ?email= required
//   DELETE /activities/{name}/unregister  -> ?email= required
//   GET    /static/...                    -> front-end files, when configured
// handle() never throws for a well-formed request object; anything unexpected
// is reported as 500.
class ActivityApi {
public:
    explicit ActivityApi(ActivityRegistry& registry,
                         std::shared_ptr<const StaticFiles> static_files = nullptr);

    HttpResponse handle(const HttpRequest& req) const;

private:
    HttpResponse route(const HttpRequest& req) const;
    HttpResponse list_activities(const HttpRequest& req) const;
    HttpResponse signup(const HttpRequest& req, const std::string& activity_name,
                        const std::map<std::string, std::string>& query) const;
    HttpResponse unregister(const HttpRequest& req, const std::string& activity_name,
                            const std::map<std::string, std::string>& query) const;
    HttpResponse registry_failure(const HttpRequest& req, RegistryStatus status) const;
    HttpResponse method_not_allowed(const HttpRequest& req, const std::string& allow) const;

    ActivityRegistry& registry_;
    std::shared_ptr<const StaticFiles> static_files_;
};
