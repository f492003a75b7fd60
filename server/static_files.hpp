// static_files.hpp
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

// Serves the front-end below /static/ from a directory on disk.
class StaticFiles {
public:
    explicit StaticFiles(std::filesystem::path root);

    // Maps decoded path segments (after "static") to a regular file under the
    // root. Returns nullopt for ".." segments, directories and missing files.
    std::optional<std::filesystem::path> resolve(const std::vector<std::string>& segments) const;

    HttpResponse serve(const HttpRequest& req, const std::vector<std::string>& segments) const;


private:
    std::filesystem::path root_;
};

std::string mime_type_for(const std::filesystem::path& path);
