#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "activity_api.hpp"
#include "seed_activities.hpp"
#include "static_files.hpp"

namespace fs = std::filesystem;
namespace http = boost::beast::http;

namespace {

class StaticFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("activities_static_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "css");
        write(root_ / "index.html", "<html>Mergington</html>");
        write(root_ / "css" / "styles.css", "body{}");
        write(root_.parent_path() / "activities_secret.txt", "secret");
    }

    void TearDown() override {
        fs::remove_all(root_);
        fs::remove(root_.parent_path() / "activities_secret.txt");
    }

    static void write(const fs::path& p, const std::string& text) {
        std::ofstream out(p, std::ios::binary);
        out << text;
    }

    fs::path root_;
};

} // namespace

TEST_F(StaticFilesTest, ResolvesFilesUnderRoot) {
    StaticFiles files(root_);
    auto p = files.resolve({ "index.html" });
    ASSERT_TRUE(p);
    EXPECT_EQ(p->filename(), "index.html");
    EXPECT_TRUE(files.resolve({ "css", "styles.css" }));
}

TEST_F(StaticFilesTest, RejectsEscapesAndDirectories) {
    StaticFiles files(root_);
    EXPECT_FALSE(files.resolve({}));
    EXPECT_FALSE(files.resolve({ "css" }));
    EXPECT_FALSE(files.resolve({ "..", "activities_secret.txt" }));
    EXPECT_FALSE(files.resolve({ "css", "..", "index.html" }));
    EXPECT_FALSE(files.resolve({ "../activities_secret.txt" }));
    EXPECT_FALSE(files.resolve({ "missing.js" }));
}

TEST_F(StaticFilesTest, MimeTypes) {
    EXPECT_EQ(mime_type_for("a/index.HTML"), "text/html; charset=utf-8");
    EXPECT_EQ(mime_type_for("app.js"), "text/javascript; charset=utf-8");
    EXPECT_EQ(mime_type_for("logo.png"), "image/png");
    EXPECT_EQ(mime_type_for("blob.bin"), "application/octet-stream");
}

TEST_F(StaticFilesTest, ServedThroughApi) {
    ActivityRegistry registry(default_activities());
    ActivityApi api(registry, std::make_shared<StaticFiles>(root_));

    HttpRequest get{http::verb::get, "/static/index.html", 11};
    auto res = api.handle(get);
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "<html>Mergington</html>");
    EXPECT_EQ(res[http::field::content_type], "text/html; charset=utf-8");

    HttpRequest head{http::verb::head, "/static/css/styles.css", 11};
    res = api.handle(head);
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(res.body().empty());
    EXPECT_EQ(res[http::field::content_length], "6");

    HttpRequest traversal{http::verb::get, "/static/%2E%2E/activities_secret.txt", 11};
    EXPECT_EQ(api.handle(traversal).result(), http::status::not_found);

    HttpRequest post{http::verb::post, "/static/index.html", 11};
    EXPECT_EQ(api.handle(post).result(), http::status::method_not_allowed);
}
