#include <gtest/gtest.h>

#include "project_store.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace toolbridge;
using nlohmann::json;

namespace {

// /A/B, /A/C/D folders plus a few files
std::unique_ptr<project::ProjectStore> make_tree() {
    auto store = std::make_unique<project::ProjectStore>("demo");
    auto& a = store->root().add_folder("A");
    a.add_folder("B");
    a.add_folder("C").add_folder("D");
    return store;
}

std::unique_ptr<project::ProjectStore> make_programs() {
    auto store = std::make_unique<project::ProjectStore>("demo");
    auto& bin = store->root().add_folder("bin");
    bin.add_file("app.apk", "Program");
    bin.add_file("libnative.so", "Program");
    store->root().add_file("notes.txt", "File");
    return store;
}

std::vector<std::string> paths_of(const std::vector<json>& items) {
    std::vector<std::string> paths;
    for (size_t i = 1; i < items.size(); ++i) {
        paths.push_back(items[i]["path"].get<std::string>());
    }
    return paths;
}

} // namespace

TEST(ProjectTools, RecursiveListingVisitsEveryFolder) {
    TestServer server(make_tree());

    json response = server.call("list-project-files", {{"folderPath", "/"}, {"recursive", true}});

    ASSERT_TRUE(response.contains("result")) << response.dump();
    auto items = content_items(response);
    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(items[0]["itemCount"], 4);
    EXPECT_EQ(items[0]["isRecursive"], true);
    EXPECT_EQ(items[0]["truncated"], false);
    EXPECT_EQ(paths_of(items), (std::vector<std::string>{"A", "A/B", "A/C", "A/C/D"}));
    EXPECT_EQ(items[1]["type"], "folder");
    EXPECT_EQ(items[1]["childCount"], 2);
}

TEST(ProjectTools, FlatListingShowsDirectChildrenOnly) {
    TestServer server(make_tree());

    json response = server.call("list-project-files", {{"folderPath", "/"}});

    auto items = content_items(response);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0]["folderName"], "demo");
    EXPECT_EQ(paths_of(items), (std::vector<std::string>{"A"}));
}

TEST(ProjectTools, ListingOfSubfolderUsesRelativePaths) {
    TestServer server(make_tree());

    json response = server.call("list-project-files", {{"folderPath", "/A/C"}, {"recursive", true}});

    auto items = content_items(response);
    EXPECT_EQ(paths_of(items), (std::vector<std::string>{"D"}));
}

TEST(ProjectTools, ListingReportsFilesAfterFolders) {
    TestServer server(make_programs());

    json response = server.call("list-project-files", {{"folderPath", "/"}, {"recursive", true}});

    auto items = content_items(response);
    EXPECT_EQ(paths_of(items), (std::vector<std::string>{"bin", "bin/app.apk", "bin/libnative.so", "notes.txt"}));
    EXPECT_EQ(items[2]["type"], "file");
    EXPECT_EQ(items[2]["contentType"], "Program");
}

TEST(ProjectTools, ListingTruncatesAtMaxItems) {
    TestServer server(make_tree());
    server.config.max_items = 2;

    json response = server.call("list-project-files", {{"folderPath", "/"}, {"recursive", true}});

    auto items = content_items(response);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]["itemCount"], 2);
    EXPECT_EQ(items[0]["totalCount"], 4);
    EXPECT_EQ(items[0]["truncated"], true);
}

TEST(ProjectTools, ListingUnknownFolderIsNotFound) {
    TestServer server(make_tree());

    json response = server.call("list-project-files", {{"folderPath", "/nope"}});

    EXPECT_EQ(response["error"]["code"], -32002);
    EXPECT_EQ(response["error"]["message"], "Folder not found: /nope");
}

TEST(ProjectTools, OpenProgramBecomesCurrent) {
    TestServer server(make_programs());

    json none = server.call("get-current-program");
    EXPECT_EQ(none["error"]["code"], -32002);
    EXPECT_EQ(none["error"]["message"], "No programs are currently open");

    json opened = server.call("open-program", {{"programPath", "/bin/app.apk"}});
    ASSERT_TRUE(opened.contains("result")) << opened.dump();
    EXPECT_EQ(first_item(opened)["path"], "/bin/app.apk");

    server.call("open-program", {{"programPath", "bin/libnative.so"}});
    json current = server.call("get-current-program");
    EXPECT_EQ(first_item(current)["name"], "libnative.so");

    json listed = server.call("list-open-programs");
    auto items = content_items(listed);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]["count"], 2);
    EXPECT_EQ(items[1]["name"], "app.apk");
    EXPECT_EQ(items[2]["name"], "libnative.so");
}

TEST(ProjectTools, ReopeningProgramDoesNotDuplicateIt) {
    TestServer server(make_programs());
    server.call("open-program", {{"programPath", "/bin/app.apk"}});
    server.call("open-program", {{"programPath", "/bin/app.apk"}});

    auto items = content_items(server.call("list-open-programs"));
    EXPECT_EQ(items[0]["count"], 1);
}

TEST(ProjectTools, ListOpenProgramsWithNoneOpenIsNotFound) {
    TestServer server(make_programs());

    json response = server.call("list-open-programs");

    EXPECT_EQ(response["error"]["code"], -32002);
}

TEST(ProjectTools, CheckinAddsUnversionedProgram) {
    TestServer server(make_programs());

    json response = server.call("checkin-program", {{"programPath", "/bin/app.apk"}, {"message", "initial import"}});

    ASSERT_TRUE(response.contains("result")) << response.dump();
    json result = first_item(response);
    EXPECT_EQ(result["action"], "added_to_version_control");
    EXPECT_EQ(result["version"], 1);
    EXPECT_EQ(result["isCheckedOut"], true);
}

TEST(ProjectTools, CheckinCommitsModifiedProgram) {
    auto store = make_programs();
    auto* file = store->find_file("/bin/app.apk");
    file->add_to_version_control("v1", true);
    file->mark_modified();
    TestServer server(std::move(store));

    json response = server.call("checkin-program",
                                {{"programPath", "/bin/app.apk"}, {"message", "patched"}, {"keepCheckedOut", false}});

    json result = first_item(response);
    EXPECT_EQ(result["action"], "checked_in");
    EXPECT_EQ(result["version"], 2);
    EXPECT_EQ(result["isCheckedOut"], false);
}

TEST(ProjectTools, CheckinWithoutChangesExplainsWhy) {
    auto store = make_programs();
    store->find_file("/bin/app.apk")->add_to_version_control("v1", true);
    TestServer server(std::move(store));

    json response = server.call("checkin-program", {{"programPath", "/bin/app.apk"}, {"message", "nothing"}});

    EXPECT_EQ(response["error"]["code"], -1);
    EXPECT_EQ(response["error"]["message"], "Program has no changes since checkout: /bin/app.apk");
}

TEST(ProjectTools, CheckinNotCheckedOutExplainsWhy) {
    auto store = make_programs();
    store->find_file("/bin/app.apk")->add_to_version_control("v1", false);
    TestServer server(std::move(store));

    json response = server.call("checkin-program", {{"programPath", "/bin/app.apk"}, {"message", "edit"}});

    EXPECT_EQ(response["error"]["message"], "Program is not checked out and cannot be modified: /bin/app.apk");
}

TEST(ProjectTools, CheckinRejectsEmptyMessage) {
    TestServer server(make_programs());

    json response = server.call("checkin-program", {{"programPath", "/bin/app.apk"}, {"message", ""}});

    EXPECT_EQ(response["error"]["code"], -32602);
    EXPECT_EQ(response["error"]["data"]["parameter"], "message");
}

TEST(ProjectTools, LoadProjectDirectoryMirrorsTree) {
    TempDir dir;
    dir.write("apps/demo.apk", "PK");
    dir.write("apps/readme.md", "# demo");
    dir.mkdir("empty");

    auto store = project::load_project_directory(dir.path());

    ASSERT_NE(store->find_folder("/apps"), nullptr);
    ASSERT_NE(store->find_folder("/empty"), nullptr);
    auto* apk = store->find_file("/apps/demo.apk");
    ASSERT_NE(apk, nullptr);
    EXPECT_EQ(apk->content_type(), "Program");
    EXPECT_EQ(apk->size_bytes(), 2u);
    EXPECT_EQ(store->find_file("/apps/readme.md")->content_type(), "File");
}

TEST(ProjectTools, LoadMissingProjectDirectoryThrows) {
    TempDir dir;
    EXPECT_THROW(project::load_project_directory(dir.path() / "missing"), std::filesystem::filesystem_error);
}
