#include <gtest/gtest.h>
#include "group_list_sync.hpp"
#include "fake_http_client.hpp"
#include "log_capture.hpp"

#include <memory>

namespace {

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
    return root;
}

Group group(int id, const std::string& name, std::optional<std::string> comment = std::nullopt, bool enabled = true) {
    Group g;
    g.id = id;
    g.name = name;
    g.comment = std::move(comment);
    g.enabled = enabled;
    return g;
}

AdList list(const std::string& address, std::vector<int> groups, const std::string& type = "block") {
    AdList l;
    l.id = 1;
    l.address = address;
    l.type = type;
    l.groups = std::move(groups);
    return l;
}

} // namespace

TEST(ResolveListGroupsTest, MapsIdsByName) {
    const std::map<int, std::string> mainNames{{0, "Default"}, {4, "kids"}, {7, "iot"}};
    const std::map<std::string, int> secondaryIds{{"Default", 0}, {"kids", 2}, {"iot", 9}};
    std::vector<std::string> warnings;

    EXPECT_EQ(resolveListGroups(list("a", {7, 4, 4}), mainNames, secondaryIds, true, "pi2:443", warnings),
              (std::vector<int>{2, 9}));
    EXPECT_TRUE(warnings.empty());
}

TEST(ResolveListGroupsTest, EmptyGroupsMeanDefaultGroup) {
    std::vector<std::string> warnings;
    EXPECT_EQ(resolveListGroups(list("a", {}), {{0, "Default"}}, {{"Default", 0}}, true, "pi2:443", warnings),
              (std::vector<int>{0}));
    EXPECT_EQ(resolveListGroups(list("a", {}), {}, {}, false, "pi2:443", warnings), (std::vector<int>{0}));
    EXPECT_TRUE(warnings.empty());
}

TEST(ResolveListGroupsTest, WithoutGroupSyncEverythingLandsInGroupZero) {
    LogCapture log;
    std::vector<std::string> warnings;
    const std::map<int, std::string> mainNames{{0, "Default"}, {4, "kids"}};

    EXPECT_EQ(resolveListGroups(list("https://example.com/hosts", {0, 4}), mainNames, {}, false, "pi2:443", warnings),
              (std::vector<int>{0}));
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("https://example.com/hosts"), std::string::npos);
    EXPECT_TRUE(log.contains("default group"));
}

TEST(ResolveListGroupsTest, MissingGroupFallsBackToDefault) {
    std::vector<std::string> warnings;
    const std::map<int, std::string> mainNames{{0, "Default"}, {4, "kids"}};
    const std::map<std::string, int> secondaryIds{{"Default", 0}};

    EXPECT_EQ(resolveListGroups(list("a", {4}), mainNames, secondaryIds, true, "pi2:443", warnings),
              (std::vector<int>{0}));
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("'kids'"), std::string::npos);
}

class GroupListSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        instance.host = "pi2.lan";
        instance.apiKey = "second";
        client->acceptLogin("pi2.lan");
        client->on("pi2.lan", "POST /api/groups", 201, "{}");
        client->on("pi2.lan", "POST /api/lists?type=block", 201, "{}");
        client->on("pi2.lan", "POST /api/lists?type=allow", 201, "{}");
    }

    InstanceConfig instance;
    std::shared_ptr<FakeHttpClient> client = std::make_shared<FakeHttpClient>();
    SessionManager sessions{client};
    ConfigApiTransport transport{std::chrono::milliseconds(0)};
    GroupListSync sync{transport};
};

TEST_F(GroupListSyncTest, AddsMissingAndUpdatesChangedGroups) {
    client->on("pi2.lan", "GET /api/groups", 200, R"({"groups":[
        {"id":0,"name":"Default","comment":"The default group","enabled":true},
        {"id":2,"name":"kids","comment":"old","enabled":true},
        {"id":5,"name":"guests","comment":null,"enabled":true}
    ]})");
    client->on("pi2.lan", "PUT /api/groups/kids", 200, "{}");

    const std::vector<Group> mainGroups{
        group(0, "Default", std::string("The default group")),
        group(4, "kids", std::string("new"), false),
        group(6, "iot"),
    };

    Session session = sessions.acquire(instance);
    EXPECT_TRUE(sync.syncGroups(session, mainGroups));

    EXPECT_EQ(client->count("pi2.lan", "PUT /api/groups/Default"), 0u);
    const auto updates = client->requests("pi2.lan", "PUT /api/groups/kids");
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(parse(updates[0].request.body), parse(R"({"name":"kids","comment":"new","enabled":false})"));

    const auto adds = client->requests("pi2.lan", "POST /api/groups");
    ASSERT_EQ(adds.size(), 1u);
    EXPECT_EQ(parse(adds[0].request.body)["name"], "iot");

    // nothing on the secondary is ever removed
    for (const auto& request : client->requests()) {
        EXPECT_NE(request.request.method, http::Method::DELETE) << request.key();
    }
}

TEST_F(GroupListSyncTest, GroupsAlreadyInSync) {
    client->on("pi2.lan", "GET /api/groups", 200,
               R"({"groups":[{"id":0,"name":"Default","comment":null,"enabled":true}]})");

    Session session = sessions.acquire(instance);
    EXPECT_FALSE(sync.syncGroups(session, {group(0, "Default")}));
    EXPECT_EQ(client->count("pi2.lan", "POST /api/groups"), 0u);
}

TEST_F(GroupListSyncTest, ListsMatchedByAddressAndType) {
    client->on("pi2.lan", "GET /api/groups", 200, R"({"groups":[
        {"id":0,"name":"Default","enabled":true},
        {"id":2,"name":"kids","enabled":true}
    ]})");
    client->on("pi2.lan", "GET /api/lists", 200, R"({"lists":[
        {"id":10,"address":"https://a.example/hosts","type":"block","comment":null,"enabled":true,"groups":[0]},
        {"id":11,"address":"https://b.example/hosts","type":"block","comment":null,"enabled":true,"groups":[0]}
    ]})");
    client->on("pi2.lan", "PUT /api/lists/https%3A%2F%2Fb.example%2Fhosts?type=block", 200, "{}");

    const std::vector<Group> mainGroups{group(0, "Default"), group(4, "kids")};
    const std::vector<AdList> mainLists{
        list("https://a.example/hosts", {}),           // unchanged: {} is {0}
        list("https://b.example/hosts", {0, 4}),       // groups changed
        list("https://a.example/hosts", {0}, "allow"), // same address, other type
    };

    std::vector<std::string> warnings;
    Session session = sessions.acquire(instance);
    EXPECT_TRUE(sync.syncLists(session, mainLists, mainGroups, true, warnings));
    EXPECT_TRUE(warnings.empty());

    EXPECT_EQ(client->count("pi2.lan", "PUT /api/lists/https%3A%2F%2Fa.example%2Fhosts?type=block"), 0u);

    const auto updates = client->requests("pi2.lan", "PUT /api/lists/https%3A%2F%2Fb.example%2Fhosts?type=block");
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(parse(updates[0].request.body)["groups"], parse("[0, 2]"));

    const auto adds = client->requests("pi2.lan", "POST /api/lists?type=allow");
    ASSERT_EQ(adds.size(), 1u);
    EXPECT_EQ(parse(adds[0].request.body)["address"], "https://a.example/hosts");
    EXPECT_FALSE(parse(adds[0].request.body).isMember("id"));
}

TEST_F(GroupListSyncTest, ListsWithoutGroupSyncWarn) {
    client->on("pi2.lan", "GET /api/groups", 200, R"({"groups":[{"id":0,"name":"Default","enabled":true}]})");
    client->on("pi2.lan", "GET /api/lists", 200, R"({"lists":[]})");

    const std::vector<Group> mainGroups{group(0, "Default"), group(4, "kids")};
    std::vector<std::string> warnings;

    Session session = sessions.acquire(instance);
    EXPECT_TRUE(sync.syncLists(session, {list("https://a.example/hosts", {4})}, mainGroups, false, warnings));
    EXPECT_EQ(warnings.size(), 1u);

    const auto adds = client->requests("pi2.lan", "POST /api/lists?type=block");
    ASSERT_EQ(adds.size(), 1u);
    EXPECT_EQ(parse(adds[0].request.body)["groups"], parse("[0]"));
}

TEST_F(GroupListSyncTest, SecondRunIsANoOp) {
    client->on("pi2.lan", "GET /api/groups", 200, R"({"groups":[{"id":0,"name":"Default","enabled":true}]})");
    client->on("pi2.lan", "GET /api/lists", 200, R"({"lists":[
        {"id":10,"address":"https://a.example/hosts","type":"block","comment":"ads","enabled":true,"groups":[0]}
    ]})");

    AdList mainList = list("https://a.example/hosts", {0});
    mainList.comment = "ads";
    std::vector<std::string> warnings;

    Session session = sessions.acquire(instance);
    EXPECT_FALSE(sync.syncLists(session, {mainList}, {group(0, "Default")}, true, warnings));
    EXPECT_EQ(client->count("pi2.lan", "POST /api/lists?type=block"), 0u);
}
