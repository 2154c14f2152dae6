#include <gtest/gtest.h>
#include <httplib.h>
#include "droidbridge/errors.hpp"
#include "droidbridge/server.hpp"
#include "fake_spawner.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

using namespace droidbridge;
using namespace droidbridge::fakes;

TEST(StatusForTest, MapsErrorClasses) {
    EXPECT_EQ(status_for(InvalidArgumentError("bad")), 400);
    EXPECT_EQ(status_for(UnknownKeyError("FOO")), 400);
    EXPECT_EQ(status_for(WindowNotFoundError("none")), 404);
    EXPECT_EQ(status_for(ConnectionError("refused")), 502);
    EXPECT_EQ(status_for(WakeupFailedError("off")), 500);
    EXPECT_EQ(status_for(std::runtime_error("boom")), 500);
}

TEST(ErrorBodyTest, NamesTheErrorClass) {
    json body = error_body(UnknownKeyError("FOO"));
    EXPECT_EQ(body["type"], "UnknownKeyError");
    EXPECT_EQ(body["error"], "Provided key \"FOO\" does not have a mapping");

    EXPECT_EQ(error_body(BinaryNotFoundError("adb"))["type"], "BinaryNotFoundError");
    EXPECT_EQ(error_body(std::logic_error("oops"))["type"], "InternalError");
}

TEST(ResponseCacheTest, ExpiresAfterTtl) {
    ResponseCache cache;
    EXPECT_FALSE(cache.get("k", std::chrono::seconds(30)).has_value());

    cache.set("k", "v");
    EXPECT_EQ(cache.get("k", std::chrono::seconds(30)).value_or(""), "v");
    EXPECT_FALSE(cache.get("k", std::chrono::seconds(0)).has_value());

    cache.clear();
    EXPECT_FALSE(cache.get("k", std::chrono::seconds(30)).has_value());
}

TEST(TimestampTest, IsoFormat) {
    std::string ts = get_iso_timestamp();
    ASSERT_EQ(ts.size(), 26u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts[19], '.');
}

// =============================================================================
// Routes, served on a loopback port against a scripted adb
// =============================================================================

class RoutesTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeSpawner> spawner = std::make_shared<FakeSpawner>();
    std::unique_ptr<DeviceSession> session;
    ResponseCache cache;
    ServerConfig config;
    httplib::Server svr;
    std::thread server_thread;
    int port = 0;

    // Adjust `config` before the routes are registered
    virtual void configure() {}

    static bool has_arg(const std::vector<std::string>& argv, const std::string& arg) {
        return std::find(argv.begin(), argv.end(), arg) != argv.end();
    }

    void SetUp() override {
        spawner->set_script([](const std::vector<std::string>& argv) {
            FakeResponse response;
            if (argv.back() == "devices") {
                response.out = "List of devices attached\nemulator-5554\tdevice\n";
            } else if (has_arg(argv, "pm")) {
                response.out = "package:/data/app/a.apk=com.example.a\n";
            } else if (has_arg(argv, "connect")) {
                const std::string& address = argv.back();
                response.out = address == "good" ? "connected to good" : "failed to connect to '" + address + "'";
            }
            return response;
        });

        SessionOptions options;
        options.spawner = spawner;
        options.resolver = fake_resolver;
        options.connect_settle = std::chrono::milliseconds(0);
        options.wakeup_settle = std::chrono::milliseconds(0);
        session = std::make_unique<DeviceSession>(options);

        configure();
        register_routes(svr, *session, cache, config);
        port = svr.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        server_thread = std::thread([this] { svr.listen_after_bind(); });
        while (!svr.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void TearDown() override {
        svr.stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }
};

class TokenRoutesTest : public RoutesTest {
protected:
    void configure() override { config.api_token = "s3cret"; }
};

TEST_F(RoutesTest, DevicesAsJson) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/devices");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    json body = json::parse(res->body);
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["serial"], "emulator-5554");
    EXPECT_EQ(body[0]["state"], "device");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(RoutesTest, HealthReportsConnectedDevice) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/health");
    ASSERT_TRUE(res);
    json body = json::parse(res->body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["active_processes"], 0);
}

TEST_F(RoutesTest, PackagesAreCached) {
    httplib::Client cli("127.0.0.1", port);
    auto first = cli.Get("/packages");
    auto second = cli.Get("/packages");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    EXPECT_EQ(json::parse(first->body), json::array({"com.example.a"}));
    EXPECT_EQ(first->body, second->body);
    EXPECT_EQ(spawner->spawn_count(), 1u);
}

TEST_F(RoutesTest, UnknownKeyIsBadRequest) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/keys?names=HOME,FOO", "", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["type"], "UnknownKeyError");
    EXPECT_EQ(spawner->spawn_count(), 0u);
}

TEST_F(RoutesTest, MissingParameterIsBadRequest) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/launch", "", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(RoutesTest, ConnectFailureIsBadGateway) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/connect?address=10.0.0.9", "", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 502);
    EXPECT_EQ(json::parse(res->body)["type"], "ConnectionError");
}

TEST_F(RoutesTest, ShellReturnsCommandResult) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/shell", "pm list packages -f", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    json body = json::parse(res->body);
    EXPECT_EQ(body["exit_status"], 0);
    EXPECT_EQ(body["output"], "package:/data/app/a.apk=com.example.a");
    EXPECT_EQ(body["timed_out"], false);
    EXPECT_EQ(spawner->commands().back(),
              (std::vector<std::string>{"/fake/bin/adb", "shell", "pm", "list", "packages", "-f"}));
}

TEST_F(RoutesTest, ConnectDropsCachedAnswers) {
    httplib::Client cli("127.0.0.1", port);
    ASSERT_TRUE(cli.Get("/packages"));
    ASSERT_EQ(spawner->spawn_count(), 1u);

    auto connected = cli.Post("/connect?address=good", "", "text/plain");
    ASSERT_TRUE(connected);
    EXPECT_EQ(connected->status, 200);

    ASSERT_TRUE(cli.Get("/packages"));
    EXPECT_EQ(spawner->spawn_count(), 3u);
    EXPECT_EQ(spawner->commands().back(),
              (std::vector<std::string>{"/fake/bin/adb", "-s", "good", "shell", "pm", "list", "packages", "-f"}));
}

TEST_F(RoutesTest, CorsHeadersOnlyOnReadRoutes) {
    httplib::Client cli("127.0.0.1", port);
    auto read = cli.Get("/version");
    auto write = cli.Post("/shell", "id", "text/plain");
    ASSERT_TRUE(read);
    ASSERT_TRUE(write);

    EXPECT_EQ(read->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_FALSE(write->has_header("Access-Control-Allow-Origin"));
}

TEST_F(RoutesTest, BrowserOriginCannotDriveDevice) {
    httplib::Client cli("127.0.0.1", port);
    httplib::Headers headers = {{"Origin", "http://attacker.example"}};
    auto res = cli.Post("/shell", headers, "reboot", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
    EXPECT_EQ(json::parse(res->body)["type"], "Forbidden");
    EXPECT_EQ(spawner->spawn_count(), 0u);
}

TEST_F(RoutesTest, PreflightIsNotAnswered) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Options("/shell");
    ASSERT_TRUE(res);
    EXPECT_NE(res->status, 204);
    EXPECT_FALSE(res->has_header("Access-Control-Allow-Origin"));
}

TEST_F(TokenRoutesTest, PostWithoutTokenIsUnauthorized) {
    httplib::Client cli("127.0.0.1", port);
    auto missing = cli.Post("/shell", "id", "text/plain");
    httplib::Headers wrong_headers = {{"Authorization", "Bearer guess"}};
    auto wrong = cli.Post("/shell", wrong_headers, "id", "text/plain");
    ASSERT_TRUE(missing);
    ASSERT_TRUE(wrong);

    EXPECT_EQ(missing->status, 401);
    EXPECT_EQ(wrong->status, 401);
    EXPECT_EQ(json::parse(missing->body)["type"], "Unauthorized");
    EXPECT_EQ(spawner->spawn_count(), 0u);
}

TEST_F(TokenRoutesTest, PostWithTokenIsServed) {
    httplib::Client cli("127.0.0.1", port);
    httplib::Headers headers = {{"Authorization", "Bearer s3cret"}};
    auto res = cli.Post("/shell", headers, "pm list packages -f", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(spawner->spawn_count(), 1u);
}

TEST_F(TokenRoutesTest, ReadRoutesNeedNoToken) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/devices");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
}
