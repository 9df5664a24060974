#include <gtest/gtest.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/Toolkit.hpp"
#include "TestUtils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace toolkit;
using toolkit::fixtures::TempDir;

namespace {

    // Records the last POST and answers with a canned reply
    class RecordingClient : public http::HttpClient {
    public:
        http::ClientResponse post(const std::string& url, const std::string& body,
                                  const http::Headers& headers) override {
            lastUrl = url;
            lastBody = body;
            lastHeaders = headers;
            return reply;
        }

        std::string lastUrl;
        std::string lastBody;
        http::Headers lastHeaders;
        http::ClientResponse reply;
    };

    class FailingClient : public http::HttpClient {
    public:
        http::ClientResponse post(const std::string&, const std::string&, const http::Headers&) override {
            throw ToolkitError(ErrorKind::Transport, "CURL error: Couldn't connect to server");
        }
    };

    // Captures which path the toolkit asked for
    class RecordingFileServer : public http::FileServer {
    public:
        void serveFile(const http::Request&, http::ResponseWriter& w, const std::string& path) override {
            servedPath = path;
            w.writeHeader(200);
        }

        std::string servedPath;
    };

    struct Event {
        std::string name;
        int count = 0;
    };

    void to_json(json& j, const Event& e) { j = json{{"name", e.name}, {"count", e.count}}; }
    void from_json(const json& j, Event& e) {
        j.at("name").get_to(e.name);
        j.at("count").get_to(e.count);
    }

}

TEST(ToolkitTest, ZeroLimitsResolveToDefaults) {
    Toolkit tools;
    EXPECT_EQ(tools.config().maxUploadBytes, DEFAULT_MAX_UPLOAD_BYTES);
    EXPECT_EQ(tools.config().maxJsonBytes, DEFAULT_MAX_JSON_BYTES);
}

TEST(ToolkitTest, ExplicitLimitsAreKept) {
    ToolkitConfig config;
    config.maxUploadBytes = 5;
    config.maxJsonBytes = 6;
    Toolkit tools(config);
    EXPECT_EQ(tools.config().maxUploadBytes, 5u);
    EXPECT_EQ(tools.config().maxJsonBytes, 6u);
}

TEST(ToolkitTest, RandomStringAndSlugify) {
    Toolkit tools;
    EXPECT_EQ(tools.randomString(17).size(), 17u);
    EXPECT_EQ(tools.slugify("Now is the Time!"), "now-is-the-time");
}

TEST(ToolkitTest, CreateDirIfNotExist) {
    TempDir tmp;
    Toolkit tools;
    tools.createDirIfNotExist(tmp.file("x/y"));
    EXPECT_TRUE(fs::is_directory(tmp.file("x/y")));
}

TEST(ToolkitTest, ReadJSONUsesConfiguredLimit) {
    ToolkitConfig config;
    config.maxJsonBytes = 8;
    Toolkit tools(config);
    http::Request req;
    req.body = R"({"name":"too long for the limit","count":1})";
    Event event;

    try {
        tools.readJSON(req, event);
        FAIL() << "Expected JsonDecodeError";
    } catch (const JsonDecodeError& e) {
        EXPECT_EQ(e.reason(), JsonDecodeError::Reason::TooLarge);
    }
}

TEST(ToolkitTest, ReadJSONHonoursUnknownFieldSetting) {
    ToolkitConfig config;
    config.allowUnknownJsonFields = true;
    Toolkit tools(config);
    http::Request req;
    req.body = R"({"name":"launch","count":3,"source":"cli"})";
    Event event;

    tools.readJSON(req, event);

    EXPECT_EQ(event.name, "launch");
    EXPECT_EQ(event.count, 3);
}

TEST(ToolkitTest, WriteJSONAndErrorJSON) {
    Toolkit tools;
    http::Response ok;
    tools.writeJSON(ok, 200, Event{"launch", 3});
    EXPECT_EQ(json::parse(ok.body)["count"], 3);

    http::Response failed;
    tools.errorJSON(failed, ToolkitError(ErrorKind::EmptyInput, "nothing here"));
    EXPECT_EQ(failed.status, 400);
    EXPECT_EQ(json::parse(failed.body)["message"], "nothing here");
}

TEST(DownloadStaticFileTest, SetsAttachmentHeader) {
    TempDir tmp;
    fixtures::writeFile(tmp.file("report.pdf"), "%PDF-1.4 fake");
    Toolkit tools;
    http::Request req;
    http::Response res;

    tools.downloadStaticFile(req, res, tmp.path(), "report.pdf", "Quarterly Report.pdf");

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.header("Content-Disposition"), "attachment; filename=\"Quarterly Report.pdf\"");
    EXPECT_EQ(res.header("Content-Type"), "application/pdf");
    EXPECT_EQ(res.body, "%PDF-1.4 fake");
}

TEST(DownloadStaticFileTest, QuotesAndBackslashesInNameAreEscaped) {
    TempDir tmp;
    fixtures::writeFile(tmp.file("r.txt"), "r");
    Toolkit tools;
    http::Request req;
    http::Response res;

    tools.downloadStaticFile(req, res, tmp.path(), "r.txt", "say \"hi\"\\now.txt");

    EXPECT_EQ(res.header("Content-Disposition"), "attachment; filename=\"say \\\"hi\\\"\\\\now.txt\"");
}

TEST(DownloadStaticFileTest, MissingFileIs404) {
    TempDir tmp;
    Toolkit tools;
    http::Request req;
    http::Response res;

    tools.downloadStaticFile(req, res, tmp.path(), "absent.bin", "absent.bin");

    EXPECT_EQ(res.status, 404);
}

TEST(DownloadStaticFileTest, JoinsPathsThroughInjectedServer) {
    auto fileServer = std::make_shared<RecordingFileServer>();
    Toolkit tools;
    tools.setFileServer(fileServer);
    http::Request req;
    http::Response res;

    tools.downloadStaticFile(req, res, "/srv/static/", "./docs/a.txt", "a.txt");

    EXPECT_EQ(fileServer->servedPath, "/srv/static/docs/a.txt");
}

TEST(PushJSONTest, PostsEncodedBody) {
    auto client = std::make_shared<RecordingClient>();
    client->reply.status = 202;
    client->reply.body = "accepted";
    Toolkit tools;
    PushOptions options;
    options.client = client;

    http::ClientResponse response =
        tools.pushJSONToRemoteService("http://example.test/hook", Event{"launch", 3}, options);

    EXPECT_EQ(response.status, 202);
    EXPECT_EQ(response.body, "accepted");
    EXPECT_EQ(client->lastUrl, "http://example.test/hook");
    EXPECT_EQ(json::parse(client->lastBody), (json{{"name", "launch"}, {"count", 3}}));
    EXPECT_EQ(client->lastHeaders.at("content-type"), "application/json");
}

TEST(PushJSONTest, TransportErrorPropagates) {
    Toolkit tools;
    PushOptions options;
    options.client = std::make_shared<FailingClient>();

    try {
        tools.pushJSONToRemoteService("http://unreachable.test", json{{"a", 1}}, options);
        FAIL() << "Expected ToolkitError";
    } catch (const ToolkitError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Transport);
    }
}

TEST(PushJSONTest, UnencodableDataIsEncodingError) {
    Toolkit tools;
    auto client = std::make_shared<RecordingClient>();
    PushOptions options;
    options.client = client;

    try {
        tools.pushJSONToRemoteService("http://example.test", json{{"bad", std::string("\xC3\x28")}}, options);
        FAIL() << "Expected ToolkitError";
    } catch (const ToolkitError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Encoding);
    }
    EXPECT_TRUE(client->lastUrl.empty());
}
