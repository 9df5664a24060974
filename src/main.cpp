#include <iostream>
#include <string>
#include <csignal>
#include <cstdlib>

#include "config.hpp"
#include "core/Toolkit.hpp"
#include "server/wserver.hpp"
#include "server/endpoint.hpp"
#include "const/rest_enums.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace toolkit;

namespace {

struct SlugRequest {
    std::string text;
};

void to_json(json& j, const SlugRequest& r) { j = json{{"text", r.text}}; }
void from_json(const json& j, SlugRequest& r) { r.text = j.value("text", std::string()); }

json describe(const UploadedFile& file) {
    return {
        {"storedName", file.storedName},
        {"originalName", file.originalName},
        {"sizeBytes", file.sizeBytes}
    };
}

void signal_handler(int signum) {
    if (signum == SIGINT) {
        std::cout << "\nSIGINT received, shutting down" << std::endl;
        std::exit(0);
    }
}

}

int main(int argc, char** argv)
{
    std::string config_path = argc > 1 ? argv[1] : TOOLKIT_DEFAULT_CONFIG_PATH;

    ServerConfig config;
    try {
        config = loadServerConfig(config_path);
    } catch (const ToolkitError& e) {
        std::cerr << "Cannot start: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);

    auto tools = std::make_shared<Toolkit>(config.toolkit);
    wServer server(tools->config().maxUploadBytes);

    // Multipart upload, optional ?rename=randomString|noSpaces:retainCase|noSpaces:allLowercase
    server.add_endpoint(endpoint(
        [tools, &config](const http::Request& req, http::Response& res) {
            UploadOptions options;
            options.rename = parseRenamePolicy(req.getQuery("rename"));
            try {
                auto files = tools->uploadFiles(req, config.uploadDir, options);
                JsonResponse payload;
                payload.message = "Uploaded " + std::to_string(files.size()) + " file(s)";
                payload.data = json::array();
                for (const auto& f : files) payload.data.push_back(describe(f));
                tools->writeJSON(res, 201, payload);
            } catch (const UploadError& e) {
                std::cerr << "Upload failed after " << e.uploaded().size() << " file(s): " << e.what() << std::endl;
                ErrorJsonOptions error_options;
                error_options.status = e.kind() == ErrorKind::SizeExceeded ? 413
                                     : e.kind() == ErrorKind::TypeNotPermitted ? 415
                                     : e.kind() == ErrorKind::Io ? 500 : 400;
                tools->errorJSON(res, e, error_options);
            }
        },
        HttpRequest::POST,
        "/upload"));

    server.add_endpoint(endpoint(
        [tools, &config](const http::Request& req, http::Response& res) {
            UploadOptions options;
            options.rename = parseRenamePolicy(req.getQuery("rename"));
            try {
                UploadedFile file = tools->uploadOneFile(req, config.uploadDir, options);
                JsonResponse payload;
                payload.message = "Uploaded " + file.storedName;
                payload.data = describe(file);
                tools->writeJSON(res, 201, payload);
            } catch (const ToolkitError& e) {
                tools->errorJSON(res, e);
            }
        },
        HttpRequest::POST,
        "/upload/one"));

    // GET /download?file=report.pdf&name=Report.pdf
    server.add_endpoint(endpoint(
        [tools, &config](const http::Request& req, http::Response& res) {
            std::string file = req.getQuery("file");
            if (file.empty() || file.find("..") != std::string::npos) {
                tools->errorJSON(res, ToolkitError(ErrorKind::MalformedInput, "invalid file parameter"));
                return;
            }
            tools->downloadStaticFile(req, res, config.staticDir, file, req.getQuery("name", file));
        },
        HttpRequest::GET,
        "/download"));

    server.add_endpoint(endpoint(
        [tools](const http::Request& req, http::Response& res) {
            SlugRequest body;
            try {
                tools->readJSON(req, body);
                JsonResponse payload;
                payload.message = "slug created";
                payload.data = {{"slug", tools->slugify(body.text)}};
                tools->writeJSON(res, 200, payload);
            } catch (const ToolkitError& e) {
                tools->errorJSON(res, e);
            }
        },
        HttpRequest::POST,
        "/slugify"));

    server.add_endpoint(endpoint(
        [tools](const http::Request& req, http::Response& res) {
            std::size_t length = 32;
            try {
                length = std::stoul(req.getQuery("length", "32"));
                if (length > 4096) throw std::out_of_range("length");
            } catch (const std::exception&) {
                tools->errorJSON(res, ToolkitError(ErrorKind::MalformedInput, "length must be a number up to 4096"));
                return;
            }
            JsonResponse payload;
            payload.message = "random string";
            payload.data = {{"value", tools->randomString(length)}};
            tools->writeJSON(res, 200, payload);
        },
        HttpRequest::GET,
        "/random"));

    // Forwards the posted JSON value to the configured push target
    server.add_endpoint(endpoint(
        [tools, &config](const http::Request& req, http::Response& res) {
            if (config.pushTarget.empty()) {
                ErrorJsonOptions options;
                options.status = 404;
                tools->errorJSON(res, ToolkitError(ErrorKind::EmptyInput, "no push target configured"), options);
                return;
            }
            json body;
            try {
                tools->readJSON(req, body);
                http::ClientResponse remote = tools->pushJSONToRemoteService(config.pushTarget, body);
                JsonResponse payload;
                payload.message = "pushed";
                payload.data = {{"status", remote.status}};
                tools->writeJSON(res, 202, payload);
            } catch (const ToolkitError& e) {
                ErrorJsonOptions options;
                options.status = e.kind() == ErrorKind::Transport ? 502 : 400;
                tools->errorJSON(res, e, options);
            }
        },
        HttpRequest::POST,
        "/push"));

    try {
        server.run(config.port);
    } catch (const std::exception& e) {
        std::cerr << "Server stopped: " << e.what() << std::endl;
        return 1;
    }
}
