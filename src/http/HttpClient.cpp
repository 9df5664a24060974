#include "http/HttpClient.hpp"
#include "core/ToolkitError.hpp"
#include <curl/curl.h>
#include <iostream>
#include <memory>

namespace toolkit {
namespace http {

namespace {
    size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    size_t headerCallback(char* buffer, size_t size, size_t nitems, Headers* headers) {
        size_t totalSize = size * nitems;
        std::string line(buffer, totalSize);

        // A new status line (redirect, 100-continue) starts a fresh header block
        if (line.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return totalSize;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) return totalSize;

        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t first = value.find_first_not_of(" \t");
        size_t last = value.find_last_not_of(" \t\r\n");
        value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);

        (*headers)[name] = value;
        return totalSize;
    }

    struct CurlDeleter {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };

    struct SlistDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
}

CurlHttpClient::CurlHttpClient(long timeoutSeconds)
    : timeoutSeconds_(timeoutSeconds) {}

ClientResponse CurlHttpClient::post(const std::string& url, const std::string& body,
                                    const Headers& headers) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw ToolkitError(ErrorKind::Transport, "Failed to initialize CURL");
    }

    ClientResponse response;
    std::unique_ptr<curl_slist, SlistDeleter> headerList;

    for (const auto& [name, value] : headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended) {
            throw ToolkitError(ErrorKind::Transport, "Failed to build request headers");
        }
        headerList.release();
        headerList.reset(appended);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds_);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::cerr << "CURL error posting to " << url << ": " << curl_easy_strerror(res) << std::endl;
        throw ToolkitError(ErrorKind::Transport, std::string("CURL error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace http
} // namespace toolkit
