/**
 * @file engine_api.cpp
 * @brief libcurl GET against the Docker daemon
 *
 * @date 2025
 */

#include "dockhand/runtime/engine_api.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/string_utils.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <memory>
#include <mutex>
#include <utility>

namespace dockhand {
namespace runtime {

using core::EngineError;
using core::ErrorKind;
using utils::StringUtils;

namespace {

struct EasyHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

void InitCurlOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t AppendBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

bool IsConnectFailure(CURLcode code) {
    return code == CURLE_COULDNT_CONNECT ||
           code == CURLE_COULDNT_RESOLVE_HOST ||
           code == CURLE_COULDNT_RESOLVE_PROXY ||
           code == CURLE_OPERATION_TIMEDOUT ||
           code == CURLE_SEND_ERROR ||
           code == CURLE_RECV_ERROR ||
           code == CURLE_GOT_NOTHING;
}

} // anonymous namespace

EngineApi::EngineApi(std::string docker_host)
    : docker_host_(std::move(docker_host)) {
    if (docker_host_.empty()) {
        docker_host_ = "unix:///var/run/docker.sock";
    }

    if (StringUtils::StartsWith(docker_host_, "unix://")) {
        socket_path_ = docker_host_.substr(std::strlen("unix://"));
        base_url_ = "http://localhost";
    } else if (StringUtils::StartsWith(docker_host_, "tcp://")) {
        base_url_ = "http://" + docker_host_.substr(std::strlen("tcp://"));
    } else {
        base_url_ = docker_host_;
    }

    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string EngineApi::UrlFor(const std::string& path) const {
    return base_url_ + path;
}

HttpResponse EngineApi::Get(const std::string& path) const {
    InitCurlOnce();

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        throw EngineError(ErrorKind::RUNTIME_ERROR, "Failed to initialize libcurl");
    }

    HttpResponse response;
    const std::string url = UrlFor(path);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    if (!socket_path_.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, socket_path_.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        std::string reason = curl_easy_strerror(code);
        if (IsConnectFailure(code)) {
            throw EngineError(ErrorKind::RUNTIME_UNAVAILABLE,
                              "Cannot reach Docker daemon at " + docker_host_ + ": " + reason);
        }
        throw EngineError(ErrorKind::RUNTIME_ERROR,
                          "Engine API request " + path + " failed: " + reason);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);

    spdlog::debug("GET {} -> {}", path, response.status);
    return response;
}

} // namespace runtime
} // namespace dockhand
