// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "image_fetcher.h"

#include "hv/requests.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <memory>

namespace thumbkit {

HttpImageFetcher::HttpImageFetcher(int timeout_sec, std::string user_agent)
    : timeout_sec_(std::max(timeout_sec, 1)), user_agent_(std::move(user_agent)) {}

FetchResult HttpImageFetcher::fetch(const std::string& url) {
    FetchResult result;

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    req->timeout = timeout_sec_;
    if (!user_agent_.empty()) {
        req->SetHeader("User-Agent", user_agent_);
    }

    auto resp = requests::request(req);
    if (!resp) {
        result.error = "Request failed or timed out after " + std::to_string(timeout_sec_) + "s";
        spdlog::debug("[HttpImageFetcher] {}: {}", url, result.error);
        return result;
    }

    result.status_code = static_cast<int>(resp->status_code);
    if (resp->status_code != HTTP_STATUS_OK) {
        result.error = "HTTP " + std::to_string(result.status_code);
        spdlog::debug("[HttpImageFetcher] {}: {}", url, result.error);
        return result;
    }
    if (resp->body.empty()) {
        result.error = "Empty response body";
        spdlog::debug("[HttpImageFetcher] {}: {}", url, result.error);
        return result;
    }

    result.data.assign(resp->body.begin(), resp->body.end());
    result.ok = true;
    spdlog::trace("[HttpImageFetcher] Fetched {} bytes from {}", result.data.size(), url);
    return result;
}

} // namespace thumbkit
