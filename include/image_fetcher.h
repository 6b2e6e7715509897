// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file image_fetcher.h
 * @brief Blocking byte fetch used by loader workers
 */

namespace thumbkit {

/**
 * @brief Outcome of a single fetch
 */
struct FetchResult {
    bool ok = false;
    int status_code = 0;       ///< HTTP status (0 if no response)
    std::vector<uint8_t> data; ///< Response body on success
    std::string error;         ///< Human-readable failure description
};

/**
 * @brief Source of raw image bytes
 *
 * fetch() is called on worker threads and may block. Implementations must be
 * safe to call concurrently.
 */
class ImageFetcher {
  public:
    virtual ~ImageFetcher() = default;

    virtual FetchResult fetch(const std::string& url) = 0;
};

/**
 * @brief HTTP(S) fetcher backed by libhv requests
 *
 * Any response other than 200 with a non-empty body is a failure.
 */
class HttpImageFetcher : public ImageFetcher {
  public:
    static constexpr int DEFAULT_TIMEOUT_SEC = 30;

    explicit HttpImageFetcher(int timeout_sec = DEFAULT_TIMEOUT_SEC,
                              std::string user_agent = "thumbkit/1.0");

    FetchResult fetch(const std::string& url) override;

    [[nodiscard]] int timeout_sec() const {
        return timeout_sec_;
    }

  private:
    int timeout_sec_;
    std::string user_agent_;
};

} // namespace thumbkit
