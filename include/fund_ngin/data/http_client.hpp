// include/fund_ngin/data/http_client.hpp
#pragma once

#include <string>
#include <vector>
#include "fund_ngin/core/error.hpp"

namespace fund_ngin {

/**
 * @brief Raw HTTP response
 */
struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * @brief Options shared by the HTTP-backed gateways
 */
struct HttpOptions {
    long timeout_seconds{30};
    std::string user_agent{"Mozilla/5.0 (fund_ngin)"};
    std::vector<std::string> headers;
};

/**
 * @brief Perform a blocking GET request with libcurl
 * @return CONNECTION_ERROR on transport failure, TIMEOUT_ERROR on timeout.
 *         Non-200 statuses are returned as responses, not errors.
 */
Result<HttpResponse> http_get(const std::string& url, const HttpOptions& options);

}  // namespace fund_ngin
