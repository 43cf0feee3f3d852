#include <paygraph/net/network_client.h>
#include <paygraph/graph/payload_parser.h>

#include <curl/curl.h>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace paygraph {
namespace net {

namespace {
// Appends the response body; returning less than the chunk size aborts the transfer
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string FormatQueryNumber(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream out;
    out << value;
    return out.str();
}
} // namespace

CurlNetworkSource::CurlNetworkSource(std::string api_base, long timeout_seconds)
    : api_base_(std::move(api_base)), timeout_seconds_(timeout_seconds) {
    while (!api_base_.empty() && api_base_.back() == '/') {
        api_base_.pop_back();
    }
}

std::string CurlNetworkSource::BuildUrl(const RefreshRequest& request) const {
    return api_base_ + "/network?min_amount=" + FormatQueryNumber(request.min_amount) +
           "&max_edges=" + std::to_string(request.max_edges);
}

graph::NetworkPayload CurlNetworkSource::FetchNetwork(const RefreshRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL for fetching the network.");
    }
    auto curl_guard = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>{curl, curl_easy_cleanup};

    struct curl_slist* headers = nullptr;
    auto headers_guard = std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>{nullptr, curl_slist_free_all};
    headers = curl_slist_append(headers, "Accept: application/json");
    headers_guard.reset(headers);

    std::string response_buffer;
    std::string url = BuildUrl(request);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // Called from worker threads

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw std::runtime_error("Network request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw std::runtime_error("Network request returned HTTP status " + std::to_string(http_code) +
                                 ". Response: " + response_buffer);
    }

    return graph::ParseNetworkPayload(response_buffer);
}

} // namespace net
} // namespace paygraph
