#ifndef PAYGRAPH_NET_NETWORK_CLIENT_H
#define PAYGRAPH_NET_NETWORK_CLIENT_H

#include <string>

#include <paygraph/graph/graph_types.h>

namespace paygraph {
namespace net {

struct RefreshRequest {
    double min_amount = 30000.0;
    int max_edges = 80;
};

// Abstract data source for the payment network. Implementations may block; they are called
// from a worker task, never from the frame thread. Failures are reported by throwing.
class NetworkSource {
public:
    virtual graph::NetworkPayload FetchNetwork(const RefreshRequest& request) = 0;
    virtual ~NetworkSource() = default;
};

/**
 * CurlNetworkSource fetches GET {api_base}/network?min_amount=..&max_edges=..
 * - One easy handle per request, so concurrent fetches never share curl state
 * - Non-200 responses and transport errors throw std::runtime_error
 * - The body is decoded with ParseNetworkPayload
 */
class CurlNetworkSource : public NetworkSource {
public:
    explicit CurlNetworkSource(std::string api_base, long timeout_seconds = 15L);

    graph::NetworkPayload FetchNetwork(const RefreshRequest& request) override;

    // Exposed for tests
    std::string BuildUrl(const RefreshRequest& request) const;

private:
    std::string api_base_;
    long timeout_seconds_;
};

} // namespace net
} // namespace paygraph

#endif // PAYGRAPH_NET_NETWORK_CLIENT_H
