#ifndef PAYGRAPH_NET_REFRESH_COORDINATOR_H
#define PAYGRAPH_NET_REFRESH_COORDINATOR_H

#include <cstdint>
#include <future>
#include <optional>
#include <vector>

#include <paygraph/core/ui_interface.h>
#include <paygraph/graph/graph_types.h>
#include <paygraph/net/network_client.h>

namespace paygraph {
namespace net {

struct RefreshResult {
    std::uint64_t token;
    RefreshRequest request;
    graph::NetworkPayload payload;
};

/**
 * Runs network fetches off the frame thread and hands back only the newest answer.
 * - Every RequestRefresh() stamps a new, strictly increasing sequence token
 * - Poll() (frame thread) returns a payload only when it belongs to the newest token;
 *   older responses are dropped whether they succeeded or failed, so a slow response
 *   for an old filter can never overwrite a newer graph
 * - A failure of the newest request becomes a displayError notice; nothing is retried
 */
class RefreshCoordinator {
public:
    RefreshCoordinator(NetworkSource& source, UserInterface& ui);
    ~RefreshCoordinator();

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    std::uint64_t RequestRefresh(const RefreshRequest& request);

    // Non-blocking. Collects every finished fetch and returns the newest one if it succeeded.
    std::optional<RefreshResult> Poll();

    // Blocks until every in-flight fetch has finished (results stay queued for Poll).
    void WaitForPending();

    bool IsLoading() const { return loading_; }
    std::uint64_t LatestToken() const { return latest_token_; }
    std::uint64_t AppliedToken() const { return applied_token_; }
    std::size_t InFlightCount() const { return pending_.size(); }
    std::size_t DiscardedCount() const { return discarded_count_; }

private:
    struct PendingFetch {
        std::uint64_t token;
        RefreshRequest request;
        std::future<graph::NetworkPayload> result;
    };

    NetworkSource& source_;
    UserInterface& ui_;
    std::vector<PendingFetch> pending_;
    std::uint64_t latest_token_ = 0;
    std::uint64_t applied_token_ = 0;
    std::size_t discarded_count_ = 0;
    bool loading_ = false;
};

} // namespace net
} // namespace paygraph

#endif // PAYGRAPH_NET_REFRESH_COORDINATOR_H
