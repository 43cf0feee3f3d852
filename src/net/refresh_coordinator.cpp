#include <paygraph/net/refresh_coordinator.h>
#include <paygraph/graph/format_utils.h>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace paygraph {
namespace net {

RefreshCoordinator::RefreshCoordinator(NetworkSource& source, UserInterface& ui)
    : source_(source), ui_(ui) {}

RefreshCoordinator::~RefreshCoordinator() {
    for (auto& fetch : pending_) {
        if (fetch.result.valid()) {
            // Outcome no longer matters, only that the task stops touching source_
            fetch.result.wait();
        }
    }
}

std::uint64_t RefreshCoordinator::RequestRefresh(const RefreshRequest& request) {
    std::uint64_t token = ++latest_token_;
    loading_ = true;

    NetworkSource* source = &source_;
    pending_.push_back(PendingFetch{
        token,
        request,
        std::async(std::launch::async, [source, request]() { return source->FetchNetwork(request); })});

    ui_.displayStatus("Loading network (min amount " + graph::FormatCurrency(request.min_amount) + ")...");
    return token;
}

std::optional<RefreshResult> RefreshCoordinator::Poll() {
    std::optional<RefreshResult> newest;

    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        bool is_newest = it->token == latest_token_;
        try {
            graph::NetworkPayload payload = it->result.get();
            if (is_newest) {
                newest = RefreshResult{it->token, it->request, std::move(payload)};
            } else {
                ++discarded_count_;
            }
        } catch (const std::exception& e) {
            if (is_newest) {
                loading_ = false;
                ui_.displayError("Failed to load network: " + std::string(e.what()));
            } else {
                ++discarded_count_;
                std::cerr << "Ignoring failure of superseded network request #" << it->token
                          << ": " << e.what() << std::endl;
            }
        }
        it = pending_.erase(it);
    }

    if (newest.has_value()) {
        applied_token_ = newest->token;
        loading_ = false;
    }
    return newest;
}

void RefreshCoordinator::WaitForPending() {
    for (auto& fetch : pending_) {
        if (fetch.result.valid()) {
            fetch.result.wait();
        }
    }
}

} // namespace net
} // namespace paygraph
