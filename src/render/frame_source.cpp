#include <paygraph/render/frame_source.h>

#include <algorithm>
#include <utility>

namespace paygraph {
namespace render {

FrameSubscription::~FrameSubscription() {
    Reset();
}

FrameSubscription::FrameSubscription(FrameSubscription&& other) noexcept
    : source_(other.source_), id_(other.id_) {
    other.source_ = nullptr;
    other.id_ = 0;
}

FrameSubscription& FrameSubscription::operator=(FrameSubscription&& other) noexcept {
    if (this != &other) {
        Reset();
        source_ = other.source_;
        id_ = other.id_;
        other.source_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void FrameSubscription::Reset() {
    if (source_) {
        source_->Unsubscribe(id_);
        source_ = nullptr;
        id_ = 0;
    }
}

FrameSubscription FrameSource::Subscribe(FrameCallback callback) {
    std::uint64_t id = next_id_++;
    if (pumping_) {
        pending_.push_back(Entry{id, std::move(callback), false});
    } else {
        entries_.push_back(Entry{id, std::move(callback), false});
    }
    return FrameSubscription(this, id);
}

void FrameSource::Unsubscribe(std::uint64_t id) {
    auto matches = [id](const Entry& e) { return e.id == id; };
    if (pumping_) {
        // Entries stay in place until the pump finishes; the running callback may be this one
        for (auto& entry : entries_) {
            if (entry.id == id) entry.removed = true;
        }
        pending_.erase(std::remove_if(pending_.begin(), pending_.end(), matches), pending_.end());
        return;
    }
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(), matches), entries_.end());
}

void FrameSource::PumpFrame() {
    ++frame_count_;
    pumping_ = true;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (!entries_[i].removed) {
            entries_[i].callback();
        }
    }
    pumping_ = false;

    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const Entry& e) { return e.removed; }),
                   entries_.end());
    for (auto& entry : pending_) {
        entries_.push_back(std::move(entry));
    }
    pending_.clear();
}

std::size_t FrameSource::SubscriberCount() const {
    std::size_t live = pending_.size();
    for (const auto& entry : entries_) {
        if (!entry.removed) ++live;
    }
    return live;
}

} // namespace render
} // namespace paygraph
