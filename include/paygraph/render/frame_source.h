#ifndef PAYGRAPH_RENDER_FRAME_SOURCE_H
#define PAYGRAPH_RENDER_FRAME_SOURCE_H

#include <cstdint>
#include <functional>
#include <vector>

namespace paygraph {
namespace render {

class FrameSource;

// Move-only handle; detaches its callback from the FrameSource when reset or destroyed.
// The FrameSource must outlive every subscription taken from it.
class FrameSubscription {
public:
    FrameSubscription() = default;
    FrameSubscription(FrameSource* source, std::uint64_t id) : source_(source), id_(id) {}
    ~FrameSubscription();

    FrameSubscription(const FrameSubscription&) = delete;
    FrameSubscription& operator=(const FrameSubscription&) = delete;
    FrameSubscription(FrameSubscription&& other) noexcept;
    FrameSubscription& operator=(FrameSubscription&& other) noexcept;

    void Reset();
    bool Active() const { return source_ != nullptr; }

private:
    FrameSource* source_ = nullptr;
    std::uint64_t id_ = 0;
};

/*
 * Per-frame callback list. The host calls PumpFrame() once per display refresh; tests call it
 * a fixed number of times. Callbacks may subscribe or unsubscribe (including themselves)
 * while a pump is in progress; changes take effect from the next pump.
 */
class FrameSource {
public:
    using FrameCallback = std::function<void()>;

    FrameSource() = default;
    FrameSource(const FrameSource&) = delete;
    FrameSource& operator=(const FrameSource&) = delete;

    [[nodiscard]] FrameSubscription Subscribe(FrameCallback callback);
    void PumpFrame();

    std::size_t SubscriberCount() const;
    std::uint64_t FrameCount() const { return frame_count_; }

private:
    friend class FrameSubscription;
    void Unsubscribe(std::uint64_t id);

    struct Entry {
        std::uint64_t id;
        FrameCallback callback;
        bool removed;
    };

    std::vector<Entry> entries_;
    std::vector<Entry> pending_;   // Subscribed during a pump
    std::uint64_t next_id_ = 1;
    std::uint64_t frame_count_ = 0;
    bool pumping_ = false;
};

} // namespace render
} // namespace paygraph

#endif // PAYGRAPH_RENDER_FRAME_SOURCE_H
