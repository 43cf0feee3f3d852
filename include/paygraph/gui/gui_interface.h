#pragma once

#include <paygraph/core/ui_interface.h>

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <queue>
#include <string>
#include <vector>
#include <imgui.h> // Required for ImVec2

// Forward declaration for GLFW window handle
struct GLFWwindow;

namespace paygraph {
namespace gui {

enum class NoticeType {
    STATUS,
    ERROR
};

struct Notice {
    NoticeType type;
    std::string content;
    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds> timestamp;
};

class GuiInterface : public UserInterface {
public:
    static constexpr std::size_t kMaxNoticeHistory = 50;

    GuiInterface() = default;
    ~GuiInterface() override;

    GuiInterface(const GuiInterface&)            = delete;
    GuiInterface& operator=(const GuiInterface&) = delete;
    GuiInterface(GuiInterface&&)                 = delete;
    GuiInterface& operator=(GuiInterface&&)      = delete;

    // Implementation of the UserInterface contract
    void displayError(const std::string& error) override;
    void displayStatus(const std::string& status) override;
    void initialize() override;
    void shutdown() override;
    bool isGuiMode() const override;

    GLFWwindow* getWindow() const;

    // Moves queued notices into the visible history. Frame thread only.
    void processNoticeQueue();
    const std::deque<Notice>& getNoticeHistory() const { return notice_history; }

    // Method for GUI thread to get and clear accumulated scroll offsets
    ImVec2 getAndClearScrollOffsets();

private:
    // GLFW callbacks; the window user pointer is the owning GuiInterface
    static void scrollCallback(GLFWwindow* window, double xoffset, double yoffset);
    static void errorCallback(int error, const char* description);

    void enqueueNotice(NoticeType type, const std::string& content);

    GLFWwindow* window = nullptr;
    float accumulated_scroll_x = 0.0f;
    float accumulated_scroll_y = 0.0f;

    std::mutex display_mutex; // Protects notice_queue
    std::mutex input_mutex;   // Protects the accumulated scroll offsets

    std::queue<Notice> notice_queue;
    std::deque<Notice> notice_history;
};

} // namespace gui
} // namespace paygraph
