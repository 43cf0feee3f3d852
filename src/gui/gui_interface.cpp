#include <paygraph/gui/gui_interface.h>
#include <paygraph/gui/theme_utils.h>

#include <iostream>
#include <stdexcept>

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

namespace paygraph {
namespace gui {

namespace {
inline std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds> getCurrentTimestamp() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}
} // namespace

// Flag to track if ImGui backends were successfully initialized
static bool imgui_init_done = false;

GuiInterface::~GuiInterface() {
    if (window) {
        shutdown();
    }
}

void GuiInterface::scrollCallback(GLFWwindow* window, double xoffset, double yoffset) {
    GuiInterface* gui_ui = static_cast<GuiInterface*>(glfwGetWindowUserPointer(window));
    if (!gui_ui) return;
    // Scroll is only consumed as canvas zoom; fold into whole-frame totals
    std::lock_guard<std::mutex> lock(gui_ui->input_mutex);
    gui_ui->accumulated_scroll_x += static_cast<float>(xoffset);
    gui_ui->accumulated_scroll_y += static_cast<float>(yoffset);
}

void GuiInterface::errorCallback(int error, const char* description) {
    std::cerr << "GLFW Error " << error << ": " << description << std::endl;
}

void GuiInterface::initialize() {
    glfwSetErrorCallback(errorCallback);
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

#if defined(__APPLE__)
    // GL 3.2 + GLSL 150
    const char* glsl_version = "#version 150";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#else
    // GL 3.3 + GLSL 330
    const char* glsl_version = "#version 330";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#endif

    window = glfwCreateWindow(1280, 720, "Payment Network", nullptr, nullptr);
    if (window == nullptr) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // Enable vsync

    glfwSetWindowUserPointer(window, this);
    // Installed before the ImGui backend so the backend chains to it
    glfwSetScrollCallback(window, scrollCallback);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr; // No persisted window layout

    ThemeUtils::applyDarkTheme();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        window = nullptr;
        glfwTerminate();
        imgui_init_done = false;
        throw std::runtime_error("Failed to initialize ImGui GLFW backend");
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        window = nullptr;
        glfwTerminate();
        imgui_init_done = false;
        throw std::runtime_error("Failed to initialize ImGui OpenGL3 backend");
    }

    imgui_init_done = true;
    std::cout << "GUI Initialized Successfully." << std::endl;
}

void GuiInterface::shutdown() {
    if (!window) return; // Prevent double shutdown

    std::cout << "Shutting down GUI..." << std::endl;

    if (imgui_init_done) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        imgui_init_done = false;
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    window = nullptr;
    std::cout << "GUI Shutdown Complete." << std::endl;
}

GLFWwindow* GuiInterface::getWindow() const {
    return window;
}

void GuiInterface::displayError(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
    enqueueNotice(NoticeType::ERROR, error);
}

void GuiInterface::displayStatus(const std::string& status) {
    enqueueNotice(NoticeType::STATUS, status);
}

void GuiInterface::enqueueNotice(NoticeType type, const std::string& content) {
    auto now = getCurrentTimestamp();
    std::lock_guard<std::mutex> lock(display_mutex);
    notice_queue.push({type, content, now});
}

void GuiInterface::processNoticeQueue() {
    std::lock_guard<std::mutex> lock(display_mutex);
    while (!notice_queue.empty()) {
        notice_history.push_back(std::move(notice_queue.front()));
        notice_queue.pop();
    }
    while (notice_history.size() > kMaxNoticeHistory) {
        notice_history.pop_front();
    }
}

ImVec2 GuiInterface::getAndClearScrollOffsets() {
    std::lock_guard<std::mutex> lock(input_mutex);
    ImVec2 offsets(accumulated_scroll_x, accumulated_scroll_y);
    accumulated_scroll_x = 0.0f;
    accumulated_scroll_y = 0.0f;
    return offsets;
}

bool GuiInterface::isGuiMode() const {
    return true;
}

} // namespace gui
} // namespace paygraph
