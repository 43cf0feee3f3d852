#include <paygraph/core/app_config.h>
#include <paygraph/graph/format_utils.h>
#include <paygraph/gui/graph_view.h>
#include <paygraph/gui/gui_interface.h>
#include <paygraph/gui/imgui_input_source.h>
#include <paygraph/gui/theme_utils.h>
#include <paygraph/net/network_client.h>
#include <paygraph/net/refresh_coordinator.h>
#include <paygraph/render/frame_source.h>
#include <paygraph/session/graph_session.h>

#include <GLFW/glfw3.h>
#include <curl/curl.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <cstddef>
#include <iostream>
#include <string>

using namespace paygraph;

namespace {

struct ViewerState {
    ViewerConfig config;
    std::size_t selected_choice = 0;
};

std::size_t FindChoiceIndex(const ViewerConfig& config) {
    for (std::size_t i = 0; i < config.min_amount_choices.size(); ++i) {
        if (config.min_amount_choices[i] == config.min_amount) return i;
    }
    return 0;
}

void draw_toolbar(ViewerState& state, session::GraphSession& session, net::RefreshCoordinator& refresher) {
    const auto& stats = session.Snapshot().stats;
    ImGui::Text("Payment network");
    ImGui::SameLine();
    ImGui::TextDisabled("%lld orgs, %lld contractors, %lld links",
                        static_cast<long long>(stats.org_count),
                        static_cast<long long>(stats.contractor_count),
                        static_cast<long long>(stats.edge_count));

    const auto& choices = state.config.min_amount_choices;
    if (!choices.empty()) {
        ImGui::SameLine();
        ImGui::SetNextItemWidth(110.0f);
        std::string preview = graph::FormatAmountShort(choices[state.selected_choice]);
        if (ImGui::BeginCombo("Min amount", preview.c_str())) {
            for (std::size_t i = 0; i < choices.size(); ++i) {
                bool is_selected = i == state.selected_choice;
                std::string label = graph::FormatAmountShort(choices[i]);
                if (ImGui::Selectable(label.c_str(), is_selected) && !is_selected) {
                    state.selected_choice = i;
                    refresher.RequestRefresh(net::RefreshRequest{choices[i], state.config.max_edges});
                }
                if (is_selected) ImGui::SetItemDefaultFocus();
            }
            ImGui::EndCombo();
        }
    }

    ImGui::SameLine();
    if (ImGui::Button("+")) session.ZoomIn();
    ImGui::SameLine();
    if (ImGui::Button("-")) session.ZoomOut();
    ImGui::SameLine();
    if (ImGui::Button("Reset")) session.ResetView();

    if (refresher.IsLoading()) {
        ImGui::SameLine();
        ImGui::TextDisabled("Loading...");
    }
}

void draw_notices(gui::GuiInterface& gui) {
    const auto& history = gui.getNoticeHistory();
    if (history.empty()) return;

    const gui::Notice& last = history.back();
    ImU32 color = last.type == gui::NoticeType::ERROR ? gui::ThemeUtils::GetErrorTextColor()
                                                      : gui::ThemeUtils::GetMutedTextColor();
    ImGui::PushStyleColor(ImGuiCol_Text, ImGui::ColorConvertU32ToFloat4(color));
    ImGui::TextUnformatted(last.content.c_str());
    ImGui::PopStyleColor();
    if (ImGui::IsItemHovered() && history.size() > 1) {
        ImGui::BeginTooltip();
        for (const auto& notice : history) {
            ImGui::TextUnformatted(notice.content.c_str());
        }
        ImGui::EndTooltip();
    }
}

void draw_network_window(ViewerState& state, gui::GuiInterface& gui, session::GraphSession& session,
                         net::RefreshCoordinator& refresher, gui::ImGuiInputSource& input,
                         render::FrameSource& frames, const gui::GraphView& view) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                             ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;
    ImGui::Begin("Payment Network", nullptr, flags);

    draw_toolbar(state, session, refresher);
    draw_notices(gui);

    ImVec2 canvas_origin = ImGui::GetCursorScreenPos();
    ImVec2 canvas_size = ImGui::GetContentRegionAvail();
    if (canvas_size.x < 50.0f) canvas_size.x = 50.0f;
    if (canvas_size.y < 50.0f) canvas_size.y = 50.0f;

    ImGui::InvisibleButton("network_canvas", canvas_size, ImGuiButtonFlags_MouseButtonLeft);
    bool hovered = ImGui::IsItemHovered();

    session.SetViewportSize(canvas_size);
    input.BeginCanvas(canvas_origin, canvas_size, hovered);
    // Input first, so a drag's pin is read by this frame's tick
    session.HandleInput(input);
    frames.PumpFrame();

    view.Draw(ImGui::GetWindowDrawList(), canvas_origin, canvas_size);

    ImGui::End();
}

} // namespace

int main(int, char**) {
    ViewerState state;
    state.config = LoadViewerConfig();
    state.selected_choice = FindChoiceIndex(state.config);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Failed to initialize libcurl" << std::endl;
        return 1;
    }

    gui::GuiInterface gui_ui;
    try {
        gui_ui.initialize();
    } catch (const std::exception& e) {
        std::cerr << "GUI Initialization failed: " << e.what() << std::endl;
        curl_global_cleanup();
        return 1;
    }

    GLFWwindow* window = gui_ui.getWindow();
    {
        render::FrameSource frames;
        session::GraphSession session(frames, gui_ui);
        gui::GraphView view;
        session.AddRenderSink(&view);

        net::CurlNetworkSource source(state.config.api_base);
        net::RefreshCoordinator refresher(source, gui_ui);
        gui::ImGuiInputSource input(gui_ui);

        refresher.RequestRefresh(net::RefreshRequest{state.config.min_amount, state.config.max_edges});

        // --- Main Render Loop ---
        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            if (auto result = refresher.Poll()) {
                session.LoadPayload(result->payload);
            }
            gui_ui.processNoticeQueue();

            draw_network_window(state, gui_ui, session, refresher, input, frames, view);

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            ImVec4 clear_color = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
            glClearColor(clear_color.x, clear_color.y, clear_color.z, clear_color.w);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        session.RemoveRenderSink(&view);
        // refresher waits for in-flight fetches on destruction, before source goes away
    }

    gui_ui.shutdown();
    curl_global_cleanup();
    return 0;
}
