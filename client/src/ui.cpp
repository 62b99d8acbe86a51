#include "client/ui.hpp"

#include <SDL2/SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include <chrono>
#include <ctime>
#include <future>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace quizsync::client {
namespace {

constexpr std::size_t kMaxNotices = 50;
const char* kAnswerOptions[] = {"A", "B", "C", "D"};

SDL_Window* g_window = nullptr;
SDL_Renderer* g_renderer = nullptr;
bool g_initialized = false;

bool input_text(const char* label, std::string& value, std::size_t capacity = 128) {
  std::vector<char> buffer(capacity, '\0');
  value.copy(buffer.data(), capacity - 1);
  if (ImGui::InputText(label, buffer.data(), buffer.size())) {
    value = buffer.data();
    return true;
  }
  return false;
}

std::string clock_text() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
  return buf;
}

ImVec4 mode_color(ConnectionMode mode) {
  switch (mode) {
    case ConnectionMode::Cloud:
      return ImVec4(0.5f, 0.9f, 0.5f, 1.0f);
    case ConnectionMode::LocalRelay:
      return ImVec4(0.5f, 0.7f, 1.0f, 1.0f);
    case ConnectionMode::Offline:
      break;
  }
  return ImVec4(0.9f, 0.6f, 0.3f, 1.0f);
}

const char* notice_label(Notice::Kind kind) {
  switch (kind) {
    case Notice::Kind::Offline:
      return "offline";
    case Notice::Kind::RelayConnected:
      return "relay";
    case Notice::Kind::RelayError:
      return "error";
    case Notice::Kind::ReconnectFailed:
      return "reconnect";
    case Notice::Kind::SyncComplete:
      return "sync";
  }
  return "notice";
}

// -- UI subpanels ----------------------------------------------------------
void render_header(ClientState& st, ConnectionModeController& controller, LocalIdentity& identity) {
  if (!ImGui::BeginMainMenuBar()) return;

  ConnectionMode mode = controller.mode();
  ImGui::Text("Mode");
  ImGui::SameLine();
  ImGui::TextColored(mode_color(mode), "%s", to_string(mode));
  ImGui::Separator();

  bool online = controller.network_online();
  if (ImGui::Button(online ? "Go offline" : "Go online")) {
    if (online) {
      controller.network_lost();
    } else {
      controller.network_restored();
    }
  }
  ImGui::Separator();

  auto current = identity.current_identity();
  if (current) {
    ImGui::Text("Signed in as %s", current->display_name.c_str());
    ImGui::SameLine();
    if (ImGui::Button("Sign out")) {
      identity.sign_out();
      controller.auth_state_changed(false);
    }
  } else {
    ImGui::SetNextItemWidth(120);
    input_text("##user", st.user_id, 64);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(160);
    input_text("##name", st.display_name, 64);
    ImGui::SameLine();
    if (ImGui::Button("Sign in") && !st.user_id.empty()) {
      identity.sign_in(Identity{st.user_id, st.display_name});
      controller.auth_state_changed(true);
    }
  }
  ImGui::EndMainMenuBar();
}

void render_relay(ClientState& st, ConnectionModeController& controller) {
  ImGui::Begin("Local Hub");
  ImGui::SetNextItemWidth(200);
  input_text("Address", st.relay_address, 64);
  ImGui::SameLine();

  bool connecting = st.pending_connect.valid();
  if (connecting) {
    ImGui::TextDisabled("Connecting...");
    if (st.pending_connect.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      st.pending_connect.get();
    }
  } else if (ImGui::Button("Connect")) {
    std::string address = st.relay_address;
    st.pending_connect = std::async(std::launch::async, [&controller, address] {
      return controller.connect_to_relay(address);
    });
  }

  auto last = controller.last_relay_address();
  ImGui::Text("Last hub: %s", last ? last->c_str() : "-");
  ImGui::Text("Reconnect attempts: %d", controller.reconnect_attempts());
  if (controller.mode() == ConnectionMode::LocalRelay) {
    ImGui::Text("Active users on hub: %zu", controller.relay_active_users());
  }
  ImGui::End();
}

void render_answer(ClientState& st, ConnectionModeController& controller, LocalIdentity& identity) {
  ImGui::Begin("Answer");
  input_text("Question", st.question_id, 64);
  for (const char* option : kAnswerOptions) {
    if (ImGui::RadioButton(option, st.answer == option)) st.answer = option;
    ImGui::SameLine();
  }
  ImGui::NewLine();
  input_text("Reason", st.reason, 512);
  if (ImGui::Button("Submit")) {
    bool delivered = controller.submit_response(st.question_id, st.answer, st.reason);
    st.last_submit = delivered ? "Delivered (" + std::string(to_string(controller.mode())) + ")"
                               : "Saved on this device";
  }
  if (!st.last_submit.empty()) {
    ImGui::SameLine();
    ImGui::Text("%s", st.last_submit.c_str());
  }

  ImGui::Separator();
  ImGui::Text("My answers");
  auto current = identity.current_identity();
  auto mine = current ? controller.cache().own_responses_for(current->user_id)
                      : std::vector<quizsync::Response>();
  if (ImGui::BeginTable("mine", 3, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
    ImGui::TableSetupColumn("Question");
    ImGui::TableSetupColumn("Answer");
    ImGui::TableSetupColumn("Reason");
    ImGui::TableHeadersRow();
    for (const auto& r : mine) {
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0); ImGui::Text("%s", r.question_id.c_str());
      ImGui::TableSetColumnIndex(1); ImGui::Text("%s", r.answer.c_str());
      ImGui::TableSetColumnIndex(2); ImGui::TextWrapped("%s", r.reason.c_str());
    }
    ImGui::EndTable();
  }
  ImGui::End();
}

void render_peers(ClientState& st, ConnectionModeController& controller) {
  ImGui::Begin("Class answers");
  input_text("Question##peers", st.watched_question, 64);
  ImGui::SameLine();
  if (ImGui::Button("Refresh")) {
    st.peer_rows = controller.get_peer_responses(st.watched_question);
  }
  if (ImGui::BeginTable("peers", 3, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg |
                                        ImGuiTableFlags_SizingStretchProp)) {
    ImGui::TableSetupColumn("Student");
    ImGui::TableSetupColumn("Answer");
    ImGui::TableSetupColumn("Reason");
    ImGui::TableHeadersRow();
    for (const auto& r : st.peer_rows) {
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0); ImGui::Text("%s", r.display_name.c_str());
      ImGui::TableSetColumnIndex(1); ImGui::Text("%s", r.answer.c_str());
      ImGui::TableSetColumnIndex(2); ImGui::TextWrapped("%s", r.reason.c_str());
    }
    ImGui::EndTable();
  }
  ImGui::End();
}

void render_notices(ClientState& st) {
  for (auto& notice : st.inbox.drain()) {
    st.notices.push_back(NoticeRow{notice, clock_text()});
  }
  while (st.notices.size() > kMaxNotices) st.notices.erase(st.notices.begin());

  ImGui::Begin("Notices");
  for (auto it = st.notices.rbegin(); it != st.notices.rend(); ++it) {
    ImGui::TextWrapped("%s [%s] %s", it->time.c_str(), notice_label(it->notice.kind),
                       it->notice.text.c_str());
  }
  ImGui::End();
}

}  // namespace

// ---------------------------------------------------------------------------
bool render_ui(ClientState& state, ConnectionModeController& controller, LocalIdentity& identity) {
  if (!g_initialized) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      spdlog::error("SDL_Init failed: {}", SDL_GetError());
      return false;
    }
    g_window = SDL_CreateWindow("Quiz Sync", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                1280, 720, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    g_renderer = SDL_CreateRenderer(g_window, -1,
                                    SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplSDL2_InitForSDLRenderer(g_window, g_renderer);
    ImGui_ImplSDLRenderer2_Init(g_renderer);
    g_initialized = true;
  }

  bool running = true;
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    ImGui_ImplSDL2_ProcessEvent(&event);
    if (event.type == SDL_QUIT) running = false;
  }

  ImGui_ImplSDLRenderer2_NewFrame();
  ImGui_ImplSDL2_NewFrame();
  ImGui::NewFrame();

  render_header(state, controller, identity);
  render_relay(state, controller);
  render_answer(state, controller, identity);
  render_peers(state, controller);
  render_notices(state);

  ImGui::Render();
  SDL_SetRenderDrawColor(g_renderer, 30, 30, 30, 255);
  SDL_RenderClear(g_renderer);
  ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData());
  SDL_RenderPresent(g_renderer);

  return running;
}

void shutdown_ui() {
  if (!g_initialized) return;
  ImGui_ImplSDLRenderer2_Shutdown();
  ImGui_ImplSDL2_Shutdown();
  ImGui::DestroyContext();
  SDL_DestroyRenderer(g_renderer);
  SDL_DestroyWindow(g_window);
  SDL_Quit();
  g_initialized = false;
}

}  // namespace quizsync::client
