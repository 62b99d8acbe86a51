#pragma once

#include "client/mode_controller.hpp"
#include "client/remote_store.hpp"
#include "client/state.hpp"

namespace quizsync::client {

// Render one SDL2/ImGui frame. Returns false once the user closed the window.
bool render_ui(ClientState& state, ConnectionModeController& controller, LocalIdentity& identity);

// Release the window and ImGui context created by render_ui.
void shutdown_ui();

}  // namespace quizsync::client
