#pragma once

#include "ui/frame_renderer.hpp"
#include "ui/key_reader.hpp"

#include <optional>
#include <string>

enum class MenuAction {
    Launch,
    Reinstall,
    Uninstall,
    Exit
};

/// L/R/U/X, case-insensitive. Any other key maps to nothing.
std::optional<MenuAction> map_menu_key(char key);

const char* menu_action_name(MenuAction action);

/// Asks for the same "y" several times before a destructive action.
class ConfirmationFlow {
public:
    ConfirmationFlow(KeyReader& keys, FrameRenderer& renderer);

    /// The prompt wording follows `action`. Keys typed before the prompt
    /// appeared are discarded first.
    /// y counts one confirmation and returns true once `required` are in.
    /// n starts over, or cancels when nothing was confirmed yet.
    /// Esc, x, q and end of input cancel. Other keys redraw the prompt.
    /// detail: extra line shown under the prompt (e.g. the target path)
    bool confirm(MenuAction action, int required, const std::string& detail = "");

private:
    KeyReader& keys_;
    FrameRenderer& renderer_;
};
