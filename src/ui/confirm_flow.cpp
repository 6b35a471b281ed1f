#include "ui/confirm_flow.hpp"
#include "i18n/i18n.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <vector>

std::optional<MenuAction> map_menu_key(char key) {
    switch (std::tolower(static_cast<unsigned char>(key))) {
        case 'l': return MenuAction::Launch;
        case 'r': return MenuAction::Reinstall;
        case 'u': return MenuAction::Uninstall;
        case 'x': return MenuAction::Exit;
        default:  return std::nullopt;
    }
}

const char* menu_action_name(MenuAction action) {
    switch (action) {
        case MenuAction::Launch:    return "launch";
        case MenuAction::Reinstall: return "reinstall";
        case MenuAction::Uninstall: return "uninstall";
        case MenuAction::Exit:      return "exit";
    }
    return "unknown";
}

ConfirmationFlow::ConfirmationFlow(KeyReader& keys, FrameRenderer& renderer)
    : keys_(keys), renderer_(renderer) {}

bool ConfirmationFlow::confirm(MenuAction action, int required, const std::string& detail) {
    if (required < 1) required = 1;
    int received = 0;

    const char* title = T().confirm;
    const char* prompt = T().confirm_prompt;
    if (action == MenuAction::Uninstall) {
        title = T().uninstall_title;
        prompt = T().uninstall_confirm;
    } else if (action == MenuAction::Reinstall) {
        title = T().reinstall_title;
        prompt = T().reinstall_confirm;
    }

    // Only keys pressed while this prompt is visible count
    keys_.discard_pending();

    for (;;) {
        std::vector<std::string> body = {prompt};
        if (!detail.empty()) body.push_back(detail);
        body.push_back("");
        body.push_back(std::string(T().confirm_count) + ": " +
                       std::to_string(received) + "/" + std::to_string(required));
        renderer_.render_frame(title, body, T().confirm_hint, FrameRenderer::Tone::Warning);

        auto key = keys_.read_key();
        if (!key) {
            spdlog::info("confirm {}: input closed", menu_action_name(action));
            return false;
        }

        switch (*key) {
            case 'y':
            case 'Y':
                if (++received >= required) {
                    spdlog::info("confirm {}: confirmed", menu_action_name(action));
                    return true;
                }
                break;
            case 'n':
            case 'N':
                if (received == 0) {
                    spdlog::info("confirm {}: declined", menu_action_name(action));
                    return false;
                }
                received = 0;
                break;
            case kEscapeKey:
            case 'x':
            case 'X':
            case 'q':
            case 'Q':
                spdlog::info("confirm {}: cancelled", menu_action_name(action));
                return false;
            default:
                break;
        }
    }
}
