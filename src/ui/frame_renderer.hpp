#pragma once

#include "core/progress_channel.hpp"

#include <ostream>
#include <string>
#include <vector>

/// Draws bordered frames that overwrite each other in place.
class FrameRenderer {
public:
    enum class Tone {
        Normal,
        Warning,
        Error,
        Success
    };

    /// width: preferred frame width (raised to kMinWidth)
    /// terminal_columns: 0 = ask the terminal
    explicit FrameRenderer(std::ostream& out, int width = kDefaultWidth, int terminal_columns = 0);

    void render_frame(const std::string& title,
                      const std::vector<std::string>& body,
                      const std::string& footer = "",
                      Tone tone = Tone::Normal);

    /// Progress frame: phase label, fixed-width bar with a percentage, detail
    void render_progress(ProgressPhase phase, float fraction, const std::string& detail,
                         const std::string& title = "");

    /// Move below the last frame so later output does not overwrite it.
    void finish();

    /// Effective frame width after clamping to the terminal
    int width() const { return width_; }

    /// Number of frames drawn so far
    int frames() const { return frames_; }

    /// "██████░░░░ 60%" with exactly `cells` bar cells
    static std::string format_bar(float fraction, int cells = kBarCells);

    static constexpr int kDefaultWidth = 60;
    static constexpr int kMinWidth = 20;
    static constexpr int kBarCells = 40;

private:
    std::ostream& out_;
    int width_;
    int frames_ = 0;
    std::string reset_position_;
};
