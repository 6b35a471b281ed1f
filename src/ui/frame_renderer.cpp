#include "ui/frame_renderer.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/terminal.hpp>

#include <algorithm>
#include <cmath>

using namespace ftxui;

FrameRenderer::FrameRenderer(std::ostream& out, int width, int terminal_columns)
    : out_(out), width_(std::max(width, kMinWidth)) {
    int columns = terminal_columns > 0 ? terminal_columns : Terminal::Size().dimx;
    if (columns > 0 && columns < width_) {
        width_ = std::max(columns, kMinWidth);
    }
}

std::string FrameRenderer::format_bar(float fraction, int cells) {
    if (std::isnan(fraction) || fraction < 0.0f) fraction = 0.0f;
    if (fraction > 1.0f) fraction = 1.0f;
    if (cells < 1) cells = 1;

    int filled = static_cast<int>(fraction * static_cast<float>(cells));
    int pct = static_cast<int>(fraction * 100.0f);

    std::string bar;
    for (int i = 0; i < cells; ++i) {
        bar += (i < filled) ? "█" : "░";
    }
    return bar + " " + std::to_string(pct) + "%";
}

void FrameRenderer::render_frame(const std::string& title,
                                 const std::vector<std::string>& body,
                                 const std::string& footer,
                                 Tone tone) {
    Elements content;
    content.push_back(text(" " + title) | bold);
    content.push_back(separator());
    for (const auto& line : body) {
        content.push_back(text(" " + line));
    }
    if (!footer.empty()) {
        content.push_back(separator());
        content.push_back(text(" " + footer) | dim);
    }

    Element doc = vbox(std::move(content)) | border;
    switch (tone) {
        case Tone::Warning: doc = doc | color(Color::Yellow); break;
        case Tone::Error:   doc = doc | color(Color::Red); break;
        case Tone::Success: doc = doc | color(Color::Green); break;
        case Tone::Normal:  break;
    }

    auto screen = Screen::Create(Dimension::Fixed(width_), Dimension::Fit(doc));
    Render(screen, doc);

    // Clear the previous frame and draw over it
    out_ << reset_position_ << screen.ToString() << std::flush;
    reset_position_ = screen.ResetPosition(true);
    ++frames_;
}

void FrameRenderer::render_progress(ProgressPhase phase, float fraction, const std::string& detail,
                                    const std::string& title) {
    const char* label = phase == ProgressPhase::Downloading ? T().install_downloading
                                                            : T().install_extracting;
    // Border, padding and " 100%" need 9 columns beside the bar
    int cells = std::min(kBarCells, std::max(1, width_ - 9));

    std::vector<std::string> body = {
        label,
        "",
        format_bar(fraction, cells),
    };
    if (!detail.empty()) body.push_back(detail);

    render_frame(title.empty() ? std::string(T().app_title) : title, body);
}

void FrameRenderer::finish() {
    if (frames_ > 0 && !reset_position_.empty()) {
        out_ << "\n" << std::flush;
    }
    reset_position_.clear();
}
