#include "ipod/progress.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iostream>

#include <fmt/color.h>
#include <fmt/format.h>
#include <indicators/cursor_control.hpp>

namespace ipod::progress {

namespace {

std::string hms_string(std::chrono::nanoseconds dur) {
    const std::chrono::hh_mm_ss hms{
        std::chrono::floor<std::chrono::seconds>(dur)};
    if (hms.hours().count() > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}s", hms.hours().count(),
                           hms.minutes().count(), hms.seconds().count());
    }
    return fmt::format("{:02d}:{:02d}s", hms.minutes().count(),
                       hms.seconds().count());
}

std::string glyphs(std::string_view glyph, int count) {
    std::string out;
    for (int i = 0; i < count; ++i) {
        out.append(glyph);
    }
    return out;
}

} // namespace

ProgressBar::ProgressBar(std::string_view prefix,
                         SizeType num_orbits,
                         bool transient,
                         int bar_width)
    : m_prefix(prefix),
      m_total(num_orbits),
      m_transient(transient),
      m_bar_width(bar_width),
      m_start(std::chrono::steady_clock::now()) {}

ProgressBar::~ProgressBar() { mark_as_completed(); }

void ProgressBar::advance(SizeType num_orbits) {
    const auto done = std::min(m_done.load() + num_orbits, m_total);
    m_done.store(done);
    if (done == m_total) {
        mark_as_completed();
        return;
    }
    redraw();
}

void ProgressBar::mark_as_completed() {
    if (m_completed.exchange(true)) {
        return;
    }
    const auto elapsed = std::chrono::steady_clock::now() - m_start;
    m_frozen_elapsed.store(
        std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
    redraw();
}

std::chrono::nanoseconds ProgressBar::get_elapsed() const {
    const auto frozen = m_frozen_elapsed.load();
    if (frozen >= 0) {
        return std::chrono::nanoseconds{frozen};
    }
    return std::chrono::steady_clock::now() - m_start;
}

double ProgressBar::fraction_done() const {
    if (m_total == 0) {
        return 1.0;
    }
    return std::clamp(static_cast<double>(get_progress()) /
                          static_cast<double>(m_total),
                      0.0, 1.0);
}

std::string ProgressBar::render_spinner() const {
    if (is_completed()) {
        return fmt::format("{}", fmt::styled("✔", fmt::fg(palette::kMint) |
                                                      fmt::emphasis::bold));
    }
    constexpr std::int64_t kFrameMs = 120;
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(get_elapsed());
    const auto frame = static_cast<SizeType>(ms.count() / kFrameMs);
    return fmt::format("{}", fmt::styled(kSpinner[frame % kSpinner.size()],
                                         fmt::fg(palette::kSky)));
}

std::string ProgressBar::render_bar() const {
    const auto filled = static_cast<int>(m_bar_width * fraction_done());
    return fmt::format(
        "{}{}", fmt::styled(glyphs("━", filled), fmt::fg(palette::kSky)),
        fmt::styled(glyphs("━", m_bar_width - filled),
                    fmt::fg(palette::kTrack)));
}

std::string ProgressBar::render_times() const {
    const auto elapsed = get_elapsed();
    std::string eta    = "--:--s";
    const auto done    = get_progress();
    if (done > 0) {
        const auto remaining = elapsed * (static_cast<double>(m_total - done) /
                                          static_cast<double>(done));
        eta = hms_string(
            std::chrono::duration_cast<std::chrono::nanoseconds>(remaining));
    }
    return fmt::format("{}",
                       fmt::styled(fmt::format("[{}<{}]", hms_string(elapsed),
                                               eta),
                                   fmt::fg(palette::kSlate)));
}

std::string ProgressBar::to_string() const {
    const auto pct = static_cast<int>(fraction_done() * 100.0);
    return fmt::format(
        "{} {} {} {} • {} • {}",
        fmt::styled(m_prefix, fmt::fg(palette::kSky) | fmt::emphasis::bold),
        render_spinner(), render_bar(),
        fmt::styled(fmt::format("{:3d}%", pct), fmt::fg(palette::kIce)),
        render_times(),
        fmt::styled(fmt::format("Orbits: {}/{}", get_progress(), m_total),
                    fmt::fg(palette::kMint)));
}

void ProgressBar::redraw() {
    std::lock_guard<std::mutex> lock(m_draw_mutex);
    std::fputs("\r\033[K", stderr);
    if (!is_completed()) {
        std::cerr << to_string();
    } else if (!m_transient) {
        std::cerr << to_string() << '\n';
    }
    std::cerr.flush();
}

ProgressGuard::ProgressGuard(bool show) : m_show(show) {
    if (m_show) {
        indicators::show_console_cursor(false);
    }
}

ProgressGuard::~ProgressGuard() {
    if (m_show) {
        indicators::show_console_cursor(true);
    }
}

std::unique_ptr<ProgressBar> make_orbits_bar(std::string_view prefix,
                                             SizeType num_orbits,
                                             bool transient) {
    return std::make_unique<ProgressBar>(prefix, num_orbits, transient);
}

} // namespace ipod::progress
