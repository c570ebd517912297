#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/color.h>

#include "ipod/common/types.hpp"

namespace ipod::progress {

namespace palette {
constexpr auto kSky   = fmt::color{0x4FA3E0};
constexpr auto kIce   = fmt::color{0x9CCFF2};
constexpr auto kSlate = fmt::color{0x5C7A99};
constexpr auto kMint  = fmt::color{0x66BB6A};
constexpr auto kTrack = fmt::color{0x3A3A3A};
} // namespace palette

/**
 * @brief Single-line orbit counter drawn on stderr.
 *
 * The line reads `<prefix> <spinner> <bar> <pct> • [elapsed<eta] • Orbits:
 * done/total`. The manager advances it once per merged chunk by the number
 * of orbits in that chunk. Completion freezes the elapsed time.
 */
class ProgressBar {
public:
    ProgressBar(std::string_view prefix,
                SizeType num_orbits,
                bool transient = true,
                int bar_width  = 40);

    ~ProgressBar();
    ProgressBar(const ProgressBar&)            = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;
    ProgressBar(ProgressBar&&)                 = delete;
    ProgressBar& operator=(ProgressBar&&)      = delete;

    void advance(SizeType num_orbits);
    void mark_as_completed();

    [[nodiscard]] bool is_completed() const { return m_completed.load(); }
    [[nodiscard]] SizeType get_progress() const { return m_done.load(); }
    [[nodiscard]] SizeType get_max_progress() const { return m_total; }
    [[nodiscard]] std::chrono::nanoseconds get_elapsed() const;

    [[nodiscard]] std::string to_string() const;

private:
    std::string m_prefix;
    SizeType m_total;
    bool m_transient;
    int m_bar_width;
    std::atomic<SizeType> m_done{0};
    std::atomic<bool> m_completed{false};
    std::chrono::steady_clock::time_point m_start;
    std::atomic<std::chrono::nanoseconds::rep> m_frozen_elapsed{-1};
    std::mutex m_draw_mutex;

    static constexpr std::array<std::string_view, 10> kSpinner = {
        "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};

    [[nodiscard]] double fraction_done() const;
    [[nodiscard]] std::string render_spinner() const;
    [[nodiscard]] std::string render_bar() const;
    [[nodiscard]] std::string render_times() const;
    void redraw();
};

// Hides the console cursor for the lifetime of a drawn bar
class ProgressGuard {
public:
    explicit ProgressGuard(bool show);
    ~ProgressGuard();
    ProgressGuard(const ProgressGuard&)            = delete;
    ProgressGuard& operator=(const ProgressGuard&) = delete;
    ProgressGuard(ProgressGuard&&)                 = delete;
    ProgressGuard& operator=(ProgressGuard&&)      = delete;

private:
    bool m_show;
};

std::unique_ptr<ProgressBar> make_orbits_bar(std::string_view prefix,
                                             SizeType num_orbits,
                                             bool transient = true);

} // namespace ipod::progress
