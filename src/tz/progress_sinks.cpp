#include "tz/progress_sinks.hpp"

#include <cstdio>

namespace tzupdater {

namespace {
bool g_progress_line_active = false;
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string label(e.label);
    if (label != last_label_) {
        finished_ = false;
        last_label_ = label;
    }
    if (finished_) return;

    if (e.total > 0) {
        int pct = static_cast<int>((e.done * 100ULL) / e.total);
        if (pct > 100)
            pct = 100;
        std::fprintf(stderr,
                     "\r[%s] %3d%% (%llu/%llu bytes)",
                     label.c_str(),
                     pct,
                     (unsigned long long)e.done,
                     (unsigned long long)e.total);
        std::fflush(stderr);
        g_progress_line_active = true;

        if (pct >= 100) {
            std::fprintf(stderr, "\n");
            finished_ = true;
            g_progress_line_active = false;
        }
    } else {
        std::fprintf(stderr, "\r[%s] %llu bytes", label.c_str(), (unsigned long long)e.done);
        std::fflush(stderr);
        g_progress_line_active = true;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace tzupdater
