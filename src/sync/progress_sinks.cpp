#include "sync/progress_sinks.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace reposync {

namespace {
std::atomic_bool g_progress_line_active{false};

int Clamp(int pct) {
    if (pct < 0) return 0;
    if (pct > 100) return 100;
    return pct;
}
} // namespace

FileProgressReporter::FileProgressReporter(std::string path) : path_(std::move(path)) {}

void FileProgressReporter::OnProgress(const ProgressEvent& e) {
    const nlohmann::json status = {
        {"label", std::string(e.label)},
        {"percent", Clamp(e.percent)},
    };

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;
    os << status.dump();
    os.close();
    if (!os.good())
        return;

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0)
        std::remove(tmp_path.c_str());
}

void ConsoleReporter::OnProgress(const ProgressEvent& e) {
    if (!show_progress_)
        return;

    const int pct = Clamp(e.percent);
    std::fprintf(stderr, "\r%.*s %3d%%", (int)e.label.size(), e.label.data(), pct);
    std::fflush(stderr);
    g_progress_line_active = true;

    if (pct >= 100) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

void ConsoleReporter::OnMessage(std::string_view text) {
    ClearProgressLine();
    std::fprintf(stdout, "%.*s\n", (int)text.size(), text.data());
    std::fflush(stdout);
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace reposync
