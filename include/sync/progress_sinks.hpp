#pragma once

#include "sync/progress.hpp"

#include <string>

namespace reposync {

class FileProgressReporter final : public IReporter {
public:
    explicit FileProgressReporter(std::string path);

    void OnProgress(const ProgressEvent& e) override;
    void OnMessage(std::string_view) override {}

private:
    std::string path_;
};

class ConsoleReporter final : public IReporter {
public:
    explicit ConsoleReporter(bool show_progress = true) : show_progress_(show_progress) {}

    void OnProgress(const ProgressEvent& e) override;
    void OnMessage(std::string_view text) override;

private:
    bool show_progress_ = true;
};

class NullReporter final : public IReporter {
public:
    void OnProgress(const ProgressEvent&) override {}
    void OnMessage(std::string_view) override {}
};

// Fans every call out to two reporters.
class TeeReporter final : public IReporter {
public:
    TeeReporter(IReporter& first, IReporter& second) : first_(first), second_(second) {}

    void OnProgress(const ProgressEvent& e) override {
        first_.OnProgress(e);
        second_.OnProgress(e);
    }
    void OnMessage(std::string_view text) override {
        first_.OnMessage(text);
        second_.OnMessage(text);
    }

private:
    IReporter& first_;
    IReporter& second_;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace reposync
