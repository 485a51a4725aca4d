#pragma once
#include <string_view>

namespace reposync {

struct ProgressEvent {
    std::string_view label;
    int percent = 0;
};

// User-facing sink. Calls may arrive at high frequency during extraction.
class IReporter {
  public:
    virtual ~IReporter() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
    virtual void OnMessage(std::string_view text) = 0;
};

// Passes a percentage through only when it is strictly above the last one passed.
class PercentTracker {
  public:
    bool Advance(int percent) {
        if (percent <= last_)
            return false;
        last_ = percent;
        return true;
    }

    int Last() const { return last_; }

  private:
    int last_ = 0;
};

} // namespace reposync
