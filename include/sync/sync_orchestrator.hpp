#pragma once

#include "archive/entry_reader.hpp"
#include "net/transfer.hpp"
#include "sync/progress.hpp"
#include "sync/registry.hpp"
#include "util/result.hpp"

#include <string>

namespace reposync {

enum class SyncOutcome {
    Updated,
    NoChanges,
    Failed,
};

const char* ToString(SyncOutcome outcome);

// Runs one batch over every configured repository:
// freshness check -> concurrent fetch -> sequential extraction -> one commit.
// Fatal conditions never escape as errors: they end the batch with Failed and
// the reason is kept in LastFailure(). The registry is only written on Updated.
class SyncOrchestrator {
  public:
    enum class State {
        Idle,
        CheckingFreshness,
        Fetching,
        Extracting,
        Committing,
        NoChanges,
        Updated,
        Failed,
    };

    struct Options {
        std::string download_dir = "/tmp";
        EntryReaderOptions entry{};
    };

    SyncOrchestrator(IRegistry& registry,
                     ITransferEngine& transfer,
                     IETagProbe& probe,
                     IReporter& reporter);
    SyncOrchestrator(IRegistry& registry,
                     ITransferEngine& transfer,
                     IETagProbe& probe,
                     IReporter& reporter,
                     const Options& opt);

    SyncOutcome Run();

    State CurrentState() const { return state_; }
    const Result& LastFailure() const { return last_failure_; }

  private:
    SyncOutcome Fail(Result why);
    void ShowInconsistencies();

    IRegistry& registry_;
    ITransferEngine& transfer_;
    IETagProbe& probe_;
    IReporter& reporter_;
    Options opt_;

    State state_ = State::Idle;
    Result last_failure_;
};

const char* ToString(SyncOrchestrator::State state);

} // namespace reposync
