#include "net/curl_transfer_engine.hpp"

#include "net/curl_global.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <curl/curl.h>
#include <memory>
#include <unordered_map>

namespace reposync {

namespace {

struct Job {
    DownloadTarget target;
    std::FILE* fp = nullptr;
    CURL* easy = nullptr;
    std::string etag;
    char errbuf[CURL_ERROR_SIZE]{};

    ~Job() {
        if (fp) std::fclose(fp);
        if (easy) curl_easy_cleanup(easy);
    }
};

} // namespace

CurlTransferEngine::CurlTransferEngine() : CurlTransferEngine(Options{}) {}

CurlTransferEngine::CurlTransferEngine(const Options& opt) : opt_(opt) {
    if (opt_.max_concurrent == 0)
        opt_.max_concurrent = 1;
    EnsureCurlGlobalInit();
}

Result CurlTransferEngine::FetchAll(const std::vector<DownloadTarget>& targets,
                                    const CompletionCallback& on_complete) {
    if (targets.empty())
        return Result::Ok();

    CURLM* multi = curl_multi_init();
    if (!multi)
        return Result::Fail(kErrTransfer, "curl_multi_init failed");

    std::unordered_map<CURL*, std::unique_ptr<Job>> active;
    std::string failures;
    std::size_t next = 0;

    auto complete = [&](Job& job, std::string error) {
        if (job.fp) {
            const bool close_failed = std::fclose(job.fp) != 0;
            job.fp = nullptr;
            if (close_failed && error.empty())
                error = "cannot write " + job.target.path;
        }
        if (!error.empty()) {
            LogError("Download failed: %s: %s", job.target.uri.c_str(), error.c_str());
            failures += (failures.empty() ? "" : "; ") + job.target.uri + " (" + error + ")";
        } else {
            LogDebug("Downloaded %s -> %s (etag=%s)",
                     job.target.uri.c_str(), job.target.path.c_str(), job.etag.c_str());
        }
        on_complete(DownloadCompletion{job.target.uri, job.target.path, error, job.etag});
    };

    while (next < targets.size() || !active.empty()) {
        while (active.size() < opt_.max_concurrent && next < targets.size()) {
            auto job = std::make_unique<Job>();
            job->target = targets[next++];

            job->fp = std::fopen(job->target.path.c_str(), "wb");
            if (!job->fp) {
                complete(*job, "cannot open " + job->target.path + " for writing");
                continue;
            }
            job->easy = curl_easy_init();
            if (!job->easy) {
                complete(*job, "curl_easy_init failed");
                continue;
            }

            CURL* h = job->easy;
            curl_easy_setopt(h, CURLOPT_URL, job->target.uri.c_str());
            curl_easy_setopt(h, CURLOPT_WRITEDATA, job->fp);
            curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, CaptureETagHeader);
            curl_easy_setopt(h, CURLOPT_HEADERDATA, &job->etag);
            curl_easy_setopt(h, CURLOPT_ERRORBUFFER, job->errbuf);
            curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
            curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opt_.connect_timeout_sec);
            curl_easy_setopt(h, CURLOPT_TIMEOUT, opt_.transfer_timeout_sec);
            curl_easy_setopt(h, CURLOPT_USERAGENT, opt_.user_agent.c_str());

            const CURLMcode mc = curl_multi_add_handle(multi, h);
            if (mc != CURLM_OK) {
                complete(*job, std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc));
                continue;
            }
            active.emplace(h, std::move(job));
        }

        int still_running = 0;
        const CURLMcode perf = curl_multi_perform(multi, &still_running);
        if (perf != CURLM_OK) {
            LogError("curl_multi_perform: %s", curl_multi_strerror(perf));
            for (auto& [h, job] : active) {
                curl_multi_remove_handle(multi, h);
                complete(*job, std::string("curl_multi_perform: ") + curl_multi_strerror(perf));
            }
            active.clear();
            break;
        }

        int msgs_in_queue = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi, &msgs_in_queue)) {
            if (msg->msg != CURLMSG_DONE)
                continue;
            auto it = active.find(msg->easy_handle);
            if (it == active.end())
                continue;

            Job& job = *it->second;
            std::string error;
            if (msg->data.result != CURLE_OK) {
                error = job.errbuf[0] != '\0' ? job.errbuf : curl_easy_strerror(msg->data.result);
            }
            curl_multi_remove_handle(multi, msg->easy_handle);
            complete(job, error);
            active.erase(it);
        }

        if (!active.empty()) {
            curl_multi_poll(multi, nullptr, 0, 1000, nullptr);
        }
    }

    // Targets never started because the loop aborted still get their completion.
    while (next < targets.size()) {
        Job job;
        job.target = targets[next++];
        complete(job, "transfer aborted");
    }

    curl_multi_cleanup(multi);

    if (!failures.empty())
        return Result::Fail(kErrTransfer, "Download failed: " + failures);
    return Result::Ok();
}

} // namespace reposync
