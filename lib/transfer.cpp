#include "lib/transfer.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <cstdio>
#include <iostream>
#include <curl/curl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Transfer {
    
    namespace {
        constexpr long CONNECT_TIMEOUT_SEC = 15;
        // Abort when throughput stays below 1 KB/s for a minute.
        constexpr long LOW_SPEED_LIMIT = 1024;
        constexpr long LOW_SPEED_TIME_SEC = 60;
        constexpr int POLL_TIMEOUT_MS = 500;
        
        struct FileCloser {
            void operator()(FILE* fp) const {
                if (fp && fclose(fp) != 0) {
                    Logs::warning("Failed to close download file");
                }
            }
        };
        
        using FilePtr = std::unique_ptr<FILE, FileCloser>;
        
        bool isHttp(const std::string& uri) {
            return uri.rfind("http://", 0) == 0 || uri.rfind("https://", 0) == 0;
        }
        
        void applyCommonOptions(CURL* curl, const TransferJob& job, FILE* fp) {
            curl_easy_setopt(curl, CURLOPT_URL, job.uri.c_str());
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, fwrite);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, fp);
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SEC);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, LOW_SPEED_LIMIT);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, LOW_SPEED_TIME_SEC);
            
            if (isHttp(job.uri)) {
                curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
            }
        }
        
        std::string describe(CURL* curl, CURLcode code) {
            std::string message = curl_easy_strerror(code);
            
            if (code == CURLE_HTTP_RETURNED_ERROR) {
                long status = 0;
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
                message += " (HTTP " + std::to_string(status) + ")";
            }
            
            return message;
        }
    }
    
    uint64_t fileSize(const std::string& path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            return 0;
        }
        return static_cast<uint64_t>(st.st_size);
    }
    
    AttemptResult CurlManagedStrategy::attempt(const TransferJob& job, ProgressState& progress) {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
        std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)> multi(curl_multi_init(), curl_multi_cleanup);
        if (!curl || !multi) {
            return AttemptResult::failure("Failed to init curl");
        }
        
        FilePtr fp(fopen(job.partialPath().c_str(), "ab"));
        if (!fp) {
            return AttemptResult::failure("Cannot open " + job.partialPath());
        }
        
        fseek(fp.get(), 0, SEEK_END);
        curl_off_t offset = ftell(fp.get());
        
        if (offset > 0) {
            Logs::info("Resuming from " + ProgressBar::formatSize(static_cast<uint64_t>(offset)));
        }
        
        applyCommonOptions(curl.get(), job, fp.get());
        curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE, offset);
        
        if (curl_multi_add_handle(multi.get(), curl.get()) != CURLM_OK) {
            return AttemptResult::failure("Failed to register curl transfer");
        }
        
        ProgressBar bar("Downloading");
        progress.advanceTo(static_cast<uint64_t>(offset));
        
        int running = 1;
        std::string failure;
        
        while (running > 0) {
            CURLMcode mc = curl_multi_perform(multi.get(), &running);
            if (mc == CURLM_OK && running > 0) {
                mc = curl_multi_poll(multi.get(), nullptr, 0, POLL_TIMEOUT_MS, nullptr);
            }
            
            if (mc != CURLM_OK) {
                failure = curl_multi_strerror(mc);
                break;
            }
            
            // Content length is -1 until (and unless) the server announces it.
            curl_off_t remoteTotal = -1;
            curl_off_t received = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &remoteTotal);
            curl_easy_getinfo(curl.get(), CURLINFO_SIZE_DOWNLOAD_T, &received);
            
            progress.setTotal(remoteTotal > 0 ? static_cast<uint64_t>(offset + remoteTotal)
                                              : ProgressState::UNKNOWN_TOTAL);
            progress.advanceTo(static_cast<uint64_t>(offset + received));
            bar.update(progress);
        }
        
        if (failure.empty()) {
            int pending = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi.get(), &pending)) {
                if (msg->msg == CURLMSG_DONE && msg->data.result != CURLE_OK) {
                    failure = describe(curl.get(), msg->data.result);
                }
            }
        }
        
        curl_multi_remove_handle(multi.get(), curl.get());
        
        if (!failure.empty()) {
            std::cout << std::endl;
            return AttemptResult::failure(failure);
        }
        
        bar.finish(progress);
        return AttemptResult::success();
    }
    
    AttemptResult ExternalToolStrategy::attempt(const TransferJob& job, ProgressState& progress) {
        std::string command;
        
        if (runner.exists("wget")) {
            command = "wget -q -c -O " + CommandRunner::quote(job.partialPath()) + " " +
                      CommandRunner::quote(job.uri);
        } else if (runner.exists("curl")) {
            command = "curl -fsSL -C - -o " + CommandRunner::quote(job.partialPath()) + " " +
                      CommandRunner::quote(job.uri);
        } else {
            return AttemptResult::failure("Neither wget nor curl is installed");
        }
        
        Logs::info("Downloading with external tool, progress unavailable");
        
        CommandResult result = runner.run(command);
        if (!result.ok()) {
            return AttemptResult::failure("exit " + std::to_string(result.exitCode) + ": " + result.output);
        }
        
        progress.advanceTo(fileSize(job.partialPath()));
        return AttemptResult::success();
    }
    
    AttemptResult CurlSimpleStrategy::attempt(const TransferJob& job, ProgressState& progress) {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) {
            return AttemptResult::failure("Failed to init curl");
        }
        
        FilePtr fp(fopen(job.partialPath().c_str(), "wb"));
        if (!fp) {
            return AttemptResult::failure("Cannot open " + job.partialPath());
        }
        
        applyCommonOptions(curl.get(), job, fp.get());
        
        CURLcode code = curl_easy_perform(curl.get());
        if (code != CURLE_OK) {
            return AttemptResult::failure(describe(curl.get(), code));
        }
        
        curl_off_t received = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_SIZE_DOWNLOAD_T, &received);
        progress.advanceTo(static_cast<uint64_t>(received));
        
        return AttemptResult::success();
    }
    
    Engine::Engine(std::vector<std::unique_ptr<Strategy>> strategies)
        : ladder(std::move(strategies)) {}
    
    Engine Engine::withDefaultLadder(CommandRunner& runner) {
        std::vector<std::unique_ptr<Strategy>> strategies;
        strategies.push_back(std::make_unique<CurlManagedStrategy>());
        strategies.push_back(std::make_unique<ExternalToolStrategy>(runner));
        strategies.push_back(std::make_unique<CurlSimpleStrategy>());
        return Engine(std::move(strategies));
    }
    
    std::string Engine::fetch(const TransferJob& job) {
        if (job.reuseExisting && access(job.destination.c_str(), F_OK) == 0) {
            uint64_t existing = fileSize(job.destination);
            Logs::info("Reusing existing " + job.destination + " (" + ProgressBar::formatSize(existing) + ")");
            if (existing < job.minimumBytes) {
                Logs::warning(job.destination + " is smaller than expected, it may be incomplete");
            }
            return job.destination;
        }
        
        Logs::info("Fetching " + job.uri);
        
        std::string failures;
        
        for (const auto& strategy : ladder) {
            ProgressState progress;
            Logs::debug("Trying transfer strategy: " + strategy->name());
            
            AttemptResult result = strategy->attempt(job, progress);
            if (!result.ok) {
                Logs::warning("Transfer strategy '" + strategy->name() + "' failed: " + result.error);
                failures += (failures.empty() ? "" : "; ") + strategy->name() + ": " + result.error;
                continue;
            }
            
            uint64_t size = fileSize(job.partialPath());
            if (size < job.minimumBytes) {
                std::remove(job.partialPath().c_str());
                std::remove(job.destination.c_str());
                throw TransferError(TransferError::Kind::TooSmall,
                    "Downloaded " + job.uri + " is only " + std::to_string(size) +
                    " bytes (expected at least " + std::to_string(job.minimumBytes) + ")");
            }
            
            if (std::rename(job.partialPath().c_str(), job.destination.c_str()) != 0) {
                throw FileError(job.destination, "Cannot move finished download into place");
            }
            
            Logs::success("Downloaded " + job.destination + " (" + ProgressBar::formatSize(size) + ")");
            return job.destination;
        }
        
        if (fileSize(job.partialPath()) > 0) {
            Logs::info("Partial download kept at " + job.partialPath() + " for the next attempt");
        }
        throw TransferError(TransferError::Kind::Exhausted,
            "All transfer strategies failed for " + job.uri + ": " + failures);
    }
}
