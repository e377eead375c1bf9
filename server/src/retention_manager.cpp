#include "chunkyard/server/retention_manager.hpp"

#include <spdlog/spdlog.h>

namespace chunkyard::server
{

    void to_json(nlohmann::json &json, const SweepReport &report)
    {
        json = nlohmann::json{
            {"sessions", report.sessions},
            {"files", report.files},
            {"jobs", report.jobs},
        };
    }

    RetentionManager::RetentionManager(asio::io_context &io_context, UploadManager &uploads, FileCatalog &files,
                                       JobEngine &jobs, RetentionConfig config)
        : uploads_(uploads), files_(files), jobs_(jobs), config_(config), timer_(io_context)
    {
    }

    SweepReport RetentionManager::sweep(TimePoint now)
    {
        std::lock_guard lock(sweep_mutex_);
        SweepReport report{};
        report.sessions = uploads_.sweep_expired(now);

        for (const auto &file : files_.list())
        {
            if (file.expires_at > now)
            {
                continue;
            }
            switch (jobs_.remove_unpinned_file(file.file_id))
            {
            case FileRemoval::Removed:
                ++report.files;
                break;
            case FileRemoval::Pinned:
                spdlog::debug("Keeping expired file {}: input of an active job", file.file_id);
                break;
            case FileRemoval::Missing:
                break;
            }
        }

        report.jobs = jobs_.prune_finished(now - config_.job_retention);

        if (report.sessions + report.files + report.jobs > 0)
        {
            spdlog::info("Retention sweep removed {} session(s), {} file(s), {} job(s)", report.sessions,
                         report.files, report.jobs);
        }
        else
        {
            spdlog::debug("Retention sweep found nothing to remove");
        }
        return report;
    }

    void RetentionManager::start()
    {
        running_ = true;
        schedule_next();
    }

    void RetentionManager::stop()
    {
        running_ = false;
        timer_.cancel();
    }

    void RetentionManager::schedule_next()
    {
        timer_.expires_after(config_.sweep_interval);
        timer_.async_wait([this](std::error_code ec)
                          {
            if (ec || !running_)
            {
                return;
            }
            try
            {
                sweep(Clock::now());
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Retention sweep failed: {}", ex.what());
            }
            schedule_next(); });
    }

} // namespace chunkyard::server
