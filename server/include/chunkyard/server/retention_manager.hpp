#pragma once

#include <cstddef>
#include <mutex>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "chunkyard/server/config.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/job_engine.hpp"
#include "chunkyard/server/upload_manager.hpp"

namespace chunkyard::server
{

    struct SweepReport
    {
        std::size_t sessions{};
        std::size_t files{};
        std::size_t jobs{};
    };

    void to_json(nlohmann::json &json, const SweepReport &report);

    // Periodic garbage collection of expired sessions, expired files and old job records.
    class RetentionManager
    {
    public:
        RetentionManager(asio::io_context &io_context, UploadManager &uploads, FileCatalog &files,
                         JobEngine &jobs, RetentionConfig config);

        SweepReport sweep(TimePoint now);

        void start();
        void stop();

    private:
        void schedule_next();

        UploadManager &uploads_;
        FileCatalog &files_;
        JobEngine &jobs_;
        RetentionConfig config_;
        asio::steady_timer timer_;
        std::mutex sweep_mutex_;
        bool running_{false};
    };

} // namespace chunkyard::server
