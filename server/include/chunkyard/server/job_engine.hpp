#pragma once

#include <atomic>
#include <deque>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "chunkyard/server/config.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/records.hpp"
#include "chunkyard/server/registry.hpp"
#include "chunkyard/server/transform/transform_operation.hpp"

namespace chunkyard::server
{

    enum class FileRemoval
    {
        Removed,
        Missing,
        Pinned
    };

    // Runs transform jobs on its own thread pool. Heavy kinds share a fixed number of slots;
    // jobs beyond that wait in FIFO order while staying "queued".
    class JobEngine
    {
    public:
        // Operations missing from the map fall back to make_default_operations. Jobs left
        // non-terminal by a previous run are marked failed.
        JobEngine(FileCatalog &files, Registry<TransformJob> &jobs, TransformConfig config,
                  std::filesystem::path workspace_root, transform::OperationMap operations = {});
        ~JobEngine();

        JobEngine(const JobEngine &) = delete;
        JobEngine &operator=(const JobEngine &) = delete;

        TransformJob submit(std::string_view kind, std::vector<std::string> input_file_ids,
                            nlohmann::json params);

        TransformJob status(const std::string &job_id) const;

        // Inputs of queued and processing jobs.
        std::set<std::string> pinned_inputs() const;

        // Deletes a stored file unless a queued or processing job reads it. Serialized with submit(),
        // so a file that passed submission checks cannot disappear before its job is recorded.
        FileRemoval remove_unpinned_file(const std::string &file_id);

        // Drops completed and failed jobs that finished before cutoff; returns how many.
        std::size_t prune_finished(TimePoint cutoff);

        std::size_t pending_count() const;

        // Stops accepting work and waits for running jobs.
        void shutdown();

    private:
        void recover_interrupted();
        void schedule(const std::string &job_id, TransformKind kind);
        void release_heavy_slot();
        void execute(const std::string &job_id, bool holds_heavy_slot);
        std::vector<transform::OperationInput> prepare_inputs(const TransformJob &job,
                                                              const std::filesystem::path &workspace);
        void report_progress(const std::string &job_id, int percent);
        void mark_completed(const std::string &job_id, std::vector<std::string> outputs, nlohmann::json result);
        void mark_failed(const std::string &job_id, const std::string &message);

        FileCatalog &files_;
        Registry<TransformJob> &jobs_;
        TransformConfig config_;
        std::filesystem::path workspace_root_;
        transform::OperationMap operations_;

        std::mutex pin_mutex_;
        std::mutex heavy_mutex_;
        std::size_t heavy_running_{0};
        std::deque<std::string> heavy_pending_;
        std::atomic<bool> stopping_{false};

        asio::thread_pool pool_;
    };

} // namespace chunkyard::server
