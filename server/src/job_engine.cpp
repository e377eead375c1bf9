#include "chunkyard/server/job_engine.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

#include <asio/post.hpp>
#include <spdlog/spdlog.h>

#include "chunkyard/crypto.hpp"
#include "chunkyard/server/service_error.hpp"

namespace chunkyard::server
{

    namespace
    {

        constexpr std::size_t kStageBufferSize = 256 * 1024;

        // Removes a job's scratch directory however the job ends.
        class WorkspaceGuard
        {
        public:
            explicit WorkspaceGuard(std::filesystem::path path) : path_(std::move(path))
            {
                std::filesystem::create_directories(path_);
            }

            ~WorkspaceGuard()
            {
                std::error_code ec;
                std::filesystem::remove_all(path_, ec);
                if (ec)
                {
                    spdlog::warn("Failed to remove workspace {}: {}", path_.string(), ec.message());
                }
            }

            WorkspaceGuard(const WorkspaceGuard &) = delete;
            WorkspaceGuard &operator=(const WorkspaceGuard &) = delete;

            const std::filesystem::path &path() const noexcept { return path_; }

        private:
            std::filesystem::path path_;
        };

        std::filesystem::path stage_input(const FileCatalog &files, const FileRecord &record,
                                          const std::filesystem::path &directory, std::size_t index)
        {
            std::filesystem::create_directories(directory);
            const auto target = directory / (std::to_string(index) + "_" + record.file_id);
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to stage input " + record.file_id);
            }
            auto source = files.open(record, 0, record.size);
            std::vector<std::byte> buffer(kStageBufferSize);
            while (const auto count = source->read(buffer))
            {
                out.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(count));
            }
            if (!out)
            {
                throw std::runtime_error("Failed to write staged input " + record.file_id);
            }
            return target;
        }

    } // namespace

    JobEngine::JobEngine(FileCatalog &files, Registry<TransformJob> &jobs, TransformConfig config,
                         std::filesystem::path workspace_root, transform::OperationMap operations)
        : files_(files),
          jobs_(jobs),
          config_(std::move(config)),
          workspace_root_(std::move(workspace_root)),
          operations_(std::move(operations)),
          pool_(config_.worker_threads)
    {
        for (auto &[kind, operation] : transform::make_default_operations(config_))
        {
            operations_.try_emplace(kind, std::move(operation));
        }
        recover_interrupted();
    }

    JobEngine::~JobEngine()
    {
        shutdown();
    }

    void JobEngine::shutdown()
    {
        if (stopping_.exchange(true))
        {
            return;
        }
        pool_.stop();
        pool_.join();
    }

    void JobEngine::recover_interrupted()
    {
        for (const auto &job : jobs_.list())
        {
            if (is_terminal(job.status))
            {
                continue;
            }
            mark_failed(job.job_id, "interrupted by restart");
            spdlog::warn("Job {} ({}) was {} when the service stopped; marked failed", job.job_id,
                         to_string(job.kind), to_string(job.status));
        }
    }

    TransformJob JobEngine::submit(std::string_view kind_label, std::vector<std::string> input_file_ids,
                                   nlohmann::json params)
    {
        const auto kind = transform_kind_from_string(kind_label);
        const auto operation = kind ? operations_.find(*kind) : operations_.end();
        if (!kind || operation == operations_.end())
        {
            throw ServiceError(ErrorCode::UnsupportedKind, "Unsupported transform kind: " + std::string(kind_label),
                               nlohmann::json{{"kind", std::string(kind_label)}});
        }
        if (params.is_null())
        {
            params = nlohmann::json::object();
        }
        if (!params.is_object())
        {
            throw_validation("params must be an object");
        }
        TransformJob job{};
        {
            std::lock_guard pin_lock(pin_mutex_);
            for (const auto &file_id : input_file_ids)
            {
                files_.require(file_id);
            }
            operation->second->validate(params, input_file_ids.size());

            job.job_id = crypto::random_uuid();
            job.kind = *kind;
            job.status = JobStatus::Queued;
            job.input_file_ids = std::move(input_file_ids);
            job.params = std::move(params);
            job.created_at = Clock::now();
            jobs_.put(job);
        }

        spdlog::info("Queued job {} ({}) with {} input(s)", job.job_id, to_string(job.kind),
                     job.input_file_ids.size());
        schedule(job.job_id, job.kind);
        return job;
    }

    void JobEngine::schedule(const std::string &job_id, TransformKind kind)
    {
        if (is_heavy(kind))
        {
            std::lock_guard lock(heavy_mutex_);
            if (heavy_running_ >= config_.max_concurrent_heavy)
            {
                heavy_pending_.push_back(job_id);
                spdlog::debug("Job {} waits for a heavy slot ({} running)", job_id, heavy_running_);
                return;
            }
            ++heavy_running_;
        }
        asio::post(pool_, [this, job_id, heavy = is_heavy(kind)]()
                   { execute(job_id, heavy); });
    }

    void JobEngine::release_heavy_slot()
    {
        std::string next;
        {
            std::lock_guard lock(heavy_mutex_);
            if (heavy_pending_.empty())
            {
                --heavy_running_;
                return;
            }
            // The slot passes straight to the next waiting job.
            next = std::move(heavy_pending_.front());
            heavy_pending_.pop_front();
        }
        asio::post(pool_, [this, next]()
                   { execute(next, true); });
    }

    void JobEngine::execute(const std::string &job_id, bool holds_heavy_slot)
    {
        // Hands the slot on however this function exits.
        struct HeavySlot
        {
            JobEngine *engine;

            ~HeavySlot()
            {
                if (engine)
                {
                    engine->release_heavy_slot();
                }
            }
        };
        const HeavySlot slot{holds_heavy_slot ? this : nullptr};

        std::vector<std::string> produced;
        try
        {
            auto job = jobs_.update(job_id, [](TransformJob &record)
                                    {
                if (record.status == JobStatus::Queued)
                {
                    record.status = JobStatus::Processing;
                    record.started_at = Clock::now();
                } });
            if (!job || job->status != JobStatus::Processing)
            {
                return;
            }
            spdlog::info("Job {} ({}) processing", job_id, to_string(job->kind));

            WorkspaceGuard workspace(workspace_root_ / job_id);
            auto &operation = *operations_.at(job->kind);

            int last_reported = 0;
            transform::OperationContext context{
                .inputs = prepare_inputs(*job, workspace.path()),
                .workspace = workspace.path(),
                .params = job->params,
                .report_progress = [this, &job_id, &last_reported](double percent)
                {
                    if (!std::isfinite(percent))
                    {
                        return;
                    }
                    const auto value = static_cast<int>(std::clamp(percent, 0.0, 100.0));
                    if (value > last_reported)
                    {
                        last_reported = value;
                        report_progress(job_id, value);
                    }
                },
            };

            auto outcome = operation.run(context);

            nlohmann::json outputs = nlohmann::json::array();
            for (auto &output : outcome.outputs)
            {
                auto record = files_.ingest_path(output.path, NewFile{
                                                                  .filename = output.filename,
                                                                  .mime_type = output.mime_type,
                                                                  .metadata = {{"job_id", job_id},
                                                                               {"source_file_ids", job->input_file_ids}},
                                                                  .origin = FileOrigin::Transform,
                                                              });
                produced.push_back(record.file_id);
                auto entry = output.details.is_object() ? output.details : nlohmann::json::object();
                entry["file_id"] = record.file_id;
                entry["filename"] = record.filename;
                entry["size"] = record.size;
                entry["mime_type"] = record.mime_type;
                outputs.push_back(std::move(entry));
            }
            if (!outputs.empty())
            {
                outcome.result["outputs"] = std::move(outputs);
            }
            mark_completed(job_id, produced, std::move(outcome.result));
            spdlog::info("Job {} completed with {} output file(s)", job_id, produced.size());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Job {} failed: {}", job_id, ex.what());
            try
            {
                for (const auto &file_id : produced)
                {
                    files_.remove(file_id);
                }
                mark_failed(job_id, ex.what());
            }
            catch (const std::exception &inner)
            {
                spdlog::error("Failed to record failure of job {}: {}", job_id, inner.what());
            }
        }
    }

    std::vector<transform::OperationInput> JobEngine::prepare_inputs(const TransformJob &job,
                                                                     const std::filesystem::path &workspace)
    {
        std::vector<transform::OperationInput> inputs;
        inputs.reserve(job.input_file_ids.size());
        for (std::size_t index = 0; index < job.input_file_ids.size(); ++index)
        {
            const auto &file_id = job.input_file_ids[index];
            const auto record = files_.find(file_id);
            if (!record)
            {
                throw std::runtime_error("Input file " + file_id + " no longer exists");
            }
            auto path = files_.store().local_path(record->storage_key);
            inputs.push_back(transform::OperationInput{
                .file_id = record->file_id,
                .filename = record->filename,
                .mime_type = record->mime_type,
                .size = record->size,
                .path = path ? *path : stage_input(files_, *record, workspace / "in", index),
            });
        }
        return inputs;
    }

    void JobEngine::report_progress(const std::string &job_id, int percent)
    {
        jobs_.update(job_id, [percent](TransformJob &record)
                     {
            if (record.status == JobStatus::Processing && percent > record.progress)
            {
                record.progress = percent;
            } });
    }

    void JobEngine::mark_completed(const std::string &job_id, std::vector<std::string> outputs,
                                   nlohmann::json result)
    {
        jobs_.update(job_id, [&](TransformJob &record)
                     {
            if (is_terminal(record.status))
            {
                return;
            }
            record.status = JobStatus::Completed;
            record.progress = 100;
            record.output_file_ids = std::move(outputs);
            record.result = std::move(result);
            record.completed_at = Clock::now(); });
    }

    void JobEngine::mark_failed(const std::string &job_id, const std::string &message)
    {
        jobs_.update(job_id, [&](TransformJob &record)
                     {
            if (is_terminal(record.status))
            {
                return;
            }
            record.status = JobStatus::Failed;
            record.error = message;
            record.completed_at = Clock::now(); });
    }

    TransformJob JobEngine::status(const std::string &job_id) const
    {
        auto job = jobs_.get(job_id);
        if (!job)
        {
            throw_not_found("Job not found: " + job_id);
        }
        return *job;
    }

    std::set<std::string> JobEngine::pinned_inputs() const
    {
        std::set<std::string> pinned;
        for (const auto &job : jobs_.list())
        {
            if (!is_terminal(job.status))
            {
                pinned.insert(job.input_file_ids.begin(), job.input_file_ids.end());
            }
        }
        return pinned;
    }

    FileRemoval JobEngine::remove_unpinned_file(const std::string &file_id)
    {
        std::lock_guard pin_lock(pin_mutex_);
        if (pinned_inputs().contains(file_id))
        {
            return FileRemoval::Pinned;
        }
        return files_.remove(file_id) ? FileRemoval::Removed : FileRemoval::Missing;
    }

    std::size_t JobEngine::prune_finished(TimePoint cutoff)
    {
        std::size_t pruned = 0;
        for (const auto &job : jobs_.list())
        {
            if (!is_terminal(job.status))
            {
                continue;
            }
            const auto finished = job.completed_at.value_or(job.created_at);
            if (finished < cutoff && jobs_.remove(job.job_id))
            {
                ++pruned;
            }
        }
        return pruned;
    }

    std::size_t JobEngine::pending_count() const
    {
        const auto jobs = jobs_.list();
        return static_cast<std::size_t>(std::count_if(jobs.begin(), jobs.end(), [](const TransformJob &job)
                                                      { return !is_terminal(job.status); }));
    }

} // namespace chunkyard::server
