#include <algorithm>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/crypto.hpp"
#include "chunkyard/server/blob_store.hpp"
#include "chunkyard/server/byte_stream.hpp"
#include "chunkyard/server/file_catalog.hpp"
#include "chunkyard/server/job_engine.hpp"
#include "chunkyard/server/registry.hpp"
#include "chunkyard/server/service_error.hpp"
#include "chunkyard/server/transform/transform_operation.hpp"

using namespace chunkyard;
using namespace chunkyard::server;
using namespace std::chrono_literals;

namespace
{

    // Holds operations inside run() until released and records how many ran at once.
    struct Gate
    {
        void enter()
        {
            std::unique_lock lock(mutex);
            ++running;
            ++arrived;
            max_running = std::max(max_running, running);
            cv.notify_all();
            cv.wait(lock, [this]
                    { return open; });
            --running;
        }

        void release()
        {
            std::lock_guard lock(mutex);
            open = true;
            cv.notify_all();
        }

        bool wait_arrived(int count)
        {
            std::unique_lock lock(mutex);
            return cv.wait_for(lock, 10s, [&]
                               { return arrived >= count; });
        }

        std::mutex mutex;
        std::condition_variable cv;
        bool open{false};
        int running{0};
        int arrived{0};
        int max_running{0};
    };

    class FakeOperation : public transform::TransformOperation
    {
    public:
        enum class Mode
        {
            Produce,
            Fail
        };

        FakeOperation(TransformKind kind, Mode mode, std::shared_ptr<Gate> gate = nullptr)
            : kind_(kind), mode_(mode), gate_(std::move(gate))
        {
        }

        TransformKind kind() const noexcept override { return kind_; }

        void validate(const nlohmann::json &params, std::size_t input_count) const override
        {
            transform::require_inputs(kind_, input_count, 1, 1);
            if (params.contains("reject"))
            {
                throw_validation("rejected by operation");
            }
        }

        transform::OperationResult run(const transform::OperationContext &context) override
        {
            context.report_progress(40.0);
            context.report_progress(10.0);
            if (gate_)
            {
                gate_->enter();
            }
            if (mode_ == Mode::Fail)
            {
                throw std::runtime_error("encoder crashed");
            }

            const auto output = context.workspace / "out.txt";
            {
                std::ofstream out(output, std::ios::binary);
                out << "derived from " << context.inputs.front().filename;
            }
            transform::OperationResult result;
            result.outputs.push_back(transform::ProducedFile{
                .path = output,
                .filename = "derived.txt",
                .mime_type = "text/plain",
                .details = {{"part", 1}},
            });
            result.result = {{"note", "done"}};
            return result;
        }

    private:
        TransformKind kind_;
        Mode mode_;
        std::shared_ptr<Gate> gate_;
    };

    // Fails the queued -> processing write for jobs reading one chosen file.
    class JobRegistryWithFailingStart : public InMemoryRegistry<TransformJob>
    {
    public:
        void fail_start_of_jobs_reading(std::string file_id)
        {
            std::lock_guard lock(mutex_);
            failing_input_ = std::move(file_id);
        }

    protected:
        void on_stored(const TransformJob &record) override
        {
            std::lock_guard lock(mutex_);
            if (record.status == JobStatus::Processing && record.progress == 0 && !failing_input_.empty() &&
                std::find(record.input_file_ids.begin(), record.input_file_ids.end(), failing_input_) !=
                    record.input_file_ids.end())
            {
                throw std::runtime_error("disk full");
            }
        }

    private:
        std::mutex mutex_;
        std::string failing_input_;
    };

    struct EngineFixture
    {
        explicit EngineFixture(const char *name)
            : root(std::filesystem::temp_directory_path() / name),
              store((std::filesystem::remove_all(root), root / "blobs")),
              catalog(store, files, FileConfig{})
        {
        }

        ~EngineFixture()
        {
            engine.reset();
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        void start(transform::OperationMap operations, TransformConfig config = {})
        {
            engine = std::make_unique<JobEngine>(catalog, jobs, config, root / "work", std::move(operations));
        }

        FileRecord add(const std::string &filename, const std::string &content)
        {
            auto ingest = catalog.begin_file(NewFile{.filename = filename});
            ingest->write(as_byte_span(content));
            return ingest->commit();
        }

        std::string read_file(const std::string &file_id) const
        {
            const auto record = catalog.require(file_id);
            auto source = catalog.open(record, 0, record.size);
            MemorySink sink;
            copy_stream(*source, sink);
            return sink.take();
        }

        TransformJob wait_terminal(const std::string &job_id) const
        {
            for (int attempt = 0; attempt < 1000; ++attempt)
            {
                auto job = engine->status(job_id);
                if (is_terminal(job.status))
                {
                    return job;
                }
                std::this_thread::sleep_for(10ms);
            }
            throw std::runtime_error("job " + job_id + " never finished");
        }

        std::filesystem::path root;
        LocalBlobStore store;
        InMemoryRegistry<FileRecord> files;
        JobRegistryWithFailingStart jobs;
        FileCatalog catalog;
        std::unique_ptr<JobEngine> engine;
    };

    transform::OperationMap single_operation(std::unique_ptr<transform::TransformOperation> operation)
    {
        transform::OperationMap operations;
        const auto kind = operation->kind();
        operations.emplace(kind, std::move(operation));
        return operations;
    }

    ErrorCode error_of(const std::function<void()> &action)
    {
        try
        {
            action();
        }
        catch (const ServiceError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    void test_submit_rejections()
    {
        EngineFixture fixture("chunkyard_jobs_rejections");
        fixture.start({});
        const auto input = fixture.add("a.txt", "abc");
        const auto other = fixture.add("b.txt", "def");

        assert(error_of([&]
                        { fixture.engine->submit("resize", {input.file_id}, {}); }) == ErrorCode::UnsupportedKind);
        assert(error_of([&]
                        { fixture.engine->submit("checksum", {"missing"}, {}); }) == ErrorCode::NotFound);
        assert(error_of([&]
                        { fixture.engine->submit("checksum", {input.file_id}, nlohmann::json::array()); }) ==
               ErrorCode::ValidationError);
        assert(error_of([&]
                        { fixture.engine->submit("checksum", {input.file_id, other.file_id}, {}); }) ==
               ErrorCode::ValidationError);
        assert(error_of([&]
                        { fixture.engine->submit("checksum", {input.file_id}, {{"algorithm", "crc32"}}); }) ==
               ErrorCode::ValidationError);
        assert(error_of([&]
                        { fixture.engine->status("no-such-job"); }) == ErrorCode::NotFound);

        // Nothing was recorded for rejected submissions.
        assert(fixture.jobs.size() == 0);
    }

    void test_checksum_job_completes()
    {
        EngineFixture fixture("chunkyard_jobs_checksum");
        fixture.start({});
        const auto input = fixture.add("a.txt", "abc");

        const auto queued = fixture.engine->submit("checksum", {input.file_id}, nullptr);
        assert(queued.status == JobStatus::Queued);
        assert(queued.params.is_object());

        const auto job = fixture.wait_terminal(queued.job_id);
        assert(job.status == JobStatus::Completed);
        assert(job.progress == 100);
        assert(job.output_file_ids.empty());
        assert(job.result["algorithm"] == "sha256");
        assert(job.result["checksum"] == crypto::sha256_hex(std::string_view("abc")));
        assert(job.started_at.has_value() && job.completed_at.has_value());
    }

    void test_checksum_job_md5()
    {
        EngineFixture fixture("chunkyard_jobs_checksum_md5");
        fixture.start({});
        const auto input = fixture.add("a.txt", "abc");

        const auto job = fixture.wait_terminal(
            fixture.engine->submit("checksum", {input.file_id}, {{"algorithm", "md5"}}).job_id);
        assert(job.status == JobStatus::Completed);
        assert(job.result["algorithm"] == "md5");
        assert(job.result["checksum"] == "900150983cd24fb0d6963f7d28e17f72");
    }

    void test_operation_parameters_are_validated()
    {
        EngineFixture fixture("chunkyard_jobs_params");
        fixture.start({});
        const auto pdf = fixture.add("report.pdf", "%PDF-1.4");
        const auto other_pdf = fixture.add("appendix.pdf", "%PDF-1.4");
        const auto clip = fixture.add("clip.mp4", "not really a video");

        struct Case
        {
            const char *kind;
            std::vector<std::string> inputs;
            nlohmann::json params;
        };
        const std::vector<Case> cases{
            {"split-pdf", {pdf.file_id}, nlohmann::json::object()},
            {"split-pdf", {pdf.file_id}, nlohmann::json::parse(R"({"ranges": []})")},
            {"split-pdf", {pdf.file_id}, nlohmann::json::parse(R"({"ranges": [[1, 5], [5, 7]]})")},
            {"split-pdf", {pdf.file_id}, nlohmann::json::parse(R"({"ranges": [[3, -1], [8, 9]]})")},
            {"split-pdf", {pdf.file_id}, nlohmann::json::parse(R"({"ranges": [[6, 2]]})")},
            {"split-pdf", {pdf.file_id}, nlohmann::json::parse(R"({"ranges": [[0, 3]]})")},
            {"split-pdf", {pdf.file_id}, nlohmann::json::parse(R"({"ranges": [["1", 3]]})")},
            {"merge-pdf", {pdf.file_id}, nlohmann::json::object()},
            {"merge-pdf", {pdf.file_id, other_pdf.file_id}, {{"outputFilename", "../escape.pdf"}}},
            {"transcode", {clip.file_id}, {{"outputFormat", "exe"}}},
            {"transcode", {clip.file_id}, {{"resolution", "large"}}},
            {"transcode", {clip.file_id}, {{"bitrate", "fast"}}},
            {"extract-audio", {clip.file_id}, {{"outputFormat", "midi"}}},
            {"thumbnail", {clip.file_id}, {{"width", 0}}},
            {"compress", {pdf.file_id}, {{"format", "rar"}}},
            {"compress", {pdf.file_id}, {{"compressionLevel", 12}}},
            {"compress", {pdf.file_id}, {{"compressionLevel", "max"}}},
            {"compress", {}, nlohmann::json::object()},
        };
        for (const auto &entry : cases)
        {
            assert(error_of([&]
                            { fixture.engine->submit(entry.kind, entry.inputs, entry.params); }) ==
                   ErrorCode::ValidationError);
        }
        assert(fixture.jobs.size() == 0);
    }

    void test_outputs_are_ingested()
    {
        EngineFixture fixture("chunkyard_jobs_outputs");
        fixture.start(single_operation(std::make_unique<FakeOperation>(TransformKind::Compress, FakeOperation::Mode::Produce)));
        const auto input = fixture.add("source.txt", "payload");

        const auto queued = fixture.engine->submit("compress", {input.file_id}, {});
        const auto job = fixture.wait_terminal(queued.job_id);
        assert(job.status == JobStatus::Completed);
        assert(job.output_file_ids.size() == 1);

        const auto output = fixture.catalog.require(job.output_file_ids.front());
        assert(output.origin == FileOrigin::Transform);
        assert(output.filename == "derived.txt");
        assert(output.metadata["job_id"] == job.job_id);
        assert(output.metadata["source_file_ids"] == nlohmann::json::array({input.file_id}));
        assert(fixture.read_file(output.file_id) == "derived from source.txt");

        assert(job.result["note"] == "done");
        assert(job.result["outputs"][0]["file_id"] == output.file_id);
        assert(job.result["outputs"][0]["part"] == 1);
        assert(job.result["outputs"][0]["size"] == output.size);

        assert(!std::filesystem::exists(fixture.root / "work" / job.job_id));
    }

    void test_failure_is_recorded()
    {
        EngineFixture fixture("chunkyard_jobs_failure");
        fixture.start(single_operation(std::make_unique<FakeOperation>(TransformKind::Compress, FakeOperation::Mode::Fail)));
        const auto input = fixture.add("source.txt", "payload");

        const auto job = fixture.wait_terminal(fixture.engine->submit("compress", {input.file_id}, {}).job_id);
        assert(job.status == JobStatus::Failed);
        assert(job.error.find("encoder crashed") != std::string::npos);
        assert(job.output_file_ids.empty());
        assert(job.progress < 100);
        // Only the input remains in the catalog.
        assert(fixture.catalog.count() == 1);
    }

    void test_progress_never_decreases()
    {
        EngineFixture fixture("chunkyard_jobs_progress");
        auto gate = std::make_shared<Gate>();
        fixture.start(single_operation(std::make_unique<FakeOperation>(TransformKind::Compress, FakeOperation::Mode::Produce, gate)));
        const auto input = fixture.add("source.txt", "payload");

        const auto queued = fixture.engine->submit("compress", {input.file_id}, {});
        assert(gate->wait_arrived(1));

        // 40 was reported before 10; the lower value is ignored.
        const auto running = fixture.engine->status(queued.job_id);
        assert(running.status == JobStatus::Processing);
        assert(running.progress == 40);
        assert(fixture.engine->pending_count() == 1);
        assert(fixture.engine->pinned_inputs().count(input.file_id) == 1);

        gate->release();
        const auto job = fixture.wait_terminal(queued.job_id);
        assert(job.progress == 100);
        assert(fixture.engine->pending_count() == 0);
        assert(fixture.engine->pinned_inputs().empty());
    }

    void test_heavy_jobs_respect_ceiling()
    {
        EngineFixture fixture("chunkyard_jobs_heavy");
        auto gate = std::make_shared<Gate>();
        fixture.start(single_operation(std::make_unique<FakeOperation>(TransformKind::Transcode, FakeOperation::Mode::Produce, gate)),
                      TransformConfig{.worker_threads = 4, .max_concurrent_heavy = 1});
        const auto clip = fixture.add("clip.mp4", "not really a video");

        const auto first = fixture.engine->submit("transcode", {clip.file_id}, {});
        const auto second = fixture.engine->submit("transcode", {clip.file_id}, {});
        assert(gate->wait_arrived(1));

        // Light work still runs while the heavy slot is taken.
        const auto light = fixture.wait_terminal(fixture.engine->submit("checksum", {clip.file_id}, {}).job_id);
        assert(light.status == JobStatus::Completed);

        std::this_thread::sleep_for(100ms);
        assert(fixture.engine->status(second.job_id).status == JobStatus::Queued);
        assert(fixture.engine->status(second.job_id).progress == 0);

        gate->release();
        const auto first_done = fixture.wait_terminal(first.job_id);
        const auto second_done = fixture.wait_terminal(second.job_id);
        assert(first_done.status == JobStatus::Completed);
        assert(second_done.status == JobStatus::Completed);
        assert(gate->max_running == 1);
        assert(*second_done.started_at >= *first_done.completed_at);
    }

    void test_failed_start_releases_heavy_slot()
    {
        EngineFixture fixture("chunkyard_jobs_failed_start");
        fixture.start(single_operation(std::make_unique<FakeOperation>(TransformKind::Transcode, FakeOperation::Mode::Produce)),
                      TransformConfig{.worker_threads = 2, .max_concurrent_heavy = 1});
        const auto broken = fixture.add("broken.mp4", "unwritable");
        const auto healthy = fixture.add("healthy.mp4", "fine");
        fixture.jobs.fail_start_of_jobs_reading(broken.file_id);

        const auto failed = fixture.wait_terminal(fixture.engine->submit("transcode", {broken.file_id}, {}).job_id);
        assert(failed.status == JobStatus::Failed);
        assert(failed.error == "disk full");

        // The only heavy slot was handed back, so the next heavy job still runs.
        const auto next = fixture.wait_terminal(fixture.engine->submit("transcode", {healthy.file_id}, {}).job_id);
        assert(next.status == JobStatus::Completed);
    }

    void test_submit_and_removal_do_not_interleave()
    {
        EngineFixture fixture("chunkyard_jobs_pin_race");
        auto gate = std::make_shared<Gate>();
        fixture.start(single_operation(std::make_unique<FakeOperation>(TransformKind::Compress, FakeOperation::Mode::Produce, gate)));

        std::vector<std::string> submitted;
        for (int round = 0; round < 40; ++round)
        {
            const auto input = fixture.add("race.txt", "contended");
            std::optional<TransformJob> job;
            ErrorCode submit_error = ErrorCode::Ok;
            std::thread submitter([&]
                                  {
                try
                {
                    job = fixture.engine->submit("compress", {input.file_id}, {});
                }
                catch (const ServiceError &ex)
                {
                    submit_error = ex.code();
                } });
            const auto removal = fixture.engine->remove_unpinned_file(input.file_id);
            submitter.join();

            if (job)
            {
                // The job was recorded first, so its input is pinned and survives.
                assert(removal == FileRemoval::Pinned);
                assert(fixture.catalog.find(input.file_id).has_value());
                submitted.push_back(job->job_id);
            }
            else
            {
                assert(submit_error == ErrorCode::NotFound);
                assert(removal == FileRemoval::Removed);
                assert(!fixture.catalog.find(input.file_id).has_value());
            }
        }

        gate->release();
        for (const auto &job_id : submitted)
        {
            assert(fixture.wait_terminal(job_id).status == JobStatus::Completed);
        }
        assert(fixture.engine->remove_unpinned_file("never-stored") == FileRemoval::Missing);
    }

    void test_interrupted_jobs_fail_on_start()
    {
        EngineFixture fixture("chunkyard_jobs_recovery");
        TransformJob stale{};
        stale.job_id = "stale-job";
        stale.kind = TransformKind::Transcode;
        stale.status = JobStatus::Processing;
        stale.progress = 35;
        stale.input_file_ids = {"f-1"};
        stale.created_at = Clock::now();
        fixture.jobs.put(stale);

        TransformJob finished = stale;
        finished.job_id = "finished-job";
        finished.status = JobStatus::Completed;
        finished.progress = 100;
        fixture.jobs.put(finished);

        fixture.start({});
        const auto recovered = fixture.engine->status("stale-job");
        assert(recovered.status == JobStatus::Failed);
        assert(recovered.error == "interrupted by restart");
        assert(recovered.completed_at.has_value());
        assert(fixture.engine->status("finished-job").status == JobStatus::Completed);
        assert(fixture.engine->pinned_inputs().empty());
    }

    void test_prune_finished_jobs()
    {
        EngineFixture fixture("chunkyard_jobs_prune");
        fixture.start({});
        const auto now = Clock::now();

        TransformJob old_job{};
        old_job.job_id = "old";
        old_job.status = JobStatus::Completed;
        old_job.created_at = now - 3h;
        old_job.completed_at = now - 2h;
        fixture.jobs.put(old_job);

        TransformJob recent = old_job;
        recent.job_id = "recent";
        recent.completed_at = now - 10min;
        fixture.jobs.put(recent);

        TransformJob waiting = old_job;
        waiting.job_id = "waiting";
        waiting.status = JobStatus::Queued;
        waiting.completed_at.reset();
        waiting.input_file_ids = {"f-pinned"};
        fixture.jobs.put(waiting);

        assert(fixture.engine->prune_finished(now - 1h) == 1);
        assert(error_of([&]
                        { fixture.engine->status("old"); }) == ErrorCode::NotFound);
        assert(fixture.engine->status("recent").status == JobStatus::Completed);
        assert(fixture.engine->status("waiting").status == JobStatus::Queued);
        assert(fixture.engine->pinned_inputs() == std::set<std::string>{"f-pinned"});
    }

} // namespace

void run_job_engine_tests()
{
    test_submit_rejections();
    test_checksum_job_completes();
    test_checksum_job_md5();
    test_operation_parameters_are_validated();
    test_outputs_are_ingested();
    test_failure_is_recorded();
    test_progress_never_decreases();
    test_heavy_jobs_respect_ceiling();
    test_failed_start_releases_heavy_slot();
    test_submit_and_removal_do_not_interleave();
    test_interrupted_jobs_fail_on_start();
    test_prune_finished_jobs();
}
