#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace chunkyard::server
{

    enum class RegistryBackend
    {
        Memory,
        JsonFiles
    };

    std::string_view to_string(RegistryBackend backend) noexcept;
    std::optional<RegistryBackend> registry_backend_from_string(std::string_view value) noexcept;

    // Keyed record store. Records expose their key through an ADL-visible record_id(const Record &).
    template <typename Record>
    class Registry
    {
    public:
        using Mutator = std::function<void(Record &)>;

        virtual ~Registry() = default;

        virtual std::optional<Record> get(const std::string &id) const = 0;
        virtual void put(const Record &record) = 0;

        // Atomic read-modify-write. Returns the updated record, or nullopt when absent.
        // If the mutator throws, the stored record is left untouched.
        virtual std::optional<Record> update(const std::string &id, const Mutator &mutator) = 0;

        virtual bool remove(const std::string &id) = 0;
        virtual std::vector<Record> list() const = 0;
        virtual std::size_t size() const = 0;
    };

    template <typename Record>
    class InMemoryRegistry : public Registry<Record>
    {
    public:
        using typename Registry<Record>::Mutator;

        std::optional<Record> get(const std::string &id) const override
        {
            std::shared_lock lock(mutex_);
            if (auto it = records_.find(id); it != records_.end())
            {
                return it->second;
            }
            return std::nullopt;
        }

        void put(const Record &record) override
        {
            std::unique_lock lock(mutex_);
            on_stored(record);
            records_[record_id(record)] = record;
        }

        std::optional<Record> update(const std::string &id, const Mutator &mutator) override
        {
            std::unique_lock lock(mutex_);
            auto it = records_.find(id);
            if (it == records_.end())
            {
                return std::nullopt;
            }
            Record copy = it->second;
            mutator(copy);
            on_stored(copy);
            it->second = copy;
            return copy;
        }

        bool remove(const std::string &id) override
        {
            std::unique_lock lock(mutex_);
            if (records_.erase(id) == 0)
            {
                return false;
            }
            on_removed(id);
            return true;
        }

        std::vector<Record> list() const override
        {
            std::shared_lock lock(mutex_);
            std::vector<Record> result;
            result.reserve(records_.size());
            for (const auto &[id, record] : records_)
            {
                result.push_back(record);
            }
            return result;
        }

        std::size_t size() const override
        {
            std::shared_lock lock(mutex_);
            return records_.size();
        }

    protected:
        // Persistence hooks, called with the write lock held.
        virtual void on_stored(const Record & /*record*/) {}
        virtual void on_removed(const std::string & /*id*/) {}

        void load_record(Record record)
        {
            std::unique_lock lock(mutex_);
            auto id = record_id(record);
            records_[std::move(id)] = std::move(record);
        }

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, Record> records_;
    };

    // Write-through registry keeping one JSON document per record.
    template <typename Record>
    class JsonFileRegistry : public InMemoryRegistry<Record>
    {
    public:
        explicit JsonFileRegistry(std::filesystem::path directory) : directory_(std::move(directory))
        {
            std::filesystem::create_directories(directory_);
            load_existing();
        }

    protected:
        void on_stored(const Record &record) override
        {
            const auto path = metadata_path(record_id(record));
            const auto temp = path.string() + ".tmp";
            {
                std::ofstream out(temp, std::ios::trunc);
                if (!out.is_open())
                {
                    throw std::runtime_error("Failed to persist record: " + path.string());
                }
                out << nlohmann::json(record).dump(2);
            }
            std::filesystem::rename(temp, path);
        }

        void on_removed(const std::string &id) override
        {
            std::error_code ec;
            std::filesystem::remove(metadata_path(id), ec);
        }

    private:
        std::filesystem::path metadata_path(const std::string &id) const
        {
            return directory_ / (id + ".json");
        }

        void load_existing()
        {
            for (const auto &entry : std::filesystem::directory_iterator(directory_))
            {
                if (!entry.is_regular_file() || entry.path().extension() != ".json")
                {
                    continue;
                }
                std::ifstream in(entry.path());
                if (!in.is_open())
                {
                    continue;
                }
                try
                {
                    nlohmann::json json;
                    in >> json;
                    this->load_record(json.get<Record>());
                }
                catch (const nlohmann::json::exception &ex)
                {
                    spdlog::warn("Skipping unreadable record {}: {}", entry.path().string(), ex.what());
                }
            }
        }

        std::filesystem::path directory_;
    };

    template <typename Record>
    std::unique_ptr<Registry<Record>> make_registry(RegistryBackend backend, const std::filesystem::path &directory)
    {
        if (backend == RegistryBackend::JsonFiles)
        {
            return std::make_unique<JsonFileRegistry<Record>>(directory);
        }
        return std::make_unique<InMemoryRegistry<Record>>();
    }

} // namespace chunkyard::server
