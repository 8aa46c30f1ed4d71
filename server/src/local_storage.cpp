#include "ferry/server/local_storage.hpp"

#include <chrono>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace ferry::server
{

    namespace
    {
        constexpr auto kIncomingDir = ".incoming";

        std::chrono::system_clock::time_point to_system_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            return time_point_cast<system_clock::duration>(time - std::filesystem::file_time_type::clock::now() +
                                                           system_clock::now());
        }

        std::string random_suffix()
        {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<std::uint64_t> dist;
            std::ostringstream oss;
            oss << std::hex << dist(rng);
            return oss.str();
        }

        class FileReader : public BlobReader
        {
        public:
            FileReader(std::ifstream file, std::uint64_t size) : file_(std::move(file)), size_(size) {}

            std::uint64_t size() const noexcept override { return size_; }

            std::size_t read(std::span<std::uint8_t> buffer) override
            {
                if (buffer.empty() || !file_)
                {
                    return 0;
                }
                file_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (file_.bad())
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, "Failed to read stored file");
                }
                return static_cast<std::size_t>(file_.gcount());
            }

        private:
            std::ifstream file_;
            std::uint64_t size_;
        };

        class FileWriter : public BlobWriter
        {
        public:
            FileWriter(std::filesystem::path temp_path, std::filesystem::path final_path, std::uint64_t expected_size)
                : temp_path_(std::move(temp_path)), final_path_(std::move(final_path)), expected_size_(expected_size)
            {
                file_.open(temp_path_, std::ios::binary | std::ios::trunc);
                if (!file_.is_open())
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable,
                                       "Cannot create " + temp_path_.filename().string());
                }
            }

            ~FileWriter() override
            {
                abort();
            }

            void write(std::span<const std::uint8_t> data) override
            {
                if (finished_)
                {
                    throw StorageError(ferry::ErrorCode::InternalError, "Write after upload finished");
                }
                file_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!file_)
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, "Failed to write upload");
                }
                written_ += data.size();
            }

            void commit() override
            {
                if (finished_)
                {
                    throw StorageError(ferry::ErrorCode::InternalError, "Upload already finished");
                }
                if (written_ != expected_size_)
                {
                    throw StorageError(ferry::ErrorCode::TransferIncomplete,
                                       "Received " + std::to_string(written_) + " of " +
                                           std::to_string(expected_size_) + " bytes");
                }
                file_.close();
                if (file_.fail())
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, "Failed to flush upload");
                }
                std::error_code ec;
                std::filesystem::rename(temp_path_, final_path_, ec);
                if (ec)
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, "Failed to store file: " + ec.message());
                }
                finished_ = true;
            }

            void abort() noexcept override
            {
                if (finished_)
                {
                    return;
                }
                finished_ = true;
                file_.close();
                std::error_code ec;
                std::filesystem::remove(temp_path_, ec);
                if (ec)
                {
                    spdlog::warn("Could not remove partial upload {}: {}", temp_path_.string(), ec.message());
                }
            }

        private:
            std::filesystem::path temp_path_;
            std::filesystem::path final_path_;
            std::uint64_t expected_size_;
            std::uint64_t written_{0};
            std::ofstream file_;
            bool finished_{false};
        };

    } // namespace

    LocalStorage::LocalStorage(std::filesystem::path root)
        : base_(std::move(root)), incoming_(base_ / kIncomingDir)
    {
        std::filesystem::create_directories(base_);
        std::filesystem::create_directories(incoming_);
    }

    std::vector<ferry::protocol::BlobInfo> LocalStorage::list()
    {
        std::vector<ferry::protocol::BlobInfo> blobs;
        try
        {
            for (const auto &entry : std::filesystem::directory_iterator(base_))
            {
                std::error_code ec;
                if (!entry.is_regular_file(ec))
                {
                    continue;
                }
                // Entries can vanish between enumeration and stat when overwritten.
                const auto size = entry.file_size(ec);
                const auto modified = ec ? std::filesystem::file_time_type{} : entry.last_write_time(ec);
                if (ec)
                {
                    continue;
                }
                blobs.push_back(ferry::protocol::BlobInfo{
                    .name = entry.path().filename().string(),
                    .size = size,
                    .modified_at = to_system_time(modified),
                });
            }
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            throw StorageError(ferry::ErrorCode::BackendUnavailable, std::string("Storage list error: ") + ex.what());
        }
        return blobs;
    }

    std::unique_ptr<BlobReader> LocalStorage::open_for_read(const std::string &name)
    {
        const auto path = resolve(name);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw StorageError(ferry::ErrorCode::NotFound, std::string(ferry::protocol::kFileNotFound));
        }
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open())
        {
            // Replaced or removed since the check above.
            throw StorageError(ferry::ErrorCode::NotFound, std::string(ferry::protocol::kFileNotFound));
        }
        // Size comes from the opened file, which a concurrent commit cannot swap out.
        const std::streamoff end = file.tellg();
        file.seekg(0, std::ios::beg);
        if (end < 0 || !file)
        {
            throw StorageError(ferry::ErrorCode::BackendUnavailable, "Cannot read size of " + name);
        }
        return std::make_unique<FileReader>(std::move(file), static_cast<std::uint64_t>(end));
    }

    std::unique_ptr<BlobWriter> LocalStorage::open_for_write(const std::string &name, std::uint64_t expected_size)
    {
        const auto target = resolve(name);
        std::error_code ec;
        if (std::filesystem::is_directory(target, ec))
        {
            throw StorageError(ferry::ErrorCode::BackendUnavailable, name + " is a directory");
        }
        std::filesystem::create_directories(incoming_, ec);
        return std::make_unique<FileWriter>(make_temp_path(name), target, expected_size);
    }

    std::filesystem::path LocalStorage::resolve(const std::string &name) const
    {
        const std::filesystem::path relative = name;
        if (name.empty() || relative.has_parent_path() || name == "." || name == ".." ||
            name.find('\0') != std::string::npos)
        {
            throw StorageError(ferry::ErrorCode::ProtocolError, "Invalid file name");
        }
        return base_ / relative;
    }

    std::filesystem::path LocalStorage::make_temp_path(const std::string &name) const
    {
        return incoming_ / (name + "." + random_suffix() + ".part");
    }

} // namespace ferry::server
