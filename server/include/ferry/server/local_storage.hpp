#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ferry/server/storage.hpp"

namespace ferry::server
{

    /// Blobs are regular files directly inside the root directory. Uploads
    /// are staged in <root>/.incoming and renamed into place on commit.
    class LocalStorage : public StorageBackend
    {
    public:
        explicit LocalStorage(std::filesystem::path root);

        std::string_view kind() const noexcept override { return "local"; }

        std::vector<ferry::protocol::BlobInfo> list() override;

        std::unique_ptr<BlobReader> open_for_read(const std::string &name) override;

        std::unique_ptr<BlobWriter> open_for_write(const std::string &name, std::uint64_t expected_size) override;

    private:
        std::filesystem::path base_;
        std::filesystem::path incoming_;

        std::filesystem::path resolve(const std::string &name) const;
        std::filesystem::path make_temp_path(const std::string &name) const;
    };

} // namespace ferry::server
