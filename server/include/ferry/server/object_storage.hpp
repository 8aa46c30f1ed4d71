#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ferry/server/config.hpp"
#include "ferry/server/s3_signer.hpp"
#include "ferry/server/storage.hpp"

namespace ferry::server
{

    /// S3-compatible bucket accessed through the REST API with path-style
    /// addressing. Every operation opens its own HTTP connection, so the
    /// backend can be shared by concurrent sessions.
    class ObjectStorage : public StorageBackend
    {
    public:
        explicit ObjectStorage(ObjectStorageConfig config);

        std::string_view kind() const noexcept override { return "s3"; }

        std::vector<ferry::protocol::BlobInfo> list() override;

        std::unique_ptr<BlobReader> open_for_read(const std::string &name) override;

        std::unique_ptr<BlobWriter> open_for_write(const std::string &name, std::uint64_t expected_size) override;

        const std::string &host() const noexcept { return host_; }
        const std::string &port() const noexcept { return port_; }

    private:
        s3::HttpRequest make_request(const std::string &method, const std::string &key) const;
        void sign(s3::HttpRequest &request, std::string_view payload_hash) const;

        ObjectStorageConfig config_;
        s3::SigV4Signer signer_;
        std::string host_;
        std::string port_;
    };

    /// Minimal ListObjectsV2 response parsing, exposed for tests.
    struct ListPage
    {
        std::vector<ferry::protocol::BlobInfo> blobs;
        bool truncated{};
        std::string continuation_token;
    };

    ListPage parse_list_page(const std::string &xml);

} // namespace ferry::server
