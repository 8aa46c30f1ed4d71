#include "ferry/server/object_storage.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>

#include <spdlog/spdlog.h>

#include "http_connection.hpp"

namespace ferry::server
{

    namespace
    {

        struct ElementRange
        {
            std::size_t content_start;
            std::size_t content_end;
        };

        std::vector<ElementRange> find_elements(const std::string &xml, const std::string &tag)
        {
            std::vector<ElementRange> ranges;
            const auto open = "<" + tag + ">";
            const auto close = "</" + tag + ">";
            std::size_t pos = 0;
            while ((pos = xml.find(open, pos)) != std::string::npos)
            {
                const auto start = pos + open.size();
                const auto end = xml.find(close, start);
                if (end == std::string::npos)
                {
                    break;
                }
                ranges.push_back({start, end});
                pos = end + close.size();
            }
            return ranges;
        }

        std::string get_element(const std::string &xml, const std::string &tag)
        {
            const auto ranges = find_elements(xml, tag);
            if (ranges.empty())
            {
                return {};
            }
            return xml.substr(ranges.front().content_start, ranges.front().content_end - ranges.front().content_start);
        }

        std::string decode_entities(std::string value)
        {
            static const std::array<std::pair<std::string_view, char>, 5> kEntities{{
                {"&lt;", '<'},
                {"&gt;", '>'},
                {"&quot;", '"'},
                {"&apos;", '\''},
                {"&amp;", '&'},
            }};
            std::string decoded;
            decoded.reserve(value.size());
            std::size_t pos = 0;
            while (pos < value.size())
            {
                bool replaced = false;
                if (value[pos] == '&')
                {
                    for (const auto &[entity, ch] : kEntities)
                    {
                        if (value.compare(pos, entity.size(), entity) == 0)
                        {
                            decoded.push_back(ch);
                            pos += entity.size();
                            replaced = true;
                            break;
                        }
                    }
                }
                if (!replaced)
                {
                    decoded.push_back(value[pos++]);
                }
            }
            return decoded;
        }

        // 2023-12-15T14:30:00.000Z
        std::chrono::system_clock::time_point parse_last_modified(const std::string &text)
        {
            int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
            if (std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d", &year, &month, &day, &hour, &minute, &second) != 6)
            {
                return {};
            }
            std::tm tm{};
            tm.tm_year = year - 1900;
            tm.tm_mon = month - 1;
            tm.tm_mday = day;
            tm.tm_hour = hour;
            tm.tm_min = minute;
            tm.tm_sec = second;
            const auto seconds = timegm(&tm);
            if (seconds == -1)
            {
                return {};
            }
            return std::chrono::system_clock::from_time_t(seconds);
        }

        std::string error_message(const http::ResponseHead &head, const std::string &body)
        {
            auto message = decode_entities(get_element(body, "Message"));
            if (message.empty())
            {
                message = get_element(body, "Code");
            }
            auto text = "HTTP " + std::to_string(head.status);
            if (!head.reason.empty())
            {
                text += " " + head.reason;
            }
            if (!message.empty())
            {
                text += " (" + message + ")";
            }
            return text;
        }

        class ObjectReader : public BlobReader
        {
        public:
            ObjectReader(std::unique_ptr<http::HttpConnection> connection, std::uint64_t size)
                : connection_(std::move(connection)), size_(size), remaining_(size) {}

            ~ObjectReader() override
            {
                connection_->close();
            }

            std::uint64_t size() const noexcept override { return size_; }

            std::size_t read(std::span<std::uint8_t> buffer) override
            {
                if (remaining_ == 0 || buffer.empty())
                {
                    return 0;
                }
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining_));
                const auto got = connection_->read_some_body(buffer.first(want));
                remaining_ -= got;
                return got;
            }

        private:
            std::unique_ptr<http::HttpConnection> connection_;
            std::uint64_t size_;
            std::uint64_t remaining_;
        };

        // The PUT is sent with a fixed Content-Length, so the store only
        // creates the object once the whole body has arrived. Dropping the
        // connection earlier discards the upload.
        class ObjectWriter : public BlobWriter
        {
        public:
            ObjectWriter(std::unique_ptr<http::HttpConnection> connection, std::string key,
                         std::uint64_t expected_size)
                : connection_(std::move(connection)), key_(std::move(key)), expected_size_(expected_size) {}

            ~ObjectWriter() override
            {
                abort();
            }

            void write(std::span<const std::uint8_t> data) override
            {
                if (finished_)
                {
                    throw StorageError(ferry::ErrorCode::InternalError, "Write after upload finished");
                }
                if (written_ + data.size() > expected_size_)
                {
                    throw StorageError(ferry::ErrorCode::InternalError, "Upload exceeds announced size");
                }
                connection_->send_body(data);
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
                finished_ = true;
                const auto head = connection_->read_head();
                const auto body = connection_->read_body(head);
                connection_->close();
                if (!head.ok())
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable,
                                       "S3 put error: " + error_message(head, body));
                }
            }

            void abort() noexcept override
            {
                if (finished_)
                {
                    return;
                }
                finished_ = true;
                connection_->close();
                spdlog::debug("Discarded upload of {} after {} of {} bytes", key_, written_, expected_size_);
            }

        private:
            std::unique_ptr<http::HttpConnection> connection_;
            std::string key_;
            std::uint64_t expected_size_;
            std::uint64_t written_{0};
            bool finished_{false};
        };

    } // namespace

    ListPage parse_list_page(const std::string &xml)
    {
        ListPage page;
        page.truncated = get_element(xml, "IsTruncated") == "true";
        page.continuation_token = decode_entities(get_element(xml, "NextContinuationToken"));
        for (const auto &range : find_elements(xml, "Contents"))
        {
            const auto content = xml.substr(range.content_start, range.content_end - range.content_start);
            ferry::protocol::BlobInfo blob;
            blob.name = decode_entities(get_element(content, "Key"));
            const auto size = ferry::protocol::parse_size(get_element(content, "Size"));
            blob.size = size.value_or(0);
            blob.modified_at = parse_last_modified(get_element(content, "LastModified"));
            page.blobs.push_back(std::move(blob));
        }
        return page;
    }

    ObjectStorage::ObjectStorage(ObjectStorageConfig config)
        : config_(std::move(config)),
          signer_(config_.access_key, config_.secret_key, config_.region, "s3")
    {
        const auto endpoint =
            config_.endpoint.empty() ? "s3." + config_.region + ".amazonaws.com" : config_.endpoint;
        std::tie(host_, port_) = http::split_endpoint(endpoint);
        if (signer_.anonymous())
        {
            spdlog::warn("No AWS credentials configured, sending unsigned requests to {}", endpoint);
        }
    }

    std::vector<ferry::protocol::BlobInfo> ObjectStorage::list()
    {
        std::vector<ferry::protocol::BlobInfo> blobs;
        std::string continuation;
        try
        {
            do
            {
                auto request = make_request("GET", "");
                request.query["list-type"] = "2";
                if (!continuation.empty())
                {
                    request.query["continuation-token"] = continuation;
                }
                sign(request, s3::kEmptyPayloadHash);

                http::HttpConnection connection(host_, port_);
                connection.send_head(request);
                const auto head = connection.read_head();
                const auto body = connection.read_body(head);
                connection.close();
                if (!head.ok())
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, error_message(head, body));
                }

                auto page = parse_list_page(body);
                std::move(page.blobs.begin(), page.blobs.end(), std::back_inserter(blobs));
                continuation = page.truncated ? page.continuation_token : std::string{};
            } while (!continuation.empty());
        }
        catch (const StorageError &ex)
        {
            throw StorageError(ferry::ErrorCode::BackendUnavailable, std::string("S3 list error: ") + ex.what());
        }
        return blobs;
    }

    std::unique_ptr<BlobReader> ObjectStorage::open_for_read(const std::string &name)
    {
        auto request = make_request("GET", name);
        sign(request, s3::kEmptyPayloadHash);

        auto connection = std::make_unique<http::HttpConnection>(host_, port_);
        connection->send_head(request);
        const auto head = connection->read_head();
        if (head.status == 404)
        {
            connection->close();
            throw StorageError(ferry::ErrorCode::NotFound, std::string(ferry::protocol::kFileNotFound));
        }
        if (!head.ok())
        {
            const auto body = connection->read_body(head);
            connection->close();
            throw StorageError(ferry::ErrorCode::BackendUnavailable, "S3 get error: " + error_message(head, body));
        }
        const auto size = head.content_length();
        if (!size)
        {
            connection->close();
            throw StorageError(ferry::ErrorCode::BackendUnavailable, "S3 get error: missing Content-Length");
        }
        return std::make_unique<ObjectReader>(std::move(connection), *size);
    }

    std::unique_ptr<BlobWriter> ObjectStorage::open_for_write(const std::string &name, std::uint64_t expected_size)
    {
        auto request = make_request("PUT", name);
        request.headers["content-length"] = std::to_string(expected_size);
        request.headers["content-type"] = "application/octet-stream";
        sign(request, s3::kUnsignedPayload);

        auto connection = std::make_unique<http::HttpConnection>(host_, port_);
        connection->send_head(request);
        return std::make_unique<ObjectWriter>(std::move(connection), name, expected_size);
    }

    s3::HttpRequest ObjectStorage::make_request(const std::string &method, const std::string &key) const
    {
        s3::HttpRequest request;
        request.method = method;
        request.path = "/" + config_.bucket;
        if (!key.empty())
        {
            request.path += "/" + key;
        }
        request.headers["host"] = port_ == "80" ? host_ : host_ + ":" + port_;
        request.headers["connection"] = "close";
        return request;
    }

    void ObjectStorage::sign(s3::HttpRequest &request, std::string_view payload_hash) const
    {
        signer_.sign(request, payload_hash, std::chrono::system_clock::now(), config_.session_token);
    }

} // namespace ferry::server
