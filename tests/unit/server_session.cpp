#include <asio/buffer.hpp>
#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "ferry/client/session.hpp"
#include "ferry/client/transfer_client.hpp"
#include "ferry/framing.hpp"
#include "ferry/server/local_storage.hpp"
#include "ferry/server/server.hpp"

using namespace ferry;
using namespace ferry::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    bool wait_until(const std::function<bool()> &condition,
                    std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (condition())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    std::string make_payload(std::size_t size)
    {
        std::string payload(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            payload[i] = static_cast<char>((i * 31 + 7) % 256);
        }
        return payload;
    }

    class CountingSink : public MetricsSink
    {
    public:
        void record(std::string_view name, std::int64_t /*value*/) override
        {
            std::lock_guard lock(mutex_);
            ++counts_[std::string(name)];
        }

        std::size_t count(const std::string &name)
        {
            std::lock_guard lock(mutex_);
            return counts_[name];
        }

    private:
        std::mutex mutex_;
        std::map<std::string, std::size_t> counts_;
    };

    // Counts every observation, then fails like an unreachable collector.
    class ThrowingSink : public CountingSink
    {
    public:
        void record(std::string_view name, std::int64_t value) override
        {
            CountingSink::record(name, value);
            throw std::runtime_error("metrics collector unreachable");
        }
    };

    class FailingWriter : public BlobWriter
    {
    public:
        FailingWriter(std::unique_ptr<BlobWriter> inner, bool fail) : inner_(std::move(inner)), fail_(fail) {}

        void write(std::span<const std::uint8_t> data) override
        {
            if (fail_)
            {
                throw StorageError(ErrorCode::BackendUnavailable, "No space left on device");
            }
            inner_->write(data);
        }

        void commit() override { inner_->commit(); }
        void abort() noexcept override { inner_->abort(); }

    private:
        std::unique_ptr<BlobWriter> inner_;
        bool fail_;
    };

    // Reports end of stream after limit bytes although size() promises more.
    class TruncatedReader : public BlobReader
    {
    public:
        TruncatedReader(std::unique_ptr<BlobReader> inner, std::uint64_t limit)
            : inner_(std::move(inner)), limit_(limit) {}

        std::uint64_t size() const noexcept override { return inner_->size(); }

        std::size_t read(std::span<std::uint8_t> buffer) override
        {
            const auto left = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), limit_ - delivered_));
            if (left == 0)
            {
                return 0;
            }
            const auto got = inner_->read(buffer.first(left));
            delivered_ += got;
            return got;
        }

    private:
        std::unique_ptr<BlobReader> inner_;
        std::uint64_t limit_;
        std::uint64_t delivered_{0};
    };

    // Local storage whose listing, writes and reads can be broken on demand.
    class FaultyStorage : public StorageBackend
    {
    public:
        explicit FaultyStorage(const std::filesystem::path &root) : inner_(root) {}

        std::string_view kind() const noexcept override { return "faulty"; }

        std::vector<protocol::BlobInfo> list() override
        {
            if (fail_list)
            {
                throw StorageError(ErrorCode::BackendUnavailable, "Storage list error: disk offline");
            }
            return inner_.list();
        }

        std::unique_ptr<BlobReader> open_for_read(const std::string &name) override
        {
            auto reader = inner_.open_for_read(name);
            const auto limit = read_limit.load();
            if (limit == 0)
            {
                return reader;
            }
            return std::make_unique<TruncatedReader>(std::move(reader), limit);
        }

        std::unique_ptr<BlobWriter> open_for_write(const std::string &name, std::uint64_t expected_size) override
        {
            return std::make_unique<FailingWriter>(inner_.open_for_write(name, expected_size), fail_writes.load());
        }

        std::atomic<bool> fail_list{false};
        std::atomic<bool> fail_writes{false};
        // 0 serves blobs in full.
        std::atomic<std::uint64_t> read_limit{0};

    private:
        LocalStorage inner_;
    };

    using StorageFactory = std::function<std::unique_ptr<StorageBackend>(const std::filesystem::path &)>;

    std::unique_ptr<StorageBackend> make_faulty_storage(const std::filesystem::path &root)
    {
        return std::make_unique<FaultyStorage>(root);
    }

    class TestServer
    {
    public:
        explicit TestServer(const std::string &name, const StorageFactory &make_storage = {},
                            std::unique_ptr<CountingSink> metrics = std::make_unique<CountingSink>())
            : root_(std::filesystem::temp_directory_path() / name)
        {
            cleanup_path(root_);
            ServerConfig config;
            config.address = "127.0.0.1";
            config.port = 0;
            config.root = root_;
            config.idle_timeout = std::chrono::milliseconds(200);
            config.accept_timeout = std::chrono::milliseconds(100);

            std::unique_ptr<StorageBackend> storage;
            if (make_storage)
            {
                storage = make_storage(root_);
            }
            else
            {
                storage = std::make_unique<LocalStorage>(root_);
            }
            metrics_ = metrics.get();
            server_ = std::make_unique<Server>(config, std::move(storage), std::move(metrics));
            thread_ = std::thread([this]
                                  { server_->run(); });
        }

        ~TestServer()
        {
            stop();
            server_.reset();
            cleanup_path(root_);
        }

        void stop()
        {
            server_->shutdown();
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        std::uint16_t port() const { return server_->port(); }
        Server &server() { return *server_; }
        CountingSink &metrics() { return *metrics_; }
        FaultyStorage &faulty_storage() { return dynamic_cast<FaultyStorage &>(server_->storage()); }
        const std::filesystem::path &root() const { return root_; }

    private:
        std::filesystem::path root_;
        CountingSink *metrics_{};
        std::unique_ptr<Server> server_;
        std::thread thread_;
    };

    // Speaks the wire protocol byte by byte, without TransferClient.
    class RawClient
    {
    public:
        explicit RawClient(std::uint16_t port) : socket_(io_context_)
        {
            const asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);
            socket_.connect(endpoint);
        }

        void send(const std::string &data)
        {
            asio::write(socket_, asio::buffer(data));
        }

        std::string read_line()
        {
            for (;;)
            {
                if (auto line = ferry::protocol::take_line(inbound_))
                {
                    return *line;
                }
                if (!fill())
                {
                    throw std::runtime_error("connection closed while waiting for a line");
                }
            }
        }

        std::string read_exact(std::size_t size)
        {
            while (inbound_.size() < size)
            {
                if (!fill())
                {
                    throw std::runtime_error("connection closed while waiting for payload");
                }
            }
            std::string data(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(size));
            inbound_.erase(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(size));
            return data;
        }

        // True once the server has closed its side.
        bool at_eof()
        {
            return inbound_.empty() && !fill();
        }

        void close()
        {
            std::error_code ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);
        }

    private:
        bool fill()
        {
            std::array<std::uint8_t, 4096> chunk{};
            std::error_code ec;
            const auto received = socket_.read_some(asio::buffer(chunk), ec);
            if (ec)
            {
                return false;
            }
            inbound_.insert(inbound_.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(received));
            return true;
        }

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::vector<std::uint8_t> inbound_;
    };

    void test_put_then_get_over_the_wire()
    {
        TestServer server("ferry_session_wire_test");
        RawClient client(server.port());

        client.send("put hello.txt 5\n");
        assert(client.read_line() == "OK");
        client.send("hello");
        assert(client.read_line() == "OK 5");

        client.send("get hello.txt\n");
        assert(client.read_line() == "OK 5");
        client.send("OK");
        assert(client.read_exact(5) == "hello");

        client.send("ls\n");
        const auto row = client.read_line();
        assert(row.size() == 12 + 1 + 19 + 1 + 9);
        assert(row.starts_with("           5 "));
        assert(row.ends_with(" hello.txt"));
        assert(client.read_line().empty());

        assert(wait_until([&]
                          { return server.metrics().count("Downloads") == 1; }));
        assert(server.metrics().count("Uploads") == 1);
    }

    void test_errors_keep_session_open()
    {
        TestServer server("ferry_session_errors_test");
        RawClient client(server.port());

        client.send("get never-uploaded.txt\n");
        assert(client.read_line() == "ERR File not found");

        client.send("put notes.txt lots\n");
        assert(client.read_line() == "ERR Invalid filesize");

        client.send("delete notes.txt\n");
        assert(client.read_line() == "ERR Unknown command");

        client.send("get\n");
        assert(client.read_line() == "ERR Invalid GET format");

        client.send("put notes.txt\n");
        assert(client.read_line() == "ERR Invalid PUT format");

        client.send("get ../..\n");
        assert(client.read_line() == "ERR Invalid file name");

        client.send(std::string("put secret\0.txt 3\n", 18));
        assert(client.read_line() == "ERR Invalid file name");

        client.send("ls\n");
        assert(client.read_line() == "No files");
        assert(client.read_line().empty());
        assert(!std::filesystem::exists(server.root() / "notes.txt"));
    }

    void test_legacy_commands_without_newline()
    {
        TestServer server("ferry_session_legacy_test");
        RawClient client(server.port());

        client.send("ls");
        assert(client.read_line() == "No files");
        assert(client.read_line().empty());

        client.send("put legacy.txt 3");
        assert(client.read_line() == "OK");
        client.send("abc");
        assert(client.read_line() == "OK 3");

        client.send("put pipelined.txt 5\nhello");
        assert(client.read_line() == "OK");
        assert(client.read_line() == "OK 5");

        client.send("GET legacy.txt");
        assert(client.read_line() == "OK 3");
        client.send("OK");
        assert(client.read_exact(3) == "abc");
    }

    void test_put_names_are_flattened()
    {
        TestServer server("ferry_session_names_test");
        RawClient client(server.port());

        client.send("put ../../etc/evil.txt 4\n");
        assert(client.read_line() == "OK");
        client.send("evil");
        assert(client.read_line() == "OK 4");
        assert(std::filesystem::exists(server.root() / "evil.txt"));

        client.send("put my report.txt 2\n");
        assert(client.read_line() == "OK");
        client.send("ok");
        assert(client.read_line() == "OK 2");
        assert(std::filesystem::exists(server.root() / "my report.txt"));
    }

    void test_disconnect_mid_upload_leaves_nothing()
    {
        TestServer server("ferry_session_abort_test");
        {
            RawClient client(server.port());
            client.send("put big.bin 1000\n");
            assert(client.read_line() == "OK");
            client.send(std::string(200, 'z'));
            client.close();
        }
        assert(wait_until([&]
                          { return server.server().registry().count() == 0; }));

        assert(server.server().storage().list().empty());
        assert(!std::filesystem::exists(server.root() / "big.bin"));
        assert(std::filesystem::is_empty(server.root() / ".incoming"));
    }

    void test_transfer_client_roundtrip()
    {
        TestServer server("ferry_session_client_test");
        client::TransferClient transfer;
        transfer.connect("127.0.0.1", server.port());

        assert(transfer.list() == std::vector<std::string>{"No files"});

        const auto payload = make_payload(3 * 4096 + 123);
        std::istringstream in(payload);
        std::uint64_t reported = 0;
        transfer.put("blob.bin", in, payload.size(), [&](std::uint64_t sent)
                     { reported = sent; });
        assert(reported == payload.size());

        std::ostringstream out;
        const auto size = transfer.get("blob.bin", out);
        assert(size == payload.size());
        assert(out.str() == payload);

        const auto rows = transfer.list();
        assert(rows.size() == 1);
        assert(rows.front().ends_with(" blob.bin"));
        assert(rows.front().starts_with("       12411 "));

        bool not_found = false;
        try
        {
            std::ostringstream ignored;
            transfer.get("missing.bin", ignored);
        }
        catch (const client::ClientError &ex)
        {
            not_found = ex.code() == ErrorCode::NotFound;
        }
        assert(not_found);
        assert(transfer.connected());
    }

    void test_concurrent_sessions()
    {
        TestServer server("ferry_session_concurrent_test");
        client::TransferClient first;
        client::TransferClient second;
        first.connect("127.0.0.1", server.port());
        second.connect("127.0.0.1", server.port());

        assert(wait_until([&]
                          { return server.server().registry().count() == 2; }));
        assert(server.metrics().count("ActiveClients") >= 2);

        const auto payload_a = make_payload(50000);
        const auto payload_b = std::string(70000, 'b');
        std::atomic<bool> first_done{false};
        std::thread uploader([&]
                             {
            std::istringstream in(payload_a);
            first.put("a.bin", in, payload_a.size());
            first_done = true; });
        std::istringstream in_b(payload_b);
        second.put("b.bin", in_b, payload_b.size());
        uploader.join();
        assert(first_done);

        std::ostringstream out_a;
        second.get("a.bin", out_a);
        assert(out_a.str() == payload_a);
        assert(first.list().size() == 2);

        first.close();
        assert(wait_until([&]
                          { return server.server().registry().count() == 1; }));
    }

    void test_shutdown_closes_live_sessions()
    {
        TestServer server("ferry_session_shutdown_test");
        RawClient idle(server.port());
        RawClient uploading(server.port());
        uploading.send("put slow.bin 100\n");
        assert(uploading.read_line() == "OK");
        uploading.send("partial");

        assert(wait_until([&]
                          { return server.server().registry().count() == 2; }));

        server.stop();
        assert(server.server().registry().count() == 0);
        assert(idle.at_eof());
        assert(uploading.at_eof());
        assert(!std::filesystem::exists(server.root() / "slow.bin"));
    }

    void test_backend_write_failure_drains_upload()
    {
        TestServer server("ferry_session_write_failure_test", make_faulty_storage);
        auto &storage = server.faulty_storage();
        storage.fail_writes = true;
        RawClient client(server.port());

        client.send("put doomed.bin 10000\n");
        assert(client.read_line() == "OK");
        client.send(std::string(10000, 'd') + "ls\n");
        assert(client.read_line() == "ERR Upload failed: No space left on device");
        assert(client.read_line() == "No files");
        assert(client.read_line().empty());
        assert(std::filesystem::is_empty(server.root() / ".incoming"));

        storage.fail_writes = false;
        client.send("put fine.bin 2\n");
        assert(client.read_line() == "OK");
        client.send("ok");
        assert(client.read_line() == "OK 2");
        assert(wait_until([&]
                          { return server.metrics().count("Uploads") == 1; }));
    }

    void test_short_backend_read_closes_session()
    {
        TestServer server("ferry_session_short_read_test", make_faulty_storage);
        auto &storage = server.faulty_storage();
        const auto payload = make_payload(1000);
        {
            RawClient client(server.port());
            client.send("put short.bin 1000\n");
            assert(client.read_line() == "OK");
            client.send(payload);
            assert(client.read_line() == "OK 1000");

            storage.read_limit = 100;
            client.send("get short.bin\n");
            assert(client.read_line() == "OK 1000");
            client.send("OK");
            assert(client.read_exact(100) == payload.substr(0, 100));
            assert(client.at_eof());
        }
        assert(wait_until([&]
                          { return server.server().registry().count() == 0; }));
        assert(server.metrics().count("Downloads") == 0);

        const auto workdir = std::filesystem::temp_directory_path() / "ferry_short_read_workdir";
        cleanup_path(workdir);
        std::filesystem::create_directories(workdir);
        const auto local = workdir / "short.bin";

        std::istringstream input("get short.bin " + local.string() + "\nls\nls\n");
        std::ostringstream output;
        client::ClientSession session(client::ClientConfig{.host = "127.0.0.1", .port = server.port()},
                                      client::Logger(std::nullopt), input, output);
        assert(session.run() == 0);

        const auto transcript = output.str();
        assert(transcript.find("Download incomplete: " + local.string()) != std::string::npos);
        assert(transcript.find("Connection lost.") != std::string::npos);
        assert(!std::filesystem::exists(local));
        assert(!std::filesystem::exists(workdir / "short.bin.part"));
        cleanup_path(workdir);
    }

    void test_list_failure_sends_single_error()
    {
        TestServer server("ferry_session_list_failure_test", make_faulty_storage);
        auto &storage = server.faulty_storage();
        storage.fail_list = true;
        RawClient client(server.port());

        client.send("ls\n");
        assert(client.read_line() == "ERR Storage list error: disk offline");
        // A sentinel line here would be read in place of the next reply.
        client.send("get missing.txt\n");
        assert(client.read_line() == "ERR File not found");

        storage.fail_list = false;
        client.send("ls\n");
        assert(client.read_line() == "No files");
        assert(client.read_line().empty());
    }

    void test_throwing_metrics_do_not_abort_transfers()
    {
        TestServer server("ferry_session_metrics_failure_test", {}, std::make_unique<ThrowingSink>());
        {
            RawClient client(server.port());
            client.send("put m.txt 5\n");
            assert(client.read_line() == "OK");
            client.send("hello");
            assert(client.read_line() == "OK 5");

            client.send("get m.txt\n");
            assert(client.read_line() == "OK 5");
            client.send("OK");
            assert(client.read_exact(5) == "hello");

            client.send("ls\n");
            assert(client.read_line().ends_with(" m.txt"));
            assert(client.read_line().empty());
        }
        // One observation on connect, one on disconnect.
        assert(wait_until([&]
                          { return server.metrics().count("ActiveClients") == 2; }));
        assert(server.metrics().count("Uploads") == 1);
        assert(server.metrics().count("Downloads") == 1);
    }

    void test_interactive_client_session()
    {
        TestServer server("ferry_session_shell_test");
        const auto workdir = std::filesystem::temp_directory_path() / "ferry_shell_workdir";
        cleanup_path(workdir);
        std::filesystem::create_directories(workdir);

        const auto upload_path = workdir / "notes.txt";
        {
            std::ofstream out(upload_path, std::ios::binary);
            out << "remember the milk";
        }
        const auto download_path = workdir / "copy.txt";

        std::istringstream input("put " + upload_path.string() + "\n" + "ls\n" + "get notes.txt " +
                                 download_path.string() + "\n" + "get absent.txt " + (workdir / "x").string() +
                                 "\n" + "frobnicate\n" + "quit\n");
        std::ostringstream output;
        client::ClientSession session(client::ClientConfig{.host = "127.0.0.1", .port = server.port()},
                                      client::Logger(std::nullopt), input, output);
        assert(session.run() == 0);

        const auto transcript = output.str();
        assert(transcript.find("Uploaded: notes.txt (17 bytes)") != std::string::npos);
        assert(transcript.find(" notes.txt\n") != std::string::npos);
        assert(transcript.find("Downloaded: " + download_path.string()) != std::string::npos);
        assert(transcript.find("ERR File not found") != std::string::npos);
        assert(transcript.find("Unknown command.") != std::string::npos);

        std::ifstream copy(download_path, std::ios::binary);
        const std::string content((std::istreambuf_iterator<char>(copy)), std::istreambuf_iterator<char>());
        assert(content == "remember the milk");
        assert(!std::filesystem::exists(workdir / "x"));
        assert(!std::filesystem::exists(workdir / "x.part"));

        cleanup_path(workdir);
    }

} // namespace

void run_server_session_tests()
{
    test_put_then_get_over_the_wire();
    test_errors_keep_session_open();
    test_legacy_commands_without_newline();
    test_put_names_are_flattened();
    test_disconnect_mid_upload_leaves_nothing();
    test_transfer_client_roundtrip();
    test_concurrent_sessions();
    test_shutdown_closes_live_sessions();
    test_backend_write_failure_drains_upload();
    test_short_backend_read_closes_session();
    test_list_failure_sends_single_error();
    test_throwing_metrics_do_not_abort_transfers();
    test_interactive_client_session();
}
