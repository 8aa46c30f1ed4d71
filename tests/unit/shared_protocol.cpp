#include <cassert>
#include <chrono>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/framing.hpp"
#include "ferry/protocol.hpp"

using namespace ferry;
using namespace ferry::protocol;

void run_server_component_tests();
void run_server_session_tests();

namespace
{

    std::string rejection_reason(std::string_view line)
    {
        try
        {
            parse_request(line);
        }
        catch (const ProtocolError &ex)
        {
            assert(ex.code() == ErrorCode::ProtocolError);
            return ex.what();
        }
        return {};
    }

    std::span<const std::uint8_t> as_bytes(std::string_view text)
    {
        return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
    }

    void test_parse_requests()
    {
        assert(std::holds_alternative<ListRequest>(parse_request("ls")));
        assert(std::holds_alternative<ListRequest>(parse_request("  LS  ")));

        const auto get = parse_request("get hello.txt");
        assert(std::get<GetRequest>(get) == GetRequest{.name = "hello.txt"});

        const auto spaced_get = parse_request("GET my  holiday photo.jpg");
        assert(std::get<GetRequest>(spaced_get).name == "my holiday photo.jpg");

        const auto put = parse_request("put annual report.pdf 1024");
        assert((std::get<PutRequest>(put) == PutRequest{.name = "annual report.pdf", .size = 1024}));

        const auto empty_put = parse_request("Put empty.bin 0");
        assert(std::get<PutRequest>(empty_put).size == 0);
    }

    void test_rejected_requests()
    {
        assert(rejection_reason("") == "Unknown command");
        assert(rejection_reason("delete a.txt") == "Unknown command");
        assert(rejection_reason("lsx") == "Unknown command");
        assert(rejection_reason("get") == "Invalid GET format");
        assert(rejection_reason("put a.txt") == "Invalid PUT format");
        assert(rejection_reason("put a.txt abc") == "Invalid filesize");
        assert(rejection_reason("put a.txt -5") == "Invalid filesize");
        assert(rejection_reason("put a.txt 12kb") == "Invalid filesize");
        assert(rejection_reason("put a.txt 18446744073709551616") == "Invalid filesize");
    }

    void test_parse_size()
    {
        assert(parse_size("0") == 0u);
        assert(parse_size("18446744073709551615") == 18446744073709551615ull);
        assert(!parse_size(""));
        assert(!parse_size("+1"));
        assert(!parse_size("1 "));
    }

    void test_sanitize_name()
    {
        assert(sanitize_name("hello.txt") == "hello.txt");
        assert(sanitize_name("a/b/../c") == "c");
        assert(sanitize_name("..\\x") == "x");
        assert(sanitize_name("/etc/passwd") == "passwd");
        assert(sanitize_name("my file.txt") == "my file.txt");

        for (const auto *bad : {"", "..", ".", "dir/", "a/..", "  "})
        {
            bool rejected = false;
            try
            {
                sanitize_name(bad);
            }
            catch (const ProtocolError &ex)
            {
                rejected = std::string(ex.what()) == "Invalid file name";
            }
            assert(rejected);
        }

        using namespace std::string_view_literals;
        for (const auto bad : {"secret\0.txt"sv, "a\x01z"sv, "bell\a.txt"sv, "del\x7f"sv, "dir/x\0"sv})
        {
            bool rejected = false;
            try
            {
                sanitize_name(bad);
            }
            catch (const ProtocolError &ex)
            {
                rejected = std::string(ex.what()) == "Invalid file name";
            }
            assert(rejected);
        }

        // The NUL survives request parsing and is only caught by sanitizing.
        const auto request = parse_request("put secret\0.txt 3"sv);
        assert(std::get<PutRequest>(request).name.size() == 11);
    }

    void test_listing_format()
    {
        const BlobInfo blob{
            .name = "hello.txt",
            .size = 5,
            .modified_at = std::chrono::system_clock::from_time_t(0),
        };
        assert(format_listing_row(blob) == "           5 1970-01-01 00:00:00 hello.txt");
        assert(format_listing({}) == "No files\n\n");

        const BlobInfo big{
            .name = "disk.img",
            .size = 123456789012ull,
            .modified_at = std::chrono::system_clock::from_time_t(1700000000),
        };
        assert(format_listing({blob, big}) ==
               "           5 1970-01-01 00:00:00 hello.txt\n"
               "123456789012 2023-11-14 22:13:20 disk.img\n"
               "\n");
    }

    void test_responses()
    {
        assert(format_ok() == "OK\n");
        assert(format_ok(42) == "OK 42\n");
        assert(format_error("File not found") == "ERR File not found\n");
        assert(format_error("multi\nline\r") == "ERR multi line \n");

        const auto ok = parse_response("OK 5");
        assert(ok.kind == ResponseKind::Ok && ok.detail == "5");
        assert(parse_response("OK").kind == ResponseKind::Ok);
        const auto err = parse_response("ERR Invalid filesize");
        assert(err.kind == ResponseKind::Error && err.detail == "Invalid filesize");
        assert(parse_response("No files").kind == ResponseKind::Data);
        assert(is_listing_terminator(""));
        assert(!is_listing_terminator("No files"));

        assert(request_line(ListRequest{}) == "ls\n");
        assert(request_line(GetRequest{.name = "a b"}) == "get a b\n");
        assert(request_line(PutRequest{.name = "x", .size = 7}) == "put x 7\n");
    }

    void test_framing()
    {
        const auto bare = split_command(as_bytes("ls"));
        assert(bare.command == "ls" && bare.bytes_consumed == 2);

        const auto pipelined = split_command(as_bytes("put a.txt 5\nhello"));
        assert(pipelined.command == "put a.txt 5");
        assert(pipelined.bytes_consumed == 12);

        const auto crlf = split_command(as_bytes("get x\r\n"));
        assert(crlf.command == "get x" && crlf.bytes_consumed == 7);

        std::vector<std::uint8_t> buffer;
        const std::string_view text = "OK 5\nhel";
        buffer.assign(text.begin(), text.end());
        assert(take_line(buffer) == std::string("OK 5"));
        assert(!take_line(buffer));
        assert(buffer.size() == 3);
        buffer.push_back('\n');
        assert(take_line(buffer) == std::string("hel"));
        assert(buffer.empty());
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::NotFound) == "not_found");
        assert(to_string(ErrorCode::TransferIncomplete) == "transfer_incomplete");
        static_assert(is_recoverable(ErrorCode::ProtocolError));
        static_assert(is_recoverable(ErrorCode::BackendUnavailable));
        static_assert(!is_recoverable(ErrorCode::TransferIncomplete));
        static_assert(!is_recoverable(ErrorCode::ConnectionFault));
    }

    void test_crypto()
    {
        assert(crypto::sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        assert(crypto::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        const std::string_view key = "Jefe";
        const auto mac = crypto::hmac_sha256(
            std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(key.data()), key.size()),
            "what do ya want for nothing?");
        assert(crypto::to_hex(mac) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    }

} // namespace

int main()
{
    try
    {
        test_parse_requests();
        test_rejected_requests();
        test_parse_size();
        test_sanitize_name();
        test_listing_format();
        test_responses();
        test_framing();
        test_error_codes();
        test_crypto();
        run_server_component_tests();
        run_server_session_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
