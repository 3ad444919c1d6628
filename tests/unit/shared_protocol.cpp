#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "uplink/crypto.hpp"
#include "uplink/encoding/base64.hpp"
#include "uplink/error_codes.hpp"
#include "uplink/framing.hpp"
#include "uplink/protocol.hpp"
#include "test_support.hpp"

using namespace uplink;
using namespace uplink::protocol;

void run_server_component_tests();
void run_client_component_tests();
void run_transfer_worker_tests();
void run_end_to_end_tests();

namespace
{

    void test_request_envelope()
    {
        OpenSessionRequest open{
            .task_id = "0192a7c3d4e5f00a1b2c",
            .destination = "cameras/front/clip-001.mp4",
            .total_size = 12 * 1024 * 1024,
            .chunk_size = 5 * 1024 * 1024,
            .chunk_count = 3,
            .file_checksum = "abcd",
            .metadata = {{"camera", "front"}},
        };
        RequestEnvelope envelope{};
        envelope.command = Command::OpenSession;
        envelope.payload = open;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "OPEN_SESSION");
        assert(json.at("id") == "req-42");

        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::OpenSession);
        assert(decoded.request_id == envelope.request_id);
        const auto decoded_open = decoded.payload.get<OpenSessionRequest>();
        assert(decoded_open.chunk_count == 3);
        assert(decoded_open.metadata.at("camera") == "front");

        bool threw = false;
        try
        {
            nlohmann::json{{"cmd", "DELETE_EVERYTHING"}}.get<RequestEnvelope>();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_response_envelope()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Retry;
        envelope.error = ErrorCode::Incomplete;
        envelope.message = "2 missing and 1 damaged chunks";
        envelope.payload = FinalizeGaps{.missing = {1, 4}, .mismatched = {2}};
        envelope.request_id = std::string("7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "RETRY");
        assert(json.at("error") == to_int(ErrorCode::Incomplete));

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Retry);
        assert(decoded.error == ErrorCode::Incomplete);
        const auto gaps = decoded.payload.get<FinalizeGaps>();
        assert((gaps.missing == std::vector<std::uint64_t>{1, 4}));
        assert((gaps.mismatched == std::vector<std::uint64_t>{2}));
    }

    void test_send_chunk_wire_names()
    {
        SendChunkRequest request{
            .session_id = "s-1",
            .task_id = "t-1",
            .index = 2,
            .offset = 2048,
            .length = 4,
            .checksum = "abcd",
            .data_base64 = "ZGF0YQ==",
        };
        const auto json = nlohmann::json(request);
        assert(json.at("data") == "ZGF0YQ==");
        assert(!json.contains("data_base64"));
        assert(json.get<SendChunkRequest>().offset == 2048);
    }

    void test_classification()
    {
        assert(classify(ErrorCode::Ok) == ResponseKind::Ok);
        assert(classify(ErrorCode::InvalidCommand) == ResponseKind::Fatal);
        assert(classify(ErrorCode::InvalidPayload) == ResponseKind::Fatal);
        assert(classify(ErrorCode::Rejected) == ResponseKind::Fatal);
        assert(classify(ErrorCode::ChecksumMismatch) == ResponseKind::Retry);
        assert(classify(ErrorCode::SessionUnknown) == ResponseKind::Retry);
        assert(classify(ErrorCode::Incomplete) == ResponseKind::Retry);
        assert(classify(ErrorCode::StorageFailure) == ResponseKind::Retry);
        assert(classify(ErrorCode::Busy) == ResponseKind::Retry);

        assert(to_string(ErrorCode::ChecksumMismatch) == "checksum_mismatch");
        assert(error_code_from_int(to_int(ErrorCode::ChunkConflict)) == ErrorCode::ChunkConflict);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
        assert(command_from_string("FINALIZE") == Command::Finalize);
        assert(!command_from_string("finalize").has_value());
        assert(response_kind_from_string("FATAL") == ResponseKind::Fatal);
    }

    void test_framing()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::Ping;

        const auto frame = encode_frame(nlohmann::json(envelope));
        assert(frame.size() > kFrameHeaderSize);

        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        assert(decoded->message.get<RequestEnvelope>().command == Command::Ping);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());
        assert(!try_decode_frame(std::span<const std::uint8_t>(frame.data(), 2)).has_value());

        std::array<std::uint8_t, kFrameHeaderSize> header{};
        std::copy_n(frame.begin(), kFrameHeaderSize, header.begin());
        assert(decode_frame_header(header) == frame.size() - kFrameHeaderSize);

        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0xFF, 0xFF, 0xFF, 0xFF};
        bool threw = false;
        try
        {
            decode_frame_header(oversized);
        }
        catch (const std::length_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_base64()
    {
        const auto bytes = uplink::testing::pattern_bytes(1000);
        const auto encoded = encoding::encode_base64(bytes);
        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded.has_value());
        assert(*decoded == bytes);

        assert(encoding::encode_base64(std::span<const std::byte>{}).empty());
        assert(encoding::decode_base64("").has_value());
        assert(!encoding::decode_base64("not base64!").has_value());
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(!chunk_hash.empty());

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        assert(crypto::hash_stream(stream) == chunk_hash);

        crypto::Hasher hasher;
        hasher.update(std::span<const std::byte>(chunk.data(), 1));
        hasher.update(std::span<const std::byte>(chunk.data() + 1, 3));
        assert(hasher.finish() == chunk_hash);

        uplink::testing::TempDir dir("crypto");
        const auto file_path = dir / "chunk.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        assert(crypto::hash_file(file_path) == chunk_hash);

        bool threw = false;
        try
        {
            crypto::hash_file(dir / "missing.bin");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        const auto id = crypto::random_hex(8);
        assert(id.size() == 16);
        assert(id != crypto::random_hex(8));
    }

} // namespace

int main()
{
    try
    {
        test_request_envelope();
        test_response_envelope();
        test_send_chunk_wire_names();
        test_classification();
        test_framing();
        test_base64();
        test_crypto();
        run_server_component_tests();
        run_client_component_tests();
        run_transfer_worker_tests();
        run_end_to_end_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
