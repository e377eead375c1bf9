#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkyard/crypto.hpp"
#include "chunkyard/encoding/base64.hpp"
#include "chunkyard/error_codes.hpp"
#include "chunkyard/framing.hpp"
#include "chunkyard/protocol.hpp"
#include "chunkyard/time_format.hpp"

using namespace chunkyard;
using namespace chunkyard::protocol;

void run_server_component_tests();
void run_upload_manager_tests();
void run_download_streamer_tests();
void run_job_engine_tests();
void run_retention_tests();
void run_cloud_tests();

namespace
{

    void test_request_roundtrip()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::UploadStatus;
        envelope.payload = UploadRefRequest{.upload_id = "u-1"};
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json["cmd"] == "UPLOAD_STATUS");
        const auto decoded = json.get<RequestEnvelope>();

        assert(decoded.command == Command::UploadStatus);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);
    }

    void test_unknown_command_rejected()
    {
        const nlohmann::json json{{"cmd", "SYNC_APPLY"}, {"payload", nlohmann::json::object()}};
        bool threw = false;
        try
        {
            (void)json.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            threw = true;
        }
        assert(threw);
        assert(!command_from_string("LIST").has_value());
        assert(command_from_string("CLOUD_PRESIGN") == Command::CloudPresign);
    }

    void test_error_response_carries_kind()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::MissingChunks;
        envelope.message = "chunks missing";
        envelope.payload = {{"missing", {2, 3}}};

        const auto json = nlohmann::json(envelope);
        assert(json["status"] == "ERROR");
        assert(json["error"] == 4);
        assert(json["error_kind"] == "missing_chunks");

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::MissingChunks);
        assert(decoded.payload["missing"].size() == 2);
    }

    void test_error_code_tags()
    {
        assert(to_string(ErrorCode::ValidationError) == "validation_error");
        assert(to_string(ErrorCode::UnsupportedProvider) == "unsupported_provider");
        assert(error_code_from_string("invalid_range") == ErrorCode::InvalidRange);
        assert(error_code_from_int(10) == ErrorCode::Conflict);
        assert(to_int(ErrorCode::InternalError) == 11);
    }

    void test_framing()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::UploadInit;
        envelope.payload = UploadInitRequest{
            .filename = "notes.txt",
            .total_size = 4096,
            .chunk_size = 1024,
        };

        const auto frame = encode_frame(nlohmann::json(envelope));
        const std::uint32_t length = read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize>(frame.data(), kFrameHeaderSize));
        assert(length + kFrameHeaderSize == frame.size());

        // Partial frames are not decoded.
        assert(!try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1)).has_value());

        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        const auto decoded_envelope = decoded->message.get<RequestEnvelope>();
        assert(decoded_envelope.command == Command::UploadInit);
        const auto init = decoded_envelope.payload.get<UploadInitRequest>();
        assert(init.filename == "notes.txt");
        assert(init.chunk_size == 1024u);
        assert(!init.mime_type.has_value());
    }

    void test_frame_size_ceiling()
    {
        const nlohmann::json message{{"cmd", "PING"}, {"payload", nlohmann::json::object()}};
        const auto frame = encode_frame(message);
        const auto body_size = frame.size() - kFrameHeaderSize;

        assert(try_decode_frame(frame, body_size).has_value());

        // The ceiling applies from the header alone, before the body has arrived.
        bool too_large = false;
        try
        {
            (void)try_decode_frame(std::span<const std::uint8_t>(frame.data(), kFrameHeaderSize + 1), body_size - 1);
        }
        catch (const FrameTooLarge &ex)
        {
            too_large = ex.payload_size() == body_size && ex.limit() == body_size - 1;
        }
        assert(too_large);

        const std::array<std::uint8_t, kFrameHeaderSize> header{0x01, 0x00, 0x00, 0x00};
        assert(read_frame_length(header) == 16'777'216u);
        assert(checked_frame_length(header, 16'777'216) == 16'777'216u);
    }

    void test_chunk_capacity_fits_frame()
    {
        assert(max_chunk_bytes(kChunkEnvelopeReserve) == 0);
        assert(max_chunk_bytes(kChunkEnvelopeReserve + 4) == 3);

        const auto capacity = max_chunk_bytes(kDefaultMaxFrameBytes);
        assert(capacity > 47u * 1024 * 1024 && capacity < 48u * 1024 * 1024);

        const std::vector<std::byte> chunk(3000, std::byte{0x7F});
        RequestEnvelope envelope{};
        envelope.command = Command::UploadChunk;
        envelope.payload = UploadChunkRequest{
            .upload_id = crypto::random_uuid(),
            .chunk_index = 123456,
            .data_base64 = encoding::encode_base64(chunk),
        };
        envelope.request_id = std::string("req-1");
        const auto limit = kChunkEnvelopeReserve + 4000;
        assert(max_chunk_bytes(limit) >= chunk.size());
        assert(encode_frame(nlohmann::json(envelope)).size() - kFrameHeaderSize <= limit);
    }

    void test_size_fields_reject_negative_and_fractional()
    {
        auto rejected = [](const nlohmann::json &payload)
        {
            try
            {
                (void)payload.get<UploadInitRequest>();
            }
            catch (const std::invalid_argument &)
            {
                return true;
            }
            return false;
        };

        assert(rejected({{"filename", "a.bin"}, {"total_size", -5}}));
        assert(rejected({{"filename", "a.bin"}, {"total_size", 10.5}}));
        assert(rejected({{"filename", "a.bin"}, {"total_size", "10"}}));
        assert(rejected({{"filename", "a.bin"}, {"total_size", 10}, {"chunk_size", -1}}));
        // Integers past 2^64 arrive as floating point.
        assert(rejected(nlohmann::json::parse(R"({"filename": "a.bin", "total_size": 36893488147419103232})")));

        const auto max = nlohmann::json::parse(R"({"filename": "a.bin", "total_size": 18446744073709551615})");
        assert(max.get<UploadInitRequest>().total_size == std::numeric_limits<std::uint64_t>::max());
        assert((nlohmann::json{{"filename", "a.bin"}}.get<UploadInitRequest>().total_size == 0u));

        bool chunk_rejected = false;
        try
        {
            (void)nlohmann::json{{"upload_id", "u"}, {"chunk_index", -1}, {"data", ""}}.get<UploadChunkRequest>();
        }
        catch (const std::invalid_argument &)
        {
            chunk_rejected = true;
        }
        assert(chunk_rejected);

        bool range_rejected = false;
        try
        {
            (void)nlohmann::json{{"file_id", "f"}, {"start", -10}}.get<DownloadRequest>();
        }
        catch (const std::invalid_argument &)
        {
            range_rejected = true;
        }
        assert(range_rejected);
    }

    void test_transform_submit_single_file()
    {
        const nlohmann::json payload{{"kind", "checksum"}, {"file_id", "f-1"}};
        const auto request = payload.get<TransformSubmitRequest>();
        assert(request.file_ids == std::vector<std::string>{"f-1"});
        assert(request.params.is_object());
    }

    void test_download_frame_fields()
    {
        const DownloadChunkFrame frame{.offset = 1024, .bytes = 3, .data_base64 = "AAEC"};
        const auto json = nlohmann::json(frame);
        assert(json["offset"] == 1024);
        assert(json["data"] == "AAEC");

        const nlohmann::json request_json{{"file_id", "f-9"}, {"range", "bytes=0-99"}};
        const auto request = request_json.get<DownloadRequest>();
        assert(request.range == "bytes=0-99");
        assert(!request.range_start.has_value());
    }

    void test_base64()
    {
        assert(encoding::encode_base64(std::string_view("foobar")) == "Zm9vYmFy");
        assert(encoding::encode_base64(std::string_view("fo")) == "Zm8=");
        assert(encoding::decode_base64_string("Zm9vYg==") == std::string("foob"));
        assert(!encoding::decode_base64("Zm9v*mFy").has_value());

        const std::vector<std::byte> bytes{std::byte{0x00}, std::byte{0xFF}, std::byte{0x10}};
        const auto encoded = encoding::encode_base64(bytes);
        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded.has_value() && *decoded == bytes);
    }

    void test_crypto()
    {
        assert(crypto::sha256_hex(std::string_view("abc")) ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        crypto::Digest sha512(crypto::DigestAlgorithm::Sha512);
        sha512.update(std::string_view("abc"));
        assert(sha512.finish_hex() == "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
                                      "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");

        crypto::Digest blake(crypto::DigestAlgorithm::Blake2b);
        blake.update(std::string_view("abc"));
        assert(blake.finish_hex() == "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
                                     "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");

        // RFC 4231, test case 2.
        const auto mac = crypto::hmac_sha256("Jefe", "what do ya want for nothing?");
        assert(crypto::to_hex(std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(mac.data()),
                                                             mac.size())) ==
               "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

        const auto file_path = std::filesystem::temp_directory_path() / "chunkyard_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("abc", 3);
        }
        assert(crypto::hash_file(file_path) == crypto::sha256_hex(std::string_view("abc")));
        std::filesystem::remove(file_path);

        assert(crypto::digest_algorithm_from_string("blake2b") == crypto::DigestAlgorithm::Blake2b);
        assert(!crypto::digest_algorithm_from_string("crc32").has_value());

        crypto::Digest md5(*crypto::digest_algorithm_from_string("md5"));
        md5.update(std::string_view("abc"));
        assert(md5.finish_hex() == "900150983cd24fb0d6963f7d28e17f72");

        crypto::Digest sha1(crypto::DigestAlgorithm::Sha1);
        sha1.update(std::string_view("ab"));
        sha1.update(std::string_view("c"));
        assert(sha1.finish_hex() == "a9993e364706816aba3e25717850c26c9cd0d89d");

        const auto first = crypto::random_uuid();
        const auto second = crypto::random_uuid();
        assert(first.size() == 36 && first[14] == '4');
        assert(first != second);
    }

    void test_time_format()
    {
        const auto epoch_plus = from_unix_millis(1'700'000'000'123);
        assert(format_iso8601(epoch_plus) == "2023-11-14T22:13:20.123Z");
        assert(parse_iso8601("2023-11-14T22:13:20.123Z") == epoch_plus);
        assert(to_unix_millis(epoch_plus) == 1'700'000'000'123);
        assert(!parse_iso8601("yesterday").has_value());
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_unknown_command_rejected();
        test_error_response_carries_kind();
        test_error_code_tags();
        test_framing();
        test_frame_size_ceiling();
        test_chunk_capacity_fits_frame();
        test_size_fields_reject_negative_and_fractional();
        test_transform_submit_single_file();
        test_download_frame_fields();
        test_base64();
        test_crypto();
        test_time_format();
        run_server_component_tests();
        run_upload_manager_tests();
        run_download_streamer_tests();
        run_job_engine_tests();
        run_retention_tests();
        run_cloud_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
