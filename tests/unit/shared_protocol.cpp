#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "formupload/crypto.hpp"
#include "formupload/error_codes.hpp"
#include "formupload/protocol.hpp"
#include "formupload/version.hpp"

using namespace formupload;
using namespace formupload::protocol;

void run_client_component_tests();
void run_upload_engine_tests();
void run_http_transport_tests();

namespace
{

    void test_transfer_mode_labels()
    {
        assert(to_string(TransferMode::Staged) == "staged");
        assert(to_string(TransferMode::Simple) == "simple");
        assert(transfer_mode_from_string("staged") == TransferMode::Staged);
        assert(transfer_mode_from_string("s3") == TransferMode::Staged);
        assert(transfer_mode_from_string("simple") == TransferMode::Simple);
        assert(!transfer_mode_from_string("ftp"));
        assert(synthesized_confirmation(3) == "confirm-3");
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::StoreUnavailable) == "store_unavailable");
        assert(to_string(ErrorCode::ProtocolError) == "protocol_error");
        assert(error_code_from_int(to_int(ErrorCode::HttpStatus)) == ErrorCode::HttpStatus);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_init_request_shape()
    {
        InitRequest request;
        request.files.push_back(InitFile{"doc", "report.pdf", 12, "application/pdf", 3});
        const auto json = nlohmann::json(request);
        const auto &file = json.at("files").at(0);
        assert(file.at("inputName") == "doc");
        assert(file.at("fileName") == "report.pdf");
        assert(file.at("size") == 12);
        assert(file.at("mime") == "application/pdf");
        assert(file.at("chunks") == 3);
    }

    void test_decode_init_response()
    {
        const auto decoded = decode_init_response(R"({
            "uploads": [{
                "inputName": "doc",
                "uploadId": "stage-1",
                "s3Path": "/bucket/doc",
                "parts": [{"partNumber": 2, "url": "http://p/2"}, {"partNumber": 1, "url": "http://p/1"}]
            }]
        })");
        const auto *response = std::get_if<InitResponse>(&decoded);
        assert(response != nullptr);
        assert(response->uploads.size() == 1);
        const auto &upload = response->uploads.front();
        assert(upload.staging_handle == "stage-1");
        assert(upload.path == std::optional<std::string>("/bucket/doc"));
        assert(upload.parts.size() == 2);
        assert(upload.parts[0].part_number == 1);
        assert(upload.parts[1].url == "http://p/2");

        assert(std::holds_alternative<ProtocolError>(decode_init_response("not json")));
        assert(std::holds_alternative<ProtocolError>(decode_init_response("[]")));
        assert(std::holds_alternative<ProtocolError>(decode_init_response(R"({"uploads": {}})")));
        assert(std::holds_alternative<ProtocolError>(decode_init_response(
            R"({"uploads": [{"inputName": "doc", "stagingHandle": "h", "parts": [{"partNumber": 0, "url": "u"}]}]})")));
        assert(std::holds_alternative<ProtocolError>(
            decode_init_response(R"({"uploads": [{"inputName": "doc", "parts": []}]})")));
    }

    void test_init_part_numbering()
    {
        const auto shifted = decode_init_response(R"({"uploads": [{"inputName": "doc", "stagingHandle": "h",
            "parts": [{"partNumber": 2, "url": "u2"}, {"partNumber": 3, "url": "u3"}, {"partNumber": 4, "url": "u4"}]}]})");
        assert(std::holds_alternative<ProtocolError>(shifted));

        const auto duplicated = decode_init_response(R"({"uploads": [{"inputName": "doc", "stagingHandle": "h",
            "parts": [{"partNumber": 1, "url": "a"}, {"partNumber": 1, "url": "b"}]}]})");
        assert(std::holds_alternative<ProtocolError>(duplicated));

        const auto gap = decode_init_response(R"({"uploads": [{"inputName": "doc", "stagingHandle": "h",
            "parts": [{"partNumber": 1, "url": "a"}, {"partNumber": 3, "url": "c"}]}]})");
        assert(std::holds_alternative<ProtocolError>(gap));
    }

    void test_dump_json_invalid_utf8()
    {
        const nlohmann::json json = {{"fileName", std::string("caf\xe9.bin")}};
        bool threw = false;
        try
        {
            (void)json.dump();
        }
        catch (const nlohmann::json::type_error &)
        {
            threw = true;
        }
        assert(threw);

        const auto text = dump_json(json);
        const auto reparsed = nlohmann::json::parse(text);
        assert(reparsed.at("fileName") == "caf\xEF\xBF\xBD.bin");
        assert(dump_json(json, 2).find('\n') != std::string::npos);
    }

    void test_decode_complete_response()
    {
        const auto decoded = decode_complete_response(R"({
            "files": [
                {"inputName": "doc", "fileId": "id-1", "path": "/stored/doc"},
                {"inputName": "doc", "fileId": "id-2"},
                {"inputName": "", "fileId": "ignored"},
                {"inputName": "photo"},
                42
            ]
        })");
        const auto *response = std::get_if<CompleteResponse>(&decoded);
        assert(response != nullptr);
        assert(response->files.size() == 2);
        assert(resolved_identifier(response->files[0]) == std::optional<std::string>("/stored/doc"));
        assert(resolved_identifier(response->files[1]) == std::optional<std::string>("id-2"));

        const auto empty = decode_complete_response("  ");
        assert(std::holds_alternative<CompleteResponse>(empty));
        assert(std::get<CompleteResponse>(empty).files.empty());

        assert(std::holds_alternative<ProtocolError>(decode_complete_response("{")));
        assert(std::holds_alternative<ProtocolError>(decode_complete_response(R"({"files": "x"})")));
    }

    void test_complete_request_shape()
    {
        CompleteRequest request;
        request.uploads.push_back(CompleteUpload{"doc", "stage-1", "/staged/x/doc/a.bin",
                                                 {PartConfirmation{1, "t1"}, PartConfirmation{2, "t2"}}});
        const auto json = nlohmann::json(request);
        const auto &upload = json.at("uploads").at(0);
        assert(upload.at("stagingHandle") == "stage-1");
        assert(upload.at("path") == "/staged/x/doc/a.bin");
        assert(upload.at("parts").at(1).at("partNumber") == 2);
        assert(upload.at("parts").at(1).at("confirmationToken") == "t2");
    }

    void test_decode_simple_response()
    {
        auto response = decode_simple_response(R"({"path": "/files/a", "fileId": "f"})");
        assert(response.path == std::optional<std::string>("/files/a"));
        assert(response.file_id == std::optional<std::string>("f"));

        response = decode_simple_response("<html>");
        assert(!response.path && !response.file_id);

        response = decode_simple_response(R"({"path": ""})");
        assert(!response.path);
    }

    void test_crypto()
    {
        const std::vector<std::byte> data = {std::byte{'a'}, std::byte{'b'}, std::byte{'c'}};
        const auto digest = crypto::hash_bytes(data);
        assert(digest.size() == 64);
        assert(digest == crypto::hash_bytes(data));

        const auto hex = crypto::random_hex(8);
        assert(hex.size() == 16);
        assert(hex.find_first_not_of("0123456789abcdef") == std::string::npos);

        std::set<std::string> seen;
        for (int i = 0; i < 32; ++i)
        {
            const auto uuid = crypto::random_uuid();
            assert(uuid.size() == 36);
            assert(uuid[8] == '-' && uuid[13] == '-' && uuid[18] == '-' && uuid[23] == '-');
            assert(uuid[14] == '4');
            seen.insert(uuid);
        }
        assert(seen.size() == 32);
    }

} // namespace

int main()
{
    try
    {
        assert(!formupload::version().empty());
        test_transfer_mode_labels();
        test_error_codes();
        test_init_request_shape();
        test_decode_init_response();
        test_init_part_numbering();
        test_dump_json_invalid_utf8();
        test_decode_complete_response();
        test_complete_request_shape();
        test_decode_simple_response();
        test_crypto();
        run_client_component_tests();
        run_upload_engine_tests();
        run_http_transport_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
