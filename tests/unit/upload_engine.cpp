#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "formupload/client/chunk_store.hpp"
#include "formupload/client/logger.hpp"
#include "formupload/client/reporter.hpp"
#include "formupload/client/session_state_store.hpp"
#include "formupload/client/upload_engine.hpp"
#include "formupload/protocol.hpp"
#include "test_support.hpp"

using namespace formupload;
using namespace formupload::client;
using formupload::test::FakeReply;
using formupload::test::FakeTransport;
using formupload::test::RecordingPipeline;

namespace
{

    // Staged uploader double: hands out part URLs on init and names every file on complete.
    struct StagedServer
    {
        bool report_paths{true};
        bool name_files_on_complete{true};
        std::optional<std::string> hold_part_suffix;
        std::optional<std::string> fail_part_suffix;
        std::optional<std::string> short_parts_for;
        unsigned init_status{200};
        unsigned complete_status{200};
        std::optional<std::string> complete_body;
        int init_calls{0};

        FakeReply operator()(const HttpRequest &request)
        {
            if (request.method == "PUT")
            {
                if (hold_part_suffix && formupload::test::ends_with(request.url, *hold_part_suffix))
                {
                    return formupload::test::held_reply();
                }
                if (fail_part_suffix && formupload::test::ends_with(request.url, *fail_part_suffix))
                {
                    return formupload::test::status_reply(500);
                }
                auto reply = formupload::test::ok_reply();
                reply.response.headers["etag"] = "\"tag-" + request.url.substr(request.url.rfind('/') + 1) + "\"";
                return reply;
            }
            if (formupload::test::ends_with(request.url, "/init"))
            {
                ++init_calls;
                if (init_status != 200)
                {
                    return formupload::test::status_reply(init_status);
                }
                const auto init = nlohmann::json::parse(request.body).get<protocol::InitRequest>();
                nlohmann::json uploads = nlohmann::json::array();
                int ordinal = 0;
                for (const auto &file : init.files)
                {
                    const auto prefix = "http://parts.test/" + std::to_string(init_calls) + "-" +
                                        std::to_string(ordinal++) + "/";
                    nlohmann::json parts = nlohmann::json::array();
                    for (std::uint64_t n = 1; n <= file.chunks; ++n)
                    {
                        parts.push_back({{"partNumber", n}, {"url", prefix + std::to_string(n)}});
                    }
                    if (short_parts_for == file.file_name)
                    {
                        parts.erase(parts.end() - 1);
                    }
                    nlohmann::json upload = {
                        {"inputName", file.input_name}, {"stagingHandle", "handle-" + file.file_name}, {"parts", parts}};
                    if (report_paths)
                    {
                        upload["path"] = "/remote/" + file.file_name;
                    }
                    uploads.push_back(std::move(upload));
                }
                return formupload::test::ok_reply(nlohmann::json{{"uploads", uploads}}.dump());
            }
            if (formupload::test::ends_with(request.url, "/complete"))
            {
                if (complete_status != 200)
                {
                    return formupload::test::status_reply(complete_status);
                }
                if (complete_body)
                {
                    return formupload::test::ok_reply(*complete_body);
                }
                const auto complete = nlohmann::json::parse(request.body).get<protocol::CompleteRequest>();
                nlohmann::json files = nlohmann::json::array();
                if (name_files_on_complete)
                {
                    for (const auto &upload : complete.uploads)
                    {
                        files.push_back({{"inputName", upload.input_name}, {"fileId", "id:" + upload.staging_handle}});
                    }
                }
                return formupload::test::ok_reply(nlohmann::json{{"files", files}}.dump());
            }
            return formupload::test::status_reply(404);
        }
    };

    UploadDeclaration staged_form(std::vector<std::string> inputs = {"avatar"})
    {
        UploadDeclaration declaration;
        declaration.mode = "staged";
        declaration.endpoint = "http://uploads.test/api";
        declaration.chunk_size_mib = "5";
        declaration.form_id = "profile";
        declaration.page_path = "/settings";
        declaration.file_inputs = std::move(inputs);
        return declaration;
    }

    UploadDeclaration simple_form()
    {
        UploadDeclaration declaration;
        declaration.mode = "simple";
        declaration.endpoint = "http://uploads.test/simple";
        declaration.form_id = "note";
        declaration.page_path = "/notes";
        declaration.file_inputs = {"attachment"};
        return declaration;
    }

    SelectedFile memory_file(const std::string &name, std::size_t size, std::string mime = {})
    {
        return SelectedFile{name, std::move(mime),
                            std::make_shared<MemoryByteSource>(formupload::test::pattern_bytes(size))};
    }

    std::vector<SelectedFile> one_file(SelectedFile file)
    {
        std::vector<SelectedFile> files;
        files.push_back(std::move(file));
        return files;
    }

    // Every collaborator of the engine, rooted at one scratch directory. Two harnesses built on the
    // same root behave like the same page before and after a reload.
    struct Harness
    {
        explicit Harness(const std::filesystem::path &root, FakeTransport::Responder responder,
                         EngineOptions options = {})
            : store(root / "chunks"), state_store(root / "sessions.json"), logger(std::nullopt), reporter(logger),
              transport(io_context, std::move(responder)),
              engine(io_context, transport, store, state_store, reporter, pipeline, std::move(options)) {}

        std::size_t count_events(const std::string &message) const
        {
            std::size_t total = 0;
            for (const auto &event : reporter.history())
            {
                if (event.message == message)
                {
                    ++total;
                }
            }
            return total;
        }

        std::shared_ptr<FileState> file(const std::string &session_id, const std::string &key) const
        {
            const auto *session = engine.find_session(session_id);
            assert(session != nullptr);
            const auto it = session->files.find(key);
            return it == session->files.end() ? nullptr : it->second;
        }

        asio::io_context io_context;
        DiskChunkStore store;
        SessionStateStore state_store;
        Logger logger;
        UploadReporter reporter;
        RecordingPipeline pipeline;
        FakeTransport transport;
        UploadEngine engine;
    };

    class FailingChunkStore : public ChunkStore
    {
    public:
        void put_file_record(const FileRecord &) override { fail(); }
        std::vector<FileRecord> list_file_records(const std::string &) override { fail(); }
        void put_chunk(const ChunkKey &, std::span<const std::byte>) override { fail(); }
        std::optional<std::vector<std::byte>> get_chunk(const ChunkKey &) override { fail(); }
        void delete_chunk(const ChunkKey &) override { fail(); }
        void delete_file(const std::string &, const std::string &, std::uint32_t) override { fail(); }

    private:
        [[noreturn]] static void fail()
        {
            throw StoreError(ErrorCode::StoreUnavailable, "disk unavailable");
        }
    };

    void test_staged_upload_lifecycle()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_staged");
        StagedServer server;
        Harness harness(root, std::ref(server));

        const auto session_id = harness.engine.attach_form(staged_form());
        assert(session_id);

        std::vector<FileStatus> statuses;
        std::vector<double> progress;
        harness.reporter.add_listener([&](const UploadEvent &)
                                      {
                                          const auto entry = harness.reporter.find_entry(*session_id, "avatar:0");
                                          if (!entry)
                                          {
                                              return;
                                          }
                                          if (statuses.empty() || statuses.back() != entry->status)
                                          {
                                              statuses.push_back(entry->status);
                                          }
                                          progress.push_back(entry->progress); });

        assert(harness.engine.select_files(*session_id, "avatar",
                                           one_file(memory_file("photo.raw", 12 * kMiB, "image/x-raw"))));
        const auto state = harness.file(*session_id, "avatar:0");
        assert(state->total_chunks == 3);
        assert(state->chunk_size == 5 * kMiB);
        assert(harness.store.get_chunk(ChunkKey{*session_id, "avatar", 0, 2}));

        harness.io_context.run();

        assert(harness.transport.count("POST", "/init") == 1);
        assert(harness.transport.count("PUT") == 3);
        assert(harness.transport.count("POST", "/complete") == 1);
        assert(state->status == FileStatus::Completed);
        assert(state->file_id == std::optional<std::string>("id:handle-photo.raw"));
        assert(state->uploaded_chunks == 3);
        assert(state->part_confirmations[0] == std::optional<std::string>("\"tag-1\""));
        assert(harness.engine.all_completed(*session_id));

        // Confirmed parts leave the store; the finished record stays.
        for (std::uint32_t index = 0; index < 3; ++index)
        {
            assert(!harness.store.get_chunk(ChunkKey{*session_id, "avatar", 0, index}));
        }
        const auto records = harness.store.list_file_records(*session_id);
        assert(records.size() == 1);
        assert(records.front().status == FileStatus::Completed);

        const std::vector<FileStatus> expected{FileStatus::Queued, FileStatus::Uploading, FileStatus::Finalizing,
                                               FileStatus::Completed};
        assert(statuses == expected);
        for (std::size_t i = 1; i < progress.size(); ++i)
        {
            assert(progress[i] >= progress[i - 1]);
        }
        assert(progress.back() == 1.0);
        assert(harness.count_events("upload.session.create") == 1);
        assert(harness.count_events("upload.chunk.complete") == 3);
        assert(harness.count_events("upload.finalize.complete") == 1);

        const auto complete = std::find_if(harness.transport.requests.begin(), harness.transport.requests.end(),
                                           [](const HttpRequest &request)
                                           { return formupload::test::ends_with(request.url, "/complete"); });
        const auto body = nlohmann::json::parse(complete->body);
        assert(body.at("uploads").at(0).at("path") == "/remote/photo.raw");
        assert(body.at("uploads").at(0).at("parts").size() == 3);
        assert(body.at("uploads").at(0).at("parts").at(2).at("partNumber") == 3);

        formupload::test::cleanup_path(root);
    }

    void test_simple_upload()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_simple");
        Harness harness(root, [](const HttpRequest &)
                        { return formupload::test::ok_reply(R"({"path":"/files/note.txt"})"); });
        const auto session_id = harness.engine.attach_form(simple_form());
        assert(harness.engine.select_files(*session_id, "attachment", one_file(memory_file("note.txt", 2048))));
        const auto state = harness.file(*session_id, "attachment:0");
        assert(state->total_chunks == 1);
        assert(state->chunk_size == 2048);
        assert(state->mime == "application/octet-stream");

        harness.io_context.run();

        assert(harness.transport.requests.size() == 1);
        const auto &request = harness.transport.requests.front();
        assert(request.method == "POST");
        assert(request.url == "http://uploads.test/simple");
        assert(request.body.find("name=\"inputName\"\r\n\r\nattachment\r\n") != std::string::npos);
        assert(request.body.find("filename=\"note.txt\"") != std::string::npos);
        assert(state->status == FileStatus::Completed);
        assert(state->file_id == std::optional<std::string>("/files/note.txt"));
        assert(harness.count_events("upload.simple.complete") == 1);

        formupload::test::cleanup_path(root);
    }

    void test_simple_upload_failure_blocks_submit()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_simple_failure");
        Harness harness(root, [](const HttpRequest &)
                        { return formupload::test::status_reply(500); });
        const auto session_id = harness.engine.attach_form(simple_form());
        assert(harness.engine.select_files(*session_id, "attachment", one_file(memory_file("note.txt", 2048))));
        harness.io_context.run();

        const auto state = harness.file(*session_id, "attachment:0");
        assert(state->status == FileStatus::Failed);
        assert(state->last_error && state->last_error->find("500") != std::string::npos);
        assert(!state->source);
        assert(harness.count_events("upload.failed") == 1);
        assert(harness.engine.any_failed(*session_id));

        FormSubmission submission;
        submission.session_id = *session_id;
        submission.action_url = "http://app.test/notes";
        const auto result = harness.engine.gate(submission);
        assert(result.blocked);
        assert(!result.deferred);
        assert(!result.rewritten_payload);

        submission.method = "get";
        const auto passthrough = harness.engine.gate(submission);
        assert(!passthrough.blocked);
        assert(passthrough.rewritten_payload && *passthrough.rewritten_payload == submission.payload);

        formupload::test::cleanup_path(root);
    }

    void test_deferred_submission_replays()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_defer");
        StagedServer server;
        Harness harness(root, std::ref(server));
        const auto session_id = harness.engine.attach_form(staged_form({"avatar", "docs"}));

        assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("me.png", 1024, "image/png"))));
        std::vector<SelectedFile> docs;
        docs.push_back(memory_file("a.pdf", 4096, "application/pdf"));
        docs.push_back(memory_file("b.pdf", 8192, "application/pdf"));
        assert(harness.engine.select_files(*session_id, "docs", std::move(docs)));

        FormSubmission submission;
        submission.session_id = *session_id;
        submission.action_url = "http://app.test/profile";
        submission.target_id = "save";
        submission.payload = {{"title", "hello"}, {"avatar", "C:\\fakepath\\me.png"}};
        const auto result = harness.engine.gate(submission);
        assert(result.blocked && result.deferred);
        assert(harness.state_store.read_pending(*session_id));
        assert(harness.pipeline.submissions.empty());

        harness.io_context.run();

        // All three files ride on one init and one complete request.
        assert(harness.transport.count("POST", "/init") == 1);
        assert(harness.transport.count("POST", "/complete") == 1);
        assert(harness.pipeline.submissions.size() == 1);
        assert(harness.pipeline.skipped_gate.front());
        const auto &replay = harness.pipeline.submissions.front();
        assert(replay.target_id == std::optional<std::string>("save"));
        assert(replay.action_url == "http://app.test/profile");
        assert(replay.payload.at("title") == "hello");
        assert(replay.payload.at("avatar").at("fileId") == "id:handle-me.png");
        assert(replay.payload.at("avatar").at("contentType") == "image/png");
        assert(replay.payload.at("docs").is_array());
        assert(replay.payload.at("docs").size() == 2);
        assert(replay.payload.at("docs").at(1).at("fileName") == "b.pdf");
        assert(replay.payload.at("docs").at(1).at("fileSize") == 8192);
        assert(!harness.state_store.read_pending(*session_id));
        assert(harness.count_events("upload.pending.replay") == 1);

        const auto direct = harness.engine.gate(submission);
        assert(!direct.blocked);
        assert(direct.rewritten_payload->at("docs").size() == 2);

        formupload::test::cleanup_path(root);
    }

    void test_pending_target_gone()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_target_gone");
        StagedServer server;
        Harness harness(root, std::ref(server));
        harness.pipeline.target_available = false;
        const auto session_id = harness.engine.attach_form(staged_form());
        assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("me.png", 1024))));

        FormSubmission submission;
        submission.session_id = *session_id;
        submission.action_url = "http://app.test/profile";
        assert(harness.engine.gate(submission).deferred);
        harness.io_context.run();

        assert(harness.pipeline.submissions.empty());
        assert(harness.count_events("Pending submission target no longer exists; submission discarded.") == 1);
        assert(!harness.state_store.read_pending(*session_id));

        formupload::test::cleanup_path(root);
    }

    void test_complete_without_identifiers()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_fallback_ids");
        {
            StagedServer server;
            server.name_files_on_complete = false;
            Harness harness(root, std::ref(server));
            const auto session_id = harness.engine.attach_form(staged_form());
            assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("me.png", 1024))));
            harness.io_context.run();
            assert(harness.file(*session_id, "avatar:0")->file_id == std::optional<std::string>("/remote/me.png"));
        }
        formupload::test::cleanup_path(root);
        std::filesystem::create_directories(root);
        {
            StagedServer server;
            server.name_files_on_complete = false;
            server.report_paths = false;
            Harness harness(root, std::ref(server));
            const auto session_id = harness.engine.attach_form(staged_form());
            assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("my photo.png", 1024))));
            harness.io_context.run();
            const auto state = harness.file(*session_id, "avatar:0");
            assert(state->status == FileStatus::Completed);
            assert(state->file_id == "/staged/" + state->file_uuid + "/avatar/my%20photo.png");
        }
        formupload::test::cleanup_path(root);
    }

    void test_resume_sends_remaining_parts()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_resume");
        std::string session_id;
        {
            StagedServer server;
            server.hold_part_suffix = "/3";
            Harness harness(root, std::ref(server));
            session_id = *harness.engine.attach_form(staged_form());
            assert(harness.engine.select_files(session_id, "avatar", one_file(memory_file("big.bin", 12 * kMiB))));

            FormSubmission submission;
            submission.session_id = session_id;
            submission.action_url = "http://app.test/profile";
            submission.payload = {{"title", "before reload"}};
            assert(harness.engine.gate(submission).deferred);

            harness.io_context.run();
            const auto state = harness.file(session_id, "avatar:0");
            assert(state->status == FileStatus::Uploading);
            assert(state->uploaded_chunks == 2);
        }
        {
            StagedServer server;
            Harness harness(root, std::ref(server));
            const auto resumed = harness.engine.attach_form(staged_form());
            assert(resumed == std::optional<std::string>(session_id));
            const auto state = harness.file(session_id, "avatar:0");
            assert(state);
            assert(state->uploaded_chunks == 2);

            harness.io_context.run();

            assert(server.init_calls == 0);
            assert(harness.transport.count("PUT") == 1);
            assert(harness.transport.requests.front().url.back() == '3');
            assert(harness.transport.count("POST", "/complete") == 1);
            assert(state->status == FileStatus::Completed);
            assert(harness.count_events("upload.session.resume") == 1);
            assert(harness.pipeline.submissions.size() == 1);
            assert(harness.pipeline.submissions.front().payload.at("title") == "before reload");
        }
        formupload::test::cleanup_path(root);
    }

    void test_resume_keeps_terminal_files()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_resume_terminal");
        std::string session_id;
        {
            StagedServer server;
            server.fail_part_suffix = "/1";
            Harness harness(root, std::ref(server));
            session_id = *harness.engine.attach_form(staged_form());
            assert(harness.engine.select_files(session_id, "avatar", one_file(memory_file("x.bin", 1024))));
            harness.io_context.run();
            assert(harness.file(session_id, "avatar:0")->status == FileStatus::Failed);
        }
        {
            StagedServer server;
            Harness harness(root, std::ref(server));
            assert(harness.engine.attach_form(staged_form()) == std::optional<std::string>(session_id));
            harness.io_context.run();
            assert(harness.transport.requests.empty());
            const auto state = harness.file(session_id, "avatar:0");
            assert(state->status == FileStatus::Failed);
            assert(state->last_error == std::optional<std::string>("Chunk upload failed: 500"));
        }
        formupload::test::cleanup_path(root);
    }

    void test_reselection_replaces_files()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_reselect");
        StagedServer server;
        server.hold_part_suffix = "/1";
        Harness harness(root, std::ref(server));
        const auto session_id = *harness.engine.attach_form(staged_form());

        assert(harness.engine.select_files(session_id, "avatar", one_file(memory_file("old.bin", 1024))));
        harness.io_context.run();
        const auto old_state = harness.file(session_id, "avatar:0");
        assert(harness.store.get_chunk(ChunkKey{session_id, "avatar", 0, 0}));

        harness.io_context.restart();
        assert(harness.engine.select_files(session_id, "avatar", one_file(memory_file("new.bin", 2048))));
        assert(old_state->detached);
        assert(!old_state->source);

        const auto records = harness.store.list_file_records(session_id);
        assert(records.size() == 1);
        assert(records.front().file_name == "new.bin");
        const auto chunk = harness.store.get_chunk(ChunkKey{session_id, "avatar", 0, 0});
        assert(chunk && chunk->size() == 2048);
        assert(harness.reporter.entries().size() == 1);
        assert(harness.reporter.entries().front().file_name == "new.bin");

        formupload::test::cleanup_path(root);
    }

    void test_part_concurrency_cap()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_concurrency");
        StagedServer server;
        EngineOptions options;
        options.concurrency = 2;
        Harness harness(root, std::ref(server), options);
        const auto session_id = *harness.engine.attach_form(staged_form());
        assert(harness.engine.select_files(session_id, "avatar", one_file(memory_file("wide.bin", 20 * kMiB))));
        harness.io_context.run();

        assert(harness.transport.count("PUT") == 4);
        assert(harness.transport.peak_puts_in_flight == 2);
        assert(harness.engine.all_completed(session_id));

        formupload::test::cleanup_path(root);
    }

    void test_failing_store_is_advisory()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_failing_store");
        asio::io_context io_context;
        StagedServer server;
        FakeTransport transport(io_context, std::ref(server));
        FailingChunkStore store;
        SessionStateStore state_store(root / "sessions.json");
        Logger logger(std::nullopt);
        UploadReporter reporter(logger);
        RecordingPipeline pipeline;
        UploadEngine engine(io_context, transport, store, state_store, reporter, pipeline);

        const auto session_id = engine.attach_form(staged_form());
        assert(session_id);
        assert(engine.select_files(*session_id, "avatar", one_file(memory_file("x.bin", 6 * kMiB))));
        io_context.run();

        assert(engine.all_completed(*session_id));
        std::size_t errors = 0;
        for (const auto &event : reporter.history())
        {
            if (event.type == EventType::Error)
            {
                ++errors;
            }
            assert(event.message != "upload.failed");
        }
        assert(errors > 0);

        formupload::test::cleanup_path(root);
    }

    void test_drop_requires_single_input()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_drop");
        StagedServer server;
        Harness harness(root, std::ref(server));
        const auto two_inputs = *harness.engine.attach_form(staged_form({"avatar", "docs"}));
        assert(!harness.engine.drop_files(two_inputs, one_file(memory_file("x.bin", 10))));
        assert(harness.count_events("Drop upload requires exactly one file input.") == 1);

        auto single = simple_form();
        const auto one_input = *harness.engine.attach_form(single);
        assert(harness.engine.drop_files(one_input, one_file(memory_file("x.bin", 10))));
        assert(harness.file(one_input, "attachment:0"));

        assert(!harness.engine.select_files(two_inputs, "elsewhere", one_file(memory_file("x.bin", 10))));
        formupload::test::cleanup_path(root);
    }

    void test_clear_after_submit()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_clear");
        StagedServer server;
        EngineOptions options;
        options.clear_delay = std::chrono::milliseconds(5);
        Harness harness(root, std::ref(server), options);
        auto declaration = staged_form();
        declaration.after_submit = "clear";
        const auto session_id = *harness.engine.attach_form(declaration);
        assert(harness.engine.select_files(session_id, "avatar", one_file(memory_file("x.bin", 1024))));
        harness.io_context.run();
        assert(harness.engine.all_completed(session_id));

        harness.engine.notify_submission_succeeded(session_id);
        harness.io_context.restart();
        harness.io_context.run();

        assert(harness.count_events("submit:clear") == 1);
        assert(harness.engine.find_session(session_id)->files.empty());
        assert(harness.store.list_file_records(session_id).empty());
        assert(harness.reporter.entries().empty());

        formupload::test::cleanup_path(root);
    }

    void test_clear_skipped_with_redirect()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_redirect");
        StagedServer server;
        EngineOptions options;
        options.clear_delay = std::chrono::milliseconds(1);
        Harness harness(root, std::ref(server), options);
        auto declaration = staged_form();
        declaration.after_submit = "clear";
        declaration.redirect_declared = true;
        const auto session_id = *harness.engine.attach_form(declaration);
        assert(harness.engine.select_files(session_id, "avatar", one_file(memory_file("x.bin", 1024))));
        harness.io_context.run();

        harness.engine.notify_submission_succeeded(session_id);
        harness.io_context.restart();
        harness.io_context.run();
        assert(harness.count_events("submit:clear") == 0);
        assert(harness.engine.find_session(session_id)->files.size() == 1);

        formupload::test::cleanup_path(root);
    }

    void test_file_name_not_utf8()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_latin1_name");
        StagedServer server;
        Harness harness(root, std::ref(server));
        const auto session_id = harness.engine.attach_form(staged_form());

        // Latin-1 "café.bin" as an OS file name; not valid UTF-8.
        assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("caf\xe9.bin", 1024))));
        harness.io_context.run();

        const auto state = harness.file(*session_id, "avatar:0");
        assert(state->status == FileStatus::Completed);
        assert(state->file_id == std::optional<std::string>("id:handle-caf\xEF\xBF\xBD.bin"));
        assert(harness.count_events("upload.failed") == 0);
        assert(harness.engine.all_completed(*session_id));

        const auto records = harness.store.list_file_records(*session_id);
        assert(records.size() == 1);
        assert(records.front().file_name == "caf\xEF\xBF\xBD.bin");
        assert(records.front().status == FileStatus::Completed);

        FormSubmission submission;
        submission.session_id = *session_id;
        submission.action_url = "http://app.test/profile";
        const auto result = harness.engine.gate(submission);
        assert(!result.blocked);
        assert(result.rewritten_payload);
        assert(!protocol::dump_json(*result.rewritten_payload).empty());

        formupload::test::cleanup_path(root);
    }

    void test_init_part_count_mismatch()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_short_parts");
        StagedServer server;
        server.short_parts_for = "a.pdf";
        Harness harness(root, std::ref(server));
        const auto session_id = harness.engine.attach_form(staged_form({"avatar", "docs"}));
        assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("me.png", 1024))));
        assert(harness.engine.select_files(*session_id, "docs", one_file(memory_file("a.pdf", 4096))));
        harness.io_context.run();

        assert(harness.transport.count("POST", "/init") == 1);
        const auto docs = harness.file(*session_id, "docs:0");
        assert(docs->status == FileStatus::Failed);
        assert(docs->last_error == std::optional<std::string>("Staged init returned mismatched part count."));
        const auto avatar = harness.file(*session_id, "avatar:0");
        assert(avatar->status == FileStatus::Completed);
        assert(avatar->file_id == std::optional<std::string>("id:handle-me.png"));
        assert(harness.transport.count("PUT") == 1);
        assert(harness.count_events("upload.failed") == 1);

        FormSubmission submission;
        submission.session_id = *session_id;
        submission.action_url = "http://app.test/profile";
        const auto result = harness.engine.gate(submission);
        assert(result.blocked);
        assert(!result.deferred);

        formupload::test::cleanup_path(root);
    }

    void test_staged_status_failures()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_staged_status");
        {
            StagedServer server;
            server.init_status = 503;
            Harness harness(root, std::ref(server));
            const auto session_id = harness.engine.attach_form(staged_form());
            assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("me.png", 1024))));
            harness.io_context.run();

            const auto state = harness.file(*session_id, "avatar:0");
            assert(state->status == FileStatus::Failed);
            assert(state->last_error == std::optional<std::string>("Staged init failed: 503"));
            assert(harness.transport.count("PUT") == 0);
            assert(harness.engine.any_failed(*session_id));
        }
        formupload::test::cleanup_path(root);
        std::filesystem::create_directories(root);
        {
            StagedServer server;
            server.complete_status = 502;
            Harness harness(root, std::ref(server));
            const auto session_id = harness.engine.attach_form(staged_form());
            assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("me.png", 1024))));
            harness.io_context.run();

            const auto state = harness.file(*session_id, "avatar:0");
            assert(state->status == FileStatus::Failed);
            assert(state->last_error == std::optional<std::string>("Staged finalize failed: 502"));
            assert(harness.transport.count("PUT") == 1);
            assert(!state->file_id);

            FormSubmission submission;
            submission.session_id = *session_id;
            submission.action_url = "http://app.test/profile";
            assert(harness.engine.gate(submission).blocked);
        }
        formupload::test::cleanup_path(root);
    }

    void test_malformed_complete_response()
    {
        const auto root = formupload::test::fresh_directory("formupload_engine_bad_complete");
        StagedServer server;
        server.complete_body = "{";
        Harness harness(root, std::ref(server));
        const auto session_id = harness.engine.attach_form(staged_form());
        assert(harness.engine.select_files(*session_id, "avatar", one_file(memory_file("me.png", 1024))));
        harness.io_context.run();

        const auto state = harness.file(*session_id, "avatar:0");
        assert(state->status == FileStatus::Failed);
        assert(state->last_error && state->last_error->find("malformed complete response") != std::string::npos);
        assert(harness.count_events("upload.finalize.complete") == 0);
        assert(harness.count_events("upload.failed") == 1);

        formupload::test::cleanup_path(root);
    }

} // namespace

void run_upload_engine_tests()
{
    test_staged_upload_lifecycle();
    test_simple_upload();
    test_simple_upload_failure_blocks_submit();
    test_deferred_submission_replays();
    test_pending_target_gone();
    test_complete_without_identifiers();
    test_resume_sends_remaining_parts();
    test_resume_keeps_terminal_files();
    test_reselection_replaces_files();
    test_part_concurrency_cap();
    test_failing_store_is_advisory();
    test_drop_requires_single_input();
    test_clear_after_submit();
    test_clear_skipped_with_redirect();
    test_file_name_not_utf8();
    test_init_part_count_mismatch();
    test_staged_status_failures();
    test_malformed_complete_response();
}
