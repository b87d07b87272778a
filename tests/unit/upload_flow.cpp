#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fake_drive.hpp"
#include "skydrive/client/batch_uploader.hpp"
#include "skydrive/client/session_store.hpp"
#include "skydrive/client/upload_session.hpp"
#include "skydrive/client/uploader.hpp"
#include "skydrive/crypto.hpp"
#include "skydrive/errors.hpp"

using namespace skydrive;
using namespace skydrive::client;
using namespace skydrive::testing;

namespace
{

    namespace fs = std::filesystem;

    const std::string kFragmentFailure =
        R"({"error": {"code": "invalidRange", "message": "Invalid range", "innererror": {"code": "fragmentRowCountCheckFailed"}}})";
    const std::string kInvalidRange = R"({"error": {"code": "invalidRange", "message": "Invalid range"}})";

    std::int64_t now_seconds()
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // Resumable uploads in 320 KiB chunks, whatever the file size.
    UploadOptions small_chunks()
    {
        UploadOptions options;
        options.simple_threshold = 0;
        options.chunk_size = kChunkAlignment;
        return options;
    }

    std::string range(std::uint64_t start, std::uint64_t length, std::uint64_t total)
    {
        return http::content_range(start, length, total);
    }

    struct UploadFixture
    {
        explicit UploadFixture(const std::string &name,
                               std::function<std::shared_ptr<http::HttpTransport>(std::shared_ptr<FakeDrive>)> wrap = {})
            : h(name, std::move(wrap)),
              data(h.dir.path() / "data"),
              local(h.dir.path() / "local")
        {
            fs::create_directories(local);
            h.fake->add_folder("docs");
        }

        fs::path file(const std::string &name, const std::string &content)
        {
            const auto path = local / name;
            write_file(path, content);
            return path;
        }

        protocol::DriveItem upload(const fs::path &path, const UploadOptions &options,
                                   const std::string &directory = "docs")
        {
            Uploader uploader(h.drive, h.waiter, data);
            return uploader.upload(directory, path, options);
        }

        fs::path session_file(const std::string &remote, const fs::path &path) const
        {
            return SessionStore::locate(data, remote, crypto::sha1_file(path));
        }

        Harness h;
        fs::path data;
        fs::path local;
    };

    void test_chunked_upload()
    {
        UploadFixture f("skydrive_flow_chunked");
        const auto total = 25 * kMebibyte;
        const auto content = make_content(total, 11);
        const auto path = f.file("big.bin", content);

        const auto item = f.upload(path, UploadOptions{});
        assert(item.name == "big.bin");
        assert(item.size == total);
        assert(f.h.fake->items.at("docs/big.bin").content == content);

        const auto chunk = 10 * kMebibyte;
        const std::vector<std::string> expected{
            range(0, chunk, total),
            range(chunk, chunk, total),
            range(2 * chunk, total - 2 * chunk, total),
        };
        assert(f.h.fake->chunk_ranges() == expected);
        assert(f.h.fake->count("POST", "upload.createSession") == 1);
        assert(f.h.waiter.waits().empty());
        assert(!fs::exists(f.session_file("docs/big.bin", path)));
    }

    void test_simple_upload()
    {
        UploadFixture f("skydrive_flow_simple");
        const auto content = make_content(5 * 1024, 12);
        const auto path = f.file("small.bin", content);

        const auto item = f.upload(path, UploadOptions{});
        assert(item.size == content.size());
        assert(f.h.fake->items.at("docs/small.bin").content == content);
        assert(f.h.fake->count("POST", "upload.createSession") == 0);
        assert(f.h.fake->count("PUT", "/drive/root:/docs/small.bin:/content?@name.conflictBehavior=fail") == 1);
        assert(f.h.fake->chunk_ranges().empty());
        assert(!fs::exists(f.data / "saved_sessions"));

        // the threshold is inclusive
        UploadOptions options;
        options.simple_threshold = content.size();
        f.upload(f.file("edge.bin", content), options);
        assert(f.h.fake->count("POST", "upload.createSession") == 0);
        options.simple_threshold = content.size() - 1;
        f.upload(f.file("over.bin", content), options);
        assert(f.h.fake->count("POST", "upload.createSession") == 1);
    }

    void test_chunk_boundaries()
    {
        UploadFixture f("skydrive_flow_sizes");
        const std::vector<std::uint64_t> sizes{1, kChunkAlignment - 1, kChunkAlignment, kChunkAlignment + 1,
                                               3 * kChunkAlignment};
        for (std::size_t i = 0; i < sizes.size(); ++i)
        {
            const auto content = make_content(sizes[i], static_cast<unsigned>(20 + i));
            const auto name = "s" + std::to_string(i) + ".bin";
            const auto before = f.h.fake->chunk_ranges().size();

            f.upload(f.file(name, content), small_chunks());

            const auto sent = f.h.fake->chunk_ranges().size() - before;
            assert(sent == (sizes[i] + kChunkAlignment - 1) / kChunkAlignment);
            assert(f.h.fake->items.at("docs/" + name).content == content);
        }
        assert(f.h.waiter.waits().empty());
    }

    void test_restart_after_lost_session()
    {
        UploadFixture f("skydrive_flow_restart");
        const auto total = 3 * kChunkAlignment;
        const auto content = make_content(total, 13);
        const auto path = f.file("r.bin", content);
        f.h.fake->chunk_script = {{}, {404, R"({"error": {"code": "itemNotFound"}})", false}};

        f.upload(path, small_chunks());

        assert(f.h.fake->count("POST", "upload.createSession") == 2);
        const std::vector<std::string> expected{
            range(0, kChunkAlignment, total),
            range(kChunkAlignment, kChunkAlignment, total),
            range(0, kChunkAlignment, total),
            range(kChunkAlignment, kChunkAlignment, total),
            range(2 * kChunkAlignment, kChunkAlignment, total),
        };
        assert(f.h.fake->chunk_ranges() == expected);
        assert(f.h.fake->items.at("docs/r.bin").content == content);
        assert(f.h.waiter.waits().empty());
        assert(!fs::exists(f.session_file("docs/r.bin", path)));
    }

    void test_missing_remote_hash()
    {
        UploadFixture f("skydrive_flow_nohash");
        f.h.fake->omit_hash = true;
        const auto path = f.file("h.bin", make_content(kChunkAlignment + 10, 14));

        std::optional<IntegrityError> failure;
        try
        {
            f.upload(path, small_chunks());
        }
        catch (const IntegrityError &ex)
        {
            failure.emplace(ex);
        }
        assert(failure);
        const std::string message = failure->what();
        assert(message.find("has no key file.hashes.sha1Hash") != std::string::npos);
        assert(message.find("session saved to '" + f.session_file("docs/h.bin", path).string() + "'") !=
               std::string::npos);
        assert(failure->saved_session() && *failure->saved_session() == f.session_file("docs/h.bin", path));
        assert(fs::exists(f.session_file("docs/h.bin", path)));

        const auto simple = caught<IntegrityError>([&]
                                                   { f.upload(f.file("s.bin", "tiny"), UploadOptions{}); });
        assert(simple && simple->find("session saved to") == std::string::npos);
    }

    void test_remote_hash_mismatch()
    {
        UploadFixture f("skydrive_flow_wrong_hash");
        f.h.fake->wrong_hash = true;
        const auto content = make_content(2 * kChunkAlignment, 24);
        const auto path = f.file("m.bin", content);
        const auto session = f.session_file("docs/m.bin", path);

        std::optional<IntegrityError> failure;
        try
        {
            f.upload(path, small_chunks());
        }
        catch (const IntegrityError &ex)
        {
            failure.emplace(ex);
        }
        assert(failure);
        assert(failure->code() == ErrorCode::IntegrityError);
        const std::string message = failure->what();
        assert(message.find("SHA-1 digest mismatch") != std::string::npos);
        assert(message.find(crypto::sha1_file(path)) != std::string::npos);
        assert(failure->saved_session() && *failure->saved_session() == session);
        assert(fs::exists(session));
        // the item was created; a mismatch is reported, never retried
        assert(f.h.fake->items.at("docs/m.bin").content == content);
        assert(f.h.fake->chunk_ranges().size() == 2);
        assert(f.h.fake->count("POST", "upload.createSession") == 1);
        assert(f.h.waiter.waits().empty());

        const auto simple_path = f.file("small.bin", "tiny payload");
        std::optional<IntegrityError> simple;
        try
        {
            f.upload(simple_path, UploadOptions{});
        }
        catch (const IntegrityError &ex)
        {
            simple.emplace(ex);
        }
        assert(simple);
        assert(std::string(simple->what()).find("SHA-1 digest mismatch") != std::string::npos);
        assert(!simple->saved_session());
        assert(f.h.fake->items.at("docs/small.bin").content == "tiny payload");
        assert(f.h.fake->count("PUT", "small.bin") == 1);
        assert(f.h.fake->chunk_ranges().size() == 2);
    }

    void test_second_anomaly_fails()
    {
        UploadFixture f("skydrive_flow_anomaly");
        const auto path = f.file("a.bin", make_content(3 * kChunkAlignment, 15));
        f.h.fake->chunk_script = {{401, "", false}, {401, "", false}};

        std::optional<UploadError> failure;
        try
        {
            f.upload(path, small_chunks());
        }
        catch (const UploadError &ex)
        {
            failure.emplace(ex);
        }
        assert(failure);
        const std::string message = failure->what();
        assert(message.find("got HTTP 401 upon chunk upload request") != std::string::npos);
        assert(message.find("session saved to") != std::string::npos);
        assert(failure->code() == ErrorCode::ProtocolError);
        assert(failure->saved_session() && *failure->saved_session() == f.session_file("docs/a.bin", path));
        assert(fs::exists(f.session_file("docs/a.bin", path)));
        assert((f.h.waiter.waits() == std::vector<long long>{30, 3}));
        assert(!f.h.fake->has_item("docs/a.bin"));
    }

    void test_anomaly_cleared_by_progress()
    {
        UploadFixture f("skydrive_flow_anomaly_cleared");
        const auto content = make_content(3 * kChunkAlignment, 16);
        const auto path = f.file("a.bin", content);
        f.h.fake->chunk_script = {{401, "", false}, {}, {401, "", false}};

        f.upload(path, small_chunks());

        assert((f.h.waiter.waits() == std::vector<long long>{30, 3, 30, 3}));
        assert(f.h.fake->items.at("docs/a.bin").content == content);
        assert(f.h.fake->count("GET", std::string(kUploadHost)) == 2);
    }

    void test_invalid_range_variants()
    {
        {
            UploadFixture f("skydrive_flow_fragment");
            const auto content = make_content(2 * kChunkAlignment, 17);
            f.h.fake->chunk_script = {{416, kFragmentFailure, false}};
            f.upload(f.file("a.bin", content), small_chunks());
            assert((f.h.waiter.waits() == std::vector<long long>{30, 3}));
            assert(f.h.fake->items.at("docs/a.bin").content == content);
        }
        {
            UploadFixture f("skydrive_flow_plain_416");
            const auto content = make_content(2 * kChunkAlignment, 18);
            f.h.fake->chunk_script = {{416, kInvalidRange, false}, {416, kInvalidRange, false}};
            f.upload(f.file("a.bin", content), small_chunks());
            assert((f.h.waiter.waits() == std::vector<long long>{3, 3}));
            assert(f.h.fake->items.at("docs/a.bin").content == content);
        }
    }

    void test_server_error_backoff()
    {
        UploadFixture f("skydrive_flow_5xx");
        const auto content = make_content(2 * kChunkAlignment, 19);
        f.h.fake->chunk_script = {{}, {503, "", false}};

        f.upload(f.file("a.bin", content), small_chunks());

        assert((f.h.waiter.waits() == std::vector<long long>{30}));
        assert(f.h.fake->items.at("docs/a.bin").content == content);
        assert(f.h.fake->chunk_ranges().size() == 3);
    }

    void test_fatal_status()
    {
        UploadFixture f("skydrive_flow_fatal");
        const auto path = f.file("a.bin", make_content(2 * kChunkAlignment, 21));
        f.h.fake->chunk_script = {{400, R"({"error": {"code": "invalidRequest"}})", false}};

        const auto message = caught<UploadError>([&]
                                                 { f.upload(path, small_chunks()); });
        assert(message);
        assert(message->find("got HTTP 400 upon chunk upload request") != std::string::npos);
        assert(message->find("don't know what to do") != std::string::npos);
        assert(message->find("session-secret") == std::string::npos);
        assert(f.h.waiter.waits().empty());
        assert(f.h.fake->chunk_ranges().size() == 1);
    }

    void test_multi_range_status()
    {
        UploadFixture f("skydrive_flow_multirange");
        const auto path = f.file("a.bin", make_content(2 * kChunkAlignment, 22));
        f.h.fake->chunk_script = {{500, "", false}};
        f.h.fake->status_ranges_override = nlohmann::json::array({"0-10", "20-"});

        const auto message = caught<UploadError>([&]
                                                 { f.upload(path, small_chunks()); });
        assert(message && message->find("multi-range upload not implemented") != std::string::npos);
        assert((f.h.waiter.waits() == std::vector<long long>{30}));
    }

    void test_wrongly_typed_session_status()
    {
        {
            UploadFixture f("skydrive_flow_null_ranges");
            const auto path = f.file("n.bin", make_content(2 * kChunkAlignment, 25));
            f.h.fake->chunk_script = {{500, "", false}};
            f.h.fake->status_ranges_override.emplace(nullptr);

            std::optional<UploadError> failure;
            try
            {
                f.upload(path, small_chunks());
            }
            catch (const UploadError &ex)
            {
                failure.emplace(ex);
            }
            assert(failure);
            const std::string message = failure->what();
            assert(message.find("malformed upload session status for 'docs/n.bin'") != std::string::npos);
            assert(message.find("\"nextExpectedRanges\":null") != std::string::npos);
            assert(failure->code() == ErrorCode::ProtocolError);
            assert(failure->response() && failure->response()->status == 200);
            assert(failure->saved_session() && *failure->saved_session() == f.session_file("docs/n.bin", path));
            assert((f.h.waiter.waits() == std::vector<long long>{30}));
        }
        {
            UploadFixture f("skydrive_flow_numeric_ranges");
            const auto path = f.file("n.bin", make_content(2 * kChunkAlignment, 26));
            f.h.fake->chunk_script = {{503, "", false}};
            f.h.fake->status_ranges_override = nlohmann::json::array({0});

            const auto message = caught<UploadError>([&]
                                                     { f.upload(path, small_chunks()); });
            assert(message && message->find("malformed upload session status") != std::string::npos);
            assert(message->find("session saved to") != std::string::npos);
        }
    }

    void test_lost_final_response()
    {
        UploadFixture f("skydrive_flow_lost_final");
        const auto content = make_content(2 * kChunkAlignment, 23);
        const auto path = f.file("a.bin", content);
        f.h.fake->chunk_script = {{}, {500, "", true}};

        const auto item = f.upload(path, small_chunks());

        assert(item.name == "a.bin");
        assert(item.size == content.size());
        assert((f.h.waiter.waits() == std::vector<long long>{30, 30}));
        assert(f.h.fake->chunk_ranges().size() == 2);
        assert(!fs::exists(f.session_file("docs/a.bin", path)));
    }

    void test_no_ranges_without_item()
    {
        UploadFixture f("skydrive_flow_no_ranges");
        const auto path = f.file("a.bin", make_content(2 * kChunkAlignment, 24));
        f.h.fake->chunk_script = {{500, "", false}};
        f.h.fake->status_ranges_override = nlohmann::json::array();

        const auto message = caught<UploadError>([&]
                                                 { f.upload(path, small_chunks()); });
        assert(message && message->find("file still does not exist") != std::string::npos);
        assert((f.h.waiter.waits() == std::vector<long long>{30, 30}));
    }

    void test_resume_saved_session()
    {
        UploadFixture f("skydrive_flow_resume");
        const auto total = 3 * kChunkAlignment;
        const auto content = make_content(total, 25);
        const auto path = f.file("r.bin", content);

        SessionStore store(f.data, "docs/r.bin", crypto::sha1_file(path));
        store.save(f.h.fake->open_session("docs/r.bin", total, content.substr(0, kChunkAlignment)),
                   now_seconds() + 3600);

        f.upload(path, small_chunks());

        assert(f.h.fake->count("POST", "upload.createSession") == 0);
        assert(f.h.fake->count("GET", std::string(kUploadHost)) == 1);
        const std::vector<std::string> expected{
            range(kChunkAlignment, kChunkAlignment, total),
            range(2 * kChunkAlignment, kChunkAlignment, total),
        };
        assert(f.h.fake->chunk_ranges() == expected);
        assert(f.h.fake->items.at("docs/r.bin").content == content);
        assert(!fs::exists(store.path()));
    }

    void test_expired_session_reinitiates()
    {
        UploadFixture f("skydrive_flow_expired");
        const auto total = 2 * kChunkAlignment;
        const auto content = make_content(total, 26);
        const auto path = f.file("e.bin", content);

        SessionStore store(f.data, "docs/e.bin", crypto::sha1_file(path));
        store.save(f.h.fake->open_session("docs/e.bin", total, content.substr(0, kChunkAlignment)),
                   now_seconds() - 5);

        f.upload(path, small_chunks());

        assert(f.h.fake->count("POST", "upload.createSession") == 1);
        assert(f.h.fake->count("GET", std::string(kUploadHost)) == 0);
        assert(f.h.fake->chunk_ranges().front() == range(0, kChunkAlignment, total));
        assert(f.h.fake->items.at("docs/e.bin").content == content);
    }

    void test_interrupt_keeps_session()
    {
        UploadFixture f("skydrive_flow_interrupt");
        const auto total = 3 * kChunkAlignment;
        const auto content = make_content(total, 27);
        const auto path = f.file("i.bin", content);
        f.h.fake->chunk_script = {{}, {502, "", false}};
        f.h.waiter.on_wait = [](std::size_t)
        { throw InterruptedError(); };

        assert(caught<InterruptedError>([&]
                                        { f.upload(path, small_chunks()); }));
        const auto saved = f.session_file("docs/i.bin", path);
        assert(fs::exists(saved));
        const auto record = nlohmann::json::parse(read_file(saved));
        const auto upload_url = record.at("upload_url").get<std::string>();
        assert(upload_url.rfind(std::string(kUploadHost), 0) == 0);
        assert(upload_url.find("access_token") == std::string::npos);
        assert(record.at("expires").get<std::int64_t>() > now_seconds());

        f.h.waiter.on_wait = {};
        f.upload(path, small_chunks());

        assert(f.h.fake->count("POST", "upload.createSession") == 1);
        assert(f.h.fake->items.at("docs/i.bin").content == content);
        const auto ranges = f.h.fake->chunk_ranges();
        assert(ranges.size() == 4);
        assert(ranges[2] == range(kChunkAlignment, kChunkAlignment, total));
        assert(!fs::exists(saved));
    }

    void test_remote_conflicts()
    {
        UploadFixture f("skydrive_flow_conflicts");
        f.h.fake->add_file("docs/exists.bin", "old");
        f.h.fake->add_folder("docs/dir.bin");
        const auto path = f.file("exists.bin", "new content");

        const auto exists = caught<AlreadyExistsError>([&]
                                                       { f.upload(path, UploadOptions{}); });
        assert(exists && exists->find("https://drive.test/docs/exists.bin") != std::string::npos);
        assert(f.h.fake->count("PUT", "/content") == 0);

        assert(caught<WrongTypeError>([&]
                                      { f.upload(f.file("dir.bin", "x"), UploadOptions{}); }));

        UploadOptions unchecked;
        unchecked.check_remote = false;
        const auto rejected = caught<UploadError>([&]
                                                  { f.upload(path, unchecked); });
        assert(rejected && rejected->find("got HTTP 409 upon simple upload request") != std::string::npos);
        assert(f.h.fake->items.at("docs/exists.bin").content == "old");

        auto chunked = small_chunks();
        chunked.check_remote = false;
        assert(caught<UploadError>([&]
                                   { f.upload(path, chunked); }));
        assert(f.h.fake->items.at("docs/exists.bin").content == "old");

        UploadOptions replace;
        replace.conflict = protocol::ConflictBehavior::Replace;
        f.upload(path, replace);
        assert(f.h.fake->items.at("docs/exists.bin").content == "new content");
        assert(f.h.fake->count("PUT", "conflictBehavior=replace") == 1);
    }

    void test_local_validation()
    {
        UploadFixture f("skydrive_flow_local");
        const auto missing = caught<NotFoundError>([&]
                                                   { f.upload(f.local / "absent.bin", UploadOptions{}); });
        assert(missing && missing->find("does not exist") != std::string::npos);

        fs::create_directories(f.local / "folder");
        const auto directory = caught<WrongTypeError>([&]
                                                      { f.upload(f.local / "folder", UploadOptions{}); });
        assert(directory && directory->find("is a directory") != std::string::npos);
        assert(f.h.fake->requests.empty());
    }

    void test_unchecked_upload_skips_persistence()
    {
        UploadFixture f("skydrive_flow_nocheck");
        f.h.fake->omit_hash = true;
        const auto content = make_content(2 * kChunkAlignment + 7, 28);
        auto options = small_chunks();
        options.compare_hash = false;

        f.upload(f.file("n.bin", content), options);

        assert(f.h.fake->items.at("docs/n.bin").content == content);
        assert(!fs::exists(f.data / "saved_sessions"));
    }

    void test_transport_failure_is_wrapped()
    {
        UploadFixture f("skydrive_flow_transport", [](std::shared_ptr<FakeDrive> fake)
                        { return std::make_shared<FlakyTransport>(fake, std::string(kUploadHost), -1); });
        const auto path = f.file("t.bin", make_content(2 * kChunkAlignment, 29));

        std::optional<UploadError> failure;
        try
        {
            f.upload(path, small_chunks());
        }
        catch (const UploadError &ex)
        {
            failure.emplace(ex);
        }
        assert(failure);
        assert(failure->code() == ErrorCode::TransportError);
        assert(std::string(failure->what()).find("simulated timeout") != std::string::npos);
        assert(failure->saved_session());
        assert(f.h.waiter.waits().empty());
    }

    void test_simple_transport_failure_is_wrapped()
    {
        const std::string target = std::string(protocol::kApiEndpoint) + "/drive/root:/docs/t.bin:/content";
        UploadFixture f("skydrive_flow_simple_transport", [&target](std::shared_ptr<FakeDrive> fake)
                        { return std::make_shared<FlakyTransport>(fake, target, -1); });
        const auto path = f.file("t.bin", "payload");

        UploadOptions options;
        options.check_remote = false;
        std::optional<UploadError> failure;
        try
        {
            f.upload(path, options);
        }
        catch (const UploadError &ex)
        {
            failure.emplace(ex);
        }
        assert(failure && failure->code() == ErrorCode::TransportError);
        assert(!failure->saved_session());
    }

    void test_streaming_upload_retries()
    {
        std::shared_ptr<FlakyTransport> flaky;
        UploadFixture f("skydrive_flow_streaming", [&flaky](std::shared_ptr<FakeDrive> fake)
                        {
            flaky = std::make_shared<FlakyTransport>(fake, std::string(kUploadHost), 2);
            return std::static_pointer_cast<http::HttpTransport>(flaky); });
        const auto content = make_content(3 * kChunkAlignment - 100, 30);
        auto options = small_chunks();
        options.stream = true;

        f.upload(f.file("s.bin", content), options);

        assert(f.h.fake->items.at("docs/s.bin").content == content);
        assert(flaky->attempts() == 5);
        assert(f.h.waiter.waits().empty());
    }

    void test_unfinished_final_response()
    {
        UploadFixture f("skydrive_flow_final_202");
        const auto path = f.file("a.bin", make_content(2 * kChunkAlignment, 31));
        f.h.fake->chunk_script = {{}, {202, R"({"nextExpectedRanges": []})", true}};

        const auto message = caught<UploadError>([&]
                                                 { f.upload(path, small_chunks()); });
        assert(message && message->find("finished but got HTTP 202") != std::string::npos);
    }

    void test_missing_parent_directory()
    {
        UploadFixture f("skydrive_flow_no_parent");
        const auto path = f.file("a.bin", make_content(kChunkAlignment + 1, 32));

        const auto message = caught<NotFoundError>([&]
                                                   { f.upload(path, small_chunks(), "nope"); });
        assert(message && *message == "directory 'nope' not found on the remote drive");
        assert(f.h.fake->chunk_ranges().empty());
    }

    void test_upload_session_phases()
    {
        Harness h("skydrive_flow_phases");
        h.fake->add_folder("docs");
        const auto content = make_content(kChunkAlignment + 5, 33);
        ChunkTransport transport(h.client, PayloadMode::Buffered);

        UploadSessionParams params;
        params.remote_path = "docs/p.bin";
        params.chunk_size = kChunkAlignment;
        UploadSession session(h.drive, transport, h.waiter, params);
        assert(session.phase() == UploadPhase::NoSession);

        std::istringstream source(content);
        const auto item = session.run(source, content.size());
        assert(item.size == content.size());
        assert(session.phase() == UploadPhase::Completed);
        assert(session.state().position == content.size());
        assert(!session.state().anomaly);
        assert(session.upload_url().rfind(std::string(kUploadHost), 0) == 0);
        assert(session.upload_url().find('?') == std::string::npos);

        h.fake->chunk_script = {{400, "", false}};
        params.remote_path = "docs/q.bin";
        UploadSession failing(h.drive, transport, h.waiter, params);
        std::istringstream again(content);
        assert(caught<UploadError>([&]
                                   { failing.run(again, content.size()); }));
        assert(failing.phase() == UploadPhase::Failed);

        params.chunk_size = 0;
        assert(caught<std::invalid_argument>([&]
                                             { UploadSession rejected(h.drive, transport, h.waiter, params); }));
    }

    void test_batch_upload()
    {
        UploadFixture f("skydrive_flow_batch");
        f.h.fake->add_file("docs/taken.bin", "remote");
        const auto small = make_content(500, 34);
        const auto large = make_content(2 * kChunkAlignment + 3, 35);
        const std::vector<fs::path> files{
            f.file("small.bin", small),
            f.local / "missing.bin",
            f.file("taken.bin", "local"),
            f.file("large.bin", large),
        };

        UploadOptions options;
        options.simple_threshold = 1000;
        options.chunk_size = kChunkAlignment;

        std::atomic<int> reported{0};
        BatchUploader batch(f.h.drive, f.h.waiter, f.data, 2);
        const auto outcomes = batch.run("docs", files, options, [&reported](const UploadOutcome &)
                                        { ++reported; });

        assert(reported == 4);
        assert(outcomes.size() == 4);
        for (std::size_t i = 0; i < files.size(); ++i)
        {
            assert(outcomes[i].local_path == files[i]);
        }
        assert(outcomes[0].success && outcomes[0].code == ErrorCode::Ok);
        assert(!outcomes[1].success && outcomes[1].code == ErrorCode::NotFound);
        assert(!outcomes[2].success && outcomes[2].code == ErrorCode::AlreadyExists);
        assert(outcomes[3].success);
        assert(f.h.fake->items.at("docs/small.bin").content == small);
        assert(f.h.fake->items.at("docs/large.bin").content == large);
        assert(f.h.fake->items.at("docs/taken.bin").content == "remote");

        const auto description = describe_failure(outcomes[1]);
        assert(description.rfind("failed to upload '" + files[1].string() + "': not_found: ", 0) == 0);

        BatchUploader unbounded(f.h.drive, f.h.waiter, f.data, 0);
        assert(unbounded.run("docs", {}, options).empty());
    }

} // namespace

void run_upload_flow_tests()
{
    test_chunked_upload();
    test_simple_upload();
    test_chunk_boundaries();
    test_restart_after_lost_session();
    test_missing_remote_hash();
    test_remote_hash_mismatch();
    test_second_anomaly_fails();
    test_anomaly_cleared_by_progress();
    test_invalid_range_variants();
    test_server_error_backoff();
    test_fatal_status();
    test_multi_range_status();
    test_wrongly_typed_session_status();
    test_lost_final_response();
    test_no_ranges_without_item();
    test_resume_saved_session();
    test_expired_session_reinitiates();
    test_interrupt_keeps_session();
    test_remote_conflicts();
    test_local_validation();
    test_unchecked_upload_skips_persistence();
    test_transport_failure_is_wrapped();
    test_simple_transport_failure_is_wrapped();
    test_streaming_upload_retries();
    test_unfinished_final_response();
    test_missing_parent_directory();
    test_upload_session_phases();
    test_batch_upload();
}
