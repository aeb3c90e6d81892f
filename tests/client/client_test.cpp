#include "tus/client/client.hpp"

#include "support/fake_transport.hpp"
#include "support/temp_files.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace tus;
using namespace tus::client;
using tus::testing::FakeTransport;
using tus::protocol::UploadState;
using tus::testing::TempDirTest;

namespace {

constexpr const char* kRemote = "http://tus.example.com/files/abc";

std::vector<std::pair<std::string, std::string>> offset_header(uint64_t offset) {
    return {{"Upload-Offset", std::to_string(offset)}};
}

/// Behaves like a well-formed server: accepts every byte it is sent.
Result<network::HttpResponse> accept_all(const network::HttpRequest& request) {
    if (request.method == network::HttpMethod::POST) {
        return Ok(FakeTransport::response(201, {{"Location", kRemote}}));
    }
    const uint64_t offset = std::stoull(request.get_header("Upload-Offset"));
    return Ok(FakeTransport::response(204, offset_header(offset + request.body.size())));
}

} // namespace

class ClientTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        host_ = network::Url::parse("http://tus.example.com/files/").value();
    }

    ClientOptions small_chunks(std::size_t chunk_size) {
        ClientOptions options;
        options.chunk_size = chunk_size;
        return options;
    }

    network::Url host_;
};

TEST_F(ClientTest, UploadsFileInChunks) {
    const std::string payload = tus::testing::make_payload(128);
    auto file = make_file("data.bin", payload);

    FakeTransport transport;
    transport.set_responder(accept_all);
    Client client(transport, small_chunks(64));

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_ok()) << to_string(result.error().error);
    EXPECT_TRUE(result.value().upload_complete());
    EXPECT_EQ(result.value().status().bytes_uploaded, 128u);
    EXPECT_EQ(result.value().state(), UploadState::Complete);

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].method, network::HttpMethod::POST);
    EXPECT_EQ(requests[0].get_header("Upload-Length"), "128");
    EXPECT_EQ(requests[1].get_header("Upload-Offset"), "0");
    EXPECT_EQ(requests[2].get_header("Upload-Offset"), "64");
    EXPECT_EQ(std::string(requests[1].body.begin(), requests[1].body.end()), payload.substr(0, 64));
    EXPECT_EQ(std::string(requests[2].body.begin(), requests[2].body.end()), payload.substr(64));
}

TEST_F(ClientTest, LastChunkIsShort) {
    auto file = make_file("data.bin", tus::testing::make_payload(100));

    FakeTransport transport;
    transport.set_responder(accept_all);
    Client client(transport, small_chunks(64));

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_ok());
    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[2].body.size(), 36u);
}

TEST_F(ClientTest, ChunkLargerThanFileSendsOnlyTheFile) {
    const std::string payload = tus::testing::make_payload(10);
    auto file = make_file("tiny.bin", payload);

    FakeTransport transport;
    transport.set_responder(accept_all);
    Client client(transport, small_chunks(std::numeric_limits<std::size_t>::max()));

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_ok()) << to_string(result.error().error);

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(std::string(requests[1].body.begin(), requests[1].body.end()), payload);
}

TEST_F(ClientTest, PartialAcknowledgementResendsFromServerOffset) {
    const std::string payload = tus::testing::make_payload(30);
    auto file = make_file("data.bin", payload);

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    transport.enqueue(FakeTransport::response(204, offset_header(10)));
    transport.enqueue(FakeTransport::response(204, offset_header(30)));
    Client client(transport);

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_ok());
    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[2].get_header("Upload-Offset"), "10");
    EXPECT_EQ(std::string(requests[2].body.begin(), requests[2].body.end()), payload.substr(10));
}

TEST_F(ClientTest, CreateFailureHasSnapshotWithoutRemoteUrl) {
    auto file = make_file("data.bin", "abc");

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(413));
    Client client(transport);

    auto result = client.create(file, host_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::PayloadTooLarge);
    ASSERT_TRUE(result.error().snapshot.has_value());
    EXPECT_FALSE(result.error().snapshot->remote_url().has_value());
    EXPECT_EQ(result.error().snapshot->state(), UploadState::Unstarted);
}

TEST_F(ClientTest, CreateWithoutLocationIsMissingHeader) {
    auto file = make_file("data.bin", "abc");

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201));
    Client client(transport);

    auto result = client.create(file, host_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::MissingHeader);
    EXPECT_EQ(result.error().error.header.value_or(""), "Location");
    ASSERT_TRUE(result.error().snapshot.has_value());
    EXPECT_FALSE(result.error().snapshot->remote_url().has_value());
}

TEST_F(ClientTest, ValidationErrorsHaveNoSnapshotAndSendNothing) {
    FakeTransport transport;
    Client client(transport);

    auto directory = client.create(root_, host_);
    ASSERT_TRUE(directory.is_error());
    EXPECT_EQ(directory.error().error.kind, ErrorKind::FileRead);
    EXPECT_FALSE(directory.error().snapshot.has_value());

    auto missing = client.upload(root_ / "missing.bin", host_);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().error.kind, ErrorKind::FileRead);
    EXPECT_FALSE(missing.error().snapshot.has_value());

    EXPECT_EQ(transport.request_count(), 0u);
}

TEST_F(ClientTest, ConflictKeepsLastConfirmedOffset) {
    auto file = make_file("data.bin", tus::testing::make_payload(128));

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    transport.enqueue(FakeTransport::response(204, offset_header(64)));
    transport.enqueue(FakeTransport::response(409));
    Client client(transport, small_chunks(64));

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::OffsetConflict);
    ASSERT_TRUE(result.error().snapshot.has_value());
    EXPECT_EQ(result.error().snapshot->status().bytes_uploaded, 64u);
    EXPECT_EQ(result.error().snapshot->error_count(), 1u);
    EXPECT_EQ(result.error().snapshot->remote_url()->to_string(), kRemote);
}

TEST_F(ClientTest, ResumeAfterResynchronisingOffset) {
    const std::string payload = tus::testing::make_payload(128);
    auto file = make_file("data.bin", payload);

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    Client client(transport, small_chunks(64));
    auto created = client.create(file, host_);
    ASSERT_TRUE(created.is_ok());

    // The server already holds 96 bytes from an earlier attempt
    transport.enqueue(FakeTransport::response(200, offset_header(96)));
    auto synced = client.get_offset(created.value());
    ASSERT_TRUE(synced.is_ok());
    EXPECT_EQ(synced.value().status().bytes_uploaded, 96u);

    transport.set_responder(accept_all);
    auto resumed = client.resume(synced.value());
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_TRUE(resumed.value().upload_complete());

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[2].get_header("Upload-Offset"), "96");
    EXPECT_EQ(requests[2].body.size(), 32u);
}

TEST_F(ClientTest, GetOffsetIsIdempotent) {
    auto file = make_file("data.bin", tus::testing::make_payload(50));

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    transport.set_responder([](const network::HttpRequest&) {
        return Ok(FakeTransport::response(200, offset_header(20)));
    });
    Client client(transport);

    auto created = client.create(file, host_).value();
    auto first = client.get_offset(created);
    auto second = client.get_offset(first.value());
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().status().bytes_uploaded, 20u);
    EXPECT_TRUE(first.value().status() == second.value().status());
    EXPECT_EQ(created.status().bytes_uploaded, 0u);
}

TEST_F(ClientTest, DecreasingOffsetIsProtocolViolation) {
    auto file = make_file("data.bin", tus::testing::make_payload(128));

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    transport.enqueue(FakeTransport::response(204, offset_header(64)));
    transport.enqueue(FakeTransport::response(204, offset_header(32)));
    Client client(transport, small_chunks(64));

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::ProtocolViolation);
    EXPECT_EQ(result.error().snapshot->status().bytes_uploaded, 64u);
}

TEST_F(ClientTest, NoProgressStopsTheLoop) {
    auto file = make_file("data.bin", tus::testing::make_payload(10));

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    transport.set_responder([](const network::HttpRequest&) {
        return Ok(FakeTransport::response(204, offset_header(0)));
    });
    Client client(transport);

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::ProtocolViolation);
    EXPECT_EQ(transport.request_count(), 2u);
}

TEST_F(ClientTest, OffsetBeyondBytesSentIsProtocolViolation) {
    auto file = make_file("data.bin", tus::testing::make_payload(128));

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    transport.enqueue(FakeTransport::response(204, offset_header(100)));
    Client client(transport, small_chunks(64));

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::ProtocolViolation);
    EXPECT_EQ(result.error().snapshot->status().bytes_uploaded, 0u);
}

TEST_F(ClientTest, TruncatedFileIsFileRead) {
    auto file = make_file("data.bin", tus::testing::make_payload(128));

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    Client client(transport, small_chunks(64));
    auto created = client.create(file, host_);
    ASSERT_TRUE(created.is_ok());

    transport.enqueue(FakeTransport::response(200, offset_header(100)));
    auto synced = client.get_offset(created.value());
    ASSERT_TRUE(synced.is_ok());

    tus::testing::write_file(file, tus::testing::make_payload(50));
    auto result = client.resume(synced.value());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::FileRead);
    EXPECT_EQ(result.error().snapshot->status().bytes_uploaded, 100u);
    EXPECT_EQ(transport.request_count(), 2u);
}

TEST_F(ClientTest, ResumeNeedsRemoteUrl) {
    auto meta = UploadMeta::from_file(make_file("data.bin", "abc"), host_).value();

    FakeTransport transport;
    Client client(transport);
    auto result = client.resume(meta);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::MissingUploadUrl);
    EXPECT_EQ(transport.request_count(), 0u);
}

TEST_F(ClientTest, CompletedUploadResumesWithoutRequests) {
    auto file = make_file("empty.bin", "");

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    Client client(transport);

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state(), UploadState::Complete);
    EXPECT_EQ(transport.request_count(), 1u);
}

TEST_F(ClientTest, TransportFailureMidUploadReturnsSnapshot) {
    auto file = make_file("data.bin", tus::testing::make_payload(128));

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(201, {{"Location", kRemote}}));
    transport.enqueue(FakeTransport::response(204, offset_header(64)));
    transport.enqueue_error(Error::transport("connection reset"));
    Client client(transport, small_chunks(64));

    auto result = client.upload(file, host_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().error.kind, ErrorKind::Transport);
    EXPECT_EQ(result.error().snapshot->status().bytes_uploaded, 64u);

    // The snapshot survives persistence and can be resumed
    auto restored = UploadMeta::from_json(result.error().snapshot->to_json());
    ASSERT_TRUE(restored.is_ok());
    transport.set_responder(accept_all);
    auto resumed = client.resume(restored.value());
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_TRUE(resumed.value().upload_complete());
}

TEST_F(ClientTest, TerminateSwallowsErrors) {
    auto meta = UploadMeta::from_file(make_file("data.bin", "abc"), host_)
                    .value()
                    .with_remote_url(network::Url::parse(kRemote).value())
                    .value();

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(404));
    transport.enqueue_error(Error::transport("connection refused"));
    Client client(transport);

    client.terminate(meta);
    client.terminate(meta);
    EXPECT_EQ(transport.request_count(), 2u);
    EXPECT_EQ(transport.requests()[0].method, network::HttpMethod::DELETE_METHOD);
}

TEST_F(ClientTest, TryTerminateReportsOutcome) {
    auto meta = UploadMeta::from_file(make_file("data.bin", "abc"), host_)
                    .value()
                    .with_remote_url(network::Url::parse(kRemote).value())
                    .value();

    FakeTransport transport;
    transport.enqueue(FakeTransport::response(204));
    transport.enqueue(FakeTransport::response(404));
    Client client(transport);

    EXPECT_TRUE(client.try_terminate(meta).is_ok());
    auto second = client.try_terminate(meta);
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().kind, ErrorKind::NotFound);
}

TEST_F(ClientTest, DefaultAndCustomHeadersReachEveryRequest) {
    auto file = make_file("data.bin", "abc");

    ClientOptions options;
    options.default_headers = {{"Authorization", "Bearer default"}, {"X-Client", "tus-cpp"}};
    FakeTransport transport;
    transport.set_responder(accept_all);
    Client client(transport, options);

    auto result = client.upload(file, host_, {}, network::HeaderMap{{"Authorization", "Bearer mine"}});
    ASSERT_TRUE(result.is_ok());
    for (const auto& request : transport.requests()) {
        EXPECT_EQ(request.get_header("Authorization"), "Bearer mine");
        EXPECT_EQ(request.get_header("X-Client"), "tus-cpp");
        EXPECT_EQ(request.get_header("Tus-Resumable"), "1.0.0");
    }
}

TEST_F(ClientTest, ServerInfoFromOptions) {
    FakeTransport transport;
    transport.enqueue(FakeTransport::response(204, {{"Tus-Resumable", "1.0.0"},
                                                    {"Tus-Extension", "creation,termination"},
                                                    {"Tus-Max-Size", "1024"}}));
    transport.enqueue(FakeTransport::response(405));
    Client client(transport);

    auto info = client.get_server_info(host_);
    ASSERT_TRUE(info.is_ok());
    EXPECT_TRUE(info.value().supports(protocol::Extension::Termination));
    EXPECT_EQ(info.value().max_size.value_or(0), 1024u);
    EXPECT_EQ(transport.requests()[0].method, network::HttpMethod::OPTIONS);

    auto rejected = client.get_server_info(host_);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind, ErrorKind::UnexpectedStatus);
}
