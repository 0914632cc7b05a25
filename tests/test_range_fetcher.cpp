#include <gtest/gtest.h>
#include "resumable/range_fetcher.hpp"
#include "scripted_server.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace resumable;
using resumable::testing::ScriptedResource;
using resumable::testing::ScriptedServer;
using resumable::testing::makeBody;

namespace {

const std::string kUrl = "https://mirror.example.com/pool/image.iso";

class MemorySink final : public ByteSink {
public:
    void write(const char* data, std::size_t size) override {
        if (fail_writes) {
            throw TransferError(ErrorKind::Storage, "No space left on device");
        }
        bytes.append(data, size);
    }
    void flush() override { ++flushes; }
    void discard() override { bytes.clear(); }
    [[nodiscard]] std::uint64_t size() const override { return bytes.size(); }

    std::string bytes;
    bool fail_writes{false};
    int flushes{0};
};

class RecordingListener final : public FetchListener {
public:
    bool onResponse(const ResourceInfo& resource) override {
        seen = resource;
        return accept;
    }
    void onChunk(std::uint64_t bytes_completed) override {
        chunks.push_back(bytes_completed);
        if (cancel_at && bytes_completed >= cancel_at) {
            stop = true;
        }
    }
    [[nodiscard]] bool cancelled() const override { return stop; }

    bool accept{true};
    std::uint64_t cancel_at{0};
    bool stop{false};
    std::optional<ResourceInfo> seen;
    std::vector<std::uint64_t> chunks;
};

// Reports cancellation once it has been polled `polls` times.
class StopAfterPolls final : public FetchListener {
public:
    explicit StopAfterPolls(int polls) : remaining_(polls) {}

    bool onResponse([[maybe_unused]] const ResourceInfo& resource) override { return true; }
    void onChunk([[maybe_unused]] std::uint64_t bytes_completed) override {}
    [[nodiscard]] bool cancelled() const override { return --remaining_ < 0; }

private:
    mutable int remaining_;
};

} // namespace

class RangeFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<ScriptedServer>(4096);
        body = makeBody(100000);
        server->setResource(kUrl, ScriptedResource{body, "\"abc\""});
        fetcher = std::make_unique<RangeFetcher>(server);
    }

    std::shared_ptr<ScriptedServer> server;
    std::unique_ptr<RangeFetcher> fetcher;
    std::string body;
    MemorySink sink;
    RecordingListener listener;
};

TEST_F(RangeFetcherTest, FullDownloadSendsNoRange) {
    const auto outcome = fetcher->fetch(kUrl, {}, 0, sink, listener);

    EXPECT_EQ(outcome.kind, FetchOutcome::Kind::Completed);
    EXPECT_EQ(outcome.bytes_completed, body.size());
    EXPECT_EQ(sink.bytes, body);
    EXPECT_EQ(outcome.resource.total_size.value_or(0), body.size());
    EXPECT_EQ(outcome.resource.validator.value_or(""), "\"abc\"");

    const auto gets = server->gets(kUrl);
    ASSERT_EQ(gets.size(), 1u);
    EXPECT_FALSE(gets[0].range_start.has_value());
}

TEST_F(RangeFetcherTest, PartialContentContinuesFromOffset) {
    const auto outcome = fetcher->fetch(kUrl, {}, 30000, sink, listener);

    ASSERT_EQ(outcome.kind, FetchOutcome::Kind::Completed);
    EXPECT_EQ(sink.bytes, body.substr(30000));
    EXPECT_EQ(outcome.bytes_completed, body.size());
    ASSERT_TRUE(listener.seen.has_value());
    EXPECT_EQ(listener.seen->http_status, 206);
    EXPECT_EQ(listener.seen->total_size.value_or(0), body.size());

    ASSERT_FALSE(listener.chunks.empty());
    EXPECT_EQ(listener.chunks.front(), 30000u + 4096u);
    EXPECT_EQ(listener.chunks.back(), body.size());
    EXPECT_EQ(server->gets(kUrl).at(0).range_start.value_or(0), 30000u);
}

TEST_F(RangeFetcherTest, FullResponseToRangedRequestIsRejectedBeforeWriting) {
    ScriptedResource resource{body, "\"abc\""};
    resource.honor_ranges = false;
    server->setResource(kUrl, resource);

    const auto outcome = fetcher->fetch(kUrl, {}, 30000, sink, listener);

    EXPECT_EQ(outcome.kind, FetchOutcome::Kind::ResumeRejected);
    ASSERT_TRUE(outcome.cause.has_value());
    EXPECT_EQ(outcome.cause->kind, ErrorKind::ResumeRejected);
    EXPECT_TRUE(sink.bytes.empty());
    EXPECT_FALSE(listener.seen.has_value());
}

TEST_F(RangeFetcherTest, UnsatisfiableRangeIsRejected) {
    const auto outcome = fetcher->fetch(kUrl, {}, body.size(), sink, listener);
    EXPECT_EQ(outcome.kind, FetchOutcome::Kind::ResumeRejected);
    EXPECT_EQ(outcome.resource.http_status, 416);
}

TEST_F(RangeFetcherTest, HttpErrorIsServerFailure) {
    const auto outcome = fetcher->fetch("https://mirror.example.com/missing", {}, 0, sink, listener);

    ASSERT_EQ(outcome.kind, FetchOutcome::Kind::Failed);
    EXPECT_EQ(outcome.cause->kind, ErrorKind::Server);
    EXPECT_EQ(outcome.cause->http_status, 404);
    EXPECT_FALSE(outcome.cause->retryable);
}

TEST_F(RangeFetcherTest, DroppedConnectionIsRetryableNetworkFailure) {
    server->dropConnections(kUrl, 1, 8192);
    const auto outcome = fetcher->fetch(kUrl, {}, 0, sink, listener);

    ASSERT_EQ(outcome.kind, FetchOutcome::Kind::Failed);
    EXPECT_EQ(outcome.cause->kind, ErrorKind::Network);
    EXPECT_TRUE(outcome.cause->retryable);
    EXPECT_EQ(outcome.bytes_completed, 8192u);
    EXPECT_EQ(sink.bytes, body.substr(0, 8192));
}

TEST_F(RangeFetcherTest, ShortBodyIsSizeMismatch) {
    ScriptedResource resource{body, "\"abc\""};
    resource.declared_length = body.size() + 10;
    server->setResource(kUrl, resource);

    const auto outcome = fetcher->fetch(kUrl, {}, 0, sink, listener);
    ASSERT_EQ(outcome.kind, FetchOutcome::Kind::Failed);
    EXPECT_EQ(outcome.cause->kind, ErrorKind::SizeMismatch);
}

TEST_F(RangeFetcherTest, BodyLongerThanDeclaredIsCutOff) {
    ScriptedResource resource{body, "\"abc\""};
    resource.declared_length = 1000;
    server->setResource(kUrl, resource);

    const auto outcome = fetcher->fetch(kUrl, {}, 0, sink, listener);
    ASSERT_EQ(outcome.kind, FetchOutcome::Kind::Failed);
    EXPECT_EQ(outcome.cause->kind, ErrorKind::SizeMismatch);
    EXPECT_TRUE(sink.bytes.empty());
}

TEST_F(RangeFetcherTest, ListenerVetoIsValidatorMismatch) {
    listener.accept = false;
    const auto outcome = fetcher->fetch(kUrl, {}, 30000, sink, listener);

    ASSERT_EQ(outcome.kind, FetchOutcome::Kind::Failed);
    EXPECT_EQ(outcome.cause->kind, ErrorKind::ValidatorMismatch);
    EXPECT_TRUE(sink.bytes.empty());
}

TEST_F(RangeFetcherTest, SinkFailureIsStorageFailure) {
    sink.fail_writes = true;
    const auto outcome = fetcher->fetch(kUrl, {}, 0, sink, listener);

    ASSERT_EQ(outcome.kind, FetchOutcome::Kind::Failed);
    EXPECT_EQ(outcome.cause->kind, ErrorKind::Storage);
    EXPECT_FALSE(outcome.cause->retryable);
}

TEST_F(RangeFetcherTest, CancellationStopsBetweenChunks) {
    listener.cancel_at = 40000;
    const auto outcome = fetcher->fetch(kUrl, {}, 0, sink, listener);

    EXPECT_EQ(outcome.kind, FetchOutcome::Kind::Cancelled);
    EXPECT_EQ(outcome.bytes_completed % 4096, 0u);
    EXPECT_GE(outcome.bytes_completed, 40000u);
    EXPECT_LT(outcome.bytes_completed, body.size());
    EXPECT_EQ(sink.bytes, body.substr(0, outcome.bytes_completed));
}

TEST_F(RangeFetcherTest, ForwardsRequestHeaders) {
    const Headers headers{{"Authorization", "Bearer token"}};
    ASSERT_EQ(fetcher->fetch(kUrl, headers, 0, sink, listener).kind, FetchOutcome::Kind::Completed);
    EXPECT_EQ(detail::findHeader(server->gets(kUrl).at(0).headers, "Authorization").value_or(""), "Bearer token");
}

TEST_F(RangeFetcherTest, ProbeReportsSizeAndValidator) {
    const auto probe = fetcher->probe(kUrl, {});
    ASSERT_TRUE(probe.ok());
    EXPECT_EQ(probe.resource->total_size.value_or(0), body.size());
    EXPECT_EQ(probe.resource->validator.value_or(""), "\"abc\"");
    EXPECT_TRUE(probe.resource->accepts_ranges);
    EXPECT_TRUE(server->gets(kUrl).empty());
}

TEST_F(RangeFetcherTest, ProbeToleratesMissingHeadSupport) {
    ScriptedResource resource{body, "\"abc\""};
    resource.head_allowed = false;
    server->setResource(kUrl, resource);

    const auto probe = fetcher->probe(kUrl, {});
    ASSERT_TRUE(probe.ok());
    EXPECT_FALSE(probe.resource->total_size.has_value());
    EXPECT_FALSE(probe.resource->validator.has_value());
}

TEST_F(RangeFetcherTest, ProbeOfMissingResourceFails) {
    const auto probe = fetcher->probe("https://mirror.example.com/missing", {});
    ASSERT_FALSE(probe.ok());
    EXPECT_EQ(probe.cause->kind, ErrorKind::Server);
    EXPECT_EQ(probe.cause->http_status, 404);
}

TEST_F(RangeFetcherTest, MetadataRequestStopsWhenCancelled) {
    server->setHeadStall(std::chrono::seconds{30});
    StopAfterPolls stopper(20);

    const auto started = std::chrono::steady_clock::now();
    const auto meta = fetcher->probe(kUrl, {}, &stopper);

    EXPECT_TRUE(meta.cancelled);
    EXPECT_FALSE(meta.ok());
    EXPECT_FALSE(meta.cause.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{10});
    EXPECT_EQ(server->requestCount(), 1u);
}

TEST_F(RangeFetcherTest, MetadataRequestIsSkippedWhenAlreadyCancelled) {
    listener.stop = true;
    const auto meta = fetcher->probe(kUrl, {}, &listener);

    EXPECT_TRUE(meta.cancelled);
    EXPECT_EQ(server->requestCount(), 0u);
}

TEST_F(RangeFetcherTest, ReportsAnnouncedFileName) {
    ScriptedResource resource{body, "\"abc\""};
    resource.final_url = "https://edge.example.com/blobs/ubuntu.iso?expires=60";
    server->setResource(kUrl, resource);
    auto meta = fetcher->probe(kUrl, {});
    ASSERT_TRUE(meta.ok());
    EXPECT_EQ(meta.resource->file_name.value_or(""), "ubuntu.iso");

    resource.disposition = "attachment; filename=\"ubuntu-24.04.iso\"";
    server->setResource(kUrl, resource);
    meta = fetcher->probe(kUrl, {});
    ASSERT_TRUE(meta.ok());
    EXPECT_EQ(meta.resource->file_name.value_or(""), "ubuntu-24.04.iso");

    const auto outcome = fetcher->fetch(kUrl, {}, 0, sink, listener);
    ASSERT_EQ(outcome.kind, FetchOutcome::Kind::Completed);
    ASSERT_TRUE(listener.seen.has_value());
    EXPECT_EQ(listener.seen->file_name.value_or(""), "ubuntu-24.04.iso");
}

TEST_F(RangeFetcherTest, ResponseHeadLookupIgnoresCase) {
    ResponseHead head;
    head.headers = {{"content-length", "10"}, {"ETag", "\"x\""}, {"etag", "\"y\""}};

    EXPECT_EQ(head.header("Content-Length").value_or(""), "10");
    EXPECT_EQ(head.header("ETAG").value_or(""), "\"y\"");
    EXPECT_FALSE(head.header("Content-Range").has_value());
}
