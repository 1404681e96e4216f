#include "mediagate/progress_stream.hpp"

#include "mediagate/bounded_executor.hpp"
#include "mediagate/errors.hpp"

#include "support/fake_engine.hpp"
#include "support/scratch_dir.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <random>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

using namespace mediagate;
using namespace std::chrono_literals;
using mediagate::testing::FakeEngine;
using mediagate::testing::FakeStep;

class ProgressStreamTest : public mediagate::testing::ScratchDirTest {
protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        options_.temp_root = root();
        options_.poll_interval = 20ms;
        options_.stream_timeout = 5000ms;
        options_.cancel_join_timeout = 500ms;
    }

    void TearDown() override {
        // Let any parked worker finish before the scratch dir goes away.
        engine_->release();
        std::this_thread::sleep_for(20ms);
        ScratchDirTest::TearDown();
    }

    std::unique_ptr<ProgressStream> open(DownloadRequest request = {"https://media.example/clip.mp4"}) {
        return std::make_unique<ProgressStream>(engine_, std::move(request), gate_->acquire(0ms), store_, options_,
                                                metrics_);
    }

    // Pulls until the stream reports the end; the cap only guards a broken
    // stream from hanging the suite.
    static std::vector<ProgressEvent> drain(ProgressStream& stream) {
        std::vector<ProgressEvent> events;
        for (int i = 0; i < 2000; ++i) {
            auto event = stream.next();
            if (!event) {
                break;
            }
            events.push_back(std::move(*event));
        }
        return events;
    }

    static std::size_t terminalCount(const std::vector<ProgressEvent>& events) {
        return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), isTerminal));
    }

    std::shared_ptr<FakeEngine> engine_ = std::make_shared<FakeEngine>();
    std::shared_ptr<AdmissionGate> gate_ = std::make_shared<AdmissionGate>(2);
    std::shared_ptr<CompletedDownloadStore> store_ = std::make_shared<CompletedDownloadStore>(StoreOptions{});
    std::shared_ptr<Metrics> metrics_ = std::make_shared<Metrics>(false);
    StreamOptions options_;
};

TEST_F(ProgressStreamTest, ReportsProgressThenCompletesLast) {
    engine_->steps = {{100, 1000, 0ms}, {500, 1000, 0ms}, {1000, 1000, 0ms}};
    engine_->postprocess = true;
    auto stream = open();

    const auto events = drain(*stream);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(terminalCount(events), 1u);
    ASSERT_TRUE(std::holds_alternative<CompleteEvent>(events.back()));

    std::vector<DownloadingEvent> downloading;
    std::vector<std::string> messages;
    for (const auto& event : events) {
        if (const auto* d = std::get_if<DownloadingEvent>(&event)) {
            downloading.push_back(*d);
        } else if (const auto* p = std::get_if<ProcessingEvent>(&event)) {
            messages.push_back(p->message);
        }
    }
    ASSERT_EQ(downloading.size(), 3u);
    EXPECT_DOUBLE_EQ(downloading[0].percent, 10.0);
    EXPECT_DOUBLE_EQ(downloading[2].percent, 100.0);
    EXPECT_EQ(downloading[1].total, 1000u);
    EXPECT_EQ(messages, (std::vector<std::string>{"Processing file...", "Converting..."}));

    const auto& complete = std::get<CompleteEvent>(events.back());
    EXPECT_EQ(complete.filename, "clip.mp4");
    EXPECT_EQ(complete.size, engine_->payload.size());

    EXPECT_FALSE(stream->next().has_value());
    EXPECT_FALSE(stream->holdsPermit());
    EXPECT_EQ(gate_->outstanding(), 0u);

    auto record = store_->take(complete.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->temp_dir, stream->workDir());
    EXPECT_EQ(record->content_type, "video/mp4");
    EXPECT_EQ(readFile(record->file_path), engine_->payload);
    EXPECT_EQ(metrics_->snapshot().successes, 1u);
}

TEST_F(ProgressStreamTest, FindsFileWhenEngineReportsNoPath) {
    engine_->report_path = false;
    engine_->output_name = "track.m4a";
    auto stream = open();

    const auto events = drain(*stream);
    ASSERT_TRUE(std::holds_alternative<CompleteEvent>(events.back()));
    EXPECT_EQ(std::get<CompleteEvent>(events.back()).filename, "track.m4a");
}

TEST_F(ProgressStreamTest, CloseBeforeFirstNextReleasesEverything) {
    auto stream = open();
    const auto dir = stream->workDir();
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_TRUE(stream->holdsPermit());
    EXPECT_EQ(gate_->outstanding(), 1u);

    stream->close();
    EXPECT_EQ(gate_->outstanding(), 0u);
    EXPECT_FALSE(std::filesystem::exists(dir));
    EXPECT_EQ(engine_->started.load(), 0);
    EXPECT_FALSE(stream->next().has_value());

    stream->close();
    EXPECT_EQ(gate_->outstanding(), 0u);
}

TEST_F(ProgressStreamTest, DestructionActsAsClose) {
    std::filesystem::path dir;
    {
        auto stream = open();
        dir = stream->workDir();
        EXPECT_EQ(gate_->outstanding(), 1u);
    }
    EXPECT_EQ(gate_->outstanding(), 0u);
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(ProgressStreamTest, StreamTimeoutEmitsOneTerminalEvent) {
    engine_->block = true;
    options_.stream_timeout = 100ms;
    auto stream = open();
    const auto dir = stream->workDir();

    const auto events = drain(*stream);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(terminalCount(events), 1u);
    ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events.back()));
    const auto& error = std::get<ErrorEvent>(events.back());
    EXPECT_EQ(error.kind, ErrorKind::Timeout);
    EXPECT_TRUE(error.retryable);

    EXPECT_FALSE(stream->next().has_value());
    EXPECT_EQ(gate_->outstanding(), 0u);
    EXPECT_FALSE(std::filesystem::exists(dir));
    EXPECT_EQ(metrics_->snapshot().timeouts, 1u);
}

TEST_F(ProgressStreamTest, ParkedStreamSendsHeartbeats) {
    engine_->block = true;
    auto stream = open();

    auto event = stream->next();
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(std::holds_alternative<WaitingEvent>(*event));
    EXPECT_FALSE(stream->finished());
}

TEST_F(ProgressStreamTest, CloseMidStreamCancelsTheWorker) {
    engine_->block = true;
    auto stream = open();
    const auto dir = stream->workDir();

    (void)stream->next();
    ASSERT_TRUE(engine_->waitStarted(1));

    stream->close();
    EXPECT_EQ(gate_->outstanding(), 0u);
    EXPECT_FALSE(std::filesystem::exists(dir));
    EXPECT_EQ(engine_->finished.load(), 0);
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_EQ(metrics_->snapshot().cancellations, 1u);
}

TEST_F(ProgressStreamTest, UncooperativeWorkerIsLeftBehindOnClose) {
    engine_->block = true;
    engine_->cooperative = false;
    options_.cancel_join_timeout = 50ms;
    auto stream = open();

    (void)stream->next();
    ASSERT_TRUE(engine_->waitStarted(1));

    const auto started = std::chrono::steady_clock::now();
    stream->close();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
    EXPECT_EQ(gate_->outstanding(), 0u);
    stream.reset();

    // The detached worker exits on its own once the engine returns, dropping
    // its share of the engine.
    engine_->release();
    EXPECT_TRUE(eventually([this] { return engine_.use_count() == 1; }));
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(ProgressStreamTest, TransientFailureIsRetryable) {
    engine_->failure = std::make_exception_ptr(NetworkError("connection reset by peer"));
    auto stream = open();
    const auto dir = stream->workDir();

    const auto events = drain(*stream);
    EXPECT_EQ(terminalCount(events), 1u);
    ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events.back()));
    const auto& error = std::get<ErrorEvent>(events.back());
    EXPECT_EQ(error.kind, ErrorKind::Transient);
    EXPECT_TRUE(error.retryable);
    EXPECT_EQ(error.message, "connection reset by peer");

    EXPECT_FALSE(std::filesystem::exists(dir));
    EXPECT_EQ(gate_->outstanding(), 0u);
    EXPECT_EQ(metrics_->snapshot().errors, 1u);
}

TEST_F(ProgressStreamTest, PermanentFailureIsNotRetryable) {
    engine_->failure = std::make_exception_ptr(ContentError("video unavailable"));
    auto stream = open();

    const auto events = drain(*stream);
    ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events.back()));
    EXPECT_EQ(std::get<ErrorEvent>(events.back()).kind, ErrorKind::Permanent);
    EXPECT_FALSE(std::get<ErrorEvent>(events.back()).retryable);
}

TEST_F(ProgressStreamTest, UnclassifiedFailureIsPermanent) {
    engine_->failure = std::make_exception_ptr(std::runtime_error("engine bug"));
    auto stream = open();

    const auto events = drain(*stream);
    ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events.back()));
    EXPECT_EQ(std::get<ErrorEvent>(events.back()).kind, ErrorKind::Permanent);
    EXPECT_EQ(std::get<ErrorEvent>(events.back()).message, "engine bug");
}

TEST_F(ProgressStreamTest, OversizedFileIsRejected) {
    options_.max_file_size = 4;
    auto stream = open();
    const auto dir = stream->workDir();

    const auto events = drain(*stream);
    ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events.back()));
    const auto& error = std::get<ErrorEvent>(events.back());
    EXPECT_EQ(error.kind, ErrorKind::Permanent);
    EXPECT_NE(error.message.find("exceeds"), std::string::npos);
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(ProgressStreamTest, MissingOutputIsAnError) {
    engine_->write_file = false;
    engine_->report_path = false;
    auto stream = open();

    const auto events = drain(*stream);
    ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events.back()));
    EXPECT_NE(std::get<ErrorEvent>(events.back()).message.find("not found"), std::string::npos);
}

TEST_F(ProgressStreamTest, WorkDirFailureReturnsThePermit) {
    const auto blocker = root() / "not_a_directory";
    writeFile(blocker, "x");
    options_.temp_root = blocker / "nested";

    EXPECT_THROW(open(), TempDirError);
    EXPECT_EQ(gate_->outstanding(), 0u);
}

// Streams and executor calls ended at seeded random points: before the first
// event, after a few events, at completion, by stream timeout, by engine
// failure, by executor timeout and by a throwing job. Afterwards no slot may
// be held and only directories owned by the store may remain.
TEST_F(ProgressStreamTest, PermitsAndDirectoriesBalanceUnderRandomisedAborts) {
    BoundedExecutor executor(gate_, 4, 50ms, metrics_);
    std::vector<std::shared_ptr<FakeEngine>> engines;
    std::mt19937 rng(20261019);
    std::uniform_int_distribution<int> outcome(0, 6);
    std::uniform_int_distribution<int> prefix(1, 3);

    for (int i = 0; i < 60; ++i) {
        auto engine = std::make_shared<FakeEngine>();
        engines.push_back(engine);
        StreamOptions options = options_;
        auto openWith = [&] {
            return std::make_unique<ProgressStream>(engine, DownloadRequest{"https://media.example/clip.mp4"},
                                                    gate_->acquire(0ms), store_, options, metrics_);
        };

        switch (outcome(rng)) {
        case 0: {
            auto stream = openWith();
            stream->close();
            break;
        }
        case 1: {
            engine->steps = {{1, 10, 2ms}, {5, 10, 2ms}, {10, 10, 2ms}};
            engine->block = true;
            auto stream = openWith();
            const int wanted = prefix(rng);
            for (int k = 0; k < wanted && stream->next(); ++k) {
            }
            stream->close();
            break;
        }
        case 2: {
            auto stream = openWith();
            const auto events = drain(*stream);
            ASSERT_FALSE(events.empty());
            EXPECT_TRUE(std::holds_alternative<CompleteEvent>(events.back()));
            break;
        }
        case 3: {
            engine->block = true;
            options.stream_timeout = 60ms;
            auto stream = openWith();
            const auto events = drain(*stream);
            ASSERT_FALSE(events.empty());
            ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events.back()));
            EXPECT_EQ(std::get<ErrorEvent>(events.back()).kind, ErrorKind::Timeout);
            break;
        }
        case 4: {
            engine->failure = std::make_exception_ptr(NetworkError("connection reset"));
            auto stream = openWith();
            const auto events = drain(*stream);
            ASSERT_FALSE(events.empty());
            EXPECT_TRUE(std::holds_alternative<ErrorEvent>(events.back()));
            break;
        }
        case 5:
            EXPECT_THROW(executor.runWithTimeout(
                             [] {
                                 std::this_thread::sleep_for(40ms);
                                 return 0;
                             },
                             5ms),
                         Timeout);
            break;
        default:
            EXPECT_THROW(executor.runWithTimeout([]() -> int { throw std::runtime_error("job failed"); }, 1s),
                         std::runtime_error);
            break;
        }
        EXPECT_EQ(gate_->outstanding(), 0u) << "iteration " << i;
    }

    for (auto& engine : engines) {
        engine->release();
    }
    EXPECT_TRUE(eventually([&executor] { return executor.inFlight() == 0; }));
    EXPECT_EQ(gate_->outstanding(), 0u);
    EXPECT_EQ(countPrefixed(), store_->size());
}
