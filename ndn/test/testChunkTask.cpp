#include "gtest/gtest.h"
#include "MockRawCache.hpp"
#include "MockTunnel.hpp"
#include "chunkflow/asyncio/core/EventLoop.hpp"
#include "chunkflow/ndn/download/ChunkTask.hpp"

#include <functional>

using namespace chunkflow::core;
using namespace chunkflow::asyncio;
using namespace chunkflow::ndn;

static std::shared_ptr<DownloadContext> context_of(std::vector<PeerDesc> peers) {
	return std::make_shared<SingleDownloadContext>(std::move(peers));
}

TEST(ChunkTaskTest, StartsDownloading) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(4096);

	auto task = ChunkTask::create(b.chunks, content.chunk, context_of({}));

	ASSERT_TRUE(task.ok());
	auto state = (*task)->state();
	EXPECT_EQ(state.type, DownloadTaskState::Type::Downloading);
	EXPECT_EQ(state.progress, 0);
	EXPECT_EQ((*task)->control_state(), DownloadTaskControlState::Normal);
	EXPECT_EQ(b.chunks.cache_of(content.chunk)->downloader()->context_count(), 1);
}

TEST(ChunkTaskTest, StoredChunkFinishes) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(4096);
	ASSERT_TRUE(b.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	auto task = ChunkTask::create(b.chunks, content.chunk, context_of({}));
	ASSERT_TRUE(task.ok());
	auto downloader = b.chunks.cache_of(content.chunk)->downloader();
	EXPECT_EQ(downloader->context_count(), 1);

	auto state = (*task)->state();

	EXPECT_EQ(state.type, DownloadTaskState::Type::Finished);
	EXPECT_EQ(state.progress, 1);
	EXPECT_EQ(downloader->context_count(), 0);
	EXPECT_EQ((*task)->state().type, DownloadTaskState::Type::Finished);
}

TEST(ChunkTaskTest, CancelIsIdempotent) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(4096);
	auto task = *ChunkTask::create(b.chunks, content.chunk, context_of({}));
	auto downloader = b.chunks.cache_of(content.chunk)->downloader();

	EXPECT_EQ(task->cancel(), DownloadTaskControlState::Canceled);
	EXPECT_EQ(task->cancel(), DownloadTaskControlState::Canceled);

	auto state = task->state();
	EXPECT_EQ(state.type, DownloadTaskState::Type::Error);
	EXPECT_EQ(error_code(state.error), ErrorCode::UserCanceled);
	EXPECT_EQ(task->control_state(), DownloadTaskControlState::Canceled);
	EXPECT_EQ(downloader->context_count(), 0);
}

TEST(ChunkTaskTest, CancelWakesWaitersOnce) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(4096);
	auto task = *ChunkTask::create(b.chunks, content.chunk, context_of({}));
	int first = 0;
	int second = 0;
	task->wait_user_canceled([&](absl::Status status) {
		EXPECT_EQ(error_code(status), ErrorCode::UserCanceled);
		first++;
	});
	task->wait_user_canceled([&](absl::Status) {
		second++;
	});

	task->cancel();
	task->cancel();

	EXPECT_EQ(first, 1);
	EXPECT_EQ(second, 1);

	int late = 0;
	task->wait_user_canceled([&](absl::Status status) {
		EXPECT_EQ(error_code(status), ErrorCode::UserCanceled);
		late++;
	});
	EXPECT_EQ(late, 1);
}

TEST(ChunkTaskTest, SpeedIsZeroAfterCancel) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(4096);
	auto task = *ChunkTask::create(b.chunks, content.chunk, context_of({}));

	task->cancel();

	EXPECT_EQ(task->calc_speed(1000), 0);
	EXPECT_EQ(task->cur_speed(), 0);
	EXPECT_EQ(task->history_speed(), 0);
	EXPECT_EQ(task->drain_score(), 0);
	EXPECT_EQ(task->on_drain(100), 0);
}

TEST(ChunkTaskTest, CancelStopsDownloadSession) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(4096);
	auto task = *ChunkTask::create(b.chunks, content.chunk, context_of({a.desc()}));
	auto downloader = b.chunks.cache_of(content.chunk)->downloader();
	b.chunks.on_schedule(0);
	ASSERT_TRUE(downloader->has_session());

	task->cancel();
	b.chunks.on_schedule(1000);

	EXPECT_FALSE(downloader->has_session());
	EXPECT_EQ(b.tunnel.sent_count(CommandCode::PieceControl), 1);
	EXPECT_EQ(b.channels.channel_of(a.id)->download_session_count(), 0);
}

TEST(ChunkTaskTest, CanceledCacheIsReleased) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(4096);
	auto task = *ChunkTask::create(b.chunks, content.chunk, context_of({}));
	std::weak_ptr<ChunkStreamCache> stream = b.chunks.cache_of(content.chunk)->stream();

	b.chunks.on_schedule(0);
	ASSERT_NE(b.chunks.cache_of(content.chunk), nullptr);
	task->cancel();
	b.chunks.on_schedule(1000);

	EXPECT_EQ(b.chunks.cache_of(content.chunk), nullptr);
	EXPECT_EQ(b.chunks.cache_count(), 0);
	EXPECT_EQ(stream.use_count(), 0);
}

TEST(ChunkTaskTest, StoredCacheOutlivesTask) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(4096);
	ASSERT_TRUE(b.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	auto task = *ChunkTask::create(b.chunks, content.chunk, context_of({}));

	task->cancel();
	b.chunks.on_schedule(0);

	ASSERT_NE(b.chunks.cache_of(content.chunk), nullptr);
	EXPECT_TRUE(b.chunks.cache_of(content.chunk)->stream()->finished());
}

TEST(ChunkTaskTest, DroppedTaskLeavesDownloader) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(4096);
	auto task = *ChunkTask::create(b.chunks, content.chunk, context_of({a.desc()}));
	auto downloader = b.chunks.cache_of(content.chunk)->downloader();
	b.chunks.on_schedule(0);
	ASSERT_TRUE(downloader->has_session());

	task.reset();
	EXPECT_EQ(downloader->context_count(), 0);
	b.chunks.on_schedule(1000);

	EXPECT_FALSE(downloader->has_session());
	EXPECT_EQ(b.tunnel.sent_count(CommandCode::PieceControl), 1);
	EXPECT_EQ(b.chunks.cache_of(content.chunk), nullptr);
}

TEST(ChunkTaskTest, CalcSpeedKeepsDownloaderSample) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(8192);
	ASSERT_TRUE(a.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	auto task = *ChunkTask::create(b.chunks, content.chunk, context_of({a.desc()}));
	auto downloader = b.chunks.cache_of(content.chunk)->downloader();
	b.chunks.on_schedule(0);
	network.pump();
	a.channels.on_time_escape(0);
	network.pump();
	b.chunks.on_schedule(1000);
	ASSERT_EQ(downloader->cur_speed(), 8192);
	auto history = downloader->history_speed();

	EXPECT_EQ(task->calc_speed(1500), 8192);
	EXPECT_EQ(task->calc_speed(2000), 8192);

	EXPECT_EQ(downloader->cur_speed(), 8192);
	EXPECT_EQ(downloader->history_speed(), history);
}

//---------------- Reader ----------------//

TEST(ChunkTaskReaderTest, DestroyingReaderCancelsTask) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(4096);
	auto res = ChunkTask::reader(b.chunks, content.chunk, context_of({}));
	ASSERT_TRUE(res.ok());
	auto task = res->first;

	res->second.reset();

	EXPECT_EQ(task->control_state(), DownloadTaskControlState::Canceled);
	EXPECT_EQ(b.chunks.cache_of(content.chunk)->downloader()->context_count(), 0);
}

TEST(ChunkTaskReaderTest, ReadsWholeChunk) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(3000);
	ASSERT_TRUE(b.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	auto res = ChunkTask::reader(b.chunks, content.chunk, context_of({}));
	ASSERT_TRUE(res.ok());
	auto& reader = res->second;

	std::vector<uint8_t> out;
	uint8_t buf[700];
	bool done = false;
	std::function<void()> next = [&]() {
		reader->async_read(buf, sizeof(buf), 1000, [&](absl::StatusOr<size_t> n) {
			ASSERT_TRUE(n.ok());
			if(*n == 0) {
				done = true;
				return;
			}
			out.insert(out.end(), buf, buf + *n);
			next();
		});
	};
	next();
	EventLoop::run();

	EXPECT_TRUE(done);
	EXPECT_EQ(out, content.bytes);
	EXPECT_EQ(reader->tell(), 3000);
}

TEST(ChunkTaskReaderTest, ReadAfterCancelFails) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(3000);
	auto res = ChunkTask::reader(b.chunks, content.chunk, context_of({}));
	ASSERT_TRUE(res.ok());
	res->first->cancel();
	uint8_t buf[16];
	std::optional<absl::StatusOr<size_t>> result;

	res->second->async_read(buf, sizeof(buf), 1000, [&](absl::StatusOr<size_t> n) {
		result = std::move(n);
	});

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(error_code(*result), ErrorCode::UserCanceled);
}

TEST(ChunkTaskReaderTest, CancelFailsWaitingRead) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(3000);
	auto res = ChunkTask::reader(b.chunks, content.chunk, context_of({}));
	ASSERT_TRUE(res.ok());
	uint8_t buf[16];
	int calls = 0;
	std::optional<absl::StatusOr<size_t>> result;
	res->second->async_read(buf, sizeof(buf), 20, [&](absl::StatusOr<size_t> n) {
		calls++;
		result = std::move(n);
	});
	EXPECT_FALSE(result.has_value());

	res->first->cancel();

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(error_code(*result), ErrorCode::UserCanceled);

	// The timeout still fires, the callback stays called once
	EventLoop::run();
	EXPECT_EQ(calls, 1);
}

TEST(ChunkTaskReaderTest, ReadTimesOut) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(3000);
	auto res = ChunkTask::reader(b.chunks, content.chunk, context_of({}));
	ASSERT_TRUE(res.ok());
	uint8_t buf[16];
	std::optional<absl::StatusOr<size_t>> result;

	res->second->async_read(buf, sizeof(buf), 20, [&](absl::StatusOr<size_t> n) {
		result = std::move(n);
	});
	EventLoop::run();

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(error_code(*result), ErrorCode::NotFound);
	EXPECT_EQ(res->second->tell(), 0);
}

TEST(ChunkTaskReaderTest, SeekWithinChunk) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(3000);
	ASSERT_TRUE(b.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	auto res = ChunkTask::reader(b.chunks, content.chunk, context_of({}));
	ASSERT_TRUE(res.ok());
	auto& reader = res->second;

	EXPECT_EQ(error_code(reader->seek(3001)), ErrorCode::InvalidInput);
	ASSERT_TRUE(reader->seek(2990).ok());

	uint8_t buf[64];
	std::optional<absl::StatusOr<size_t>> result;
	reader->async_read(buf, sizeof(buf), 1000, [&](absl::StatusOr<size_t> n) {
		result = std::move(n);
	});
	EventLoop::run();

	ASSERT_TRUE(result.has_value());
	ASSERT_TRUE(result->ok());
	EXPECT_EQ(**result, 10);
	EXPECT_EQ(std::vector<uint8_t>(buf, buf + 10), std::vector<uint8_t>(content.bytes.begin() + 2990, content.bytes.end()));
}
