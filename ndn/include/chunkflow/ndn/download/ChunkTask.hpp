/*! \file ChunkTask.hpp
*/

#ifndef CHUNKFLOW_NDN_CHUNKTASK_HPP
#define CHUNKFLOW_NDN_CHUNKTASK_HPP

#include <chunkflow/ndn/chunk/ChunkManager.hpp>
#include <chunkflow/ndn/download/DownloadContext.hpp>
#include <chunkflow/ndn/download/DownloadTask.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chunkflow {
namespace ndn {

class ChunkTaskReader;

//! Download of a single chunk
/*!
	Registers its context with the downloader of the chunk cache for as long as it
	is downloading and alive. Cancel moves it to Error(UserCanceled) for good.
*/
class ChunkTask : public DownloadTask, public std::enable_shared_from_this<ChunkTask> {
private:
	struct Downloading {
		DownloadContextSet::ContextId context_id;
		std::shared_ptr<ChunkCache> cache;
	};
	struct Failed {
		absl::Status error;
	};
	struct Finished {
		std::shared_ptr<ChunkCache> cache;
	};
	using TaskState = std::variant<Downloading, Failed, Finished>;

	ChunkId chunk_id;
	std::shared_ptr<DownloadContext> context;

	mutable std::mutex lock;
	mutable TaskState task_state;
	/// Set while the control state is Normal
	std::optional<StateWaiter> waiters;

	ChunkTask(ChunkId const& chunk, std::shared_ptr<DownloadContext> context, std::shared_ptr<ChunkCache> cache);

	/// Cache while downloading
	std::shared_ptr<ChunkCache> downloading_cache() const;

public:
	~ChunkTask();

	static absl::StatusOr<std::shared_ptr<ChunkTask>> create(
		ChunkManager& chunk_manager,
		ChunkId const& chunk,
		std::shared_ptr<DownloadContext> context
	);

	//! Task plus a reader over its chunk
	/*!
		Destroying the reader cancels the task.
	*/
	static absl::StatusOr<std::pair<std::shared_ptr<ChunkTask>, std::unique_ptr<ChunkTaskReader>>> reader(
		ChunkManager& chunk_manager,
		ChunkId const& chunk,
		std::shared_ptr<DownloadContext> context
	);

	ChunkId const& chunk() const {
		return chunk_id;
	}

	DownloadTaskState state() const override;
	DownloadTaskControlState control_state() const override;

	/// Last speed sampled by the downloader schedule, the sample is not retaken
	uint32_t calc_speed(uint64_t when) override;
	uint32_t cur_speed() const override;
	uint32_t history_speed() const override;
	int64_t drain_score() const override;
	uint32_t on_drain(uint32_t expect) override;

	DownloadTaskControlState cancel() override;
	void wait_user_canceled(CanceledCallback cb) override;

	std::string to_string() const {
		return "ChunkTask{chunk:" + chunk_id.to_string() + "}";
	}
};

//! Sequential reader over the chunk of a task
/*!
	Reads wait for the pieces they cover to be downloaded.
*/
class ChunkTaskReader {
public:
	using ReadCallback = std::function<void(absl::StatusOr<size_t>)>;

private:
	/// Callbacks of reads in flight, each taken exactly once
	struct PendingReads {
		std::mutex lock;
		uint64_t next_id = 0;
		std::map<uint64_t, ReadCallback> reads;

		uint64_t add(ReadCallback cb);
		ReadCallback take(uint64_t id);
		std::vector<ReadCallback> take_all();
	};

	std::shared_ptr<ChunkTask> task;
	std::shared_ptr<ChunkStreamCache> cache;
	std::shared_ptr<uint64_t> position;
	std::shared_ptr<PendingReads> pending;

public:
	ChunkTaskReader(std::shared_ptr<ChunkTask> task, std::shared_ptr<ChunkStreamCache> cache);
	~ChunkTaskReader();

	ChunkTaskReader(ChunkTaskReader const&) = delete;
	ChunkTaskReader& operator=(ChunkTaskReader const&) = delete;

	std::shared_ptr<ChunkTask> const& download_task() const {
		return task;
	}

	/// Move to pos from the start of the chunk
	absl::StatusOr<uint64_t> seek(uint64_t pos);
	uint64_t tell() const {
		return *position;
	}

	//! Read up to len bytes at the current position
	/*!
		cb receives the bytes read, 0 at the end of the chunk, NotFound if the piece
		does not arrive within timeout ms, UserCanceled once the task is canceled,
		also when the read is already waiting. out must stay valid until cb runs.
	*/
	void async_read(uint8_t* out, size_t len, std::optional<uint64_t> timeout, ReadCallback cb);
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_CHUNKTASK_HPP
