#include "chunkflow/ndn/download/ChunkTask.hpp"

#include <chunkflow/core/Error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;

ChunkTask::ChunkTask(ChunkId const& chunk, std::shared_ptr<DownloadContext> context, std::shared_ptr<ChunkCache> cache) :
chunk_id(chunk),
context(std::move(context)),
task_state(Downloading{0, std::move(cache)}),
waiters(StateWaiter()) {
	auto& downloading = std::get<Downloading>(task_state);
	downloading.context_id = downloading.cache->downloader()->add_context(this->context);
}

ChunkTask::~ChunkTask() {
	if(auto* downloading = std::get_if<Downloading>(&task_state)) {
		SPDLOG_DEBUG("ChunkTask {{ Chunk: {} }}: Dropped while downloading", chunk_id.to_string());
		downloading->cache->downloader()->remove_context(downloading->context_id);
	}
}

absl::StatusOr<std::shared_ptr<ChunkTask>> ChunkTask::create(
	ChunkManager& chunk_manager,
	ChunkId const& chunk,
	std::shared_ptr<DownloadContext> context
) {
	auto cache = chunk_manager.create_cache(chunk);
	if(!cache.ok()) {
		return cache.status();
	}

	SPDLOG_DEBUG("ChunkTask {{ Chunk: {} }}: Created", chunk.to_string());
	return std::shared_ptr<ChunkTask>(new ChunkTask(chunk, std::move(context), std::move(*cache)));
}

absl::StatusOr<std::pair<std::shared_ptr<ChunkTask>, std::unique_ptr<ChunkTaskReader>>> ChunkTask::reader(
	ChunkManager& chunk_manager,
	ChunkId const& chunk,
	std::shared_ptr<DownloadContext> context
) {
	auto task = create(chunk_manager, chunk, std::move(context));
	if(!task.ok()) {
		return task.status();
	}

	auto stream = std::get<Downloading>((*task)->task_state).cache->stream();
	std::unique_ptr<ChunkTaskReader> reader(new ChunkTaskReader(*task, std::move(stream)));

	return std::make_pair(std::move(*task), std::move(reader));
}

std::shared_ptr<ChunkCache> ChunkTask::downloading_cache() const {
	std::lock_guard<std::mutex> guard(lock);
	if(auto* downloading = std::get_if<Downloading>(&task_state)) {
		return downloading->cache;
	}
	return nullptr;
}

//---------------- State begin ----------------//

DownloadTaskState ChunkTask::state() const {
	std::shared_ptr<ChunkCache> cache;
	std::optional<DownloadContextSet::ContextId> context_id;
	{
		std::lock_guard<std::mutex> guard(lock);
		if(auto* failed = std::get_if<Failed>(&task_state)) {
			return DownloadTaskState::failed(failed->error);
		}
		if(std::holds_alternative<Finished>(task_state)) {
			return DownloadTaskState::finished();
		}

		auto& downloading = std::get<Downloading>(task_state);
		cache = downloading.cache;
		if(cache->stream()->finished()) {
			context_id = downloading.context_id;
			task_state = Finished{cache};
		}
	}

	if(context_id.has_value()) {
		SPDLOG_INFO("ChunkTask {{ Chunk: {} }}: Finished", chunk_id.to_string());
		cache->downloader()->remove_context(*context_id);
		return DownloadTaskState::finished();
	}

	auto len = chunk_id.len();
	float progress = len == 0 ? 1.0f : float(cache->downloader()->downloaded()) / len;
	return DownloadTaskState::downloading(cache->downloader()->cur_speed(), progress);
}

DownloadTaskControlState ChunkTask::control_state() const {
	std::lock_guard<std::mutex> guard(lock);
	return waiters.has_value() ? DownloadTaskControlState::Normal : DownloadTaskControlState::Canceled;
}

//---------------- State end ----------------//

//---------------- Speed begin ----------------//

uint32_t ChunkTask::calc_speed(uint64_t) {
	auto cache = downloading_cache();
	return cache ? cache->downloader()->cur_speed() : 0;
}

uint32_t ChunkTask::cur_speed() const {
	auto cache = downloading_cache();
	return cache ? cache->downloader()->cur_speed() : 0;
}

uint32_t ChunkTask::history_speed() const {
	auto cache = downloading_cache();
	return cache ? cache->downloader()->history_speed() : 0;
}

int64_t ChunkTask::drain_score() const {
	auto cache = downloading_cache();
	return cache ? cache->downloader()->drain_score() : 0;
}

uint32_t ChunkTask::on_drain(uint32_t expect) {
	auto cache = downloading_cache();
	return cache ? cache->downloader()->on_drain(expect) : 0;
}

//---------------- Speed end ----------------//

//---------------- Cancel begin ----------------//

DownloadTaskControlState ChunkTask::cancel() {
	std::vector<std::function<void()>> to_wake;
	std::shared_ptr<ChunkCache> cache;
	DownloadContextSet::ContextId context_id = 0;
	{
		std::lock_guard<std::mutex> guard(lock);
		if(waiters.has_value()) {
			to_wake = waiters->transfer();
			waiters.reset();
		}

		if(auto* downloading = std::get_if<Downloading>(&task_state)) {
			cache = downloading->cache;
			context_id = downloading->context_id;
			task_state = Failed{make_error(ErrorCode::UserCanceled, "cancel invoked")};
		}
	}

	StateWaiter::wake(to_wake);

	if(cache) {
		SPDLOG_INFO("ChunkTask {{ Chunk: {} }}: Canceled", chunk_id.to_string());
		cache->downloader()->remove_context(context_id);
	}

	return DownloadTaskControlState::Canceled;
}

void ChunkTask::wait_user_canceled(CanceledCallback cb) {
	{
		std::lock_guard<std::mutex> guard(lock);
		if(waiters.has_value()) {
			waiters->new_waiter([cb]() {
				cb(make_error(ErrorCode::UserCanceled, "task canceled"));
			});
			return;
		}
	}

	cb(make_error(ErrorCode::UserCanceled, "task canceled"));
}

//---------------- Cancel end ----------------//

//---------------- ChunkTaskReader begin ----------------//

uint64_t ChunkTaskReader::PendingReads::add(ReadCallback cb) {
	std::lock_guard<std::mutex> guard(lock);
	auto id = next_id++;
	reads.emplace(id, std::move(cb));
	return id;
}

ChunkTaskReader::ReadCallback ChunkTaskReader::PendingReads::take(uint64_t id) {
	std::lock_guard<std::mutex> guard(lock);
	auto iter = reads.find(id);
	if(iter == reads.end()) {
		return nullptr;
	}
	auto cb = std::move(iter->second);
	reads.erase(iter);
	return cb;
}

std::vector<ChunkTaskReader::ReadCallback> ChunkTaskReader::PendingReads::take_all() {
	std::lock_guard<std::mutex> guard(lock);
	std::vector<ReadCallback> res;
	res.reserve(reads.size());
	for(auto& [id, cb] : reads) {
		res.push_back(std::move(cb));
	}
	reads.clear();
	return res;
}

ChunkTaskReader::ChunkTaskReader(std::shared_ptr<ChunkTask> task, std::shared_ptr<ChunkStreamCache> cache) :
task(std::move(task)),
cache(std::move(cache)),
position(std::make_shared<uint64_t>(0)),
pending(std::make_shared<PendingReads>()) {
	std::weak_ptr<PendingReads> weak_pending = pending;
	this->task->wait_user_canceled([weak_pending](absl::Status status) {
		auto reads = weak_pending.lock();
		if(!reads) {
			return;
		}
		for(auto& cb : reads->take_all()) {
			cb(status);
		}
	});
}

ChunkTaskReader::~ChunkTaskReader() {
	task->cancel();
}

absl::StatusOr<uint64_t> ChunkTaskReader::seek(uint64_t pos) {
	if(pos > cache->chunk().len()) {
		return make_error(ErrorCode::InvalidInput, "seek beyond chunk");
	}
	*position = pos;
	return pos;
}

void ChunkTaskReader::async_read(uint8_t* out, size_t len, std::optional<uint64_t> timeout, ReadCallback cb) {
	if(task->control_state() == DownloadTaskControlState::Canceled) {
		cb(make_error(ErrorCode::UserCanceled, "task canceled"));
		return;
	}

	auto pos = *position;
	if(pos >= cache->chunk().len() || len == 0) {
		cb(size_t(0));
		return;
	}

	auto piece_size = cache->piece_size();
	auto index = static_cast<uint32_t>(pos / piece_size);
	auto offset = static_cast<size_t>(pos - uint64_t(index) * piece_size);

	auto id = pending->add(std::move(cb));
	if(task->control_state() == DownloadTaskControlState::Canceled) {
		// Canceled before the read was registered
		if(auto canceled = pending->take(id)) {
			canceled(make_error(ErrorCode::UserCanceled, "task canceled"));
		}
		return;
	}
	cache->async_read(
		PieceDesc::range(index, piece_size),
		timeout,
		[position = position, pending = pending, id, out, len, offset](absl::StatusOr<core::Buffer> piece) {
			auto cb = pending->take(id);
			if(!cb) {
				// Already failed by cancel
				return;
			}
			if(!piece.ok()) {
				cb(piece.status());
				return;
			}

			auto n = std::min(len, piece->size() - offset);
			std::memcpy(out, piece->data() + offset, n);
			*position += n;
			cb(n);
		}
	);
}

//---------------- ChunkTaskReader end ----------------//

} // namespace ndn
} // namespace chunkflow
