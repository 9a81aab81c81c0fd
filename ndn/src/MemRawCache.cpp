#include "chunkflow/ndn/chunk/MemRawCache.hpp"

#include <chunkflow/asyncio/core/Work.hpp>
#include <chunkflow/core/Error.hpp>

#include <algorithm>
#include <cstring>
#include <mutex>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;

namespace {

using Storage = MemRawCache::Storage;

absl::StatusOr<uint64_t> seek_in(Storage& storage, uint64_t pos) {
	if(pos > storage.bytes.size()) {
		return make_error(ErrorCode::InvalidInput, "seek beyond capacity");
	}
	return pos;
}

size_t read_at(Storage& storage, uint64_t pos, uint8_t* out, size_t len) {
	std::shared_lock<std::shared_mutex> lock(storage.lock);
	if(pos >= storage.bytes.size()) {
		return 0;
	}
	auto n = std::min<uint64_t>(len, storage.bytes.size() - pos);
	std::memcpy(out, storage.bytes.data() + pos, n);
	return n;
}

size_t write_at(Storage& storage, uint64_t pos, uint8_t const* in, size_t len) {
	std::unique_lock<std::shared_mutex> lock(storage.lock);
	if(pos >= storage.bytes.size()) {
		return 0;
	}
	auto n = std::min<uint64_t>(len, storage.bytes.size() - pos);
	std::memcpy(storage.bytes.data() + pos, in, n);
	return n;
}

class MemSyncReader : public SyncReader {
private:
	std::shared_ptr<Storage> storage;
	uint64_t pos = 0;
public:
	MemSyncReader(std::shared_ptr<Storage> storage) : storage(std::move(storage)) {}

	absl::StatusOr<uint64_t> seek(uint64_t pos) override {
		auto res = seek_in(*storage, pos);
		if(res.ok()) {
			this->pos = *res;
		}
		return res;
	}

	absl::StatusOr<size_t> read(uint8_t* out, size_t len) override {
		auto n = read_at(*storage, pos, out, len);
		pos += n;
		return n;
	}
};

class MemSyncWriter : public SyncWriter {
private:
	std::shared_ptr<Storage> storage;
	uint64_t pos = 0;
public:
	MemSyncWriter(std::shared_ptr<Storage> storage) : storage(std::move(storage)) {}

	absl::StatusOr<uint64_t> seek(uint64_t pos) override {
		auto res = seek_in(*storage, pos);
		if(res.ok()) {
			this->pos = *res;
		}
		return res;
	}

	absl::StatusOr<size_t> write(uint8_t const* in, size_t len) override {
		auto n = write_at(*storage, pos, in, len);
		pos += n;
		return n;
	}
};

class MemAsyncReader : public AsyncReader {
private:
	std::shared_ptr<Storage> storage;
	uint64_t pos = 0;
public:
	MemAsyncReader(std::shared_ptr<Storage> storage) : storage(std::move(storage)) {}

	void seek(uint64_t pos, SeekCallback cb) override {
		auto res = seek_in(*storage, pos);
		if(res.ok()) {
			this->pos = *res;
		}
		cb(std::move(res));
	}

	void read(uint8_t* out, size_t len, ReadCallback cb) override {
		auto n = std::make_shared<size_t>(0);
		auto from = pos;
		int res = asyncio::queue_work(
			[storage = storage, from, out, len, n]() {
				*n = read_at(*storage, from, out, len);
			},
			[this, n, cb](int status) {
				if(status < 0) {
					cb(make_error(ErrorCode::Unknown, "read work canceled"));
					return;
				}
				pos += *n;
				cb(*n);
			}
		);
		if(res < 0) {
			cb(make_error(ErrorCode::Unknown, "failed to queue read"));
		}
	}
};

class MemAsyncWriter : public AsyncWriter {
private:
	std::shared_ptr<Storage> storage;
	uint64_t pos = 0;
public:
	MemAsyncWriter(std::shared_ptr<Storage> storage) : storage(std::move(storage)) {}

	void seek(uint64_t pos, SeekCallback cb) override {
		auto res = seek_in(*storage, pos);
		if(res.ok()) {
			this->pos = *res;
		}
		cb(std::move(res));
	}

	void write(uint8_t const* in, size_t len, WriteCallback cb) override {
		auto n = std::make_shared<size_t>(0);
		auto from = pos;
		int res = asyncio::queue_work(
			[storage = storage, from, in, len, n]() {
				*n = write_at(*storage, from, in, len);
			},
			[this, n, cb](int status) {
				if(status < 0) {
					cb(make_error(ErrorCode::Unknown, "write work canceled"));
					return;
				}
				pos += *n;
				cb(*n);
			}
		);
		if(res < 0) {
			cb(make_error(ErrorCode::Unknown, "failed to queue write"));
		}
	}
};

} // namespace

MemRawCache::MemRawCache(uint64_t capacity, bool async_only) :
storage(std::make_shared<Storage>()), async_only(async_only) {
	storage->bytes.resize(capacity);
}

uint64_t MemRawCache::capacity() const {
	return storage->bytes.size();
}

absl::StatusOr<std::unique_ptr<SyncReader>> MemRawCache::sync_reader() {
	if(async_only) {
		return make_error(ErrorCode::UnSupport, "async read only");
	}
	return std::unique_ptr<SyncReader>(new MemSyncReader(storage));
}

absl::StatusOr<std::unique_ptr<SyncWriter>> MemRawCache::sync_writer() {
	return std::unique_ptr<SyncWriter>(new MemSyncWriter(storage));
}

void MemRawCache::async_reader(AsyncReaderCallback cb) {
	cb(std::unique_ptr<AsyncReader>(new MemAsyncReader(storage)));
}

void MemRawCache::async_writer(AsyncWriterCallback cb) {
	cb(std::unique_ptr<AsyncWriter>(new MemAsyncWriter(storage)));
}

} // namespace ndn
} // namespace chunkflow
