#ifndef MOCK_RAW_CACHE_HPP
#define MOCK_RAW_CACHE_HPP

#include <chunkflow/core/Error.hpp>
#include <chunkflow/ndn/chunk/MemRawCache.hpp>
#include <chunkflow/ndn/protocol/Messages.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

/// Content of a chunk and its id
struct ChunkContent {
	std::vector<uint8_t> bytes;
	chunkflow::ndn::ChunkId chunk;

	explicit ChunkContent(size_t size, uint8_t seed = 7) : bytes(size) {
		for(size_t i = 0; i < size; i++) {
			bytes[i] = static_cast<uint8_t>((i * 31 + seed) % 251);
		}
		chunk = chunkflow::ndn::ChunkId::calculate(bytes.data(), bytes.size());
	}

	chunkflow::ndn::PieceData piece(uint32_t index, uint16_t piece_size, uint32_t session_id = 1) const {
		auto start = std::min<size_t>(size_t(index) * piece_size, bytes.size());
		auto end = std::min<size_t>(start + piece_size, bytes.size());
		return chunkflow::ndn::PieceData{
			session_id,
			chunk,
			chunkflow::ndn::PieceDesc::range(index, piece_size),
			chunkflow::core::Buffer::copy_of(bytes.data() + start, end - start)
		};
	}
};

/// Writes go through a MemRawCache and are counted
class CountingRawCache : public chunkflow::ndn::MemRawCache {
public:
	struct Counters {
		std::atomic<int> writes{0};
	};

private:
	class CountingWriter : public chunkflow::ndn::SyncWriter {
	private:
		std::unique_ptr<chunkflow::ndn::SyncWriter> inner;
		std::shared_ptr<Counters> counters;
	public:
		CountingWriter(std::unique_ptr<chunkflow::ndn::SyncWriter> inner, std::shared_ptr<Counters> counters) :
		inner(std::move(inner)), counters(std::move(counters)) {}

		absl::StatusOr<uint64_t> seek(uint64_t pos) override {
			return inner->seek(pos);
		}

		absl::StatusOr<size_t> write(uint8_t const* in, size_t len) override {
			counters->writes++;
			// Widen the window for racing pushers
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
			return inner->write(in, len);
		}
	};

	std::shared_ptr<Counters> counters;

public:
	CountingRawCache(uint64_t capacity, std::shared_ptr<Counters> counters) :
	MemRawCache(capacity), counters(std::move(counters)) {}

	absl::StatusOr<std::unique_ptr<chunkflow::ndn::SyncWriter>> sync_writer() override {
		auto writer = MemRawCache::sync_writer();
		if(!writer.ok()) {
			return writer.status();
		}
		return std::unique_ptr<chunkflow::ndn::SyncWriter>(new CountingWriter(std::move(*writer), counters));
	}
};

/// Writes lose their last byte
class ShortWriteRawCache : public chunkflow::ndn::MemRawCache {
private:
	class ShortWriter : public chunkflow::ndn::SyncWriter {
	private:
		std::unique_ptr<chunkflow::ndn::SyncWriter> inner;
	public:
		ShortWriter(std::unique_ptr<chunkflow::ndn::SyncWriter> inner) : inner(std::move(inner)) {}

		absl::StatusOr<uint64_t> seek(uint64_t pos) override {
			return inner->seek(pos);
		}

		absl::StatusOr<size_t> write(uint8_t const* in, size_t len) override {
			return inner->write(in, len > 0 ? len - 1 : 0);
		}
	};

public:
	ShortWriteRawCache(uint64_t capacity) : MemRawCache(capacity) {}

	absl::StatusOr<std::unique_ptr<chunkflow::ndn::SyncWriter>> sync_writer() override {
		auto writer = MemRawCache::sync_writer();
		if(!writer.ok()) {
			return writer.status();
		}
		return std::unique_ptr<chunkflow::ndn::SyncWriter>(new ShortWriter(std::move(*writer)));
	}
};

#endif // MOCK_RAW_CACHE_HPP
