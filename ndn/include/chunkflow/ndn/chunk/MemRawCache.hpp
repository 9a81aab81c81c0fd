/*! \file MemRawCache.hpp
*/

#ifndef CHUNKFLOW_NDN_MEMRAWCACHE_HPP
#define CHUNKFLOW_NDN_MEMRAWCACHE_HPP

#include <chunkflow/ndn/chunk/RawCache.hpp>

#include <memory>
#include <shared_mutex>
#include <vector>

namespace chunkflow {
namespace ndn {

//! RawCache over a heap block of fixed capacity
/*!
	Async views run the copy on the libuv thread pool. With async_only set, the
	sync reader is refused with UnSupport.
*/
class MemRawCache : public RawCache {
public:
	struct Storage {
		std::shared_mutex lock;
		std::vector<uint8_t> bytes;
	};

private:
	std::shared_ptr<Storage> storage;
	bool async_only;

public:
	MemRawCache(uint64_t capacity, bool async_only = false);

	uint64_t capacity() const override;

	absl::StatusOr<std::unique_ptr<SyncReader>> sync_reader() override;
	absl::StatusOr<std::unique_ptr<SyncWriter>> sync_writer() override;
	void async_reader(AsyncReaderCallback cb) override;
	void async_writer(AsyncWriterCallback cb) override;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_MEMRAWCACHE_HPP
