/*! \file RawCache.hpp
	\brief Seekable byte storage of one chunk
*/

#ifndef CHUNKFLOW_NDN_RAWCACHE_HPP
#define CHUNKFLOW_NDN_RAWCACHE_HPP

#include <absl/status/statusor.h>

#include <stdint.h>
#include <functional>
#include <memory>

namespace chunkflow {
namespace ndn {

/// Blocking reader with a cursor
class SyncReader {
public:
	virtual ~SyncReader() = default;

	/// Move the cursor to pos from the start, returns the new position
	virtual absl::StatusOr<uint64_t> seek(uint64_t pos) = 0;
	/// Read up to len bytes, returns the number of bytes read
	virtual absl::StatusOr<size_t> read(uint8_t* out, size_t len) = 0;
};

/// Blocking writer with a cursor
class SyncWriter {
public:
	virtual ~SyncWriter() = default;

	virtual absl::StatusOr<uint64_t> seek(uint64_t pos) = 0;
	/// Write up to len bytes, returns the number of bytes written
	virtual absl::StatusOr<size_t> write(uint8_t const* in, size_t len) = 0;
};

//! Reader completing on the event loop
/*!
	The reader and the memory passed to read must outlive the callback.
*/
class AsyncReader {
public:
	using SeekCallback = std::function<void(absl::StatusOr<uint64_t>)>;
	using ReadCallback = std::function<void(absl::StatusOr<size_t>)>;

	virtual ~AsyncReader() = default;

	virtual void seek(uint64_t pos, SeekCallback cb) = 0;
	virtual void read(uint8_t* out, size_t len, ReadCallback cb) = 0;
};

//! Writer completing on the event loop
/*!
	The writer and the memory passed to write must outlive the callback.
*/
class AsyncWriter {
public:
	using SeekCallback = std::function<void(absl::StatusOr<uint64_t>)>;
	using WriteCallback = std::function<void(absl::StatusOr<size_t>)>;

	virtual ~AsyncWriter() = default;

	virtual void seek(uint64_t pos, SeekCallback cb) = 0;
	virtual void write(uint8_t const* in, size_t len, WriteCallback cb) = 0;
};

//! Storage backend contract
/*!
	Readers and writers are independent views over the same bytes. A backend may
	refuse the sync views with an UnSupport error to require asynchronous access.
*/
class RawCache {
public:
	using AsyncReaderCallback = std::function<void(absl::StatusOr<std::unique_ptr<AsyncReader>>)>;
	using AsyncWriterCallback = std::function<void(absl::StatusOr<std::unique_ptr<AsyncWriter>>)>;

	virtual ~RawCache() = default;

	/// Bytes the storage can hold
	virtual uint64_t capacity() const = 0;

	virtual absl::StatusOr<std::unique_ptr<SyncReader>> sync_reader() = 0;
	virtual absl::StatusOr<std::unique_ptr<SyncWriter>> sync_writer() = 0;
	virtual void async_reader(AsyncReaderCallback cb) = 0;
	virtual void async_writer(AsyncWriterCallback cb) = 0;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_RAWCACHE_HPP
