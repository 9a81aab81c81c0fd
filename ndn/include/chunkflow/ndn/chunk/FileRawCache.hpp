/*! \file FileRawCache.hpp
*/

#ifndef CHUNKFLOW_NDN_FILERAWCACHE_HPP
#define CHUNKFLOW_NDN_FILERAWCACHE_HPP

#include <chunkflow/ndn/chunk/RawCache.hpp>

#include <uv.h>

#include <memory>
#include <string>

namespace chunkflow {
namespace ndn {

//! RawCache over a file, through libuv file system requests
/*!
	Sync views issue blocking requests, async views complete on the default loop.
*/
class FileRawCache : public RawCache {
public:
	/// Open descriptor, closed with the last view
	struct File {
		uv_file fd;
		uint64_t capacity;

		File(uv_file fd, uint64_t capacity) : fd(fd), capacity(capacity) {}
		~File();
	};

private:
	std::shared_ptr<File> file;
	std::string path;

	FileRawCache(std::shared_ptr<File> file, std::string path);

public:
	/// Open or create path, sized to capacity bytes
	static absl::StatusOr<std::unique_ptr<FileRawCache>> open(std::string const& path, uint64_t capacity);

	std::string const& file_path() const {
		return path;
	}

	uint64_t capacity() const override;

	absl::StatusOr<std::unique_ptr<SyncReader>> sync_reader() override;
	absl::StatusOr<std::unique_ptr<SyncWriter>> sync_writer() override;
	void async_reader(AsyncReaderCallback cb) override;
	void async_writer(AsyncWriterCallback cb) override;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_FILERAWCACHE_HPP
