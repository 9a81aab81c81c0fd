#include "chunkflow/ndn/chunk/FileRawCache.hpp"

#include <chunkflow/core/Error.hpp>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <algorithm>
#include <functional>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;
using File = FileRawCache::File;

namespace {

absl::Status fs_error(ssize_t res) {
	return make_error(ErrorCode::Unknown, uv_strerror(static_cast<int>(res)));
}

/// Bytes of [pos, pos + len) inside the file
size_t clamp_len(File const& file, uint64_t pos, size_t len) {
	if(pos >= file.capacity) {
		return 0;
	}
	return std::min<uint64_t>(len, file.capacity - pos);
}

ssize_t fs_read_sync(File const& file, uint64_t pos, uint8_t* out, size_t len) {
	len = clamp_len(file, pos, len);
	if(len == 0) {
		return 0;
	}

	uv_fs_t req;
	auto buf = uv_buf_init((char*)out, len);
	auto res = uv_fs_read(uv_default_loop(), &req, file.fd, &buf, 1, pos, nullptr);
	uv_fs_req_cleanup(&req);
	return res;
}

ssize_t fs_write_sync(File const& file, uint64_t pos, uint8_t const* in, size_t len) {
	len = clamp_len(file, pos, len);
	if(len == 0) {
		return 0;
	}

	uv_fs_t req;
	auto buf = uv_buf_init((char*)in, len);
	auto res = uv_fs_write(uv_default_loop(), &req, file.fd, &buf, 1, pos, nullptr);
	uv_fs_req_cleanup(&req);
	return res;
}

struct FsRequest {
	uv_fs_t req;
	std::shared_ptr<File> file;
	std::function<void(ssize_t)> cb;
};

void fs_cb(uv_fs_t* req) {
	auto* request = (FsRequest*)req->data;
	auto res = req->result;
	uv_fs_req_cleanup(req);

	auto cb = std::move(request->cb);
	delete request;
	cb(res);
}

void fs_async(
	std::shared_ptr<File> const& file,
	bool is_write,
	uint64_t pos,
	uint8_t* data,
	size_t len,
	std::function<void(ssize_t)> cb
) {
	len = clamp_len(*file, pos, len);
	if(len == 0) {
		cb(0);
		return;
	}

	auto* request = new FsRequest{uv_fs_t(), file, std::move(cb)};
	request->req.data = request;
	auto buf = uv_buf_init((char*)data, len);

	int res = is_write
		? uv_fs_write(uv_default_loop(), &request->req, file->fd, &buf, 1, pos, fs_cb)
		: uv_fs_read(uv_default_loop(), &request->req, file->fd, &buf, 1, pos, fs_cb);
	if(res < 0) {
		SPDLOG_ERROR("FileRawCache: fs request error: {}", uv_strerror(res));
		auto cb = std::move(request->cb);
		delete request;
		cb(res);
	}
}

absl::StatusOr<uint64_t> seek_in(File const& file, uint64_t pos) {
	if(pos > file.capacity) {
		return make_error(ErrorCode::InvalidInput, "seek beyond capacity");
	}
	return pos;
}

class FileSyncReader : public SyncReader {
private:
	std::shared_ptr<File> file;
	uint64_t pos = 0;
public:
	FileSyncReader(std::shared_ptr<File> file) : file(std::move(file)) {}

	absl::StatusOr<uint64_t> seek(uint64_t pos) override {
		auto res = seek_in(*file, pos);
		if(res.ok()) {
			this->pos = *res;
		}
		return res;
	}

	absl::StatusOr<size_t> read(uint8_t* out, size_t len) override {
		auto res = fs_read_sync(*file, pos, out, len);
		if(res < 0) {
			return fs_error(res);
		}
		pos += res;
		return static_cast<size_t>(res);
	}
};

class FileSyncWriter : public SyncWriter {
private:
	std::shared_ptr<File> file;
	uint64_t pos = 0;
public:
	FileSyncWriter(std::shared_ptr<File> file) : file(std::move(file)) {}

	absl::StatusOr<uint64_t> seek(uint64_t pos) override {
		auto res = seek_in(*file, pos);
		if(res.ok()) {
			this->pos = *res;
		}
		return res;
	}

	absl::StatusOr<size_t> write(uint8_t const* in, size_t len) override {
		auto res = fs_write_sync(*file, pos, in, len);
		if(res < 0) {
			return fs_error(res);
		}
		pos += res;
		return static_cast<size_t>(res);
	}
};

class FileAsyncReader : public AsyncReader {
private:
	std::shared_ptr<File> file;
	uint64_t pos = 0;
public:
	FileAsyncReader(std::shared_ptr<File> file) : file(std::move(file)) {}

	void seek(uint64_t pos, SeekCallback cb) override {
		auto res = seek_in(*file, pos);
		if(res.ok()) {
			this->pos = *res;
		}
		cb(std::move(res));
	}

	void read(uint8_t* out, size_t len, ReadCallback cb) override {
		fs_async(file, false, pos, out, len, [this, cb](ssize_t res) {
			if(res < 0) {
				cb(fs_error(res));
				return;
			}
			pos += res;
			cb(static_cast<size_t>(res));
		});
	}
};

class FileAsyncWriter : public AsyncWriter {
private:
	std::shared_ptr<File> file;
	uint64_t pos = 0;
public:
	FileAsyncWriter(std::shared_ptr<File> file) : file(std::move(file)) {}

	void seek(uint64_t pos, SeekCallback cb) override {
		auto res = seek_in(*file, pos);
		if(res.ok()) {
			this->pos = *res;
		}
		cb(std::move(res));
	}

	void write(uint8_t const* in, size_t len, WriteCallback cb) override {
		fs_async(file, true, pos, (uint8_t*)in, len, [this, cb](ssize_t res) {
			if(res < 0) {
				cb(fs_error(res));
				return;
			}
			pos += res;
			cb(static_cast<size_t>(res));
		});
	}
};

} // namespace

File::~File() {
	uv_fs_t req;
	auto res = uv_fs_close(uv_default_loop(), &req, fd, nullptr);
	uv_fs_req_cleanup(&req);
	if(res < 0) {
		SPDLOG_ERROR("FileRawCache: close error: {}", uv_strerror(res));
	}
}

FileRawCache::FileRawCache(std::shared_ptr<File> file, std::string path) :
file(std::move(file)), path(std::move(path)) {}

absl::StatusOr<std::unique_ptr<FileRawCache>> FileRawCache::open(std::string const& path, uint64_t capacity) {
	uv_fs_t req;
	auto fd = uv_fs_open(uv_default_loop(), &req, path.c_str(), O_RDWR | O_CREAT, 0644, nullptr);
	uv_fs_req_cleanup(&req);
	if(fd < 0) {
		SPDLOG_ERROR("FileRawCache {{ Path: {} }}: open error: {}", path, uv_strerror(fd));
		return fs_error(fd);
	}

	auto file = std::make_shared<File>(fd, capacity);

	auto res = uv_fs_ftruncate(uv_default_loop(), &req, fd, capacity, nullptr);
	uv_fs_req_cleanup(&req);
	if(res < 0) {
		SPDLOG_ERROR("FileRawCache {{ Path: {} }}: truncate error: {}", path, uv_strerror(res));
		return fs_error(res);
	}

	return std::unique_ptr<FileRawCache>(new FileRawCache(std::move(file), path));
}

uint64_t FileRawCache::capacity() const {
	return file->capacity;
}

absl::StatusOr<std::unique_ptr<SyncReader>> FileRawCache::sync_reader() {
	return std::unique_ptr<SyncReader>(new FileSyncReader(file));
}

absl::StatusOr<std::unique_ptr<SyncWriter>> FileRawCache::sync_writer() {
	return std::unique_ptr<SyncWriter>(new FileSyncWriter(file));
}

void FileRawCache::async_reader(AsyncReaderCallback cb) {
	cb(std::unique_ptr<AsyncReader>(new FileAsyncReader(file)));
}

void FileRawCache::async_writer(AsyncWriterCallback cb) {
	cb(std::unique_ptr<AsyncWriter>(new FileAsyncWriter(file)));
}

} // namespace ndn
} // namespace chunkflow
