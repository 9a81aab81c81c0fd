#include <chunkflow/asyncio/core/EventLoop.hpp>
#include <chunkflow/ndn/NdnStack.hpp>
#include <chunkflow/ndn/chunk/FileRawCache.hpp>

#include <spdlog/spdlog.h>
#include <structopt/app.hpp>

#include <fstream>
#include <iterator>
#include <memory>
#include <vector>

#ifndef CHUNKFLOW_TOOL_DEFAULT_BIND_ADDR
#define CHUNKFLOW_TOOL_DEFAULT_BIND_ADDR "0.0.0.0:18700"
#endif

#ifndef CHUNKFLOW_TOOL_DEFAULT_READ_TIMEOUT
#define CHUNKFLOW_TOOL_DEFAULT_READ_TIMEOUT 30000
#endif

using namespace chunkflow;
using namespace chunkflow::core;
using namespace chunkflow::asyncio;
using namespace chunkflow::ndn;


struct CliOptions {
	std::optional<std::string> name;
	std::optional<std::string> bind;
	std::optional<std::string> peers;
	std::optional<std::string> share;
	std::optional<std::string> get;
	std::optional<std::string> out;
	std::optional<std::string> store;
	std::optional<uint16_t> piece_size;
	std::optional<std::string> log_level;
};
STRUCTOPT(CliOptions, name, bind, peers, share, get, out, store, piece_size, log_level);

//! Fetches a chunk through a task reader and writes it to a file
struct Fetch {
	std::shared_ptr<ChunkTask> task;
	std::unique_ptr<ChunkTaskReader> reader;
	std::vector<uint8_t> content;
	std::vector<uint8_t> scratch;
	std::string out_path;
	int status = -1;

	void read_next() {
		reader->async_read(
			scratch.data(),
			scratch.size(),
			CHUNKFLOW_TOOL_DEFAULT_READ_TIMEOUT,
			[this](absl::StatusOr<size_t> res) {
				if(!res.ok()) {
					SPDLOG_ERROR("Fetch of {} failed: {}", task->chunk().to_string(), res.status().ToString());
					EventLoop::stop();
					return;
				}
				if(*res == 0) {
					done();
					return;
				}
				content.insert(content.end(), scratch.begin(), scratch.begin() + *res);
				read_next();
			}
		);
	}

	void done() {
		std::ofstream file(out_path, std::ios::binary | std::ios::trunc);
		file.write((char const*)content.data(), content.size());
		if(!file) {
			SPDLOG_ERROR("Write to {} failed", out_path);
		} else {
			SPDLOG_INFO("Fetched {} into {}", task->chunk().to_string(), out_path);
			status = 0;
		}
		EventLoop::stop();
	}
};

int main(int argc, char** argv) {
	try {
		auto options = structopt::app("chunkflow-tool").parse<CliOptions>(argc, argv);

		spdlog::set_level(spdlog::level::from_str(options.log_level.value_or("info")));

		auto name = options.name.value_or("chunkflow");
		auto bind_addr = SocketAddress::from_string(options.bind.value_or(CHUNKFLOW_TOOL_DEFAULT_BIND_ADDR));
		if(!bind_addr.has_value()) {
			SPDLOG_ERROR("Invalid bind address");
			return -1;
		}

		NdnConfig config;
		config.piece_size = options.piece_size.value_or(config.piece_size);

		NdnStack stack(DeviceId::from_name(name), config);

		// Chunk bytes live in <store>/<chunk id> instead of memory
		if(options.store.has_value()) {
			auto dir = *options.store;
			stack.chunk_manager().set_raw_cache_factory([dir](ChunkId const& chunk) -> absl::StatusOr<std::unique_ptr<RawCache>> {
				auto file = FileRawCache::open(dir + "/" + chunk.to_string(), chunk.len());
				if(!file.ok()) {
					return file.status();
				}
				return std::unique_ptr<RawCache>(std::move(*file));
			});
		}

		std::vector<PeerDesc> sources;
		size_t pos;
		std::string peers = options.peers.value_or("");
		while(!peers.empty()) {
			pos = peers.find(',');
			auto peer_string = peers.substr(0, pos);
			peers = pos == std::string::npos ? "" : peers.substr(pos + 1);

			auto peer = PeerTable::parse_peer(peer_string);
			if(!peer.has_value()) {
				SPDLOG_ERROR("Invalid peer: {}", peer_string);
				return -1;
			}
			stack.peers().add(*peer);
			sources.push_back(*peer);
		}

		if(stack.start(*bind_addr) < 0) {
			return -1;
		}

		SPDLOG_INFO("Node {} id: {}", name, stack.local_id().to_string());

		if(options.share.has_value()) {
			std::ifstream file(*options.share, std::ios::binary);
			if(!file) {
				SPDLOG_ERROR("Cannot open {}", *options.share);
				return -1;
			}
			std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

			auto chunk = ChunkId::calculate(data.data(), data.size());
			auto cache = stack.chunk_manager().store_chunk(chunk, data.data(), data.size());
			if(!cache.ok()) {
				SPDLOG_ERROR("Share failed: {}", cache.status().ToString());
				return -1;
			}
			SPDLOG_INFO("Sharing {} as {}", *options.share, chunk.to_string());

			return EventLoop::run();
		}

		if(options.get.has_value()) {
			auto chunk = ChunkId::from_string(*options.get);
			if(!chunk.has_value()) {
				SPDLOG_ERROR("Invalid chunk id: {}", *options.get);
				return -1;
			}
			if(sources.empty()) {
				SPDLOG_ERROR("No peer to fetch from");
				return -1;
			}

			auto task = ChunkTask::reader(
				stack.chunk_manager(),
				*chunk,
				std::make_shared<SingleDownloadContext>(sources)
			);
			if(!task.ok()) {
				SPDLOG_ERROR("Fetch failed: {}", task.status().ToString());
				return -1;
			}

			Fetch fetch;
			fetch.task = std::move(task->first);
			fetch.reader = std::move(task->second);
			fetch.scratch.resize(config.piece_size);
			fetch.out_path = options.out.value_or(chunk->to_string());
			fetch.read_next();

			EventLoop::run();
			return fetch.status;
		}

		return EventLoop::run();
	} catch (structopt::exception& e) {
		SPDLOG_ERROR("{}", e.what());
		SPDLOG_ERROR("{}", e.help());
	}

	return -1;
}
