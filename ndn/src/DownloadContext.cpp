#include "chunkflow/ndn/download/DownloadContext.hpp"

#include <set>

namespace chunkflow {
namespace ndn {

DownloadContextSet::ContextId DownloadContextSet::add_context(std::shared_ptr<DownloadContext> context) {
	std::lock_guard<std::mutex> guard(lock);
	auto id = next_id++;
	contexts.emplace(id, std::move(context));
	return id;
}

bool DownloadContextSet::remove_context(ContextId id) {
	std::lock_guard<std::mutex> guard(lock);
	return contexts.erase(id) > 0;
}

bool DownloadContextSet::empty() const {
	std::lock_guard<std::mutex> guard(lock);
	return contexts.empty();
}

size_t DownloadContextSet::size() const {
	std::lock_guard<std::mutex> guard(lock);
	return contexts.size();
}

std::vector<PeerDesc> DownloadContextSet::sources(ChunkId const& chunk) const {
	std::vector<std::shared_ptr<DownloadContext>> snapshot;
	{
		std::lock_guard<std::mutex> guard(lock);
		for(auto const& [id, context] : contexts) {
			snapshot.push_back(context);
		}
	}

	std::vector<PeerDesc> res;
	std::set<DeviceId> seen;
	for(auto const& context : snapshot) {
		for(auto const& peer : context->sources(chunk)) {
			if(seen.insert(peer.id).second) {
				res.push_back(peer);
			}
		}
	}
	return res;
}

} // namespace ndn
} // namespace chunkflow
