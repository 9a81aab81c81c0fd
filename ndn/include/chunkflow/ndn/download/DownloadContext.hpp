/*! \file DownloadContext.hpp
	\brief Candidate sources of a download, supplied by the caller
*/

#ifndef CHUNKFLOW_NDN_DOWNLOADCONTEXT_HPP
#define CHUNKFLOW_NDN_DOWNLOADCONTEXT_HPP

#include <chunkflow/ndn/types/ChunkId.hpp>
#include <chunkflow/ndn/types/DeviceId.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace chunkflow {
namespace ndn {

class DownloadContext {
public:
	virtual ~DownloadContext() = default;

	/// Peers that may hold chunk, most preferred first
	virtual std::vector<PeerDesc> sources(ChunkId const& chunk) const = 0;
};

/// Fixed list of sources for any chunk
class SingleDownloadContext : public DownloadContext {
private:
	std::vector<PeerDesc> peers;

public:
	SingleDownloadContext(std::vector<PeerDesc> peers) : peers(std::move(peers)) {}

	std::vector<PeerDesc> sources(ChunkId const&) const override {
		return peers;
	}
};

//! Contexts registered on one download, keyed by opaque id
class DownloadContextSet {
public:
	using ContextId = uint64_t;

private:
	mutable std::mutex lock;
	ContextId next_id = 1;
	std::map<ContextId, std::shared_ptr<DownloadContext>> contexts;

public:
	ContextId add_context(std::shared_ptr<DownloadContext> context);
	/// False if id is not registered
	bool remove_context(ContextId id);

	bool empty() const;
	size_t size() const;

	/// Sources of every context, first occurrence of a device kept
	std::vector<PeerDesc> sources(ChunkId const& chunk) const;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_DOWNLOADCONTEXT_HPP
