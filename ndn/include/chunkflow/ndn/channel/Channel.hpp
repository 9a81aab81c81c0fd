/*! \file Channel.hpp
	\brief Sessions multiplexed with one remote peer
*/

#ifndef CHUNKFLOW_NDN_CHANNEL_HPP
#define CHUNKFLOW_NDN_CHANNEL_HPP

#include <chunkflow/core/HistorySpeed.hpp>
#include <chunkflow/ndn/Config.hpp>
#include <chunkflow/ndn/channel/Tunnel.hpp>
#include <chunkflow/ndn/chunk/StreamDecoder.hpp>
#include <chunkflow/ndn/chunk/StreamEncoder.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace chunkflow {
namespace ndn {

/// Chunk side lookup used to serve interests
class UploadSource {
public:
	virtual ~UploadSource() = default;

	/// Cache to upload chunk from, nullptr if not held
	virtual std::shared_ptr<ChunkStreamCache> upload_cache_of(ChunkId const& chunk) = 0;
};

//! Receive side of a session, created by Channel::download
class DownloadSession {
public:
	enum class State {
		Downloading,
		Finished,
		Error
	};

private:
	friend class Channel;

	uint32_t id;
	DeviceId remote_id;
	std::shared_ptr<StreamDecoder> stream_decoder;

	mutable std::mutex lock;
	State session_state = State::Downloading;
	absl::Status session_error;

	// Guarded by the channel
	bool any_received = false;
	bool progressed = false;
	std::optional<uint64_t> last_progress;
	std::optional<uint64_t> last_request;

	void set_finished();
	void set_error(absl::Status status);

public:
	DownloadSession(uint32_t id, DeviceId const& remote, std::shared_ptr<StreamDecoder> decoder);

	uint32_t session_id() const {
		return id;
	}

	DeviceId const& remote() const {
		return remote_id;
	}

	ChunkId const& chunk() const {
		return stream_decoder->chunk();
	}

	std::shared_ptr<StreamDecoder> const& decoder() const {
		return stream_decoder;
	}

	State state() const;
	/// Ok unless the state is Error
	absl::Status error() const;
};

//! Per remote peer multiplexer
/*!
	Upload sessions are keyed by the session id the remote chose, download sessions
	by the id this side chose. Time only advances through on_time_escape.
*/
class Channel : public std::enable_shared_from_this<Channel> {
private:
	struct UploadSession {
		std::shared_ptr<StreamEncoder> encoder;
		bool touched = true;
		std::optional<uint64_t> last_active;
	};

	PeerDesc remote_desc;
	DatagramTunnel& tunnel;
	UploadSource* upload_source;
	ChannelConfig cfg;

	mutable std::mutex lock;
	uint32_t next_session_id = 1;
	std::map<uint32_t, std::shared_ptr<DownloadSession>> downloads;
	std::map<uint32_t, UploadSession> uploads;

	core::HistorySpeed download_history;
	core::HistorySpeed upload_history;
	uint64_t download_bytes = 0;
	uint64_t upload_bytes = 0;
	uint32_t cur_download = 0;
	uint32_t cur_upload = 0;
	std::optional<uint64_t> last_calc;
	bool download_active = false;
	bool upload_active = false;
	std::optional<uint64_t> idle_since;

	using Outgoing = std::vector<core::Buffer>;

	void send_all(Outgoing& outgoing);

	absl::Status on_interest(core::Buffer const& payload, Outgoing& outgoing);
	absl::Status on_resp_interest(core::Buffer const& payload);
	absl::Status on_piece_data(core::Buffer&& payload, Outgoing& outgoing);
	absl::Status on_piece_control(core::Buffer const& payload);

	void tick_downloads(uint64_t now, Outgoing& outgoing);
	void tick_uploads(uint64_t now, Outgoing& outgoing);

public:
	Channel(
		PeerDesc const& remote,
		DatagramTunnel& tunnel,
		UploadSource* upload_source,
		ChannelConfig const& config,
		core::HistorySpeed download_speed,
		core::HistorySpeed upload_speed
	);

	PeerDesc const& remote() const {
		return remote_desc;
	}

	//! Start downloading window of chunk into cache
	/*!
		Sends an Interest, retried from on_time_escape until pieces arrive.
	*/
	std::shared_ptr<DownloadSession> download(
		ChunkId const& chunk,
		PieceDesc const& window,
		std::shared_ptr<ChunkStreamCache> cache
	);
	/// Give up a download session, the remote is told to stop
	void cancel_download(uint32_t session_id);

	/// Handle one inbound command
	absl::Status on_datagram(Datagram&& datagram);
	/// Send pieces and retry requests
	void on_time_escape(uint64_t now);

	//! (download, upload) bytes per second since the last call
	/*!
		A direction without sessions or traffic since the last call feeds no sample
		to its history.
	*/
	std::pair<uint32_t, uint32_t> calc_speed(uint64_t when);
	/// Direction had sessions or traffic at the last calc_speed
	bool had_download() const;
	bool had_upload() const;

	uint32_t cur_download_speed() const;
	uint32_t cur_upload_speed() const;
	uint32_t history_download_speed() const;
	uint32_t history_upload_speed() const;

	size_t download_session_count() const;
	size_t upload_session_count() const;
	/// No session since idle_timeout ms before now, as seen by on_time_escape
	bool idle_at(uint64_t now) const;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_CHANNEL_HPP
