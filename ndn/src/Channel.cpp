#include "chunkflow/ndn/channel/Channel.hpp"

#include <chunkflow/core/Error.hpp>

#include <spdlog/spdlog.h>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;

//---------------- DownloadSession begin ----------------//

DownloadSession::DownloadSession(uint32_t id, DeviceId const& remote, std::shared_ptr<StreamDecoder> decoder) :
id(id), remote_id(remote), stream_decoder(std::move(decoder)) {}

void DownloadSession::set_finished() {
	std::lock_guard<std::mutex> guard(lock);
	if(session_state == State::Downloading) {
		session_state = State::Finished;
	}
}

void DownloadSession::set_error(absl::Status status) {
	std::lock_guard<std::mutex> guard(lock);
	if(session_state == State::Downloading) {
		session_state = State::Error;
		session_error = std::move(status);
	}
}

DownloadSession::State DownloadSession::state() const {
	std::lock_guard<std::mutex> guard(lock);
	return session_state;
}

absl::Status DownloadSession::error() const {
	std::lock_guard<std::mutex> guard(lock);
	return session_error;
}

//---------------- DownloadSession end ----------------//

Channel::Channel(
	PeerDesc const& remote,
	DatagramTunnel& tunnel,
	UploadSource* upload_source,
	ChannelConfig const& config,
	core::HistorySpeed download_speed,
	core::HistorySpeed upload_speed
) : remote_desc(remote),
	tunnel(tunnel),
	upload_source(upload_source),
	cfg(config),
	download_history(download_speed),
	upload_history(upload_speed) {}

void Channel::send_all(Outgoing& outgoing) {
	for(auto& buf : outgoing) {
		auto status = tunnel.send(remote_desc, std::move(buf));
		if(!status.ok()) {
			SPDLOG_ERROR(
				"Channel {{ Remote: {} }}: Send error: {}",
				remote_desc.id.to_string(),
				status.ToString()
			);
		}
	}
	outgoing.clear();
}

//---------------- Download begin ----------------//

std::shared_ptr<DownloadSession> Channel::download(
	ChunkId const& chunk,
	PieceDesc const& window,
	std::shared_ptr<ChunkStreamCache> cache
) {
	Outgoing outgoing;
	std::shared_ptr<DownloadSession> session;
	{
		std::lock_guard<std::mutex> guard(lock);
		auto id = next_session_id++;
		auto decoder = std::make_shared<StreamDecoder>(chunk, window, std::move(cache));
		session = std::make_shared<DownloadSession>(id, remote_desc.id, std::move(decoder));
		downloads[id] = session;

		outgoing.push_back(Interest{id, chunk, window}.encode());
	}

	SPDLOG_DEBUG(
		"Channel {{ Remote: {} }}: Download session {}: chunk {}, window {}",
		remote_desc.id.to_string(),
		session->session_id(),
		chunk.to_string(),
		window.to_string()
	);
	send_all(outgoing);

	return session;
}

void Channel::cancel_download(uint32_t session_id) {
	Outgoing outgoing;
	{
		std::lock_guard<std::mutex> guard(lock);
		auto iter = downloads.find(session_id);
		if(iter == downloads.end()) {
			return;
		}

		auto session = std::move(iter->second);
		downloads.erase(iter);
		session->set_error(make_error(ErrorCode::UserCanceled, "download canceled"));
		outgoing.push_back(PieceControl{session_id, session->chunk(), PieceControlCommand::Cancel, 0, {}}.encode());
	}

	SPDLOG_DEBUG("Channel {{ Remote: {} }}: Download session {} canceled", remote_desc.id.to_string(), session_id);
	send_all(outgoing);
}

//---------------- Download end ----------------//

//---------------- Inbound begin ----------------//

absl::Status Channel::on_datagram(Datagram&& datagram) {
	auto code = command_of(datagram.payload);
	if(!code.has_value()) {
		return make_error(ErrorCode::InvalidInput, "unknown command");
	}

	Outgoing outgoing;
	absl::Status status;
	switch(*code) {
		case CommandCode::Interest:
			status = on_interest(datagram.payload, outgoing);
			break;
		case CommandCode::RespInterest:
			status = on_resp_interest(datagram.payload);
			break;
		case CommandCode::PieceData:
			status = on_piece_data(std::move(datagram.payload), outgoing);
			break;
		case CommandCode::PieceControl:
			status = on_piece_control(datagram.payload);
			break;
	}

	send_all(outgoing);
	return status;
}

absl::Status Channel::on_interest(core::Buffer const& payload, Outgoing& outgoing) {
	auto interest = Interest::decode(payload);
	if(!interest.ok()) {
		return interest.status();
	}

	auto cache = upload_source != nullptr ? upload_source->upload_cache_of(interest->chunk) : nullptr;
	if(!cache || !cache->loaded()) {
		SPDLOG_DEBUG(
			"Channel {{ Remote: {} }}: Interest for unknown chunk {}",
			remote_desc.id.to_string(),
			interest->chunk.to_string()
		);
		outgoing.push_back(RespInterest{interest->session_id, interest->chunk, ErrorCode::NotFound}.encode());
		return absl::OkStatus();
	}
	if(interest->desc.piece_size() != cache->piece_size()) {
		outgoing.push_back(RespInterest{interest->session_id, interest->chunk, ErrorCode::InvalidInput}.encode());
		return absl::OkStatus();
	}

	std::lock_guard<std::mutex> guard(lock);
	auto iter = uploads.find(interest->session_id);
	if(iter != uploads.end() &&
		iter->second.encoder->cache()->chunk() == interest->chunk &&
		iter->second.encoder->desc() == interest->desc
	) {
		// Interest resent, start over
		iter->second.encoder->reset();
		iter->second.touched = true;
		return absl::OkStatus();
	}

	UploadSession upload;
	upload.encoder = StreamEncoder::create(std::move(cache), interest->desc);
	uploads[interest->session_id] = std::move(upload);

	SPDLOG_DEBUG(
		"Channel {{ Remote: {} }}: Upload session {}: chunk {}, window {}",
		remote_desc.id.to_string(),
		interest->session_id,
		interest->chunk.to_string(),
		interest->desc.to_string()
	);

	return absl::OkStatus();
}

absl::Status Channel::on_resp_interest(core::Buffer const& payload) {
	auto resp = RespInterest::decode(payload);
	if(!resp.ok()) {
		return resp.status();
	}
	if(resp->err == ErrorCode::Ok) {
		return absl::OkStatus();
	}

	std::shared_ptr<DownloadSession> session;
	{
		std::lock_guard<std::mutex> guard(lock);
		auto iter = downloads.find(resp->session_id);
		if(iter == downloads.end() || iter->second->chunk() != resp->chunk) {
			return make_error(ErrorCode::NotFound, "no such download session");
		}
		session = std::move(iter->second);
		downloads.erase(iter);
	}

	SPDLOG_INFO(
		"Channel {{ Remote: {} }}: Download session {} refused: {}",
		remote_desc.id.to_string(),
		resp->session_id,
		core::error_name(resp->err)
	);
	session->set_error(make_error(resp->err, "interest refused by remote"));

	return absl::OkStatus();
}

absl::Status Channel::on_piece_data(core::Buffer&& payload, Outgoing& outgoing) {
	auto piece = PieceData::decode(std::move(payload));
	if(!piece.ok()) {
		return piece.status();
	}

	std::shared_ptr<DownloadSession> session;
	{
		std::lock_guard<std::mutex> guard(lock);
		auto iter = downloads.find(piece->session_id);
		if(iter == downloads.end()) {
			return make_error(ErrorCode::NotFound, "no such download session");
		}
		session = iter->second;
	}

	auto res = session->decoder()->push_piece_data(*piece);
	if(!res.ok()) {
		return res.status();
	}

	std::lock_guard<std::mutex> guard(lock);
	session->any_received = true;
	if(res->pushed()) {
		session->progressed = true;
		download_bytes += piece->data.size();
	}

	if(res->finished) {
		downloads.erase(session->session_id());
		session->set_finished();
		outgoing.push_back(PieceControl{session->session_id(), session->chunk(), PieceControlCommand::Finish, 0, {}}.encode());

		SPDLOG_DEBUG(
			"Channel {{ Remote: {} }}: Download session {} finished",
			remote_desc.id.to_string(),
			session->session_id()
		);
	}

	return absl::OkStatus();
}

absl::Status Channel::on_piece_control(core::Buffer const& payload) {
	auto control = PieceControl::decode(payload);
	if(!control.ok()) {
		return control.status();
	}

	std::shared_ptr<StreamEncoder> encoder;
	{
		std::lock_guard<std::mutex> guard(lock);
		auto iter = uploads.find(control->session_id);
		if(iter == uploads.end()) {
			return make_error(ErrorCode::NotFound, "no such upload session");
		}

		if(control->command != PieceControlCommand::Continue) {
			SPDLOG_DEBUG(
				"Channel {{ Remote: {} }}: Upload session {} closed by remote",
				remote_desc.id.to_string(),
				control->session_id
			);
			uploads.erase(iter);
			return absl::OkStatus();
		}

		iter->second.touched = true;
		encoder = iter->second.encoder;
	}

	SPDLOG_TRACE(
		"Channel {{ Remote: {} }}: Upload session {} continue from {}, lost ranges: {}",
		remote_desc.id.to_string(),
		control->session_id,
		control->max_index,
		control->lost.size()
	);
	encoder->merge(control->max_index, control->lost);

	return absl::OkStatus();
}

//---------------- Inbound end ----------------//

//---------------- Timer begin ----------------//

void Channel::on_time_escape(uint64_t now) {
	Outgoing outgoing;
	tick_downloads(now, outgoing);
	tick_uploads(now, outgoing);
	send_all(outgoing);

	std::lock_guard<std::mutex> guard(lock);
	if(!downloads.empty() || !uploads.empty()) {
		idle_since.reset();
	} else if(!idle_since.has_value()) {
		idle_since = now;
	}
}

bool Channel::idle_at(uint64_t now) const {
	std::lock_guard<std::mutex> guard(lock);
	return downloads.empty() && uploads.empty() &&
		idle_since.has_value() && now - *idle_since >= cfg.idle_timeout;
}

void Channel::tick_downloads(uint64_t now, Outgoing& outgoing) {
	std::vector<std::shared_ptr<DownloadSession>> timed_out;
	{
		std::lock_guard<std::mutex> guard(lock);
		for(auto iter = downloads.begin(); iter != downloads.end();) {
			auto& session = *iter->second;

			if(session.progressed || !session.last_progress.has_value()) {
				session.progressed = false;
				session.last_progress = now;
				session.last_request = now;
			}

			if(now - *session.last_progress >= cfg.download_timeout) {
				outgoing.push_back(PieceControl{session.session_id(), session.chunk(), PieceControlCommand::Cancel, 0, {}}.encode());
				timed_out.push_back(std::move(iter->second));
				iter = downloads.erase(iter);
				continue;
			}

			if(now - *session.last_request >= cfg.resend_interval) {
				session.last_request = now;
				auto const& window = session.decoder()->desc();
				if(!session.any_received) {
					outgoing.push_back(Interest{session.session_id(), session.chunk(), window}.encode());
				} else {
					auto required = session.decoder()->require_index();
					if(required.has_value()) {
						auto [start, end, step] = window.unwrap_as_stream();
						auto max_lost = PieceControl::max_lost_in(cfg.mtu);
						if(required->lost.size() > max_lost) {
							required->lost.resize(max_lost);
						}
						outgoing.push_back(PieceControl{
							session.session_id(),
							session.chunk(),
							PieceControlCommand::Continue,
							step > 0 ? end - 1 : start,
							std::move(required->lost)
						}.encode());
					}
				}
			}

			iter++;
		}
	}

	for(auto& session : timed_out) {
		SPDLOG_INFO(
			"Channel {{ Remote: {} }}: Download session {} timed out",
			remote_desc.id.to_string(),
			session->session_id()
		);
		session->set_error(make_error(ErrorCode::Timeout, "download session timed out"));
	}
}

void Channel::tick_uploads(uint64_t now, Outgoing& outgoing) {
	std::vector<std::pair<uint32_t, std::shared_ptr<StreamEncoder>>> active;
	{
		std::lock_guard<std::mutex> guard(lock);
		for(auto iter = uploads.begin(); iter != uploads.end();) {
			auto& upload = iter->second;
			if(upload.touched || !upload.last_active.has_value()) {
				upload.touched = false;
				upload.last_active = now;
			}

			if(now - *upload.last_active >= cfg.upload_idle_timeout) {
				SPDLOG_DEBUG(
					"Channel {{ Remote: {} }}: Upload session {} idle, dropped",
					remote_desc.id.to_string(),
					iter->first
				);
				iter = uploads.erase(iter);
				continue;
			}

			active.emplace_back(iter->first, upload.encoder);
			iter++;
		}
	}

	uint64_t sent = 0;
	std::vector<uint32_t> failed;
	for(auto& [session_id, encoder] : active) {
		auto header_size = PieceData::header_size(PieceDesc::range(0, encoder->desc().piece_size()));
		for(uint32_t i = 0; i < cfg.max_pieces_per_tick; i++) {
			core::Buffer buf(cfg.mtu);
			auto res = encoder->next_piece(session_id, buf.data(), buf.size());
			if(!res.ok()) {
				SPDLOG_ERROR(
					"Channel {{ Remote: {} }}: Upload session {} error: {}",
					remote_desc.id.to_string(),
					session_id,
					res.status().ToString()
				);
				if(core::error_code(res.status()) != ErrorCode::InvalidInput) {
					break;
				}
				// Piece cannot be encoded, the session cannot make progress
				failed.push_back(session_id);
				break;
			}
			if(*res == 0) {
				break;
			}

			buf.truncate_unsafe(buf.size() - *res);
			sent += *res - header_size;
			outgoing.push_back(std::move(buf));
		}
	}

	std::lock_guard<std::mutex> guard(lock);
	upload_bytes += sent;
	for(auto session_id : failed) {
		uploads.erase(session_id);
	}
}

//---------------- Timer end ----------------//

//---------------- Speed begin ----------------//

std::pair<uint32_t, uint32_t> Channel::calc_speed(uint64_t when) {
	std::lock_guard<std::mutex> guard(lock);

	if(last_calc.has_value() && when > *last_calc) {
		auto elapsed = when - *last_calc;
		cur_download = static_cast<uint32_t>(download_bytes * 1000 / elapsed);
		cur_upload = static_cast<uint32_t>(upload_bytes * 1000 / elapsed);
	} else {
		cur_download = 0;
		cur_upload = 0;
	}
	last_calc = when;
	download_active = !downloads.empty() || download_bytes > 0;
	upload_active = !uploads.empty() || upload_bytes > 0;
	download_bytes = 0;
	upload_bytes = 0;

	download_history.update(
		download_active ? std::optional<uint32_t>(cur_download) : std::nullopt,
		when
	);
	upload_history.update(
		upload_active ? std::optional<uint32_t>(cur_upload) : std::nullopt,
		when
	);

	return std::make_pair(cur_download, cur_upload);
}

uint32_t Channel::cur_download_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return cur_download;
}

uint32_t Channel::cur_upload_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return cur_upload;
}

uint32_t Channel::history_download_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return download_history.average();
}

uint32_t Channel::history_upload_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return upload_history.average();
}

bool Channel::had_download() const {
	std::lock_guard<std::mutex> guard(lock);
	return download_active;
}

bool Channel::had_upload() const {
	std::lock_guard<std::mutex> guard(lock);
	return upload_active;
}

size_t Channel::download_session_count() const {
	std::lock_guard<std::mutex> guard(lock);
	return downloads.size();
}

size_t Channel::upload_session_count() const {
	std::lock_guard<std::mutex> guard(lock);
	return uploads.size();
}

//---------------- Speed end ----------------//

} // namespace ndn
} // namespace chunkflow
