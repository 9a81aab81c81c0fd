/*! \file Config.hpp
	\brief Tunables of the transfer engine, defaults overridable at compile time
*/

#ifndef CHUNKFLOW_NDN_CONFIG_HPP
#define CHUNKFLOW_NDN_CONFIG_HPP

#include <chunkflow/core/HistorySpeed.hpp>

#include <stdint.h>

#ifndef CHUNKFLOW_NDN_DEFAULT_PIECE_SIZE
#define CHUNKFLOW_NDN_DEFAULT_PIECE_SIZE 1024
#endif

#ifndef CHUNKFLOW_NDN_DEFAULT_MTU
#define CHUNKFLOW_NDN_DEFAULT_MTU 1400
#endif

#ifndef CHUNKFLOW_NDN_DEFAULT_RESEND_INTERVAL
#define CHUNKFLOW_NDN_DEFAULT_RESEND_INTERVAL 500
#endif

#ifndef CHUNKFLOW_NDN_DEFAULT_DOWNLOAD_TIMEOUT
#define CHUNKFLOW_NDN_DEFAULT_DOWNLOAD_TIMEOUT 10000
#endif

#ifndef CHUNKFLOW_NDN_DEFAULT_UPLOAD_IDLE_TIMEOUT
#define CHUNKFLOW_NDN_DEFAULT_UPLOAD_IDLE_TIMEOUT 30000
#endif

#ifndef CHUNKFLOW_NDN_DEFAULT_CHANNEL_IDLE_TIMEOUT
#define CHUNKFLOW_NDN_DEFAULT_CHANNEL_IDLE_TIMEOUT 60000
#endif

#ifndef CHUNKFLOW_NDN_DEFAULT_PIECES_PER_TICK
#define CHUNKFLOW_NDN_DEFAULT_PIECES_PER_TICK 64
#endif

#ifndef CHUNKFLOW_NDN_DEFAULT_TIMER_INTERVAL
#define CHUNKFLOW_NDN_DEFAULT_TIMER_INTERVAL 10
#endif

#ifndef CHUNKFLOW_NDN_DEFAULT_SCHEDULE_INTERVAL
#define CHUNKFLOW_NDN_DEFAULT_SCHEDULE_INTERVAL 1000
#endif

namespace chunkflow {
namespace ndn {

struct ChannelConfig {
	core::HistorySpeedConfig history_speed;
	/// ms without a piece before a download session asks again
	uint64_t resend_interval = CHUNKFLOW_NDN_DEFAULT_RESEND_INTERVAL;
	/// ms without progress before a download session fails
	uint64_t download_timeout = CHUNKFLOW_NDN_DEFAULT_DOWNLOAD_TIMEOUT;
	/// ms without control before an upload session is dropped
	uint64_t upload_idle_timeout = CHUNKFLOW_NDN_DEFAULT_UPLOAD_IDLE_TIMEOUT;
	/// ms without any session before the channel is retired
	uint64_t idle_timeout = CHUNKFLOW_NDN_DEFAULT_CHANNEL_IDLE_TIMEOUT;
	/// Pieces an upload session may emit per timer tick
	uint32_t max_pieces_per_tick = CHUNKFLOW_NDN_DEFAULT_PIECES_PER_TICK;
	/// Largest datagram sent on the command tunnel
	uint16_t mtu = CHUNKFLOW_NDN_DEFAULT_MTU;
};

struct NdnConfig {
	/// Piece size of newly created caches, must fit a PieceData in the mtu
	uint16_t piece_size = CHUNKFLOW_NDN_DEFAULT_PIECE_SIZE;
	ChannelConfig channel;
	/// Smoothing of per chunk download speed
	core::HistorySpeedConfig download_speed;
	/// ms between send/resend ticks
	uint64_t timer_interval = CHUNKFLOW_NDN_DEFAULT_TIMER_INTERVAL;
	/// ms between speed aggregation and download scheduling
	uint64_t schedule_interval = CHUNKFLOW_NDN_DEFAULT_SCHEDULE_INTERVAL;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_CONFIG_HPP
