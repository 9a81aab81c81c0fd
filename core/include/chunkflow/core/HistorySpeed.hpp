/*! \file HistorySpeed.hpp
	\brief Exponentially smoothed throughput estimate
*/

#ifndef CHUNKFLOW_CORE_HISTORYSPEED_HPP
#define CHUNKFLOW_CORE_HISTORYSPEED_HPP

#include <stdint.h>
#include <optional>

#ifndef CHUNKFLOW_CORE_DEFAULT_SPEED_ATTENUATION
#define CHUNKFLOW_CORE_DEFAULT_SPEED_ATTENUATION 0.5
#endif

#ifndef CHUNKFLOW_CORE_DEFAULT_SPEED_ATOMIC
#define CHUNKFLOW_CORE_DEFAULT_SPEED_ATOMIC 1000
#endif

#ifndef CHUNKFLOW_CORE_DEFAULT_SPEED_EXPIRE
#define CHUNKFLOW_CORE_DEFAULT_SPEED_EXPIRE 20000
#endif

namespace chunkflow {
namespace core {

struct HistorySpeedConfig {
	/// Weight kept by the history on every elapsed slot
	double attenuation = CHUNKFLOW_CORE_DEFAULT_SPEED_ATTENUATION;
	/// Slot length in ms
	uint64_t atomic = CHUNKFLOW_CORE_DEFAULT_SPEED_ATOMIC;
	/// History is dropped after this many ms without a sample
	uint64_t expire = CHUNKFLOW_CORE_DEFAULT_SPEED_EXPIRE;
};

//! Smoothed speed in bytes per second
/*!
	Every elapsed slot decays the history by the attenuation factor. A slot with a
	sample moves the history toward the sample, a slot without one only decays it.
	Updates inside the current slot are ignored.
*/
class HistorySpeed {
private:
	HistorySpeedConfig cfg;
	double average_speed;
	std::optional<uint64_t> last_update;
	uint64_t last_sample = 0;

public:
	HistorySpeed(uint32_t initial, HistorySpeedConfig const& config);

	/// Feed the speed measured at when (ms), nullopt if there was nothing to measure
	void update(std::optional<uint32_t> cur_speed, uint64_t when);

	uint32_t average() const;

	HistorySpeedConfig const& config() const {
		return cfg;
	}
};

} // namespace core
} // namespace chunkflow

#endif // CHUNKFLOW_CORE_HISTORYSPEED_HPP
