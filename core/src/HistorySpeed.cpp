#include "chunkflow/core/HistorySpeed.hpp"

#include <cmath>

namespace chunkflow {
namespace core {

HistorySpeed::HistorySpeed(uint32_t initial, HistorySpeedConfig const& config) :
cfg(config), average_speed(initial) {}

void HistorySpeed::update(std::optional<uint32_t> cur_speed, uint64_t when) {
	uint64_t slots = 1;
	if(last_update.has_value()) {
		if(when <= *last_update || cfg.atomic == 0) {
			return;
		}
		slots = (when - *last_update) / cfg.atomic;
		if(slots == 0) {
			return;
		}
		*last_update += slots * cfg.atomic;
	} else {
		last_update = when;
		last_sample = when;
	}

	double decay = std::pow(cfg.attenuation, static_cast<double>(slots));
	if(cur_speed.has_value()) {
		average_speed = average_speed * decay + *cur_speed * (1 - decay);
		last_sample = when;
	} else {
		average_speed *= decay;
		if(when - last_sample >= cfg.expire) {
			average_speed = 0;
		}
	}
}

uint32_t HistorySpeed::average() const {
	return static_cast<uint32_t>(std::lround(average_speed));
}

} // namespace core
} // namespace chunkflow
