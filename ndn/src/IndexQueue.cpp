#include "chunkflow/ndn/protocol/IndexQueue.hpp"

#include <algorithm>

namespace chunkflow {
namespace ndn {

//---------------- IncomeIndexQueue begin ----------------//

IncomeIndexQueue::IncomeIndexQueue(uint64_t chunk_len, uint16_t piece_size) :
count(piece_size == 0 ? 0 : static_cast<uint32_t>((chunk_len + piece_size - 1) / piece_size)),
reserved(count, false),
committed(count, false) {}

PushIndexResult IncomeIndexQueue::try_push(IndexRange const& range) {
	PushIndexResult res;
	if(!in_bounds(range)) {
		return res;
	}
	res.valid = true;

	for(auto i = range.start; i < range.end; i++) {
		if(reserved[i] || committed[i]) {
			res.exists = true;
			res.finished = finished();
			return res;
		}
	}

	for(auto i = range.start; i < range.end; i++) {
		reserved[i] = true;
	}
	return res;
}

PushIndexResult IncomeIndexQueue::push(IndexRange const& range) {
	PushIndexResult res;
	if(!in_bounds(range)) {
		return res;
	}
	res.valid = true;

	bool any_new = false;
	for(auto i = range.start; i < range.end; i++) {
		reserved[i] = false;
		if(!committed[i]) {
			committed[i] = true;
			committed_num++;
			any_new = true;
		}
	}

	res.exists = !any_new;
	res.finished = finished();
	return res;
}

void IncomeIndexQueue::unreserve(IndexRange const& range) {
	auto end = std::min(range.end, count);
	for(auto i = range.start; i < end; i++) {
		reserved[i] = false;
	}
}

void IncomeIndexQueue::fill() {
	std::fill(reserved.begin(), reserved.end(), false);
	std::fill(committed.begin(), committed.end(), true);
	committed_num = count;
}

bool IncomeIndexQueue::exists(uint32_t index) const {
	return index < count && committed[index];
}

std::optional<RequireIndex> IncomeIndexQueue::require(uint32_t start, uint32_t end, int32_t step) const {
	end = std::min(end, count);
	if(start >= end) {
		return std::nullopt;
	}

	std::vector<IndexRange> lost;
	for(auto i = start; i < end; i++) {
		if(committed[i]) {
			continue;
		}
		if(!lost.empty() && lost.back().end == i) {
			lost.back().end = i + 1;
		} else {
			lost.push_back(IndexRange{i, i + 1});
		}
	}

	if(lost.empty()) {
		return std::nullopt;
	}

	uint32_t next = step < 0 ? lost.back().end - 1 : lost.front().start;
	return RequireIndex{next, std::move(lost)};
}

//---------------- IncomeIndexQueue end ----------------//

//---------------- OutcomeIndexQueue begin ----------------//

OutcomeIndexQueue::OutcomeIndexQueue(uint32_t start, uint32_t end, int32_t step) :
start(start), end(end), step(step) {
	reset();
}

std::optional<uint32_t> OutcomeIndexQueue::next() const {
	if(pending.empty()) {
		return std::nullopt;
	}

	auto& head = pending.front();
	return forward() ? head.start : head.end - 1;
}

std::optional<uint32_t> OutcomeIndexQueue::pop_next() {
	auto index = next();
	if(!index.has_value()) {
		return std::nullopt;
	}

	auto& head = pending.front();
	if(forward()) {
		head.start++;
	} else {
		head.end--;
	}
	if(head.empty()) {
		pending.pop_front();
	}

	return index;
}

void OutcomeIndexQueue::reset() {
	pending.clear();
	if(start < end) {
		pending.push_back(IndexRange{start, end});
	}
}

uint32_t OutcomeIndexQueue::remaining() const {
	uint32_t res = 0;
	for(auto const& range : pending) {
		res += range.len();
	}
	return res;
}

//---------------- OutcomeIndexQueue end ----------------//

} // namespace ndn
} // namespace chunkflow
