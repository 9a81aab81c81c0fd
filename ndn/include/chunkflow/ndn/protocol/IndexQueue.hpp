/*! \file IndexQueue.hpp
	\brief Piece index bookkeeping of the receiving and of the sending side
*/

#ifndef CHUNKFLOW_NDN_INDEXQUEUE_HPP
#define CHUNKFLOW_NDN_INDEXQUEUE_HPP

#include <stdint.h>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {
namespace ndn {

/// Half open range of piece indices
struct IndexRange {
	uint32_t start = 0;
	uint32_t end = 0;

	uint32_t len() const {
		return end > start ? end - start : 0;
	}

	bool empty() const {
		return end <= start;
	}

	bool operator==(IndexRange const& other) const {
		return start == other.start && end == other.end;
	}

	std::string to_string() const {
		return std::to_string(start) + ".." + std::to_string(end);
	}
};

struct PushIndexResult {
	/// Range is inside the index space
	bool valid = false;
	/// Range was already reserved or committed
	bool exists = false;
	/// Every index of the queue is committed
	bool finished = false;

	bool pushed() const {
		return valid && !exists;
	}
};

/// Missing pieces of a window
struct RequireIndex {
	/// First missing index in iteration order
	uint32_t next;
	/// Missing sub-ranges, ascending
	std::vector<IndexRange> lost;
};

//! Receive side index space [0, piece_count)
/*!
	An index goes through reserved (a writer owns it) to committed (its bytes are
	durably written). Reservation is exclusive: a reserved index looks like an
	existing one to every other pusher until it is committed or unreserved.

	Not synchronized, the owning cache guards it.
*/
class IncomeIndexQueue {
private:
	uint32_t count;
	std::vector<bool> reserved;
	std::vector<bool> committed;
	uint32_t committed_num = 0;

	bool in_bounds(IndexRange const& range) const {
		return range.start < range.end && range.end <= count;
	}

public:
	IncomeIndexQueue(uint64_t chunk_len, uint16_t piece_size);

	uint32_t piece_count() const {
		return count;
	}

	uint32_t committed_count() const {
		return committed_num;
	}

	bool finished() const {
		return committed_num == count;
	}

	/// Reserve every index of range for the caller
	PushIndexResult try_push(IndexRange const& range);
	/// Commit a range reserved by try_push
	PushIndexResult push(IndexRange const& range);
	/// Release a reservation whose write failed
	void unreserve(IndexRange const& range);
	/// Commit every index
	void fill();

	bool exists(uint32_t index) const;

	/// Missing indices of the window [start, end) walked by step, nullopt if none
	std::optional<RequireIndex> require(uint32_t start, uint32_t end, int32_t step) const;
};

//! Send side cursor over [start, end) walked in the direction of step
/*!
	Pending indices are kept as ranges in iteration order. Popped indices are not
	revisited until the next reset.
*/
class OutcomeIndexQueue {
private:
	uint32_t start;
	uint32_t end;
	int32_t step;
	std::deque<IndexRange> pending;

	bool forward() const {
		return step > 0;
	}

public:
	OutcomeIndexQueue(uint32_t start, uint32_t end, int32_t step);

	std::optional<uint32_t> next() const;
	std::optional<uint32_t> pop_next();

	/// Rewind to [start, end)
	void reset();

	bool empty() const {
		return pending.empty();
	}

	/// Number of pending indices
	uint32_t remaining() const;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_INDEXQUEUE_HPP
