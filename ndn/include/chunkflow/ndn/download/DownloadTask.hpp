/*! \file DownloadTask.hpp
	\brief Task interface seen by the outer task management layer
*/

#ifndef CHUNKFLOW_NDN_DOWNLOADTASK_HPP
#define CHUNKFLOW_NDN_DOWNLOADTASK_HPP

#include <absl/status/status.h>

#include <stdint.h>
#include <functional>
#include <utility>
#include <vector>

namespace chunkflow {
namespace ndn {

enum class DownloadTaskControlState {
	Normal,
	Canceled
};

enum class DownloadTaskPriority : uint8_t {
	Background = 1,
	Normal = 2,
	Realtime = 4
};

struct DownloadTaskState {
	enum class Type {
		Downloading,
		Error,
		Finished
	};

	Type type = Type::Downloading;
	/// Bytes per second, Downloading only
	uint32_t speed = 0;
	/// Fraction of bytes held, Downloading only
	float progress = 0;
	/// Error only
	absl::Status error;

	static DownloadTaskState downloading(uint32_t speed, float progress) {
		return DownloadTaskState{Type::Downloading, speed, progress, absl::OkStatus()};
	}

	static DownloadTaskState failed(absl::Status error) {
		return DownloadTaskState{Type::Error, 0, 0, std::move(error)};
	}

	static DownloadTaskState finished() {
		return DownloadTaskState{Type::Finished, 0, 1, absl::OkStatus()};
	}
};

//! Callbacks waiting for a state change
/*!
	transfer hands the registered callbacks over once, wake them outside any lock.
*/
class StateWaiter {
private:
	std::vector<std::function<void()>> waiters;

public:
	void new_waiter(std::function<void()> waiter) {
		waiters.push_back(std::move(waiter));
	}

	std::vector<std::function<void()>> transfer() {
		return std::move(waiters);
	}

	static void wake(std::vector<std::function<void()>>& waiters) {
		for(auto& waiter : waiters) {
			waiter();
		}
		waiters.clear();
	}
};

class DownloadTask {
public:
	using CanceledCallback = std::function<void(absl::Status)>;

	virtual ~DownloadTask() = default;

	virtual DownloadTaskState state() const = 0;
	virtual DownloadTaskControlState control_state() const = 0;
	virtual uint8_t priority_score() const {
		return static_cast<uint8_t>(DownloadTaskPriority::Normal);
	}

	/// Speed accessors report 0 unless downloading
	virtual uint32_t calc_speed(uint64_t when) = 0;
	virtual uint32_t cur_speed() const = 0;
	virtual uint32_t history_speed() const = 0;
	virtual int64_t drain_score() const = 0;
	virtual uint32_t on_drain(uint32_t expect) = 0;

	/// Idempotent, returns Canceled
	virtual DownloadTaskControlState cancel() = 0;
	/// cb receives UserCanceled once the task is canceled
	virtual void wait_user_canceled(CanceledCallback cb) = 0;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_DOWNLOADTASK_HPP
