/*! \file Timer.hpp
*/

#ifndef CHUNKFLOW_ASYNCIO_TIMER_HPP
#define CHUNKFLOW_ASYNCIO_TIMER_HPP

#include <uv.h>
#include <functional>
#include <utility>

namespace chunkflow {
namespace asyncio {

//! libuv timer on the default loop
/*!
	Callbacks are either a member function of a delegate, or a plain closure.
	The timer may be destroyed from inside its own callback.
*/
class Timer {
private:
	using Self = Timer;

	uv_timer_t* timer;
	std::function<void()> callback;

	static void timer_close_cb(uv_handle_t* handle) {
		delete (uv_timer_t*)handle;
	}

	static void timer_cb(uv_timer_t* handle) {
		auto& timer = *(Self*)handle->data;
		// Copy, the timer could be destroyed by the callback
		auto cb = timer.callback;
		cb();
	}

	template<typename DelegateType, void (DelegateType::*callback)()>
	static void delegate_timer_cb(uv_timer_t* handle) {
		auto& timer = *(Self*)handle->data;
		(((DelegateType*)(timer.delegate))->*callback)();
	}
public:
	void* delegate = nullptr;

	Timer() {
		timer = new uv_timer_t();
		timer->data = this;
		uv_timer_init(uv_default_loop(), timer);
	}

	template<typename DelegateType>
	Timer(DelegateType* delegate) : Timer() {
		this->delegate = delegate;
	}

	Timer(Timer const&) = delete;
	Timer& operator=(Timer const&) = delete;

	template<typename DelegateType, void (DelegateType::*callback)()>
	void start(uint64_t timeout, uint64_t repeat) {
		uv_timer_start(timer, delegate_timer_cb<DelegateType, callback>, timeout, repeat);
	}

	void start(uint64_t timeout, uint64_t repeat, std::function<void()> cb) {
		callback = std::move(cb);
		uv_timer_start(timer, timer_cb, timeout, repeat);
	}

	void stop() {
		uv_timer_stop(timer);
	}

	bool is_active() const {
		return uv_is_active((uv_handle_t*)timer) != 0;
	}

	~Timer() {
		uv_timer_stop(timer);
		timer->data = nullptr;
		uv_close((uv_handle_t*)timer, timer_close_cb);
	}
};

} // namespace asyncio
} // namespace chunkflow

#endif // CHUNKFLOW_ASYNCIO_TIMER_HPP
