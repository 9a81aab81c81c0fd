/*! \file EventLoop.hpp
*/

#ifndef CHUNKFLOW_ASYNCIO_EVENTLOOP_HPP
#define CHUNKFLOW_ASYNCIO_EVENTLOOP_HPP

#include <uv.h>
#include <stdint.h>

namespace chunkflow {
namespace asyncio {

class EventLoop {
public:
	static int run() {
		return uv_run(uv_default_loop(), UV_RUN_DEFAULT);
	}

	/// Run a single iteration without blocking
	static int run_nowait() {
		return uv_run(uv_default_loop(), UV_RUN_NOWAIT);
	}

	static void stop() {
		uv_stop(uv_default_loop());
	}

	/// Loop time in ms
	static uint64_t now() {
		return uv_now(uv_default_loop());
	}

	static void update_time() {
		uv_update_time(uv_default_loop());
	}
};

} // namespace asyncio
} // namespace chunkflow

#endif // CHUNKFLOW_ASYNCIO_EVENTLOOP_HPP
