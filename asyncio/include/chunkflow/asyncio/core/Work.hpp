/*! \file Work.hpp
	\brief Run blocking work on the libuv thread pool
*/

#ifndef CHUNKFLOW_ASYNCIO_WORK_HPP
#define CHUNKFLOW_ASYNCIO_WORK_HPP

#include <uv.h>
#include <spdlog/spdlog.h>

#include <functional>
#include <utility>

namespace chunkflow {
namespace asyncio {

//! Queue work on the thread pool, done is then invoked on the loop thread
/*!
	\param work runs on a pool thread
	\param done runs on the loop thread with 0, or a libuv error code if the work was canceled
	\return 0 on success, libuv error code otherwise (done is not invoked)
*/
inline int queue_work(std::function<void()> work, std::function<void(int)> done) {
	struct WorkPayload {
		std::function<void()> work;
		std::function<void(int)> done;
	};

	auto* req = new uv_work_t();
	req->data = new WorkPayload{std::move(work), std::move(done)};

	int res = uv_queue_work(
		uv_default_loop(),
		req,
		[](uv_work_t* req) {
			((WorkPayload*)req->data)->work();
		},
		[](uv_work_t* req, int status) {
			auto* payload = (WorkPayload*)req->data;
			payload->done(status);
			delete payload;
			delete req;
		}
	);

	if(res < 0) {
		SPDLOG_ERROR("Asyncio: Queue work error: {}", uv_strerror(res));
		delete (WorkPayload*)req->data;
		delete req;
	}

	return res;
}

} // namespace asyncio
} // namespace chunkflow

#endif // CHUNKFLOW_ASYNCIO_WORK_HPP
