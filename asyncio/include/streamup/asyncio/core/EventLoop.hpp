/*! \file EventLoop.hpp
*/

#ifndef STREAMUP_ASYNCIO_EVENTLOOP_HPP
#define STREAMUP_ASYNCIO_EVENTLOOP_HPP

#include <uv.h>

namespace streamup {
namespace asyncio {

class EventLoop {
public:
	static int run() {
		return uv_run(uv_default_loop(), UV_RUN_DEFAULT);
	}
};

} // namespace asyncio
} // namespace streamup

#endif // STREAMUP_ASYNCIO_EVENTLOOP_HPP
