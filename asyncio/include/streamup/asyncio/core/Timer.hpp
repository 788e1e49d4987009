/*! \file Timer.hpp
*/

#ifndef STREAMUP_ASYNCIO_TIMER_HPP
#define STREAMUP_ASYNCIO_TIMER_HPP

#include <uv.h>
#include <stdint.h>

namespace streamup {
namespace asyncio {

/// One shot or repeating timer on the default loop, calling back into a delegate member function
class Timer {
private:
	using Self = Timer;

	uv_timer_t* timer;

	static void timer_close_cb(uv_handle_t* handle) {
		delete (uv_timer_t*)handle;
	}

	template<typename DelegateType, void (DelegateType::*callback)()>
	static void timer_cb(uv_timer_t* handle) {
		auto& timer = *(Self*)handle->data;
		(((DelegateType*)(timer.delegate))->*callback)();
	}
public:
	void* delegate;

	template<typename DelegateType>
	Timer(DelegateType* delegate) : delegate(delegate) {
		timer = new uv_timer_t();
		timer->data = this;
		uv_timer_init(uv_default_loop(), timer);
	}

	Timer(Timer const&) = delete;
	Timer& operator=(Timer const&) = delete;

	template<typename DelegateType, void (DelegateType::*callback)()>
	void start(uint64_t timeout, uint64_t repeat) {
		uv_timer_start(timer, timer_cb<DelegateType, callback>, timeout, repeat);
	}

	void stop() {
		uv_timer_stop(timer);
	}

	~Timer() {
		uv_timer_stop(timer);
		uv_close((uv_handle_t*)timer, timer_close_cb);
	}
};

} // namespace asyncio
} // namespace streamup

#endif // STREAMUP_ASYNCIO_TIMER_HPP
