#include "common/event/event_loop.h"
#include "common/logging.h"

#include <cstring>

namespace CVW {

EventLoop &EventLoop::Get()
{
	static thread_local EventLoop inst;
	return inst;
}

EventLoop::EventLoop()
{
	memset(&m_loop, 0, sizeof(uv_loop_t));
	int rc = uv_loop_init(&m_loop);
	if (rc != 0) {
		LOG_FATAL(MOD_NET, "uv_loop_init failed: {}", uv_strerror(rc));
	}
}

EventLoop::~EventLoop()
{
	// Drain pending close callbacks before closing the loop
	uv_run(&m_loop, UV_RUN_NOWAIT);
	int rc = uv_loop_close(&m_loop);
	if (rc != 0) {
		LOG_DEBUG(MOD_NET, "uv_loop_close: {}", uv_strerror(rc));
	}
}

void EventLoop::Process()
{
	uv_run(&m_loop, UV_RUN_NOWAIT);
}

bool EventLoop::RunOnce()
{
	return uv_run(&m_loop, UV_RUN_ONCE) != 0;
}

void EventLoop::Run()
{
	uv_run(&m_loop, UV_RUN_DEFAULT);
}

} // namespace CVW
