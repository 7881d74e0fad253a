#include "common/event/timer.h"
#include "common/event/event_loop.h"
#include "common/logging.h"

#include <cstring>

namespace CVW {

Timer::Timer(std::function<void(Timer *)> cb)
	: m_timer(nullptr), m_cb(std::move(cb))
{
}

Timer::Timer(uint64_t duration_ms, bool repeats, std::function<void(Timer *)> cb)
	: m_timer(nullptr), m_cb(std::move(cb))
{
	Start(duration_ms, repeats);
}

Timer::~Timer()
{
	Stop();
}

void Timer::Start(uint64_t duration_ms, bool repeats)
{
	if (m_timer) {
		return;
	}

	auto loop = EventLoop::Get().Handle();
	m_timer = new uv_timer_t;
	memset(m_timer, 0, sizeof(uv_timer_t));
	uv_timer_init(loop, m_timer);
	m_timer->data = this;

	int rc;
	if (repeats) {
		rc = uv_timer_start(m_timer, [](uv_timer_t *handle) {
			Timer *t = static_cast<Timer *>(handle->data);
			t->Execute();
		}, duration_ms, duration_ms);
	}
	else {
		rc = uv_timer_start(m_timer, [](uv_timer_t *handle) {
			Timer *t = static_cast<Timer *>(handle->data);
			t->Stop();
			t->Execute();
		}, duration_ms, 0);
	}

	if (rc != 0) {
		LOG_ERROR(MOD_NET, "uv_timer_start failed: {}", uv_strerror(rc));
		Stop();
	}
}

void Timer::Stop()
{
	if (m_timer) {
		uv_timer_stop(m_timer);
		uv_close(reinterpret_cast<uv_handle_t *>(m_timer), [](uv_handle_t *handle) {
			delete reinterpret_cast<uv_timer_t *>(handle);
		});
		m_timer = nullptr;
	}
}

void Timer::Execute()
{
	if (m_cb) {
		m_cb(this);
	}
}

} // namespace CVW
