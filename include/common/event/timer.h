#pragma once

#include <uv.h>
#include <cstdint>
#include <functional>

namespace CVW {

// One-shot or repeating timer on the EventLoop. The callback may restart or
// stop the timer that invoked it.
class Timer {
public:
	explicit Timer(std::function<void(Timer *)> cb);
	Timer(uint64_t duration_ms, bool repeats, std::function<void(Timer *)> cb);
	~Timer();

	Timer(const Timer &) = delete;
	Timer &operator=(const Timer &) = delete;

	void Start(uint64_t duration_ms, bool repeats);
	void Stop();

	bool IsRunning() const { return m_timer != nullptr; }

private:
	void Execute();

	uv_timer_t *m_timer;
	std::function<void(Timer *)> m_cb;
};

} // namespace CVW
