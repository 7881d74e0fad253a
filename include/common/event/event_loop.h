#pragma once

#include <uv.h>

namespace CVW {

// Process-wide libuv loop. Everything asynchronous in the viewer (HTTP
// transfers, image load timeouts) is scheduled here and runs on the thread
// that pumps it.
class EventLoop {
public:
	static EventLoop &Get();

	~EventLoop();

	EventLoop(const EventLoop &) = delete;
	EventLoop &operator=(const EventLoop &) = delete;

	// Run one non-blocking iteration (call once per frame)
	void Process();

	// Block until at least one event was handled. Returns false once no
	// active handles remain.
	bool RunOnce();

	// Run until no active handles remain
	void Run();

	uv_loop_t *Handle() { return &m_loop; }

private:
	EventLoop();

	uv_loop_t m_loop;
};

} // namespace CVW
