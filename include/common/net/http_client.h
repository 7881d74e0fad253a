#pragma once

#include <curl/curl.h>
#include <uv.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace CVW {

class Timer;

struct HttpResponse {
	long status = 0;
	std::string body;
	std::string error;  // transport error, empty when a status line was received

	bool TransportFailed() const { return !error.empty(); }
	bool Ok() const { return error.empty() && status >= 200 && status < 300; }
};

using HttpRequestId = uint64_t;
using HttpCallback = std::function<void(const HttpResponse &)>;

// Asynchronous HTTP client. Transfers run on libcurl's multi interface and
// their sockets are watched by the EventLoop, so completions are delivered
// from EventLoop::Process() on the loop thread.
class HttpClient {
public:
	HttpClient();
	~HttpClient();

	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;

	// False when libcurl could not be initialized; every request then
	// completes immediately with a transport error.
	bool IsReady() const { return m_multi != nullptr; }

	// Existence check without a body. Returns 0 when the request could not be
	// queued (the callback has already run with the error).
	HttpRequestId Head(const std::string &url, HttpCallback cb);
	HttpRequestId Get(const std::string &url, HttpCallback cb);

	// Drops a transfer; its callback will not run.
	void Cancel(HttpRequestId id);

	void SetTimeoutMs(long timeout_ms) { m_timeout_ms = timeout_ms; }
	void SetUserAgent(const std::string &agent) { m_user_agent = agent; }

	size_t InFlight() const { return m_transfers.size(); }

private:
	struct Transfer {
		HttpRequestId id = 0;
		CURL *easy = nullptr;
		HttpCallback cb;
		HttpResponse response;
		char error_buffer[CURL_ERROR_SIZE] = {};
	};

	struct SocketContext {
		uv_poll_t poll;
		curl_socket_t fd;
		HttpClient *owner;
	};

	HttpRequestId Start(const std::string &url, bool head_only, HttpCallback cb);
	void Release(Transfer &transfer);
	void CheckMultiInfo();

	static int OnSocket(CURL *easy, curl_socket_t s, int action, void *userp, void *socketp);
	static int OnTimer(CURLM *multi, long timeout_ms, void *userp);
	static void OnPoll(uv_poll_t *handle, int status, int events);
	static size_t OnWrite(char *ptr, size_t size, size_t nmemb, void *userdata);

	CURLM *m_multi = nullptr;
	std::unique_ptr<Timer> m_timeout;
	std::map<HttpRequestId, std::unique_ptr<Transfer>> m_transfers;
	HttpRequestId m_next_id = 1;
	long m_timeout_ms = 15000;
	std::string m_user_agent = "champview/1.0";
};

} // namespace CVW
