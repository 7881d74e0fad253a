#include "common/net/http_client.h"
#include "common/event/event_loop.h"
#include "common/event/timer.h"
#include "common/logging.h"

namespace {

bool g_curl_initialized = false;

bool EnsureCurlGlobal()
{
	if (!g_curl_initialized) {
		CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) {
			LOG_ERROR(MOD_HTTP, "curl_global_init failed: {}", curl_easy_strerror(rc));
			return false;
		}
		g_curl_initialized = true;
	}
	return true;
}

} // namespace

namespace CVW {

HttpClient::HttpClient()
{
	m_timeout = std::make_unique<Timer>([this](Timer *) {
		if (!m_multi) {
			return;
		}
		int running = 0;
		curl_multi_socket_action(m_multi, CURL_SOCKET_TIMEOUT, 0, &running);
		CheckMultiInfo();
	});

	if (!EnsureCurlGlobal()) {
		return;
	}

	m_multi = curl_multi_init();
	if (!m_multi) {
		LOG_ERROR(MOD_HTTP, "curl_multi_init failed");
		return;
	}

	curl_multi_setopt(m_multi, CURLMOPT_SOCKETFUNCTION, &HttpClient::OnSocket);
	curl_multi_setopt(m_multi, CURLMOPT_SOCKETDATA, this);
	curl_multi_setopt(m_multi, CURLMOPT_TIMERFUNCTION, &HttpClient::OnTimer);
	curl_multi_setopt(m_multi, CURLMOPT_TIMERDATA, this);
}

HttpClient::~HttpClient()
{
	for (auto &kv : m_transfers) {
		Release(*kv.second);
	}
	m_transfers.clear();
	m_timeout->Stop();

	if (m_multi) {
		curl_multi_cleanup(m_multi);
		m_multi = nullptr;
	}
}

HttpRequestId HttpClient::Head(const std::string &url, HttpCallback cb)
{
	return Start(url, true, std::move(cb));
}

HttpRequestId HttpClient::Get(const std::string &url, HttpCallback cb)
{
	return Start(url, false, std::move(cb));
}

HttpRequestId HttpClient::Start(const std::string &url, bool head_only, HttpCallback cb)
{
	HttpResponse failed;
	if (!m_multi) {
		failed.error = "http client not initialized";
		cb(failed);
		return 0;
	}

	auto transfer = std::make_unique<Transfer>();
	transfer->easy = curl_easy_init();
	if (!transfer->easy) {
		LOG_ERROR(MOD_HTTP, "curl_easy_init failed for {}", url);
		failed.error = "curl_easy_init failed";
		cb(failed);
		return 0;
	}

	transfer->id = m_next_id++;
	transfer->cb = std::move(cb);

	CURL *easy = transfer->easy;
	curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
	curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(easy, CURLOPT_MAXREDIRS, 5L);
	curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, m_timeout_ms);
	curl_easy_setopt(easy, CURLOPT_USERAGENT, m_user_agent.c_str());
	curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, transfer->error_buffer);
	curl_easy_setopt(easy, CURLOPT_PRIVATE, transfer.get());
	if (head_only) {
		curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
	}
	else {
		curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &HttpClient::OnWrite);
		curl_easy_setopt(easy, CURLOPT_WRITEDATA, &transfer->response.body);
	}

	CURLMcode rc = curl_multi_add_handle(m_multi, easy);
	if (rc != CURLM_OK) {
		LOG_ERROR(MOD_HTTP, "curl_multi_add_handle failed for {}: {}", url, curl_multi_strerror(rc));
		curl_easy_cleanup(easy);
		failed.error = curl_multi_strerror(rc);
		transfer->cb(failed);
		return 0;
	}

	LOG_TRACE(MOD_HTTP, "{} {} (id {})", head_only ? "HEAD" : "GET", url, transfer->id);

	HttpRequestId id = transfer->id;
	m_transfers.emplace(id, std::move(transfer));
	return id;
}

void HttpClient::Cancel(HttpRequestId id)
{
	auto it = m_transfers.find(id);
	if (it == m_transfers.end()) {
		return;
	}

	LOG_TRACE(MOD_HTTP, "Cancel request {}", id);
	Release(*it->second);
	m_transfers.erase(it);
}

void HttpClient::Release(Transfer &transfer)
{
	if (transfer.easy) {
		curl_multi_remove_handle(m_multi, transfer.easy);
		curl_easy_cleanup(transfer.easy);
		transfer.easy = nullptr;
	}
}

void HttpClient::CheckMultiInfo()
{
	CURLMsg *msg = nullptr;
	int pending = 0;

	while ((msg = curl_multi_info_read(m_multi, &pending))) {
		if (msg->msg != CURLMSG_DONE) {
			continue;
		}

		Transfer *raw = nullptr;
		curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &raw);
		if (!raw) {
			continue;
		}

		auto it = m_transfers.find(raw->id);
		if (it == m_transfers.end()) {
			continue;
		}

		std::unique_ptr<Transfer> transfer = std::move(it->second);
		m_transfers.erase(it);

		if (msg->data.result != CURLE_OK) {
			transfer->response.error = transfer->error_buffer[0] != '\0'
				? std::string(transfer->error_buffer)
				: std::string(curl_easy_strerror(msg->data.result));
		}
		else {
			curl_easy_getinfo(transfer->easy, CURLINFO_RESPONSE_CODE, &transfer->response.status);
		}

		Release(*transfer);

		LOG_TRACE(MOD_HTTP, "Request {} done: status {} error '{}'", transfer->id,
			transfer->response.status, transfer->response.error);

		// The callback may start or cancel other requests.
		transfer->cb(transfer->response);
	}
}

int HttpClient::OnSocket(CURL *, curl_socket_t s, int action, void *userp, void *socketp)
{
	auto *self = static_cast<HttpClient *>(userp);
	auto *context = static_cast<SocketContext *>(socketp);

	if (action == CURL_POLL_REMOVE) {
		if (context) {
			uv_poll_stop(&context->poll);
			uv_close(reinterpret_cast<uv_handle_t *>(&context->poll), [](uv_handle_t *handle) {
				delete static_cast<SocketContext *>(handle->data);
			});
			curl_multi_assign(self->m_multi, s, nullptr);
		}
		return 0;
	}

	if (!context) {
		context = new SocketContext();
		context->fd = s;
		context->owner = self;
		if (uv_poll_init_socket(EventLoop::Get().Handle(), &context->poll, s) != 0) {
			LOG_ERROR(MOD_NET, "uv_poll_init_socket failed for fd {}", static_cast<int>(s));
			delete context;
			return -1;
		}
		context->poll.data = context;
		curl_multi_assign(self->m_multi, s, context);
	}

	int events = 0;
	if (action != CURL_POLL_OUT) {
		events |= UV_READABLE;
	}
	if (action != CURL_POLL_IN) {
		events |= UV_WRITABLE;
	}

	uv_poll_start(&context->poll, events, &HttpClient::OnPoll);
	return 0;
}

int HttpClient::OnTimer(CURLM *, long timeout_ms, void *userp)
{
	auto *self = static_cast<HttpClient *>(userp);
	if (timeout_ms < 0) {
		self->m_timeout->Stop();
	}
	else {
		// A zero timeout still goes through the loop; libcurl must not be
		// re-entered from inside its own callback.
		self->m_timeout->Stop();
		self->m_timeout->Start(static_cast<uint64_t>(timeout_ms), false);
	}
	return 0;
}

void HttpClient::OnPoll(uv_poll_t *handle, int status, int events)
{
	auto *context = static_cast<SocketContext *>(handle->data);
	HttpClient *self = context->owner;
	if (!self->m_multi) {
		return;
	}

	int flags = 0;
	if (status < 0) {
		flags = CURL_CSELECT_ERR;
	}
	else {
		if (events & UV_READABLE) {
			flags |= CURL_CSELECT_IN;
		}
		if (events & UV_WRITABLE) {
			flags |= CURL_CSELECT_OUT;
		}
	}

	int running = 0;
	curl_multi_socket_action(self->m_multi, context->fd, flags, &running);
	self->CheckMultiInfo();
}

size_t HttpClient::OnWrite(char *ptr, size_t size, size_t nmemb, void *userdata)
{
	auto *body = static_cast<std::string *>(userdata);
	body->append(ptr, size * nmemb);
	return size * nmemb;
}

} // namespace CVW
