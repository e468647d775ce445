#include "service_finder/mdns_engine.hpp"
#include "service_finder/event_dispatcher.hpp"
#include "service_finder/record_cache.hpp"
#include "service_finder/service_name.hpp"
#include "service_finder/log.hpp"
#include "mdns_utils.hpp"

#include <sys/select.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <fmt/format.h>

namespace service_finder
{

namespace
{

using Clock = RecordCache::Clock;

// First resend of a service info query, doubled after each one
constexpr std::chrono::milliseconds kInfoQueryDelay{200};

}

class MdnsEngine::EngineImpl
{
private:
	MdnsEngine& m_owner;
	EngineSettings m_settings;
	std::vector<int> m_sockets;

	std::atomic<bool> m_running{false};
	std::thread m_listenThread;

	std::mutex m_mutex;
	std::condition_variable m_cacheChanged;
	RecordCache m_cache;

	// Last, its workers may still be inside a listener calling back into us
	EventDispatcher m_dispatcher;

public:
	EngineImpl(MdnsEngine& owner, EngineSettings settings)
	: m_owner(owner)
	, m_settings(std::move(settings))
	, m_cache(m_settings.query_interval_min, m_settings.query_interval_max)
	, m_dispatcher(owner)
	{
		m_sockets = OpenServiceSockets(m_settings.use_ipv6);
		const auto num_sockets = m_sockets.size();
		if (num_sockets == 0) {
			Log(LogLevel::Error, "Failed to open any mDNS sockets.");
			throw EngineError("Failed to open any mDNS sockets.");
		}
		Log(LogLevel::Debug, fmt::format("Opened {} socket{} for mDNS browsing.", num_sockets, num_sockets > 1 ? "s" : ""));

		m_running.store(true, std::memory_order_release);
		m_listenThread = std::thread([this](){
			ListenLoop();
		});
	}

	~EngineImpl()
	{
		Close();
	}

	void Browse(const std::string& type, std::shared_ptr<ServiceListener> listener)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (!m_running.load(std::memory_order_acquire)) {
			Log(LogLevel::Warn, fmt::format("mDNS engine closed, not browsing {}.", NormalizeName(type)));
			return;
		}

		if (!m_cache.Browsing(type)) {
			Log(LogLevel::Debug, fmt::format("Browsing {}.", NormalizeName(type)));
		}
		// Late subscribers still hear about what is already known
		Post(m_cache.Subscribe(type, std::move(listener), Clock::now()));
	}

	std::optional<ServiceInfo> GetServiceInfo(const std::string& type, const std::string& name,
	                                          std::chrono::milliseconds timeout)
	{
		const auto deadline = Clock::now() + timeout;
		auto next_send = Clock::now();
		auto delay = kInfoQueryDelay;

		std::unique_lock<std::mutex> lock(m_mutex);
		while (m_running.load(std::memory_order_acquire)) {
			auto info = m_cache.Lookup(type, name);
			if (info && !info->addresses.empty()) {
				return info;
			}

			const auto now = Clock::now();
			if (now >= deadline) {
				return info;
			}
			if (now >= next_send) {
				const std::string target = info ? info->server : std::string();
				lock.unlock();
				SendInfoQueries(name, target);
				lock.lock();
				next_send = now + delay;
				delay *= 2;
				continue;
			}
			m_cacheChanged.wait_until(lock, std::min(deadline, next_send));
		}
		return std::nullopt;
	}

	// May be called from a listener. The listener threads are then signalled
	// and joined when the engine is destroyed.
	void Close()
	{
		if (m_running.exchange(false, std::memory_order_acq_rel) == false) {
			// Was not running previously!
			return;
		}

		Log(LogLevel::Debug, "mDNS engine closing.");
		{
			std::lock_guard<std::mutex> lock(m_mutex);
		}
		m_cacheChanged.notify_all();

		if (m_listenThread.joinable()) {
			m_listenThread.join();
		}
		m_dispatcher.Stop();

		for (const auto& socket : m_sockets) {
			mdns_socket_close(socket);
		}
		m_sockets.clear();

		std::lock_guard<std::mutex> lock(m_mutex);
		m_cache.Clear();
		Log(LogLevel::Debug, "mDNS engine closed.");
	}

private:
	static int RecordCallback(int sock, const struct sockaddr* from, size_t addrlen,
	                          mdns_entry_type_t entry, uint16_t query_id, uint16_t rtype,
	                          uint16_t rclass, uint32_t ttl, const void* data, size_t size,
	                          size_t name_offset, size_t name_length, size_t record_offset,
	                          size_t record_length, void* user_data)
	{
		(void)sock;
		(void)query_id;
		(void)name_length;
		auto impl = static_cast<EngineImpl*>(user_data);
		if (entry != MDNS_ENTRYTYPE_ANSWER && entry != MDNS_ENTRYTYPE_ADDITIONAL) {
			return 0;
		}
		impl->HandleRecord(ParseRecord(from, addrlen, entry, rtype, rclass, ttl, data, size,
		                               name_offset, record_offset, record_length));
		return 0;
	}

	void HandleRecord(const Record& record)
	{
		if (LogEnabled(LogLevel::Debug)) {
			Log(LogLevel::Debug, fmt::format("Got record: {}", ToString(record)));
		}

		{
			std::lock_guard<std::mutex> lock(m_mutex);
			Post(m_cache.Insert(record, Clock::now()));
		}
		m_cacheChanged.notify_all();
	}

	// m_mutex held, keeps the cache order per type
	void Post(std::vector<BrowseEvent> events)
	{
		for (auto& event : events) {
			m_dispatcher.Post(std::move(event));
		}
	}

	void ExpireRecords()
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		Post(m_cache.Expire(Clock::now()));
	}

	void SendQueries(const std::vector<mdns_query_t>& queries)
	{
		std::array<char, 2048> buffer;
		for (const auto& sock : m_sockets) {
			if (mdns_multiquery_send(sock, queries.data(), queries.size(), buffer.data(), buffer.size(), 0) < 0) {
				Log(LogLevel::Debug, fmt::format("Failed to send mDNS query on socket {}: {}", sock, strerror(errno)));
			}
		}
	}

	void SendInfoQueries(const std::string& name, const std::string& target)
	{
		std::vector<mdns_query_t> queries;
		queries.push_back(mdns_query_t{MDNS_RECORDTYPE_SRV, name.c_str(), name.size()});
		queries.push_back(mdns_query_t{MDNS_RECORDTYPE_TXT, name.c_str(), name.size()});
		if (!target.empty()) {
			queries.push_back(mdns_query_t{MDNS_RECORDTYPE_A, target.c_str(), target.size()});
		}
		SendQueries(queries);
	}

	void SendDueBrowseQueries()
	{
		std::vector<std::string> due;
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			due = m_cache.DueQueries(Clock::now());
		}
		for (const auto& type : due) {
			SendQueries({mdns_query_t{MDNS_RECORDTYPE_PTR, type.c_str(), type.size()}});
		}
	}

	void ListenLoop()
	{
		std::array<char, 2048> buffer;
		while (m_running.load(std::memory_order_acquire)) {
			SendDueBrowseQueries();

			int nfds = 0;
			fd_set readfs;
			FD_ZERO(&readfs);
			for (const auto& sock : m_sockets) {
				if (sock >= nfds)
					nfds = sock + 1;
				FD_SET(sock, &readfs);
			}

			struct timeval timeout;
			timeout.tv_sec = 0;
			timeout.tv_usec = 100000;

			const int res = select(nfds, &readfs, nullptr, nullptr, &timeout);
			if (res < 0) {
				if (errno == EINTR) {
					continue;
				}
				Log(LogLevel::Error, fmt::format("mDNS select failed: {}", strerror(errno)));
				break;
			}
			if (res > 0) {
				for (const auto& sock : m_sockets) {
					if (FD_ISSET(sock, &readfs)) {
						mdns_query_recv(sock, buffer.data(), buffer.size(), RecordCallback, this, 0);
					}
				}
			}
			ExpireRecords();
		}
	}
};

MdnsEngine::MdnsEngine(EngineSettings settings)
: m_impl(std::make_unique<EngineImpl>(*this, std::move(settings)))
{}

MdnsEngine::~MdnsEngine() = default;

void MdnsEngine::Browse(const std::string& type, std::shared_ptr<ServiceListener> listener)
{
	m_impl->Browse(type, std::move(listener));
}

std::optional<ServiceInfo> MdnsEngine::GetServiceInfo(const std::string& type, const std::string& name,
                                                      std::chrono::milliseconds timeout)
{
	return m_impl->GetServiceInfo(type, name, timeout);
}

void MdnsEngine::Close()
{
	m_impl->Close();
}

}
