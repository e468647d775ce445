#include "service_finder/event_dispatcher.hpp"
#include "service_finder/engine.hpp"
#include "service_finder/log.hpp"
#include "service_finder/service_name.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <thread>
#include <vector>

#include <fmt/format.h>

namespace service_finder
{

class EventDispatcher::Worker
{
private:
	Engine& m_engine;
	std::mutex m_mutex;
	std::condition_variable m_ready;
	std::deque<BrowseEvent> m_events;
	bool m_running{true};
	std::thread m_thread;

public:
	explicit Worker(Engine& engine)
	: m_engine(engine)
	{
		m_thread = std::thread([this](){
			Run();
		});
	}

	~Worker()
	{
		Stop();
		if (!m_thread.joinable()) {
			return;
		}
		if (m_thread.get_id() == std::this_thread::get_id()) {
			m_thread.detach();
		} else {
			m_thread.join();
		}
	}

	void Post(BrowseEvent event)
	{
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			if (!m_running) {
				return;
			}
			m_events.push_back(std::move(event));
		}
		m_ready.notify_one();
	}

	void Stop()
	{
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_running = false;
			m_events.clear();
		}
		m_ready.notify_all();
	}

	// Joins unless called from this worker
	void Join()
	{
		if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
			m_thread.join();
		}
	}

private:
	void Run()
	{
		while (true) {
			BrowseEvent event;
			{
				std::unique_lock<std::mutex> lock(m_mutex);
				m_ready.wait(lock, [this]() {
					return !m_running || !m_events.empty();
				});
				if (!m_running) {
					return;
				}
				event = std::move(m_events.front());
				m_events.pop_front();
			}
			Deliver(event);
		}
	}

	void Deliver(const BrowseEvent& event)
	{
		for (const auto& listener : event.listeners) {
			try {
				switch (event.kind) {
					case EventKind::Added:
						listener->AddService(m_engine, event.type, event.name);
						break;
					case EventKind::Updated:
						listener->UpdateService(m_engine, event.type, event.name);
						break;
					case EventKind::Removed:
						listener->RemoveService(m_engine, event.type, event.name);
						break;
				}
			} catch (const std::exception& e) {
				Log(LogLevel::Error, fmt::format("Listener for {} failed on {}: {}", event.type, event.name, e.what()));
			}
		}
	}
};

EventDispatcher::EventDispatcher(Engine& engine)
: m_engine(engine)
{}

EventDispatcher::~EventDispatcher()
{
	Stop();

	// A worker stopped from its own listener may still be running it and
	// post to us, so it is joined outside the lock
	std::map<std::string, std::unique_ptr<Worker>> workers;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		workers.swap(m_workers);
	}
	workers.clear();
}

void EventDispatcher::Post(BrowseEvent event)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_stopped) {
		return;
	}
	auto& worker = m_workers[CacheKey(NormalizeName(event.type))];
	if (!worker) {
		Log(LogLevel::Debug, fmt::format("Starting event worker for {}.", event.type));
		worker = std::make_unique<Worker>(m_engine);
	}
	worker->Post(std::move(event));
}

void EventDispatcher::Stop()
{
	std::vector<Worker*> workers;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_stopped) {
			return;
		}
		m_stopped = true;
		for (const auto& worker : m_workers) {
			workers.push_back(worker.second.get());
		}
	}

	for (auto* worker : workers) {
		worker->Stop();
	}
	for (auto* worker : workers) {
		worker->Join();
	}
}

std::size_t EventDispatcher::WorkerCount() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_workers.size();
}

}
