#include "service_finder/record_cache.hpp"
#include "service_finder/service_name.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

namespace service_finder
{

namespace
{

RecordCache::Clock::time_point ExpiryFor(std::uint32_t ttl, RecordCache::Clock::time_point now)
{
	return now + std::chrono::seconds(ttl);
}

bool EndsWith(const std::string& str, const std::string& suffix)
{
	return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}

RecordCache::RecordCache(std::chrono::milliseconds query_interval_min, std::chrono::milliseconds query_interval_max)
: m_intervalMin(query_interval_min)
, m_intervalMax(query_interval_max)
{}

std::vector<BrowseEvent> RecordCache::Subscribe(const std::string& type, std::shared_ptr<ServiceListener> listener,
                                                Clock::time_point now)
{
	std::vector<BrowseEvent> events;
	const auto normalized = NormalizeName(type);
	auto [it, inserted] = m_browsers.try_emplace(CacheKey(normalized));
	BrowseState& state = it->second;
	if (inserted) {
		state.type = normalized;
		state.next_query = now;
		state.interval = m_intervalMin;
	} else {
		for (const auto& known : state.instances) {
			events.push_back(BrowseEvent{EventKind::Added, state.type, known.second.name, {listener}});
		}
	}
	state.listeners.push_back(std::move(listener));
	return events;
}

std::vector<BrowseEvent> RecordCache::Insert(const Record& record, Clock::time_point now)
{
	std::vector<BrowseEvent> events;
	if (const auto* ptr = std::get_if<DomainNamePointerRecord>(&record)) {
		OnPointer(*ptr, now, events);
	} else if (const auto* srv = std::get_if<ServiceRecord>(&record)) {
		OnService(*srv, now);
	} else if (const auto* a = std::get_if<ARecord>(&record)) {
		OnAddress(*a, now);
	} else if (const auto* txt = std::get_if<TXTRecord>(&record)) {
		OnText(*txt, now, events);
	}
	return events;
}

void RecordCache::OnPointer(const DomainNamePointerRecord& record, Clock::time_point now,
                            std::vector<BrowseEvent>& events)
{
	auto browser = m_browsers.find(CacheKey(record.header.entry_string));
	if (browser == m_browsers.end()) {
		return;
	}
	BrowseState& state = browser->second;
	const auto key = CacheKey(record.name_string);
	auto found = state.instances.find(key);

	if (record.header.ttl == 0) {
		if (found != state.instances.end()) {
			Raise(EventKind::Removed, state, found->second.name, events);
			state.instances.erase(found);
		}
		return;
	}

	if (found == state.instances.end()) {
		state.instances.emplace(key, KnownInstance{record.name_string, ExpiryFor(record.header.ttl, now)});
		Raise(EventKind::Added, state, record.name_string, events);
	} else {
		found->second.expiry = ExpiryFor(record.header.ttl, now);
	}
}

void RecordCache::OnService(const ServiceRecord& record, Clock::time_point now)
{
	const auto key = CacheKey(record.header.entry_string);
	if (record.header.ttl == 0) {
		m_services.erase(key);
		return;
	}
	m_services[key] = CachedService{record.target, record.port, ExpiryFor(record.header.ttl, now)};
}

void RecordCache::OnAddress(const ARecord& record, Clock::time_point now)
{
	const auto key = CacheKey(record.header.entry_string);
	if (record.header.ttl == 0) {
		auto host = m_addresses.find(key);
		if (host == m_addresses.end()) {
			return;
		}
		auto& addresses = host->second;
		addresses.erase(std::remove_if(addresses.begin(), addresses.end(), [&record](const CachedAddress& cached) {
			return cached.address == record.address;
		}), addresses.end());
		if (addresses.empty()) {
			m_addresses.erase(host);
		}
		return;
	}

	auto& addresses = m_addresses[key];
	auto found = std::find_if(addresses.begin(), addresses.end(), [&record](const CachedAddress& cached) {
		return cached.address == record.address;
	});
	if (found == addresses.end()) {
		addresses.push_back(CachedAddress{record.address, ExpiryFor(record.header.ttl, now)});
	} else {
		found->expiry = ExpiryFor(record.header.ttl, now);
	}
}

void RecordCache::OnText(const TXTRecord& record, Clock::time_point now, std::vector<BrowseEvent>& events)
{
	const auto key = CacheKey(record.header.entry_string);
	if (record.header.ttl == 0) {
		m_texts.erase(key);
		return;
	}

	auto found = m_texts.find(key);
	const bool changed = found != m_texts.end() && found->second.txt != record.txt;
	m_texts[key] = CachedText{record.txt, ExpiryFor(record.header.ttl, now)};
	if (!changed) {
		return;
	}
	for (const auto& browser : m_browsers) {
		const auto instance = browser.second.instances.find(key);
		if (instance != browser.second.instances.end()) {
			Raise(EventKind::Updated, browser.second, instance->second.name, events);
		}
	}
}

void RecordCache::Raise(EventKind kind, const BrowseState& state, const std::string& name,
                        std::vector<BrowseEvent>& events)
{
	if (state.listeners.empty()) {
		return;
	}
	events.push_back(BrowseEvent{kind, state.type, name, state.listeners});
}

std::vector<BrowseEvent> RecordCache::Expire(Clock::time_point now)
{
	std::vector<BrowseEvent> events;
	for (auto& browser : m_browsers) {
		auto& instances = browser.second.instances;
		for (auto it = instances.begin(); it != instances.end();) {
			if (it->second.expiry <= now) {
				Raise(EventKind::Removed, browser.second, it->second.name, events);
				it = instances.erase(it);
			} else {
				++it;
			}
		}
	}
	for (auto it = m_services.begin(); it != m_services.end();) {
		it = it->second.expiry <= now ? m_services.erase(it) : std::next(it);
	}
	for (auto it = m_addresses.begin(); it != m_addresses.end();) {
		auto& addresses = it->second;
		addresses.erase(std::remove_if(addresses.begin(), addresses.end(), [now](const CachedAddress& cached) {
			return cached.expiry <= now;
		}), addresses.end());
		it = addresses.empty() ? m_addresses.erase(it) : std::next(it);
	}
	for (auto it = m_texts.begin(); it != m_texts.end();) {
		it = it->second.expiry <= now ? m_texts.erase(it) : std::next(it);
	}
	return events;
}

std::vector<std::string> RecordCache::DueQueries(Clock::time_point now)
{
	std::vector<std::string> due;
	for (auto& browser : m_browsers) {
		BrowseState& state = browser.second;
		if (state.next_query > now) {
			continue;
		}
		due.push_back(state.type);
		state.next_query = now + state.interval;
		state.interval = std::min(state.interval * 2, m_intervalMax);
	}
	return due;
}

std::optional<ServiceInfo> RecordCache::Lookup(const std::string& type, const std::string& name) const
{
	const auto key = CacheKey(NormalizeName(name));
	const auto expected = ServiceTypeName(NormalizeName(name), false);
	if (!EndsWith(CacheKey(NormalizeName(type)), CacheKey(expected))) {
		throw BadTypeInNameError(fmt::format("Name '{}' does not belong to type '{}'", name, type));
	}

	const auto service = m_services.find(key);
	if (service == m_services.end()) {
		return std::nullopt;
	}

	ServiceInfo info;
	info.type = type;
	info.name = name;
	info.server = service->second.target;
	info.port = service->second.port;

	const auto addresses = m_addresses.find(CacheKey(info.server));
	if (addresses != m_addresses.end()) {
		for (const auto& cached : addresses->second) {
			info.addresses.push_back(cached.address);
		}
	}
	const auto text = m_texts.find(key);
	if (text != m_texts.end()) {
		info.properties = text->second.txt;
	}
	return info;
}

void RecordCache::Clear()
{
	m_browsers.clear();
	m_services.clear();
	m_addresses.clear();
	m_texts.clear();
}

bool RecordCache::Browsing(const std::string& type) const
{
	return m_browsers.count(CacheKey(NormalizeName(type))) > 0;
}

std::size_t RecordCache::InstanceCount(const std::string& type) const
{
	const auto browser = m_browsers.find(CacheKey(NormalizeName(type)));
	return browser == m_browsers.end() ? 0 : browser->second.instances.size();
}

std::size_t RecordCache::HostCount() const
{
	return m_addresses.size();
}

}
