#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mock_engine.hpp"
#include "service_finder/record_cache.hpp"
#include "service_finder/service_name.hpp"

#include <chrono>
#include <memory>

using namespace service_finder;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using std::chrono::seconds;

namespace {

constexpr const char* kIpp = "_ipp._tcp.local.";
constexpr const char* kPrinter = "Printer1._ipp._tcp.local.";

RecordHeader Header(const std::string& entry, std::uint32_t ttl, std::uint16_t record_type) {
    RecordHeader header;
    header.ip_address = "192.168.1.20:5353";
    header.entry_type = EntryType::ANSWER;
    header.entry_string = entry;
    header.record_type = record_type;
    header.rclass = 1;
    header.ttl = ttl;
    return header;
}

Record Pointer(const std::string& type, const std::string& instance, std::uint32_t ttl) {
    DomainNamePointerRecord record;
    record.header = Header(type, ttl, 12);
    record.name_string = instance;
    return record;
}

Record Service(const std::string& instance, const std::string& target, std::uint16_t port, std::uint32_t ttl) {
    ServiceRecord record;
    record.header = Header(instance, ttl, 33);
    record.target = target;
    record.port = port;
    return record;
}

Record Address(const std::string& host, Ipv4Address address, std::uint32_t ttl) {
    ARecord record;
    record.header = Header(host, ttl, 1);
    record.address = address;
    return record;
}

Record Text(const std::string& instance, TxtProperties txt, std::uint32_t ttl) {
    TXTRecord record;
    record.header = Header(instance, ttl, 16);
    record.txt = std::move(txt);
    return record;
}

}

class RecordCacheTest : public ::testing::Test {
protected:
    RecordCache cache_{std::chrono::milliseconds(1000), std::chrono::milliseconds(4000)};
    std::shared_ptr<NiceMock<MockServiceListener>> listener_ = std::make_shared<NiceMock<MockServiceListener>>();
    RecordCache::Clock::time_point t0_ = RecordCache::Clock::now();
};

TEST_F(RecordCacheTest, PointerAnnouncesInstanceOnce) {
    EXPECT_THAT(cache_.Subscribe(kIpp, listener_, t0_), IsEmpty());

    const auto events = cache_.Insert(Pointer(kIpp, kPrinter, 120), t0_);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::Added);
    EXPECT_EQ(events[0].type, kIpp);
    EXPECT_EQ(events[0].name, kPrinter);
    ASSERT_EQ(events[0].listeners.size(), 1u);
    EXPECT_EQ(events[0].listeners[0], listener_);

    EXPECT_THAT(cache_.Insert(Pointer(kIpp, kPrinter, 120), t0_ + seconds(1)), IsEmpty());
    EXPECT_EQ(cache_.InstanceCount(kIpp), 1u);
}

TEST_F(RecordCacheTest, PointerForUnbrowsedTypeIsIgnored) {
    cache_.Subscribe(kIpp, listener_, t0_);

    EXPECT_THAT(cache_.Insert(Pointer("_http._tcp.local.", "Web._http._tcp.local.", 120), t0_), IsEmpty());
    EXPECT_EQ(cache_.InstanceCount("_http._tcp.local."), 0u);
}

TEST_F(RecordCacheTest, GoodbyeRemovesInstance) {
    cache_.Subscribe(kIpp, listener_, t0_);
    cache_.Insert(Pointer(kIpp, kPrinter, 120), t0_);

    const auto events = cache_.Insert(Pointer(kIpp, "printer1._IPP._tcp.local.", 0), t0_ + seconds(5));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::Removed);
    EXPECT_EQ(events[0].name, kPrinter);
    EXPECT_EQ(cache_.InstanceCount(kIpp), 0u);

    EXPECT_THAT(cache_.Insert(Pointer(kIpp, kPrinter, 0), t0_ + seconds(6)), IsEmpty());
}

TEST_F(RecordCacheTest, InstanceExpiresWithItsTtl) {
    cache_.Subscribe(kIpp, listener_, t0_);
    cache_.Insert(Pointer(kIpp, kPrinter, 10), t0_);

    EXPECT_THAT(cache_.Expire(t0_ + seconds(9)), IsEmpty());

    const auto events = cache_.Expire(t0_ + seconds(10));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::Removed);
    EXPECT_EQ(events[0].name, kPrinter);
    EXPECT_EQ(cache_.InstanceCount(kIpp), 0u);
}

TEST_F(RecordCacheTest, RefreshExtendsExpiry) {
    cache_.Subscribe(kIpp, listener_, t0_);
    cache_.Insert(Pointer(kIpp, kPrinter, 10), t0_);
    cache_.Insert(Pointer(kIpp, kPrinter, 10), t0_ + seconds(8));

    EXPECT_THAT(cache_.Expire(t0_ + seconds(12)), IsEmpty());
    EXPECT_EQ(cache_.Expire(t0_ + seconds(18)).size(), 1u);
}

TEST_F(RecordCacheTest, LateSubscriberHearsKnownInstances) {
    cache_.Subscribe(kIpp, listener_, t0_);
    cache_.Insert(Pointer(kIpp, kPrinter, 120), t0_);
    cache_.Insert(Pointer(kIpp, "Printer2._ipp._tcp.local.", 120), t0_);

    auto late = std::make_shared<NiceMock<MockServiceListener>>();
    const auto events = cache_.Subscribe("_ipp._tcp.local", late, t0_ + seconds(1));

    ASSERT_EQ(events.size(), 2u);
    for (const auto& event : events) {
        EXPECT_EQ(event.kind, EventKind::Added);
        ASSERT_EQ(event.listeners.size(), 1u);
        EXPECT_EQ(event.listeners[0], late);
    }

    // Later events go to both
    const auto removed = cache_.Insert(Pointer(kIpp, kPrinter, 0), t0_ + seconds(2));
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].listeners.size(), 2u);
}

TEST_F(RecordCacheTest, ChangedTextUpdatesInstance) {
    cache_.Subscribe(kIpp, listener_, t0_);
    cache_.Insert(Pointer(kIpp, kPrinter, 120), t0_);

    EXPECT_THAT(cache_.Insert(Text(kPrinter, {{"rp", "queue1"}}, 120), t0_), IsEmpty());
    EXPECT_THAT(cache_.Insert(Text(kPrinter, {{"rp", "queue1"}}, 120), t0_ + seconds(1)), IsEmpty());

    const auto events = cache_.Insert(Text(kPrinter, {{"rp", "queue2"}}, 120), t0_ + seconds(2));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::Updated);
    EXPECT_EQ(events[0].name, kPrinter);
}

TEST_F(RecordCacheTest, LookupJoinsServiceAddressAndText) {
    cache_.Insert(Service(kPrinter, "printer.local.", 631, 120), t0_);
    cache_.Insert(Address("Printer.local.", {192, 168, 1, 20}, 120), t0_);
    cache_.Insert(Text(kPrinter, {{"ty", "Laser"}}, 120), t0_);

    const auto info = cache_.Lookup(kIpp, kPrinter);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->server, "printer.local.");
    EXPECT_EQ(info->port, 631);
    EXPECT_THAT(info->addresses, ElementsAre(Ipv4Address{192, 168, 1, 20}));
    ASSERT_EQ(info->properties.size(), 1u);
    EXPECT_EQ(info->properties[0].second, "Laser");
}

TEST_F(RecordCacheTest, LookupBeforeServiceRecordIsEmpty) {
    EXPECT_FALSE(cache_.Lookup(kIpp, kPrinter).has_value());

    cache_.Insert(Service(kPrinter, "printer.local.", 631, 120), t0_);
    const auto info = cache_.Lookup(kIpp, kPrinter);
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->addresses.empty());
}

TEST_F(RecordCacheTest, LookupRejectsMalformedNames) {
    EXPECT_THROW(cache_.Lookup(kIpp, "Printer1._http._tcp.local."), BadTypeInNameError);
    EXPECT_THROW(cache_.Lookup(kIpp, "Printer1._-ipp._tcp.local."), BadTypeInNameError);
    EXPECT_THROW(cache_.Lookup(kIpp, "Printer1.example.com."), BadTypeInNameError);
    EXPECT_NO_THROW(cache_.Lookup("_ipp._tcp.local", "Printer1._ipp._tcp.local"));
}

TEST_F(RecordCacheTest, ForgetsHostsWithoutAddresses) {
    EXPECT_THAT(cache_.Insert(Address("ghost.local.", {10, 0, 0, 1}, 0), t0_), IsEmpty());
    EXPECT_EQ(cache_.HostCount(), 0u);

    cache_.Insert(Address("a.local.", {10, 0, 0, 2}, 120), t0_);
    cache_.Insert(Address("a.local.", {10, 0, 0, 2}, 0), t0_ + seconds(1));
    EXPECT_EQ(cache_.HostCount(), 0u);

    cache_.Insert(Address("b.local.", {10, 0, 0, 3}, 10), t0_);
    EXPECT_EQ(cache_.HostCount(), 1u);
    cache_.Expire(t0_ + seconds(11));
    EXPECT_EQ(cache_.HostCount(), 0u);
}

TEST_F(RecordCacheTest, BrowseQueriesBackOff) {
    cache_.Subscribe(kIpp, listener_, t0_);

    EXPECT_THAT(cache_.DueQueries(t0_), ElementsAre(kIpp));
    EXPECT_THAT(cache_.DueQueries(t0_), IsEmpty());
    EXPECT_THAT(cache_.DueQueries(t0_ + seconds(1)), ElementsAre(kIpp));
    EXPECT_THAT(cache_.DueQueries(t0_ + seconds(2)), IsEmpty());
    EXPECT_THAT(cache_.DueQueries(t0_ + seconds(3)), ElementsAre(kIpp));
    // Capped at 4 s from here on
    EXPECT_THAT(cache_.DueQueries(t0_ + seconds(6)), IsEmpty());
    EXPECT_THAT(cache_.DueQueries(t0_ + seconds(7)), ElementsAre(kIpp));
    EXPECT_THAT(cache_.DueQueries(t0_ + seconds(10)), IsEmpty());
    EXPECT_THAT(cache_.DueQueries(t0_ + seconds(11)), ElementsAre(kIpp));
}

TEST_F(RecordCacheTest, ClearForgetsEverything) {
    cache_.Subscribe(kIpp, listener_, t0_);
    cache_.Insert(Pointer(kIpp, kPrinter, 120), t0_);
    cache_.Insert(Service(kPrinter, "printer.local.", 631, 120), t0_);
    cache_.Insert(Address("printer.local.", {10, 0, 0, 2}, 120), t0_);

    cache_.Clear();

    EXPECT_FALSE(cache_.Browsing(kIpp));
    EXPECT_EQ(cache_.HostCount(), 0u);
    EXPECT_FALSE(cache_.Lookup(kIpp, kPrinter).has_value());
}
