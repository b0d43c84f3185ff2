#include "rxdnssd/rx_dnssd.hpp"

#include "fake_discovery_service.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

using namespace rxdnssd;
using namespace rxdnssd::test;

namespace
{

const std::vector<std::uint8_t> kPrinterIpv4{192, 168, 1, 10};
const std::vector<std::uint8_t> kPrinterIpv6{0xfe, 0x80, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};

class RxDnssdTest
{
public:
    explicit RxDnssdTest(ErrorPolicy policy = ErrorPolicy::Isolate)
    : service(std::make_shared<FakeDiscoveryService>())
    , rxdnssd(service, RxDnssdSettings{policy, kAllInterfaces})
    {}

    std::shared_ptr<FakeDiscoveryService> service;
    RxDnssd rxdnssd;

    std::vector<ServiceRecord> records;
    std::vector<ErrorCode> errors;
    int completed{0};

    Subscription SubscribeTo(const RecordObservable& observable)
    {
        return observable.Subscribe(
            [this](const ServiceRecord& record) {
                records.push_back(record);
            },
            [this](std::exception_ptr error) {
                try {
                    std::rethrow_exception(error);
                } catch (const DiscoveryError& e) {
                    errors.push_back(e.Code());
                }
            },
            [this]() {
                ++completed;
            });
    }

    static BrowseReply Found(const std::string& name, std::uint32_t interface_index = 3,
                             ServiceFlags flags = ServiceFlags::Added)
    {
        BrowseReply reply;
        reply.flags = flags;
        reply.interface_index = interface_index;
        reply.service_name = name;
        reply.reg_type = "_ipp._tcp.";
        reply.domain = "local.";
        return reply;
    }

    static ResolveReply Resolved(const std::string& host, std::uint16_t port, std::vector<std::uint8_t> txt = {0})
    {
        ResolveReply reply;
        reply.interface_index = 3;
        reply.host_target = host;
        reply.port = port;
        reply.txt_record = std::move(txt);
        return reply;
    }

    static QueryReply Answer(RecordType type, std::vector<std::uint8_t> rdata, std::uint32_t ttl = 120)
    {
        QueryReply reply;
        reply.interface_index = 3;
        reply.fullname = "printer.local.";
        reply.record_type = type;
        reply.rdata = std::move(rdata);
        reply.ttl = ttl;
        return reply;
    }

    static ServiceRecord ResolvedRecord()
    {
        ServiceRecord record;
        record.interface_index = 3;
        record.service_name = "printer";
        record.reg_type = "_ipp._tcp.";
        record.domain = "local.";
        record.hostname = "printer.local.";
        record.port = 631;
        return record;
    }

    static bool IsSuperset(const ServiceRecord& later, const ServiceRecord& earlier)
    {
        return std::includes(later.addresses.begin(), later.addresses.end(),
                             earlier.addresses.begin(), earlier.addresses.end());
    }
};

class RxDnssdPropagateTest : public RxDnssdTest
{
public:
    RxDnssdPropagateTest()
    : RxDnssdTest(ErrorPolicy::Propagate)
    {}
};

}


TEST_CASE("RxDnssd needs a discovery service", "[RxDnssd]") {
    try {
        RxDnssd rxdnssd(nullptr);
        FAIL("constructed without a service");
    } catch (const DiscoveryError& e) {
        CHECK(e.Code() == ErrorCode::BadParam);
    }
}


TEST_CASE_METHOD(RxDnssdTest, "Browse", "[RxDnssd]") {
    auto subscription = SubscribeTo(rxdnssd.Browse("_ipp._tcp.", "local."));
    const auto browses = service->Browses();
    REQUIRE(browses.size() == 1);
    CHECK(browses[0].reg_type == "_ipp._tcp.");
    CHECK(browses[0].domain == "local.");
    CHECK(browses[0].interface_index == kAllInterfaces);

    browses[0].listener.on_reply(Found("printer"));
    browses[0].listener.on_reply(Found("printer", 3, ServiceFlags::Removed));

    REQUIRE(records.size() == 2);
    CHECK(records[0].flags == ServiceFlags::Added);
    CHECK(records[0].service_name == "printer");
    CHECK(records[0].interface_index == 3);
    CHECK(records[0].hostname.empty());
    CHECK(records[0].addresses.empty());
    CHECK(records[1].IsRemoved());

    subscription.Unsubscribe();
    CHECK(browses[0].Cancelled());
}


TEST_CASE_METHOD(RxDnssdTest, "Two browse subscriptions are independent", "[RxDnssd]") {
    const auto browse = rxdnssd.Browse("_ipp._tcp.", "local.");
    auto first = SubscribeTo(browse);
    auto second = SubscribeTo(browse);
    const auto browses = service->Browses();
    REQUIRE(browses.size() == 2);

    first.Unsubscribe();
    CHECK(browses[0].Cancelled());
    CHECK_FALSE(browses[1].Cancelled());
    second.Unsubscribe();
    CHECK(service->CancelCount() == 2);
}


TEST_CASE_METHOD(RxDnssdTest, "Printer found, resolved and queried", "[RxDnssd]") {
    auto subscription = SubscribeTo(rxdnssd.Browse("_ipp._tcp.", "local.")
        .Compose(rxdnssd.Resolve())
        .Compose(rxdnssd.QueryRecords()));

    service->Browses()[0].listener.on_reply(Found("printer"));

    const auto resolves = service->Resolves();
    REQUIRE(resolves.size() == 1);
    CHECK(resolves[0].interface_index == 3);
    CHECK(resolves[0].name == "printer");
    CHECK(resolves[0].reg_type == "_ipp._tcp.");
    CHECK(resolves[0].domain == "local.");
    resolves[0].listener.on_reply(Resolved("printer.local.", 631));
    CHECK(resolves[0].Cancelled());

    REQUIRE(service->Queries().size() == 2);
    const auto a = service->Query(RecordType::A);
    const auto aaaa = service->Query(RecordType::AAAA);
    CHECK(a.name == "printer.local.");
    CHECK(a.interface_index == 3);
    CHECK(aaaa.name == "printer.local.");
    CHECK(aaaa.interface_index == 3);
    CHECK(records.empty());

    a.listener.on_reply(Answer(RecordType::A, kPrinterIpv4));
    aaaa.listener.on_reply(Answer(RecordType::AAAA, kPrinterIpv6));

    REQUIRE(records.size() == 2);
    CHECK(records[0].addresses == std::set<IpAddress>{{AddressFamily::IPv4, "192.168.1.10"}});
    CHECK(records[1].addresses == std::set<IpAddress>{{AddressFamily::IPv4, "192.168.1.10"}, {AddressFamily::IPv6, "fe80::1"}});
    for (const auto& record : records) {
        CHECK(record.service_name == "printer");
        CHECK(record.interface_index == 3);
        CHECK(record.hostname == "printer.local.");
        CHECK(record.port == 631);
        CHECK(record.txt_records.empty());
    }
    CHECK(errors.empty());
    CHECK(completed == 0);

    subscription.Unsubscribe();
    CHECK(service->Browses()[0].Cancelled());
    CHECK(a.Cancelled());
    CHECK(aaaa.Cancelled());
}


TEST_CASE_METHOD(RxDnssdTest, "Removed records are never enriched", "[RxDnssd]") {
    auto subscription = SubscribeTo(rxdnssd.Browse("_ipp._tcp.", "local.")
        .Compose(rxdnssd.Resolve())
        .Compose(rxdnssd.QueryRecords())
        .Compose(rxdnssd.QueryIPv4Records())
        .Compose(rxdnssd.QueryIPv6Records()));

    service->Browses()[0].listener.on_reply(Found("printer", 3, ServiceFlags::Removed));

    REQUIRE(records.size() == 1);
    CHECK(records[0].IsRemoved());
    CHECK(records[0].service_name == "printer");
    CHECK(service->CallCount() == 1);
}


TEST_CASE_METHOD(RxDnssdTest, "Resolve passes a removed record through unchanged", "[RxDnssd]") {
    ServiceRecord removed = ResolvedRecord();
    removed.flags = ServiceFlags::Removed;
    removed.txt_records = {{"a", "1"}};

    SubscribeTo(RecordObservable::Just(removed).Compose(rxdnssd.Resolve()));

    REQUIRE(records.size() == 1);
    CHECK(records[0] == removed);
    CHECK(completed == 1);
    CHECK(service->CallCount() == 0);
}


TEST_CASE_METHOD(RxDnssdTest, "Resolve decodes the TXT record", "[RxDnssd]") {
    ServiceRecord found = ResolvedRecord();
    found.hostname.clear();
    found.port = 0;

    SubscribeTo(RecordObservable::Just(found).Compose(rxdnssd.Resolve()));
    REQUIRE(service->Resolves().size() == 1);
    service->Resolves()[0].listener.on_reply(Resolved("printer.local.", 631, EncodeTxtRecord({{"rp", "ipp/print"}})));

    REQUIRE(records.size() == 1);
    CHECK(records[0].hostname == "printer.local.");
    CHECK(records[0].port == 631);
    CHECK(records[0].txt_records == std::map<std::string, std::string>{{"rp", "ipp/print"}});
    CHECK(completed == 1);
}


TEST_CASE_METHOD(RxDnssdPropagateTest, "Resolve fails on a malformed TXT record", "[RxDnssd]") {
    SubscribeTo(RecordObservable::Just(ResolvedRecord()).Compose(rxdnssd.Resolve()));
    service->Resolves()[0].listener.on_reply(Resolved("printer.local.", 631, {5, 'a', '=', '1'}));

    CHECK(records.empty());
    CHECK(errors == std::vector<ErrorCode>{ErrorCode::BadTxtRecord});
    CHECK(service->Resolves()[0].Cancelled());
}


TEST_CASE_METHOD(RxDnssdTest, "A failed resolve is isolated", "[RxDnssd]") {
    auto subscription = SubscribeTo(rxdnssd.Browse("_ipp._tcp.", "local.").Compose(rxdnssd.Resolve()));
    const auto browse = service->Browses()[0];
    browse.listener.on_reply(Found("first"));
    browse.listener.on_reply(Found("second"));
    const auto resolves = service->Resolves();
    REQUIRE(resolves.size() == 2);

    resolves[0].listener.on_failure(DiscoveryError(ErrorCode::Timeout, "no answer"));
    resolves[1].listener.on_reply(Resolved("second.local.", 80));

    CHECK(errors.empty());
    REQUIRE(records.size() == 1);
    CHECK(records[0].service_name == "second");
    CHECK_FALSE(browse.Cancelled());

    browse.listener.on_reply(Found("third"));
    CHECK(service->Resolves().size() == 3);
}


TEST_CASE_METHOD(RxDnssdPropagateTest, "A failed resolve ends the session", "[RxDnssd]") {
    SubscribeTo(rxdnssd.Browse("_ipp._tcp.", "local.").Compose(rxdnssd.Resolve()));
    const auto browse = service->Browses()[0];
    browse.listener.on_reply(Found("first"));
    browse.listener.on_reply(Found("second"));
    const auto resolves = service->Resolves();
    REQUIRE(resolves.size() == 2);

    resolves[0].listener.on_failure(DiscoveryError(ErrorCode::Timeout, "no answer"));

    CHECK(errors == std::vector<ErrorCode>{ErrorCode::Timeout});
    CHECK(browse.Cancelled());
    CHECK(resolves[1].Cancelled());

    resolves[1].listener.on_reply(Resolved("second.local.", 80));
    CHECK(records.empty());
}


TEST_CASE_METHOD(RxDnssdTest, "A failed address query cancels the other family", "[RxDnssd]") {
    SubscribeTo(RecordObservable::Just(ResolvedRecord()).Compose(rxdnssd.QueryRecords()));
    const auto a = service->Query(RecordType::A);
    const auto aaaa = service->Query(RecordType::AAAA);

    a.listener.on_failure(DiscoveryError(ErrorCode::Unknown, "query failed"));

    CHECK(a.Cancelled());
    CHECK(aaaa.Cancelled());
    CHECK(errors.empty());
    CHECK(completed == 1);
}


TEST_CASE_METHOD(RxDnssdPropagateTest, "A failed address query propagates", "[RxDnssd]") {
    SubscribeTo(RecordObservable::Just(ResolvedRecord()).Compose(rxdnssd.QueryRecords()));
    service->Query(RecordType::AAAA).listener.on_failure(DiscoveryError(ErrorCode::Unknown, "query failed"));

    CHECK(errors == std::vector<ErrorCode>{ErrorCode::Unknown});
    CHECK(service->Query(RecordType::A).Cancelled());
}


TEST_CASE_METHOD(RxDnssdTest, "Address answers that add nothing are skipped", "[RxDnssd]") {
    SubscribeTo(RecordObservable::Just(ResolvedRecord()).Compose(rxdnssd.QueryIPv4Records()));
    REQUIRE(service->Queries().size() == 1);
    const auto a = service->Query(RecordType::A);

    a.listener.on_reply(Answer(RecordType::A, kPrinterIpv4, 0));
    a.listener.on_reply(Answer(RecordType::A, {1, 2, 3}));
    CHECK(records.empty());

    a.listener.on_reply(Answer(RecordType::A, kPrinterIpv4));
    REQUIRE(records.size() == 1);
    CHECK(records[0].addresses.size() == 1);
}


TEST_CASE_METHOD(RxDnssdTest, "QueryIPv6Records queries AAAA only", "[RxDnssd]") {
    SubscribeTo(RecordObservable::Just(ResolvedRecord()).Compose(rxdnssd.QueryIPv6Records()));
    const auto queries = service->Queries();
    REQUIRE(queries.size() == 1);
    CHECK(queries[0].record_type == RecordType::AAAA);

    queries[0].listener.on_reply(Answer(RecordType::AAAA, kPrinterIpv6));
    REQUIRE(records.size() == 1);
    CHECK(records[0].addresses == std::set<IpAddress>{{AddressFamily::IPv6, "fe80::1"}});
}


TEST_CASE_METHOD(RxDnssdPropagateTest, "Querying an unresolved record fails", "[RxDnssd]") {
    ServiceRecord unresolved = ResolvedRecord();
    unresolved.hostname.clear();

    SubscribeTo(RecordObservable::Just(unresolved).Compose(rxdnssd.QueryIPv4Records()));

    CHECK(errors == std::vector<ErrorCode>{ErrorCode::BadParam});
    CHECK(service->CallCount() == 0);
}


TEST_CASE_METHOD(RxDnssdTest, "Cancelling the session releases every operation", "[RxDnssd]") {
    auto subscription = SubscribeTo(rxdnssd.Browse("_ipp._tcp.", "local.")
        .Compose(rxdnssd.Resolve())
        .Compose(rxdnssd.QueryRecords()));
    service->Browses()[0].listener.on_reply(Found("first"));
    service->Browses()[0].listener.on_reply(Found("second"));
    service->Resolves()[0].listener.on_reply(Resolved("first.local.", 80));
    REQUIRE(service->Queries().size() == 2);

    subscription.Unsubscribe();

    CHECK(service->CancelCount() == static_cast<int>(service->CallCount()));
    for (const auto& call : service->Queries()) {
        CHECK(call.Cancelled());
    }
    CHECK(service->Resolves()[1].Cancelled());
    CHECK(service->Browses()[0].Cancelled());
}


TEST_CASE_METHOD(RxDnssdTest, "A removed service releases its address queries", "[RxDnssd]") {
    auto subscription = SubscribeTo(rxdnssd.Browse("_ipp._tcp.", "local.")
        .Compose(rxdnssd.Resolve())
        .Compose(rxdnssd.QueryRecords()));
    const auto browse = service->Browses()[0];

    for (std::size_t round = 1; round <= 5; ++round) {
        browse.listener.on_reply(Found("printer"));
        const auto resolves = service->Resolves();
        REQUIRE(resolves.size() == round);
        resolves.back().listener.on_reply(Resolved("printer.local.", 631));

        const auto queries = service->Queries();
        REQUIRE(queries.size() == 2 * round);
        const auto& a = queries[queries.size() - 2];
        const auto& aaaa = queries[queries.size() - 1];
        CHECK_FALSE(a.Cancelled());
        CHECK_FALSE(aaaa.Cancelled());
        a.listener.on_reply(Answer(RecordType::A, kPrinterIpv4));

        browse.listener.on_reply(Found("printer", 3, ServiceFlags::Removed));

        CHECK(a.Cancelled());
        CHECK(aaaa.Cancelled());
        REQUIRE_FALSE(records.empty());
        CHECK(records.back().IsRemoved());
        CHECK(records.back().service_name == "printer");

        // Late answers of released queries are dropped
        const auto count = records.size();
        aaaa.listener.on_reply(Answer(RecordType::AAAA, kPrinterIpv6));
        CHECK(records.size() == count);
    }

    CHECK_FALSE(browse.Cancelled());
    CHECK(service->CancelCount() == static_cast<int>(service->CallCount()) - 1);
    CHECK(errors.empty());
    CHECK(completed == 0);

    subscription.Unsubscribe();
    CHECK(browse.Cancelled());
}


TEST_CASE_METHOD(RxDnssdTest, "A removed service cancels its pending resolve", "[RxDnssd]") {
    auto subscription = SubscribeTo(rxdnssd.Browse("_ipp._tcp.", "local.")
        .Compose(rxdnssd.Resolve())
        .Compose(rxdnssd.QueryRecords()));
    const auto browse = service->Browses()[0];

    browse.listener.on_reply(Found("printer"));
    browse.listener.on_reply(Found("scanner"));
    browse.listener.on_reply(Found("printer", 3, ServiceFlags::Removed));

    const auto resolves = service->Resolves();
    REQUIRE(resolves.size() == 2);
    CHECK(resolves[0].Cancelled());
    CHECK_FALSE(resolves[1].Cancelled());

    resolves[0].listener.on_reply(Resolved("printer.local.", 631));
    CHECK(service->Queries().empty());
    REQUIRE(records.size() == 1);
    CHECK(records[0].IsRemoved());

    // Other instances and other interfaces are not affected
    browse.listener.on_reply(Found("scanner", 5, ServiceFlags::Removed));
    CHECK_FALSE(resolves[1].Cancelled());
    resolves[1].listener.on_reply(Resolved("scanner.local.", 80));
    CHECK(service->Queries().size() == 2);
}


TEST_CASE_METHOD(RxDnssdTest, "Concurrent address answers publish growing snapshots", "[RxDnssd]") {
    std::mutex mutex;
    std::vector<ServiceRecord> snapshots;
    RecordObservable::Just(ResolvedRecord()).Compose(rxdnssd.QueryRecords()).Subscribe([&](const ServiceRecord& record) {
        std::lock_guard<std::mutex> lock(mutex);
        snapshots.push_back(record);
    });
    const auto a = service->Query(RecordType::A);
    const auto aaaa = service->Query(RecordType::AAAA);

    std::thread ipv4([&]() {
        for (std::uint8_t i = 1; i <= 50; ++i) {
            a.listener.on_reply(Answer(RecordType::A, {10, 0, 0, i}));
        }
    });
    std::thread ipv6([&]() {
        for (std::uint8_t i = 1; i <= 50; ++i) {
            aaaa.listener.on_reply(Answer(RecordType::AAAA, {0xfd, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, i}));
        }
    });
    ipv4.join();
    ipv6.join();

    REQUIRE(snapshots.size() == 100);
    for (std::size_t i = 1; i < snapshots.size(); ++i) {
        CHECK(snapshots[i].addresses.size() == i + 1);
        CHECK(IsSuperset(snapshots[i], snapshots[i - 1]));
    }
}


TEST_CASE_METHOD(RxDnssdTest, "Register", "[RxDnssd]") {
    ServiceRecord requested;
    requested.service_name = "printer";
    requested.reg_type = "_ipp._tcp.";
    requested.domain = "local.";
    requested.port = 631;
    requested.txt_records = {{"rp", "ipp/print"}};

    auto subscription = SubscribeTo(rxdnssd.Register(requested));
    const auto registers = service->Registers();
    REQUIRE(registers.size() == 1);
    CHECK(registers[0].name == "printer");
    CHECK(registers[0].port == 631);
    CHECK(registers[0].host.empty());
    CHECK(DecodeTxtRecord(registers[0].txt_record) == requested.txt_records);

    RegisterReply reply;
    reply.service_name = "printer (2)";
    reply.reg_type = "_ipp._tcp.";
    reply.domain = "local.";
    registers[0].listener.on_reply(reply);

    REQUIRE(records.size() == 1);
    CHECK(records[0].service_name == "printer (2)");
    CHECK(records[0].port == 631);
    CHECK(records[0].txt_records == requested.txt_records);
    CHECK(completed == 0);

    subscription.Unsubscribe();
    CHECK(registers[0].Cancelled());
}


TEST_CASE_METHOD(RxDnssdTest, "Register with an invalid TXT key fails", "[RxDnssd]") {
    ServiceRecord requested = ResolvedRecord();
    requested.txt_records = {{"a=b", "1"}};

    SubscribeTo(rxdnssd.Register(requested));
    CHECK(errors == std::vector<ErrorCode>{ErrorCode::BadParam});
    CHECK(service->CallCount() == 0);
}
