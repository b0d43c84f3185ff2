#include "listeners.hpp"

#include "rxdnssd/log.hpp"
#include "rxdnssd/txt_record.hpp"

#include <fmt/core.h>

namespace rxdnssd
{

namespace
{

std::function<void(const DiscoveryError&)> ForwardFailure(const RecordSubscriber& subscriber)
{
    return [subscriber](const DiscoveryError& error) {
        subscriber->OnError(std::make_exception_ptr(error));
    };
}

}

BrowseListener MakeBrowseListener(RecordSubscriber subscriber)
{
    BrowseListener listener;
    listener.on_reply = [subscriber](const BrowseReply& reply) {
        ServiceRecord record;
        record.flags = reply.flags;
        record.interface_index = reply.interface_index;
        record.service_name = reply.service_name;
        record.reg_type = reply.reg_type;
        record.domain = reply.domain;
        subscriber->OnNext(record);
    };
    listener.on_failure = ForwardFailure(subscriber);
    return listener;
}

ResolveListener MakeResolveListener(RecordSubscriber subscriber, ServiceRecord record)
{
    ResolveListener listener;
    listener.on_reply = [subscriber, record](const ResolveReply& reply) {
        std::map<std::string, std::string> txt;
        try {
            txt = TxtRecord::Decode(reply.txt_record).ToMap();
        } catch (const DiscoveryError& error) {
            subscriber->OnError(std::make_exception_ptr(error));
            return;
        }

        ServiceRecordBuilder builder(record);
        builder.Hostname(reply.host_target)
               .Port(reply.port)
               .TxtRecords(std::move(txt));
        subscriber->OnNext(builder.Build());
        subscriber->OnCompleted();
    };
    listener.on_failure = ForwardFailure(subscriber);
    return listener;
}

QueryListener MakeQueryListener(RecordSubscriber subscriber, std::shared_ptr<ServiceRecordBuilder> builder)
{
    QueryListener listener;
    listener.on_reply = [subscriber, builder](const QueryReply& reply) {
        if (reply.ttl == 0) {
            Log(LogLevel::Debug, fmt::format("Ignoring withdrawn {} record for {}", ToString(reply.record_type), reply.fullname));
            return;
        }

        AddressFamily family;
        if (reply.record_type == RecordType::A) {
            family = AddressFamily::IPv4;
        } else if (reply.record_type == RecordType::AAAA) {
            family = AddressFamily::IPv6;
        } else {
            Log(LogLevel::Warn, fmt::format("Unexpected {} record in address query for {}", ToString(reply.record_type), reply.fullname));
            return;
        }

        IpAddress address;
        try {
            address = IpAddress::FromRecordData(family, reply.rdata);
        } catch (const DiscoveryError& error) {
            Log(LogLevel::Warn, fmt::format("Skipping address for {}: {}", reply.fullname, error.what()));
            return;
        }

        builder->AddAddress(address, [&subscriber](const ServiceRecord& snapshot) {
            subscriber->OnNext(snapshot);
        });
    };
    listener.on_failure = ForwardFailure(subscriber);
    return listener;
}

RegisterListener MakeRegisterListener(RecordSubscriber subscriber, ServiceRecord requested)
{
    RegisterListener listener;
    listener.on_reply = [subscriber, requested](const RegisterReply& reply) {
        ServiceRecord record = requested;
        record.flags = ServiceFlags::Added;
        record.service_name = reply.service_name;
        record.reg_type = reply.reg_type;
        record.domain = reply.domain;
        subscriber->OnNext(record);
    };
    listener.on_failure = ForwardFailure(subscriber);
    return listener;
}

}
