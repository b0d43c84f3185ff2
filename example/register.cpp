#include "rxdnssd/mdns_discovery_service.hpp"
#include "rxdnssd/rx_dnssd.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

// usage: rxdnssd_register [name] [reg_type] [port] [seconds]
int main(int argc, char* argv[])
{
    rxdnssd::ServiceRecord record;
    record.service_name = argc > 1 ? argv[1] : "rxdnssd";
    record.reg_type = argc > 2 ? argv[2] : "_http._tcp.";
    record.domain = "local.";
    record.port = static_cast<std::uint16_t>(argc > 3 ? std::atoi(argv[3]) : 8080);
    record.txt_records = {{"path", "/"}};
    const int seconds = argc > 4 ? std::atoi(argv[4]) : 60;

    try {
        auto service = std::make_shared<rxdnssd::MdnsDiscoveryService>();
        rxdnssd::RxDnssd rxdnssd(service);

        auto subscription = rxdnssd.Register(record).Subscribe(
            [](const rxdnssd::ServiceRecord& registered) {
                std::cout << "Registered " << registered << "\n";
            },
            [](std::exception_ptr error) {
                std::cerr << "Register failed: " << rxdnssd::DescribeError(error) << "\n";
            });

        std::this_thread::sleep_for(std::chrono::seconds(seconds));
        subscription.Unsubscribe();
    } catch (const rxdnssd::DiscoveryError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
