#include "rxdnssd/mdns_discovery_service.hpp"
#include "rxdnssd/rx_dnssd.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

// usage: rxdnssd_browse [reg_type] [seconds]
int main(int argc, char* argv[])
{
    const std::string reg_type = argc > 1 ? argv[1] : "_http._tcp.";
    const int seconds = argc > 2 ? std::atoi(argv[2]) : 20;

    try {
        auto service = std::make_shared<rxdnssd::MdnsDiscoveryService>();
        rxdnssd::RxDnssd rxdnssd(service);

        auto subscription = rxdnssd.Browse(reg_type, "local.")
            .Compose(rxdnssd.Resolve())
            .Compose(rxdnssd.QueryRecords())
            .Subscribe(
                [](const rxdnssd::ServiceRecord& record) {
                    std::cout << record << "\n";
                },
                [](std::exception_ptr error) {
                    std::cerr << "Browse failed: " << rxdnssd::DescribeError(error) << "\n";
                });

        std::this_thread::sleep_for(std::chrono::seconds(seconds));
        subscription.Unsubscribe();
    } catch (const rxdnssd::DiscoveryError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
