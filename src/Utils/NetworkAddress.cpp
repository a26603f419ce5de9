#include "Utils/NetworkAddress.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <charconv>
#include <format>

namespace NetworkAddress {

bool isIpv4(std::string_view address) noexcept {
    if (address.empty()) return false;
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(std::string(address), ec);
    return !ec;
}

std::optional<unsigned> parseOctet(std::string_view octet) noexcept {
    if (octet.empty() || octet.size() > 3) return std::nullopt;
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(octet.data(), octet.data() + octet.size(), value);
    if (ec != std::errc{} || ptr != octet.data() + octet.size()) return std::nullopt;
    if (value > 255) return std::nullopt;
    return value;
}

std::string privateHost(unsigned octet, unsigned host) {
    return std::format("192.168.{}.{}", octet, host);
}

} // namespace NetworkAddress
