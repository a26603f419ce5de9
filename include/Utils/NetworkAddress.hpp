#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace NetworkAddress {

// dotted-quad IPv4 check, backed by boost::asio::ip::make_address_v4
[[nodiscard]] bool isIpv4(std::string_view address) noexcept;

// "100" -> 100; nullopt for anything that is not an integer in 0..255
[[nodiscard]] std::optional<unsigned> parseOctet(std::string_view octet) noexcept;

// 192.168.<octet>.<host>
[[nodiscard]] std::string privateHost(unsigned octet, unsigned host);

} // namespace NetworkAddress
