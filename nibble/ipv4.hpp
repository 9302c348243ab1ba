#pragma once

#include <nibble/elements.hpp>
#include <nibble/repeat.hpp>
#include <nibble/take.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace nibble
{
    struct ipv4_address
    {
        std::array<std::uint8_t, 4> octets;
    };

    inline bool operator==(ipv4_address const &left, ipv4_address const &right)
    {
        return left.octets == right.octets;
    }

    inline std::string to_string(ipv4_address const &address)
    {
        return std::to_string(address.octets[0]) + '.' + std::to_string(address.octets[1]) + '.' +
               std::to_string(address.octets[2]) + '.' + std::to_string(address.octets[3]);
    }

    // One to three decimal digits with a value of at most 255.
    inline parser<std::string, std::uint8_t> decimal_octet()
    {
        return nibble::bind(take_while<std::string>([](char const c)
                                                    {
                                                        return (c >= '0') && (c <= '9');
                                                    }),
                            [](std::string const &digits) -> parser<std::string, std::uint8_t>
                            {
                                if (digits.empty())
                                {
                                    return fail_with<std::string, std::uint8_t>(
                                        errors::predicate_failed{std::string("decimal digit")});
                                }
                                if (digits.size() > 3)
                                {
                                    return fail_with<std::string, std::uint8_t>(
                                        errors::invalid{"too many digits in octet " + digits});
                                }
                                unsigned long const value = std::stoul(digits);
                                if (value > 255)
                                {
                                    return fail_with<std::string, std::uint8_t>(
                                        errors::invalid{"octet out of range: " + digits});
                                }
                                return pure<std::string>(static_cast<std::uint8_t>(value));
                            });
    }

    // Dotted quad notation like 192.168.0.1
    inline parser<std::string, ipv4_address> ipv4()
    {
        parser<std::string, std::uint8_t> const octet = decimal_octet();
        return nibble::bind(octet, [octet](std::uint8_t const first)
                            {
                                auto const dotted = nibble::then(element<std::string>('.'), octet);
                                return nibble::map(nibble::repeat(exactly(make_count(3)), dotted),
                                                   [first](std::vector<std::uint8_t> const &rest)
                                                   {
                                                       ipv4_address address;
                                                       address.octets[0] = first;
                                                       for (std::size_t i = 0; i < rest.size(); ++i)
                                                       {
                                                           address.octets[i + 1] = rest[i];
                                                       }
                                                       return address;
                                                   });
                            });
    }
}
