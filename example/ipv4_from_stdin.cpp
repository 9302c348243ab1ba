#include <nibble/ipv4.hpp>
#include <nibble/nibble.hpp>
#include <boost/system/error_code.hpp>
#include <silicium/error_or.hpp>
#include <array>
#include <iostream>

namespace
{
    bool is_separator(char const c)
    {
        return (c == ' ') || (c == '\n') || (c == '\r') || (c == '\t') || (c == ',');
    }

    // addresses separated by white space or commas
    nibble::parser<std::string, std::vector<nibble::ipv4_address>> address_list()
    {
        auto const separators = nibble::skip_while<std::string>(is_separator);
        return nibble::then(separators, nibble::many(nibble::before(nibble::ipv4(), separators)));
    }

    Si::error_or<std::string> read_chunk(std::istream &in)
    {
        std::array<char, 64> chunk;
        in.read(chunk.data(), chunk.size());
        if (in.bad())
        {
            return boost::system::errc::make_error_code(boost::system::errc::io_error);
        }
        return std::string(chunk.data(), static_cast<std::size_t>(in.gcount()));
    }
}

int main()
{
    Si::error_or<nibble::result<std::string, std::vector<nibble::ipv4_address>>> const outcome =
        nibble::parse_feed_checked(
            []()
            {
                return read_chunk(std::cin);
            },
            address_list(), "");
    if (outcome.is_error())
    {
        std::cerr << "Could not read the input: " << outcome.error().message() << '\n';
        return 1;
    }
    nibble::parse_ok<std::string, std::vector<nibble::ipv4_address>> const *const ok =
        nibble::try_get_ok(outcome.get());
    if (!ok)
    {
        std::cerr << nibble::describe(outcome.get()) << '\n';
        return 1;
    }
    for (nibble::ipv4_address const &address : ok->value)
    {
        std::cout << nibble::to_string(address) << '\n';
    }
    if (!ok->leftover.empty())
    {
        std::cerr << "Unexpected input: " << ok->leftover << '\n';
        return 1;
    }
}
