#include <util/time.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace util {

std::string format_timestamp(timestamp_t tp) {
    auto const secs   = std::chrono::floor<std::chrono::seconds>(tp);
    auto const micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    auto const tt     = std::chrono::system_clock::to_time_t(secs);

    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06}Z", fmt::gmtime(tt), micros);
}

timestamp_t parse_timestamp(std::string_view text) {
    auto invalid = [&text]() {
        return std::invalid_argument{ fmt::format("invalid timestamp '{}'", text) };
    };

    std::tm tm{};
    std::istringstream in{ std::string{ text } };
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if(in.fail())
        throw invalid();

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    // get_time stops right after the seconds field
    auto const consumed = in.eof() ? text.size() : static_cast<std::size_t>(in.tellg());
    auto rest           = text.substr(consumed);

    if(not rest.empty() and rest.front() == '.') {
        rest.remove_prefix(1);
        std::int64_t nanos = 0;
        int digits         = 0;
        while(not rest.empty() and std::isdigit(static_cast<unsigned char>(rest.front()))) {
            if(digits < 9) {
                nanos = nanos * 10 + (rest.front() - '0');
                ++digits;
            }
            rest.remove_prefix(1);
        }
        if(digits == 0)
            throw invalid();
        for(; digits < 9; ++digits)
            nanos *= 10;
        tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds{ nanos });
    }

    if(rest.empty() or rest == "Z" or rest == "z")
        return tp;

    if(rest.size() == 6 and (rest[0] == '+' or rest[0] == '-') and rest[3] == ':') {
        auto digit = [&](std::size_t idx) {
            if(not std::isdigit(static_cast<unsigned char>(rest[idx])))
                throw invalid();
            return rest[idx] - '0';
        };
        auto const offset = std::chrono::hours{ digit(1) * 10 + digit(2) } + std::chrono::minutes{ digit(4) * 10 + digit(5) };
        return rest[0] == '+' ? tp - offset : tp + offset;
    }

    throw invalid();
}

std::string format_utc(timestamp_t tp, std::string_view pattern) {
    auto const tt = std::chrono::system_clock::to_time_t(tp);
    return fmt::format(fmt::runtime(fmt::format("{{:{}}}", pattern)), fmt::gmtime(tt));
}

} // namespace util
