#include "Driver.hpp"
#include <spdlog/fmt/fmt.h>

namespace odbcmcp {

std::string bytesToText(const Bytes& bytes) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string result = "0x";
    result.reserve(2 + bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        result += kHex[b >> 4];
        result += kHex[b & 0x0F];
    }
    return result;
}

std::string valueToText(const DriverValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return "";
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return fmt::format("{}", *d);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return bytesToText(std::get<Bytes>(value));
}

}  // namespace odbcmcp
