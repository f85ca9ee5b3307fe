// Perp Ledger - Types Implementation

#include <perp/ledger/types.hpp>
#include <algorithm>
#include <stdexcept>

namespace perp::ledger {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr int X18_DIGITS = 18;

} // namespace

// Address
Address address::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must have 40 hex digits: " + std::string(hex));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_digit(hex[2 * i]);
        int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string address::to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// X18
I128 x18::from_string(std::string_view s) {
    if (s.empty()) {
        throw std::invalid_argument("empty decimal string");
    }

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = (s[0] == '-');
        s.remove_prefix(1);
    }

    auto dot = s.find('.');
    std::string_view int_part = s.substr(0, dot);
    std::string_view frac_part = (dot == std::string_view::npos) ? std::string_view{} : s.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw std::invalid_argument("no digits in decimal string");
    }

    // Largest integer part whose scaled value plus any fraction fits in I128
    constexpr I128 max_int = (I128_MAX - (X18_ONE - 1)) / X18_ONE;

    I128 int_val = 0;
    for (char c : int_part) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid decimal string: " + std::string(s));
        }
        int_val = int_val * 10 + (c - '0');
        if (int_val > max_int) {
            throw std::invalid_argument("decimal out of range: " + std::string(s));
        }
    }

    // Pad or truncate to 18 digits
    I128 frac_val = 0;
    int used = 0;
    for (char c : frac_part) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid decimal string: " + std::string(s));
        }
        if (used < X18_DIGITS) {
            frac_val = frac_val * 10 + (c - '0');
            ++used;
        }
    }
    for (; used < X18_DIGITS; ++used) frac_val *= 10;

    I128 result = int_val * X18_ONE + frac_val;
    return negative ? -result : result;
}

std::string x18::to_string(I128 v) {
    bool negative = v < 0;
    U128 abs_val = negative ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);
    U128 int_part = abs_val / static_cast<U128>(X18_ONE);
    U128 frac_part = abs_val % static_cast<U128>(X18_ONE);

    std::string int_str;
    do {
        int_str.push_back(static_cast<char>('0' + static_cast<int>(int_part % 10)));
        int_part /= 10;
    } while (int_part != 0);
    std::reverse(int_str.begin(), int_str.end());

    std::string result = negative ? "-" + int_str : int_str;
    if (frac_part == 0) return result;

    std::string frac_str(X18_DIGITS, '0');
    for (int i = X18_DIGITS - 1; i >= 0; --i) {
        frac_str[static_cast<size_t>(i)] = static_cast<char>('0' + static_cast<int>(frac_part % 10));
        frac_part /= 10;
    }
    frac_str.erase(frac_str.find_last_not_of('0') + 1);
    return result + "." + frac_str;
}

} // namespace perp::ledger
