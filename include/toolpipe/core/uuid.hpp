#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace toolpipe::core {

// UUID v4 implementation
class UUID {
public:
    UUID() : bytes_{} {}

    // Generate a new random UUID (v4)
    static UUID generate() {
        UUID uuid;

        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        // Version 4, RFC 4122 variant
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        for (int i = 0; i < 8; ++i) {
            uuid.bytes_[i] = static_cast<uint8_t>((high >> (56 - i * 8)) & 0xFF);
            uuid.bytes_[i + 8] = static_cast<uint8_t>((low >> (56 - i * 8)) & 0xFF);
        }

        return uuid;
    }

    // Canonical form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    std::string to_string() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes_[i]);
        }

        return ss.str();
    }

    // 32 lowercase hex characters, no separators
    std::string to_hex() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (auto b : bytes_) {
            ss << std::setw(2) << static_cast<int>(b);
        }
        return ss.str();
    }

    bool is_valid() const {
        for (auto b : bytes_) {
            if (b != 0) return true;
        }
        return false;
    }

    bool operator==(const UUID& other) const {
        return bytes_ == other.bytes_;
    }

    bool operator!=(const UUID& other) const {
        return bytes_ != other.bytes_;
    }

private:
    std::array<uint8_t, 16> bytes_;
};

// trace_<16 hex>_<unix seconds>
inline std::string generate_trace_id() {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "trace_" + UUID::generate().to_hex().substr(0, 16) + "_" + std::to_string(seconds);
}

// span_<type>_<8 hex>
inline std::string generate_span_id(std::string_view span_type) {
    return "span_" + std::string(span_type) + "_" + UUID::generate().to_hex().substr(0, 8);
}

inline std::string root_span_id(std::string_view trace_id) {
    return "span_root_" + std::string(trace_id);
}

}  // namespace toolpipe::core
