#ifndef ksuid_hpp
#define ksuid_hpp

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

// K-sortable unique identifiers: 4 bytes of seconds since kEpoch followed by
// 16 random bytes, base62 encoded to a fixed 27 characters. Lexical order
// follows creation order at one second resolution.
namespace ksuid {

constexpr int64_t kEpoch          = 1400000000;
constexpr size_t kPayloadBytes    = 16;
constexpr size_t kRawBytes        = 4 + kPayloadBytes;
constexpr size_t kEncodedLength   = 27;
constexpr const char* kAlphabet   = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

inline int base62Value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    if (c >= 'a' && c <= 'z') return c - 'a' + 36;
    return -1;
}

// Encodes the 20 raw bytes as a big-endian base62 number, left padded with '0'.
inline std::string encode(const std::array<uint8_t, kRawBytes>& raw) {
    std::array<uint8_t, kRawBytes> number = raw;
    std::string out(kEncodedLength, '0');
    size_t pos = kEncodedLength;

    bool is_zero = false;
    while (!is_zero && pos > 0) {
        // long division of `number` by 62
        uint32_t remainder = 0;
        is_zero = true;
        for (auto& byte : number) {
            uint32_t acc = (remainder << 8) | byte;
            byte         = static_cast<uint8_t>(acc / 62);
            remainder    = acc % 62;
            if (byte != 0) is_zero = false;
        }
        out[--pos] = kAlphabet[remainder];
    }
    return out;
}

inline bool isValid(const std::string& id) {
    if (id.size() != kEncodedLength) return false;
    // 62^27 overflows 160 bits above "aWgEPTl1tmebfsQzFP4bxwgy80V"
    if (id > "aWgEPTl1tmebfsQzFP4bxwgy80V") return false;
    for (char c : id) {
        if (base62Value(c) < 0) return false;
    }
    return true;
}

// Seconds since the unix epoch stored in a valid id.
inline int64_t timestampOf(const std::string& id) {
    std::array<uint8_t, kRawBytes> number{};
    for (char c : id) {
        uint32_t carry = static_cast<uint32_t>(base62Value(c));
        for (size_t i = kRawBytes; i-- > 0;) {
            uint32_t acc = number[i] * 62u + carry;
            number[i]    = static_cast<uint8_t>(acc & 0xFF);
            carry        = acc >> 8;
        }
    }
    uint32_t secs = (uint32_t(number[0]) << 24) | (uint32_t(number[1]) << 16) | (uint32_t(number[2]) << 8) | number[3];
    return static_cast<int64_t>(secs) + kEpoch;
}

class Generator {
  private:
    std::mutex mtx;
    std::mt19937_64 gen;

  public:
    Generator() : gen(std::random_device{}()) {}

    std::string next(std::chrono::system_clock::time_point now) {
        int64_t unix_secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        uint32_t ts       = static_cast<uint32_t>(unix_secs - kEpoch);

        std::array<uint8_t, kRawBytes> raw{};
        raw[0] = static_cast<uint8_t>(ts >> 24);
        raw[1] = static_cast<uint8_t>(ts >> 16);
        raw[2] = static_cast<uint8_t>(ts >> 8);
        raw[3] = static_cast<uint8_t>(ts);

        std::lock_guard<std::mutex> lock(mtx);
        for (size_t i = 4; i < kRawBytes; i += 8) {
            uint64_t r = gen();
            for (size_t b = 0; b < 8 && i + b < kRawBytes; b++) {
                raw[i + b] = static_cast<uint8_t>(r >> (8 * b));
            }
        }
        return encode(raw);
    }
};

} // namespace ksuid

#endif
