/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "cga/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <random>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace cga {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;

    if (str.empty()) {
        tokens.push_back("");
        return tokens;
    }

    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }

    // Handle trailing delimiter: "a,b," should produce ["a", "b", ""]
    if (str.back() == delimiter) {
        tokens.push_back("");
    }

    return tokens;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string bytesToHex(const uint8_t* data, size_t len) {
    if (!data || len == 0) {
        return "";
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }

    return oss.str();
}

std::vector<uint8_t> hexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        char c1 = hex[i];
        char c2 = hex[i + 1];

        if (!std::isxdigit(static_cast<unsigned char>(c1)) ||
            !std::isxdigit(static_cast<unsigned char>(c2))) {
            throw std::invalid_argument("Invalid hex character in string");
        }

        std::string byteString = hex.substr(i, 2);
        bytes.push_back(static_cast<uint8_t>(std::stoi(byteString, nullptr, 16)));
    }

    return bytes;
}

std::string toBase64(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    // 4 output chars per 3 input bytes, plus NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::vector<uint8_t>> fromBase64(const std::string& base64) {
    if (base64.empty()) {
        return std::vector<uint8_t>{};
    }
    if (base64.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    for (size_t i = 0; i < base64.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(base64[i]);
        if (c == '=') {
            // Padding only in the last two positions
            if (i < base64.size() - 2) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || !(std::isalnum(c) || c == '+' || c == '/')) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> out(3 * (base64.size() / 4));
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(base64.data()),
                              static_cast<int>(base64.size()));
    if (len < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

std::string generateUuid() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t ab = dis(gen);
    uint64_t cd = dis(gen);

    // Version 4, RFC 4122 variant
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << ((ab >> 32) & 0xFFFFFFFF) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << ((cd >> 48) & 0xFFFF) << "-";
    ss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);

    return ss.str();
}

std::string randomHex(size_t numBytes) {
    std::vector<uint8_t> buf(numBytes);
    if (numBytes > 0 && RAND_bytes(buf.data(), static_cast<int>(numBytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytesToHex(buf);
}

} // namespace utils
} // namespace cga
