/**
 * @file string_utils.h
 * @brief String and encoding utilities
 *
 * Common string operations used across CGA services.
 *
 * @version 1.0.0
 * @date 2026-02-02
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace cga {
namespace utils {

/**
 * @brief Convert string to lowercase
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase
 */
std::string toUpper(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * "a,b," yields ["a", "b", ""]; an empty string yields [""].
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts
 */
std::vector<std::string> split(const std::string& str, char delimiter);

bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Convert bytes to lowercase hex string
 *
 * @param data Byte array
 * @param len Length of data
 * @return Hex string (e.g., "0a1b2c"), empty for null/empty input
 */
std::string bytesToHex(const uint8_t* data, size_t len);

inline std::string bytesToHex(const std::vector<uint8_t>& data) {
    return bytesToHex(data.data(), data.size());
}

/**
 * @brief Convert hex string to bytes
 *
 * @param hex Hex string (even length)
 * @return Bytes
 * @throws std::invalid_argument on odd length or non-hex characters
 */
std::vector<uint8_t> hexToBytes(const std::string& hex);

/**
 * @brief Encode bytes as single-line Base64 (no newlines)
 */
std::string toBase64(const std::vector<uint8_t>& data);

/**
 * @brief Decode Base64
 *
 * @return Decoded bytes, or std::nullopt if the input is not valid Base64
 */
std::optional<std::vector<uint8_t>> fromBase64(const std::string& base64);

/**
 * @brief Generate a random UUID v4 string (36 chars)
 */
std::string generateUuid();

/**
 * @brief Generate cryptographically random bytes, hex encoded
 *
 * @param numBytes Number of random bytes (output length is 2 * numBytes)
 * @throws std::runtime_error if the entropy source fails
 */
std::string randomHex(size_t numBytes);

} // namespace utils
} // namespace cga
