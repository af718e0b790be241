/**
 * @file secure_buffer.h
 * @brief Byte buffer that wipes its contents on destruction
 *
 * Holds decrypted private key material. The buffer never reallocates
 * after construction, so no stale copy of the secret is left on the heap.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <openssl/crypto.h>

namespace cga::crypto {

class SecureBuffer {
public:
    SecureBuffer() = default;

    explicit SecureBuffer(size_t size) : data_(size) {}

    SecureBuffer(const uint8_t* data, size_t size) : data_(data, data + size) {}

    ~SecureBuffer() { cleanse(); }

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept : data_(std::move(other.data_)) {}

    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            cleanse();
            data_ = std::move(other.data_);
        }
        return *this;
    }

    uint8_t* data() { return data_.data(); }
    const uint8_t* data() const { return data_.data(); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    /**
     * @brief Shrink the logical size without reallocating
     */
    void truncate(size_t size) {
        if (size < data_.size()) {
            OPENSSL_cleanse(data_.data() + size, data_.size() - size);
            data_.resize(size);
        }
    }

    void cleanse() {
        if (!data_.empty()) {
            OPENSSL_cleanse(data_.data(), data_.size());
        }
    }

private:
    std::vector<uint8_t> data_;
};

} // namespace cga::crypto
