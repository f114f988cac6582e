// File: secure_memory.hpp
// Brief: Secure memory handling for private key bytes
//
// This class provides memory protection for sensitive data:
// - Asks the OS not to swap the memory to disk
// - Wipes memory with OPENSSL_cleanse on destruction and on move-assignment
// - Provides controlled access to the underlying data

#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <openssl/crypto.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#endif

namespace signer {

class SecureMemory {
private:
    uint8_t* data_;
    size_t size_;
    bool locked_;

    void lock() {
        #ifdef _WIN32
        locked_ = VirtualLock(data_, size_) != 0;
        #else
        // Fails without CAP_IPC_LOCK or above RLIMIT_MEMLOCK; the buffer is wiped either way
        locked_ = mlock(data_, size_) == 0;
        #endif
    }

    void release() {
        if (!data_) {
            return;
        }
        OPENSSL_cleanse(data_, size_);
        if (locked_) {
            #ifdef _WIN32
            VirtualUnlock(data_, size_);
            #else
            munlock(data_, size_);
            #endif
        }
        delete[] data_;
        data_ = nullptr;
        size_ = 0;
        locked_ = false;
    }

public:
    // Copies the sensitive input into a locked buffer
    explicit SecureMemory(std::span<const uint8_t> input)
        : data_(new uint8_t[input.size()]), size_(input.size()), locked_(false) {
        std::memcpy(data_, input.data(), size_);
        lock();
    }

    ~SecureMemory() {
        release();
    }

    // Prevent copying
    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    // Allow moving
    SecureMemory(SecureMemory&& other) noexcept
        : data_(other.data_), size_(other.size_), locked_(other.locked_) {
        other.data_ = nullptr;
        other.size_ = 0;
        other.locked_ = false;
    }

    SecureMemory& operator=(SecureMemory&& other) noexcept {
        if (this != &other) {
            release();

            data_ = other.data_;
            size_ = other.size_;
            locked_ = other.locked_;

            other.data_ = nullptr;
            other.size_ = 0;
            other.locked_ = false;
        }
        return *this;
    }

    // Controlled access to data
    std::span<const uint8_t> bytes() const { return {data_, size_}; }
};

} // namespace signer
