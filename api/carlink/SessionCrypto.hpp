/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2021 Gothel Software e.K.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef CARLINK_SESSION_CRYPTO_HPP_
#define CARLINK_SESSION_CRYPTO_HPP_

#include <string>
#include <memory>
#include <cstdint>
#include <mutex>

#include <jau/basic_types.hpp>
#include <jau/int_types.hpp>
#include <jau/octets.hpp>

#include "CarlinkTypes.hpp"

namespace carlink {

    /**
     * AES-128-CCM nonce length as required by the tinycrypt implementation.
     */
    inline constexpr const jau::nsize_t CCM_NONCE_SIZE = 13;

    /**
     * AES-128-CCM authentication tag length.
     */
    inline constexpr const jau::nsize_t CCM_TAG_SIZE = 16;

    /**
     * Seals `len` bytes of `in` into `out`, which must provide `len + CCM_TAG_SIZE` bytes.
     * @return true on success
     */
    bool aes128_ccm_seal(const jau::uint128dp_t& key, const uint8_t nonce[CCM_NONCE_SIZE],
                         const uint8_t * in, const jau::nsize_t len, uint8_t * out) noexcept;

    /**
     * Opens `len` bytes of `in`, ciphertext with trailing tag, into `out`,
     * which must provide `len - CCM_TAG_SIZE` bytes.
     * @return true if the tag verified, otherwise false and `out` has been zeroed.
     */
    bool aes128_ccm_open(const jau::uint128dp_t& key, const uint8_t nonce[CCM_NONCE_SIZE],
                         const uint8_t * in, const jau::nsize_t len, uint8_t * out) noexcept;

    /**
     * A 128 bit symmetric session key, either derived by a handshake or restored from storage.
     */
    class SessionKey {
        public:
            static constexpr const jau::nsize_t SIZE = 16;

        private:
            jau::uint128dp_t key;
            bool valid;

        public:
            /** Constructs an invalid key. */
            SessionKey() noexcept
            : key(), valid(false) {}

            explicit SessionKey(const jau::uint128dp_t& key_) noexcept
            : key(key_), valid(true) {}

            /** Returns a random key, see random_bytes(). */
            static SessionKey generate();

            /** Returns a key from the given 16 bytes, or an invalid key if the size doesn't match. */
            static SessionKey fromBytes(const jau::TROOctets& bytes) noexcept;

            bool isValid() const noexcept { return valid; }

            const jau::uint128dp_t& get() const noexcept { return key; }

            jau::POctets toBytes() const noexcept;

            bool operator==(const SessionKey& rhs) const noexcept {
                return valid == rhs.valid && key == rhs.key;
            }
            bool operator!=(const SessionKey& rhs) const noexcept {
                return !(*this == rhs);
            }

            /** Doesn't expose key material. */
            std::string toString() const noexcept {
                return valid ? "SessionKey[valid]" : "SessionKey[invalid]";
            }
    };

    /**
     * Role of a ChannelCipher, selecting the direction byte of its nonces.
     */
    enum class CipherRole : uint8_t {
        SERVER = 0x01,
        CLIENT = 0x02
    };
    constexpr uint8_t number(const CipherRole rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    constexpr CipherRole peer_role(const CipherRole rhs) noexcept {
        return CipherRole::SERVER == rhs ? CipherRole::CLIENT : CipherRole::SERVER;
    }

    /**
     * AES-128-CCM message protection of an established secure channel.
     * <p>
     * Nonce layout is `direction(1) ‖ zero(4) ‖ counter(8, little endian)`.
     * A sealed frame is `counter(8) ‖ ciphertext ‖ tag(16)`.
     * </p>
     * <p>
     * Encryption uses the own role as direction, decryption the peer's role.
     * Hence the decryption nonce of one peer equals the encryption nonce of the other
     * and an endpoint cannot decrypt its own ciphertext.
     * </p>
     * <p>
     * Received counters must strictly increase, replayed frames are rejected.
     * </p>
     */
    class ChannelCipher {
        public:
            static constexpr const jau::nsize_t COUNTER_SIZE = 8;
            static constexpr const jau::nsize_t OVERHEAD = COUNTER_SIZE + CCM_TAG_SIZE;

        private:
            const SessionKey key;
            const CipherRole role;
            std::mutex mtx_counter;
            uint64_t tx_counter;
            uint64_t rx_counter;

            static void make_nonce(uint8_t nonce[CCM_NONCE_SIZE], const CipherRole dir, const uint64_t counter) noexcept;

        public:
            ChannelCipher(const SessionKey& key_, const CipherRole role_) noexcept;

            ChannelCipher(const ChannelCipher&) = delete;
            void operator=(const ChannelCipher&) = delete;

            CipherRole getRole() const noexcept { return role; }

            /**
             * Encrypts the given plaintext into `out`.
             * @return DeviceError::SUCCESS, DeviceError::INVALID_ENCRYPTION_KEY without valid key
             *         or DeviceError::INVALID_MSG if sealing failed.
             */
            DeviceError encrypt(const jau::TROOctets& plain, jau::POctets& out) noexcept;

            /**
             * Decrypts the given sealed frame into `out`.
             * @return DeviceError::SUCCESS, DeviceError::INVALID_ENCRYPTION_KEY without valid key
             *         or DeviceError::INVALID_MSG if the frame is truncated, forged, replayed or not meant for this role.
             */
            DeviceError decrypt(const jau::TROOctets& sealed, jau::POctets& out) noexcept;
    };

} // namespace carlink

#endif /* CARLINK_SESSION_CRYPTO_HPP_ */
