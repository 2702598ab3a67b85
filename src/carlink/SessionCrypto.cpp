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

#include <memory>
#include <cstdint>
#include <cstring>
#include <cinttypes>
#include <algorithm>

#include <jau/debug.hpp>

#include "SessionCrypto.hpp"

#include <tinycrypt/constants.h>
#include <tinycrypt/aes.h>
#include <tinycrypt/ccm_mode.h>

using namespace carlink;

bool carlink::aes128_ccm_seal(const jau::uint128dp_t& key, const uint8_t nonce[CCM_NONCE_SIZE],
                              const uint8_t * in, const jau::nsize_t len, uint8_t * out) noexcept
{
    struct tc_aes_key_sched_struct sched;
    struct tc_ccm_mode_struct c;
    uint8_t n[CCM_NONCE_SIZE];
    ::memcpy(n, nonce, CCM_NONCE_SIZE);

    if( TC_CRYPTO_FAIL == tc_aes128_set_encrypt_key(&sched, key.data) ) {
        return false;
    }
    if( TC_CRYPTO_FAIL == tc_ccm_config(&c, &sched, n, CCM_NONCE_SIZE, CCM_TAG_SIZE) ) {
        return false;
    }
    const bool res = TC_CRYPTO_FAIL != tc_ccm_generation_encryption(out, len + CCM_TAG_SIZE, nullptr, 0,
                                                                    0 < len ? in : nullptr, len, &c);
    ::memset(&sched, 0, sizeof(sched));
    return res;
}

bool carlink::aes128_ccm_open(const jau::uint128dp_t& key, const uint8_t nonce[CCM_NONCE_SIZE],
                              const uint8_t * in, const jau::nsize_t len, uint8_t * out) noexcept
{
    if( len < CCM_TAG_SIZE ) {
        return false;
    }
    struct tc_aes_key_sched_struct sched;
    struct tc_ccm_mode_struct c;
    uint8_t n[CCM_NONCE_SIZE];
    ::memcpy(n, nonce, CCM_NONCE_SIZE);

    if( TC_CRYPTO_FAIL == tc_aes128_set_encrypt_key(&sched, key.data) ) {
        return false;
    }
    if( TC_CRYPTO_FAIL == tc_ccm_config(&c, &sched, n, CCM_NONCE_SIZE, CCM_TAG_SIZE) ) {
        return false;
    }
    const bool res = TC_CRYPTO_FAIL != tc_ccm_decryption_verification(out, len - CCM_TAG_SIZE, nullptr, 0, in, len, &c);
    ::memset(&sched, 0, sizeof(sched));
    return res;
}

SessionKey SessionKey::generate() {
    jau::uint128dp_t k;
    random_bytes(k.data, sizeof(k.data));
    return SessionKey(k);
}

SessionKey SessionKey::fromBytes(const jau::TROOctets& bytes) noexcept {
    if( SIZE != bytes.size() ) {
        return SessionKey();
    }
    jau::uint128dp_t k;
    ::memcpy(k.data, bytes.get_ptr(), SIZE);
    return SessionKey(k);
}

jau::POctets SessionKey::toBytes() const noexcept {
    return jau::POctets(key.data, SIZE, jau::lb_endian_t::little);
}

ChannelCipher::ChannelCipher(const SessionKey& key_, const CipherRole role_) noexcept
: key(key_), role(role_), tx_counter(0), rx_counter(0)
{ }

void ChannelCipher::make_nonce(uint8_t nonce[CCM_NONCE_SIZE], const CipherRole dir, const uint64_t counter) noexcept {
    ::memset(nonce, 0, CCM_NONCE_SIZE);
    nonce[0] = number(dir);
    jau::put_uint64(nonce + 5, counter, jau::lb_endian_t::little);
}

DeviceError ChannelCipher::encrypt(const jau::TROOctets& plain, jau::POctets& out) noexcept {
    if( !key.isValid() ) {
        return DeviceError::INVALID_ENCRYPTION_KEY;
    }
    uint64_t counter;
    {
        const std::lock_guard<std::mutex> lock(mtx_counter); // RAII-style acquire and relinquish via destructor
        counter = ++tx_counter;
    }
    uint8_t nonce[CCM_NONCE_SIZE];
    make_nonce(nonce, role, counter);

    const jau::nsize_t sz = plain.size() + OVERHEAD;
    out.resize(sz, sz);
    jau::put_uint64(out.get_wptr(), counter, jau::lb_endian_t::little);
    if( !aes128_ccm_seal(key.get(), nonce, plain.get_ptr(), plain.size(), out.get_wptr() + COUNTER_SIZE) ) {
        ERR_PRINT("ChannelCipher::encrypt: Failed sealing %u bytes", plain.size());
        return DeviceError::INVALID_MSG;
    }
    return DeviceError::SUCCESS;
}

DeviceError ChannelCipher::decrypt(const jau::TROOctets& sealed, jau::POctets& out) noexcept {
    if( !key.isValid() ) {
        return DeviceError::INVALID_ENCRYPTION_KEY;
    }
    if( sealed.size() < OVERHEAD ) {
        DBG_PRINT("ChannelCipher::decrypt: Truncated frame of %u bytes", sealed.size());
        return DeviceError::INVALID_MSG;
    }
    const uint64_t counter = jau::get_uint64(sealed.get_ptr(), jau::lb_endian_t::little);
    uint8_t nonce[CCM_NONCE_SIZE];
    make_nonce(nonce, peer_role(role), counter);

    const jau::nsize_t sz = sealed.size() - OVERHEAD;
    out.resize(std::max<jau::nsize_t>(1, sz), sz); // keep a valid buffer for empty payloads

    const std::lock_guard<std::mutex> lock(mtx_counter); // RAII-style acquire and relinquish via destructor
    if( counter <= rx_counter ) {
        DBG_PRINT("ChannelCipher::decrypt: Replayed counter %" PRIu64 " <= %" PRIu64, counter, rx_counter);
        return DeviceError::INVALID_MSG;
    }
    if( !aes128_ccm_open(key.get(), nonce, sealed.get_ptr() + COUNTER_SIZE, sealed.size() - COUNTER_SIZE, out.get_wptr()) ) {
        DBG_PRINT("ChannelCipher::decrypt: Authentication failed, counter %" PRIu64, counter);
        out.resize(0, 0);
        return DeviceError::INVALID_MSG;
    }
    rx_counter = counter;
    return DeviceError::SUCCESS;
}
