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
#include <algorithm>

#include <jau/debug.hpp>

#include "OobConnectionManager.hpp"

using namespace carlink;

OobConnectionManager::OobConnectionManager() noexcept
: key()
{
    ::memset(encryptionIv, 0, sizeof(encryptionIv));
    ::memset(decryptionIv, 0, sizeof(decryptionIv));
}

void OobConnectionManager::generateOobData() {
    key = SessionKey::generate();
    random_bytes(encryptionIv, sizeof(encryptionIv));
    do {
        random_bytes(decryptionIv, sizeof(decryptionIv));
    } while( 0 == ::memcmp(encryptionIv, decryptionIv, CCM_NONCE_SIZE) );
}

bool OobConnectionManager::setOobData(const jau::TROOctets& oobData) noexcept {
    if( OOB_DATA_SIZE != oobData.size() ) {
        WARN_PRINT("OobConnectionManager: Invalid out-of-band data size %u, expected %u", oobData.size(), OOB_DATA_SIZE);
        key = SessionKey();
        return false;
    }
    const uint8_t * p = oobData.get_ptr();
    ::memcpy(decryptionIv, p, CCM_NONCE_SIZE);
    ::memcpy(encryptionIv, p + CCM_NONCE_SIZE, CCM_NONCE_SIZE);
    key = SessionKey::fromBytes( jau::TROOctets(p + 2*CCM_NONCE_SIZE, SessionKey::SIZE, jau::lb_endian_t::little) );
    return key.isValid();
}

jau::POctets OobConnectionManager::getOobData() const noexcept {
    if( !key.isValid() ) {
        return jau::POctets(jau::lb_endian_t::little);
    }
    jau::POctets res(OOB_DATA_SIZE, OOB_DATA_SIZE, jau::lb_endian_t::little);
    uint8_t * p = res.get_wptr();
    // receiver's decryption IV is our encryption IV and vice versa
    ::memcpy(p, encryptionIv, CCM_NONCE_SIZE);
    ::memcpy(p + CCM_NONCE_SIZE, decryptionIv, CCM_NONCE_SIZE);
    ::memcpy(p + 2*CCM_NONCE_SIZE, key.get().data, SessionKey::SIZE);
    return res;
}

DeviceError OobConnectionManager::encryptVerificationCode(const jau::TROOctets& code, jau::POctets& out) const noexcept {
    if( !key.isValid() ) {
        return DeviceError::INVALID_ENCRYPTION_KEY;
    }
    const jau::nsize_t sz = code.size() + CCM_TAG_SIZE;
    out.resize(sz, sz);
    if( !aes128_ccm_seal(key.get(), encryptionIv, code.get_ptr(), code.size(), out.get_wptr()) ) {
        return DeviceError::INVALID_MSG;
    }
    return DeviceError::SUCCESS;
}

DeviceError OobConnectionManager::decryptVerificationCode(const jau::TROOctets& sealed, jau::POctets& out) const noexcept {
    if( !key.isValid() ) {
        return DeviceError::INVALID_ENCRYPTION_KEY;
    }
    if( sealed.size() < CCM_TAG_SIZE ) {
        return DeviceError::INVALID_MSG;
    }
    const jau::nsize_t sz = sealed.size() - CCM_TAG_SIZE;
    out.resize(std::max<jau::nsize_t>(1, sz), sz);
    if( !aes128_ccm_open(key.get(), decryptionIv, sealed.get_ptr(), sealed.size(), out.get_wptr()) ) {
        out.resize(0, 0);
        return DeviceError::INVALID_MSG;
    }
    return DeviceError::SUCCESS;
}

std::string OobConnectionManager::toString() const noexcept {
    return "OobConnectionManager["+key.toString()+"]";
}
