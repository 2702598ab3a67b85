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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <cerrno>

extern "C" {
    #include <sys/random.h>
}

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "CarlinkTypes.hpp"

using namespace carlink;

std::size_t uuid128_hash::operator()(jau::uuid128_t const& a) const noexcept {
    // 31 * x == (x << 5) - x
    std::size_t h = 0;
    const uint8_t * p = a.data();
    for(jau::nsize_t i=0; i<16; ++i) {
        h = ( ( h << 5 ) - h ) + p[i];
    }
    return h;
}

DeviceId carlink::to_device_id(const jau::TROOctets& bytes) {
    if( 16 != bytes.size() ) {
        throw jau::IllegalArgumentException("DeviceId requires 16 bytes, has "+std::to_string(bytes.size()), E_FILE_LINE);
    }
    return DeviceId(bytes.get_ptr(), jau::lb_endian_t::big);
}

jau::POctets carlink::to_octets(const jau::uuid128_t& id) noexcept {
    jau::POctets res(16, 16, jau::lb_endian_t::big);
    id.put(res.get_wptr(), jau::lb_endian_t::big);
    return res;
}

void carlink::random_bytes(uint8_t * dest, const jau::nsize_t size) {
    jau::nsize_t done = 0;
    while( done < size ) {
        const ssize_t res = ::getrandom(dest+done, size-done, 0);
        if( 0 > res ) {
            if( EINTR == errno ) {
                continue;
            }
            throw jau::RuntimeException("getrandom failed: errno "+std::to_string(errno)+" "+strerror(errno), E_FILE_LINE);
        }
        done += static_cast<jau::nsize_t>(res);
    }
}

DeviceId carlink::random_device_id() {
    uint8_t b[16];
    random_bytes(b, sizeof(b));
    b[6] = static_cast<uint8_t>( ( b[6] & 0x0f ) | 0x40 ); // version 4
    b[8] = static_cast<uint8_t>( ( b[8] & 0x3f ) | 0x80 ); // variant 1
    return DeviceId(b, jau::lb_endian_t::big);
}

#define DEVICE_ERROR_CASE_TO_STRING(V) case DeviceError::V: return #V;

std::string carlink::to_string(const DeviceError ec) noexcept {
    switch(ec) {
    DEVICE_ERROR_ENUM(DEVICE_ERROR_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown DeviceError";
}

std::string carlink::to_string(const OperationType op) noexcept {
    switch(op) {
        case OperationType::ENCRYPTION_HANDSHAKE: return "ENCRYPTION_HANDSHAKE";
        case OperationType::ACK: return "ACK";
        case OperationType::CLIENT_MESSAGE: return "CLIENT_MESSAGE";
        default: ; // fall through intended
    }
    return "Unknown OperationType";
}

#define CHANNEL_STATE_ENUM(X) \
    X(AWAITING_DEVICE_ID) \
    X(HANDSHAKE_IN_PROGRESS) \
    X(AWAITING_OOB_CONFIRMATION) \
    X(RESUMING_SESSION) \
    X(ESTABLISHED) \
    X(ERROR)

#define CHANNEL_STATE_CASE_TO_STRING(V) case ChannelState::V: return #V;

std::string carlink::to_string(const ChannelState s) noexcept {
    switch(s) {
    CHANNEL_STATE_ENUM(CHANNEL_STATE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ChannelState";
}

/**
 * Row is the source state, column the destination state, both in enum order.
 */
static constexpr const bool channel_transitions[6][6] = {
    /*                       AWAIT_ID HS     OOB    RESUME EST    ERR   */
    /* AWAITING_DEVICE_ID */ { false, true,  false, false, false, true  },
    /* HANDSHAKE_IN_PROG  */ { false, false, true,  true,  false, true  },
    /* AWAITING_OOB_CONF  */ { false, false, false, false, true,  true  },
    /* RESUMING_SESSION   */ { false, false, false, false, true,  true  },
    /* ESTABLISHED        */ { false, false, false, false, false, false },
    /* ERROR              */ { false, false, false, false, false, false }
};

bool carlink::is_valid_transition(const ChannelState from, const ChannelState to) noexcept {
    const uint8_t f = number(from), t = number(to);
    if( f > 5 || t > 5 ) {
        return false;
    }
    return channel_transitions[f][t];
}

std::string carlink::to_string(const DeviceConnectionState s) noexcept {
    switch(s) {
        case DeviceConnectionState::DISCONNECTED: return "DISCONNECTED";
        case DeviceConnectionState::CONNECTING: return "CONNECTING";
        case DeviceConnectionState::HANDSHAKE_IN_PROGRESS: return "HANDSHAKE_IN_PROGRESS";
        case DeviceConnectionState::ESTABLISHED: return "ESTABLISHED";
        default: ; // fall through intended
    }
    return "Unknown DeviceConnectionState";
}

static constexpr const bool device_transitions[4][4] = {
    /*                          DISC   CONN   HS     EST   */
    /* DISCONNECTED          */ { false, true,  true,  false },
    /* CONNECTING            */ { true,  false, true,  false },
    /* HANDSHAKE_IN_PROGRESS */ { true,  false, false, true  },
    /* ESTABLISHED           */ { true,  false, false, false }
};

bool carlink::is_valid_transition(const DeviceConnectionState from, const DeviceConnectionState to) noexcept {
    const uint8_t f = number(from), t = number(to);
    if( f > 3 || t > 3 ) {
        return false;
    }
    return device_transitions[f][t];
}

std::string carlink::to_string(const ManagerState s) noexcept {
    switch(s) {
        case ManagerState::STOPPED: return "STOPPED";
        case ManagerState::STARTING: return "STARTING";
        case ManagerState::RUNNING: return "RUNNING";
        default: ; // fall through intended
    }
    return "Unknown ManagerState";
}

static constexpr const bool manager_transitions[3][3] = {
    /*               STOP   START  RUN   */
    /* STOPPED  */ { false, true,  false },
    /* STARTING */ { true,  false, true  },
    /* RUNNING  */ { true,  true,  false }
};

bool carlink::is_valid_transition(const ManagerState from, const ManagerState to) noexcept {
    const uint8_t f = number(from), t = number(to);
    if( f > 2 || t > 2 ) {
        return false;
    }
    return manager_transitions[f][t];
}

std::string DeviceMessage::toString() const noexcept {
    return "DeviceMessage[recipient "+recipient.toString()+", encrypted "+std::to_string(encrypted)+
           ", payload "+std::to_string(payload.size())+" bytes]";
}

std::string ConnectedDevice::toString() const noexcept {
    return "ConnectedDevice[id "+deviceId.toString()+", name '"+deviceName+
           "', activeUser "+std::to_string(belongsToActiveUser)+", secure "+std::to_string(secureChannel)+"]";
}

std::string AssociatedDevice::toString() const noexcept {
    return "AssociatedDevice[id "+deviceId.toString()+", address "+address+", name '"+name+
           "', enabled "+std::to_string(connectionEnabled)+"]";
}
