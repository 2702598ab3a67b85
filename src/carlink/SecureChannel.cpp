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

#include <jau/debug.hpp>

#include "SecureChannel.hpp"
#include "CarlinkConst.hpp"

using namespace carlink;

std::string carlink::to_string(const HandshakeState s) noexcept {
    switch(s) {
        case HandshakeState::UNKNOWN: return "UNKNOWN";
        case HandshakeState::IN_PROGRESS: return "IN_PROGRESS";
        case HandshakeState::VERIFICATION_NEEDED: return "VERIFICATION_NEEDED";
        case HandshakeState::RESUMING_SESSION: return "RESUMING_SESSION";
        case HandshakeState::FINISHED: return "FINISHED";
        case HandshakeState::INVALID: return "INVALID";
        default: ; // fall through intended
    }
    return "Unknown HandshakeState";
}

static jau::TROOctets string_octets(const std::string& s) noexcept {
    return jau::TROOctets(reinterpret_cast<const uint8_t*>(s.data()), s.size(), jau::lb_endian_t::little);
}

SecureChannel::SecureChannel(const TransportAdapterRef& transport_, const link_handle_t link_, const DeviceStoreRef& store_,
                             std::unique_ptr<HandshakePrimitive> primitive_, const bool isReconnect,
                             const SecureChannelListenerRef& listener_,
                             const std::shared_ptr<OobConnectionManager>& oob_)
: transport(transport_), link(link_), store(store_), primitive(std::move(primitive_)),
  reconnect(isReconnect), listener(listener_), oob(oob_),
  state(ChannelState::AWAITING_DEVICE_ID), deviceId(), has_device_id(false), lastError(DeviceError::SUCCESS)
{
    if( nullptr == transport || nullptr == store || nullptr == primitive || nullptr == listener ) {
        throw jau::IllegalArgumentException("SecureChannel: null transport, store, primitive or listener", E_FILE_LINE);
    }
    DBG_PRINT("SecureChannel::ctor: %s", toString().c_str());
}

SecureChannel::~SecureChannel() noexcept {
    DBG_PRINT("SecureChannel::dtor: %s", toString().c_str());
}

ChannelState SecureChannel::getState() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
    return state;
}

bool SecureChannel::hasDeviceId() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
    return has_device_id;
}

DeviceId SecureChannel::getDeviceId() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
    return deviceId;
}

SessionKey SecureChannel::getSessionKey() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
    return sessionKey;
}

bool SecureChannel::setState(const ChannelState to) noexcept {
    if( !is_valid_transition(state, to) ) {
        ERR_PRINT("SecureChannel: Invalid transition %s -> %s: %s",
                to_string(state).c_str(), to_string(to).c_str(), toString().c_str());
        return false;
    }
    DBG_PRINT("SecureChannel: %s -> %s, link %u", to_string(state).c_str(), to_string(to).c_str(), link);
    state = to;
    return true;
}

void SecureChannel::fail(const DeviceError error) noexcept {
    if( ChannelState::ERROR == state || ChannelState::ESTABLISHED == state ) {
        return;
    }
    WARN_PRINT("SecureChannel: Handshake failed in %s: %s, link %u",
            to_string(state).c_str(), to_string(error).c_str(), link);
    state = ChannelState::ERROR;
    lastError = error;
    verificationCode.clear();
    post( [this, error](SecureChannelListener& l) { l.establishSecureChannelFailure(*this, error); } );
}

void SecureChannel::post(const Notification& n) noexcept {
    pendingNotifications.push_back(n);
}

void SecureChannel::flushNotifications() noexcept {
    jau::darray<Notification> todo;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
        todo.swap(pendingNotifications);
    }
    for(Notification& n : todo) {
        try {
            n(*listener);
        } catch (std::exception &e) {
            ERR_PRINT("SecureChannel: Caught exception in listener %s", e.what());
        }
    }
}

bool SecureChannel::sendHandshake(const jau::TROOctets& payload) noexcept {
    const DeviceMessage frame(RecipientId(), false /* encrypted */, payload);
    try {
        if( transport->sendMessage(link, frame, OperationType::ENCRYPTION_HANDSHAKE) ) {
            return true;
        }
    } catch (std::exception &e) {
        ERR_PRINT("SecureChannel: Caught exception sending handshake: %s", e.what());
    }
    WARN_PRINT("SecureChannel: Failed sending handshake frame of %u bytes, link %u", payload.size(), link);
    return false;
}

void SecureChannel::processFrame(const DeviceMessage& frame, const OperationType op) noexcept {
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
        processFrameLocked(frame, op);
    }
    flushNotifications();
}

void SecureChannel::processFrameLocked(const DeviceMessage& frame, const OperationType op) noexcept {
    switch( state ) {
        case ChannelState::AWAITING_DEVICE_ID:
            processDeviceId(frame);
            break;
        case ChannelState::HANDSHAKE_IN_PROGRESS:
            processHandshake(frame);
            break;
        case ChannelState::AWAITING_OOB_CONFIRMATION:
            if( nullptr != oob ) {
                processOobVerification(frame);
            } else {
                DBG_PRINT("SecureChannel: Frame while awaiting user confirmation");
                fail(DeviceError::INVALID_HANDSHAKE);
            }
            break;
        case ChannelState::RESUMING_SESSION:
            processResumingSession(frame);
            break;
        case ChannelState::ESTABLISHED:
            processClientMessage(frame, op);
            break;
        default:
            DBG_PRINT("SecureChannel: Dropped frame in %s: %s", to_string(state).c_str(), frame.toString().c_str());
            break;
    }
}

void SecureChannel::processDeviceId(const DeviceMessage& frame) noexcept {
    if( frame.isEncrypted() || DEVICE_ID_LENGTH != frame.getPayload().size() ) {
        WARN_PRINT("SecureChannel: Invalid device id frame: %s", frame.toString().c_str());
        fail(DeviceError::INVALID_DEVICE_ID);
        return;
    }
    const DeviceId id = to_device_id(frame.getPayload());
    DeviceId own_id;
    try {
        if( reconnect && !store->getEncryptionKey(id).isValid() ) {
            WARN_PRINT("SecureChannel: No stored key for reconnecting device %s", id.toString().c_str());
            fail(DeviceError::INVALID_DEVICE_ID);
            return;
        }
        own_id = store->getUniqueId();
    } catch (std::exception &e) {
        ERR_PRINT("SecureChannel: Caught exception accessing store: %s", e.what());
        fail(DeviceError::STORAGE_FAILURE);
        return;
    }
    deviceId = id;
    has_device_id = true;

    if( !sendHandshake( to_octets(own_id) ) ) {
        fail(DeviceError::INVALID_HANDSHAKE);
        return;
    }
    try {
        primitive->init(reconnect);
    } catch (std::exception &e) {
        WARN_PRINT("SecureChannel: Handshake init failed: %s", e.what());
        fail(DeviceError::INVALID_HANDSHAKE);
        return;
    }
    setState(ChannelState::HANDSHAKE_IN_PROGRESS);
    const DeviceId id_ = deviceId;
    post( [this, id_](SecureChannelListener& l) { l.deviceIdReceived(*this, id_); } );
}

void SecureChannel::processHandshake(const DeviceMessage& frame) noexcept {
    if( frame.isEncrypted() ) {
        fail(DeviceError::INVALID_HANDSHAKE);
        return;
    }
    HandshakeMessage res;
    try {
        res = primitive->continueHandshake(frame.getPayload());
    } catch (std::exception &e) {
        WARN_PRINT("SecureChannel: Handshake step failed: %s", e.what());
        fail(DeviceError::INVALID_HANDSHAKE);
        return;
    }
    DBG_PRINT("SecureChannel: Handshake step -> %s, response %u bytes",
            to_string(res.nextState).c_str(), res.nextMessage.size());

    switch( res.nextState ) {
        case HandshakeState::IN_PROGRESS:
            if( 0 < res.nextMessage.size() && !sendHandshake(res.nextMessage) ) {
                fail(DeviceError::INVALID_HANDSHAKE);
            }
            return;

        case HandshakeState::VERIFICATION_NEEDED: {
            if( reconnect ) {
                WARN_PRINT("SecureChannel: Verification requested while reconnecting");
                fail(DeviceError::INVALID_HANDSHAKE);
                return;
            }
            if( 0 < res.nextMessage.size() && !sendHandshake(res.nextMessage) ) {
                fail(DeviceError::INVALID_HANDSHAKE);
                return;
            }
            std::string code = res.verificationCode;
            if( code.empty() ) {
                try {
                    code = primitive->verificationCode();
                } catch (std::exception &e) {
                    WARN_PRINT("SecureChannel: No verification code: %s", e.what());
                }
            }
            if( code.empty() ) {
                fail(DeviceError::INVALID_HANDSHAKE);
                return;
            }
            startVerification(code);
            return;
        }

        case HandshakeState::RESUMING_SESSION:
            if( !reconnect ) {
                WARN_PRINT("SecureChannel: Session resumption requested while associating");
                fail(DeviceError::INVALID_HANDSHAKE);
                return;
            }
            if( 0 < res.nextMessage.size() && !sendHandshake(res.nextMessage) ) {
                fail(DeviceError::INVALID_HANDSHAKE);
                return;
            }
            // the peer's next frame proves its previous key
            setState(ChannelState::RESUMING_SESSION);
            return;

        default:
            fail(DeviceError::INVALID_HANDSHAKE);
            return;
    }
}

void SecureChannel::startVerification(const std::string& code) noexcept {
    verificationCode = code;
    setState(ChannelState::AWAITING_OOB_CONFIRMATION);
    if( nullptr == oob ) {
        const std::string code_ = verificationCode;
        post( [this, code_](SecureChannelListener& l) { l.verificationCodeAvailable(*this, code_); } );
        return;
    }
    jau::POctets sealed(jau::lb_endian_t::little);
    const DeviceError err = oob->encryptVerificationCode(string_octets(verificationCode), sealed);
    if( DeviceError::SUCCESS != err ) {
        fail(err);
        return;
    }
    if( !sendHandshake(sealed) ) {
        fail(DeviceError::INVALID_HANDSHAKE);
    }
}

void SecureChannel::processOobVerification(const DeviceMessage& frame) noexcept {
    jau::POctets code(jau::lb_endian_t::little);
    if( frame.isEncrypted() || DeviceError::SUCCESS != oob->decryptVerificationCode(frame.getPayload(), code) ) {
        fail(DeviceError::INVALID_VERIFICATION);
        return;
    }
    if( code.size() != verificationCode.size() ||
        0 != ::memcmp(code.get_ptr(), verificationCode.data(), code.size()) )
    {
        WARN_PRINT("SecureChannel: Out-of-band verification code mismatch");
        fail(DeviceError::INVALID_VERIFICATION);
        return;
    }
    acceptVerification();
}

DeviceError SecureChannel::notifyOutOfBandAccepted() noexcept {
    DeviceError res;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
        if( ChannelState::AWAITING_OOB_CONFIRMATION != state ) {
            DBG_PRINT("SecureChannel: Confirmation in %s", to_string(state).c_str());
            return DeviceError::INVALID_CHANNEL_STATE;
        }
        acceptVerification();
        res = ChannelState::ESTABLISHED == state ? DeviceError::SUCCESS : lastError;
    }
    flushNotifications();
    return res;
}

void SecureChannel::acceptVerification() noexcept {
    SessionKey key;
    try {
        primitive->notifyOutOfBandAccepted();
        key = primitive->finish();
    } catch (std::exception &e) {
        WARN_PRINT("SecureChannel: Finishing handshake failed: %s", e.what());
        fail(DeviceError::INVALID_VERIFICATION);
        return;
    }
    if( !key.isValid() ) {
        fail(DeviceError::INVALID_ENCRYPTION_KEY);
        return;
    }
    if( !sendHandshake( string_octets(std::string(CONFIRMATION_SIGNAL)) ) ) {
        fail(DeviceError::INVALID_HANDSHAKE);
        return;
    }
    // key is persisted with the new AssociatedDevice by the owner
    establish(key);
}

void SecureChannel::processResumingSession(const DeviceMessage& frame) noexcept {
    if( frame.isEncrypted() ) {
        fail(DeviceError::INVALID_HANDSHAKE);
        return;
    }
    SessionKey previous;
    try {
        previous = store->getEncryptionKey(deviceId);
    } catch (std::exception &e) {
        ERR_PRINT("SecureChannel: Caught exception loading key: %s", e.what());
        fail(DeviceError::STORAGE_FAILURE);
        return;
    }
    if( !previous.isValid() ) {
        fail(DeviceError::INVALID_ENCRYPTION_KEY);
        return;
    }
    HandshakeMessage auth;
    SessionKey key;
    try {
        auth = primitive->resumeSession(frame.getPayload(), previous);
        if( HandshakeState::FINISHED != auth.nextState ) {
            WARN_PRINT("SecureChannel: Session resumption ended in %s", to_string(auth.nextState).c_str());
            fail(DeviceError::INVALID_HANDSHAKE);
            return;
        }
        key = primitive->finish();
    } catch (std::exception &e) {
        WARN_PRINT("SecureChannel: Session resumption rejected: %s", e.what());
        fail(DeviceError::INVALID_HANDSHAKE);
        return;
    }
    if( !key.isValid() ) {
        fail(DeviceError::INVALID_ENCRYPTION_KEY);
        return;
    }
    bool saved = false;
    try {
        saved = store->saveEncryptionKey(deviceId, key);
    } catch (std::exception &e) {
        ERR_PRINT("SecureChannel: Caught exception saving key: %s", e.what());
    }
    if( !saved ) {
        fail(DeviceError::STORAGE_FAILURE);
        return;
    }
    if( 0 < auth.nextMessage.size() && !sendHandshake(auth.nextMessage) ) {
        fail(DeviceError::INVALID_HANDSHAKE);
        return;
    }
    establish(key);
}

void SecureChannel::establish(const SessionKey& key) noexcept {
    sessionKey = key;
    cipher = std::make_unique<ChannelCipher>(key, CipherRole::SERVER);
    verificationCode.clear();
    if( !setState(ChannelState::ESTABLISHED) ) {
        return;
    }
    jau::INFO_PRINT("SecureChannel: Established with %s, reconnect %d, link %u",
            deviceId.toString().c_str(), reconnect, link);
    post( [this](SecureChannelListener& l) { l.secureChannelEstablished(*this); } );
}

void SecureChannel::processClientMessage(const DeviceMessage& frame, const OperationType op) noexcept {
    if( OperationType::ACK == op ) {
        return;
    }
    if( OperationType::CLIENT_MESSAGE != op ) {
        WARN_PRINT("SecureChannel: Unexpected %s frame after handshake", to_string(op).c_str());
        post( [this](SecureChannelListener& l) { l.messageReceivedError(*this, DeviceError::INVALID_MSG); } );
        return;
    }
    if( !frame.isEncrypted() ) {
        post( [this, frame](SecureChannelListener& l) { l.messageReceived(*this, frame); } );
        return;
    }
    jau::POctets plain(jau::lb_endian_t::little);
    const DeviceError err = decryptPayload(frame.getPayload(), plain);
    if( DeviceError::SUCCESS != err ) {
        WARN_PRINT("SecureChannel: Decryption failed: %s, %s", to_string(err).c_str(), frame.toString().c_str());
        post( [this, err](SecureChannelListener& l) { l.messageReceivedError(*this, err); } );
        return;
    }
    const DeviceMessage message = frame.withPayload(false, std::move(plain));
    post( [this, message](SecureChannelListener& l) { l.messageReceived(*this, message); } );
}

DeviceError SecureChannel::encryptPayload(const jau::TROOctets& plain, jau::POctets& out) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
    if( nullptr == cipher ) {
        return DeviceError::INVALID_ENCRYPTION_KEY;
    }
    return cipher->encrypt(plain, out);
}

DeviceError SecureChannel::decryptPayload(const jau::TROOctets& sealed, jau::POctets& out) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
    if( nullptr == cipher ) {
        return DeviceError::INVALID_ENCRYPTION_KEY;
    }
    return cipher->decrypt(sealed, out);
}

DeviceError SecureChannel::sendClientMessage(const DeviceMessage& message) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
    if( ChannelState::ERROR == state ) {
        return DeviceError::INVALID_CHANNEL_STATE;
    }
    bool sent = false;
    if( message.isEncrypted() ) {
        if( ChannelState::ESTABLISHED != state ) {
            return DeviceError::INVALID_CHANNEL_STATE;
        }
        jau::POctets sealed(jau::lb_endian_t::little);
        const DeviceError err = encryptPayload(message.getPayload(), sealed);
        if( DeviceError::SUCCESS != err ) {
            return err;
        }
        try {
            sent = transport->sendMessage(link, message.withPayload(true, std::move(sealed)), OperationType::CLIENT_MESSAGE);
        } catch (std::exception &e) {
            ERR_PRINT("SecureChannel: Caught exception sending: %s", e.what());
        }
    } else {
        try {
            sent = transport->sendMessage(link, message, OperationType::CLIENT_MESSAGE);
        } catch (std::exception &e) {
            ERR_PRINT("SecureChannel: Caught exception sending: %s", e.what());
        }
    }
    return sent ? DeviceError::SUCCESS : DeviceError::UNEXPECTED_DISCONNECTION;
}

std::string SecureChannel::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_channel); // RAII-style acquire and relinquish via destructor
    return "SecureChannel[link "+std::to_string(link)+", "+to_string(state)+
           ", reconnect "+std::to_string(reconnect)+", oob "+std::to_string(nullptr != oob)+
           ", device "+( has_device_id ? deviceId.toString() : "n/a" )+"]";
}
