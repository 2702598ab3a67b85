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

#ifndef CARLINK_SECURE_CHANNEL_HPP_
#define CARLINK_SECURE_CHANNEL_HPP_

#include <string>
#include <memory>
#include <cstdint>
#include <mutex>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>
#include <jau/darray.hpp>
#include <jau/functional.hpp>

#include "CarlinkTypes.hpp"
#include "SessionCrypto.hpp"
#include "HandshakePrimitive.hpp"
#include "OobConnectionManager.hpp"
#include "DeviceStore.hpp"
#include "TransportAdapter.hpp"

namespace carlink {

    class SecureChannel; // forward

    /**
     * Progress and traffic of one SecureChannel.
     * <p>
     * Callbacks are invoked on the thread feeding SecureChannel::processFrame()
     * or calling SecureChannel::notifyOutOfBandAccepted(), after the channel lock has been released.
     * </p>
     */
    class SecureChannelListener {
        public:
            /** The peer's device id has been received and the own id has been sent. */
            virtual void deviceIdReceived(SecureChannel& channel, const DeviceId& deviceId) {
                (void)channel;
                (void)deviceId;
            }

            /** Association: the given code shall be confirmed by the user. */
            virtual void verificationCodeAvailable(SecureChannel& channel, const std::string& code) {
                (void)channel;
                (void)code;
            }

            virtual void secureChannelEstablished(SecureChannel& channel) {
                (void)channel;
            }

            /** The handshake failed, the channel is in ChannelState::ERROR and shall be discarded. */
            virtual void establishSecureChannelFailure(SecureChannel& channel, const DeviceError error) {
                (void)channel;
                (void)error;
            }

            /** A client message has been received, payload already decrypted. */
            virtual void messageReceived(SecureChannel& channel, const DeviceMessage& message) {
                (void)channel;
                (void)message;
            }

            /** A client message could not be decrypted, the channel remains established. */
            virtual void messageReceivedError(SecureChannel& channel, const DeviceError error) {
                (void)channel;
                (void)error;
            }

            virtual ~SecureChannelListener() noexcept = default;
    };
    typedef std::shared_ptr<SecureChannelListener> SecureChannelListenerRef;

    /**
     * Handshake state machine and message protection of one physical connection, server side.
     * <p>
     * States, see ChannelState:
     * <pre>
     *   AWAITING_DEVICE_ID -> HANDSHAKE_IN_PROGRESS -> AWAITING_OOB_CONFIRMATION -> ESTABLISHED
     *                                              \-> RESUMING_SESSION -> ESTABLISHED (reconnection)
     *   any non-terminal state -> ERROR
     * </pre>
     * </p>
     * <p>
     * The first frame carries the peer's device id, answered with the own unique id.
     * Further frames are fed to the HandshakePrimitive until it either
     * requires an out-of-band verification (association)
     * or resumes the session with the stored key (reconnection).
     * A resumption consumes one more frame, the peer's proof of the stored key.
     * </p>
     * <p>
     * With an OobConnectionManager, the verification code is exchanged encrypted
     * and the confirmation is accepted by the channel itself if both codes match.
     * </p>
     * <p>
     * Once established, encrypted client messages are protected by a ChannelCipher in the server role.
     * </p>
     */
    class SecureChannel {
        private:
            const TransportAdapterRef transport;
            const link_handle_t link;
            const DeviceStoreRef store;
            std::unique_ptr<HandshakePrimitive> primitive;
            const bool reconnect;
            const SecureChannelListenerRef listener;
            const std::shared_ptr<OobConnectionManager> oob;

            mutable std::recursive_mutex mtx_channel;
            ChannelState state;
            DeviceId deviceId;
            bool has_device_id;
            std::string verificationCode;
            DeviceError lastError;
            SessionKey sessionKey;
            std::unique_ptr<ChannelCipher> cipher;

            typedef jau::function<void(SecureChannelListener&)> Notification;
            /** Collected while locked, delivered by flushNotifications(). */
            jau::darray<Notification> pendingNotifications;

            void post(const Notification& n) noexcept;
            void flushNotifications() noexcept;

            bool setState(const ChannelState to) noexcept;
            void fail(const DeviceError error) noexcept;
            bool sendHandshake(const jau::TROOctets& payload) noexcept;

            void processFrameLocked(const DeviceMessage& frame, const OperationType op) noexcept;
            void processDeviceId(const DeviceMessage& frame) noexcept;
            void processHandshake(const DeviceMessage& frame) noexcept;
            void processOobVerification(const DeviceMessage& frame) noexcept;
            void processResumingSession(const DeviceMessage& frame) noexcept;
            void processClientMessage(const DeviceMessage& frame, const OperationType op) noexcept;

            void startVerification(const std::string& code) noexcept;
            void acceptVerification() noexcept;
            void establish(const SessionKey& key) noexcept;

        public:
            /**
             * @param transport_ the transport owning the link
             * @param link_ the physical connection
             * @param store_ source of the own unique id and stored session keys
             * @param primitive_ the key agreement engine, owned by this channel
             * @param isReconnect true to resume a session with an associated device, false for association
             * @param listener_ receiving progress and traffic
             * @param oob_ optional out-of-band verification, association only
             */
            SecureChannel(const TransportAdapterRef& transport_, const link_handle_t link_, const DeviceStoreRef& store_,
                          std::unique_ptr<HandshakePrimitive> primitive_, const bool isReconnect,
                          const SecureChannelListenerRef& listener_,
                          const std::shared_ptr<OobConnectionManager>& oob_=nullptr);

            SecureChannel(const SecureChannel&) = delete;
            void operator=(const SecureChannel&) = delete;

            ~SecureChannel() noexcept;

            ChannelState getState() const noexcept;

            bool isEstablished() const noexcept { return ChannelState::ESTABLISHED == getState(); }

            bool isReconnect() const noexcept { return reconnect; }

            const TransportAdapterRef& getTransport() const noexcept { return transport; }

            link_handle_t getLink() const noexcept { return link; }

            /** Returns true if the peer's device id has been received. */
            bool hasDeviceId() const noexcept;

            /** Returns the peer's device id, zero before hasDeviceId(). */
            DeviceId getDeviceId() const noexcept;

            /** Returns the session key once established, otherwise an invalid key. */
            SessionKey getSessionKey() const noexcept;

            /**
             * Processes one inbound frame of the peer.
             */
            void processFrame(const DeviceMessage& frame, const OperationType op) noexcept;

            /**
             * Relays the user's confirmation of the verification code.
             * <p>
             * Sends the confirmation signal, finishes the handshake and becomes established.
             * </p>
             * @return DeviceError::SUCCESS, DeviceError::INVALID_CHANNEL_STATE if not awaiting a confirmation
             *         or the error the handshake failed with.
             */
            DeviceError notifyOutOfBandAccepted() noexcept;

            /**
             * Sends the given client message, encrypting its payload if DeviceMessage::isEncrypted().
             * @return DeviceError::SUCCESS, DeviceError::INVALID_CHANNEL_STATE if encryption is requested before established,
             *         or DeviceError::UNEXPECTED_DISCONNECTION if the transport failed.
             */
            DeviceError sendClientMessage(const DeviceMessage& message) noexcept;

            /**
             * @return DeviceError::INVALID_ENCRYPTION_KEY before a key exists
             */
            DeviceError encryptPayload(const jau::TROOctets& plain, jau::POctets& out) noexcept;

            /**
             * @return DeviceError::INVALID_ENCRYPTION_KEY before a key exists
             */
            DeviceError decryptPayload(const jau::TROOctets& sealed, jau::POctets& out) noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<SecureChannel> SecureChannelRef;

} // namespace carlink

#endif /* CARLINK_SECURE_CHANNEL_HPP_ */
