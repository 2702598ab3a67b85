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

#ifndef CARLINK_DEVICE_CONNECTION_ORCHESTRATOR_HPP_
#define CARLINK_DEVICE_CONNECTION_ORCHESTRATOR_HPP_

#include <string>
#include <memory>
#include <cstdint>
#include <mutex>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>
#include <jau/functional.hpp>

#include "CarlinkTypes.hpp"
#include "CarlinkEnv.hpp"
#include "Executor.hpp"
#include "DeviceCallbacks.hpp"
#include "DeviceStore.hpp"
#include "TransportAdapter.hpp"
#include "HandshakePrimitive.hpp"
#include "OobConnectionManager.hpp"
#include "SecureChannel.hpp"
#include "RecipientRegistry.hpp"

namespace carlink {

    /**
     * Top level coordinator of the companion devices of the active user.
     * <p>
     * Owns the connection lifecycle of each device, the association flow
     * and the surface used by feature code, i.e. callback registration and messaging.
     * </p>
     * <p>
     * All TransportListener and DeviceStoreListener events are posted onto the single event queue Executor,
     * hence state transitions are totally ordered.
     * Connecting and out-of-band exchanges run on the worker Executor.
     * </p>
     * <p>
     * Exactly one ConnectedDevice exists per device id. A SecureChannel exists per physical link,
     * created when the link connects and discarded when it disconnects or its handshake fails.
     * </p>
     * <p>
     * The only TransportRole::PERIPHERAL transport is used for association and reconnection.
     * Its disconnects re-arm reconnection to the active user's device.
     * </p>
     */
    class DeviceConnectionOrchestrator {
        private:
            class StoreForwarder;
            class TransportForwarder;
            class ChannelForwarder;
            friend class StoreForwarder;
            friend class TransportForwarder;
            friend class ChannelForwarder;

            struct DeviceEntry {
                ConnectedDevice device;
                TransportAdapterRef transport;
                link_handle_t link;
                DeviceConnectionState state;
            };

            struct ConnectionCallbackPair {
                ConnectionCallbackRef callback;
                ExecutorRef executor;
                /** Notified for devices of the active user only */
                bool activeUserOnly;
            };
            typedef jau::cow_darray<ConnectionCallbackPair, jau::nsize_t> connectionCallbackList_t;
            static connectionCallbackList_t::equal_comparator connectionCallbackEqComparator;

            struct AssociationCallbackPair {
                DeviceAssociationCallbackRef callback;
                ExecutorRef executor;
            };
            typedef jau::cow_darray<AssociationCallbackPair, jau::nsize_t> associationCallbackList_t;
            static associationCallbackList_t::equal_comparator associationCallbackEqComparator;

            const CarlinkEnv & env;
            const DeviceStoreRef store;
            const jau::darray<TransportAdapterRef> transports;
            const TransportAdapterRef peripheral;
            const HandshakePrimitiveFactory primitiveFactory;

            std::shared_ptr<SerialExecutor> ownedEventQueue;
            std::shared_ptr<SerialExecutor> ownedWorker;
            const ExecutorRef eventQueue;
            const ExecutorRef worker;

            const RecipientBlacklistRef blacklist;
            RecipientRegistry registry;

            std::shared_ptr<StoreForwarder> storeForwarder;
            std::shared_ptr<TransportForwarder> transportForwarder;
            std::shared_ptr<ChannelForwarder> channelForwarder;

            connectionCallbackList_t connectionCallbacks;
            associationCallbackList_t associationCallbacks;

            /** Guards state, devices and channels; never held while calling out. */
            mutable std::recursive_mutex mtx_devices;
            ManagerState state;
            jau::darray<DeviceEntry> devices;
            jau::darray<SecureChannelRef> channels;

            /** Guards the single in-flight connection attempt. */
            mutable std::mutex mtx_connect;
            bool is_connecting;
            DeviceId connectingDeviceId;

            /** Guards the pending association. */
            mutable std::recursive_mutex mtx_association;
            AssociationCallbackRef assocCallback;
            std::string assocName;
            std::shared_ptr<OobConnectionManager> assocOob;
            std::shared_ptr<OobChannel> assocOobChannel;
            SecureChannelRef assocChannel;

            static ExecutorRef makeExecutor(const ExecutorRef& given, std::shared_ptr<SerialExecutor>& owned,
                                            const std::string& name, const jau::nsize_t capacity);

            bool setState(const ManagerState to) noexcept;

            TransportAdapterRef findTransport(const TransportAdapter& t) const noexcept;
            SecureChannelRef findChannel(const TransportAdapter& t, const link_handle_t link) const noexcept;
            SecureChannelRef removeChannel(const TransportAdapter& t, const link_handle_t link) noexcept;
            DeviceEntry* findEntry(const DeviceId& deviceId) noexcept;
            bool clearConnecting() noexcept;

            void postEvent(const std::string& name, Executor::Task task) noexcept;

            void connectToActiveUserDeviceImpl() noexcept;

            /** Invokes the notification on the executor of each matching connection callback. */
            void notifyConnectionCallbacks(const ConnectedDevice& device,
                                           const jau::function<void(ConnectionCallback&)>& notification) noexcept;
            void notifyAssociationCallbacks(const jau::function<void(DeviceAssociationCallback&)>& notification) noexcept;

            /** Invokes the notification on the pending association callback, if any, on the current thread. */
            void notifyAssociation(const jau::function<void(AssociationCallback&)>& notification) noexcept;
            void clearAssociation(const bool interrupt) noexcept;
            bool isAssociationChannel(const SecureChannel& ch) const noexcept;
            std::string makeAssociationName() const;
            void startAssociationImpl(const AssociationCallbackRef& callback, const std::shared_ptr<OobConnectionManager>& oob) noexcept;
            void disconnectLink(const TransportAdapterRef& transport, const link_handle_t link) noexcept;

            // TransportListener events, on the event queue
            void handleLinkConnected(const TransportAdapterRef& transport, const link_handle_t link, const bool isReconnect) noexcept;
            void handleLinkDisconnected(const TransportAdapterRef& transport, const link_handle_t link) noexcept;
            void handleFrame(const TransportAdapterRef& transport, const link_handle_t link,
                             const DeviceMessage& frame, const OperationType op) noexcept;

            // SecureChannelListener events, on the thread driving the channel
            void channelDeviceIdReceived(SecureChannel& ch, const DeviceId& deviceId) noexcept;
            void channelVerificationCodeAvailable(SecureChannel& ch, const std::string& code) noexcept;
            void channelEstablished(SecureChannel& ch) noexcept;
            void channelFailure(SecureChannel& ch, const DeviceError error) noexcept;
            void channelMessageReceived(SecureChannel& ch, const DeviceMessage& message) noexcept;
            void channelMessageError(SecureChannel& ch, const DeviceError error) noexcept;

        public:
            /**
             * @param store_ persistence of associated devices and keys
             * @param transports_ at least one transport, at most one TransportRole::PERIPHERAL
             * @param primitiveFactory_ creating a fresh HandshakePrimitive for each SecureChannel
             * @param eventQueue_ executor serializing all events, a new SerialExecutor if nullptr
             * @param worker_ executor for blocking operations, a new SerialExecutor if nullptr
             * @throws jau::IllegalArgumentException if store_ or primitiveFactory_ is null or transports_ is empty
             */
            DeviceConnectionOrchestrator(const DeviceStoreRef& store_, const jau::darray<TransportAdapterRef>& transports_,
                                         const HandshakePrimitiveFactory& primitiveFactory_,
                                         const ExecutorRef& eventQueue_=nullptr, const ExecutorRef& worker_=nullptr);

            DeviceConnectionOrchestrator(const DeviceConnectionOrchestrator&) = delete;
            void operator=(const DeviceConnectionOrchestrator&) = delete;

            /**
             * Stops, unregisters from the transports and the store and stops the executors created by this instance.
             * <p>
             * Given executors must not run tasks of this instance after destruction.
             * </p>
             */
            ~DeviceConnectionOrchestrator() noexcept;

            ManagerState getState() const noexcept;

            /**
             * Starts, resetting first if started already, and attempts to connect to the active user's device.
             */
            void start() noexcept;

            /**
             * Disconnects all devices, stops advertising, clears the connecting flag,
             * the recipient blacklist and any pending association.
             */
            void reset() noexcept;

            /**
             * reset() and transition to ManagerState::STOPPED, dropping all device callback registrations.
             */
            void stop() noexcept;

            /**
             * Asynchronously connects to the active user's associated device, if it is enabled and not yet connected.
             * <p>
             * Concurrent calls collapse into one in-flight attempt.
             * </p>
             */
            void connectToActiveUserDevice() noexcept;

            /** Returns the connected devices belonging to the active user. */
            jau::darray<ConnectedDevice> getActiveUserConnectedDevices() const noexcept;

            /** Returns the connection state of the given device. */
            DeviceConnectionState getDeviceConnectionState(const DeviceId& deviceId) const noexcept;

            /** Returns true while a connection attempt is in flight. */
            bool isConnecting() const noexcept;

            /**
             * Starts advertising under a random name for association of a new device.
             * Replaces any pending association's callback.
             */
            void startAssociation(const AssociationCallbackRef& callback) noexcept;

            /**
             * Hands over out-of-band data to the device with given address via the given channel
             * on the worker executor, then proceeds like startAssociation().
             * The verification code is exchanged encrypted and confirmed without user interaction.
             */
            void startOutOfBandAssociation(const AssociationCallbackRef& callback,
                                           const std::shared_ptr<OobChannel>& oobChannel, const std::string& address) noexcept;

            /**
             * Stops the pending association if it has been started with the given callback, otherwise does nothing.
             */
            void stopAssociation(const AssociationCallbackRef& callback) noexcept;

            bool isAssociating() const noexcept;

            /**
             * Relays the user's confirmation of the verification code to the pending association.
             * Failures are reported via AssociationCallback::onAssociationError().
             */
            void notifyOutOfBandAccepted() noexcept;

            /**
             * Registers a callback for connections of the active user's devices.
             * @return true if newly added
             */
            bool registerActiveUserConnectionCallback(const ConnectionCallbackRef& callback, const ExecutorRef& executor) noexcept;

            /**
             * Registers a callback for connections of all devices, associated or not.
             * @return true if newly added
             */
            bool registerConnectionCallback(const ConnectionCallbackRef& callback, const ExecutorRef& executor) noexcept;

            bool unregisterConnectionCallback(const ConnectionCallbackRef& callback) noexcept;

            bool registerDeviceAssociationCallback(const DeviceAssociationCallbackRef& callback, const ExecutorRef& executor) noexcept;

            bool unregisterDeviceAssociationCallback(const DeviceAssociationCallbackRef& callback) noexcept;

            /**
             * Registers the callback for the given device and recipient, see RecipientRegistry::registerCallback().
             */
            bool registerDeviceCallback(const ConnectedDevice& device, const RecipientId& recipient,
                                        const DeviceCallbackRef& callback, const ExecutorRef& executor) noexcept;

            bool unregisterDeviceCallback(const ConnectedDevice& device, const RecipientId& recipient,
                                          const DeviceCallbackRef& callback) noexcept;

            void setMessageDeliveryDelegate(const MessageDeliveryDelegateRef& delegate) noexcept;

            /**
             * Encrypts and sends the message to the given recipient on the device.
             * @return DeviceError::SUCCESS, DeviceError::INVALID_CHANNEL_STATE if the device has no established channel,
             *         without touching the transport, or the error of SecureChannel::sendClientMessage().
             */
            DeviceError sendMessageSecurely(const ConnectedDevice& device, const RecipientId& recipient, const jau::TROOctets& message) noexcept;

            /**
             * Sends the message unencrypted to the given recipient on the device.
             * @return DeviceError::SUCCESS, DeviceError::UNEXPECTED_DISCONNECTION if the device is not connected
             *         or the error of SecureChannel::sendClientMessage().
             */
            DeviceError sendMessageUnsecurely(const ConnectedDevice& device, const RecipientId& recipient, const jau::TROOctets& message) noexcept;

            /** Enables connections to the associated device and attempts to connect. */
            bool enableAssociatedDeviceConnection(const DeviceId& deviceId) noexcept;

            /** Disables connections to the associated device and disconnects it. */
            bool disableAssociatedDeviceConnection(const DeviceId& deviceId) noexcept;

            /** Disconnects the device if connected and removes its association. */
            bool removeActiveUserAssociatedDevice(const DeviceId& deviceId) noexcept;

            const RecipientBlacklistRef& getRecipientBlacklist() const noexcept { return blacklist; }

            /**
             * Internal event handlers, driven by the SecureChannel events of each link.
             * Public for unit testing only.
             */
            void onDeviceConnected(const DeviceId& deviceId, const TransportAdapterRef& transport, const link_handle_t link) noexcept;
            void onDeviceDisconnected(const DeviceId& deviceId, const TransportAdapterRef& transport) noexcept;
            void onSecureChannelEstablished(const DeviceId& deviceId) noexcept;
            void onMessageReceived(const DeviceId& deviceId, const DeviceMessage& message) noexcept;
            void onSecureChannelError(const DeviceId& deviceId) noexcept;
            void onAssociationCompleted(const DeviceId& deviceId) noexcept;

            std::string toString() const noexcept;
    };

} // namespace carlink

#endif /* CARLINK_DEVICE_CONNECTION_ORCHESTRATOR_HPP_ */
