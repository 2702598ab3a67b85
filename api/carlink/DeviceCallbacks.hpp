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

#ifndef CARLINK_DEVICE_CALLBACKS_HPP_
#define CARLINK_DEVICE_CALLBACKS_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>

#include "CarlinkTypes.hpp"

namespace carlink {

    /**
     * Feature side interface for one recipient of one ConnectedDevice.
     * <p>
     * Methods are invoked on the executor given at registration,
     * see DeviceConnectionOrchestrator::registerDeviceCallback().
     * </p>
     * <p>
     * Default comparison operator tests for same memory reference only.
     * </p>
     */
    class DeviceCallback {
        public:
            virtual void onSecureChannelEstablished(const ConnectedDevice& device) {
                (void)device;
            }

            /** A message for the registered recipient, payload decrypted. */
            virtual void onMessageReceived(const ConnectedDevice& device, const jau::TROOctets& message) {
                (void)device;
                (void)message;
            }

            virtual void onDeviceError(const ConnectedDevice& device, const DeviceError error) {
                (void)device;
                (void)error;
            }

            virtual ~DeviceCallback() noexcept = default;

            virtual std::string toString() const noexcept { return "DeviceCallback["+jau::to_hexstring(this)+"]"; }

            virtual bool operator==(const DeviceCallback& rhs) const
            { return this == &rhs; }

            bool operator!=(const DeviceCallback& rhs) const
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<DeviceCallback> DeviceCallbackRef;

    /**
     * Connection changes of devices belonging to the active user.
     */
    class ConnectionCallback {
        public:
            virtual void onDeviceConnected(const ConnectedDevice& device) {
                (void)device;
            }
            virtual void onDeviceDisconnected(const ConnectedDevice& device) {
                (void)device;
            }

            virtual ~ConnectionCallback() noexcept = default;

            virtual std::string toString() const noexcept { return "ConnectionCallback["+jau::to_hexstring(this)+"]"; }

            virtual bool operator==(const ConnectionCallback& rhs) const
            { return this == &rhs; }

            bool operator!=(const ConnectionCallback& rhs) const
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<ConnectionCallback> ConnectionCallbackRef;

    /**
     * Progress of one association, see DeviceConnectionOrchestrator::startAssociation().
     */
    class AssociationCallback {
        public:
            /** Advertising under the given name has started. */
            virtual void onAssociationStartSuccess(const std::string& deviceName) {
                (void)deviceName;
            }
            virtual void onAssociationStartFailure() { }

            virtual void onAssociationError(const DeviceError error) {
                (void)error;
            }

            /**
             * The user shall compare the given code with the one shown on the companion device
             * and confirm via DeviceConnectionOrchestrator::notifyOutOfBandAccepted().
             */
            virtual void onVerificationCodeAvailable(const std::string& code) {
                (void)code;
            }

            /** The device and its key have been persisted. */
            virtual void onAssociationCompleted(const DeviceId& deviceId) {
                (void)deviceId;
            }

            virtual ~AssociationCallback() noexcept = default;

            virtual std::string toString() const noexcept { return "AssociationCallback["+jau::to_hexstring(this)+"]"; }

            virtual bool operator==(const AssociationCallback& rhs) const
            { return this == &rhs; }

            bool operator!=(const AssociationCallback& rhs) const
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<AssociationCallback> AssociationCallbackRef;

    /**
     * Changes of the active user's AssociatedDevice records, republished from the DeviceStore.
     */
    class DeviceAssociationCallback {
        public:
            virtual void onAssociatedDeviceAdded(const AssociatedDevice& device) {
                (void)device;
            }
            virtual void onAssociatedDeviceRemoved(const AssociatedDevice& device) {
                (void)device;
            }
            virtual void onAssociatedDeviceUpdated(const AssociatedDevice& device) {
                (void)device;
            }

            virtual ~DeviceAssociationCallback() noexcept = default;

            virtual std::string toString() const noexcept { return "DeviceAssociationCallback["+jau::to_hexstring(this)+"]"; }

            virtual bool operator==(const DeviceAssociationCallback& rhs) const
            { return this == &rhs; }

            bool operator!=(const DeviceAssociationCallback& rhs) const
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<DeviceAssociationCallback> DeviceAssociationCallbackRef;

    /**
     * Optional per device veto of message delivery.
     */
    class MessageDeliveryDelegate {
        public:
            /** Returns false to drop messages of the given device, they won't be cached either. */
            virtual bool shouldDeliverMessageForDevice(const ConnectedDevice& device) = 0;

            virtual ~MessageDeliveryDelegate() noexcept = default;
    };
    typedef std::shared_ptr<MessageDeliveryDelegate> MessageDeliveryDelegateRef;

} // namespace carlink

#endif /* CARLINK_DEVICE_CALLBACKS_HPP_ */
