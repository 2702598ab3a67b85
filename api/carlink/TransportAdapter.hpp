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

#ifndef CARLINK_TRANSPORT_ADAPTER_HPP_
#define CARLINK_TRANSPORT_ADAPTER_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "CarlinkTypes.hpp"

namespace carlink {

    /**
     * Handle of one physical connection, unique within its TransportAdapter while connected.
     */
    typedef uint16_t link_handle_t;

    /**
     * Role of a TransportAdapter.
     */
    enum class TransportRole : uint8_t {
        /** Advertising side, capable of association and reconnection. */
        PERIPHERAL  = 0,
        /** Scanning side, accepts connections only. */
        CENTRAL     = 1
    };
    std::string to_string(const TransportRole r) noexcept;

    class TransportAdapter; // forward

    /**
     * Raw link events of a TransportAdapter.
     * <p>
     * Callbacks may arrive on any thread, one per transport role.
     * </p>
     */
    class TransportListener {
        public:
            /**
             * A new physical connection has been established.
             * @param isReconnect true if initiated via TransportAdapter::connectToDevice(),
             *        false if accepted while advertising for association
             */
            virtual void linkConnected(TransportAdapter &transport, const link_handle_t link, const bool isReconnect) = 0;

            virtual void linkDisconnected(TransportAdapter &transport, const link_handle_t link) = 0;

            virtual void frameReceived(TransportAdapter &transport, const link_handle_t link,
                                       const DeviceMessage& frame, const OperationType op) = 0;

            virtual ~TransportListener() noexcept = default;
    };
    typedef std::shared_ptr<TransportListener> TransportListenerRef;

    /**
     * Physical connection primitives, e.g. BLE GATT or an RFCOMM socket.
     * <p>
     * Implementations are external. Message framing and fragmentation on the wire are their concern.
     * </p>
     */
    class TransportAdapter {
        public:
            virtual ~TransportAdapter() noexcept = default;

            virtual TransportRole getRole() const noexcept = 0;

            /** Advertises under the given name for association. */
            virtual bool startAdvertising(const std::string& name) = 0;

            virtual void stopAdvertising() = 0;

            /**
             * Starts connecting to the given associated device, e.g. advertising its reconnection data,
             * for at most the given timeout. Returns immediately.
             * @return false if the attempt could not be started
             */
            virtual bool connectToDevice(const DeviceId& deviceId, const int32_t timeoutSeconds) = 0;

            /** Disconnects the given link; TransportListener::linkDisconnected() follows. */
            virtual void disconnectDevice(const link_handle_t link) = 0;

            /**
             * Sends the given frame over the given link.
             * @return false if the link is not connected or writing failed
             */
            virtual bool sendMessage(const link_handle_t link, const DeviceMessage& frame, const OperationType op) = 0;

            /** Returns the peer's transport address, e.g. its Bluetooth address. */
            virtual std::string getLinkAddress(const link_handle_t link) const = 0;

            /** Returns the peer's advertised name, may be empty. */
            virtual std::string getLinkName(const link_handle_t link) const = 0;

            virtual void setTransportListener(const TransportListenerRef& l) = 0;

            virtual std::string toString() const noexcept = 0;
    };
    typedef std::shared_ptr<TransportAdapter> TransportAdapterRef;

} // namespace carlink

#endif /* CARLINK_TRANSPORT_ADAPTER_HPP_ */
