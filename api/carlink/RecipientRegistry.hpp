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

#ifndef CARLINK_RECIPIENT_REGISTRY_HPP_
#define CARLINK_RECIPIENT_REGISTRY_HPP_

#include <string>
#include <memory>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/functional.hpp>

#include "CarlinkTypes.hpp"
#include "DeviceCallbacks.hpp"
#include "Executor.hpp"

namespace carlink {

    /**
     * Set of recipient ids barred from registration after a duplicate registration has been detected.
     * <p>
     * Shared with its owner, which clears it on reset only.
     * </p>
     */
    class RecipientBlacklist {
        private:
            mutable std::recursive_mutex mtx_blacklist;
            std::unordered_set<RecipientId, uuid128_hash> recipients;

        public:
            RecipientBlacklist() noexcept = default;

            RecipientBlacklist(const RecipientBlacklist&) = delete;
            void operator=(const RecipientBlacklist&) = delete;

            /** Returns true if newly added. */
            bool add(const RecipientId& recipient) noexcept;

            bool contains(const RecipientId& recipient) const noexcept;

            void clear() noexcept;

            jau::nsize_t size() const noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<RecipientBlacklist> RecipientBlacklistRef;

    /**
     * Multiplexes the messages of each ConnectedDevice to the DeviceCallback
     * registered for the message's recipient id.
     * <p>
     * A message without registered recipient is kept, at most one per recipient and device,
     * and handed to the next registration of that recipient on that device.
     * </p>
     * <p>
     * A second registration of a recipient id on the same device blacklists the recipient id
     * for all devices, see RecipientBlacklist.
     * </p>
     * <p>
     * All callbacks are invoked via their Executor after the internal lock has been released.
     * </p>
     */
    class RecipientRegistry {
        public:
            struct Registration {
                DeviceCallbackRef callback;
                ExecutorRef executor;

                Registration(const DeviceCallbackRef& callback_, const ExecutorRef& executor_) noexcept
                : callback(callback_), executor(executor_) {}
            };
            typedef jau::darray<Registration> RegistrationList;
            typedef jau::function<void(DeviceCallback&)> Notification;

        private:
            typedef std::unordered_map<RecipientId, RegistrationList, uuid128_hash> recipient_map_t;
            typedef std::unordered_map<DeviceId, jau::POctets, uuid128_hash> missed_map_t;

            const RecipientBlacklistRef blacklist;

            mutable std::recursive_mutex mtx_registry;
            std::unordered_map<DeviceId, recipient_map_t, uuid128_hash> deviceCallbacks;
            std::unordered_map<RecipientId, missed_map_t, uuid128_hash> missedMessages;
            MessageDeliveryDelegateRef deliveryDelegate;

            /** Invokes the notification on each registration's executor. */
            static void invoke(const RegistrationList& list, const Notification& notification) noexcept;

            static void invoke(const Registration& r, const Notification& notification) noexcept;

            bool popMissedMessage(const RecipientId& recipient, const DeviceId& deviceId, jau::POctets& out) noexcept;

        public:
            /**
             * @param blacklist_ the shared blacklist
             * @throws jau::IllegalArgumentException if blacklist_ is nullptr
             */
            explicit RecipientRegistry(const RecipientBlacklistRef& blacklist_);

            RecipientRegistry(const RecipientRegistry&) = delete;
            void operator=(const RecipientRegistry&) = delete;

            const RecipientBlacklistRef& getBlacklist() const noexcept { return blacklist; }

            /**
             * Registers the callback for messages of the given device to the given recipient.
             * <p>
             * A blacklisted recipient is refused and the new callback receives
             * DeviceError::INSECURE_RECIPIENT_ID_DETECTED.
             * </p>
             * <p>
             * If the recipient is registered already on this device, both callbacks receive
             * DeviceError::INSECURE_RECIPIENT_ID_DETECTED, the existing registration is removed
             * and the recipient is blacklisted.
             * </p>
             * <p>
             * Otherwise a missed message of this device to this recipient is delivered right away and consumed.
             * </p>
             * @return true if registered, otherwise false
             */
            bool registerCallback(const ConnectedDevice& device, const RecipientId& recipient,
                                  const DeviceCallbackRef& callback, const ExecutorRef& executor) noexcept;

            /**
             * Removes the registration, and the recipient entry if it was the last one.
             * @return true if removed
             */
            bool unregisterCallback(const ConnectedDevice& device, const RecipientId& recipient,
                                    const DeviceCallbackRef& callback) noexcept;

            /**
             * Delivers the decrypted message to all callbacks registered for its recipient on this device.
             * <p>
             * Without registered callback the payload is kept, unless a message is kept already for this pair.
             * If the MessageDeliveryDelegate vetoes the device, the message is dropped.
             * </p>
             * @return true if delivered to at least one callback
             */
            bool dispatch(const ConnectedDevice& device, const DeviceMessage& message) noexcept;

            void setMessageDeliveryDelegate(const MessageDeliveryDelegateRef& delegate) noexcept;

            /** Invokes the notification on all callbacks registered for the given device, any recipient. */
            void notifyDeviceCallbacks(const DeviceId& deviceId, const Notification& notification) noexcept;

            jau::nsize_t getRegistrationCount(const DeviceId& deviceId) const noexcept;

            /** Returns the number of devices holding at least one registration. */
            jau::nsize_t getDeviceCount() const noexcept;

            bool hasMissedMessage(const RecipientId& recipient, const DeviceId& deviceId) const noexcept;

            /** Removes all registrations and missed messages, the blacklist is kept. */
            void clear() noexcept;

            std::string toString() const noexcept;
    };

} // namespace carlink

#endif /* CARLINK_RECIPIENT_REGISTRY_HPP_ */
