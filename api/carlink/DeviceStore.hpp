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

#ifndef CARLINK_DEVICE_STORE_HPP_
#define CARLINK_DEVICE_STORE_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>

#include "CarlinkTypes.hpp"
#include "SessionCrypto.hpp"

namespace carlink {

    /**
     * Receives changes of the persisted AssociatedDevice records,
     * including changes not caused by the orchestrator.
     */
    class DeviceStoreListener {
        public:
            virtual void associatedDeviceAdded(const AssociatedDevice& device) {
                (void)device;
            }
            virtual void associatedDeviceRemoved(const AssociatedDevice& device) {
                (void)device;
            }
            virtual void associatedDeviceUpdated(const AssociatedDevice& device) {
                (void)device;
            }

            virtual ~DeviceStoreListener() noexcept = default;

            virtual std::string toString() const noexcept { return "DeviceStoreListener["+jau::to_hexstring(this)+"]"; }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const DeviceStoreListener& rhs) const
            { return this == &rhs; }

            bool operator!=(const DeviceStoreListener& rhs) const
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<DeviceStoreListener> DeviceStoreListenerRef;

    /**
     * Persistence of the head unit's identity, the active user's associated devices,
     * their session keys and connection flags.
     */
    class DeviceStore {
        private:
            typedef jau::cow_darray<DeviceStoreListenerRef, jau::nsize_t> listenerList_t;
            static listenerList_t::equal_comparator listenerRefEqComparator;
            listenerList_t listenerList;

        protected:
            void notifyAdded(const AssociatedDevice& device) noexcept;
            void notifyRemoved(const AssociatedDevice& device) noexcept;
            void notifyUpdated(const AssociatedDevice& device) noexcept;

        public:
            virtual ~DeviceStore() noexcept = default;

            /** Returns the persistent unique id of this head unit, sent to the peer during handshake. */
            virtual DeviceId getUniqueId() = 0;

            virtual jau::darray<AssociatedDevice> getActiveUserAssociatedDevices() = 0;

            /** Returns true if the given device is associated with the active user. */
            virtual bool isActiveUserDevice(const DeviceId& deviceId);

            /**
             * Persists the given device with its session key and notifies listeners.
             * @return false on storage failure
             */
            virtual bool addAssociatedDeviceForActiveUser(const AssociatedDevice& device, const SessionKey& key) = 0;

            /**
             * Deletes the given device record and notifies listeners.
             * @return false if not existing or on storage failure
             */
            virtual bool removeAssociatedDeviceForActiveUser(const DeviceId& deviceId) = 0;

            /**
             * Updates the connection flag of the given device and notifies listeners.
             * @return false if not existing or on storage failure
             */
            virtual bool updateAssociatedDeviceConnectionEnabled(const DeviceId& deviceId, const bool enabled) = 0;

            /** Returns the stored session key, invalid if none exists. */
            virtual SessionKey getEncryptionKey(const DeviceId& deviceId) = 0;

            /**
             * Replaces the stored session key of the given device.
             * @return false on storage failure
             */
            virtual bool saveEncryptionKey(const DeviceId& deviceId, const SessionKey& key) = 0;

            bool addListener(const DeviceStoreListenerRef& l) noexcept;

            bool removeListener(const DeviceStoreListenerRef& l) noexcept;

            jau::nsize_t getListenerCount() const noexcept { return listenerList.size(); }

            virtual std::string toString() const noexcept = 0;
    };
    typedef std::shared_ptr<DeviceStore> DeviceStoreRef;

} // namespace carlink

#endif /* CARLINK_DEVICE_STORE_HPP_ */
