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

#include <string>
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>

#include "DeviceStore.hpp"

using namespace carlink;

DeviceStore::listenerList_t::equal_comparator DeviceStore::listenerRefEqComparator =
        [](const DeviceStoreListenerRef &a, const DeviceStoreListenerRef &b) -> bool { return *a == *b; };

bool DeviceStore::isActiveUserDevice(const DeviceId& deviceId) {
    const jau::darray<AssociatedDevice> devices = getActiveUserAssociatedDevices();
    for(const AssociatedDevice& d : devices) {
        if( d.deviceId == deviceId ) {
            return true;
        }
    }
    return false;
}

bool DeviceStore::addListener(const DeviceStoreListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("DeviceStoreListener ref is null");
        return false;
    }
    return listenerList.push_back_unique(l, listenerRefEqComparator);
}

bool DeviceStore::removeListener(const DeviceStoreListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("DeviceStoreListener ref is null");
        return false;
    }
    const jau::nsize_t count = listenerList.erase_matching(l, false /* all_matching */, listenerRefEqComparator);
    return count > 0;
}

void DeviceStore::notifyAdded(const AssociatedDevice& device) noexcept {
    int i=0;
    jau::for_each_fidelity(listenerList, [&](DeviceStoreListenerRef &l) {
        try {
            l->associatedDeviceAdded(device);
        } catch (std::exception &e) {
            ERR_PRINT("DeviceStore::notifyAdded-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, listenerList.size(), l->toString().c_str(), device.toString().c_str(), e.what());
        }
        i++;
    });
}

void DeviceStore::notifyRemoved(const AssociatedDevice& device) noexcept {
    int i=0;
    jau::for_each_fidelity(listenerList, [&](DeviceStoreListenerRef &l) {
        try {
            l->associatedDeviceRemoved(device);
        } catch (std::exception &e) {
            ERR_PRINT("DeviceStore::notifyRemoved-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, listenerList.size(), l->toString().c_str(), device.toString().c_str(), e.what());
        }
        i++;
    });
}

void DeviceStore::notifyUpdated(const AssociatedDevice& device) noexcept {
    int i=0;
    jau::for_each_fidelity(listenerList, [&](DeviceStoreListenerRef &l) {
        try {
            l->associatedDeviceUpdated(device);
        } catch (std::exception &e) {
            ERR_PRINT("DeviceStore::notifyUpdated-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, listenerList.size(), l->toString().c_str(), device.toString().c_str(), e.what());
        }
        i++;
    });
}
