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
#include <jau/basic_algos.hpp>

#include "RecipientRegistry.hpp"

using namespace carlink;

bool RecipientBlacklist::add(const RecipientId& recipient) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_blacklist); // RAII-style acquire and relinquish via destructor
    return recipients.insert(recipient).second;
}

bool RecipientBlacklist::contains(const RecipientId& recipient) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_blacklist); // RAII-style acquire and relinquish via destructor
    return recipients.end() != recipients.find(recipient);
}

void RecipientBlacklist::clear() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_blacklist); // RAII-style acquire and relinquish via destructor
    recipients.clear();
}

jau::nsize_t RecipientBlacklist::size() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_blacklist); // RAII-style acquire and relinquish via destructor
    return static_cast<jau::nsize_t>( recipients.size() );
}

std::string RecipientBlacklist::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_blacklist); // RAII-style acquire and relinquish via destructor
    std::string res("RecipientBlacklist[");
    jau::for_each(recipients.cbegin(), recipients.cend(), [&res](const RecipientId &id) {
        if( res.back() != '[' ) {
            res.append( ", " );
        }
        res.append( id.toString() );
    });
    return res+"]";
}

RecipientRegistry::RecipientRegistry(const RecipientBlacklistRef& blacklist_)
: blacklist(blacklist_)
{
    if( nullptr == blacklist ) {
        throw jau::IllegalArgumentException("RecipientRegistry: null blacklist", E_FILE_LINE);
    }
}

void RecipientRegistry::invoke(const Registration& r, const Notification& notification) noexcept {
    DeviceCallbackRef cb = r.callback;
    Notification n = notification;
    const bool res = r.executor->execute( [cb, n]() {
        try {
            n(*cb);
        } catch (std::exception &e) {
            ERR_PRINT("RecipientRegistry: Caught exception in %s: %s", cb->toString().c_str(), e.what());
        }
    } );
    if( !res ) {
        WARN_PRINT("RecipientRegistry: Executor %s refused notification of %s",
                r.executor->toString().c_str(), cb->toString().c_str());
    }
}

void RecipientRegistry::invoke(const RegistrationList& list, const Notification& notification) noexcept {
    for(const Registration& r : list) {
        invoke(r, notification);
    }
}

bool RecipientRegistry::popMissedMessage(const RecipientId& recipient, const DeviceId& deviceId, jau::POctets& out) noexcept {
    auto it = missedMessages.find(recipient);
    if( missedMessages.end() == it ) {
        return false;
    }
    auto it2 = it->second.find(deviceId);
    if( it->second.end() == it2 ) {
        return false;
    }
    out = std::move(it2->second);
    it->second.erase(it2);
    if( it->second.empty() ) {
        missedMessages.erase(it);
    }
    return true;
}

bool RecipientRegistry::registerCallback(const ConnectedDevice& device, const RecipientId& recipient,
                                         const DeviceCallbackRef& callback, const ExecutorRef& executor) noexcept
{
    if( nullptr == callback || nullptr == executor ) {
        ERR_PRINT("RecipientRegistry: Null callback or executor for recipient %s", recipient.toString().c_str());
        return false;
    }
    const Registration fresh(callback, executor);
    const ConnectedDevice d = device;
    const Notification insecure = [d](DeviceCallback& cb) {
        cb.onDeviceError(d, DeviceError::INSECURE_RECIPIENT_ID_DETECTED);
    };

    RegistrationList existing;
    jau::POctets missed(jau::lb_endian_t::little);
    bool has_missed = false;
    bool blacklisted = false;
    {
        // blacklist check, duplicate check and insertion are one atomic step
        const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        if( blacklist->contains(recipient) ) {
            blacklisted = true;
        } else {
            auto dit = deviceCallbacks.find(device.getDeviceId());
            if( deviceCallbacks.end() != dit && dit->second.end() != dit->second.find(recipient) ) {
                recipient_map_t& recipients = dit->second;
                auto it = recipients.find(recipient);
                existing = std::move(it->second);
                recipients.erase(it);
                if( recipients.empty() ) {
                    deviceCallbacks.erase(dit);
                }
                blacklist->add(recipient);
            } else {
                RegistrationList list;
                list.push_back(fresh);
                deviceCallbacks[device.getDeviceId()].emplace(recipient, std::move(list));
                has_missed = popMissedMessage(recipient, device.getDeviceId(), missed);
            }
        }
    }
    if( blacklisted ) {
        ERR_PRINT("RecipientRegistry: Recipient %s is blacklisted, refused %s",
                recipient.toString().c_str(), callback->toString().c_str());
        invoke(fresh, insecure);
        return false;
    }
    if( !existing.empty() ) {
        ERR_PRINT("RecipientRegistry: Multiple callbacks registered for recipient %s on %s, blacklisted",
                recipient.toString().c_str(), device.getDeviceId().toString().c_str());
        invoke(existing, insecure);
        invoke(fresh, insecure);
        return false;
    }
    DBG_PRINT("RecipientRegistry: Registered %s for recipient %s on %s, missed message %d",
            callback->toString().c_str(), recipient.toString().c_str(),
            device.getDeviceId().toString().c_str(), has_missed);
    if( has_missed ) {
        const std::shared_ptr<jau::POctets> payload = std::make_shared<jau::POctets>(std::move(missed));
        invoke(fresh, [d, payload](DeviceCallback& cb) {
            cb.onMessageReceived(d, *payload);
        });
    }
    return true;
}

bool RecipientRegistry::unregisterCallback(const ConnectedDevice& device, const RecipientId& recipient,
                                           const DeviceCallbackRef& callback) noexcept
{
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    auto it = deviceCallbacks.find(device.getDeviceId());
    if( deviceCallbacks.end() == it ) {
        return false;
    }
    recipient_map_t& recipients = it->second;
    auto it2 = recipients.find(recipient);
    if( recipients.end() == it2 ) {
        return false;
    }
    RegistrationList& list = it2->second;
    bool removed = false;
    for(auto it3 = list.begin(); it3 != list.end(); ) {
        if( nullptr != callback && *it3->callback == *callback ) {
            it3 = list.erase(it3);
            removed = true;
        } else {
            ++it3;
        }
    }
    if( list.empty() ) {
        recipients.erase(it2);
    }
    if( recipients.empty() ) {
        deviceCallbacks.erase(it);
    }
    DBG_PRINT("RecipientRegistry: Unregistered recipient %s on %s: %d",
            recipient.toString().c_str(), device.getDeviceId().toString().c_str(), removed);
    return removed;
}

bool RecipientRegistry::dispatch(const ConnectedDevice& device, const DeviceMessage& message) noexcept {
    MessageDeliveryDelegateRef delegate;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        delegate = deliveryDelegate;
    }
    if( nullptr != delegate ) {
        bool deliver = true;
        try {
            deliver = delegate->shouldDeliverMessageForDevice(device);
        } catch (std::exception &e) {
            ERR_PRINT("RecipientRegistry: Caught exception in delivery delegate: %s", e.what());
        }
        if( !deliver ) {
            DBG_PRINT("RecipientRegistry: Delivery vetoed for %s, dropped %s",
                    device.toString().c_str(), message.toString().c_str());
            return false;
        }
    }

    RegistrationList targets;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        auto it = deviceCallbacks.find(device.getDeviceId());
        if( deviceCallbacks.end() != it ) {
            auto it2 = it->second.find(message.getRecipient());
            if( it->second.end() != it2 ) {
                targets = it2->second;
            }
        }
        if( targets.empty() ) {
            missed_map_t& missed = missedMessages[message.getRecipient()];
            const bool kept = missed.emplace(device.getDeviceId(),
                    jau::POctets(message.getPayload().get_ptr(), message.getPayload().size(), jau::lb_endian_t::little)).second;
            DBG_PRINT("RecipientRegistry: No recipient %s on %s, message kept %d",
                    message.getRecipient().toString().c_str(), device.getDeviceId().toString().c_str(), kept);
            return false;
        }
    }
    const ConnectedDevice d = device;
    const std::shared_ptr<jau::POctets> payload = std::make_shared<jau::POctets>(
            message.getPayload().get_ptr(), message.getPayload().size(), jau::lb_endian_t::little);
    invoke(targets, [d, payload](DeviceCallback& cb) {
        cb.onMessageReceived(d, *payload);
    });
    return true;
}

void RecipientRegistry::setMessageDeliveryDelegate(const MessageDeliveryDelegateRef& delegate) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    deliveryDelegate = delegate;
}

void RecipientRegistry::notifyDeviceCallbacks(const DeviceId& deviceId, const Notification& notification) noexcept {
    RegistrationList targets;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        auto it = deviceCallbacks.find(deviceId);
        if( deviceCallbacks.end() == it ) {
            return;
        }
        for(const auto& entry : it->second) {
            for(const Registration& r : entry.second) {
                targets.push_back(r);
            }
        }
    }
    DBG_PRINT("RecipientRegistry: Notifying %u callbacks of %s", targets.size(), deviceId.toString().c_str());
    invoke(targets, notification);
}

jau::nsize_t RecipientRegistry::getDeviceCount() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return static_cast<jau::nsize_t>( deviceCallbacks.size() );
}

jau::nsize_t RecipientRegistry::getRegistrationCount(const DeviceId& deviceId) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    auto it = deviceCallbacks.find(deviceId);
    if( deviceCallbacks.end() == it ) {
        return 0;
    }
    jau::nsize_t count = 0;
    for(const auto& entry : it->second) {
        count += entry.second.size();
    }
    return count;
}

bool RecipientRegistry::hasMissedMessage(const RecipientId& recipient, const DeviceId& deviceId) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    auto it = missedMessages.find(recipient);
    return missedMessages.end() != it && it->second.end() != it->second.find(deviceId);
}

void RecipientRegistry::clear() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    deviceCallbacks.clear();
    missedMessages.clear();
}

std::string RecipientRegistry::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
    return "RecipientRegistry[devices "+std::to_string(deviceCallbacks.size())+
           ", missed recipients "+std::to_string(missedMessages.size())+
           ", blacklisted "+std::to_string(blacklist->size())+"]";
}
