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

#include "DeviceConnectionOrchestrator.hpp"

using namespace carlink;

static void invokeAssociationCallback(const AssociationCallbackRef& cb, const jau::function<void(AssociationCallback&)>& notification) noexcept {
    try {
        notification(*cb);
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception in %s: %s", cb->toString().c_str(), e.what());
    }
}

void DeviceConnectionOrchestrator::notifyAssociation(const jau::function<void(AssociationCallback&)>& notification) noexcept {
    AssociationCallbackRef cb;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
        cb = assocCallback;
    }
    if( nullptr == cb ) {
        DBG_PRINT("Orchestrator: No association pending, notification dropped");
        return;
    }
    invokeAssociationCallback(cb, notification);
}

bool DeviceConnectionOrchestrator::isAssociating() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
    return nullptr != assocCallback;
}

bool DeviceConnectionOrchestrator::isAssociationChannel(const SecureChannel& ch) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
    return assocChannel.get() == &ch;
}

std::string DeviceConnectionOrchestrator::makeAssociationName() const {
    const jau::nsize_t len = static_cast<jau::nsize_t>( env.ASSOCIATION_NAME_LENGTH );
    std::string name;
    uint8_t rnd[16];
    while( name.size() < len ) {
        random_bytes(rnd, sizeof(rnd));
        for(jau::nsize_t i=0; i<sizeof(rnd) && name.size() < len; ++i) {
            // 250 is the largest multiple of 10 below 256
            if( rnd[i] < 250 ) {
                name.push_back( static_cast<char>( '0' + rnd[i] % 10 ) );
            }
        }
    }
    return name;
}

void DeviceConnectionOrchestrator::clearAssociation(const bool interrupt) noexcept {
    bool pending;
    std::shared_ptr<OobChannel> oobChannel;
    SecureChannelRef ch;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
        pending = nullptr != assocCallback;
        oobChannel = assocOobChannel;
        ch = assocChannel;
        assocCallback = nullptr;
        assocName.clear();
        assocOob = nullptr;
        assocOobChannel = nullptr;
        assocChannel = nullptr;
    }
    if( !interrupt || !pending ) {
        return;
    }
    DBG_PRINT("Orchestrator: Association stopped");
    if( nullptr != peripheral ) {
        try {
            peripheral->stopAdvertising();
        } catch (std::exception &e) {
            ERR_PRINT("Orchestrator: Caught exception stopping advertising: %s", e.what());
        }
    }
    if( nullptr != oobChannel ) {
        oobChannel->interrupt();
    }
    if( nullptr != ch && !ch->isEstablished() ) {
        disconnectLink(ch->getTransport(), ch->getLink());
    }
}

void DeviceConnectionOrchestrator::startAssociation(const AssociationCallbackRef& callback) noexcept {
    if( nullptr == callback ) {
        ERR_PRINT("AssociationCallback ref is null");
        return;
    }
    postEvent("startAssociation", [this, callback]() { startAssociationImpl(callback, nullptr); });
}

void DeviceConnectionOrchestrator::startOutOfBandAssociation(const AssociationCallbackRef& callback,
                                                             const std::shared_ptr<OobChannel>& oobChannel,
                                                             const std::string& address) noexcept
{
    if( nullptr == callback || nullptr == oobChannel ) {
        ERR_PRINT("AssociationCallback or OobChannel ref is null");
        return;
    }
    std::shared_ptr<OobChannel> superseded;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
        if( nullptr != assocOobChannel && assocOobChannel != oobChannel ) {
            superseded = assocOobChannel;
        }
        assocCallback = callback;
        assocOobChannel = oobChannel;
        assocOob = nullptr;
    }
    if( nullptr != superseded ) {
        DBG_PRINT("Orchestrator: Interrupting superseded %s", superseded->toString().c_str());
        superseded->interrupt();
    }
    // the exchange blocks on the side channel, hence off the event queue
    const bool queued = worker->execute( [this, callback, oobChannel, address]() {
        std::shared_ptr<OobConnectionManager> oob = std::make_shared<OobConnectionManager>();
        bool exchanged = false;
        try {
            oob->generateOobData();
            exchanged = oobChannel->completeOobDataExchange(address, oob->getOobData());
        } catch (std::exception &e) {
            ERR_PRINT("Orchestrator: Caught exception during out-of-band exchange: %s", e.what());
        }
        bool current;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
            current = assocCallback == callback && assocOobChannel == oobChannel;
        }
        if( !current ) {
            DBG_PRINT("Orchestrator: Out-of-band association stopped during exchange");
            return;
        }
        if( !exchanged ) {
            WARN_PRINT("Orchestrator: Out-of-band exchange with %s failed via %s", address.c_str(), oobChannel->toString().c_str());
            clearAssociation(false /* interrupt */);
            invokeAssociationCallback(callback, [](AssociationCallback& cb) { cb.onAssociationStartFailure(); });
            return;
        }
        DBG_PRINT("Orchestrator: Out-of-band data delivered to %s", address.c_str());
        postEvent("startOutOfBandAssociation", [this, callback, oob]() { startAssociationImpl(callback, oob); });
    } );
    if( !queued ) {
        clearAssociation(false /* interrupt */);
        invokeAssociationCallback(callback, [](AssociationCallback& cb) { cb.onAssociationStartFailure(); });
    }
}

void DeviceConnectionOrchestrator::startAssociationImpl(const AssociationCallbackRef& callback,
                                                        const std::shared_ptr<OobConnectionManager>& oob) noexcept
{
    if( nullptr == peripheral ) {
        WARN_PRINT("Orchestrator: No peripheral transport for association");
        invokeAssociationCallback(callback, [](AssociationCallback& cb) { cb.onAssociationStartFailure(); });
        return;
    }
    std::string name;
    try {
        name = makeAssociationName();
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception creating association name: %s", e.what());
        invokeAssociationCallback(callback, [](AssociationCallback& cb) { cb.onAssociationStartFailure(); });
        return;
    }
    SecureChannelRef stale;
    std::shared_ptr<OobChannel> superseded;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
        if( nullptr != assocCallback && *assocCallback != *callback ) {
            DBG_PRINT("Orchestrator: Replacing pending association of %s", assocCallback->toString().c_str());
        }
        if( nullptr != oob && assocCallback != callback ) {
            DBG_PRINT("Orchestrator: Out-of-band association superseded");
            return;
        }
        assocCallback = callback;
        assocName = name;
        assocOob = oob;
        if( nullptr == oob ) {
            superseded = assocOobChannel;
            assocOobChannel = nullptr;
        }
        stale = assocChannel;
        assocChannel = nullptr;
    }
    if( nullptr != superseded ) {
        DBG_PRINT("Orchestrator: Out-of-band association replaced, interrupting %s", superseded->toString().c_str());
        superseded->interrupt();
    }
    if( nullptr != stale && !stale->isEstablished() ) {
        disconnectLink(stale->getTransport(), stale->getLink());
    }
    bool advertising = false;
    try {
        advertising = peripheral->startAdvertising(name);
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception starting advertising: %s", e.what());
    }
    if( !advertising ) {
        WARN_PRINT("Orchestrator: Could not advertise for association as '%s'", name.c_str());
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
            if( assocCallback == callback ) {
                assocCallback = nullptr;
                assocName.clear();
                assocOob = nullptr;
                assocOobChannel = nullptr;
            }
        }
        invokeAssociationCallback(callback, [](AssociationCallback& cb) { cb.onAssociationStartFailure(); });
        return;
    }
    jau::INFO_PRINT("Orchestrator: Association started as '%s', out-of-band %d", name.c_str(), nullptr != oob);
    invokeAssociationCallback(callback, [name](AssociationCallback& cb) { cb.onAssociationStartSuccess(name); });
}

void DeviceConnectionOrchestrator::stopAssociation(const AssociationCallbackRef& callback) noexcept {
    if( nullptr == callback ) {
        return;
    }
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
        if( nullptr == assocCallback || *assocCallback != *callback ) {
            DBG_PRINT("Orchestrator: stopAssociation of %s ignored, not pending", callback->toString().c_str());
            return;
        }
    }
    clearAssociation(true /* interrupt */);
}

void DeviceConnectionOrchestrator::notifyOutOfBandAccepted() noexcept {
    postEvent("notifyOutOfBandAccepted", [this]() {
        SecureChannelRef ch;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
            ch = assocChannel;
        }
        if( nullptr == ch ) {
            WARN_PRINT("Orchestrator: Out-of-band acceptance without pending association channel");
            notifyAssociation( [](AssociationCallback& cb) { cb.onAssociationError(DeviceError::INVALID_CHANNEL_STATE); } );
            return;
        }
        const DeviceError err = ch->notifyOutOfBandAccepted();
        if( DeviceError::INVALID_CHANNEL_STATE == err ) {
            notifyAssociation( [err](AssociationCallback& cb) { cb.onAssociationError(err); } );
        }
        // other failures have been reported by the channel
    } );
}
