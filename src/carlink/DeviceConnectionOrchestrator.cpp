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
#include <utility>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "DeviceConnectionOrchestrator.hpp"

using namespace carlink;

std::string carlink::to_string(const TransportRole r) noexcept {
    switch(r) {
        case TransportRole::PERIPHERAL: return "PERIPHERAL";
        case TransportRole::CENTRAL: return "CENTRAL";
        default: ; // fall through intended
    }
    return "Unknown TransportRole";
}

/**
 * Posts DeviceStore changes onto the event queue.
 */
class DeviceConnectionOrchestrator::StoreForwarder : public DeviceStoreListener {
    private:
        DeviceConnectionOrchestrator & o;

    public:
        explicit StoreForwarder(DeviceConnectionOrchestrator & o_) noexcept : o(o_) {}

        void associatedDeviceAdded(const AssociatedDevice& device) override {
            DeviceConnectionOrchestrator* po = &o;
            o.postEvent("associatedDeviceAdded", [po, device]() {
                po->notifyAssociationCallbacks( [device](DeviceAssociationCallback& cb) { cb.onAssociatedDeviceAdded(device); } );
            });
        }
        void associatedDeviceRemoved(const AssociatedDevice& device) override {
            DeviceConnectionOrchestrator* po = &o;
            o.postEvent("associatedDeviceRemoved", [po, device]() {
                po->notifyAssociationCallbacks( [device](DeviceAssociationCallback& cb) { cb.onAssociatedDeviceRemoved(device); } );
            });
        }
        void associatedDeviceUpdated(const AssociatedDevice& device) override {
            DeviceConnectionOrchestrator* po = &o;
            o.postEvent("associatedDeviceUpdated", [po, device]() {
                po->notifyAssociationCallbacks( [device](DeviceAssociationCallback& cb) { cb.onAssociatedDeviceUpdated(device); } );
            });
        }

        std::string toString() const noexcept override { return "Orchestrator::StoreForwarder"; }
};

/**
 * Posts raw link events of all transports onto the event queue.
 */
class DeviceConnectionOrchestrator::TransportForwarder : public TransportListener {
    private:
        DeviceConnectionOrchestrator & o;

    public:
        explicit TransportForwarder(DeviceConnectionOrchestrator & o_) noexcept : o(o_) {}

        void linkConnected(TransportAdapter &transport, const link_handle_t link, const bool isReconnect) override {
            const TransportAdapterRef t = o.findTransport(transport);
            if( nullptr == t ) {
                ERR_PRINT("Orchestrator: linkConnected on unknown transport %s", transport.toString().c_str());
                return;
            }
            DeviceConnectionOrchestrator* po = &o;
            o.postEvent("linkConnected", [po, t, link, isReconnect]() { po->handleLinkConnected(t, link, isReconnect); });
        }

        void linkDisconnected(TransportAdapter &transport, const link_handle_t link) override {
            const TransportAdapterRef t = o.findTransport(transport);
            if( nullptr == t ) {
                ERR_PRINT("Orchestrator: linkDisconnected on unknown transport %s", transport.toString().c_str());
                return;
            }
            DeviceConnectionOrchestrator* po = &o;
            o.postEvent("linkDisconnected", [po, t, link]() { po->handleLinkDisconnected(t, link); });
        }

        void frameReceived(TransportAdapter &transport, const link_handle_t link,
                           const DeviceMessage& frame, const OperationType op) override {
            const TransportAdapterRef t = o.findTransport(transport);
            if( nullptr == t ) {
                ERR_PRINT("Orchestrator: frameReceived on unknown transport %s", transport.toString().c_str());
                return;
            }
            DeviceConnectionOrchestrator* po = &o;
            o.postEvent("frameReceived", [po, t, link, frame, op]() { po->handleFrame(t, link, frame, op); });
        }
};

/**
 * Relays SecureChannel events, already running on the event queue.
 */
class DeviceConnectionOrchestrator::ChannelForwarder : public SecureChannelListener {
    private:
        DeviceConnectionOrchestrator & o;

    public:
        explicit ChannelForwarder(DeviceConnectionOrchestrator & o_) noexcept : o(o_) {}

        void deviceIdReceived(SecureChannel& channel, const DeviceId& deviceId) override {
            o.channelDeviceIdReceived(channel, deviceId);
        }
        void verificationCodeAvailable(SecureChannel& channel, const std::string& code) override {
            o.channelVerificationCodeAvailable(channel, code);
        }
        void secureChannelEstablished(SecureChannel& channel) override {
            o.channelEstablished(channel);
        }
        void establishSecureChannelFailure(SecureChannel& channel, const DeviceError error) override {
            o.channelFailure(channel, error);
        }
        void messageReceived(SecureChannel& channel, const DeviceMessage& message) override {
            o.channelMessageReceived(channel, message);
        }
        void messageReceivedError(SecureChannel& channel, const DeviceError error) override {
            o.channelMessageError(channel, error);
        }
};

DeviceConnectionOrchestrator::connectionCallbackList_t::equal_comparator DeviceConnectionOrchestrator::connectionCallbackEqComparator =
        [](const ConnectionCallbackPair &a, const ConnectionCallbackPair &b) -> bool { return *a.callback == *b.callback; };

DeviceConnectionOrchestrator::associationCallbackList_t::equal_comparator DeviceConnectionOrchestrator::associationCallbackEqComparator =
        [](const AssociationCallbackPair &a, const AssociationCallbackPair &b) -> bool { return *a.callback == *b.callback; };

static TransportAdapterRef findPeripheral(const jau::darray<TransportAdapterRef>& transports) noexcept {
    for(const TransportAdapterRef& t : transports) {
        if( nullptr != t && TransportRole::PERIPHERAL == t->getRole() ) {
            return t;
        }
    }
    return nullptr;
}

ExecutorRef DeviceConnectionOrchestrator::makeExecutor(const ExecutorRef& given, std::shared_ptr<SerialExecutor>& owned,
                                                       const std::string& name, const jau::nsize_t capacity)
{
    if( nullptr != given ) {
        return given;
    }
    owned = std::make_shared<SerialExecutor>(name, capacity);
    return owned;
}

DeviceConnectionOrchestrator::DeviceConnectionOrchestrator(const DeviceStoreRef& store_, const jau::darray<TransportAdapterRef>& transports_,
                                                           const HandshakePrimitiveFactory& primitiveFactory_,
                                                           const ExecutorRef& eventQueue_, const ExecutorRef& worker_)
: env(CarlinkEnv::get()),
  store(store_), transports(transports_), peripheral(findPeripheral(transports_)), primitiveFactory(primitiveFactory_),
  ownedEventQueue(), ownedWorker(),
  eventQueue( makeExecutor(eventQueue_, ownedEventQueue, "carlink_events", static_cast<jau::nsize_t>(env.TASK_RING_CAPACITY)) ),
  worker( makeExecutor(worker_, ownedWorker, "carlink_worker", static_cast<jau::nsize_t>(env.TASK_RING_CAPACITY)) ),
  blacklist( std::make_shared<RecipientBlacklist>() ), registry(blacklist),
  state(ManagerState::STOPPED), is_connecting(false), connectingDeviceId()
{
    if( nullptr == store ) {
        throw jau::IllegalArgumentException("DeviceConnectionOrchestrator: null DeviceStore", E_FILE_LINE);
    }
    if( transports.empty() ) {
        throw jau::IllegalArgumentException("DeviceConnectionOrchestrator: no TransportAdapter", E_FILE_LINE);
    }
    for(const TransportAdapterRef& t : transports) {
        if( nullptr == t ) {
            throw jau::IllegalArgumentException("DeviceConnectionOrchestrator: null TransportAdapter", E_FILE_LINE);
        }
    }
    if( primitiveFactory.is_null() ) {
        throw jau::IllegalArgumentException("DeviceConnectionOrchestrator: null HandshakePrimitiveFactory", E_FILE_LINE);
    }
    if( nullptr == peripheral ) {
        WARN_PRINT("DeviceConnectionOrchestrator: No peripheral transport, association and reconnection disabled");
    }
    storeForwarder = std::make_shared<StoreForwarder>(*this);
    transportForwarder = std::make_shared<TransportForwarder>(*this);
    channelForwarder = std::make_shared<ChannelForwarder>(*this);

    store->addListener(storeForwarder);
    for(const TransportAdapterRef& t : transports) {
        t->setTransportListener(transportForwarder);
    }
    DBG_PRINT("DeviceConnectionOrchestrator::ctor: %s", toString().c_str());
}

DeviceConnectionOrchestrator::~DeviceConnectionOrchestrator() noexcept {
    DBG_PRINT("DeviceConnectionOrchestrator::dtor: start: %s", toString().c_str());
    stop();
    for(const TransportAdapterRef& t : transports) {
        try {
            t->setTransportListener(nullptr);
        } catch (std::exception &e) {
            ERR_PRINT("DeviceConnectionOrchestrator::dtor: Caught exception %s", e.what());
        }
    }
    store->removeListener(storeForwarder);
    if( nullptr != ownedEventQueue ) {
        ownedEventQueue->stop();
    }
    if( nullptr != ownedWorker ) {
        ownedWorker->stop();
    }
    DBG_PRINT("DeviceConnectionOrchestrator::dtor: end");
}

bool DeviceConnectionOrchestrator::setState(const ManagerState to) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    if( !is_valid_transition(state, to) ) {
        DBG_PRINT("DeviceConnectionOrchestrator: Ignored transition %s -> %s", to_string(state).c_str(), to_string(to).c_str());
        return false;
    }
    DBG_PRINT("DeviceConnectionOrchestrator: State %s -> %s", to_string(state).c_str(), to_string(to).c_str());
    state = to;
    return true;
}

ManagerState DeviceConnectionOrchestrator::getState() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    return state;
}

TransportAdapterRef DeviceConnectionOrchestrator::findTransport(const TransportAdapter& t) const noexcept {
    for(const TransportAdapterRef& r : transports) {
        if( r.get() == &t ) {
            return r;
        }
    }
    return nullptr;
}

SecureChannelRef DeviceConnectionOrchestrator::findChannel(const TransportAdapter& t, const link_handle_t link) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    for(const SecureChannelRef& ch : channels) {
        if( ch->getTransport().get() == &t && ch->getLink() == link ) {
            return ch;
        }
    }
    return nullptr;
}

SecureChannelRef DeviceConnectionOrchestrator::removeChannel(const TransportAdapter& t, const link_handle_t link) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    for(auto it = channels.begin(); it != channels.end(); ++it) {
        if( (*it)->getTransport().get() == &t && (*it)->getLink() == link ) {
            SecureChannelRef ch = *it;
            channels.erase(it);
            return ch;
        }
    }
    return nullptr;
}

DeviceConnectionOrchestrator::DeviceEntry* DeviceConnectionOrchestrator::findEntry(const DeviceId& deviceId) noexcept {
    for(DeviceEntry& e : devices) {
        if( e.device.getDeviceId() == deviceId ) {
            return &e;
        }
    }
    return nullptr;
}

bool DeviceConnectionOrchestrator::clearConnecting() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_connect); // RAII-style acquire and relinquish via destructor
    const bool was = is_connecting;
    is_connecting = false;
    connectingDeviceId = DeviceId();
    return was;
}

bool DeviceConnectionOrchestrator::isConnecting() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_connect); // RAII-style acquire and relinquish via destructor
    return is_connecting;
}

void DeviceConnectionOrchestrator::postEvent(const std::string& name, Executor::Task task) noexcept {
    COND_PRINT(env.DEBUG_EVENT, "Orchestrator: Event %s", name.c_str());
    if( !eventQueue->execute( std::move(task) ) ) {
        WARN_PRINT("Orchestrator: Event %s dropped by %s", name.c_str(), eventQueue->toString().c_str());
    }
}

void DeviceConnectionOrchestrator::disconnectLink(const TransportAdapterRef& transport, const link_handle_t link) noexcept {
    DBG_PRINT("Orchestrator: Disconnect link %u on %s", link, transport->toString().c_str());
    try {
        transport->disconnectDevice(link);
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception disconnecting link %u: %s", link, e.what());
    }
}

void DeviceConnectionOrchestrator::start() noexcept {
    if( ManagerState::STOPPED != getState() ) {
        DBG_PRINT("DeviceConnectionOrchestrator::start: Started already, resetting");
        reset();
    }
    setState(ManagerState::STARTING);
    setState(ManagerState::RUNNING);
    jau::INFO_PRINT("DeviceConnectionOrchestrator: Started: %s", toString().c_str());
    connectToActiveUserDevice();
}

void DeviceConnectionOrchestrator::reset() noexcept {
    DBG_PRINT("DeviceConnectionOrchestrator::reset: %s", toString().c_str());
    clearAssociation(true /* interrupt */);
    if( nullptr != peripheral ) {
        try {
            peripheral->stopAdvertising();
        } catch (std::exception &e) {
            ERR_PRINT("DeviceConnectionOrchestrator::reset: Caught exception %s", e.what());
        }
    }
    clearConnecting();
    blacklist->clear();

    jau::darray<std::pair<TransportAdapterRef, link_handle_t>> links;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        for(const DeviceEntry& e : devices) {
            links.push_back( std::make_pair(e.transport, e.link) );
        }
        for(const SecureChannelRef& ch : channels) {
            const bool dup = links.cend() != jau::find_if(links.cbegin(), links.cend(),
                    [&](const std::pair<TransportAdapterRef, link_handle_t>& l) -> bool {
                        return l.first == ch->getTransport() && l.second == ch->getLink();
                    });
            if( !dup ) {
                links.push_back( std::make_pair(ch->getTransport(), ch->getLink()) );
            }
        }
    }
    for(const auto& l : links) {
        disconnectLink(l.first, l.second);
    }
}

void DeviceConnectionOrchestrator::stop() noexcept {
    setState(ManagerState::STOPPED);
    reset();
    registry.clear();
    jau::INFO_PRINT("DeviceConnectionOrchestrator: Stopped");
}

void DeviceConnectionOrchestrator::connectToActiveUserDevice() noexcept {
    if( !worker->execute( [this]() { connectToActiveUserDeviceImpl(); } ) ) {
        WARN_PRINT("DeviceConnectionOrchestrator: Connect request dropped by %s", worker->toString().c_str());
    }
}

void DeviceConnectionOrchestrator::connectToActiveUserDeviceImpl() noexcept {
    if( ManagerState::STOPPED == getState() ) {
        DBG_PRINT("Orchestrator::connect: Stopped, ignored");
        return;
    }
    if( nullptr == peripheral ) {
        return;
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_connect); // RAII-style acquire and relinquish via destructor
        if( is_connecting ) {
            DBG_PRINT("Orchestrator::connect: Already attempting to connect to %s", connectingDeviceId.toString().c_str());
            return;
        }
        is_connecting = true;
    }
    jau::darray<AssociatedDevice> associated;
    try {
        associated = store->getActiveUserAssociatedDevices();
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator::connect: Caught exception reading store: %s", e.what());
        clearConnecting();
        return;
    }
    if( associated.empty() ) {
        DBG_PRINT("Orchestrator::connect: No associated device for the active user");
        clearConnecting();
        return;
    }
    // only one device of the active user is supported
    const AssociatedDevice device = associated[0];
    if( !device.connectionEnabled ) {
        DBG_PRINT("Orchestrator::connect: Connection disabled for %s", device.toString().c_str());
        clearConnecting();
        return;
    }
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        if( nullptr != findEntry(device.deviceId) ) {
            DBG_PRINT("Orchestrator::connect: Already connected to %s", device.toString().c_str());
            clearConnecting();
            return;
        }
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_connect); // RAII-style acquire and relinquish via destructor
        connectingDeviceId = device.deviceId;
    }
    bool started = false;
    try {
        started = peripheral->connectToDevice(device.deviceId, env.CONNECT_TIMEOUT_SEC);
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator::connect: Caught exception %s", e.what());
    }
    if( !started ) {
        WARN_PRINT("Orchestrator::connect: Could not start connecting to %s", device.toString().c_str());
        clearConnecting();
        return;
    }
    DBG_PRINT("Orchestrator::connect: Connecting to %s, timeout %d s", device.toString().c_str(), env.CONNECT_TIMEOUT_SEC);
}

jau::darray<ConnectedDevice> DeviceConnectionOrchestrator::getActiveUserConnectedDevices() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    jau::darray<ConnectedDevice> res;
    for(const DeviceEntry& e : devices) {
        if( e.device.isAssociatedWithActiveUser() ) {
            res.push_back(e.device);
        }
    }
    return res;
}

DeviceConnectionState DeviceConnectionOrchestrator::getDeviceConnectionState(const DeviceId& deviceId) const noexcept {
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        for(const DeviceEntry& e : devices) {
            if( e.device.getDeviceId() == deviceId ) {
                return e.state;
            }
        }
    }
    const std::lock_guard<std::mutex> lock(mtx_connect); // RAII-style acquire and relinquish via destructor
    if( is_connecting && connectingDeviceId == deviceId ) {
        return DeviceConnectionState::CONNECTING;
    }
    return DeviceConnectionState::DISCONNECTED;
}

//
// Feature callbacks
//

void DeviceConnectionOrchestrator::notifyConnectionCallbacks(const ConnectedDevice& device,
                                                             const jau::function<void(ConnectionCallback&)>& notification) noexcept
{
    DBG_PRINT("Orchestrator: Notifying connection callbacks of %s", device.toString().c_str());
    int i=0;
    jau::for_each_fidelity(connectionCallbacks, [&](ConnectionCallbackPair &p) {
        if( !p.activeUserOnly || device.isAssociatedWithActiveUser() ) {
            const ConnectionCallbackRef cb = p.callback;
            const jau::function<void(ConnectionCallback&)> n = notification;
            if( !p.executor->execute( [cb, n]() {
                    try {
                        n(*cb);
                    } catch (std::exception &e) {
                        ERR_PRINT("Orchestrator: Caught exception in %s: %s", cb->toString().c_str(), e.what());
                    }
                } ) )
            {
                WARN_PRINT("Orchestrator: ConnectionCallback %d dropped: %s", i+1, cb->toString().c_str());
            }
        }
        i++;
    });
}

void DeviceConnectionOrchestrator::notifyAssociationCallbacks(const jau::function<void(DeviceAssociationCallback&)>& notification) noexcept {
    jau::for_each_fidelity(associationCallbacks, [&](AssociationCallbackPair &p) {
        const DeviceAssociationCallbackRef cb = p.callback;
        const jau::function<void(DeviceAssociationCallback&)> n = notification;
        if( !p.executor->execute( [cb, n]() {
                try {
                    n(*cb);
                } catch (std::exception &e) {
                    ERR_PRINT("Orchestrator: Caught exception in %s: %s", cb->toString().c_str(), e.what());
                }
            } ) )
        {
            WARN_PRINT("Orchestrator: DeviceAssociationCallback %s dropped", cb->toString().c_str());
        }
    });
}

bool DeviceConnectionOrchestrator::registerActiveUserConnectionCallback(const ConnectionCallbackRef& callback, const ExecutorRef& executor) noexcept {
    if( nullptr == callback || nullptr == executor ) {
        ERR_PRINT("ConnectionCallback or Executor ref is null");
        return false;
    }
    return connectionCallbacks.push_back_unique(ConnectionCallbackPair{callback, executor, true}, connectionCallbackEqComparator);
}

bool DeviceConnectionOrchestrator::registerConnectionCallback(const ConnectionCallbackRef& callback, const ExecutorRef& executor) noexcept {
    if( nullptr == callback || nullptr == executor ) {
        ERR_PRINT("ConnectionCallback or Executor ref is null");
        return false;
    }
    return connectionCallbacks.push_back_unique(ConnectionCallbackPair{callback, executor, false}, connectionCallbackEqComparator);
}

bool DeviceConnectionOrchestrator::unregisterConnectionCallback(const ConnectionCallbackRef& callback) noexcept {
    if( nullptr == callback ) {
        ERR_PRINT("ConnectionCallback ref is null");
        return false;
    }
    const jau::nsize_t count = connectionCallbacks.erase_matching(ConnectionCallbackPair{callback, nullptr, false},
                                                                  false /* all_matching */,
                                                                  connectionCallbackEqComparator);
    return count > 0;
}

bool DeviceConnectionOrchestrator::registerDeviceAssociationCallback(const DeviceAssociationCallbackRef& callback, const ExecutorRef& executor) noexcept {
    if( nullptr == callback || nullptr == executor ) {
        ERR_PRINT("DeviceAssociationCallback or Executor ref is null");
        return false;
    }
    return associationCallbacks.push_back_unique(AssociationCallbackPair{callback, executor}, associationCallbackEqComparator);
}

bool DeviceConnectionOrchestrator::unregisterDeviceAssociationCallback(const DeviceAssociationCallbackRef& callback) noexcept {
    if( nullptr == callback ) {
        ERR_PRINT("DeviceAssociationCallback ref is null");
        return false;
    }
    const jau::nsize_t count = associationCallbacks.erase_matching(AssociationCallbackPair{callback, nullptr},
                                                                   false /* all_matching */,
                                                                   associationCallbackEqComparator);
    return count > 0;
}

bool DeviceConnectionOrchestrator::registerDeviceCallback(const ConnectedDevice& device, const RecipientId& recipient,
                                                          const DeviceCallbackRef& callback, const ExecutorRef& executor) noexcept
{
    return registry.registerCallback(device, recipient, callback, executor);
}

bool DeviceConnectionOrchestrator::unregisterDeviceCallback(const ConnectedDevice& device, const RecipientId& recipient,
                                                            const DeviceCallbackRef& callback) noexcept
{
    return registry.unregisterCallback(device, recipient, callback);
}

void DeviceConnectionOrchestrator::setMessageDeliveryDelegate(const MessageDeliveryDelegateRef& delegate) noexcept {
    registry.setMessageDeliveryDelegate(delegate);
}

//
// Messaging
//

DeviceError DeviceConnectionOrchestrator::sendMessageSecurely(const ConnectedDevice& device, const RecipientId& recipient,
                                                              const jau::TROOctets& message) noexcept
{
    SecureChannelRef ch;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        DeviceEntry* e = findEntry(device.getDeviceId());
        if( nullptr != e ) {
            ch = findChannel(*e->transport, e->link);
        }
    }
    if( nullptr == ch || !ch->isEstablished() ) {
        WARN_PRINT("Orchestrator: Secure channel not established with %s", device.toString().c_str());
        return DeviceError::INVALID_CHANNEL_STATE;
    }
    return ch->sendClientMessage( DeviceMessage(recipient, true /* encrypted */, message) );
}

DeviceError DeviceConnectionOrchestrator::sendMessageUnsecurely(const ConnectedDevice& device, const RecipientId& recipient,
                                                                const jau::TROOctets& message) noexcept
{
    SecureChannelRef ch;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        DeviceEntry* e = findEntry(device.getDeviceId());
        if( nullptr != e ) {
            ch = findChannel(*e->transport, e->link);
        }
    }
    if( nullptr == ch ) {
        WARN_PRINT("Orchestrator: Not connected to %s", device.toString().c_str());
        return DeviceError::UNEXPECTED_DISCONNECTION;
    }
    return ch->sendClientMessage( DeviceMessage(recipient, false /* encrypted */, message) );
}

//
// Associated devices
//

bool DeviceConnectionOrchestrator::enableAssociatedDeviceConnection(const DeviceId& deviceId) noexcept {
    bool res = false;
    try {
        res = store->updateAssociatedDeviceConnectionEnabled(deviceId, true);
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception enabling %s: %s", deviceId.toString().c_str(), e.what());
    }
    if( !res ) {
        return false;
    }
    connectToActiveUserDevice();
    return true;
}

bool DeviceConnectionOrchestrator::disableAssociatedDeviceConnection(const DeviceId& deviceId) noexcept {
    bool res = false;
    try {
        res = store->updateAssociatedDeviceConnectionEnabled(deviceId, false);
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception disabling %s: %s", deviceId.toString().c_str(), e.what());
    }
    if( !res ) {
        return false;
    }
    TransportAdapterRef transport;
    link_handle_t link = 0;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        DeviceEntry* e = findEntry(deviceId);
        if( nullptr != e ) {
            transport = e->transport;
            link = e->link;
        }
    }
    if( nullptr != transport ) {
        disconnectLink(transport, link);
    }
    return true;
}

bool DeviceConnectionOrchestrator::removeActiveUserAssociatedDevice(const DeviceId& deviceId) noexcept {
    TransportAdapterRef transport;
    link_handle_t link = 0;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        DeviceEntry* e = findEntry(deviceId);
        if( nullptr != e ) {
            transport = e->transport;
            link = e->link;
        }
    }
    if( nullptr != transport ) {
        disconnectLink(transport, link);
    }
    try {
        return store->removeAssociatedDeviceForActiveUser(deviceId);
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception removing %s: %s", deviceId.toString().c_str(), e.what());
    }
    return false;
}

//
// Link events
//

void DeviceConnectionOrchestrator::handleLinkConnected(const TransportAdapterRef& transport, const link_handle_t link,
                                                       const bool isReconnect) noexcept
{
    if( ManagerState::STOPPED == getState() ) {
        WARN_PRINT("Orchestrator: Link %u connected while stopped", link);
        disconnectLink(transport, link);
        return;
    }
    std::shared_ptr<OobConnectionManager> oob;
    if( !isReconnect ) {
        bool accept;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
            accept = nullptr != assocCallback && transport == peripheral && nullptr == assocChannel;
            oob = assocOob;
        }
        if( !accept ) {
            WARN_PRINT("Orchestrator: Link %u connected for association, none pending on %s", link, transport->toString().c_str());
            disconnectLink(transport, link);
            return;
        }
    }
    std::unique_ptr<HandshakePrimitive> primitive;
    try {
        primitive = primitiveFactory();
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception creating HandshakePrimitive: %s", e.what());
    }
    if( nullptr == primitive ) {
        ERR_PRINT("Orchestrator: No HandshakePrimitive for link %u", link);
        disconnectLink(transport, link);
        return;
    }
    const SecureChannelRef ch = std::make_shared<SecureChannel>(transport, link, store, std::move(primitive),
                                                                isReconnect, channelForwarder, oob);
    if( !isReconnect ) {
        const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
        assocChannel = ch;
    }
    SecureChannelRef stale = removeChannel(*transport, link);
    if( nullptr != stale ) {
        WARN_PRINT("Orchestrator: Replaced stale %s", stale->toString().c_str());
    }
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        channels.push_back(ch);
    }
    DBG_PRINT("Orchestrator: Link connected: %s", ch->toString().c_str());
}

void DeviceConnectionOrchestrator::handleLinkDisconnected(const TransportAdapterRef& transport, const link_handle_t link) noexcept {
    const SecureChannelRef ch = removeChannel(*transport, link);
    DBG_PRINT("Orchestrator: Link %u disconnected on %s, %s", link, transport->toString().c_str(),
            nullptr != ch ? ch->toString().c_str() : "no channel");
    if( nullptr != ch ) {
        bool pendingAssociation = false;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
            if( ch == assocChannel ) {
                assocChannel = nullptr;
                pendingAssociation = true;
            }
        }
        if( pendingAssociation ) {
            notifyAssociation( [](AssociationCallback& cb) { cb.onAssociationError(DeviceError::UNEXPECTED_DISCONNECTION); } );
        }
        if( ch->hasDeviceId() ) {
            const DeviceId id = ch->getDeviceId();
            bool ownsEntry = false;
            {
                const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
                const DeviceEntry* e = findEntry(id);
                ownsEntry = nullptr != e && e->transport == transport && e->link == link;
            }
            if( ownsEntry ) {
                onDeviceDisconnected(id, transport);
                return;
            }
        }
    }
    // link without device entry
    if( TransportRole::PERIPHERAL == transport->getRole() ) {
        clearConnecting();
        bool empty;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
            empty = devices.empty();
        }
        if( empty ) {
            connectToActiveUserDevice();
        }
    }
}

void DeviceConnectionOrchestrator::handleFrame(const TransportAdapterRef& transport, const link_handle_t link,
                                               const DeviceMessage& frame, const OperationType op) noexcept
{
    const SecureChannelRef ch = findChannel(*transport, link); // keeps channel alive while processing
    if( nullptr == ch ) {
        WARN_PRINT("Orchestrator: Frame on unknown link %u dropped: %s", link, frame.toString().c_str());
        return;
    }
    ch->processFrame(frame, op);
}

//
// SecureChannel events
//

void DeviceConnectionOrchestrator::channelDeviceIdReceived(SecureChannel& ch, const DeviceId& deviceId) noexcept {
    const TransportAdapterRef& transport = ch.getTransport();
    if( isAssociationChannel(ch) ) {
        try {
            transport->stopAdvertising();
        } catch (std::exception &e) {
            ERR_PRINT("Orchestrator: Caught exception stopping advertising: %s", e.what());
        }
    }
    bool duplicate;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        const DeviceEntry* e = findEntry(deviceId);
        duplicate = nullptr != e && !( e->transport == transport && e->link == ch.getLink() );
    }
    if( duplicate ) {
        WARN_PRINT("Orchestrator: Device %s connected already, dropping link %u",
                deviceId.toString().c_str(), ch.getLink());
        disconnectLink(transport, ch.getLink());
        return;
    }
    onDeviceConnected(deviceId, transport, ch.getLink());
}

void DeviceConnectionOrchestrator::channelVerificationCodeAvailable(SecureChannel& ch, const std::string& code) noexcept {
    if( !isAssociationChannel(ch) ) {
        WARN_PRINT("Orchestrator: Verification code of stray channel %s", ch.toString().c_str());
        return;
    }
    notifyAssociation( [code](AssociationCallback& cb) { cb.onVerificationCodeAvailable(code); } );
}

void DeviceConnectionOrchestrator::channelEstablished(SecureChannel& ch) noexcept {
    const DeviceId id = ch.getDeviceId();
    const TransportAdapterRef transport = ch.getTransport();
    const link_handle_t link = ch.getLink();
    if( !ch.isReconnect() ) {
        if( !isAssociationChannel(ch) ) {
            WARN_PRINT("Orchestrator: Association has been stopped, dropping %s", ch.toString().c_str());
            disconnectLink(transport, link);
            return;
        }
        bool saved = false;
        try {
            const AssociatedDevice device(id, transport->getLinkAddress(link), transport->getLinkName(link), true /* enabled */);
            saved = store->addAssociatedDeviceForActiveUser(device, ch.getSessionKey());
        } catch (std::exception &e) {
            ERR_PRINT("Orchestrator: Caught exception persisting %s: %s", id.toString().c_str(), e.what());
        }
        if( !saved ) {
            ERR_PRINT("Orchestrator: Could not persist association of %s", id.toString().c_str());
            {
                const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
                assocChannel = nullptr;
            }
            notifyAssociation( [](AssociationCallback& cb) { cb.onAssociationError(DeviceError::STORAGE_FAILURE); } );
            disconnectLink(transport, link);
            return;
        }
        onAssociationCompleted(id);
        clearAssociation(false /* interrupt */);
    }
    onSecureChannelEstablished(id);
}

void DeviceConnectionOrchestrator::channelFailure(SecureChannel& ch, const DeviceError error) noexcept {
    WARN_PRINT("Orchestrator: Secure channel failed: %s, %s", to_string(error).c_str(), ch.toString().c_str());
    if( isAssociationChannel(ch) ) {
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_association); // RAII-style acquire and relinquish via destructor
            assocChannel = nullptr;
        }
        notifyAssociation( [error](AssociationCallback& cb) { cb.onAssociationError(error); } );
    }
    if( ch.hasDeviceId() ) {
        onSecureChannelError(ch.getDeviceId());
    }
    // the channel is discarded with its link
    disconnectLink(ch.getTransport(), ch.getLink());
}

void DeviceConnectionOrchestrator::channelMessageReceived(SecureChannel& ch, const DeviceMessage& message) noexcept {
    onMessageReceived(ch.getDeviceId(), message);
}

void DeviceConnectionOrchestrator::channelMessageError(SecureChannel& ch, const DeviceError error) noexcept {
    const DeviceId id = ch.getDeviceId();
    ConnectedDevice device;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        const DeviceEntry* e = findEntry(id);
        if( nullptr == e ) {
            return;
        }
        device = e->device;
    }
    WARN_PRINT("Orchestrator: Message error %s from %s", to_string(error).c_str(), device.toString().c_str());
    registry.notifyDeviceCallbacks(id, [device](DeviceCallback& cb) { cb.onDeviceError(device, DeviceError::INVALID_MSG); });
}

//
// Device events
//

void DeviceConnectionOrchestrator::onDeviceConnected(const DeviceId& deviceId, const TransportAdapterRef& transport,
                                                     const link_handle_t link) noexcept
{
    std::string name;
    bool belongs = false;
    try {
        belongs = store->isActiveUserDevice(deviceId);
        if( belongs ) {
            const jau::darray<AssociatedDevice> associated = store->getActiveUserAssociatedDevices();
            for(const AssociatedDevice& d : associated) {
                if( d.deviceId == deviceId ) {
                    name = d.name;
                }
            }
        }
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception reading store: %s", e.what());
    }
    const ConnectedDevice device(deviceId, name, belongs, false /* secureChannel */);
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        if( nullptr != findEntry(deviceId) ) {
            DBG_PRINT("Orchestrator: Device %s connected already, no-op", deviceId.toString().c_str());
            return;
        }
        devices.push_back( DeviceEntry{ device, transport, link, DeviceConnectionState::HANDSHAKE_IN_PROGRESS } );
    }
    DBG_PRINT("Orchestrator: Device connected: %s, link %u", device.toString().c_str(), link);
    notifyConnectionCallbacks(device, [device](ConnectionCallback& cb) { cb.onDeviceConnected(device); });
}

void DeviceConnectionOrchestrator::onDeviceDisconnected(const DeviceId& deviceId, const TransportAdapterRef& transport) noexcept {
    ConnectedDevice device;
    bool found = false;
    bool empty;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        for(auto it = devices.begin(); it != devices.end(); ++it) {
            if( it->device.getDeviceId() == deviceId && it->transport == transport ) {
                device = it->device;
                devices.erase(it);
                found = true;
                break;
            }
        }
        empty = devices.empty();
    }
    DBG_PRINT("Orchestrator: Device %s disconnected from %s, known %d",
            deviceId.toString().c_str(), transport->toString().c_str(), found);
    if( found ) {
        notifyConnectionCallbacks(device, [device](ConnectionCallback& cb) { cb.onDeviceDisconnected(device); });
    }
    if( TransportRole::PERIPHERAL == transport->getRole() ) {
        // open for future connection requests
        clearConnecting();
        if( ( found && device.isAssociatedWithActiveUser() ) || empty ) {
            connectToActiveUserDevice();
        }
    }
}

void DeviceConnectionOrchestrator::onSecureChannelEstablished(const DeviceId& deviceId) noexcept {
    ConnectedDevice updated;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        DeviceEntry* e = findEntry(deviceId);
        if( nullptr == e ) {
            ERR_PRINT("Orchestrator: Secure channel established on unknown device %s", deviceId.toString().c_str());
            return;
        }
        if( !is_valid_transition(e->state, DeviceConnectionState::ESTABLISHED) ) {
            WARN_PRINT("Orchestrator: Device %s in state %s", deviceId.toString().c_str(), to_string(e->state).c_str());
            return;
        }
        e->device = e->device.withSecureChannel(true);
        e->state = DeviceConnectionState::ESTABLISHED;
        updated = e->device;
    }
    jau::INFO_PRINT("Orchestrator: Secure channel established: %s", updated.toString().c_str());
    registry.notifyDeviceCallbacks(deviceId, [updated](DeviceCallback& cb) { cb.onSecureChannelEstablished(updated); });
}

void DeviceConnectionOrchestrator::onMessageReceived(const DeviceId& deviceId, const DeviceMessage& message) noexcept {
    ConnectedDevice device;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        const DeviceEntry* e = findEntry(deviceId);
        if( nullptr == e ) {
            WARN_PRINT("Orchestrator: Message from unknown device %s: %s", deviceId.toString().c_str(), message.toString().c_str());
            return;
        }
        device = e->device;
    }
    DBG_PRINT("Orchestrator: Message from %s: %s", deviceId.toString().c_str(), message.toString().c_str());
    registry.dispatch(device, message);
}

void DeviceConnectionOrchestrator::onSecureChannelError(const DeviceId& deviceId) noexcept {
    ConnectedDevice device;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        const DeviceEntry* e = findEntry(deviceId);
        if( nullptr == e ) {
            WARN_PRINT("Orchestrator: Secure channel failed on unknown device %s", deviceId.toString().c_str());
            return;
        }
        device = e->device;
    }
    registry.notifyDeviceCallbacks(deviceId, [device](DeviceCallback& cb) { cb.onDeviceError(device, DeviceError::INVALID_SECURITY_KEY); });
}

void DeviceConnectionOrchestrator::onAssociationCompleted(const DeviceId& deviceId) noexcept {
    notifyAssociation( [deviceId](AssociationCallback& cb) { cb.onAssociationCompleted(deviceId); } );

    std::string name;
    try {
        const jau::darray<AssociatedDevice> associated = store->getActiveUserAssociatedDevices();
        for(const AssociatedDevice& d : associated) {
            if( d.deviceId == deviceId ) {
                name = d.name;
            }
        }
    } catch (std::exception &e) {
        ERR_PRINT("Orchestrator: Caught exception reading store: %s", e.what());
    }
    ConnectedDevice previous, associated;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        DeviceEntry* e = findEntry(deviceId);
        if( nullptr == e || e->device.isAssociatedWithActiveUser() ) {
            return;
        }
        previous = e->device;
        associated = previous.withActiveUser(true, name);
        e->device = associated;
    }
    // previous device is obsolete
    notifyConnectionCallbacks(previous, [previous](ConnectionCallback& cb) { cb.onDeviceDisconnected(previous); });
    notifyConnectionCallbacks(associated, [associated](ConnectionCallback& cb) { cb.onDeviceConnected(associated); });
}

std::string DeviceConnectionOrchestrator::toString() const noexcept {
    jau::nsize_t devCount, chCount;
    ManagerState s;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        devCount = devices.size();
        chCount = channels.size();
        s = state;
    }
    return "Orchestrator["+to_string(s)+", devices "+std::to_string(devCount)+", channels "+std::to_string(chCount)+
           ", transports "+std::to_string(transports.size())+", connecting "+std::to_string(isConnecting())+
           ", associating "+std::to_string(isAssociating())+"]";
}
