#include <iostream>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <carlink/DeviceConnectionOrchestrator.hpp>

#include "carlink_test_utils.hpp"

using namespace carlink;
using namespace carlink_test;

class RecordingStoreCallback : public DeviceAssociationCallback {
    public:
        std::vector<AssociatedDevice> added, removed, updated;

        void onAssociatedDeviceAdded(const AssociatedDevice& device) override { added.push_back(device); }
        void onAssociatedDeviceRemoved(const AssociatedDevice& device) override { removed.push_back(device); }
        void onAssociatedDeviceUpdated(const AssociatedDevice& device) override { updated.push_back(device); }
};

class FakeOobChannel : public OobChannel {
    public:
        bool result = true;
        bool interrupted = false;
        std::string address;
        jau::POctets data = jau::POctets(jau::lb_endian_t::little);

        bool completeOobDataExchange(const std::string& address_, const jau::TROOctets& oobData) noexcept override {
            address = address_;
            data = jau::POctets(oobData.get_ptr(), oobData.size(), jau::lb_endian_t::little);
            return result;
        }
        void interrupt() noexcept override { interrupted = true; }
        std::string toString() const noexcept override { return "FakeOobChannel"; }
};

/**
 * Orchestrator driven inline, all events and work run on the calling thread.
 */
struct OrchestratorFixture {
    std::shared_ptr<FakeTransport> peripheral;
    std::shared_ptr<FakeTransport> central;
    std::shared_ptr<FakeStore> store;
    ExecutorRef direct;
    std::shared_ptr<RecordingConnectionCallback> activeUserCallback;
    std::shared_ptr<RecordingConnectionCallback> allCallback;
    std::shared_ptr<RecordingStoreCallback> storeCallback;
    std::unique_ptr<DeviceConnectionOrchestrator> orch;

    const DeviceId phone = make_id(1);

    explicit OrchestratorFixture(const ExecutorRef& worker=nullptr)
    : peripheral(std::make_shared<FakeTransport>(TransportRole::PERIPHERAL)),
      central(std::make_shared<FakeTransport>(TransportRole::CENTRAL)),
      store(std::make_shared<FakeStore>()),
      direct(std::make_shared<DirectExecutor>()),
      activeUserCallback(std::make_shared<RecordingConnectionCallback>()),
      allCallback(std::make_shared<RecordingConnectionCallback>()),
      storeCallback(std::make_shared<RecordingStoreCallback>())
    {
        jau::darray<TransportAdapterRef> transports;
        transports.push_back(peripheral);
        transports.push_back(central);
        HandshakePrimitiveFactory factory = []() -> std::unique_ptr<HandshakePrimitive> {
            return std::make_unique<FakeHandshake>();
        };
        orch = std::make_unique<DeviceConnectionOrchestrator>(store, transports, factory, direct,
                                                              nullptr != worker ? worker : direct);
        REQUIRE( true == orch->registerActiveUserConnectionCallback(activeUserCallback, direct) );
        REQUIRE( true == orch->registerConnectionCallback(allCallback, direct) );
        REQUIRE( true == orch->registerDeviceAssociationCallback(storeCallback, direct) );
    }

    void associate() {
        store->put(AssociatedDevice(phone, "00:11:22:33:44:55", "phone", true), make_key(0x11));
    }

    void sendDeviceId(FakeTransport& t, const link_handle_t link, const DeviceId& id) {
        t.peerSendsHandshake(link, to_octets(id));
    }

    /** Session resumption of the associated phone, proving its stored key. */
    void resume(FakeTransport& t, const link_handle_t link) {
        t.peerSendsHandshake(link, bytes_of("resume"));
        t.peerSendsHandshake(link, make_key(0x11).toBytes());
    }

    /** Reconnects the associated phone on the peripheral transport, link 1. */
    void reconnect() {
        peripheral->peerConnects(1, true);
        sendDeviceId(*peripheral, 1, phone);
        resume(*peripheral, 1);
    }

    ConnectedDevice connectedPhone() const {
        const jau::darray<ConnectedDevice> list = orch->getActiveUserConnectedDevices();
        REQUIRE( 1 == list.size() );
        return list[0];
    }
};

TEST_CASE( "Orchestrator Lifecycle Test 01", "[Orchestrator][lifecycle]" ) {
    OrchestratorFixture f;
    REQUIRE( ManagerState::STOPPED == f.orch->getState() );

    // no associated device
    f.orch->start();
    REQUIRE( ManagerState::RUNNING == f.orch->getState() );
    REQUIRE( 0 == f.peripheral->connectCount );
    REQUIRE( false == f.orch->isConnecting() );

    f.associate();
    f.orch->connectToActiveUserDevice();
    REQUIRE( 1 == f.peripheral->connectCount );
    REQUIRE( f.phone == f.peripheral->lastConnectId );
    REQUIRE( 60 == f.peripheral->lastTimeout );
    REQUIRE( true == f.orch->isConnecting() );
    REQUIRE( DeviceConnectionState::CONNECTING == f.orch->getDeviceConnectionState(f.phone) );

    // in flight attempt absorbs further requests
    f.orch->connectToActiveUserDevice();
    REQUIRE( 1 == f.peripheral->connectCount );

    f.orch->stop();
    REQUIRE( ManagerState::STOPPED == f.orch->getState() );
    REQUIRE( false == f.orch->isConnecting() );
    REQUIRE( DeviceConnectionState::DISCONNECTED == f.orch->getDeviceConnectionState(f.phone) );

    // stopped: requests are ignored, links refused
    f.orch->connectToActiveUserDevice();
    REQUIRE( 1 == f.peripheral->connectCount );
    f.peripheral->peerConnects(7, true);
    REQUIRE( 1 == f.peripheral->disconnected.size() );
    REQUIRE( 7 == f.peripheral->disconnected[0] );

    // failed attempt doesn't keep the flag
    f.peripheral->connectResult = false;
    f.orch->start();
    REQUIRE( 2 == f.peripheral->connectCount );
    REQUIRE( false == f.orch->isConnecting() );
}

TEST_CASE( "Orchestrator Request Before Start Test 16", "[Orchestrator][lifecycle]" ) {
    OrchestratorFixture f;
    f.associate();

    // requested before start, served by start in one attempt
    f.orch->connectToActiveUserDevice();
    f.orch->connectToActiveUserDevice();
    REQUIRE( 0 == f.peripheral->connectCount );
    REQUIRE( false == f.orch->isConnecting() );

    f.orch->start();
    REQUIRE( 1 == f.peripheral->connectCount );
    REQUIRE( f.phone == f.peripheral->lastConnectId );
    REQUIRE( true == f.orch->isConnecting() );
}

TEST_CASE( "Orchestrator Reconnection Test 02", "[Orchestrator][reconnect]" ) {
    OrchestratorFixture f;
    f.associate();
    f.orch->start();
    REQUIRE( 1 == f.peripheral->connectCount );

    f.peripheral->peerConnects(1, true);
    f.sendDeviceId(*f.peripheral, 1, f.phone);
    REQUIRE( DeviceConnectionState::HANDSHAKE_IN_PROGRESS == f.orch->getDeviceConnectionState(f.phone) );
    REQUIRE( 1 == f.activeUserCallback->events.size() );
    REQUIRE( '+' == f.activeUserCallback->events[0].first );
    REQUIRE( "phone" == f.activeUserCallback->events[0].second.getDeviceName() );
    REQUIRE( false == f.activeUserCallback->events[0].second.hasSecureChannel() );
    REQUIRE( 1 == f.allCallback->events.size() );

    const ConnectedDevice device = f.connectedPhone();
    std::shared_ptr<RecordingDeviceCallback> cb = std::make_shared<RecordingDeviceCallback>();
    const RecipientId recipient = make_id(0x30);
    REQUIRE( true == f.orch->registerDeviceCallback(device, recipient, cb, f.direct) );

    f.peripheral->peerSendsHandshake(1, bytes_of("resume"));
    // awaiting the phone's proof of the stored key
    REQUIRE( DeviceConnectionState::HANDSHAKE_IN_PROGRESS == f.orch->getDeviceConnectionState(f.phone) );
    REQUIRE( 0 == cb->established.size() );
    f.peripheral->peerSendsHandshake(1, make_key(0x11).toBytes());
    REQUIRE( DeviceConnectionState::ESTABLISHED == f.orch->getDeviceConnectionState(f.phone) );
    REQUIRE( 1 == cb->established.size() );
    REQUIRE( true == cb->established[0].hasSecureChannel() );
    REQUIRE( true == f.connectedPhone().hasSecureChannel() );
    REQUIRE( FakeHandshake::resumedKey() == f.store->getEncryptionKey(f.phone) );

    // outbound
    ChannelCipher peer(FakeHandshake::resumedKey(), CipherRole::CLIENT);
    const size_t sentBefore = f.peripheral->sent.size();
    REQUIRE( DeviceError::SUCCESS == f.orch->sendMessageSecurely(device, recipient, bytes_of("to phone")) );
    REQUIRE( sentBefore + 1 == f.peripheral->sent.size() );
    jau::POctets plain(jau::lb_endian_t::little);
    REQUIRE( DeviceError::SUCCESS == peer.decrypt(f.peripheral->sent.back().frame.getPayload(), plain) );
    REQUIRE( "to phone" == string_of(plain) );
    REQUIRE( DeviceError::SUCCESS == f.orch->sendMessageUnsecurely(device, recipient, bytes_of("plain")) );
    REQUIRE( "plain" == string_of(f.peripheral->sent.back().frame.getPayload()) );

    // inbound
    jau::POctets sealed(jau::lb_endian_t::little);
    REQUIRE( DeviceError::SUCCESS == peer.encrypt(bytes_of("to car"), sealed) );
    f.peripheral->peerSends(1, DeviceMessage(recipient, true, sealed), OperationType::CLIENT_MESSAGE);
    REQUIRE( 1 == cb->messages.size() );
    REQUIRE( "to car" == cb->messages[0] );

    // garbled
    f.peripheral->peerSends(1, DeviceMessage(recipient, true, bytes_of("garbled frame content")), OperationType::CLIENT_MESSAGE);
    REQUIRE( 1 == cb->errors.size() );
    REQUIRE( DeviceError::INVALID_MSG == cb->errors[0] );

    // disconnect re-arms the connection attempt
    f.peripheral->peerDisconnects(1);
    REQUIRE( 0 == f.orch->getActiveUserConnectedDevices().size() );
    REQUIRE( 2 == f.activeUserCallback->events.size() );
    REQUIRE( '-' == f.activeUserCallback->events[1].first );
    REQUIRE( 2 == f.peripheral->connectCount );
    REQUIRE( DeviceError::INVALID_CHANNEL_STATE == f.orch->sendMessageSecurely(device, recipient, bytes_of("late")) );
    REQUIRE( DeviceError::UNEXPECTED_DISCONNECTION == f.orch->sendMessageUnsecurely(device, recipient, bytes_of("late")) );
}

TEST_CASE( "Orchestrator Secure Send Guard Test 03", "[Orchestrator][message]" ) {
    OrchestratorFixture f;
    f.associate();
    f.orch->start();
    f.peripheral->peerConnects(1, true);
    f.sendDeviceId(*f.peripheral, 1, f.phone);

    const ConnectedDevice device = f.connectedPhone();
    const size_t sentBefore = f.peripheral->sent.size();
    REQUIRE( DeviceError::INVALID_CHANNEL_STATE == f.orch->sendMessageSecurely(device, make_id(0x30), bytes_of("early")) );
    REQUIRE( sentBefore == f.peripheral->sent.size() );

    // unknown device
    const ConnectedDevice stranger(make_id(9), "", false, false);
    REQUIRE( DeviceError::INVALID_CHANNEL_STATE == f.orch->sendMessageSecurely(stranger, make_id(0x30), bytes_of("x")) );
    REQUIRE( DeviceError::UNEXPECTED_DISCONNECTION == f.orch->sendMessageUnsecurely(stranger, make_id(0x30), bytes_of("x")) );
}

TEST_CASE( "Orchestrator Reconnection Failure Test 04", "[Orchestrator][reconnect][error]" ) {
    OrchestratorFixture f;
    f.associate();
    f.orch->start();

    f.peripheral->peerConnects(1, true);
    f.sendDeviceId(*f.peripheral, 1, f.phone);
    std::shared_ptr<RecordingDeviceCallback> cb = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == f.orch->registerDeviceCallback(f.connectedPhone(), make_id(0x30), cb, f.direct) );

    f.peripheral->peerSendsHandshake(1, bytes_of("bad"));
    REQUIRE( 1 == cb->errors.size() );
    REQUIRE( DeviceError::INVALID_SECURITY_KEY == cb->errors[0] );
    // the failed link is dropped
    REQUIRE( 1 == f.peripheral->disconnected.size() );
    REQUIRE( 0 == f.orch->getActiveUserConnectedDevices().size() );
    REQUIRE( '-' == f.activeUserCallback->events.back().first );
    REQUIRE( 2 == f.peripheral->connectCount );

    // unknown device id on a reconnection link
    f.peripheral->peerConnects(2, true);
    f.sendDeviceId(*f.peripheral, 2, make_id(9));
    REQUIRE( 2 == f.peripheral->disconnected.size() );
    REQUIRE( 2 == f.peripheral->disconnected[1] );
    REQUIRE( 2 == f.activeUserCallback->events.size() );

    // phone proves a key other than the stored one
    f.peripheral->peerConnects(3, true);
    f.sendDeviceId(*f.peripheral, 3, f.phone);
    f.peripheral->peerSendsHandshake(3, bytes_of("resume"));
    f.peripheral->peerSendsHandshake(3, make_key(0x33).toBytes());
    REQUIRE( 3 == f.peripheral->disconnected.size() );
    REQUIRE( 3 == f.peripheral->disconnected[2] );
    REQUIRE( 0 == f.orch->getActiveUserConnectedDevices().size() );
    REQUIRE( make_key(0x11) == f.store->getEncryptionKey(f.phone) );
}

TEST_CASE( "Orchestrator Association Test 05", "[Orchestrator][association]" ) {
    OrchestratorFixture f;
    f.orch->start();
    std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();

    f.orch->startAssociation(acb);
    REQUIRE( true == f.orch->isAssociating() );
    REQUIRE( true == f.peripheral->advertising );
    REQUIRE( 1 == acb->startNames.size() );
    REQUIRE( 8 == acb->startNames[0].size() );
    for(const char c : acb->startNames[0]) {
        REQUIRE( '0' <= c );
        REQUIRE( '9' >= c );
    }
    REQUIRE( f.peripheral->advertisedName == acb->startNames[0] );

    f.peripheral->peerConnects(1, false);
    f.sendDeviceId(*f.peripheral, 1, f.phone);
    REQUIRE( false == f.peripheral->advertising );
    // not yet the active user's device
    REQUIRE( 0 == f.activeUserCallback->events.size() );
    REQUIRE( 1 == f.allCallback->events.size() );
    REQUIRE( false == f.allCallback->events[0].second.isAssociatedWithActiveUser() );
    REQUIRE( 0 == f.orch->getActiveUserConnectedDevices().size() );

    f.peripheral->peerSendsHandshake(1, bytes_of("verify"));
    REQUIRE( 1 == acb->codes.size() );
    REQUIRE( "123456" == acb->codes[0] );

    f.orch->notifyOutOfBandAccepted();
    REQUIRE( "True" == string_of(f.peripheral->sent.back().frame.getPayload()) );
    REQUIRE( 1 == acb->completed.size() );
    REQUIRE( f.phone == acb->completed[0] );
    REQUIRE( 0 == acb->errors.size() );
    REQUIRE( false == f.orch->isAssociating() );

    // persisted with the session key
    REQUIRE( 1 == f.store->devices.size() );
    REQUIRE( f.phone == f.store->devices[0].deviceId );
    REQUIRE( "phone1" == f.store->devices[0].name );
    REQUIRE( "00:11:22:33:44:11" == f.store->devices[0].address );
    REQUIRE( true == f.store->devices[0].connectionEnabled );
    REQUIRE( FakeHandshake::associationKey() == f.store->getEncryptionKey(f.phone) );
    REQUIRE( 1 == f.storeCallback->added.size() );

    // replaced by the active user's device
    REQUIRE( 3 == f.allCallback->events.size() );
    REQUIRE( '-' == f.allCallback->events[1].first );
    REQUIRE( '+' == f.allCallback->events[2].first );
    REQUIRE( 1 == f.activeUserCallback->events.size() );
    REQUIRE( '+' == f.activeUserCallback->events[0].first );
    REQUIRE( "phone1" == f.activeUserCallback->events[0].second.getDeviceName() );

    const ConnectedDevice device = f.connectedPhone();
    REQUIRE( true == device.isAssociatedWithActiveUser() );
    REQUIRE( true == device.hasSecureChannel() );
    REQUIRE( DeviceConnectionState::ESTABLISHED == f.orch->getDeviceConnectionState(f.phone) );

    // late confirmation
    f.orch->notifyOutOfBandAccepted();
    REQUIRE( 0 == acb->errors.size() );
}

TEST_CASE( "Orchestrator Association Failures Test 06", "[Orchestrator][association][error]" ) {
    {
        // garbled device id
        OrchestratorFixture f;
        f.orch->start();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        f.orch->startAssociation(acb);
        f.peripheral->peerConnects(1, false);
        f.peripheral->peerSendsHandshake(1, bytes_of("garbage"));
        REQUIRE( 1 == acb->errors.size() );
        REQUIRE( DeviceError::INVALID_DEVICE_ID == acb->errors[0] );
        REQUIRE( 1 == f.peripheral->disconnected.size() );
        REQUIRE( 0 == acb->completed.size() );
    }
    {
        // peer leaves during the handshake
        OrchestratorFixture f;
        f.orch->start();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        f.orch->startAssociation(acb);
        f.peripheral->peerConnects(1, false);
        f.sendDeviceId(*f.peripheral, 1, f.phone);
        f.peripheral->peerDisconnects(1);
        REQUIRE( 1 == acb->errors.size() );
        REQUIRE( DeviceError::UNEXPECTED_DISCONNECTION == acb->errors[0] );
        REQUIRE( 2 == f.allCallback->events.size() );
        REQUIRE( '-' == f.allCallback->events[1].first );
    }
    {
        // confirmation without a pending channel
        OrchestratorFixture f;
        f.orch->start();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        f.orch->startAssociation(acb);
        f.orch->notifyOutOfBandAccepted();
        REQUIRE( 1 == acb->errors.size() );
        REQUIRE( DeviceError::INVALID_CHANNEL_STATE == acb->errors[0] );
    }
    {
        // confirmation before a verification code
        OrchestratorFixture f;
        f.orch->start();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        f.orch->startAssociation(acb);
        f.peripheral->peerConnects(1, false);
        f.sendDeviceId(*f.peripheral, 1, f.phone);
        f.orch->notifyOutOfBandAccepted();
        REQUIRE( 1 == acb->errors.size() );
        REQUIRE( DeviceError::INVALID_CHANNEL_STATE == acb->errors[0] );
        REQUIRE( true == f.orch->isAssociating() );
    }
    {
        // store refuses the new device
        OrchestratorFixture f;
        f.orch->start();
        f.store->failAdd = true;
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        f.orch->startAssociation(acb);
        f.peripheral->peerConnects(1, false);
        f.sendDeviceId(*f.peripheral, 1, f.phone);
        f.peripheral->peerSendsHandshake(1, bytes_of("verify"));
        f.orch->notifyOutOfBandAccepted();
        REQUIRE( 1 == acb->errors.size() );
        REQUIRE( DeviceError::STORAGE_FAILURE == acb->errors[0] );
        REQUIRE( 0 == acb->completed.size() );
        REQUIRE( 1 == f.peripheral->disconnected.size() );
    }
    {
        // advertising refused
        OrchestratorFixture f;
        f.orch->start();
        f.peripheral->advertiseResult = false;
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        f.orch->startAssociation(acb);
        REQUIRE( 1 == acb->startFailures );
        REQUIRE( false == f.orch->isAssociating() );
    }
    {
        // association links are refused without pending association
        OrchestratorFixture f;
        f.orch->start();
        f.peripheral->peerConnects(4, false);
        REQUIRE( 1 == f.peripheral->disconnected.size() );
        REQUIRE( 4 == f.peripheral->disconnected[0] );
    }
}

TEST_CASE( "Orchestrator Stop Association Test 07", "[Orchestrator][association]" ) {
    OrchestratorFixture f;
    f.orch->start();
    std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
    std::shared_ptr<RecordingAssociationCallback> other = std::make_shared<RecordingAssociationCallback>();

    f.orch->startAssociation(acb);
    f.orch->stopAssociation(other);
    REQUIRE( true == f.orch->isAssociating() );
    REQUIRE( true == f.peripheral->advertising );

    f.peripheral->peerConnects(1, false);
    f.orch->stopAssociation(acb);
    REQUIRE( false == f.orch->isAssociating() );
    REQUIRE( false == f.peripheral->advertising );
    REQUIRE( 1 == f.peripheral->disconnected.size() );
    REQUIRE( 0 == acb->errors.size() );

    // restart replaces the callback
    f.orch->startAssociation(acb);
    f.orch->startAssociation(other);
    REQUIRE( 3 == f.peripheral->advertiseCount );
    REQUIRE( 1 == other->startNames.size() );
    f.peripheral->peerConnects(2, false);
    f.sendDeviceId(*f.peripheral, 2, f.phone);
    f.peripheral->peerSendsHandshake(2, bytes_of("verify"));
    REQUIRE( 0 == acb->codes.size() );
    REQUIRE( 1 == other->codes.size() );
}

TEST_CASE( "Orchestrator Out-Of-Band Association Test 08", "[Orchestrator][association][oob]" ) {
    {
        OrchestratorFixture f;
        f.orch->start();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        std::shared_ptr<FakeOobChannel> oobChannel = std::make_shared<FakeOobChannel>();

        f.orch->startOutOfBandAssociation(acb, oobChannel, "00:11:22:33:44:55");
        REQUIRE( "00:11:22:33:44:55" == oobChannel->address );
        REQUIRE( OobConnectionManager::OOB_DATA_SIZE == oobChannel->data.size() );
        REQUIRE( 1 == acb->startNames.size() );

        OobConnectionManager phoneOob;
        REQUIRE( true == phoneOob.setOobData(oobChannel->data) );

        f.peripheral->peerConnects(1, false);
        f.sendDeviceId(*f.peripheral, 1, f.phone);
        f.peripheral->peerSendsHandshake(1, bytes_of("verify"));
        // exchanged encrypted, never shown
        REQUIRE( 0 == acb->codes.size() );

        jau::POctets code(jau::lb_endian_t::little);
        REQUIRE( DeviceError::SUCCESS == phoneOob.decryptVerificationCode(f.peripheral->sent.back().frame.getPayload(), code) );
        REQUIRE( "123456" == string_of(code) );
        jau::POctets sealed(jau::lb_endian_t::little);
        REQUIRE( DeviceError::SUCCESS == phoneOob.encryptVerificationCode(code, sealed) );
        f.peripheral->peerSends(1, DeviceMessage(RecipientId(), false, sealed), OperationType::ENCRYPTION_HANDSHAKE);

        REQUIRE( 1 == acb->completed.size() );
        REQUIRE( 0 == acb->errors.size() );
        REQUIRE( true == f.connectedPhone().hasSecureChannel() );
    }
    {
        // side channel fails
        OrchestratorFixture f;
        f.orch->start();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        std::shared_ptr<FakeOobChannel> oobChannel = std::make_shared<FakeOobChannel>();
        oobChannel->result = false;

        f.orch->startOutOfBandAssociation(acb, oobChannel, "00:11:22:33:44:55");
        REQUIRE( 1 == acb->startFailures );
        REQUIRE( 0 == acb->startNames.size() );
        REQUIRE( false == f.orch->isAssociating() );
        REQUIRE( 0 == f.peripheral->advertiseCount );
    }
    {
        // stop interrupts the side channel
        OrchestratorFixture f;
        f.orch->start();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        std::shared_ptr<FakeOobChannel> oobChannel = std::make_shared<FakeOobChannel>();
        f.orch->startOutOfBandAssociation(acb, oobChannel, "00:11:22:33:44:55");
        f.orch->stopAssociation(acb);
        REQUIRE( true == oobChannel->interrupted );
        REQUIRE( false == f.orch->isAssociating() );
    }
}

TEST_CASE( "Orchestrator Duplicate Recipient Test 09", "[Orchestrator][blacklist]" ) {
    OrchestratorFixture f;
    f.associate();
    f.orch->start();
    f.reconnect();
    const ConnectedDevice device = f.connectedPhone();
    const RecipientId recipient = make_id(0x30);

    std::shared_ptr<RecordingDeviceCallback> first = std::make_shared<RecordingDeviceCallback>();
    std::shared_ptr<RecordingDeviceCallback> second = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == f.orch->registerDeviceCallback(device, recipient, first, f.direct) );
    REQUIRE( false == f.orch->registerDeviceCallback(device, recipient, second, f.direct) );
    REQUIRE( DeviceError::INSECURE_RECIPIENT_ID_DETECTED == first->errors.at(0) );
    REQUIRE( DeviceError::INSECURE_RECIPIENT_ID_DETECTED == second->errors.at(0) );
    REQUIRE( true == f.orch->getRecipientBlacklist()->contains(recipient) );

    // restart clears the blacklist
    f.orch->start();
    REQUIRE( false == f.orch->getRecipientBlacklist()->contains(recipient) );
}

TEST_CASE( "Orchestrator Missed Message Test 10", "[Orchestrator][message]" ) {
    OrchestratorFixture f;
    f.associate();
    f.orch->start();
    f.reconnect();
    const ConnectedDevice device = f.connectedPhone();
    const RecipientId recipient = make_id(0x30);

    f.peripheral->peerSends(1, DeviceMessage(recipient, false, bytes_of("early bird")), OperationType::CLIENT_MESSAGE);

    std::shared_ptr<RecordingDeviceCallback> cb = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == f.orch->registerDeviceCallback(device, recipient, cb, f.direct) );
    REQUIRE( 1 == cb->messages.size() );
    REQUIRE( "early bird" == cb->messages[0] );
}

TEST_CASE( "Orchestrator Associated Devices Test 11", "[Orchestrator][store]" ) {
    OrchestratorFixture f;
    f.associate();
    f.orch->start();
    f.reconnect();
    REQUIRE( 1 == f.orch->getActiveUserConnectedDevices().size() );
    REQUIRE( 1 == f.peripheral->connectCount );

    REQUIRE( true == f.orch->disableAssociatedDeviceConnection(f.phone) );
    REQUIRE( false == f.store->devices[0].connectionEnabled );
    REQUIRE( 1 == f.storeCallback->updated.size() );
    REQUIRE( 0 == f.orch->getActiveUserConnectedDevices().size() );
    // disabled device isn't reconnected
    REQUIRE( 1 == f.peripheral->connectCount );

    REQUIRE( true == f.orch->enableAssociatedDeviceConnection(f.phone) );
    REQUIRE( 2 == f.peripheral->connectCount );
    REQUIRE( 2 == f.storeCallback->updated.size() );

    REQUIRE( false == f.orch->enableAssociatedDeviceConnection(make_id(9)) );

    REQUIRE( true == f.orch->removeActiveUserAssociatedDevice(f.phone) );
    REQUIRE( 0 == f.store->devices.size() );
    REQUIRE( 1 == f.storeCallback->removed.size() );
    REQUIRE( false == f.orch->removeActiveUserAssociatedDevice(f.phone) );

    REQUIRE( true == f.orch->unregisterDeviceAssociationCallback(f.storeCallback) );
    REQUIRE( false == f.orch->unregisterDeviceAssociationCallback(f.storeCallback) );
}

TEST_CASE( "Orchestrator Central Transport Test 12", "[Orchestrator][central]" ) {
    OrchestratorFixture f;
    f.associate();
    f.orch->start();
    REQUIRE( 1 == f.peripheral->connectCount );

    // the same device on the central transport
    f.central->peerConnects(1, true);
    f.sendDeviceId(*f.central, 1, f.phone);
    f.resume(*f.central, 1);
    REQUIRE( true == f.connectedPhone().hasSecureChannel() );

    // second link of a connected device is dropped
    f.peripheral->peerConnects(1, true);
    f.sendDeviceId(*f.peripheral, 1, f.phone);
    REQUIRE( 1 == f.peripheral->disconnected.size() );
    REQUIRE( true == f.connectedPhone().hasSecureChannel() );

    // central disconnects don't re-arm the peripheral
    const int before = f.peripheral->connectCount;
    f.central->peerDisconnects(1);
    REQUIRE( 0 == f.orch->getActiveUserConnectedDevices().size() );
    REQUIRE( before == f.peripheral->connectCount );

    REQUIRE( true == f.orch->unregisterConnectionCallback(f.allCallback) );
    REQUIRE( false == f.orch->unregisterConnectionCallback(f.allCallback) );
}

TEST_CASE( "Orchestrator Construction Test 13", "[Orchestrator]" ) {
    std::shared_ptr<FakeStore> store = std::make_shared<FakeStore>();
    jau::darray<TransportAdapterRef> none;
    jau::darray<TransportAdapterRef> one;
    one.push_back( std::make_shared<FakeTransport>(TransportRole::PERIPHERAL) );
    HandshakePrimitiveFactory factory = []() -> std::unique_ptr<HandshakePrimitive> {
        return std::make_unique<FakeHandshake>();
    };
    ExecutorRef direct = std::make_shared<DirectExecutor>();

    REQUIRE_THROWS_AS( DeviceConnectionOrchestrator(nullptr, one, factory, direct, direct), jau::IllegalArgumentException );
    REQUIRE_THROWS_AS( DeviceConnectionOrchestrator(store, none, factory, direct, direct), jau::IllegalArgumentException );
    REQUIRE_THROWS_AS( DeviceConnectionOrchestrator(store, one, HandshakePrimitiveFactory(), direct, direct), jau::IllegalArgumentException );

    // own executors
    DeviceConnectionOrchestrator orch(store, one, factory);
    orch.start();
    REQUIRE( ManagerState::RUNNING == orch.getState() );
    orch.stop();
    REQUIRE( ManagerState::STOPPED == orch.getState() );
}

TEST_CASE( "Orchestrator Non Active User Disconnect Test 14", "[Orchestrator][reconnect]" ) {
    OrchestratorFixture f;
    f.associate();
    f.orch->start();
    f.reconnect();
    REQUIRE( true == f.connectedPhone().hasSecureChannel() );

    // a second phone, not associated with the active user, on the peripheral transport
    const DeviceId stranger = make_id(5);
    std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
    f.orch->startAssociation(acb);
    f.peripheral->peerConnects(2, false);
    f.sendDeviceId(*f.peripheral, 2, stranger);
    REQUIRE( DeviceConnectionState::HANDSHAKE_IN_PROGRESS == f.orch->getDeviceConnectionState(stranger) );
    REQUIRE( 2 == f.allCallback->events.size() );

    const int connects = f.peripheral->connectCount;
    const int advertises = f.peripheral->advertiseCount;
    f.peripheral->peerDisconnects(2);
    REQUIRE( DeviceConnectionState::DISCONNECTED == f.orch->getDeviceConnectionState(stranger) );
    REQUIRE( '-' == f.allCallback->events.back().first );
    // no reconnection attempt while the active user's phone stays connected
    REQUIRE( connects == f.peripheral->connectCount );
    REQUIRE( advertises == f.peripheral->advertiseCount );
    REQUIRE( false == f.orch->isConnecting() );
    REQUIRE( true == f.connectedPhone().hasSecureChannel() );

    // the active user's phone triggers exactly one
    f.peripheral->peerDisconnects(1);
    REQUIRE( connects + 1 == f.peripheral->connectCount );
}

/**
 * Queues tasks until run() is called.
 */
class ManualExecutor : public Executor {
    public:
        std::vector<Task> tasks;

        bool execute(Task task) noexcept override {
            tasks.push_back(std::move(task));
            return true;
        }
        void run() {
            while( !tasks.empty() ) {
                Task t = tasks.front();
                tasks.erase(tasks.begin());
                t();
            }
        }
        std::string toString() const noexcept override { return "ManualExecutor"; }
};

TEST_CASE( "Orchestrator Superseded Out-Of-Band Association Test 15", "[Orchestrator][association][oob]" ) {
    {
        std::shared_ptr<ManualExecutor> worker = std::make_shared<ManualExecutor>();
        OrchestratorFixture f(worker);
        f.orch->start();
        worker->run();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        std::shared_ptr<FakeOobChannel> oobChannel = std::make_shared<FakeOobChannel>();

        f.orch->startOutOfBandAssociation(acb, oobChannel, "00:11:22:33:44:55");
        REQUIRE( 1 == worker->tasks.size() );

        // plain association replaces the pending exchange
        f.orch->startAssociation(acb);
        REQUIRE( true == oobChannel->interrupted );
        REQUIRE( 1 == acb->startNames.size() );
        REQUIRE( 1 == f.peripheral->advertiseCount );

        // exchange returns late, ignored
        worker->run();
        REQUIRE( 1 == acb->startNames.size() );
        REQUIRE( 0 == acb->startFailures );
        REQUIRE( 1 == f.peripheral->advertiseCount );
        REQUIRE( true == f.orch->isAssociating() );

        // verification stays plain, the code is shown to the user
        f.peripheral->peerConnects(1, false);
        f.sendDeviceId(*f.peripheral, 1, f.phone);
        f.peripheral->peerSendsHandshake(1, bytes_of("verify"));
        REQUIRE( 1 == acb->codes.size() );
        f.orch->notifyOutOfBandAccepted();
        REQUIRE( 1 == acb->completed.size() );
        REQUIRE( 0 == acb->errors.size() );
    }
    {
        // late failure of the superseded exchange isn't reported
        std::shared_ptr<ManualExecutor> worker = std::make_shared<ManualExecutor>();
        OrchestratorFixture f(worker);
        f.orch->start();
        worker->run();
        std::shared_ptr<RecordingAssociationCallback> acb = std::make_shared<RecordingAssociationCallback>();
        std::shared_ptr<FakeOobChannel> first = std::make_shared<FakeOobChannel>();
        std::shared_ptr<FakeOobChannel> second = std::make_shared<FakeOobChannel>();
        first->result = false;

        f.orch->startOutOfBandAssociation(acb, first, "00:11:22:33:44:55");
        f.orch->startOutOfBandAssociation(acb, second, "00:11:22:33:44:66");
        REQUIRE( true == first->interrupted );
        REQUIRE( false == second->interrupted );

        worker->run();
        REQUIRE( 0 == acb->startFailures );
        REQUIRE( 1 == acb->startNames.size() );
        REQUIRE( "00:11:22:33:44:66" == second->address );
        REQUIRE( true == f.orch->isAssociating() );
    }
}
