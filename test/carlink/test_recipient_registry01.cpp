#include <iostream>
#include <cinttypes>
#include <cstring>
#include <thread>
#include <atomic>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <carlink/RecipientRegistry.hpp>
#include <carlink/Executor.hpp>

#include "carlink_test_utils.hpp"

using namespace carlink;
using namespace carlink_test;

class VetoDelegate : public MessageDeliveryDelegate {
    public:
        bool deliver = false;
        int asked = 0;

        bool shouldDeliverMessageForDevice(const ConnectedDevice& device) override {
            (void)device;
            ++asked;
            return deliver;
        }
};

static DeviceMessage message_to(const RecipientId& recipient, const std::string& s) {
    return DeviceMessage(recipient, false, bytes_of(s));
}

TEST_CASE( "RecipientRegistry Dispatch Test 01", "[RecipientRegistry][dispatch]" ) {
    RecipientRegistry registry(std::make_shared<RecipientBlacklist>());
    ExecutorRef direct = std::make_shared<DirectExecutor>();
    const ConnectedDevice phone1(make_id(1), "phone1", true, true);
    const ConnectedDevice phone2(make_id(2), "phone2", true, true);
    const RecipientId rA = make_id(0x30);
    const RecipientId rB = make_id(0x40);

    std::shared_ptr<RecordingDeviceCallback> cbA = std::make_shared<RecordingDeviceCallback>();
    std::shared_ptr<RecordingDeviceCallback> cbB = std::make_shared<RecordingDeviceCallback>();

    REQUIRE( true == registry.registerCallback(phone1, rA, cbA, direct) );
    REQUIRE( true == registry.registerCallback(phone1, rB, cbB, direct) );
    // same recipient on another device is fine
    REQUIRE( true == registry.registerCallback(phone2, rA, cbB, direct) );
    REQUIRE( 2 == registry.getRegistrationCount(phone1.getDeviceId()) );
    REQUIRE( 1 == registry.getRegistrationCount(phone2.getDeviceId()) );

    REQUIRE( true == registry.dispatch(phone1, message_to(rA, "a1")) );
    REQUIRE( true == registry.dispatch(phone1, message_to(rB, "b1")) );
    REQUIRE( true == registry.dispatch(phone2, message_to(rA, "a2")) );
    REQUIRE( 1 == cbA->messages.size() );
    REQUIRE( "a1" == cbA->messages[0] );
    REQUIRE( 2 == cbB->messages.size() );
    REQUIRE( "b1" == cbB->messages[0] );
    REQUIRE( "a2" == cbB->messages[1] );

    REQUIRE( true == registry.unregisterCallback(phone1, rA, cbA) );
    REQUIRE( false == registry.unregisterCallback(phone1, rA, cbA) );
    REQUIRE( 1 == registry.getRegistrationCount(phone1.getDeviceId()) );

    registry.notifyDeviceCallbacks(phone1.getDeviceId(), [&phone1](DeviceCallback& cb) {
        cb.onSecureChannelEstablished(phone1);
    });
    REQUIRE( 0 == cbA->established.size() );
    REQUIRE( 1 == cbB->established.size() );
    REQUIRE( phone1 == cbB->established[0] );

    REQUIRE_THROWS_AS( RecipientRegistry(nullptr), jau::IllegalArgumentException );
}

TEST_CASE( "RecipientRegistry Missed Message Test 02", "[RecipientRegistry][missed]" ) {
    RecipientRegistry registry(std::make_shared<RecipientBlacklist>());
    ExecutorRef direct = std::make_shared<DirectExecutor>();
    const ConnectedDevice phone1(make_id(1), "phone1", true, true);
    const ConnectedDevice phone2(make_id(2), "phone2", true, true);
    const RecipientId rA = make_id(0x30);

    REQUIRE( false == registry.dispatch(phone1, message_to(rA, "first")) );
    // only the first is kept
    REQUIRE( false == registry.dispatch(phone1, message_to(rA, "second")) );
    REQUIRE( true == registry.hasMissedMessage(rA, phone1.getDeviceId()) );
    REQUIRE( false == registry.hasMissedMessage(rA, phone2.getDeviceId()) );

    std::shared_ptr<RecordingDeviceCallback> cb2 = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == registry.registerCallback(phone2, rA, cb2, direct) );
    REQUIRE( 0 == cb2->messages.size() );

    std::shared_ptr<RecordingDeviceCallback> cb1 = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == registry.registerCallback(phone1, rA, cb1, direct) );
    REQUIRE( 1 == cb1->messages.size() );
    REQUIRE( "first" == cb1->messages[0] );
    REQUIRE( false == registry.hasMissedMessage(rA, phone1.getDeviceId()) );

    // consumed
    REQUIRE( true == registry.unregisterCallback(phone1, rA, cb1) );
    std::shared_ptr<RecordingDeviceCallback> cb3 = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == registry.registerCallback(phone1, rA, cb3, direct) );
    REQUIRE( 0 == cb3->messages.size() );

    REQUIRE( false == registry.dispatch(phone2, message_to(make_id(0x50), "kept")) );
    registry.clear();
    REQUIRE( false == registry.hasMissedMessage(make_id(0x50), phone2.getDeviceId()) );
    REQUIRE( 0 == registry.getRegistrationCount(phone1.getDeviceId()) );
}

TEST_CASE( "RecipientRegistry Duplicate Recipient Test 03", "[RecipientRegistry][blacklist]" ) {
    RecipientBlacklistRef blacklist = std::make_shared<RecipientBlacklist>();
    RecipientRegistry registry(blacklist);
    ExecutorRef direct = std::make_shared<DirectExecutor>();
    const ConnectedDevice phone1(make_id(1), "phone1", true, true);
    const ConnectedDevice phone2(make_id(2), "phone2", true, true);
    const RecipientId rA = make_id(0x30);

    std::shared_ptr<RecordingDeviceCallback> first = std::make_shared<RecordingDeviceCallback>();
    std::shared_ptr<RecordingDeviceCallback> second = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == registry.registerCallback(phone1, rA, first, direct) );
    REQUIRE( false == registry.registerCallback(phone1, rA, second, direct) );

    REQUIRE( true == blacklist->contains(rA) );
    REQUIRE( 1 == first->errors.size() );
    REQUIRE( DeviceError::INSECURE_RECIPIENT_ID_DETECTED == first->errors[0] );
    REQUIRE( 1 == second->errors.size() );
    REQUIRE( DeviceError::INSECURE_RECIPIENT_ID_DETECTED == second->errors[0] );
    REQUIRE( 0 == registry.getRegistrationCount(phone1.getDeviceId()) );
    REQUIRE( 0 == registry.getDeviceCount() );

    // no one receives messages of the blacklisted recipient
    REQUIRE( false == registry.dispatch(phone1, message_to(rA, "leak")) );
    REQUIRE( 0 == first->messages.size() );
    REQUIRE( 0 == second->messages.size() );

    // blacklisted for every device
    std::shared_ptr<RecordingDeviceCallback> third = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( false == registry.registerCallback(phone2, rA, third, direct) );
    REQUIRE( 1 == third->errors.size() );
    REQUIRE( DeviceError::INSECURE_RECIPIENT_ID_DETECTED == third->errors[0] );
    REQUIRE( 0 == registry.getDeviceCount() );

    // other recipients of the device are kept
    const RecipientId rB = make_id(0x40);
    std::shared_ptr<RecordingDeviceCallback> fourth = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == registry.registerCallback(phone1, rB, fourth, direct) );
    REQUIRE( false == registry.registerCallback(phone1, rA, fourth, direct) );
    REQUIRE( 1 == registry.getRegistrationCount(phone1.getDeviceId()) );
    REQUIRE( 1 == registry.getDeviceCount() );
    REQUIRE( true == registry.unregisterCallback(phone1, rB, fourth) );

    // kept by clear()
    registry.clear();
    REQUIRE( 1 == blacklist->size() );
    blacklist->clear();
    REQUIRE( true == registry.registerCallback(phone2, rA, third, direct) );
}

TEST_CASE( "RecipientRegistry Delivery Delegate Test 04", "[RecipientRegistry][delegate]" ) {
    RecipientRegistry registry(std::make_shared<RecipientBlacklist>());
    ExecutorRef direct = std::make_shared<DirectExecutor>();
    const ConnectedDevice phone1(make_id(1), "phone1", true, true);
    const RecipientId rA = make_id(0x30);
    std::shared_ptr<VetoDelegate> delegate = std::make_shared<VetoDelegate>();
    registry.setMessageDeliveryDelegate(delegate);

    std::shared_ptr<RecordingDeviceCallback> cb = std::make_shared<RecordingDeviceCallback>();
    REQUIRE( true == registry.registerCallback(phone1, rA, cb, direct) );

    REQUIRE( false == registry.dispatch(phone1, message_to(rA, "vetoed")) );
    REQUIRE( 1 == delegate->asked );
    REQUIRE( 0 == cb->messages.size() );

    // vetoed messages are not kept
    REQUIRE( false == registry.dispatch(phone1, message_to(make_id(0x40), "vetoed")) );
    REQUIRE( false == registry.hasMissedMessage(make_id(0x40), phone1.getDeviceId()) );

    delegate->deliver = true;
    REQUIRE( true == registry.dispatch(phone1, message_to(rA, "delivered")) );
    REQUIRE( 1 == cb->messages.size() );

    registry.setMessageDeliveryDelegate(nullptr);
    delegate->deliver = false;
    REQUIRE( true == registry.dispatch(phone1, message_to(rA, "again")) );
    REQUIRE( 2 == cb->messages.size() );
}

TEST_CASE( "RecipientRegistry Concurrent Registration Test 05", "[RecipientRegistry][blacklist]" ) {
    for(int loop=0; loop<20; ++loop) {
        RecipientBlacklistRef blacklist = std::make_shared<RecipientBlacklist>();
        RecipientRegistry registry(blacklist);
        ExecutorRef direct = std::make_shared<DirectExecutor>();
        const ConnectedDevice phone1(make_id(1), "phone1", true, true);
        const RecipientId rA = make_id(0x30);
        const int thread_count = 8;

        std::vector<std::shared_ptr<RecordingDeviceCallback>> callbacks;
        for(int i=0; i<thread_count; ++i) {
            callbacks.push_back( std::make_shared<RecordingDeviceCallback>() );
        }
        std::atomic<bool> go(false);
        std::atomic<int> accepted(0);
        std::vector<std::thread> threads;
        for(int i=0; i<thread_count; ++i) {
            threads.push_back( std::thread( [&, i]() {
                while( !go.load() ) {
                    std::this_thread::yield();
                }
                if( registry.registerCallback(phone1, rA, callbacks[i], direct) ) {
                    ++accepted;
                }
            } ) );
        }
        go = true;
        for(std::thread& t : threads) {
            t.join();
        }
        // once blacklisted, the recipient is never registered again
        REQUIRE( true == blacklist->contains(rA) );
        REQUIRE( 1 == accepted.load() );
        REQUIRE( 0 == registry.getRegistrationCount(phone1.getDeviceId()) );
        REQUIRE( 0 == registry.getDeviceCount() );
        REQUIRE( false == registry.dispatch(phone1, message_to(rA, "leak")) );
        for(const std::shared_ptr<RecordingDeviceCallback>& cb : callbacks) {
            REQUIRE( 0 == cb->messages.size() );
        }
    }
}

TEST_CASE( "SerialExecutor Order Test 06", "[Executor][SerialExecutor]" ) {
    std::shared_ptr<SerialExecutor> serial = std::make_shared<SerialExecutor>("test", 64);
    REQUIRE( true == serial->isRunning() );

    std::atomic<int> count(0);
    std::atomic<bool> ordered(true);
    for(int i=0; i<32; ++i) {
        REQUIRE( true == serial->execute( [&count, &ordered, i]() {
            if( count.load() != i ) {
                ordered = false;
            }
            ++count;
        } ) );
    }
    for(int i=0; i<500 && 32 > count.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE( 32 == count.load() );
    REQUIRE( true == ordered.load() );

    serial->stop();
    REQUIRE( false == serial->isRunning() );
    REQUIRE( false == serial->execute( [&count]() { ++count; } ) );
}
