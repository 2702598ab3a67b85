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

#ifndef CARLINK_TYPES_HPP_
#define CARLINK_TYPES_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

namespace carlink {

    /** \addtogroup CarlinkUserAPI
     *
     *  @{
     */

    /**
     * Opaque identifier of a companion device, persistent across connections.
     */
    typedef jau::uuid128_t DeviceId;

    /**
     * Opaque identifier of one feature multiplexed over a secure channel.
     */
    typedef jau::uuid128_t RecipientId;

    /**
     * Hash functor for DeviceId and RecipientId keyed containers.
     */
    struct uuid128_hash {
        std::size_t operator()(jau::uuid128_t const& a) const noexcept;
    };

    /**
     * Returns a DeviceId decoded from the given 16 bytes in network byte order,
     * or throws jau::IllegalArgumentException if size doesn't match.
     */
    DeviceId to_device_id(const jau::TROOctets& bytes);

    /** Returns the 16 bytes of the given identifier in network byte order. */
    jau::POctets to_octets(const jau::uuid128_t& id) noexcept;

    /**
     * Fills the given buffer with random bytes from the kernel's CSPRNG.
     * <p>
     * Throws jau::RuntimeException if no entropy could be retrieved.
     * </p>
     */
    void random_bytes(uint8_t * dest, const jau::nsize_t size);

    /** Returns a newly generated random DeviceId. */
    DeviceId random_device_id();

    #define DEVICE_ERROR_ENUM(X) \
        X(SUCCESS) \
        X(INVALID_HANDSHAKE) \
        X(INVALID_MSG) \
        X(INVALID_DEVICE_ID) \
        X(INVALID_VERIFICATION) \
        X(INVALID_CHANNEL_STATE) \
        X(INVALID_ENCRYPTION_KEY) \
        X(STORAGE_FAILURE) \
        X(INVALID_SECURITY_KEY) \
        X(INSECURE_RECIPIENT_ID_DETECTED) \
        X(UNEXPECTED_DISCONNECTION) \
        X(UNKNOWN)

    /**
     * Error codes surfaced through callbacks or returned by synchronous preconditions.
     */
    enum class DeviceError : uint8_t {
        SUCCESS                         = 0x00,
        /** Malformed or out-of-sequence handshake frame, channel is discarded. */
        INVALID_HANDSHAKE               = 0x01,
        /** Undecodable frame, channel is retained. */
        INVALID_MSG                     = 0x02,
        /** Peer device id frame unparsable or unknown. */
        INVALID_DEVICE_ID               = 0x03,
        /** Out-of-band confirmation mismatch. */
        INVALID_VERIFICATION            = 0x04,
        /** Operation attempted before handshake completion. */
        INVALID_CHANNEL_STATE           = 0x05,
        /** Missing symmetric key. */
        INVALID_ENCRYPTION_KEY          = 0x06,
        /** Persistence layer could not save or load a device record. */
        STORAGE_FAILURE                 = 0x07,
        /** Rejected symmetric key, e.g. a failed session resumption. */
        INVALID_SECURITY_KEY            = 0x08,
        /** Duplicate recipient registration. */
        INSECURE_RECIPIENT_ID_DETECTED  = 0x09,
        /** Transport link dropped outside a requested disconnect. */
        UNEXPECTED_DISCONNECTION        = 0x0a,
        UNKNOWN                         = 0xff
    };
    constexpr uint8_t number(const DeviceError rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const DeviceError ec) noexcept;

    class DeviceErrorCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "carlink"; }
            std::string message(int condition) const override {
                return "carlink::"+to_string( static_cast<DeviceError>(condition) );
            }
            static DeviceErrorCategory& get() {
                static DeviceErrorCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( DeviceError e ) noexcept {
      return std::error_code( number(e), DeviceErrorCategory::get() );
    }

    /**
     * Frame classification at the transport level.
     */
    enum class OperationType : uint8_t {
        ENCRYPTION_HANDSHAKE = 0x02,
        ACK                  = 0x03,
        CLIENT_MESSAGE       = 0x04
    };
    constexpr uint8_t number(const OperationType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const OperationType op) noexcept;

    /**
     * State of one SecureChannel.
     * <p>
     * AWAITING_DEVICE_ID -> HANDSHAKE_IN_PROGRESS -> AWAITING_OOB_CONFIRMATION -> ESTABLISHED on association,
     * AWAITING_DEVICE_ID -> HANDSHAKE_IN_PROGRESS -> RESUMING_SESSION -> ESTABLISHED on reconnection.
     * ERROR is absorbing.
     * </p>
     */
    enum class ChannelState : uint8_t {
        AWAITING_DEVICE_ID          = 0,
        HANDSHAKE_IN_PROGRESS       = 1,
        AWAITING_OOB_CONFIRMATION   = 2,
        /** Reconnection: awaiting the peer's proof of the previous session key. */
        RESUMING_SESSION            = 3,
        ESTABLISHED                 = 4,
        ERROR                       = 5
    };
    constexpr uint8_t number(const ChannelState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ChannelState s) noexcept;
    bool is_valid_transition(const ChannelState from, const ChannelState to) noexcept;

    /**
     * Connection state of one device as seen by the orchestrator.
     */
    enum class DeviceConnectionState : uint8_t {
        DISCONNECTED            = 0,
        CONNECTING              = 1,
        HANDSHAKE_IN_PROGRESS   = 2,
        ESTABLISHED             = 3
    };
    constexpr uint8_t number(const DeviceConnectionState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const DeviceConnectionState s) noexcept;
    bool is_valid_transition(const DeviceConnectionState from, const DeviceConnectionState to) noexcept;

    /**
     * Process-wide state of the orchestrator.
     */
    enum class ManagerState : uint8_t {
        STOPPED     = 0,
        STARTING    = 1,
        RUNNING     = 2
    };
    constexpr uint8_t number(const ManagerState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ManagerState s) noexcept;
    bool is_valid_transition(const ManagerState from, const ManagerState to) noexcept;

    /**
     * Unit of application level communication.
     * <p>
     * Handshake frames carry the all-zero recipient.
     * </p>
     */
    class DeviceMessage {
        private:
            RecipientId recipient;
            bool encrypted;
            jau::POctets payload;

        public:
            DeviceMessage() noexcept
            : recipient(), encrypted(false), payload(jau::lb_endian_t::little) {}

            DeviceMessage(const RecipientId& recipient_, const bool encrypted_, const jau::TROOctets& payload_) noexcept
            : recipient(recipient_), encrypted(encrypted_), payload(payload_.get_ptr(), payload_.size(), jau::lb_endian_t::little) {}

            DeviceMessage(const RecipientId& recipient_, const bool encrypted_, jau::POctets && payload_) noexcept
            : recipient(recipient_), encrypted(encrypted_), payload(std::move(payload_)) {}

            const RecipientId& getRecipient() const noexcept { return recipient; }
            bool isEncrypted() const noexcept { return encrypted; }
            const jau::POctets& getPayload() const noexcept { return payload; }

            /** Returns a copy of this message with the given payload and encryption flag. */
            DeviceMessage withPayload(const bool encrypted_, jau::POctets && payload_) const noexcept {
                return DeviceMessage(recipient, encrypted_, std::move(payload_));
            }

            std::string toString() const noexcept;
    };

    /**
     * A live connection to a companion device.
     * <p>
     * Immutable, a new instance replaces the old one whenever any field changes.
     * </p>
     */
    class ConnectedDevice {
        private:
            DeviceId deviceId;
            std::string deviceName;
            bool belongsToActiveUser;
            bool secureChannel;

        public:
            ConnectedDevice() noexcept
            : deviceId(), deviceName(), belongsToActiveUser(false), secureChannel(false) {}

            ConnectedDevice(const DeviceId& deviceId_, const std::string& deviceName_,
                            const bool belongsToActiveUser_, const bool secureChannel_) noexcept
            : deviceId(deviceId_), deviceName(deviceName_),
              belongsToActiveUser(belongsToActiveUser_), secureChannel(secureChannel_) {}

            const DeviceId& getDeviceId() const noexcept { return deviceId; }

            /** Returns the device name, which may be empty. */
            const std::string& getDeviceName() const noexcept { return deviceName; }

            bool isAssociatedWithActiveUser() const noexcept { return belongsToActiveUser; }

            bool hasSecureChannel() const noexcept { return secureChannel; }

            ConnectedDevice withSecureChannel(const bool v) const noexcept {
                return ConnectedDevice(deviceId, deviceName, belongsToActiveUser, v);
            }
            ConnectedDevice withActiveUser(const bool v, const std::string& name) const noexcept {
                return ConnectedDevice(deviceId, name, v, secureChannel);
            }

            std::string toString() const noexcept;
    };
    inline bool operator==(const ConnectedDevice& lhs, const ConnectedDevice& rhs) noexcept {
        return lhs.getDeviceId() == rhs.getDeviceId() &&
               lhs.getDeviceName() == rhs.getDeviceName() &&
               lhs.isAssociatedWithActiveUser() == rhs.isAssociatedWithActiveUser() &&
               lhs.hasSecureChannel() == rhs.hasSecureChannel();
    }
    inline bool operator!=(const ConnectedDevice& lhs, const ConnectedDevice& rhs) noexcept
    { return !(lhs == rhs); }

    /**
     * Persisted pairing record, owned by the DeviceStore.
     */
    struct AssociatedDevice {
        DeviceId deviceId;
        std::string address;
        std::string name;
        bool connectionEnabled;

        AssociatedDevice() noexcept
        : deviceId(), address(), name(), connectionEnabled(false) {}

        AssociatedDevice(const DeviceId& deviceId_, const std::string& address_, const std::string& name_, const bool connectionEnabled_) noexcept
        : deviceId(deviceId_), address(address_), name(name_), connectionEnabled(connectionEnabled_) {}

        std::string toString() const noexcept;
    };
    inline bool operator==(const AssociatedDevice& lhs, const AssociatedDevice& rhs) noexcept {
        return lhs.deviceId == rhs.deviceId && lhs.address == rhs.address &&
               lhs.name == rhs.name && lhs.connectionEnabled == rhs.connectionEnabled;
    }
    inline bool operator!=(const AssociatedDevice& lhs, const AssociatedDevice& rhs) noexcept
    { return !(lhs == rhs); }

    /**@}*/

} // namespace carlink

// injecting specialization of std::is_error_code_enum to namespace std of our types above
namespace std
{
    template <>
        struct is_error_code_enum<carlink::DeviceError> : true_type {};
}

#endif /* CARLINK_TYPES_HPP_ */
