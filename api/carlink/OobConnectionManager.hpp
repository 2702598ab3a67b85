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

#ifndef CARLINK_OOB_CONNECTION_MANAGER_HPP_
#define CARLINK_OOB_CONNECTION_MANAGER_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>

#include "CarlinkTypes.hpp"
#include "SessionCrypto.hpp"

namespace carlink {

    /**
     * A secondary side channel used to hand over out-of-band data during association,
     * e.g. an RFCOMM socket to the phone.
     * <p>
     * Implementations are external.
     * </p>
     */
    class OobChannel {
        public:
            virtual ~OobChannel() noexcept = default;

            /**
             * Connects to the device with given address and sends the given out-of-band data.
             * <p>
             * Blocking, hence only called off the orchestrator's event queue.
             * </p>
             * @return true if the data has been delivered
             */
            virtual bool completeOobDataExchange(const std::string& address, const jau::TROOctets& oobData) noexcept = 0;

            /** Aborts a pending completeOobDataExchange(). */
            virtual void interrupt() noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };

    /**
     * Protects the verification code exchanged during an out-of-band association.
     * <p>
     * The sender generates a key and two IVs and hands them over via the OobChannel,
     * serialized as `decryptionIv(13) ‖ encryptionIv(13) ‖ key(16)`.
     * The IV names are from the receiver's point of view:
     * the receiver decrypts with the first and encrypts with the second IV,
     * the sender does the inverse.
     * </p>
     * <p>
     * Without key data, encryption and decryption fail with DeviceError::INVALID_ENCRYPTION_KEY.
     * </p>
     */
    class OobConnectionManager {
        public:
            static constexpr const jau::nsize_t OOB_DATA_SIZE = 2*CCM_NONCE_SIZE + SessionKey::SIZE;

        private:
            SessionKey key;
            uint8_t encryptionIv[CCM_NONCE_SIZE];
            uint8_t decryptionIv[CCM_NONCE_SIZE];

        public:
            /** Constructs an instance without key data. */
            OobConnectionManager() noexcept;

            /**
             * Sender role: generates a fresh key and IVs.
             */
            void generateOobData();

            /**
             * Receiver role: takes the key and IVs of the given out-of-band data.
             * @return false if the data is malformed, leaving this instance without key data.
             */
            bool setOobData(const jau::TROOctets& oobData) noexcept;

            /**
             * Returns the out-of-band data to be sent by the sender, empty without key data.
             */
            jau::POctets getOobData() const noexcept;

            bool hasKey() const noexcept { return key.isValid(); }

            DeviceError encryptVerificationCode(const jau::TROOctets& code, jau::POctets& out) const noexcept;

            DeviceError decryptVerificationCode(const jau::TROOctets& sealed, jau::POctets& out) const noexcept;

            std::string toString() const noexcept;
    };

} // namespace carlink

#endif /* CARLINK_OOB_CONNECTION_MANAGER_HPP_ */
