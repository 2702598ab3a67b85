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

#ifndef CARLINK_HANDSHAKE_PRIMITIVE_HPP_
#define CARLINK_HANDSHAKE_PRIMITIVE_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/functional.hpp>
#include <jau/octets.hpp>

#include "CarlinkTypes.hpp"
#include "SessionCrypto.hpp"

namespace carlink {

    /**
     * Progress of a HandshakePrimitive as reported by each step.
     */
    enum class HandshakeState : uint8_t {
        UNKNOWN             = 0,
        /** Further round-trips required. */
        IN_PROGRESS         = 1,
        /** Association: a verification code must be confirmed out of band. */
        VERIFICATION_NEEDED = 2,
        /** Reconnection: the previous session key shall be used to resume the session. */
        RESUMING_SESSION    = 3,
        FINISHED            = 4,
        INVALID             = 5
    };
    std::string to_string(const HandshakeState s) noexcept;

    /**
     * Result of one handshake step.
     */
    struct HandshakeMessage {
        HandshakeState nextState;
        /** Response to be sent to the peer, may be empty. */
        jau::POctets nextMessage;
        /** Human readable verification code, only set with HandshakeState::VERIFICATION_NEEDED. */
        std::string verificationCode;

        HandshakeMessage() noexcept
        : nextState(HandshakeState::UNKNOWN), nextMessage(jau::lb_endian_t::little), verificationCode() {}

        HandshakeMessage(const HandshakeState s, jau::POctets && msg, const std::string& code="") noexcept
        : nextState(s), nextMessage(std::move(msg)), verificationCode(code) {}
    };

    /**
     * Thrown by a HandshakePrimitive on a protocol violation.
     */
    class HandshakeException : public jau::RuntimeException {
        public:
            HandshakeException(std::string const& m, const char* file, int line) noexcept
            : RuntimeException("HandshakeException", m, file, line) {}
    };

    /**
     * Pluggable key agreement engine of a SecureChannel, acting as responder.
     * <p>
     * Any exception thrown aborts the handshake with DeviceError::INVALID_HANDSHAKE.
     * </p>
     */
    class HandshakePrimitive {
        public:
            virtual ~HandshakePrimitive() noexcept = default;

            /**
             * Prepares a new handshake.
             * @param isReconnect true if the peer is already associated, expecting HandshakeState::RESUMING_SESSION
             */
            virtual void init(const bool isReconnect) = 0;

            /**
             * Processes the given handshake frame of the peer.
             */
            virtual HandshakeMessage continueHandshake(const jau::TROOctets& message) = 0;

            /** Returns the verification code after HandshakeState::VERIFICATION_NEEDED. */
            virtual std::string verificationCode() const = 0;

            /** Signals that the verification code has been confirmed out of band. */
            virtual void notifyOutOfBandAccepted() = 0;

            /**
             * Verifies the peer's reconnection proof against the previous key and resumes the session.
             * @param message the peer's frame following HandshakeState::RESUMING_SESSION
             * @param previousKey the stored key of the peer
             * @return HandshakeState::FINISHED and the server authentication message for the peer
             * @throws HandshakeException if the proof doesn't match the previous key
             */
            virtual HandshakeMessage resumeSession(const jau::TROOctets& message, const SessionKey& previousKey) = 0;

            /**
             * Returns the derived key after a finished handshake.
             */
            virtual SessionKey finish() = 0;
    };

    /**
     * Creates one new HandshakePrimitive per physical connection.
     */
    typedef jau::function<std::unique_ptr<HandshakePrimitive>()> HandshakePrimitiveFactory;

} // namespace carlink

#endif /* CARLINK_HANDSHAKE_PRIMITIVE_HPP_ */
