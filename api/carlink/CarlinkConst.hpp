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

#ifndef CARLINK_CONST_HPP_
#define CARLINK_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>

namespace carlink {

    /**
     * Maximum time in milliseconds to wait for a thread shutdown.
     *
     * Used for the SerialExecutor service threads.
     */
    inline constexpr const jau::nsize_t THREAD_SHUTDOWN_TIMEOUT_MS = 8000;

    /**
     * Length of a device id frame as exchanged at the start of a handshake.
     */
    inline constexpr const jau::nsize_t DEVICE_ID_LENGTH = 16;

    /**
     * Confirmation signal sent to the client once the out-of-band verification has been accepted.
     */
    inline constexpr const char CONFIRMATION_SIGNAL[] = "True";

} // namespace carlink

#endif /* CARLINK_CONST_HPP_ */
