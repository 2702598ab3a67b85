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

#ifndef CARLINK_ENV_HPP_
#define CARLINK_ENV_HPP_

#include <cstdint>

#include <jau/environment.hpp>

namespace carlink {

    /**
     * Carlink configuration, read once from the environment.
     * <p>
     * All properties use the prefix 'carlink', exploded into
     * the environment as described in jau::environment::getExplodingProperties().
     * </p>
     */
    class CarlinkEnv : public jau::root_environment {
        private:
            CarlinkEnv() noexcept; // NOLINT(modernize-use-equals-delete)

        public:
            /** Global Debug flag, retrieved first to triggers CarlinkEnv initialization. */
            const bool DEBUG_GLOBAL;

        private:
            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Timeout in seconds passed to TransportAdapter::connectToDevice(), defaults to 60s.
             * <p>
             * Environment variable is 'carlink.connect.timeout'.
             * </p>
             */
            const int32_t CONNECT_TIMEOUT_SEC;

            /**
             * Task ringbuffer capacity of each SerialExecutor, defaults to 128 tasks.
             * <p>
             * Environment variable is 'carlink.ringsize'.
             * </p>
             */
            const int32_t TASK_RING_CAPACITY;

            /**
             * Length of the random device name advertised during association, defaults to 8.
             * <p>
             * The name must fit into the advertisement data, hence the maximum of 8.
             * </p>
             * <p>
             * Environment variable is 'carlink.assoc.namelen'.
             * </p>
             */
            const int32_t ASSOCIATION_NAME_LENGTH;

            /**
             * Debug all events passed through the orchestrator's event queue.
             * <p>
             * Environment variable is 'carlink.debug.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static CarlinkEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static CarlinkEnv e;
                return e;
            }
    };

} // namespace carlink

#endif /* CARLINK_ENV_HPP_ */
