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

#ifndef CARLINK_EXECUTOR_HPP_
#define CARLINK_EXECUTOR_HPP_

#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/functional.hpp>
#include <jau/ringbuffer.hpp>
#include <jau/service_runner.hpp>

namespace carlink {

    /**
     * Runs tasks on behalf of a caller, e.g. user callbacks
     * on the thread the user registered them with.
     */
    class Executor {
        public:
            typedef jau::function<void()> Task;

            virtual ~Executor() noexcept = default;

            /**
             * Schedules the given task.
             * @return true if the task has been accepted, otherwise false, e.g. if stopped.
             */
            virtual bool execute(Task task) noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };
    typedef std::shared_ptr<Executor> ExecutorRef;

    /**
     * Runs each task inline on the calling thread.
     */
    class DirectExecutor : public Executor {
        public:
            bool execute(Task task) noexcept override;

            std::string toString() const noexcept override { return "DirectExecutor"; }
    };

    /**
     * Runs tasks one after another in submission order on its own service thread.
     * <p>
     * Implementation utilizes a ringbuffer of tasks drained by one jau::service_runner.
     * </p>
     */
    class SerialExecutor : public Executor {
        private:
            const std::string name;
            jau::ringbuffer<Task, jau::nsize_t> taskRing;
            jau::service_runner service;

            void serviceWork(jau::service_runner& sr) noexcept;
            void serviceEndLocked(jau::service_runner& sr) noexcept;

        public:
            SerialExecutor(const std::string& name_, const jau::nsize_t capacity);

            SerialExecutor(const SerialExecutor&) = delete;
            void operator=(const SerialExecutor&) = delete;

            /** Stops the service thread, dropping all pending tasks. */
            ~SerialExecutor() noexcept override;

            bool execute(Task task) noexcept override;

            /**
             * Stops the service thread, dropping all pending tasks.
             * <p>
             * Must not be called from a task of this executor.
             * </p>
             */
            void stop() noexcept;

            bool isRunning() const noexcept { return service.is_running(); }

            jau::nsize_t getPendingCount() const noexcept { return taskRing.size(); }

            std::string toString() const noexcept override;
    };

} // namespace carlink

#endif /* CARLINK_EXECUTOR_HPP_ */
