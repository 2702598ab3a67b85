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

#include "Executor.hpp"
#include "CarlinkConst.hpp"

using namespace carlink;
using namespace jau::fractions_i64_literals;

bool DirectExecutor::execute(Task task) noexcept {
    try {
        task();
    } catch (std::exception &e) {
        ERR_PRINT("DirectExecutor: Caught exception %s", e.what());
    }
    return true;
}

void SerialExecutor::serviceWork(jau::service_runner& sr) noexcept {
    Task task;
    if( !taskRing.getBlocking(task, 100_ms) ) {
        return; // idle, allow stop request to be noticed
    }
    if( sr.shall_stop() ) {
        return;
    }
    try {
        task();
    } catch (std::exception &e) {
        ERR_PRINT("SerialExecutor[%s]: Caught exception %s", name.c_str(), e.what());
    }
}

void SerialExecutor::serviceEndLocked(jau::service_runner& sr) noexcept {
    (void)sr;
    WORDY_PRINT("SerialExecutor[%s]: Ended. Ring has %u tasks flushed", name.c_str(), taskRing.size());
    taskRing.clear();
}

SerialExecutor::SerialExecutor(const std::string& name_, const jau::nsize_t capacity)
: name(name_),
  taskRing(capacity),
  service(name_, THREAD_SHUTDOWN_TIMEOUT_MS,
          jau::bind_member(this, &SerialExecutor::serviceWork),
          jau::service_runner::Callback() /* init */,
          jau::bind_member(this, &SerialExecutor::serviceEndLocked))
{
    service.start();
    DBG_PRINT("SerialExecutor::ctor: Started: %s", toString().c_str());
}

SerialExecutor::~SerialExecutor() noexcept {
    stop();
}

void SerialExecutor::stop() noexcept {
    if( service.is_running() ) {
        const bool res = service.stop();
        DBG_PRINT("SerialExecutor::stop: stopped %d, %s", res, toString().c_str());
    }
}

bool SerialExecutor::execute(Task task) noexcept {
    if( !service.is_running() || service.shall_stop() ) {
        WARN_PRINT("SerialExecutor[%s]: Not running, task dropped", name.c_str());
        return false;
    }
    if( taskRing.isFull() ) {
        WARN_PRINT("SerialExecutor[%s]: Ring full (%u capacity), blocking", name.c_str(), taskRing.capacity());
    }
    if( !taskRing.putBlocking( std::move(task), 0_s ) ) {
        ERR_PRINT("SerialExecutor[%s]: Put failed: %s", name.c_str(), taskRing.toString().c_str());
        return false;
    }
    return true;
}

std::string SerialExecutor::toString() const noexcept {
    return "SerialExecutor["+name+", pending "+std::to_string(taskRing.size())+"/"+std::to_string(taskRing.capacity())+
           ", running "+std::to_string(service.is_running())+"]";
}
