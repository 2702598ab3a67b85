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

#ifndef CARLINK_DEVICE_KEY_STORE_HPP_
#define CARLINK_DEVICE_KEY_STORE_HPP_

#include <string>
#include <memory>
#include <cstdint>
#include <mutex>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>

#include "DeviceStore.hpp"

namespace carlink {

    /**
     * File based DeviceStore, one binary record per associated device within one directory.
     *
     * Record file format version 1, all numbers in little endian:
     * <pre>
     *   uint16_t version
     *   uint16_t size, total record size in bytes
     *   uint64_t creation timestamp in seconds since Unix epoch
     *   uint8_t  device id[16], network byte order
     *   uint8_t  connection enabled
     *   uint8_t  key valid
     *   uint8_t  key[16]
     *   uint8_t  address length, followed by its characters
     *   uint8_t  name length, followed by its characters
     * </pre>
     * <p>
     * Filename as retrieved by getFilename() has the form `cd_<device-id>.key`,
     * the device id in hex without dashes.
     * </p>
     * <p>
     * The head unit's unique id is kept in `carlink_uid.key`, `version ‖ id[16]`,
     * created once with a random id.
     * </p>
     * <p>
     * Invalid record files are removed when read.
     * </p>
     */
    class DeviceKeyStore : public DeviceStore {
        public:
            constexpr static const uint16_t VERSION = (uint16_t)0b0101010101010101U + (uint16_t)1U; // bitpattern + version

            /** Maximum length of the stored address and name, each. */
            constexpr static const jau::nsize_t MAX_STRING_LEN = 255;

        private:
            struct Record {
                AssociatedDevice device;
                SessionKey key;
                uint64_t ts_creation_sec;
            };
            const std::string path;
            const bool verbose;
            mutable std::recursive_mutex mtx_store;
            DeviceId uniqueId;
            jau::darray<Record> records;

            static jau::POctets encode(const Record& r) noexcept;
            static bool decode(const jau::TROOctets& data, Record& r) noexcept;

            bool write(const Record& r) noexcept;
            bool read(const std::string& fname, Record& r) noexcept;
            bool loadOrCreateUniqueId();
            void readAll() noexcept;

            Record* findLocked(const DeviceId& deviceId) noexcept;

        public:
            /**
             * Opens the store within the given existing directory, reading all records.
             * <p>
             * Throws jau::IllegalArgumentException if the directory doesn't exist
             * and jau::RuntimeException if the unique id can't be created.
             * </p>
             */
            DeviceKeyStore(const std::string& path_, const bool verbose_=false);

            ~DeviceKeyStore() noexcept override = default;

            std::string getFilename(const DeviceId& deviceId) const noexcept;

            const std::string& getPath() const noexcept { return path; }

            DeviceId getUniqueId() override;

            jau::darray<AssociatedDevice> getActiveUserAssociatedDevices() override;

            bool addAssociatedDeviceForActiveUser(const AssociatedDevice& device, const SessionKey& key) override;

            bool removeAssociatedDeviceForActiveUser(const DeviceId& deviceId) override;

            bool updateAssociatedDeviceConnectionEnabled(const DeviceId& deviceId, const bool enabled) override;

            SessionKey getEncryptionKey(const DeviceId& deviceId) override;

            bool saveEncryptionKey(const DeviceId& deviceId, const SessionKey& key) override;

            std::string toString() const noexcept override;
    };

} // namespace carlink

#endif /* CARLINK_DEVICE_KEY_STORE_HPP_ */
