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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <vector>
#include <fstream>
#include <iostream>
#include <algorithm>

#include <jau/debug.hpp>
#include <jau/file_util.hpp>

#include "DeviceKeyStore.hpp"

using namespace carlink;

static const std::string uid_basename = "carlink_uid.key";

static std::vector<std::string> get_file_list(const std::string& dname) {
    std::vector<std::string> res;
    const jau::fs::consume_dir_item cs = jau::bindCaptureRefFunc(&res,
            ( void(*)(std::vector<std::string>*, const jau::fs::dir_item&) ) /* help template type deduction of function-ptr */
                ( [](std::vector<std::string>* receiver, const jau::fs::dir_item& item) -> void {
                    const std::string& bname = item.basename();
                    if( 7 <= bname.size() && 0 == bname.find("cd_") ) { // prefix check, 'cd_' + '.key' at least
                        const std::string::size_type suffix_pos = bname.size() - 4;
                        if( suffix_pos == bname.find(".key", suffix_pos) ) { // suffix check
                            receiver->push_back( item.path() ); // full path
                        }
                    }
                  } )
        );
    jau::fs::get_dir_content(dname, cs);
    return res;
}

static bool remove_impl(const std::string& fname) {
    return 0 == std::remove( fname.c_str() );
}

static bool write_file(const std::string& fname, const jau::TROOctets& data) noexcept {
    const jau::fs::file_stats fname_stat(fname);
    if( fname_stat.exists() ) {
        if( !fname_stat.is_file() || !remove_impl(fname) ) {
            ERR_PRINT("DeviceKeyStore: Failed deletion of existing file %s", fname_stat.to_string().c_str());
            return false;
        }
    }
    std::ofstream file(fname, std::ios::out | std::ios::binary);
    if ( !file.good() || !file.is_open() ) {
        ERR_PRINT("DeviceKeyStore: File not open %s", fname.c_str());
        return false;
    }
    file.write((const char*)data.get_ptr(), data.size());
    const bool res = file.good() && file.is_open();
    file.close();
    return res;
}

static bool read_file(const std::string& fname, const jau::nsize_t min_size, jau::POctets& res) noexcept {
    std::ifstream file(fname, std::ios::binary);
    if ( !file.is_open() ) {
        return false;
    }
    uint8_t buffer[4];
    file.read((char*)buffer, sizeof(buffer));
    if( file.fail() ) {
        return false;
    }
    const uint16_t version = jau::get_uint16(buffer, jau::lb_endian_t::little);
    const uint16_t size = jau::get_uint16(buffer + 2, jau::lb_endian_t::little);
    if( DeviceKeyStore::VERSION != version || size < min_size ) {
        return false;
    }
    res.resize(size, size);
    ::memcpy(res.get_wptr(), buffer, sizeof(buffer));
    file.read((char*)res.get_wptr() + sizeof(buffer), size - sizeof(buffer));
    return !file.fail();
}

static void put_string(jau::POctets& out, jau::nsize_t& i, const std::string& s) noexcept {
    const jau::nsize_t len = std::min<jau::nsize_t>(s.size(), DeviceKeyStore::MAX_STRING_LEN);
    out.get_wptr()[i++] = static_cast<uint8_t>(len);
    ::memcpy(out.get_wptr() + i, s.data(), len);
    i += len;
}

static bool get_string(const jau::TROOctets& in, jau::nsize_t& i, std::string& s) noexcept {
    if( i + 1 > in.size() ) {
        return false;
    }
    const jau::nsize_t len = in.get_ptr()[i++];
    if( i + len > in.size() ) {
        return false;
    }
    s = std::string((const char*)in.get_ptr() + i, len);
    i += len;
    return true;
}

// version, size, timestamp, id, enabled, key valid, key, address length, name length
static constexpr const jau::nsize_t record_fixed_size = 2 + 2 + 8 + 16 + 1 + 1 + 16 + 1 + 1;

jau::POctets DeviceKeyStore::encode(const Record& r) noexcept {
    const jau::nsize_t size = record_fixed_size +
                              std::min<jau::nsize_t>(r.device.address.size(), MAX_STRING_LEN) +
                              std::min<jau::nsize_t>(r.device.name.size(), MAX_STRING_LEN);
    jau::POctets out(size, size, jau::lb_endian_t::little);
    uint8_t * p = out.get_wptr();
    jau::nsize_t i = 0;
    jau::put_uint16(p + i, VERSION, jau::lb_endian_t::little); i += 2;
    jau::put_uint16(p + i, static_cast<uint16_t>(size), jau::lb_endian_t::little); i += 2;
    jau::put_uint64(p + i, r.ts_creation_sec, jau::lb_endian_t::little); i += 8;
    r.device.deviceId.put(p + i, jau::lb_endian_t::big); i += 16;
    p[i++] = r.device.connectionEnabled ? 1 : 0;
    p[i++] = r.key.isValid() ? 1 : 0;
    ::memcpy(p + i, r.key.get().data, SessionKey::SIZE); i += SessionKey::SIZE;
    put_string(out, i, r.device.address);
    put_string(out, i, r.device.name);
    return out;
}

bool DeviceKeyStore::decode(const jau::TROOctets& data, Record& r) noexcept {
    if( data.size() < record_fixed_size ) {
        return false;
    }
    const uint8_t * p = data.get_ptr();
    jau::nsize_t i = 4; // version and size validated by read_file()
    r.ts_creation_sec = jau::get_uint64(p + i, jau::lb_endian_t::little); i += 8;
    r.device.deviceId = DeviceId(p + i, jau::lb_endian_t::big); i += 16;
    r.device.connectionEnabled = 0 != p[i++];
    const bool key_valid = 0 != p[i++];
    r.key = key_valid ? SessionKey::fromBytes( jau::TROOctets(p + i, SessionKey::SIZE, jau::lb_endian_t::little) ) : SessionKey();
    i += SessionKey::SIZE;
    if( !get_string(data, i, r.device.address) || !get_string(data, i, r.device.name) ) {
        return false;
    }
    return i == data.size();
}

std::string DeviceKeyStore::getFilename(const DeviceId& deviceId) const noexcept {
    std::string id = deviceId.toString();
    id.erase( std::remove( id.begin(), id.end(), '-'), id.end() );
    return path + "/cd_" + id + ".key";
}

bool DeviceKeyStore::write(const Record& r) noexcept {
    const std::string fname = getFilename(r.device.deviceId);
    const bool res = write_file(fname, encode(r));
    if( res ) {
        if( verbose ) {
            jau::fprintf_td(stderr, "Write DeviceKeyStore: Success: %s: %s\n", fname.c_str(), r.device.toString().c_str());
        }
    } else {
        jau::fprintf_td(stderr, "Write DeviceKeyStore: Failed: %s: %s\n", fname.c_str(), r.device.toString().c_str());
    }
    return res;
}

bool DeviceKeyStore::read(const std::string& fname, Record& r) noexcept {
    jau::POctets data(jau::lb_endian_t::little);
    if( !read_file(fname, record_fixed_size, data) || !decode(data, r) ) {
        remove_impl( fname );
        jau::fprintf_td(stderr, "Read DeviceKeyStore: Failed %s (removed)\n", fname.c_str());
        return false;
    }
    if( verbose ) {
        jau::fprintf_td(stderr, "Read DeviceKeyStore: OK %s: %s\n", fname.c_str(), r.device.toString().c_str());
    }
    return true;
}

bool DeviceKeyStore::loadOrCreateUniqueId() {
    const std::string fname = path + "/" + uid_basename;
    jau::POctets data(jau::lb_endian_t::little);
    if( read_file(fname, 2 + 2 + 16, data) && 2 + 2 + 16 == data.size() ) {
        uniqueId = DeviceId(data.get_ptr() + 4, jau::lb_endian_t::big);
        return true;
    }
    uniqueId = random_device_id();
    jau::POctets out(2 + 2 + 16, 2 + 2 + 16, jau::lb_endian_t::little);
    jau::put_uint16(out.get_wptr(), VERSION, jau::lb_endian_t::little);
    jau::put_uint16(out.get_wptr() + 2, static_cast<uint16_t>(out.size()), jau::lb_endian_t::little);
    uniqueId.put(out.get_wptr() + 4, jau::lb_endian_t::big);
    DBG_PRINT("DeviceKeyStore: New unique id %s", uniqueId.toString().c_str());
    return write_file(fname, out);
}

void DeviceKeyStore::readAll() noexcept {
    const std::vector<std::string> fnames = get_file_list(path);
    for(const std::string& fname : fnames) {
        Record r;
        if( read(fname, r) ) {
            records.push_back(r);
        }
    }
    std::sort(records.begin(), records.end(), [](const Record& a, const Record& b) -> bool {
        return a.ts_creation_sec < b.ts_creation_sec;
    });
}

DeviceKeyStore::DeviceKeyStore(const std::string& path_, const bool verbose_)
: path(path_), verbose(verbose_)
{
    const jau::fs::file_stats path_stat(path);
    if( !path_stat.is_dir() ) {
        throw jau::IllegalArgumentException("Not a directory: "+path_stat.to_string(), E_FILE_LINE);
    }
    if( !loadOrCreateUniqueId() ) {
        throw jau::RuntimeException("Failed to store unique id in "+path, E_FILE_LINE);
    }
    readAll();
    DBG_PRINT("DeviceKeyStore::ctor: %s", toString().c_str());
}

DeviceKeyStore::Record* DeviceKeyStore::findLocked(const DeviceId& deviceId) noexcept {
    for(Record& r : records) {
        if( r.device.deviceId == deviceId ) {
            return &r;
        }
    }
    return nullptr;
}

DeviceId DeviceKeyStore::getUniqueId() {
    const std::lock_guard<std::recursive_mutex> lock(mtx_store); // RAII-style acquire and relinquish via destructor
    return uniqueId;
}

jau::darray<AssociatedDevice> DeviceKeyStore::getActiveUserAssociatedDevices() {
    const std::lock_guard<std::recursive_mutex> lock(mtx_store); // RAII-style acquire and relinquish via destructor
    jau::darray<AssociatedDevice> res;
    for(const Record& r : records) {
        res.push_back(r.device);
    }
    return res;
}

bool DeviceKeyStore::addAssociatedDeviceForActiveUser(const AssociatedDevice& device, const SessionKey& key) {
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_store); // RAII-style acquire and relinquish via destructor
        Record r { device, key, jau::getWallClockSeconds() };
        Record* existing = findLocked(device.deviceId);
        if( nullptr != existing ) {
            r.ts_creation_sec = existing->ts_creation_sec;
        }
        if( !write(r) ) {
            return false;
        }
        if( nullptr != existing ) {
            *existing = r;
        } else {
            records.push_back(r);
        }
    }
    notifyAdded(device);
    return true;
}

bool DeviceKeyStore::removeAssociatedDeviceForActiveUser(const DeviceId& deviceId) {
    AssociatedDevice removed;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_store); // RAII-style acquire and relinquish via destructor
        auto it = std::find_if(records.begin(), records.end(), [&](const Record& r) -> bool {
            return r.device.deviceId == deviceId;
        });
        if( it == records.end() ) {
            return false;
        }
        if( !remove_impl( getFilename(deviceId) ) ) {
            ERR_PRINT("DeviceKeyStore: Failed deletion of %s", getFilename(deviceId).c_str());
            return false;
        }
        removed = it->device;
        records.erase(it);
    }
    notifyRemoved(removed);
    return true;
}

bool DeviceKeyStore::updateAssociatedDeviceConnectionEnabled(const DeviceId& deviceId, const bool enabled) {
    AssociatedDevice updated;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_store); // RAII-style acquire and relinquish via destructor
        Record* r = findLocked(deviceId);
        if( nullptr == r ) {
            return false;
        }
        if( r->device.connectionEnabled == enabled ) {
            return true;
        }
        Record n = *r;
        n.device.connectionEnabled = enabled;
        if( !write(n) ) {
            return false;
        }
        *r = n;
        updated = n.device;
    }
    notifyUpdated(updated);
    return true;
}

SessionKey DeviceKeyStore::getEncryptionKey(const DeviceId& deviceId) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_store); // RAII-style acquire and relinquish via destructor
    const Record* r = findLocked(deviceId);
    return nullptr != r ? r->key : SessionKey();
}

bool DeviceKeyStore::saveEncryptionKey(const DeviceId& deviceId, const SessionKey& key) {
    const std::lock_guard<std::recursive_mutex> lock(mtx_store); // RAII-style acquire and relinquish via destructor
    Record* r = findLocked(deviceId);
    if( nullptr == r ) {
        WARN_PRINT("DeviceKeyStore: Unknown device %s", deviceId.toString().c_str());
        return false;
    }
    Record n = *r;
    n.key = key;
    if( !write(n) ) {
        return false;
    }
    *r = n;
    return true;
}

std::string DeviceKeyStore::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_store); // RAII-style acquire and relinquish via destructor
    return "DeviceKeyStore[path "+path+", id "+uniqueId.toString()+", devices "+std::to_string(records.size())+"]";
}
