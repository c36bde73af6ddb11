/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/PinAuth/FilePinStore.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * File-backed PIN store. Keeps the working set in memory (MemoryPinStore) and
 * rewrites a JSON snapshot after every mutation so records, sessions, recent
 * attempts and lockout resets survive restarts. A failed write is reported
 * to the caller, which denies.
 * =================================================================================
 */
#ifndef FILE_PIN_STORE_H
#define FILE_PIN_STORE_H

#include <string>
#include "MemoryPinStore.h"
#include "SafetyContext.h"

#define PIN_STORE_MAGIC 0x52565049 // "RVPI"
#define PIN_STORE_VERSION 1

class FilePinStore : public MemoryPinStore {
public:
    FilePinStore(ISafetyContext& ctx, const std::string& path);

    /**
     * Loads the snapshot from disk.
     * @return true if a valid snapshot was loaded or no file exists yet.
     */
    bool load();

    const std::string& getPath() const { return _path; }

protected:
    bool commit() override;

private:
    ISafetyContext& _ctx;
    std::string _path;

    void logKeyValue(const char* key, const char* value);
};

#endif
