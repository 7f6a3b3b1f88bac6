#pragma once

#include <map>
#include <string>
#include <vector>

#include <json/json.h>

#include "core/error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

namespace blastbridge {

// Key/value persistence for database records. Every operation is valid on
// a store that has never been written (first run).
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual bool get(const std::string& id, DatabaseRecord& rec) const = 0;
    virtual bool set(const std::string& id, const DatabaseRecord& rec,
                     SearchError& err) = 0;
    // Removing an absent id succeeds.
    virtual bool remove(const std::string& id, SearchError& err) = 0;
    virtual std::vector<DatabaseRecord> list_all() const = 0;
};

// Records kept in one JSON document:
//   { "version": 1, "databases": { "<id>": { ...record... }, ... } }
// A missing file is an empty store. Each mutation rewrites the file
// through "<path>.tmp" + rename. The file is read on open() or on first
// access; records that fail to decode are dropped with a warning.
class JsonFileConfigStore : public ConfigStore {
public:
    JsonFileConfigStore(const std::string& path, const Logger& logger);

    // Read the file. A missing file is not an error; an unreadable or
    // malformed one is (kIo).
    bool open(SearchError& err);

    bool get(const std::string& id, DatabaseRecord& rec) const override;
    bool set(const std::string& id, const DatabaseRecord& rec,
             SearchError& err) override;
    bool remove(const std::string& id, SearchError& err) override;
    std::vector<DatabaseRecord> list_all() const override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    const Logger& logger_;
    mutable bool loaded_ = false;
    mutable std::map<std::string, DatabaseRecord> records_;

    bool ensure_loaded(SearchError& err) const;
    bool save(SearchError& err) const;
};

Json::Value record_to_json(const DatabaseRecord& rec);
bool record_from_json(const Json::Value& v, DatabaseRecord& rec);

} // namespace blastbridge
