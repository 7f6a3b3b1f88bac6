#include "registry/config_store.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace blastbridge {

Json::Value record_to_json(const DatabaseRecord& rec) {
    Json::Value v;
    v["id"] = rec.id;
    v["name"] = rec.name;
    v["mol_type"] = mol_type_dbtype(rec.mol_type);
    v["status"] = db_status_name(rec.status);
    v["directory"] = rec.directory;
    v["db_path"] = rec.db_path;
    v["sequence_count"] = static_cast<Json::UInt64>(rec.sequence_count);
    v["letter_count"] = static_cast<Json::UInt64>(rec.letter_count);
    v["source_file"] = rec.source_file;
    v["created_at"] = rec.created_at;
    v["last_validated"] = rec.last_validated;
    return v;
}

bool record_from_json(const Json::Value& v, DatabaseRecord& rec) {
    if (!v.isObject()) return false;
    rec.id = v.get("id", "").asString();
    rec.name = v.get("name", "").asString();
    if (rec.id.empty() || rec.name.empty()) return false;

    if (!parse_mol_type(v.get("mol_type", "nucl").asString(), rec.mol_type))
        return false;
    if (!parse_db_status(v.get("status", "error").asString(), rec.status))
        return false;

    rec.directory = v.get("directory", "").asString();
    rec.db_path = v.get("db_path", "").asString();
    rec.sequence_count = v.get("sequence_count", 0).asUInt64();
    rec.letter_count = v.get("letter_count", 0).asUInt64();
    rec.source_file = v.get("source_file", "").asString();
    rec.created_at = v.get("created_at", "").asString();
    rec.last_validated = v.get("last_validated", "").asString();
    rec.discovered = false;
    return true;
}

JsonFileConfigStore::JsonFileConfigStore(const std::string& path, const Logger& logger)
    : path_(path), logger_(logger) {}

bool JsonFileConfigStore::open(SearchError& err) {
    loaded_ = false;
    records_.clear();
    return ensure_loaded(err);
}

bool JsonFileConfigStore::ensure_loaded(SearchError& err) const {
    if (loaded_) return true;

    std::ifstream in(path_);
    if (!in.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            loaded_ = true;  // first run
            return true;
        }
        err.set(ErrorCode::kIo, "cannot read registry file " + path_);
        return false;
    }

    std::stringstream ss;
    ss << in.rdbuf();
    std::string body = ss.str();
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        loaded_ = true;
        return true;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string parse_errors;
    if (!reader->parse(body.c_str(), body.c_str() + body.size(), &root, &parse_errors)) {
        err.set(ErrorCode::kIo, "malformed registry file " + path_ + ": " + parse_errors);
        return false;
    }

    const Json::Value& dbs = root["databases"];
    if (dbs.isObject()) {
        for (const auto& id : dbs.getMemberNames()) {
            DatabaseRecord rec;
            if (record_from_json(dbs[id], rec)) {
                records_[rec.id] = rec;
            } else {
                logger_.warn("Skipping invalid registry record '%s' in %s",
                             id.c_str(), path_.c_str());
            }
        }
    }
    loaded_ = true;
    return true;
}

bool JsonFileConfigStore::save(SearchError& err) const {
    Json::Value root;
    root["version"] = 1;
    Json::Value dbs(Json::objectValue);
    for (const auto& kv : records_) {
        dbs[kv.first] = record_to_json(kv.second);
    }
    root["databases"] = std::move(dbs);

    std::filesystem::path p(path_);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            err.set(ErrorCode::kIo, "cannot create directory " +
                    p.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            err.set(ErrorCode::kIo, "cannot write registry file " + tmp);
            return false;
        }
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        out << Json::writeString(writer, root) << '\n';
        if (!out.good()) {
            err.set(ErrorCode::kIo, "write failed for " + tmp);
            return false;
        }
    }

    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        err.set(ErrorCode::kIo, "cannot replace " + path_ + ": " + std::strerror(errno));
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

bool JsonFileConfigStore::get(const std::string& id, DatabaseRecord& rec) const {
    SearchError err;
    if (!ensure_loaded(err)) {
        logger_.error("%s", err.message.c_str());
        return false;
    }
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    rec = it->second;
    return true;
}

bool JsonFileConfigStore::set(const std::string& id, const DatabaseRecord& rec,
                              SearchError& err) {
    if (!ensure_loaded(err)) return false;
    auto prev = records_.find(id);
    bool had_prev = prev != records_.end();
    DatabaseRecord old;
    if (had_prev) old = prev->second;

    records_[id] = rec;
    if (!save(err)) {
        if (had_prev) records_[id] = old;
        else records_.erase(id);
        return false;
    }
    return true;
}

bool JsonFileConfigStore::remove(const std::string& id, SearchError& err) {
    if (!ensure_loaded(err)) return false;
    auto it = records_.find(id);
    if (it == records_.end()) return true;

    DatabaseRecord old = it->second;
    records_.erase(it);
    if (!save(err)) {
        records_[id] = old;
        return false;
    }
    return true;
}

std::vector<DatabaseRecord> JsonFileConfigStore::list_all() const {
    std::vector<DatabaseRecord> out;
    SearchError err;
    if (!ensure_loaded(err)) {
        logger_.error("%s", err.message.c_str());
        return out;
    }
    out.reserve(records_.size());
    for (const auto& kv : records_) out.push_back(kv.second);
    return out;
}

} // namespace blastbridge
