#pragma once

#include <atomic>
#include <string>

#include "core/error.hpp"
#include "core/types.hpp"

namespace blastbridge {

enum class RawFormat {
    kTabular,  // -outfmt 6 columns (local)
    kXml,      // BLAST XML (remote)
};

// Unparsed output of one backend run.
struct RawOutput {
    RawFormat format = RawFormat::kTabular;
    std::string body;
    std::string audit_text;    // human-readable copy, may be empty
    std::string command_line;  // local: the blast command that ran
    std::string request_id;    // remote: job token
};

// Stop flag shared between the caller and a running search.
// request() only stores to an atomic and may be called from a signal handler.
class CancelToken {
public:
    void request() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

// Receives stage notifications while a search runs.
// Stages: validate, resolve, execute, submit, poll, retrieve, parse,
// fallback, done.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;
    virtual void on_progress(const std::string& stage, const std::string& message) = 0;
};

struct ExecutionContext {
    const CancelToken* cancel = nullptr;
    ProgressObserver* observer = nullptr;

    bool cancelled() const { return cancel != nullptr && cancel->cancelled(); }
    void notify(const std::string& stage, const std::string& message) const {
        if (observer) observer->on_progress(stage, message);
    }
};

// One way of running a BLAST search (local subprocess, NCBI web service).
class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    virtual ResultSource source() const = 0;

    // Checks that can be made before anything runs (database files present).
    // A failure here is surfaced to the caller, never replaced by a fallback.
    virtual bool prepare(const SearchRequest& req, const std::string& db_path,
                         SearchError& err) = 0;

    // Run the search for an already validated query.
    virtual bool execute(const SearchRequest& req, const SequenceQuery& query,
                         const std::string& db_path, const ExecutionContext& ctx,
                         RawOutput& out, SearchError& err) = 0;
};

} // namespace blastbridge
