#pragma once

#include <cstddef>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace sos {
namespace store {

// Append-only JSON-lines file with a SHA-256 hash chain. Each line is
// "<hex hash>\t<json>" where hash = sha256(previous hash + json).
// A torn or tampered tail is cut off on replay; everything before it is kept.
class Journal {
public:
    // An empty path gives a memory-only journal: appends are no-ops.
    explicit Journal(std::string path);

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    // Feeds every intact record to fn in file order, truncates the file
    // after the last intact record and opens it for appending. Returns the
    // number of records delivered.
    size_t replay(const std::function<void(const nlohmann::json&)>& fn);

    // Throws core::TransientStoreError if the record cannot be written.
    void append(const nlohmann::json& record);

    // The next n appends fail with TransientStoreError without touching the
    // file. Lets operators and tests drill the retry paths.
    void fail_next_appends(size_t n);

    bool persistent() const { return !m_path.empty(); }
    const std::string& path() const { return m_path; }
    size_t records() const;

private:
    void open_for_append();

    std::string m_path;
    std::ofstream m_out;
    std::string m_previous_hash;
    size_t m_records = 0;
    size_t m_fail_next = 0;
    bool m_opened = false;
    mutable std::mutex m_mutex;
};

} // namespace store
} // namespace sos
