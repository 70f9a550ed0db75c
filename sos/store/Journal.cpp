#include "Journal.hpp"
#include "../core/Crypto.hpp"
#include "../core/Errors.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace sos {
namespace store {

namespace fs = std::filesystem;

Journal::Journal(std::string path) : m_path(std::move(path)) {}

size_t Journal::replay(const std::function<void(const nlohmann::json&)>& fn) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_path.empty()) {
        m_opened = true;
        return 0;
    }

    std::error_code ec;
    fs::path p(m_path);
    if (p.has_parent_path())
        fs::create_directories(p.parent_path(), ec);
    if (ec)
        throw core::TransientStoreError("cannot create " + p.parent_path().string() + ": " + ec.message());

    uintmax_t good_bytes = 0;
    uintmax_t file_bytes = 0;
    size_t delivered = 0;
    std::string prev;

    {
        std::ifstream in(m_path, std::ios::binary);
        if (in.is_open()) {
            std::string line;
            while (std::getline(in, line)) {
                // A line without its newline is a torn write.
                if (in.eof())
                    break;

                size_t tab = line.find('\t');
                if (tab == std::string::npos) {
                    std::cerr << "[Journal] " << m_path << ": malformed record " << (delivered + 1) << "\n";
                    break;
                }

                std::string hash = line.substr(0, tab);
                std::string body = line.substr(tab + 1);
                if (core::Crypto::sha256_hex(prev + body) != hash) {
                    std::cerr << "[Journal] " << m_path << ": hash chain broken at record " << (delivered + 1) << "\n";
                    break;
                }

                nlohmann::json record = nlohmann::json::parse(body, nullptr, false);
                if (record.is_discarded()) {
                    std::cerr << "[Journal] " << m_path << ": unparsable record " << (delivered + 1) << "\n";
                    break;
                }

                fn(record);
                prev = hash;
                good_bytes += line.size() + 1;
                ++delivered;
            }
        }
    }

    if (fs::exists(p, ec)) {
        file_bytes = fs::file_size(p, ec);
        if (!ec && file_bytes > good_bytes) {
            std::cerr << "[Journal] " << m_path << ": dropping " << (file_bytes - good_bytes)
                      << " trailing bytes\n";
            fs::resize_file(p, good_bytes, ec);
            if (ec)
                throw core::TransientStoreError("cannot truncate " + m_path + ": " + ec.message());
        }
    }

    m_previous_hash = prev;
    m_records = delivered;
    open_for_append();
    return delivered;
}

void Journal::open_for_append() {
    m_out.close();
    m_out.clear();
    m_out.open(m_path, std::ios::binary | std::ios::app);
    if (!m_out.is_open())
        throw core::TransientStoreError("cannot open " + m_path + " for append");
    m_opened = true;
}

void Journal::append(const nlohmann::json& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_fail_next > 0) {
        --m_fail_next;
        throw core::TransientStoreError("injected journal write failure");
    }

    if (m_path.empty()) {
        ++m_records;
        return;
    }

    if (!m_opened)
        open_for_append();

    std::string body = record.dump();
    std::string hash = core::Crypto::sha256_hex(m_previous_hash + body);

    m_out << hash << '\t' << body << '\n';
    m_out.flush();
    if (!m_out.good()) {
        // Reopen on the next append; the half-written line is cut on replay.
        m_out.close();
        m_opened = false;
        throw core::TransientStoreError("write to " + m_path + " failed");
    }

    m_previous_hash = hash;
    ++m_records;
}

void Journal::fail_next_appends(size_t n) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fail_next = n;
}

size_t Journal::records() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

} // namespace store
} // namespace sos
