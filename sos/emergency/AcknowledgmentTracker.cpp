#include "AcknowledgmentTracker.hpp"

namespace sos {
namespace emergency {

namespace {

// Releases the in-flight claim however the store call ends.
class InFlightClaim {
public:
    InFlightClaim(std::mutex& mutex, std::unordered_set<std::string>& set, std::string key)
        : m_mutex(mutex), m_set(set), m_key(std::move(key)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_claimed = m_set.insert(m_key).second;
    }

    ~InFlightClaim() {
        if (!m_claimed) return;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_set.erase(m_key);
    }

    bool claimed() const { return m_claimed; }

private:
    std::mutex& m_mutex;
    std::unordered_set<std::string>& m_set;
    std::string m_key;
    bool m_claimed = false;
};

} // namespace

AcknowledgmentTracker::AcknowledgmentTracker(store::EmergencyStore& store)
    : m_store(store) {}

AckRecordResult AcknowledgmentTracker::record(core::Acknowledgment ack, const store::StageAckFn& stage) {
    InFlightClaim claim(m_mutex, m_in_flight, ack.emergency_id + "|" + ack.contact_id);

    AckRecordResult result;
    if (!claim.claimed()) {
        result.ack = ack;
        return result;
    }

    result.recorded = m_store.insert_acknowledgment(ack, stage);
    result.first_for_emergency = result.recorded && ack.sequence == 1;
    result.ack = ack;
    return result;
}

} // namespace emergency
} // namespace sos
