#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

#include "../core/Types.hpp"
#include "../store/EmergencyStore.hpp"

namespace sos {
namespace emergency {

struct AckRecordResult {
    bool recorded = false;
    // True for exactly one acknowledgment per emergency.
    bool first_for_emergency = false;
    core::Acknowledgment ack;
};

// Idempotent acknowledgment recording. The store enforces uniqueness on
// (emergency, contact); the in-flight set makes a racing duplicate lose
// before it reaches the store.
class AcknowledgmentTracker {
public:
    explicit AcknowledgmentTracker(store::EmergencyStore& store);

    // `stage` builds the event committed with the acknowledgment.
    AckRecordResult record(core::Acknowledgment ack, const store::StageAckFn& stage = nullptr);

private:
    store::EmergencyStore& m_store;

    std::mutex m_mutex;
    std::unordered_set<std::string> m_in_flight;
};

} // namespace emergency
} // namespace sos
