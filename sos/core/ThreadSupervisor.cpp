#include "ThreadSupervisor.hpp"
#include "Errors.hpp"

#include <iostream>

namespace sos {
namespace core {

bool ThreadSupervisor::run_guarded(const std::string& task_name,
                                   const std::function<void()>& fn) {
    try {
        fn();
        return true;
    }
    catch (const EngineError& e) {
        std::cerr << "[Supervisor] TASK FAILURE [" << task_name << "] "
                  << to_string(e.kind()) << ": " << e.what() << "\n";
    }
    catch (const std::exception& e) {
        std::cerr << "[Supervisor] TASK FAILURE [" << task_name << "]: "
                  << e.what() << "\n";
    }
    return false;
}

} // namespace core
} // namespace sos
