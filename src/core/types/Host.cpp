#include "core/types/Host.hpp"

namespace hostwatch::core {

std::string HostState::statusToString() const {
    switch (status()) {
    case HostStatus::Up:
        return "UP";
    case HostStatus::Down:
        return "DOWN";
    }
    return "UP";
}

bool HostState::isConsistent() const {
    return failCount >= 0 && !(up && failCount != 0);
}

} // namespace hostwatch::core
