#include "Target.hpp"

#include <format>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

TargetRegistry::TargetRegistry(std::vector<Target> targets): _targets(std::move(targets)) {
    for (auto& target: _targets) {
        if (target.display_name.empty()) target.display_name = target.address;
    }

    validate();
}

void TargetRegistry::validate() const {
    std::unordered_set<std::string_view> seen;

    for (const auto& target: _targets) {
        if (target.address.empty()) throw std::invalid_argument("Target address must not be empty");

        // the address ends up on the ping command line
        if (target.address.starts_with('-')) throw std::invalid_argument(std::format("Invalid target address: {}", target.address));

        if (target.address.find_first_of(" \t\r\n") != std::string::npos) {
            throw std::invalid_argument(std::format("Invalid target address: {}", target.address));
        }

        if (!seen.insert(target.address).second) {
            throw std::invalid_argument(std::format("Duplicate target address: {}", target.address));
        }

        if (target.service_check) {
            if (target.service_check->port == 0) {
                throw std::invalid_argument(std::format("Service check for {} needs a port", target.address));
            }

            if (target.service_check->match_hint.empty()) {
                throw std::invalid_argument(std::format("Service check for {} needs a match string", target.address));
            }
        }
    }
}

std::optional<size_t> TargetRegistry::index_of(std::string_view address) const {
    auto it = std::ranges::find(_targets, address, &Target::address);

    if (it == _targets.end()) return std::nullopt;

    return static_cast<size_t>(std::distance(_targets.begin(), it));
}
