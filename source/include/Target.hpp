#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <string_view>

struct ServiceCheckSpec {
    uint16_t port{};
    std::string match_hint{};
};

struct Target {
    std::string address, display_name;

    std::optional<ServiceCheckSpec> service_check = std::nullopt;
};

// fixed for the lifetime of the process, identity is the address

class TargetRegistry {
public:
    explicit TargetRegistry(std::vector<Target> targets);

    const std::vector<Target>& targets() const { return _targets; }
    size_t size() const { return _targets.size(); }
    bool empty() const { return _targets.empty(); }

    const Target& at(size_t index) const { return _targets.at(index); }

    std::optional<size_t> index_of(std::string_view address) const;
    bool contains(std::string_view address) const { return index_of(address).has_value(); }

private:
    void validate() const;

    std::vector<Target> _targets;
};
