#include "Config.hpp"
#include "Utils.hpp"

#include <format>
#include <stdexcept>

#include <boost/json.hpp>

namespace json = boost::json;

namespace {

    int64_t read_int(const json::object& obj, std::string_view key, int64_t fallback, int64_t min, int64_t max) {
        auto it = obj.find(key);
        if (it == obj.end()) return fallback;

        if (!it->value().is_int64() && !it->value().is_uint64()) {
            throw std::runtime_error(std::format("Config: '{}' must be an integer", key));
        }

        auto value = it->value().to_number<int64_t>();
        if (value < min || value > max) {
            throw std::runtime_error(std::format("Config: '{}' must be between {} and {}", key, min, max));
        }

        return value;
    }

    std::string read_string(const json::object& obj, std::string_view key, std::string fallback) {
        auto it = obj.find(key);
        if (it == obj.end()) return fallback;

        if (!it->value().is_string()) throw std::runtime_error(std::format("Config: '{}' must be a string", key));

        return std::string(it->value().get_string());
    }

    Target parse_target(const json::value& v, size_t index) {
        if (!v.is_object()) throw std::runtime_error(std::format("Config: targets[{}] must be an object", index));

        const auto& obj = v.get_object();
        Target t;

        t.address = read_string(obj, "address", "");
        t.display_name = read_string(obj, "name", "");

        if (t.address.empty()) throw std::runtime_error(std::format("Config: targets[{}] has no address", index));

        if (auto it = obj.find("service"); it != obj.end() && !it->value().is_null()) {
            if (!it->value().is_object()) throw std::runtime_error(std::format("Config: targets[{}].service must be an object", index));

            const auto& svc = it->value().get_object();

            ServiceCheckSpec spec;
            spec.port = static_cast<uint16_t>(read_int(svc, "port", 0, 1, 65535));
            spec.match_hint = read_string(svc, "match", "");

            if (spec.port == 0) throw std::runtime_error(std::format("Config: targets[{}].service needs a port", index));
            if (spec.match_hint.empty()) throw std::runtime_error(std::format("Config: targets[{}].service needs a match string", index));

            t.service_check = std::move(spec);
        }

        return t;
    }
}

MonitorConfig default_config() {
    MonitorConfig config;

    config.targets = {
        { "192.168.0.224", "Master Pi (Pi 5)" },
        { "192.168.0.203", "Worker Pi (Pi 5)" },
        { "192.168.0.155", "Worker Pi (Pi 2b)" }
    };

    return config;
}

MonitorConfig parse_config(std::string_view json_text) {
    boost::system::error_code ec;
    auto root = json::parse(json_text, ec);

    if (ec) throw std::runtime_error(std::format("Config: invalid JSON ({})", ec.message()));
    if (!root.is_object()) throw std::runtime_error("Config: top level must be an object");

    const auto& obj = root.get_object();
    MonitorConfig config;

    config.period = std::chrono::seconds(read_int(obj, "period_seconds", 10, 1, 24 * 3600));
    config.probe_timeout = std::chrono::milliseconds(read_int(obj, "probe_timeout_ms", 1000, 100, 60000));
    config.service_timeout = std::chrono::milliseconds(read_int(obj, "service_timeout_ms", 2000, 100, 2000));
    config.copy_feedback = std::chrono::milliseconds(read_int(obj, "copy_feedback_ms", 2000, 100, 60000));
    config.api_port = static_cast<uint16_t>(read_int(obj, "api_port", 8080, 0, 65535));
    config.ping_command = read_string(obj, "ping_command", "ping");

    if (config.ping_command.empty()) throw std::runtime_error("Config: 'ping_command' must not be empty");

    if (auto it = obj.find("clipboard_command"); it != obj.end()) {
        if (it->value().is_string()) {
            config.clipboard_command = { std::string(it->value().get_string()) };
        }
        else if (it->value().is_array()) {
            for (const auto& part: it->value().get_array()) {
                if (!part.is_string()) throw std::runtime_error("Config: 'clipboard_command' entries must be strings");
                config.clipboard_command.emplace_back(part.get_string());
            }
        }
        else {
            throw std::runtime_error("Config: 'clipboard_command' must be a string or an array of strings");
        }
    }

    auto it = obj.find("targets");
    if (it == obj.end() || !it->value().is_array()) throw std::runtime_error("Config: 'targets' must be an array");

    const auto& targets = it->value().get_array();
    if (targets.empty()) throw std::runtime_error("Config: 'targets' must not be empty");

    for (size_t i = 0; i < targets.size(); ++i) config.targets.push_back(parse_target(targets[i], i));

    return config;
}

MonitorConfig load_config(const std::string& path) {
    return parse_config(read_from_file(path));
}
