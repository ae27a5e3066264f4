/**
 * @file port_bindings.cpp
 * @brief Implementation of the publish string codec
 *
 * @date 2025
 */

#include "dockhand/utils/port_bindings.hpp"
#include "dockhand/utils/string_utils.hpp"
#include "dockhand/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace dockhand {
namespace utils {

using core::EngineError;
using core::ErrorKind;
using core::PortBinding;

namespace {

bool IsPortNumber(const std::string& str) {
    if (str.empty() || str.size() > 5) {
        return false;
    }
    if (!std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    int port = std::stoi(str);
    return port > 0 && port <= 65535;
}

// Port or port range ("8000-8010")
bool IsPortOrRange(const std::string& str) {
    auto dash = str.find('-');
    if (dash == std::string::npos) {
        return IsPortNumber(str);
    }
    return IsPortNumber(str.substr(0, dash)) && IsPortNumber(str.substr(dash + 1));
}

EngineError InvalidPublish(const std::string& publish, const std::string& reason) {
    return EngineError(ErrorKind::INVALID_SPEC,
                       "Invalid port spec '" + publish + "': " + reason);
}

} // anonymous namespace

std::string PortBindings::NormalizeContainerPort(const std::string& container_port) {
    if (container_port.find('/') == std::string::npos) {
        return container_port + "/tcp";
    }
    return container_port;
}

std::pair<std::string, PortBinding> PortBindings::ParsePublish(const std::string& publish) {
    std::string rest = StringUtils::Trim(publish);
    PortBinding binding;

    // Bracketed IPv6 host address
    if (StringUtils::StartsWith(rest, "[")) {
        auto close = rest.find(']');
        if (close == std::string::npos || close + 1 >= rest.size() || rest[close + 1] != ':') {
            throw InvalidPublish(publish, "unterminated IPv6 address");
        }
        binding.host_ip = rest.substr(1, close - 1);
        rest = rest.substr(close + 2);
    }

    auto segments = StringUtils::Split(rest, ':');
    std::string container_port;

    if (!binding.host_ip.empty()) {
        if (segments.size() != 2) {
            throw InvalidPublish(publish, "expected [ip]:hostPort:containerPort");
        }
        binding.host_port = segments[0];
        container_port = segments[1];
    } else if (segments.size() == 1) {
        container_port = segments[0];
    } else if (segments.size() == 2) {
        binding.host_port = segments[0];
        container_port = segments[1];
    } else if (segments.size() == 3) {
        binding.host_ip = segments[0];
        binding.host_port = segments[1];
        container_port = segments[2];
    } else {
        throw InvalidPublish(publish, "too many ':' segments");
    }

    std::string port_part = container_port;
    std::string protocol = "tcp";
    auto slash = container_port.find('/');
    if (slash != std::string::npos) {
        port_part = container_port.substr(0, slash);
        protocol = StringUtils::ToLower(container_port.substr(slash + 1));
    }

    if (!IsPortOrRange(port_part)) {
        throw InvalidPublish(publish, "container port must be 1-65535");
    }
    if (protocol != "tcp" && protocol != "udp" && protocol != "sctp") {
        throw InvalidPublish(publish, "unknown protocol '" + protocol + "'");
    }
    if (!binding.host_port.empty() && !IsPortOrRange(binding.host_port)) {
        throw InvalidPublish(publish, "host port must be 1-65535");
    }

    return {port_part + "/" + protocol, binding};
}

std::string PortBindings::FormatPublish(const std::string& container_port,
                                        const PortBinding& binding) {
    if (binding.host_ip.empty()) {
        if (binding.host_port.empty()) {
            return container_port;
        }
        return binding.host_port + ":" + container_port;
    }

    std::string host_ip = binding.host_ip;
    if (host_ip.find(':') != std::string::npos) {
        host_ip = "[" + host_ip + "]";
    }
    return host_ip + ":" + binding.host_port + ":" + container_port;
}

core::PortMap PortBindings::ToPortMap(const std::vector<std::string>& publish_specs) {
    core::PortMap ports;
    for (const auto& spec : publish_specs) {
        auto [container_port, binding] = ParsePublish(spec);
        ports[container_port].push_back(binding);
    }
    return ports;
}

} // namespace utils
} // namespace dockhand
