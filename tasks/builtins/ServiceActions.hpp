/**
 * @file tasks/builtins/ServiceActions.hpp
 * @brief systemctl actions accepted by manage-service, shared with the typed client.
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace SysTask::Tasks {

enum class ServiceAction { Start, Stop, Restart, Status, Enable, Disable };

inline constexpr std::array<ServiceAction, 6> all_service_actions{
    ServiceAction::Start, ServiceAction::Stop, ServiceAction::Restart,
    ServiceAction::Status, ServiceAction::Enable, ServiceAction::Disable,
};

constexpr std::string_view to_string(ServiceAction action) noexcept {
    switch (action) {
        case ServiceAction::Start:   return "start";
        case ServiceAction::Stop:    return "stop";
        case ServiceAction::Restart: return "restart";
        case ServiceAction::Status:  return "status";
        case ServiceAction::Enable:  return "enable";
        case ServiceAction::Disable: return "disable";
    }
    return "unknown";
}

constexpr std::optional<ServiceAction> parse_service_action(std::string_view text) noexcept {
    for (auto action : all_service_actions) {
        if (to_string(action) == text) return action;
    }
    return std::nullopt;
}

/// "start, stop, restart, status, enable, disable"
inline std::string service_action_list() {
    std::string out;
    for (auto action : all_service_actions) {
        if (!out.empty()) out += ", ";
        out += to_string(action);
    }
    return out;
}

} // namespace SysTask::Tasks
