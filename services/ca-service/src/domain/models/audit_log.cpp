/**
 * @file audit_log.cpp
 * @brief Implementation of audit log domain model
 */

#include "audit_log.h"

#include <cga/utils/string_utils.h>

namespace domain {
namespace models {

std::string actorTypeToString(ActorType type) {
    switch (type) {
        case ActorType::SYSTEM: return "system";
        case ActorType::ADMIN: return "admin";
        case ActorType::AGENT: return "agent";
        case ActorType::API: return "api";
    }
    return "system";
}

std::optional<ActorType> parseActorType(const std::string& name) {
    std::string lower = cga::utils::toLower(name);
    if (lower == "system") return ActorType::SYSTEM;
    if (lower == "admin") return ActorType::ADMIN;
    if (lower == "agent") return ActorType::AGENT;
    if (lower == "api") return ActorType::API;
    return std::nullopt;
}

AuditActor AuditActor::parse(const std::string& spec) {
    std::string trimmed = cga::utils::trim(spec);
    if (trimmed.empty()) {
        return system();
    }

    size_t colon = trimmed.find(':');
    std::string prefix = trimmed.substr(0, colon);
    auto type = parseActorType(prefix);

    if (colon == std::string::npos) {
        if (type) {
            return AuditActor{*type, std::nullopt};
        }
        return AuditActor{ActorType::ADMIN, trimmed};
    }

    std::string rest = trimmed.substr(colon + 1);
    if (!type) {
        return AuditActor{ActorType::ADMIN, trimmed};
    }
    return AuditActor{*type, rest.empty() ? std::nullopt : std::optional<std::string>(rest)};
}

std::string AuditActor::toString() const {
    return id ? actorTypeToString(type) + ":" + *id : actorTypeToString(type);
}

Json::Value AuditLogRecord::toJson() const {
    Json::Value json;
    json["id"] = Json::Int64(id);
    json["timestamp"] = cga::utils::formatIso8601(timestamp);
    json["actorType"] = actorTypeToString(entry.actor.type);
    if (entry.actor.id) json["actorId"] = *entry.actor.id;
    json["action"] = entry.action;
    json["resourceType"] = entry.resourceType;
    if (entry.resourceId) json["resourceId"] = *entry.resourceId;
    json["details"] = entry.details;
    if (entry.requestIp) json["requestIp"] = *entry.requestIp;
    if (entry.requestId) json["requestId"] = *entry.requestId;
    return json;
}

} // namespace models
} // namespace domain
