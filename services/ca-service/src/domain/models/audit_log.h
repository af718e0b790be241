/**
 * @file audit_log.h
 * @brief Domain model for the append-only audit log
 */

#pragma once

#include <cga/utils/time_utils.h>

#include <optional>
#include <string>
#include <json/json.h>

namespace domain {
namespace models {

using cga::utils::TimePoint;

enum class ActorType {
    SYSTEM,
    ADMIN,
    AGENT,
    API
};

std::string actorTypeToString(ActorType type);

std::optional<ActorType> parseActorType(const std::string& name);

/**
 * @brief Who performed an operation
 *
 * Parsed from "type:id" specs such as "admin:alice" or "system".
 * An unrecognized type prefix is treated as an admin-supplied name.
 */
struct AuditActor {
    ActorType type = ActorType::SYSTEM;
    std::optional<std::string> id;

    static AuditActor parse(const std::string& spec);

    static AuditActor system() { return AuditActor{ActorType::SYSTEM, std::nullopt}; }

    std::string toString() const;
};

/**
 * @brief Audit entry as submitted with a mutating operation
 */
struct AuditEntry {
    AuditActor actor;
    std::string action;        // e.g. "certificate_issued"
    std::string resourceType;  // "certificate" | "ca_key"
    std::optional<std::string> resourceId;
    Json::Value details = Json::Value(Json::objectValue);
    std::optional<std::string> requestIp;
    std::optional<std::string> requestId;
};

/**
 * @brief Persisted audit row
 */
struct AuditLogRecord {
    int64_t id = 0;
    TimePoint timestamp;
    AuditEntry entry;

    Json::Value toJson() const;
};

} // namespace models
} // namespace domain
