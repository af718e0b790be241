/**
 * @file pg_certificate_registry.cpp
 * @brief PgCertificateRegistry implementation
 */

#include "pg_certificate_registry.h"
#include "registry_schema.h"
#include "exceptions.h"
#include "../common/json_utils.h"

#include <spdlog/spdlog.h>

namespace repositories {

using namespace domain::models;
using cga::utils::formatIso8601;
using cga::utils::parseIso8601;

namespace {

constexpr const char* CERTIFICATE_COLUMNS =
    "id, agent_id, agent_version, org_id, org_name, org_domain, level, "
    "golden_thread_hash, golden_thread_algorithm, issued_at, expires_at, "
    "certificate_content, signature_algorithm, signature_key_id, signature_value, "
    "status, revoked_at, revocation_reason, supersedes_id, created_at, updated_at";

constexpr const char* KEY_COLUMNS =
    "id, algorithm, public_key, private_key_encrypted, status, created_at, "
    "expires_at, rotated_at, certificates_signed";

// Serializes concurrent initialize() calls across processes
constexpr const char* MIGRATION_LOCK_ID = "724183";

std::string text(const Json::Value& row, const char* column) {
    const Json::Value& v = row[column];
    return v.isNull() ? std::string() : v.asString();
}

std::optional<std::string> optionalText(const Json::Value& row, const char* column) {
    const Json::Value& v = row[column];
    if (v.isNull()) {
        return std::nullopt;
    }
    return v.asString();
}

TimePoint timestamp(const Json::Value& row, const char* column) {
    auto tp = parseIso8601(text(row, column));
    if (!tp) {
        throw common::StorageException("Unreadable timestamp in registry row",
                                       std::string(column) + "=" + text(row, column));
    }
    return *tp;
}

std::optional<TimePoint> optionalTimestamp(const Json::Value& row, const char* column) {
    if (row[column].isNull()) {
        return std::nullopt;
    }
    return timestamp(row, column);
}

std::string orEmpty(const std::optional<std::string>& value) {
    return value.value_or("");
}

std::string orEmpty(const std::optional<TimePoint>& value) {
    return value ? formatIso8601(*value) : "";
}

} // anonymous namespace

PgCertificateRegistry::PgCertificateRegistry(common::DbConnectionPool* dbPool)
    : dbPool_(dbPool)
{
    if (!dbPool_) {
        throw std::invalid_argument("PgCertificateRegistry: dbPool cannot be nullptr");
    }
}

Json::Value PgCertificateRegistry::readRows(const std::string& sql, const std::vector<std::string>& params) {
    common::PgTransaction tx(dbPool_);
    Json::Value rows = tx.query(sql, params);
    tx.commit();
    return rows;
}

// =============================================================================
// Schema
// =============================================================================

void PgCertificateRegistry::initialize() {
    common::PgTransaction tx(dbPool_);
    tx.query(std::string("SELECT pg_advisory_xact_lock(") + MIGRATION_LOCK_ID + ")");

    tx.execute(
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "  version INTEGER PRIMARY KEY,"
        "  description TEXT NOT NULL,"
        "  applied_at TIMESTAMPTZ NOT NULL DEFAULT NOW()"
        ")");

    Json::Value current = tx.query("SELECT COALESCE(MAX(version), 0) AS version FROM schema_version");
    int applied = current[0]["version"].asInt();

    for (const auto& migration : schemaMigrations()) {
        if (migration.version <= applied) {
            continue;
        }
        spdlog::info("[PgCertificateRegistry] Applying schema migration {}: {}",
                     migration.version, migration.description);
        for (const auto& statement : migration.statements) {
            tx.execute(statement);
        }
        tx.execute("INSERT INTO schema_version (version, description) VALUES ($1, $2)",
                   {std::to_string(migration.version), migration.description});
        applied = migration.version;
    }

    tx.commit();
    spdlog::info("[PgCertificateRegistry] Schema at version {}", applied);
}

int PgCertificateRegistry::schemaVersion() {
    Json::Value exists = readRows("SELECT to_regclass('schema_version') IS NOT NULL AS present");
    if (exists.empty() || !exists[0]["present"].asBool()) {
        return 0;
    }
    Json::Value rows = readRows("SELECT COALESCE(MAX(version), 0) AS version FROM schema_version");
    return rows[0]["version"].asInt();
}

// =============================================================================
// Atomic commands
// =============================================================================

void PgCertificateRegistry::issueCertificate(const CertificateRecord& record,
                                             const std::optional<std::string>& supersedesId,
                                             const AuditEntry& audit) {
    common::PgTransaction tx(dbPool_);
    const CertificateIdentity identity = record.identity();

    if (supersedesId) {
        Json::Value prior = tx.query(
            "SELECT id, agent_id, agent_version, org_id, status FROM certificates "
            "WHERE id = $1 FOR UPDATE",
            {*supersedesId});
        if (prior.empty()) {
            throw common::NotFoundException("Certificate", *supersedesId);
        }
        std::string status = text(prior[0], "status");
        if (status != "active") {
            throw common::ConflictException("Superseded certificate is not active",
                                            *supersedesId + " is " + status);
        }
        CertificateIdentity priorIdentity{text(prior[0], "agent_id"), text(prior[0], "agent_version"),
                                          text(prior[0], "org_id")};
        if (!(priorIdentity == identity)) {
            throw common::ConflictException(
                "Superseded certificate belongs to a different identity",
                priorIdentity.toString() + " != " + identity.toString());
        }
    }

    Json::Value live = tx.query(
        "SELECT id FROM certificates "
        "WHERE agent_id = $1 AND agent_version = $2 AND org_id = $3 AND status <> 'superseded' "
        "FOR UPDATE",
        {identity.agentId, identity.agentVersion, identity.orgId});
    for (const auto& row : live) {
        std::string liveId = text(row, "id");
        if (!supersedesId || liveId != *supersedesId) {
            throw common::ConflictException("A live certificate already exists for this identity",
                                            identity.toString() + " -> " + liveId);
        }
    }

    if (supersedesId) {
        tx.execute("UPDATE certificates SET status = 'superseded', updated_at = $2 WHERE id = $1",
                   {*supersedesId, formatIso8601(record.createdAt)});
    }

    int keyRows = tx.execute(
        "UPDATE ca_keys SET certificates_signed = certificates_signed + 1 WHERE id = $1",
        {record.signatureKeyId});
    if (keyRows == 0) {
        throw common::NotFoundException("CA key", record.signatureKeyId);
    }

    tx.execute(
        "INSERT INTO certificates ("
        "  id, agent_id, agent_version, org_id, org_name, org_domain, level,"
        "  golden_thread_hash, golden_thread_algorithm, issued_at, expires_at,"
        "  certificate_content, signature_algorithm, signature_key_id, signature_value,"
        "  status, revoked_at, revocation_reason, supersedes_id, created_at, updated_at"
        ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15,"
        "          $16, $17, $18, $19, $20, $21)",
        {
            record.id, record.agentId, record.agentVersion, record.orgId, record.orgName,
            orEmpty(record.orgDomain), certificateLevelToString(record.level),
            record.goldenThreadHash, record.goldenThreadAlgorithm,
            formatIso8601(record.issuedAt), formatIso8601(record.expiresAt),
            record.certificateContent, record.signatureAlgorithm, record.signatureKeyId,
            record.signatureValue, certificateStatusToString(record.status),
            orEmpty(record.revokedAt), orEmpty(record.revocationReason), orEmpty(supersedesId),
            formatIso8601(record.createdAt), formatIso8601(record.updatedAt)
        });

    insertAudit(tx, audit);
    tx.commit();

    spdlog::debug("[PgCertificateRegistry] Issued {} ({})", record.id, identity.toString());
}

RevocationResult PgCertificateRegistry::revokeCertificate(const RevocationRecord& revocation,
                                                          const AuditEntry& audit) {
    common::PgTransaction tx(dbPool_);

    Json::Value cert = tx.query("SELECT id FROM certificates WHERE id = $1 FOR UPDATE",
                                {revocation.certificateId});
    if (cert.empty()) {
        throw common::NotFoundException("Certificate", revocation.certificateId);
    }

    Json::Value existing = tx.query(
        "SELECT certificate_id, revoked_at, reason, revoked_by, incident_id "
        "FROM revocations WHERE certificate_id = $1",
        {revocation.certificateId});
    if (!existing.empty()) {
        tx.commit();
        return RevocationResult{rowToRevocation(existing[0]), false};
    }

    const std::string revokedAt = formatIso8601(revocation.revokedAt);

    tx.execute(
        "UPDATE certificates SET "
        "status = CASE WHEN status = 'superseded' THEN status ELSE 'revoked' END, "
        "revoked_at = $2, revocation_reason = $3, updated_at = $2 WHERE id = $1",
        {revocation.certificateId, revokedAt, revocation.reason});

    tx.execute(
        "INSERT INTO revocations (certificate_id, revoked_at, reason, revoked_by, incident_id) "
        "VALUES ($1, $2, $3, $4, $5)",
        {revocation.certificateId, revokedAt, revocation.reason, revocation.revokedBy,
         orEmpty(revocation.incidentId)});

    tx.execute("DELETE FROM ocsp_cache WHERE certificate_id = $1", {revocation.certificateId});

    insertAudit(tx, audit);
    tx.commit();

    return RevocationResult{revocation, true};
}

void PgCertificateRegistry::activateKey(const CaKeyRecord& key, const AuditEntry& audit) {
    common::PgTransaction tx(dbPool_);

    tx.query("SELECT id FROM ca_keys WHERE status = 'active' FOR UPDATE");
    tx.execute("UPDATE ca_keys SET status = 'rotated', rotated_at = $1 WHERE status = 'active'",
               {formatIso8601(key.createdAt)});

    tx.execute(
        "INSERT INTO ca_keys (id, algorithm, public_key, private_key_encrypted, status, "
        "created_at, expires_at, rotated_at, certificates_signed) "
        "VALUES ($1, $2, $3, $4, 'active', $5, $6, NULL, $7)",
        {key.id, key.algorithm, key.publicKey, key.encryptedPrivateKey,
         formatIso8601(key.createdAt), orEmpty(key.expiresAt),
         std::to_string(key.certificatesSigned)});

    insertAudit(tx, audit);
    tx.commit();
}

// =============================================================================
// Certificates
// =============================================================================

std::optional<CertificateRecord> PgCertificateRegistry::findCertificate(const std::string& id) {
    Json::Value rows = readRows(
        std::string("SELECT ") + CERTIFICATE_COLUMNS + " FROM certificates WHERE id = $1", {id});
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToCertificate(rows[0]);
}

std::optional<CertificateRecord> PgCertificateRegistry::findLiveCertificate(const CertificateIdentity& identity) {
    Json::Value rows = readRows(
        std::string("SELECT ") + CERTIFICATE_COLUMNS + " FROM certificates "
        "WHERE agent_id = $1 AND agent_version = $2 AND org_id = $3 AND status <> 'superseded'",
        {identity.agentId, identity.agentVersion, identity.orgId});
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToCertificate(rows[0]);
}

std::vector<CertificateRecord> PgCertificateRegistry::listByAgent(const std::string& agentId) {
    Json::Value rows = readRows(
        std::string("SELECT ") + CERTIFICATE_COLUMNS + " FROM certificates "
        "WHERE agent_id = $1 ORDER BY issued_at DESC",
        {agentId});
    std::vector<CertificateRecord> out;
    for (const auto& row : rows) {
        out.push_back(rowToCertificate(row));
    }
    return out;
}

std::vector<CertificateRecord> PgCertificateRegistry::listByOrg(const std::string& orgId) {
    Json::Value rows = readRows(
        std::string("SELECT ") + CERTIFICATE_COLUMNS + " FROM certificates "
        "WHERE org_id = $1 ORDER BY issued_at DESC",
        {orgId});
    std::vector<CertificateRecord> out;
    for (const auto& row : rows) {
        out.push_back(rowToCertificate(row));
    }
    return out;
}

std::vector<CertificateRecord> PgCertificateRegistry::findActiveExpiringBetween(const TimePoint& from,
                                                                                const TimePoint& to) {
    Json::Value rows = readRows(
        std::string("SELECT ") + CERTIFICATE_COLUMNS + " FROM certificates "
        "WHERE status = 'active' AND expires_at >= $1 AND expires_at < $2 "
        "ORDER BY expires_at ASC",
        {formatIso8601(from), formatIso8601(to)});
    std::vector<CertificateRecord> out;
    for (const auto& row : rows) {
        out.push_back(rowToCertificate(row));
    }
    return out;
}

// =============================================================================
// Revocations
// =============================================================================

std::optional<RevocationRecord> PgCertificateRegistry::findRevocation(const std::string& certificateId) {
    Json::Value rows = readRows(
        "SELECT certificate_id, revoked_at, reason, revoked_by, incident_id "
        "FROM revocations WHERE certificate_id = $1",
        {certificateId});
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToRevocation(rows[0]);
}

std::vector<RevocationRecord> PgCertificateRegistry::listRevocations() {
    Json::Value rows = readRows(
        "SELECT certificate_id, revoked_at, reason, revoked_by, incident_id "
        "FROM revocations ORDER BY revoked_at ASC");
    std::vector<RevocationRecord> out;
    for (const auto& row : rows) {
        out.push_back(rowToRevocation(row));
    }
    return out;
}

// =============================================================================
// CA keys
// =============================================================================

std::optional<CaKeyRecord> PgCertificateRegistry::getActiveKey() {
    Json::Value rows = readRows(
        std::string("SELECT ") + KEY_COLUMNS + " FROM ca_keys WHERE status = 'active'");
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToKey(rows[0]);
}

std::optional<CaKeyRecord> PgCertificateRegistry::findKey(const std::string& id) {
    Json::Value rows = readRows(
        std::string("SELECT ") + KEY_COLUMNS + " FROM ca_keys WHERE id = $1", {id});
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToKey(rows[0]);
}

std::vector<CaKeyRecord> PgCertificateRegistry::listKeys() {
    Json::Value rows = readRows(
        std::string("SELECT ") + KEY_COLUMNS + " FROM ca_keys ORDER BY created_at ASC");
    std::vector<CaKeyRecord> out;
    for (const auto& row : rows) {
        out.push_back(rowToKey(row));
    }
    return out;
}

// =============================================================================
// OCSP cache
// =============================================================================

std::optional<OcspCacheEntry> PgCertificateRegistry::findOcspCache(const std::string& certificateId) {
    Json::Value rows = readRows(
        "SELECT certificate_id, response_bytes, produced_at, this_update, next_update "
        "FROM ocsp_cache WHERE certificate_id = $1",
        {certificateId});
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToOcspCache(rows[0]);
}

void PgCertificateRegistry::upsertOcspCache(const OcspCacheEntry& entry) {
    common::PgTransaction tx(dbPool_);
    tx.execute(
        "INSERT INTO ocsp_cache (certificate_id, response_bytes, produced_at, this_update, next_update) "
        "VALUES ($1, $2, $3, $4, $5) "
        "ON CONFLICT (certificate_id) DO UPDATE SET "
        "  response_bytes = EXCLUDED.response_bytes,"
        "  produced_at = EXCLUDED.produced_at,"
        "  this_update = EXCLUDED.this_update,"
        "  next_update = EXCLUDED.next_update",
        {entry.certificateId, entry.responseBytes, formatIso8601(entry.producedAt),
         formatIso8601(entry.thisUpdate), formatIso8601(entry.nextUpdate)});
    tx.commit();
}

void PgCertificateRegistry::deleteOcspCache(const std::string& certificateId) {
    common::PgTransaction tx(dbPool_);
    tx.execute("DELETE FROM ocsp_cache WHERE certificate_id = $1", {certificateId});
    tx.commit();
}

// =============================================================================
// Append-only logs
// =============================================================================

int64_t PgCertificateRegistry::appendVerification(const VerificationHistoryRecord& record) {
    common::PgTransaction tx(dbPool_);
    Json::Value rows = tx.query(
        "INSERT INTO verification_history (certificate_id, agent_id, request_id, request_ip, "
        "request_action, request_timestamp, result, result_details, duration_ms) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8::jsonb, $9) RETURNING id",
        {orEmpty(record.certificateId), record.agentId, orEmpty(record.context.requestId),
         orEmpty(record.context.requestIp), orEmpty(record.context.requestAction),
         formatIso8601(record.requestTimestamp), verificationResultToString(record.result),
         common::toCompactJson(record.resultDetails), std::to_string(record.durationMs)});
    tx.commit();
    return rows[0]["id"].asInt64();
}

std::vector<VerificationHistoryRecord> PgCertificateRegistry::listVerifications(
    const std::string& certificateId, int limit) {
    Json::Value rows = readRows(
        "SELECT id, certificate_id, agent_id, request_id, request_ip, request_action, "
        "request_timestamp, result, result_details, duration_ms "
        "FROM verification_history WHERE certificate_id = $1 ORDER BY id DESC LIMIT $2",
        {certificateId, std::to_string(limit)});
    std::vector<VerificationHistoryRecord> out;
    for (const auto& row : rows) {
        out.push_back(rowToVerification(row));
    }
    return out;
}

int64_t PgCertificateRegistry::recordAudit(const AuditEntry& entry) {
    common::PgTransaction tx(dbPool_);
    int64_t id = insertAudit(tx, entry);
    tx.commit();
    return id;
}

int64_t PgCertificateRegistry::insertAudit(common::PgTransaction& tx, const AuditEntry& entry) {
    Json::Value rows = tx.query(
        "INSERT INTO audit_log (actor_type, actor_id, action, resource_type, resource_id, "
        "details, request_ip, request_id) "
        "VALUES ($1, $2, $3, $4, $5, $6::jsonb, $7, $8) RETURNING id",
        {actorTypeToString(entry.actor.type), orEmpty(entry.actor.id), entry.action,
         entry.resourceType, orEmpty(entry.resourceId), common::toCompactJson(entry.details),
         orEmpty(entry.requestIp), orEmpty(entry.requestId)});
    return rows[0]["id"].asInt64();
}

std::vector<AuditLogRecord> PgCertificateRegistry::listAudit(const std::optional<std::string>& resourceId,
                                                             int limit) {
    const std::string columns =
        "SELECT id, timestamp, actor_type, actor_id, action, resource_type, resource_id, "
        "details, request_ip, request_id FROM audit_log ";

    Json::Value rows = resourceId
        ? readRows(columns + "WHERE resource_id = $1 ORDER BY id DESC LIMIT $2",
                   {*resourceId, std::to_string(limit)})
        : readRows(columns + "ORDER BY id DESC LIMIT $1", {std::to_string(limit)});

    std::vector<AuditLogRecord> out;
    for (const auto& row : rows) {
        out.push_back(rowToAudit(row));
    }
    return out;
}

// =============================================================================
// Row mapping
// =============================================================================

CertificateRecord PgCertificateRegistry::rowToCertificate(const Json::Value& row) {
    CertificateRecord c;
    c.id = text(row, "id");
    c.agentId = text(row, "agent_id");
    c.agentVersion = text(row, "agent_version");
    c.orgId = text(row, "org_id");
    c.orgName = text(row, "org_name");
    c.orgDomain = optionalText(row, "org_domain");

    auto level = parseCertificateLevel(text(row, "level"));
    auto status = parseCertificateStatus(text(row, "status"));
    if (!level || !status) {
        throw common::StorageException("Unreadable certificate row", c.id);
    }
    c.level = *level;
    c.status = *status;

    c.goldenThreadHash = text(row, "golden_thread_hash");
    c.goldenThreadAlgorithm = text(row, "golden_thread_algorithm");
    c.issuedAt = timestamp(row, "issued_at");
    c.expiresAt = timestamp(row, "expires_at");
    c.certificateContent = text(row, "certificate_content");
    c.signatureAlgorithm = text(row, "signature_algorithm");
    c.signatureKeyId = text(row, "signature_key_id");
    c.signatureValue = text(row, "signature_value");
    c.revokedAt = optionalTimestamp(row, "revoked_at");
    c.revocationReason = optionalText(row, "revocation_reason");
    c.supersedesId = optionalText(row, "supersedes_id");
    c.createdAt = timestamp(row, "created_at");
    c.updatedAt = timestamp(row, "updated_at");
    return c;
}

RevocationRecord PgCertificateRegistry::rowToRevocation(const Json::Value& row) {
    RevocationRecord r;
    r.certificateId = text(row, "certificate_id");
    r.revokedAt = timestamp(row, "revoked_at");
    r.reason = text(row, "reason");
    r.revokedBy = text(row, "revoked_by");
    r.incidentId = optionalText(row, "incident_id");
    return r;
}

CaKeyRecord PgCertificateRegistry::rowToKey(const Json::Value& row) {
    CaKeyRecord k;
    k.id = text(row, "id");
    k.algorithm = text(row, "algorithm");
    k.publicKey = text(row, "public_key");
    k.encryptedPrivateKey = text(row, "private_key_encrypted");

    auto status = parseKeyStatus(text(row, "status"));
    if (!status) {
        throw common::StorageException("Unreadable CA key row", k.id);
    }
    k.status = *status;
    k.createdAt = timestamp(row, "created_at");
    k.expiresAt = optionalTimestamp(row, "expires_at");
    k.rotatedAt = optionalTimestamp(row, "rotated_at");
    k.certificatesSigned = row["certificates_signed"].asInt64();
    return k;
}

OcspCacheEntry PgCertificateRegistry::rowToOcspCache(const Json::Value& row) {
    OcspCacheEntry e;
    e.certificateId = text(row, "certificate_id");
    e.responseBytes = text(row, "response_bytes");
    e.producedAt = timestamp(row, "produced_at");
    e.thisUpdate = timestamp(row, "this_update");
    e.nextUpdate = timestamp(row, "next_update");
    return e;
}

VerificationHistoryRecord PgCertificateRegistry::rowToVerification(const Json::Value& row) {
    VerificationHistoryRecord v;
    v.id = row["id"].asInt64();
    v.certificateId = optionalText(row, "certificate_id");
    v.agentId = text(row, "agent_id");
    v.context.requestId = optionalText(row, "request_id");
    v.context.requestIp = optionalText(row, "request_ip");
    v.context.requestAction = optionalText(row, "request_action");
    v.requestTimestamp = timestamp(row, "request_timestamp");
    v.result = parseVerificationResult(text(row, "result")).value_or(VerificationResult::UNKNOWN);
    v.resultDetails = common::parseJson(text(row, "result_details")).value_or(Json::Value(Json::objectValue));
    v.durationMs = row["duration_ms"].asInt64();
    return v;
}

AuditLogRecord PgCertificateRegistry::rowToAudit(const Json::Value& row) {
    AuditLogRecord a;
    a.id = row["id"].asInt64();
    a.timestamp = timestamp(row, "timestamp");
    a.entry.actor.type = parseActorType(text(row, "actor_type")).value_or(ActorType::SYSTEM);
    a.entry.actor.id = optionalText(row, "actor_id");
    a.entry.action = text(row, "action");
    a.entry.resourceType = text(row, "resource_type");
    a.entry.resourceId = optionalText(row, "resource_id");
    a.entry.details = common::parseJson(text(row, "details")).value_or(Json::Value(Json::objectValue));
    a.entry.requestIp = optionalText(row, "request_ip");
    a.entry.requestId = optionalText(row, "request_id");
    return a;
}

} // namespace repositories
