#pragma once

/**
 * @file registry_schema.h
 * @brief Registry schema migrations
 *
 * Migrations are additive only and applied in ascending version order.
 * schema_version holds one row per applied migration.
 */

#include <string>
#include <vector>

namespace repositories {

struct SchemaMigration {
    int version;
    std::string description;
    std::vector<std::string> statements;
};

inline const std::vector<SchemaMigration>& schemaMigrations() {
    static const std::vector<SchemaMigration> migrations = {
        {1, "initial registry schema", {
            "CREATE TABLE IF NOT EXISTS ca_keys ("
            "  id TEXT PRIMARY KEY,"
            "  algorithm TEXT NOT NULL,"
            "  public_key TEXT NOT NULL,"
            "  private_key_encrypted TEXT NOT NULL,"
            "  status TEXT NOT NULL CHECK (status IN ('active', 'inactive', 'rotated')),"
            "  created_at TIMESTAMPTZ NOT NULL,"
            "  expires_at TIMESTAMPTZ,"
            "  rotated_at TIMESTAMPTZ,"
            "  certificates_signed BIGINT NOT NULL DEFAULT 0"
            ")",

            // At most one active key
            "CREATE UNIQUE INDEX IF NOT EXISTS ux_ca_keys_active "
            "ON ca_keys ((status)) WHERE status = 'active'",

            "CREATE TABLE IF NOT EXISTS certificates ("
            "  id TEXT PRIMARY KEY,"
            "  agent_id TEXT NOT NULL,"
            "  agent_version TEXT NOT NULL,"
            "  org_id TEXT NOT NULL,"
            "  org_name TEXT NOT NULL,"
            "  org_domain TEXT,"
            "  level TEXT NOT NULL CHECK (level IN ('BRONZE', 'SILVER', 'GOLD', 'PLATINUM')),"
            "  golden_thread_hash TEXT NOT NULL,"
            "  golden_thread_algorithm TEXT NOT NULL DEFAULT 'SHA-256',"
            "  issued_at TIMESTAMPTZ NOT NULL,"
            "  expires_at TIMESTAMPTZ NOT NULL,"
            "  certificate_content TEXT NOT NULL,"
            "  signature_algorithm TEXT NOT NULL,"
            "  signature_key_id TEXT NOT NULL REFERENCES ca_keys(id),"
            "  signature_value TEXT NOT NULL,"
            "  status TEXT NOT NULL CHECK (status IN ('active', 'revoked', 'expired', 'superseded')),"
            "  revoked_at TIMESTAMPTZ,"
            "  revocation_reason TEXT,"
            "  supersedes_id TEXT REFERENCES certificates(id),"
            "  created_at TIMESTAMPTZ NOT NULL,"
            "  updated_at TIMESTAMPTZ NOT NULL"
            ")",

            // One live record per identity; superseded records keep their history
            "CREATE UNIQUE INDEX IF NOT EXISTS ux_certificates_live_identity "
            "ON certificates (agent_id, agent_version, org_id) WHERE status <> 'superseded'",

            "CREATE INDEX IF NOT EXISTS idx_certificates_agent ON certificates (agent_id)",
            "CREATE INDEX IF NOT EXISTS idx_certificates_org ON certificates (org_id)",
            "CREATE INDEX IF NOT EXISTS idx_certificates_active_expiry "
            "ON certificates (expires_at) WHERE status = 'active'",

            "CREATE TABLE IF NOT EXISTS revocations ("
            "  certificate_id TEXT PRIMARY KEY REFERENCES certificates(id),"
            "  revoked_at TIMESTAMPTZ NOT NULL,"
            "  reason TEXT NOT NULL,"
            "  revoked_by TEXT NOT NULL,"
            "  incident_id TEXT"
            ")",

            "CREATE TABLE IF NOT EXISTS ocsp_cache ("
            "  certificate_id TEXT PRIMARY KEY,"
            "  response_bytes TEXT NOT NULL,"
            "  produced_at TIMESTAMPTZ NOT NULL,"
            "  this_update TIMESTAMPTZ NOT NULL,"
            "  next_update TIMESTAMPTZ NOT NULL"
            ")",

            "CREATE TABLE IF NOT EXISTS verification_history ("
            "  id BIGSERIAL PRIMARY KEY,"
            "  certificate_id TEXT,"
            "  agent_id TEXT NOT NULL,"
            "  request_id TEXT,"
            "  request_ip TEXT,"
            "  request_action TEXT,"
            "  request_timestamp TIMESTAMPTZ NOT NULL,"
            "  result TEXT NOT NULL CHECK (result IN ('valid', 'invalid', 'revoked', 'expired', 'unknown')),"
            "  result_details JSONB NOT NULL DEFAULT '{}'::jsonb,"
            "  duration_ms BIGINT NOT NULL DEFAULT 0"
            ")",

            "CREATE TABLE IF NOT EXISTS audit_log ("
            "  id BIGSERIAL PRIMARY KEY,"
            "  timestamp TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
            "  actor_type TEXT NOT NULL CHECK (actor_type IN ('system', 'admin', 'agent', 'api')),"
            "  actor_id TEXT,"
            "  action TEXT NOT NULL,"
            "  resource_type TEXT NOT NULL,"
            "  resource_id TEXT,"
            "  details JSONB NOT NULL DEFAULT '{}'::jsonb,"
            "  request_ip TEXT,"
            "  request_id TEXT"
            ")",
        }},
        {2, "history and audit lookup indexes", {
            "CREATE INDEX IF NOT EXISTS idx_verification_history_cert "
            "ON verification_history (certificate_id, id DESC)",
            "CREATE INDEX IF NOT EXISTS idx_audit_log_resource "
            "ON audit_log (resource_id, id DESC)",
        }},
    };
    return migrations;
}

inline int latestSchemaVersion() {
    return schemaMigrations().back().version;
}

} // namespace repositories
