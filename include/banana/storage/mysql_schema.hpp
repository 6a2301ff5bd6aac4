#pragma once

#include <string_view>

namespace banana::schema {

// MySQL 8 schema. Timestamps are Unix milliseconds (BIGINT); enums are
// stored as their snake_case names.

inline constexpr int CURRENT_SCHEMA_VERSION = 1;

inline constexpr std::string_view V1_SCHEMA = R"SQL(

CREATE TABLE IF NOT EXISTS schema_version (
    version INT NOT NULL PRIMARY KEY,
    applied_at DATETIME DEFAULT CURRENT_TIMESTAMP
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS jobs (
    job_rowid BIGINT UNSIGNED AUTO_INCREMENT PRIMARY KEY,
    job_id VARCHAR(32) CHARACTER SET ascii COLLATE ascii_bin NOT NULL,
    kind VARCHAR(16) NOT NULL,
    prompt TEXT NOT NULL,
    input_reference VARCHAR(1024) NULL,
    parent_id VARCHAR(32) CHARACTER SET ascii COLLATE ascii_bin NULL,
    params JSON NOT NULL,
    status VARCHAR(16) NOT NULL,
    attempt_count INT NOT NULL DEFAULT 0,
    output_references JSON NOT NULL,
    error_kind VARCHAR(32) NULL,
    error_detail TEXT NULL,
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL,
    UNIQUE KEY uq_jobs_job_id (job_id),
    INDEX idx_jobs_created (created_at DESC, job_id DESC),
    INDEX idx_jobs_status_created (status, created_at DESC)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

)SQL";

} // namespace banana::schema
