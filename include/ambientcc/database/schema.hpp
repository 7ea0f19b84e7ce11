#pragma once

/**
 * Correlation Database Schema Definitions
 *
 * Three tables: the job queue shared by all workers, the daily stacked
 * cross-correlations and (optionally) the individual window
 * cross-correlations. Correlation samples are stored as blobs of native
 * doubles.
 */

#include <string>
#include <cstdint>

namespace ambientcc {
namespace schema {

constexpr const char* SCHEMA_VERSION = "1.0";

// Job flags
constexpr char FLAG_TODO = 'T';
constexpr char FLAG_IN_PROGRESS = 'I';
constexpr char FLAG_DONE = 'D';

// Job types
constexpr const char* JOB_CC = "CC";
constexpr const char* JOB_STACK = "STACK";

/**
 * JOBS table - Work queue
 */
struct JobRow {
    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS jobs (
            ref         INTEGER PRIMARY KEY AUTOINCREMENT,
            day         TEXT NOT NULL,
            pair        TEXT NOT NULL,
            jobtype     TEXT NOT NULL,
            flag        TEXT NOT NULL DEFAULT 'T',
            lastmod     REAL,
            UNIQUE(day, pair, jobtype)
        )
    )";

    static constexpr const char* INDEX_SQL = R"(
        CREATE INDEX IF NOT EXISTS jobs_type_flag_day
            ON jobs(jobtype, flag, day)
    )";
};

/**
 * DAILY_CCF table - One stacked CCF per pair, components, filter and day
 */
struct DailyStackRow {
    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS daily_ccf (
            pair            TEXT NOT NULL,
            components      TEXT NOT NULL,
            filterid        INTEGER NOT NULL,
            day             TEXT NOT NULL,
            nsamp           INTEGER NOT NULL,
            ncorr           INTEGER NOT NULL,
            samprate        REAL NOT NULL,
            maxlag          REAL NOT NULL,
            stackmethod     TEXT NOT NULL,
            data            BLOB,
            lddate          REAL,
            PRIMARY KEY (pair, components, filterid, day)
        )
    )";
};

/**
 * WINDOW_CCF table - Individual window CCFs (keep_all)
 */
struct WindowCorrelationRow {
    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS window_ccf (
            pair            TEXT NOT NULL,
            components      TEXT NOT NULL,
            filterid        INTEGER NOT NULL,
            day             TEXT NOT NULL,
            wstart          REAL NOT NULL,
            nsamp           INTEGER NOT NULL,
            samprate        REAL NOT NULL,
            data            BLOB,
            lddate          REAL,
            PRIMARY KEY (pair, components, filterid, wstart)
        )
    )";
};

/**
 * META table - Schema version
 */
struct MetaRow {
    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS meta (
            key     TEXT PRIMARY KEY,
            value   TEXT
        )
    )";
};

} // namespace schema
} // namespace ambientcc
