/**
 * @file operations.hpp
 * @brief High-level database operations - COPY streaming, connection pooling, transactions
 *
 * Consolidates common patterns:
 * - Transaction RAII wrapper
 * - COPY protocol streaming (CSV lines, non-blocking with drain waits)
 * - Connection pooling for parallel batch workers
 *
 * DESIGN: Composable operations that hide libpq details.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <vector>
#include <libpq-fe.h>

#include "gridsync/db/connection.hpp"
#include "gridsync/db/helpers.hpp"

namespace gridsync::db {

// =============================================================================
// Transaction RAII
// =============================================================================

/**
 * RAII transaction wrapper. Rolls back unless commit() succeeded.
 *
 * Usage:
 *   {
 *       Transaction tx(conn);
 *       exec(conn, "SET LOCAL synchronous_commit = off");
 *       ...
 *       tx.commit();
 *   }  // Rolls back if commit() not called
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn) : conn_(conn), finished_(false) {
        Result res = exec(conn_, "BEGIN");
        check(res, conn_, "BEGIN");
    }

    ~Transaction() {
        if (!finished_) {
            PGresult* res = PQexec(conn_, "ROLLBACK");
            PQclear(res);
        }
    }

    void commit() {
        if (finished_) return;
        finished_ = true;
        Result res = exec(conn_, "COMMIT");
        check(res, conn_, "COMMIT");
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool finished_;
};

// =============================================================================
// COPY Protocol (CSV format)
// =============================================================================

// Null sentinel; every real text value is quoted, so it never collides.
inline constexpr std::string_view kCsvNull = "\\N";

/**
 * Append a quoted CSV field, doubling embedded quote characters.
 */
inline void csv_quote(std::string& dest, std::string_view src) {
    dest += '"';
    for (char ch : src) {
        if (ch == '"') dest += '"';
        dest += ch;
    }
    dest += '"';
}

/**
 * Build "COPY table (a, b) FROM STDIN WITH (FORMAT csv, NULL '\N')".
 */
std::string copy_csv_command(const std::string& table, const std::vector<std::string>& columns);

/**
 * RAII wrapper for COPY FROM STDIN streaming.
 *
 * The connection is switched to non-blocking mode for the duration of the
 * copy. When libpq cannot queue more data the stream waits for the socket
 * to drain (bounded by drain_timeout) instead of failing or spinning.
 *
 * Usage:
 *   CopyStream copy(conn, copy_csv_command("\"Row\"", {"id", "search"}));
 *   copy.put("\"r1\",\"alpha\"\n");
 *   copy.end();  // Explicit end; destruction without end() aborts the copy
 */
class CopyStream {
public:
    CopyStream(PGconn* conn, const std::string& copy_cmd,
               std::chrono::milliseconds drain_timeout = std::chrono::seconds(30));
    ~CopyStream();

    bool ok() const { return !error_; }
    const std::string& error() const { return error_msg_; }

    // Number of times a put had to wait for the output buffer to drain
    size_t drain_waits() const { return drain_waits_; }

    bool put(const char* data, size_t len);
    bool put(const std::string& data) { return put(data.data(), data.size()); }

    /**
     * End COPY stream and collect the command result. Returns false on error.
     */
    bool end();

    // Abort the copy; the server discards everything sent.
    void abort(const char* reason);

    CopyStream(const CopyStream&) = delete;
    CopyStream& operator=(const CopyStream&) = delete;

private:
    bool wait_drain();
    void fail(const std::string& msg);
    void finish_results();

    PGconn* conn_;
    std::chrono::milliseconds drain_timeout_;
    bool ended_;
    bool error_;
    size_t drain_waits_;
    std::string error_msg_;
};

/**
 * One CSV line (no trailing newline).
 *
 * Usage:
 *   CsvLine line;
 *   line.text("r1").number(42).null();
 *   writer.add_line(line.str());
 */
class CsvLine {
public:
    CsvLine& text(std::string_view val) {
        separator();
        csv_quote(buf_, val);
        return *this;
    }

    CsvLine& number(double val);

    CsvLine& null() {
        separator();
        buf_ += kCsvNull;
        return *this;
    }

    const std::string& str() const { return buf_; }

private:
    void separator() {
        if (fields_++ > 0) buf_ += ',';
    }

    std::string buf_;
    size_t fields_ = 0;
};

/**
 * Line sink on top of CopyStream with chunked flushing.
 *
 * Usage:
 *   CopyWriter writer(conn, "\"Cell\"", {"id", "\"vText\""});
 *   writer.add_line(line);
 *   writer.finish();
 */
class CopyWriter {
public:
    CopyWriter(PGconn* conn, const std::string& table,
               const std::vector<std::string>& columns,
               size_t chunk_size = 1 << 20)
        : stream_(std::make_unique<CopyStream>(conn, copy_csv_command(table, columns))),
          chunk_size_(chunk_size), rows_(0), error_(false) {
        if (!stream_->ok()) {
            error_ = true;
            error_msg_ = stream_->error();
        }
        buffer_.reserve(chunk_size_);
    }

    bool ok() const { return !error_; }
    const std::string& error() const { return error_msg_; }
    size_t rows() const { return rows_; }
    size_t drain_waits() const { return stream_->drain_waits(); }

    /**
     * Append one encoded line and flush if the buffer is large.
     */
    bool add_line(std::string_view line) {
        if (error_) return false;
        buffer_ += line;
        buffer_ += '\n';
        rows_++;

        if (buffer_.size() >= chunk_size_) {
            return flush();
        }
        return true;
    }

    bool flush() {
        if (error_ || buffer_.empty()) return !error_;
        if (!stream_->put(buffer_)) {
            error_ = true;
            error_msg_ = stream_->error();
            return false;
        }
        buffer_.clear();
        return true;
    }

    bool finish() {
        if (error_) {
            stream_->abort("writer error");
            return false;
        }
        if (!flush()) return false;
        if (!stream_->end()) {
            error_ = true;
            error_msg_ = stream_->error();
            return false;
        }
        return true;
    }

private:
    std::unique_ptr<CopyStream> stream_;
    std::string buffer_;
    size_t chunk_size_;
    size_t rows_;
    bool error_;
    std::string error_msg_;
};

// =============================================================================
// Connection Pool
// =============================================================================

/**
 * Thread-safe connection pool for parallel database operations.
 * Connections are opened lazily up to max_size.
 *
 * Usage:
 *   ConnectionPool pool(config, 4);
 *   auto conn = pool.acquire();
 *   exec(conn.get(), "SELECT ...");
 *   // Auto-returns to pool when conn goes out of scope
 */
class ConnectionPool {
public:
    /**
     * RAII handle for borrowed connection.
     */
    class Handle {
    public:
        Handle() : pool_(nullptr), conn_(nullptr) {}
        Handle(ConnectionPool* pool, PGconn* conn) : pool_(pool), conn_(conn) {}

        ~Handle() {
            if (pool_ && conn_) {
                pool_->release(conn_);
            }
        }

        Handle(Handle&& other) noexcept : pool_(other.pool_), conn_(other.conn_) {
            other.pool_ = nullptr;
            other.conn_ = nullptr;
        }

        Handle& operator=(Handle&& other) noexcept {
            if (this != &other) {
                if (pool_ && conn_) pool_->release(conn_);
                pool_ = other.pool_;
                conn_ = other.conn_;
                other.pool_ = nullptr;
                other.conn_ = nullptr;
            }
            return *this;
        }

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        PGconn* get() const { return conn_; }
        operator PGconn*() const { return conn_; }
        bool ok() const { return conn_ && PQstatus(conn_) == CONNECTION_OK; }

    private:
        ConnectionPool* pool_;
        PGconn* conn_;
    };

    ConnectionPool(const ConnectionConfig& config, size_t max_size)
        : conninfo_(config.to_conninfo()), max_size_(max_size == 0 ? 1 : max_size),
          open_(0), shutdown_(false) {}

    ~ConnectionPool() {
        shutdown();
    }

    /**
     * Acquire a connection (blocks while max_size are borrowed).
     * Throws TransientStoreError if a new connection cannot be opened.
     */
    Handle acquire();

    size_t max_size() const { return max_size_; }

    /**
     * Shutdown pool and close all idle connections.
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        while (!available_.empty()) {
            PQfinish(available_.front());
            available_.pop();
            --open_;
        }
        cv_.notify_all();
    }

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

private:
    void release(PGconn* conn);

    std::string conninfo_;
    size_t max_size_;
    size_t open_;
    std::queue<PGconn*> available_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_;
};

}  // namespace gridsync::db
