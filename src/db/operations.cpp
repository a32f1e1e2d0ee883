#include "gridsync/db/operations.hpp"

#include <poll.h>
#include <cerrno>

#include "gridsync/logging.hpp"
#include "gridsync/types.hpp"

namespace gridsync::db {

std::string copy_csv_command(const std::string& table, const std::vector<std::string>& columns) {
    std::string cmd = "COPY " + table + " (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) cmd += ", ";
        cmd += columns[i];
    }
    cmd += ") FROM STDIN WITH (FORMAT csv, NULL '\\N')";
    return cmd;
}

// =============================================================================
// CopyStream
// =============================================================================

CopyStream::CopyStream(PGconn* conn, const std::string& copy_cmd,
                       std::chrono::milliseconds drain_timeout)
    : conn_(conn), drain_timeout_(drain_timeout), ended_(false), error_(false), drain_waits_(0) {
    PGresult* res = PQexec(conn_, copy_cmd.c_str());
    if (PQresultStatus(res) != PGRES_COPY_IN) {
        error_ = true;
        error_msg_ = PQerrorMessage(conn_);
        ended_ = true;
    }
    PQclear(res);

    if (!error_ && PQsetnonblocking(conn_, 1) != 0) {
        fail("cannot switch connection to non-blocking mode");
    }
}

CopyStream::~CopyStream() {
    if (!ended_) {
        abort("copy stream destroyed before end()");
    }
}

void CopyStream::fail(const std::string& msg) {
    if (!error_) {
        error_ = true;
        error_msg_ = msg;
        const char* pq = PQerrorMessage(conn_);
        if (pq && *pq) error_msg_ += ": " + std::string(pq);
    }
}

bool CopyStream::wait_drain() {
    auto deadline = std::chrono::steady_clock::now() + drain_timeout_;
    for (;;) {
        int flushed = PQflush(conn_);
        if (flushed == 0) return true;
        if (flushed < 0) {
            fail("flush failed");
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            fail("timed out waiting for copy buffer to drain");
            return false;
        }

        // The server may also be sending (notices, errors); read-readiness
        // must be consumed or the write side can stall.
        pollfd pfd{};
        pfd.fd = PQsocket(conn_);
        pfd.events = POLLOUT | POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            fail("poll failed");
            return false;
        }
        if ((pfd.revents & POLLIN) && !PQconsumeInput(conn_)) {
            fail("connection lost during copy");
            return false;
        }
    }
}

bool CopyStream::put(const char* data, size_t len) {
    if (error_ || ended_) return false;
    for (;;) {
        int rc = PQputCopyData(conn_, data, static_cast<int>(len));
        if (rc == 1) return true;
        if (rc < 0) {
            fail("PQputCopyData failed");
            return false;
        }
        ++drain_waits_;
        if (!wait_drain()) return false;
    }
}

void CopyStream::finish_results() {
    // Blocking mode again so PQgetResult waits for the command to complete.
    PQsetnonblocking(conn_, 0);
    while (PGresult* res = PQgetResult(conn_)) {
        if (PQresultStatus(res) != PGRES_COMMAND_OK && !error_) {
            error_ = true;
            error_msg_ = PQresultErrorMessage(res);
        }
        PQclear(res);
    }
}

bool CopyStream::end() {
    if (ended_) return !error_;
    ended_ = true;

    for (;;) {
        int rc = PQputCopyEnd(conn_, error_ ? error_msg_.c_str() : nullptr);
        if (rc == 1) break;
        if (rc < 0) {
            fail("PQputCopyEnd failed");
            break;
        }
        ++drain_waits_;
        if (!wait_drain()) break;
    }
    if (!error_) wait_drain();

    finish_results();
    return !error_;
}

void CopyStream::abort(const char* reason) {
    if (ended_) return;
    ended_ = true;
    if (!error_) {
        error_ = true;
        error_msg_ = reason;
    }
    PQsetnonblocking(conn_, 0);
    PQputCopyEnd(conn_, reason);
    finish_results();
}

// =============================================================================
// CsvLine
// =============================================================================

CsvLine& CsvLine::number(double val) {
    separator();
    buf_ += format_number(val);
    return *this;
}

// =============================================================================
// ConnectionPool
// =============================================================================

ConnectionPool::Handle ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return shutdown_ || !available_.empty() || open_ < max_size_; });

    if (shutdown_) {
        throw DatabaseError(ErrorCode::CONNECTION_FAILED, "connection pool is shut down", "ConnectionPool::acquire");
    }

    if (!available_.empty()) {
        PGconn* conn = available_.front();
        available_.pop();
        return Handle(this, conn);
    }

    ++open_;
    lock.unlock();

    PGconn* conn = PQconnectdb(conninfo_.c_str());
    if (PQstatus(conn) != CONNECTION_OK) {
        std::string msg = PQerrorMessage(conn);
        PQfinish(conn);
        {
            std::lock_guard<std::mutex> relock(mutex_);
            --open_;
        }
        cv_.notify_one();
        throw TransientStoreError("connection failed: " + msg, "ConnectionPool::acquire");
    }
    LOG_DEBUG("Pool opened connection (max ", max_size_, ")");
    return Handle(this, conn);
}

void ConnectionPool::release(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Broken or mid-transaction connections are not reused.
    bool reusable = !shutdown_ && PQstatus(conn) == CONNECTION_OK &&
                    PQtransactionStatus(conn) == PQTRANS_IDLE;
    if (reusable) {
        available_.push(conn);
    } else {
        PQfinish(conn);
        --open_;
    }
    cv_.notify_one();
}

}  // namespace gridsync::db
