// SPDX-License-Identifier: MIT

#pragma once

#include <libpq-fe.h>
#include <memory>

namespace sheetload {

// Wrapper interface for libpq functions to enable testing
class ILibPq {
public:
    virtual ~ILibPq() = default;

    // Connection
    virtual PGconn* connectdb(const char* conninfo) = 0;
    virtual void finish(PGconn* conn) = 0;
    virtual ConnStatusType status(const PGconn* conn) = 0;
    virtual int socket(const PGconn* conn) = 0;
    virtual int setnonblocking(PGconn* conn, int arg) = 0;
    virtual char* errorMessage(const PGconn* conn) = 0;

    // Async query
    virtual int sendQueryParams(PGconn* conn, const char* command, int nParams,
                                const char* const* paramValues) = 0;
    virtual int flush(PGconn* conn) = 0;
    virtual int consumeInput(PGconn* conn) = 0;
    virtual int isBusy(PGconn* conn) = 0;
    virtual PGresult* getResult(PGconn* conn) = 0;

    // Result handling
    virtual ExecStatusType resultStatus(const PGresult* res) = 0;
    virtual char* resultErrorMessage(const PGresult* res) = 0;
    virtual char* resultErrorField(const PGresult* res, int fieldcode) = 0;
    virtual void clear(PGresult* res) = 0;
    virtual int ntuples(const PGresult* res) = 0;
    virtual int nfields(const PGresult* res) = 0;
    virtual char* getvalue(const PGresult* res, int row, int col) = 0;
    virtual int getisnull(const PGresult* res, int row, int col) = 0;

    // Command result
    virtual char* cmdTuples(PGresult* res) = 0;
};

// Real implementation that delegates to actual libpq
class RealLibPq : public ILibPq {
public:
    PGconn* connectdb(const char* conninfo) override {
        return PQconnectdb(conninfo);
    }
    void finish(PGconn* conn) override {
        PQfinish(conn);
    }
    ConnStatusType status(const PGconn* conn) override {
        return PQstatus(conn);
    }
    int socket(const PGconn* conn) override {
        return PQsocket(conn);
    }
    int setnonblocking(PGconn* conn, int arg) override {
        return PQsetnonblocking(conn, arg);
    }
    char* errorMessage(const PGconn* conn) override {
        return PQerrorMessage(conn);
    }
    int sendQueryParams(PGconn* conn, const char* command, int nParams,
                        const char* const* paramValues) override {
        // Text format for every parameter and for the result; the server
        // infers parameter types from the statement.
        return PQsendQueryParams(conn, command, nParams, nullptr, paramValues,
                                 nullptr, nullptr, 0);
    }
    int flush(PGconn* conn) override {
        return PQflush(conn);
    }
    int consumeInput(PGconn* conn) override {
        return PQconsumeInput(conn);
    }
    int isBusy(PGconn* conn) override {
        return PQisBusy(conn);
    }
    PGresult* getResult(PGconn* conn) override {
        return PQgetResult(conn);
    }
    ExecStatusType resultStatus(const PGresult* res) override {
        return PQresultStatus(res);
    }
    char* resultErrorMessage(const PGresult* res) override {
        return PQresultErrorMessage(res);
    }
    char* resultErrorField(const PGresult* res, int fieldcode) override {
        return PQresultErrorField(res, fieldcode);
    }
    void clear(PGresult* res) override {
        PQclear(res);
    }
    int ntuples(const PGresult* res) override {
        return PQntuples(res);
    }
    int nfields(const PGresult* res) override {
        return PQnfields(res);
    }
    char* getvalue(const PGresult* res, int row, int col) override {
        return PQgetvalue(res, row, col);
    }
    int getisnull(const PGresult* res, int row, int col) override {
        return PQgetisnull(res, row, col);
    }
    char* cmdTuples(PGresult* res) override {
        return PQcmdTuples(res);
    }
};

// Global instance (can be swapped for testing)
inline ILibPq& GetLibPq() {
    static RealLibPq instance;
    return instance;
}

}  // namespace sheetload
