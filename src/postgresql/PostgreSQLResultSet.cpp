#include "PostgreSQLResultSet.hpp"

namespace pqrow {

namespace {

RawField fromCString(const char* value) {
    if (!value) return std::nullopt;
    return std::string_view(value);
}

}  // namespace

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res) : m_res(res) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    if (m_res) {
        PQclear(m_res);
    }
}

PostgreSQLResultSet::PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept
    : m_res(other.m_res) {
    other.m_res = nullptr;
}

PostgreSQLResultSet& PostgreSQLResultSet::operator=(PostgreSQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) {
            PQclear(m_res);
        }
        m_res = other.m_res;
        other.m_res = nullptr;
    }
    return *this;
}

int PostgreSQLResultSet::ntuples() const {
    return m_res ? PQntuples(m_res) : 0;
}

int PostgreSQLResultSet::nfields() const {
    return m_res ? PQnfields(m_res) : 0;
}

Cell PostgreSQLResultSet::getCell(int row, int col) const {
    if (!m_res) return std::nullopt;
    if (row < 0 || row >= ntuples()) return std::nullopt;
    if (col < 0 || col >= nfields()) return std::nullopt;
    if (PQgetisnull(m_res, row, col)) return std::nullopt;
    return std::string_view(PQgetvalue(m_res, row, col),
                            static_cast<size_t>(PQgetlength(m_res, row, col)));
}

ExecStatusType PostgreSQLResultSet::resultStatus() const {
    return m_res ? PQresultStatus(m_res) : PGRES_FATAL_ERROR;
}

RawField PostgreSQLResultSet::cmdStatus() const {
    return m_res ? fromCString(PQcmdStatus(m_res)) : std::nullopt;
}

RawField PostgreSQLResultSet::cmdTuples() const {
    return m_res ? fromCString(PQcmdTuples(m_res)) : std::nullopt;
}

RawField PostgreSQLResultSet::resultErrorMessage() const {
    return m_res ? fromCString(PQresultErrorMessage(m_res)) : std::nullopt;
}

RawField PostgreSQLResultSet::resultErrorField(int fieldCode) const {
    return m_res ? fromCString(PQresultErrorField(m_res, fieldCode)) : std::nullopt;
}

const char* PostgreSQLResultSet::statusMessage() const {
    return m_res ? PQresStatus(PQresultStatus(m_res)) : "No result";
}

const char* PostgreSQLResultSet::fieldName(int col) const {
    if (!m_res || col < 0 || col >= nfields()) return nullptr;
    return PQfname(m_res, col);
}

Oid PostgreSQLResultSet::fieldType(int col) const {
    if (!m_res || col < 0 || col >= nfields()) return InvalidOid;
    return PQftype(m_res, col);
}

std::vector<std::string> PostgreSQLResultSet::getColumnNames() const {
    std::vector<std::string> names;
    if (!m_res) return names;

    int nFields = PQnfields(m_res);
    names.reserve(nFields);

    for (int i = 0; i < nFields; ++i) {
        const char* name = PQfname(m_res, i);
        names.emplace_back(name ? name : "");
    }

    return names;
}

void PostgreSQLResultSet::reset(PGresult* res) {
    if (m_res) {
        PQclear(m_res);
    }
    m_res = res;
}

PGresult* PostgreSQLResultSet::release() {
    PGresult* res = m_res;
    m_res = nullptr;
    return res;
}

}  // namespace pqrow
