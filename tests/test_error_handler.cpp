#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"

using namespace pqrow;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class MockRawResult : public RawResult {
public:
    MOCK_METHOD(int, ntuples, (), (const, override));
    MOCK_METHOD(int, nfields, (), (const, override));
    MOCK_METHOD(Cell, getCell, (int row, int col), (const, override));
    MOCK_METHOD(ExecStatusType, resultStatus, (), (const, override));
    MOCK_METHOD(RawField, cmdStatus, (), (const, override));
    MOCK_METHOD(RawField, cmdTuples, (), (const, override));
    MOCK_METHOD(RawField, resultErrorMessage, (), (const, override));
    MOCK_METHOD(RawField, resultErrorField, (int fieldCode), (const, override));
};

class ErrorHandlerTest : public ::testing::Test {
protected:
    NiceMock<MockRawResult> result_;

    // String storage for the views the mock hands out
    const std::string uniqueViolation_ = "23505";
    const std::string duplicateKey_ =
        "ERROR:  duplicate key value violates unique constraint \"users_pkey\"\n";
};

// Success statuses
TEST_F(ErrorHandlerTest, CommandOkSucceeds) {
    EXPECT_CALL(result_, resultStatus()).WillRepeatedly(Return(PGRES_COMMAND_OK));
    EXPECT_CALL(result_, resultErrorField(_)).Times(0);
    EXPECT_CALL(result_, resultErrorMessage()).Times(0);

    EXPECT_NO_THROW(ErrorHandler::okResult(result_));
}

TEST_F(ErrorHandlerTest, TuplesOkSucceeds) {
    EXPECT_CALL(result_, resultStatus()).WillRepeatedly(Return(PGRES_TUPLES_OK));
    EXPECT_CALL(result_, resultErrorField(_)).Times(0);

    EXPECT_NO_THROW(ErrorHandler::okResult(result_));
}

// SQL errors
TEST_F(ErrorHandlerTest, FatalErrorRaisesSqlErrorWithCodeAndMessage) {
    EXPECT_CALL(result_, resultStatus()).WillRepeatedly(Return(PGRES_FATAL_ERROR));
    EXPECT_CALL(result_, resultErrorField(PG_DIAG_SQLSTATE))
        .WillRepeatedly(Return(RawField(uniqueViolation_)));
    EXPECT_CALL(result_, resultErrorMessage()).WillRepeatedly(Return(RawField(duplicateKey_)));

    try {
        ErrorHandler::okResult(result_);
        FAIL() << "expected SqlError";
    } catch (const SqlError& e) {
        EXPECT_EQ(e.status(), PGRES_FATAL_ERROR);
        EXPECT_EQ(e.sqlState(), "23505");
        EXPECT_EQ(e.message(), duplicateKey_);
        EXPECT_EQ(e.category(), SqlStateCategory::IntegrityConstraintViolation);
        EXPECT_FALSE(e.isConnectionFailure());
        EXPECT_THAT(e.what(), HasSubstr("PGRES_FATAL_ERROR [23505]"));
        EXPECT_THAT(e.what(), HasSubstr("users_pkey\""));
    }
}

TEST_F(ErrorHandlerTest, EveryOtherStatusIsAFailure) {
    for (ExecStatusType status : {PGRES_EMPTY_QUERY, PGRES_BAD_RESPONSE, PGRES_NONFATAL_ERROR,
                                  PGRES_COPY_OUT, PGRES_COPY_IN, PGRES_SINGLE_TUPLE}) {
        NiceMock<MockRawResult> result;
        EXPECT_CALL(result, resultStatus()).WillRepeatedly(Return(status));
        EXPECT_CALL(result, resultErrorField(PG_DIAG_SQLSTATE))
            .WillRepeatedly(Return(RawField("XX000")));
        EXPECT_CALL(result, resultErrorMessage()).WillRepeatedly(Return(RawField("boom")));

        try {
            ErrorHandler::okResult(result);
            FAIL() << "expected SqlError for " << PQresStatus(status);
        } catch (const SqlError& e) {
            EXPECT_EQ(e.status(), status);
            EXPECT_EQ(e.category(), SqlStateCategory::InternalError);
        }
    }
}

TEST_F(ErrorHandlerTest, EmptyMessageIsStillASqlError) {
    EXPECT_CALL(result_, resultStatus()).WillRepeatedly(Return(PGRES_FATAL_ERROR));
    EXPECT_CALL(result_, resultErrorField(PG_DIAG_SQLSTATE))
        .WillRepeatedly(Return(RawField("42601")));
    EXPECT_CALL(result_, resultErrorMessage()).WillRepeatedly(Return(RawField("")));

    try {
        ErrorHandler::okResult(result_);
        FAIL() << "expected SqlError";
    } catch (const SqlError& e) {
        EXPECT_EQ(e.message(), "");
        EXPECT_EQ(e.category(), SqlStateCategory::SyntaxErrorOrAccessRule);
    }
}

// Missing diagnostics
TEST_F(ErrorHandlerTest, MissingSqlStateIsConnectionError) {
    EXPECT_CALL(result_, resultStatus()).WillRepeatedly(Return(PGRES_FATAL_ERROR));
    EXPECT_CALL(result_, resultErrorField(PG_DIAG_SQLSTATE))
        .WillRepeatedly(Return(RawField(std::nullopt)));
    EXPECT_CALL(result_, resultErrorMessage()).Times(0);

    try {
        ErrorHandler::okResult(result_);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.call(), "resultErrorField");
    }
}

TEST_F(ErrorHandlerTest, MissingMessageIsConnectionError) {
    EXPECT_CALL(result_, resultStatus()).WillRepeatedly(Return(PGRES_FATAL_ERROR));
    EXPECT_CALL(result_, resultErrorField(PG_DIAG_SQLSTATE))
        .WillRepeatedly(Return(RawField(uniqueViolation_)));
    EXPECT_CALL(result_, resultErrorMessage()).WillRepeatedly(Return(RawField(std::nullopt)));

    try {
        ErrorHandler::okResult(result_);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.call(), "resultErrorMessage");
    }
}

TEST_F(ErrorHandlerTest, ConnectionErrorIsNotASqlError) {
    EXPECT_CALL(result_, resultStatus()).WillRepeatedly(Return(PGRES_FATAL_ERROR));
    EXPECT_CALL(result_, resultErrorField(_)).WillRepeatedly(Return(RawField(std::nullopt)));

    EXPECT_THROW(ErrorHandler::okResult(result_), ConnectionError);
    EXPECT_THROW(ErrorHandler::okResult(result_), ResultException);
}

// Raw accessors
TEST_F(ErrorHandlerTest, ResultErrorCodeReadsSqlStateField) {
    EXPECT_CALL(result_, resultErrorField(PG_DIAG_SQLSTATE))
        .WillOnce(Return(RawField(uniqueViolation_)))
        .WillOnce(Return(RawField(std::nullopt)));

    EXPECT_EQ(ErrorHandler::resultErrorCode(result_), std::optional<std::string>("23505"));
    EXPECT_EQ(ErrorHandler::resultErrorCode(result_), std::nullopt);
}

TEST_F(ErrorHandlerTest, ResultErrorMessagePassesThrough) {
    EXPECT_CALL(result_, resultErrorMessage())
        .WillOnce(Return(RawField(duplicateKey_)))
        .WillOnce(Return(RawField(std::nullopt)));

    EXPECT_EQ(ErrorHandler::resultErrorMessage(result_), std::optional<std::string>(duplicateKey_));
    EXPECT_EQ(ErrorHandler::resultErrorMessage(result_), std::nullopt);
}

// SQLSTATE classification
TEST_F(ErrorHandlerTest, CategorizeKnownClasses) {
    EXPECT_EQ(ErrorHandler::categorize("00000"), SqlStateCategory::Success);
    EXPECT_EQ(ErrorHandler::categorize("01000"), SqlStateCategory::Warning);
    EXPECT_EQ(ErrorHandler::categorize("02000"), SqlStateCategory::NoData);
    EXPECT_EQ(ErrorHandler::categorize("08006"), SqlStateCategory::ConnectionException);
    EXPECT_EQ(ErrorHandler::categorize("0A000"), SqlStateCategory::FeatureNotSupported);
    EXPECT_EQ(ErrorHandler::categorize("22012"), SqlStateCategory::DataException);
    EXPECT_EQ(ErrorHandler::categorize("23503"), SqlStateCategory::IntegrityConstraintViolation);
    EXPECT_EQ(ErrorHandler::categorize("25P02"), SqlStateCategory::InvalidTransactionState);
    EXPECT_EQ(ErrorHandler::categorize("28P01"), SqlStateCategory::InvalidAuthorization);
    EXPECT_EQ(ErrorHandler::categorize("40001"), SqlStateCategory::TransactionRollback);
    EXPECT_EQ(ErrorHandler::categorize("42P01"), SqlStateCategory::SyntaxErrorOrAccessRule);
    EXPECT_EQ(ErrorHandler::categorize("53300"), SqlStateCategory::InsufficientResources);
    EXPECT_EQ(ErrorHandler::categorize("57014"), SqlStateCategory::OperatorIntervention);
    EXPECT_EQ(ErrorHandler::categorize("58030"), SqlStateCategory::SystemError);
    EXPECT_EQ(ErrorHandler::categorize("XX001"), SqlStateCategory::InternalError);
}

TEST_F(ErrorHandlerTest, CategorizeUnknownOrMalformed) {
    EXPECT_EQ(ErrorHandler::categorize("P0001"), SqlStateCategory::Other);
    EXPECT_EQ(ErrorHandler::categorize(""), SqlStateCategory::Other);
    EXPECT_EQ(ErrorHandler::categorize("23"), SqlStateCategory::Other);
    EXPECT_EQ(ErrorHandler::categorize("235050"), SqlStateCategory::Other);
}

TEST_F(ErrorHandlerTest, ConnectionFailureStates) {
    EXPECT_TRUE(ErrorHandler::isConnectionFailure("08000"));
    EXPECT_TRUE(ErrorHandler::isConnectionFailure("08006"));
    EXPECT_TRUE(ErrorHandler::isConnectionFailure("57P01"));
    EXPECT_TRUE(ErrorHandler::isConnectionFailure("57P03"));
    EXPECT_FALSE(ErrorHandler::isConnectionFailure("57014"));
    EXPECT_FALSE(ErrorHandler::isConnectionFailure("23505"));
    EXPECT_FALSE(ErrorHandler::isConnectionFailure(""));
}

TEST_F(ErrorHandlerTest, CategoryNames) {
    EXPECT_STREQ(ErrorHandler::categoryName(SqlStateCategory::IntegrityConstraintViolation),
                 "integrity_constraint_violation");
    EXPECT_STREQ(ErrorHandler::categoryName(SqlStateCategory::ConnectionException),
                 "connection_exception");
    EXPECT_STREQ(ErrorHandler::categoryName(SqlStateCategory::Other), "other");
}

// Exception messages
TEST_F(ErrorHandlerTest, ExceptionMessages) {
    EXPECT_STREQ(RowsOutOfBounds("getRow", 3, 3).what(),
                 "getRow: row 3 out of bounds (result has 3 rows)");
    EXPECT_STREQ(ColumnShapeMismatch("getRows", 2, 3).what(),
                 "getRows: result has 2 columns, decoder expects 3");
    EXPECT_STREQ(RowDecodeError("firstRow", "column 1: unexpected NULL").what(),
                 "firstRow: column 1: unexpected NULL");
    EXPECT_STREQ(ConnectionError("cmdStatus").what(), "cmdStatus returned no value");
    EXPECT_STREQ(ConnectionError("PQconnectdb", "could not connect\n").what(),
                 "PQconnectdb: could not connect");
}
