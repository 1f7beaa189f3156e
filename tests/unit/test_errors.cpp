#include <gtest/gtest.h>
#include "geodata/error.hpp"

using namespace geodata;

TEST(ApiErrors, CodesFromConstructors) {
    EXPECT_EQ(GeoNotAuthorizedError("x").code, error::NotAuthorized);
    EXPECT_EQ(GeoNoSuchRecordError("x").code, error::NoSuch);
    EXPECT_EQ(GeoUnsupportedOperationError("x").code, error::BadRequest);
    EXPECT_EQ(GeoApiError(503, "x").code, 503);
}

TEST(ApiErrors, MakeApiErrorPicksClass) {
    EXPECT_THROW(std::rethrow_exception(make_api_error(401, "denied")), GeoNotAuthorizedError);
    EXPECT_THROW(std::rethrow_exception(make_api_error(404, "gone")), GeoNoSuchRecordError);
    try {
        std::rethrow_exception(make_api_error(409, "conflict"));
    } catch (const GeoApiError& e) {
        EXPECT_EQ(e.code, 409);
        EXPECT_EQ(e.kind(), ErrorKind::Service);
        EXPECT_STREQ(e.what(), "conflict");
    }
}

TEST(ErrorKinds, Classification) {
    EXPECT_EQ(error_kind(std::make_exception_ptr(GeoNotAuthorizedError("x"))), ErrorKind::NotAuthorized);
    EXPECT_EQ(error_kind(std::make_exception_ptr(GeoNoSuchRecordError("x"))), ErrorKind::NoSuchRecord);
    EXPECT_EQ(error_kind(std::make_exception_ptr(GeoUnsupportedOperationError("x"))),
              ErrorKind::UnsupportedOperation);
    EXPECT_EQ(error_kind(std::make_exception_ptr(GeoMalformedResponseError("x"))),
              ErrorKind::MalformedResponse);
    EXPECT_EQ(error_kind(std::make_exception_ptr(GeoTransportError("x"))), ErrorKind::Transport);
    EXPECT_EQ(error_kind(std::make_exception_ptr(GeoInvalidRequestError("x"))), ErrorKind::InvalidRequest);
    EXPECT_EQ(error_kind(std::make_exception_ptr(GeoApiError(500, "x"))), ErrorKind::Service);
}

TEST(ErrorKinds, ForeignExceptionRethrown) {
    EXPECT_THROW(error_kind(std::make_exception_ptr(std::out_of_range("x"))), std::out_of_range);
    EXPECT_THROW(error_kind(nullptr), std::invalid_argument);
}

TEST(ErrorKinds, Names) {
    EXPECT_EQ(error_kind_to_string(ErrorKind::NotAuthorized), "not_authorized");
    EXPECT_EQ(error_kind_to_string(ErrorKind::NoSuchRecord), "no_such_record");
    EXPECT_EQ(error_kind_to_string(ErrorKind::Transport), "transport");
}

TEST(ErrorHierarchy, AllGeoErrorsAreRuntimeErrors) {
    try {
        throw GeoTransportError("refused");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "refused");
    }
}
