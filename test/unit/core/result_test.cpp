#include <gtest/gtest.h>
#include "kgraph/core/result.h"
#include "kgraph/core/error.h"
#include <string>
#include <vector>

namespace kgraph {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.code(), Error::Code::UNKNOWN);
}

TEST(ResultTest, ErrorCarriesMessageAndCode) {
    auto result = Result<int>::error("no such token", Error::Code::NOT_FOUND);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "no such token");
    EXPECT_EQ(result.code(), Error::Code::NOT_FOUND);
}

TEST(ResultTest, ConstructFromErrorObject) {
    Result<std::string> result{DimensionMismatchError("expected 384, got 3")};
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::DIMENSION_MISMATCH);
    EXPECT_EQ(result.error(), "expected 384, got 3");
}

TEST(ResultTest, ErrorOfOkResultThrows) {
    Result<int> result(1);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, TakeValueMovesOut) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    std::vector<int> taken = result.take_value();
    EXPECT_EQ(taken.size(), 3u);
}

TEST(ResultTest, MoveKeepsState) {
    auto failed = Result<int>::error("boom", Error::Code::INTERNAL);
    Result<int> moved(std::move(failed));
    EXPECT_FALSE(moved.ok());
    EXPECT_EQ(moved.code(), Error::Code::INTERNAL);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.ok());

    auto failed = Result<void>::error("storage gone", Error::Code::STORAGE_UNAVAILABLE);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.code(), Error::Code::STORAGE_UNAVAILABLE);
}

TEST(ResultTest, PropagateKeepsCode) {
    auto failed = Result<void>::error("not ready", Error::Code::NOT_INITIALIZED);
    Result<size_t> forwarded = propagate<size_t>(failed);
    EXPECT_FALSE(forwarded.ok());
    EXPECT_EQ(forwarded.error(), "not ready");
    EXPECT_EQ(forwarded.code(), Error::Code::NOT_INITIALIZED);
}

TEST(ErrorTest, SubclassesSetCodes) {
    EXPECT_EQ(InvalidArgumentError("x").code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(NotInitializedError("x").code(), Error::Code::NOT_INITIALIZED);
    EXPECT_EQ(StorageUnavailableError("x").code(), Error::Code::STORAGE_UNAVAILABLE);
    EXPECT_EQ(EncodingError("x").code(), Error::Code::ENCODING_ERROR);
    EXPECT_EQ(OracleFailureError("x").code(), Error::Code::ORACLE_FAILURE);
    EXPECT_EQ(InternalError("x").code(), Error::Code::INTERNAL);
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(ToString(Error::Code::ENCODING_ERROR), "EncodingError");
    EXPECT_STREQ(ToString(Error::Code::ABORTED), "Aborted");
    EXPECT_STREQ(ToString(Error::Code::DIMENSION_MISMATCH), "DimensionMismatch");
}

TEST(ErrorTest, CatchAsBase) {
    try {
        throw EncodingError("truncated column");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), Error::Code::ENCODING_ERROR);
        EXPECT_STREQ(e.what(), "truncated column");
    }
}

} // namespace
} // namespace core
} // namespace kgraph
