#include "ckscan/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace ckscan
{
    TEST(ErrorTest, BasicConstruction) {
        const Error error(ErrorCode::InvalidArgument, "invalid value");

        EXPECT_EQ(error.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(error.message(), "invalid value");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ConstructionWithContext) {
        const Error error(ErrorCode::NotFound, "File not found", "src/Foo.java");

        EXPECT_EQ(error.code(), ErrorCode::NotFound);
        EXPECT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "src/Foo.java");
    }

    TEST(ErrorTest, Factories) {
        EXPECT_EQ(Error::invalid_argument("bad").code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(Error::not_found("missing", "a.py").code(), ErrorCode::NotFound);
        EXPECT_EQ(Error::parse_error("no tree", "a.py").code(), ErrorCode::ParseError);
        EXPECT_EQ(Error::io_error("read failed").code(), ErrorCode::IoError);
        EXPECT_EQ(Error::config_error("bad key").code(), ErrorCode::ConfigError);
        EXPECT_EQ(Error::unsupported_language("no grammar", "a.go").code(), ErrorCode::UnsupportedLanguage);
        EXPECT_EQ(Error::analysis_error("failed", "a.rb").code(), ErrorCode::AnalysisError);
        EXPECT_EQ(Error::limit_exceeded("too large", "big.java").code(), ErrorCode::LimitExceeded);
        EXPECT_EQ(Error::internal_error("oops").code(), ErrorCode::InternalError);
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto error = Error::parse_error("parser returned no tree", "a.ts");
        const auto more = error.with_context("phase=metrics");

        EXPECT_EQ(more.context().value(), "a.ts; phase=metrics");
        EXPECT_EQ(more.message(), error.message());

        const auto fresh = Error::internal_error("oops").with_context("b.ts");
        EXPECT_EQ(fresh.context().value(), "b.ts");
    }

    TEST(ErrorTest, ToString) {
        EXPECT_EQ(Error::io_error("read failed").to_string(), "[IoError] read failed");
        EXPECT_EQ(Error::limit_exceeded("file too large", "big.java").to_string(),
                  "[LimitExceeded] file too large (context: big.java)");
    }

    TEST(ErrorTest, StreamOutput) {
        std::ostringstream oss;
        oss << Error::not_found("File not found", "x.py") << " " << ErrorCode::ParseError;
        EXPECT_EQ(oss.str(), "[NotFound] File not found (context: x.py) ParseError");
    }

    TEST(ErrorTest, CodeNames) {
        EXPECT_STREQ(code_name(ErrorCode::None), "None");
        EXPECT_STREQ(code_name(ErrorCode::UnsupportedLanguage), "UnsupportedLanguage");
        EXPECT_STREQ(code_name(ErrorCode::LimitExceeded), "LimitExceeded");
        EXPECT_STREQ(code_name(ErrorCode::InternalError), "InternalError");
    }

    TEST(ErrorTest, Equality) {
        const auto e1 = Error::not_found("missing", "key");
        const auto e2 = Error::not_found("missing", "key");
        const auto e3 = Error::not_found("missing", "other");
        const auto e4 = Error::io_error("missing", "key");

        EXPECT_EQ(e1, e2);
        EXPECT_NE(e1, e3);
        EXPECT_NE(e1, e4);
    }

}  // namespace ckscan
