#include <gtest/gtest.h>

#include <cstring>
#include <string>

#include "common/status.h"

using Common::ErrorKind;
using Common::Status;

TEST(StatusTest, DefaultIsOk) {
    const Status status;
    EXPECT_TRUE(status.isOk());
    EXPECT_EQ(status.kind(), ErrorKind::NONE);
    EXPECT_TRUE(status.message().empty());
    EXPECT_EQ(status.toString(), "OK");
}

TEST(StatusTest, ErrorFormatsMessage) {
    const Status status = Status::error(ErrorKind::PATH_VIOLATION, "Access denied: %s (%d)", "/etc/passwd", 4);
    EXPECT_FALSE(status.isOk());
    EXPECT_EQ(status.kind(), ErrorKind::PATH_VIOLATION);
    EXPECT_EQ(status.message(), "Access denied: /etc/passwd (4)");
    EXPECT_EQ(status.toString(), "[PATH_VIOLATION] Access denied: /etc/passwd (4)");
}

TEST(StatusTest, LongMessagesAreNotTruncated) {
    const std::string detail(2000, 'w');
    const Status status = Status::error(ErrorKind::SECURITY_REJECTION, "warnings: %s", detail.c_str());
    EXPECT_EQ(status.message().size(), std::strlen("warnings: ") + detail.size());
}

TEST(StatusTest, WithContextKeepsKind) {
    Status status = Status::error(ErrorKind::IO_FAILURE, "short write");
    status.withContext("output/index.html");
    EXPECT_EQ(status.kind(), ErrorKind::IO_FAILURE);
    EXPECT_EQ(status.message(), "output/index.html: short write");

    Status ok = Status::ok();
    ok.withContext("ignored");
    EXPECT_TRUE(ok.isOk());
    EXPECT_TRUE(ok.message().empty());
}

TEST(StatusTest, EveryKindHasAName) {
    for (uint8_t k = 0; k <= static_cast<uint8_t>(ErrorKind::INVALID_ARGUMENT); ++k) {
        const char* name = Common::errorKindToString(static_cast<ErrorKind>(k));
        ASSERT_NE(name, nullptr);
        EXPECT_STRNE(name, "UNKNOWN") << "kind " << static_cast<int>(k);
    }
    EXPECT_STREQ(Common::errorKindToString(ErrorKind::SECURITY_REJECTION), "SECURITY_REJECTION");
}
