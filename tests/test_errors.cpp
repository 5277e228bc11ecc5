/**
 * @file test_errors.cpp
 * @brief Exit-code mapping of the error taxonomy.
 */

#include <gtest/gtest.h>
#include "errors.hpp"

TEST(ErrorsTest, UserErrorsExitWithOne) {
    for (ErrorKind kind : {ErrorKind::InvalidConfiguration, ErrorKind::InvalidCredential,
                           ErrorKind::AuthenticationFailed, ErrorKind::ProtocolOrHostError,
                           ErrorKind::HostUnreachable, ErrorKind::RemotePathNotFound,
                           ErrorKind::RemotePermissionDenied}) {
        EXPECT_TRUE(isUserError(kind)) << errorKindName(kind);
        EXPECT_EQ(exitCodeFor(kind), 1) << errorKindName(kind);
    }
}

TEST(ErrorsTest, UnclassifiedExitsWithTwo) {
    EXPECT_FALSE(isUserError(ErrorKind::Unclassified));
    EXPECT_EQ(exitCodeFor(ErrorKind::Unclassified), 2);
}

TEST(ErrorsTest, KindNames) {
    EXPECT_EQ(errorKindName(ErrorKind::HostUnreachable), "HostUnreachable");
    EXPECT_EQ(errorKindName(ErrorKind::RemotePermissionDenied), "RemotePermissionDenied");
    EXPECT_EQ(errorKindName(ErrorKind::Unclassified), "Unclassified");
}
