#include <gtest/gtest.h>

#include <cstring>

#include "cre/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(cre::Version::major, 0);
    EXPECT_EQ(cre::Version::minor, 3);
    EXPECT_EQ(cre::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(cre::Version::string, "0.3.0");
}

TEST(VersionTest, MacrosMatchStruct) {
    EXPECT_EQ(CRE_VERSION_MAJOR, cre::Version::major);
    EXPECT_EQ(std::strcmp(CRE_VERSION_STRING, cre::Version::string), 0);
}
