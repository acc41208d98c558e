#include "corvid/mime-types.hpp"

#include <gtest/gtest.h>

namespace corvid {

TEST(MimeTypeForPath, KnownExtensions) {
  EXPECT_EQ(MimeTypeForPath("index.html"), "text/html");
  EXPECT_EQ(MimeTypeForPath("/var/www/static/app.min.js"), "text/javascript");
  EXPECT_EQ(MimeTypeForPath("PHOTO.JPG"), "image/jpeg");
  EXPECT_EQ(MimeTypeForPath("font.woff2"), "font/woff2");
}

TEST(MimeTypeForPath, UnknownOrMissingExtension) {
  EXPECT_TRUE(MimeTypeForPath("README").empty());
  EXPECT_TRUE(MimeTypeForPath("archive.unknownext").empty());
  EXPECT_TRUE(MimeTypeForPath("dir.d/file").empty());
  EXPECT_TRUE(MimeTypeForPath("trailingdot.").empty());
}

}  // namespace corvid
