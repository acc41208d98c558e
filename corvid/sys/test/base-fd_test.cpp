#include "corvid/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

using namespace corvid;

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1 || errno != EBADF; }

}  // namespace

TEST(BaseFd, ClosesOnDestruction) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  {
    BaseFd rd(fds[0]);
    BaseFd wr(fds[1]);
    EXPECT_TRUE(rd);
    EXPECT_TRUE(IsOpen(fds[0]));
  }
  EXPECT_FALSE(IsOpen(fds[0]));
  EXPECT_FALSE(IsOpen(fds[1]));
}

TEST(BaseFd, MoveTransfersOwnership) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd wr(fds[1]);
  BaseFd rd(fds[0]);
  BaseFd moved(std::move(rd));
  EXPECT_FALSE(rd);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(moved.fd(), fds[0]);

  BaseFd other;
  other = std::move(moved);
  EXPECT_EQ(other.fd(), fds[0]);
  EXPECT_TRUE(IsOpen(fds[0]));
}

TEST(BaseFd, ReleaseAndIdempotentClose) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd wr(fds[1]);
  BaseFd rd(fds[0]);
  int raw = rd.release();
  EXPECT_EQ(raw, fds[0]);
  EXPECT_FALSE(rd);
  EXPECT_TRUE(IsOpen(raw));
  ::close(raw);

  wr.close();
  wr.close();
  EXPECT_FALSE(wr);
}

TEST(BaseFd, FailedCloseStillReleasesOwnership) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd rd(fds[0]);
  ::close(fds[0]);
  ::close(fds[1]);
  rd.close();
  EXPECT_FALSE(rd);
  EXPECT_EQ(rd.fd(), BaseFd::kClosedFd);
}
