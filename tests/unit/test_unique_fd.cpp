#include "sockcomm/core/unique_fd.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace {

std::array<int, 2> make_stream_pair() {
    std::array<int, 2> fds{};
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()) != 0) {
        throw std::runtime_error("socketpair creation failed");
    }
    return fds;
}

void expect_fd_is_closed(int fd) {
    errno = 0;
    EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(unique_fd_test, default_constructed_is_invalid) {
    const sockcomm::unique_fd fd;
    EXPECT_FALSE(fd.valid());
    EXPECT_FALSE(static_cast<bool>(fd));
    EXPECT_EQ(fd.get(), -1);
}

TEST(unique_fd_test, move_assignment_closes_previous_descriptor) {
    const auto first = make_stream_pair();
    const auto second = make_stream_pair();

    sockcomm::unique_fd target{first[0]};
    sockcomm::unique_fd first_peer{first[1]};
    sockcomm::unique_fd source{second[0]};
    sockcomm::unique_fd second_peer{second[1]};

    const int old_target_fd = target.get();
    const int source_fd = source.get();

    target = std::move(source);

    expect_fd_is_closed(old_target_fd);
    EXPECT_FALSE(source.valid());
    EXPECT_EQ(target.get(), source_fd);
}

TEST(unique_fd_test, release_transfers_ownership_without_closing) {
    const auto fds = make_stream_pair();

    sockcomm::unique_fd end{fds[0]};
    sockcomm::unique_fd peer{fds[1]};

    const int released = end.release();
    EXPECT_FALSE(end.valid());
    EXPECT_NE(::fcntl(released, F_GETFD), -1);

    sockcomm::unique_fd readopted{released};
    EXPECT_TRUE(readopted.close().has_value());
    expect_fd_is_closed(released);
}

TEST(unique_fd_test, destructor_closes_valid_descriptor) {
    int fd_to_check = -1;
    {
        const auto fds = make_stream_pair();
        sockcomm::unique_fd end{fds[0]};
        sockcomm::unique_fd peer{fds[1]};
        fd_to_check = end.get();
    }

    expect_fd_is_closed(fd_to_check);
}

TEST(unique_fd_test, close_empties_handle_and_rejects_second_close) {
    const auto fds = make_stream_pair();
    sockcomm::unique_fd end{fds[0]};
    sockcomm::unique_fd peer{fds[1]};

    ASSERT_TRUE(end.close().has_value());
    EXPECT_FALSE(end.valid());
    expect_fd_is_closed(fds[0]);

    const auto second = end.close();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().value(), EBADF);
}

TEST(unique_fd_test, shutdown_write_signals_end_of_stream_to_peer) {
    const auto fds = make_stream_pair();
    sockcomm::unique_fd end{fds[0]};
    sockcomm::unique_fd peer{fds[1]};

    ASSERT_TRUE(end.shutdown(sockcomm::shutdown_mode::write).has_value());

    char byte = 0;
    EXPECT_EQ(::read(peer.get(), &byte, 1), 0);
}

TEST(unique_fd_test, shutdown_modes_mirror_platform_constants) {
    EXPECT_EQ(static_cast<int>(sockcomm::shutdown_mode::read), SHUT_RD);
    EXPECT_EQ(static_cast<int>(sockcomm::shutdown_mode::write), SHUT_WR);
    EXPECT_EQ(static_cast<int>(sockcomm::shutdown_mode::both), SHUT_RDWR);
}

TEST(unique_fd_test, shutdown_on_empty_handle_reports_ebadf) {
    const sockcomm::unique_fd fd;
    const auto status = fd.shutdown(sockcomm::shutdown_mode::both);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().value(), EBADF);
}

} // namespace
