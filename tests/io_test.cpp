#include "core/CommandExecutor.hpp"
#include "io/SerialChannel.hpp"
#include <gtest/gtest.h>
#include <fcntl.h>
#include <pty.h> // openpty
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

  /// Master/slave pseudo-terminal pair standing in for /dev/ttyUSB*.
  struct FakeTty {
    int masterFd{ -1 };
    int slaveFd{ -1 };
    char slaveName[64]{};

    FakeTty() {
      if (openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr) != 0)
        masterFd = slaveFd = -1;
    }
    ~FakeTty() {
      hangUp();
      if (slaveFd >= 0)
        close(slaveFd);
    }

    /// Drop the "modem" side, as when the USB device is unplugged.
    void hangUp() {
      if (masterFd >= 0)
        close(masterFd);
      masterFd = -1;
    }

    /// Blocks until \p n bytes arrived from the channel side.
    std::string readMaster(std::size_t n) {
      std::string got;
      char buf[64];
      while (got.size() < n) {
        ssize_t r = ::read(masterFd, buf, std::min(sizeof(buf), n - got.size()));
        if (r <= 0)
          break;
        got.append(buf, r);
      }
      return got;
    }
  };

} // namespace

TEST(serial_channel, opens_writes_reads_closes) {
  // create a false ttyUSB0 "device"
  FakeTty tty;
  ASSERT_GE(tty.masterFd, 0);

  // check that we can open a serial channel to slave dev
  atlink::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(tty.slaveName));
  EXPECT_TRUE(chan.isOpen());

  // Writer on master side
  const char* msg = "PING\r\n";
  ASSERT_EQ(static_cast<ssize_t>(strlen(msg)), write(tty.masterFd, msg, strlen(msg)));

  char buf[16] = { 0 };
  auto res = chan.read(buf, sizeof(buf), 200ms);
  ASSERT_EQ(res.status, atlink::io::ReadStatus::Data);
  EXPECT_EQ(std::string(buf, res.count), "PING\r\n");

  ASSERT_TRUE(chan.write("PONG\r\n"));
  EXPECT_EQ(tty.readMaster(6), "PONG\r\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
  EXPECT_EQ(chan.read(buf, sizeof(buf), 1ms).status, atlink::io::ReadStatus::Error);
  EXPECT_FALSE(chan.write("X"));
}

TEST(serial_channel, idle_line_reads_as_would_block) {
  FakeTty tty;
  ASSERT_GE(tty.masterFd, 0);
  atlink::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(tty.slaveName));

  char buf[8];
  EXPECT_EQ(chan.read(buf, sizeof(buf), 20ms).status, atlink::io::ReadStatus::WouldBlock);
}

TEST(serial_channel, inter_char_timeout_bounds_raw_reads) {
  FakeTty tty;
  ASSERT_GE(tty.masterFd, 0);
  atlink::io::PortOptions options;
  options.interCharTimeout = 300ms;
  atlink::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(tty.slaveName, options));

  const int fd = chan.nativeHandle();
  EXPECT_EQ(fcntl(fd, F_GETFL) & O_NONBLOCK, 0);
  struct termios t;
  ASSERT_EQ(tcgetattr(fd, &t), 0);
  EXPECT_EQ(t.c_cc[VMIN], 0);
  EXPECT_EQ(t.c_cc[VTIME], 3);

  // idle line: read() waits out VTIME and returns 0 instead of EAGAIN
  char buf[8];
  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(::read(fd, buf, sizeof(buf)), 0);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, 250ms);
  EXPECT_LT(elapsed, 1s);

  // poll-gated reads still honour the caller's shorter slice
  const auto sliceStart = std::chrono::steady_clock::now();
  EXPECT_EQ(chan.read(buf, sizeof(buf), 20ms).status, atlink::io::ReadStatus::WouldBlock);
  EXPECT_LT(std::chrono::steady_clock::now() - sliceStart, 200ms);
}

TEST(serial_channel, hang_up_is_a_transport_error) {
  FakeTty tty;
  ASSERT_GE(tty.masterFd, 0);
  atlink::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(tty.slaveName));

  tty.hangUp();

  char buf[8];
  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(chan.read(buf, sizeof(buf), 500ms).status, atlink::io::ReadStatus::Error);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 200ms);
}

TEST(serial_channel, open_fails_for_missing_device) {
  atlink::io::SerialChannel chan;
  EXPECT_FALSE(chan.open("/dev/atlink-does-not-exist"));
  EXPECT_FALSE(chan.isOpen());
}

TEST(serial_channel, move_transfers_ownership) {
  FakeTty tty;
  ASSERT_GE(tty.masterFd, 0);
  atlink::io::SerialChannel a;
  ASSERT_TRUE(a.open(tty.slaveName));

  atlink::io::SerialChannel b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  EXPECT_TRUE(b.isOpen());
}

TEST(baud_mapping, known_and_unknown_rates) {
  EXPECT_EQ(atlink::io::toSpeed(115200), B115200);
  EXPECT_EQ(atlink::io::toSpeed(9600), B9600);
  EXPECT_EQ(atlink::io::toSpeed(12345), static_cast<speed_t>(0));
}

TEST(serial_exchange, network_operator_query_over_pty) {
  FakeTty tty;
  ASSERT_GE(tty.masterFd, 0);
  atlink::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(tty.slaveName));

  // modem side: wait for the command, then answer like a real LTE module
  std::string received;
  std::thread modem([&] {
    received = tty.readMaster(10);
    const char* reply = "\r\n+COPS: 0,0,\"Carrier\",7\r\n\r\nOK\r\n";
    auto n = ::write(tty.masterFd, reply, strlen(reply));
    (void)n;
  });

  atlink::core::CommandExecutor executor(chan);
  auto out = executor.executeRead(atlink::protocols::CommandBody::NetworkOperator, 1s);
  modem.join();

  EXPECT_EQ(received, "AT+COPS?\r\n");
  EXPECT_FALSE(out.error);
  EXPECT_TRUE(out.success);
  EXPECT_EQ(out.payload, "+COPS: 0,0,\"Carrier\",7");
}
