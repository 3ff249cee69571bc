/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx - handles file descriptor, termios setup and raw byte io - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// atlink headers
#include "io/SerialChannel.hpp"

using namespace atlink::io;

speed_t atlink::io::toSpeed(unsigned long baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  case 460800:
    return B460800;
  case 921600:
    return B921600;
  default:
    return 0;
  }
}

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, const PortOptions& options) {
  close();

  // open non-blocking so a modem holding DCD low can't stall open(); dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from open: " << strerror(errno) << "\n";
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  switch (options.dataBits) {
  case 5:
    tty.c_cflag |= CS5;
    break;
  case 6:
    tty.c_cflag |= CS6;
    break;
  case 7:
    tty.c_cflag |= CS7;
    break;
  default:
    tty.c_cflag |= CS8;
    break;
  }
  if (options.stopBits == 2)
    tty.c_cflag |= CSTOPB;
  else
    tty.c_cflag &= ~CSTOPB;
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  // VTIME is in deciseconds and capped at one byte
  auto deci = std::clamp<long long>(options.interCharTimeout.count() / 100, 0, 255);
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = static_cast<cc_t>(deci);

  cfsetispeed(&tty, options.baud);
  cfsetospeed(&tty, options.baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  // back to blocking: VMIN/VTIME only govern read() on a blocking fd
  int flags = fcntl(fd_, F_GETFL);
  if (flags == -1 || fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK) == -1) {
    std::cerr << "Error " << errno << " from fcntl: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool SerialChannel::write(std::string_view bytes) {

  if (fd_ < 0) {
    return false;
  }

  // Good Pattern for POSIX write loop (required if the tty blocks for instance)
  std::size_t total = 0;
  while (total < bytes.size()) {
    ssize_t written = ::write(fd_, bytes.data() + total, bytes.size() - total);
    if (written > 0) {
      total += written;
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // output queue full: wait for the tty to drain before retrying
      pollfd pfd{ fd_, POLLOUT, 0 };
      ::poll(&pfd, 1, 10);
      continue;
    } else {
      std::cerr << "Error: " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// SerialChannel::read
// Waits at most `wait` for input, then drains what is there.
// Nothing available (poll timeout, EAGAIN, zero-byte read) is WouldBlock;
// a hung-up line is an Error.
// -------------------------------------------------------------------
ReadResult SerialChannel::read(char* dst, std::size_t len, std::chrono::milliseconds wait) {
  if (fd_ < 0)
    return { ReadStatus::Error, 0, EBADF };

  pollfd pfd{ fd_, POLLIN, 0 };
  int rc = ::poll(&pfd, 1, static_cast<int>(std::max<long long>(wait.count(), 0)));
  if (rc == -1) {
    if (errno == EINTR)
      return { ReadStatus::WouldBlock, 0, 0 }; // interrupted → retry
    int err = errno;
    std::cerr << "poll: " << strerror(err) << '\n';
    return { ReadStatus::Error, 0, err };
  }
  if (rc == 0)
    return { ReadStatus::WouldBlock, 0, 0 }; // timeout

  if (pfd.revents & (POLLERR | POLLNVAL)) {
    std::cerr << "poll: device error on fd " << fd_ << '\n';
    return { ReadStatus::Error, 0, EIO };
  }
  // hang-up (modem unplugged): drain what is left, then report it
  const bool hungUp = pfd.revents & POLLHUP;
  if (hungUp && !(pfd.revents & POLLIN)) {
    std::cerr << "poll: hang-up on fd " << fd_ << '\n';
    return { ReadStatus::Error, 0, ENODEV };
  }

  ssize_t n = ::read(fd_, dst, len);
  if (n > 0)
    return { ReadStatus::Data, static_cast<std::size_t>(n), 0 };
  if (n == 0 && hungUp) {
    std::cerr << "read: hang-up on fd " << fd_ << '\n';
    return { ReadStatus::Error, 0, ENODEV };
  }
  if (n == 0 || errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
    return { ReadStatus::WouldBlock, 0, 0 }; // transient → retry

  int err = errno;
  std::cerr << "read: " << strerror(err) << '\n';
  return { ReadStatus::Error, 0, err };
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
