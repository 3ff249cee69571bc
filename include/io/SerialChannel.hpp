#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART byte I/O wrapper (poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

// atlink headers
#include "io/Transport.hpp"

namespace atlink {
  namespace io {

    /// Line settings applied by SerialChannel::open().
    struct PortOptions {
      speed_t baud{ B115200 };
      unsigned dataBits{ 8 };                              ///< 5..8
      unsigned stopBits{ 1 };                              ///< 1 or 2
      std::chrono::milliseconds interCharTimeout{ 2000 }; ///< mapped onto VTIME
    };

    /// VTIME holds tenths of a second in one byte.
    inline constexpr std::chrono::milliseconds kMaxInterCharTimeout{ 25500 };

    /// Maps a numeric baud rate (e.g. 115200) onto its termios constant, 0 if unsupported.
    speed_t toSpeed(unsigned long baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Raw 8N1-style byte stream, no flow control; framing is the caller's job.
 *  * Blocking fd (VMIN=0, VTIME from PortOptions::interCharTimeout); `read()`
 *    is gated by poll(2) for at most the requested slice.
 *  * *Non-copyable*, but move-constructible.
 */
    class SerialChannel : public Transport {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      ~SerialChannel() override; // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, const PortOptions& options = {});
      bool write(std::string_view bytes) override; // returns false on EIO
      ReadResult read(char* dst, std::size_t len, std::chrono::milliseconds wait) override;
      void close() override;

      bool isOpen() const { return fd_ >= 0; }
      int nativeHandle() const { return fd_; } ///< -1 when closed

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      int fd_{ -1 }; ///< POSIX fd (-1==closed)
    };
  } // namespace io
} // namespace atlink
