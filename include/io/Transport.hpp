#pragma once
/** @file  Transport.hpp
 *  @brief Duplex byte-stream capability consumed by the command engine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace atlink {
  namespace io {

    enum class ReadStatus : std::uint8_t {
      Data,       ///< `count` bytes were copied into the caller's buffer
      WouldBlock, ///< nothing available within the wait (NOT end-of-stream)
      Error       ///< stream fault, `err` holds the errno
    };

    struct ReadResult {
      ReadStatus status{ ReadStatus::WouldBlock };
      std::size_t count{ 0 };
      int err{ 0 };
    };

    /**
 * @class Transport
 * @brief Abstract read + write + close stream.
 *
 *  * The engine borrows a Transport for one exchange and never opens it.
 *  * `read()` must return within roughly `wait`; a zero-byte read is
 *    reported as WouldBlock, never as a closed stream.
 */
    class Transport {
    public:
      virtual ~Transport() = default;

      /// Write every byte of \p bytes or return false.
      virtual bool write(std::string_view bytes) = 0;

      /// Copy up to \p len bytes into \p dst, blocking at most \p wait.
      virtual ReadResult read(char* dst, std::size_t len, std::chrono::milliseconds wait) = 0;

      virtual void close() = 0;
    };

  } // namespace io
} // namespace atlink
