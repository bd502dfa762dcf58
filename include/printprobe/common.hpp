#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace printprobe {

    // Protocol defaults used when a hostname or a capability path leaves them out
    constexpr dp::i32 DEFAULT_IPP_PORT = 631;
    constexpr const char *DEFAULT_IPP_SCHEME = "ipp";

    // Helper to convert between dp::String and std::string at library boundaries
    inline std::string to_std(const dp::String &value) { return std::string(value.c_str()); }
    inline dp::String to_dp(const std::string &value) { return dp::String(value.c_str()); }

    // Helper to read a whole file into memory
    // Returns dp::Res<std::string> - file contents, or error
    // ERROR CATEGORIZATION:
    // - not_found: file does not exist
    // - io_error: open/read failures other than a missing file
    inline dp::Res<std::string> read_file(const dp::String &path) {
        dp::i32 fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            if (errno == ENOENT) {
                echo::trace("read_file: no such file ", path.c_str());
                return dp::result::err(dp::Error::not_found("no such file"));
            }
            echo::trace("read_file: open failed: ", strerror(errno), " (", path.c_str(), ")");
            return dp::result::err(dp::Error::io_error(dp::String("open error: ") + strerror(errno)));
        }

        std::string contents;
        char buffer[4096];
        while (true) {
            dp::isize n = ::read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("read interrupted by signal, retrying");
                    continue;
                }
                echo::trace("read_file: read failed: ", strerror(errno), " (fd=", fd, ")");
                ::close(fd);
                return dp::result::err(dp::Error::io_error(dp::String("read error: ") + strerror(errno)));
            }
            if (n == 0) {
                break;
            }
            contents.append(buffer, static_cast<dp::usize>(n));
        }

        ::close(fd);
        echo::trace("read_file: read ", contents.size(), " bytes from ", path.c_str());
        return dp::result::ok(std::move(contents));
    }

    // Helper to write exactly n bytes to a file descriptor
    // Returns dp::Res<void> - ok if all bytes written, error otherwise
    inline dp::Res<void> write_exact(dp::i32 fd, const char *buffer, dp::usize count) {
        dp::usize total_written = 0;
        while (total_written < count) {
            dp::isize n = ::write(fd, buffer + total_written, count - total_written);
            if (n < 0) {
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }
                echo::trace("write failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("write error: ") + strerror(errno)));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

    // Replace the contents of a file in one step
    // Data goes to "<path>.tmp" first, is flushed, then renamed over the target,
    // so readers see either the old document or the new one, never a torn write.
    inline dp::Res<void> write_file_atomic(const dp::String &path, const std::string &contents) {
        dp::String tmp_path = path + ".tmp";

        dp::i32 fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            echo::trace("write_file_atomic: open failed: ", strerror(errno), " (", tmp_path.c_str(), ")");
            return dp::result::err(dp::Error::io_error(dp::String("open error: ") + strerror(errno)));
        }

        auto write_res = write_exact(fd, contents.data(), contents.size());
        if (write_res.is_err()) {
            ::close(fd);
            ::unlink(tmp_path.c_str());
            return write_res;
        }

        if (::fsync(fd) < 0) {
            echo::warn("fsync failed: ", strerror(errno), " (", tmp_path.c_str(), ")");
        }
        ::close(fd);

        if (::rename(tmp_path.c_str(), path.c_str()) < 0) {
            echo::trace("write_file_atomic: rename failed: ", strerror(errno));
            dp::String message = dp::String("rename error: ") + strerror(errno);
            ::unlink(tmp_path.c_str());
            return dp::result::err(dp::Error::io_error(message));
        }

        echo::trace("write_file_atomic: wrote ", contents.size(), " bytes to ", path.c_str());
        return dp::result::ok();
    }

} // namespace printprobe
