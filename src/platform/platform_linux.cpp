#include "../platform.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace splice::platform {

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/splice" : "";
        }

        bool write_file_atomic(const std::filesystem::path& path, const std::string& content) {
            std::string tmpl = (path.parent_path() / ("." + path.filename().string() + ".splice-XXXXXX")).string();
            std::vector<char> name(tmpl.begin(), tmpl.end());
            name.push_back('\0');

            int fd = mkstemp(name.data());
            if (fd < 0) return false;

            mode_t mode = 0644;
            struct stat st;
            if (stat(path.c_str(), &st) == 0) mode = st.st_mode & 07777;

            const char* data = content.data();
            size_t left = content.size();
            while (left > 0) {
                ssize_t n = write(fd, data, left);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int saved = errno;
                    close(fd);
                    unlink(name.data());
                    errno = saved;
                    return false;
                }
                data += n;
                left -= static_cast<size_t>(n);
            }

            if (fchmod(fd, mode) != 0 || fsync(fd) != 0) {
                int saved = errno;
                close(fd);
                unlink(name.data());
                errno = saved;
                return false;
            }
            if (close(fd) != 0) {
                int saved = errno;
                unlink(name.data());
                errno = saved;
                return false;
            }

            if (std::rename(name.data(), path.c_str()) != 0) {
                int saved = errno;
                unlink(name.data());
                errno = saved;
                return false;
            }
            return true;
        }
    }

}
