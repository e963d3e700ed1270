#include "Sysctl.hpp"
#include "Core/Logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace NetConfig
{
    std::string ProcSysctl::ToProcSysPath(const std::string &dotted)
    {
        std::string p = "/proc/sys/";
        p.reserve(p.size() + dotted.size());
        for (char c : dotted)
        {
            p.push_back(c == '.' ? '/' : c);
        }
        return p;
    }

    void ProcSysctl::Set(const std::string &dotted,
                         const std::string &value)
    {
        LOGD("sysctl") << "Set: key=" << dotted << " value='" << value << "'";
        const std::string path = ToProcSysPath(dotted);

        int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0)
        {
            const int e = errno;
            LOGE("sysctl") << "Set: open failed path=" << path << " errno=" << e;
            throw std::runtime_error("open " + path + ": " + std::strerror(e));
        }

        const ssize_t need = static_cast<ssize_t>(value.size());
        const ssize_t n    = ::write(fd, value.c_str(), value.size());
        const int     e    = errno;
        ::close(fd);

        if (n != need)
        {
            LOGE("sysctl") << "Set: short write path=" << path << " need=" << need << " wrote=" << n;
            throw std::runtime_error("write " + path + ": " +
                                     (n < 0 ? std::string(std::strerror(e)) : std::string("short write")));
        }
        LOGT("sysctl") << "Set: ok key=" << dotted;
    }
} // namespace NetConfig
